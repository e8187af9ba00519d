#include <catch2/catch_test_macros.hpp>
#include "storage/client_repository.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/trust_repository.hpp"

#include <QTemporaryDir>

using namespace pairlink;
using namespace pairlink::storage;

namespace {

Database migrated_memory_db() {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    return db;
}

bool table_exists(Database& db, const std::string& name) {
    auto stmt = db.prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;").unwrap();
    REQUIRE(stmt.bind_text(1, name).is_ok());
    return stmt.step().unwrap();
}

} // namespace

TEST_CASE("Database basic operations", "[unit][storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Prepare and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 'Alice'), (2, 'Bob');").is_ok());

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");
        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_text(1) == "Bob");
        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            REQUIRE(db.execute("INSERT INTO test VALUES (2);").is_ok());
            return fail("intentional", ErrorCode::Internal);
        });
        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);
    }

    SECTION("Bad SQL reports a storage error") {
        auto result = db.execute("CREATE TABLE (;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::Storage);
    }
}

TEST_CASE("Migrations create and roll back the schema", "[unit][storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    REQUIRE(runner.current_version().unwrap() == 0);
    REQUIRE(runner.migrate().is_ok());
    REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    REQUIRE(table_exists(db, "trusted_servers"));
    REQUIRE(table_exists(db, "trusted_server_hosts"));
    REQUIRE(table_exists(db, "clients"));

    // Migrating twice is harmless.
    REQUIRE(runner.migrate().is_ok());

    REQUIRE(runner.rollback_to(1).is_ok());
    REQUIRE(runner.current_version().unwrap() == 1);
    REQUIRE_FALSE(table_exists(db, "clients"));
    REQUIRE(table_exists(db, "trusted_servers"));

    REQUIRE(runner.migrate_to(2).is_ok());
    REQUIRE(table_exists(db, "clients"));
}

TEST_CASE("Client status is constrained by the schema", "[unit][storage]") {
    auto db = migrated_memory_db();
    auto result = db.execute(
        "INSERT INTO clients (fingerprint, status, first_seen, last_seen) VALUES ('x', 7, 0, 0);");
    REQUIRE(result.is_err());
}

TEST_CASE("TrustRepository keeps host order and cascades deletes", "[unit][storage]") {
    auto db = migrated_memory_db();
    TrustRepository repo(db);

    TrustedServerCertificate cert{
        .fingerprint = "fp-one",
        .hosts = {"192.168.1.20", "laptop.local:7863", "[fe80::1]:7863"},
        .created_at = Timestamp(1000),
        .updated_at = Timestamp(1000),
    };
    REQUIRE(repo.save(cert).is_ok());

    auto loaded = repo.get("fp-one").unwrap();
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->hosts == cert.hosts);
    REQUIRE(loaded->created_at == Timestamp(1000));

    SECTION("save replaces the host list") {
        cert.hosts = {"laptop.local:7863"};
        cert.updated_at = Timestamp(2000);
        REQUIRE(repo.save(cert).is_ok());

        auto again = repo.get("fp-one").unwrap();
        REQUIRE(again->hosts == std::vector<std::string>{"laptop.local:7863"});
        REQUIRE(again->created_at == Timestamp(1000));
        REQUIRE(again->updated_at == Timestamp(2000));
    }

    SECTION("remove deletes hosts too") {
        REQUIRE(repo.remove("fp-one").unwrap() == true);
        REQUIRE(repo.remove("fp-one").unwrap() == false);
        REQUIRE_FALSE(repo.get("fp-one").unwrap().has_value());
        REQUIRE(repo.hosts_of("fp-one").unwrap().empty());
    }

    SECTION("host lookup prefers the most recently updated entry") {
        TrustedServerCertificate other{
            .fingerprint = "fp-two",
            .hosts = {"192.168.1.20"},
            .created_at = Timestamp(3000),
            .updated_at = Timestamp(3000),
        };
        REQUIRE(repo.save(other).is_ok());
        REQUIRE(repo.fingerprint_for_host("192.168.1.20").unwrap() == std::optional<std::string>("fp-two"));
        REQUIRE(repo.fingerprint_for_host("LAPTOP.local:7863").unwrap() == std::optional<std::string>("fp-one"));
        REQUIRE_FALSE(repo.fingerprint_for_host("10.0.0.1").unwrap().has_value());
    }

    SECTION("list is ordered by fingerprint") {
        REQUIRE(repo.save(TrustedServerCertificate{.fingerprint = "fp-a", .hosts = {"h"}}).is_ok());
        const auto all = repo.list().unwrap();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].fingerprint == "fp-a");
        REQUIRE(all[1].fingerprint == "fp-one");
    }
}

TEST_CASE("ClientRepository round-trips clients", "[unit][storage]") {
    auto db = migrated_memory_db();
    ClientRepository repo(db);

    ClientSummary client{
        .fingerprint = "client-1",
        .alias = "Phone",
        .device_model = "pixel",
        .status = ClientStatus::Pending,
        .first_seen = Timestamp(10),
        .last_seen = Timestamp(20),
    };
    REQUIRE(repo.save(client).is_ok());
    REQUIRE(repo.get("client-1").unwrap() == std::optional<ClientSummary>(client));

    client.status = ClientStatus::Blocked;
    client.last_seen = Timestamp(30);
    REQUIRE(repo.save(client).is_ok());
    REQUIRE(repo.get("client-1").unwrap()->status == ClientStatus::Blocked);

    REQUIRE(repo.save(ClientSummary{.fingerprint = "client-0", .alias = "alpha"}).is_ok());
    const auto all = repo.list().unwrap();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].alias == "alpha");

    REQUIRE(repo.remove("client-1").unwrap());
    REQUIRE_FALSE(repo.get("client-1").unwrap().has_value());
}

TEST_CASE("A second connection sees committed rows", "[unit][storage]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = (dir.path() + QStringLiteral("/pairlink.db")).toStdString();

    auto writer = Database::open(path).unwrap();
    REQUIRE(initialize_database(writer).is_ok());
    auto reader = Database::open(path).unwrap();

    TrustRepository writes(writer);
    TrustRepository reads(reader);
    REQUIRE(writes.save(TrustedServerCertificate{.fingerprint = "fp", .hosts = {"h1"}}).is_ok());
    REQUIRE(reads.get("fp").unwrap().has_value());
}
