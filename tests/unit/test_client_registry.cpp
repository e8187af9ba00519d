#include <catch2/catch_test_macros.hpp>
#include "network/client_registry.hpp"
#include "storage/migrations.hpp"
#include "../test_support.hpp"

#include <QTemporaryDir>

#include <string>
#include <vector>

using namespace pairlink;
using namespace pairlink::network;
using pairlink::test::fakeFingerprint;

namespace {

storage::Database open_db(const QString& path) {
    auto db = storage::Database::open(path.toStdString()).unwrap();
    REQUIRE(storage::initialize_database(db).is_ok());
    return db;
}

struct Recorder {
    std::vector<std::string> events;

    void attach(ClientRegistry& registry) {
        QObject::connect(&registry, &ClientRegistry::approvalRequired, &registry,
                         [this](const ClientSummary& c) { events.push_back("approval:" + c.alias); });
        QObject::connect(&registry, &ClientRegistry::statusChanged, &registry,
                         [this](const QString&, ClientStatus s) {
                             events.push_back("status:" + std::string(to_string(s)));
                         });
        QObject::connect(&registry, &ClientRegistry::clientRemoved, &registry,
                         [this](const QString&) { events.push_back("removed"); });
        QObject::connect(&registry, &ClientRegistry::clientsChanged, &registry,
                         [this](const ClientList& list) {
                             events.push_back("list:" + std::to_string(list.size()));
                         });
    }
};

} // namespace

TEST_CASE("ClientRegistry tracks first contact as pending", "[unit][clients]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    ClientRegistry registry(open_db(dir.filePath(QStringLiteral("pairlink.db"))));
    REQUIRE(registry.load().is_ok());

    Recorder recorder;
    recorder.attach(registry);

    const auto phone = fakeFingerprint("phone");
    auto status = registry.registerContact(phone, QStringLiteral("Phone"), QStringLiteral("Pixel"));
    REQUIRE(status.unwrap() == ClientStatus::Pending);
    REQUIRE(recorder.events == std::vector<std::string>{"approval:Phone", "list:1"});

    SECTION("a second contact refreshes details without asking again") {
        recorder.events.clear();
        REQUIRE(registry.registerContact(phone, QString(), QStringLiteral("Pixel 9")).unwrap() ==
                ClientStatus::Pending);
        REQUIRE(recorder.events == std::vector<std::string>{"list:1"});
        const auto stored = registry.client(phone);
        REQUIRE(stored->alias == "Phone");
        REQUIRE(stored->device_model == "Pixel 9");
        REQUIRE(stored->last_seen >= stored->first_seen);
    }

    SECTION("approve then block then approve") {
        recorder.events.clear();
        REQUIRE(registry.updateClientStatus(phone, ClientStatus::Approved).is_ok());
        REQUIRE(registry.updateClientStatus(phone, ClientStatus::Blocked).is_ok());
        REQUIRE(registry.updateClientStatus(phone, ClientStatus::Approved).is_ok());
        REQUIRE(recorder.events == std::vector<std::string>{
                                       "status:approved", "list:1",
                                       "status:blocked", "list:1",
                                       "status:approved", "list:1",
                                   });
        REQUIRE(registry.statusOf(phone) == ClientStatus::Approved);
    }

    SECTION("setting the current status is a silent no-op") {
        REQUIRE(registry.updateClientStatus(phone, ClientStatus::Blocked).is_ok());
        recorder.events.clear();
        REQUIRE(registry.updateClientStatus(phone, ClientStatus::Blocked).is_ok());
        REQUIRE(recorder.events.empty());
    }

    SECTION("nothing goes back to pending") {
        REQUIRE(registry.updateClientStatus(phone, ClientStatus::Approved).is_ok());
        auto back = registry.updateClientStatus(phone, ClientStatus::Pending);
        REQUIRE(back.unwrap_err().code == ErrorCode::InvalidArgument);
        REQUIRE(registry.statusOf(phone) == ClientStatus::Approved);
    }

    SECTION("unknown clients are NotFound") {
        const auto stranger = fakeFingerprint("stranger");
        REQUIRE(registry.updateClientStatus(stranger, ClientStatus::Approved).unwrap_err().code ==
                ErrorCode::NotFound);
        REQUIRE(registry.removeClient(stranger).unwrap_err().code == ErrorCode::NotFound);
    }

    SECTION("removal forgets the client so it starts over") {
        REQUIRE(registry.updateClientStatus(phone, ClientStatus::Blocked).is_ok());
        recorder.events.clear();
        REQUIRE(registry.removeClient(phone).is_ok());
        REQUIRE(recorder.events == std::vector<std::string>{"removed", "list:0"});
        REQUIRE_FALSE(registry.client(phone).has_value());

        REQUIRE(registry.registerContact(phone, QStringLiteral("Phone"), QString()).unwrap() ==
                ClientStatus::Pending);
    }

    SECTION("state survives a reopen") {
        REQUIRE(registry.updateClientStatus(phone, ClientStatus::Approved).is_ok());
        ClientRegistry reopened(open_db(dir.filePath(QStringLiteral("pairlink.db"))));
        REQUIRE(reopened.load().is_ok());
        REQUIRE(reopened.listClients() == registry.listClients());
        REQUIRE(reopened.statusOf(phone) == ClientStatus::Approved);
    }
}

TEST_CASE("ClientRegistry lists clients by alias", "[unit][clients]") {
    auto db = storage::Database::open_memory().unwrap();
    REQUIRE(storage::initialize_database(db).is_ok());
    ClientRegistry registry(std::move(db));
    REQUIRE(registry.load().is_ok());

    REQUIRE(registry.registerContact(fakeFingerprint("1"), QStringLiteral("zeta"), QString()).is_ok());
    REQUIRE(registry.registerContact(fakeFingerprint("2"), QStringLiteral("Alpha"), QString()).is_ok());
    REQUIRE(registry.registerContact(fakeFingerprint("3"), QStringLiteral("beta"), QString()).is_ok());

    const auto clients = registry.listClients();
    REQUIRE(clients.size() == 3);
    REQUIRE(clients[0].alias == "Alpha");
    REQUIRE(clients[1].alias == "beta");
    REQUIRE(clients[2].alias == "zeta");

    REQUIRE(registry.registerContact(QStringLiteral("short"), QString(), QString()).unwrap_err().code ==
            ErrorCode::InvalidArgument);
}
