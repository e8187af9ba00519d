#include <catch2/catch_test_macros.hpp>
#include "network/trust_store.hpp"
#include "storage/migrations.hpp"
#include "../test_support.hpp"

#include <QTemporaryDir>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace pairlink;
using namespace pairlink::network;
using pairlink::test::fakeFingerprint;

namespace {

storage::Database migrated(storage::Database db) {
    REQUIRE(storage::initialize_database(db).is_ok());
    return db;
}

storage::Database open_db(const QString& path) {
    return migrated(storage::Database::open(path.toStdString()).unwrap());
}

std::vector<std::string> fingerprints(const TrustList& list) {
    std::vector<std::string> out;
    for (const auto& e : list) out.push_back(e.fingerprint);
    return out;
}

} // namespace

TEST_CASE("TrustStore mutations publish the whole list", "[unit][trust]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    TrustStore store(open_db(dir.filePath(QStringLiteral("pairlink.db"))));
    REQUIRE(store.load().is_ok());

    std::vector<TrustList> published;
    QObject context;
    store.subscribe(&context, [&](const TrustList& list) { published.push_back(list); });
    REQUIRE(published.size() == 1);
    REQUIRE(published.back().empty());

    const auto a = fakeFingerprint("server-a");
    const auto b = fakeFingerprint("server-b");

    auto added = store.addTrustedServer(a, {QStringLiteral("192.168.1.10"), QStringLiteral(" 192.168.1.10 ")});
    REQUIRE(added.is_ok());
    REQUIRE(added.unwrap().hosts == std::vector<std::string>{"192.168.1.10"});
    REQUIRE(store.addTrustedServer(b, {QStringLiteral("nas.local")}).is_ok());

    REQUIRE(published.size() == 3);
    REQUIRE(published.back().size() == 2);
    REQUIRE(std::is_sorted(published.back().begin(), published.back().end(),
                           [](const auto& x, const auto& y) { return x.fingerprint < y.fingerprint; }));

    SECTION("adding again merges hosts") {
        auto merged = store.addTrustedServer(a, {QStringLiteral("laptop.local"), QStringLiteral("192.168.1.10")});
        REQUIRE(merged.unwrap().hosts == std::vector<std::string>{"192.168.1.10", "laptop.local"});
    }

    SECTION("editHosts replaces the host set") {
        REQUIRE(store.editHosts(a, {QStringLiteral("10.0.0.1"), QStringLiteral("10.0.0.2")}).is_ok());
        REQUIRE(store.trustedServer(a)->hosts == std::vector<std::string>{"10.0.0.1", "10.0.0.2"});
        REQUIRE(published.size() == 4);
    }

    SECTION("unknown fingerprints are NotFound and publish nothing") {
        const auto unknown = fakeFingerprint("never-paired");
        REQUIRE(store.editHosts(unknown, {QStringLiteral("x")}).unwrap_err().code == ErrorCode::NotFound);
        REQUIRE(store.removeTrustedServer(unknown).unwrap_err().code == ErrorCode::NotFound);
        REQUIRE(published.size() == 3);
    }

    SECTION("remove deletes the entry") {
        REQUIRE(store.removeTrustedServer(a).is_ok());
        REQUIRE_FALSE(store.trustedServer(a).has_value());
        REQUIRE(fingerprints(published.back()) == std::vector<std::string>{b.toStdString()});
        REQUIRE(store.editHosts(a, {QStringLiteral("10.0.0.1")}).unwrap_err().code == ErrorCode::NotFound);

        REQUIRE(store.addTrustedServer(a, {QStringLiteral("10.0.0.1")}).is_ok());
        REQUIRE(store.editHosts(a, {QStringLiteral("10.0.0.2")}).is_ok());
        REQUIRE(store.trustedServer(a)->hosts == std::vector<std::string>{"10.0.0.2"});
    }

    SECTION("invalid fingerprints are refused") {
        REQUIRE(store.addTrustedServer(QStringLiteral("nope"), {}).unwrap_err().code ==
                ErrorCode::InvalidArgument);
    }

    SECTION("entries survive a reopen") {
        TrustStore reopened(open_db(dir.filePath(QStringLiteral("pairlink.db"))));
        REQUIRE(reopened.load().is_ok());
        REQUIRE(reopened.trustedServers() == store.trustedServers());
    }
}

TEST_CASE("TrustStore resolves hosts to fingerprints", "[unit][trust]") {
    TrustStore store(migrated(storage::Database::open_memory().unwrap()));
    REQUIRE(store.load().is_ok());

    const auto old_fp = fakeFingerprint("old");
    const auto new_fp = fakeFingerprint("new");
    REQUIRE(store.addTrustedServer(old_fp, {QStringLiteral("192.168.1.10"), QStringLiteral("old.local")}).is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    REQUIRE(store.addTrustedServer(new_fp, {QStringLiteral("192.168.1.10")}).is_ok());

    REQUIRE(store.fingerprintForHost(QStringLiteral("192.168.1.10")) == new_fp);
    REQUIRE(store.fingerprintForHost(QStringLiteral("OLD.local")) == old_fp);
    REQUIRE_FALSE(store.fingerprintForHost(QStringLiteral("10.9.9.9")).has_value());
}

TEST_CASE("TrustStore matches hosts by endpoint", "[unit][trust]") {
    TrustStore store(migrated(storage::Database::open_memory().unwrap()));
    REQUIRE(store.load().is_ok());

    const auto fp = fakeFingerprint("nas");
    REQUIRE(store.addTrustedServer(fp, {QStringLiteral("https://10.0.0.5:7863")}).is_ok());

    REQUIRE(store.fingerprintForHost(QStringLiteral("https://10.0.0.5:7863"), 7863) == fp);
    REQUIRE(store.fingerprintForHost(QStringLiteral("10.0.0.5:7863"), 7863) == fp);
    REQUIRE(store.fingerprintForHost(QStringLiteral("10.0.0.5"), 7863) == fp);
    REQUIRE_FALSE(store.fingerprintForHost(QStringLiteral("10.0.0.5:9000"), 7863).has_value());
    REQUIRE_FALSE(store.fingerprintForHost(QStringLiteral("10.0.0.5"), 9000).has_value());
    REQUIRE_FALSE(store.fingerprintForHost(QStringLiteral("10.0.0.6"), 7863).has_value());

    SECTION("bare hosts in the store match ports spelled out by the caller") {
        const auto other = fakeFingerprint("laptop");
        REQUIRE(store.addTrustedServer(other, {QStringLiteral("Laptop.local")}).is_ok());
        REQUIRE(store.fingerprintForHost(QStringLiteral("laptop.local:7863"), 7863) == other);
        REQUIRE(store.fingerprintForHost(QStringLiteral("https://LAPTOP.local"), 7863) == other);
    }
}

TEST_CASE("TrustStore delivers snapshots in commit order across threads", "[unit][trust]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    TrustStore store(open_db(dir.filePath(QStringLiteral("pairlink.db"))));
    REQUIRE(store.load().is_ok());

    std::vector<size_t> sizes;
    QObject::connect(&store, &TrustStore::trustListUpdated, &store,
                     [&sizes](const TrustList& list) { sizes.push_back(list.size()); },
                     Qt::DirectConnection);

    constexpr int kPerThread = 10;
    std::atomic<int> failures{0};
    auto writer = [&store, &failures](const char* tag) {
        for (int i = 0; i < kPerThread; ++i) {
            const auto fp = fakeFingerprint(std::string(tag) + std::to_string(i));
            if (store.addTrustedServer(fp, {QStringLiteral("host-%1").arg(i)}).is_err()) {
                ++failures;
            }
        }
    };
    std::thread t1(writer, "a");
    std::thread t2(writer, "b");
    t1.join();
    t2.join();

    REQUIRE(failures == 0);
    REQUIRE(store.trustedServers().size() == 2 * kPerThread);
    REQUIRE(sizes.size() == 2 * kPerThread);
    REQUIRE(std::is_sorted(sizes.begin(), sizes.end()));
    REQUIRE(sizes.back() == 2 * kPerThread);
}
