#include <catch2/catch_test_macros.hpp>
#include "network/discovery.hpp"
#include "network/discovery_broadcaster.hpp"
#include "network/discovery_datagram.hpp"
#include "../test_support.hpp"

#include <QJsonDocument>
#include <QJsonObject>

using namespace pairlink;
using namespace pairlink::network;
using namespace std::chrono_literals;
using pairlink::test::fakeFingerprint;

namespace {

Announcement announcement(const QString& alias, const QString& fingerprint) {
    Announcement a;
    a.alias = alias;
    a.device_model = QStringLiteral("pairlink");
    a.device_type = QStringLiteral("desktop");
    a.fingerprint = fingerprint;
    a.port = 7863;
    return a;
}

} // namespace

TEST_CASE("Discovery datagram: encodes and decodes announcements", "[unit][discovery]") {
    const auto a = announcement(QStringLiteral("Living room"), fakeFingerprint("tv"));

    const auto decoded = decode_announcement(encode_announcement(a));
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap() == a);
}

TEST_CASE("Discovery datagram: rejects malformed input", "[unit][discovery]") {
    REQUIRE(decode_announcement(QByteArray("not-json")).unwrap_err().code == ErrorCode::InvalidArgument);
    REQUIRE(decode_announcement(QByteArray("[1,2]")).is_err());
    REQUIRE(decode_announcement(QByteArray("{\"alias\":\"x\"}")).is_err());

    QJsonObject obj;
    obj["alias"] = QStringLiteral("x");
    obj["fingerprint"] = QStringLiteral("too-short");
    obj["port"] = 7863;
    REQUIRE(decode_announcement(QJsonDocument(obj).toJson()).is_err());

    obj["fingerprint"] = fakeFingerprint("x");
    obj["port"] = 70000;
    REQUIRE(decode_announcement(QJsonDocument(obj).toJson()).is_err());

    obj["port"] = 7863;
    REQUIRE(decode_announcement(QJsonDocument(obj).toJson()).is_ok());

    REQUIRE(decode_announcement(QByteArray(MAX_DATAGRAM_SIZE + 1, ' ')).is_err());
}

TEST_CASE("DiscoveryRegistry keeps one entry per fingerprint", "[unit][discovery]") {
    DiscoveryRegistry registry(5000ms);
    const auto t0 = DiscoveryRegistry::Clock::time_point{} + 1h;
    const auto fp = fakeFingerprint("laptop");

    registry.upsert(announcement(QStringLiteral("Laptop"), fp), QStringLiteral("192.168.1.5"), t0, Timestamp(1000));
    registry.upsert(announcement(QStringLiteral("Laptop"), fp), QStringLiteral("10.0.0.5"), t0 + 1s, Timestamp(2000));
    registry.upsert(announcement(QStringLiteral("Laptop (renamed)"), fp), QStringLiteral("192.168.1.5"),
                    t0 + 2s, Timestamp(3000));

    REQUIRE(registry.size() == 1);
    const auto device = registry.device(fp);
    REQUIRE(device.has_value());
    REQUIRE(device->alias == QStringLiteral("Laptop (renamed)"));
    REQUIRE(device->ips == QStringList{QStringLiteral("192.168.1.5"), QStringLiteral("10.0.0.5")});
    REQUIRE(device->last_seen == Timestamp(3000));
}

TEST_CASE("DiscoveryRegistry last_seen never goes backwards", "[unit][discovery]") {
    DiscoveryRegistry registry(5000ms);
    const auto t0 = DiscoveryRegistry::Clock::time_point{} + 1h;
    const auto fp = fakeFingerprint("phone");

    registry.upsert(announcement(QStringLiteral("Phone"), fp), QStringLiteral("192.168.1.9"), t0, Timestamp(5000));
    registry.upsert(announcement(QStringLiteral("Phone"), fp), QStringLiteral("192.168.1.9"), t0, Timestamp(4000));
    REQUIRE(registry.device(fp)->last_seen == Timestamp(5000));
}

TEST_CASE("DiscoveryRegistry sweep evicts only stale entries", "[unit][discovery]") {
    DiscoveryRegistry registry(5000ms);
    const auto t0 = DiscoveryRegistry::Clock::time_point{} + 1h;
    const auto stale = fakeFingerprint("stale");
    const auto fresh = fakeFingerprint("fresh");

    registry.upsert(announcement(QStringLiteral("Stale"), stale), QStringLiteral("10.0.0.1"), t0);
    registry.upsert(announcement(QStringLiteral("Fresh"), fresh), QStringLiteral("10.0.0.2"), t0 + 4s);

    // Exactly at the window edge nothing is evicted.
    REQUIRE(registry.sweep(t0 + 5s).empty());

    const auto evicted = registry.sweep(t0 + 6s);
    REQUIRE(evicted == std::vector<QString>{stale});
    REQUIRE_FALSE(registry.device(stale).has_value());
    REQUIRE(registry.device(fresh).has_value());

    SECTION("an update in the same tick keeps the entry") {
        registry.upsert(announcement(QStringLiteral("Fresh"), fresh), QStringLiteral("10.0.0.2"), t0 + 20s);
        REQUIRE(registry.sweep(t0 + 20s).empty());
    }

    SECTION("evicted devices come back on their next announcement") {
        registry.upsert(announcement(QStringLiteral("Stale"), stale), QStringLiteral("10.0.0.1"), t0 + 7s);
        REQUIRE(registry.device(stale).has_value());
    }
}

TEST_CASE("DiscoveryRegistry lists devices by alias then fingerprint", "[unit][discovery]") {
    DiscoveryRegistry registry(5000ms);
    registry.upsert(announcement(QStringLiteral("bravo"), fakeFingerprint("b")), QStringLiteral("10.0.0.2"));
    registry.upsert(announcement(QStringLiteral("Alpha"), fakeFingerprint("a")), QStringLiteral("10.0.0.1"));
    registry.upsert(announcement(QStringLiteral("Charlie"), fakeFingerprint("c")), QStringLiteral("10.0.0.3"));

    const auto devices = registry.devices();
    REQUIRE(devices.size() == 3);
    REQUIRE(devices[0].alias == QStringLiteral("Alpha"));
    REQUIRE(devices[1].alias == QStringLiteral("bravo"));
    REQUIRE(devices[2].alias == QStringLiteral("Charlie"));

    registry.clear();
    REQUIRE(registry.size() == 0);
}

TEST_CASE("DiscoveryBroadcaster bounds the session length", "[unit][discovery]") {
    DiscoveryBroadcaster broadcaster(PairingConfig{});
    broadcaster.setTargets({QHostAddress(QHostAddress::LocalHost)});
    const auto fp = fakeFingerprint("bounded");

    REQUIRE(broadcaster.startBroadcast(0, QStringLiteral("me"), fp).unwrap_err().code ==
            ErrorCode::InvalidArgument);
    REQUIRE(broadcaster.startBroadcast(-5, QStringLiteral("me"), fp).unwrap_err().code ==
            ErrorCode::InvalidArgument);
    // 3000000 s would overflow a millisecond interval held in an int.
    REQUIRE(broadcaster.startBroadcast(3000000, QStringLiteral("me"), fp).unwrap_err().code ==
            ErrorCode::InvalidArgument);
    REQUIRE(broadcaster.startBroadcast(DiscoveryBroadcaster::MAX_DURATION_SECONDS + 1, QStringLiteral("me"), fp)
                .unwrap_err().code == ErrorCode::InvalidArgument);
    REQUIRE_FALSE(broadcaster.isBroadcasting());

    REQUIRE(broadcaster.startBroadcast(DiscoveryBroadcaster::MAX_DURATION_SECONDS, QStringLiteral("me"), fp)
                .is_ok());
    REQUIRE(broadcaster.isBroadcasting());
    broadcaster.stopBroadcast();
    REQUIRE_FALSE(broadcaster.isBroadcasting());
}
