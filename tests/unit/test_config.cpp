#include <catch2/catch_test_macros.hpp>
#include "core/config.hpp"
#include "../test_support.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace pairlink;
using pairlink::test::EnvVarGuard;

TEST_CASE("PairingConfig defaults are already valid", "[unit][config]") {
    PairingConfig config;
    REQUIRE(config.validate().isEmpty());
    REQUIRE(config.announce_interval_ms == 1000);
    REQUIRE(config.liveness_window_ms == 5000);
    REQUIRE(config.connect_timeout_ms == 3000);
    REQUIRE(config.pending_policy == PendingPolicy::Hold);
}

TEST_CASE("PairingConfig::validate restores the timing ordering", "[unit][config]") {
    PairingConfig config;

    SECTION("non-positive durations fall back to defaults") {
        config.announce_interval_ms = 0;
        config.connect_timeout_ms = -5;
        const auto corrections = config.validate();
        REQUIRE(corrections.size() == 2);
        REQUIRE(config.announce_interval_ms == PairingConfig::DEFAULT_ANNOUNCE_INTERVAL_MS);
        REQUIRE(config.connect_timeout_ms == PairingConfig::DEFAULT_CONNECT_TIMEOUT_MS);
    }

    SECTION("liveness must cover two announcements") {
        config.announce_interval_ms = 4000;
        config.liveness_window_ms = 5000;
        config.validate();
        REQUIRE(config.liveness_window_ms == 8000);
    }

    SECTION("sweep never exceeds liveness") {
        config.sweep_interval_ms = 60000;
        config.validate();
        REQUIRE(config.sweep_interval_ms == config.liveness_window_ms);
    }

    SECTION("zero ports are replaced") {
        config.discovery_port = 0;
        config.server_port = 0;
        config.validate();
        REQUIRE(config.discovery_port == PairingConfig::DEFAULT_DISCOVERY_PORT);
        REQUIRE(config.server_port == PairingConfig::DEFAULT_SERVER_PORT);
    }
}

TEST_CASE("Pending policy names", "[unit][config]") {
    REQUIRE(pending_policy_from_string(QStringLiteral("hold")) == PendingPolicy::Hold);
    REQUIRE(pending_policy_from_string(QStringLiteral("ping")) == PendingPolicy::AllowPing);
    REQUIRE(pending_policy_from_string(QStringLiteral("allow_ping")) == PendingPolicy::AllowPing);
    REQUIRE_FALSE(pending_policy_from_string(QStringLiteral("everything")).has_value());
    REQUIRE(pending_policy_from_string(pending_policy_to_string(PendingPolicy::AllowPing)) ==
            PendingPolicy::AllowPing);
}

TEST_CASE("Settings then environment override defaults", "[unit][config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("pairlink.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("pairing/server_port"), 9000);
    settings.setValue(QStringLiteral("pairing/announce_interval_ms"), 500);
    settings.setValue(QStringLiteral("pairing/pending_policy"), QStringLiteral("ping"));
    settings.setValue(QStringLiteral("pairing/discovery_port"), QStringLiteral("not-a-port"));

    auto config = apply_settings(PairingConfig{}, settings);
    REQUIRE(config.server_port == 9000);
    REQUIRE(config.announce_interval_ms == 500);
    REQUIRE(config.pending_policy == PendingPolicy::AllowPing);
    REQUIRE(config.discovery_port == PairingConfig::DEFAULT_DISCOVERY_PORT);

    EnvVarGuard port("PAIRLINK_SERVER_PORT");
    EnvVarGuard data("PAIRLINK_DATA_DIR");
    EnvVarGuard policy("PAIRLINK_PENDING_POLICY");
    qputenv("PAIRLINK_SERVER_PORT", "9100");
    qputenv("PAIRLINK_DATA_DIR", dir.path().toUtf8());
    qputenv("PAIRLINK_PENDING_POLICY", "hold");

    config = apply_environment(config);
    REQUIRE(config.server_port == 9100);
    REQUIRE(config.data_dir == dir.path());
    REQUIRE(config.resolved_data_dir() == dir.path());
    REQUIRE(config.pending_policy == PendingPolicy::Hold);
}
