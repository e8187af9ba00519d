#pragma once

#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>

class QSettings;

namespace pairlink {

/**
 * What a PENDING peer may do while the server owner has not decided yet.
 *
 * Hold keeps the transport open and acknowledges Hello, everything else is
 * refused. AllowPing additionally answers Ping.
 */
enum class PendingPolicy : uint8_t {
    Hold,
    AllowPing,
};

[[nodiscard]] QString pending_policy_to_string(PendingPolicy policy);
[[nodiscard]] std::optional<PendingPolicy> pending_policy_from_string(const QString& text);

/**
 * PairingConfig - every tunable of discovery, pairing and reconnection.
 *
 * Values are layered: built-in defaults, then the `pairing/` group of
 * QSettings, then PAIRLINK_* environment variables.
 */
struct PairingConfig {
    static constexpr uint16_t DEFAULT_DISCOVERY_PORT = 53317;
    static constexpr uint16_t DEFAULT_SERVER_PORT = 7863;
    static constexpr int DEFAULT_ANNOUNCE_INTERVAL_MS = 1000;
    static constexpr int DEFAULT_SWEEP_INTERVAL_MS = 1000;
    static constexpr int DEFAULT_LIVENESS_WINDOW_MS = 5000;
    static constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 3000;

    uint16_t discovery_port = DEFAULT_DISCOVERY_PORT;
    QString multicast_group = QStringLiteral("224.0.0.167");
    int announce_interval_ms = DEFAULT_ANNOUNCE_INTERVAL_MS;
    int sweep_interval_ms = DEFAULT_SWEEP_INTERVAL_MS;
    int liveness_window_ms = DEFAULT_LIVENESS_WINDOW_MS;
    int connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS;
    uint16_t server_port = DEFAULT_SERVER_PORT;
    QString device_model = QStringLiteral("pairlink");
    QString device_type = QStringLiteral("desktop");
    QString data_dir;
    PendingPolicy pending_policy = PendingPolicy::Hold;

    /**
     * Clamp values into their legal ranges.
     *
     * Durations must be positive, the liveness window at least twice the
     * announce interval, the sweep interval no longer than the liveness
     * window, ports non-zero. Each correction is logged and returned.
     */
    QStringList validate();

    // data_dir, or the platform's AppLocalDataLocation when unset.
    [[nodiscard]] QString resolved_data_dir() const;
};

/**
 * Apply the `pairing/` group of `settings` on top of `base`.
 */
[[nodiscard]] PairingConfig apply_settings(PairingConfig base, QSettings& settings);

/**
 * Apply PAIRLINK_* environment variables on top of `base`.
 */
[[nodiscard]] PairingConfig apply_environment(PairingConfig base);

/**
 * Defaults, QSettings and environment, validated.
 */
[[nodiscard]] PairingConfig load_config();

} // namespace pairlink
