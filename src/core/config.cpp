#include "core/config.hpp"

#include "core/logging.hpp"

#include <QSettings>
#include <QStandardPaths>


namespace pairlink {
namespace {

constexpr const char* kSettingsGroup = "pairing";

void read_port(const QString& text, uint16_t& out, const char* name) {
    bool ok = false;
    const auto v = text.trimmed().toUInt(&ok);
    if (!ok || v == 0 || v > 65535) {
        qCWarning(pairlinkStorageLog) << "Ignoring invalid" << name << "=" << text;
        return;
    }
    out = static_cast<uint16_t>(v);
}

void read_millis(const QString& text, int& out, const char* name) {
    bool ok = false;
    const auto v = text.trimmed().toInt(&ok);
    if (!ok) {
        qCWarning(pairlinkStorageLog) << "Ignoring invalid" << name << "=" << text;
        return;
    }
    out = v;
}

} // namespace

QString pending_policy_to_string(PendingPolicy policy) {
    switch (policy) {
        case PendingPolicy::Hold: return QStringLiteral("hold");
        case PendingPolicy::AllowPing: return QStringLiteral("ping");
    }
    return QStringLiteral("hold");
}

std::optional<PendingPolicy> pending_policy_from_string(const QString& text) {
    const auto t = text.trimmed().toLower();
    if (t == QStringLiteral("hold")) return PendingPolicy::Hold;
    if (t == QStringLiteral("ping") || t == QStringLiteral("allow_ping")) {
        return PendingPolicy::AllowPing;
    }
    return std::nullopt;
}

QStringList PairingConfig::validate() {
    QStringList corrections;
    auto correct = [&corrections](const QString& what) {
        qCWarning(pairlinkStorageLog).noquote() << "config:" << what;
        corrections << what;
    };

    if (announce_interval_ms <= 0) {
        correct(QStringLiteral("announce_interval_ms %1 -> %2")
                    .arg(announce_interval_ms).arg(DEFAULT_ANNOUNCE_INTERVAL_MS));
        announce_interval_ms = DEFAULT_ANNOUNCE_INTERVAL_MS;
    }
    if (sweep_interval_ms <= 0) {
        correct(QStringLiteral("sweep_interval_ms %1 -> %2")
                    .arg(sweep_interval_ms).arg(DEFAULT_SWEEP_INTERVAL_MS));
        sweep_interval_ms = DEFAULT_SWEEP_INTERVAL_MS;
    }
    if (connect_timeout_ms <= 0) {
        correct(QStringLiteral("connect_timeout_ms %1 -> %2")
                    .arg(connect_timeout_ms).arg(DEFAULT_CONNECT_TIMEOUT_MS));
        connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS;
    }
    // Two missed announcements before a peer is considered gone.
    const int min_liveness = announce_interval_ms * 2;
    if (liveness_window_ms < min_liveness) {
        correct(QStringLiteral("liveness_window_ms %1 -> %2")
                    .arg(liveness_window_ms).arg(min_liveness));
        liveness_window_ms = min_liveness;
    }
    if (sweep_interval_ms > liveness_window_ms) {
        correct(QStringLiteral("sweep_interval_ms %1 -> %2")
                    .arg(sweep_interval_ms).arg(liveness_window_ms));
        sweep_interval_ms = liveness_window_ms;
    }
    if (discovery_port == 0) {
        correct(QStringLiteral("discovery_port 0 -> %1").arg(DEFAULT_DISCOVERY_PORT));
        discovery_port = DEFAULT_DISCOVERY_PORT;
    }
    if (server_port == 0) {
        correct(QStringLiteral("server_port 0 -> %1").arg(DEFAULT_SERVER_PORT));
        server_port = DEFAULT_SERVER_PORT;
    }
    if (multicast_group.trimmed().isEmpty()) {
        correct(QStringLiteral("multicast_group empty -> 224.0.0.167"));
        multicast_group = QStringLiteral("224.0.0.167");
    }
    return corrections;
}

QString PairingConfig::resolved_data_dir() const {
    if (!data_dir.isEmpty()) {
        return data_dir;
    }
    return QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
}

PairingConfig apply_settings(PairingConfig base, QSettings& settings) {
    settings.beginGroup(QString::fromLatin1(kSettingsGroup));
    auto str = [&settings](const char* key) {
        return settings.value(QString::fromLatin1(key)).toString();
    };
    if (settings.contains(QStringLiteral("discovery_port"))) {
        read_port(str("discovery_port"), base.discovery_port, "discovery_port");
    }
    if (settings.contains(QStringLiteral("server_port"))) {
        read_port(str("server_port"), base.server_port, "server_port");
    }
    if (settings.contains(QStringLiteral("multicast_group"))) {
        base.multicast_group = str("multicast_group");
    }
    if (settings.contains(QStringLiteral("announce_interval_ms"))) {
        read_millis(str("announce_interval_ms"), base.announce_interval_ms, "announce_interval_ms");
    }
    if (settings.contains(QStringLiteral("sweep_interval_ms"))) {
        read_millis(str("sweep_interval_ms"), base.sweep_interval_ms, "sweep_interval_ms");
    }
    if (settings.contains(QStringLiteral("liveness_window_ms"))) {
        read_millis(str("liveness_window_ms"), base.liveness_window_ms, "liveness_window_ms");
    }
    if (settings.contains(QStringLiteral("connect_timeout_ms"))) {
        read_millis(str("connect_timeout_ms"), base.connect_timeout_ms, "connect_timeout_ms");
    }
    if (settings.contains(QStringLiteral("device_model"))) {
        base.device_model = str("device_model");
    }
    if (settings.contains(QStringLiteral("device_type"))) {
        base.device_type = str("device_type");
    }
    if (settings.contains(QStringLiteral("data_dir"))) {
        base.data_dir = str("data_dir");
    }
    if (settings.contains(QStringLiteral("pending_policy"))) {
        if (auto p = pending_policy_from_string(str("pending_policy"))) {
            base.pending_policy = *p;
        } else {
            qCWarning(pairlinkStorageLog) << "Ignoring invalid pending_policy" << str("pending_policy");
        }
    }
    settings.endGroup();
    return base;
}

PairingConfig apply_environment(PairingConfig base) {
    if (qEnvironmentVariableIsSet("PAIRLINK_DATA_DIR")) {
        base.data_dir = qEnvironmentVariable("PAIRLINK_DATA_DIR");
    }
    if (qEnvironmentVariableIsSet("PAIRLINK_DISCOVERY_PORT")) {
        read_port(qEnvironmentVariable("PAIRLINK_DISCOVERY_PORT"), base.discovery_port,
                  "PAIRLINK_DISCOVERY_PORT");
    }
    if (qEnvironmentVariableIsSet("PAIRLINK_SERVER_PORT")) {
        read_port(qEnvironmentVariable("PAIRLINK_SERVER_PORT"), base.server_port,
                  "PAIRLINK_SERVER_PORT");
    }
    if (qEnvironmentVariableIsSet("PAIRLINK_MULTICAST_GROUP")) {
        base.multicast_group = qEnvironmentVariable("PAIRLINK_MULTICAST_GROUP");
    }
    if (qEnvironmentVariableIsSet("PAIRLINK_ANNOUNCE_MS")) {
        read_millis(qEnvironmentVariable("PAIRLINK_ANNOUNCE_MS"), base.announce_interval_ms,
                    "PAIRLINK_ANNOUNCE_MS");
    }
    if (qEnvironmentVariableIsSet("PAIRLINK_SWEEP_MS")) {
        read_millis(qEnvironmentVariable("PAIRLINK_SWEEP_MS"), base.sweep_interval_ms,
                    "PAIRLINK_SWEEP_MS");
    }
    if (qEnvironmentVariableIsSet("PAIRLINK_LIVENESS_MS")) {
        read_millis(qEnvironmentVariable("PAIRLINK_LIVENESS_MS"), base.liveness_window_ms,
                    "PAIRLINK_LIVENESS_MS");
    }
    if (qEnvironmentVariableIsSet("PAIRLINK_CONNECT_TIMEOUT_MS")) {
        read_millis(qEnvironmentVariable("PAIRLINK_CONNECT_TIMEOUT_MS"), base.connect_timeout_ms,
                    "PAIRLINK_CONNECT_TIMEOUT_MS");
    }
    if (qEnvironmentVariableIsSet("PAIRLINK_DEVICE_MODEL")) {
        base.device_model = qEnvironmentVariable("PAIRLINK_DEVICE_MODEL");
    }
    if (qEnvironmentVariableIsSet("PAIRLINK_PENDING_POLICY")) {
        const auto raw = qEnvironmentVariable("PAIRLINK_PENDING_POLICY");
        if (auto p = pending_policy_from_string(raw)) {
            base.pending_policy = *p;
        } else {
            qCWarning(pairlinkStorageLog) << "Ignoring invalid PAIRLINK_PENDING_POLICY" << raw;
        }
    }
    return base;
}

PairingConfig load_config() {
    QSettings settings;
    auto config = apply_environment(apply_settings(PairingConfig{}, settings));
    config.validate();
    return config;
}

} // namespace pairlink
