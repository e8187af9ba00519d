#include "cli/output.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace pairlink::cli {

namespace {

[[nodiscard]] QString q(const std::string& s) {
    return QString::fromStdString(s);
}

[[nodiscard]] QString q(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

[[nodiscard]] QString iso(const Timestamp& t) {
    return QString::fromStdString(t.to_iso_string());
}

[[nodiscard]] QString render_json(const QJsonArray& array) {
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Indented));
}

[[nodiscard]] QString render_json(const QJsonObject& obj) {
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented));
}

[[nodiscard]] QJsonArray to_json_array(const std::vector<std::string>& items) {
    QJsonArray out;
    for (const auto& item : items) {
        out.append(q(item));
    }
    return out;
}

} // namespace

QString group_fingerprint(const QString& fingerprint) {
    QStringList groups;
    for (qsizetype i = 0; i < fingerprint.size(); i += 4) {
        groups << fingerprint.mid(i, 4);
    }
    return groups.join(QLatin1Char(' '));
}

QString format_devices(const std::vector<network::DiscoveredDevice>& devices, const OutputOptions& opts) {
    if (opts.json) {
        QJsonArray array;
        for (const auto& d : devices) {
            QJsonObject obj;
            obj["alias"] = d.alias;
            obj["deviceModel"] = d.device_model;
            obj["deviceType"] = d.device_type;
            obj["fingerprint"] = d.fingerprint;
            obj["port"] = d.port;
            obj["lastSeen"] = static_cast<qint64>(d.last_seen.seconds());
            obj["ips"] = QJsonArray::fromStringList(d.ips);
            array.append(obj);
        }
        return render_json(array);
    }

    if (devices.empty()) {
        return QStringLiteral("No devices found.\n");
    }
    QStringList lines;
    for (const auto& d : devices) {
        lines << QStringLiteral("%1 (%2, %3)").arg(d.alias, d.device_model, d.device_type);
        lines << QStringLiteral("  fingerprint: %1").arg(d.fingerprint);
        lines << QStringLiteral("  addresses:   %1 port %2").arg(d.ips.join(QStringLiteral(", "))).arg(d.port);
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_clients(const network::ClientList& clients, const OutputOptions& opts) {
    if (opts.json) {
        QJsonArray array;
        for (const auto& c : clients) {
            QJsonObject obj;
            obj["alias"] = q(c.alias);
            obj["fingerprint"] = q(c.fingerprint);
            obj["deviceModel"] = q(c.device_model);
            obj["status"] = q(to_string(c.status));
            obj["firstSeen"] = iso(c.first_seen);
            obj["lastSeen"] = iso(c.last_seen);
            array.append(obj);
        }
        return render_json(array);
    }

    if (clients.empty()) {
        return QStringLiteral("No clients.\n");
    }
    QStringList lines;
    for (const auto& c : clients) {
        const auto alias = c.alias.empty() ? QStringLiteral("(unnamed)") : q(c.alias);
        lines << QStringLiteral("[%1] %2 %3").arg(q(to_string(c.status)), -8).arg(alias, q(c.device_model));
        lines << QStringLiteral("  %1  last seen %2").arg(q(c.fingerprint), iso(c.last_seen));
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_trust_list(const TrustList& list, const OutputOptions& opts) {
    if (opts.json) {
        QJsonArray array;
        for (const auto& entry : list) {
            QJsonObject obj;
            obj["fingerprint"] = q(entry.fingerprint);
            obj["hosts"] = to_json_array(entry.hosts);
            obj["createdAt"] = iso(entry.created_at);
            obj["updatedAt"] = iso(entry.updated_at);
            array.append(obj);
        }
        return render_json(array);
    }

    if (list.empty()) {
        return QStringLiteral("No trusted servers.\n");
    }
    QStringList lines;
    for (const auto& entry : list) {
        lines << q(entry.fingerprint);
        for (const auto& host : entry.hosts) {
            lines << QStringLiteral("  - %1").arg(q(host));
        }
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_connect_result(const network::ConnectResult& result, const OutputOptions& opts) {
    if (result.is_ok()) {
        const auto& ok = result.unwrap();
        if (opts.json) {
            QJsonObject obj;
            obj["ok"] = true;
            obj["host"] = ok.connected_host;
            obj["fingerprint"] = ok.fingerprint;
            return render_json(obj);
        }
        return QStringLiteral("Connected to %1 (%2)\n").arg(ok.connected_host, ok.fingerprint);
    }

    const auto& failure = result.unwrap_err();
    if (opts.json) {
        QJsonArray attempts;
        for (const auto& a : failure.attempts) {
            QJsonObject obj;
            obj["host"] = a.host;
            obj["code"] = q(to_string(a.code));
            obj["message"] = a.message;
            attempts.append(obj);
        }
        QJsonObject obj;
        obj["ok"] = false;
        obj["code"] = q(to_string(failure.code));
        obj["attempts"] = attempts;
        return render_json(obj);
    }

    QStringList lines;
    lines << QStringLiteral("Connection failed: %1").arg(q(to_string(failure.code)));
    for (const auto& a : failure.attempts) {
        lines << QStringLiteral("  %1: %2 %3").arg(a.host, q(to_string(a.code)), a.message);
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace pairlink::cli
