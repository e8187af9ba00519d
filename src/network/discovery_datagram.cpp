#include "network/discovery_datagram.hpp"

#include "crypto/fingerprint.hpp"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>

namespace pairlink::network {
namespace {

Result<Announcement, Error> reject(const char* why) {
    return Result<Announcement, Error>::err(Error{why, ErrorCode::InvalidArgument});
}

} // namespace

QByteArray encode_announcement(const Announcement& announcement) {
    QJsonObject obj;
    obj["alias"] = announcement.alias;
    obj["version"] = announcement.version;
    obj["deviceModel"] = announcement.device_model;
    obj["deviceType"] = announcement.device_type;
    obj["fingerprint"] = announcement.fingerprint;
    obj["port"] = static_cast<int>(announcement.port);
    obj["protocol"] = announcement.protocol;
    obj["announce"] = true;
    obj["ts"] = QDateTime::currentMSecsSinceEpoch();
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<Announcement, Error> decode_announcement(const QByteArray& datagram) {
    if (datagram.size() > MAX_DATAGRAM_SIZE) {
        return reject("datagram too large");
    }

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(datagram, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return reject("invalid json");
    }

    const auto obj = doc.object();
    if (!obj.contains("fingerprint") || !obj.contains("port")) {
        return reject("missing fields");
    }

    const auto fingerprint = obj["fingerprint"].toString();
    if (!crypto::is_valid_fingerprint(fingerprint)) {
        return reject("invalid fingerprint");
    }

    const int port = obj["port"].toInt(-1);
    if (port <= 0 || port > 65535) {
        return reject("invalid port");
    }

    Announcement announcement;
    announcement.alias = obj["alias"].toString();
    announcement.version = obj["version"].toString();
    announcement.device_model = obj["deviceModel"].toString();
    announcement.device_type = obj["deviceType"].toString();
    announcement.fingerprint = fingerprint;
    announcement.port = static_cast<uint16_t>(port);
    announcement.protocol = obj["protocol"].toString(QStringLiteral("https"));
    return Result<Announcement, Error>::ok(std::move(announcement));
}

} // namespace pairlink::network
