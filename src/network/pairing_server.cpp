#include "network/pairing_server.hpp"

#include "core/logging.hpp"
#include "crypto/fingerprint.hpp"
#include "network/admission_policy.hpp"
#include "network/client_registry.hpp"

#include <QJsonObject>

#include <algorithm>

namespace pairlink::network {

QJsonObject status_payload(ClientStatus status) {
    QJsonObject obj;
    obj["status"] = static_cast<int>(status);
    obj["statusName"] = QString::fromLatin1(to_string(status).data());
    return obj;
}

std::optional<ClientStatus> status_from_payload(const QJsonObject& obj) {
    if (!obj.contains("status")) {
        return std::nullopt;
    }
    return client_status_from_int(obj["status"].toInt(-1));
}

PairingServer::PairingServer(const crypto::LocalIdentity& identity,
                             ClientRegistry& registry,
                             PairingConfig config,
                             QObject* parent)
    : QObject(parent)
    , identity_(identity)
    , registry_(registry)
    , config_(std::move(config))
{
    connect(&registry_, &ClientRegistry::statusChanged, this, &PairingServer::onStatusChanged);
    connect(&registry_, &ClientRegistry::clientRemoved, this, &PairingServer::onClientRemoved);
}

PairingServer::~PairingServer() {
    stop();
}

Result<uint16_t, Error> PairingServer::start(const QString& interface_address,
                                             const QString& alias,
                                             std::optional<uint16_t> port) {
    using R = Result<uint16_t, Error>;
    if (isRunning()) {
        return R::err(Error{"server already running on port " + std::to_string(this->port()),
                            ErrorCode::AlreadyRunning});
    }

    QHostAddress address;
    if (!address.setAddress(interface_address.trimmed())) {
        return R::err(Error{"invalid interface address: " + interface_address.toStdString(),
                            ErrorCode::InvalidArgument});
    }

    server_ = std::make_unique<TlsServer>(identity_, this);
    server_->setHandshakeTimeout(config_.connect_timeout_ms * 2);
    connect(server_.get(), &TlsServer::secureConnection, this, &PairingServer::onSecureConnection);

    const uint16_t wanted = port.value_or(config_.server_port);
    if (!server_->listen(address, wanted)) {
        const auto message = server_->errorString();
        const int native = static_cast<int>(server_->serverError());
        server_.reset();
        qCWarning(pairlinkServerLog) << "Cannot listen on" << address.toString() << wanted << message;
        return R::err(Error{"listen: " + message.toStdString(), ErrorCode::NetworkUnreachable, native});
    }

    alias_ = alias;
    qCInfo(pairlinkServerLog) << "Serving as" << alias << "on" << address.toString()
                              << server_->serverPort();
    emit runningChanged(true);
    return R::ok(server_->serverPort());
}

void PairingServer::stop() {
    if (!server_) return;

    server_->close();
    for (auto& session : sessions_) {
        session->connection->disconnect(this);
        session->connection->close();
        session->connection.release()->deleteLater();
    }
    sessions_.clear();
    server_.reset();

    qCInfo(pairlinkServerLog) << "Server stopped";
    emit runningChanged(false);
}

bool PairingServer::isRunning() const {
    return server_ && server_->isListening();
}

uint16_t PairingServer::port() const {
    return server_ ? server_->serverPort() : 0;
}

QStringList PairingServer::connectedClients() const {
    QStringList out;
    for (const auto& session : sessions_) {
        if (!out.contains(session->fingerprint)) {
            out << session->fingerprint;
        }
    }
    out.sort();
    return out;
}

void PairingServer::onSecureConnection(QSslSocket* socket) {
    const auto peer = socket->peerAddress().toString();
    QString fingerprint;
    auto fp = crypto::fingerprint_of(socket->peerCertificate());
    if (fp.is_ok()) {
        fingerprint = fp.unwrap();
    }

    const auto decision = decide_admission(identity_.fingerprint, fingerprint,
                                           registry_.statusOf(fingerprint));
    if (!decision.admitted()) {
        qCInfo(pairlinkServerLog) << "Refusing" << peer << fingerprint << ":" << decision.reason;
        socket->abort();
        socket->deleteLater();
        emit clientRejected(fingerprint, decision.reason);
        return;
    }

    auto registered = registry_.registerContact(fingerprint, QString{}, QString{});
    if (registered.is_err()) {
        qCWarning(pairlinkServerLog) << "Cannot register" << fingerprint << ":"
                                     << registered.unwrap_err().message.c_str();
        socket->abort();
        socket->deleteLater();
        emit error(QString::fromStdString(registered.unwrap_err().message));
        return;
    }

    // Listeners of the registration may already have decided.
    const auto status = registry_.statusOf(fingerprint).value_or(registered.unwrap());
    if (status == ClientStatus::Blocked) {
        qCInfo(pairlinkServerLog) << "Refusing" << peer << fingerprint << ": blocked";
        socket->abort();
        socket->deleteLater();
        emit clientRejected(fingerprint, QStringLiteral("blocked"));
        return;
    }

    auto session = std::make_unique<Session>();
    session->connection = std::make_unique<Connection>();
    session->fingerprint = fingerprint;
    session->status = status;

    auto* conn = session->connection.get();
    connect(conn, &Connection::messageReceived, this,
            [this, conn](MessageType type, const QByteArray& payload) {
                if (auto* s = findSession(conn)) {
                    handleMessage(*s, type, payload);
                }
            });
    connect(conn, &Connection::disconnected, this, [this, conn] { dropSession(conn, false); });

    sessions_.push_back(std::move(session));
    conn->adoptSocket(socket);

    qCInfo(pairlinkServerLog) << "Client" << fingerprint << "from" << peer << "is"
                              << QString::fromLatin1(to_string(status).data());
    emit clientConnected(fingerprint, status);
}

PairingServer::Session* PairingServer::findSession(const Connection* connection) {
    auto it = std::find_if(sessions_.begin(), sessions_.end(),
                           [connection](const auto& s) { return s->connection.get() == connection; });
    return it == sessions_.end() ? nullptr : it->get();
}

void PairingServer::handleMessage(Session& session, MessageType type, const QByteArray& payload) {
    if (!may_handle_request(session.status, config_.pending_policy, type)) {
        reject(session, session.status == ClientStatus::Pending ? QStringLiteral("awaiting approval")
                                                                : QStringLiteral("not allowed"));
        return;
    }

    switch (type) {
        case MessageType::Hello:
            handleHello(session, payload);
            break;
        case MessageType::Ping:
            session.connection->send(MessageType::Pong, payload).inspect_err([](const Error& e) {
                qCDebug(pairlinkServerLog) << "Pong not sent:" << e.message.c_str();
            });
            break;
        case MessageType::Disconnect:
            dropSession(session.connection.get(), false);
            break;
        default:
            qCDebug(pairlinkServerLog) << "Ignoring unexpected frame" << static_cast<int>(type)
                                       << "from" << session.fingerprint;
            break;
    }
}

void PairingServer::handleHello(Session& session, const QByteArray& payload) {
    auto parsed = decode_payload(payload);
    if (parsed.is_err()) {
        reject(session, QStringLiteral("malformed hello"));
        return;
    }
    const auto& obj = parsed.unwrap();

    // Take a copy: registerContact emits signals that may drop sessions.
    const auto fingerprint = session.fingerprint;
    auto* conn = session.connection.get();
    auto status = registry_.registerContact(fingerprint,
                                            obj["alias"].toString(),
                                            obj["deviceModel"].toString());
    auto* live = findSession(conn);
    if (!live) return;

    if (status.is_err()) {
        reject(*live, QStringLiteral("server storage error"));
        return;
    }
    live->status = status.unwrap();
    live->hello_received = true;

    auto ack = status_payload(live->status);
    ack["alias"] = alias_;
    ack["fingerprint"] = identity_.fingerprint;
    live->connection->send(MessageType::HelloAck, encode_payload(ack)).inspect_err([](const Error& e) {
        qCDebug(pairlinkServerLog) << "HelloAck not sent:" << e.message.c_str();
    });
}

void PairingServer::reject(Session& session, const QString& reason) {
    QJsonObject obj;
    obj["reason"] = reason;
    session.connection->send(MessageType::Reject, encode_payload(obj)).inspect_err([](const Error& e) {
        qCDebug(pairlinkServerLog) << "Reject not sent:" << e.message.c_str();
    });
}

void PairingServer::dropSession(const Connection* connection, bool abort) {
    auto it = std::find_if(sessions_.begin(), sessions_.end(),
                           [connection](const auto& s) { return s->connection.get() == connection; });
    if (it == sessions_.end()) return;

    auto session = std::move(*it);
    sessions_.erase(it);

    auto* conn = session->connection.release();
    conn->disconnect(this);
    if (abort) {
        conn->abort();
    } else {
        conn->close();
    }
    conn->deleteLater();

    qCInfo(pairlinkServerLog) << "Session closed for" << session->fingerprint;
    emit clientDisconnected(session->fingerprint);
}

void PairingServer::dropSessionsOf(const QString& fingerprint) {
    std::vector<const Connection*> doomed;
    for (const auto& session : sessions_) {
        if (session->fingerprint == fingerprint) {
            doomed.push_back(session->connection.get());
        }
    }
    for (const auto* conn : doomed) {
        dropSession(conn, true);
    }
}

void PairingServer::onStatusChanged(const QString& fingerprint, ClientStatus status) {
    if (status == ClientStatus::Blocked) {
        dropSessionsOf(fingerprint);
        return;
    }
    for (auto& session : sessions_) {
        if (session->fingerprint != fingerprint) continue;
        session->status = status;
        session->connection->send(MessageType::StatusUpdate, encode_payload(status_payload(status)))
            .inspect_err([](const Error& e) {
                qCDebug(pairlinkServerLog) << "StatusUpdate not sent:" << e.message.c_str();
            });
    }
}

void PairingServer::onClientRemoved(const QString& fingerprint) {
    dropSessionsOf(fingerprint);
}

} // namespace pairlink::network
