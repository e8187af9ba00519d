#include "network/connection_manager.hpp"

#include "core/logging.hpp"
#include "crypto/fingerprint.hpp"
#include "network/pairing_server.hpp"
#include "network/trust_store.hpp"

#include <QJsonObject>
#include <QSysInfo>
#include <QTimer>

#include <algorithm>

namespace pairlink::network {

QString ConnectFailure::summary() const {
    QStringList parts;
    for (const auto& a : attempts) {
        parts << QStringLiteral("%1: %2 (%3)")
                     .arg(a.host, QString::fromLatin1(to_string(a.code).data()), a.message);
    }
    const auto head = QString::fromLatin1(to_string(code).data());
    return parts.isEmpty() ? head : head + QStringLiteral(" [") + parts.join("; ") + ']';
}

ErrorCode aggregate_failure(const std::vector<ConnectAttempt>& attempts) {
    auto all = [&attempts](ErrorCode code) {
        return std::all_of(attempts.begin(), attempts.end(),
                           [code](const ConnectAttempt& a) { return a.code == code; });
    };
    if (std::any_of(attempts.begin(), attempts.end(),
                    [](const ConnectAttempt& a) { return a.code == ErrorCode::FingerprintMismatch; })) {
        return ErrorCode::FingerprintMismatch;
    }
    if (!attempts.empty() && all(ErrorCode::Timeout)) {
        return ErrorCode::Timeout;
    }
    if (all(ErrorCode::UntrustedHost)) {
        return ErrorCode::UntrustedHost;
    }
    return ErrorCode::NetworkUnreachable;
}

ConnectionManager::ConnectionManager(const crypto::LocalIdentity& identity,
                                     const TrustStore& trust,
                                     PairingConfig config,
                                     QObject* parent)
    : QObject(parent)
    , identity_(identity)
    , trust_(trust)
    , config_(std::move(config))
    , alias_(QSysInfo::machineHostName())
{
}

ConnectionManager::~ConnectionManager() {
    dropAttemptConnection();
    if (session_) {
        session_->disconnect(this);
        session_->abort();
    }
}

void ConnectionManager::connectToHosts(const QStringList& hosts, ConnectCallback callback) {
    std::vector<Candidate> candidates;
    for (const auto& raw : hosts) {
        const auto host = raw.trimmed();
        if (host.isEmpty()) continue;
        candidates.push_back(Candidate{host, trust_.fingerprintForHost(host, config_.server_port).value_or(QString{})});
    }
    begin(std::move(candidates), std::move(callback));
}

void ConnectionManager::connectTrusted(const QString& fingerprint, ConnectCallback callback) {
    const auto entry = trust_.trustedServer(fingerprint);
    if (!entry) {
        failLater(std::move(callback),
                  ConnectFailure{ErrorCode::NotFound,
                                 {ConnectAttempt{QString{}, ErrorCode::NotFound,
                                                 QStringLiteral("fingerprint %1 is not trusted").arg(fingerprint)}}});
        return;
    }

    std::vector<Candidate> candidates;
    for (const auto& host : entry->hosts) {
        candidates.push_back(Candidate{QString::fromStdString(host), QString::fromStdString(entry->fingerprint)});
    }
    begin(std::move(candidates), std::move(callback));
}

void ConnectionManager::failLater(ConnectCallback callback, ConnectFailure failure) {
    QTimer::singleShot(0, this, [callback = std::move(callback), failure = std::move(failure)] {
        callback(ConnectResult::err(failure));
    });
}

void ConnectionManager::begin(std::vector<Candidate> candidates, ConnectCallback callback) {
    if (attempt_) {
        failLater(std::move(callback),
                  ConnectFailure{ErrorCode::AlreadyRunning,
                                 {ConnectAttempt{QString{}, ErrorCode::AlreadyRunning,
                                                 QStringLiteral("a connection attempt is in progress")}}});
        return;
    }

    if (session_) {
        qCInfo(pairlinkConnectLog) << "Closing session with" << connected_host_ << "for a new connect";
        disconnectSession();
    }

    attempt_ = std::make_unique<Attempt>();
    attempt_->candidates = std::move(candidates);
    attempt_->callback = std::move(callback);

    // Deliver the outcome from the event loop even when nothing is dialed.
    QTimer::singleShot(0, this, &ConnectionManager::tryNext);
}

void ConnectionManager::tryNext() {
    if (!attempt_) return;
    dropAttemptConnection();

    while (attempt_->next < attempt_->candidates.size()) {
        const auto candidate = attempt_->candidates[attempt_->next++];
        attempt_->current = candidate;

        if (candidate.expected_fingerprint.isEmpty()) {
            attempt_->results.push_back(ConnectAttempt{candidate.host, ErrorCode::UntrustedHost,
                                                       QStringLiteral("no trusted fingerprint for host")});
            continue;
        }

        auto endpoint = parse_endpoint(candidate.host, config_.server_port);
        if (endpoint.is_err()) {
            attempt_->results.push_back(ConnectAttempt{
                candidate.host, ErrorCode::InvalidArgument,
                QString::fromStdString(endpoint.unwrap_err().message)});
            continue;
        }

        auto& attempt = *attempt_;
        attempt.connection = std::make_unique<Connection>();
        attempt.deadline = std::make_unique<QTimer>();
        attempt.deadline->setSingleShot(true);

        connect(attempt.connection.get(), &Connection::connected, this,
                &ConnectionManager::onAttemptConnected);
        connect(attempt.connection.get(), &Connection::failed, this,
                [this](ErrorCode code, const QString& message) { recordAndContinue(code, message); });
        connect(attempt.deadline.get(), &QTimer::timeout, this, [this] {
            recordAndContinue(ErrorCode::Timeout,
                              QStringLiteral("no verified session within %1 ms").arg(config_.connect_timeout_ms));
        });

        qCDebug(pairlinkConnectLog) << "Dialing" << endpoint.unwrap().toString() << "expecting"
                                    << candidate.expected_fingerprint;
        attempt.deadline->start(config_.connect_timeout_ms);
        attempt.connection->connectToServer(endpoint.unwrap().host, endpoint.unwrap().port, identity_);
        return;
    }

    finishFailure(aggregate_failure(attempt_->results));
}

void ConnectionManager::recordAndContinue(ErrorCode code, const QString& message) {
    if (!attempt_) return;
    qCInfo(pairlinkConnectLog) << "Host" << attempt_->current.host << "failed:"
                               << QString::fromLatin1(to_string(code).data()) << message;
    attempt_->results.push_back(ConnectAttempt{attempt_->current.host, code, message});
    // Leave the signal emitter's stack before destroying it.
    QTimer::singleShot(0, this, &ConnectionManager::tryNext);
    if (attempt_->deadline) attempt_->deadline->stop();
    if (attempt_->connection) {
        attempt_->connection->disconnect(this);
        attempt_->connection->abort();
    }
}

void ConnectionManager::onAttemptConnected() {
    if (!attempt_ || !attempt_->connection) return;

    const auto& expected = attempt_->current.expected_fingerprint;
    auto presented = crypto::fingerprint_of(attempt_->connection->peerCertificate());
    if (presented.is_err()) {
        recordAndContinue(ErrorCode::TlsHandshakeFailed,
                          QString::fromStdString(presented.unwrap_err().message));
        return;
    }
    if (!crypto::fingerprints_equal(presented.unwrap(), expected)) {
        qCWarning(pairlinkConnectLog) << "Host" << attempt_->current.host << "presented"
                                      << presented.unwrap() << "instead of" << expected;
        recordAndContinue(ErrorCode::FingerprintMismatch,
                          QStringLiteral("presented %1, expected %2").arg(presented.unwrap(), expected));
        return;
    }

    // The certificate is right; the host only counts once the server has
    // admitted us and acknowledged Hello. The deadline keeps running.
    auto* conn = attempt_->connection.get();
    connect(conn, &Connection::messageReceived, this, &ConnectionManager::onAttemptMessage);
    connect(conn, &Connection::disconnected, this, [this] {
        recordAndContinue(ErrorCode::NetworkUnreachable,
                          QStringLiteral("server closed the session before acknowledging"));
    });
    sendHello(*conn);
}

void ConnectionManager::onAttemptMessage(MessageType type, const QByteArray& payload) {
    if (!attempt_) return;
    auto decoded = decode_payload(payload);
    const auto obj = decoded.is_ok() ? decoded.unwrap() : QJsonObject{};

    switch (type) {
        case MessageType::HelloAck: {
            const auto status = status_from_payload(obj);
            if (!status) {
                recordAndContinue(ErrorCode::NetworkUnreachable,
                                  QStringLiteral("acknowledgement without a valid status"));
                return;
            }
            finishSuccess(*status);
            break;
        }
        case MessageType::Reject:
            recordAndContinue(ErrorCode::NetworkUnreachable,
                              QStringLiteral("rejected: %1").arg(obj["reason"].toString()));
            break;
        case MessageType::Disconnect:
            recordAndContinue(ErrorCode::NetworkUnreachable,
                              QStringLiteral("server said goodbye before acknowledging"));
            break;
        default:
            qCDebug(pairlinkConnectLog) << "Ignoring frame" << static_cast<int>(type) << "before HelloAck";
            break;
    }
}

void ConnectionManager::finishSuccess(ClientStatus status) {
    auto attempt = std::move(attempt_);
    attempt->deadline->stop();
    attempt->connection->disconnect(this);
    attempt->deadline.release()->deleteLater();

    connected_host_ = attempt->current.host;
    connected_fingerprint_ = attempt->current.expected_fingerprint;
    adoptSession(std::move(attempt->connection));
    remote_status_ = status;

    qCInfo(pairlinkConnectLog) << "Connected to" << connected_host_ << "as" << connected_fingerprint_
                               << "status" << QString::fromLatin1(to_string(status).data());
    emit sessionEstablished(connected_host_, connected_fingerprint_);
    attempt->callback(ConnectResult::ok(ConnectSuccess{connected_host_, connected_fingerprint_}));
    emit remoteStatusChanged(status);
}

void ConnectionManager::finishFailure(ErrorCode code) {
    auto attempt = std::move(attempt_);
    ConnectFailure failure{code, std::move(attempt->results)};
    qCInfo(pairlinkConnectLog) << "Connect failed:" << failure.summary();
    attempt->callback(ConnectResult::err(std::move(failure)));
}

void ConnectionManager::adoptSession(std::unique_ptr<Connection> connection) {
    session_ = std::move(connection);
    remote_status_.reset();
    connect(session_.get(), &Connection::messageReceived, this, &ConnectionManager::onSessionMessage);
    connect(session_.get(), &Connection::disconnected, this, &ConnectionManager::onSessionDisconnected);
}

void ConnectionManager::sendHello(Connection& connection) {
    QJsonObject hello;
    hello["alias"] = alias_;
    hello["deviceModel"] = config_.device_model;
    hello["fingerprint"] = identity_.fingerprint;
    connection.send(MessageType::Hello, encode_payload(hello)).inspect_err([this](const Error& e) {
        qCWarning(pairlinkConnectLog) << "Hello not sent:" << e.message.c_str();
        recordAndContinue(ErrorCode::NetworkUnreachable, QString::fromStdString(e.message));
    });
}

void ConnectionManager::onSessionMessage(MessageType type, const QByteArray& payload) {
    auto decoded = decode_payload(payload);
    const auto obj = decoded.is_ok() ? decoded.unwrap() : QJsonObject{};

    switch (type) {
        case MessageType::HelloAck:
        case MessageType::StatusUpdate: {
            const auto status = status_from_payload(obj);
            if (!status) {
                qCWarning(pairlinkConnectLog) << "Status frame without a valid status";
                return;
            }
            if (remote_status_ != status) {
                remote_status_ = status;
                qCInfo(pairlinkConnectLog) << "Server reports us as"
                                           << QString::fromLatin1(to_string(*status).data());
                emit remoteStatusChanged(*status);
            }
            break;
        }
        case MessageType::Reject:
            emit requestRejected(obj["reason"].toString());
            break;
        case MessageType::Pong:
            emit pongReceived();
            break;
        case MessageType::Disconnect:
            onSessionDisconnected();
            break;
        default:
            qCDebug(pairlinkConnectLog) << "Ignoring frame" << static_cast<int>(type);
            break;
    }
}

void ConnectionManager::onSessionDisconnected() {
    if (!session_) return;
    auto* conn = session_.release();
    conn->disconnect(this);
    conn->abort();
    conn->deleteLater();

    qCInfo(pairlinkConnectLog) << "Session with" << connected_host_ << "closed";
    connected_host_.clear();
    connected_fingerprint_.clear();
    remote_status_.reset();
    emit sessionClosed();
}

void ConnectionManager::disconnectSession() {
    if (!session_) return;
    session_->disconnect(this);
    session_->close();
    session_.release()->deleteLater();

    connected_host_.clear();
    connected_fingerprint_.clear();
    remote_status_.reset();
    emit sessionClosed();
}

Result<void, Error> ConnectionManager::ping() {
    if (!session_) {
        return fail("not connected", ErrorCode::NetworkUnreachable);
    }
    return session_->send(MessageType::Ping);
}

bool ConnectionManager::isConnected() const {
    return session_ && session_->isConnected();
}

void ConnectionManager::dropAttemptConnection() {
    if (!attempt_) return;
    if (attempt_->deadline) {
        attempt_->deadline->stop();
        attempt_->deadline.release()->deleteLater();
    }
    if (attempt_->connection) {
        attempt_->connection->disconnect(this);
        attempt_->connection->abort();
        attempt_->connection.release()->deleteLater();
    }
}

} // namespace pairlink::network
