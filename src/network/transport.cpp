#include "network/transport.hpp"

#include "core/logging.hpp"

#include <QJsonDocument>
#include <QSslConfiguration>
#include <QTimer>

namespace pairlink::network {
namespace {

bool is_handshake_error(QAbstractSocket::SocketError socket_error) {
    switch (socket_error) {
        case QAbstractSocket::RemoteHostClosedError:
        case QAbstractSocket::SslHandshakeFailedError:
        case QAbstractSocket::SslInternalError:
        case QAbstractSocket::SslInvalidUserDataError:
            return true;
        default:
            return false;
    }
}

} // namespace

bool is_known_message_type(uint8_t value) noexcept {
    switch (static_cast<MessageType>(value)) {
        case MessageType::Hello:
        case MessageType::HelloAck:
        case MessageType::StatusUpdate:
        case MessageType::Reject:
        case MessageType::Ping:
        case MessageType::Pong:
        case MessageType::Disconnect:
            return true;
    }
    return false;
}

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<pairlink::ErrorCode>("pairlink::ErrorCode");
    qRegisterMetaType<pairlink::network::MessageType>("pairlink::network::MessageType");
}

Connection::~Connection() {
    if (socket_) {
        socket_->disconnect(this);
        socket_->abort();
    }
}

void Connection::wireSocket() {
    connect(socket_.get(), &QSslSocket::encrypted, this, &Connection::onEncrypted);
    connect(socket_.get(), &QSslSocket::disconnected, this, &Connection::onSocketDisconnected);
    connect(socket_.get(), &QSslSocket::errorOccurred, this, &Connection::onSocketError);
    connect(socket_.get(), &QSslSocket::sslErrors, this, &Connection::onSslErrors);
    connect(socket_.get(), &QSslSocket::readyRead, this, &Connection::onReadyRead);
}

void Connection::connectToServer(const QString& host, uint16_t port,
                                 const crypto::LocalIdentity& identity) {
    openSocket(host, port, &identity);
}

void Connection::connectAnonymously(const QString& host, uint16_t port) {
    openSocket(host, port, nullptr);
}

void Connection::openSocket(const QString& host, uint16_t port,
                            const crypto::LocalIdentity* identity) {
    if (socket_) {
        socket_->disconnect(this);
        socket_->abort();
    }
    socket_ = std::make_unique<QSslSocket>();
    read_buffer_.clear();
    wireSocket();

    if (identity) {
        socket_->setLocalCertificate(identity->certificate);
        socket_->setPrivateKey(identity->private_key);
    }
    socket_->setPeerVerifyMode(QSslSocket::QueryPeer);
    connect(socket_.get(), &QSslSocket::connected, this, [this] { setState(State::Handshaking); });

    setState(State::Connecting);
    socket_->connectToHostEncrypted(host, port);
}

void Connection::adoptSocket(QSslSocket* socket) {
    socket->setParent(nullptr);
    socket_.reset(socket);
    read_buffer_.clear();
    wireSocket();

    setState(State::Connected);
    if (socket_->bytesAvailable() > 0) {
        QTimer::singleShot(0, this, &Connection::onReadyRead);
    }
}

void Connection::close() {
    if (!socket_ || state_ == State::Disconnected) return;
    if (state_ == State::Connected) {
        send(MessageType::Disconnect).inspect_err([](const Error& e) {
            qCDebug(pairlinkConnectLog) << "Disconnect frame not sent:" << e.message.c_str();
        });
    }
    socket_->disconnectFromHost();
    setState(State::Disconnected);
}

void Connection::abort() {
    if (!socket_) return;
    socket_->disconnect(this);
    socket_->abort();
    setState(State::Disconnected);
}

Result<void, Error> Connection::send(MessageType type, const QByteArray& payload) {
    if (state_ != State::Connected || !socket_) {
        return fail("not connected", ErrorCode::NetworkUnreachable);
    }
    if (static_cast<size_t>(payload.size()) > MessageHeader::MAX_PAYLOAD) {
        return fail("payload too large", ErrorCode::InvalidArgument);
    }

    const auto header = serializeHeader(MessageHeader{
        .type = type,
        .length = static_cast<uint32_t>(payload.size()),
    });
    QByteArray frame(reinterpret_cast<const char*>(header.data()), static_cast<int>(header.size()));
    frame.append(payload);

    if (socket_->write(frame) != frame.size()) {
        return fail("write failed: " + socket_->errorString().toStdString(),
                    ErrorCode::NetworkUnreachable);
    }
    socket_->flush();
    return Result<void, Error>::ok();
}

QSslCertificate Connection::peerCertificate() const {
    return socket_ ? socket_->peerCertificate() : QSslCertificate{};
}

QString Connection::peerAddress() const {
    return socket_ ? socket_->peerAddress().toString() : QString{};
}

void Connection::setState(State state) {
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

void Connection::failWith(ErrorCode code, const QString& message) {
    if (state_ == State::Failed || state_ == State::Disconnected) {
        return;
    }
    setState(State::Failed);
    emit failed(code, message);
}

void Connection::onEncrypted() {
    setState(State::Connected);
    emit connected();
}

void Connection::onSocketDisconnected() {
    if (state_ == State::Connecting || state_ == State::Handshaking) {
        failWith(ErrorCode::TlsHandshakeFailed, QStringLiteral("peer closed during handshake"));
        return;
    }
    if (state_ == State::Failed) {
        return;
    }
    setState(State::Disconnected);
    emit disconnected();
}

void Connection::onSocketError(QAbstractSocket::SocketError socket_error) {
    const auto message = socket_ ? socket_->errorString() : QString{};
    switch (state_) {
        case State::Connecting:
            failWith(socket_error == QAbstractSocket::SocketTimeoutError ? ErrorCode::Timeout
                                                                         : ErrorCode::NetworkUnreachable,
                     message);
            break;
        case State::Handshaking:
            failWith(is_handshake_error(socket_error) ? ErrorCode::TlsHandshakeFailed
                                                      : ErrorCode::NetworkUnreachable,
                     message);
            break;
        case State::Connected:
            if (socket_error != QAbstractSocket::RemoteHostClosedError) {
                qCWarning(pairlinkConnectLog) << "Session error:" << message;
            }
            break;
        default:
            break;
    }
}

void Connection::onSslErrors(const QList<QSslError>& errors) {
    // Self-signed certificates are expected; identity is checked by fingerprint.
    for (const auto& e : errors) {
        qCDebug(pairlinkConnectLog) << "Ignoring TLS chain error:" << e.errorString();
    }
    if (socket_) {
        socket_->ignoreSslErrors(errors);
    }
}

void Connection::onReadyRead() {
    if (!socket_) return;
    read_buffer_.append(socket_->readAll());

    while (read_buffer_.size() >= static_cast<int>(MessageHeader::HEADER_SIZE)) {
        std::vector<uint8_t> header_data(read_buffer_.begin(),
                                         read_buffer_.begin() + MessageHeader::HEADER_SIZE);
        auto header_result = deserializeHeader(header_data);
        if (header_result.is_err()) {
            qCWarning(pairlinkConnectLog) << "Bad frame from" << peerAddress() << ":"
                                          << header_result.unwrap_err().message.c_str();
            read_buffer_.clear();
            abort();
            emit disconnected();
            return;
        }

        const auto header = header_result.unwrap();
        const auto total = static_cast<int>(MessageHeader::HEADER_SIZE + header.length);
        if (read_buffer_.size() < total) {
            return;
        }

        const QByteArray payload = read_buffer_.mid(static_cast<int>(MessageHeader::HEADER_SIZE),
                                                    static_cast<int>(header.length));
        read_buffer_.remove(0, total);

        if (!is_known_message_type(static_cast<uint8_t>(header.type))) {
            qCDebug(pairlinkConnectLog) << "Skipping unknown frame type"
                                        << static_cast<int>(header.type);
            continue;
        }
        emit messageReceived(header.type, payload);
        if (!socket_ || state_ != State::Connected) {
            return;
        }
    }
}

// ============================================================================
// TlsServer
// ============================================================================

TlsServer::TlsServer(const crypto::LocalIdentity& identity, QObject* parent)
    : QTcpServer(parent)
    , certificate_(identity.certificate)
    , private_key_(identity.private_key)
{
}

void TlsServer::incomingConnection(qintptr socket_descriptor) {
    auto* socket = new QSslSocket(this);
    if (!socket->setSocketDescriptor(socket_descriptor)) {
        qCWarning(pairlinkServerLog) << "Cannot adopt incoming socket:" << socket->errorString();
        socket->deleteLater();
        return;
    }

    socket->setLocalCertificate(certificate_);
    socket->setPrivateKey(private_key_);
    socket->setPeerVerifyMode(QSslSocket::QueryPeer);

    auto* deadline = new QTimer(socket);
    deadline->setSingleShot(true);
    connect(deadline, &QTimer::timeout, socket, [socket] {
        qCInfo(pairlinkServerLog) << "TLS handshake timed out for" << socket->peerAddress().toString();
        socket->abort();
        socket->deleteLater();
    });

    connect(socket, &QSslSocket::sslErrors, socket, [socket](const QList<QSslError>& errors) {
        socket->ignoreSslErrors(errors);
    });
    connect(socket, &QSslSocket::encrypted, this, [this, socket, deadline] {
        deadline->stop();
        deadline->deleteLater();
        socket->disconnect(this);
        emit secureConnection(socket);
    });
    connect(socket, &QSslSocket::errorOccurred, this, [socket](QAbstractSocket::SocketError) {
        if (!socket->isEncrypted()) {
            qCDebug(pairlinkServerLog) << "Handshake failed:" << socket->errorString();
            socket->deleteLater();
        }
    });

    deadline->start(handshake_timeout_ms_);
    socket->startServerEncryption();
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<uint8_t> serializeHeader(const MessageHeader& header) {
    std::vector<uint8_t> data(MessageHeader::HEADER_SIZE);
    data[0] = MessageHeader::MAGIC[0];
    data[1] = MessageHeader::MAGIC[1];
    data[2] = MessageHeader::VERSION;
    data[3] = static_cast<uint8_t>(header.type);
    data[4] = (header.length >> 24) & 0xFF;
    data[5] = (header.length >> 16) & 0xFF;
    data[6] = (header.length >> 8) & 0xFF;
    data[7] = header.length & 0xFF;
    return data;
}

Result<MessageHeader, Error> deserializeHeader(const std::vector<uint8_t>& data) {
    using R = Result<MessageHeader, Error>;
    if (data.size() < MessageHeader::HEADER_SIZE) {
        return R::err(Error{"header too short", ErrorCode::InvalidArgument});
    }
    if (data[0] != MessageHeader::MAGIC[0] || data[1] != MessageHeader::MAGIC[1]) {
        return R::err(Error{"invalid magic", ErrorCode::InvalidArgument});
    }
    if (data[2] != MessageHeader::VERSION) {
        return R::err(Error{"unsupported version", ErrorCode::InvalidArgument});
    }

    MessageHeader header{
        .type = static_cast<MessageType>(data[3]),
        .length = (static_cast<uint32_t>(data[4]) << 24) |
                  (static_cast<uint32_t>(data[5]) << 16) |
                  (static_cast<uint32_t>(data[6]) << 8) |
                  static_cast<uint32_t>(data[7]),
    };
    if (header.length > MessageHeader::MAX_PAYLOAD) {
        return R::err(Error{"frame too large", ErrorCode::InvalidArgument});
    }
    return R::ok(header);
}

QByteArray encode_payload(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<QJsonObject, Error> decode_payload(const QByteArray& payload) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(payload, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<QJsonObject, Error>::err(Error{"invalid payload", ErrorCode::InvalidArgument});
    }
    return Result<QJsonObject, Error>::ok(doc.object());
}

} // namespace pairlink::network
