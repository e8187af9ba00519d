#pragma once

#include "core/errors.hpp"
#include "core/result.hpp"
#include "crypto/identity.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <QMetaType>
#include <QObject>
#include <QPointer>
#include <QSslCertificate>
#include <QSslSocket>
#include <QTcpServer>

#include <memory>
#include <vector>

class QTimer;

namespace pairlink::network {

/**
 * Message types of the pairing session protocol.
 */
enum class MessageType : uint8_t {
    // Session setup
    Hello = 0x01,       // client -> server {alias, deviceModel}
    HelloAck = 0x02,    // server -> client {status}
    StatusUpdate = 0x03,// server -> client {status}, on approval changes
    Reject = 0x04,      // server -> client {reason}, request refused

    // Control
    Ping = 0x30,
    Pong = 0x31,
    Disconnect = 0x3F,
};

[[nodiscard]] bool is_known_message_type(uint8_t value) noexcept;

/**
 * Frame header.
 *
 * Format:
 * - Magic (2 bytes): 0x50 0x4C ("PL")
 * - Version (1 byte)
 * - Type (1 byte)
 * - Length (4 bytes, big-endian)
 * - Payload (Length bytes, at most MAX_PAYLOAD)
 */
struct MessageHeader {
    static constexpr uint8_t MAGIC[2] = {0x50, 0x4C};
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 8;
    static constexpr uint32_t MAX_PAYLOAD = 64 * 1024;

    MessageType type;
    uint32_t length;
};

std::vector<uint8_t> serializeHeader(const MessageHeader& header);
Result<MessageHeader, Error> deserializeHeader(const std::vector<uint8_t>& data);

// JSON payload helpers.
QByteArray encode_payload(const QJsonObject& obj);
Result<QJsonObject, Error> decode_payload(const QByteArray& payload);

/**
 * Connection - one TLS session carrying framed messages.
 *
 * Both roles present the local certificate and ask the peer for its own.
 * Chain validation is off; peers are identified by certificate fingerprint
 * and the caller decides whether that fingerprint is acceptable.
 */
class Connection : public QObject {
    Q_OBJECT

public:
    enum class State {
        Disconnected,
        Connecting,
        Handshaking,
        Connected,
        Failed
    };
    Q_ENUM(State)

    explicit Connection(QObject* parent = nullptr);
    ~Connection() override;

    /**
     * Open a TLS session to `host:port` as the client.
     */
    void connectToServer(const QString& host, uint16_t port, const crypto::LocalIdentity& identity);

    /**
     * Open a TLS session without presenting a certificate. Used to look at
     * the server certificate only.
     */
    void connectAnonymously(const QString& host, uint16_t port);

    /**
     * Take over a socket whose server-side handshake already completed.
     */
    void adoptSocket(QSslSocket* socket);

    /**
     * Say goodbye and close gracefully.
     */
    void close();

    /**
     * Drop the socket immediately, sending nothing.
     */
    void abort();

    Result<void, Error> send(MessageType type, const QByteArray& payload = {});

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isConnected() const { return state_ == State::Connected; }
    [[nodiscard]] QSslCertificate peerCertificate() const;
    [[nodiscard]] QString peerAddress() const;

signals:
    void connected();
    void disconnected();
    void messageReceived(pairlink::network::MessageType type, const QByteArray& payload);
    void failed(pairlink::ErrorCode code, const QString& message);
    void stateChanged(pairlink::network::Connection::State state);

private slots:
    void onEncrypted();
    void onSocketDisconnected();
    void onSocketError(QAbstractSocket::SocketError socket_error);
    void onSslErrors(const QList<QSslError>& errors);
    void onReadyRead();

private:
    void wireSocket();
    void openSocket(const QString& host, uint16_t port, const crypto::LocalIdentity* identity);
    void setState(State state);
    void failWith(ErrorCode code, const QString& message);

    State state_ = State::Disconnected;
    std::unique_ptr<QSslSocket> socket_;
    QByteArray read_buffer_;
};

/**
 * TlsServer - TCP server that upgrades every accepted socket to TLS.
 *
 * Clients are asked for a certificate but not required to present one.
 * Sockets that do not finish the handshake within `handshake_timeout_ms`
 * are dropped.
 */
class TlsServer : public QTcpServer {
    Q_OBJECT

public:
    explicit TlsServer(const crypto::LocalIdentity& identity, QObject* parent = nullptr);

    void setHandshakeTimeout(int timeout_ms) { handshake_timeout_ms_ = timeout_ms; }

signals:
    /**
     * A client finished the TLS handshake. The receiver takes ownership.
     */
    void secureConnection(QSslSocket* socket);

protected:
    void incomingConnection(qintptr socket_descriptor) override;

private:
    QSslCertificate certificate_;
    QSslKey private_key_;
    int handshake_timeout_ms_ = 10000;
};

} // namespace pairlink::network

Q_DECLARE_METATYPE(pairlink::ErrorCode)
Q_DECLARE_METATYPE(pairlink::network::MessageType)
