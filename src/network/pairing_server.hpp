#pragma once

#include "core/config.hpp"
#include "core/peer.hpp"
#include "core/result.hpp"
#include "crypto/identity.hpp"
#include "network/transport.hpp"

#include <QHostAddress>
#include <QJsonObject>
#include <QObject>
#include <QStringList>

#include <memory>
#include <optional>
#include <vector>

namespace pairlink::network {

class ClientRegistry;

/**
 * PairingServer - the listening side of pairing.
 *
 * Every client must present a certificate. Its fingerprint is looked up in
 * the ClientRegistry: blocked clients are cut off right after the TLS
 * handshake, unknown clients are registered as PENDING and held, approved
 * clients are served. Approval changes are pushed to live sessions.
 *
 * Session protocol (see MessageType):
 *   client                         server
 *   Hello {alias, deviceModel} ->
 *                              <-  HelloAck {status}
 *   Ping                       ->
 *                              <-  Pong | Reject {reason}
 *                              <-  StatusUpdate {status}   (on approval)
 */
class PairingServer : public QObject {
    Q_OBJECT

public:
    PairingServer(const crypto::LocalIdentity& identity,
                  ClientRegistry& registry,
                  PairingConfig config,
                  QObject* parent = nullptr);
    ~PairingServer() override;

    /**
     * Listen on `interface_address`. `port` defaults to the configured
     * server port; 0 picks a free one. Returns the bound port.
     *
     * AlreadyRunning if started, InvalidArgument for an unparsable address,
     * NetworkUnreachable if the bind fails.
     */
    Result<uint16_t, Error> start(const QString& interface_address,
                                  const QString& alias,
                                  std::optional<uint16_t> port = std::nullopt);

    /**
     * Close the listener and every session. Stopping a stopped server is a
     * no-op.
     */
    void stop();

    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] QString alias() const { return alias_; }
    [[nodiscard]] int sessionCount() const { return static_cast<int>(sessions_.size()); }

    // Fingerprints with a live session, sorted.
    [[nodiscard]] QStringList connectedClients() const;

signals:
    void runningChanged(bool running);
    void clientConnected(const QString& fingerprint, pairlink::ClientStatus status);
    void clientDisconnected(const QString& fingerprint);
    void clientRejected(const QString& fingerprint, const QString& reason);
    void error(const QString& message);

private slots:
    void onSecureConnection(QSslSocket* socket);
    void onStatusChanged(const QString& fingerprint, pairlink::ClientStatus status);
    void onClientRemoved(const QString& fingerprint);

private:
    struct Session {
        std::unique_ptr<Connection> connection;
        QString fingerprint;
        ClientStatus status = ClientStatus::Pending;
        bool hello_received = false;
    };

    Session* findSession(const Connection* connection);
    void handleMessage(Session& session, MessageType type, const QByteArray& payload);
    void handleHello(Session& session, const QByteArray& payload);
    void reject(Session& session, const QString& reason);
    void dropSession(const Connection* connection, bool abort);
    void dropSessionsOf(const QString& fingerprint);

    crypto::LocalIdentity identity_;
    ClientRegistry& registry_;
    PairingConfig config_;
    std::unique_ptr<TlsServer> server_;
    std::vector<std::unique_ptr<Session>> sessions_;
    QString alias_;
};

/**
 * JSON shape of status-bearing frames: {"status": 0|1|2, "statusName": ".."}.
 */
QJsonObject status_payload(ClientStatus status);
std::optional<ClientStatus> status_from_payload(const QJsonObject& obj);

} // namespace pairlink::network
