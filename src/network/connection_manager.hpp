#pragma once

#include "core/config.hpp"
#include "core/peer.hpp"
#include "core/result.hpp"
#include "crypto/identity.hpp"
#include "network/certificate_fetcher.hpp"
#include "network/transport.hpp"

#include <QObject>
#include <QStringList>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

class QTimer;

namespace pairlink::network {

class TrustStore;

/**
 * Outcome of dialing one candidate host.
 */
struct ConnectAttempt {
    QString host;
    ErrorCode code;
    QString message;
};

struct ConnectSuccess {
    QString connected_host;
    QString fingerprint;
};

struct ConnectFailure {
    ErrorCode code;
    std::vector<ConnectAttempt> attempts;

    QString summary() const;
};

using ConnectResult = Result<ConnectSuccess, ConnectFailure>;
using ConnectCallback = std::function<void(ConnectResult)>;

/**
 * Reduce per-host failures to one code: FingerprintMismatch if any host
 * presented the wrong certificate, else Timeout if every host timed out,
 * else UntrustedHost if no host was trusted, else NetworkUnreachable.
 */
[[nodiscard]] ErrorCode aggregate_failure(const std::vector<ConnectAttempt>& attempts);

/**
 * ConnectionManager - reconnects to paired servers.
 *
 * Candidate hosts are dialed one after the other, in the order given, each
 * bounded by the configured connect timeout. A host only counts when the
 * certificate it presents has exactly the fingerprint the TrustStore pins
 * for it and the server acknowledges our Hello; a refusal, an early close or
 * anything else is recorded and the next host is tried. The first host that
 * gets that far becomes the session. The TrustStore is only read.
 */
class ConnectionManager : public QObject {
    Q_OBJECT

public:
    ConnectionManager(const crypto::LocalIdentity& identity,
                      const TrustStore& trust,
                      PairingConfig config,
                      QObject* parent = nullptr);
    ~ConnectionManager() override;

    // Alias sent in Hello.
    void setLocalAlias(const QString& alias) { alias_ = alias; }

    /**
     * Connect to the first of `hosts` that proves the fingerprint the
     * TrustStore has for it. `callback` runs exactly once.
     */
    void connectToHosts(const QStringList& hosts, ConnectCallback callback);

    /**
     * Same, over every host recorded for `fingerprint`; NotFound when the
     * fingerprint is not trusted.
     */
    void connectTrusted(const QString& fingerprint, ConnectCallback callback);

    /**
     * Close the session, if any.
     */
    void disconnectSession();

    Result<void, Error> ping();

    [[nodiscard]] bool isConnected() const;
    [[nodiscard]] bool isConnecting() const { return attempt_ != nullptr; }
    [[nodiscard]] QString connectedHost() const { return connected_host_; }
    [[nodiscard]] QString connectedFingerprint() const { return connected_fingerprint_; }
    [[nodiscard]] std::optional<ClientStatus> remoteStatus() const { return remote_status_; }

signals:
    void sessionEstablished(const QString& host, const QString& fingerprint);
    void sessionClosed();
    void remoteStatusChanged(pairlink::ClientStatus status);
    void requestRejected(const QString& reason);
    void pongReceived();

private:
    struct Candidate {
        QString host;
        QString expected_fingerprint;   // empty: not trusted
    };

    struct Attempt {
        std::vector<Candidate> candidates;
        size_t next = 0;
        std::vector<ConnectAttempt> results;
        ConnectCallback callback;
        std::unique_ptr<Connection> connection;
        std::unique_ptr<QTimer> deadline;
        Candidate current;
    };

    void begin(std::vector<Candidate> candidates, ConnectCallback callback);
    void tryNext();
    void recordAndContinue(ErrorCode code, const QString& message);
    void onAttemptConnected();
    void onAttemptMessage(MessageType type, const QByteArray& payload);
    void finishSuccess(ClientStatus status);
    void finishFailure(ErrorCode code);
    void sendHello(Connection& connection);
    void adoptSession(std::unique_ptr<Connection> connection);
    void onSessionMessage(MessageType type, const QByteArray& payload);
    void onSessionDisconnected();
    void dropAttemptConnection();
    void failLater(ConnectCallback callback, ConnectFailure failure);

    crypto::LocalIdentity identity_;
    const TrustStore& trust_;
    PairingConfig config_;
    QString alias_;

    std::unique_ptr<Attempt> attempt_;
    std::unique_ptr<Connection> session_;
    QString connected_host_;
    QString connected_fingerprint_;
    std::optional<ClientStatus> remote_status_;
};

} // namespace pairlink::network
