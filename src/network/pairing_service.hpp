#pragma once

#include "core/config.hpp"
#include "core/peer.hpp"
#include "core/result.hpp"
#include "crypto/identity.hpp"
#include "network/certificate_fetcher.hpp"
#include "network/client_registry.hpp"
#include "network/connection_manager.hpp"
#include "network/discovery.hpp"

#include <QObject>
#include <QStringList>

#include <memory>
#include <optional>
#include <vector>

namespace pairlink::network {

class DiscoveryBroadcaster;
class DiscoveryListener;
class PairingServer;
class TrustStore;

/**
 * PairingService - the command surface an application drives.
 *
 * Owns the local identity, the two persistent stores and every network
 * component, and forwards their notifications. Commands answer with a
 * Result; long-running ones (connect, fetch) answer through a callback.
 * Everything lives on the thread that called initialize().
 */
class PairingService : public QObject {
    Q_OBJECT

public:
    explicit PairingService(QObject* parent = nullptr);
    ~PairingService() override;

    /**
     * Open `<data_dir>/pairlink.db`, migrate it, load both stores and the
     * local identity (created on first run).
     */
    Result<void, Error> initialize(PairingConfig config);
    [[nodiscard]] bool isInitialized() const { return initialized_; }

    // Discovery. An empty fingerprint means the local one.
    Result<void, Error> startBroadcast(int duration_seconds, const QString& alias,
                                       const QString& fingerprint = {});
    void stopBroadcast();
    Result<void, Error> startListening(const QString& alias, const QString& fingerprint = {});
    void stopListening();
    [[nodiscard]] std::vector<DiscoveredDevice> discoveredDevices() const;

    // Server side.
    Result<uint16_t, Error> startServer(const QString& interface_address, const QString& alias,
                                        std::optional<uint16_t> port = std::nullopt);
    Result<void, Error> stopServer();
    [[nodiscard]] Result<ClientList, Error> listClients() const;
    Result<void, Error> updateClientStatus(const QString& fingerprint, ClientStatus status);
    Result<void, Error> removeTrustedClient(const QString& fingerprint);

    // Identity.
    [[nodiscard]] QString sslCertificateFingerprint() const;

    // Trust.
    Result<TrustedServerCertificate, Error> trustServer(const QString& fingerprint,
                                                        const QStringList& hosts);
    Result<void, Error> editHosts(const QString& fingerprint, const QStringList& hosts);
    Result<void, Error> removeTrustedServer(const QString& fingerprint);
    [[nodiscard]] TrustList trustedServers() const;

    // Client side.
    void fetchServerCertificate(const QString& url, FetchCallback callback);
    void connectToHosts(const QStringList& hosts, ConnectCallback callback);
    void connectTrusted(const QString& fingerprint, ConnectCallback callback);
    void disconnectSession();

    [[nodiscard]] const PairingConfig& config() const { return config_; }
    [[nodiscard]] const crypto::LocalIdentity& identity() const { return identity_; }
    [[nodiscard]] DiscoveryBroadcaster* broadcaster() const { return broadcaster_.get(); }
    [[nodiscard]] DiscoveryListener* listener() const { return listener_.get(); }
    [[nodiscard]] PairingServer* server() const { return server_.get(); }
    [[nodiscard]] ClientRegistry* clients() const { return clients_.get(); }
    [[nodiscard]] TrustStore* trust() const { return trust_.get(); }
    [[nodiscard]] ConnectionManager* connections() const { return connections_.get(); }

signals:
    void discoveredDevice(const pairlink::network::DiscoveredDevice& device);
    void deviceLost(const QString& fingerprint);
    void trustListUpdated(const pairlink::TrustList& list);
    void clientsChanged(const pairlink::network::ClientList& clients);
    void approvalRequired(const pairlink::ClientSummary& client);
    void remoteStatusChanged(pairlink::ClientStatus status);
    void error(const QString& message);

private:
    [[nodiscard]] Result<void, Error> ready() const;
    [[nodiscard]] QString fingerprintOrLocal(const QString& fingerprint) const;

    bool initialized_ = false;
    PairingConfig config_;
    crypto::LocalIdentity identity_;
    std::unique_ptr<TrustStore> trust_;
    std::unique_ptr<ClientRegistry> clients_;
    std::unique_ptr<DiscoveryBroadcaster> broadcaster_;
    std::unique_ptr<DiscoveryListener> listener_;
    std::unique_ptr<PairingServer> server_;
    std::unique_ptr<CertificateFetcher> fetcher_;
    std::unique_ptr<ConnectionManager> connections_;
};

} // namespace pairlink::network
