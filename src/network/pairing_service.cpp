#include "network/pairing_service.hpp"

#include "core/logging.hpp"
#include "crypto/fingerprint.hpp"
#include "network/discovery_broadcaster.hpp"
#include "network/discovery_listener.hpp"
#include "network/pairing_server.hpp"
#include "network/trust_store.hpp"
#include "storage/migrations.hpp"

#include <QDir>
#include <QTimer>

namespace pairlink::network {

namespace {

Result<storage::Database, Error> open_store(const QString& path, bool migrate) {
    auto db = storage::Database::open(path.toStdString());
    if (db.is_err() || !migrate) {
        return db;
    }
    auto migrated = storage::initialize_database(db.unwrap());
    if (migrated.is_err()) {
        return Result<storage::Database, Error>::err(migrated.unwrap_err());
    }
    return db;
}

} // namespace

PairingService::PairingService(QObject* parent)
    : QObject(parent)
{
}

// Members go in reverse order: sessions before the stores they reference.
PairingService::~PairingService() = default;

Result<void, Error> PairingService::initialize(PairingConfig config) {
    if (initialized_) {
        return fail("pairing service already initialized", ErrorCode::AlreadyRunning);
    }

    auto crypto_ready = crypto::init();
    if (crypto_ready.is_err()) {
        return crypto_ready;
    }

    config.validate();
    config_ = std::move(config);

    const auto data_dir = config_.resolved_data_dir();
    if (!QDir().mkpath(data_dir)) {
        return fail("cannot create data directory " + data_dir.toStdString(), ErrorCode::Storage);
    }

    auto identity = crypto::load_or_create_identity(data_dir);
    if (identity.is_err()) {
        return Result<void, Error>::err(identity.unwrap_err());
    }
    identity_ = std::move(identity).unwrap();

    // One connection per store so their transactions never share a handle.
    const auto db_path = QDir(data_dir).filePath(QStringLiteral("pairlink.db"));
    auto trust_db = open_store(db_path, true);
    if (trust_db.is_err()) {
        return Result<void, Error>::err(trust_db.unwrap_err());
    }
    auto clients_db = open_store(db_path, false);
    if (clients_db.is_err()) {
        return Result<void, Error>::err(clients_db.unwrap_err());
    }

    trust_ = std::make_unique<TrustStore>(std::move(trust_db).unwrap());
    clients_ = std::make_unique<ClientRegistry>(std::move(clients_db).unwrap());
    auto loaded = trust_->load().and_then([this] { return clients_->load(); });
    if (loaded.is_err()) {
        trust_.reset();
        clients_.reset();
        return loaded;
    }

    broadcaster_ = std::make_unique<DiscoveryBroadcaster>(config_);
    listener_ = std::make_unique<DiscoveryListener>(config_);
    fetcher_ = std::make_unique<CertificateFetcher>(config_.connect_timeout_ms, config_.server_port);
    connections_ = std::make_unique<ConnectionManager>(identity_, *trust_, config_);

    connect(listener_.get(), &DiscoveryListener::deviceDiscovered, this, &PairingService::discoveredDevice);
    connect(listener_.get(), &DiscoveryListener::deviceLost, this, &PairingService::deviceLost);
    connect(listener_.get(), &DiscoveryListener::error, this, &PairingService::error);
    connect(broadcaster_.get(), &DiscoveryBroadcaster::error, this, &PairingService::error);
    connect(trust_.get(), &TrustStore::trustListUpdated, this, &PairingService::trustListUpdated);
    connect(clients_.get(), &ClientRegistry::clientsChanged, this, &PairingService::clientsChanged);
    connect(clients_.get(), &ClientRegistry::approvalRequired, this, &PairingService::approvalRequired);
    connect(connections_.get(), &ConnectionManager::remoteStatusChanged, this,
            &PairingService::remoteStatusChanged);

    initialized_ = true;
    qCInfo(pairlinkIdentityLog) << "Local fingerprint" << identity_.fingerprint << "data in" << data_dir;
    return Result<void, Error>::ok();
}

Result<void, Error> PairingService::ready() const {
    if (!initialized_) {
        return fail("pairing service not initialized", ErrorCode::Internal);
    }
    return Result<void, Error>::ok();
}

QString PairingService::fingerprintOrLocal(const QString& fingerprint) const {
    return fingerprint.isEmpty() ? identity_.fingerprint : fingerprint;
}

Result<void, Error> PairingService::startBroadcast(int duration_seconds, const QString& alias,
                                                   const QString& fingerprint) {
    return ready().and_then([&] {
        return broadcaster_->startBroadcast(duration_seconds, alias, fingerprintOrLocal(fingerprint));
    });
}

void PairingService::stopBroadcast() {
    if (broadcaster_) broadcaster_->stopBroadcast();
}

Result<void, Error> PairingService::startListening(const QString& alias, const QString& fingerprint) {
    return ready().and_then([&] {
        return listener_->startListening(alias, fingerprintOrLocal(fingerprint));
    });
}

void PairingService::stopListening() {
    if (listener_) listener_->stopListening();
}

std::vector<DiscoveredDevice> PairingService::discoveredDevices() const {
    return listener_ ? listener_->devices() : std::vector<DiscoveredDevice>{};
}

Result<uint16_t, Error> PairingService::startServer(const QString& interface_address,
                                                    const QString& alias,
                                                    std::optional<uint16_t> port) {
    if (auto r = ready(); r.is_err()) {
        return Result<uint16_t, Error>::err(r.unwrap_err());
    }
    if (!server_) {
        server_ = std::make_unique<PairingServer>(identity_, *clients_, config_);
        connect(server_.get(), &PairingServer::error, this, &PairingService::error);
    }
    return server_->start(interface_address, alias, port);
}

Result<void, Error> PairingService::stopServer() {
    return ready().and_then([this] {
        if (server_) server_->stop();
        return Result<void, Error>::ok();
    });
}

Result<ClientList, Error> PairingService::listClients() const {
    if (auto r = ready(); r.is_err()) {
        return Result<ClientList, Error>::err(r.unwrap_err());
    }
    return Result<ClientList, Error>::ok(clients_->listClients());
}

Result<void, Error> PairingService::updateClientStatus(const QString& fingerprint, ClientStatus status) {
    return ready().and_then([&] { return clients_->updateClientStatus(fingerprint, status); });
}

Result<void, Error> PairingService::removeTrustedClient(const QString& fingerprint) {
    return ready().and_then([&] { return clients_->removeClient(fingerprint); });
}

QString PairingService::sslCertificateFingerprint() const {
    return identity_.fingerprint;
}

Result<TrustedServerCertificate, Error> PairingService::trustServer(const QString& fingerprint,
                                                                    const QStringList& hosts) {
    if (auto r = ready(); r.is_err()) {
        return Result<TrustedServerCertificate, Error>::err(r.unwrap_err());
    }
    return trust_->addTrustedServer(fingerprint, hosts);
}

Result<void, Error> PairingService::editHosts(const QString& fingerprint, const QStringList& hosts) {
    return ready().and_then([&] { return trust_->editHosts(fingerprint, hosts); });
}

Result<void, Error> PairingService::removeTrustedServer(const QString& fingerprint) {
    return ready().and_then([&] { return trust_->removeTrustedServer(fingerprint); });
}

TrustList PairingService::trustedServers() const {
    return trust_ ? trust_->trustedServers() : TrustList{};
}

void PairingService::fetchServerCertificate(const QString& url, FetchCallback callback) {
    if (auto r = ready(); r.is_err()) {
        QTimer::singleShot(0, this, [callback = std::move(callback), e = r.unwrap_err()] {
            callback(Result<QString, Error>::err(e));
        });
        return;
    }
    fetcher_->fetchServerCertificate(url, std::move(callback));
}

void PairingService::connectToHosts(const QStringList& hosts, ConnectCallback callback) {
    if (auto r = ready(); r.is_err()) {
        QTimer::singleShot(0, this, [callback = std::move(callback), e = r.unwrap_err()] {
            callback(ConnectResult::err(ConnectFailure{e.code, {}}));
        });
        return;
    }
    connections_->connectToHosts(hosts, std::move(callback));
}

void PairingService::connectTrusted(const QString& fingerprint, ConnectCallback callback) {
    if (auto r = ready(); r.is_err()) {
        QTimer::singleShot(0, this, [callback = std::move(callback), e = r.unwrap_err()] {
            callback(ConnectResult::err(ConnectFailure{e.code, {}}));
        });
        return;
    }
    connections_->connectTrusted(fingerprint, std::move(callback));
}

void PairingService::disconnectSession() {
    if (connections_) connections_->disconnectSession();
}

} // namespace pairlink::network
