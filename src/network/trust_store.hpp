#pragma once

#include "core/config.hpp"
#include "core/peer.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"
#include "storage/trust_repository.hpp"

#include <QHash>
#include <QMetaType>
#include <QRecursiveMutex>
#include <QObject>
#include <QStringList>

#include <functional>
#include <optional>

namespace pairlink::network {

/**
 * TrustStore - servers this device has paired with, and where to find them.
 *
 * Every mutation is committed to the database before the in-memory view is
 * swapped, and only then is trustListUpdated emitted with the complete,
 * fingerprint-sorted list. Failed mutations change nothing and emit nothing.
 * All members are thread-safe.
 */
class TrustStore : public QObject {
    Q_OBJECT

public:
    using Subscriber = std::function<void(const TrustList&)>;

    /**
     * Takes ownership of `db`, which must already be migrated.
     */
    explicit TrustStore(storage::Database db, QObject* parent = nullptr);

    /**
     * Read the persisted entries into memory. Call once before use.
     */
    Result<void, Error> load();

    /**
     * Record a confirmed pairing. Creates the entry, or merges `hosts` into
     * an existing one after its current hosts.
     */
    Result<TrustedServerCertificate, Error> addTrustedServer(const QString& fingerprint,
                                                             const QStringList& hosts);

    // NotFound if the fingerprint was never trusted.
    Result<void, Error> editHosts(const QString& fingerprint, const QStringList& hosts);
    Result<void, Error> removeTrustedServer(const QString& fingerprint);

    [[nodiscard]] std::optional<TrustedServerCertificate> trustedServer(const QString& fingerprint) const;
    [[nodiscard]] TrustList trustedServers() const;

    /**
     * The trusted fingerprint expected at `host`. Hosts are compared as
     * endpoints, so "https://10.0.0.5:7863", "10.0.0.5:7863" and "10.0.0.5"
     * are the same place when `default_port` is 7863. When several entries
     * list the host, the most recently updated one wins.
     */
    [[nodiscard]] std::optional<QString> fingerprintForHost(
        const QString& host, uint16_t default_port = PairingConfig::DEFAULT_SERVER_PORT) const;

    /**
     * Call `subscriber` with the current list now and after every change,
     * until `context` is destroyed.
     */
    QMetaObject::Connection subscribe(QObject* context, Subscriber subscriber);

signals:
    void trustListUpdated(const pairlink::TrustList& list);

private:
    [[nodiscard]] TrustList snapshotLocked() const;
    Result<void, Error> persistLocked(const TrustedServerCertificate& entry);

    // Held while emitting so snapshots reach subscribers in commit order.
    mutable QRecursiveMutex mu_;
    storage::Database db_;
    storage::TrustRepository repo_;
    QHash<QString, TrustedServerCertificate> entries_;
};

} // namespace pairlink::network

Q_DECLARE_METATYPE(pairlink::TrustedServerCertificate)
Q_DECLARE_METATYPE(pairlink::TrustList)
