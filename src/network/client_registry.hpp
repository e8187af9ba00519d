#pragma once

#include "core/peer.hpp"
#include "core/result.hpp"
#include "storage/client_repository.hpp"
#include "storage/database.hpp"

#include <QHash>
#include <QMetaType>
#include <QObject>
#include <QRecursiveMutex>
#include <QString>

#include <optional>
#include <vector>

namespace pairlink::network {

using ClientList = std::vector<ClientSummary>;

/**
 * ClientRegistry - approval state of every client that reached our server.
 *
 *   first contact ──> PENDING ──approve──> APPROVED <──> BLOCKED
 *                        └──────block──────────────────────^
 *
 * Nothing returns to PENDING. Removing a client deletes it; its next
 * contact starts over as PENDING.
 */
class ClientRegistry : public QObject {
    Q_OBJECT

public:
    /**
     * Takes ownership of `db`, which must already be migrated.
     */
    explicit ClientRegistry(storage::Database db, QObject* parent = nullptr);

    Result<void, Error> load();

    /**
     * Note that `fingerprint` contacted us. Unknown fingerprints are stored
     * as PENDING and announced through approvalRequired; known ones get
     * their alias, model and last-seen time refreshed. Empty alias or model
     * leave the stored value alone.
     *
     * Returns the client's status after the call.
     */
    Result<ClientStatus, Error> registerContact(const QString& fingerprint,
                                                const QString& alias,
                                                const QString& device_model);

    /**
     * NotFound for unknown clients, InvalidArgument for PENDING. Setting the
     * current status again succeeds without emitting anything.
     */
    Result<void, Error> updateClientStatus(const QString& fingerprint, ClientStatus status);

    Result<void, Error> removeClient(const QString& fingerprint);

    [[nodiscard]] ClientList listClients() const;
    [[nodiscard]] std::optional<ClientSummary> client(const QString& fingerprint) const;
    [[nodiscard]] std::optional<ClientStatus> statusOf(const QString& fingerprint) const;

signals:
    void clientsChanged(const pairlink::network::ClientList& clients);
    void approvalRequired(const pairlink::ClientSummary& client);
    void statusChanged(const QString& fingerprint, pairlink::ClientStatus status);
    void clientRemoved(const QString& fingerprint);

private:
    [[nodiscard]] ClientList snapshotLocked() const;

    mutable QRecursiveMutex mu_;
    storage::Database db_;
    storage::ClientRepository repo_;
    QHash<QString, ClientSummary> clients_;
};

} // namespace pairlink::network

Q_DECLARE_METATYPE(pairlink::ClientStatus)
Q_DECLARE_METATYPE(pairlink::ClientSummary)
Q_DECLARE_METATYPE(pairlink::network::ClientList)
