#include "network/client_registry.hpp"

#include "core/logging.hpp"
#include "crypto/fingerprint.hpp"

#include <algorithm>

namespace pairlink::network {
namespace {

Error unknown_client(const QString& fingerprint) {
    return Error{"unknown client: " + fingerprint.toStdString(), ErrorCode::NotFound};
}

} // namespace

ClientRegistry::ClientRegistry(storage::Database db, QObject* parent)
    : QObject(parent)
    , db_(std::move(db))
    , repo_(db_)
{
    qRegisterMetaType<pairlink::ClientStatus>("pairlink::ClientStatus");
    qRegisterMetaType<pairlink::ClientSummary>("pairlink::ClientSummary");
    qRegisterMetaType<pairlink::network::ClientList>("pairlink::network::ClientList");
}

Result<void, Error> ClientRegistry::load() {
    QMutexLocker lock(&mu_);
    auto listed = repo_.list();
    if (listed.is_err()) {
        return Result<void, Error>::err(listed.unwrap_err());
    }
    clients_.clear();
    for (auto& client : std::move(listed).unwrap()) {
        const auto key = QString::fromStdString(client.fingerprint);
        clients_.insert(key, std::move(client));
    }
    qCInfo(pairlinkClientsLog) << "Loaded" << clients_.size() << "clients";
    return Result<void, Error>::ok();
}

Result<ClientStatus, Error> ClientRegistry::registerContact(const QString& fingerprint,
                                                            const QString& alias,
                                                            const QString& device_model) {
    using R = Result<ClientStatus, Error>;
    if (!crypto::is_valid_fingerprint(fingerprint)) {
        return R::err(Error{"invalid fingerprint", ErrorCode::InvalidArgument});
    }

    QMutexLocker lock(&mu_);
    const auto now = Timestamp::now();
    auto it = clients_.constFind(fingerprint);
    const bool first_contact = it == clients_.cend();

    ClientSummary updated;
    if (first_contact) {
        updated = ClientSummary{
            .fingerprint = fingerprint.toStdString(),
            .alias = alias.toStdString(),
            .device_model = device_model.toStdString(),
            .status = ClientStatus::Pending,
            .first_seen = now,
            .last_seen = now,
        };
    } else {
        updated = *it;
        if (!alias.isEmpty()) updated.alias = alias.toStdString();
        if (!device_model.isEmpty()) updated.device_model = device_model.toStdString();
        updated.last_seen = std::max(updated.last_seen, now);
    }

    auto saved = repo_.save(updated);
    if (saved.is_err()) {
        qCWarning(pairlinkClientsLog) << "Persisting client failed:" << saved.unwrap_err().message.c_str();
        return R::err(saved.unwrap_err());
    }
    clients_.insert(fingerprint, updated);

    if (first_contact) {
        qCInfo(pairlinkClientsLog) << "New client" << fingerprint << alias << "awaiting approval";
        emit approvalRequired(updated);
    }
    emit clientsChanged(snapshotLocked());
    return R::ok(updated.status);
}

Result<void, Error> ClientRegistry::updateClientStatus(const QString& fingerprint, ClientStatus status) {
    if (status == ClientStatus::Pending) {
        return fail("a client cannot be set back to pending", ErrorCode::InvalidArgument);
    }

    QMutexLocker lock(&mu_);
    auto it = clients_.constFind(fingerprint);
    if (it == clients_.cend()) {
        return Result<void, Error>::err(unknown_client(fingerprint));
    }
    if (it->status == status) {
        return Result<void, Error>::ok();
    }
    if (!is_allowed_transition(it->status, status)) {
        return fail("illegal status change", ErrorCode::InvalidArgument);
    }

    auto updated = *it;
    updated.status = status;
    auto saved = repo_.save(updated);
    if (saved.is_err()) {
        return saved;
    }
    clients_.insert(fingerprint, updated);

    qCInfo(pairlinkClientsLog) << "Client" << fingerprint << "is now"
                               << QString::fromLatin1(to_string(status).data());
    emit statusChanged(fingerprint, status);
    emit clientsChanged(snapshotLocked());
    return Result<void, Error>::ok();
}

Result<void, Error> ClientRegistry::removeClient(const QString& fingerprint) {
    QMutexLocker lock(&mu_);
    if (!clients_.contains(fingerprint)) {
        return Result<void, Error>::err(unknown_client(fingerprint));
    }
    auto removed = repo_.remove(fingerprint.toStdString());
    if (removed.is_err()) {
        return Result<void, Error>::err(removed.unwrap_err());
    }
    clients_.remove(fingerprint);

    qCInfo(pairlinkClientsLog) << "Removed client" << fingerprint;
    emit clientRemoved(fingerprint);
    emit clientsChanged(snapshotLocked());
    return Result<void, Error>::ok();
}

ClientList ClientRegistry::listClients() const {
    QMutexLocker lock(&mu_);
    return snapshotLocked();
}

std::optional<ClientSummary> ClientRegistry::client(const QString& fingerprint) const {
    QMutexLocker lock(&mu_);
    auto it = clients_.constFind(fingerprint);
    if (it == clients_.cend()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<ClientStatus> ClientRegistry::statusOf(const QString& fingerprint) const {
    QMutexLocker lock(&mu_);
    auto it = clients_.constFind(fingerprint);
    if (it == clients_.cend()) {
        return std::nullopt;
    }
    return it->status;
}

ClientList ClientRegistry::snapshotLocked() const {
    ClientList out;
    out.reserve(static_cast<size_t>(clients_.size()));
    for (const auto& client : clients_) {
        out.push_back(client);
    }
    std::sort(out.begin(), out.end(), [](const ClientSummary& a, const ClientSummary& b) {
        const int by_alias = QString::fromStdString(a.alias)
                                 .compare(QString::fromStdString(b.alias), Qt::CaseInsensitive);
        if (by_alias != 0) return by_alias < 0;
        return a.fingerprint < b.fingerprint;
    });
    return out;
}

} // namespace pairlink::network
