#include "network/trust_store.hpp"

#include "core/logging.hpp"
#include "crypto/fingerprint.hpp"
#include "network/certificate_fetcher.hpp"

#include <algorithm>

namespace pairlink::network {
namespace {

std::vector<std::string> to_std(const QStringList& list) {
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(list.size()));
    for (const auto& s : list) {
        out.push_back(s.toStdString());
    }
    return out;
}

Result<void, Error> check_fingerprint(const QString& fingerprint) {
    if (!crypto::is_valid_fingerprint(fingerprint)) {
        return fail("invalid fingerprint: " + fingerprint.toStdString(), ErrorCode::InvalidArgument);
    }
    return Result<void, Error>::ok();
}

Error not_trusted(const QString& fingerprint) {
    return Error{"not a trusted server: " + fingerprint.toStdString(), ErrorCode::NotFound};
}

} // namespace

TrustStore::TrustStore(storage::Database db, QObject* parent)
    : QObject(parent)
    , db_(std::move(db))
    , repo_(db_)
{
    qRegisterMetaType<pairlink::TrustList>("pairlink::TrustList");
}

Result<void, Error> TrustStore::load() {
    QMutexLocker lock(&mu_);
    auto listed = repo_.list();
    if (listed.is_err()) {
        return Result<void, Error>::err(listed.unwrap_err());
    }
    entries_.clear();
    for (auto& entry : std::move(listed).unwrap()) {
        const auto key = QString::fromStdString(entry.fingerprint);
        entries_.insert(key, std::move(entry));
    }
    qCInfo(pairlinkTrustLog) << "Loaded" << entries_.size() << "trusted servers";
    return Result<void, Error>::ok();
}

Result<void, Error> TrustStore::persistLocked(const TrustedServerCertificate& entry) {
    auto saved = repo_.save(entry);
    if (saved.is_err()) {
        qCWarning(pairlinkTrustLog) << "Persisting trust entry failed:"
                                    << saved.unwrap_err().message.c_str();
        return saved;
    }
    entries_.insert(QString::fromStdString(entry.fingerprint), entry);
    return Result<void, Error>::ok();
}

Result<TrustedServerCertificate, Error> TrustStore::addTrustedServer(const QString& fingerprint,
                                                                     const QStringList& hosts) {
    using R = Result<TrustedServerCertificate, Error>;
    auto valid = check_fingerprint(fingerprint);
    if (valid.is_err()) {
        return R::err(valid.unwrap_err());
    }

    TrustedServerCertificate entry;
    {
        QMutexLocker lock(&mu_);
        const auto now = Timestamp::now();
        auto it = entries_.constFind(fingerprint);
        if (it == entries_.cend()) {
            entry = TrustedServerCertificate{
                .fingerprint = fingerprint.toStdString(),
                .hosts = normalize_hosts(to_std(hosts)),
                .created_at = now,
                .updated_at = now,
            };
        } else {
            entry = *it;
            entry.hosts = merge_hosts(entry.hosts, to_std(hosts));
            entry.updated_at = std::max(entry.updated_at, now);
        }

        auto persisted = persistLocked(entry);
        if (persisted.is_err()) {
            return R::err(persisted.unwrap_err());
        }
        qCInfo(pairlinkTrustLog) << "Trusted server" << fingerprint << "hosts" << hosts;
        emit trustListUpdated(snapshotLocked());
    }
    return R::ok(std::move(entry));
}

Result<void, Error> TrustStore::editHosts(const QString& fingerprint, const QStringList& hosts) {
    {
        QMutexLocker lock(&mu_);
        auto it = entries_.constFind(fingerprint);
        if (it == entries_.cend()) {
            return Result<void, Error>::err(not_trusted(fingerprint));
        }
        auto entry = *it;
        entry.hosts = normalize_hosts(to_std(hosts));
        entry.updated_at = std::max(entry.updated_at, Timestamp::now());

        auto persisted = persistLocked(entry);
        if (persisted.is_err()) {
            return persisted;
        }
        qCInfo(pairlinkTrustLog) << "Edited hosts of" << fingerprint << "->" << hosts;
        emit trustListUpdated(snapshotLocked());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> TrustStore::removeTrustedServer(const QString& fingerprint) {
    {
        QMutexLocker lock(&mu_);
        if (!entries_.contains(fingerprint)) {
            return Result<void, Error>::err(not_trusted(fingerprint));
        }
        auto removed = repo_.remove(fingerprint.toStdString());
        if (removed.is_err()) {
            return Result<void, Error>::err(removed.unwrap_err());
        }
        entries_.remove(fingerprint);
        qCInfo(pairlinkTrustLog) << "Removed trusted server" << fingerprint;
        emit trustListUpdated(snapshotLocked());
    }
    return Result<void, Error>::ok();
}

std::optional<TrustedServerCertificate> TrustStore::trustedServer(const QString& fingerprint) const {
    QMutexLocker lock(&mu_);
    auto it = entries_.constFind(fingerprint);
    if (it == entries_.cend()) {
        return std::nullopt;
    }
    return *it;
}

TrustList TrustStore::trustedServers() const {
    QMutexLocker lock(&mu_);
    return snapshotLocked();
}

std::optional<QString> TrustStore::fingerprintForHost(const QString& host, uint16_t default_port) const {
    const auto wanted = host.trimmed();
    const auto wanted_endpoint = parse_endpoint(wanted, default_port);
    auto matches = [&](const std::string& stored) {
        if (hosts_equal(stored, wanted.toStdString())) {
            return true;
        }
        if (wanted_endpoint.is_err()) {
            return false;
        }
        const auto endpoint = parse_endpoint(QString::fromStdString(stored), default_port);
        return endpoint.is_ok() && endpoint.unwrap().port == wanted_endpoint.unwrap().port &&
               endpoint.unwrap().host.compare(wanted_endpoint.unwrap().host, Qt::CaseInsensitive) == 0;
    };
    QMutexLocker lock(&mu_);

    const TrustedServerCertificate* best = nullptr;
    for (const auto& entry : entries_) {
        const bool listed = std::any_of(entry.hosts.begin(), entry.hosts.end(), matches);
        if (!listed) continue;
        if (!best || entry.updated_at > best->updated_at ||
            (entry.updated_at == best->updated_at && entry.fingerprint < best->fingerprint)) {
            best = &entry;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return QString::fromStdString(best->fingerprint);
}

QMetaObject::Connection TrustStore::subscribe(QObject* context, Subscriber subscriber) {
    QMutexLocker lock(&mu_);
    subscriber(snapshotLocked());
    return connect(this, &TrustStore::trustListUpdated, context,
                   [subscriber](const TrustList& list) { subscriber(list); });
}

TrustList TrustStore::snapshotLocked() const {
    TrustList out;
    out.reserve(static_cast<size_t>(entries_.size()));
    for (const auto& entry : entries_) {
        out.push_back(entry);
    }
    std::sort(out.begin(), out.end(),
              [](const TrustedServerCertificate& a, const TrustedServerCertificate& b) {
                  return a.fingerprint < b.fingerprint;
              });
    return out;
}

} // namespace pairlink::network
