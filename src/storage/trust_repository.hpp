#pragma once

#include "core/peer.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"

#include <optional>
#include <string>

namespace pairlink::storage {

/**
 * TrustRepository - trusted_servers and their ordered host lists.
 */
class TrustRepository {
public:
    explicit TrustRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<TrustedServerCertificate>, Error> get(const std::string& fingerprint);

    // Sorted by fingerprint.
    [[nodiscard]] Result<TrustList, Error> list();

    /**
     * Insert or replace an entry, host list included, in one transaction.
     */
    [[nodiscard]] Result<void, Error> save(const TrustedServerCertificate& cert);

    // Ok(false) when nothing matched.
    [[nodiscard]] Result<bool, Error> remove(const std::string& fingerprint);

    /**
     * Fingerprint of the most recently updated entry listing `host`.
     */
    [[nodiscard]] Result<std::optional<std::string>, Error> fingerprint_for_host(const std::string& host);

private:
    [[nodiscard]] Result<std::vector<std::string>, Error> hosts_of(const std::string& fingerprint);

    Database& db_;
};

} // namespace pairlink::storage
