#pragma once

#include "core/peer.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pairlink::storage {

/**
 * ClientRepository - clients that have contacted the local server.
 */
class ClientRepository {
public:
    explicit ClientRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<ClientSummary>, Error> get(const std::string& fingerprint);

    // Sorted by alias (case-insensitive), then fingerprint.
    [[nodiscard]] Result<std::vector<ClientSummary>, Error> list();

    // Insert or overwrite every column.
    [[nodiscard]] Result<void, Error> save(const ClientSummary& client);

    // Ok(false) when nothing matched.
    [[nodiscard]] Result<bool, Error> remove(const std::string& fingerprint);

private:
    Database& db_;
};

} // namespace pairlink::storage
