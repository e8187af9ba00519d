#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pairlink {

/**
 * ClientStatus - a remote client's standing with this server.
 *
 * The numeric values are part of the wire protocol and the database schema.
 */
enum class ClientStatus : uint8_t {
    Approved = 0,
    Pending = 1,
    Blocked = 2,
};

[[nodiscard]] std::string_view to_string(ClientStatus status) noexcept;
[[nodiscard]] std::optional<ClientStatus> client_status_from_int(int value) noexcept;
[[nodiscard]] std::optional<ClientStatus> client_status_from_string(std::string_view text);

/**
 * Whether `from -> to` is a legal status change.
 *
 * Pending can become Approved or Blocked; Approved and Blocked can swap.
 * Nothing goes back to Pending. Same-status is allowed (a no-op).
 */
[[nodiscard]] bool is_allowed_transition(ClientStatus from, ClientStatus to) noexcept;

/**
 * ClientSummary - a client that has contacted this server.
 */
struct ClientSummary {
    std::string fingerprint;
    std::string alias;
    std::string device_model;
    ClientStatus status = ClientStatus::Pending;
    Timestamp first_seen;
    Timestamp last_seen;

    bool operator==(const ClientSummary&) const = default;
};

/**
 * TrustedServerCertificate - a server the user chose to trust.
 *
 * `hosts` are the addresses to try when reconnecting, in order. They are
 * unique (case-insensitive) and never empty strings.
 */
struct TrustedServerCertificate {
    std::string fingerprint;
    std::vector<std::string> hosts;
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const TrustedServerCertificate&) const = default;
};

using TrustList = std::vector<TrustedServerCertificate>;

// ============================================================================
// Host list helpers
// ============================================================================

/**
 * Trim, drop empties, drop case-insensitive duplicates keeping the first.
 */
[[nodiscard]] std::vector<std::string> normalize_hosts(const std::vector<std::string>& hosts);

/**
 * `existing` followed by the entries of `added` it does not already contain.
 */
[[nodiscard]] std::vector<std::string> merge_hosts(const std::vector<std::string>& existing,
                                                   const std::vector<std::string>& added);

[[nodiscard]] bool hosts_equal(std::string_view a, std::string_view b) noexcept;

} // namespace pairlink
