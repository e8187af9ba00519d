#include "core/peer.hpp"

#include <algorithm>
#include <cctype>

namespace pairlink {

std::string_view to_string(ClientStatus status) noexcept {
    switch (status) {
        case ClientStatus::Approved: return "approved";
        case ClientStatus::Pending: return "pending";
        case ClientStatus::Blocked: return "blocked";
    }
    return "unknown";
}

std::optional<ClientStatus> client_status_from_int(int value) noexcept {
    switch (value) {
        case 0: return ClientStatus::Approved;
        case 1: return ClientStatus::Pending;
        case 2: return ClientStatus::Blocked;
        default: return std::nullopt;
    }
}

std::optional<ClientStatus> client_status_from_string(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "approved" || lower == "approve") return ClientStatus::Approved;
    if (lower == "pending") return ClientStatus::Pending;
    if (lower == "blocked" || lower == "block") return ClientStatus::Blocked;
    return std::nullopt;
}

bool is_allowed_transition(ClientStatus from, ClientStatus to) noexcept {
    if (from == to) return true;
    return to != ClientStatus::Pending;
}

bool hosts_equal(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool contains_host(const std::vector<std::string>& hosts, std::string_view host) {
    return std::any_of(hosts.begin(), hosts.end(),
                       [host](const std::string& h) { return hosts_equal(h, host); });
}

} // namespace

std::vector<std::string> normalize_hosts(const std::vector<std::string>& hosts) {
    std::vector<std::string> out;
    out.reserve(hosts.size());
    for (const auto& raw : hosts) {
        auto host = trim(raw);
        if (host.empty() || contains_host(out, host)) continue;
        out.emplace_back(host);
    }
    return out;
}

std::vector<std::string> merge_hosts(const std::vector<std::string>& existing,
                                     const std::vector<std::string>& added) {
    auto out = normalize_hosts(existing);
    for (const auto& host : normalize_hosts(added)) {
        if (!contains_host(out, host)) {
            out.push_back(host);
        }
    }
    return out;
}

} // namespace pairlink
