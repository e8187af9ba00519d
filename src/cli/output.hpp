#pragma once

#include "core/peer.hpp"
#include "network/connection_manager.hpp"
#include "network/client_registry.hpp"
#include "network/discovery.hpp"

#include <QString>

#include <vector>

namespace pairlink::cli {

struct OutputOptions {
    bool json = false;
};

[[nodiscard]] QString format_devices(const std::vector<network::DiscoveredDevice>& devices,
                                     const OutputOptions& opts);
[[nodiscard]] QString format_clients(const network::ClientList& clients, const OutputOptions& opts);
[[nodiscard]] QString format_trust_list(const TrustList& list, const OutputOptions& opts);
[[nodiscard]] QString format_connect_result(const network::ConnectResult& result,
                                            const OutputOptions& opts);

/**
 * Group a fingerprint in blocks of 4 for reading aloud: "abcd efgh ...".
 */
[[nodiscard]] QString group_fingerprint(const QString& fingerprint);

} // namespace pairlink::cli
