#pragma once

#include "core/result.hpp"
#include "network/discovery.hpp"

#include <QByteArray>

namespace pairlink::network {

// Announcement wire format. Separate from the sockets so it can be tested
// without a network.
//
//   {"alias":..,"version":..,"deviceModel":..,"deviceType":..,
//    "fingerprint":..,"port":..,"protocol":..,"announce":true,"ts":..}

constexpr int MAX_DATAGRAM_SIZE = 8192;

QByteArray encode_announcement(const Announcement& announcement);

Result<Announcement, Error> decode_announcement(const QByteArray& datagram);

} // namespace pairlink::network
