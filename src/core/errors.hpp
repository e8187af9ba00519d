#pragma once

#include <cstdint>
#include <string_view>

namespace pairlink {

/**
 * ErrorCode - failure taxonomy shared by every command of the subsystem.
 *
 * The embedding application branches on these; messages are for humans.
 */
enum class ErrorCode : uint8_t {
    NotFound,            // fingerprint absent from the targeted table
    NetworkUnreachable,  // socket, bind, connect failures
    TlsHandshakeFailed,
    FingerprintMismatch, // presented certificate differs from the pinned one
    AlreadyRunning,
    Timeout,
    UntrustedHost,       // host has no trusted fingerprint to verify against
    InvalidArgument,
    Storage,
    Internal,
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::NetworkUnreachable: return "network_unreachable";
        case ErrorCode::TlsHandshakeFailed: return "tls_handshake_failed";
        case ErrorCode::FingerprintMismatch: return "fingerprint_mismatch";
        case ErrorCode::AlreadyRunning: return "already_running";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::UntrustedHost: return "untrusted_host";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::Storage: return "storage";
        case ErrorCode::Internal: return "internal";
    }
    return "unknown";
}

} // namespace pairlink
