#pragma once

#include "core/config.hpp"
#include "core/peer.hpp"
#include "network/transport.hpp"

#include <QString>

#include <optional>

namespace pairlink::network {

enum class AdmissionKind {
    Accept,
    AcceptPending,
    RejectBlocked,
    RejectSelf,
    RejectNoCertificate,
};

struct AdmissionDecision {
    AdmissionKind kind = AdmissionKind::Accept;
    QString reason;

    [[nodiscard]] bool admitted() const {
        return kind == AdmissionKind::Accept || kind == AdmissionKind::AcceptPending;
    }
};

/**
 * Decide whether a freshly handshaken client may keep its session.
 *
 * `status` is the client's registry status, or nullopt for a first contact
 * (which is admitted as pending).
 */
[[nodiscard]] inline AdmissionDecision decide_admission(const QString& local_fingerprint,
                                                        const QString& remote_fingerprint,
                                                        std::optional<ClientStatus> status) {
    if (remote_fingerprint.isEmpty()) {
        return {AdmissionKind::RejectNoCertificate, QStringLiteral("No client certificate")};
    }
    if (remote_fingerprint == local_fingerprint) {
        return {AdmissionKind::RejectSelf, QStringLiteral("Connection from self")};
    }
    if (!status || *status == ClientStatus::Pending) {
        return {AdmissionKind::AcceptPending, QStringLiteral("Awaiting approval")};
    }
    if (*status == ClientStatus::Blocked) {
        return {AdmissionKind::RejectBlocked, QStringLiteral("Client is blocked")};
    }
    return {AdmissionKind::Accept, QString{}};
}

/**
 * Whether a session in `status` may have a `type` request served.
 */
[[nodiscard]] inline bool may_handle_request(ClientStatus status,
                                             PendingPolicy policy,
                                             MessageType type) {
    switch (type) {
        case MessageType::Hello:
        case MessageType::Disconnect:
            return status != ClientStatus::Blocked;
        case MessageType::Ping:
            if (status == ClientStatus::Pending) {
                return policy == PendingPolicy::AllowPing;
            }
            return status == ClientStatus::Approved;
        default:
            return status == ClientStatus::Approved;
    }
}

} // namespace pairlink::network
