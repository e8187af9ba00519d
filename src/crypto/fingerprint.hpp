#pragma once

#include "core/result.hpp"

#include <QString>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

class QSslCertificate;

namespace pairlink::crypto {

constexpr size_t SHA256_SIZE = 32;
// 32 digest bytes, 5 characters per 4-byte group.
constexpr size_t FINGERPRINT_LENGTH = 40;

using Sha256Digest = std::array<uint8_t, SHA256_SIZE>;

/**
 * Initialize libsodium. Safe to call repeatedly and from several threads.
 */
[[nodiscard]] Result<void, Error> init();

[[nodiscard]] Sha256Digest sha256(const uint8_t* data, size_t size);
[[nodiscard]] Sha256Digest sha256(const std::vector<uint8_t>& data);

/**
 * Base85 with the RFC 1924 alphabet.
 *
 * Each 4-byte group becomes 5 characters, big-endian. A trailing group of
 * n < 4 bytes becomes n + 1 characters.
 */
[[nodiscard]] std::string encode_base85(const uint8_t* data, size_t size);
[[nodiscard]] std::string encode_base85(const std::vector<uint8_t>& data);
[[nodiscard]] Result<std::vector<uint8_t>, Error> decode_base85(std::string_view text);

/**
 * The identity of a peer: base85(SHA-256(SubjectPublicKeyInfo DER)).
 *
 * Keyed on the public key rather than the certificate, so re-issuing a
 * certificate for the same key keeps the fingerprint.
 */
[[nodiscard]] std::string fingerprint_from_public_key_der(const std::vector<uint8_t>& spki_der);

/**
 * SubjectPublicKeyInfo DER of a certificate. Fails on a null or
 * unparsable certificate.
 */
[[nodiscard]] Result<std::vector<uint8_t>, Error> public_key_der(const QSslCertificate& certificate);

[[nodiscard]] Result<QString, Error> fingerprint_of(const QSslCertificate& certificate);

/**
 * 40 characters, all from the base85 alphabet.
 */
[[nodiscard]] bool is_valid_fingerprint(std::string_view text) noexcept;
[[nodiscard]] bool is_valid_fingerprint(const QString& text);

/**
 * Constant-time equality, for comparing a presented fingerprint against a
 * pinned one.
 */
[[nodiscard]] bool fingerprints_equal(const QString& a, const QString& b);

} // namespace pairlink::crypto
