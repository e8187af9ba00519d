#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QSslCertificate>
#include <QSslKey>
#include <QString>

namespace pairlink::crypto {

constexpr int CERTIFICATE_VALIDITY_DAYS = 3650;
constexpr int RSA_KEY_BITS = 2048;

/**
 * LocalIdentity - the certificate this device presents on every TLS
 * connection, in both client and server roles.
 */
struct LocalIdentity {
    Uuid certificate_id;
    QSslCertificate certificate;
    QSslKey private_key;
    QString fingerprint;
};

struct CertificatePem {
    QByteArray certificate;
    QByteArray private_key;
};

/**
 * Self-signed X.509 v3, RSA 2048, SHA-256 signature, CN = `common_name`.
 */
[[nodiscard]] Result<CertificatePem, Error> generate_self_signed(const QString& common_name,
                                                                 int validity_days = CERTIFICATE_VALIDITY_DAYS);

/**
 * Whether `pem` holds a certificate that matches the key, carries
 * `common_name` and has not expired.
 */
[[nodiscard]] Result<void, Error> check_certificate_pem(const CertificatePem& pem,
                                                        const QString& common_name);

/**
 * Load the identity kept under `data_dir`, creating or repairing it.
 *
 * Layout:
 *   <data_dir>/certificate_id    UUID, created once
 *   <data_dir>/certs/cert.pem
 *   <data_dir>/certs/key.pem     owner read/write only
 *
 * Missing, unreadable, mismatched or expired material is regenerated; the
 * fingerprint therefore changes only when the key had to be replaced.
 */
[[nodiscard]] Result<LocalIdentity, Error> load_or_create_identity(const QString& data_dir);

} // namespace pairlink::crypto
