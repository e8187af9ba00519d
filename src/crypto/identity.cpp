#include "crypto/identity.hpp"

#include "core/logging.hpp"
#include "crypto/fingerprint.hpp"

#include <QDir>
#include <QFile>
#include <QFileDevice>
#include <QSaveFile>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <sodium.h>

#include <memory>

namespace pairlink::crypto {
namespace {

struct PkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
struct BioDeleter { void operator()(BIO* p) const { BIO_free(p); } };

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

Error openssl_error(const char* what) {
    return Error{std::string("openssl: ") + what, ErrorCode::Internal};
}

QByteArray drain(BIO* bio) {
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio, &data);
    return QByteArray(data, static_cast<int>(len));
}

BioPtr bio_from(const QByteArray& bytes) {
    return BioPtr(BIO_new_mem_buf(bytes.constData(), static_cast<int>(bytes.size())));
}

Result<QByteArray, Error> read_file(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<QByteArray, Error>::err(
            Error{"cannot read " + path.toStdString(), ErrorCode::Storage});
    }
    return Result<QByteArray, Error>::ok(file.readAll());
}

Result<void, Error> write_file_atomic(const QString& path, const QByteArray& bytes,
                                      QFileDevice::Permissions permissions) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail("cannot write " + path.toStdString() + ": " + file.errorString().toStdString(),
                    ErrorCode::Storage);
    }
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return fail("short write to " + path.toStdString(), ErrorCode::Storage);
    }
    if (!file.setPermissions(permissions)) {
        qCWarning(pairlinkIdentityLog) << "Cannot set permissions on" << path;
    }
    if (!file.commit()) {
        return fail("cannot commit " + path.toStdString(), ErrorCode::Storage);
    }
    return Result<void, Error>::ok();
}

Result<Uuid, Error> load_or_create_certificate_id(const QString& data_dir) {
    const auto path = QDir(data_dir).filePath(QStringLiteral("certificate_id"));
    if (QFile::exists(path)) {
        auto contents = read_file(path);
        if (contents.is_ok()) {
            if (auto parsed = Uuid::parse(contents.unwrap().trimmed().toStdString())) {
                return Result<Uuid, Error>::ok(*parsed);
            }
        }
        qCWarning(pairlinkIdentityLog) << "Replacing unreadable certificate id at" << path;
    }

    const auto id = Uuid::generate();
    auto written = write_file_atomic(path, QByteArray::fromStdString(id.to_string() + "\n"),
                                     QFileDevice::ReadOwner | QFileDevice::WriteOwner |
                                         QFileDevice::ReadGroup | QFileDevice::ReadOther);
    if (written.is_err()) {
        return Result<Uuid, Error>::err(written.unwrap_err());
    }
    return Result<Uuid, Error>::ok(id);
}

} // namespace

Result<CertificatePem, Error> generate_self_signed(const QString& common_name, int validity_days) {
    using R = Result<CertificatePem, Error>;

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), RSA_KEY_BITS) <= 0) {
        return R::err(openssl_error("keygen setup failed"));
    }
    EVP_PKEY* raw_key = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw_key) <= 0) {
        return R::err(openssl_error("keygen failed"));
    }
    PkeyPtr key(raw_key);

    X509Ptr cert(X509_new());
    if (!cert || X509_set_version(cert.get(), 2) != 1) {
        return R::err(openssl_error("cannot create certificate"));
    }

    // 63-bit random serial keeps the INTEGER positive.
    uint64_t serial = 0;
    randombytes_buf(&serial, sizeof(serial));
    serial &= 0x7FFFFFFFFFFFFFFFull;
    if (ASN1_INTEGER_set_uint64(X509_get_serialNumber(cert.get()), serial) != 1) {
        return R::err(openssl_error("cannot set serial"));
    }

    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), static_cast<long>(validity_days) * 24 * 60 * 60);

    if (X509_set_pubkey(cert.get(), key.get()) != 1) {
        return R::err(openssl_error("cannot set public key"));
    }

    const QByteArray cn = common_name.toUtf8();
    X509_NAME* name = X509_get_subject_name(cert.get());
    if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
                                   reinterpret_cast<const unsigned char*>(cn.constData()),
                                   -1, -1, 0) != 1 ||
        X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("pairlink"),
                                   -1, -1, 0) != 1) {
        return R::err(openssl_error("cannot set subject"));
    }
    if (X509_set_issuer_name(cert.get(), name) != 1) {
        return R::err(openssl_error("cannot set issuer"));
    }
    if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0) {
        return R::err(openssl_error("signing failed"));
    }

    BioPtr cert_bio(BIO_new(BIO_s_mem()));
    BioPtr key_bio(BIO_new(BIO_s_mem()));
    if (!cert_bio || !key_bio ||
        PEM_write_bio_X509(cert_bio.get(), cert.get()) != 1 ||
        PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return R::err(openssl_error("cannot encode PEM"));
    }

    return R::ok(CertificatePem{
        .certificate = drain(cert_bio.get()),
        .private_key = drain(key_bio.get()),
    });
}

Result<void, Error> check_certificate_pem(const CertificatePem& pem, const QString& common_name) {
    auto cert_bio = bio_from(pem.certificate);
    auto key_bio = bio_from(pem.private_key);
    if (!cert_bio || !key_bio) {
        return fail("out of memory", ErrorCode::Internal);
    }

    X509Ptr cert(PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
        return fail("certificate is not valid PEM", ErrorCode::InvalidArgument);
    }
    PkeyPtr key(PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        return fail("private key is not valid PEM", ErrorCode::InvalidArgument);
    }
    if (X509_check_private_key(cert.get(), key.get()) != 1) {
        return fail("certificate does not match private key", ErrorCode::InvalidArgument);
    }
    if (X509_cmp_time(X509_get0_notAfter(cert.get()), nullptr) <= 0) {
        return fail("certificate expired", ErrorCode::InvalidArgument);
    }

    char cn[256] = {};
    const int cn_len = X509_NAME_get_text_by_NID(X509_get_subject_name(cert.get()),
                                                 NID_commonName, cn, sizeof(cn));
    if (cn_len < 0 || QString::fromUtf8(cn, cn_len) != common_name) {
        return fail("certificate common name does not match certificate id",
                    ErrorCode::InvalidArgument);
    }
    return Result<void, Error>::ok();
}

Result<LocalIdentity, Error> load_or_create_identity(const QString& data_dir) {
    using R = Result<LocalIdentity, Error>;

    auto sodium = init();
    if (sodium.is_err()) {
        return R::err(sodium.unwrap_err());
    }

    QDir root(data_dir);
    if (!root.mkpath(QStringLiteral("certs"))) {
        return R::err(Error{"cannot create " + root.filePath("certs").toStdString(),
                            ErrorCode::Storage});
    }

    auto id_result = load_or_create_certificate_id(data_dir);
    if (id_result.is_err()) {
        return R::err(id_result.unwrap_err());
    }
    const auto certificate_id = id_result.unwrap();
    const auto common_name = QString::fromStdString(certificate_id.to_string());

    const auto cert_path = root.filePath(QStringLiteral("certs/cert.pem"));
    const auto key_path = root.filePath(QStringLiteral("certs/key.pem"));

    CertificatePem pem;
    bool usable = false;
    auto cert_bytes = read_file(cert_path);
    auto key_bytes = read_file(key_path);
    if (cert_bytes.is_ok() && key_bytes.is_ok()) {
        pem = CertificatePem{.certificate = cert_bytes.unwrap(), .private_key = key_bytes.unwrap()};
        auto checked = check_certificate_pem(pem, common_name);
        usable = checked.is_ok();
        if (!usable) {
            qCWarning(pairlinkIdentityLog) << "Regenerating certificate:"
                                           << checked.unwrap_err().message.c_str();
        }
    }

    if (!usable) {
        auto generated = generate_self_signed(common_name);
        if (generated.is_err()) {
            return R::err(generated.unwrap_err());
        }
        pem = std::move(generated).unwrap();

        auto written = write_file_atomic(key_path, pem.private_key,
                                         QFileDevice::ReadOwner | QFileDevice::WriteOwner)
            .and_then([&] {
                return write_file_atomic(cert_path, pem.certificate,
                                         QFileDevice::ReadOwner | QFileDevice::WriteOwner |
                                             QFileDevice::ReadGroup | QFileDevice::ReadOther);
            });
        if (written.is_err()) {
            return R::err(written.unwrap_err());
        }
        qCInfo(pairlinkIdentityLog) << "Generated certificate" << common_name;
    }

    LocalIdentity identity{
        .certificate_id = certificate_id,
        .certificate = QSslCertificate(pem.certificate, QSsl::Pem),
        .private_key = QSslKey(pem.private_key, QSsl::Rsa, QSsl::Pem, QSsl::PrivateKey),
        .fingerprint = {},
    };
    if (identity.certificate.isNull() || identity.private_key.isNull()) {
        return R::err(Error{"TLS backend rejected the local certificate", ErrorCode::Internal});
    }

    auto fp = fingerprint_of(identity.certificate);
    if (fp.is_err()) {
        return R::err(fp.unwrap_err());
    }
    identity.fingerprint = fp.unwrap();
    qCInfo(pairlinkIdentityLog) << "Local fingerprint" << identity.fingerprint;
    return R::ok(std::move(identity));
}

} // namespace pairlink::crypto
