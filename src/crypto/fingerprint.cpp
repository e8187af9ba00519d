#include "crypto/fingerprint.hpp"

#include <QSslCertificate>

#include <openssl/x509.h>
#include <sodium.h>

#include <algorithm>
#include <memory>

namespace pairlink::crypto {
namespace {

constexpr std::string_view kAlphabet =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz!#$%&()*+-;<=>?@^_`{|}~";

constexpr int8_t decode_char(char c) noexcept {
    for (size_t i = 0; i < kAlphabet.size(); ++i) {
        if (kAlphabet[i] == c) return static_cast<int8_t>(i);
    }
    return -1;
}

constexpr std::array<int8_t, 256> make_decode_table() {
    std::array<int8_t, 256> table{};
    for (size_t i = 0; i < table.size(); ++i) {
        table[i] = decode_char(static_cast<char>(i));
    }
    return table;
}

constexpr auto kDecodeTable = make_decode_table();

struct X509Deleter {
    void operator()(X509* x) const { X509_free(x); }
};

} // namespace

Result<void, Error> init() {
    if (sodium_init() < 0) {
        return fail("failed to initialize libsodium", ErrorCode::Internal);
    }
    return Result<void, Error>::ok();
}

Sha256Digest sha256(const uint8_t* data, size_t size) {
    Sha256Digest out{};
    crypto_hash_sha256(out.data(), data, size);
    return out;
}

Sha256Digest sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

std::string encode_base85(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve((size + 3) / 4 * 5);

    for (size_t i = 0; i < size; i += 4) {
        const size_t chunk = std::min<size_t>(4, size - i);
        uint32_t value = 0;
        for (size_t j = 0; j < 4; ++j) {
            value <<= 8;
            if (j < chunk) value |= data[i + j];
        }

        char group[5];
        for (int k = 4; k >= 0; --k) {
            group[k] = kAlphabet[value % 85];
            value /= 85;
        }
        out.append(group, chunk + 1);
    }
    return out;
}

std::string encode_base85(const std::vector<uint8_t>& data) {
    return encode_base85(data.data(), data.size());
}

Result<std::vector<uint8_t>, Error> decode_base85(std::string_view text) {
    using R = Result<std::vector<uint8_t>, Error>;
    if (text.size() % 5 == 1) {
        return R::err(Error{"base85: dangling character", ErrorCode::InvalidArgument});
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() / 5 * 4 + 3);

    for (size_t i = 0; i < text.size(); i += 5) {
        const size_t chunk = std::min<size_t>(5, text.size() - i);
        uint64_t value = 0;
        for (size_t j = 0; j < 5; ++j) {
            // Short groups are padded with the highest digit.
            int8_t digit = 84;
            if (j < chunk) {
                digit = kDecodeTable[static_cast<uint8_t>(text[i + j])];
                if (digit < 0) {
                    return R::err(Error{"base85: invalid character", ErrorCode::InvalidArgument});
                }
            }
            value = value * 85 + static_cast<uint64_t>(digit);
        }
        if (value > 0xFFFFFFFFull) {
            return R::err(Error{"base85: group overflow", ErrorCode::InvalidArgument});
        }
        for (size_t j = 0; j < chunk - 1; ++j) {
            out.push_back(static_cast<uint8_t>(value >> (24 - 8 * j)));
        }
    }
    return R::ok(std::move(out));
}

std::string fingerprint_from_public_key_der(const std::vector<uint8_t>& spki_der) {
    const auto digest = sha256(spki_der);
    return encode_base85(digest.data(), digest.size());
}

Result<std::vector<uint8_t>, Error> public_key_der(const QSslCertificate& certificate) {
    using R = Result<std::vector<uint8_t>, Error>;
    if (certificate.isNull()) {
        return R::err(Error{"no certificate", ErrorCode::InvalidArgument});
    }

    const QByteArray der = certificate.toDer();
    const auto* cursor = reinterpret_cast<const unsigned char*>(der.constData());
    std::unique_ptr<X509, X509Deleter> x509(d2i_X509(nullptr, &cursor, der.size()));
    if (!x509) {
        return R::err(Error{"unparsable certificate", ErrorCode::InvalidArgument});
    }

    X509_PUBKEY* pubkey = X509_get_X509_PUBKEY(x509.get());
    unsigned char* encoded = nullptr;
    const int len = i2d_X509_PUBKEY(pubkey, &encoded);
    if (len <= 0 || !encoded) {
        return R::err(Error{"cannot encode public key", ErrorCode::Internal});
    }
    std::vector<uint8_t> out(encoded, encoded + len);
    OPENSSL_free(encoded);
    return R::ok(std::move(out));
}

Result<QString, Error> fingerprint_of(const QSslCertificate& certificate) {
    return public_key_der(certificate).map([](const std::vector<uint8_t>& der) {
        return QString::fromStdString(fingerprint_from_public_key_der(der));
    });
}

bool is_valid_fingerprint(std::string_view text) noexcept {
    if (text.size() != FINGERPRINT_LENGTH) return false;
    for (char c : text) {
        if (kDecodeTable[static_cast<uint8_t>(c)] < 0) return false;
    }
    return true;
}

bool is_valid_fingerprint(const QString& text) {
    return is_valid_fingerprint(std::string_view(text.toStdString()));
}

bool fingerprints_equal(const QString& a, const QString& b) {
    const QByteArray lhs = a.toLatin1();
    const QByteArray rhs = b.toLatin1();
    if (lhs.size() != rhs.size()) return false;
    return sodium_memcmp(lhs.constData(), rhs.constData(), static_cast<size_t>(lhs.size())) == 0;
}

} // namespace pairlink::crypto
