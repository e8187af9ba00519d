#include <catch2/catch_test_macros.hpp>
#include "crypto/fingerprint.hpp"
#include "crypto/identity.hpp"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace pairlink;
using namespace pairlink::crypto;

TEST_CASE("base85 uses the RFC 1924 alphabet in 4-byte groups", "[unit][crypto]") {
    REQUIRE(encode_base85(std::vector<uint8_t>{0, 0, 0, 0}) == "00000");
    REQUIRE(encode_base85(std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xFF}) == "|NsC0");
    REQUIRE(encode_base85(std::vector<uint8_t>{'h', 'e', 'l', 'l', 'o'}) == "Xk~0{Zv");
    REQUIRE(encode_base85(std::vector<uint8_t>{1}) == "0R");
    REQUIRE(encode_base85(std::vector<uint8_t>{}).empty());
}

TEST_CASE("base85 decodes what it encodes, including short groups", "[unit][crypto]") {
    for (size_t n : {1u, 2u, 3u, 4u, 5u, 31u, 32u}) {
        std::vector<uint8_t> data(n);
        for (size_t i = 0; i < n; ++i) data[i] = static_cast<uint8_t>(0xF0 + i * 37);
        const auto decoded = decode_base85(encode_base85(data));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap() == data);
    }
}

TEST_CASE("base85 rejects malformed text", "[unit][crypto]") {
    REQUIRE(decode_base85("0000").is_ok());
    REQUIRE(decode_base85("000000").unwrap_err().code == ErrorCode::InvalidArgument);
    REQUIRE(decode_base85("00\"00").is_err());
    REQUIRE(decode_base85("~~~~~").is_err());
}

TEST_CASE("Fingerprints are 40 characters of SHA-256 in base85", "[unit][crypto]") {
    const std::vector<uint8_t> empty;
    const auto fp = fingerprint_from_public_key_der(empty);
    REQUIRE(fp == "<FLd+nEV_Rn)~#~nQyryC$2%{WSf&rq?MT)cv84k");
    REQUIRE(fp.size() == FINGERPRINT_LENGTH);
    REQUIRE(is_valid_fingerprint(fp));

    REQUIRE_FALSE(is_valid_fingerprint(std::string_view("short")));
    REQUIRE_FALSE(is_valid_fingerprint(QStringLiteral("<FLd+nEV_Rn)~#~nQyryC$2%{WSf&rq?MT)cv84\"")));
    REQUIRE(fingerprints_equal(QString::fromStdString(fp), QString::fromStdString(fp)));
    REQUIRE_FALSE(fingerprints_equal(QString::fromStdString(fp), QStringLiteral("abc")));
}

TEST_CASE("Generated certificates identify by public key", "[unit][crypto]") {
    const auto id = Uuid::generate();
    const auto cn = QString::fromStdString(id.to_string());

    auto pem = generate_self_signed(cn);
    REQUIRE(pem.is_ok());
    REQUIRE(check_certificate_pem(pem.unwrap(), cn).is_ok());
    REQUIRE(check_certificate_pem(pem.unwrap(), QStringLiteral("someone-else")).is_err());

    const auto certs = QSslCertificate::fromData(pem.unwrap().certificate, QSsl::Pem);
    REQUIRE(certs.size() == 1);
    auto fp = fingerprint_of(certs.front());
    REQUIRE(fp.is_ok());
    REQUIRE(is_valid_fingerprint(fp.unwrap()));

    // Another key, another fingerprint.
    auto other = generate_self_signed(cn).unwrap();
    const auto other_cert = QSslCertificate::fromData(other.certificate, QSsl::Pem).front();
    REQUIRE(fingerprint_of(other_cert).unwrap() != fp.unwrap());

    REQUIRE(fingerprint_of(QSslCertificate{}).unwrap_err().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Local identity is created once and then reused", "[unit][crypto]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    auto first = load_or_create_identity(dir.path());
    REQUIRE(first.is_ok());
    REQUIRE_FALSE(first.unwrap().certificate.isNull());
    REQUIRE_FALSE(first.unwrap().private_key.isNull());
    REQUIRE(QFile::exists(dir.filePath(QStringLiteral("certs/cert.pem"))));
    REQUIRE(QFile::exists(dir.filePath(QStringLiteral("certs/key.pem"))));

    auto second = load_or_create_identity(dir.path());
    REQUIRE(second.is_ok());
    REQUIRE(second.unwrap().fingerprint == first.unwrap().fingerprint);
    REQUIRE(second.unwrap().certificate_id == first.unwrap().certificate_id);

    SECTION("corrupt material is regenerated") {
        QFile cert(dir.filePath(QStringLiteral("certs/cert.pem")));
        REQUIRE(cert.open(QIODevice::WriteOnly | QIODevice::Truncate));
        cert.write("garbage");
        cert.close();

        auto repaired = load_or_create_identity(dir.path());
        REQUIRE(repaired.is_ok());
        REQUIRE(repaired.unwrap().fingerprint != first.unwrap().fingerprint);
        REQUIRE(repaired.unwrap().certificate_id == first.unwrap().certificate_id);
    }
}
