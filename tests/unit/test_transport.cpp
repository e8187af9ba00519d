#include <catch2/catch_test_macros.hpp>
#include "network/certificate_fetcher.hpp"
#include "network/connection_manager.hpp"
#include "network/pairing_server.hpp"
#include "network/transport.hpp"

using namespace pairlink;
using namespace pairlink::network;

TEST_CASE("Frame header round trip", "[unit][transport]") {
    const auto bytes = serializeHeader(MessageHeader{.type = MessageType::StatusUpdate, .length = 0x01020304});
    REQUIRE(bytes.size() == MessageHeader::HEADER_SIZE);
    REQUIRE(bytes[0] == 'P');
    REQUIRE(bytes[1] == 'L');
    REQUIRE(bytes[4] == 0x01);
    REQUIRE(bytes[7] == 0x04);

    // Oversized lengths are refused even though the header itself is fine.
    REQUIRE(deserializeHeader(bytes).is_err());

    const auto small = serializeHeader(MessageHeader{.type = MessageType::Ping, .length = 12});
    const auto header = deserializeHeader(small);
    REQUIRE(header.is_ok());
    REQUIRE(header.unwrap().type == MessageType::Ping);
    REQUIRE(header.unwrap().length == 12);
}

TEST_CASE("Frame header rejects foreign data", "[unit][transport]") {
    auto bytes = serializeHeader(MessageHeader{.type = MessageType::Hello, .length = 0});
    SECTION("bad magic") {
        bytes[0] = 'G';
        REQUIRE(deserializeHeader(bytes).unwrap_err().code == ErrorCode::InvalidArgument);
    }
    SECTION("bad version") {
        bytes[2] = 99;
        REQUIRE(deserializeHeader(bytes).is_err());
    }
    SECTION("truncated") {
        bytes.resize(5);
        REQUIRE(deserializeHeader(bytes).is_err());
    }
}

TEST_CASE("Message types", "[unit][transport]") {
    REQUIRE(is_known_message_type(0x01));
    REQUIRE(is_known_message_type(0x3F));
    REQUIRE_FALSE(is_known_message_type(0x00));
    REQUIRE_FALSE(is_known_message_type(0x20));
}

TEST_CASE("Status payloads", "[unit][transport]") {
    const auto obj = status_payload(ClientStatus::Blocked);
    REQUIRE(obj["statusName"].toString() == QStringLiteral("blocked"));
    REQUIRE(status_from_payload(obj) == ClientStatus::Blocked);

    const auto decoded = decode_payload(encode_payload(obj));
    REQUIRE(decoded.is_ok());
    REQUIRE(status_from_payload(decoded.unwrap()) == ClientStatus::Blocked);

    REQUIRE_FALSE(status_from_payload(QJsonObject{}).has_value());
    REQUIRE(decode_payload(QByteArray("{broken")).is_err());
}

TEST_CASE("Endpoint parsing", "[unit][connect]") {
    auto parse = [](const char* text) { return parse_endpoint(QString::fromLatin1(text), 7863); };

    SECTION("host only uses the default port") {
        const auto e = parse("192.168.1.4").unwrap();
        REQUIRE(e.host == QStringLiteral("192.168.1.4"));
        REQUIRE(e.port == 7863);
    }
    SECTION("host and port") {
        const auto e = parse(" laptop.local:9000 ").unwrap();
        REQUIRE(e.host == QStringLiteral("laptop.local"));
        REQUIRE(e.port == 9000);
    }
    SECTION("bracketed IPv6") {
        const auto e = parse("[fe80::1]:9000").unwrap();
        REQUIRE(e.host == QStringLiteral("fe80::1"));
        REQUIRE(e.port == 9000);
        REQUIRE(e.toString() == QStringLiteral("[fe80::1]:9000"));
        REQUIRE(parse("[::1]").unwrap().port == 7863);
    }
    SECTION("bare IPv6") {
        const auto e = parse("fe80::2").unwrap();
        REQUIRE(e.host == QStringLiteral("fe80::2"));
        REQUIRE(e.port == 7863);
    }
    SECTION("url") {
        const auto e = parse("https://10.0.0.7:7000/api/info").unwrap();
        REQUIRE(e.host == QStringLiteral("10.0.0.7"));
        REQUIRE(e.port == 7000);
        REQUIRE(parse("https://10.0.0.7").unwrap().port == 7863);
    }
    SECTION("invalid input") {
        for (const char* bad : {"", "   ", "host:", "host:0", "host:70000", "host:abc",
                                "[fe80::1", "[nothex]:1", "[::1]x", "two words"}) {
            INFO(bad);
            REQUIRE(parse(bad).unwrap_err().code == ErrorCode::InvalidArgument);
        }
    }
}

TEST_CASE("Connect failures aggregate by priority", "[unit][connect]") {
    auto attempt = [](ErrorCode code) { return ConnectAttempt{QStringLiteral("h"), code, {}}; };

    REQUIRE(aggregate_failure({attempt(ErrorCode::Timeout), attempt(ErrorCode::FingerprintMismatch)}) ==
            ErrorCode::FingerprintMismatch);
    REQUIRE(aggregate_failure({attempt(ErrorCode::Timeout), attempt(ErrorCode::Timeout)}) == ErrorCode::Timeout);
    REQUIRE(aggregate_failure({attempt(ErrorCode::UntrustedHost)}) == ErrorCode::UntrustedHost);
    REQUIRE(aggregate_failure({}) == ErrorCode::UntrustedHost);
    REQUIRE(aggregate_failure({attempt(ErrorCode::Timeout), attempt(ErrorCode::UntrustedHost)}) ==
            ErrorCode::NetworkUnreachable);
    REQUIRE(aggregate_failure({attempt(ErrorCode::TlsHandshakeFailed)}) == ErrorCode::NetworkUnreachable);
}
