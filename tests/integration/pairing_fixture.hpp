#pragma once

#include <catch2/catch_test_macros.hpp>

#include <QSslSocket>
#include <QTcpServer>
#include <QTemporaryDir>

#include <memory>
#include <optional>

#include "core/config.hpp"
#include "network/connection_manager.hpp"
#include "network/pairing_service.hpp"
#include "../test_support.hpp"

namespace pairlink::test {

// One device: its own data directory and an initialized service.
struct Device {
    QTemporaryDir dir;
    network::PairingService service;

    explicit Device(int connect_timeout_ms = 2000) {
        REQUIRE(dir.isValid());
        PairingConfig config;
        config.data_dir = dir.path();
        config.connect_timeout_ms = connect_timeout_ms;
        auto ready = service.initialize(config);
        INFO(ready.is_err() ? ready.unwrap_err().message : std::string{});
        REQUIRE(ready.is_ok());
    }

    QString fingerprint() const { return service.sslCertificateFingerprint(); }
};

inline bool tlsAvailable() {
    return QSslSocket::supportsSsl();
}

// A loopback port nothing listens on.
inline uint16_t closedLoopbackPort() {
    QTcpServer scratch;
    REQUIRE(scratch.listen(QHostAddress::LocalHost, 0));
    const auto port = scratch.serverPort();
    scratch.close();
    return port;
}

// Run `start` and spin the event loop until its callback fires.
template<typename R, typename Start>
std::optional<R> awaitCallback(Start&& start, int timeout_ms = 10000) {
    std::optional<R> out;
    start([&out](R result) { out.emplace(std::move(result)); });
    spinUntil([&out] { return out.has_value(); }, timeout_ms);
    return out;
}

} // namespace pairlink::test
