#include <catch2/catch_test_macros.hpp>
#include "network/pairing_server.hpp"
#include "network/trust_store.hpp"
#include "pairing_fixture.hpp"

using namespace pairlink;
using namespace pairlink::network;
using namespace pairlink::test;

TEST_CASE("Pairing server lifecycle", "[integration][server]") {
    Device server;

    auto port = server.service.startServer(QStringLiteral("127.0.0.1"), QStringLiteral("server"), 0);
    REQUIRE(port.is_ok());
    REQUIRE(port.unwrap() != 0);
    REQUIRE(server.service.server()->isRunning());

    auto again = server.service.startServer(QStringLiteral("127.0.0.1"), QStringLiteral("server"), 0);
    REQUIRE(again.unwrap_err().code == ErrorCode::AlreadyRunning);

    REQUIRE(server.service.stopServer().is_ok());
    REQUIRE_FALSE(server.service.server()->isRunning());
    REQUIRE(server.service.stopServer().is_ok());

    auto bad = server.service.startServer(QStringLiteral("not-an-address"), QStringLiteral("server"), 0);
    REQUIRE(bad.unwrap_err().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Pending clients are held until the owner decides", "[integration][server]") {
    if (!tlsAvailable()) {
        SKIP("TLS backend not available");
    }

    Device server;
    Device client;
    auto port = server.service.startServer(QStringLiteral("127.0.0.1"), QStringLiteral("server"), 0);
    REQUIRE(port.is_ok());
    const auto url = QStringLiteral("127.0.0.1:%1").arg(port.unwrap());

    QStringList approvals;
    QObject::connect(&server.service, &PairingService::approvalRequired, &server.service,
                     [&approvals](const ClientSummary& c) {
                         approvals << QString::fromStdString(c.fingerprint);
                     });

    REQUIRE(client.service.trustServer(server.fingerprint(), {url}).is_ok());
    auto connected = awaitCallback<ConnectResult>([&](ConnectCallback cb) {
        client.service.connectTrusted(server.fingerprint(), std::move(cb));
    });
    REQUIRE(connected.has_value());
    REQUIRE(connected->is_ok());

    auto* connections = client.service.connections();
    REQUIRE(spinUntil([&] { return connections->remoteStatus() == ClientStatus::Pending; }, 3000));
    REQUIRE(approvals == QStringList{client.fingerprint()});
    REQUIRE(server.service.server()->connectedClients() == QStringList{client.fingerprint()});

    const auto clients = server.service.listClients().unwrap();
    REQUIRE(clients.size() == 1);
    REQUIRE(clients[0].status == ClientStatus::Pending);
    REQUIRE(clients[0].device_model == "pairlink");

    QStringList rejections;
    int pongs = 0;
    QObject::connect(connections, &ConnectionManager::requestRejected, connections,
                     [&rejections](const QString& reason) { rejections << reason; });
    QObject::connect(connections, &ConnectionManager::pongReceived, connections, [&pongs] { ++pongs; });

    REQUIRE(connections->ping().is_ok());
    REQUIRE(spinUntil([&] { return !rejections.isEmpty(); }, 3000));
    REQUIRE(rejections.front() == QStringLiteral("awaiting approval"));
    REQUIRE(pongs == 0);
    REQUIRE(connections->isConnected());

    SECTION("approval is pushed and unlocks requests") {
        REQUIRE(server.service.updateClientStatus(client.fingerprint(), ClientStatus::Approved).is_ok());
        REQUIRE(spinUntil([&] { return connections->remoteStatus() == ClientStatus::Approved; }, 3000));

        REQUIRE(connections->ping().is_ok());
        REQUIRE(spinUntil([&] { return pongs == 1; }, 3000));
    }

    SECTION("blocking cuts the session and refuses reconnects") {
        REQUIRE(server.service.updateClientStatus(client.fingerprint(), ClientStatus::Blocked).is_ok());
        REQUIRE(spinUntil([&] { return !connections->isConnected(); }, 3000));
        REQUIRE(spinUntil([&] { return server.service.server()->sessionCount() == 0; }, 3000));

        auto retry = awaitCallback<ConnectResult>([&](ConnectCallback cb) {
            client.service.connectTrusted(server.fingerprint(), std::move(cb));
        });
        REQUIRE(retry.has_value());
        REQUIRE(retry->is_err());
        REQUIRE_FALSE(connections->isConnected());
        REQUIRE_FALSE(connections->remoteStatus().has_value());
        REQUIRE(server.service.listClients().unwrap()[0].status == ClientStatus::Blocked);
    }

    SECTION("unblocking lets the client back in") {
        REQUIRE(server.service.updateClientStatus(client.fingerprint(), ClientStatus::Blocked).is_ok());
        REQUIRE(spinUntil([&] { return !connections->isConnected(); }, 3000));

        REQUIRE(server.service.updateClientStatus(client.fingerprint(), ClientStatus::Approved).is_ok());
        auto back = awaitCallback<ConnectResult>([&](ConnectCallback cb) {
            client.service.connectTrusted(server.fingerprint(), std::move(cb));
        });
        REQUIRE(back.has_value());
        REQUIRE(back->is_ok());
        REQUIRE(connections->isConnected());
        REQUIRE(connections->remoteStatus() == ClientStatus::Approved);

        REQUIRE(connections->ping().is_ok());
        REQUIRE(spinUntil([&] { return pongs == 1; }, 3000));
    }

    SECTION("removal drops the session and forgets the client") {
        REQUIRE(server.service.removeTrustedClient(client.fingerprint()).is_ok());
        REQUIRE(spinUntil([&] { return !connections->isConnected(); }, 3000));
        REQUIRE(server.service.listClients().unwrap().empty());
    }

    client.service.disconnectSession();
    REQUIRE(server.service.stopServer().is_ok());
}
