#include <QCoreApplication>
#include <QEventLoop>
#include <QHostAddress>
#include <QTemporaryDir>
#include <QTimer>

#include <utility>

#include "core/config.hpp"
#include "network/pairing_service.hpp"

namespace {

pairlink::PairingConfig config_for(const QString& dir) {
    pairlink::PairingConfig config;
    config.data_dir = dir;
    config.connect_timeout_ms = 2000;
    return config;
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    QTemporaryDir server_dir;
    QTemporaryDir client_dir;
    if (!server_dir.isValid() || !client_dir.isValid()) {
        return 1;
    }

    pairlink::network::PairingService server;
    pairlink::network::PairingService client;
    for (auto [service, dir] : {std::pair{&server, server_dir.path()}, std::pair{&client, client_dir.path()}}) {
        auto ready = service->initialize(config_for(dir));
        if (ready.is_err()) {
            qCritical().noquote() << "initialize:" << ready.unwrap_err().message.c_str();
            return 1;
        }
    }

    auto started = server.startServer(QStringLiteral("127.0.0.1"), QStringLiteral("server"), 0);
    if (started.is_err()) {
        qCritical().noquote() << "start server:" << started.unwrap_err().message.c_str();
        return 1;
    }
    const auto url = QStringLiteral("127.0.0.1:%1").arg(started.unwrap());

    // Pair: fetch, compare with what the server says about itself, trust.
    QString fetched;
    QEventLoop loop;
    client.fetchServerCertificate(url, [&](pairlink::Result<QString, pairlink::Error> result) {
        if (result.is_ok()) {
            fetched = result.unwrap();
        } else {
            qCritical().noquote() << "fetch:" << result.unwrap_err().message.c_str();
        }
        loop.quit();
    });
    loop.exec();
    if (fetched != server.sslCertificateFingerprint()) {
        qCritical().noquote() << "fetched" << fetched << "expected" << server.sslCertificateFingerprint();
        return 2;
    }
    if (client.trustServer(fetched, QStringList{url}).is_err()) {
        return 2;
    }

    // Approve the client as soon as the server sees it.
    QObject::connect(&server, &pairlink::network::PairingService::approvalRequired, &app,
                     [&](const pairlink::ClientSummary& summary) {
                         auto approved = server.updateClientStatus(
                             QString::fromStdString(summary.fingerprint), pairlink::ClientStatus::Approved);
                         if (approved.is_err()) {
                             qCritical().noquote() << "approve:" << approved.unwrap_err().message.c_str();
                         }
                     });

    bool connected = false;
    bool approved = false;
    QObject::connect(&client, &pairlink::network::PairingService::remoteStatusChanged, &app,
                     [&](pairlink::ClientStatus status) {
                         if (status == pairlink::ClientStatus::Approved) {
                             approved = true;
                             loop.quit();
                         }
                     });
    client.connectTrusted(fetched, [&](pairlink::network::ConnectResult result) {
        connected = result.is_ok();
        if (!connected) {
            qCritical().noquote() << "connect:" << result.unwrap_err().summary();
            loop.quit();
        }
    });

    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeout.start(5000);
    loop.exec();

    client.disconnectSession();
    server.stopServer().inspect_err([](const pairlink::Error& e) {
        qWarning().noquote() << "stop server:" << e.message.c_str();
    });

    if (!connected) {
        return 3;
    }
    if (!approved) {
        return 4;
    }
    qInfo().noquote() << "loopback pairing ok:" << fetched;
    return 0;
}
