#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QSocketNotifier>
#include <QSysInfo>
#include <QTextStream>
#include <QTimer>

#include <chrono>
#include <cstdio>
#include <optional>

#include "cli/output.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "network/discovery_broadcaster.hpp"
#include "network/discovery_listener.hpp"
#include "network/pairing_server.hpp"
#include "network/pairing_service.hpp"

namespace {

using pairlink::ClientStatus;
using pairlink::Error;
using pairlink::network::PairingService;

int report(const Error& e) {
    QTextStream(stderr) << "error (" << QString::fromLatin1(pairlink::to_string(e.code).data())
                        << "): " << QString::fromStdString(e.message) << '\n';
    return 1;
}

int usage(const QString& message) {
    QTextStream(stderr) << message << '\n';
    return 2;
}

QString alias_or_default(const QString& alias) {
    return alias.isEmpty() ? QSysInfo::machineHostName() : alias;
}

int run_clients(PairingService& service, const QStringList& args, const pairlink::cli::OutputOptions& out) {
    const auto sub = args.value(1, QStringLiteral("list"));
    if (sub == QStringLiteral("list")) {
        const auto clients = service.listClients();
        if (clients.is_err()) return report(clients.unwrap_err());
        QTextStream(stdout) << pairlink::cli::format_clients(clients.unwrap(), out);
        return 0;
    }
    if (args.size() < 3) {
        return usage(QStringLiteral("usage: pairlink clients approve|block|remove FINGERPRINT"));
    }
    const auto fingerprint = args.at(2);
    auto result = sub == QStringLiteral("remove")
        ? service.removeTrustedClient(fingerprint)
        : [&] {
              const auto status = pairlink::client_status_from_string(sub.toStdString());
              if (!status || *status == ClientStatus::Pending) {
                  return pairlink::fail("unknown clients command: " + sub.toStdString(),
                                        pairlink::ErrorCode::InvalidArgument);
              }
              return service.updateClientStatus(fingerprint, *status);
          }();
    if (result.is_err()) return report(result.unwrap_err());
    QTextStream(stdout) << "ok\n";
    return 0;
}

int run_trust(PairingService& service, const QStringList& args, const pairlink::cli::OutputOptions& out) {
    const auto sub = args.value(1, QStringLiteral("list"));
    if (sub == QStringLiteral("list")) {
        QTextStream(stdout) << pairlink::cli::format_trust_list(service.trustedServers(), out);
        return 0;
    }
    if (sub == QStringLiteral("edit") && args.size() >= 3) {
        auto result = service.editHosts(args.at(2), args.mid(3));
        if (result.is_err()) return report(result.unwrap_err());
        QTextStream(stdout) << "ok\n";
        return 0;
    }
    if (sub == QStringLiteral("remove") && args.size() == 3) {
        auto result = service.removeTrustedServer(args.at(2));
        if (result.is_err()) return report(result.unwrap_err());
        QTextStream(stdout) << "ok\n";
        return 0;
    }
    return usage(QStringLiteral("usage: pairlink trust list | edit FINGERPRINT HOST... | remove FINGERPRINT"));
}

// Handle "approve FP", "block FP", "remove FP" and "list" typed while serving.
void handle_serve_input(PairingService& service, const QString& line) {
    const auto words = line.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (words.isEmpty()) return;
    QStringList args{QStringLiteral("clients")};
    args << words;
    run_clients(service, args, {});
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("pairlink");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("pairlink");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Find devices on the local network, pair by certificate fingerprint and reconnect.\n\n"
        "Commands:\n"
        "  fingerprint                         show the local fingerprint\n"
        "  discover                            list devices announcing themselves\n"
        "  announce                            announce this device\n"
        "  serve --interface IP                accept clients (approve from stdin)\n"
        "  fetch URL                           show the fingerprint a server presents\n"
        "  pair URL                            fetch, confirm and trust a server\n"
        "  trust list|edit FP HOST...|remove FP\n"
        "  clients list|approve FP|block FP|remove FP\n"
        "  connect HOST...                     connect to a trusted server"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dataDirOption(
        QStringList{QStringLiteral("data-dir")},
        QStringLiteral("Directory for the certificate and database (sets PAIRLINK_DATA_DIR)."),
        QStringLiteral("path"));
    parser.addOption(dataDirOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging and mirror the log to stderr."));
    parser.addOption(debugOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption secondsOption(
        QStringList{QStringLiteral("seconds")},
        QStringLiteral("Duration for 'discover' and 'announce' (default 10)."),
        QStringLiteral("n"), QStringLiteral("10"));
    parser.addOption(secondsOption);

    const QCommandLineOption aliasOption(
        QStringList{QStringLiteral("alias")},
        QStringLiteral("Name shown to other devices (default: host name)."),
        QStringLiteral("name"));
    parser.addOption(aliasOption);

    const QCommandLineOption interfaceOption(
        QStringList{QStringLiteral("interface")},
        QStringLiteral("Address 'serve' listens on."),
        QStringLiteral("ip"), QStringLiteral("0.0.0.0"));
    parser.addOption(interfaceOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("port")},
        QStringLiteral("Port 'serve' listens on (default from config)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption autoApproveOption(
        QStringList{QStringLiteral("auto-approve")},
        QStringLiteral("Approve every new client while serving."));
    parser.addOption(autoApproveOption);

    const QCommandLineOption yesOption(
        QStringList{QStringLiteral("yes")},
        QStringLiteral("Trust the fetched fingerprint without asking ('pair')."));
    parser.addOption(yesOption);

    const QCommandLineOption fingerprintOption(
        QStringList{QStringLiteral("fingerprint")},
        QStringLiteral("Connect to every host recorded for this trusted fingerprint ('connect')."),
        QStringLiteral("fp"));
    parser.addOption(fingerprintOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run (e.g. 'discover')."));
    parser.process(app);

    if (parser.isSet(dataDirOption)) {
        qputenv("PAIRLINK_DATA_DIR", parser.value(dataDirOption).toUtf8());
    }

    const auto config = pairlink::load_config();
    const bool debug = parser.isSet(debugOption);
    pairlink::install_file_logging(QDir(config.resolved_data_dir()).filePath(QStringLiteral("logs")), debug);
    if (debug) {
        pairlink::enable_debug_logging();
        qInfo() << "pairlink: logging to" << pairlink::log_file_path();
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(2);
    }
    const auto command = positional.first();
    const pairlink::cli::OutputOptions out{.json = parser.isSet(jsonOption)};
    const auto alias = alias_or_default(parser.value(aliasOption));

    bool seconds_ok = false;
    const int seconds = parser.value(secondsOption).toInt(&seconds_ok);
    if (!seconds_ok || seconds <= 0 || seconds > pairlink::network::DiscoveryBroadcaster::MAX_DURATION_SECONDS) {
        return usage(QStringLiteral("--seconds must be between 1 and %1")
                         .arg(pairlink::network::DiscoveryBroadcaster::MAX_DURATION_SECONDS));
    }

    PairingService service;
    auto initialized = service.initialize(config);
    if (initialized.is_err()) {
        return report(initialized.unwrap_err());
    }

    if (command == QStringLiteral("fingerprint")) {
        const auto fp = service.sslCertificateFingerprint();
        QTextStream(stdout) << fp << '\n' << pairlink::cli::group_fingerprint(fp) << '\n';
        return 0;
    }

    if (command == QStringLiteral("clients")) {
        return run_clients(service, positional, out);
    }

    if (command == QStringLiteral("trust")) {
        return run_trust(service, positional, out);
    }

    if (command == QStringLiteral("discover")) {
        auto started = service.startListening(alias);
        if (started.is_err()) return report(started.unwrap_err());
        if (!out.json) {
            QObject::connect(&service, &PairingService::discoveredDevice, &app,
                             [](const pairlink::network::DiscoveredDevice& d) {
                                 QTextStream(stderr) << "seen " << d.alias << " " << d.fingerprint << '\n';
                             });
        }
        QTimer::singleShot(std::chrono::milliseconds(std::chrono::seconds(seconds)), &app, [&] {
            QTextStream(stdout) << pairlink::cli::format_devices(service.discoveredDevices(), out);
            service.stopListening();
            app.quit();
        });
        return app.exec();
    }

    if (command == QStringLiteral("announce")) {
        auto started = service.startBroadcast(seconds, alias);
        if (started.is_err()) return report(started.unwrap_err());
        QObject::connect(service.broadcaster(), &pairlink::network::DiscoveryBroadcaster::broadcastFinished,
                         &app, [&] {
                             QTextStream(stdout) << "sent " << service.broadcaster()->announcementsSent()
                                                 << " announcements\n";
                             app.quit();
                         });
        return app.exec();
    }

    if (command == QStringLiteral("serve")) {
        std::optional<uint16_t> port;
        if (parser.isSet(portOption)) {
            bool ok = false;
            const uint value = parser.value(portOption).toUInt(&ok);
            if (!ok || value > 65535) {
                return usage(QStringLiteral("--port must be between 0 and 65535"));
            }
            port = static_cast<uint16_t>(value);
        }

        const bool auto_approve = parser.isSet(autoApproveOption);
        QObject::connect(&service, &PairingService::approvalRequired, &app,
                         [&service, auto_approve](const pairlink::ClientSummary& client) {
                             const auto fp = QString::fromStdString(client.fingerprint);
                             if (auto_approve) {
                                 auto approved = service.updateClientStatus(fp, ClientStatus::Approved);
                                 if (approved.is_err()) report(approved.unwrap_err());
                                 return;
                             }
                             QTextStream(stdout) << "pending client " << fp
                                                 << " (type 'approve " << fp << "' or 'block " << fp << "')\n";
                         });

        auto started = service.startServer(parser.value(interfaceOption), alias, port);
        if (started.is_err()) return report(started.unwrap_err());
        QTextStream(stdout) << "serving as " << alias << " on port " << started.unwrap() << '\n'
                            << "fingerprint " << service.sslCertificateFingerprint() << '\n';

        QSocketNotifier input(fileno(stdin), QSocketNotifier::Read);
        QObject::connect(&input, &QSocketNotifier::activated, &app, [&] {
            QTextStream in(stdin);
            const auto line = in.readLine();
            if (line.isNull()) {
                input.setEnabled(false);
                return;
            }
            handle_serve_input(service, line);
        });
        return app.exec();
    }

    if (command == QStringLiteral("fetch") || command == QStringLiteral("pair")) {
        if (positional.size() != 2) {
            return usage(QStringLiteral("usage: pairlink %1 URL").arg(command));
        }
        const auto url = positional.at(1);
        const bool pair = command == QStringLiteral("pair");
        const bool assume_yes = parser.isSet(yesOption);
        int exit_code = 0;
        service.fetchServerCertificate(url, [&](pairlink::Result<QString, Error> fetched) {
            if (fetched.is_err()) {
                exit_code = report(fetched.unwrap_err());
                app.quit();
                return;
            }
            const auto fp = fetched.unwrap();
            QTextStream(stdout) << fp << '\n';
            if (pair) {
                QTextStream(stdout) << "Compare with the other device: "
                                    << pairlink::cli::group_fingerprint(fp) << '\n';
                bool confirmed = assume_yes;
                if (!confirmed) {
                    QTextStream(stdout) << "Trust this server? [y/N] " << Qt::flush;
                    const auto answer = QTextStream(stdin).readLine().trimmed().toLower();
                    confirmed = answer == QStringLiteral("y") || answer == QStringLiteral("yes");
                }
                if (!confirmed) {
                    QTextStream(stdout) << "not trusted\n";
                    exit_code = 1;
                } else {
                    auto trusted = service.trustServer(fp, QStringList{url});
                    if (trusted.is_err()) {
                        exit_code = report(trusted.unwrap_err());
                    } else {
                        QTextStream(stdout) << "trusted\n";
                    }
                }
            }
            app.quit();
        });
        const int rc = app.exec();
        return rc != 0 ? rc : exit_code;
    }

    if (command == QStringLiteral("connect")) {
        const auto hosts = positional.mid(1);
        if (hosts.isEmpty() && !parser.isSet(fingerprintOption)) {
            return usage(QStringLiteral("usage: pairlink connect HOST... | connect --fingerprint FP"));
        }
        service.connections()->setLocalAlias(alias);

        int exit_code = 0;
        auto on_result = [&](pairlink::network::ConnectResult result) {
            QTextStream(stdout) << pairlink::cli::format_connect_result(result, out);
            if (result.is_err()) {
                exit_code = 1;
                app.quit();
                return;
            }
            // Wait for the server to tell us where we stand, then leave.
            QTimer::singleShot(service.config().connect_timeout_ms, &app, [&] {
                QTextStream(stdout) << "no status from server\n";
                service.disconnectSession();
                app.quit();
            });
        };
        QObject::connect(&service, &PairingService::remoteStatusChanged, &app, [&](ClientStatus status) {
            QTextStream(stdout) << "status: " << QString::fromLatin1(pairlink::to_string(status).data()) << '\n';
            service.disconnectSession();
            app.quit();
        });

        if (parser.isSet(fingerprintOption)) {
            service.connectTrusted(parser.value(fingerprintOption), on_result);
        } else {
            service.connectToHosts(hosts, on_result);
        }
        const int rc = app.exec();
        return rc != 0 ? rc : exit_code;
    }

    return usage(QStringLiteral("unknown command '%1', see --help").arg(command));
}
