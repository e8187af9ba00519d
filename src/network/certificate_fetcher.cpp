#include "network/certificate_fetcher.hpp"

#include "core/logging.hpp"
#include "crypto/fingerprint.hpp"
#include "network/transport.hpp"

#include <QHostAddress>
#include <QTimer>
#include <QUrl>

#include <algorithm>

namespace pairlink::network {

namespace {

Result<uint16_t, Error> parse_port(const QString& text) {
    bool ok = false;
    const uint value = text.toUInt(&ok);
    if (!ok || value == 0 || value > 65535) {
        return Result<uint16_t, Error>::err(
            Error{"invalid port: " + text.toStdString(), ErrorCode::InvalidArgument});
    }
    return Result<uint16_t, Error>::ok(static_cast<uint16_t>(value));
}

bool plausible_host(const QString& host) {
    if (host.isEmpty()) return false;
    return std::none_of(host.begin(), host.end(), [](QChar c) {
        return c.isSpace() || c == '/' || c == '[' || c == ']' || c == '@';
    });
}

} // namespace

QString Endpoint::toString() const {
    if (host.contains(':')) {
        return QStringLiteral("[%1]:%2").arg(host).arg(port);
    }
    return QStringLiteral("%1:%2").arg(host).arg(port);
}

Result<Endpoint, Error> parse_endpoint(const QString& text, uint16_t default_port) {
    using R = Result<Endpoint, Error>;
    const auto input = text.trimmed();
    auto invalid = [&input](const char* why) {
        return R::err(Error{std::string(why) + ": '" + input.toStdString() + "'",
                            ErrorCode::InvalidArgument});
    };

    if (input.isEmpty()) {
        return invalid("empty address");
    }

    if (input.contains(QStringLiteral("://"))) {
        const QUrl url(input, QUrl::StrictMode);
        if (!url.isValid() || url.host().isEmpty()) {
            return invalid("invalid url");
        }
        const int port = url.port(default_port);
        if (port <= 0 || port > 65535) {
            return invalid("invalid port");
        }
        return R::ok(Endpoint{url.host(), static_cast<uint16_t>(port)});
    }

    if (input.startsWith('[')) {
        const auto close = input.indexOf(']');
        if (close < 0) {
            return invalid("unterminated IPv6 literal");
        }
        const auto host = input.mid(1, close - 1);
        if (QHostAddress(host).protocol() != QAbstractSocket::IPv6Protocol) {
            return invalid("invalid IPv6 address");
        }
        const auto rest = input.mid(close + 1);
        if (rest.isEmpty()) {
            return R::ok(Endpoint{host, default_port});
        }
        if (!rest.startsWith(':')) {
            return invalid("unexpected text after IPv6 literal");
        }
        return parse_port(rest.mid(1)).map([&host](uint16_t port) { return Endpoint{host, port}; });
    }

    const auto colons = input.count(':');
    if (colons > 1) {
        if (QHostAddress(input).protocol() != QAbstractSocket::IPv6Protocol) {
            return invalid("invalid address");
        }
        return R::ok(Endpoint{input, default_port});
    }

    if (colons == 1) {
        const auto sep = input.indexOf(':');
        const auto host = input.left(sep);
        if (!plausible_host(host)) {
            return invalid("invalid host");
        }
        return parse_port(input.mid(sep + 1)).map([&host](uint16_t port) { return Endpoint{host, port}; });
    }

    if (!plausible_host(input)) {
        return invalid("invalid host");
    }
    return R::ok(Endpoint{input, default_port});
}

struct CertificateFetcher::Fetch {
    Endpoint endpoint;
    FetchCallback callback;
    std::unique_ptr<Connection> connection;
    std::unique_ptr<QTimer> deadline;
};

CertificateFetcher::CertificateFetcher(int timeout_ms, uint16_t default_port, QObject* parent)
    : QObject(parent)
    , timeout_ms_(timeout_ms)
    , default_port_(default_port)
{
}

CertificateFetcher::~CertificateFetcher() {
    for (auto& fetch : fetches_) {
        fetch->connection->disconnect(this);
        fetch->connection->abort();
    }
}

void CertificateFetcher::fetchServerCertificate(const QString& url, FetchCallback callback) {
    auto endpoint = parse_endpoint(url, default_port_);
    if (endpoint.is_err()) {
        // Keep the callback asynchronous in every case.
        QTimer::singleShot(0, this, [callback = std::move(callback), error = endpoint.unwrap_err()] {
            callback(Result<QString, Error>::err(error));
        });
        return;
    }

    auto fetch = std::make_unique<Fetch>();
    fetch->endpoint = endpoint.unwrap();
    fetch->callback = std::move(callback);
    fetch->connection = std::make_unique<Connection>();
    fetch->deadline = std::make_unique<QTimer>();
    fetch->deadline->setSingleShot(true);

    auto* raw = fetch.get();
    connect(raw->connection.get(), &Connection::connected, this, [this, raw] {
        auto fingerprint = crypto::fingerprint_of(raw->connection->peerCertificate());
        raw->connection->abort();
        if (fingerprint.is_err()) {
            finish(raw, Result<QString, Error>::err(
                            Error{"server presented no usable certificate: " +
                                      fingerprint.unwrap_err().message,
                                  ErrorCode::TlsHandshakeFailed}));
            return;
        }
        finish(raw, Result<QString, Error>::ok(fingerprint.unwrap()));
    });
    connect(raw->connection.get(), &Connection::failed, this,
            [this, raw](ErrorCode code, const QString& message) {
                finish(raw, Result<QString, Error>::err(Error{message.toStdString(), code}));
            });
    connect(raw->deadline.get(), &QTimer::timeout, this, [this, raw] {
        raw->connection->abort();
        finish(raw, Result<QString, Error>::err(
                        Error{"no TLS handshake with " + raw->endpoint.toString().toStdString() +
                                  " within " + std::to_string(timeout_ms_) + " ms",
                              ErrorCode::Timeout}));
    });

    qCDebug(pairlinkConnectLog) << "Fetching certificate of" << raw->endpoint.toString();
    fetches_.push_back(std::move(fetch));
    raw->deadline->start(timeout_ms_);
    raw->connection->connectAnonymously(raw->endpoint.host, raw->endpoint.port);
}

void CertificateFetcher::finish(Fetch* fetch, Result<QString, Error> result) {
    auto it = std::find_if(fetches_.begin(), fetches_.end(),
                           [fetch](const auto& f) { return f.get() == fetch; });
    if (it == fetches_.end()) return;

    auto owned = std::move(*it);
    fetches_.erase(it);
    owned->deadline->stop();
    owned->connection->disconnect(this);

    result.match(
        [&owned](const QString& fp) {
            qCInfo(pairlinkConnectLog) << owned->endpoint.toString() << "presents" << fp;
        },
        [&owned](const Error& e) {
            qCInfo(pairlinkConnectLog) << "Fetch from" << owned->endpoint.toString() << "failed:"
                                       << e.message.c_str();
        });

    auto callback = std::move(owned->callback);
    // The connection may be the signal sender still on the stack.
    owned->connection.release()->deleteLater();
    owned->deadline.release()->deleteLater();
    callback(std::move(result));
}

} // namespace pairlink::network
