#pragma once

#include "core/result.hpp"

#include <QObject>
#include <QString>

#include <functional>
#include <memory>
#include <vector>

namespace pairlink::network {

class Connection;

/**
 * A host and port to dial.
 */
struct Endpoint {
    QString host;
    uint16_t port = 0;

    QString toString() const;
};

/**
 * Parse "host", "host:port", "[v6]:port", a bare IPv6 literal, or
 * "scheme://host[:port]/path". Missing ports become `default_port`.
 */
[[nodiscard]] Result<Endpoint, Error> parse_endpoint(const QString& text, uint16_t default_port);

using FetchCallback = std::function<void(Result<QString, Error>)>;

/**
 * CertificateFetcher - connects to a URL only to look at the certificate
 * the server presents, trusted or not.
 *
 * Nothing is stored. The observed fingerprint is what the operator compares
 * against the one shown on the other device before anything is trusted.
 */
class CertificateFetcher : public QObject {
    Q_OBJECT

public:
    explicit CertificateFetcher(int timeout_ms, uint16_t default_port, QObject* parent = nullptr);
    ~CertificateFetcher() override;

    /**
     * Start a fetch. `callback` runs exactly once, on this object's thread,
     * with the fingerprint or InvalidArgument / NetworkUnreachable /
     * TlsHandshakeFailed / Timeout. Several fetches may run at once.
     */
    void fetchServerCertificate(const QString& url, FetchCallback callback);

    [[nodiscard]] int pendingFetches() const { return static_cast<int>(fetches_.size()); }

private:
    struct Fetch;

    void finish(Fetch* fetch, Result<QString, Error> result);

    int timeout_ms_;
    uint16_t default_port_;
    std::vector<std::unique_ptr<Fetch>> fetches_;
};

} // namespace pairlink::network
