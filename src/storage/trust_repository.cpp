#include "storage/trust_repository.hpp"

namespace pairlink::storage {

Result<std::vector<std::string>, Error> TrustRepository::hosts_of(const std::string& fingerprint) {
    using R = Result<std::vector<std::string>, Error>;
    auto stmt_result = db_.prepare(R"SQL(
        SELECT host FROM trusted_server_hosts
        WHERE fingerprint = ? ORDER BY position;
    )SQL");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, fingerprint);
    if (bound.is_err()) {
        return R::err(bound.unwrap_err());
    }

    std::vector<std::string> hosts;
    while (true) {
        auto step = stmt.step();
        if (step.is_err()) {
            return R::err(step.unwrap_err());
        }
        if (!step.unwrap()) break;
        hosts.push_back(stmt.column_text(0));
    }
    return R::ok(std::move(hosts));
}

Result<std::optional<TrustedServerCertificate>, Error> TrustRepository::get(const std::string& fingerprint) {
    using R = Result<std::optional<TrustedServerCertificate>, Error>;
    auto stmt_result = db_.prepare(R"SQL(
        SELECT fingerprint, created_at, updated_at
        FROM trusted_servers WHERE fingerprint = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, fingerprint);
    if (bound.is_err()) {
        return R::err(bound.unwrap_err());
    }

    auto step = stmt.step();
    if (step.is_err()) {
        return R::err(step.unwrap_err());
    }
    if (!step.unwrap()) {
        return R::ok(std::nullopt);
    }

    TrustedServerCertificate cert{
        .fingerprint = stmt.column_text(0),
        .hosts = {},
        .created_at = Timestamp(stmt.column_int64(1)),
        .updated_at = Timestamp(stmt.column_int64(2)),
    };
    auto hosts = hosts_of(cert.fingerprint);
    if (hosts.is_err()) {
        return R::err(hosts.unwrap_err());
    }
    cert.hosts = std::move(hosts).unwrap();
    return R::ok(std::move(cert));
}

Result<TrustList, Error> TrustRepository::list() {
    using R = Result<TrustList, Error>;
    TrustList entries;
    auto q = db_.query(R"SQL(
        SELECT fingerprint, created_at, updated_at
        FROM trusted_servers ORDER BY fingerprint;
    )SQL", [&entries](const Statement& row) {
        entries.push_back(TrustedServerCertificate{
            .fingerprint = row.column_text(0),
            .hosts = {},
            .created_at = Timestamp(row.column_int64(1)),
            .updated_at = Timestamp(row.column_int64(2)),
        });
    });
    if (q.is_err()) {
        return R::err(q.unwrap_err());
    }

    for (auto& entry : entries) {
        auto hosts = hosts_of(entry.fingerprint);
        if (hosts.is_err()) {
            return R::err(hosts.unwrap_err());
        }
        entry.hosts = std::move(hosts).unwrap();
    }
    return R::ok(std::move(entries));
}

Result<void, Error> TrustRepository::save(const TrustedServerCertificate& cert) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto upsert_result = db_.prepare(R"SQL(
            INSERT INTO trusted_servers (fingerprint, created_at, updated_at)
            VALUES (?, ?, ?)
            ON CONFLICT(fingerprint) DO UPDATE SET
                updated_at = excluded.updated_at;
        )SQL");
        if (upsert_result.is_err()) {
            return Result<void, Error>::err(upsert_result.unwrap_err());
        }
        auto upsert = std::move(upsert_result).unwrap();
        auto bound = upsert.bind_text(1, cert.fingerprint)
            .and_then([&] { return upsert.bind_int64(2, cert.created_at.millis()); })
            .and_then([&] { return upsert.bind_int64(3, cert.updated_at.millis()); });
        if (bound.is_err()) {
            return bound;
        }
        auto step = upsert.step();
        if (step.is_err()) {
            return Result<void, Error>::err(step.unwrap_err());
        }

        auto clear_result = db_.prepare("DELETE FROM trusted_server_hosts WHERE fingerprint = ?;");
        if (clear_result.is_err()) {
            return Result<void, Error>::err(clear_result.unwrap_err());
        }
        auto clear = std::move(clear_result).unwrap();
        bound = clear.bind_text(1, cert.fingerprint);
        if (bound.is_err()) {
            return bound;
        }
        step = clear.step();
        if (step.is_err()) {
            return Result<void, Error>::err(step.unwrap_err());
        }

        auto insert_result = db_.prepare(R"SQL(
            INSERT INTO trusted_server_hosts (fingerprint, position, host)
            VALUES (?, ?, ?);
        )SQL");
        if (insert_result.is_err()) {
            return Result<void, Error>::err(insert_result.unwrap_err());
        }
        auto insert = std::move(insert_result).unwrap();
        for (size_t i = 0; i < cert.hosts.size(); ++i) {
            bound = insert.reset()
                .and_then([&] { return insert.bind_text(1, cert.fingerprint); })
                .and_then([&] { return insert.bind_int(2, static_cast<int>(i)); })
                .and_then([&] { return insert.bind_text(3, cert.hosts[i]); });
            if (bound.is_err()) {
                return bound;
            }
            step = insert.step();
            if (step.is_err()) {
                return Result<void, Error>::err(step.unwrap_err());
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<bool, Error> TrustRepository::remove(const std::string& fingerprint) {
    using R = Result<bool, Error>;
    auto stmt_result = db_.prepare("DELETE FROM trusted_servers WHERE fingerprint = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, fingerprint);
    if (bound.is_err()) {
        return R::err(bound.unwrap_err());
    }
    auto step = stmt.step();
    if (step.is_err()) {
        return R::err(step.unwrap_err());
    }
    return R::ok(db_.changes() > 0);
}

Result<std::optional<std::string>, Error> TrustRepository::fingerprint_for_host(const std::string& host) {
    using R = Result<std::optional<std::string>, Error>;
    auto stmt_result = db_.prepare(R"SQL(
        SELECT s.fingerprint
        FROM trusted_server_hosts h
        JOIN trusted_servers s ON s.fingerprint = h.fingerprint
        WHERE h.host = ?
        ORDER BY s.updated_at DESC, s.fingerprint
        LIMIT 1;
    )SQL");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, host);
    if (bound.is_err()) {
        return R::err(bound.unwrap_err());
    }
    auto step = stmt.step();
    if (step.is_err()) {
        return R::err(step.unwrap_err());
    }
    if (!step.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(stmt.column_text(0));
}

} // namespace pairlink::storage
