#include "storage/client_repository.hpp"

#include "core/logging.hpp"

namespace pairlink::storage {
namespace {

constexpr const char* kSelectColumns =
    "SELECT fingerprint, alias, device_model, status, first_seen, last_seen FROM clients";

ClientSummary row_to_client(const Statement& row) {
    auto status = client_status_from_int(row.column_int(3));
    if (!status) {
        // Only reachable if the table was edited by hand; treat as undecided.
        qCWarning(pairlinkStorageLog) << "Unknown client status" << row.column_int(3);
    }
    return ClientSummary{
        .fingerprint = row.column_text(0),
        .alias = row.column_text(1),
        .device_model = row.column_text(2),
        .status = status.value_or(ClientStatus::Pending),
        .first_seen = Timestamp(row.column_int64(4)),
        .last_seen = Timestamp(row.column_int64(5)),
    };
}

} // namespace

Result<std::optional<ClientSummary>, Error> ClientRepository::get(const std::string& fingerprint) {
    using R = Result<std::optional<ClientSummary>, Error>;
    auto stmt_result = db_.prepare(std::string(kSelectColumns) + " WHERE fingerprint = ?;");
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
    return R::ok(row_to_client(stmt));
}

Result<std::vector<ClientSummary>, Error> ClientRepository::list() {
    using R = Result<std::vector<ClientSummary>, Error>;
    std::vector<ClientSummary> clients;
    auto q = db_.query(std::string(kSelectColumns) +
                           " ORDER BY alias COLLATE NOCASE, fingerprint;",
                       [&clients](const Statement& row) { clients.push_back(row_to_client(row)); });
    if (q.is_err()) {
        return R::err(q.unwrap_err());
    }
    return R::ok(std::move(clients));
}

Result<void, Error> ClientRepository::save(const ClientSummary& client) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO clients (fingerprint, alias, device_model, status, first_seen, last_seen)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(fingerprint) DO UPDATE SET
            alias = excluded.alias,
            device_model = excluded.device_model,
            status = excluded.status,
            last_seen = excluded.last_seen;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, client.fingerprint)
        .and_then([&] { return stmt.bind_text(2, client.alias); })
        .and_then([&] { return stmt.bind_text(3, client.device_model); })
        .and_then([&] { return stmt.bind_int(4, static_cast<int>(client.status)); })
        .and_then([&] { return stmt.bind_int64(5, client.first_seen.millis()); })
        .and_then([&] { return stmt.bind_int64(6, client.last_seen.millis()); });
    if (bound.is_err()) {
        return bound;
    }
    auto step = stmt.step();
    if (step.is_err()) {
        return Result<void, Error>::err(step.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<bool, Error> ClientRepository::remove(const std::string& fingerprint) {
    using R = Result<bool, Error>;
    auto stmt_result = db_.prepare("DELETE FROM clients WHERE fingerprint = ?;");
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

} // namespace pairlink::storage
