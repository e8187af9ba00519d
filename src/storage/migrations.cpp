#include "storage/migrations.hpp"

#include "core/logging.hpp"
#include "core/types.hpp"

namespace pairlink::storage {

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensured = ensure_migrations_table();
    if (ensured.is_err()) {
        return Result<int, Error>::err(ensured.unwrap_err());
    }

    int version = 0;
    auto q = db_.query("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;",
                       [&version](const Statement& row) { version = row.column_int(0); });
    if (q.is_err()) {
        return Result<int, Error>::err(q.unwrap_err());
    }
    return Result<int, Error>::ok(version);
}

Result<void, Error> MigrationRunner::apply(const Migration& m) {
    auto exec = db_.execute(m.up_sql);
    if (exec.is_err()) {
        return fail("migration " + std::to_string(m.version) + " (" + m.name + ") failed: " +
                        exec.unwrap_err().message,
                    ErrorCode::Storage, exec.unwrap_err().native_code);
    }

    auto stmt_result = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return stmt.bind_int(1, m.version)
        .and_then([&] { return stmt.bind_text(2, m.name); })
        .and_then([&] { return stmt.bind_int64(3, Timestamp::now().millis()); })
        .and_then([&]() -> Result<void, Error> {
            auto step = stmt.step();
            if (step.is_err()) return Result<void, Error>::err(step.unwrap_err());
            qCInfo(pairlinkStorageLog) << "Applied migration" << m.version << m.name.c_str();
            return Result<void, Error>::ok();
        });
}

Result<void, Error> MigrationRunner::revert(const Migration& m) {
    if (m.down_sql.empty()) {
        return fail("migration " + std::to_string(m.version) + " has no rollback",
                    ErrorCode::Storage);
    }
    auto exec = db_.execute(m.down_sql);
    if (exec.is_err()) {
        return fail("rollback of migration " + std::to_string(m.version) + " failed: " +
                        exec.unwrap_err().message,
                    ErrorCode::Storage, exec.unwrap_err().native_code);
    }
    return db_.execute("DELETE FROM schema_migrations WHERE version = " +
                       std::to_string(m.version) + ";");
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(current_result.unwrap_err());
    }
    const int current = current_result.unwrap();
    if (current >= target_version) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version > current && m.version <= target_version) {
                auto result = apply(m);
                if (result.is_err()) {
                    return result;
                }
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> MigrationRunner::rollback_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(current_result.unwrap_err());
    }
    const int current = current_result.unwrap();
    if (current <= target_version) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (auto it = ALL_MIGRATIONS.rbegin(); it != ALL_MIGRATIONS.rend(); ++it) {
            if (it->version <= current && it->version > target_version) {
                auto result = revert(*it);
                if (result.is_err()) {
                    return result;
                }
            }
        }
        return Result<void, Error>::ok();
    });
}

} // namespace pairlink::storage
