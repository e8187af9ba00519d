#pragma once

#include "core/result.hpp"
#include "storage/database.hpp"

#include <string>
#include <vector>

namespace pairlink::storage {

struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * Schema history, oldest first. Never edit a released entry; append a new one.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "trusted_servers",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS trusted_servers (
                fingerprint TEXT PRIMARY KEY,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );

            -- Host order is significant: connection attempts follow it.
            CREATE TABLE IF NOT EXISTS trusted_server_hosts (
                fingerprint TEXT NOT NULL
                    REFERENCES trusted_servers(fingerprint) ON DELETE CASCADE,
                position INTEGER NOT NULL,
                host TEXT NOT NULL COLLATE NOCASE,
                UNIQUE (fingerprint, host)
            );
            CREATE INDEX IF NOT EXISTS idx_trusted_server_hosts_host
                ON trusted_server_hosts(host);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS trusted_server_hosts;
            DROP TABLE IF EXISTS trusted_servers;
        )SQL"
    },
    {
        .version = 2,
        .name = "clients",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS clients (
                fingerprint TEXT PRIMARY KEY,
                alias TEXT NOT NULL DEFAULT '',
                device_model TEXT NOT NULL DEFAULT '',
                status INTEGER NOT NULL CHECK (status IN (0, 1, 2)),
                first_seen INTEGER NOT NULL,
                last_seen INTEGER NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS clients;
        )SQL"
    },
};

/**
 * MigrationRunner - brings a database to a schema version and back.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> migrate();
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> apply(const Migration& m);
    [[nodiscard]] Result<void, Error> revert(const Migration& m);

    Database& db_;
};

[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace pairlink::storage
