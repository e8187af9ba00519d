#pragma once

#include "core/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pairlink::storage {

/**
 * Prepared statement, finalized when the last copy goes away.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int(int index, int value);
    Result<void, Error> bind_int64(int index, int64_t value);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;

    // true while a row is available
    Result<bool, Error> step();
    Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - owning SQLite connection.
 *
 * Opened connections run with foreign keys on, WAL journaling and
 * synchronous=FULL so a committed pairing survives power loss.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Private in-memory database, used by tests.
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    void close();

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Run `sql` and hand every row to `callback`.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }
        return Result<void, Error>::ok();
    }

    /**
     * Run `f` inside BEGIN IMMEDIATE / COMMIT. An error from `f` or from the
     * commit rolls the transaction back and is returned unchanged.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();
        if (result.is_err()) {
            rollback_quietly();
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            rollback_quietly();
            return ResultType::err(commit_result.unwrap_err());
        }
        return result;
    }

    // Rows touched by the last INSERT, UPDATE or DELETE.
    [[nodiscard]] int changes() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    Result<void, Error> begin_transaction();
    Result<void, Error> commit();
    Result<void, Error> rollback();

    // Rollback after a failure; a rollback error is logged, the original error wins.
    void rollback_quietly();

    sqlite3* db_ = nullptr;
};

/**
 * Make a storage Error from an SQLite return code.
 */
[[nodiscard]] Error sqlite_error(std::string what, int rc, sqlite3* db = nullptr);

} // namespace pairlink::storage
