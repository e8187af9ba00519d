#include "storage/database.hpp"

#include "core/logging.hpp"

namespace pairlink::storage {

Error sqlite_error(std::string what, int rc, sqlite3* db) {
    if (db) {
        what += ": ";
        what += sqlite3_errmsg(db);
    } else {
        what += ": ";
        what += sqlite3_errstr(rc);
    }
    return Error{std::move(what), ErrorCode::Storage, rc};
}

namespace {

Result<void, Error> check_bind(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error(what, rc));
    }
    return Result<void, Error>::ok();
}

} // namespace

// ---------------------------------------------------------------------------
// Statement

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return check_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                        static_cast<int>(text.size()), SQLITE_TRANSIENT),
                      "bind text");
}

Result<void, Error> Statement::bind_int(int index, int value) {
    return check_bind(sqlite3_bind_int(stmt_.get(), index, value), "bind int");
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_.get(), index, value), "bind int64");
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    return Result<bool, Error>::err(sqlite_error("step", rc, sqlite3_db_handle(stmt_.get())));
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("reset", rc));
    }
    return Result<void, Error>::ok();
}

// ---------------------------------------------------------------------------
// Database

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        auto error = sqlite_error("open " + path, rc, raw);
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(std::move(error));
    }

    Database db(raw);
    sqlite3_busy_timeout(raw, 2000);

    for (const char* pragma : {"PRAGMA foreign_keys = ON;",
                               "PRAGMA journal_mode = WAL;",
                               "PRAGMA synchronous = FULL;"}) {
        auto pragma_result = db.execute(pragma);
        if (pragma_result.is_err()) {
            return Result<Database, Error>::err(pragma_result.unwrap_err());
        }
    }

    qCDebug(pairlinkStorageLog) << "Opened database" << path.c_str();
    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(Error{"database not open", ErrorCode::Storage});
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(sqlite_error("prepare", rc, db_));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return fail("database not open", ErrorCode::Storage);
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        return fail(std::move(message), ErrorCode::Storage, rc);
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    // IMMEDIATE takes the write lock up front so two writers cannot deadlock
    // on lock upgrade.
    return execute("BEGIN IMMEDIATE;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

void Database::rollback_quietly() {
    rollback().inspect_err([](const Error& e) {
        qCWarning(pairlinkStorageLog) << "Rollback failed:" << e.message.c_str();
    });
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

} // namespace pairlink::storage
