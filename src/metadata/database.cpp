#include <spdlog/spdlog.h>
#include <mediarepo/metadata/database.h>

namespace mediarepo::metadata {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

bool isConstraintViolation(int rc) {
    return (rc & 0xff) == SQLITE_CONSTRAINT;
}

Error sqliteError(int rc, std::string_view context, const char* detail) {
    return Error{isConstraintViolation(rc) ? ErrorCode::Conflict : ErrorCode::DatabaseError,
                 fmt::format("{}: {}", context, detail ? detail : sqlite3_errstr(rc))};
}

Error notOpen() {
    return Error{ErrorCode::InvalidState, "Database not open"};
}

} // namespace

Result<void> Statement::checkBind(int rc, int index) const {
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Failed to bind parameter {}: {}", index, sqlite3_errstr(rc))};
    }
    return {};
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return checkBind(sqlite3_bind_null(stmt_.get(), index), index);
}

Result<void> Statement::bind(int index, int value) {
    return checkBind(sqlite3_bind_int(stmt_.get(), index, value), index);
}

Result<void> Statement::bind(int index, int64_t value) {
    return checkBind(sqlite3_bind_int64(stmt_.get(), index, value), index);
}

Result<void> Statement::bind(int index, std::string_view value) {
    return checkBind(sqlite3_bind_text(stmt_.get(), index, value.data(),
                                       static_cast<int>(value.size()), SQLITE_TRANSIENT),
                     index);
}

Result<void> Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, std::string_view(*value)) : bind(index, nullptr);
}

Result<void> Statement::bind(int index, const std::optional<int64_t>& value) {
    return value ? bind(index, *value) : bind(index, nullptr);
}

Result<void> Statement::execute() {
    // SQLITE_BUSY is already retried by the connection's busy handler
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
        return {};
    }
    auto error = sqliteError(rc, "Failed to execute statement",
                             sqlite3_errmsg(sqlite3_db_handle(stmt_.get())));
    if (error.code == ErrorCode::Conflict) {
        spdlog::debug("Constraint violation in: {}", sqlite3_sql(stmt_.get()));
    }
    return error;
}

Result<bool> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return sqliteError(rc, "Failed to step statement",
                       sqlite3_errmsg(sqlite3_db_handle(stmt_.get())));
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_.get(), column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_.get(), column);
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(stmt_.get(), column);
    if (!text)
        return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), column)));
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL;
}

std::optional<std::string> Statement::getOptionalString(int column) const {
    if (isNull(column))
        return std::nullopt;
    return getString(column);
}

Result<void> Statement::reset() {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "Statement not prepared"};
    }
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return sqliteError(rc, "Failed to reset statement", nullptr);
    }
    return {};
}

Result<void> Statement::clearBindings() {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "Statement not prepared"};
    }
    int rc = sqlite3_clear_bindings(stmt_.get());
    if (rc != SQLITE_OK) {
        return sqliteError(rc, "Failed to clear bindings", nullptr);
    }
    return {};
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    close();

    int flags = SQLITE_OPEN_READWRITE;
    if (mode == ConnectionMode::ReadOnly) {
        flags = SQLITE_OPEN_READONLY;
    } else if (mode == ConnectionMode::Create) {
        flags |= SQLITE_OPEN_CREATE;
    }
    // Connections are handed between threads by the pool
    flags |= SQLITE_OPEN_FULLMUTEX;

    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    std::unique_ptr<sqlite3, Closer> db(handle);
    if (rc != SQLITE_OK) {
        return sqliteError(rc, "Failed to open database " + path,
                           db ? sqlite3_errmsg(db.get()) : nullptr);
    }

    sqlite3_busy_timeout(db.get(), BUSY_TIMEOUT_MS);
    db_ = std::move(db);
    path_ = path;
    return {};
}

void Database::close() {
    db_.reset();
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(std::string_view sql) {
    if (!db_) {
        return notOpen();
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_.get(), sql.data(), static_cast<int>(sql.size()), &stmt,
                                nullptr);
    Statement prepared(stmt);
    if (rc != SQLITE_OK) {
        return sqliteError(rc, "Failed to prepare statement", sqlite3_errmsg(db_.get()));
    }
    return prepared;
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return notOpen();
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc == SQLITE_OK) {
        return {};
    }

    auto error = sqliteError(rc, "Failed to execute SQL", errMsg);
    sqlite3_free(errMsg);
    if (error.code != ErrorCode::Conflict) {
        spdlog::error("{} ({})", error.message, sql);
    }
    return error;
}

Result<void> Database::beginTransaction(TransactionMode mode) {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    }
    MEDIAREPO_TRY(execute(mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN"));
    inTransaction_ = true;
    return {};
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }
    MEDIAREPO_TRY(execute("COMMIT"));
    inTransaction_ = false;
    return {};
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }
    inTransaction_ = false;
    return execute("ROLLBACK");
}

void Database::rollbackQuietly() {
    auto result = rollback();
    if (!result) {
        spdlog::warn("Rollback failed: {}", result.error().message);
    }
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_.get()) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_.get()) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    MEDIAREPO_TRY_UNWRAP(stmt, prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?"));
    MEDIAREPO_TRY(stmt.bind(1, table));
    return stmt.step();
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_) {
        return notOpen();
    }
    int rc = sqlite3_busy_timeout(db_.get(), static_cast<int>(timeout.count()));
    if (rc != SQLITE_OK) {
        return sqliteError(rc, "Failed to set busy timeout", sqlite3_errmsg(db_.get()));
    }
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode = WAL");
}

} // namespace mediarepo::metadata
