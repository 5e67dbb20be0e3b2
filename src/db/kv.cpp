#include "faststatus/db/kv.hpp"
#include <sqlite3.h>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <string>

#include "faststatus/core/log.hpp"

namespace faststatus::db {

using namespace faststatus::core;

namespace {
    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS kv (
            bucket TEXT NOT NULL,
            key BLOB NOT NULL,
            value BLOB NOT NULL,
            PRIMARY KEY (bucket, key)
        ) WITHOUT ROWID;
    )SQL";

    [[nodiscard]] Status db_error(int rc) noexcept {
        StatusCode code = StatusCode::Unknown;
        switch (rc & 0xff) {
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                code = StatusCode::Busy;
                break;
            case SQLITE_CORRUPT:
            case SQLITE_NOTADB:
                code = StatusCode::Corrupt;
                break;
            case SQLITE_IOERR:
            case SQLITE_FULL:
            case SQLITE_CANTOPEN:
                code = StatusCode::Io;
                break;
            default:
                break;
        }
        return make_status(StatusDomain::Db, code, static_cast<u32>(rc));
    }

    [[nodiscard]] int exec_sql(sqlite3* db, const char* sql) noexcept {
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            log_write(LogLevel::Debug, "kv: %s: %s", sql, err_msg ? err_msg : sqlite3_errstr(rc));
        }
        if (err_msg) sqlite3_free(err_msg);
        return rc;
    }

    [[nodiscard]] bool journal_mode_ok(const char* mode) noexcept {
        if (!mode || mode[0] == '\0') return false;
        for (const char* p = mode; *p; ++p) {
            if (!std::isalpha(static_cast<unsigned char>(*p))) return false;
        }
        return true;
    }
}

// ============================================================================
// Engine Lifecycle
// ============================================================================

KvEngine::~KvEngine() noexcept {
    (void)close();
}

Status KvEngine::open(const KvConfig& cfg) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    // Close existing connection if any
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    const char* path = cfg.path ? cfg.path : ":memory:";
    int rc = sqlite3_open(path, &db_);
    if (rc != SQLITE_OK) {
        log_write(LogLevel::Error, "kv: cannot open %s: %s", path, db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return db_error(rc);
    }

    sqlite3_busy_timeout(db_, static_cast<int>(cfg.busy_timeout_ms));

    const char* journal_mode = std::getenv("FASTSTATUS_DB_JOURNAL_MODE");
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    } else if (!journal_mode_ok(journal_mode)) {
        log_write(LogLevel::Warn, "kv: ignoring FASTSTATUS_DB_JOURNAL_MODE=%s", journal_mode);
        journal_mode = "WAL";
    }
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    // In-memory databases report "memory"; not an error.
    (void)exec_sql(db_, journal_sql.c_str());
    (void)exec_sql(db_, "PRAGMA synchronous=NORMAL");

    rc = exec_sql(db_, kSchemaSQL);
    if (rc != SQLITE_OK) {
        log_write(LogLevel::Error, "kv: schema setup failed for %s: %s", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return db_error(rc);
    }

    log_write(LogLevel::Debug, "kv: opened %s (journal_mode=%s)", path, journal_mode);
    return ok_status();
}

Status KvEngine::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }
    db_ = nullptr;
    return ok_status();
}

bool KvEngine::is_open() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

// ============================================================================
// Transaction Management
// ============================================================================

Status KvEngine::update(const KvTxnFn& fn) noexcept {
    return run("BEGIN IMMEDIATE", true, fn);
}

Status KvEngine::view(const KvTxnFn& fn) noexcept {
    return run("BEGIN DEFERRED", false, fn);
}

Status KvEngine::run(const char* begin_sql, bool writable, const KvTxnFn& fn) noexcept {
    if (!fn) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    int rc = exec_sql(db_, begin_sql);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    KvTxn txn(db_, writable);
    const Status s = fn(txn);
    if (!is_ok(s)) {
        (void)exec_sql(db_, "ROLLBACK");
        return s;
    }

    rc = exec_sql(db_, "COMMIT");
    if (rc != SQLITE_OK) {
        (void)exec_sql(db_, "ROLLBACK");
        return db_error(rc);
    }

    return ok_status();
}

// ============================================================================
// Key/Value Operations
// ============================================================================

Status KvTxn::get(const char* bucket, BufferView key, std::vector<u8>* value, bool* found) noexcept {
    if (!db_ || !bucket || !value || !found || (key.len > 0 && !key.data)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT value FROM kv WHERE bucket = ? AND key = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    sqlite3_bind_text(stmt, 1, bucket, -1, SQLITE_STATIC);
    sqlite3_bind_blob(stmt, 2, key.data, static_cast<int>(key.len), SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const void* blob = sqlite3_column_blob(stmt, 0);
        const int len = sqlite3_column_bytes(stmt, 0);
        if (blob && len > 0) {
            const u8* p = static_cast<const u8*>(blob);
            value->assign(p, p + len);
        } else {
            value->clear();
        }
        *found = true;
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error(rc);
    }

    value->clear();
    *found = false;
    return ok_status();
}

Status KvTxn::put(const char* bucket, BufferView key, BufferView value) noexcept {
    if (!db_ || !bucket || (key.len > 0 && !key.data) || (value.len > 0 && !value.data)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (!writable_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "INSERT OR REPLACE INTO kv (bucket, key, value) VALUES (?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    sqlite3_bind_text(stmt, 1, bucket, -1, SQLITE_STATIC);
    sqlite3_bind_blob(stmt, 2, key.data, static_cast<int>(key.len), SQLITE_STATIC);
    // zeroblob keeps NOT NULL satisfied for empty values.
    if (value.len == 0) {
        sqlite3_bind_zeroblob(stmt, 3, 0);
    } else {
        sqlite3_bind_blob(stmt, 3, value.data, static_cast<int>(value.len), SQLITE_STATIC);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error(rc);
    }

    return ok_status();
}

} // namespace faststatus::db
