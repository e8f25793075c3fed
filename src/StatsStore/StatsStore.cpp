// === src/StatsStore/StatsStore.cpp ===
#include "StatsStore.hpp"
#include "StatsErrors.hpp"
#include "StatsRecordJson.hpp"
#include "Logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>

// Create tables query
static const char* kSchemaSQL = R"SQL(
CREATE TABLE IF NOT EXISTS tu_stats (
  key   TEXT PRIMARY KEY,
  value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS meta (
  key   TEXT PRIMARY KEY,
  value TEXT NOT NULL
);

INSERT OR IGNORE INTO meta(key, value) VALUES ('schema_version','1');
)SQL";

static const int kBusyTimeoutMs = 5000;

using StmtPtr = std::unique_ptr<sqlite3_stmt, int(*)(sqlite3_stmt*)>;

// Desc: run one SQL batch
// In: sqlite3* db, const char* sql, std::string& err
// Out: bool (false with err set on failure)
static bool exec_sql(sqlite3* db, const char* sql, std::string& err) {
    char* msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &msg) != SQLITE_OK) {
        err = msg ? msg : sqlite3_errmsg(db);
        if (msg) sqlite3_free(msg);
        return false;
    }
    return true;
}

// Desc: run one SQL batch, throwing on failure
// In: sqlite3* db, const char* sql, const std::string& where
// Out: void; throws StorageOpenError
static void exec_or_throw(sqlite3* db, const char* sql, const std::string& where) {
    std::string e;
    if (!exec_sql(db, sql, e)) {
        throw StorageOpenError("[StatsStore] " + where + ": " + e);
    }
}

StatsStore::StatsStore(const std::string& path, Mode mode) : path_(path), mode_(mode) {
    namespace fs = std::filesystem;
    const bool read_only = (mode == Mode::ReadOnly);

    // 1) parent dir, or an existing file when reading
    if (read_only) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            throw StorageOpenError("[StatsStore] no stats database at " + path);
        }
    } else {
        const fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                throw StorageOpenError("[StatsStore] cannot create directory " + parent.string() + ": " + ec.message());
            }
        }
    }

    // 2) open
    const int flags = read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string e = raw ? sqlite3_errmsg(raw) : "unknown";
        if (raw) sqlite3_close_v2(raw);
        throw StorageOpenError("[StatsStore] sqlite open failed for " + path + ": " + e);
    }
    db_.reset(raw);
    sqlite3_busy_timeout(db_.get(), kBusyTimeoutMs);

    // 3) pragmas + schema (a non-database file fails here with SQLITE_NOTADB)
    if (read_only) {
        checkSchemaVersion_();
    } else {
        exec_or_throw(db_.get(), "PRAGMA journal_mode=WAL;", "journal_mode on " + path);
        exec_or_throw(db_.get(), "PRAGMA synchronous=FULL;", "synchronous on " + path);
        applySchema_();
    }

    log_info("[StatsStore] opened " + path + (read_only ? " (read-only)" : ""));
}

void StatsStore::applySchema_() {
    exec_or_throw(db_.get(), kSchemaSQL, "schema exec on " + path_);
    checkSchemaVersion_();
}

// Desc: read the stored schema version; newer versions are only logged
// In: (none)
// Out: void; throws StorageOpenError when the meta table is unreadable
void StatsStore::checkSchemaVersion_() {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_.get(), "SELECT value FROM meta WHERE key='schema_version'", -1, &raw, nullptr) != SQLITE_OK) {
        throw StorageOpenError("[StatsStore] meta read on " + path_ + ": " + sqlite3_errmsg(db_.get()));
    }
    StmtPtr s(raw, sqlite3_finalize);
    int stored = 0;
    if (sqlite3_step(s.get()) == SQLITE_ROW) {
        const unsigned char* t = sqlite3_column_text(s.get(), 0);
        if (t) stored = static_cast<int>(std::strtol(reinterpret_cast<const char*>(t), nullptr, 10));
    }

    if (stored > kSchemaVersion) {
        log_info("[StatsStore] " + path_ + " has schema_version " + std::to_string(stored) +
                 " (this build writes " + std::to_string(kSchemaVersion) + "); unknown fields are ignored");
    }
}

std::string StatsStore::make_key(const StatsRecord& rec) {
    const auto ns = std::chrono::duration_cast<Nanos>(rec.timestamp.time_since_epoch()).count();
    const long long secs  = static_cast<long long>(ns / 1000000000LL);
    const long long nanos = static_cast<long long>(ns % 1000000000LL);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%lld.%09lld", secs, nanos);
    return std::string(buf) + ":" + rec.input_file;
}

// caller holds mu_
void StatsStore::rollback_() {
    std::string e;
    if (!exec_sql(db_.get(), "ROLLBACK;", e)) {
        log_warn("[StatsStore] rollback on " + path_ + " failed: " + e);
    }
}

void StatsStore::insert(const StatsRecord& rec) {
    if (mode_ == Mode::ReadOnly) {
        throw StorageWriteError("[StatsStore] " + path_ + " is open read-only");
    }
    const std::string key   = make_key(rec);
    const std::string value = serialize_stats_record(rec);

    std::lock_guard<std::mutex> lk(mu_);
    std::string e;
    if (!exec_sql(db_.get(), "BEGIN IMMEDIATE;", e)) {
        throw StorageWriteError("[StatsStore] begin insert of '" + key + "' failed: " + e);
    }

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_.get(), "INSERT OR REPLACE INTO tu_stats(key,value) VALUES(?,?)", -1, &raw, nullptr) != SQLITE_OK) {
        e = sqlite3_errmsg(db_.get());
        rollback_();
        throw StorageWriteError("[StatsStore] prepare insert failed: " + e);
    }
    StmtPtr u(raw, sqlite3_finalize);
    sqlite3_bind_text(u.get(), 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(u.get(), 2, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);

    if (sqlite3_step(u.get()) != SQLITE_DONE) {
        e = sqlite3_errmsg(db_.get());
        u.reset();
        rollback_();
        throw StorageWriteError("[StatsStore] insert of '" + key + "' failed: " + e);
    }
    u.reset();

    // synchronous=FULL: the WAL is fsynced before COMMIT returns
    if (!exec_sql(db_.get(), "COMMIT;", e)) {
        rollback_();
        throw StorageWriteError("[StatsStore] commit of '" + key + "' failed: " + e);
    }
}

std::vector<StatsRecord> StatsStore::scan() const {
    std::vector<StatsRecord> out;

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_.get(), "SELECT key, value FROM tu_stats ORDER BY key", -1, &raw, nullptr) != SQLITE_OK) {
        throw StorageReadError("[StatsStore] prepare scan failed: " + std::string(sqlite3_errmsg(db_.get())));
    }
    StmtPtr s(raw, sqlite3_finalize);

    int rc;
    while ((rc = sqlite3_step(s.get())) == SQLITE_ROW) {
        const char* k = reinterpret_cast<const char*>(sqlite3_column_text(s.get(), 0));
        const char* v = reinterpret_cast<const char*>(sqlite3_column_text(s.get(), 1));
        const int   n = sqlite3_column_bytes(s.get(), 1);
        const std::string key = k ? k : "";
        out.push_back(deserialize_stats_record(v ? std::string(v, static_cast<size_t>(n)) : std::string(), key));
    }
    if (rc != SQLITE_DONE) {
        throw StorageReadError("[StatsStore] scan failed: " + std::string(sqlite3_errmsg(db_.get())));
    }
    return out;
}

std::size_t StatsStore::count() const {
    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_.get(), "SELECT COUNT(*) FROM tu_stats", -1, &raw, nullptr) != SQLITE_OK) {
        throw StorageReadError("[StatsStore] prepare count failed: " + std::string(sqlite3_errmsg(db_.get())));
    }
    StmtPtr s(raw, sqlite3_finalize);
    if (sqlite3_step(s.get()) != SQLITE_ROW) {
        throw StorageReadError("[StatsStore] count failed: " + std::string(sqlite3_errmsg(db_.get())));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(s.get(), 0));
}
