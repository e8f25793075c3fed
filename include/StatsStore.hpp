// === include/StatsStore.hpp ===
#pragma once
#include "StatsRecord.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

// Durable key -> StatsRecord log on top of a single SQLite database file.
//
// Several processes may open the same path: WAL journaling plus a busy
// timeout let SQLite serialize their writers. Within one process a single
// instance may be shared across threads.
class StatsStore {
public:
    static constexpr int kSchemaVersion = 1;

    enum class Mode {
        Create,     // create the file and its parent directory when missing
        ReadOnly    // the file must already exist; nothing is written
    };

    // Opens the store. Throws StorageOpenError.
    explicit StatsStore(const std::string& path, Mode mode = Mode::Create);

    StatsStore(const StatsStore&) = delete;
    StatsStore& operator=(const StatsStore&) = delete;

    // Writes rec under make_key(rec) in its own IMMEDIATE transaction;
    // returns once the commit is fsynced. An existing entry with the same
    // key is replaced. Throws StorageWriteError, after rolling back.
    void insert(const StatsRecord& rec);

    // Every stored record, in key order (callers must not depend on it).
    // Throws StorageReadError on the first undecodable entry.
    std::vector<StatsRecord> scan() const;

    // Throws StorageReadError.
    std::size_t count() const;

    const std::string& path() const { return path_; }

    // "<secs>.<9-digit nanos>:<input_file>"
    static std::string make_key(const StatsRecord& rec);

private:
    void applySchema_();
    void checkSchemaVersion_();
    void rollback_();

    std::string path_;
    Mode mode_;
    mutable std::mutex mu_;
    std::unique_ptr<sqlite3, int(*)(sqlite3*)> db_{nullptr, sqlite3_close_v2};
};
