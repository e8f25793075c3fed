// === include/StatsRecordJson.hpp ===
#pragma once
#include "StatsRecord.hpp"
#include <string>

// Field-named JSON encoding of StatsRecord. Missing fields read back as
// defaults; unknown fields are ignored.
std::string serialize_stats_record(const StatsRecord& rec);                       // throws StorageWriteError
StatsRecord deserialize_stats_record(const std::string& text, const std::string& key); // throws StorageReadError
