// === include/StatsExport.hpp ===
#pragma once
#include "ConfigManager.hpp"
#include "StatsRecord.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

// Read-back and reporting over a stats store.
class StatsExport {
public:
    static constexpr std::size_t kCsvRankEntries   = 3;
    static constexpr std::size_t kHumanRankEntries = 5;

    // Opens the store at `path`, else cfg.stats_file, else the default
    // location, read-only, and returns every record. A missing file is a
    // StorageOpenError; nothing is created. Throws ConfigResolutionError,
    // StorageOpenError, StorageReadError.
    static std::vector<StatsRecord> query(const std::optional<std::string>& path,
                                          const TuStatsConfig& cfg = TuStatsConfig{});

    static std::string csv_header();
    static std::string to_csv(const std::vector<StatsRecord>& records);

    static void print_human(const std::vector<StatsRecord>& records, std::ostream& os);

    // Chronological order, ties by input file.
    static void sort_by_timestamp(std::vector<StatsRecord>& records);
};
