#include "StatsExport.hpp"
#include "StatsStore.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <sstream>

// Desc: quote a CSV field when it holds a separator, quote or newline
// In: const std::string& text
// Out: std::string
static std::string escape_csv(const std::string& text) {
    if (text.find_first_of(",\"\n\r") == std::string::npos) {
        return text;
    }
    std::string result = "\"";
    for (const char c : text) {
        if (c == '"') result += "\"\"";
        else result += c;
    }
    result += "\"";
    return result;
}

static long long epoch_secs(const WallClock::time_point& tp) {
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

static long long millis(const Nanos& d) {
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
}

// Desc: "<secs>.<9-digit nanos>" rendering of a wall-clock instant
// In: const WallClock::time_point& tp
// Out: std::string
static std::string raw_timestamp(const WallClock::time_point& tp) {
    const auto ns = std::chrono::duration_cast<Nanos>(tp.time_since_epoch()).count();
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%lld.%09lld",
                  static_cast<long long>(ns / 1000000000LL), static_cast<long long>(ns % 1000000000LL));
    return buf;
}

std::vector<StatsRecord> StatsExport::query(const std::optional<std::string>& path,
                                            const TuStatsConfig& cfg) {
    const std::string resolved = path ? *path : ConfigManager::resolve_stats_path(cfg);
    StatsStore store(resolved, StatsStore::Mode::ReadOnly);
    return store.scan();
}

std::string StatsExport::csv_header() {
    std::string h = "timestamp,input_file,preprocessed_size,num_includes,"
                    "preprocess_duration_ms,compile_duration_ms,dist_retry_count,is_distributed";
    for (std::size_t i = 1; i <= kCsvRankEntries; ++i) {
        const std::string p = "top_count_" + std::to_string(i) + "_";
        h += "," + p + "prefix," + p + "count," + p + "lines";
    }
    for (std::size_t i = 1; i <= kCsvRankEntries; ++i) {
        const std::string p = "top_size_" + std::to_string(i) + "_";
        h += "," + p + "prefix," + p + "lines," + p + "count";
    }
    return h;
}

// Desc: render records as CSV with a fixed column count
// In: const std::vector<StatsRecord>& records
// Out: std::string (header + one line per record)
std::string StatsExport::to_csv(const std::vector<StatsRecord>& records) {
    std::ostringstream os;
    os << csv_header() << '\n';

    for (const auto& r : records) {
        os << epoch_secs(r.timestamp) << ','
           << escape_csv(r.input_file) << ','
           << r.preprocessed_size << ','
           << r.num_includes << ','
           << millis(r.preprocess_duration) << ','
           << millis(r.compile_duration) << ','
           << r.dist_retry_count << ','
           << (r.is_distributed ? "true" : "false");

        // by count: prefix,count,lines
        for (std::size_t i = 0; i < kCsvRankEntries; ++i) {
            if (i < r.top_includes_by_count.size()) {
                const auto& s = r.top_includes_by_count[i];
                os << ',' << escape_csv(s.path_prefix) << ',' << s.count << ',' << s.lines;
            } else {
                os << ",,,";
            }
        }
        // by size: prefix,lines,count
        for (std::size_t i = 0; i < kCsvRankEntries; ++i) {
            if (i < r.top_includes_by_size.size()) {
                const auto& s = r.top_includes_by_size[i];
                os << ',' << escape_csv(s.path_prefix) << ',' << s.lines << ',' << s.count;
            } else {
                os << ",,,";
            }
        }
        os << '\n';
    }
    return os.str();
}

void StatsExport::print_human(const std::vector<StatsRecord>& records, std::ostream& os) {
    if (records.empty()) {
        os << "No translation unit statistics found.\n";
        return;
    }

    os << "Translation unit statistics (" << records.size() << " entries)\n";
    for (const auto& r : records) {
        os << "\n" << r.input_file << "\n"
           << "  preprocessed size : " << r.preprocessed_size << " bytes\n"
           << "  includes          : " << r.num_includes << "\n"
           << "  preprocess time   : " << millis(r.preprocess_duration) << " ms\n"
           << "  compile time      : " << millis(r.compile_duration) << " ms\n"
           << "  distributed       : " << (r.is_distributed ? "yes" : "no")
           << " (retries: " << r.dist_retry_count << ")\n";

        os << "  top includes by count:\n";
        if (r.top_includes_by_count.empty()) os << "    (none)\n";
        for (std::size_t i = 0; i < r.top_includes_by_count.size() && i < kHumanRankEntries; ++i) {
            const auto& s = r.top_includes_by_count[i];
            os << "    " << (i + 1) << ". " << s.path_prefix
               << "  files=" << s.count << " bytes=" << s.lines << "\n";
        }
        os << "  top includes by size:\n";
        if (r.top_includes_by_size.empty()) os << "    (none)\n";
        for (std::size_t i = 0; i < r.top_includes_by_size.size() && i < kHumanRankEntries; ++i) {
            const auto& s = r.top_includes_by_size[i];
            os << "    " << (i + 1) << ". " << s.path_prefix
               << "  bytes=" << s.lines << " files=" << s.count << "\n";
        }
        os << "  timestamp         : " << raw_timestamp(r.timestamp) << "\n";
    }
}

void StatsExport::sort_by_timestamp(std::vector<StatsRecord>& records) {
    std::stable_sort(records.begin(), records.end(), [](const StatsRecord& a, const StatsRecord& b) {
        if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
        return a.input_file < b.input_file;
    });
}
