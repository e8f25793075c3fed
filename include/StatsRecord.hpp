#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

using WallClock = std::chrono::system_clock;
using Nanos     = std::chrono::nanoseconds;

// One included file's footprint in a translation unit (aggregation input).
struct IncludeContribution {
    std::string path_prefix;
    uint64_t    size_bytes{0};
};

// One ranked group of includes sharing a path prefix.
struct IncludeStats {
    std::string path_prefix;
    uint64_t    count{0};   // files from this prefix
    uint64_t    lines{0};   // cumulative preprocessed bytes from this prefix

    bool operator==(const IncludeStats& o) const noexcept {
        return path_prefix == o.path_prefix && count == o.count && lines == o.lines;
    }
    bool operator!=(const IncludeStats& o) const noexcept { return !(*this == o); }
};

// Snapshot of a single compilation. Built once by the pipeline and only
// passed around by const reference afterwards.
struct StatsRecord {
    std::string input_file;
    uint64_t    preprocessed_size{0};
    uint64_t    num_includes{0};
    Nanos       preprocess_duration{0};
    Nanos       compile_duration{0};
    uint32_t    dist_retry_count{0};   // 0 when not distributed
    bool        is_distributed{false};
    std::vector<IncludeStats> top_includes_by_count;
    std::vector<IncludeStats> top_includes_by_size;
    WallClock::time_point     timestamp{};

    bool operator==(const StatsRecord& o) const noexcept {
        return input_file == o.input_file &&
               preprocessed_size == o.preprocessed_size &&
               num_includes == o.num_includes &&
               preprocess_duration == o.preprocess_duration &&
               compile_duration == o.compile_duration &&
               dist_retry_count == o.dist_retry_count &&
               is_distributed == o.is_distributed &&
               top_includes_by_count == o.top_includes_by_count &&
               top_includes_by_size == o.top_includes_by_size &&
               timestamp == o.timestamp;
    }
    bool operator!=(const StatsRecord& o) const noexcept { return !(*this == o); }
};
