#pragma once
#include "StatsRecord.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

struct IncludeRankings {
    std::vector<IncludeStats> by_count;
    std::vector<IncludeStats> by_size;
};

// Reduces per-file include contributions into bounded top-N rankings.
// Pure: no I/O, no shared state.
class IncludeAggregator {
public:
    static constexpr size_t kDefaultTopN  = 10;
    static constexpr size_t kDefaultDepth = 3;

    static IncludeRankings aggregate(const std::vector<IncludeContribution>& contributions,
                                     size_t top_n = kDefaultTopN);

    // Parent directory of include_path, cut to at most `depth` components
    // (0 keeps the whole directory).
    static std::string prefix_of(const std::string& include_path,
                                 size_t depth = kDefaultDepth);

    static std::vector<IncludeContribution>
    contributions_from(const std::vector<std::pair<std::string, uint64_t>>& files,
                       size_t depth = kDefaultDepth);
};
