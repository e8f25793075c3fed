#pragma once
#include "StatsRecord.hpp"
#include <cstddef>
#include <string>

// Builds a StatsRecord from a JSON compilation description:
//   { "input_file", "preprocessed_size", "preprocess_ms", "compile_ms",
//     "dist_retry_count", "is_distributed", "includes": [{"path","size"}] }
// num_includes is the length of "includes"; rankings come from
// IncludeAggregator. Throws std::runtime_error on malformed input.
StatsRecord stats_record_from_compilation(const std::string& json_text,
                                          std::size_t top_n,
                                          WallClock::time_point when);
