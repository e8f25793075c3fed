#include "CompilationInput.hpp"
#include "IncludeAggregator.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
using nlohmann::json;

// Desc: read an optional unsigned field, rejecting other types
// In: const json& j, const char* name
// Out: uint64_t (0 when absent); throws on bad type
static uint64_t opt_u64(const json& j, const char* name) {
    if (!j.contains(name)) return 0;
    if (!j[name].is_number_unsigned()) {
        throw std::runtime_error(std::string("'") + name + "' must be a non-negative integer");
    }
    return j[name].get<uint64_t>();
}

// Desc: read an optional millisecond field bounded by the nanosecond range
// In: const json& j, const char* name
// Out: std::chrono::milliseconds; throws when out of range
static std::chrono::milliseconds opt_ms(const json& j, const char* name) {
    static const uint64_t kMaxMs =
        static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(Nanos::max()).count());
    const uint64_t ms = opt_u64(j, name);
    if (ms > kMaxMs) throw std::runtime_error(std::string("'") + name + "' out of range");
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
}

StatsRecord stats_record_from_compilation(const std::string& json_text,
                                          std::size_t top_n,
                                          WallClock::time_point when) {
    json j;
    try { j = json::parse(json_text); }
    catch (const json::exception& e) { throw std::runtime_error(std::string("invalid JSON: ") + e.what()); }
    if (!j.is_object()) throw std::runtime_error("compilation description must be an object");

    if (!j.contains("input_file") || !j["input_file"].is_string() || j["input_file"].get<std::string>().empty()) {
        throw std::runtime_error("'input_file' must be a non-empty string");
    }

    std::vector<std::pair<std::string, uint64_t>> files;
    if (j.contains("includes")) {
        if (!j["includes"].is_array()) throw std::runtime_error("'includes' must be an array");
        for (const auto& inc : j["includes"]) {
            if (!inc.is_object() || !inc.contains("path") || !inc["path"].is_string()) {
                throw std::runtime_error("each include needs a string 'path'");
            }
            files.emplace_back(inc["path"].get<std::string>(), opt_u64(inc, "size"));
        }
    }

    const uint64_t retries = opt_u64(j, "dist_retry_count");
    if (retries > UINT32_MAX) throw std::runtime_error("'dist_retry_count' out of range");

    bool distributed = false;
    if (j.contains("is_distributed")) {
        if (!j["is_distributed"].is_boolean()) throw std::runtime_error("'is_distributed' must be boolean");
        distributed = j["is_distributed"].get<bool>();
    }

    const IncludeRankings ranks =
        IncludeAggregator::aggregate(IncludeAggregator::contributions_from(files), top_n);

    StatsRecord rec;
    rec.input_file            = j["input_file"].get<std::string>();
    rec.preprocessed_size     = opt_u64(j, "preprocessed_size");
    rec.num_includes          = files.size();
    rec.preprocess_duration   = opt_ms(j, "preprocess_ms");
    rec.compile_duration      = opt_ms(j, "compile_ms");
    rec.dist_retry_count      = static_cast<uint32_t>(retries);
    rec.is_distributed        = distributed;
    rec.top_includes_by_count = ranks.by_count;
    rec.top_includes_by_size  = ranks.by_size;
    rec.timestamp             = when;
    return rec;
}
