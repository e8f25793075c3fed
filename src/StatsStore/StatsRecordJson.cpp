#include "StatsRecordJson.hpp"
#include "StatsErrors.hpp"
#include <cstdint>
#include <stdexcept>
#include <nlohmann/json.hpp>
using nlohmann::json;

static constexpr int64_t kNanosPerSec = 1000000000LL;

// Desc: encode a non-negative nanosecond count as {secs, nanos}
// In: int64_t ns, const char* secs_key, const char* nanos_key
// Out: json object
static json split_nanos(int64_t ns, const char* secs_key, const char* nanos_key) {
    json j;
    j[secs_key]  = static_cast<uint64_t>(ns / kNanosPerSec);
    j[nanos_key] = static_cast<uint32_t>(ns % kNanosPerSec);
    return j;
}

static json includes_to_json(const std::vector<IncludeStats>& v) {
    json arr = json::array();
    for (const auto& s : v) {
        arr.push_back({{"path_prefix", s.path_prefix}, {"count", s.count}, {"lines", s.lines}});
    }
    return arr;
}

std::string serialize_stats_record(const StatsRecord& rec) {
    const int64_t pp_ns = rec.preprocess_duration.count();
    const int64_t cc_ns = rec.compile_duration.count();
    const int64_t ts_ns = std::chrono::duration_cast<Nanos>(rec.timestamp.time_since_epoch()).count();
    if (pp_ns < 0 || cc_ns < 0) {
        throw StorageWriteError("cannot serialize stats for " + rec.input_file + ": negative duration");
    }
    if (ts_ns < 0) {
        throw StorageWriteError("cannot serialize stats for " + rec.input_file + ": timestamp before epoch");
    }

    json j;
    j["input_file"]            = rec.input_file;
    j["preprocessed_size"]     = rec.preprocessed_size;
    j["num_includes"]          = rec.num_includes;
    j["preprocess_duration"]   = split_nanos(pp_ns, "secs", "nanos");
    j["compile_duration"]      = split_nanos(cc_ns, "secs", "nanos");
    j["dist_retry_count"]      = rec.dist_retry_count;
    j["is_distributed"]        = rec.is_distributed;
    j["top_includes_by_count"] = includes_to_json(rec.top_includes_by_count);
    j["top_includes_by_size"]  = includes_to_json(rec.top_includes_by_size);
    j["timestamp"]             = split_nanos(ts_ns, "secs_since_epoch", "nanos_since_epoch");

    try {
        return j.dump();
    } catch (const json::exception& e) {
        // invalid UTF-8 in input_file or a prefix
        throw StorageWriteError("cannot serialize stats for " + rec.input_file + ": " + e.what());
    }
}

// ---- read side: every field optional, but a present field must have the right type ----

static uint64_t read_u64(const json& j, const char* name, uint64_t def = 0) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) return def;
    if (!it->is_number_unsigned()) throw std::runtime_error(std::string("field '") + name + "' is not an unsigned integer");
    return it->get<uint64_t>();
}

static bool read_bool(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) return false;
    if (!it->is_boolean()) throw std::runtime_error(std::string("field '") + name + "' is not a boolean");
    return it->get<bool>();
}

static std::string read_string(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) return std::string();
    if (!it->is_string()) throw std::runtime_error(std::string("field '") + name + "' is not a string");
    return it->get<std::string>();
}

static int64_t read_split_nanos(const json& j, const char* name, const char* secs_key, const char* nanos_key) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) return 0;
    if (!it->is_object()) throw std::runtime_error(std::string("field '") + name + "' is not an object");
    const uint64_t secs  = read_u64(*it, secs_key);
    const uint64_t nanos = read_u64(*it, nanos_key);
    if (nanos >= static_cast<uint64_t>(kNanosPerSec)) {
        throw std::runtime_error(std::string("field '") + name + "' has nanos out of range");
    }
    if (secs > static_cast<uint64_t>(INT64_MAX / kNanosPerSec) - 1) {
        throw std::runtime_error(std::string("field '") + name + "' overflows");
    }
    return static_cast<int64_t>(secs) * kNanosPerSec + static_cast<int64_t>(nanos);
}

static std::vector<IncludeStats> read_includes(const json& j, const char* name) {
    std::vector<IncludeStats> out;
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) return out;
    if (!it->is_array()) throw std::runtime_error(std::string("field '") + name + "' is not an array");
    out.reserve(it->size());
    for (const auto& e : *it) {
        if (!e.is_object()) throw std::runtime_error(std::string("entry of '") + name + "' is not an object");
        out.push_back(IncludeStats{read_string(e, "path_prefix"), read_u64(e, "count"), read_u64(e, "lines")});
    }
    return out;
}

StatsRecord deserialize_stats_record(const std::string& text, const std::string& key) {
    json j;
    try { j = json::parse(text); }
    catch (const json::exception& e) {
        throw StorageReadError("corrupt stats entry '" + key + "': " + e.what());
    }
    if (!j.is_object()) {
        throw StorageReadError("corrupt stats entry '" + key + "': value is not an object");
    }

    try {
        StatsRecord rec;
        rec.input_file            = read_string(j, "input_file");
        rec.preprocessed_size     = read_u64(j, "preprocessed_size");
        rec.num_includes          = read_u64(j, "num_includes");
        rec.preprocess_duration   = Nanos(read_split_nanos(j, "preprocess_duration", "secs", "nanos"));
        rec.compile_duration      = Nanos(read_split_nanos(j, "compile_duration", "secs", "nanos"));
        const uint64_t retries    = read_u64(j, "dist_retry_count");
        if (retries > UINT32_MAX) throw std::runtime_error("field 'dist_retry_count' overflows");
        rec.dist_retry_count      = static_cast<uint32_t>(retries);
        rec.is_distributed        = read_bool(j, "is_distributed");
        rec.top_includes_by_count = read_includes(j, "top_includes_by_count");
        rec.top_includes_by_size  = read_includes(j, "top_includes_by_size");
        rec.timestamp = WallClock::time_point(std::chrono::duration_cast<WallClock::duration>(
            Nanos(read_split_nanos(j, "timestamp", "secs_since_epoch", "nanos_since_epoch"))));
        return rec;
    } catch (const std::exception& e) {
        throw StorageReadError("corrupt stats entry '" + key + "': " + e.what());
    }
}
