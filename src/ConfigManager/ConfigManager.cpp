// === ConfigManager.cpp ===
#include "ConfigManager.hpp"
#include "StatsErrors.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>
using nlohmann::json;

static const char* kDefaultDbName = "tu_stats.db";
static const char* kToolDirName   = "tustat";

// Desc: read an environment variable, treating empty as unset
// In: const char* name
// Out: std::string (empty when unset)
static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        #ifdef DEBUG
        std::cerr << "[ConfigManager] no config at " << config_path << ", using defaults\n";
        #endif
        return true;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_(ss.str(), config_path);
}

bool ConfigManager::loadFromString(const std::string& json_text) {
    return parse_(json_text, "<string>");
}

bool ConfigManager::parse_(const std::string& text, const std::string& origin) {
    json j;
    try { j = json::parse(text); }
    catch (const std::exception& e) { std::cerr << "[ConfigManager] invalid JSON in " << origin << ": " << e.what() << "\n"; return false; }

    if (!j.is_object()) { std::cerr << "[ConfigManager] top level of " << origin << " must be an object\n"; return false; }

    // translation_unit_stats
    TuStatsConfig tu;
    if (j.contains("translation_unit_stats")) {
        const auto& s = j["translation_unit_stats"];
        if (!s.is_object()) { std::cerr << "[ConfigManager] 'translation_unit_stats' must be an object\n"; return false; }

        if (s.contains("enabled")) {
            if (!s["enabled"].is_boolean()) { std::cerr << "[ConfigManager] 'translation_unit_stats.enabled' must be boolean\n"; return false; }
            tu.enabled = s["enabled"].get<bool>();
        }
        if (s.contains("stats_file") && !s["stats_file"].is_null()) {
            if (!s["stats_file"].is_string()) { std::cerr << "[ConfigManager] 'translation_unit_stats.stats_file' must be a string\n"; return false; }
            std::string p = s["stats_file"].get<std::string>();
            if (p.empty()) { std::cerr << "[ConfigManager] 'translation_unit_stats.stats_file' must be non-empty\n"; return false; }
            tu.stats_file = p;
        }
    }

    // log_file
    std::string log_path = log_file_;
    if (j.contains("log_file")) {
        if (!j["log_file"].is_string() || j["log_file"].get<std::string>().empty()) {
            std::cerr << "[ConfigManager] 'log_file' must be a non-empty string\n";
            return false;
        }
        log_path = j["log_file"].get<std::string>();
    }

    // top_n
    std::size_t top_n = top_n_;
    if (j.contains("top_n")) {
        if (!j["top_n"].is_number_unsigned() || j["top_n"].get<uint64_t>() == 0) {
            std::cerr << "[ConfigManager] 'top_n' must be a positive integer\n";
            return false;
        }
        top_n = static_cast<std::size_t>(j["top_n"].get<uint64_t>());
    }

    tu_stats_ = tu;
    log_file_ = log_path;
    top_n_    = top_n;
    return true;
}

// Desc: resolve the tool cache directory from the environment
// In: (none)
// Out: std::string; throws ConfigResolutionError
std::string ConfigManager::default_cache_dir() {
    namespace fs = std::filesystem;
    const std::string explicit_dir = env_or_empty("TUSTAT_CACHE_DIR");
    if (!explicit_dir.empty()) return explicit_dir;

    const std::string xdg = env_or_empty("XDG_CACHE_HOME");
    if (!xdg.empty()) return (fs::path(xdg) / kToolDirName).string();

    const std::string home = env_or_empty("HOME");
    if (!home.empty()) return (fs::path(home) / ".cache" / kToolDirName).string();

    throw ConfigResolutionError("cannot resolve cache directory: none of TUSTAT_CACHE_DIR, XDG_CACHE_HOME, HOME is set");
}

// Desc: pick the stats database path for a config
// In: const TuStatsConfig& cfg
// Out: std::string; throws ConfigResolutionError
std::string ConfigManager::resolve_stats_path(const TuStatsConfig& cfg) {
    if (cfg.stats_file) return *cfg.stats_file;
    return (std::filesystem::path(default_cache_dir()) / kDefaultDbName).string();
}
