// requirements.cpp
#include "requirements.hpp"
#include "Logger.hpp"
#include "StatsErrors.hpp"
#include "StatsRecorder.hpp"

#include <filesystem>


// Desc: create directory if missing and record status
// In: const std::string& path, StartupResult& out
// Out: void
void Requirements::ensureDir(const std::string& path, StartupResult& out) {
    if (path.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        out.logs.push_back("[ensureDir] failed: " + path + " (" + ec.message() + ")");
        return;
    }
    out.logs.push_back("[ensureDir] ok: " + path);
}

// Desc: load JSON config into StartupResult::config
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    if (!out.config.loadFromFile(config_path)) {
        out.error = "[config] failed to load " + config_path;
        out.logs.push_back(out.error);
        return false;
    }
    const TuStatsConfig& tu = out.config.getTuStatsConfig();
    out.logs.push_back("[config] loaded: " + config_path);
    out.logs.push_back(std::string("[config] translation_unit_stats.enabled: ") + (tu.enabled ? "true" : "false"));
    if (tu.stats_file) out.logs.push_back("[config] translation_unit_stats.stats_file: " + *tu.stats_file);
    return true;
}

// Desc: install the global recorder from config
// In: StartupResult& out
// Out: bool (true on success or when disabled)
bool Requirements::initRecorder(StartupResult& out) {
    try {
        TuStatsRecorder::init(out.config.getTuStatsConfig());
    } catch (const TuStatsError& e) {
        out.error = std::string("[recorder] ") + e.what();
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back(TuStatsRecorder::is_active() ? "[recorder] active" : "[recorder] disabled");
    return true;
}


// Desc: orchestrate startup: config, logging, recorder; log results
// In: const std::string& config_path, bool with_recorder
// Out: StartupResult
StartupResult Requirements::run(const std::string& config_path, bool with_recorder) {
    StartupResult res;

    // 1) config load
    const bool loaded = loadConfig(config_path, res);

    // 2) log destination (defaults when the config failed)
    const std::string log_path = res.config.getLogFile();
    ensureDir(std::filesystem::path(log_path).parent_path().string(), res);
    set_log_file(log_path);

    if (!loaded) {
        for (auto& l : res.logs) log_info(l);
        return res;
    }

    // 3) recorder
    if (with_recorder && !initRecorder(res)) {
        for (auto& l : res.logs) log_info(l);
        return res;
    }

    // Ok
    res.ok = true;
    for (auto& l : res.logs) log_info(l);
    return res;
}
