// requirements.hpp
#pragma once
#include "ConfigManager.hpp"
#include <string>
#include <vector>

struct StartupResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> logs;
    ConfigManager config;
};

class Requirements {
public:
    // Loads config, points the logger at its log file and, when asked,
    // installs the global stats recorder.
    static StartupResult run(const std::string& config_path, bool with_recorder);

private:
    static void ensureDir(const std::string& path, StartupResult& out);
    static bool loadConfig(const std::string& config_path, StartupResult& out);
    static bool initRecorder(StartupResult& out);
};
