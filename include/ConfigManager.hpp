// include/ConfigManager.hpp
#pragma once
#include <cstddef>
#include <optional>
#include <string>

// The slice of tool configuration the stats subsystem consumes.
struct TuStatsConfig {
    bool enabled = false;
    std::optional<std::string> stats_file;
};

class ConfigManager {
public:
    explicit ConfigManager() = default;

    // A missing file keeps defaults and returns true; malformed content returns false.
    bool loadFromFile(const std::string& config_path);
    bool loadFromString(const std::string& json_text);

    const TuStatsConfig& getTuStatsConfig() const { return tu_stats_; }
    const std::string&   getLogFile()       const { return log_file_; }
    std::size_t          getTopN()          const { return top_n_; }

    void setTuStatsConfig(const TuStatsConfig& cfg) { tu_stats_ = cfg; }

    // $TUSTAT_CACHE_DIR, $XDG_CACHE_HOME/tustat or $HOME/.cache/tustat.
    // Throws ConfigResolutionError when none is set.
    static std::string default_cache_dir();
    // cfg.stats_file, else <default_cache_dir()>/tu_stats.db
    static std::string resolve_stats_path(const TuStatsConfig& cfg);

private:
    bool parse_(const std::string& text, const std::string& origin);

    TuStatsConfig tu_stats_;
    std::string   log_file_ = "logs/tustat.log";
    std::size_t   top_n_    = 10;
};
