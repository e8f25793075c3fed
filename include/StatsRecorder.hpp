#pragma once
#include "ConfigManager.hpp"
#include "StatsRecord.hpp"

// Process-wide recording sink for translation-unit stats.
//
// init() is meant to run once at startup; a second call replaces the
// installed store. record() is fire-and-forget: failures are logged and
// never reach the caller.
namespace TuStatsRecorder {

// No-op when cfg.enabled is false. Throws ConfigResolutionError or
// StorageOpenError; on failure the previous sink (if any) stays installed.
void init(const TuStatsConfig& cfg);

void record(const StatsRecord& rec) noexcept;

bool is_active();

// Drops the installed sink. The store closes once no record() is using it.
void shutdown();

}
