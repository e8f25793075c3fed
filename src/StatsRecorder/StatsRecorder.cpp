#include "StatsRecorder.hpp"
#include "StatsStore.hpp"
#include "StatsErrors.hpp"
#include "Logger.hpp"

#include <memory>
#include <mutex>

namespace {
    std::mutex                  g_mtx;
    std::shared_ptr<StatsStore> g_store;
}

namespace TuStatsRecorder {

// Desc: open the configured store and install it as the global sink
// In: const TuStatsConfig& cfg
// Out: void; throws ConfigResolutionError / StorageOpenError
void init(const TuStatsConfig& cfg) {
    if (!cfg.enabled) return;

    const std::string path = ConfigManager::resolve_stats_path(cfg);
    // open outside the lock; only the swap is guarded
    auto store = std::make_shared<StatsStore>(path);
    {
        std::lock_guard<std::mutex> lk(g_mtx);
        g_store = std::move(store);
    }
    log_info("[TuStats] recording to " + path);
}

// Desc: best-effort insert into the global sink
// In: const StatsRecord& rec
// Out: void (errors logged and dropped)
void record(const StatsRecord& rec) noexcept {
    std::shared_ptr<StatsStore> store;
    {
        std::lock_guard<std::mutex> lk(g_mtx);
        store = g_store;
    }
    if (!store) return;

    try {
        store->insert(rec);
    } catch (const std::exception& e) {
        log_warn("[TuStats] failed to record stats for " + rec.input_file + ": " + e.what());
    }
}

bool is_active() {
    std::lock_guard<std::mutex> lk(g_mtx);
    return g_store != nullptr;
}

void shutdown() {
    std::shared_ptr<StatsStore> old;
    {
        std::lock_guard<std::mutex> lk(g_mtx);
        old.swap(g_store);
    }
}

}
