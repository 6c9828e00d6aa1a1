// EngineBootstrap - picks a model tier that fits the memory budget and makes
// sure its file is present and valid before an engine loads it.
#pragma once

#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>
#include <spdlog/logger.h>

#include "models/cache_error.h"
#include "models/model_cache.h"
#include "models/model_catalog.h"
#include "system/memory_inspector.h"

namespace wcache {

enum class BootstrapState {
    Init,
    MemoryChecked,
    Downgraded,
    Validated,
    Ready,
    Failed,
};

const char* to_string(BootstrapState state);

struct ActiveModel {
    CatalogEntry entry;
    std::filesystem::path path;
    ModelId requested{ModelId::Tiny};
    bool downgraded{false};
};

class EngineBootstrap {
public:
    EngineBootstrap(ModelCacheManager& cache,
                    const ModelCatalog& catalog,
                    MemoryProvider memory = sampleSystemMemory,
                    double budget_ratio = 0.75,
                    uint32_t recovery_retries = 2,
                    std::shared_ptr<spdlog::logger> log = nullptr);

    // Init -> MemoryChecked -> {Downgraded}* -> Validated -> Ready, or Failed.
    // A missing file is ModelNotFound (no download on this path); a corrupt
    // one is re-downloaded with recovery_retries.
    CacheResult<ActiveModel> bootstrap(ModelId requested);

    // Same as bootstrap() without the memory budget check.
    CacheResult<ActiveModel> switchModel(ModelId tier);

    // Run on a worker thread. The EngineBootstrap must outlive the future.
    std::future<CacheResult<ActiveModel>> bootstrapAsync(ModelId requested);
    std::future<CacheResult<ActiveModel>> switchModelAsync(ModelId tier);

    // bootstrap(id) when check_memory, else switchModel(id).
    CacheResult<ActiveModel> ensureReady(ModelId id, bool check_memory = true);
    bool isTierAvailable(ModelId id) const;
    std::set<ModelId> cachedTiers() const;

    std::optional<ActiveModel> active() const;
    BootstrapState state() const;
    std::vector<BootstrapState> history() const;

private:
    CacheResult<ActiveModel> run(ModelId requested, bool check_memory);
    CacheResult<ActiveModel> fail(CacheError error);
    void transition(BootstrapState next);

    ModelCacheManager& cache_;
    const ModelCatalog& catalog_;
    MemoryProvider memory_;
    double budget_ratio_;
    uint32_t recovery_retries_;
    std::shared_ptr<spdlog::logger> log_;

    std::mutex run_mutex_;  // one attempt at a time
    mutable std::mutex state_mutex_;
    BootstrapState state_{BootstrapState::Init};
    std::vector<BootstrapState> history_;
    std::optional<ActiveModel> active_;
};

}  // namespace wcache
