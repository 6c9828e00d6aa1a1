#include "core/engine_bootstrap.h"

#include <system_error>
#include <utility>

#include "utils/logger.h"

namespace fs = std::filesystem;

namespace wcache {

const char* to_string(BootstrapState state) {
    switch (state) {
        case BootstrapState::Init:
            return "init";
        case BootstrapState::MemoryChecked:
            return "memory_checked";
        case BootstrapState::Downgraded:
            return "downgraded";
        case BootstrapState::Validated:
            return "validated";
        case BootstrapState::Ready:
            return "ready";
        case BootstrapState::Failed:
            return "failed";
    }
    return "unknown";
}

EngineBootstrap::EngineBootstrap(ModelCacheManager& cache,
                                 const ModelCatalog& catalog,
                                 MemoryProvider memory,
                                 double budget_ratio,
                                 uint32_t recovery_retries,
                                 std::shared_ptr<spdlog::logger> log)
    : cache_(cache),
      catalog_(catalog),
      memory_(std::move(memory)),
      budget_ratio_(budget_ratio),
      recovery_retries_(recovery_retries),
      log_(logger::or_default(std::move(log))) {}

CacheResult<ActiveModel> EngineBootstrap::bootstrap(ModelId requested) {
    return run(requested, true);
}

CacheResult<ActiveModel> EngineBootstrap::switchModel(ModelId tier) {
    return run(tier, false);
}

std::future<CacheResult<ActiveModel>> EngineBootstrap::bootstrapAsync(ModelId requested) {
    return std::async(std::launch::async, [this, requested]() { return bootstrap(requested); });
}

std::future<CacheResult<ActiveModel>> EngineBootstrap::switchModelAsync(ModelId tier) {
    return std::async(std::launch::async, [this, tier]() { return switchModel(tier); });
}

CacheResult<ActiveModel> EngineBootstrap::ensureReady(ModelId id, bool check_memory) {
    return check_memory ? bootstrap(id) : switchModel(id);
}

bool EngineBootstrap::isTierAvailable(ModelId id) const {
    return cache_.isAvailable(catalog_.entryFor(id), false);
}

std::set<ModelId> EngineBootstrap::cachedTiers() const {
    return cache_.availableModels(catalog_);
}

std::optional<ActiveModel> EngineBootstrap::active() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return active_;
}

BootstrapState EngineBootstrap::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::vector<BootstrapState> EngineBootstrap::history() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return history_;
}

void EngineBootstrap::transition(BootstrapState next) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = next;
    history_.push_back(next);
}

CacheResult<ActiveModel> EngineBootstrap::fail(CacheError error) {
    transition(BootstrapState::Failed);
    log_->error("Bootstrap: failed kind={} model={} msg={}", to_string(error.kind),
                error.model ? toString(*error.model) : "-", error.message);
    return CacheResult<ActiveModel>::failure(std::move(error));
}

CacheResult<ActiveModel> EngineBootstrap::run(ModelId requested, bool check_memory) {
    std::lock_guard<std::mutex> run_lock(run_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = BootstrapState::Init;
        history_.assign(1, BootstrapState::Init);
    }

    const CatalogEntry* entry = &catalog_.entryFor(requested);
    bool downgraded = false;
    log_->info("Bootstrap: requested model={} memory_check={}", toString(requested), check_memory);

    if (check_memory) {
        const MemoryInfo info = memory_ ? memory_() : MemoryInfo{};
        transition(BootstrapState::MemoryChecked);
        if (info.totalBytes() == 0) {
            log_->warn("Bootstrap: system memory unknown, skipping budget check");
        } else {
            const uint64_t budget_mb = memoryBudgetMb(info, budget_ratio_);
            log_->info("Bootstrap: ram={}MB swap={}MB budget={}MB", info.total_ram_bytes / (1024 * 1024),
                       info.total_swap_bytes / (1024 * 1024), budget_mb);
            while (catalog_.memoryUsageMb(*entry) > budget_mb) {
                const auto next = ModelCatalog::downgradeTarget(entry->id);
                if (!next) {
                    CacheError err;
                    err.kind = CacheErrorKind::InsufficientMemory;
                    err.model = entry->id;
                    err.message = std::string(toString(entry->id)) + " needs " +
                                  std::to_string(catalog_.memoryUsageMb(*entry)) + " MB, budget is " +
                                  std::to_string(budget_mb) + " MB";
                    return fail(std::move(err));
                }
                log_->warn("Bootstrap: {} needs {}MB over budget {}MB, downgrading to {}", toString(entry->id),
                           catalog_.memoryUsageMb(*entry), budget_mb, toString(*next));
                entry = &catalog_.entryFor(*next);
                downgraded = true;
                transition(BootstrapState::Downgraded);
            }
        }
    }

    const fs::path path = cache_.modelPath(*entry);
    if (!cache_.isAvailable(*entry, true)) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            log_->warn("Bootstrap: model missing model={} path='{}'", toString(entry->id), path.string());
            CacheError err;
            err.kind = CacheErrorKind::ModelNotFound;
            err.model = entry->id;
            err.message = "no cached file at " + path.string();
            return fail(std::move(err));
        }

        log_->warn("Bootstrap: corruption detected model={}, re-downloading (retries={})", toString(entry->id),
                   recovery_retries_);
        auto recovered = cache_.downloadModelWithRetry(*entry, recovery_retries_);
        if (!recovered.ok()) {
            return fail(std::move(recovered.error));
        }
        if (!cache_.isAvailable(*entry, true)) {
            CacheError err;
            err.kind = CacheErrorKind::Corruption;
            err.model = entry->id;
            err.message = "file still invalid after re-download: " + path.string();
            return fail(std::move(err));
        }
    }
    transition(BootstrapState::Validated);

    ActiveModel selected{*entry, path, requested, downgraded};
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_ = selected;
    }
    transition(BootstrapState::Ready);
    log_->info("Bootstrap: ready model={} downgraded={} path='{}'", toString(entry->id), downgraded, path.string());
    return CacheResult<ActiveModel>::success(std::move(selected));
}

}  // namespace wcache
