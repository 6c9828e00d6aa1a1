// ModelCacheManager - presence, integrity and download of cached model files.
//
// Layout (owned exclusively by this class):
//   <cache_dir>/ggml-<filename>.bin        validated artifact
//   <cache_dir>/ggml-<filename>.bin.tmp    download in progress
//   <cache_dir>/ggml-<filename>.bin.lock   per-entry advisory lock
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <spdlog/logger.h>

#include "models/cache_error.h"
#include "models/http_transport.h"
#include "models/model_catalog.h"

namespace wcache {

// downloaded / total bytes. total is 0 when the size is not known up front.
using ProgressCallback = std::function<void(uint64_t downloaded, uint64_t total)>;

class ModelCacheManager {
public:
    // transport defaults to HttplibTransport, log to the process-wide logger.
    explicit ModelCacheManager(std::filesystem::path cache_dir,
                               std::shared_ptr<HttpTransport> transport = nullptr,
                               std::shared_ptr<spdlog::logger> log = nullptr);

    ModelCacheManager(const ModelCacheManager&) = delete;
    ModelCacheManager& operator=(const ModelCacheManager&) = delete;

    // Existence + size, plus a streamed SHA-256 comparison when verify_hash.
    // Read-only; safe to call concurrently.
    bool isAvailable(const CatalogEntry& entry, bool verify_hash) const;

    // Streams url into a temp file, verifies expected_checksum when given, then
    // renames over <cache_dir>/<last url path segment>. One attempt.
    CacheResult<std::filesystem::path> downloadModel(const std::string& url,
                                                     const std::optional<std::string>& expected_checksum,
                                                     const ProgressCallback& progress = {});

    // downloadModel with the entry's URL, digest and size. NetworkError and
    // Corruption are retried; after max_retries + 1 attempts the result is
    // DownloadFailed with cause set to the last error kind. InvalidUrl and
    // FileSystemError are returned immediately.
    // Returns without transferring when a concurrent caller already produced
    // a valid file.
    CacheResult<std::filesystem::path> downloadModelWithRetry(const CatalogEntry& entry,
                                                              uint32_t max_retries,
                                                              const ProgressCallback& progress = {});

    // Ids whose final file exists (no hash verification).
    std::set<ModelId> availableModels(const ModelCatalog& catalog) const;

    std::filesystem::path modelPath(const CatalogEntry& entry) const;
    const std::filesystem::path& cacheDir() const { return cache_dir_; }

    // Deletes the final file and any temp file. data is true if a file was removed.
    CacheResult<bool> removeModel(const CatalogEntry& entry);

    // Removes orphaned *.bin.tmp files whose entry lock is free. Returns the count.
    size_t cleanupTempFiles();

    // Delay unit between attempts; attempt N waits backoff * (N - 1).
    void setBackoff(std::chrono::milliseconds backoff) { backoff_ = backoff; }
    std::chrono::milliseconds backoff() const { return backoff_; }

private:
    CacheResult<std::filesystem::path> downloadUnlocked(const std::string& url,
                                                        const std::filesystem::path& final_path,
                                                        const std::optional<std::string>& expected_checksum,
                                                        uint64_t expected_size,
                                                        const ProgressCallback& progress);
    CacheError ensureCacheDir() const;
    std::shared_ptr<std::mutex> entryMutex(const std::filesystem::path& final_path);

    std::filesystem::path cache_dir_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<spdlog::logger> log_;
    std::chrono::milliseconds backoff_{500};

    std::mutex entry_locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> entry_locks_;
};

}  // namespace wcache
