#include "models/model_cache.h"

#include <fstream>
#include <thread>
#include <utility>
#include <vector>

#include "utils/file_lock.h"
#include "utils/logger.h"
#include "utils/sha256.h"
#include "utils/url_encode.h"

namespace fs = std::filesystem;

namespace wcache {

namespace {

constexpr const char* kTempSuffix = ".tmp";
constexpr const char* kLockSuffix = ".lock";

fs::path tempPathFor(const fs::path& final_path) {
    return fs::path(final_path.string() + kTempSuffix);
}

fs::path lockPathFor(const fs::path& final_path) {
    return fs::path(final_path.string() + kLockSuffix);
}

// Last path segment of the URL, decoded. Empty when it could escape the
// cache directory or names nothing.
std::string cacheFilenameFromUrl(const HttpUrl& url) {
    std::string path = url.path;
    const auto query = path.find('?');
    if (query != std::string::npos) path.resize(query);
    const auto slash = path.rfind('/');
    std::string name = urlDecodePathSegment(slash == std::string::npos ? path : path.substr(slash + 1));
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return "";
    }
    return name;
}

CacheError makeError(CacheErrorKind kind, std::string message, int http_status = 0) {
    CacheError err;
    err.kind = kind;
    err.message = std::move(message);
    err.http_status = http_status;
    return err;
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

}  // namespace

ModelCacheManager::ModelCacheManager(fs::path cache_dir,
                                     std::shared_ptr<HttpTransport> transport,
                                     std::shared_ptr<spdlog::logger> log)
    : cache_dir_(std::move(cache_dir)),
      transport_(transport ? std::move(transport) : std::make_shared<HttplibTransport>()),
      log_(logger::or_default(std::move(log))) {}

fs::path ModelCacheManager::modelPath(const CatalogEntry& entry) const {
    return cache_dir_ / entry.cacheFilename();
}

bool ModelCacheManager::isAvailable(const CatalogEntry& entry, bool verify_hash) const {
    const fs::path path = modelPath(entry);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        log_->debug("ModelCache: model missing id={} path='{}'", toString(entry.id), path.string());
        return false;
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        log_->warn("ModelCache: cannot stat path='{}': {}", path.string(), ec.message());
        return false;
    }
    if (size != entry.expected_size_bytes) {
        log_->warn("ModelCache: size mismatch id={} expected={} actual={}",
                   toString(entry.id), entry.expected_size_bytes, size);
        return false;
    }
    if (!verify_hash) return true;

    const std::string actual = sha256_file(path);
    if (actual.empty()) {
        log_->warn("ModelCache: failed to hash path='{}'", path.string());
        return false;
    }
    if (actual != entry.expected_sha256) {
        log_->warn("ModelCache: corruption detected id={} expected_sha256={} actual_sha256={}",
                   toString(entry.id), entry.expected_sha256, actual);
        return false;
    }
    return true;
}

CacheError ModelCacheManager::ensureCacheDir() const {
    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    std::error_code dir_ec;
    if (ec || !fs::is_directory(cache_dir_, dir_ec)) {
        const std::string why = ec ? ec.message() : std::string("not a directory");
        log_->error("ModelCache: cannot create cache dir '{}': {}", cache_dir_.string(), why);
        return makeError(CacheErrorKind::FileSystemError,
                         "cannot create cache directory " + cache_dir_.string() + ": " + why);
    }
    return {};
}

std::shared_ptr<std::mutex> ModelCacheManager::entryMutex(const fs::path& final_path) {
    std::lock_guard<std::mutex> guard(entry_locks_mutex_);
    auto& slot = entry_locks_[final_path.string()];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

CacheResult<fs::path> ModelCacheManager::downloadModel(const std::string& url,
                                                       const std::optional<std::string>& expected_checksum,
                                                       const ProgressCallback& progress) {
    using Result = CacheResult<fs::path>;
    const HttpUrl parsed = parseHttpUrl(url);
    if (!parsed.valid()) {
        log_->error("ModelCache: invalid url '{}'", url);
        return Result::failure(makeError(CacheErrorKind::InvalidUrl, "malformed url: " + url));
    }
    const std::string filename = cacheFilenameFromUrl(parsed);
    if (filename.empty()) {
        log_->error("ModelCache: url names no file '{}'", url);
        return Result::failure(makeError(CacheErrorKind::InvalidUrl, "url does not name a file: " + url));
    }
    if (expected_checksum && !is_sha256_hex(*expected_checksum)) {
        return Result::failure(makeError(CacheErrorKind::Corruption,
                                         "expected checksum is not a sha256 hex digest: " + *expected_checksum));
    }
    if (auto err = ensureCacheDir(); err.kind != CacheErrorKind::None) {
        return Result::failure(std::move(err));
    }

    const fs::path final_path = cache_dir_ / filename;
    auto mutex = entryMutex(final_path);
    std::lock_guard<std::mutex> guard(*mutex);
    FileLock lock(lockPathFor(final_path), FileLock::Mode::Blocking);
    if (!lock.locked()) {
        log_->warn("ModelCache: could not take lock '{}', continuing unlocked", lock.path().string());
    }
    return downloadUnlocked(url, final_path, expected_checksum, 0, progress);
}

CacheResult<fs::path> ModelCacheManager::downloadModelWithRetry(const CatalogEntry& entry,
                                                                uint32_t max_retries,
                                                                const ProgressCallback& progress) {
    using Result = CacheResult<fs::path>;
    const std::string url = entry.remote_url;
    if (!parseHttpUrl(url).valid()) {
        log_->error("ModelCache: invalid url for id={} url='{}'", toString(entry.id), url);
        auto err = makeError(CacheErrorKind::InvalidUrl, "malformed url: " + url);
        err.model = entry.id;
        return Result::failure(std::move(err));
    }
    if (auto err = ensureCacheDir(); err.kind != CacheErrorKind::None) {
        err.model = entry.id;
        return Result::failure(std::move(err));
    }

    const fs::path final_path = modelPath(entry);
    auto mutex = entryMutex(final_path);
    std::lock_guard<std::mutex> guard(*mutex);
    FileLock lock(lockPathFor(final_path), FileLock::Mode::Blocking);
    if (!lock.locked()) {
        log_->warn("ModelCache: could not take lock '{}', continuing unlocked", lock.path().string());
    }

    // Another caller may have finished the same entry while we waited.
    std::error_code ec;
    if (fs::exists(final_path, ec) && isAvailable(entry, true)) {
        log_->info("ModelCache: id={} already valid at '{}', skipping download",
                   toString(entry.id), final_path.string());
        if (progress) progress(entry.expected_size_bytes, entry.expected_size_bytes);
        return Result::success(final_path);
    }

    const uint64_t attempts = static_cast<uint64_t>(max_retries) + 1;
    CacheError last;
    for (uint64_t attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            const auto delay = backoff_ * static_cast<int64_t>(attempt - 1);
            log_->warn("ModelCache: retry attempt {}/{} id={} after {}ms (last error: {} {})",
                       attempt, attempts, toString(entry.id), delay.count(), to_string(last.kind), last.message);
            std::this_thread::sleep_for(delay);
        }
        auto result = downloadUnlocked(url, final_path, entry.expected_sha256, entry.expected_size_bytes, progress);
        if (result.ok()) {
            log_->info("ModelCache: downloaded id={} attempts={} path='{}'",
                       toString(entry.id), attempt, final_path.string());
            return result;
        }
        last = std::move(result.error);
        last.model = entry.id;
        if (!last.retryable()) {
            log_->error("ModelCache: non-retryable failure id={} kind={} msg={}",
                        toString(entry.id), to_string(last.kind), last.message);
            return Result::failure(std::move(last));
        }
    }

    log_->error("ModelCache: download failed id={} attempts={} last_kind={} msg={}",
                toString(entry.id), attempts, to_string(last.kind), last.message);
    CacheError failed;
    failed.kind = CacheErrorKind::DownloadFailed;
    failed.cause = last.kind;
    failed.http_status = last.http_status;
    failed.model = entry.id;
    failed.message = last.message + " (after " + std::to_string(attempts) + " attempts)";
    return Result::failure(std::move(failed));
}

CacheResult<fs::path> ModelCacheManager::downloadUnlocked(const std::string& url,
                                                          const fs::path& final_path,
                                                          const std::optional<std::string>& expected_checksum,
                                                          uint64_t expected_size,
                                                          const ProgressCallback& progress) {
    using Result = CacheResult<fs::path>;
    const fs::path temp_path = tempPathFor(final_path);

    std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        log_->error("ModelCache: cannot open temp file '{}'", temp_path.string());
        return Result::failure(makeError(CacheErrorKind::FileSystemError,
                                         "cannot open temp file " + temp_path.string()));
    }

    log_->info("ModelCache: downloading url='{}' -> '{}'", url, temp_path.string());
    Sha256Stream hasher;
    uint64_t written = 0;
    bool write_failed = false;

    const FetchResult fetched = transport_->fetch(url, [&](const char* data, size_t len) {
        ofs.write(data, static_cast<std::streamsize>(len));
        if (!ofs) {
            write_failed = true;
            return false;
        }
        hasher.update(data, len);
        written += len;
        if (progress) progress(written, expected_size);
        return true;
    });

    ofs.flush();
    if (!ofs) write_failed = true;
    ofs.close();

    if (write_failed) {
        removeQuietly(temp_path);
        log_->error("ModelCache: write failed for '{}' after {} bytes", temp_path.string(), written);
        return Result::failure(makeError(CacheErrorKind::FileSystemError,
                                         "failed writing " + temp_path.string()));
    }

    if (!fetched.ok()) {
        removeQuietly(temp_path);
        switch (fetched.status) {
            case FetchStatus::InvalidUrl:
                log_->error("ModelCache: invalid url '{}': {}", url, fetched.error_message);
                return Result::failure(makeError(CacheErrorKind::InvalidUrl, fetched.error_message));
            case FetchStatus::HttpError:
                log_->warn("ModelCache: HTTP {} for url='{}'", fetched.http_status, url);
                return Result::failure(makeError(CacheErrorKind::NetworkError,
                                                 "HTTP status " + std::to_string(fetched.http_status),
                                                 fetched.http_status));
            default:
                log_->warn("ModelCache: transfer failed url='{}': {}", url, fetched.error_message);
                return Result::failure(makeError(CacheErrorKind::NetworkError, fetched.error_message));
        }
    }

    if (expected_size != 0 && written != expected_size) {
        removeQuietly(temp_path);
        log_->warn("ModelCache: size mismatch for '{}' expected={} actual={}", url, expected_size, written);
        return Result::failure(makeError(CacheErrorKind::Corruption,
                                         "size mismatch: expected " + std::to_string(expected_size) +
                                             " bytes, received " + std::to_string(written)));
    }

    if (expected_checksum) {
        const std::string actual = hasher.finalize();
        if (actual != *expected_checksum) {
            removeQuietly(temp_path);
            log_->warn("ModelCache: checksum mismatch for '{}' expected={} actual={}",
                       url, *expected_checksum, actual);
            return Result::failure(makeError(CacheErrorKind::Corruption,
                                             "checksum mismatch: expected " + *expected_checksum + ", got " +
                                                 actual));
        }
    }

    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec) {
        removeQuietly(temp_path);
        log_->error("ModelCache: rename '{}' -> '{}' failed: {}", temp_path.string(), final_path.string(),
                    ec.message());
        return Result::failure(makeError(CacheErrorKind::FileSystemError,
                                         "cannot move download into place: " + ec.message()));
    }
    if (progress && expected_size == 0) progress(written, written);
    return Result::success(final_path);
}

std::set<ModelId> ModelCacheManager::availableModels(const ModelCatalog& catalog) const {
    std::set<ModelId> out;
    std::error_code ec;
    if (!fs::is_directory(cache_dir_, ec)) return out;
    for (fs::directory_iterator it(cache_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code file_ec;
        if (!it->is_regular_file(file_ec)) continue;
        if (auto id = catalog.idFromCacheFilename(it->path().filename().string())) {
            out.insert(*id);
        }
    }
    if (ec) {
        log_->warn("ModelCache: listing '{}' stopped early: {}", cache_dir_.string(), ec.message());
    }
    return out;
}

CacheResult<bool> ModelCacheManager::removeModel(const CatalogEntry& entry) {
    const fs::path final_path = modelPath(entry);
    auto mutex = entryMutex(final_path);
    std::lock_guard<std::mutex> guard(*mutex);

    std::error_code ec;
    if (!fs::exists(cache_dir_, ec)) return CacheResult<bool>::success(false);
    FileLock lock(lockPathFor(final_path), FileLock::Mode::Blocking);

    bool removed = false;
    for (const auto& path : {final_path, tempPathFor(final_path)}) {
        ec.clear();
        if (fs::remove(path, ec)) {
            removed = true;
        } else if (ec) {
            log_->error("ModelCache: cannot remove '{}': {}", path.string(), ec.message());
            auto err = makeError(CacheErrorKind::FileSystemError, "cannot remove " + path.string() + ": " +
                                                                      ec.message());
            err.model = entry.id;
            return CacheResult<bool>::failure(std::move(err));
        }
    }
    if (removed) log_->info("ModelCache: removed id={}", toString(entry.id));
    return CacheResult<bool>::success(removed);
}

size_t ModelCacheManager::cleanupTempFiles() {
    size_t removed = 0;
    std::error_code ec;
    if (!fs::is_directory(cache_dir_, ec)) return removed;

    std::vector<fs::path> temps;
    for (fs::directory_iterator it(cache_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        const std::string suffix = std::string(".bin") + kTempSuffix;
        if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            temps.push_back(it->path());
        }
    }

    for (const auto& temp : temps) {
        const std::string temp_text = temp.string();
        const fs::path final_path(temp_text.substr(0, temp_text.size() - std::string(kTempSuffix).size()));
        // A held lock means a download is writing this file right now.
        FileLock lock(lockPathFor(final_path), FileLock::Mode::NonBlocking);
        if (!lock.locked()) {
            log_->debug("ModelCache: '{}' is in use, keeping it", temp_text);
            continue;
        }
        std::error_code rm_ec;
        if (fs::remove(temp, rm_ec)) {
            ++removed;
            log_->info("ModelCache: removed orphaned temp file '{}'", temp_text);
        } else if (rm_ec) {
            log_->warn("ModelCache: cannot remove '{}': {}", temp_text, rm_ec.message());
        }
    }
    return removed;
}

}  // namespace wcache
