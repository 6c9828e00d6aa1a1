#include "models/catalog_updater.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>
#include <vector>

#include "utils/logger.h"
#include "utils/sha256.h"
#include "utils/url_encode.h"

namespace wcache {

namespace {

void setError(std::string* error, std::string message) {
    if (error) *error = std::move(message);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Pointer files are ~130 bytes; anything much larger is the blob itself.
constexpr size_t kMaxPointerBytes = 1024;

}  // namespace

std::optional<LfsPointer> parseLfsPointer(const std::string& text) {
    static const std::string kOid = "oid sha256:";
    static const std::string kSize = "size ";
    LfsPointer out;
    bool has_size = false;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.compare(0, kOid.size(), kOid) == 0) {
            out.sha256 = toLower(line.substr(kOid.size()));
        } else if (line.compare(0, kSize.size(), kSize) == 0) {
            const std::string digits = line.substr(kSize.size());
            if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                               [](unsigned char c) { return std::isdigit(c) != 0; })) {
                return std::nullopt;
            }
            try {
                out.size = std::stoull(digits);
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
            has_size = true;
        }
    }
    if (!is_sha256_hex(out.sha256) || !has_size || out.size == 0) return std::nullopt;
    return out;
}

CatalogUpdater::CatalogUpdater(std::shared_ptr<HttpTransport> transport, std::shared_ptr<spdlog::logger> log)
    : transport_(transport ? std::move(transport) : std::make_shared<HttplibTransport>()),
      log_(logger::or_default(std::move(log))) {}

std::string CatalogUpdater::treeUrl(const RemoteSource& source) {
    std::string out = source.base_url;
    while (!out.empty() && out.back() == '/') out.pop_back();
    out += "/api/models/";
    out += urlEncodePath(source.repo);
    out += "/tree/";
    out += urlEncodePathSegment(source.git_ref);
    return out;
}

std::string CatalogUpdater::rawUrl(const RemoteSource& source, const std::string& path) {
    std::string out = source.base_url;
    while (!out.empty() && out.back() == '/') out.pop_back();
    out += "/";
    out += urlEncodePath(source.repo);
    out += "/raw/";
    out += urlEncodePathSegment(source.git_ref);
    out += "/";
    out += urlEncodePath(path);
    return out;
}

std::optional<nlohmann::json> CatalogUpdater::buildCatalogDocument(const nlohmann::json& listing,
                                                                   const RemoteSource& source,
                                                                   const ModelCatalog& catalog,
                                                                   std::string* error) {
    if (!listing.is_array()) {
        setError(error, "tree listing must be a JSON array");
        return std::nullopt;
    }

    std::vector<nlohmann::json> models;
    for (const auto& item : listing) {
        if (!item.is_object()) continue;
        if (item.value("type", std::string()) != "file") continue;
        const std::string path = item.value("path", std::string());
        const auto id = catalog.idFromCacheFilename(path);
        if (!id) continue;

        const auto lfs = item.find("lfs");
        if (lfs == item.end() || !lfs->is_object()) {
            setError(error, path + " has no LFS metadata");
            return std::nullopt;
        }
        const std::string oid = toLower(lfs->value("oid", std::string()));
        if (!is_sha256_hex(oid)) {
            setError(error, path + " has a malformed LFS oid");
            return std::nullopt;
        }
        const auto size_it = lfs->find("size");
        if (size_it == lfs->end() || !size_it->is_number_unsigned()) {
            setError(error, path + " has no LFS size");
            return std::nullopt;
        }
        const auto& entry = catalog.entryFor(*id);
        nlohmann::json model = {{"id", entry.filename},
                                {"filename", path},
                                {"sha256", oid},
                                {"size", size_it->get<uint64_t>()},
                                {"memory_mb", entry.approx_memory_mb}};
        models.push_back(std::move(model));
    }

    if (models.empty()) {
        setError(error, "tree listing names no known model files");
        return std::nullopt;
    }
    std::sort(models.begin(), models.end(), [&](const nlohmann::json& a, const nlohmann::json& b) {
        return static_cast<int>(*catalog.idFromName(a["id"].get<std::string>())) <
               static_cast<int>(*catalog.idFromName(b["id"].get<std::string>()));
    });

    nlohmann::json doc;
    doc["base_url"] = source.base_url;
    doc["repo"] = source.repo;
    doc["git_ref"] = source.git_ref;
    doc["models"] = models;
    return doc;
}

CacheResult<nlohmann::json> CatalogUpdater::refresh(const RemoteSource& source, const ModelCatalog& catalog) {
    using Result = CacheResult<nlohmann::json>;
    const std::string url = treeUrl(source);
    log_->info("CatalogUpdater: fetching tree listing url='{}'", url);

    std::string body;
    const FetchResult fetched = fetchText(*transport_, url, body);
    if (!fetched.ok()) {
        log_->warn("CatalogUpdater: fetch failed url='{}': {}", url, fetched.error_message);
        CacheError err;
        err.kind = fetched.status == FetchStatus::InvalidUrl ? CacheErrorKind::InvalidUrl
                                                              : CacheErrorKind::NetworkError;
        err.http_status = fetched.http_status;
        err.message = fetched.error_message;
        return Result::failure(std::move(err));
    }

    nlohmann::json listing;
    try {
        listing = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        log_->warn("CatalogUpdater: listing is not JSON: {}", e.what());
        return Result::failure(CacheErrorKind::Corruption, std::string("tree listing is not JSON: ") + e.what());
    }

    if (listing.is_array()) {
        for (auto& item : listing) {
            if (!item.is_object() || item.value("type", std::string()) != "file") continue;
            const std::string path = item.value("path", std::string());
            if (!catalog.idFromCacheFilename(path)) continue;
            const auto lfs = item.find("lfs");
            if (lfs != item.end() && lfs->is_object()) continue;

            auto pointer = fetchPointer(source, path);
            if (!pointer.ok()) return Result::failure(std::move(pointer.error));
            item["lfs"] = {{"oid", pointer.data->sha256}, {"size", pointer.data->size}};
        }
    }

    std::string error;
    auto doc = buildCatalogDocument(listing, source, catalog, &error);
    if (!doc) {
        log_->warn("CatalogUpdater: unusable listing: {}", error);
        return Result::failure(CacheErrorKind::Corruption, error);
    }
    log_->info("CatalogUpdater: {} models at ref {}", (*doc)["models"].size(), source.git_ref);
    return Result::success(std::move(*doc));
}

CacheResult<LfsPointer> CatalogUpdater::fetchPointer(const RemoteSource& source, const std::string& path) {
    using Result = CacheResult<LfsPointer>;
    const std::string url = rawUrl(source, path);
    log_->debug("CatalogUpdater: reading LFS pointer url='{}'", url);

    std::string body;
    const FetchResult fetched = fetchText(*transport_, url, body, kMaxPointerBytes);
    if (fetched.status == FetchStatus::Aborted) {
        return Result::failure(CacheErrorKind::Corruption, path + " is larger than an LFS pointer file");
    }
    if (!fetched.ok()) {
        log_->warn("CatalogUpdater: pointer fetch failed url='{}': {}", url, fetched.error_message);
        CacheError err;
        err.kind = fetched.status == FetchStatus::InvalidUrl ? CacheErrorKind::InvalidUrl
                                                              : CacheErrorKind::NetworkError;
        err.http_status = fetched.http_status;
        err.message = path + ": " + fetched.error_message;
        return Result::failure(std::move(err));
    }
    auto pointer = parseLfsPointer(body);
    if (!pointer) {
        log_->warn("CatalogUpdater: '{}' is not an LFS pointer", path);
        return Result::failure(CacheErrorKind::Corruption, path + " is not an LFS pointer file");
    }
    return Result::success(std::move(*pointer));
}

}  // namespace wcache
