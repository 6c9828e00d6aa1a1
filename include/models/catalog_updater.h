// CatalogUpdater - regenerates the catalog document (digests, sizes, git ref)
// from the model host's repository tree listing.
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "models/cache_error.h"
#include "models/http_transport.h"
#include "models/model_catalog.h"

namespace wcache {

struct LfsPointer {
    std::string sha256;
    uint64_t size{0};
};

// Parses a Git LFS pointer file:
//   version https://git-lfs.github.com/spec/v1
//   oid sha256:<64 hex>
//   size <bytes>
std::optional<LfsPointer> parseLfsPointer(const std::string& text);

class CatalogUpdater {
public:
    explicit CatalogUpdater(std::shared_ptr<HttpTransport> transport = nullptr,
                            std::shared_ptr<spdlog::logger> log = nullptr);

    // <base_url>/api/models/<repo>/tree/<git_ref>
    static std::string treeUrl(const RemoteSource& source);
    // <base_url>/<repo>/raw/<git_ref>/<path>: the LFS pointer text, not the blob.
    static std::string rawUrl(const RemoteSource& source, const std::string& path);

    // Turns a tree listing (array of {type, path, size, lfs:{oid,size}}) into
    // {"base_url","repo","git_ref","models":[{"id","filename","sha256","size"}]}.
    // Files that name no catalog entry are skipped. Fails when nothing matched
    // or a matched file carries no usable LFS digest.
    static std::optional<nlohmann::json> buildCatalogDocument(const nlohmann::json& listing,
                                                              const RemoteSource& source,
                                                              const ModelCatalog& catalog,
                                                              std::string* error = nullptr);

    // Fetch + buildCatalogDocument. Model files the listing reports without
    // LFS metadata are resolved by reading their pointer file (rawUrl).
    // Transport failures map to NetworkError or InvalidUrl; an unusable
    // listing or pointer is Corruption.
    CacheResult<nlohmann::json> refresh(const RemoteSource& source, const ModelCatalog& catalog);

private:
    CacheResult<LfsPointer> fetchPointer(const RemoteSource& source, const std::string& path);

    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<spdlog::logger> log_;
};

}  // namespace wcache
