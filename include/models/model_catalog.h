// ModelCatalog - registry of the ggml Whisper artifacts this tool can manage.
// Layout on the remote side:
//   <base_url>/<repo>/resolve/<git_ref>/ggml-<filename>.bin
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace wcache {

enum class ModelId {
    Tiny,
    TinyQ5_1,
    TinyEn,
    Base,
    BaseQ5_1,
    BaseEn,
    Small,
    SmallQ5_1,
    SmallEn,
    Medium,
    MediumQ5_0,
    MediumEn,
    LargeV3,
    LargeV3Turbo,
    LargeV3TurboQ5_0,
    LargeV3TurboQ8_0,
};

constexpr size_t kModelIdCount = static_cast<size_t>(ModelId::LargeV3TurboQ8_0) + 1;

enum class SizeClass { Tiny, Base, Small, Medium, Large };

struct CatalogEntry {
    ModelId id{ModelId::Tiny};
    std::string filename;         // canonical base name, e.g. "medium", "tiny.en"
    std::string expected_sha256;  // 64 lowercase hex chars
    uint64_t expected_size_bytes{0};
    std::string remote_url;
    uint32_t approx_memory_mb{0};  // resident memory once loaded
    SizeClass size_class{SizeClass::Tiny};
    bool english_only{false};

    // ggml-<filename>.bin
    std::string cacheFilename() const { return "ggml-" + filename + ".bin"; }
};

struct RemoteSource {
    std::string base_url;
    std::string repo;
    std::string git_ref;
};

// Pure URL construction; path segments are percent-encoded.
std::string buildDownloadUrl(const RemoteSource& source, const std::string& filename);

const char* toString(ModelId id);
const char* toString(SizeClass size_class);

class ModelCatalog {
public:
    // Compiled-in table pinned to ggerganov/whisper.cpp.
    static const ModelCatalog& builtin();

    // Default remote source of the built-in table.
    static RemoteSource defaultSource();

    // Load-time table: the built-in entries overlaid with a catalog document
    // ({"base_url","repo","git_ref","models":[{"id","sha256","size"}]}).
    // Ids absent from the document keep built-in values; unknown or duplicate
    // ids, and malformed digests, are rejected.
    static std::optional<ModelCatalog> fromJson(const nlohmann::json& doc, std::string* error = nullptr);
    // fromJson over a file. base_url, when given, replaces the document's.
    static std::optional<ModelCatalog> fromFile(const std::filesystem::path& path, std::string* error = nullptr,
                                                const std::optional<std::string>& base_url = std::nullopt);

    // Explicit table. Every ModelId must appear exactly once. Entries with an
    // empty remote_url get one built from source.
    static std::optional<ModelCatalog> fromEntries(std::vector<CatalogEntry> entries,
                                                   RemoteSource source,
                                                   std::string* error = nullptr);

    // Total: every ModelId has exactly one entry.
    const CatalogEntry& entryFor(ModelId id) const;

    std::string downloadUrl(const CatalogEntry& entry) const;
    uint32_t memoryUsageMb(const CatalogEntry& entry) const { return entry.approx_memory_mb; }

    // Entries in ModelId order.
    const std::vector<CatalogEntry>& all() const { return entries_; }
    const RemoteSource& source() const { return source_; }

    // Accepts the canonical filename ("medium", "tiny.en", "large-v3-turbo-q5_0"),
    // case-insensitive.
    std::optional<ModelId> idFromName(const std::string& name) const;

    // Accepts "ggml-<filename>.bin".
    std::optional<ModelId> idFromCacheFilename(const std::string& filename) const;

    // Next smaller tier used when memory is short: Large -> Medium -> Small.
    // Keeps the English-only / quantized line where one exists.
    static std::optional<ModelId> downgradeTarget(ModelId id);

private:
    ModelCatalog(std::vector<CatalogEntry> entries, RemoteSource source)
        : entries_(std::move(entries)), source_(std::move(source)) {}

    std::vector<CatalogEntry> entries_;  // indexed by ModelId
    RemoteSource source_;
};

}  // namespace wcache
