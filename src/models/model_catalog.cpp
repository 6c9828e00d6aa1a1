#include "models/model_catalog.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <spdlog/spdlog.h>

#include "utils/sha256.h"
#include "utils/url_encode.h"

namespace wcache {

namespace {

constexpr const char* kDefaultBaseUrl = "https://huggingface.co";
constexpr const char* kDefaultRepo = "ggerganov/whisper.cpp";
// Pinned so digests and sizes below stay valid when the upstream branch moves.
constexpr const char* kDefaultGitRef = "f281eb45af861ab5e5297d23694b7d46e090c02c";

struct BuiltinRow {
    ModelId id;
    const char* filename;
    const char* sha256;
    uint64_t size_bytes;
    uint32_t memory_mb;
    SizeClass size_class;
};

// Sizes and digests are the Git LFS metadata of the pinned ref.
// Memory figures are whisper.cpp peak measurements; quantized variants run
// ~30-40% below their full-precision counterpart.
// Regenerate with `wcache catalog refresh`.
constexpr std::array<BuiltinRow, kModelIdCount> kBuiltin = {{
    {ModelId::Tiny, "tiny",
     "be07e048e1e599ad46341c8d2a135645097a538221678b7acdd1b1919c6e1b21", 77691713ULL, 273, SizeClass::Tiny},
    {ModelId::TinyQ5_1, "tiny-q5_1",
     "818710568da3ca15689e31a743197b520007872ff9576237bda97bd1b469c3d7", 32152673ULL, 164, SizeClass::Tiny},
    {ModelId::TinyEn, "tiny.en",
     "921e4cf8686fdd993dcd081a5da5b6c365bfde1162e72b08d75ac75289920b1f", 77704715ULL, 273, SizeClass::Tiny},
    {ModelId::Base, "base",
     "60ed5bc3dd14eea856493d334349b405782ddcaf0028d4b5df4088345fba2efe", 147951465ULL, 388, SizeClass::Base},
    {ModelId::BaseQ5_1, "base-q5_1",
     "422f1ae452ade6f30a004d7e5c6a43195e4433bc370bf23fac9cc591f01a8898", 59707625ULL, 233, SizeClass::Base},
    {ModelId::BaseEn, "base.en",
     "a03779c86df3323075f5e796cb2ce5029f00ec8869eee3fdfb897afe36c6d002", 147964211ULL, 388, SizeClass::Base},
    {ModelId::Small, "small",
     "1be3a9b2063867b937e64e2ec7483364a79917e157fa98c5d94b5c1fffea987b", 487601967ULL, 852, SizeClass::Small},
    {ModelId::SmallQ5_1, "small-q5_1",
     "ae85e4a935d7a567bd102fe55afc16bb595bdb618e11b2fc7591bc08120411bb", 190085487ULL, 511, SizeClass::Small},
    {ModelId::SmallEn, "small.en",
     "c6138d6d58ecc8322097e0f987c32f1be8bb0a18532a3f88f734d1bbf9c41e5d", 487614201ULL, 852, SizeClass::Small},
    {ModelId::Medium, "medium",
     "6c14d5adee5f86394037b4e4e8b59f1673b6cee10e3cf0b11bbdbee79c156208", 1533763059ULL, 2150, SizeClass::Medium},
    {ModelId::MediumQ5_0, "medium-q5_0",
     "19fea4b380c3a618ec4723c3eef2eb785ffba0d0538cf43f8f235e7b3b34220f", 539212467ULL, 1290, SizeClass::Medium},
    {ModelId::MediumEn, "medium.en",
     "cc37e93478338ec7700281a7ac30a10128929eb8f427dda2e865faa8f6da4356", 1533774781ULL, 2150, SizeClass::Medium},
    {ModelId::LargeV3, "large-v3",
     "64d182b440b98d5203c4f9bd541544d84c605196c4f7b845dfa11fb23594d1e2", 3095033483ULL, 3900, SizeClass::Large},
    {ModelId::LargeV3Turbo, "large-v3-turbo",
     "1fc70f774d38eb169993ac391eea357ef47c88757ef72ee5943879b7e8e2bc69", 1624555275ULL, 1500, SizeClass::Large},
    {ModelId::LargeV3TurboQ5_0, "large-v3-turbo-q5_0",
     "394221709cd5ad1f40c46e6031ca61bce88931e6e088c188294c6d5a55ffa7e2", 574041195ULL, 900, SizeClass::Large},
    {ModelId::LargeV3TurboQ8_0, "large-v3-turbo-q8_0",
     "317eb69c11673c9de1e1f0d459b253999804ec71ac4c23c17ecf5fbe24e259a1", 874188075ULL, 1050, SizeClass::Large},
}};

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isEnglishOnly(const std::string& filename) {
    return filename.find(".en") != std::string::npos;
}

void setError(std::string* error, std::string message) {
    if (error) *error = std::move(message);
}

std::vector<CatalogEntry> builtinEntries(const RemoteSource& source) {
    std::vector<CatalogEntry> entries;
    entries.reserve(kBuiltin.size());
    for (const auto& row : kBuiltin) {
        CatalogEntry e;
        e.id = row.id;
        e.filename = row.filename;
        e.expected_sha256 = row.sha256;
        e.expected_size_bytes = row.size_bytes;
        e.approx_memory_mb = row.memory_mb;
        e.size_class = row.size_class;
        e.english_only = isEnglishOnly(e.filename);
        e.remote_url = buildDownloadUrl(source, e.filename);
        entries.push_back(std::move(e));
    }
    return entries;
}

}  // namespace

std::string buildDownloadUrl(const RemoteSource& source, const std::string& filename) {
    std::string out = source.base_url;
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    out += "/";
    out += urlEncodePath(source.repo);
    out += "/resolve/";
    out += urlEncodePathSegment(source.git_ref);
    out += "/";
    out += urlEncodePathSegment("ggml-" + filename + ".bin");
    return out;
}

const char* toString(ModelId id) {
    return kBuiltin[static_cast<size_t>(id)].filename;
}

const char* toString(SizeClass size_class) {
    switch (size_class) {
        case SizeClass::Tiny:
            return "tiny";
        case SizeClass::Base:
            return "base";
        case SizeClass::Small:
            return "small";
        case SizeClass::Medium:
            return "medium";
        case SizeClass::Large:
            return "large";
    }
    return "unknown";
}

RemoteSource ModelCatalog::defaultSource() {
    return RemoteSource{kDefaultBaseUrl, kDefaultRepo, kDefaultGitRef};
}

const ModelCatalog& ModelCatalog::builtin() {
    static const ModelCatalog catalog(builtinEntries(defaultSource()), defaultSource());
    return catalog;
}

std::optional<ModelCatalog> ModelCatalog::fromEntries(std::vector<CatalogEntry> entries,
                                                      RemoteSource source,
                                                      std::string* error) {
    if (entries.size() != kModelIdCount) {
        setError(error, "catalog must contain exactly " + std::to_string(kModelIdCount) + " entries, got " +
                            std::to_string(entries.size()));
        return std::nullopt;
    }
    std::array<bool, kModelIdCount> seen{};
    for (const auto& e : entries) {
        const auto idx = static_cast<size_t>(e.id);
        if (idx >= kModelIdCount) {
            setError(error, "catalog entry has an out-of-range id");
            return std::nullopt;
        }
        if (seen[idx]) {
            setError(error, std::string("duplicate catalog id: ") + toString(e.id));
            return std::nullopt;
        }
        seen[idx] = true;
        if (e.filename.empty()) {
            setError(error, std::string("empty filename for ") + toString(e.id));
            return std::nullopt;
        }
        if (!is_sha256_hex(e.expected_sha256)) {
            setError(error, std::string("malformed sha256 for ") + toString(e.id));
            return std::nullopt;
        }
    }
    std::sort(entries.begin(), entries.end(), [](const CatalogEntry& a, const CatalogEntry& b) {
        return static_cast<size_t>(a.id) < static_cast<size_t>(b.id);
    });
    for (auto& e : entries) {
        if (e.remote_url.empty()) {
            e.remote_url = buildDownloadUrl(source, e.filename);
        }
    }
    return ModelCatalog(std::move(entries), std::move(source));
}

std::optional<ModelCatalog> ModelCatalog::fromJson(const nlohmann::json& doc, std::string* error) {
    if (!doc.is_object()) {
        setError(error, "catalog document must be a JSON object");
        return std::nullopt;
    }

    RemoteSource source = defaultSource();
    try {
        source.base_url = doc.value("base_url", source.base_url);
        source.repo = doc.value("repo", source.repo);
        source.git_ref = doc.value("git_ref", source.git_ref);
    } catch (const nlohmann::json::type_error& e) {
        setError(error, std::string("catalog source fields: ") + e.what());
        return std::nullopt;
    }

    // Start from the built-in table rebuilt against the document's source.
    auto entries = builtinEntries(source);
    std::array<bool, kModelIdCount> overridden{};

    if (doc.contains("models")) {
        const auto& models = doc["models"];
        if (!models.is_array()) {
            setError(error, "\"models\" must be an array");
            return std::nullopt;
        }
        const auto& base = builtin();
        for (const auto& m : models) {
            if (!m.is_object() || !m.contains("id") || !m["id"].is_string()) {
                setError(error, "every model needs a string \"id\"");
                return std::nullopt;
            }
            const std::string name = m["id"].get<std::string>();
            auto id = base.idFromName(name);
            if (!id) {
                setError(error, "unknown model id in catalog: " + name);
                return std::nullopt;
            }
            const auto idx = static_cast<size_t>(*id);
            if (overridden[idx]) {
                setError(error, "duplicate model id in catalog: " + name);
                return std::nullopt;
            }
            overridden[idx] = true;

            auto& entry = entries[idx];
            if (m.contains("sha256")) {
                if (!m["sha256"].is_string()) {
                    setError(error, "sha256 for " + name + " must be a string");
                    return std::nullopt;
                }
                const std::string digest = toLowerAscii(m["sha256"].get<std::string>());
                if (!is_sha256_hex(digest)) {
                    setError(error, "malformed sha256 for " + name);
                    return std::nullopt;
                }
                entry.expected_sha256 = digest;
            }
            if (m.contains("size")) {
                if (!m["size"].is_number_unsigned()) {
                    setError(error, "size for " + name + " must be a non-negative integer");
                    return std::nullopt;
                }
                entry.expected_size_bytes = m["size"].get<uint64_t>();
            }
            if (m.contains("memory_mb") && m["memory_mb"].is_number_unsigned()) {
                entry.approx_memory_mb = m["memory_mb"].get<uint32_t>();
            }
        }
    }

    return ModelCatalog(std::move(entries), std::move(source));
}

std::optional<ModelCatalog> ModelCatalog::fromFile(const std::filesystem::path& path, std::string* error,
                                                   const std::optional<std::string>& base_url) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        setError(error, "cannot open catalog file " + path.string());
        return std::nullopt;
    }
    nlohmann::json doc;
    try {
        ifs >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        setError(error, "cannot parse catalog file " + path.string() + ": " + e.what());
        return std::nullopt;
    }
    if (base_url && doc.is_object()) {
        doc["base_url"] = *base_url;
    }
    return fromJson(doc, error);
}

const CatalogEntry& ModelCatalog::entryFor(ModelId id) const {
    return entries_[static_cast<size_t>(id)];
}

std::string ModelCatalog::downloadUrl(const CatalogEntry& entry) const {
    return buildDownloadUrl(source_, entry.filename);
}

std::optional<ModelId> ModelCatalog::idFromName(const std::string& name) const {
    const std::string lower = toLowerAscii(name);
    for (const auto& e : entries_) {
        if (e.filename == lower) return e.id;
    }
    return std::nullopt;
}

std::optional<ModelId> ModelCatalog::idFromCacheFilename(const std::string& filename) const {
    for (const auto& e : entries_) {
        if (e.cacheFilename() == filename) return e.id;
    }
    return std::nullopt;
}

std::optional<ModelId> ModelCatalog::downgradeTarget(ModelId id) {
    switch (id) {
        case ModelId::LargeV3:
            return ModelId::Medium;
        // The turbo builds already need less memory than Medium.
        case ModelId::LargeV3Turbo:
            return ModelId::Small;
        case ModelId::LargeV3TurboQ5_0:
        case ModelId::LargeV3TurboQ8_0:
            return ModelId::SmallQ5_1;
        case ModelId::Medium:
            return ModelId::Small;
        case ModelId::MediumQ5_0:
            return ModelId::SmallQ5_1;
        case ModelId::MediumEn:
            return ModelId::SmallEn;
        default:
            return std::nullopt;
    }
}

}  // namespace wcache
