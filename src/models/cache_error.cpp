#include "models/cache_error.h"

namespace wcache {

const char* to_string(CacheErrorKind kind) {
    switch (kind) {
        case CacheErrorKind::None:
            return "OK";
        case CacheErrorKind::ModelNotFound:
            return "MODEL_NOT_FOUND";
        case CacheErrorKind::Corruption:
            return "CORRUPTION";
        case CacheErrorKind::NetworkError:
            return "NETWORK_ERROR";
        case CacheErrorKind::FileSystemError:
            return "FILE_SYSTEM_ERROR";
        case CacheErrorKind::InsufficientMemory:
            return "INSUFFICIENT_MEMORY";
        case CacheErrorKind::DownloadFailed:
            return "DOWNLOAD_FAILED";
        case CacheErrorKind::InvalidUrl:
            return "INVALID_URL";
    }
    return "UNKNOWN";
}

std::string userMessage(const CacheError& error) {
    const std::string model = error.model ? std::string(" '") + toString(*error.model) + "'" : std::string();
    switch (error.kind) {
        case CacheErrorKind::None:
            return "ok";
        case CacheErrorKind::ModelNotFound:
            return "Model" + model + " is missing from the cache. Download it with: wcache pull" +
                   (error.model ? std::string(" ") + toString(*error.model) : std::string(" <MODEL>"));
        case CacheErrorKind::Corruption:
            return "Model" + model + " is corrupted (size or checksum mismatch). Re-download it with: wcache pull" +
                   (error.model ? std::string(" ") + toString(*error.model) : std::string(" <MODEL>"));
        case CacheErrorKind::NetworkError:
            if (error.http_status != 0) {
                return "Download failed: the server answered HTTP " + std::to_string(error.http_status) +
                       ". Check the model host or mirror setting (HF_BASE_URL).";
            }
            return "Download failed: network error (" + error.message + "). Check your connection and retry.";
        case CacheErrorKind::FileSystemError:
            return "Cannot write to the model cache (" + error.message +
                   "). Check permissions and free disk space, or set WCACHE_MODELS_DIR.";
        case CacheErrorKind::InsufficientMemory:
            return "Insufficient memory for model" + model +
                   ". Try a smaller or quantized model, or free memory.";
        case CacheErrorKind::DownloadFailed:
            return "Download of model" + model + " failed after retries (" + error.message +
                   "). Try again later with: wcache pull" +
                   (error.model ? std::string(" ") + toString(*error.model) : std::string(" <MODEL>"));
        case CacheErrorKind::InvalidUrl:
            return "Invalid download URL (" + error.message + "). Check the catalog file or HF_BASE_URL.";
    }
    return error.message;
}

}  // namespace wcache
