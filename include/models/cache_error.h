#pragma once

#include <optional>
#include <string>
#include <utility>

#include "models/model_catalog.h"

namespace wcache {

enum class CacheErrorKind {
    None = 0,
    ModelNotFound,       // file absent; needs an explicit download
    Corruption,          // size or digest mismatch
    NetworkError,        // transport failure or non-2xx status
    FileSystemError,     // local I/O failure; never retried
    InsufficientMemory,  // even the smallest eligible tier is over budget
    DownloadFailed,      // retries exhausted; cause holds the last kind
    InvalidUrl,          // malformed URL; never retried
};

const char* to_string(CacheErrorKind kind);

struct CacheError {
    CacheErrorKind kind{CacheErrorKind::None};
    std::string message;
    std::optional<ModelId> model;
    int http_status{0};
    CacheErrorKind cause{CacheErrorKind::None};

    bool retryable() const {
        return kind == CacheErrorKind::NetworkError || kind == CacheErrorKind::Corruption;
    }
};

// Distinct, actionable text for each kind, e.g. for a CLI or UI.
std::string userMessage(const CacheError& error);

template<typename T>
struct CacheResult {
    CacheError error;
    std::optional<T> data;

    bool ok() const { return error.kind == CacheErrorKind::None; }

    static CacheResult success(T value) {
        CacheResult r;
        r.data = std::move(value);
        return r;
    }

    static CacheResult failure(CacheError err) {
        CacheResult r;
        r.error = std::move(err);
        return r;
    }

    static CacheResult failure(CacheErrorKind kind, std::string message,
                               std::optional<ModelId> model = std::nullopt) {
        CacheError err;
        err.kind = kind;
        err.message = std::move(message);
        err.model = model;
        return failure(std::move(err));
    }
};

}  // namespace wcache
