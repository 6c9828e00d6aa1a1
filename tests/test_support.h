// Shared fixtures for the wcache test suites.
#pragma once

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "models/http_transport.h"
#include "models/model_catalog.h"
#include "utils/sha256.h"

#ifdef _WIN32
#include <random>

inline int setenv(const char* name, const char* value, int overwrite) {
    if (!name || !*name) {
        return -1;
    }
    if (!overwrite) {
        size_t len = 0;
        if (getenv_s(&len, nullptr, 0, name) == 0 && len > 0) {
            return 0;
        }
    }
    return _putenv_s(name, value ? value : "");
}

inline int unsetenv(const char* name) {
    if (!name || !*name) {
        return -1;
    }
    return _putenv_s(name, "");
}
#else
#include <unistd.h>
#endif

namespace wcache::test {

namespace fs = std::filesystem;

class TempDir {
public:
    explicit TempDir(const std::string& prefix = "wcache-test") {
#ifdef _WIN32
        std::mt19937_64 rng(std::random_device{}());
        path = fs::temp_directory_path() / (prefix + "-" + std::to_string(rng()));
        fs::create_directories(path);
#else
        auto base = fs::temp_directory_path() / fs::path(prefix + "-XXXXXX");
        std::string tmpl = base.string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* created = mkdtemp(buf.data());
        path = created ? fs::path(created) : fs::temp_directory_path() / prefix;
        fs::create_directories(path);
#endif
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    fs::path path;
};

class EnvGuard {
public:
    explicit EnvGuard(std::vector<std::string> keys) : keys_(std::move(keys)) {
        for (const auto& key : keys_) {
            if (const char* value = std::getenv(key.c_str())) {
                saved_[key] = value;
            }
            unsetenv(key.c_str());
        }
    }

    ~EnvGuard() {
        for (const auto& key : keys_) {
            if (auto it = saved_.find(key); it != saved_.end()) {
                setenv(key.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(key.c_str());
            }
        }
    }

    void set(const std::string& key, const std::string& value) { setenv(key.c_str(), value.c_str(), 1); }

private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

inline void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

// Feeds body to the sink in small chunks, like a socket would.
inline FetchResult streamBody(const std::string& body, const ChunkSink& sink, size_t chunk = 7) {
    FetchResult out;
    out.http_status = 200;
    out.content_length = body.size();
    for (size_t pos = 0; pos < body.size(); pos += chunk) {
        const size_t len = std::min(chunk, body.size() - pos);
        if (!sink(body.data() + pos, len)) {
            out.status = FetchStatus::Aborted;
            out.error_message = "transfer aborted by receiver";
            return out;
        }
        out.bytes_received += len;
    }
    out.status = FetchStatus::Ok;
    return out;
}

// In-memory HttpTransport driven by a handler; records every requested URL.
class ScriptedTransport : public HttpTransport {
public:
    using Handler = std::function<FetchResult(const std::string& url, const ChunkSink& sink)>;

    explicit ScriptedTransport(Handler handler) : handler_(std::move(handler)) {}

    FetchResult fetch(const std::string& url, const ChunkSink& sink) override {
        ++calls_;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            urls_.push_back(url);
        }
        return handler_(url, sink);
    }

    int calls() const { return calls_.load(); }

    std::vector<std::string> urls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_;
    }

private:
    Handler handler_;
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> urls_;
};

inline ScriptedTransport::Handler serving(std::string body) {
    return [body = std::move(body)](const std::string&, const ChunkSink& sink) { return streamBody(body, sink); };
}

inline ScriptedTransport::Handler failingWith(FetchStatus status, int http_status = 0) {
    return [status, http_status](const std::string&, const ChunkSink&) {
        FetchResult out;
        out.status = status;
        out.http_status = http_status;
        out.error_message = status == FetchStatus::HttpError ? "HTTP status " + std::to_string(http_status)
                                                             : std::string("connection reset");
        return out;
    };
}

// Delivers the first `cut` bytes, then reports a dropped connection.
inline ScriptedTransport::Handler truncating(std::string body, size_t cut) {
    return [body = std::move(body), cut](const std::string&, const ChunkSink& sink) {
        FetchResult out = streamBody(body.substr(0, cut), sink);
        if (out.ok()) {
            out.status = FetchStatus::TransportError;
            out.error_message = "connection closed early";
        }
        out.content_length = body.size();
        return out;
    };
}

// Built-in table with the given ids re-pinned to small test payloads, served
// from base_url.
inline ModelCatalog catalogWithPayloads(const std::map<ModelId, std::string>& payloads,
                                        const std::string& base_url = "http://models.test") {
    std::vector<CatalogEntry> entries = ModelCatalog::builtin().all();
    for (auto& entry : entries) {
        entry.remote_url.clear();
        auto it = payloads.find(entry.id);
        if (it != payloads.end()) {
            entry.expected_sha256 = sha256_text(it->second);
            entry.expected_size_bytes = it->second.size();
        }
    }
    RemoteSource source{base_url, "ggerganov/whisper.cpp", "main"};
    std::string error;
    auto catalog = ModelCatalog::fromEntries(std::move(entries), source, &error);
    if (!catalog) {
        throw std::runtime_error("test catalog rejected: " + error);
    }
    return *catalog;
}

}  // namespace wcache::test
