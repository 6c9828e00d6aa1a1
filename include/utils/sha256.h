#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <openssl/sha.h>

namespace wcache {

// Read size used when hashing model files. Memory stays constant regardless
// of file size (tens of MB to several GB).
constexpr size_t kHashChunkSize = 64 * 1024;

inline std::string to_hex(const unsigned char* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(hex[(data[i] >> 4) & 0x0F]);
        out.push_back(hex[data[i] & 0x0F]);
    }
    return out;
}

// Incremental SHA-256 over streamed chunks.
class Sha256Stream {
public:
    Sha256Stream() { ok_ = SHA256_Init(&ctx_) == 1; }

    void update(const char* data, size_t len) {
        if (!ok_ || len == 0) return;
        ok_ = SHA256_Update(&ctx_, data, len) == 1;
    }

    // Returns lowercase hex, or an empty string if OpenSSL reported a failure.
    std::string finalize() {
        if (!ok_) return "";
        std::array<unsigned char, SHA256_DIGEST_LENGTH> hash{};
        if (SHA256_Final(hash.data(), &ctx_) != 1) return "";
        ok_ = false;
        return to_hex(hash.data(), hash.size());
    }

private:
    SHA256_CTX ctx_{};
    bool ok_{false};
};

inline std::string sha256_text(const std::string& text) {
    Sha256Stream stream;
    stream.update(text.data(), text.size());
    return stream.finalize();
}

// Streams the file in kHashChunkSize reads. Empty string if the file cannot be
// opened or a read fails midway.
inline std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return "";
    Sha256Stream stream;
    std::vector<char> buf(kHashChunkSize);
    while (file) {
        file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = file.gcount();
        if (n > 0) {
            stream.update(buf.data(), static_cast<size_t>(n));
        }
    }
    if (file.bad()) return "";
    return stream.finalize();
}

inline bool is_sha256_hex(const std::string& value) {
    if (value.size() != 64) return false;
    for (char c : value) {
        const bool digit = c >= '0' && c <= '9';
        const bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

}  // namespace wcache
