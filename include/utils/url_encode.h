#pragma once

#include <cctype>
#include <string>

namespace wcache {

// RFC 3986 unreserved characters pass through; everything else becomes %XX.
inline std::string urlEncodePathSegment(const std::string& input) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        const bool unreserved = std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0x0F]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

// Encodes each segment of "owner/repo" while keeping the separators.
inline std::string urlEncodePath(const std::string& path) {
    std::string out;
    size_t start = 0;
    while (start <= path.size()) {
        const size_t pos = path.find('/', start);
        const std::string segment = (pos == std::string::npos) ? path.substr(start)
                                                               : path.substr(start, pos - start);
        out += urlEncodePathSegment(segment);
        if (pos == std::string::npos) break;
        out.push_back('/');
        start = pos + 1;
    }
    return out;
}

// Reverses %XX escapes. Malformed escapes are kept literally.
inline std::string urlDecodePathSegment(const std::string& input) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            const int hi = hexValue(input[i + 1]);
            const int lo = hexValue(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(input[i]);
    }
    return out;
}

}  // namespace wcache
