#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace wcache {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;

    bool valid() const { return !scheme.empty() && !host.empty(); }
};

// scheme://host[:port]/path. Returns an invalid HttpUrl (empty scheme) when
// the input does not match, or when the scheme is not http/https.
HttpUrl parseHttpUrl(const std::string& url);

enum class FetchStatus {
    Ok,
    InvalidUrl,      // unparseable URL or unsupported scheme
    TransportError,  // connect/read failure, TLS failure, timeout
    HttpError,       // non-2xx status
    Aborted,         // the chunk sink refused data
};

struct FetchResult {
    FetchStatus status{FetchStatus::TransportError};
    int http_status{0};
    std::optional<uint64_t> content_length;  // as declared by the server
    uint64_t bytes_received{0};
    std::string error_message;

    bool ok() const { return status == FetchStatus::Ok; }
};

// Receives body bytes as they arrive. Returning false aborts the transfer.
using ChunkSink = std::function<bool(const char* data, size_t len)>;

// Streaming GET collaborator. Implementations must not buffer the whole body.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual FetchResult fetch(const std::string& url, const ChunkSink& sink) = 0;
};

// cpp-httplib client. Follows redirects (the model host answers resolve URLs
// with a redirect to its CDN). HTTPS requires CPPHTTPLIB_OPENSSL_SUPPORT.
class HttplibTransport : public HttpTransport {
public:
    explicit HttplibTransport(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    FetchResult fetch(const std::string& url, const ChunkSink& sink) override;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

// Convenience for small documents (catalog listings). Aborts past max_bytes.
FetchResult fetchText(HttpTransport& transport, const std::string& url, std::string& body,
                      size_t max_bytes = 16 * 1024 * 1024);

}  // namespace wcache
