#include "models/http_transport.h"

#include <cctype>
#include <memory>
#include <regex>
#include <stdexcept>
#include <httplib.h>

#include "utils/version.h"

namespace wcache {

namespace {

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout) {
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    std::string scheme_host_port = url.scheme + "://" + url.host;
    if (url.port != 0) {
        scheme_host_port += ":" + std::to_string(url.port);
    }

    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    if (!client->is_valid()) {
        return nullptr;
    }
    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client->set_connection_timeout(sec, usec);
    client->set_read_timeout(sec, usec);
    client->set_write_timeout(sec, usec);
    client->set_follow_location(true);
    return client;
}

}  // namespace

HttpUrl parseHttpUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:?#]+)(?::(\d+))?([^#]*)$)");
    std::smatch match;
    HttpUrl parsed;
    if (!std::regex_match(url, match, re)) {
        return parsed;
    }
    std::string scheme = match[1].str();
    for (auto& c : scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (scheme != "http" && scheme != "https") {
        return parsed;
    }
    int port = scheme == "https" ? 443 : 80;
    if (match[3].matched) {
        try {
            port = std::stoi(match[3].str());
        } catch (const std::out_of_range&) {
            return parsed;
        }
        if (port <= 0 || port > 65535) return parsed;
    }
    parsed.scheme = scheme;
    parsed.host = match[2].str();
    parsed.port = port;
    parsed.path = match[4].str().empty() ? "/" : match[4].str();
    return parsed;
}

HttplibTransport::HttplibTransport(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

FetchResult HttplibTransport::fetch(const std::string& url_text, const ChunkSink& sink) {
    FetchResult out;
    const HttpUrl url = parseHttpUrl(url_text);
    if (!url.valid()) {
        out.status = FetchStatus::InvalidUrl;
        out.error_message = "malformed url: " + url_text;
        return out;
    }

    auto client = makeClient(url, timeout_);
    if (!client) {
        out.status = FetchStatus::InvalidUrl;
        out.error_message = "cannot create HTTP client for " + url.scheme + "://" + url.host;
        return out;
    }

    httplib::Headers headers{{"User-Agent", std::string("wcache/") + WCACHE_VERSION}};
    bool sink_aborted = false;

    auto result = client->Get(
        url.path,
        headers,
        [&](const httplib::Response& res) {
            out.http_status = res.status;
            if (res.has_header("Content-Length")) {
                try {
                    out.content_length = std::stoull(res.get_header_value("Content-Length"));
                } catch (const std::logic_error&) {
                    out.content_length.reset();
                }
            }
            return res.status >= 200 && res.status < 300;
        },
        [&](const char* data, size_t data_length) {
            if (!sink(data, data_length)) {
                sink_aborted = true;
                return false;
            }
            out.bytes_received += data_length;
            return true;
        });

    if (out.http_status != 0 && (out.http_status < 200 || out.http_status >= 300)) {
        out.status = FetchStatus::HttpError;
        out.error_message = "HTTP status " + std::to_string(out.http_status);
        return out;
    }
    if (sink_aborted) {
        out.status = FetchStatus::Aborted;
        out.error_message = "transfer aborted by receiver";
        return out;
    }
    if (!result) {
        out.status = FetchStatus::TransportError;
        out.error_message = httplib::to_string(result.error());
        return out;
    }
    if (out.content_length && out.bytes_received != *out.content_length) {
        out.status = FetchStatus::TransportError;
        out.error_message = "truncated body: received " + std::to_string(out.bytes_received) + " of " +
                            std::to_string(*out.content_length) + " bytes";
        return out;
    }

    out.status = FetchStatus::Ok;
    return out;
}

FetchResult fetchText(HttpTransport& transport, const std::string& url, std::string& body, size_t max_bytes) {
    body.clear();
    return transport.fetch(url, [&](const char* data, size_t len) {
        if (body.size() + len > max_bytes) return false;
        body.append(data, len);
        return true;
    });
}

}  // namespace wcache
