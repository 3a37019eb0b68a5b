#pragma once

/*
 * HTTP transport seam. The libcurl adapter is the production implementation; tests plug in
 * in-process fakes through IHttpAdapter.
 */

#include <shelf/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shelf::net {

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

struct HttpRequest {
    std::string url;
    std::vector<Header> headers;
    std::optional<std::uint64_t> rangeStart; // "Range: bytes=<n>-" when set
    std::chrono::milliseconds timeout{60000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent;
};

struct HttpResult {
    long status{0};
    std::uint64_t bytes{0}; // body bytes handed to the sink
    std::string effectiveUrl;
};

struct ProgressEvent {
    std::string url;
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>;

// Receives the body of a 2xx response, chunk by chunk, together with the status code
using BodySink = std::function<Result<void>(long status, std::span<const std::byte> data)>;

/**
 * Minimal GET transport. Transport failures come back as Error (timeouts, resets and partial
 * transfers as TransientNetworkError); any HTTP status comes back as HttpResult and is the
 * caller's to classify. Bodies of non-2xx responses are discarded.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    virtual Result<HttpResult> get(const HttpRequest& request, const BodySink& sink,
                                   const ShouldCancel& shouldCancel = {},
                                   const ProgressCallback& onProgress = {}) = 0;
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();

/**
 * Process-wide libcurl initialisation; construct once in main() before any adapter is used.
 */
class CurlGlobalGuard {
public:
    CurlGlobalGuard();
    ~CurlGlobalGuard();
    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

// GET and collect the body as text
Result<HttpResult> fetchText(IHttpAdapter& http, const HttpRequest& request, std::string& body,
                             const ShouldCancel& shouldCancel = {});

[[nodiscard]] constexpr bool isSuccessStatus(long status) noexcept {
    return status >= 200 && status < 300;
}

[[nodiscard]] constexpr bool isServerErrorStatus(long status) noexcept {
    return status >= 500 && status < 600;
}

inline constexpr long kStatusRangeNotSatisfiable = 416;

/**
 * Explicit session state handed to the catalog client and the fetcher. Produced by the
 * external login tool; this code only reads it.
 */
struct SessionContext {
    std::string baseUrl;
    std::vector<Header> headers; // e.g. Cookie / Authorization
    std::string userAgent{"shelf/1.0"};
    std::chrono::milliseconds timeout{60000};
    TlsConfig tls{};
    std::optional<std::string> proxy;

    [[nodiscard]] HttpRequest request(std::string url) const;
};

/**
 * Read a session file: { "base_url": "...", "headers": { "Cookie": "..." }, "user_agent": "..." }.
 * A missing file is AuthExpired (nothing to authenticate with); a malformed one is InvalidData.
 */
Result<SessionContext> loadSession(const std::filesystem::path& path);

} // namespace shelf::net
