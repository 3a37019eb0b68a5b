/*
 * http_adapter_curl.cpp
 *
 * One GET per call on a fresh libcurl easy handle, optionally ranged ("bytes=<n>-").
 * Bodies reach the caller's sink only for 2xx responses; error pages are drained and dropped.
 * Cancellation is polled from the write callback, so a stalled transfer is bounded by the
 * low-speed timeout rather than by cancellation.
 */

#include <shelf/net/http.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <memory>
#include <string_view>

namespace shelf::net {

namespace {

struct EasyDeleter {
    void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

ErrorCode classifyCurlCode(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return ErrorCode::Success;
        // Worth another attempt: the peer or the path to it misbehaved
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return ErrorCode::TransientNetworkError;
        // Configuration or trust problems; retrying changes nothing
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_TOO_MANY_REDIRECTS:
            return ErrorCode::HttpError;
        default:
            return ErrorCode::Unknown;
    }
}

// Everything the callbacks need for one transfer
struct Transfer {
    CURL* handle{nullptr};
    const HttpRequest* request{nullptr};
    const BodySink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    const ProgressCallback* onProgress{nullptr};

    std::optional<std::uint64_t> contentLength;
    std::uint64_t delivered{0};
    bool cancelled{false};
    std::optional<Error> sinkError;
};

bool isContentLength(std::string_view name) {
    constexpr std::string_view kName = "content-length";
    return name.size() == kName.size() &&
           std::equal(name.begin(), name.end(), kName.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == b;
           });
}

size_t onHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* t = static_cast<Transfer*>(userdata);
    std::string_view line(buffer, total);

    // Each hop of a redirect chain starts over with its own status line
    if (line.rfind("HTTP/", 0) == 0) {
        t->contentLength.reset();
        return total;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos || !isContentLength(line.substr(0, colon)))
        return total;

    auto value = line.substr(colon + 1);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
        value.remove_prefix(1);
    std::uint64_t n = 0;
    if (std::from_chars(value.data(), value.data() + value.size(), n).ec == std::errc())
        t->contentLength = n;
    return total;
}

size_t onBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* t = static_cast<Transfer*>(userdata);

    if (*t->shouldCancel && (*t->shouldCancel)()) {
        t->cancelled = true;
        return 0; // CURLE_WRITE_ERROR
    }

    long status = 0;
    curl_easy_getinfo(t->handle, CURLINFO_RESPONSE_CODE, &status);
    if (!isSuccessStatus(status))
        return total;

    auto r = (*t->sink)(status, std::span<const std::byte>(
                                    reinterpret_cast<const std::byte*>(ptr), total));
    if (!r) {
        t->sinkError = r.error();
        return 0;
    }

    t->delivered += total;
    if (*t->onProgress) {
        ProgressEvent ev;
        ev.url = t->request->url;
        ev.downloadedBytes = t->delivered;
        ev.totalBytes = t->contentLength;
        (*t->onProgress)(ev);
    }
    return total;
}

HeaderList buildHeaders(const HttpRequest& request) {
    curl_slist* list = nullptr;
    for (const auto& h : request.headers)
        list = curl_slist_append(list, (h.name + ": " + h.value).c_str());
    if (request.rangeStart) {
        const auto range = "Range: bytes=" + std::to_string(*request.rangeStart) + "-";
        list = curl_slist_append(list, range.c_str());
    }
    return HeaderList(list);
}

void applyTransportOptions(CURL* h, const HttpRequest& request) {
    // Bound the connect phase and abort stalled transfers; no wall-clock cap on the whole
    // transfer because installers run to several gigabytes.
    const long timeoutMs = static_cast<long>(request.timeout.count());
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, std::min<long>(timeoutMs, 30000));
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, std::max<long>(1, timeoutMs / 1000));

    // File URLs bounce through CDN hosts
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, request.tls.insecure ? 0L : 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, request.tls.insecure ? 0L : 2L);
    if (!request.tls.caPath.empty())
        curl_easy_setopt(h, CURLOPT_CAINFO, request.tls.caPath.c_str());
    if (request.proxy && !request.proxy->empty())
        curl_easy_setopt(h, CURLOPT_PROXY, request.proxy->c_str());
    if (!request.userAgent.empty())
        curl_easy_setopt(h, CURLOPT_USERAGENT, request.userAgent.c_str());

    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    Result<HttpResult> get(const HttpRequest& request, const BodySink& sink,
                           const ShouldCancel& shouldCancel,
                           const ProgressCallback& onProgress) override {
        if (request.url.empty())
            return Error{ErrorCode::InvalidArgument, "empty URL"};

        EasyHandle handle(curl_easy_init());
        if (!handle)
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        CURL* h = handle.get();

        const auto headers = buildHeaders(request);
        Transfer t;
        t.handle = h;
        t.request = &request;
        t.sink = &sink;
        t.shouldCancel = &shouldCancel;
        t.onProgress = &onProgress;

        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, onBody);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &t);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, onHeader);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &t);
        applyTransportOptions(h, request);

        if (request.rangeStart)
            spdlog::debug("GET {} from byte {}", request.url, *request.rangeStart);
        else
            spdlog::debug("GET {}", request.url);

        const CURLcode rc = curl_easy_perform(h);

        if (t.cancelled)
            return Error{ErrorCode::OperationCancelled, "transfer cancelled"};
        if (t.sinkError)
            return *t.sinkError;
        if (rc != CURLE_OK) {
            return Error{classifyCurlCode(rc),
                         "GET " + request.url + ": " + curl_easy_strerror(rc)};
        }

        HttpResult out;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &out.status);
        char* effective = nullptr;
        if (curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective)
            out.effectiveUrl = effective;
        out.bytes = t.delivered;
        return out;
    }
};

} // namespace

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

CurlGlobalGuard::CurlGlobalGuard() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobalGuard::~CurlGlobalGuard() {
    curl_global_cleanup();
}

} // namespace shelf::net
