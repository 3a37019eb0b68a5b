#pragma once

#include <shelf/core/retry.h>
#include <shelf/core/types.h>
#include <shelf/manifest/manifest.h>
#include <shelf/net/http.h>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace shelf::sync {

// One row of the owned-items enumeration
struct CatalogEntry {
    std::string id;
    bool updated{false}; // the service flags the item as changed since last seen
};

struct CatalogPage {
    std::vector<CatalogEntry> entries;
    int page{1};
    int totalPages{1};
};

/**
 * Remote catalog as seen by the sync engine. Implementations report 401/403 as AuthExpired and
 * timeouts/resets/5xx as TransientNetworkError; retrying is the caller's business.
 */
class ICatalogClient {
public:
    virtual ~ICatalogClient() = default;

    // Every identifier owned by the session's user, in catalog order
    virtual Result<std::vector<CatalogEntry>> enumerate(const net::SessionContext& session) = 0;

    // Full detail for one identifier; UnknownItem when the service does not know it
    virtual Result<manifest::Item> fetchDetail(const net::SessionContext& session,
                                               const std::string& id) = 0;
};

/**
 * JSON-over-HTTP catalog client.
 *
 *   GET {base}/catalog?page=N        -> {"items":[{"id","updated"}],"page","total_pages"}
 *   GET {base}/catalog/items/{id}    -> {"id","title","notes","serial","files":[...]}
 *
 * A fixed delay precedes every request to stay under the service's informal rate limit.
 */
class HttpCatalogClient : public ICatalogClient {
public:
    HttpCatalogClient(net::IHttpAdapter& http, std::chrono::milliseconds requestDelay,
                      Sleeper sleeper = threadSleeper());

    Result<std::vector<CatalogEntry>> enumerate(const net::SessionContext& session) override;
    Result<manifest::Item> fetchDetail(const net::SessionContext& session,
                                       const std::string& id) override;

private:
    Result<std::string> getJson(const net::SessionContext& session, const std::string& url,
                                bool notFoundIsUnknownItem);

    net::IHttpAdapter& http_;
    std::chrono::milliseconds requestDelay_;
    Sleeper sleeper_;
};

Result<CatalogPage> parseCatalogPage(std::string_view text);
Result<manifest::Item> parseItemDetail(std::string_view text);

// Map a non-2xx catalog response onto the error taxonomy
Error classifyCatalogStatus(long status, const std::string& url, bool notFoundIsUnknownItem);

} // namespace shelf::sync
