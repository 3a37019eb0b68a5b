#pragma once

#include <shelf/core/retry.h>
#include <shelf/core/types.h>
#include <shelf/manifest/manifest.h>
#include <shelf/net/http.h>
#include <shelf/sync/catalog_client.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shelf::sync {

/**
 * Which enumerated identifiers get their detail re-fetched.
 */
enum class MergePolicy {
    All,         // every enumerated identifier
    SkipKnown,   // only identifiers absent from the manifest
    UpdatedOnly, // only identifiers the enumeration flags as updated
    SingleId     // exactly one identifier, which must be enumerated
};

const char* policyName(MergePolicy policy) noexcept;
std::optional<MergePolicy> parsePolicy(std::string_view name) noexcept;

struct SyncOptions {
    MergePolicy policy{MergePolicy::All};
    std::string singleId;

    // Files whose os/lang tag is set and outside these sets are dropped before the merge
    std::set<std::string> osFilter;
    std::set<std::string> langFilter;

    RetryPolicy retry{};
    net::ShouldCancel shouldCancel{};
    Clock clock = systemClock();
    Sleeper sleeper = threadSleeper();
};

struct SyncReport {
    std::size_t enumerated{0};
    std::size_t selected{0};
    std::size_t inserted{0};
    std::size_t updated{0};
    std::size_t unchanged{0};
    std::vector<std::pair<std::string, Error>> failures;
    bool cancelled{false};
};

/**
 * One synchronization run: enumerate, select by policy, fetch each detail with bounded
 * retries, upsert. Per-item failures are collected; AuthExpired aborts the run.
 */
class SyncEngine {
public:
    SyncEngine(ICatalogClient& client, net::SessionContext session);

    // Merge into an in-memory manifest; nothing is persisted
    Result<SyncReport> run(manifest::Manifest& manifest, const SyncOptions& options);

    // load -> run -> save once. The manifest is not rewritten when the run aborts.
    Result<SyncReport> synchronize(const std::filesystem::path& manifestPath,
                                   const SyncOptions& options);

private:
    template <typename T, typename Op>
    Result<T> withRetry(const SyncOptions& options, std::string_view what, Op&& op);

    ICatalogClient& client_;
    net::SessionContext session_;
};

// Drop files outside the os/lang filter; untagged files always survive
void pruneFiles(manifest::Item& item, const std::set<std::string>& osFilter,
                const std::set<std::string>& langFilter);

void logSyncReport(const SyncReport& report);

} // namespace shelf::sync
