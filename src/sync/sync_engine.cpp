#include <shelf/sync/sync_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>

namespace shelf::sync {

namespace {

constexpr std::array<std::pair<MergePolicy, std::string_view>, 4> kPolicyNames{{
    {MergePolicy::All, "all"},
    {MergePolicy::SkipKnown, "skip-known"},
    {MergePolicy::UpdatedOnly, "updated-only"},
    {MergePolicy::SingleId, "single-id"},
}};

bool cancelled(const SyncOptions& options) {
    return options.shouldCancel && options.shouldCancel();
}

bool tagAllowed(const std::string& tag, const std::set<std::string>& allowed) {
    return tag.empty() || allowed.empty() || allowed.count(tag) > 0;
}

} // namespace

const char* policyName(MergePolicy policy) noexcept {
    for (const auto& [p, name] : kPolicyNames) {
        if (p == policy)
            return name.data();
    }
    return "all";
}

std::optional<MergePolicy> parsePolicy(std::string_view name) noexcept {
    for (const auto& [p, n] : kPolicyNames) {
        if (n == name)
            return p;
    }
    return std::nullopt;
}

void pruneFiles(manifest::Item& item, const std::set<std::string>& osFilter,
                const std::set<std::string>& langFilter) {
    auto& files = item.files;
    files.erase(std::remove_if(files.begin(), files.end(),
                               [&](const manifest::FileRecord& f) {
                                   return !tagAllowed(f.os, osFilter) ||
                                          !tagAllowed(f.lang, langFilter);
                               }),
                files.end());
}

SyncEngine::SyncEngine(ICatalogClient& client, net::SessionContext session)
    : client_(client), session_(std::move(session)) {}

template <typename T, typename Op>
Result<T> SyncEngine::withRetry(const SyncOptions& options, std::string_view what, Op&& op) {
    const int maxAttempts = std::max(1, options.retry.maxAttempts);
    for (int attempt = 1;; ++attempt) {
        Result<T> r = op();
        if (r || !isTransient(r.error().code) || attempt >= maxAttempts)
            return r;

        const auto delay = backoffFor(options.retry, attempt);
        spdlog::warn("{}: {} (attempt {}/{}), retrying in {} ms", what, r.error().message, attempt,
                     maxAttempts, delay.count());
        if (cancelled(options))
            return Error{ErrorCode::OperationCancelled, std::string(what) + ": cancelled"};
        if (options.sleeper)
            options.sleeper(delay);
    }
}

Result<SyncReport> SyncEngine::run(manifest::Manifest& manifest, const SyncOptions& options) {
    SyncReport report;

    if (options.policy == MergePolicy::SingleId && options.singleId.empty())
        return Error{ErrorCode::InvalidArgument, "single-id policy requires an identifier"};

    spdlog::info("enumerating catalog...");
    auto listing = withRetry<std::vector<CatalogEntry>>(
        options, "catalog enumeration", [&] { return client_.enumerate(session_); });
    if (!listing)
        return listing.error();

    const auto& entries = listing.value();
    report.enumerated = entries.size();

    std::vector<std::string> selected;
    for (const auto& e : entries) {
        bool take = false;
        switch (options.policy) {
            case MergePolicy::All:
                take = true;
                break;
            case MergePolicy::SkipKnown:
                take = !manifest.contains(e.id);
                break;
            case MergePolicy::UpdatedOnly:
                take = e.updated;
                break;
            case MergePolicy::SingleId:
                take = e.id == options.singleId;
                break;
        }
        if (take)
            selected.push_back(e.id);
    }

    if (options.policy == MergePolicy::SingleId && selected.empty()) {
        return Error{ErrorCode::UnknownItem,
                     "'" + options.singleId + "' is not among the " +
                         std::to_string(report.enumerated) + " owned item(s)"};
    }

    report.selected = selected.size();
    spdlog::info("{} item(s) enumerated, {} selected ({})", report.enumerated, report.selected,
                 policyName(options.policy));

    std::size_t index = 0;
    for (const auto& id : selected) {
        if (cancelled(options)) {
            spdlog::warn("sync cancelled; {} of {} item(s) processed", index, selected.size());
            report.cancelled = true;
            break;
        }
        ++index;
        spdlog::info("({}/{}) fetching {}", index, selected.size(), id);

        auto detail = withRetry<manifest::Item>(options, id,
                                                [&] { return client_.fetchDetail(session_, id); });
        if (!detail) {
            const auto& err = detail.error();
            if (err.code == ErrorCode::AuthExpired) {
                spdlog::error("{}: {}", id, err.message);
                return err;
            }
            if (err.code == ErrorCode::OperationCancelled) {
                report.cancelled = true;
                break;
            }
            spdlog::error("{}: skipped ({}: {})", id, err.code, err.message);
            report.failures.emplace_back(id, err);
            continue;
        }

        auto item = std::move(detail).value();
        pruneFiles(item, options.osFilter, options.langFilter);

        switch (manifest.upsert(std::move(item), options.clock())) {
            case manifest::UpsertOutcome::Inserted:
                ++report.inserted;
                break;
            case manifest::UpsertOutcome::Updated:
                ++report.updated;
                break;
            case manifest::UpsertOutcome::Unchanged:
                ++report.unchanged;
                break;
        }
    }
    return report;
}

Result<SyncReport> SyncEngine::synchronize(const std::filesystem::path& manifestPath,
                                           const SyncOptions& options) {
    auto loaded = manifest::load(manifestPath);
    if (!loaded)
        return loaded.error();
    auto m = std::move(loaded).value();

    auto report = run(m, options);
    if (!report)
        return report;

    auto saved = manifest::save(manifestPath, m);
    if (!saved)
        return saved.error();
    return report;
}

void logSyncReport(const SyncReport& report) {
    spdlog::info("--totals--");
    spdlog::info("  enumerated: {}", report.enumerated);
    spdlog::info("  selected:   {}", report.selected);
    spdlog::info("  inserted:   {}", report.inserted);
    spdlog::info("  updated:    {}", report.updated);
    spdlog::info("  unchanged:  {}", report.unchanged);
    spdlog::info("  failed:     {}", report.failures.size());
    for (const auto& [id, err] : report.failures)
        spdlog::info("    {} ({})", id, err.message);
    if (report.cancelled)
        spdlog::info("  (run was cancelled)");
}

} // namespace shelf::sync
