#include <shelf/core/fs_utils.h>
#include <shelf/scheduler/download_scheduler.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <mutex>
#include <thread>

namespace shelf::scheduler {

namespace fs = std::filesystem;
using downloader::FetchOutcome;
using downloader::SkipReason;
using downloader::TaskState;

namespace {

bool cancelRequested(const net::ShouldCancel& shouldCancel) {
    return shouldCancel && shouldCancel();
}

std::string taskLabel(const DownloadTask& task) {
    return task.item->id + "/" + task.file->name;
}

} // namespace

manifest::ManifestFilter SelectionFilter::toManifestFilter() const {
    manifest::ManifestFilter f;
    f.osSet = osSet;
    f.langSet = langSet;
    f.itemId = itemId;
    if (includeGames) {
        f.kindSet.insert(manifest::FileKind::Installer);
        f.kindSet.insert(manifest::FileKind::Patch);
        f.kindSet.insert(manifest::FileKind::LanguagePack);
    }
    if (includeExtras)
        f.kindSet.insert(manifest::FileKind::Extra);
    return f;
}

Result<fs::path> itemDirFor(const fs::path& root, const manifest::Item& item) {
    if (!manifest::isSafePathComponent(item.id))
        return Error{ErrorCode::InvalidData, "item id '" + item.id + "' is not a directory name"};
    return root / item.id;
}

Result<fs::path> targetPathFor(const fs::path& root, const manifest::Item& item,
                               const manifest::FileRecord& file) {
    auto itemDir = itemDirFor(root, item);
    if (!itemDir)
        return itemDir.error();
    if (!manifest::isSafePathComponent(file.name))
        return Error{ErrorCode::InvalidData,
                     item.id + ": file name '" + file.name + "' is not a plain file name"};

    auto dir = std::move(itemDir).value();
    switch (file.kind) {
        case manifest::FileKind::Installer:
            break;
        case manifest::FileKind::Extra:
            dir /= "extras";
            break;
        case manifest::FileKind::Patch:
            dir /= "patches";
            break;
        case manifest::FileKind::LanguagePack:
            dir /= "language_packs";
            break;
    }
    auto target = dir / file.name;

    // Whatever the components, the result stays below the root
    const auto rel = target.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || *rel.begin() == "..")
        return Error{ErrorCode::InvalidData, target.string() + " is outside " + root.string()};
    return target;
}

DownloadScheduler::DownloadScheduler(SchedulerOptions options) : options_(std::move(options)) {}

Result<void> DownloadScheduler::waitForStart() const {
    if (options_.startDelay.count() <= 0)
        return {};

    spdlog::info("waiting {} minute(s) before starting...",
                 std::chrono::duration_cast<std::chrono::minutes>(options_.startDelay).count());

    // Sliced so an interrupt does not have to sit out the whole wait
    constexpr std::chrono::milliseconds kSlice{1000};
    auto remaining = options_.startDelay;
    while (remaining.count() > 0) {
        if (cancelRequested(options_.shouldCancel))
            return Error{ErrorCode::OperationCancelled, "cancelled while waiting to start"};
        const auto step = std::min(remaining, kSlice);
        if (options_.sleeper)
            options_.sleeper(step);
        remaining -= step;
    }
    return {};
}

Result<std::vector<DownloadTask>> DownloadScheduler::schedule(const manifest::Manifest& manifest,
                                                              const SelectionFilter& filter,
                                                              const fs::path& root) const {
    if (filter.itemId && !manifest.contains(*filter.itemId))
        return Error{ErrorCode::UnknownItem, "'" + *filter.itemId + "' is not in the manifest"};

    if (auto w = waitForStart(); !w)
        return w.error();

    std::vector<DownloadTask> plan;
    if (!filter.includeGames && !filter.includeExtras)
        return plan;

    for (const auto& ref : manifest.query(filter.toManifestFilter())) {
        DownloadTask task;
        task.item = ref.item;
        task.file = ref.file;

        if (ref.file->name.empty() || ref.file->url.empty()) {
            spdlog::warn("{}/{}: no name or URL, cannot schedule", ref.item->id, ref.file->name);
            task.state = TaskState::Skipped;
            task.skipReason = SkipReason::Unschedulable;
            plan.push_back(std::move(task));
            continue;
        }

        auto target = targetPathFor(root, *ref.item, *ref.file);
        if (!target) {
            spdlog::error("{}: {}", ref.item->id, target.error().message);
            task.state = TaskState::Skipped;
            task.skipReason = SkipReason::Unschedulable;
            plan.push_back(std::move(task));
            continue;
        }
        task.target = std::move(target).value();
        task.itemDir = itemDirFor(root, *ref.item).value();

        if (auto onDisk = fsutil::regularFileSize(task.target)) {
            if (!ref.file->size) {
                spdlog::warn("{}: no size info on record, skipping existing file (run verify)",
                             task.target.string());
                task.state = TaskState::Skipped;
                task.skipReason = SkipReason::AlreadyPresent;
            } else if (*onDisk == *ref.file->size) {
                spdlog::debug("{}: already present", task.target.string());
                task.state = TaskState::Skipped;
                task.skipReason = SkipReason::AlreadyPresent;
            } else {
                spdlog::info("{}: wrong size ({} vs {}), re-fetching", task.target.string(),
                             *onDisk, *ref.file->size);
            }
        }
        plan.push_back(std::move(task));
    }
    return plan;
}

DownloadRunner::DownloadRunner(downloader::FileFetcher& fetcher, int concurrency)
    : fetcher_(fetcher), concurrency_(std::clamp(concurrency, 1, kMaxConcurrency)) {}

FetchOutcome DownloadRunner::runOne(DownloadTask& task) {
    if (task.state == TaskState::Skipped) {
        FetchOutcome o;
        o.state = task.state;
        o.skipReason = task.skipReason;
        return o;
    }
    return fetcher_.fetch(task);
}

DownloadReport DownloadRunner::run(std::vector<DownloadTask>& plan) {
    DownloadReport report;
    report.outcomes.resize(plan.size());
    std::vector<bool> ran(plan.size(), false);
    const auto& shouldCancel = fetcher_.options().shouldCancel;

    if (concurrency_ <= 1 || plan.size() <= 1) {
        for (std::size_t i = 0; i < plan.size(); ++i) {
            if (cancelRequested(shouldCancel))
                break;
            report.outcomes[i] = runOne(plan[i]);
            ran[i] = true;
        }
    } else {
        std::deque<std::size_t> queue;
        for (std::size_t i = 0; i < plan.size(); ++i)
            queue.push_back(i);
        std::mutex queueMutex;

        auto worker = [&] {
            for (;;) {
                std::size_t i = 0;
                {
                    std::lock_guard<std::mutex> lock(queueMutex);
                    if (queue.empty() || cancelRequested(shouldCancel))
                        return;
                    i = queue.front();
                    queue.pop_front();
                    ran[i] = true;
                }
                report.outcomes[i] = runOne(plan[i]);
            }
        };

        const auto n = std::min<std::size_t>(static_cast<std::size_t>(concurrency_), plan.size());
        std::vector<std::thread> workers;
        workers.reserve(n);
        for (std::size_t w = 0; w < n; ++w)
            workers.emplace_back(worker);
        for (auto& t : workers)
            t.join();
    }

    for (std::size_t i = 0; i < plan.size(); ++i) {
        if (!ran[i]) {
            report.cancelled = true;
            continue;
        }
        const auto& o = report.outcomes[i];
        report.bytes += o.bytes;
        switch (o.state) {
            case TaskState::Completed:
                ++report.completed;
                break;
            case TaskState::Skipped:
                if (o.skipReason == SkipReason::Unschedulable)
                    ++report.unschedulable;
                else
                    ++report.skipped;
                break;
            case TaskState::FailedFatal:
                if (o.error && o.error->code == ErrorCode::OperationCancelled) {
                    report.cancelled = true;
                } else {
                    report.failures.emplace_back(
                        taskLabel(plan[i]),
                        o.error.value_or(Error{ErrorCode::FetchFailed, "unknown failure"}));
                }
                break;
            case TaskState::Pending:
            case TaskState::InProgress:
                break;
        }
    }
    return report;
}

void logDownloadReport(const DownloadReport& report) {
    spdlog::info("--totals--");
    spdlog::info("  completed:     {}", report.completed);
    spdlog::info("  skipped:       {}", report.skipped);
    if (report.unschedulable > 0)
        spdlog::info("  unschedulable: {}", report.unschedulable);
    spdlog::info("  failed:        {}", report.failures.size());
    for (const auto& [label, err] : report.failures)
        spdlog::info("    {} ({}: {})", label, err.code, err.message);
    spdlog::info("  received:      {} bytes", report.bytes);
    if (report.cancelled)
        spdlog::info("  (run was cancelled)");
}

} // namespace shelf::scheduler
