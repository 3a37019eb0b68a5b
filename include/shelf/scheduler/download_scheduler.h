#pragma once

#include <shelf/core/retry.h>
#include <shelf/core/types.h>
#include <shelf/downloader/downloader.hpp>
#include <shelf/manifest/manifest.h>
#include <shelf/net/http.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace shelf::scheduler {

using downloader::DownloadTask;

struct SelectionFilter {
    std::set<std::string> osSet;
    std::set<std::string> langSet;
    std::optional<std::string> itemId;
    bool includeGames{true};  // installers, patches, language packs
    bool includeExtras{true}; // bonus content

    [[nodiscard]] manifest::ManifestFilter toManifestFilter() const;
};

// "<root>/<item id>". InvalidData when the id is not a plain directory name.
Result<std::filesystem::path> itemDirFor(const std::filesystem::path& root,
                                         const manifest::Item& item);

/**
 * Deterministic location of a file below the item directory, by kind. InvalidData when the
 * item id or file name is not a single path component, or the result would not lie below
 * `root`.
 */
Result<std::filesystem::path> targetPathFor(const std::filesystem::path& root,
                                            const manifest::Item& item,
                                            const manifest::FileRecord& file);

struct SchedulerOptions {
    // One-time wait before the first task is produced (off-peak runs)
    std::chrono::milliseconds startDelay{0};
    net::ShouldCancel shouldCancel{};
    Sleeper sleeper = threadSleeper();
};

/**
 * Turns manifest entries into an ordered work list. Targets already on disk with the declared
 * size are returned as Skipped (AlreadyPresent), as are existing targets whose size was never
 * declared (verify checks those). Entries without a name or URL, or whose name does not
 * resolve below the root, are Skipped (Unschedulable). Order follows manifest insertion order.
 */
class DownloadScheduler {
public:
    explicit DownloadScheduler(SchedulerOptions options = {});

    Result<std::vector<DownloadTask>> schedule(const manifest::Manifest& manifest,
                                               const SelectionFilter& filter,
                                               const std::filesystem::path& root) const;

private:
    Result<void> waitForStart() const;

    SchedulerOptions options_;
};

struct DownloadReport {
    std::size_t completed{0};
    std::size_t skipped{0};
    std::size_t unschedulable{0};
    std::vector<std::pair<std::string, Error>> failures; // "<item>/<file>", cause
    std::uint64_t bytes{0};
    bool cancelled{false};
    std::vector<downloader::FetchOutcome> outcomes; // parallel to the plan
};

/**
 * Executes a plan. Sequential by default; a concurrency of 2-4 runs a fixed pool of workers
 * over a shared queue. The report lists outcomes in plan order either way.
 */
class DownloadRunner {
public:
    static constexpr int kMaxConcurrency = 4;

    DownloadRunner(downloader::FileFetcher& fetcher, int concurrency = 1);

    DownloadReport run(std::vector<DownloadTask>& plan);

    [[nodiscard]] int concurrency() const noexcept { return concurrency_; }

private:
    downloader::FetchOutcome runOne(DownloadTask& task);

    downloader::FileFetcher& fetcher_;
    int concurrency_;
};

void logDownloadReport(const DownloadReport& report);

} // namespace shelf::scheduler
