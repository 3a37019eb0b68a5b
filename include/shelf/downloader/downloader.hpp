#pragma once

/*
 * shelf downloader - one resumable, retrying transfer per manifest file.
 *
 * - Bytes land in "<target>.part" beside the target (same filesystem, so the final rename is
 *   atomic); an existing partial is resumed with a range request.
 * - Completed transfers are size-checked against the declared size before the rename.
 * - Sidecars ("!info.txt", "!serial.txt") are refreshed in the item directory afterwards.
 */

#include <shelf/core/retry.h>
#include <shelf/core/types.h>
#include <shelf/manifest/manifest.h>
#include <shelf/net/http.h>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace shelf::downloader {

/**
 * Per-task lifecycle: Pending -> InProgress -> Completed, back to Pending on a retryable
 * failure, FailedFatal once the attempt budget is gone or on a non-retryable error.
 */
enum class TaskState { Pending, InProgress, Completed, FailedFatal, Skipped };

enum class SkipReason { None, AlreadyPresent, DryRun, Unschedulable };

const char* stateName(TaskState state) noexcept;
const char* skipReasonName(SkipReason reason) noexcept;

/**
 * One scheduled transfer. Borrows the item and file from the manifest, which must outlive it.
 */
struct DownloadTask {
    const manifest::Item* item{nullptr};
    const manifest::FileRecord* file{nullptr};
    std::filesystem::path target;  // final location of the file
    std::filesystem::path itemDir; // where the sidecars go
    TaskState state{TaskState::Pending};
    SkipReason skipReason{SkipReason::None};
};

struct FetchOptions {
    RetryPolicy retry{};
    bool dryRun{false};
    bool writeSidecars{true};
    net::ShouldCancel shouldCancel{};
    net::ProgressCallback onProgress{};
    Sleeper sleeper = threadSleeper();
};

struct FetchOutcome {
    TaskState state{TaskState::Pending};
    SkipReason skipReason{SkipReason::None};
    int attempts{0};
    std::uint64_t bytes{0}; // bytes received over the network by this call
    std::optional<Error> error;
};

std::filesystem::path partPathFor(const std::filesystem::path& target);

/**
 * Executes DownloadTasks. Thread-safe as long as the adapter is; the runner shares one fetcher
 * between its workers.
 */
class FileFetcher {
public:
    FileFetcher(net::IHttpAdapter& http, net::SessionContext session, FetchOptions options);

    FetchOutcome fetch(DownloadTask& task);

    [[nodiscard]] const FetchOptions& options() const noexcept { return options_; }

private:
    enum class AttemptVerdict { Done, Retry, RetryNow, Fatal };

    AttemptVerdict attempt(const DownloadTask& task, FetchOutcome& outcome);

    net::IHttpAdapter& http_;
    net::SessionContext session_;
    FetchOptions options_;
    std::mutex sidecarMutex_;
};

// Human-readable dump of an item and its files
std::string renderInfo(const manifest::Item& item);

/**
 * Refresh "!info.txt" and, when the item has a serial, "!serial.txt" in `itemDir`.
 */
Result<void> writeSidecars(const manifest::Item& item, const std::filesystem::path& itemDir);

inline constexpr const char* kInfoFileName = "!info.txt";
inline constexpr const char* kSerialFileName = "!serial.txt";

} // namespace shelf::downloader
