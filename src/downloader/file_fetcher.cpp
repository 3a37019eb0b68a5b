/*
 * file_fetcher.cpp
 *
 * Flow per task:
 * - Target already present with the declared size: Skipped, no request.
 * - Dry run: log and Skipped, nothing touched.
 * - Otherwise up to maxAttempts GETs into "<target>.part" (ranged when a partial exists),
 *   backoff between transient failures, size check, rename, sidecars.
 */

#include <shelf/core/fs_utils.h>
#include <shelf/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace shelf::downloader {

namespace fs = std::filesystem;

const char* stateName(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:
            return "pending";
        case TaskState::InProgress:
            return "in-progress";
        case TaskState::Completed:
            return "completed";
        case TaskState::FailedFatal:
            return "failed";
        case TaskState::Skipped:
            return "skipped";
    }
    return "unknown";
}

const char* skipReasonName(SkipReason reason) noexcept {
    switch (reason) {
        case SkipReason::None:
            return "none";
        case SkipReason::AlreadyPresent:
            return "already present";
        case SkipReason::DryRun:
            return "dry run";
        case SkipReason::Unschedulable:
            return "unschedulable";
    }
    return "unknown";
}

fs::path partPathFor(const fs::path& target) {
    fs::path p = target;
    p += ".part";
    return p;
}

FileFetcher::FileFetcher(net::IHttpAdapter& http, net::SessionContext session,
                         FetchOptions options)
    : http_(http), session_(std::move(session)), options_(std::move(options)) {}

FetchOutcome FileFetcher::fetch(DownloadTask& task) {
    FetchOutcome outcome;
    const auto& file = *task.file;

    if (auto existing = fsutil::regularFileSize(task.target)) {
        if (!file.size)
            spdlog::warn("{}: no size info on record, keeping the existing file (run verify)",
                         task.target.string());
        if (!file.size || *existing == *file.size) {
            task.state = TaskState::Skipped;
            task.skipReason = SkipReason::AlreadyPresent;
            outcome.state = task.state;
            outcome.skipReason = task.skipReason;
            return outcome;
        }
    }

    if (options_.dryRun) {
        spdlog::info("[dry-run] {} -> {}", file.name, task.target.string());
        task.state = TaskState::Skipped;
        task.skipReason = SkipReason::DryRun;
        outcome.state = task.state;
        outcome.skipReason = task.skipReason;
        return outcome;
    }

    std::error_code ec;
    fs::create_directories(task.target.parent_path(), ec);
    if (ec) {
        task.state = TaskState::FailedFatal;
        outcome.state = task.state;
        outcome.error = Error{ErrorCode::FilesystemError, "cannot create " +
                                                              task.target.parent_path().string() +
                                                              ": " + ec.message()};
        return outcome;
    }

    const int maxAttempts = std::max(1, options_.retry.maxAttempts);
    bool exhausted = false;
    while (outcome.attempts < maxAttempts) {
        if (options_.shouldCancel && options_.shouldCancel()) {
            outcome.error = Error{ErrorCode::OperationCancelled, file.name + ": cancelled"};
            break;
        }

        task.state = TaskState::InProgress;
        ++outcome.attempts;
        const auto verdict = attempt(task, outcome);

        if (verdict == AttemptVerdict::Done) {
            task.state = TaskState::Completed;
            outcome.state = task.state;
            outcome.error.reset();
            return outcome;
        }
        if (verdict == AttemptVerdict::Fatal)
            break;

        task.state = TaskState::Pending;
        if (outcome.attempts >= maxAttempts) {
            exhausted = true;
            break;
        }
        if (verdict == AttemptVerdict::Retry) {
            const auto delay = backoffFor(options_.retry, outcome.attempts);
            spdlog::warn("{}: {} (attempt {}/{}), retrying in {} ms", file.name,
                         outcome.error ? outcome.error->message : std::string("failed"),
                         outcome.attempts, maxAttempts, delay.count());
            if (options_.sleeper)
                options_.sleeper(delay);
        }
    }

    task.state = TaskState::FailedFatal;
    outcome.state = task.state;
    if (!outcome.error) {
        outcome.error = Error{ErrorCode::FetchFailed, file.name + ": gave up"};
    } else if (exhausted) {
        outcome.error = Error{ErrorCode::FetchFailed,
                              file.name + ": gave up after " + std::to_string(outcome.attempts) +
                                  " attempt(s): " + outcome.error->message};
    }
    return outcome;
}

FileFetcher::AttemptVerdict FileFetcher::attempt(const DownloadTask& task, FetchOutcome& outcome) {
    const auto& file = *task.file;
    const auto part = partPathFor(task.target);
    std::error_code ec;

    std::uint64_t have = fsutil::regularFileSize(part).value_or(0);
    if (file.size && have > *file.size) {
        spdlog::warn("{}: partial larger than declared size, restarting", file.name);
        fs::remove(part, ec);
        have = 0;
    }

    // A complete partial left by an interrupted run only needs the final checks
    const bool needTransfer = !(file.size && have == *file.size && have > 0);

    if (needTransfer) {
        auto request = session_.request(file.url);
        if (have > 0) {
            request.rangeStart = have;
            spdlog::info("{}: resuming at byte {}", file.name, have);
        } else {
            spdlog::info("{}: downloading{}", file.name,
                         file.size ? " (" + std::to_string(*file.size) + " bytes)" : "");
        }

        std::ofstream out;
        net::BodySink sink = [&](long status,
                                 std::span<const std::byte> data) -> Result<void> {
            if (!out.is_open()) {
                // 206 continues the partial; a plain 200 restarts it
                const bool append = status == 206 && request.rangeStart.has_value();
                out.open(part, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
                if (!out)
                    return Error{ErrorCode::FilesystemError, "cannot open " + part.string()};
            }
            out.write(reinterpret_cast<const char*>(data.data()),
                      static_cast<std::streamsize>(data.size()));
            if (!out)
                return Error{ErrorCode::FilesystemError, "write failed for " + part.string()};
            return {};
        };

        auto res = http_.get(request, sink, options_.shouldCancel, options_.onProgress);
        if (out.is_open()) {
            out.flush();
            out.close();
        }

        if (!res) {
            outcome.error = res.error();
            return isTransient(res.error().code) ? AttemptVerdict::Retry : AttemptVerdict::Fatal;
        }

        const auto& http = res.value();
        outcome.bytes += http.bytes;

        if (http.status == net::kStatusRangeNotSatisfiable) {
            spdlog::warn("{}: server rejected resume range, restarting from zero", file.name);
            fs::remove(part, ec);
            outcome.error = Error{ErrorCode::HttpError, file.name + ": HTTP 416"};
            return AttemptVerdict::RetryNow;
        }
        if (net::isServerErrorStatus(http.status) || http.status == 429) {
            outcome.error = Error{ErrorCode::TransientNetworkError,
                                  file.name + ": HTTP " + std::to_string(http.status)};
            return AttemptVerdict::Retry;
        }
        if (!net::isSuccessStatus(http.status)) {
            outcome.error =
                Error{ErrorCode::HttpError, file.name + ": HTTP " + std::to_string(http.status)};
            return AttemptVerdict::Fatal;
        }
        if (http.bytes == 0 && !fs::exists(part, ec)) {
            // Empty body: still materialize an empty file
            std::ofstream touch(part, std::ios::binary | std::ios::trunc);
            if (!touch) {
                outcome.error = Error{ErrorCode::FilesystemError, "cannot create " + part.string()};
                return AttemptVerdict::Fatal;
            }
        }
    }

    const auto got = fsutil::regularFileSize(part).value_or(0);
    if (file.size && got != *file.size) {
        fs::remove(part, ec);
        outcome.error = Error{ErrorCode::SizeMismatch,
                              file.name + ": expected " + std::to_string(*file.size) +
                                  " bytes, received " + std::to_string(got)};
        return AttemptVerdict::Fatal;
    }

    if (auto r = fsutil::fsyncFile(part); !r) {
        outcome.error = r.error();
        return AttemptVerdict::Fatal;
    }
    fs::rename(part, task.target, ec);
    if (ec) {
        outcome.error = Error{ErrorCode::FilesystemError, "rename() failed (" + ec.message() +
                                                              ") for " + task.target.string()};
        return AttemptVerdict::Fatal;
    }

    if (options_.writeSidecars && task.item) {
        std::lock_guard<std::mutex> lock(sidecarMutex_);
        if (auto r = writeSidecars(*task.item, task.itemDir); !r)
            spdlog::warn("{}: sidecars not written: {}", task.item->id, r.error().message);
    }

    spdlog::info("{}: done", file.name);
    return AttemptVerdict::Done;
}

} // namespace shelf::downloader
