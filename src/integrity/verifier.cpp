#include <shelf/core/fs_utils.h>
#include <shelf/crypto/hasher.h>
#include <shelf/downloader/downloader.hpp>
#include <shelf/integrity/verifier.h>
#include <shelf/scheduler/download_scheduler.h>

#include <spdlog/spdlog.h>

#include <unordered_map>

namespace shelf::integrity {

namespace fs = std::filesystem;

const char* checkName(Check check) noexcept {
    switch (check) {
        case Check::Checksum:
            return "checksum";
        case Check::Size:
            return "size";
        case Check::Archive:
            return "archive";
    }
    return "unknown";
}

std::optional<Check> parseCheck(std::string_view name) noexcept {
    if (name == "checksum")
        return Check::Checksum;
    if (name == "size")
        return Check::Size;
    if (name == "archive")
        return Check::Archive;
    return std::nullopt;
}

const char* dispositionName(Disposition disposition) noexcept {
    return disposition == Disposition::Delete ? "delete" : "report";
}

std::optional<Disposition> parseDisposition(std::string_view name) noexcept {
    if (name == "report")
        return Disposition::Report;
    if (name == "delete")
        return Disposition::Delete;
    return std::nullopt;
}

IntegrityVerifier::IntegrityVerifier(VerifyOptions options) : options_(std::move(options)) {}

VerificationRecord IntegrityVerifier::verifyFile(const manifest::Item& item,
                                                 const manifest::FileRecord& file,
                                                 const fs::path& path) const {
    VerificationRecord rec;
    rec.itemId = item.id;
    rec.fileName = file.name;
    rec.path = path;

    const auto onDisk = fsutil::regularFileSize(path);
    if (!onDisk) {
        rec.status = FileStatus::Missing;
        return rec;
    }

    if (!file.size && !file.checksum)
        spdlog::warn("{}/{}: no size or checksum on record", item.id, file.name);

    if (enabled(Check::Checksum)) {
        if (!file.checksum) {
            rec.checksum = CheckResult::NotApplicable;
        } else {
            auto hasher = crypto::createHasher(file.checksum->algo);
            auto digest = hasher->hashFile(path);
            if (!digest) {
                rec.checksum = CheckResult::Unreadable;
                rec.problems.push_back(digest.error());
            } else if (digest.value() != file.checksum->hex) {
                rec.checksum = CheckResult::Fail;
                rec.problems.push_back(Error{ErrorCode::ChecksumMismatch,
                                             file.name + ": expected " + file.checksum->hex +
                                                 ", found " + digest.value()});
            } else {
                rec.checksum = CheckResult::Pass;
            }
        }
    }

    if (enabled(Check::Size)) {
        if (!file.size) {
            rec.size = CheckResult::NotApplicable;
        } else if (*onDisk != *file.size) {
            rec.size = CheckResult::Fail;
            rec.problems.push_back(Error{ErrorCode::SizeMismatch,
                                         file.name + ": expected " + std::to_string(*file.size) +
                                             " bytes, found " + std::to_string(*onDisk)});
        } else {
            rec.size = CheckResult::Pass;
        }
    }

    if (enabled(Check::Archive)) {
        if (!isArchivePath(path)) {
            rec.archive = CheckResult::NotApplicable;
        } else if (auto r = scanArchive(path); !r) {
            rec.archive = CheckResult::Fail;
            rec.problems.push_back(r.error());
        } else {
            rec.archive = CheckResult::Pass;
        }
    }

    rec.status = rec.problems.empty() ? FileStatus::Passed : FileStatus::Failed;
    return rec;
}

Result<VerifyReport> IntegrityVerifier::verify(const manifest::Manifest& manifest,
                                               const fs::path& root) const {
    if (options_.itemId && !manifest.contains(*options_.itemId))
        return Error{ErrorCode::UnknownItem, "'" + *options_.itemId + "' is not in the manifest"};

    manifest::ManifestFilter filter;
    filter.itemId = options_.itemId;

    VerifyReport report;
    std::unordered_map<std::string, std::size_t> summaryIndex;

    spdlog::info("verifying files under {}", root.string());
    for (const auto& ref : manifest.query(filter)) {
        if (options_.shouldCancel && options_.shouldCancel()) {
            report.cancelled = true;
            break;
        }

        const auto& item = *ref.item;
        const auto& file = *ref.file;
        ++report.files;
        auto resolved = scheduler::targetPathFor(root, item, file);
        if (!resolved) {
            ++report.unresolvable;
            spdlog::error("{}/{}: {}", item.id, file.name, resolved.error().message);
            continue;
        }
        const auto path = std::move(resolved).value();

        auto rec = verifyFile(item, file, path);
        const auto label = item.id + "/" + file.name;

        if (rec.status == FileStatus::Missing) {
            ++report.missing;
            spdlog::info("missing {}", label);
            if (options_.disposition == Disposition::Delete) {
                const auto part = downloader::partPathFor(path);
                std::error_code ec;
                if (fs::remove(part, ec)) {
                    spdlog::info("removed stale partial {}", part.string());
                    rec.deleted = true;
                } else if (ec) {
                    spdlog::warn("cannot remove {}: {}", part.string(), ec.message());
                }
            }
        } else {
            ++report.present;
            if (rec.checksum == CheckResult::Fail)
                ++report.checksumFailures;
            if (rec.size == CheckResult::Fail)
                ++report.sizeFailures;
            if (rec.archive == CheckResult::Fail)
                ++report.archiveFailures;
            if (rec.checksum == CheckResult::Unreadable)
                ++report.readFailures;

            if (rec.status == FileStatus::Failed) {
                for (const auto& p : rec.problems)
                    spdlog::error("{}: {} ({})", label, p.code, p.message);
                if (options_.disposition == Disposition::Delete && rec.mismatched()) {
                    std::error_code ec;
                    if (fs::remove(path, ec)) {
                        spdlog::info("deleted {}", label);
                        rec.deleted = true;
                        ++report.deleted;
                    } else {
                        spdlog::error("cannot delete {}: {}", path.string(), ec.message());
                    }
                }
            } else {
                spdlog::debug("ok {}", label);
            }
        }

        auto [it, inserted] = summaryIndex.try_emplace(item.id, report.items.size());
        if (inserted)
            report.items.push_back(ItemSummary{item.id});
        auto& summary = report.items[it->second];
        switch (rec.status) {
            case FileStatus::Passed:
                ++summary.passed;
                break;
            case FileStatus::Failed:
                ++summary.failed;
                summary.status = ItemStatus::SomeFailed;
                break;
            case FileStatus::Missing:
                ++summary.missing;
                if (summary.status == ItemStatus::AllPassed)
                    summary.status = ItemStatus::SomeMissing;
                break;
        }

        report.records.push_back(std::move(rec));
    }
    return report;
}

void logVerifyReport(const VerifyReport& report, const VerifyOptions& options) {
    const auto on = [&](Check c) { return options.checks.count(c) > 0; };
    spdlog::info("--totals--");
    spdlog::info("  files in manifest... {}", report.files);
    spdlog::info("  present............. {}", report.present - report.deleted);
    spdlog::info("  missing............. {}", report.missing + report.deleted);
    if (on(Check::Checksum))
        spdlog::info("  checksum mismatches. {}", report.checksumFailures);
    if (on(Check::Size))
        spdlog::info("  size mismatches..... {}", report.sizeFailures);
    if (on(Check::Archive))
        spdlog::info("  archive failures.... {}", report.archiveFailures);
    if (report.readFailures > 0)
        spdlog::info("  unreadable.......... {}", report.readFailures);
    if (report.unresolvable > 0)
        spdlog::info("  unusable names...... {}", report.unresolvable);
    if (options.disposition == Disposition::Delete)
        spdlog::info("  deleted............. {}", report.deleted);
    if (report.cancelled)
        spdlog::info("  (run was cancelled)");
}

} // namespace shelf::integrity
