#pragma once

#include <shelf/core/types.h>
#include <shelf/manifest/manifest.h>
#include <shelf/net/http.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace shelf::integrity {

enum class Check { Checksum, Size, Archive };
enum class Disposition { Report, Delete };

const char* checkName(Check check) noexcept;
std::optional<Check> parseCheck(std::string_view name) noexcept;
const char* dispositionName(Disposition disposition) noexcept;
std::optional<Disposition> parseDisposition(std::string_view name) noexcept;

// Outcome of one dimension for one file
enum class CheckResult {
    NotRun,        // not requested
    Pass,
    Fail,
    NotApplicable, // declared value unknown, or not an archive
    Unreadable     // the file could not be read; says nothing about its content
};

enum class FileStatus { Passed, Failed, Missing };

struct VerificationRecord {
    std::string itemId;
    std::string fileName;
    std::filesystem::path path;
    FileStatus status{FileStatus::Passed};
    CheckResult checksum{CheckResult::NotRun};
    CheckResult size{CheckResult::NotRun};
    CheckResult archive{CheckResult::NotRun};
    std::vector<Error> problems; // one per failed dimension
    bool deleted{false};

    [[nodiscard]] bool passed() const noexcept { return status == FileStatus::Passed; }

    // A dimension positively disagrees with the manifest (read errors do not count)
    [[nodiscard]] bool mismatched() const noexcept {
        return checksum == CheckResult::Fail || size == CheckResult::Fail ||
               archive == CheckResult::Fail;
    }
};

enum class ItemStatus { AllPassed, SomeFailed, SomeMissing };

struct ItemSummary {
    std::string id;
    ItemStatus status{ItemStatus::AllPassed};
    std::size_t passed{0};
    std::size_t failed{0};
    std::size_t missing{0};
};

struct VerifyOptions {
    std::set<Check> checks{Check::Checksum, Check::Size, Check::Archive};
    Disposition disposition{Disposition::Report};
    std::optional<std::string> itemId;
    net::ShouldCancel shouldCancel{};
};

struct VerifyReport {
    std::size_t files{0}; // files the manifest expects under the root
    std::size_t present{0};
    std::size_t missing{0};
    std::size_t checksumFailures{0};
    std::size_t sizeFailures{0};
    std::size_t archiveFailures{0};
    std::size_t readFailures{0};
    std::size_t unresolvable{0}; // records whose id or name does not map below the root
    std::size_t deleted{0};
    bool cancelled{false};
    std::vector<VerificationRecord> records;
    std::vector<ItemSummary> items;
};

/**
 * Re-checks on-disk files against the manifest. Reads the manifest only; the filesystem is
 * touched for every file on every run and, with Disposition::Delete, failing files are removed.
 */
class IntegrityVerifier {
public:
    explicit IntegrityVerifier(VerifyOptions options = {});

    Result<VerifyReport> verify(const manifest::Manifest& manifest,
                                const std::filesystem::path& root) const;

    VerificationRecord verifyFile(const manifest::Item& item, const manifest::FileRecord& file,
                                  const std::filesystem::path& path) const;

private:
    [[nodiscard]] bool enabled(Check check) const { return options_.checks.count(check) > 0; }

    VerifyOptions options_;
};

// Archive formats scanned entry by entry (.zip, .7z, .tar, .tar.gz, .tgz, .rar)
bool isArchivePath(const std::filesystem::path& path);

/**
 * Reads every entry of the archive to the end so that CRC and decompression errors surface.
 * ArchiveCorrupt on any structural or data error.
 */
Result<void> scanArchive(const std::filesystem::path& path);

void logVerifyReport(const VerifyReport& report, const VerifyOptions& options);

} // namespace shelf::integrity
