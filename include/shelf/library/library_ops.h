#pragma once

#include <shelf/core/types.h>
#include <shelf/manifest/manifest.h>
#include <shelf/net/http.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace shelf::library {

struct CopyReport {
    std::size_t scanned{0};
    std::size_t copied{0};
    std::size_t skipped{0};
    std::uint64_t bytes{0};
    std::vector<std::pair<std::string, Error>> failures; // path or "<item>/<file>", cause
};

/**
 * Hash every file below `srcDir` and copy the ones whose checksum matches a manifest record to
 * that record's place under `root`. Zip archives are not considered: the service publishes no
 * checksums for them. A destination that already hashes the same is left alone.
 */
Result<CopyReport> importFiles(const manifest::Manifest& manifest,
                               const std::filesystem::path& srcDir,
                               const std::filesystem::path& root,
                               const net::ShouldCancel& shouldCancel = {});

/**
 * Incremental copy of a library: every manifest file present in `srcRoot` with its declared
 * size is copied to `destRoot` unless already there at that size. Sidecars follow for every
 * item that had a file copied.
 */
Result<CopyReport> backupLibrary(const manifest::Manifest& manifest,
                                 const std::filesystem::path& srcRoot,
                                 const std::filesystem::path& destRoot,
                                 const net::ShouldCancel& shouldCancel = {});

// Copy through "<dest>.tmp" and rename, so `dest` is never half-written
Result<void> copyFileAtomic(const std::filesystem::path& src, const std::filesystem::path& dest);

void logCopyReport(const char* title, const CopyReport& report);

} // namespace shelf::library
