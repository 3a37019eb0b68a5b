#pragma once

#include <shelf/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace shelf::fsutil {

/**
 * Flush file contents to stable storage.
 */
Result<void> fsyncFile(const std::filesystem::path& p);

/**
 * Flush a directory so that a rename inside it survives a crash.
 */
Result<void> fsyncDir(const std::filesystem::path& dir);

/**
 * Write `content` to a sibling temporary ("<target><tempSuffix>"), fsync it, rename it over
 * `target`, then fsync the parent directory. Readers see either the old or the new file.
 */
Result<void> writeFileAtomic(const std::filesystem::path& target, std::string_view content,
                             std::string_view tempSuffix = ".tmp");

/**
 * Size of a regular file, or std::nullopt when absent / not a regular file.
 */
std::optional<std::uint64_t> regularFileSize(const std::filesystem::path& p) noexcept;

} // namespace shelf::fsutil
