/*
 * Durable file helpers shared by the manifest store, the fetcher and sidecar writers.
 * Atomic replace = write temp, fsync, rename, fsync directory.
 */

#include <shelf/core/fs_utils.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <system_error>

#if defined(_WIN32)
#define NOMINMAX
#include <Windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace shelf::fsutil {

namespace fs = std::filesystem;

Result<void> fsyncFile(const fs::path& p) {
#if defined(_WIN32)
    HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::FilesystemError, "CreateFile failed for fsync: " + p.string()};
    }
    if (!FlushFileBuffers(h)) {
        CloseHandle(h);
        return Error{ErrorCode::FilesystemError, "FlushFileBuffers failed for: " + p.string()};
    }
    CloseHandle(h);
    return Result<void>();
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::FilesystemError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::FilesystemError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Result<void>();
#endif
}

Result<void> fsyncDir(const fs::path& dir) {
#if defined(_WIN32)
    // Directory entries are durable once MoveFileEx returns on NTFS.
    (void)dir;
    return Result<void>();
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::FilesystemError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::FilesystemError, "fsync(dir) failed for: " + dir.string()};
    }
    ::close(fd);
    return Result<void>();
#endif
}

Result<void> writeFileAtomic(const fs::path& target, std::string_view content,
                             std::string_view tempSuffix) {
    std::error_code ec;
    const auto parent = target.has_parent_path() ? target.parent_path() : fs::path(".");
    fs::create_directories(parent, ec);
    if (ec) {
        return Error{ErrorCode::FilesystemError,
                     "Failed to create directory " + parent.string() + ": " + ec.message()};
    }

    fs::path temp = target;
    temp += std::string(tempSuffix);

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::FilesystemError, "Failed to open " + temp.string()};
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            return Error{ErrorCode::FilesystemError, "Write failed for " + temp.string()};
        }
    }

    if (auto r = fsyncFile(temp); !r) {
        fs::remove(temp, ec);
        return r;
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(temp, rmEc);
        return Error{ErrorCode::FilesystemError, "rename() failed (" + ec.message() + ") from " +
                                                     temp.string() + " to " + target.string()};
    }

    if (auto r = fsyncDir(parent); !r) {
        spdlog::debug("fsync on {} failed (continuing): {}", parent.string(), r.error().message);
    }
    return Result<void>();
}

std::optional<std::uint64_t> regularFileSize(const fs::path& p) noexcept {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec) || ec)
        return std::nullopt;
    const auto sz = fs::file_size(p, ec);
    if (ec)
        return std::nullopt;
    return static_cast<std::uint64_t>(sz);
}

} // namespace shelf::fsutil
