#include <shelf/integrity/verifier.h>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace shelf::integrity {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// Owns one libarchive read handle
class ArchiveReader {
public:
    ArchiveReader() : a_(archive_read_new()) {
        if (a_) {
            archive_read_support_filter_all(a_);
            archive_read_support_format_all(a_);
        }
    }
    ~ArchiveReader() {
        if (a_) {
            archive_read_close(a_);
            archive_read_free(a_);
        }
    }
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    struct archive* get() const noexcept { return a_; }

    std::string lastError() const {
        const char* msg = a_ ? archive_error_string(a_) : nullptr;
        return msg ? msg : "unknown libarchive error";
    }

private:
    struct archive* a_;
};

} // namespace

bool isArchivePath(const std::filesystem::path& path) {
    static constexpr std::array<std::string_view, 6> kSuffixes{".zip", ".7z",  ".tar",
                                                                ".tar.gz", ".tgz", ".rar"};
    const auto name = lower(path.filename().string());
    return std::any_of(kSuffixes.begin(), kSuffixes.end(),
                       [&](std::string_view s) { return endsWith(name, s); });
}

Result<void> scanArchive(const std::filesystem::path& path) {
    ArchiveReader reader;
    auto* a = reader.get();
    if (!a)
        return Error{ErrorCode::Unknown, "archive_read_new failed"};

    if (archive_read_open_filename(a, path.c_str(), 10240) != ARCHIVE_OK) {
        return Error{ErrorCode::ArchiveCorrupt,
                     path.filename().string() + ": cannot open archive: " + reader.lastError()};
    }

    std::size_t entries = 0;
    struct archive_entry* entry = nullptr;
    for (;;) {
        const int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF)
            break;
        if (r == ARCHIVE_WARN) {
            spdlog::debug("{}: {}", path.filename().string(), reader.lastError());
        } else if (r != ARCHIVE_OK) {
            return Error{ErrorCode::ArchiveCorrupt,
                         path.filename().string() + ": bad entry header: " + reader.lastError()};
        }
        ++entries;

        const char* entryName = archive_entry_pathname(entry);
        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        for (;;) {
            const int d = archive_read_data_block(a, &buff, &size, &offset);
            if (d == ARCHIVE_EOF)
                break;
            // A CRC mismatch on a stored entry only raises ARCHIVE_WARN
            if (d != ARCHIVE_OK) {
                return Error{ErrorCode::ArchiveCorrupt,
                             path.filename().string() + ": entry '" +
                                 (entryName ? entryName : "?") + "': " + reader.lastError()};
            }
        }
    }

    spdlog::debug("{}: {} entries OK ({})", path.filename().string(), entries,
                  archive_format_name(a) ? archive_format_name(a) : "unknown format");
    return {};
}

} // namespace shelf::integrity
