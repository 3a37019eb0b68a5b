#include <shelf/core/fs_utils.h>
#include <shelf/crypto/hasher.h>
#include <shelf/downloader/downloader.hpp>
#include <shelf/library/library_ops.h>
#include <shelf/scheduler/download_scheduler.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <unordered_map>

namespace shelf::library {

namespace fs = std::filesystem;

namespace {

bool cancelRequested(const net::ShouldCancel& shouldCancel) {
    return shouldCancel && shouldCancel();
}

bool isZip(const fs::path& p) {
    auto ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".zip";
}

Result<std::string> hashWith(crypto::HashAlgo algo, const fs::path& path) {
    auto hasher = crypto::createHasher(algo);
    return hasher->hashFile(path);
}

} // namespace

Result<void> copyFileAtomic(const fs::path& src, const fs::path& dest) {
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::FilesystemError,
                     "cannot create " + dest.parent_path().string() + ": " + ec.message()};
    }

    fs::path tmp = dest;
    tmp += ".tmp";
    fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tmp, rmEc);
        return Error{ErrorCode::FilesystemError,
                     "copy " + src.string() + " -> " + tmp.string() + " failed: " + ec.message()};
    }
    if (auto r = fsutil::fsyncFile(tmp); !r) {
        std::error_code rmEc;
        fs::remove(tmp, rmEc);
        return r;
    }
    fs::rename(tmp, dest, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tmp, rmEc);
        return Error{ErrorCode::FilesystemError,
                     "rename() failed (" + ec.message() + ") for " + dest.string()};
    }
    return {};
}

Result<CopyReport> importFiles(const manifest::Manifest& manifest, const fs::path& srcDir,
                               const fs::path& root, const net::ShouldCancel& shouldCancel) {
    std::error_code ec;
    if (!fs::is_directory(srcDir, ec))
        return Error{ErrorCode::InvalidArgument, srcDir.string() + " is not a directory"};

    // Declared checksums, per algorithm, to the records carrying them
    std::map<crypto::HashAlgo, std::unordered_multimap<std::string, manifest::FileRef>> byDigest;
    for (const auto& ref : manifest.query({})) {
        if (ref.file->checksum)
            byDigest[ref.file->checksum->algo].emplace(ref.file->checksum->hex, ref);
    }

    CopyReport report;
    spdlog::info("importing from {}", srcDir.string());

    fs::recursive_directory_iterator it(srcDir, fs::directory_options::skip_permission_denied, ec);
    if (ec)
        return Error{ErrorCode::FilesystemError, "cannot list " + srcDir.string() + ": " +
                                                     ec.message()};

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            report.failures.emplace_back(srcDir.string(),
                                         Error{ErrorCode::FilesystemError, ec.message()});
            break;
        }
        if (cancelRequested(shouldCancel))
            break;

        const auto& entry = *it;
        std::error_code typeEc;
        if (!entry.is_regular_file(typeEc) || isZip(entry.path()))
            continue;
        ++report.scanned;

        bool matched = false;
        for (const auto& [algo, index] : byDigest) {
            auto digest = hashWith(algo, entry.path());
            if (!digest) {
                report.failures.emplace_back(entry.path().string(), digest.error());
                break;
            }
            auto [lo, hi] = index.equal_range(digest.value());
            for (auto m = lo; m != hi; ++m) {
                matched = true;
                const auto& ref = m->second;
                auto resolved = scheduler::targetPathFor(root, *ref.item, *ref.file);
                if (!resolved) {
                    report.failures.emplace_back(ref.item->id + "/" + ref.file->name,
                                                 resolved.error());
                    continue;
                }
                const auto dest = std::move(resolved).value();

                if (fsutil::regularFileSize(dest)) {
                    auto existing = hashWith(algo, dest);
                    if (existing && existing.value() == digest.value()) {
                        spdlog::debug("{} already in place", dest.string());
                        ++report.skipped;
                        continue;
                    }
                }

                spdlog::info("import {} -> {}", entry.path().string(), dest.string());
                if (auto r = copyFileAtomic(entry.path(), dest); !r) {
                    report.failures.emplace_back(ref.item->id + "/" + ref.file->name, r.error());
                    continue;
                }
                ++report.copied;
                report.bytes += fsutil::regularFileSize(dest).value_or(0);
            }
        }
        if (!matched)
            spdlog::debug("{}: no matching record", entry.path().string());
    }
    return report;
}

Result<CopyReport> backupLibrary(const manifest::Manifest& manifest, const fs::path& srcRoot,
                                 const fs::path& destRoot, const net::ShouldCancel& shouldCancel) {
    std::error_code ec;
    if (!fs::is_directory(srcRoot, ec))
        return Error{ErrorCode::InvalidArgument, srcRoot.string() + " is not a directory"};

    CopyReport report;
    std::vector<const manifest::Item*> touched;

    for (const auto& ref : manifest.query({})) {
        if (cancelRequested(shouldCancel))
            break;

        const auto& item = *ref.item;
        const auto& file = *ref.file;
        auto src = scheduler::targetPathFor(srcRoot, item, file);
        auto dest = scheduler::targetPathFor(destRoot, item, file);
        if (!src || !dest) {
            report.failures.emplace_back(item.id + "/" + file.name,
                                         src ? dest.error() : src.error());
            continue;
        }

        const auto srcSize = fsutil::regularFileSize(src.value());
        if (!srcSize)
            continue;
        ++report.scanned;
        if (file.size && *srcSize != *file.size) {
            spdlog::warn("{}: size differs from manifest, not backed up", src.value().string());
            continue;
        }
        if (auto destSize = fsutil::regularFileSize(dest.value());
            destSize && *destSize == *srcSize) {
            ++report.skipped;
            continue;
        }

        spdlog::info("backup {}/{}", item.id, file.name);
        if (auto r = copyFileAtomic(src.value(), dest.value()); !r) {
            report.failures.emplace_back(item.id + "/" + file.name, r.error());
            continue;
        }
        ++report.copied;
        report.bytes += *srcSize;
        if (touched.empty() || touched.back() != &item)
            touched.push_back(&item);
    }

    for (const auto* item : touched) {
        // Only items whose files resolved get here, so their ids are valid directory names
        const auto srcDir = scheduler::itemDirFor(srcRoot, *item).value();
        const auto destDir = scheduler::itemDirFor(destRoot, *item).value();
        for (const char* name : {downloader::kInfoFileName, downloader::kSerialFileName}) {
            if (!fsutil::regularFileSize(srcDir / name))
                continue;
            if (auto r = copyFileAtomic(srcDir / name, destDir / name); !r)
                report.failures.emplace_back(item->id + "/" + name, r.error());
        }
    }
    return report;
}

void logCopyReport(const char* title, const CopyReport& report) {
    spdlog::info("--totals ({})--", title);
    spdlog::info("  scanned: {}", report.scanned);
    spdlog::info("  copied:  {} ({} bytes)", report.copied, report.bytes);
    spdlog::info("  skipped: {}", report.skipped);
    spdlog::info("  failed:  {}", report.failures.size());
    for (const auto& [what, err] : report.failures)
        spdlog::info("    {} ({})", what, err.message);
}

} // namespace shelf::library
