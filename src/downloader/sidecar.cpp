#include <shelf/core/fs_utils.h>
#include <shelf/downloader/downloader.hpp>

#include <fmt/format.h>

namespace shelf::downloader {

namespace {

void appendFile(std::string& out, const manifest::FileRecord& f) {
    out += fmt::format("    [{}]{}\n", f.name, f.updated ? " (updated)" : "");
    out += fmt::format("        kind....... {}\n", manifest::kindName(f.kind));
    out += fmt::format("        os......... {}\n", f.os.empty() ? "any" : f.os);
    out += fmt::format("        lang....... {}\n", f.lang.empty() ? "any" : f.lang);
    out += fmt::format("        size....... {}\n", f.size ? std::to_string(*f.size) : "unknown");
    out += fmt::format("        checksum... {}\n",
                       f.checksum ? f.checksum->toString() : std::string("unknown"));
}

} // namespace

std::string renderInfo(const manifest::Item& item) {
    std::string out;
    out += fmt::format("\n-- {} --\n\n", item.title.empty() ? item.id : item.title);
    out += fmt::format("title.......... {}\n", item.title);
    out += fmt::format("id............. {}\n", item.id);
    if (!item.lastSynced.empty())
        out += fmt::format("synced......... {}\n", item.lastSynced);

    bool header = false;
    for (const auto& f : item.files) {
        if (f.kind == manifest::FileKind::Extra)
            continue;
        if (!header) {
            out += "\nfiles..........\n";
            header = true;
        }
        appendFile(out, f);
    }

    header = false;
    for (const auto& f : item.files) {
        if (f.kind != manifest::FileKind::Extra)
            continue;
        if (!header) {
            out += "\nextras.........\n";
            header = true;
        }
        appendFile(out, f);
    }

    if (!item.notes.empty())
        out += fmt::format("\nnotes..........\n{}\n", item.notes);
    return out;
}

Result<void> writeSidecars(const manifest::Item& item, const std::filesystem::path& itemDir) {
    auto r = fsutil::writeFileAtomic(itemDir / kInfoFileName, renderInfo(item));
    if (!r)
        return r;
    if (!item.serial.empty()) {
        auto s = fsutil::writeFileAtomic(itemDir / kSerialFileName, item.serial);
        if (!s)
            return s;
    }
    return {};
}

} // namespace shelf::downloader
