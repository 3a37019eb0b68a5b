#include <shelf/manifest/manifest.h>

#include <algorithm>
#include <ctime>

namespace shelf::manifest {

const char* kindName(FileKind kind) noexcept {
    switch (kind) {
        case FileKind::Installer:
            return "installer";
        case FileKind::Extra:
            return "extra";
        case FileKind::Patch:
            return "patch";
        case FileKind::LanguagePack:
            return "language-pack";
    }
    return "installer";
}

std::optional<FileKind> parseKind(std::string_view name) noexcept {
    if (name == "installer")
        return FileKind::Installer;
    if (name == "extra")
        return FileKind::Extra;
    if (name == "patch")
        return FileKind::Patch;
    if (name == "language-pack")
        return FileKind::LanguagePack;
    return std::nullopt;
}

bool isSafePathComponent(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..")
        return false;
    return name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

bool Item::sameContent(const Item& other) const {
    return id == other.id && title == other.title && notes == other.notes &&
           serial == other.serial && files == other.files;
}

const FileRecord* Item::findFile(std::string_view name) const {
    auto it = std::find_if(files.begin(), files.end(),
                           [&](const FileRecord& f) { return f.name == name; });
    return it == files.end() ? nullptr : &*it;
}

namespace {

bool tagMatches(const std::set<std::string>& wanted, const std::string& tag) {
    // Untagged files (bonus content) are OS/language neutral.
    return wanted.empty() || tag.empty() || wanted.count(tag) > 0;
}

} // namespace

bool ManifestFilter::matches(const Item& item, const FileRecord& file) const {
    if (itemId && item.id != *itemId)
        return false;
    if (!kindSet.empty() && kindSet.count(file.kind) == 0)
        return false;
    return tagMatches(osSet, file.os) && tagMatches(langSet, file.lang);
}

UpsertOutcome Manifest::upsert(Item item, TimePoint now) {
    auto it = index_.find(item.id);
    if (it == index_.end()) {
        item.lastSynced = formatTimestamp(now);
        index_.emplace(item.id, items_.size());
        items_.push_back(std::move(item));
        return UpsertOutcome::Inserted;
    }

    auto& existing = items_[it->second];
    if (existing.sameContent(item)) {
        return UpsertOutcome::Unchanged;
    }
    item.lastSynced = formatTimestamp(now);
    existing = std::move(item);
    return UpsertOutcome::Updated;
}

void Manifest::appendLoaded(Item item) {
    index_.emplace(item.id, items_.size());
    items_.push_back(std::move(item));
}

std::vector<FileRef> Manifest::query(const ManifestFilter& filter) const {
    std::vector<FileRef> out;
    for (const auto& item : items_) {
        if (filter.itemId && item.id != *filter.itemId)
            continue;
        for (const auto& file : item.files) {
            if (filter.matches(item, file)) {
                out.push_back(FileRef{&item, &file});
            }
        }
    }
    return out;
}

const Item* Manifest::find(std::string_view id) const {
    auto it = index_.find(std::string(id));
    return it == index_.end() ? nullptr : &items_[it->second];
}

std::size_t Manifest::fileCount() const noexcept {
    std::size_t n = 0;
    for (const auto& item : items_)
        n += item.files.size();
    return n;
}

std::string formatTimestamp(TimePoint tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, n);
}

} // namespace shelf::manifest
