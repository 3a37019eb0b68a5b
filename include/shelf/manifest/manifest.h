#pragma once

#include <shelf/core/types.h>
#include <shelf/crypto/hasher.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shelf::manifest {

using TimePoint = std::chrono::system_clock::time_point;

// Kind of downloadable artifact
enum class FileKind { Installer, Extra, Patch, LanguagePack };

const char* kindName(FileKind kind) noexcept;
std::optional<FileKind> parseKind(std::string_view name) noexcept;

// Item ids and file names become single path components below the library root.
// Rejects empty names, "." and "..", and anything containing a directory separator or NUL.
bool isSafePathComponent(std::string_view name) noexcept;

// One downloadable artifact belonging to an Item. Key within the manifest: (item id, name).
struct FileRecord {
    std::string name;                     // Filename on disk
    std::string url;                      // Source URL
    std::optional<std::uint64_t> size;    // Declared size; unknown when the service omitted it
    std::optional<crypto::Checksum> checksum;
    FileKind kind{FileKind::Installer};
    std::string os;   // OS tag ("windows", "linux", "mac"); empty = any
    std::string lang; // Language tag ("en", "fr", ...); empty = any
    bool updated{false};

    bool operator==(const FileRecord&) const = default;
};

// One catalog-level product
struct Item {
    std::string id; // Stable slug, unique within the manifest
    std::string title;
    std::string notes;
    std::string serial;     // Empty when the product has no activation code
    std::string lastSynced; // UTC ISO-8601 of the last sync that changed this item
    std::vector<FileRecord> files;

    bool operator==(const Item&) const = default;

    // Equality ignoring the sync marker
    [[nodiscard]] bool sameContent(const Item& other) const;

    [[nodiscard]] const FileRecord* findFile(std::string_view name) const;
};

enum class UpsertOutcome { Inserted, Updated, Unchanged };

/**
 * Selection over (Item, FileRecord) pairs. Empty sets leave that dimension unconstrained.
 */
struct ManifestFilter {
    std::set<std::string> osSet;
    std::set<std::string> langSet;
    std::set<FileKind> kindSet;
    std::optional<std::string> itemId;

    [[nodiscard]] bool matches(const Item& item, const FileRecord& file) const;
};

// Borrowed view of one manifest file; valid until the Manifest is next modified
struct FileRef {
    const Item* item{nullptr};
    const FileRecord* file{nullptr};
};

/**
 * The catalog: items keyed by id, kept in insertion order.
 */
class Manifest {
public:
    Manifest() = default;

    /**
     * Replace an item with the same id wholesale, or append a new one. An updated item keeps
     * its position. `now` stamps the sync marker unless the content is unchanged, in which
     * case the stored item is left untouched.
     */
    UpsertOutcome upsert(Item item, TimePoint now);

    [[nodiscard]] std::vector<FileRef> query(const ManifestFilter& filter) const;

    [[nodiscard]] const Item* find(std::string_view id) const;
    [[nodiscard]] bool contains(std::string_view id) const { return find(id) != nullptr; }

    [[nodiscard]] const std::vector<Item>& items() const noexcept { return items_; }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] std::size_t fileCount() const noexcept;

    bool operator==(const Manifest& other) const { return items_ == other.items_; }

private:
    friend Result<Manifest> deserialize(std::string_view text);

    // Appends as loaded, keeping the persisted sync marker. Ids are unique by construction:
    // deserialize() rejects repeated keys.
    void appendLoaded(Item item);

    std::vector<Item> items_;
    std::unordered_map<std::string, std::size_t> index_;
};

std::string formatTimestamp(TimePoint tp);

// Persistence (JSON, see manifest_store.cpp for the layout)
inline constexpr int kManifestFormat = 1;

/**
 * Load a manifest. A missing file yields an empty manifest (first run); anything that cannot
 * be parsed fails with CorruptManifest.
 */
Result<Manifest> load(const std::filesystem::path& path);

/**
 * Persist via write-to-temporary-then-replace; a reader never observes a partial file.
 */
Result<void> save(const std::filesystem::path& path, const Manifest& manifest);

std::string serialize(const Manifest& manifest);
Result<Manifest> deserialize(std::string_view text);

} // namespace shelf::manifest
