/*
 * Manifest persistence.
 *
 * Layout (insertion order is preserved, ordered_json):
 * {
 *   "format": 1,
 *   "items": {
 *     "<item id>": {
 *       "title": "...", "notes": "...", "serial": "...", "last_synced": "2024-01-01T00:00:00Z",
 *       "files": [
 *         { "name": "setup.exe", "url": "https://...", "size": 1234 | null,
 *           "checksum": "md5:<hex>" | null, "kind": "installer", "os": "windows",
 *           "lang": "en", "updated": false }
 *       ]
 *     }
 *   }
 * }
 */

#include <shelf/core/fs_utils.h>
#include <shelf/manifest/manifest.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace shelf::manifest {

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace {

json fileToJson(const FileRecord& f) {
    json j = json::object();
    j["name"] = f.name;
    j["url"] = f.url;
    j["size"] = f.size ? json(*f.size) : json(nullptr);
    j["checksum"] = f.checksum ? json(f.checksum->toString()) : json(nullptr);
    j["kind"] = kindName(f.kind);
    j["os"] = f.os;
    j["lang"] = f.lang;
    j["updated"] = f.updated;
    return j;
}

Error corrupt(const std::string& where, const std::string& what) {
    return Error{ErrorCode::CorruptManifest, where + ": " + what};
}

// Optional string member; absent or null reads as empty
Result<std::string> optionalString(const json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return std::string{};
    if (!it->is_string())
        return corrupt(where, std::string("'") + key + "' is not a string");
    return it->get<std::string>();
}

Result<FileRecord> fileFromJson(const json& j, const std::string& where) {
    if (!j.is_object())
        return corrupt(where, "file entry is not an object");

    FileRecord f;
    auto name = j.find("name");
    if (name == j.end() || !name->is_string() || name->get<std::string>().empty())
        return corrupt(where, "file entry without a name");
    f.name = name->get<std::string>();
    if (!isSafePathComponent(f.name))
        return corrupt(where, "file name '" + f.name + "' is not a plain file name");

    const auto fileWhere = where + "/" + f.name;

    auto url = optionalString(j, "url", fileWhere);
    if (!url)
        return url.error();
    f.url = std::move(url).value();

    if (auto it = j.find("size"); it != j.end() && !it->is_null()) {
        if (!it->is_number_unsigned())
            return corrupt(fileWhere, "'size' is not an unsigned integer");
        f.size = it->get<std::uint64_t>();
    }

    if (auto it = j.find("checksum"); it != j.end() && !it->is_null()) {
        if (!it->is_string())
            return corrupt(fileWhere, "'checksum' is not a string");
        auto cs = crypto::Checksum::parse(it->get<std::string>());
        if (!cs)
            return corrupt(fileWhere, "unparseable checksum '" + it->get<std::string>() + "'");
        f.checksum = std::move(*cs);
    }

    auto kind = optionalString(j, "kind", fileWhere);
    if (!kind)
        return kind.error();
    if (!kind.value().empty()) {
        auto parsed = parseKind(kind.value());
        if (!parsed)
            return corrupt(fileWhere, "unknown kind '" + kind.value() + "'");
        f.kind = *parsed;
    }

    auto os = optionalString(j, "os", fileWhere);
    if (!os)
        return os.error();
    f.os = std::move(os).value();

    auto lang = optionalString(j, "lang", fileWhere);
    if (!lang)
        return lang.error();
    f.lang = std::move(lang).value();

    if (auto it = j.find("updated"); it != j.end() && !it->is_null()) {
        if (!it->is_boolean())
            return corrupt(fileWhere, "'updated' is not a boolean");
        f.updated = it->get<bool>();
    }
    return f;
}

Result<Item> itemFromJson(const std::string& id, const json& j) {
    if (!j.is_object())
        return corrupt(id, "item is not an object");
    if (!isSafePathComponent(id))
        return corrupt(id, "item id is not usable as a directory name");

    Item item;
    item.id = id;

    for (auto [key, field] : {std::pair{"title", &item.title}, std::pair{"notes", &item.notes},
                              std::pair{"serial", &item.serial},
                              std::pair{"last_synced", &item.lastSynced}}) {
        auto v = optionalString(j, key, id);
        if (!v)
            return v.error();
        *field = std::move(v).value();
    }

    auto files = j.find("files");
    if (files == j.end() || files->is_null())
        return item;
    if (!files->is_array())
        return corrupt(id, "'files' is not an array");

    for (const auto& fj : *files) {
        auto f = fileFromJson(fj, id);
        if (!f)
            return f.error();
        if (item.findFile(f.value().name) != nullptr)
            return corrupt(id, "duplicate file '" + f.value().name + "'");
        item.files.push_back(std::move(f).value());
    }
    return item;
}

} // namespace

std::string serialize(const Manifest& manifest) {
    json root = json::object();
    root["format"] = kManifestFormat;
    json items = json::object();
    for (const auto& item : manifest.items()) {
        json ij = json::object();
        ij["title"] = item.title;
        ij["notes"] = item.notes;
        ij["serial"] = item.serial;
        ij["last_synced"] = item.lastSynced;
        json files = json::array();
        for (const auto& f : item.files)
            files.push_back(fileToJson(f));
        ij["files"] = std::move(files);
        items[item.id] = std::move(ij);
    }
    root["items"] = std::move(items);
    return root.dump(2) + "\n";
}

Result<Manifest> deserialize(std::string_view text) {
    // The parser keeps only the last of repeated keys; catch them while they are still visible
    std::vector<std::unordered_set<std::string>> openObjects;
    std::optional<std::string> duplicateKey;
    const json::parser_callback_t onEvent = [&](int, json::parse_event_t event, json& parsed) {
        switch (event) {
            case json::parse_event_t::object_start:
                openObjects.emplace_back();
                break;
            case json::parse_event_t::object_end:
                if (!openObjects.empty())
                    openObjects.pop_back();
                break;
            case json::parse_event_t::key:
                if (!openObjects.empty() && !duplicateKey &&
                    !openObjects.back().insert(parsed.get<std::string>()).second) {
                    duplicateKey = parsed.get<std::string>();
                }
                break;
            default:
                break;
        }
        return true;
    };

    json root;
    try {
        root = json::parse(text.begin(), text.end(), onEvent);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::CorruptManifest, std::string("parse error: ") + e.what()};
    }
    if (duplicateKey)
        return Error{ErrorCode::CorruptManifest, "duplicate key '" + *duplicateKey + "'"};

    if (!root.is_object())
        return Error{ErrorCode::CorruptManifest, "top level is not an object"};

    auto format = root.find("format");
    if (format == root.end() || !format->is_number_integer() ||
        format->get<int>() != kManifestFormat) {
        return Error{ErrorCode::CorruptManifest, "missing or unsupported 'format'"};
    }

    Manifest manifest;
    auto items = root.find("items");
    if (items == root.end())
        return manifest;
    if (!items->is_object())
        return Error{ErrorCode::CorruptManifest, "'items' is not an object"};

    for (auto it = items->begin(); it != items->end(); ++it) {
        if (it.key().empty())
            return Error{ErrorCode::CorruptManifest, "item with an empty id"};
        auto item = itemFromJson(it.key(), it.value());
        if (!item)
            return item.error();
        manifest.appendLoaded(std::move(item).value());
    }
    return manifest;
}

Result<Manifest> load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::info("No manifest at {}; starting with an empty catalog", path.string());
        return Manifest{};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::CorruptManifest, "cannot open " + path.string()};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::CorruptManifest, "read failed for " + path.string()};
    }

    auto result = deserialize(buf.str());
    if (!result) {
        return Error{ErrorCode::CorruptManifest,
                     path.string() + ": " + result.error().message};
    }
    spdlog::debug("Loaded manifest {} ({} items, {} files)", path.string(),
                  result.value().size(), result.value().fileCount());
    return result;
}

Result<void> save(const fs::path& path, const Manifest& manifest) {
    auto r = fsutil::writeFileAtomic(path, serialize(manifest));
    if (!r) {
        spdlog::error("Failed to save manifest {}: {}", path.string(), r.error().message);
        return r;
    }
    spdlog::debug("Saved manifest {} ({} items)", path.string(), manifest.size());
    return r;
}

} // namespace shelf::manifest
