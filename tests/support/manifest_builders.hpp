#pragma once

#include <shelf/manifest/manifest.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace shelf::test_support {

inline manifest::FileRecord make_file(std::string name, std::string os, std::string lang,
                                      std::optional<std::uint64_t> size = std::nullopt,
                                      manifest::FileKind kind = manifest::FileKind::Installer) {
    manifest::FileRecord f;
    f.url = "https://cdn.example.test/" + name;
    f.name = std::move(name);
    f.os = std::move(os);
    f.lang = std::move(lang);
    f.size = size;
    f.kind = kind;
    return f;
}

inline manifest::Item make_item(std::string id, std::string title = {}) {
    manifest::Item item;
    item.title = title.empty() ? id : std::move(title);
    item.id = std::move(id);
    return item;
}

// Fixed instant so sync markers are reproducible
inline manifest::TimePoint fixed_time() {
    return manifest::TimePoint{std::chrono::seconds{1700000000}};
}

} // namespace shelf::test_support
