#pragma once

#include <shelf/core/retry.h>
#include <shelf/core/types.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shelf::config {

/**
 * Settings resolved from built-in defaults and config.toml. Command-line flags are layered on
 * top by the CLI.
 */
struct AppConfig {
    // [paths]
    std::filesystem::path manifestPath{"shelf-manifest.json"};
    std::filesystem::path sessionPath{"shelf-session.json"};
    std::filesystem::path libraryDir{"."};

    // [network]
    RetryPolicy retry{};
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds requestDelay{1000};
    int concurrency{1};
    bool tlsInsecure{false};
    std::string caPath;
    std::optional<std::string> proxy;

    // [filters]
    std::vector<std::string> os{"windows"};
    std::vector<std::string> lang{"en"};

    // [logging]
    std::string logLevel{"info"};
    std::filesystem::path logFile;
};

// "section.key" -> raw (unquoted) value
using ConfigValues = std::map<std::string, std::string>;

/**
 * Minimal TOML reader: [section] headers, key = value, # comments, quoted strings and flat
 * arrays. A missing file reads as empty.
 */
Result<ConfigValues> readConfigFile(const std::filesystem::path& path);

// Overlay parsed values onto `base`; a malformed value is InvalidArgument
Result<AppConfig> applyConfig(AppConfig base, const ConfigValues& values);

/**
 * Defaults overlaid with the config file. An explicitly named file must exist; the default
 * location is optional.
 */
Result<AppConfig> loadConfig(const std::string& overridePath = {});

} // namespace shelf::config
