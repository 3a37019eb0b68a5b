#include <shelf/config/config.h>
#include <shelf/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>

namespace shelf::config {

namespace {

Error badValue(const std::string& key, const std::string& value, const char* expected) {
    return Error{ErrorCode::InvalidArgument,
                 "config " + key + " = '" + value + "': expected " + expected};
}

std::optional<long long> toInt(const std::string& s) {
    long long v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

std::optional<bool> toBool(const std::string& s) {
    if (s == "true" || s == "1" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "0" || s == "no" || s == "off")
        return false;
    return std::nullopt;
}

} // namespace

Result<ConfigValues> readConfigFile(const std::filesystem::path& path) {
    ConfigValues values;
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec))
        return values;

    std::ifstream file(path);
    if (!file)
        return Error{ErrorCode::FilesystemError, "cannot read " + path.string()};

    std::string line;
    std::string currentSection;
    int lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#')
            continue;

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidArgument,
                             path.string() + ":" + std::to_string(lineNo) + ": unterminated section"};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidArgument,
                         path.string() + ":" + std::to_string(lineNo) + ": expected key = value"};
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        strip_inline_comment(v);

        // Arrays keep their brackets for parse_list
        if (!v.empty() && v.front() != '[')
            v = unquote(v);
        else
            trim(v);

        values[currentSection.empty() ? k : currentSection + "." + k] = v;
    }
    return values;
}

Result<AppConfig> applyConfig(AppConfig cfg, const ConfigValues& values) {
    for (const auto& [key, value] : values) {
        if (key == "paths.manifest") {
            cfg.manifestPath = expand_tilde(value);
        } else if (key == "paths.session") {
            cfg.sessionPath = expand_tilde(value);
        } else if (key == "paths.library") {
            cfg.libraryDir = expand_tilde(value);
        } else if (key == "network.retry_attempts") {
            auto n = toInt(value);
            if (!n || *n < 1)
                return badValue(key, value, "a positive integer");
            cfg.retry.maxAttempts = static_cast<int>(*n);
        } else if (key == "network.retry_backoff_ms") {
            auto n = toInt(value);
            if (!n || *n < 0)
                return badValue(key, value, "milliseconds");
            cfg.retry.initialBackoff = std::chrono::milliseconds(*n);
        } else if (key == "network.max_backoff_ms") {
            auto n = toInt(value);
            if (!n || *n < 0)
                return badValue(key, value, "milliseconds");
            cfg.retry.maxBackoff = std::chrono::milliseconds(*n);
        } else if (key == "network.timeout_ms") {
            auto n = toInt(value);
            if (!n || *n < 1)
                return badValue(key, value, "milliseconds");
            cfg.timeout = std::chrono::milliseconds(*n);
        } else if (key == "network.request_delay_ms") {
            auto n = toInt(value);
            if (!n || *n < 0)
                return badValue(key, value, "milliseconds");
            cfg.requestDelay = std::chrono::milliseconds(*n);
        } else if (key == "network.concurrency") {
            auto n = toInt(value);
            if (!n || *n < 1 || *n > 4)
                return badValue(key, value, "1 to 4");
            cfg.concurrency = static_cast<int>(*n);
        } else if (key == "network.tls_insecure") {
            auto b = toBool(value);
            if (!b)
                return badValue(key, value, "true or false");
            cfg.tlsInsecure = *b;
        } else if (key == "network.ca_path") {
            cfg.caPath = expand_tilde(value).string();
        } else if (key == "network.proxy") {
            if (value.empty())
                cfg.proxy.reset();
            else
                cfg.proxy = value;
        } else if (key == "filters.os") {
            cfg.os = parse_list(value);
        } else if (key == "filters.lang") {
            cfg.lang = parse_list(value);
        } else if (key == "logging.level") {
            cfg.logLevel = value;
        } else if (key == "logging.file") {
            cfg.logFile = expand_tilde(value);
        } else {
            spdlog::warn("ignoring unknown config key '{}'", key);
        }
    }
    return cfg;
}

Result<AppConfig> loadConfig(const std::string& overridePath) {
    const auto path = get_config_path(overridePath);
    std::error_code ec;
    if (!overridePath.empty() && !std::filesystem::exists(path, ec))
        return Error{ErrorCode::InvalidArgument, "config file not found: " + path.string()};

    auto values = readConfigFile(path);
    if (!values)
        return values.error();
    if (!values.value().empty())
        spdlog::debug("loaded {} setting(s) from {}", values.value().size(), path.string());
    return applyConfig(AppConfig{}, values.value());
}

} // namespace shelf::config
