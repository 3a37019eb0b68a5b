#pragma once

#include <shelf/cli/command.h>
#include <shelf/config/config.h>
#include <shelf/core/retry.h>
#include <shelf/core/types.h>
#include <shelf/net/http.h>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace shelf::cli {

/**
 * Command-line driver: global options, config resolution, logging setup, and dispatch to the
 * selected ICommand.
 */
class ShelfCLI {
public:
    ShelfCLI();
    ~ShelfCLI();

    /**
     * Run the CLI with given arguments; returns the process exit code
     */
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);
    void setPendingCommand(ICommand* command) { pendingCommand_ = command; }

    // Resolved once arguments are parsed
    const config::AppConfig& config() const { return config_; }
    const std::filesystem::path& manifestPath() const { return config_.manifestPath; }

    /**
     * Session file plus the network settings from the config.
     */
    Result<net::SessionContext> loadSession() const;

    net::IHttpAdapter& http();

    // Replaces the libcurl adapter (tests)
    void setHttpAdapter(std::unique_ptr<net::IHttpAdapter> adapter);

    // Command flag when given, otherwise the config value
    std::set<std::string> osFilter(const std::vector<std::string>& flag) const;
    std::set<std::string> langFilter(const std::vector<std::string>& flag) const;

    net::ShouldCancel cancelToken() const;

    // Async-signal-safe; consulted between units of work
    static void requestCancel() noexcept;
    static bool cancelRequested() noexcept;
    static void resetCancel() noexcept;

    static int exitCodeFor(const Error& error);

private:
    Result<void> resolveConfig();
    void setupLogging();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    config::AppConfig config_;
    std::unique_ptr<net::IHttpAdapter> http_;

    // Global options
    std::string configPath_;
    std::string manifestOverride_;
    std::string sessionOverride_;
    std::string logFileOverride_;
    bool verbose_{false};
    bool quiet_{false};
};

} // namespace shelf::cli
