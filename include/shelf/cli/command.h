#pragma once

#include <shelf/core/types.h>

#include <CLI/CLI.hpp>

#include <memory>
#include <string>

namespace shelf::cli {

// Forward declarations
class ShelfCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "update", "verify")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, ShelfCLI* cli) = 0;

    /**
     * Execute the command. Per-item failures are summarized, not returned; an error here
     * means the run as a whole failed.
     */
    virtual Result<void> execute() = 0;
};

std::unique_ptr<ICommand> createUpdateCommand();
std::unique_ptr<ICommand> createDownloadCommand();
std::unique_ptr<ICommand> createVerifyCommand();
std::unique_ptr<ICommand> createImportCommand();
std::unique_ptr<ICommand> createBackupCommand();

} // namespace shelf::cli
