#include <shelf/cli/shelf_cli.h>
#include <shelf/library/library_ops.h>
#include <shelf/manifest/manifest.h>

#include <spdlog/spdlog.h>

namespace shelf::cli {

namespace {

// SRC DEST pair shared by import and backup
class CopyCommandBase : public ICommand {
public:
    void registerCommand(CLI::App& app, ShelfCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("src", src_, "Source directory")->required()->check(CLI::ExistingDirectory);
        cmd->add_option("dest", dest_, "Destination library directory")->required();

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto loaded = manifest::load(cli_->manifestPath());
        if (!loaded)
            return loaded.error();

        auto report = copy(loaded.value());
        if (!report)
            return report.error();
        library::logCopyReport(getName().c_str(), report.value());

        if (ShelfCLI::cancelRequested())
            return Error{ErrorCode::OperationCancelled, getName() + " interrupted"};
        return {};
    }

protected:
    virtual Result<library::CopyReport> copy(const manifest::Manifest& catalog) = 0;

    ShelfCLI* cli_{nullptr};
    std::string src_;
    std::string dest_;
};

class ImportCommand : public CopyCommandBase {
public:
    std::string getName() const override { return "import"; }

    std::string getDescription() const override {
        return "Copy already-downloaded files whose checksum matches the manifest into a library";
    }

protected:
    Result<library::CopyReport> copy(const manifest::Manifest& catalog) override {
        return library::importFiles(catalog, src_, dest_, cli_->cancelToken());
    }
};

class BackupCommand : public CopyCommandBase {
public:
    std::string getName() const override { return "backup"; }

    std::string getDescription() const override {
        return "Incrementally copy a library to another directory";
    }

protected:
    Result<library::CopyReport> copy(const manifest::Manifest& catalog) override {
        return library::backupLibrary(catalog, src_, dest_, cli_->cancelToken());
    }
};

} // namespace

std::unique_ptr<ICommand> createImportCommand() {
    return std::make_unique<ImportCommand>();
}

std::unique_ptr<ICommand> createBackupCommand() {
    return std::make_unique<BackupCommand>();
}

} // namespace shelf::cli
