#include <shelf/cli/shelf_cli.h>
#include <shelf/integrity/verifier.h>
#include <shelf/manifest/manifest.h>

#include <spdlog/spdlog.h>

namespace shelf::cli {

class VerifyCommand : public ICommand {
public:
    std::string getName() const override { return "verify"; }

    std::string getDescription() const override {
        return "Check downloaded files against the manifest's checksums, sizes and archives";
    }

    void registerCommand(CLI::App& app, ShelfCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("dir", dir_, "Library directory (default: [paths] library)");
        cmd->add_option("--id", id_, "Only this item");
        cmd->add_flag("--skip-checksum", skipChecksum_, "Do not hash files");
        cmd->add_flag("--skip-size", skipSize_, "Do not compare sizes");
        cmd->add_flag("--skip-archive", skipArchive_, "Do not scan archives");
        cmd->add_flag("--delete", delete_, "Delete files that fail a check");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto root =
            dir_.empty() ? cli_->config().libraryDir : std::filesystem::path(dir_);

        auto loaded = manifest::load(cli_->manifestPath());
        if (!loaded)
            return loaded.error();

        integrity::VerifyOptions options;
        options.checks.clear();
        if (!skipChecksum_)
            options.checks.insert(integrity::Check::Checksum);
        if (!skipSize_)
            options.checks.insert(integrity::Check::Size);
        if (!skipArchive_)
            options.checks.insert(integrity::Check::Archive);
        options.disposition =
            delete_ ? integrity::Disposition::Delete : integrity::Disposition::Report;
        if (!id_.empty())
            options.itemId = id_;
        options.shouldCancel = cli_->cancelToken();

        integrity::IntegrityVerifier verifier(options);
        auto report = verifier.verify(loaded.value(), root);
        if (!report)
            return report.error();

        integrity::logVerifyReport(report.value(), options);
        if (report.value().cancelled)
            return Error{ErrorCode::OperationCancelled, "verify interrupted"};
        return {};
    }

private:
    ShelfCLI* cli_{nullptr};
    std::string dir_;
    std::string id_;
    bool skipChecksum_{false};
    bool skipSize_{false};
    bool skipArchive_{false};
    bool delete_{false};
};

std::unique_ptr<ICommand> createVerifyCommand() {
    return std::make_unique<VerifyCommand>();
}

} // namespace shelf::cli
