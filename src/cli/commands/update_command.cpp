#include <shelf/cli/shelf_cli.h>
#include <shelf/sync/catalog_client.h>
#include <shelf/sync/sync_engine.h>

#include <spdlog/spdlog.h>

namespace shelf::cli {

class UpdateCommand : public ICommand {
public:
    std::string getName() const override { return "update"; }

    std::string getDescription() const override {
        return "Refresh the manifest from the remote catalog";
    }

    void registerCommand(CLI::App& app, ShelfCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--policy", policy_,
                        "Which items to re-fetch: all, skip-known, updated-only, single-id")
            ->check(CLI::IsMember({"all", "skip-known", "updated-only", "single-id"}));
        cmd->add_option("--id", id_, "Fetch exactly this item (implies --policy single-id)");
        cmd->add_option("--os", os_, "Keep files for these operating systems");
        cmd->add_option("--lang", lang_, "Keep files for these languages");

        cmd->callback([this]() {
            if (policy_ == "single-id" && id_.empty())
                throw CLI::ValidationError("update", "--policy single-id requires --id");
            cli_->setPendingCommand(this);
        });
    }

    Result<void> execute() override {
        sync::SyncOptions options;
        options.policy = sync::parsePolicy(policy_).value_or(sync::MergePolicy::All);
        if (!id_.empty()) {
            if (options.policy != sync::MergePolicy::All &&
                options.policy != sync::MergePolicy::SingleId) {
                spdlog::warn("--id overrides --policy {}", policy_);
            }
            options.policy = sync::MergePolicy::SingleId;
            options.singleId = id_;
        }
        options.osFilter = cli_->osFilter(os_);
        options.langFilter = cli_->langFilter(lang_);
        options.retry = cli_->config().retry;
        options.shouldCancel = cli_->cancelToken();

        auto session = cli_->loadSession();
        if (!session)
            return session.error();

        sync::HttpCatalogClient client(cli_->http(), cli_->config().requestDelay);
        sync::SyncEngine engine(client, std::move(session).value());

        spdlog::info("updating manifest {}", cli_->manifestPath().string());
        auto report = engine.synchronize(cli_->manifestPath(), options);
        if (!report)
            return report.error();

        sync::logSyncReport(report.value());
        if (report.value().cancelled)
            return Error{ErrorCode::OperationCancelled, "update interrupted"};
        return {};
    }

private:
    ShelfCLI* cli_{nullptr};
    std::string policy_{"all"};
    std::string id_;
    std::vector<std::string> os_;
    std::vector<std::string> lang_;
};

std::unique_ptr<ICommand> createUpdateCommand() {
    return std::make_unique<UpdateCommand>();
}

} // namespace shelf::cli
