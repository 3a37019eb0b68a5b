#include <shelf/cli/shelf_cli.h>
#include <shelf/downloader/downloader.hpp>
#include <shelf/manifest/manifest.h>
#include <shelf/scheduler/download_scheduler.h>

#include <spdlog/spdlog.h>

#include <chrono>

namespace shelf::cli {

class DownloadCommand : public ICommand {
public:
    std::string getName() const override { return "download"; }

    std::string getDescription() const override {
        return "Download manifest files that are not on disk yet";
    }

    void registerCommand(CLI::App& app, ShelfCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("dir", dir_, "Library directory (default: [paths] library)");
        cmd->add_option("--os", os_, "Operating systems to download for");
        cmd->add_option("--lang", lang_, "Languages to download for");
        cmd->add_option("--id", id_, "Only this item");
        cmd->add_flag("--skip-extras", skipExtras_, "Skip bonus content");
        cmd->add_flag("--skip-games", skipGames_, "Skip installers, patches and language packs");
        cmd->add_flag("--dry-run", dryRun_, "List what would be downloaded");
        cmd->add_option("--wait", waitHours_, "Wait this many hours before starting")
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--concurrency", concurrency_, "Parallel transfers")
            ->check(CLI::Range(1, scheduler::DownloadRunner::kMaxConcurrency));

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto& cfg = cli_->config();
        const auto root = dir_.empty() ? cfg.libraryDir : std::filesystem::path(dir_);

        auto loaded = manifest::load(cli_->manifestPath());
        if (!loaded)
            return loaded.error();
        const auto catalog = std::move(loaded).value();

        scheduler::SelectionFilter filter;
        filter.osSet = cli_->osFilter(os_);
        filter.langSet = cli_->langFilter(lang_);
        if (!id_.empty())
            filter.itemId = id_;
        filter.includeExtras = !skipExtras_;
        filter.includeGames = !skipGames_;

        scheduler::SchedulerOptions schedOptions;
        schedOptions.startDelay = std::chrono::milliseconds(
            static_cast<long long>(waitHours_ * 60.0 * 60.0 * 1000.0));
        schedOptions.shouldCancel = cli_->cancelToken();

        scheduler::DownloadScheduler scheduler(schedOptions);
        auto plan = scheduler.schedule(catalog, filter, root);
        if (!plan)
            return plan.error();
        spdlog::info("{} file(s) selected for {}", plan.value().size(), root.string());

        // A dry run never goes to the network, so it does not need a session
        net::SessionContext session;
        if (!dryRun_) {
            auto loadedSession = cli_->loadSession();
            if (!loadedSession)
                return loadedSession.error();
            session = std::move(loadedSession).value();
        }

        downloader::FetchOptions fetchOptions;
        fetchOptions.retry = cfg.retry;
        fetchOptions.dryRun = dryRun_;
        fetchOptions.shouldCancel = cli_->cancelToken();

        downloader::FileFetcher fetcher(cli_->http(), std::move(session), fetchOptions);
        scheduler::DownloadRunner runner(fetcher, concurrency_ > 0 ? concurrency_ : cfg.concurrency);
        auto report = runner.run(plan.value());
        scheduler::logDownloadReport(report);

        if (report.cancelled)
            return Error{ErrorCode::OperationCancelled, "download interrupted"};
        return {};
    }

private:
    ShelfCLI* cli_{nullptr};
    std::string dir_;
    std::vector<std::string> os_;
    std::vector<std::string> lang_;
    std::string id_;
    bool skipExtras_{false};
    bool skipGames_{false};
    bool dryRun_{false};
    double waitHours_{0.0};
    int concurrency_{0};
};

std::unique_ptr<ICommand> createDownloadCommand() {
    return std::make_unique<DownloadCommand>();
}

} // namespace shelf::cli
