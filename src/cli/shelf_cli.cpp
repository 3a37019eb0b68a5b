#include <shelf/cli/shelf_cli.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cctype>
#include <iostream>
#include <optional>

namespace shelf::cli {

namespace {

std::atomic<bool> g_cancelRequested{false};

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "off" || v == "none")
        return spdlog::level::off;
    return std::nullopt;
}

std::set<std::string> pick(const std::vector<std::string>& flag,
                           const std::vector<std::string>& configured) {
    const auto& src = flag.empty() ? configured : flag;
    return {src.begin(), src.end()};
}

} // namespace

ShelfCLI::ShelfCLI() : app_(std::make_unique<CLI::App>("shelf: keep a local copy of a purchased catalog")) {
    app_->require_subcommand(1);
    app_->set_help_all_flag("--help-all", "Expand all help");

    app_->add_option("--config", configPath_, "Config file (default: ~/.config/shelf/config.toml)");
    app_->add_option("--manifest", manifestOverride_, "Manifest file");
    app_->add_option("--session", sessionOverride_, "Session file written by the login tool");
    app_->add_option("--log-file", logFileOverride_, "Also write the log to this file");
    auto* verbose = app_->add_flag("-v,--verbose", verbose_, "Debug output");
    app_->add_flag("-q,--quiet", quiet_, "Warnings and errors only")->excludes(verbose);

    registerCommand(createUpdateCommand());
    registerCommand(createDownloadCommand());
    registerCommand(createVerifyCommand());
    registerCommand(createImportCommand());
    registerCommand(createBackupCommand());
}

ShelfCLI::~ShelfCLI() = default;

void ShelfCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

Result<void> ShelfCLI::resolveConfig() {
    auto cfg = config::loadConfig(configPath_);
    if (!cfg)
        return cfg.error();
    config_ = std::move(cfg).value();

    if (!manifestOverride_.empty())
        config_.manifestPath = manifestOverride_;
    if (!sessionOverride_.empty())
        config_.sessionPath = sessionOverride_;
    if (!logFileOverride_.empty())
        config_.logFile = logFileOverride_;
    return {};
}

void ShelfCLI::setupLogging() {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config_.logFile.empty()) {
        try {
            sinks.push_back(
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(config_.logFile.string()));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "[WARN] cannot open log file " << config_.logFile.string() << ": "
                      << e.what() << "\n";
        }
    }
    auto logger = std::make_shared<spdlog::logger>("shelf", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    auto level = parseLevel(config_.logLevel).value_or(spdlog::level::info);
    if (verbose_)
        level = spdlog::level::debug;
    else if (quiet_)
        level = spdlog::level::warn;
    spdlog::set_level(level);
}

int ShelfCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    if (auto r = resolveConfig(); !r) {
        std::cerr << "[FAIL] " << r.error().message << "\n";
        return exitCodeFor(r.error());
    }
    setupLogging();

    if (!pendingCommand_) {
        spdlog::error("no command selected");
        return 1;
    }

    try {
        auto result = pendingCommand_->execute();
        if (!result) {
            const auto& err = result.error();
            spdlog::error("{} failed: {} ({})", pendingCommand_->getName(), err.message, err.code);
            if (err.code == ErrorCode::AuthExpired)
                spdlog::error("the session is no longer valid; log in again and retry");
            return exitCodeFor(err);
        }
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
    return 0;
}

Result<net::SessionContext> ShelfCLI::loadSession() const {
    auto session = net::loadSession(config_.sessionPath);
    if (!session)
        return session.error();
    auto ctx = std::move(session).value();
    ctx.timeout = config_.timeout;
    ctx.tls.insecure = config_.tlsInsecure;
    ctx.tls.caPath = config_.caPath;
    ctx.proxy = config_.proxy;
    return ctx;
}

net::IHttpAdapter& ShelfCLI::http() {
    if (!http_)
        http_ = net::makeCurlHttpAdapter();
    return *http_;
}

void ShelfCLI::setHttpAdapter(std::unique_ptr<net::IHttpAdapter> adapter) {
    http_ = std::move(adapter);
}

std::set<std::string> ShelfCLI::osFilter(const std::vector<std::string>& flag) const {
    return pick(flag, config_.os);
}

std::set<std::string> ShelfCLI::langFilter(const std::vector<std::string>& flag) const {
    return pick(flag, config_.lang);
}

net::ShouldCancel ShelfCLI::cancelToken() const {
    return [] { return cancelRequested(); };
}

void ShelfCLI::requestCancel() noexcept {
    g_cancelRequested.store(true, std::memory_order_relaxed);
}

bool ShelfCLI::cancelRequested() noexcept {
    return g_cancelRequested.load(std::memory_order_relaxed);
}

void ShelfCLI::resetCancel() noexcept {
    g_cancelRequested.store(false, std::memory_order_relaxed);
}

int ShelfCLI::exitCodeFor(const Error& error) {
    return error.code == ErrorCode::OperationCancelled ? 130 : 1;
}

} // namespace shelf::cli
