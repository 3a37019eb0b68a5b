#include <shelf/cli/shelf_cli.h>
#include <shelf/net/http.h>

#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>

namespace {

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shelf::cli::ShelfCLI::requestCancel();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Conservative default until ShelfCLI::run() applies the configured level
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    try {
        shelf::net::CurlGlobalGuard curl;
        shelf::cli::ShelfCLI cli;
        const int rc = cli.run(argc, argv);
        spdlog::shutdown();
        return rc;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
