#include <catch2/catch_test_macros.hpp>

#include <shelf/cli/shelf_cli.h>
#include <shelf/manifest/manifest.h>

#include "support/fake_http_adapter.hpp"
#include "support/manifest_builders.hpp"
#include "support/temp_dir_scope.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace shelf;
using namespace shelf::test_support;

namespace {

constexpr auto kBase = "https://api.example.test";

// Runs the CLI against files inside one temporary directory
struct CliFixture {
    TempDirScope tmp = TempDirScope::unique_under("shelf-cli");
    std::vector<std::pair<std::string, FakeResponse>> catalog;
    std::vector<std::pair<std::string, std::string>> served;

    CliFixture() {
        cli::ShelfCLI::resetCancel();
        write_file(configPath(), "[network]\n"
                                 "request_delay_ms = 0\n"
                                 "retry_attempts = 2\n"
                                 "retry_backoff_ms = 1\n"
                                 "[logging]\n"
                                 "level = \"warn\"\n");
    }
    ~CliFixture() { cli::ShelfCLI::resetCancel(); }

    fs::path configPath() const { return tmp.path() / "config.toml"; }
    fs::path manifestPath() const { return tmp.path() / "manifest.json"; }
    fs::path sessionPath() const { return tmp.path() / "session.json"; }
    fs::path library() const { return tmp.path() / "library"; }

    void writeSession() const {
        write_file(sessionPath(), std::string(R"({"base_url": ")") + kBase +
                                      R"(", "headers": {"Cookie": "sid=1"}})");
    }

    void seedManifest() const {
        manifest::Manifest m;
        auto item = make_item("x");
        item.files.push_back(make_file("x.exe", "windows", "en", 4));
        m.upsert(item, fixed_time());
        REQUIRE(manifest::save(manifestPath(), m));
    }

    int run(std::vector<std::string> args) {
        std::vector<std::string> full{"shelf",
                                      "--config",
                                      configPath().string(),
                                      "--manifest",
                                      manifestPath().string(),
                                      "--session",
                                      sessionPath().string()};
        full.insert(full.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(full.size());
        for (auto& a : full)
            argv.push_back(a.data());

        auto fake = std::make_unique<FakeHttpAdapter>();
        for (const auto& [url, resp] : catalog)
            fake->script(url, resp);
        for (const auto& [url, content] : served)
            fake->serveFile(url, content);

        cli::ShelfCLI shelfCli;
        shelfCli.setHttpAdapter(std::move(fake));
        return shelfCli.run(static_cast<int>(argv.size()), argv.data());
    }
};

} // namespace

TEST_CASE_METHOD(CliFixture, "verify on a fresh setup succeeds", "[cli]") {
    CHECK(run({"verify", library().string()}) == 0);
}

TEST_CASE_METHOD(CliFixture, "a corrupt manifest is a failure", "[cli]") {
    write_file(manifestPath(), "{ not json");
    CHECK(run({"verify", library().string()}) == 1);
    CHECK(read_file(manifestPath()) == "{ not json");
}

TEST_CASE_METHOD(CliFixture, "update without a session fails", "[cli]") {
    CHECK(run({"update"}) == 1);
    CHECK_FALSE(fs::exists(manifestPath()));
}

TEST_CASE_METHOD(CliFixture, "update merges the catalog into the manifest", "[cli]") {
    writeSession();
    catalog.push_back({std::string(kBase) + "/catalog?page=1",
                       {200, R"({"items":[{"id":"x"}],"page":1,"total_pages":1})"}});
    catalog.push_back(
        {std::string(kBase) + "/catalog/items/x",
         {200, R"({"id":"x","title":"X","files":[
             {"name":"x.exe","url":"https://cdn.example.test/x.exe","size":4,"os":"windows","lang":"en"},
             {"name":"x.pkg","url":"https://cdn.example.test/x.pkg","size":4,"os":"mac","lang":"en"}]})"}});

    REQUIRE(run({"update"}) == 0);
    auto m = manifest::load(manifestPath());
    REQUIRE(m);
    const auto* item = m.value().find("x");
    REQUIRE(item);
    // The default os filter keeps windows only
    REQUIRE(item->files.size() == 1);
    CHECK(item->files[0].name == "x.exe");
}

TEST_CASE_METHOD(CliFixture, "update --policy single-id needs an id", "[cli]") {
    writeSession();
    CHECK(run({"update", "--policy", "single-id"}) != 0);
}

TEST_CASE_METHOD(CliFixture, "an expired session aborts update", "[cli]") {
    writeSession();
    catalog.push_back({std::string(kBase) + "/catalog?page=1", {401, ""}});
    CHECK(run({"update"}) == 1);
}

TEST_CASE_METHOD(CliFixture, "download fetches into the library", "[cli]") {
    seedManifest();
    writeSession();
    served.push_back({"https://cdn.example.test/x.exe", "EXE!"});

    REQUIRE(run({"download", library().string()}) == 0);
    CHECK(read_file(library() / "x" / "x.exe") == "EXE!");
    CHECK(fs::exists(library() / "x" / "!info.txt"));
    CHECK(run({"verify", library().string()}) == 0);
}

TEST_CASE_METHOD(CliFixture, "dry-run download needs no session and writes nothing", "[cli]") {
    seedManifest();
    CHECK(run({"download", library().string(), "--dry-run"}) == 0);
    CHECK_FALSE(fs::exists(library() / "x"));
}

TEST_CASE_METHOD(CliFixture, "download of an unknown id fails", "[cli]") {
    seedManifest();
    writeSession();
    CHECK(run({"download", library().string(), "--id", "nope"}) == 1);
}

TEST_CASE_METHOD(CliFixture, "concurrency beyond the limit is rejected", "[cli]") {
    seedManifest();
    CHECK(run({"download", "--concurrency", "9"}) != 0);
}

TEST_CASE_METHOD(CliFixture, "an interrupted download exits 130", "[cli]") {
    seedManifest();
    writeSession();
    served.push_back({"https://cdn.example.test/x.exe", "EXE!"});
    cli::ShelfCLI::requestCancel();
    CHECK(run({"download", library().string()}) == 130);
    CHECK_FALSE(fs::exists(library() / "x" / "x.exe"));
}

TEST_CASE_METHOD(CliFixture, "verify --delete removes damaged files", "[cli]") {
    seedManifest();
    write_file(library() / "x" / "x.exe", "too long for four");
    CHECK(run({"verify", library().string(), "--delete"}) == 0);
    CHECK_FALSE(fs::exists(library() / "x" / "x.exe"));
}

TEST_CASE_METHOD(CliFixture, "a missing explicit config file is an error", "[cli]") {
    fs::remove(configPath());
    CHECK(run({"verify"}) == 1);
}

TEST_CASE("a subcommand is required", "[cli]") {
    std::string prog = "shelf";
    char* argv[] = {prog.data()};
    cli::ShelfCLI shelfCli;
    CHECK(shelfCli.run(1, argv) != 0);
}
