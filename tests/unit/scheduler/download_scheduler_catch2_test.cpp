#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <shelf/scheduler/download_scheduler.h>

#include "support/fake_http_adapter.hpp"
#include "support/manifest_builders.hpp"
#include "support/temp_dir_scope.hpp"

#include <chrono>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;
using namespace shelf;
using namespace shelf::scheduler;
using namespace shelf::test_support;
using downloader::SkipReason;
using downloader::TaskState;

namespace {

DownloadScheduler immediate_scheduler() {
    SchedulerOptions o;
    o.sleeper = [](std::chrono::milliseconds) {};
    return DownloadScheduler(o);
}

manifest::Manifest two_platform_manifest() {
    manifest::Manifest m;
    auto x = make_item("x");
    x.files.push_back(make_file("A", "windows", "en", 4));
    x.files.push_back(make_file("B", "linux", "fr", 4));
    m.upsert(x, fixed_time());
    return m;
}

downloader::FetchOptions no_wait_options() {
    downloader::FetchOptions o;
    o.retry.maxAttempts = 1;
    o.writeSidecars = false;
    o.sleeper = [](std::chrono::milliseconds) {};
    return o;
}

} // namespace

TEST_CASE("os and language filters pick exactly the matching file", "[scheduler]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    const auto m = two_platform_manifest();

    SelectionFilter filter;
    filter.osSet = {"windows"};
    filter.langSet = {"en"};

    auto plan = immediate_scheduler().schedule(m, filter, tmp.path());
    REQUIRE(plan);
    REQUIRE(plan.value().size() == 1);
    const auto& task = plan.value()[0];
    CHECK(task.file->name == "A");
    CHECK(task.state == TaskState::Pending);
    CHECK(task.target.string() == (tmp.path() / "x" / "A").string());
    CHECK(task.itemDir.string() == (tmp.path() / "x").string());
}

TEST_CASE("every scheduled task satisfies the selection", "[scheduler]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    manifest::Manifest m;
    auto a = make_item("a");
    a.files.push_back(make_file("a_win_en", "windows", "en", 1));
    a.files.push_back(make_file("a_win_de", "windows", "de", 1));
    a.files.push_back(make_file("a_mac", "mac", "", 1));
    a.files.push_back(make_file("a_any", "", "", 1));
    a.files.push_back(make_file("a_soundtrack", "", "", 1, manifest::FileKind::Extra));
    m.upsert(a, fixed_time());
    auto b = make_item("b");
    b.files.push_back(make_file("b_win_en", "windows", "en", 1, manifest::FileKind::Patch));
    m.upsert(b, fixed_time());

    SelectionFilter filter;
    filter.osSet = {"windows", "linux"};
    filter.langSet = {"en"};
    filter.includeExtras = false;

    auto plan = immediate_scheduler().schedule(m, filter, tmp.path());
    REQUIRE(plan);
    const auto mf = filter.toManifestFilter();
    std::vector<std::string> names;
    for (const auto& t : plan.value()) {
        CHECK(mf.matches(*t.item, *t.file));
        names.push_back(t.file->name);
    }
    CHECK(names == std::vector<std::string>{"a_win_en", "a_any", "b_win_en"});
}

TEST_CASE("skip flags narrow the kinds scheduled", "[scheduler]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    manifest::Manifest m;
    auto a = make_item("a");
    a.files.push_back(make_file("setup", "", "", 1));
    a.files.push_back(make_file("map.pdf", "", "", 1, manifest::FileKind::Extra));
    m.upsert(a, fixed_time());

    SelectionFilter filter;
    SECTION("extras only") {
        filter.includeGames = false;
        auto plan = immediate_scheduler().schedule(m, filter, tmp.path());
        REQUIRE(plan);
        REQUIRE(plan.value().size() == 1);
        CHECK(plan.value()[0].target.string() ==
              (tmp.path() / "a" / "extras" / "map.pdf").string());
    }
    SECTION("nothing at all") {
        filter.includeGames = false;
        filter.includeExtras = false;
        auto plan = immediate_scheduler().schedule(m, filter, tmp.path());
        REQUIRE(plan);
        CHECK(plan.value().empty());
    }
}

TEST_CASE("target paths depend on kind", "[scheduler]") {
    const fs::path root = "/library";
    const auto item = make_item("game");
    const auto at = [&](const manifest::FileRecord& f) {
        auto p = targetPathFor(root, item, f);
        REQUIRE(p);
        return p.value().generic_string();
    };
    CHECK(at(make_file("s.exe", "", "")) == "/library/game/s.exe");
    CHECK(at(make_file("p.exe", "", "", 1, manifest::FileKind::Patch)) ==
          "/library/game/patches/p.exe");
    CHECK(at(make_file("l.exe", "", "", 1, manifest::FileKind::LanguagePack)) ==
          "/library/game/language_packs/l.exe");
}

TEST_CASE("target paths never leave the root", "[scheduler]") {
    const fs::path root = "/library";
    const auto game = make_item("game");

    for (const char* name : {"../x", "../../escaped.bin", "/tmp/abs_target.bin", "..", ".",
                             "a/b", "a\\b"}) {
        INFO(name);
        auto p = targetPathFor(root, game, make_file(name, "", ""));
        REQUIRE_FALSE(p);
        CHECK(p.error().code == ErrorCode::InvalidData);
    }
    for (const char* id : {"..", "../up", ""}) {
        INFO(id);
        auto p = targetPathFor(root, make_item(id, "t"), make_file("s.exe", "", ""));
        REQUIRE_FALSE(p);
        CHECK(p.error().code == ErrorCode::InvalidData);
        CHECK_FALSE(itemDirFor(root, make_item(id, "t")));
    }

    auto dotted = targetPathFor(root, game, make_file("..hidden", "", ""));
    REQUIRE(dotted);
    CHECK(dotted.value().generic_string() == "/library/game/..hidden");
}

TEST_CASE("a record whose name escapes the root is unschedulable", "[scheduler]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    const auto root = tmp.path() / "library";
    manifest::Manifest m;
    auto a = make_item("a");
    a.files.push_back(make_file("../../escaped.bin", "", "", 4));
    a.files.push_back(make_file("ok.bin", "", "", 4));
    m.upsert(a, fixed_time());

    auto plan = immediate_scheduler().schedule(m, {}, root);
    REQUIRE(plan);
    REQUIRE(plan.value().size() == 2);
    CHECK(plan.value()[0].state == TaskState::Skipped);
    CHECK(plan.value()[0].skipReason == SkipReason::Unschedulable);
    CHECK(plan.value()[1].state == TaskState::Pending);

    FakeHttpAdapter http;
    http.serveFile("https://cdn.example.test/../../escaped.bin", "evil");
    http.serveFile("https://cdn.example.test/ok.bin", "good");
    downloader::FileFetcher fetcher(http, net::SessionContext{}, no_wait_options());
    auto report = DownloadRunner(fetcher).run(plan.value());

    CHECK(report.unschedulable == 1);
    CHECK(report.completed == 1);
    CHECK(http.requestCount() == 1);
    CHECK_FALSE(fs::exists(tmp.path() / "escaped.bin"));
    CHECK_FALSE(fs::exists(tmp.path().parent_path() / "escaped.bin"));
    CHECK(read_file(root / "a" / "ok.bin") == "good");
}

TEST_CASE("files already on disk are planned as skipped", "[scheduler]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    const auto m = two_platform_manifest();
    write_file(tmp.path() / "x" / "A", "full");
    write_file(tmp.path() / "x" / "B", "short-but-wrong");

    auto plan = immediate_scheduler().schedule(m, {}, tmp.path());
    REQUIRE(plan);
    REQUIRE(plan.value().size() == 2);
    CHECK(plan.value()[0].state == TaskState::Skipped);
    CHECK(plan.value()[0].skipReason == SkipReason::AlreadyPresent);
    CHECK(plan.value()[1].state == TaskState::Pending);
}

TEST_CASE("an existing file without a declared size is not fetched again", "[scheduler]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    manifest::Manifest m;
    auto a = make_item("a");
    a.files.push_back(make_file("soundtrack.zip", "", "", std::nullopt, manifest::FileKind::Extra));
    m.upsert(a, fixed_time());

    FakeHttpAdapter http;
    http.serveFile("https://cdn.example.test/soundtrack.zip", "music");
    downloader::FileFetcher fetcher(http, net::SessionContext{}, no_wait_options());

    for (int run = 1; run <= 3; ++run) {
        INFO("run " << run);
        auto plan = immediate_scheduler().schedule(m, {}, tmp.path());
        REQUIRE(plan);
        REQUIRE(plan.value().size() == 1);
        auto report = DownloadRunner(fetcher).run(plan.value());
        if (run == 1) {
            CHECK(plan.value()[0].state == TaskState::Completed);
            CHECK(report.completed == 1);
        } else {
            CHECK(plan.value()[0].skipReason == SkipReason::AlreadyPresent);
            CHECK(report.skipped == 1);
        }
        CHECK(http.requestCount() == 1);
    }
    CHECK(read_file(tmp.path() / "a" / "extras" / "soundtrack.zip") == "music");
}

TEST_CASE("entries without a url cannot be scheduled", "[scheduler]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    manifest::Manifest m;
    auto a = make_item("a");
    auto broken = make_file("nourl", "", "", 1);
    broken.url.clear();
    a.files.push_back(broken);
    m.upsert(a, fixed_time());

    auto plan = immediate_scheduler().schedule(m, {}, tmp.path());
    REQUIRE(plan);
    REQUIRE(plan.value().size() == 1);
    CHECK(plan.value()[0].skipReason == SkipReason::Unschedulable);
}

TEST_CASE("an unknown item id is rejected", "[scheduler]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    SelectionFilter filter;
    filter.itemId = "nope";
    auto plan = immediate_scheduler().schedule(two_platform_manifest(), filter, tmp.path());
    REQUIRE_FALSE(plan);
    CHECK(plan.error().code == ErrorCode::UnknownItem);
}

TEST_CASE("the start delay is slept in slices and can be interrupted", "[scheduler]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    std::chrono::milliseconds slept{0};
    int calls = 0;

    SchedulerOptions o;
    o.startDelay = std::chrono::milliseconds(3500);
    o.sleeper = [&](std::chrono::milliseconds d) {
        slept += d;
        ++calls;
    };

    SECTION("waits the full delay") {
        DownloadScheduler s(o);
        REQUIRE(s.schedule(two_platform_manifest(), {}, tmp.path()));
        CHECK(slept == std::chrono::milliseconds(3500));
        CHECK(calls == 4);
    }
    SECTION("cancel ends the wait") {
        o.shouldCancel = [&] { return calls >= 2; };
        DownloadScheduler s(o);
        auto plan = s.schedule(two_platform_manifest(), {}, tmp.path());
        REQUIRE_FALSE(plan);
        CHECK(plan.error().code == ErrorCode::OperationCancelled);
        CHECK(calls == 2);
    }
}

TEST_CASE("the runner reports outcomes in plan order", "[scheduler][runner]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    manifest::Manifest m;
    auto a = make_item("a");
    for (int i = 0; i < 6; ++i)
        a.files.push_back(make_file("f" + std::to_string(i), "", "", 4));
    m.upsert(a, fixed_time());

    FakeHttpAdapter http;
    for (int i = 0; i < 6; ++i) {
        if (i == 3)
            continue; // 404: fails without affecting the others
        http.serveFile("https://cdn.example.test/f" + std::to_string(i), "data");
    }
    downloader::FileFetcher fetcher(http, net::SessionContext{}, no_wait_options());

    const int concurrency = GENERATE(1, 4);
    auto plan = immediate_scheduler().schedule(m, {}, tmp.path());
    REQUIRE(plan);
    DownloadRunner runner(fetcher, concurrency);
    auto report = runner.run(plan.value());

    REQUIRE(report.outcomes.size() == 6);
    CHECK(report.completed == 5);
    REQUIRE(report.failures.size() == 1);
    CHECK(report.failures[0].first == "a/f3");
    CHECK(report.outcomes[3].state == TaskState::FailedFatal);
    CHECK(report.bytes == 20);
    CHECK_FALSE(report.cancelled);
    for (int i = 0; i < 6; ++i) {
        if (i != 3)
            CHECK(read_file(tmp.path() / "a" / ("f" + std::to_string(i))) == "data");
    }
}

TEST_CASE("a file that keeps failing transiently gives up without holding back the rest",
          "[scheduler][runner]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    manifest::Manifest m;
    auto a = make_item("a");
    for (int i = 0; i < 4; ++i)
        a.files.push_back(make_file("f" + std::to_string(i), "", "", 4));
    m.upsert(a, fixed_time());

    FakeHttpAdapter http;
    const std::string flaky = "https://cdn.example.test/f1";
    http.script(flaky, FakeResponse{503, {}, std::nullopt, std::nullopt});
    for (int i = 0; i < 4; ++i) {
        if (i != 1)
            http.serveFile("https://cdn.example.test/f" + std::to_string(i), "data");
    }

    auto o = no_wait_options();
    o.retry.maxAttempts = 3;
    std::vector<std::chrono::milliseconds> waits;
    std::mutex waitsMutex;
    o.sleeper = [&](std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lock(waitsMutex);
        waits.push_back(d);
    };
    downloader::FileFetcher fetcher(http, net::SessionContext{}, o);

    const int concurrency = GENERATE(1, 3);
    auto plan = immediate_scheduler().schedule(m, {}, tmp.path());
    REQUIRE(plan);
    auto report = DownloadRunner(fetcher, concurrency).run(plan.value());

    CHECK(http.requestCount(flaky) == 3);
    CHECK(waits.size() == 2);
    CHECK(report.completed == 3);
    REQUIRE(report.failures.size() == 1);
    CHECK(report.failures[0].first == "a/f1");
    CHECK(report.failures[0].second.code == ErrorCode::FetchFailed);
    CHECK(report.outcomes[1].attempts == 3);
    CHECK_FALSE(report.cancelled);
    for (int i : {0, 2, 3})
        CHECK(read_file(tmp.path() / "a" / ("f" + std::to_string(i))) == "data");
}

TEST_CASE("the runner clamps concurrency", "[scheduler][runner]") {
    FakeHttpAdapter http;
    downloader::FileFetcher fetcher(http, net::SessionContext{}, no_wait_options());
    CHECK(DownloadRunner(fetcher, 0).concurrency() == 1);
    CHECK(DownloadRunner(fetcher, 16).concurrency() == DownloadRunner::kMaxConcurrency);
}

TEST_CASE("a cancelled run leaves the rest unstarted", "[scheduler][runner]") {
    auto tmp = TempDirScope::unique_under("shelf-sched");
    const auto m = two_platform_manifest();
    FakeHttpAdapter http;
    auto o = no_wait_options();
    o.shouldCancel = [] { return true; };
    downloader::FileFetcher fetcher(http, net::SessionContext{}, o);

    auto plan = immediate_scheduler().schedule(m, {}, tmp.path());
    REQUIRE(plan);
    auto report = DownloadRunner(fetcher).run(plan.value());
    CHECK(report.cancelled);
    CHECK(report.completed == 0);
    CHECK(http.requestCount() == 0);
}
