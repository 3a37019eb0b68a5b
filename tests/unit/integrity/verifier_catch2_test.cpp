#include <catch2/catch_test_macros.hpp>

#include <shelf/crypto/hasher.h>
#include <shelf/downloader/downloader.hpp>
#include <shelf/integrity/verifier.h>

#include "support/manifest_builders.hpp"
#include "support/temp_dir_scope.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace shelf;
using namespace shelf::integrity;
using namespace shelf::test_support;

namespace {

const std::string kContent = "the quick brown fox jumps over the lazy dog";

crypto::Checksum md5_of(const std::string& text) {
    crypto::Checksum c;
    c.algo = crypto::HashAlgo::Md5;
    c.hex = crypto::EvpHasher::hash(crypto::HashAlgo::Md5, std::as_bytes(std::span(text)));
    return c;
}

// Stored (uncompressed) zip so tests can find and damage entry bytes
void write_zip(const fs::path& path, const std::vector<std::pair<std::string, std::string>>& entries) {
    struct archive* a = archive_write_new();
    REQUIRE(a != nullptr);
    REQUIRE(archive_write_set_format_zip(a) == ARCHIVE_OK);
    REQUIRE(archive_write_set_format_option(a, "zip", "compression", "store") == ARCHIVE_OK);
    REQUIRE(archive_write_open_filename(a, path.c_str()) == ARCHIVE_OK);

    for (const auto& [name, data] : entries) {
        struct archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, name.c_str());
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        archive_entry_set_size(e, static_cast<la_int64_t>(data.size()));
        REQUIRE(archive_write_header(a, e) == ARCHIVE_OK);
        REQUIRE(archive_write_data(a, data.data(), data.size()) ==
                static_cast<la_ssize_t>(data.size()));
        archive_entry_free(e);
    }
    REQUIRE(archive_write_close(a) == ARCHIVE_OK);
    archive_write_free(a);
}

struct VerifyFixture {
    TempDirScope tmp = TempDirScope::unique_under("shelf-verify");
    manifest::Manifest m;

    fs::path root() const { return tmp.path(); }

    // Single item "g" holding one file with the given bytes on record
    void add(const std::string& name, const std::string& content, bool withChecksum = true,
             bool withSize = true) {
        auto item = m.find("g") ? *m.find("g") : make_item("g");
        auto f = make_file(name, "", "",
                           withSize ? std::optional<std::uint64_t>(content.size()) : std::nullopt);
        if (withChecksum)
            f.checksum = md5_of(content);
        item.files.push_back(f);
        m.upsert(item, fixed_time());
    }

    fs::path on_disk(const std::string& name) const { return root() / "g" / name; }
};

} // namespace

TEST_CASE_METHOD(VerifyFixture, "intact files pass every check", "[integrity]") {
    add("setup.exe", kContent);
    write_file(on_disk("setup.exe"), kContent);

    auto report = IntegrityVerifier().verify(m, root());
    REQUIRE(report);
    REQUIRE(report.value().records.size() == 1);
    const auto& rec = report.value().records[0];
    CHECK(rec.passed());
    CHECK(rec.checksum == CheckResult::Pass);
    CHECK(rec.size == CheckResult::Pass);
    CHECK(rec.archive == CheckResult::NotApplicable);
    CHECK(report.value().present == 1);
    REQUIRE(report.value().items.size() == 1);
    CHECK(report.value().items[0].status == ItemStatus::AllPassed);
}

TEST_CASE_METHOD(VerifyFixture, "a flipped byte is a checksum mismatch", "[integrity]") {
    add("setup.exe", kContent);
    auto damaged = kContent;
    damaged[5] = 'Q';
    write_file(on_disk("setup.exe"), damaged);

    auto report = IntegrityVerifier().verify(m, root());
    REQUIRE(report);
    const auto& rec = report.value().records[0];
    CHECK(rec.status == FileStatus::Failed);
    CHECK(rec.checksum == CheckResult::Fail);
    CHECK(rec.size == CheckResult::Pass);
    REQUIRE(rec.problems.size() == 1);
    CHECK(rec.problems[0].code == ErrorCode::ChecksumMismatch);
    CHECK(report.value().checksumFailures == 1);
    CHECK(report.value().items[0].status == ItemStatus::SomeFailed);
    CHECK(fs::exists(on_disk("setup.exe")));
}

TEST_CASE_METHOD(VerifyFixture, "delete removes failing files and leaves good ones",
                 "[integrity][delete]") {
    add("good.exe", kContent);
    add("bad.exe", kContent);
    write_file(on_disk("good.exe"), kContent);
    write_file(on_disk("bad.exe"), std::string(kContent.size(), 'x'));

    VerifyOptions opts;
    opts.disposition = Disposition::Delete;
    auto report = IntegrityVerifier(opts).verify(m, root());
    REQUIRE(report);

    CHECK(report.value().deleted == 1);
    CHECK(report.value().records[1].deleted);
    CHECK(report.value().records[1].problems[0].code == ErrorCode::ChecksumMismatch);
    CHECK_FALSE(fs::exists(on_disk("bad.exe")));
    CHECK(fs::exists(on_disk("good.exe")));
}

TEST_CASE_METHOD(VerifyFixture, "wrong sizes are reported", "[integrity]") {
    add("data.bin", kContent, false);
    write_file(on_disk("data.bin"), kContent + "!");

    auto report = IntegrityVerifier().verify(m, root());
    REQUIRE(report);
    const auto& rec = report.value().records[0];
    CHECK(rec.checksum == CheckResult::NotApplicable);
    CHECK(rec.size == CheckResult::Fail);
    CHECK(rec.problems[0].code == ErrorCode::SizeMismatch);
    CHECK(report.value().sizeFailures == 1);
}

TEST_CASE_METHOD(VerifyFixture, "unknown values are not applicable", "[integrity]") {
    add("readme.txt", kContent, false, false);
    write_file(on_disk("readme.txt"), "anything at all");

    auto report = IntegrityVerifier().verify(m, root());
    REQUIRE(report);
    const auto& rec = report.value().records[0];
    CHECK(rec.passed());
    CHECK(rec.checksum == CheckResult::NotApplicable);
    CHECK(rec.size == CheckResult::NotApplicable);
}

TEST_CASE_METHOD(VerifyFixture, "disabled checks do not run", "[integrity]") {
    add("setup.exe", kContent);
    write_file(on_disk("setup.exe"), std::string(kContent.size(), 'x'));

    VerifyOptions opts;
    opts.checks = {Check::Size};
    auto report = IntegrityVerifier(opts).verify(m, root());
    REQUIRE(report);
    const auto& rec = report.value().records[0];
    CHECK(rec.passed());
    CHECK(rec.checksum == CheckResult::NotRun);
    CHECK(rec.archive == CheckResult::NotRun);
}

TEST_CASE_METHOD(VerifyFixture, "missing files are counted and stale partials cleaned",
                 "[integrity][delete]") {
    add("gone.exe", kContent);
    add("here.exe", kContent);
    write_file(on_disk("here.exe"), kContent);
    write_file(downloader::partPathFor(on_disk("gone.exe")), "half");

    VerifyOptions opts;
    SECTION("report only") {
        auto report = IntegrityVerifier(opts).verify(m, root());
        REQUIRE(report);
        CHECK(report.value().missing == 1);
        CHECK(report.value().records[0].status == FileStatus::Missing);
        CHECK(report.value().items[0].status == ItemStatus::SomeMissing);
        CHECK(fs::exists(downloader::partPathFor(on_disk("gone.exe"))));
    }
    SECTION("delete") {
        opts.disposition = Disposition::Delete;
        auto report = IntegrityVerifier(opts).verify(m, root());
        REQUIRE(report);
        CHECK(report.value().records[0].deleted);
        CHECK(report.value().deleted == 0);
        CHECK_FALSE(fs::exists(downloader::partPathFor(on_disk("gone.exe"))));
    }
}

TEST_CASE_METHOD(VerifyFixture, "a failure outranks a missing file in the item summary",
                 "[integrity]") {
    add("gone.exe", kContent);
    add("bad.exe", kContent);
    write_file(on_disk("bad.exe"), std::string(kContent.size(), 'x'));

    auto report = IntegrityVerifier().verify(m, root());
    REQUIRE(report);
    const auto& summary = report.value().items[0];
    CHECK(summary.status == ItemStatus::SomeFailed);
    CHECK(summary.missing == 1);
    CHECK(summary.failed == 1);
}

TEST_CASE_METHOD(VerifyFixture, "an unknown item id is rejected", "[integrity]") {
    VerifyOptions opts;
    opts.itemId = "nobody";
    auto report = IntegrityVerifier(opts).verify(m, root());
    REQUIRE_FALSE(report);
    CHECK(report.error().code == ErrorCode::UnknownItem);
}

TEST_CASE("archive paths are recognised by suffix", "[integrity][archive]") {
    CHECK(isArchivePath("bonus.zip"));
    CHECK(isArchivePath("ART.ZIP"));
    CHECK(isArchivePath("src.tar.gz"));
    CHECK(isArchivePath("soundtrack.7z"));
    CHECK_FALSE(isArchivePath("setup.exe"));
    CHECK_FALSE(isArchivePath("zip"));
}

TEST_CASE("archive scanning catches damaged archives", "[integrity][archive]") {
    auto tmp = TempDirScope::unique_under("shelf-archive");
    const auto zip = tmp.path() / "bonus.zip";
    const std::string marker = "PAYLOAD-0123456789-PAYLOAD-0123456789";
    write_zip(zip, {{"readme.txt", "hello"}, {"art/cover.txt", marker}});

    REQUIRE(scanArchive(zip));

    SECTION("flipped payload byte") {
        auto bytes = read_file(zip);
        const auto at = bytes.find(marker);
        REQUIRE(at != std::string::npos);
        bytes[at + 3] = 'X';
        write_file(zip, bytes);
    }
    SECTION("not an archive at all") {
        write_file(zip, "definitely not a zip file");
    }

    auto r = scanArchive(zip);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::ArchiveCorrupt);
}

TEST_CASE_METHOD(VerifyFixture, "archive failures are counted by the verifier",
                 "[integrity][archive]") {
    const auto zip = on_disk("extras.zip");
    fs::create_directories(zip.parent_path());
    const std::string marker = "ENTRY-DATA-ENTRY-DATA";
    write_zip(zip, {{"a.txt", marker}});
    auto bytes = read_file(zip);
    const auto at = bytes.find(marker);
    REQUIRE(at != std::string::npos);
    bytes[at] = 'e';
    write_file(zip, bytes);
    add("extras.zip", bytes);

    auto report = IntegrityVerifier().verify(m, root());
    REQUIRE(report);
    const auto& rec = report.value().records[0];
    CHECK(rec.checksum == CheckResult::Pass);
    CHECK(rec.size == CheckResult::Pass);
    CHECK(rec.archive == CheckResult::Fail);
    CHECK(rec.problems[0].code == ErrorCode::ArchiveCorrupt);
    CHECK(report.value().archiveFailures == 1);
}

TEST_CASE_METHOD(VerifyFixture, "an unreadable file is not reported as a checksum mismatch",
                 "[integrity]") {
    add("locked.exe", kContent);
    const auto path = on_disk("locked.exe");
    write_file(path, kContent);
    fs::permissions(path, fs::perms::none, fs::perm_options::replace);
    if (std::ifstream(path)) {
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
        SKIP("file modes are not enforced for this user");
    }

    VerifyOptions opts;
    opts.disposition = Disposition::Delete;
    auto report = IntegrityVerifier(opts).verify(m, root());
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
    REQUIRE(report);

    const auto& rec = report.value().records[0];
    CHECK(rec.checksum == CheckResult::Unreadable);
    CHECK(rec.size == CheckResult::Pass);
    CHECK_FALSE(rec.mismatched());
    REQUIRE(rec.problems.size() == 1);
    CHECK(rec.problems[0].code == ErrorCode::FilesystemError);
    CHECK(report.value().checksumFailures == 0);
    CHECK(report.value().readFailures == 1);
    CHECK_FALSE(rec.deleted);
    CHECK(fs::exists(path));
}

TEST_CASE_METHOD(VerifyFixture, "names that leave the root are never touched",
                 "[integrity][delete]") {
    const auto outside = root() / "victim.txt";
    write_file(outside, "keep me");

    auto item = make_item("g");
    auto f = make_file("../victim.txt", "", "", 1);
    f.checksum = md5_of("something else");
    item.files.push_back(f);
    m.upsert(item, fixed_time());

    VerifyOptions opts;
    opts.disposition = Disposition::Delete;
    auto report = IntegrityVerifier(opts).verify(m, root());
    REQUIRE(report);
    CHECK(report.value().files == 1);
    CHECK(report.value().unresolvable == 1);
    CHECK(report.value().records.empty());
    CHECK(read_file(outside) == "keep me");
}
