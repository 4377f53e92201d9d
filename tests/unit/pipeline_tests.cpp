#include <doctest/doctest.h>
#include <pathguard/pipeline.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace pathguard;

namespace {

Pipeline make(const std::string& root, PipelineOptions options = {}) {
    auto created = Pipeline::create(root, options);
    REQUIRE(created.ok);
    return *created.pipeline;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("create rejects an invalid root") {
    auto created = Pipeline::create("relative/root");
    CHECK_FALSE(created.ok);
    CHECK_FALSE(created.pipeline.has_value());
    CHECK(created.error == PathError::InvalidRoot);
}

TEST_CASE("create normalizes the root") {
    auto p = make("/srv/uploads/");
    CHECK(p.root().path() == "/srv/uploads");
}

// ============================================================================
// Validation scenarios
// ============================================================================

TEST_CASE("safe fragment resolves under the root") {
    auto p = make("/srv/uploads");
    auto r = p.run("reports/2025.pdf");
    REQUIRE(r.ok);
    CHECK(r.path == "/srv/uploads/reports/2025.pdf");
    CHECK(r.stage == PipelineStage::Done);
    CHECK(r.error == PathError::None);
}

TEST_CASE("traversal is blocked at validation") {
    auto p = make("/srv/uploads");
    auto r = p.run("../../etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
    CHECK(r.stage == PipelineStage::Validated);
    CHECK(r.path.empty());
}

TEST_CASE("blocked paths never fall back to a default") {
    auto p = make("/srv/uploads");
    auto r = p.run("../uploads-evil/x", Relocate{"/srv/uploads/quarantine"});
    CHECK_FALSE(r.ok);
    CHECK(r.path.empty());
}

TEST_CASE("empty fragments are rejected before normalization") {
    auto p = make("/srv/uploads");
    for (const std::string f : {"", "   "}) {
        auto r = p.run(f);
        CHECK_FALSE(r.ok);
        CHECK(r.error == PathError::EmptyInput);
        CHECK(r.stage == PipelineStage::Start);
    }
}

TEST_CASE("NUL fragments fail normalization") {
    auto p = make("/srv/uploads");
    auto r = p.run(std::string("a\0/../../etc", 12));
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::NormalizationFailed);
}

TEST_CASE("strict absolute policy stops after normalization") {
    PipelineOptions opts;
    opts.allow_absolute = false;
    auto p = make("/srv/uploads", opts);
    auto r = p.run("/etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::AbsoluteNotAllowed);
    CHECK(r.stage == PipelineStage::Normalized);
}

TEST_CASE("check returns the verdict") {
    auto p = make("/home/user");
    CHECK(p.check("docs/a.txt").safe);
    auto v = p.check("../user2/secret");
    CHECK_FALSE(v.safe);
    CHECK(v.reason == PathError::EscapesRoot);
    CHECK(p.check("").reason == PathError::EmptyInput);
}

// ============================================================================
// Transformation
// ============================================================================

TEST_CASE("run applies the processor to the validated path") {
    auto p = make("/srv/uploads");
    auto r = p.run("logs/app.log", TimestampRotate{fixed_clock("2025-01-04")});
    REQUIRE(r.ok);
    CHECK(r.path == "/srv/uploads/logs/app_2025-01-04.log");
    CHECK(r.stage == PipelineStage::Done);

    auto z = p.run("dist/archive.tar.gz", ExtensionRewrite{".zip"});
    REQUIRE(z.ok);
    CHECK(z.path == "/srv/uploads/dist/archive.tar.zip");
}

TEST_CASE("relocate outside the root is allowed unless output is confined") {
    auto open = make("/data");
    auto r = open.run("sub/report.pdf", Relocate{"/backup"});
    REQUIRE(r.ok);
    CHECK(r.path == "/backup/report.pdf");

    PipelineOptions opts;
    opts.confine_output = true;
    auto confined = make("/data", opts);
    auto blocked = confined.run("sub/report.pdf", Relocate{"/backup"});
    CHECK_FALSE(blocked.ok);
    CHECK(blocked.error == PathError::EscapesRoot);
    CHECK(blocked.stage == PipelineStage::Transformed);

    auto inside = confined.run("sub/report.pdf", Relocate{"/data/archive"});
    REQUIRE(inside.ok);
    CHECK(inside.path == "/data/archive/report.pdf");
}

TEST_CASE("renaming the root itself is refused") {
    auto p = make("/srv/uploads");

    auto rewrite = p.run(".", ExtensionRewrite{".zip"});
    CHECK_FALSE(rewrite.ok);
    CHECK(rewrite.error == PathError::EscapesRoot);
    CHECK(rewrite.stage == PipelineStage::Transformed);
    CHECK(rewrite.path.empty());

    auto rotate = p.run("a/..", TimestampRotate{fixed_clock("2025")});
    CHECK_FALSE(rotate.ok);
    CHECK(rotate.error == PathError::EscapesRoot);

    CHECK_FALSE(p.run("/", ExtensionRewrite{".bak"}).ok);

    // The root is still a valid destination when nothing renames it
    auto plain = p.run(".");
    REQUIRE(plain.ok);
    CHECK(plain.path == "/srv/uploads");
}

TEST_CASE("policy text cannot move a validated path") {
    auto p = make("/srv/uploads");

    auto evil_token = p.run("app.log", TimestampRotate{fixed_clock("x/../../../../etc/cron.d/evil")});
    CHECK_FALSE(evil_token.ok);
    CHECK(evil_token.error == PathError::InvalidFilename);
    CHECK(evil_token.stage == PipelineStage::Transformed);
    CHECK(evil_token.path.empty());

    auto evil_suffix = p.run("app.log", ExtensionRewrite{"./../../../etc/passwd"});
    CHECK_FALSE(evil_suffix.ok);
    CHECK(evil_suffix.error == PathError::InvalidFilename);

    auto dated_dirs = p.run("logs/app.log", TimestampRotate{fixed_clock("2025/01/04")});
    CHECK_FALSE(dated_dirs.ok);
    CHECK(dated_dirs.error == PathError::InvalidFilename);
}

TEST_CASE("run_each returns one result per processor") {
    auto p = make("/srv/media");
    std::vector<FileProcessor> processors = {
        ExtensionRewrite{".mp3"},
        Relocate{"/backup"},
        TimestampRotate{fixed_clock("2025-01-04")},
    };
    auto results = p.run_each("music/podcast.wav", processors);
    REQUIRE(results.size() == 3);
    CHECK(results[0].path == "/srv/media/music/podcast.mp3");
    CHECK(results[1].path == "/backup/podcast.wav");
    CHECK(results[2].path == "/srv/media/music/podcast_2025-01-04.wav");

    auto blocked = p.run_each("../../etc/shadow", processors);
    REQUIRE(blocked.size() == 3);
    for (const auto& r : blocked) {
        CHECK_FALSE(r.ok);
        CHECK(r.error == PathError::EscapesRoot);
    }
}

// ============================================================================
// Relative paths
// ============================================================================

TEST_CASE("relative_to_root strips the root") {
    auto p = make("/srv/uploads");
    CHECK(p.relative_to_root("/srv/uploads/reports/2025.pdf") == std::string("reports/2025.pdf"));
    CHECK(p.relative_to_root("/srv/uploads") == std::string("."));
    CHECK_FALSE(p.relative_to_root("/srv/uploads2/x").has_value());
    CHECK_FALSE(p.relative_to_root("reports/2025.pdf").has_value());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("one pipeline serves many threads") {
    const auto p = make("/srv/uploads");
    std::atomic<int> mismatches{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&p, &mismatches, t]() {
            for (int i = 0; i < 200; ++i) {
                auto safe = p.run("t" + std::to_string(t) + "/f" + std::to_string(i) + ".txt",
                                  ExtensionRewrite{".bak"});
                if (!safe.ok || safe.path != "/srv/uploads/t" + std::to_string(t) + "/f" +
                                                 std::to_string(i) + ".bak") {
                    ++mismatches;
                }
                if (p.check("../escape" + std::to_string(i)).safe) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    CHECK(mismatches.load() == 0);
}
