#include <doctest/doctest.h>
#include <pathguard/normalizer.hpp>
#include <pathguard/resolver.hpp>
#include <pathguard/sandbox.hpp>

#include <string>
#include <vector>

using namespace pathguard;

namespace {

TrustedRoot root_of(const std::string& path) {
    auto r = make_trusted_root(path);
    REQUIRE(r.ok);
    return *r.root;
}

} // namespace

TEST_CASE("candidate inside root is safe") {
    auto root = root_of("/srv/uploads");
    auto v = validate(root, "/srv/uploads/reports/2025.pdf");
    REQUIRE(v.safe);
    CHECK(v.path == "/srv/uploads/reports/2025.pdf");
}

TEST_CASE("root itself is safe") {
    auto root = root_of("/srv/uploads");
    auto v = validate(root, "/srv/uploads");
    REQUIRE(v.safe);
    CHECK(v.path == "/srv/uploads");
    CHECK(validate(root, "/srv/uploads/").safe);
}

TEST_CASE("sibling sharing a character prefix is blocked") {
    auto root = root_of("/home/user");
    auto v = validate(root, "/home/user2/secret");
    CHECK_FALSE(v.safe);
    CHECK(v.reason == PathError::EscapesRoot);
    CHECK_FALSE(is_within_root(root, "/home/user-evil"));
    CHECK_FALSE(is_within_root(root, "/home/username/file"));
}

TEST_CASE("parent and unrelated paths are blocked") {
    auto root = root_of("/srv/uploads");
    CHECK(validate(root, "/srv").reason == PathError::EscapesRoot);
    CHECK(validate(root, "/").reason == PathError::EscapesRoot);
    CHECK(validate(root, "/etc/passwd").reason == PathError::EscapesRoot);
}

TEST_CASE("candidate is normalized before comparison") {
    auto root = root_of("/srv/uploads");
    CHECK_FALSE(is_within_root(root, "/srv/uploads/../secrets"));
    auto v = validate(root, "/srv//uploads/./a/../b");
    REQUIRE(v.safe);
    CHECK(v.path == "/srv/uploads/b");
}

TEST_CASE("relative candidates are blocked") {
    auto root = root_of("/srv/uploads");
    CHECK(validate(root, "srv/uploads/file").reason == PathError::EscapesRoot);
    CHECK(validate(root, "file").reason == PathError::EscapesRoot);
}

TEST_CASE("empty and NUL candidates are blocked") {
    auto root = root_of("/srv/uploads");
    CHECK(validate(root, "").reason == PathError::EmptyInput);
    CHECK(validate(root, std::string("/srv/uploads/a\0b", 16)).reason ==
          PathError::NormalizationFailed);
}

TEST_CASE("filesystem root contains every absolute path") {
    auto root = root_of("/");
    CHECK(is_within_root(root, "/etc/passwd"));
    CHECK(is_within_root(root, "/"));
}

TEST_CASE("no amount of dotdot escapes through resolve") {
    const std::vector<std::string> roots = {"/srv/uploads", "/home/user", "/a", "/"};
    const std::vector<std::string> fragments = {
        "..",
        "../..",
        "../../../../../../etc/passwd",
        "a/b/c/../../../../../../../etc",
        "a/../../b",
        "./../uploads2/x",
        "..\\..\\etc",
        "/../../etc",
        "a/./../../..//x",
    };

    for (const auto& r : roots) {
        auto root = root_of(r);
        for (const auto& f : fragments) {
            CAPTURE(r);
            CAPTURE(f);
            auto candidate = resolve(root, f);
            REQUIRE(candidate.ok);
            auto verdict = validate(root, candidate.path);
            if (verdict.safe) {
                auto segs = split_segments(verdict.path);
                REQUIRE(segs.size() >= root.segments().size());
                for (size_t i = 0; i < root.segments().size(); ++i) {
                    CHECK(segs[i] == root.segments()[i]);
                }
            } else {
                CHECK(verdict.reason == PathError::EscapesRoot);
            }
        }
    }
}

TEST_CASE("traversal scenario is blocked") {
    auto root = root_of("/srv/uploads");
    auto candidate = resolve(root, "../../etc/passwd");
    REQUIRE(candidate.ok);
    auto v = validate(root, candidate.path);
    CHECK_FALSE(v.safe);
    CHECK(v.reason == PathError::EscapesRoot);
}

TEST_CASE("fragment resolving into a prefix-sharing sibling is blocked") {
    auto root = root_of("/home/user");
    auto candidate = resolve(root, "../user2/secret");
    REQUIRE(candidate.ok);
    CHECK(candidate.path == "/home/user2/secret");
    CHECK(validate(root, candidate.path).reason == PathError::EscapesRoot);
}
