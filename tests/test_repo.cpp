#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <hdrguard/errors.hpp>
#include <hdrguard/filter.hpp>
#include <hdrguard/git.hpp>
#include <hdrguard/workspace.hpp>
#include "helpers.hpp"

using namespace hdrguard;

static bool has(const PathSet& s, const fs::path& p) {
    return s.count(to_slash(p)) > 0;
}

TEST_CASE("Discover repository root from a nested directory") {
    auto tmp = make_tmpdir("hdrguard_git_root_");
    init_repo(tmp);
    write_file(tmp / "pkg" / "inner" / "x.rs", "fn main() {}\n");

    auto repo = GitRepo::discover(tmp / "pkg" / "inner");
    REQUIRE(repo.has_value());
    REQUIRE(repo->root() == tmp);

    auto outside = make_tmpdir("hdrguard_no_git_");
    REQUIRE_FALSE(GitRepo::discover(outside).has_value());
}

TEST_CASE("Tracked files are re-rooted at the repository root") {
    auto tmp = make_tmpdir("hdrguard_git_tracked_");
    init_repo(tmp);
    write_file(tmp / "a.rs", "a\n");
    write_file(tmp / "pkg" / "b.rs", "b\n");
    commit_all(tmp, "init");
    write_file(tmp / "pkg" / "new.rs", "n\n");

    auto repo = GitRepo::discover(tmp / "pkg");
    REQUIRE(repo.has_value());
    auto tracked = repo->tracked_files();
    REQUIRE(has(tracked, tmp / "a.rs"));
    REQUIRE(has(tracked, tmp / "pkg" / "b.rs"));
    REQUIRE_FALSE(has(tracked, tmp / "pkg" / "new.rs"));

    auto filter = MembershipFilter::tracked(*repo);
    REQUIRE(filter->accepts(make_candidate(tmp / "pkg" / "b.rs")).accepted);
    REQUIRE_FALSE(filter->accepts(make_candidate(tmp / "pkg" / "new.rs")).accepted);
}

TEST_CASE("Changed-since covers working tree or only commits") {
    auto tmp = make_tmpdir("hdrguard_git_changed_");
    init_repo(tmp);
    write_file(tmp / "old.rs", "old\n");
    write_file(tmp / "edit.rs", "v1\n");
    write_file(tmp / "gone.rs", "bye\n");
    commit_all(tmp, "base");
    git(tmp, {"tag", "base"});

    write_file(tmp / "committed.rs", "c\n");
    git(tmp, {"rm", "-q", "gone.rs"});
    commit_all(tmp, "second");

    write_file(tmp / "edit.rs", "v2\n");
    write_file(tmp / "untracked.rs", "u\n");

    GitRepo repo(tmp);

    SECTION("working tree") {
        auto set = repo.changed_since("base", false);
        REQUIRE(has(set, tmp / "committed.rs"));
        REQUIRE(has(set, tmp / "edit.rs"));
        REQUIRE(has(set, tmp / "untracked.rs"));
        REQUIRE_FALSE(has(set, tmp / "old.rs"));
        REQUIRE_FALSE(has(set, tmp / "gone.rs"));
    }

    SECTION("committed only") {
        auto set = repo.changed_since("base", true);
        REQUIRE(has(set, tmp / "committed.rs"));
        REQUIRE_FALSE(has(set, tmp / "edit.rs"));
        REQUIRE_FALSE(has(set, tmp / "untracked.rs"));
    }

    SECTION("unknown reference") {
        REQUIRE_THROWS_AS(repo.changed_since("no-such-ref", false), VcsError);
    }
}

TEST_CASE("Changed-since lists the new name of a renamed file") {
    auto tmp = make_tmpdir("hdrguard_git_rename_");
    init_repo(tmp);
    write_file(tmp / "old.rs", "fn same() {}\n");
    write_file(tmp / "keep.rs", "fn keep() {}\n");
    commit_all(tmp, "base");
    git(tmp, {"tag", "base"});
    git(tmp, {"mv", "old.rs", "renamed.rs"});

    GitRepo repo(tmp);

    SECTION("staged rename") {
        auto set = repo.changed_since("base", false);
        REQUIRE(has(set, tmp / "renamed.rs"));
        REQUIRE_FALSE(has(set, tmp / "old.rs"));
        REQUIRE_FALSE(has(set, tmp / "keep.rs"));
    }

    SECTION("committed rename") {
        commit_all(tmp, "rename");
        auto set = repo.changed_since("base", true);
        REQUIRE(has(set, tmp / "renamed.rs"));
        REQUIRE_FALSE(has(set, tmp / "old.rs"));
        REQUIRE_FALSE(has(set, tmp / "keep.rs"));
    }
}

TEST_CASE("Workspace falls back to the input directory without git") {
    auto tmp = make_tmpdir("hdrguard_ws_");
    write_file(tmp / "proj" / "a.rs", "");

    auto ws = resolve_workspace({(tmp / "proj").string()}, tmp);
    REQUIRE(ws.root == tmp / "proj");
    REQUIRE_FALSE(ws.is_git());

    auto from_file = resolve_workspace({(tmp / "proj" / "a.rs").string()}, tmp);
    REQUIRE(from_file.root == tmp / "proj");

    auto none = resolve_workspace({"missing"}, tmp);
    REQUIRE(none.root == tmp);
}
