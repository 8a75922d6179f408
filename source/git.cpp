#include <hdrguard/git.hpp>
#include <hdrguard/errors.hpp>
#include <hdrguard/util.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace hdrguard {

GitRepo::GitRepo(std::filesystem::path root) : root_(std::move(root)) {}

std::optional<GitRepo> GitRepo::discover(const std::filesystem::path& start) {
    std::error_code ec;
    auto dir = std::filesystem::is_directory(start, ec) ? start : start.parent_path();
    auto r = run_command({"git", "rev-parse", "--show-toplevel"}, dir);
    if (r.exit_code != 0) {
        spdlog::debug("no git work tree at {}: rc={} {}", dir.string(), r.exit_code, trim(r.err));
        return std::nullopt;
    }
    auto top = trim(r.out);
    if (top.empty()) return std::nullopt;
    return GitRepo(normalize_path(top));
}

bool GitRepo::run_git(const std::vector<std::string>& args, int& rc,
                      std::string* out, std::string* err) const
{
    auto r = run_command(args, root_);
    rc = r.exit_code;
    if (out) *out = std::move(r.out);
    if (err) *err = std::move(r.err);
    return (rc == 0);
}

std::string GitRepo::reroot(const std::string& rel) const {
    return to_slash(root_ / rel);
}

std::vector<std::string> GitRepo::list(const std::vector<std::string>& args, const char* what) const {
    int rc = 0;
    std::string out, err;
    if (!run_git(args, rc, &out, &err)) {
        throw VcsError(fmt::format("{} failed in {} (rc={}): {}", what, root_.string(), rc, trim(err)));
    }
    return split_nul(out);
}

PathSet GitRepo::tracked_files() const {
    PathSet set;
    for (auto& rel : list({"git", "ls-files", "-z", "--full-name"}, "git ls-files")) {
        set.insert(reroot(rel));
    }
    spdlog::debug("git: {} tracked files under {}", set.size(), root_.string());
    return set;
}

PathSet GitRepo::changed_since(const std::string& ref, bool committed_only) const {
    int rc = 0;
    std::string out, err;
    if (!run_git({"git", "rev-parse", "--verify", "--quiet", ref + "^{commit}"}, rc, &out, &err)) {
        throw VcsError(fmt::format("unknown git reference '{}'", ref));
    }

    PathSet set;
    std::vector<std::string> diff_args{"git", "diff", "--name-only", "-z", "--no-renames", "--diff-filter=ACMR", ref};
    if (committed_only) diff_args.push_back("HEAD");
    for (auto& rel : list(diff_args, "git diff")) set.insert(reroot(rel));

    if (!committed_only) {
        for (auto& rel : list({"git", "ls-files", "-z", "--others", "--exclude-standard", "--full-name"},
                              "git ls-files --others")) {
            set.insert(reroot(rel));
        }
    }
    spdlog::debug("git: {} paths changed since {}", set.size(), ref);
    return set;
}

} // namespace hdrguard
