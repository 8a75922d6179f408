#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace hdrguard {

// Set of absolute, slash-separated paths re-rooted at the repository root.
using PathSet = std::unordered_set<std::string>;

class GitRepo {
public:
    explicit GitRepo(std::filesystem::path root);

    // Walks up from `start` the way git does; nullopt outside a work tree or without git.
    static std::optional<GitRepo> discover(const std::filesystem::path& start);

    const std::filesystem::path& root() const { return root_; }

    PathSet tracked_files() const;

    // Added, copied, modified and renamed paths relative to `ref`. Unless
    // `committed_only`, uncommitted edits and untracked files count as changed.
    PathSet changed_since(const std::string& ref, bool committed_only) const;

private:
    std::filesystem::path root_;

    bool run_git(const std::vector<std::string>& args, int& rc, std::string* out=nullptr, std::string* err=nullptr) const;
    std::vector<std::string> list(const std::vector<std::string>& args, const char* what) const;
    std::string reroot(const std::string& rel) const;
};

} // namespace hdrguard
