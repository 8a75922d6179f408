#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <hdrguard/git.hpp>

namespace hdrguard {

struct Workspace {
    std::filesystem::path root;
    std::optional<GitRepo> repo;

    bool is_git() const { return repo.has_value(); }
};

// Enclosing git work tree of `cwd`; else the first existing directory pattern
// (or the parent of the first existing file pattern); else `cwd`.
Workspace resolve_workspace(const std::vector<std::string>& patterns, const std::filesystem::path& cwd);

} // namespace hdrguard
