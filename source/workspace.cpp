#include <hdrguard/workspace.hpp>
#include <hdrguard/util.hpp>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace hdrguard {

Workspace resolve_workspace(const std::vector<std::string>& patterns, const fs::path& cwd) {
    Workspace ws;
    if (auto repo = GitRepo::discover(cwd)) {
        ws.root = repo->root();
        ws.repo = std::move(repo);
        spdlog::debug("workspace: git work tree {}", ws.root.string());
        return ws;
    }

    for (const auto& p : patterns) {
        fs::path raw(p);
        auto abs = raw.is_absolute() ? raw : cwd / raw;
        std::error_code ec;
        if (fs::is_directory(abs, ec)) {
            ws.root = normalize_path(abs);
            break;
        }
        if (fs::exists(abs, ec)) {
            ws.root = normalize_path(abs).parent_path();
            break;
        }
    }
    if (ws.root.empty()) ws.root = normalize_path(cwd);

    // patterns may point into a repository even when cwd is outside of it
    if (auto repo = GitRepo::discover(ws.root)) {
        ws.root = repo->root();
        ws.repo = std::move(repo);
        spdlog::debug("workspace: git work tree {} (from input path)", ws.root.string());
        return ws;
    }
    spdlog::debug("workspace: {} (no git)", ws.root.string());
    return ws;
}

} // namespace hdrguard
