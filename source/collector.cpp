#include <hdrguard/collector.hpp>
#include <hdrguard/ignore.hpp>
#include <hdrguard/util.hpp>

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace fs = std::filesystem;

namespace hdrguard {

PathCandidate make_candidate(const fs::path& p) {
    PathCandidate c;
    c.path = normalize_path(p);
    c.basename = to_lower(c.path.filename().string());

    std::error_code ec;
    c.is_symlink = fs::is_symlink(fs::symlink_status(c.path, ec));
    if (!c.is_symlink) {
        auto sz = fs::file_size(c.path, ec);
        if (!ec) c.size = sz;
    }

    // a leading dot is part of the name, not an extension (".bashrc")
    auto first = c.basename.find('.', 1);
    if (first != std::string::npos && first + 1 < c.basename.size()) {
        auto last = c.basename.rfind('.');
        c.extension = c.basename.substr(last + 1);
        if (last != first) {
            auto prev = c.basename.rfind('.', last - 1);
            c.compound_extension = c.basename.substr(prev + 1);
        }
    }
    return c;
}

PathCollector::PathCollector(fs::path cwd) : cwd_(normalize_path(cwd)) {}

void PathCollector::walk(const fs::path& dir, std::vector<fs::path>& out) const {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
    if (ec) {
        spdlog::warn("cannot walk {}: {}", dir.string(), ec.message());
        return;
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("walk error under {}: {}", dir.string(), ec.message());
            break;
        }
        const auto& entry = *it;
        std::error_code sec;
        if (entry.is_symlink(sec)) {
            out.push_back(entry.path());
            continue;
        }
        if (entry.is_directory(sec)) {
            if (entry.path().filename() == ".git") it.disable_recursion_pending();
            continue;
        }
        if (entry.is_regular_file(sec)) out.push_back(entry.path());
    }
}

void PathCollector::expand_glob(const std::string& pattern, std::vector<fs::path>& out) const {
    // static leading segments become the walk base, the rest is matched relative to it
    fs::path pat(pattern);
    fs::path base = pat.is_absolute() ? fs::path("/") : cwd_;
    std::string rest;
    bool magic = false;
    for (const auto& part : pat.relative_path()) {
        auto seg = part.string();
        if (!magic && !Glob::has_magic(seg)) {
            base /= seg;
            continue;
        }
        magic = true;
        if (!rest.empty()) rest += '/';
        rest += seg;
    }

    Glob glob(rest);
    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        spdlog::warn("glob '{}' matched nothing", pattern);
        return;
    }

    std::vector<fs::path> files;
    walk(base, files);
    size_t matched = 0;
    for (auto& f : files) {
        auto rel = relative_to(f, base);
        if (!rel) continue;
        // a match on a directory takes everything beneath it
        bool hit = glob.matches(*rel);
        for (auto pos = rel->find('/'); !hit && pos != std::string::npos; pos = rel->find('/', pos + 1)) {
            hit = glob.matches(std::string_view(*rel).substr(0, pos));
        }
        if (hit) {
            out.push_back(f);
            ++matched;
        }
    }
    if (matched == 0) spdlog::warn("glob '{}' matched nothing", pattern);
}

std::vector<PathCandidate> PathCollector::expand(const std::vector<std::string>& patterns) const {
    std::vector<fs::path> paths;
    for (const auto& p : patterns) {
        fs::path raw(p);
        fs::path abs = raw.is_absolute() ? raw : cwd_ / raw;
        std::error_code ec;
        auto st = fs::symlink_status(abs, ec);
        if (!ec && fs::is_symlink(st)) {
            paths.push_back(abs);
        } else if (!ec && fs::is_directory(st)) {
            walk(abs, paths);
        } else if (!ec && fs::exists(st)) {
            paths.push_back(abs);
        } else if (Glob::has_magic(p)) {
            expand_glob(p, paths);
        } else {
            spdlog::warn("no such file or directory: {}", p);
        }
    }

    std::vector<PathCandidate> out;
    std::unordered_set<std::string> seen;
    out.reserve(paths.size());
    for (auto& p : paths) {
        auto c = make_candidate(p);
        if (seen.insert(to_slash(c.path)).second) out.push_back(std::move(c));
    }
    spdlog::debug("collected {} candidate files from {} patterns", out.size(), patterns.size());
    return out;
}

} // namespace hdrguard
