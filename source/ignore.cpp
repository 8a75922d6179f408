#include <hdrguard/ignore.hpp>
#include <hdrguard/errors.hpp>
#include <hdrguard/util.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <functional>
#include <mutex>

namespace hdrguard {

static void append_literal(std::string& rx, char c){
    if (std::strchr(".+(){}[]^$|\\*?", c) != nullptr) rx.push_back('\\');
    rx.push_back(c);
}

std::string glob_to_regex(std::string_view pat){
    std::string rx;
    size_t i=0;
    while (i<pat.size()){
        char c = pat[i];
        if (c == '*') {
            if ((i+1)<pat.size() && pat[i+1]=='*') {
                bool seg_start = (i==0 || pat[i-1]=='/');
                if (seg_start && i+2<pat.size() && pat[i+2]=='/') {
                    rx += "(?:.*/)?";
                    i += 3;
                    continue;
                }
                rx += ".*";
                i += 2;
                while (i<pat.size() && pat[i]=='*') ++i;
                continue;
            }
            rx += "[^/]*";
            ++i;
            continue;
        }
        if (c == '?') {
            rx += "[^/]";
            ++i;
            continue;
        }
        if (c == '[') {
            size_t j = i+1;
            bool neg = false;
            if (j<pat.size() && (pat[j]=='!' || pat[j]=='^')) { neg = true; ++j; }
            size_t body_start = j;
            if (j<pat.size() && pat[j]==']') ++j;
            while (j<pat.size() && pat[j]!=']') ++j;
            if (j>=pat.size()) {
                throw ConfigurationError(fmt::format("unterminated '[' in pattern '{}'", pat));
            }
            rx.push_back('[');
            if (neg) rx += "^/";
            for (char b : pat.substr(body_start, j-body_start)) {
                if (b=='\\' || b==']' || b=='[' || b=='^') rx.push_back('\\');
                rx.push_back(b);
            }
            rx.push_back(']');
            i = j+1;
            continue;
        }
        if (c == '\\' && i+1<pat.size()) {
            append_literal(rx, pat[i+1]);
            i += 2;
            continue;
        }
        append_literal(rx, c);
        ++i;
    }
    return rx;
}

static std::regex compile_regex(const std::string& rx, std::string_view source){
    try {
        return std::regex(rx, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw ConfigurationError(fmt::format("invalid pattern '{}': {}", source, e.what()));
    }
}

Glob::Glob(std::string pattern)
: pattern_(std::move(pattern)),
  re_(compile_regex("^" + glob_to_regex(pattern_) + "$", pattern_))
{}

bool Glob::matches(std::string_view rel_path) const {
    return std::regex_match(rel_path.begin(), rel_path.end(), re_);
}

bool Glob::has_magic(std::string_view pattern){
    return pattern.find_first_of("*?[") != std::string_view::npos;
}

std::optional<IgnoreRule> parse_ignore_line(std::string_view line){
    std::string s = trim(line);
    if (s.empty()) return std::nullopt;
    if (s[0] == '#') return std::nullopt;

    IgnoreRule r;
    std::string pat = s;
    if (pat[0]=='!') {
        r.negated = true;
        pat.erase(0,1);
    } else if (pat.size()>1 && pat[0]=='\\' && (pat[1]=='!' || pat[1]=='#')) {
        pat.erase(0,1);
    }

    if (!pat.empty() && pat.back()=='/') {
        r.dir_only = true;
        while (!pat.empty() && pat.back()=='/') pat.pop_back();
    }
    if (!pat.empty() && pat.front()=='/') {
        r.anchored = true;
        pat.erase(0,1);
    }
    if (pat.empty()) return std::nullopt;

    // a slash anywhere but the end ties the pattern to the declaring directory
    if (pat.find('/') != std::string::npos) r.anchored = true;

    r.pattern = pat;
    std::string rx = r.anchored ? "^" : "^(?:.*/)?";
    rx += glob_to_regex(pat);
    rx += '$';
    r.re = compile_regex(rx, s);
    return r;
}

RuleGroup parse_ignore_lines(const std::filesystem::path& base, const std::vector<std::string>& lines){
    RuleGroup g;
    g.base = base;
    for (const auto& line : lines) {
        if (auto r = parse_ignore_line(line)) g.rules.push_back(std::move(*r));
    }
    return g;
}

RuleGroup load_ignore_file(const std::filesystem::path& file, const std::filesystem::path& base){
    std::ifstream in(file);
    if (!in.good()) {
        throw ConfigurationError(fmt::format("cannot read ignore file {}", file.string()));
    }
    RuleGroup g;
    g.base = base;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        try {
            if (auto r = parse_ignore_line(line)) g.rules.push_back(std::move(*r));
        } catch (const ConfigurationError& e) {
            throw ConfigurationError(fmt::format("{}:{}: {}", file.string(), lineno, e.what()));
        }
    }
    return g;
}

static bool rule_matches(const IgnoreRule& r, const std::string& rel){
    // every ancestor directory of the path is tested as a directory
    size_t pos = 0;
    while ((pos = rel.find('/', pos)) != std::string::npos) {
        if (std::regex_match(rel.begin(), rel.begin() + static_cast<std::ptrdiff_t>(pos), r.re)) return true;
        ++pos;
    }
    if (r.dir_only) return false;
    return std::regex_match(rel, r.re);
}

bool evaluate(const std::filesystem::path& path, const RuleStack& stack){
    bool included = true;
    for (const auto& group : stack) {
        auto rel = relative_to(path, group->base);
        if (!rel || rel->empty()) continue;
        for (const auto& r : group->rules) {
            if (rule_matches(r, *rel)) included = r.negated;
        }
    }
    return included;
}

IgnoreEngine::IgnoreEngine(IgnoreOptions opts)
: opts_(std::move(opts))
{
    opts_.root = normalize_path(opts_.root);

    if (opts_.global_file) {
        std::ifstream in(*opts_.global_file);
        if (!in.good()) {
            throw ConfigurationError(fmt::format("cannot read global ignore file {}", opts_.global_file->string()));
        }
        spdlog::debug("loading global ignore file {}", opts_.global_file->string());
        std::string line;
        while (std::getline(in, line)) global_lines_.push_back(line);
        // parsed once up front so a bad line fails before any file is processed
        parse_ignore_lines(opts_.root, global_lines_);
    }

    auto add = [this](std::string p){ explicit_globs_.emplace_back(std::move(p)); };
    for (auto p : opts_.explicit_patterns) {
        std::replace(p.begin(), p.end(), '\\', '/');
        p = trim(p);
        if (p.empty()) continue;
        if (p.front() == '/') {
            p.erase(0, 1);
            while (!p.empty() && p.back()=='/') p.pop_back();
            if (p.empty()) continue;
            add(p);
            add(p + "/**");
        } else if (p.back() == '/') {
            while (!p.empty() && p.back()=='/') p.pop_back();
            if (p.empty()) continue;
            add(p);
            add(p + "/**");
            add("**/" + p + "/**");
            add("**/" + p);
        } else if (!Glob::has_magic(p)) {
            add(p);
            add("**/" + p);
            add(p + "/**");
            add("**/" + p + "/**");
        } else {
            add(p);
            if (p.rfind("**/", 0) != 0) add("**/" + p);
        }
    }
}

bool IgnoreEngine::matches_explicit(const std::filesystem::path& file) const {
    if (explicit_globs_.empty()) return false;
    auto rel = relative_to(file, opts_.root);
    std::string key = (rel && !rel->empty()) ? *rel : to_slash(file);
    return std::any_of(explicit_globs_.begin(), explicit_globs_.end(),
                       [&](const Glob& g){ return g.matches(key); });
}

IgnoreVerdict IgnoreEngine::check(const std::filesystem::path& file) const {
    if (matches_explicit(file)) return IgnoreVerdict::ExplicitPattern;
    auto stack = stack_for(file.parent_path());
    return evaluate(file, *stack) ? IgnoreVerdict::Included : IgnoreVerdict::IgnoreFile;
}

IgnoreEngine::Shard& IgnoreEngine::shard_for(const std::string& key) const {
    return shards_[std::hash<std::string>{}(key) % kShards];
}

std::shared_ptr<const RuleStack> IgnoreEngine::stack_for(const std::filesystem::path& dir) const {
    std::string key = to_slash(dir);
    auto& shard = shard_for(key);
    {
        std::shared_lock<std::shared_mutex> lk(shard.mu);
        auto it = shard.stacks.find(key);
        if (it != shard.stacks.end()) return it->second;
    }
    // two racing misses build the same stack; the later insert simply replaces the earlier one
    auto built = build_stack(dir);
    {
        std::unique_lock<std::shared_mutex> lk(shard.mu);
        shard.stacks.insert_or_assign(key, built);
    }
    return built;
}

std::shared_ptr<const RuleStack> IgnoreEngine::build_stack(const std::filesystem::path& dir) const {
    auto stack = std::make_shared<RuleStack>();
    auto rel = relative_to(dir, opts_.root);
    if (rel && !rel->empty()) {
        *stack = *stack_for(dir.parent_path());
    } else if (!global_lines_.empty()) {
        // workspace root, or a directory outside it that acts as its own root
        auto g = std::make_shared<RuleGroup>(parse_ignore_lines(dir, global_lines_));
        if (!g->rules.empty()) stack->push_back(std::move(g));
    }

    auto file = dir / opts_.file_name;
    std::error_code ec;
    if (std::filesystem::is_regular_file(file, ec)) {
        auto g = std::make_shared<RuleGroup>(load_ignore_file(file, dir));
        spdlog::debug("loaded {} ignore rules from {}", g->rules.size(), file.string());
        if (!g->rules.empty()) stack->push_back(std::move(g));
    }
    return stack;
}

size_t IgnoreEngine::cached_dirs() const {
    size_t n = 0;
    for (auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lk(shard.mu);
        n += shard.stacks.size();
    }
    return n;
}

} // namespace hdrguard
