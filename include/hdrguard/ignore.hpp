#pragma once
#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hdrguard {

// Gitignore-flavoured glob: `*` and `?` stay inside one segment, `**` crosses
// segments, `[...]` / `[!...]` classes, `\x` escapes. Matches the whole string.
class Glob {
public:
    explicit Glob(std::string pattern);

    bool matches(std::string_view rel_path) const;
    const std::string& pattern() const { return pattern_; }

    static bool has_magic(std::string_view pattern);

private:
    std::string pattern_;
    std::regex re_;
};

// Translates a glob into an ECMAScript regex body (no anchors).
// Throws ConfigurationError on an unterminated bracket class.
std::string glob_to_regex(std::string_view pat);

struct IgnoreRule {
    std::string pattern;
    bool negated{false};
    bool dir_only{false};
    bool anchored{false};
    std::regex re;
};

// Rules declared by one directory, in declaration order.
struct RuleGroup {
    std::filesystem::path base;
    std::vector<IgnoreRule> rules;
};

// Root-to-leaf sequence of the groups that apply to one directory.
using RuleStack = std::vector<std::shared_ptr<const RuleGroup>>;

std::optional<IgnoreRule> parse_ignore_line(std::string_view line);
RuleGroup parse_ignore_lines(const std::filesystem::path& base, const std::vector<std::string>& lines);
RuleGroup load_ignore_file(const std::filesystem::path& file, const std::filesystem::path& base);

// Last matching rule across the whole stack wins; no match means included.
bool evaluate(const std::filesystem::path& path, const RuleStack& stack);

enum class IgnoreVerdict {
    Included,
    ExplicitPattern,
    IgnoreFile,
};

struct IgnoreOptions {
    std::filesystem::path root;
    std::string file_name = ".licenseignore";
    std::optional<std::filesystem::path> global_file;
    std::vector<std::string> explicit_patterns;
};

// Explicit patterns first (hard exclusion), then the hierarchical ignore files.
// Rule stacks are cached per directory for the lifetime of the engine.
class IgnoreEngine {
public:
    explicit IgnoreEngine(IgnoreOptions opts);

    IgnoreVerdict check(const std::filesystem::path& file) const;
    bool included(const std::filesystem::path& file) const { return check(file) == IgnoreVerdict::Included; }

    std::shared_ptr<const RuleStack> stack_for(const std::filesystem::path& dir) const;

    const std::string& file_name() const { return opts_.file_name; }
    size_t cached_dirs() const;

private:
    static constexpr size_t kShards = 16;

    struct Shard {
        mutable std::shared_mutex mu;
        std::unordered_map<std::string, std::shared_ptr<const RuleStack>> stacks;
    };

    IgnoreOptions opts_;
    std::vector<std::string> global_lines_;
    std::vector<Glob> explicit_globs_;
    mutable std::array<Shard, kShards> shards_;

    bool matches_explicit(const std::filesystem::path& file) const;
    std::shared_ptr<const RuleStack> build_stack(const std::filesystem::path& dir) const;
    Shard& shard_for(const std::string& key) const;
};

} // namespace hdrguard
