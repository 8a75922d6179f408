#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <hdrguard/comment_style.hpp>
#include <hdrguard/detector.hpp>
#include <hdrguard/outcome.hpp>

namespace hdrguard {

inline constexpr const char* kConfigFileName = ".hdrguard.conf";
inline constexpr const char* kConfigEnv = "HDRGUARD_CONFIG";
inline constexpr const char* kGlobalIgnoreEnv = "GLOBAL_LICENSE_IGNORE";

struct RunConfig {
    Mode mode = Mode::Check;
    std::optional<int> year;
    bool preserve_years = false;
    size_t prefix_window = kDefaultPrefixWindow;
    unsigned jobs = 0;
    std::optional<std::filesystem::path> template_file;

    std::vector<std::string> ignore_patterns;
    std::optional<std::filesystem::path> global_ignore_file;
    std::string ignore_file_name = ".licenseignore";

    std::optional<std::string> changed_since;
    bool committed_only = false;
    bool tracked_only = false;

    DetectorKind detector = DetectorKind::Heuristic;
    bool collect_diffs = false;

    std::vector<std::string> include_extensions;
    std::vector<std::string> exclude_extensions;
    std::map<std::string, CommentStyle> extension_styles;
    std::vector<std::pair<std::string, CommentStyle>> file_styles;

    int target_year() const;
};

// Merges an INI-like config file into `cfg`. Throws ConfigurationError.
void load_config_file(const std::filesystem::path& file, RunConfig& cfg);

// --config, then $HDRGUARD_CONFIG, then <root>/.hdrguard.conf when present.
std::optional<std::filesystem::path> locate_config_file(const std::filesystem::path& root,
                                                        const std::optional<std::filesystem::path>& explicit_path);

// $GLOBAL_LICENSE_IGNORE fills the global ignore file when not set yet.
void apply_environment(RunConfig& cfg);

// Throws ConfigurationError on inconsistent values.
void validate(const RunConfig& cfg);

StyleRegistry make_style_registry(const RunConfig& cfg);

} // namespace hdrguard
