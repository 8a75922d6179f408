#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hdrguard {

struct CmdResult {
    int exit_code{};
    std::string out;
    std::string err;
};

CmdResult run_command(const std::vector<std::string>& argv,
                      const std::filesystem::path& cwd);

std::string trim(std::string_view s);
std::string to_lower(std::string_view s);
std::string to_slash(const std::filesystem::path& p);

// Splits NUL-separated output of `git ... -z`.
std::vector<std::string> split_nul(const std::string& s);
std::vector<std::string> split_list(std::string_view s, char sep);

// Absolute, lexically normal, parent directory resolved through symlinks.
std::filesystem::path normalize_path(const std::filesystem::path& p);

// Path of `p` relative to `base` with forward slashes ("" for `base` itself),
// nullopt if `p` is not under `base`.
std::optional<std::string> relative_to(const std::filesystem::path& p, const std::filesystem::path& base);

int current_year();

} // namespace hdrguard
