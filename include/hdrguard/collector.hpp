#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hdrguard {

struct PathCandidate {
    std::filesystem::path path;     // absolute, normalized
    std::uintmax_t size{0};
    std::string extension;          // lowercase, no dot ("rs")
    std::string compound_extension; // lowercase, no leading dot ("d.ts"), empty when there is only one
    std::string basename;           // lowercase
    bool is_symlink{false};
};

PathCandidate make_candidate(const std::filesystem::path& p);

// Expands input patterns (files, directories, globs) into de-duplicated candidates.
class PathCollector {
public:
    explicit PathCollector(std::filesystem::path cwd);

    std::vector<PathCandidate> expand(const std::vector<std::string>& patterns) const;

private:
    std::filesystem::path cwd_;

    void walk(const std::filesystem::path& dir, std::vector<std::filesystem::path>& out) const;
    void expand_glob(const std::string& pattern, std::vector<std::filesystem::path>& out) const;
};

} // namespace hdrguard
