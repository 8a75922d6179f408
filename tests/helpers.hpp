#pragma once
#include <hdrguard/util.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

static inline fs::path make_tmpdir(const std::string& prefix) {
    fs::path base = fs::temp_directory_path() / (prefix + "XXXXXX");
    std::string s = base.string();
    std::vector<char> buf(s.begin(), s.end());
    buf.push_back('\0');
    char* p = mkdtemp(buf.data());
    REQUIRE(p != nullptr);
    return hdrguard::normalize_path(fs::path(p));
}

static inline void write_file(const fs::path& p, std::string_view content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
    REQUIRE(out.good());
}

static inline std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static inline void git(const fs::path& dir, std::vector<std::string> args) {
    args.insert(args.begin(), "git");
    auto r = hdrguard::run_command(args, dir);
    INFO("git " << args[1] << ": " << r.err);
    REQUIRE(r.exit_code == 0);
}

static inline void init_repo(const fs::path& dir) {
    git(dir, {"init", "-q"});
    git(dir, {"config", "user.email", "ci@example.com"});
    git(dir, {"config", "user.name", "CI"});
    git(dir, {"config", "commit.gpgsign", "false"});
}

static inline void commit_all(const fs::path& dir, const std::string& msg) {
    git(dir, {"add", "-A"});
    git(dir, {"commit", "-q", "-m", msg});
}
