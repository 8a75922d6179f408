#include <hdrguard/util.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <vector>

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>

namespace hdrguard {

static int safe_pipe(int fds[2]){
    return pipe2(fds, O_CLOEXEC);
}

CmdResult run_command(const std::vector<std::string>& args,
                      const std::filesystem::path& cwd)
{
    CmdResult res{};
    if (args.empty()) {
        res.exit_code = -1;
        res.err = "empty argv";
        return res;
    }

    int out_pipe[2], err_pipe[2];
    if (safe_pipe(out_pipe) != 0) {
        res.exit_code = -1;
        res.err = "pipe failed";
        return res;
    }
    if (safe_pipe(err_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        res.exit_code = -1;
        res.err = "pipe failed";
        return res;
    }

    pid_t pid = fork();
    if (pid == -1) {
        res.exit_code = -1;
        res.err = "fork failed";
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return res;
    }

    if (pid == 0) {
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        std::vector<char*> argv_c;
        argv_c.reserve(args.size()+1);
        for (auto& s : args) argv_c.push_back(const_cast<char*>(s.c_str()));
        argv_c.push_back(nullptr);

        execvp(argv_c[0], argv_c.data());
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    // both pipes are drained together so a chatty stderr cannot block the child
    std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&res.out, &res.err};
    std::array<char, 4096> buf{};
    int open_fds = 2;
    while (open_fds > 0) {
        if (::poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
            if (n > 0) {
                sinks[i]->append(buf.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& f : fds) if (f.fd >= 0) close(f.fd);

    int status = 0;
    if (waitpid(pid, &status, 0) == -1) {
        res.exit_code = -1;
        return res;
    }
    if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);
    else res.exit_code = -1;

    return res;
}

std::string trim(std::string_view s){
    size_t i=0, j=s.size();
    while (i<j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j>i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
    return std::string(s.substr(i, j-i));
}

std::string to_lower(std::string_view s){
    std::string r(s);
    for (auto& ch : r) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return r;
}

std::string to_slash(const std::filesystem::path& p){
    auto s = p.lexically_normal().generic_string();
    std::replace(s.begin(), s.end(), '\\', '/');
    return s;
}

std::vector<std::string> split_nul(const std::string& s){
    std::vector<std::string> out;
    size_t start = 0;
    while (start < s.size()) {
        auto end = s.find('\0', start);
        if (end == std::string::npos) end = s.size();
        if (end > start) out.emplace_back(s, start, end - start);
        start = end + 1;
    }
    return out;
}

std::vector<std::string> split_list(std::string_view s, char sep){
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        auto end = s.find(sep, start);
        if (end == std::string_view::npos) end = s.size();
        auto item = trim(s.substr(start, end - start));
        if (!item.empty()) out.push_back(std::move(item));
        start = end + 1;
    }
    return out;
}

std::filesystem::path normalize_path(const std::filesystem::path& p){
    std::error_code ec;
    auto abs = std::filesystem::absolute(p, ec);
    if (ec) abs = p;
    abs = abs.lexically_normal();
    if (!abs.has_filename()) abs = abs.parent_path();
    auto parent = std::filesystem::weakly_canonical(abs.parent_path(), ec);
    if (ec) return abs;
    return (parent / abs.filename()).lexically_normal();
}

std::optional<std::string> relative_to(const std::filesystem::path& p, const std::filesystem::path& base){
    std::string s_abs = to_slash(p);
    std::string s_base = to_slash(base);
    while (s_base.size() > 1 && s_base.back() == '/') s_base.pop_back();
    if (s_abs == s_base) return std::string{};
    if (s_base == "/") return s_abs.substr(1);
    if (s_abs.rfind(s_base + "/", 0) == 0) return s_abs.substr(s_base.size() + 1);
    return std::nullopt;
}

int current_year() {
    using namespace std::chrono;
    auto t = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm.tm_year + 1900;
}

} // namespace hdrguard
