#include <hdrguard/file_io.hpp>
#include <hdrguard/errors.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace hdrguard {
namespace io {

namespace {

std::atomic<unsigned> g_tmp_seq{0};

[[noreturn]] void fail(const char* op, const fs::path& path, int err) {
    throw FileIOError(fmt::format("{} {}: {}", op, path.string(),
                                  std::error_code(err, std::generic_category()).message()));
}

class Fd {
public:
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { if (fd_ >= 0) ::close(fd_); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    int get() const { return fd_; }
    int release() { int f = fd_; fd_ = -1; return f; }

private:
    int fd_;
};

// persists the directory entry of a rename
void fsync_dir(const fs::path& dir) {
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) { (void)::fsync(dfd); ::close(dfd); }
}

int open_read(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) fail("open", path, errno);
    return fd;
}

// reads until `limit` bytes or EOF
void read_into(int fd, const fs::path& path, std::string& out, size_t limit) {
    char buf[8192];
    while (out.size() < limit) {
        size_t want = std::min(sizeof(buf), limit - out.size());
        ssize_t n = ::read(fd, buf, want);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("read", path, errno);
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
}

} // namespace

Prefix read_prefix(const fs::path& path, size_t window) {
    Fd fd(open_read(path));
    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) fail("stat", path, errno);
    if (!S_ISREG(st.st_mode)) {
        throw FileIOError(fmt::format("{}: not a regular file", path.string()));
    }

    Prefix p;
    p.file_size = static_cast<std::uintmax_t>(st.st_size);
    p.bytes.reserve(std::min<std::uintmax_t>(window, p.file_size));
    read_into(fd.get(), path, p.bytes, window);
    p.complete = p.bytes.size() < window || p.bytes.size() >= p.file_size;
    if (p.complete && p.bytes.size() == window) {
        // size may have grown since fstat
        char probe;
        ssize_t n = ::read(fd.get(), &probe, 1);
        if (n < 0) fail("read", path, errno);
        p.complete = (n == 0);
    }
    return p;
}

std::string read_from(const fs::path& path, std::uintmax_t offset) {
    Fd fd(open_read(path));
    if (::lseek(fd.get(), static_cast<off_t>(offset), SEEK_SET) < 0) fail("seek", path, errno);
    std::string out;
    read_into(fd.get(), path, out, std::string::npos);
    return out;
}

void write_replace(const fs::path& path, std::string_view content) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) fail("stat", path, errno);
    // rename() only needs a writable directory; the file itself must be writable too
    if (::access(path.c_str(), W_OK) != 0) fail("open", path, errno);

    auto tmp = path.parent_path() / fmt::format(".{}.hdrguard-{}-{}.tmp", path.filename().string(),
                                                ::getpid(), g_tmp_seq.fetch_add(1));
    Fd fd(::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, st.st_mode & 07777));
    if (fd.get() < 0) fail("create", tmp, errno);

    auto discard = [&tmp](const char* op, int err) {
        ::unlink(tmp.c_str());
        fail(op, tmp, err);
    };

    // umask may have narrowed the mode given to open()
    if (::fchmod(fd.get(), st.st_mode & 07777) != 0) discard("chmod", errno);

    size_t off = 0;
    while (off < content.size()) {
        ssize_t n = ::write(fd.get(), content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            discard("write", errno);
        }
        off += static_cast<size_t>(n);
    }
    if (::fsync(fd.get()) != 0) discard("fsync", errno);
    if (::close(fd.release()) != 0) discard("close", errno);
    if (::rename(tmp.c_str(), path.c_str()) != 0) discard("rename", errno);
    fsync_dir(path.parent_path());
}

size_t valid_utf8_length(std::string_view s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len;
        unsigned min_cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; min_cp = 0x80; }
        else if ((c & 0xF0) == 0xE0) { len = 3; min_cp = 0x800; }
        else if ((c & 0xF8) == 0xF0) { len = 4; min_cp = 0x10000; }
        else return i;

        if (i + len > n) return i;
        unsigned cp = c & (0x7F >> len);
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return i;
        i += len;
    }
    return i;
}

} // namespace io
} // namespace hdrguard
