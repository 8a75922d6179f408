#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace hdrguard {
namespace io {

struct Prefix {
    std::string bytes;
    std::uintmax_t file_size{0};
    bool complete{true};    // bytes hold the whole file
};

// Reads at most `window` bytes from the start of `path`. Throws FileIOError.
Prefix read_prefix(const std::filesystem::path& path, size_t window);

// Everything from `offset` to end of file. Throws FileIOError.
std::string read_from(const std::filesystem::path& path, std::uintmax_t offset);

// Writes a temp file beside `path` with the same mode, fsyncs it and renames it over `path`.
void write_replace(const std::filesystem::path& path, std::string_view content);

// Length of the longest prefix of `s` that is valid UTF-8. A multi-byte
// sequence cut off by the end of `s` is not an error and is excluded.
size_t valid_utf8_length(std::string_view s);

} // namespace io
} // namespace hdrguard
