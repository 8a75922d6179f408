#pragma once
#include <stdexcept>
#include <string>

namespace hdrguard {

// Broken template, ignore pattern, ignore file or config file. Fatal before any file is touched.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// git discovery / listing failed while a git-backed filter was requested.
class VcsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Per-file I/O or encoding problem. Recovered by the orchestrator as Failed(reason).
class FileIOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace hdrguard
