#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace hdrguard {

enum class Mode {
    Check,
    Modify,
};

enum class OutcomeKind {
    AlreadyCompliant,
    HeaderAdded,
    YearUpdated,
    HeaderMissing,
    Skipped,
    Failed,
};

const char* to_string(OutcomeKind k);

struct DiffSpan {
    std::string before;
    std::string after;
};

struct FileOutcome {
    std::filesystem::path path;
    OutcomeKind kind{OutcomeKind::AlreadyCompliant};
    std::string reason;     // Skipped / Failed
    bool written{false};
    std::optional<DiffSpan> diff;
};

struct RunSummary {
    size_t compliant{0};
    size_t added{0};
    size_t updated{0};
    size_t missing{0};
    size_t skipped{0};
    size_t failed{0};

    size_t total() const { return compliant + added + updated + missing + skipped + failed; }

    // check mode: any missing or failed; modify mode: any failed
    bool failing(Mode mode) const;
};

// Sole owner of outcomes and sole writer of the summary. Lives on the
// thread that drains the outcome channel.
class Aggregator {
public:
    using Sink = std::function<void(const FileOutcome&)>;

    explicit Aggregator(Sink sink = {}, bool keep_outcomes = true);

    void fold(FileOutcome o);

    const RunSummary& summary() const { return summary_; }
    const std::vector<FileOutcome>& outcomes() const { return outcomes_; }

private:
    Sink sink_;
    bool keep_;
    RunSummary summary_;
    std::vector<FileOutcome> outcomes_;
};

} // namespace hdrguard
