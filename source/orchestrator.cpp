#include <hdrguard/orchestrator.hpp>
#include <hdrguard/channel.hpp>
#include <hdrguard/errors.hpp>
#include <hdrguard/file_io.hpp>
#include <hdrguard/thread_pool.hpp>
#include <hdrguard/transform.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <unordered_set>

namespace hdrguard {

namespace {

FileOutcome make_outcome(const PathCandidate& c, OutcomeKind kind, std::string reason = {}) {
    FileOutcome o;
    o.path = c.path;
    o.kind = kind;
    o.reason = std::move(reason);
    return o;
}

// longest UTF-8 sequence is 4 bytes, so at most 3 may be cut off by the window
constexpr size_t kMaxCutBytes = 3;

// Closes the channel when the last job ends, whether or not that job sent.
class JobsDone {
public:
    JobsDone(std::atomic<size_t>& left, Channel<FileOutcome>& ch) : left_(left), ch_(ch) {}
    ~JobsDone() { if (left_.fetch_sub(1) == 1) ch_.close(); }
    JobsDone(const JobsDone&) = delete;
    JobsDone& operator=(const JobsDone&) = delete;

private:
    std::atomic<size_t>& left_;
    Channel<FileOutcome>& ch_;
};

} // namespace

Orchestrator::Orchestrator(const RunConfig& cfg, const FilterChain& chain, const StyleRegistry& styles,
                           const LicenseTemplate& tpl, const LicenseDetector& detector)
    : cfg_(cfg), chain_(chain), styles_(styles), tpl_(tpl), detector_(detector), year_(cfg.target_year()) {}

unsigned Orchestrator::width_for(size_t files) const {
    unsigned width = cfg_.jobs ? cfg_.jobs : std::max(1u, std::thread::hardware_concurrency());
    return static_cast<unsigned>(std::max<size_t>(1, std::min<size_t>(width, files)));
}

RunSummary Orchestrator::run(const std::vector<PathCandidate>& files, Aggregator& agg) const {
    if (files.empty()) return agg.summary();

    auto width = width_for(files.size());
    spdlog::debug("processing {} files with {} workers", files.size(), width);

    Channel<FileOutcome> outcomes;
    std::atomic<size_t> left{files.size()};
    ThreadPool pool(width);
    for (const auto& c : files) {
        pool.submit([this, &c, &outcomes, &left]{
            JobsDone done(left, outcomes);
            outcomes.send(process(c));
        });
    }
    std::unordered_set<std::string> seen;
    while (auto o = outcomes.receive()) {
        seen.insert(o->path.string());
        agg.fold(std::move(*o));
    }
    // a job that died before sending still owes its file an outcome
    if (seen.size() != files.size()) {
        for (const auto& c : files) {
            if (seen.count(c.path.string())) continue;
            spdlog::error("no outcome produced for {}", c.path.string());
            agg.fold(make_outcome(c, OutcomeKind::Failed, "no outcome produced"));
        }
    }
    return agg.summary();
}

FileOutcome Orchestrator::process(const PathCandidate& c) const {
    try {
        if (c.is_symlink) {
            spdlog::debug("skip {}: symlink", c.path.string());
            return make_outcome(c, OutcomeKind::Skipped, "symlink");
        }
        auto verdict = chain_.accepts(c);
        if (!verdict.accepted) {
            spdlog::debug("skip {}: {}", c.path.string(), verdict.reason);
            return make_outcome(c, OutcomeKind::Skipped, verdict.reason);
        }
        const CommentStyle* style = styles_.lookup(c);
        if (!style) {
            spdlog::debug("skip {}: unknown file type", c.path.string());
            return make_outcome(c, OutcomeKind::Skipped, "unknown file type");
        }
        return process_file(c, *style);
    } catch (const FileIOError& e) {
        spdlog::warn("{}", e.what());
        return make_outcome(c, OutcomeKind::Failed, e.what());
    } catch (const std::exception& e) {
        spdlog::warn("{}: {}", c.path.string(), e.what());
        return make_outcome(c, OutcomeKind::Failed, e.what());
    }
}

FileOutcome Orchestrator::process_file(const PathCandidate& c, const CommentStyle& style) const {
    // READ_PREFIX
    auto prefix = io::read_prefix(c.path, cfg_.prefix_window);
    const std::string& raw = prefix.bytes;
    size_t valid = io::valid_utf8_length(raw);
    if (valid < raw.size() && (prefix.complete || raw.size() - valid > kMaxCutBytes)) {
        throw FileIOError(fmt::format("{}: not valid UTF-8 at byte {}", c.path.string(), valid));
    }
    std::string_view text(raw.data(), valid);

    // DETECT
    if (detector_.has_license(text)) {
        auto found = detector_.extract_year(text, !prefix.complete);
        if (cfg_.preserve_years || !found || *found == year_) {
            spdlog::debug("compliant {}", c.path.string());
            return make_outcome(c, OutcomeKind::AlreadyCompliant);
        }
        auto updated = replace_copyright_year(text, year_, !prefix.complete);
        if (!updated) {
            spdlog::debug("compliant {}", c.path.string());
            return make_outcome(c, OutcomeKind::AlreadyCompliant);
        }

        auto o = make_outcome(c, OutcomeKind::YearUpdated);
        if (cfg_.collect_diffs) o.diff = DiffSpan{std::string(text), *updated};
        if (cfg_.mode == Mode::Check) {
            spdlog::debug("outdated year {} in {}", *found, c.path.string());
            return o;
        }

        // UpdateYear: substituted prefix + untouched tail
        std::string content = std::move(*updated);
        content.append(raw, valid, std::string::npos);
        if (!prefix.complete) content += io::read_from(c.path, raw.size());
        io::write_replace(c.path, content);
        o.written = true;
        spdlog::info("year updated {} -> {}: {}", *found, year_, c.path.string());
        return o;
    }

    auto header = tpl_.header(style, year_);
    if (starts_with_header(text, *header, !prefix.complete)) {
        spdlog::debug("compliant {} (header present)", c.path.string());
        return make_outcome(c, OutcomeKind::AlreadyCompliant);
    }

    if (cfg_.mode == Mode::Check) {
        spdlog::debug("missing header: {}", c.path.string());
        auto o = make_outcome(c, OutcomeKind::HeaderMissing);
        if (cfg_.collect_diffs) o.diff = DiffSpan{std::string(text), insert_header(text, *header)};
        return o;
    }

    // Insert: only now is the rest of the file read
    std::string content = raw;
    if (!prefix.complete) content += io::read_from(c.path, raw.size());
    auto updated = insert_header(content, *header);
    io::write_replace(c.path, updated);

    auto o = make_outcome(c, OutcomeKind::HeaderAdded);
    o.written = true;
    if (cfg_.collect_diffs) o.diff = DiffSpan{std::string(text), insert_header(text, *header)};
    spdlog::info("header added: {}", c.path.string());
    return o;
}

} // namespace hdrguard
