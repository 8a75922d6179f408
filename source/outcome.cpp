#include <hdrguard/outcome.hpp>

#include <utility>

namespace hdrguard {

const char* to_string(OutcomeKind k) {
    switch (k) {
    case OutcomeKind::AlreadyCompliant: return "compliant";
    case OutcomeKind::HeaderAdded: return "added";
    case OutcomeKind::YearUpdated: return "updated";
    case OutcomeKind::HeaderMissing: return "missing";
    case OutcomeKind::Skipped: return "skipped";
    case OutcomeKind::Failed: return "failed";
    }
    return "unknown";
}

bool RunSummary::failing(Mode mode) const {
    if (failed > 0) return true;
    return mode == Mode::Check && missing > 0;
}

Aggregator::Aggregator(Sink sink, bool keep_outcomes)
    : sink_(std::move(sink)), keep_(keep_outcomes) {}

void Aggregator::fold(FileOutcome o) {
    switch (o.kind) {
    case OutcomeKind::AlreadyCompliant: ++summary_.compliant; break;
    case OutcomeKind::HeaderAdded: ++summary_.added; break;
    case OutcomeKind::YearUpdated: ++summary_.updated; break;
    case OutcomeKind::HeaderMissing: ++summary_.missing; break;
    case OutcomeKind::Skipped: ++summary_.skipped; break;
    case OutcomeKind::Failed: ++summary_.failed; break;
    }
    if (sink_) sink_(o);
    if (keep_) outcomes_.push_back(std::move(o));
}

} // namespace hdrguard
