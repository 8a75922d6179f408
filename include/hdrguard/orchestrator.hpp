#pragma once
#include <vector>

#include <hdrguard/collector.hpp>
#include <hdrguard/comment_style.hpp>
#include <hdrguard/config.hpp>
#include <hdrguard/detector.hpp>
#include <hdrguard/filter.hpp>
#include <hdrguard/license_template.hpp>
#include <hdrguard/outcome.hpp>

namespace hdrguard {

// Drives every candidate through filter, detect and execute on a bounded
// worker pool. Outcomes travel over a channel to the aggregator, which runs
// on the calling thread.
class Orchestrator {
public:
    Orchestrator(const RunConfig& cfg, const FilterChain& chain, const StyleRegistry& styles,
                 const LicenseTemplate& tpl, const LicenseDetector& detector);

    RunSummary run(const std::vector<PathCandidate>& files, Aggregator& agg) const;

    // One file, start to finish. Never throws.
    FileOutcome process(const PathCandidate& c) const;

    unsigned width_for(size_t files) const;

private:
    const RunConfig& cfg_;
    const FilterChain& chain_;
    const StyleRegistry& styles_;
    const LicenseTemplate& tpl_;
    const LicenseDetector& detector_;
    int year_;

    FileOutcome process_file(const PathCandidate& c, const CommentStyle& style) const;
};

} // namespace hdrguard
