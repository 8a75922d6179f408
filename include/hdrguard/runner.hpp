#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <hdrguard/config.hpp>
#include <hdrguard/detector.hpp>
#include <hdrguard/filter.hpp>
#include <hdrguard/ignore.hpp>
#include <hdrguard/license_template.hpp>
#include <hdrguard/outcome.hpp>
#include <hdrguard/workspace.hpp>

namespace hdrguard {

// One run: owns the workspace, the ignore cache, the git snapshots, the
// template with its render cache and the detector. Construction performs all
// fallible setup and throws ConfigurationError or VcsError.
class Runner {
public:
    Runner(RunConfig cfg, Workspace ws);

    // Expands `patterns` relative to `cwd`, processes every candidate and
    // streams outcomes through `agg`.
    RunSummary run(const std::vector<std::string>& patterns, const std::filesystem::path& cwd, Aggregator& agg);

    const RunConfig& config() const { return cfg_; }
    const Workspace& workspace() const { return ws_; }

private:
    RunConfig cfg_;
    Workspace ws_;
    std::unique_ptr<IgnoreEngine> ignore_;
    FilterChain chain_;
    StyleRegistry styles_;
    LicenseTemplate tpl_;
    std::unique_ptr<LicenseDetector> detector_;
};

} // namespace hdrguard
