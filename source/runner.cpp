#include <hdrguard/runner.hpp>
#include <hdrguard/collector.hpp>
#include <hdrguard/errors.hpp>
#include <hdrguard/orchestrator.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace hdrguard {

static LicenseTemplate load_template(const RunConfig& cfg) {
    if (cfg.template_file) return LicenseTemplate::load(*cfg.template_file);
    spdlog::debug("using built-in license template");
    return LicenseTemplate::builtin();
}

Runner::Runner(RunConfig cfg, Workspace ws)
    : cfg_(std::move(cfg)),
      ws_(std::move(ws)),
      styles_(make_style_registry(cfg_)),
      tpl_(load_template(cfg_))
{
    validate(cfg_);

    ignore_ = std::make_unique<IgnoreEngine>(IgnoreOptions{
        .root = ws_.root,
        .file_name = cfg_.ignore_file_name,
        .global_file = cfg_.global_ignore_file,
        .explicit_patterns = cfg_.ignore_patterns,
    });
    chain_.add(std::make_unique<IgnoreFilter>(*ignore_));

    if (cfg_.tracked_only || cfg_.changed_since) {
        if (!ws_.repo) {
            throw VcsError(fmt::format("{} is not inside a git work tree; {} needs git",
                                       ws_.root.string(),
                                       cfg_.changed_since ? "--changed-since" : "--tracked-only"));
        }
    }
    if (cfg_.tracked_only) chain_.add(MembershipFilter::tracked(*ws_.repo));
    if (cfg_.changed_since) {
        chain_.add(MembershipFilter::changed_since(*ws_.repo, *cfg_.changed_since, cfg_.committed_only));
    }
    if (!cfg_.include_extensions.empty() || !cfg_.exclude_extensions.empty()) {
        chain_.add(std::make_unique<ExtensionFilter>(cfg_.include_extensions, cfg_.exclude_extensions));
    }

    detector_ = make_detector(cfg_.detector, tpl_, cfg_.target_year(), cfg_.prefix_window);
    spdlog::debug("license detector: {}", detector_->name());
}

RunSummary Runner::run(const std::vector<std::string>& patterns, const std::filesystem::path& cwd, Aggregator& agg) {
    PathCollector collector(cwd);
    auto candidates = collector.expand(patterns);

    // loads every ignore file the run will consult; a malformed one aborts here
    chain_.prepare(candidates);

    Orchestrator orch(cfg_, chain_, styles_, tpl_, *detector_);
    auto summary = orch.run(candidates, agg);
    spdlog::debug("run finished: {} outcomes, {} ignore stacks, {} rendered headers",
                  summary.total(), ignore_->cached_dirs(), tpl_.cached_headers());
    return summary;
}

} // namespace hdrguard
