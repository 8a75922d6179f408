#include <hdrguard/filter.hpp>
#include <hdrguard/util.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace hdrguard {

FilterResult IgnoreFilter::accepts(const PathCandidate& c) const {
    auto v = engine_.check(c.path);
    switch (v) {
    case IgnoreVerdict::Included:
        return FilterResult::accept();
    case IgnoreVerdict::ExplicitPattern:
        return FilterResult::reject("matches ignore pattern");
    case IgnoreVerdict::IgnoreFile:
        return FilterResult::reject(fmt::format("excluded by {}", engine_.file_name()));
    }
    return FilterResult::accept();
}

void IgnoreFilter::prepare(const PathCandidate& c) const {
    engine_.stack_for(c.path.parent_path());
}

MembershipFilter::MembershipFilter(const char* name, PathSet members, std::string reject_reason)
    : name_(name), members_(std::move(members)), reason_(std::move(reject_reason)) {}

std::unique_ptr<MembershipFilter> MembershipFilter::tracked(const GitRepo& repo) {
    return std::make_unique<MembershipFilter>("tracked", repo.tracked_files(), "not tracked by git");
}

std::unique_ptr<MembershipFilter> MembershipFilter::changed_since(const GitRepo& repo, const std::string& ref,
                                                                  bool committed_only) {
    return std::make_unique<MembershipFilter>("changed-since", repo.changed_since(ref, committed_only),
                                              fmt::format("unchanged since {}", ref));
}

FilterResult MembershipFilter::accepts(const PathCandidate& c) const {
    if (members_.count(to_slash(c.path))) return FilterResult::accept();
    return FilterResult::reject(reason_);
}

static std::unordered_set<std::string> extension_set(const std::vector<std::string>& list) {
    std::unordered_set<std::string> out;
    for (const auto& e : list) {
        auto s = to_lower(trim(e));
        while (!s.empty() && s.front() == '.') s.erase(0, 1);
        if (!s.empty()) out.insert(std::move(s));
    }
    return out;
}

ExtensionFilter::ExtensionFilter(const std::vector<std::string>& include, const std::vector<std::string>& exclude)
    : include_(extension_set(include)), exclude_(extension_set(exclude)) {}

bool ExtensionFilter::hit(const std::unordered_set<std::string>& set, const PathCandidate& c) {
    if (!c.extension.empty() && set.count(c.extension)) return true;
    return !c.compound_extension.empty() && set.count(c.compound_extension);
}

FilterResult ExtensionFilter::accepts(const PathCandidate& c) const {
    if (!include_.empty() && !hit(include_, c)) return FilterResult::reject("extension not included");
    if (!exclude_.empty() && hit(exclude_, c)) return FilterResult::reject("extension excluded");
    return FilterResult::accept();
}

FilterChain& FilterChain::add(std::unique_ptr<PathFilter> f) {
    spdlog::debug("filter chain: + {}", f->name());
    filters_.push_back(std::move(f));
    return *this;
}

FilterResult FilterChain::accepts(const PathCandidate& c) const {
    for (const auto& f : filters_) {
        auto r = f->accepts(c);
        if (!r.accepted) return r;
    }
    return FilterResult::accept();
}

void FilterChain::prepare(const std::vector<PathCandidate>& candidates) const {
    for (const auto& c : candidates) {
        for (const auto& f : filters_) f->prepare(c);
    }
}

} // namespace hdrguard
