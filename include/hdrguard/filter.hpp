#pragma once
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include <hdrguard/collector.hpp>
#include <hdrguard/git.hpp>
#include <hdrguard/ignore.hpp>

namespace hdrguard {

struct FilterResult {
    bool accepted{true};
    std::string reason;

    static FilterResult accept() { return {}; }
    static FilterResult reject(std::string why) { return {false, std::move(why)}; }
};

class PathFilter {
public:
    virtual ~PathFilter() = default;

    virtual FilterResult accepts(const PathCandidate& c) const = 0;

    // Resolves per-candidate state ahead of the run so setup errors surface first.
    virtual void prepare(const PathCandidate&) const {}

    virtual const char* name() const = 0;
};

class IgnoreFilter : public PathFilter {
public:
    explicit IgnoreFilter(const IgnoreEngine& engine) : engine_(engine) {}

    FilterResult accepts(const PathCandidate& c) const override;
    void prepare(const PathCandidate& c) const override;
    const char* name() const override { return "ignore"; }

private:
    const IgnoreEngine& engine_;
};

// Membership in a path snapshot taken once per run.
class MembershipFilter : public PathFilter {
public:
    MembershipFilter(const char* name, PathSet members, std::string reject_reason);

    static std::unique_ptr<MembershipFilter> tracked(const GitRepo& repo);
    static std::unique_ptr<MembershipFilter> changed_since(const GitRepo& repo, const std::string& ref,
                                                           bool committed_only);

    FilterResult accepts(const PathCandidate& c) const override;
    const char* name() const override { return name_; }
    size_t size() const { return members_.size(); }

private:
    const char* name_;
    PathSet members_;
    std::string reason_;
};

// Include list (only these) or exclude list, on simple and compound extensions.
class ExtensionFilter : public PathFilter {
public:
    ExtensionFilter(const std::vector<std::string>& include, const std::vector<std::string>& exclude);

    FilterResult accepts(const PathCandidate& c) const override;
    const char* name() const override { return "extension"; }

private:
    std::unordered_set<std::string> include_;
    std::unordered_set<std::string> exclude_;

    static bool hit(const std::unordered_set<std::string>& set, const PathCandidate& c);
};

// Short-circuits on the first rejection, in insertion order.
class FilterChain {
public:
    FilterChain& add(std::unique_ptr<PathFilter> f);

    FilterResult accepts(const PathCandidate& c) const;
    void prepare(const std::vector<PathCandidate>& candidates) const;

    size_t size() const { return filters_.size(); }

private:
    std::vector<std::unique_ptr<PathFilter>> filters_;
};

} // namespace hdrguard
