#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hdrguard {

class LicenseTemplate;

inline constexpr size_t kDefaultPrefixWindow = 1000;

// First `Copyright (c) YYYY` / `Copyright © YYYY` (case-insensitive) in `text`.
// A bare `Copyright YYYY` and year ranges do not count. When `truncated`, the
// end of `text` is not the end of the file, so a year touching it is ignored.
std::optional<int> extract_copyright_year(std::string_view text, bool truncated = false);

// Rewrites every extractable copyright year in `text` to `year`.
// nullopt when nothing changed.
std::optional<std::string> replace_copyright_year(std::string_view text, int year, bool truncated = false);

class LicenseDetector {
public:
    virtual ~LicenseDetector() = default;

    virtual bool has_license(std::string_view prefix) const = 0;
    virtual std::optional<int> extract_year(std::string_view prefix, bool truncated = false) const;
    virtual const char* name() const = 0;
};

// Case-insensitive search for "copyright" in the first `window` bytes.
class HeuristicDetector : public LicenseDetector {
public:
    explicit HeuristicDetector(size_t window = kDefaultPrefixWindow) : window_(window) {}

    bool has_license(std::string_view prefix) const override;
    const char* name() const override { return "heuristic"; }

private:
    size_t window_;
};

// Compares the normalized prefix against the normalized rendered template:
// lowercase, comment punctuation dropped, whitespace collapsed, years folded.
class ContentDetector : public LicenseDetector {
public:
    ContentDetector(std::string_view license_text, size_t window = kDefaultPrefixWindow);

    bool has_license(std::string_view prefix) const override;
    const char* name() const override { return "content"; }

    static std::string normalize(std::string_view text);

private:
    std::string normalized_;
    size_t window_;
};

enum class DetectorKind {
    Heuristic,
    Content,
};

std::unique_ptr<LicenseDetector> make_detector(DetectorKind kind, const LicenseTemplate& tpl,
                                               int year, size_t window);

} // namespace hdrguard
