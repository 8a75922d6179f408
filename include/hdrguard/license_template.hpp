#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

#include <hdrguard/comment_style.hpp>

namespace hdrguard {

inline constexpr std::string_view kYearToken = "{{year}}";
inline constexpr std::string_view kBuiltinTemplate =
    "Copyright (c) {{year}} The Authors. All rights reserved.\n";

// Wraps rendered text in a comment block: optional top line, every line
// prefixed with the middle marker (blank lines keep it without trailing
// spaces), optional bottom line, then one blank line.
std::string format_header(std::string_view text, const CommentStyle& style);

class LicenseTemplate {
public:
    explicit LicenseTemplate(std::string text);

    // Throws ConfigurationError when unreadable or empty.
    static LicenseTemplate load(const std::filesystem::path& file);
    static LicenseTemplate builtin();

    const std::string& text() const { return text_; }
    bool has_year_token() const;

    std::string render(int year) const;

    // Rendered and commented header, cached per (style, year).
    std::shared_ptr<const std::string> header(const CommentStyle& style, int year) const;
    size_t cached_headers() const;

private:
    struct Cache {
        mutable std::shared_mutex mu;
        std::map<std::pair<std::string, int>, std::shared_ptr<const std::string>> headers;
    };

    std::string text_;
    std::unique_ptr<Cache> cache_;
};

} // namespace hdrguard
