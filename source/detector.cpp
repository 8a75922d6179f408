#include <hdrguard/detector.hpp>
#include <hdrguard/license_template.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace hdrguard {

namespace {

const std::regex& year_regex() {
    // prefix, year, then an optional ',' or '.' and whitespace or end of text
    static const std::regex re(R"((copyright\s+(?:\(c\)|\xC2\xA9)\s*)(\d{4})(?=[,.]?(?:\s|$)))",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

std::regex_constants::match_flag_type end_flags(bool truncated) {
    return truncated ? std::regex_constants::match_not_eol : std::regex_constants::match_default;
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

} // namespace

std::optional<int> extract_copyright_year(std::string_view text, bool truncated) {
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(text.begin(), text.end(), m, year_regex(), end_flags(truncated))) return std::nullopt;
    return std::stoi(m[2].str());
}

std::optional<std::string> replace_copyright_year(std::string_view text, int year, bool truncated) {
    auto y = std::to_string(year);
    std::string out;
    bool changed = false;
    auto pos = text.begin();
    using It = std::string_view::const_iterator;
    for (std::regex_iterator<It> it(text.begin(), text.end(), year_regex(), end_flags(truncated)), end; it != end; ++it) {
        const auto& m = *it;
        out.append(pos, m[2].first);
        out += y;
        if (m[2].str() != y) changed = true;
        pos = m[2].second;
    }
    if (!changed) return std::nullopt;
    out.append(pos, text.end());
    return out;
}

std::optional<int> LicenseDetector::extract_year(std::string_view prefix, bool truncated) const {
    return extract_copyright_year(prefix, truncated);
}

bool HeuristicDetector::has_license(std::string_view prefix) const {
    auto text = prefix.substr(0, std::min(prefix.size(), window_));
    static constexpr std::string_view marker = "copyright";
    auto it = std::search(text.begin(), text.end(), marker.begin(), marker.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) == b;
                          });
    return it != text.end();
}

ContentDetector::ContentDetector(std::string_view license_text, size_t window)
    : normalized_(normalize(license_text)), window_(window) {}

std::string ContentDetector::normalize(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool last_space = true;
    const size_t n = text.size();
    for (size_t i = 0; i < n;) {
        char c = text[i];
        if (is_digit(c) && i + 3 < n && is_digit(text[i + 1]) && is_digit(text[i + 2]) && is_digit(text[i + 3])
            && (i == 0 || !is_alnum(text[i - 1])) && (i + 4 >= n || !is_alnum(text[i + 4]))) {
            out += "YEAR";
            last_space = false;
            i += 4;
            continue;
        }
        switch (c) {
        case '/': case '*': case '#': case '<': case '!': case '>': case ';':
            ++i;
            continue;
        case '-':
            // kept only between digits, as in a year range
            if (!(i > 0 && is_digit(text[i - 1]) && i + 1 < n && is_digit(text[i + 1]))) {
                ++i;
                continue;
            }
            break;
        default:
            break;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!last_space && !out.empty()) {
                out += ' ';
                last_space = true;
            }
            ++i;
            continue;
        }
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        last_space = false;
        ++i;
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();

    static constexpr std::string_view range = "YEAR-YEAR";
    for (auto p = out.find(range); p != std::string::npos; p = out.find(range, p)) {
        out.replace(p, range.size(), "YEAR");
    }
    return out;
}

bool ContentDetector::has_license(std::string_view prefix) const {
    if (normalized_.empty()) return false;
    auto text = normalize(prefix.substr(0, std::min(prefix.size(), window_)));
    return text.find(normalized_) != std::string::npos;
}

std::unique_ptr<LicenseDetector> make_detector(DetectorKind kind, const LicenseTemplate& tpl,
                                               int year, size_t window) {
    switch (kind) {
    case DetectorKind::Content:
        spdlog::debug("using content-based license detection (window={})", window);
        return std::make_unique<ContentDetector>(tpl.render(year), window);
    case DetectorKind::Heuristic:
        break;
    }
    spdlog::debug("using heuristic license detection (window={})", window);
    return std::make_unique<HeuristicDetector>(window);
}

} // namespace hdrguard
