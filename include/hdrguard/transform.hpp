#pragma once
#include <string>
#include <string_view>

namespace hdrguard {

struct SplitContent {
    std::string preamble;   // kept line + blank separator, empty when none
    std::string_view body;
};

// Shebangs, XML/HTML doctype, PHP open tag, encoding and Dockerfile parser
// directives must stay on the first line.
bool is_special_first_line(std::string_view line);

SplitContent split_preamble(std::string_view content);

// Header goes after any special first line. A whitespace-only body gets the
// header without the trailing blank line.
std::string insert_header(std::string_view content, std::string_view header);

// True when the body (after any special first line and leading blank lines)
// already begins with `header`. With a truncated prefix a partial match at the
// end counts.
bool starts_with_header(std::string_view content, std::string_view header, bool truncated);

} // namespace hdrguard
