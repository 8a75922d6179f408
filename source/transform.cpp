#include <hdrguard/transform.hpp>
#include <hdrguard/util.hpp>

#include <array>
#include <cctype>

namespace hdrguard {

namespace {

constexpr std::array<std::string_view, 8> kSpecialPrefixes = {
    "#!",
    "<?xml",
    "<!doctype",
    "# encoding:",
    "# frozen_string_literal:",
    "<?php",
    "# escape",
    "# syntax",
};

std::string_view rtrim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool blank(std::string_view s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

bool is_special_first_line(std::string_view line) {
    auto lower = to_lower(line.substr(0, 32));
    for (auto p : kSpecialPrefixes) {
        if (lower.rfind(p, 0) == 0) return true;
    }
    return false;
}

SplitContent split_preamble(std::string_view content) {
    auto eol = content.find('\n');
    auto first = content.substr(0, eol);
    if (!is_special_first_line(first)) return {"", content};

    SplitContent s;
    s.preamble = std::string(first);
    s.preamble += "\n\n";
    s.body = eol == std::string_view::npos ? std::string_view{} : content.substr(eol + 1);
    return s;
}

std::string insert_header(std::string_view content, std::string_view header) {
    auto split = split_preamble(content);
    std::string out = std::move(split.preamble);
    if (blank(split.body)) {
        out += rtrim(header);
        out += '\n';
        return out;
    }
    out += header;
    out += split.body;
    return out;
}

bool starts_with_header(std::string_view content, std::string_view header, bool truncated) {
    auto body = split_preamble(content).body;
    while (!body.empty() && (body.front() == '\n' || body.front() == '\r')) body.remove_prefix(1);
    auto expected = rtrim(header);
    if (expected.empty()) return false;
    if (body.substr(0, expected.size()) == expected) return true;
    return truncated && !body.empty() && body.size() < expected.size()
        && expected.substr(0, body.size()) == body;
}

} // namespace hdrguard
