#include <hdrguard/license_template.hpp>
#include <hdrguard/errors.hpp>
#include <hdrguard/util.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cctype>
#include <fstream>
#include <mutex>
#include <sstream>

namespace hdrguard {

std::string format_header(std::string_view text, const CommentStyle& style) {
    std::string out;
    if (!style.top.empty()) {
        out += style.top;
        out += '\n';
    }

    std::string bare_middle = style.middle;
    while (!bare_middle.empty() && std::isspace(static_cast<unsigned char>(bare_middle.back()))) {
        bare_middle.pop_back();
    }

    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.empty()) {
            out += bare_middle;
        } else {
            out += style.middle;
            out += line;
        }
        out += '\n';
        start = end + 1;
    }

    if (!style.bottom.empty()) {
        out += style.bottom;
        out += '\n';
    }
    out += '\n';
    return out;
}

LicenseTemplate::LicenseTemplate(std::string text)
    : text_(std::move(text)), cache_(std::make_unique<Cache>()) {}

LicenseTemplate LicenseTemplate::load(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw ConfigurationError(fmt::format("cannot read license template {}", file.string()));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw ConfigurationError(fmt::format("error reading license template {}", file.string()));
    }
    auto text = ss.str();
    if (trim(text).empty()) {
        throw ConfigurationError(fmt::format("license template {} is empty", file.string()));
    }
    LicenseTemplate t(std::move(text));
    if (!t.has_year_token()) {
        spdlog::warn("license template {} has no {} placeholder", file.string(), kYearToken);
    }
    return t;
}

LicenseTemplate LicenseTemplate::builtin() {
    return LicenseTemplate(std::string(kBuiltinTemplate));
}

bool LicenseTemplate::has_year_token() const {
    return text_.find(kYearToken) != std::string::npos;
}

std::string LicenseTemplate::render(int year) const {
    std::string out;
    auto y = std::to_string(year);
    size_t pos = 0;
    for (;;) {
        auto hit = text_.find(kYearToken, pos);
        if (hit == std::string::npos) break;
        out.append(text_, pos, hit - pos);
        out += y;
        pos = hit + kYearToken.size();
    }
    out.append(text_, pos, std::string::npos);
    return out;
}

std::shared_ptr<const std::string> LicenseTemplate::header(const CommentStyle& style, int year) const {
    auto key = std::make_pair(style.key(), year);
    {
        std::shared_lock lk(cache_->mu);
        auto it = cache_->headers.find(key);
        if (it != cache_->headers.end()) return it->second;
    }
    auto rendered = std::make_shared<const std::string>(format_header(render(year), style));
    std::unique_lock lk(cache_->mu);
    return cache_->headers.emplace(std::move(key), rendered).first->second;
}

size_t LicenseTemplate::cached_headers() const {
    std::shared_lock lk(cache_->mu);
    return cache_->headers.size();
}

} // namespace hdrguard
