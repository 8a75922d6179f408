#include <hdrguard/config.hpp>
#include <hdrguard/errors.hpp>
#include <hdrguard/util.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

namespace hdrguard {

int RunConfig::target_year() const {
    return year ? *year : current_year();
}

static std::string unquote(std::string v){
    if (v.size() >= 2 && v.front()=='"' && v.back()=='"') return v.substr(1, v.size()-2);
    return v;
}

namespace {

enum class Section { None, Extensions, Style, File, Unknown };

struct PendingStyle {
    Section kind = Section::None;
    std::string target;
    std::optional<std::string> top, middle, bottom;
    int line = 0;
};

void flush_style(const fs::path& file, PendingStyle& p, RunConfig& cfg){
    if (p.kind != Section::Style && p.kind != Section::File) return;
    if (!p.middle) {
        throw ConfigurationError(fmt::format("{}:{}: style for '{}' has no 'middle' value",
                                             file.string(), p.line, p.target));
    }
    CommentStyle s{p.top.value_or(""), *p.middle, p.bottom.value_or("")};
    if (p.kind == Section::Style) {
        auto ext = to_lower(p.target);
        if (!ext.empty() && ext.front()=='.') ext.erase(0, 1);
        cfg.extension_styles[ext] = std::move(s);
    } else {
        cfg.file_styles.emplace_back(p.target, std::move(s));
    }
    p = PendingStyle{};
}

} // namespace

void load_config_file(const fs::path& file, RunConfig& cfg){
    std::ifstream in(file);
    if (!in) throw ConfigurationError(fmt::format("cannot read config file {}", file.string()));

    PendingStyle pending;
    Section section = Section::None;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0]=='#' || line[0]==';') continue;

        if (line.front()=='[') {
            if (line.back()!=']') {
                throw ConfigurationError(fmt::format("{}:{}: unterminated section header", file.string(), lineno));
            }
            flush_style(file, pending, cfg);
            auto head = trim(line.substr(1, line.size()-2));
            auto sp = head.find_first_of(" \t");
            auto name = to_lower(head.substr(0, sp));
            auto arg = sp==std::string::npos ? std::string{} : unquote(trim(head.substr(sp+1)));
            if (name=="extensions") {
                section = Section::Extensions;
            } else if (name=="style" || name=="file") {
                if (arg.empty()) {
                    throw ConfigurationError(fmt::format("{}:{}: [{}] needs a target", file.string(), lineno, name));
                }
                section = name=="style" ? Section::Style : Section::File;
                pending.kind = section;
                pending.target = arg;
                pending.line = lineno;
            } else {
                spdlog::warn("{}:{}: unknown section [{}]", file.string(), lineno, head);
                section = Section::Unknown;
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq==std::string::npos) {
            throw ConfigurationError(fmt::format("{}:{}: expected key = value", file.string(), lineno));
        }
        auto key = to_lower(trim(line.substr(0, eq)));
        auto val = unquote(trim(line.substr(eq+1)));

        switch (section) {
        case Section::Extensions:
            if (key=="include") {
                for (auto& e : split_list(val, ';')) cfg.include_extensions.push_back(e);
            } else if (key=="exclude") {
                for (auto& e : split_list(val, ';')) cfg.exclude_extensions.push_back(e);
            } else {
                spdlog::warn("{}:{}: unknown key '{}' in [extensions]", file.string(), lineno, key);
            }
            break;
        case Section::Style:
        case Section::File:
            if (key=="top") pending.top = val;
            else if (key=="middle") pending.middle = val;
            else if (key=="bottom") pending.bottom = val;
            else spdlog::warn("{}:{}: unknown key '{}' in style section", file.string(), lineno, key);
            break;
        case Section::None:
            throw ConfigurationError(fmt::format("{}:{}: key '{}' outside of a section", file.string(), lineno, key));
        case Section::Unknown:
            break;
        }
    }
    flush_style(file, pending, cfg);
    spdlog::debug("loaded config {}: {} extension styles, {} file styles",
                  file.string(), cfg.extension_styles.size(), cfg.file_styles.size());
}

std::optional<fs::path> locate_config_file(const fs::path& root, const std::optional<fs::path>& explicit_path){
    if (explicit_path) return *explicit_path;
    if (const char* env = std::getenv(kConfigEnv); env && *env) return fs::path(env);
    auto p = root / kConfigFileName;
    std::error_code ec;
    if (fs::is_regular_file(p, ec)) return p;
    return std::nullopt;
}

void apply_environment(RunConfig& cfg){
    if (cfg.global_ignore_file) return;
    if (const char* env = std::getenv(kGlobalIgnoreEnv); env && *env) {
        cfg.global_ignore_file = fs::path(env);
    }
}

void validate(const RunConfig& cfg){
    if (cfg.prefix_window == 0) throw ConfigurationError("prefix window must be positive");
    if (cfg.year && (*cfg.year < 1000 || *cfg.year > 9999)) {
        throw ConfigurationError(fmt::format("year {} is not a four-digit year", *cfg.year));
    }
    if (cfg.year && cfg.preserve_years) {
        throw ConfigurationError("--year and --preserve-years are mutually exclusive");
    }
    if (!cfg.include_extensions.empty() && !cfg.exclude_extensions.empty()) {
        throw ConfigurationError("extension include and exclude lists are mutually exclusive");
    }
    if (cfg.committed_only && !cfg.changed_since) {
        throw ConfigurationError("--committed-only requires --changed-since");
    }
    if (cfg.ignore_file_name.empty() || cfg.ignore_file_name.find('/') != std::string::npos) {
        throw ConfigurationError(fmt::format("invalid ignore file name '{}'", cfg.ignore_file_name));
    }
}

StyleRegistry make_style_registry(const RunConfig& cfg){
    StyleRegistry reg;
    for (const auto& [ext, style] : cfg.extension_styles) reg.set_extension_style(ext, style);
    for (const auto& [name, style] : cfg.file_styles) reg.add_file_style(name, style);
    return reg;
}

} // namespace hdrguard
