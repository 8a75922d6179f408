#include <hdrguard/comment_style.hpp>
#include <hdrguard/collector.hpp>
#include <hdrguard/util.hpp>

#include <fmt/format.h>

#include <initializer_list>

namespace hdrguard {

std::string CommentStyle::key() const {
    return fmt::format("{}\x1f{}\x1f{}", top, middle, bottom);
}

bool operator==(const CommentStyle& a, const CommentStyle& b) {
    return a.top == b.top && a.middle == b.middle && a.bottom == b.bottom;
}

CommentStyle CommentStyle::block()     { return {"/*", " * ", " */"}; }
CommentStyle CommentStyle::doc_block() { return {"/**", " * ", " */"}; }
CommentStyle CommentStyle::slashes()   { return {"", "// ", ""}; }
CommentStyle CommentStyle::hash()      { return {"", "# ", ""}; }
CommentStyle CommentStyle::lisp()      { return {"", ";; ", ""}; }
CommentStyle CommentStyle::erlang()    { return {"", "% ", ""}; }
CommentStyle CommentStyle::dashes()    { return {"", "-- ", ""}; }
CommentStyle CommentStyle::markup()    { return {"<!--", " ", "-->"}; }
CommentStyle CommentStyle::jinja()     { return {"{#", "", "#}"}; }
CommentStyle CommentStyle::ocaml()     { return {"(**", "   ", "*)"}; }

StyleRegistry::StyleRegistry() : hash_(CommentStyle::hash()) {
    auto add = [this](std::initializer_list<const char*> exts, const CommentStyle& s) {
        for (auto e : exts) builtin_[e] = s;
    };
    add({"c", "h", "gv", "java", "scala", "kt", "kts"}, CommentStyle::block());
    add({"js", "mjs", "cjs", "jsx", "tsx", "css", "scss", "sass", "ts"}, CommentStyle::doc_block());
    add({"cc", "cpp", "cs", "go", "hcl", "hh", "hpp", "m", "mm", "proto", "rs", "swift",
         "dart", "groovy", "v", "sv", "php"}, CommentStyle::slashes());
    add({"py", "sh", "yaml", "yml", "rb", "tcl", "tf", "bzl", "pl", "pp", "toml"}, CommentStyle::hash());
    add({"el", "lisp"}, CommentStyle::lisp());
    add({"erl"}, CommentStyle::erlang());
    add({"hs", "sql", "sdl"}, CommentStyle::dashes());
    add({"html", "xml", "vue", "wxi", "wxl", "wxs"}, CommentStyle::markup());
    add({"j2"}, CommentStyle::jinja());
    add({"ml", "mli", "mll", "mly"}, CommentStyle::ocaml());
}

void StyleRegistry::set_extension_style(const std::string& ext, CommentStyle style) {
    auto e = to_lower(ext);
    if (!e.empty() && e.front() == '.') e.erase(0, 1);
    ext_overrides_[e] = std::move(style);
}

void StyleRegistry::add_file_style(const std::string& name_or_glob, CommentStyle style) {
    file_overrides_.emplace_back(Glob(to_lower(name_or_glob)), std::move(style));
}

const CommentStyle* StyleRegistry::lookup(const PathCandidate& c) const {
    for (const auto& [glob, style] : file_overrides_) {
        if (glob.matches(c.basename)) return &style;
    }
    if (auto it = ext_overrides_.find(c.extension); it != ext_overrides_.end()) return &it->second;
    if (auto it = builtin_.find(c.extension); it != builtin_.end()) return &it->second;

    const auto& b = c.basename;
    auto ends_with = [&b](std::string_view s) {
        return b.size() >= s.size() && b.compare(b.size() - s.size(), s.size(), s) == 0;
    };
    if (b == "cmakelists.txt" || ends_with(".cmake.in") || ends_with(".cmake")
        || b == "dockerfile" || ends_with(".dockerfile")) {
        return &hash_;
    }
    return nullptr;
}

} // namespace hdrguard
