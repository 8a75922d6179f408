#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <hdrguard/ignore.hpp>

namespace hdrguard {

struct PathCandidate;

struct CommentStyle {
    std::string top;
    std::string middle;
    std::string bottom;

    // identity for render caching
    std::string key() const;

    static CommentStyle block();      // /* * */
    static CommentStyle doc_block();  // /** * */
    static CommentStyle slashes();    // //
    static CommentStyle hash();       // #
    static CommentStyle lisp();       // ;;
    static CommentStyle erlang();     // %
    static CommentStyle dashes();     // --
    static CommentStyle markup();     // <!-- -->
    static CommentStyle jinja();      // {# #}
    static CommentStyle ocaml();      // (** *)
};

bool operator==(const CommentStyle& a, const CommentStyle& b);

// Selects one style per file. Lookup order: basename overrides, extension
// overrides, built-in extensions, built-in basenames.
class StyleRegistry {
public:
    StyleRegistry();

    void set_extension_style(const std::string& ext, CommentStyle style);
    void add_file_style(const std::string& name_or_glob, CommentStyle style);

    // nullptr for files without a known comment syntax
    const CommentStyle* lookup(const PathCandidate& c) const;

private:
    std::map<std::string, CommentStyle> builtin_;
    std::map<std::string, CommentStyle> ext_overrides_;
    std::vector<std::pair<Glob, CommentStyle>> file_overrides_;
    CommentStyle hash_;
};

} // namespace hdrguard
