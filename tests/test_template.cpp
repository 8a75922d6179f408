#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <hdrguard/collector.hpp>
#include <hdrguard/comment_style.hpp>
#include <hdrguard/errors.hpp>
#include <hdrguard/license_template.hpp>
#include "helpers.hpp"

using namespace hdrguard;

TEST_CASE("Year placeholder substitution") {
    LicenseTemplate tpl("Copyright {{year}} Acme\n(c) {{year}}\n");
    REQUIRE(tpl.has_year_token());
    REQUIRE(tpl.render(2025) == "Copyright 2025 Acme\n(c) 2025\n");
    REQUIRE_FALSE(LicenseTemplate("Acme license\n").has_year_token());
}

TEST_CASE("Header formatting per comment style") {
    std::string text = "Copyright 2025 Acme\n\nLicensed under MIT.\n";

    REQUIRE(format_header(text, CommentStyle::slashes()) ==
            "// Copyright 2025 Acme\n//\n// Licensed under MIT.\n\n");
    REQUIRE(format_header(text, CommentStyle::block()) ==
            "/*\n * Copyright 2025 Acme\n *\n * Licensed under MIT.\n */\n\n");
    REQUIRE(format_header("Copyright 2025 Acme", CommentStyle::hash()) == "# Copyright 2025 Acme\n\n");
    REQUIRE(format_header("Copyright 2025 Acme\n", CommentStyle::markup()) ==
            "<!--\n Copyright 2025 Acme\n-->\n\n");
    REQUIRE(format_header("Copyright 2025 Acme\n", CommentStyle::jinja()) == "{#\nCopyright 2025 Acme\n#}\n\n");
}

TEST_CASE("Rendered headers are cached per style and year") {
    LicenseTemplate tpl("Copyright {{year}} Acme\n");
    auto a = tpl.header(CommentStyle::slashes(), 2025);
    auto b = tpl.header(CommentStyle::slashes(), 2025);
    REQUIRE(a == b);
    REQUIRE(*a == "// Copyright 2025 Acme\n\n");
    REQUIRE(tpl.cached_headers() == 1);

    tpl.header(CommentStyle::hash(), 2025);
    tpl.header(CommentStyle::slashes(), 2024);
    REQUIRE(tpl.cached_headers() == 3);

    // separate templates do not share state
    LicenseTemplate other("Copyright {{year}} Other\n");
    REQUIRE(other.cached_headers() == 0);
    REQUIRE(*other.header(CommentStyle::slashes(), 2025) == "// Copyright 2025 Other\n\n");
}

TEST_CASE("Template loading") {
    auto tmp = make_tmpdir("hdrguard_tpl_");
    write_file(tmp / "LICENSE.tpl", "Copyright {{year}} Acme\n");
    REQUIRE(LicenseTemplate::load(tmp / "LICENSE.tpl").text() == "Copyright {{year}} Acme\n");

    write_file(tmp / "empty.tpl", "  \n");
    REQUIRE_THROWS_AS(LicenseTemplate::load(tmp / "empty.tpl"), ConfigurationError);
    REQUIRE_THROWS_AS(LicenseTemplate::load(tmp / "missing.tpl"), ConfigurationError);

    REQUIRE(LicenseTemplate::builtin().has_year_token());
}

TEST_CASE("Style lookup by extension and basename") {
    StyleRegistry reg;
    REQUIRE(*reg.lookup(make_candidate("/r/main.rs")) == CommentStyle::slashes());
    REQUIRE(*reg.lookup(make_candidate("/r/lib.C")) == CommentStyle::block());
    REQUIRE(*reg.lookup(make_candidate("/r/app.tsx")) == CommentStyle::doc_block());
    REQUIRE(*reg.lookup(make_candidate("/r/run.py")) == CommentStyle::hash());
    REQUIRE(*reg.lookup(make_candidate("/r/q.sql")) == CommentStyle::dashes());
    REQUIRE(*reg.lookup(make_candidate("/r/page.html")) == CommentStyle::markup());
    REQUIRE(*reg.lookup(make_candidate("/r/CMakeLists.txt")) == CommentStyle::hash());
    REQUIRE(*reg.lookup(make_candidate("/r/Dockerfile")) == CommentStyle::hash());
    REQUIRE(*reg.lookup(make_candidate("/r/tools.cmake.in")) == CommentStyle::hash());
    REQUIRE(reg.lookup(make_candidate("/r/notes.txt")) == nullptr);
    REQUIRE(reg.lookup(make_candidate("/r/data.json")) == nullptr);
}

TEST_CASE("Style overrides win over built-ins") {
    StyleRegistry reg;
    reg.set_extension_style(".rs", CommentStyle::block());
    reg.set_extension_style("txt", CommentStyle::hash());
    reg.add_file_style("Justfile", CommentStyle::hash());
    reg.add_file_style("*.gen.rs", CommentStyle::slashes());

    REQUIRE(*reg.lookup(make_candidate("/r/main.rs")) == CommentStyle::block());
    REQUIRE(*reg.lookup(make_candidate("/r/api.gen.rs")) == CommentStyle::slashes());
    REQUIRE(*reg.lookup(make_candidate("/r/notes.txt")) == CommentStyle::hash());
    REQUIRE(*reg.lookup(make_candidate("/r/justfile")) == CommentStyle::hash());
}
