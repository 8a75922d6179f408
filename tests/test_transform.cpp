#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <hdrguard/transform.hpp>

#include <string>

using namespace hdrguard;

static const std::string kHeader = "// Copyright 2025 Acme\n\n";

TEST_CASE("Special first lines") {
    REQUIRE(is_special_first_line("#!/usr/bin/env python3"));
    REQUIRE(is_special_first_line("<?xml version=\"1.0\"?>"));
    REQUIRE(is_special_first_line("<!DOCTYPE html>"));
    REQUIRE(is_special_first_line("# frozen_string_literal: true"));
    REQUIRE(is_special_first_line("# Encoding: utf-8"));
    REQUIRE(is_special_first_line("<?php"));
    REQUIRE(is_special_first_line("# syntax=docker/dockerfile:1"));
    REQUIRE_FALSE(is_special_first_line("# plain comment"));
    REQUIRE_FALSE(is_special_first_line("fn main() {}"));
}

TEST_CASE("Header insertion") {
    SECTION("plain file") {
        REQUIRE(insert_header("fn main() {}\n", kHeader) == "// Copyright 2025 Acme\n\nfn main() {}\n");
    }
    SECTION("shebang stays on top") {
        REQUIRE(insert_header("#!/bin/sh\necho hi\n", "# Copyright 2025 Acme\n\n") ==
                "#!/bin/sh\n\n# Copyright 2025 Acme\n\necho hi\n");
    }
    SECTION("empty body drops the blank separator") {
        REQUIRE(insert_header("", kHeader) == "// Copyright 2025 Acme\n");
        REQUIRE(insert_header("\n\n", kHeader) == "// Copyright 2025 Acme\n");
        REQUIRE(insert_header("#!/bin/sh\n", "# Copyright 2025 Acme\n\n") == "#!/bin/sh\n\n# Copyright 2025 Acme\n");
    }
    SECTION("CRLF content is kept byte for byte") {
        REQUIRE(insert_header("a();\r\nb();\r\n", kHeader) == kHeader + "a();\r\nb();\r\n");
    }
}

TEST_CASE("Insertion guard recognises an existing header") {
    auto once = insert_header("fn main() {}\n", kHeader);
    REQUIRE(starts_with_header(once, kHeader, false));

    auto shebang = insert_header("#!/bin/sh\necho hi\n", "# Acme internal\n\n");
    REQUIRE(starts_with_header(shebang, "# Acme internal\n\n", false));

    auto empty = insert_header("", kHeader);
    REQUIRE(starts_with_header(empty, kHeader, false));

    REQUIRE_FALSE(starts_with_header("fn main() {}\n", kHeader, false));

    // a window that cuts the header short still counts when truncated
    std::string cut = kHeader.substr(0, 10);
    REQUIRE(starts_with_header(cut, kHeader, true));
    REQUIRE_FALSE(starts_with_header(cut, kHeader, false));
}
