#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <hdrguard/detector.hpp>
#include <hdrguard/license_template.hpp>

#include <string>

using namespace hdrguard;

TEST_CASE("Heuristic detection is a case-insensitive marker search") {
    HeuristicDetector d;
    REQUIRE(d.has_license("// COPYRIGHT 2020 Acme\n"));
    REQUIRE(d.has_license("# copyright notice\n"));
    REQUIRE_FALSE(d.has_license("fn main() {}\n"));
    REQUIRE_FALSE(d.has_license(""));
}

TEST_CASE("Year extraction needs (c) or the copyright sign") {
    REQUIRE(extract_copyright_year("// Copyright (c) 2020 Acme") == 2020);
    REQUIRE(extract_copyright_year("// copyright (C) 2019 Acme") == 2019);
    REQUIRE(extract_copyright_year("/* Copyright \xC2\xA9 2018 Acme */") == 2018);
    REQUIRE(extract_copyright_year("Copyright (c) 2021, Acme") == 2021);
    REQUIRE(extract_copyright_year("Copyright (c) 2022") == 2022);

    REQUIRE_FALSE(extract_copyright_year("// Copyright 2020 Acme").has_value());
    REQUIRE_FALSE(extract_copyright_year("// Copyright (c) 2020-2024 Acme").has_value());
    REQUIRE_FALSE(extract_copyright_year("// Copyright (c) 20201 Acme").has_value());
}

TEST_CASE("A year at the end of a cut prefix is not extractable") {
    // "2020" may continue as "2020-2024" past the window
    const std::string cut = "// Copyright (c) 2020";
    REQUIRE(extract_copyright_year(cut) == 2020);
    REQUIRE_FALSE(extract_copyright_year(cut, true).has_value());
    REQUIRE_FALSE(extract_copyright_year(cut + ",", true).has_value());
    REQUIRE_FALSE(replace_copyright_year(cut, 2025, true).has_value());

    REQUIRE(extract_copyright_year(cut + " Acme", true) == 2020);
    REQUIRE(replace_copyright_year(cut + " Acme", 2025, true) == std::string("// Copyright (c) 2025 Acme"));
}

TEST_CASE("Bare copyright is licensed but never year-updated") {
    HeuristicDetector d;
    std::string bare = "// Copyright 2020 Acme\n";
    REQUIRE(d.has_license(bare));
    REQUIRE_FALSE(d.extract_year(bare).has_value());
    REQUIRE_FALSE(replace_copyright_year(bare, 2025).has_value());

    std::string marked = "// Copyright (c) 2020 Acme\n";
    REQUIRE(d.extract_year(marked) == 2020);
    REQUIRE(replace_copyright_year(marked, 2025) == std::string("// Copyright (c) 2025 Acme\n"));
    REQUIRE_FALSE(replace_copyright_year(marked, 2020).has_value());
}

TEST_CASE("Heuristic window boundary") {
    const size_t window = 64;
    HeuristicDetector d(window);
    const std::string marker = "copyright";

    std::string ends_at_edge(window - marker.size(), 'x');
    ends_at_edge += marker;
    REQUIRE(ends_at_edge.size() == window);
    REQUIRE(d.has_license(ends_at_edge + "tail"));

    std::string starts_at_edge(window, 'x');
    starts_at_edge += marker;
    REQUIRE_FALSE(d.has_license(starts_at_edge));
}

TEST_CASE("Content normalization") {
    REQUIRE(ContentDetector::normalize("// Copyright (c) 2024 Acme\n//  All   rights\n") ==
            "copyright (c) YEAR acme all rights");
    REQUIRE(ContentDetector::normalize("# Copyright 2020-2024 Acme") == "copyright YEAR acme");
    REQUIRE(ContentDetector::normalize("<!-- Licensed -->") == "licensed");
    REQUIRE(ContentDetector::normalize("version 12345") == "version 12345");
}

TEST_CASE("Content detection compares against the rendered template") {
    LicenseTemplate tpl("Copyright {{year}} Acme\nLicensed under the Apache License.\n");
    auto d = make_detector(DetectorKind::Content, tpl, 2025, 1000);
    REQUIRE(std::string(d->name()) == "content");

    REQUIRE(d->has_license("/*\n * Copyright 2019 Acme\n * Licensed   under the Apache License.\n */\nint x;\n"));
    REQUIRE(d->has_license("#!/bin/sh\n# copyright 2010-2020 ACME\n# licensed under the apache license.\n"));
    REQUIRE_FALSE(d->has_license("// Copyright 2025 Other Corp\n"));

    auto h = make_detector(DetectorKind::Heuristic, tpl, 2025, 1000);
    REQUIRE(std::string(h->name()) == "heuristic");
    REQUIRE(h->has_license("// Copyright 2025 Other Corp\n"));
}
