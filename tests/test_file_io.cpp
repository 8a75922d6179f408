#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <hdrguard/errors.hpp>
#include <hdrguard/file_io.hpp>
#include "helpers.hpp"

#include <sys/stat.h>
#include <unistd.h>

using namespace hdrguard;

TEST_CASE("Prefix read stops at the window") {
    auto tmp = make_tmpdir("hdrguard_io_");
    write_file(tmp / "small.rs", "abc");
    write_file(tmp / "exact.rs", std::string(16, 'x'));
    write_file(tmp / "big.rs", std::string(16, 'x') + "tail");

    auto small = io::read_prefix(tmp / "small.rs", 16);
    REQUIRE(small.bytes == "abc");
    REQUIRE(small.complete);

    auto exact = io::read_prefix(tmp / "exact.rs", 16);
    REQUIRE(exact.bytes.size() == 16);
    REQUIRE(exact.complete);

    auto big = io::read_prefix(tmp / "big.rs", 16);
    REQUIRE(big.bytes.size() == 16);
    REQUIRE_FALSE(big.complete);
    REQUIRE(big.file_size == 20);
    REQUIRE(io::read_from(tmp / "big.rs", big.bytes.size()) == "tail");

    REQUIRE_THROWS_AS(io::read_prefix(tmp / "missing.rs", 16), FileIOError);
    REQUIRE_THROWS_AS(io::read_prefix(tmp, 16), FileIOError);
}

TEST_CASE("Replace keeps permissions and leaves no temp files") {
    auto tmp = make_tmpdir("hdrguard_write_");
    auto file = tmp / "run.sh";
    write_file(file, "echo old\n");
    REQUIRE(::chmod(file.c_str(), 0750) == 0);

    io::write_replace(file, "echo new\n");
    REQUIRE(read_file(file) == "echo new\n");

    struct stat st{};
    REQUIRE(::stat(file.c_str(), &st) == 0);
    REQUIRE((st.st_mode & 07777) == 0750);

    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(tmp)) {
        (void)e;
        ++entries;
    }
    REQUIRE(entries == 1);

    REQUIRE_THROWS_AS(io::write_replace(tmp / "missing.sh", "x"), FileIOError);
}

TEST_CASE("Replace refuses a read-only file") {
    if (::geteuid() == 0) {
        WARN("running as root; permission checks do not apply");
        return;
    }
    auto tmp = make_tmpdir("hdrguard_ro_");
    auto file = tmp / "ro.rs";
    write_file(file, "fn a() {}\n");
    REQUIRE(::chmod(file.c_str(), 0444) == 0);

    REQUIRE_THROWS_AS(io::write_replace(file, "// Copyright\n\nfn a() {}\n"), FileIOError);
    REQUIRE(read_file(file) == "fn a() {}\n");

    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(tmp)) {
        (void)e;
        ++entries;
    }
    REQUIRE(entries == 1);
}

TEST_CASE("UTF-8 validation") {
    REQUIRE(io::valid_utf8_length("plain ascii") == 11);
    REQUIRE(io::valid_utf8_length("caf\xC3\xA9") == 5);
    REQUIRE(io::valid_utf8_length("\xC2\xA9 2024") == 7);
    // cut in the middle of a sequence
    REQUIRE(io::valid_utf8_length("ab\xE2\x82") == 2);
    REQUIRE(io::valid_utf8_length("\xFF\xFEtext") == 0);
    REQUIRE(io::valid_utf8_length("ok\xC0\xAF") == 2);
    REQUIRE(io::valid_utf8_length("\xED\xA0\x80") == 0);
}
