#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <cleanmarkers/age.hpp>
#include <cleanmarkers/filter.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace cleanmarkers;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

TEST_CASE("Extension filter selects by extension") {
    PathFilter f({"md"}, {}, std::nullopt);
    REQUIRE(f.accepts_extension("/root/notes.md"));
    REQUIRE_FALSE(f.accepts_extension("/root/notes.txt"));
    REQUIRE_FALSE(f.accepts_extension("/root/README"));
    REQUIRE_FALSE(f.accepts_extension("/root/notes.md.bak"));
}

TEST_CASE("Extension match ignores case and leading dot") {
    PathFilter f({".MD", "Txt"}, {}, std::nullopt);
    REQUIRE((f.extensions() == std::vector<std::string>{"md", "txt"}));
    REQUIRE(f.accepts_extension("a/NOTES.Md"));
    REQUIRE(f.accepts_extension("a/b.TXT"));
    REQUIRE_FALSE(f.accepts_extension("a/b.rst"));
}

TEST_CASE("Empty extension set accepts everything") {
    PathFilter f({}, {}, std::nullopt);
    REQUIRE(f.accepts_extension("x.md"));
    REQUIRE(f.accepts_extension("x.bin"));
    REQUIRE(f.accepts_extension("Makefile"));
}

TEST_CASE("Default config selects only markdown") {
    Config cfg;
    PathFilter f(cfg);
    REQUIRE(f.accepts_extension("notes.md"));
    REQUIRE_FALSE(f.accepts_extension("notes.txt"));
    REQUIRE(f.is_excluded(".git"));
}

TEST_CASE("Exclusion matches whole path components, case-sensitive") {
    PathFilter f({}, {".git", "node_modules"}, std::nullopt);
    REQUIRE(f.is_excluded("repo/.git/HEAD"));
    REQUIRE(f.is_excluded("a/node_modules/pkg/readme.md"));
    REQUIRE_FALSE(f.is_excluded("a/.github/notes.md"));
    REQUIRE_FALSE(f.is_excluded("a/my.git/notes.md"));
    REQUIRE_FALSE(f.is_excluded("a/.GIT/notes.md"));
    REQUIRE_FALSE(f.is_excluded("a/b/c.md"));
}

TEST_CASE("Age filter compares against max age") {
    PathFilter f({}, {}, std::chrono::seconds(3600));
    auto now = fs::file_time_type::clock::now();
    REQUIRE(f.accepts_age(now, now));
    REQUIRE(f.accepts_age(now - 30min, now));
    REQUIRE_FALSE(f.accepts_age(now - 2h, now));

    PathFilter nolimit({}, {}, std::nullopt);
    REQUIRE(nolimit.accepts_age(now - std::chrono::hours(24 * 365), now));
}

TEST_CASE("Very large max age does not overflow the comparison") {
    auto age = parse_age("100000d");
    REQUIRE(age);
    PathFilter f({}, {}, age);
    auto now = fs::file_time_type::clock::now();
    REQUIRE(f.accepts_age(now, now));
    REQUIRE(f.accepts_age(now - 1h, now));
    REQUIRE(f.accepts_age(now - std::chrono::hours(24 * 365 * 50), now));
}

TEST_CASE("accepts_file applies extension and mtime") {
    auto dir = fs::temp_directory_path() / "cleanmarkers_filter_age";
    fs::remove_all(dir);
    fs::create_directories(dir);
    auto fresh = dir / "fresh.md";
    auto old = dir / "old.md";
    auto other = dir / "fresh.txt";
    std::ofstream(fresh) << "x";
    std::ofstream(old) << "x";
    std::ofstream(other) << "x";
    fs::last_write_time(old, fs::file_time_type::clock::now() - 3h);

    PathFilter f({"md"}, {}, std::chrono::seconds(3600));
    std::string reason;
    REQUIRE(f.accepts_file(fresh));
    REQUIRE_FALSE(f.accepts_file(old, &reason));
    REQUIRE(reason == "age");
    REQUIRE_FALSE(f.accepts_file(other, &reason));
    REQUIRE(reason == "extension");
    REQUIRE_FALSE(f.accepts_file(dir / "missing.md", &reason));
    REQUIRE(reason.rfind("cannot stat", 0) == 0);

    fs::remove_all(dir);
}
