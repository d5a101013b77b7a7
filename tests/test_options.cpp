#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <commitwatch/options.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

using namespace commitwatch;
namespace fs = std::filesystem;

static fs::path make_tmpdir(const std::string& prefix) {
    fs::path base = fs::temp_directory_path() / (prefix + "XXXXXX");
    std::string s = base.string();
    std::vector<char> buf(s.begin(), s.end());
    buf.push_back('\0');
    char* p = mkdtemp(buf.data());
    REQUIRE(p != nullptr);
    return fs::path(p);
}

static std::optional<Options> parse(std::initializer_list<const char*> args) {
    std::vector<const char*> argv{"commitwatch"};
    argv.insert(argv.end(), args.begin(), args.end());
    return parse_options(static_cast<int>(argv.size()), argv.data());
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

TEST_CASE("Full command line parses") {
    auto opt = parse({"--watch", "/srv/notes", "--id", "notes",
                      "--watch", "/srv/site",
                      "--ignore", "*.log", "--ignore", "node_modules/",
                      "--debounce", "2.5",
                      "--every", "600",
                      "--daily", "23:30",
                      "--exec", "git add -A && git commit -m auto",
                      "--stats", "30",
                      "--log-file", "/tmp/cw.log",
                      "--log-rotate-max", "4096",
                      "--log-rotate-files", "5",
                      "--verbose"});
    REQUIRE(opt.has_value());
    REQUIRE(opt->watches.size() == 2);
    REQUIRE(opt->watches[0].id == "notes");
    REQUIRE(opt->watches[0].dir == fs::path("/srv/notes"));
    REQUIRE(opt->watches[1].id == "site");
    REQUIRE(opt->ignore_patterns == std::vector<std::string>{"*.log", "node_modules/"});
    REQUIRE(opt->debounce_seconds == 2.5);
    REQUIRE(opt->every.has_value());
    REQUIRE(opt->every->count() == 600000);
    REQUIRE(opt->daily.has_value());
    REQUIRE(opt->daily->hour == 23);
    REQUIRE(opt->daily->minute == 30);
    REQUIRE(opt->exec.value() == "git add -A && git commit -m auto");
    REQUIRE(opt->stats_interval_sec == 30);
    REQUIRE(opt->log_file.value() == fs::path("/tmp/cw.log"));
    REQUIRE(opt->log_rotate_max == 4096);
    REQUIRE(opt->log_rotate_files == 5);
    REQUIRE(opt->verbose);
    REQUIRE_FALSE(opt->help);
}

TEST_CASE("Defaults when only --watch is given") {
    auto opt = parse({"--watch", "/srv/notes/"});
    REQUIRE(opt.has_value());
    REQUIRE(opt->watches.size() == 1);
    REQUIRE(opt->watches[0].id == "notes");
    REQUIRE(opt->debounce_seconds == 5.0);
    REQUIRE_FALSE(opt->every.has_value());
    REQUIRE_FALSE(opt->daily.has_value());
    REQUIRE_FALSE(opt->exec.has_value());
    REQUIRE_FALSE(opt->log_file.has_value());
    REQUIRE(opt->stats_interval_sec == 0);
    REQUIRE_FALSE(opt->verbose);

    auto pats = ignore_patterns_for(*opt, "/nonexistent/commitwatch");
    for (const char* p : {"*.tmp", "*.swp", "*~", "*.log", "*.pyc", "__pycache__/",
                          "node_modules/", ".DS_Store", "Thumbs.db"}) {
        INFO(p);
        REQUIRE(contains(pats, p));
    }
}

TEST_CASE("Default ids are made unique") {
    auto opt = parse({"-w", "/a/docs", "-w", "/b/docs", "-w", "/c/docs"});
    REQUIRE(opt.has_value());
    REQUIRE(opt->watches.size() == 3);
    REQUIRE(opt->watches[0].id == "docs");
    REQUIRE(opt->watches[1].id == "docs-2");
    REQUIRE(opt->watches[2].id == "docs-3");
}

TEST_CASE("Bad command lines are rejected") {
    REQUIRE_FALSE(parse({}).has_value());
    REQUIRE_FALSE(parse({"--id", "x", "--watch", "/a"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--id", "x", "--watch", "/b", "--id", "x"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--debounce", "-1"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--debounce", "soon"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--every", "0"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--daily", "25:00"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--daily", "noon"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--stats", "0"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--log-rotate-files", "many"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--bogus"}).has_value());
    REQUIRE_FALSE(parse({"--watch"}).has_value());
}

TEST_CASE("Out-of-range durations are rejected") {
    REQUIRE_FALSE(parse({"--watch", "/a", "--every", "1e300"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--debounce", "1e300"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--stats", "9999999999999"}).has_value());
    REQUIRE_FALSE(parse({"--watch", "/a", "--stats", "4294967297"}).has_value());

    auto day = parse({"--watch", "/a", "--every", "86400", "--stats", "86400"});
    REQUIRE(day.has_value());
    REQUIRE(day->every->count() == 86400000);
    REQUIRE(day->stats_interval_sec == 86400);
}

TEST_CASE("Zero debounce is allowed") {
    auto opt = parse({"--watch", "/a", "--debounce", "0"});
    REQUIRE(opt.has_value());
    REQUIRE(opt->debounce_seconds == 0.0);
}

TEST_CASE("--help short-circuits validation") {
    auto opt = parse({"--help"});
    REQUIRE(opt.has_value());
    REQUIRE(opt->help);
    REQUIRE(opt->watches.empty());

    auto late = parse({"--watch", "/a", "-h"});
    REQUIRE(late.has_value());
    REQUIRE(late->help);
}

TEST_CASE("Ignore patterns combine defaults, flags and ignore files") {
    auto root = make_tmpdir("cw_opt_ign_");

    auto opt = parse({"--watch", root.c_str(), "--ignore", "build/"});
    REQUIRE(opt.has_value());

    SECTION("no ignore file") {
        auto pats = ignore_patterns_for(*opt, root);
        for (auto& d : kNoiseIgnorePatterns) REQUIRE(contains(pats, d));
        REQUIRE(contains(pats, "build/"));
    }
    SECTION(".commitwatchignore in the root is picked up") {
        std::ofstream(root / ".commitwatchignore") << "# generated\n\n*.pdf\n  dist/  \n";
        auto pats = ignore_patterns_for(*opt, root);
        REQUIRE(contains(pats, "*.pdf"));
        REQUIRE(contains(pats, "dist/"));
        REQUIRE_FALSE(contains(pats, "# generated"));
    }
    SECTION("explicit --ignore-file wins over the root file") {
        std::ofstream(root / ".commitwatchignore") << "*.pdf\n";
        auto other = root / "custom.ignore";
        std::ofstream(other) << "*.bak\n";
        opt->ignore_file = other;
        auto pats = ignore_patterns_for(*opt, root);
        REQUIRE(contains(pats, "*.bak"));
        REQUIRE_FALSE(contains(pats, "*.pdf"));
    }
    fs::remove_all(root);
}
