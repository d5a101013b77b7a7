#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <commitwatch/util.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <regex>
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
    return fs::canonical(fs::path(p));
}

TEST_CASE("run_command captures output and exit status") {
    auto ok = run_command({"/bin/sh", "-c", "echo hello; echo oops >&2"}, fs::path{});
    REQUIRE(ok.exit_code == 0);
    REQUIRE(ok.out == "hello\n");
    REQUIRE(ok.err == "oops\n");

    auto fail = run_command({"/bin/sh", "-c", "exit 3"}, fs::path{});
    REQUIRE(fail.exit_code == 3);
}

TEST_CASE("run_command runs in the requested directory") {
    auto dir = make_tmpdir("cw_util_cwd_");
    auto r = run_command({"pwd", "-P"}, dir);
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.out == dir.string() + "\n");

    auto missing = run_command({"pwd"}, dir / "nope");
    REQUIRE(missing.exit_code == 126);
    fs::remove_all(dir);
}

TEST_CASE("run_command passes extra environment") {
    auto r = run_command({"/bin/sh", "-c", "printf '%s|%s' \"$CW_A\" \"$HOME\""}, fs::path{},
                         {{"CW_A", "alpha"}, {"HOME", "/overridden"}});
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.out == "alpha|/overridden");
}

TEST_CASE("run_command reports a missing binary") {
    auto r = run_command({"commitwatch-no-such-binary"}, fs::path{});
    REQUIRE(r.exit_code == 127);

    auto empty = run_command({}, fs::path{});
    REQUIRE(empty.exit_code == -1);
}

TEST_CASE("run_command drains large stderr and stdout") {
    auto r = run_command({"/bin/sh", "-c",
        "i=0; while [ $i -lt 20000 ]; do echo eeeeeeee >&2; echo oooooooo; i=$((i+1)); done"},
        fs::path{});
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.out.size() == 20000 * 9);
    REQUIRE(r.err.size() == 20000 * 9);
}

TEST_CASE("iso8601 formats UTC timestamps") {
    auto epoch = std::chrono::system_clock::time_point{};
    REQUIRE(iso8601(epoch) == "1970-01-01T00:00:00Z");
    REQUIRE(iso8601(epoch + std::chrono::hours(24 * 365) + std::chrono::seconds(61))
            == "1971-01-01T00:01:01Z");
    REQUIRE(std::regex_match(iso8601_now(),
            std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)")));
}
