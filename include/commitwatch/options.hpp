#pragma once
#include <commitwatch/schedule.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace commitwatch {

struct WatchTarget {
    std::string id;
    std::filesystem::path dir;
};

struct Options {
    std::vector<WatchTarget> watches;
    std::vector<std::string> ignore_patterns;
    std::optional<std::filesystem::path> ignore_file;
    double debounce_seconds = 5.0;
    std::optional<std::chrono::milliseconds> every;
    std::optional<ScheduleSpec> daily;
    std::optional<std::string> exec;
    int stats_interval_sec = 0;
    std::optional<std::filesystem::path> log_file;
    size_t log_rotate_max = 10 * 1024 * 1024;
    size_t log_rotate_files = 3;
    bool verbose = false;
    bool help = false;
};

// Editor scratch files plus build and cache output nobody wants committed.
extern const std::vector<std::string> kNoiseIgnorePatterns;

// Logs the problem and returns nullopt on bad input. --help yields
// Options with help set and nothing else validated.
std::optional<Options> parse_options(int argc, const char* const* argv);

void print_usage(const char* argv0);

// Defaults + --ignore + the ignore file (explicit, or <root>/.commitwatchignore).
std::vector<std::string> ignore_patterns_for(const Options& opt, const std::filesystem::path& root);

} // namespace commitwatch
