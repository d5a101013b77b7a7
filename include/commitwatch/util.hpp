#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace commitwatch {

struct CmdResult {
    int exit_code{};
    std::string out;
    std::string err;
};

using EnvVars = std::vector<std::pair<std::string, std::string>>;

// fork/exec without a shell; `env` is added to the child's environment.
CmdResult run_command(const std::vector<std::string>& argv,
                      const std::filesystem::path& cwd,
                      const EnvVars& env = {});

std::string iso8601(std::chrono::system_clock::time_point tp);
std::string iso8601_now();

} // namespace commitwatch
