#pragma once
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace commitwatch {

class PathFilter {
public:
    PathFilter() = default;

    // Returns nullopt (and logs) if any pattern is malformed.
    static std::optional<PathFilter> compile(const std::vector<std::string>& patterns);

    bool should_ignore(const std::string& rel_path) const;

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    struct Rule {
        std::string pattern;
        bool dir_only{false};
        std::regex re;
    };

    std::vector<std::string> patterns_;
    std::vector<Rule> rules_;

    static std::string trim(const std::string& s);
    static std::optional<std::string> glob_to_regex(const std::string& pat, bool dir_only);
};

// One pattern per line; blank lines and '#' comments are skipped.
// Returns false if the file can't be read.
bool load_patterns(const std::filesystem::path& file, std::vector<std::string>& out);

} // namespace commitwatch
