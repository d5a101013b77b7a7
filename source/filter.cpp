#include <commitwatch/filter.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>

namespace commitwatch {

std::string PathFilter::trim(const std::string& s){
    size_t i=0, j=s.size();
    while (i<j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j>i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
    return s.substr(i, j-i);
}

// Directory patterns match a run of whole components at any depth, so their
// wildcards stay inside one component. Plain patterns follow fnmatch without
// FNM_PATHNAME: '*' may cross '/'.
std::optional<std::string> PathFilter::glob_to_regex(const std::string& pat, bool dir_only){
    const std::string any_run = dir_only ? "[^/]*" : ".*";
    const std::string any_one = dir_only ? "[^/]" : ".";

    std::string rx;
    if (dir_only) rx += "(.*/)?";
    size_t i=0;
    while (i<pat.size()){
        char c = pat[i];
        if (c == '*') {
            while (i<pat.size() && pat[i]=='*') ++i;
            rx += any_run;
            continue;
        } else if (c == '?') {
            rx += any_one;
        } else if (c == '[') {
            size_t j = i + 1;
            if (j<pat.size() && (pat[j]=='!' || pat[j]=='^')) ++j;
            if (j<pat.size() && pat[j]==']') ++j;
            while (j<pat.size() && pat[j]!=']') ++j;
            if (j >= pat.size()) return std::nullopt;

            std::string cls = "[";
            size_t k = i + 1;
            if (pat[k]=='!' || pat[k]=='^') { cls += '^'; ++k; }
            for (; k<j; ++k) {
                if (pat[k]=='\\' || pat[k]=='[' || pat[k]==']') cls += '\\';
                cls += pat[k];
            }
            cls += ']';
            rx += cls;
            i = j + 1;
            continue;
        } else if (c == '\\' && (i+1)<pat.size()) {
            // the escaped character is literal; only regex metacharacters keep the backslash
            ++i;
            if (!std::isalnum(static_cast<unsigned char>(pat[i])) && pat[i] != '_') rx.push_back('\\');
            rx.push_back(pat[i]);
        } else if (c == '.' || c == '+' || c == '(' || c==')' || c=='{' || c=='}' ||
                   c==']' || c=='^' || c=='$' || c=='|' || c=='\\') {
            rx.push_back('\\'); rx.push_back(c);
        } else {
            rx.push_back(c);
        }
        ++i;
    }
    if (dir_only) rx += "(/.*)?";
    return rx;
}

std::optional<PathFilter> PathFilter::compile(const std::vector<std::string>& patterns){
    PathFilter f;
    for (const auto& raw : patterns) {
        std::string pat = trim(raw);
        bool dir_only = false;
        while (!pat.empty() && pat.back()=='/') { dir_only = true; pat.pop_back(); }
        if (pat.empty()) {
            spdlog::error("invalid ignore pattern '{}': empty", raw);
            return std::nullopt;
        }

        auto rx = glob_to_regex(pat, dir_only);
        if (!rx) {
            spdlog::error("invalid ignore pattern '{}': unterminated character class", raw);
            return std::nullopt;
        }

        Rule r;
        r.pattern = pat;
        r.dir_only = dir_only;
        try {
            r.re = std::regex(*rx, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& e) {
            spdlog::error("invalid ignore pattern '{}': {}", raw, e.what());
            return std::nullopt;
        }
        f.rules_.push_back(std::move(r));
        f.patterns_.push_back(raw);
    }
    return f;
}

bool PathFilter::should_ignore(const std::string& rel_path) const {
    if (rel_path.empty()) return false;

    std::string name = rel_path;
    auto slash = rel_path.rfind('/');
    if (slash != std::string::npos) name = rel_path.substr(slash + 1);

    for (const auto& r : rules_) {
        if (std::regex_match(rel_path, r.re)) return true;
        if (!r.dir_only && std::regex_match(name, r.re)) return true;
    }
    return false;
}

bool load_patterns(const std::filesystem::path& file, std::vector<std::string>& out){
    std::ifstream in(file);
    if (!in.good()) {
        spdlog::warn("can't read ignore file {}", file.string());
        return false;
    }
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;
        if (line[first] == '#') continue;
        auto last = line.find_last_not_of(" \t\r");
        out.push_back(line.substr(first, last - first + 1));
        ++n;
    }
    spdlog::debug("loaded {} ignore patterns from {}", n, file.string());
    return true;
}

} // namespace commitwatch
