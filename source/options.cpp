#include <commitwatch/options.hpp>
#include <commitwatch/filter.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <set>

namespace commitwatch {

const std::vector<std::string> kNoiseIgnorePatterns = {
    "*.tmp", "*.swp", "*~",
    "*.log", "*.pyc", "__pycache__/", "node_modules/",
    ".DS_Store", "Thumbs.db",
};

// Upper bound for every duration flag; keeps the millisecond conversion in range.
static constexpr double kMaxSeconds = 366.0 * 24 * 3600;

void print_usage(const char* argv0){
    fmt::print(
        "Usage:\n"
        "  {} --watch <DIR> [--id NAME] [--watch <DIR> [--id NAME] ...]\n"
        "     [--ignore PATTERN ...] [--ignore-file PATH]\n"
        "     [--debounce SEC]\n"
        "     [--every SEC] [--daily HH:MM]\n"
        "     [--exec CMD]\n"
        "     [--stats SEC]\n"
        "     [--log-file PATH] [--log-rotate-max BYTES] [--log-rotate-files N]\n"
        "     [--verbose]\n"
        "\n", argv0);
}

static std::optional<double> parse_double(const std::string& s){
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0' || !std::isfinite(v)) return std::nullopt;
    return v;
}

static std::optional<long long> parse_ll(const std::string& s){
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return std::nullopt;
    return v;
}

static std::string default_id(const std::filesystem::path& dir){
    auto last_name = [](std::filesystem::path p){
        p = p.lexically_normal();
        if (p.filename().empty() && p.has_parent_path()) p = p.parent_path();
        return p.filename().string();
    };
    auto name = last_name(dir);
    if (name.empty() || name == "." || name == "..") {
        std::error_code ec;
        name = last_name(std::filesystem::absolute(dir, ec));
    }
    if (name == "." || name == ".." || name == "/") name.clear();
    return name.empty() ? std::string("watch") : name;
}

std::optional<Options> parse_options(int argc, const char* const* argv){
    Options opt;
    auto bad = [&](const std::string& msg) -> std::optional<Options> {
        spdlog::error("{}", msg);
        print_usage(argv[0]);
        return std::nullopt;
    };

    for (int i=1;i<argc;i++){
        std::string a = argv[i];
        bool has_val = (i+1<argc);
        if ((a=="--watch" || a=="-w") && has_val) {
            WatchTarget t;
            t.dir = argv[++i];
            opt.watches.push_back(std::move(t));
        } else if (a=="--id" && has_val) {
            if (opt.watches.empty()) return bad("--id must follow --watch");
            opt.watches.back().id = argv[++i];
        } else if (a=="--ignore" && has_val) {
            opt.ignore_patterns.push_back(argv[++i]);
        } else if (a=="--ignore-file" && has_val) {
            opt.ignore_file = std::filesystem::path(argv[++i]);
        } else if (a=="--debounce" && has_val) {
            auto v = parse_double(argv[++i]);
            if (!v || *v < 0 || *v > kMaxSeconds) return bad(fmt::format("bad --debounce value: {}", argv[i]));
            opt.debounce_seconds = *v;
        } else if (a=="--every" && has_val) {
            auto v = parse_double(argv[++i]);
            if (!v || *v <= 0 || *v > kMaxSeconds) return bad(fmt::format("bad --every value: {}", argv[i]));
            opt.every = std::chrono::milliseconds(std::llround(*v * 1000.0));
        } else if (a=="--daily" && has_val) {
            auto spec = parse_time_of_day(argv[++i]);
            if (!spec) return bad(fmt::format("bad --daily value (want HH:MM): {}", argv[i]));
            opt.daily = *spec;
        } else if (a=="--exec" && has_val) {
            opt.exec = std::string(argv[++i]);
        } else if (a=="--stats" && has_val) {
            auto v = parse_ll(argv[++i]);
            if (!v || *v < 1 || *v > static_cast<long long>(kMaxSeconds)) return bad(fmt::format("bad --stats value: {}", argv[i]));
            opt.stats_interval_sec = static_cast<int>(*v);
        } else if (a=="--log-file" && has_val) {
            opt.log_file = std::filesystem::path(argv[++i]);
        } else if (a=="--log-rotate-max" && has_val) {
            auto v = parse_ll(argv[++i]);
            if (!v || *v < 1) return bad(fmt::format("bad --log-rotate-max value: {}", argv[i]));
            opt.log_rotate_max = static_cast<size_t>(*v);
        } else if (a=="--log-rotate-files" && has_val) {
            auto v = parse_ll(argv[++i]);
            if (!v || *v < 1) return bad(fmt::format("bad --log-rotate-files value: {}", argv[i]));
            opt.log_rotate_files = static_cast<size_t>(*v);
        } else if (a=="--verbose" || a=="-v") {
            opt.verbose = true;
        } else if (a=="--help" || a=="-h") {
            Options h;
            h.help = true;
            return h;
        } else {
            return bad(fmt::format("Unknown argument: {}", a));
        }
    }

    if (opt.watches.empty()) return bad("--watch <DIR> is required");

    std::set<std::string> seen;
    for (auto& w : opt.watches) {
        if (w.id.empty()) {
            std::string base = default_id(w.dir);
            w.id = base;
            for (int n = 2; seen.count(w.id); ++n) w.id = fmt::format("{}-{}", base, n);
        }
        if (!seen.insert(w.id).second) return bad(fmt::format("duplicate trigger id: {}", w.id));
    }
    return opt;
}

std::vector<std::string> ignore_patterns_for(const Options& opt, const std::filesystem::path& root){
    std::vector<std::string> out = kNoiseIgnorePatterns;
    out.insert(out.end(), opt.ignore_patterns.begin(), opt.ignore_patterns.end());
    if (opt.ignore_file) {
        load_patterns(*opt.ignore_file, out);
    } else {
        auto def = root / ".commitwatchignore";
        std::error_code ec;
        if (std::filesystem::exists(def, ec)) load_patterns(def, out);
    }
    return out;
}

} // namespace commitwatch
