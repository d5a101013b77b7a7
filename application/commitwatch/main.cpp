#include <commitwatch/options.hpp>
#include <commitwatch/registry.hpp>
#include <commitwatch/util.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace commitwatch;

static std::atomic<bool> g_stop{false};
static std::atomic<bool> g_dump{false};

static void on_signal(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_stop.store(true);
    } else if (sig == SIGUSR1) {
        g_dump.store(true);
    }
}

static void setup_logging(const Options& opt){
    if (opt.log_file) {
        try {
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                opt.log_file->string(), opt.log_rotate_max, opt.log_rotate_files);
            auto logger = std::make_shared<spdlog::logger>("commitwatch", sink);
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("failed to initialize rotating log sink ({}), fallback to default stderr", e.what());
        }
    }
    if (opt.verbose) spdlog::set_level(spdlog::level::debug);
    spdlog::flush_on(spdlog::level::info);
}

static std::string render_changes(const ChangeSet& changes){
    std::string out;
    for (const auto& c : changes) {
        out += fmt::format("{} {}\n", to_string(c.kind), c.path);
    }
    return out;
}

// Hands a settled change set to the outside world: the log, and --exec if given.
static CommitCallback make_callback(const std::string& trigger_id, const std::optional<std::string>& exec){
    return [trigger_id, exec](const std::filesystem::path& repo, const ChangeSet& changes){
        if (changes.empty()) {
            spdlog::info("[{}] scheduled commit point for {}", trigger_id, repo.string());
        } else {
            spdlog::info("[{}] {} changed paths in {}", trigger_id, changes.size(), repo.string());
            for (const auto& c : changes) spdlog::debug("[{}]   {} {}", trigger_id, to_string(c.kind), c.path);
        }
        if (!exec) return;

        auto res = run_command({"/bin/sh", "-c", *exec}, repo, {
            {"COMMITWATCH_TRIGGER", trigger_id},
            {"COMMITWATCH_REPO", repo.string()},
            {"COMMITWATCH_CHANGES", render_changes(changes)},
            {"COMMITWATCH_TIME", iso8601_now()},
        });
        if (res.exit_code != 0) {
            spdlog::error("[{}] exec failed rc={}: {}", trigger_id, res.exit_code, res.err);
        } else {
            spdlog::debug("[{}] exec ok: {}", trigger_id, res.out);
        }
    };
}

static void log_status(const TriggerRegistry& registry){
    auto st = registry.status();
    spdlog::info("status: running={} triggers={} file={} schedule={} active_watchers={}",
                 st.running, st.total_triggers, st.file_triggers, st.schedule_triggers, st.active_watchers);
    for (const auto& t : registry.list_triggers()) {
        if (t.watcher) {
            spdlog::info("  [{}] {} {} monitoring={} paused={} pending={} since={}",
                         t.id, to_string(t.kind), t.repo_path.string(),
                         t.watcher->monitoring, t.watcher->paused, t.watcher->pending_changes,
                         iso8601(t.created_at));
        } else {
            spdlog::info("  [{}] {} {} running={} runs={} next={}",
                         t.id, to_string(t.kind), t.repo_path.string(), t.schedule_running, t.run_count,
                         t.next_run ? iso8601(*t.next_run) : std::string("-"));
        }
    }
}

int main(int argc, char** argv) {
    auto opt = parse_options(argc, argv);
    if (!opt) return 2;
    if (opt->help) {
        print_usage(argv[0]);
        return 0;
    }

    setup_logging(*opt);
    spdlog::info("commitwatch starting; {} roots, debounce={}s", opt->watches.size(), opt->debounce_seconds);

    TriggerRegistry registry;
    size_t added = 0;
    for (const auto& w : opt->watches) {
        auto patterns = ignore_patterns_for(*opt, w.dir);
        if (registry.add_file_trigger(w.id, w.dir, make_callback(w.id, opt->exec), patterns, opt->debounce_seconds)) {
            ++added;
        }
        if (opt->every) {
            auto id = w.id + "@every";
            if (registry.add_schedule_trigger(id, w.dir, ScheduleSpec::every(*opt->every), make_callback(id, opt->exec))) ++added;
        }
        if (opt->daily) {
            auto id = w.id + "@daily";
            if (registry.add_schedule_trigger(id, w.dir, *opt->daily, make_callback(id, opt->exec))) ++added;
        }
    }
    if (added == 0) {
        spdlog::error("no trigger could be started");
        return 1;
    }

    std::signal(SIGINT,  on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGUSR1, on_signal);

    {
        ScopedRegistry scope(registry);
        auto last_stats = std::chrono::steady_clock::now();
        while (!g_stop.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            auto now = std::chrono::steady_clock::now();
            bool stats_due = opt->stats_interval_sec > 0 &&
                             now - last_stats >= std::chrono::seconds(opt->stats_interval_sec);
            if (g_dump.exchange(false) || stats_due) {
                log_status(registry);
                last_stats = now;
            }
        }
    }

    registry.clear_all();
    spdlog::info("Stopping. Bye.");
    return 0;
}
