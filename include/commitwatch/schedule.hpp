#pragma once
#include <commitwatch/change.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace commitwatch {

struct ScheduleSpec {
    enum class Mode { Interval, Daily };

    Mode mode{Mode::Interval};
    std::chrono::milliseconds period{std::chrono::minutes(60)};   // Interval
    int hour{0};                                                   // Daily, local time
    int minute{0};

    static ScheduleSpec every(std::chrono::milliseconds p) {
        ScheduleSpec s; s.mode = Mode::Interval; s.period = p; return s;
    }
    static ScheduleSpec daily(int h, int m) {
        ScheduleSpec s; s.mode = Mode::Daily; s.hour = h; s.minute = m; return s;
    }

    bool valid() const;
    std::string describe() const;
};

// "HH:MM", 24h clock.
std::optional<ScheduleSpec> parse_time_of_day(const std::string& s);

// Next firing strictly after `from`.
std::chrono::system_clock::time_point next_fire(const ScheduleSpec& spec,
                                                std::chrono::system_clock::time_point from);

// Time-based producer of commit signals. Fires the callback with an empty
// change set on its own thread.
class ScheduleTrigger {
public:
    ScheduleTrigger(std::string trigger_id,
                    std::filesystem::path repo_path,
                    ScheduleSpec spec,
                    CommitCallback callback);
    ~ScheduleTrigger();

    ScheduleTrigger(const ScheduleTrigger&) = delete;
    ScheduleTrigger& operator=(const ScheduleTrigger&) = delete;

    bool start();
    bool stop();

    bool running() const;
    std::optional<std::chrono::system_clock::time_point> next_run() const;
    uint64_t run_count() const { return runs_.load(); }

    const std::string& id() const { return id_; }
    const std::filesystem::path& repo_path() const { return repo_path_; }
    const ScheduleSpec& spec() const { return spec_; }

private:
    std::string id_;
    std::filesystem::path repo_path_;
    ScheduleSpec spec_;
    CommitCallback callback_;

    std::mutex lifecycle_mutex_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_{false};
    bool stopping_{false};
    std::optional<std::chrono::system_clock::time_point> next_;
    std::thread thread_;
    uint64_t epoch_{0};
    std::atomic<uint64_t> runs_{0};

    void loop(uint64_t epoch);
    void fire();
};

} // namespace commitwatch
