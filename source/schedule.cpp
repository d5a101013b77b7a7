#include <commitwatch/schedule.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cctype>
#include <ctime>
#include <system_error>

namespace commitwatch {

bool ScheduleSpec::valid() const {
    switch (mode) {
        case Mode::Interval: return period.count() > 0;
        case Mode::Daily:    return hour >= 0 && hour < 24 && minute >= 0 && minute < 60;
    }
    return false;
}

std::string ScheduleSpec::describe() const {
    if (mode == Mode::Daily) return fmt::format("daily at {:02}:{:02}", hour, minute);
    return fmt::format("every {}ms", period.count());
}

std::optional<ScheduleSpec> parse_time_of_day(const std::string& s){
    auto colon = s.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2) return std::nullopt;
    if (s.size() - colon - 1 != 2) return std::nullopt;
    for (size_t i=0;i<s.size();++i) {
        if (i == colon) continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }
    auto spec = ScheduleSpec::daily(std::stoi(s.substr(0, colon)), std::stoi(s.substr(colon + 1)));
    if (!spec.valid()) return std::nullopt;
    return spec;
}

std::chrono::system_clock::time_point next_fire(const ScheduleSpec& spec,
                                                std::chrono::system_clock::time_point from)
{
    using namespace std::chrono;
    if (spec.mode == ScheduleSpec::Mode::Interval) {
        return from + spec.period;
    }

    auto t = system_clock::to_time_t(from);
    std::tm tm{};
    localtime_r(&t, &tm);
    tm.tm_hour = spec.hour;
    tm.tm_min = spec.minute;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    auto at = system_clock::from_time_t(std::mktime(&tm));
    if (at <= from) {
        tm.tm_mday += 1;
        tm.tm_hour = spec.hour;
        tm.tm_min = spec.minute;
        tm.tm_sec = 0;
        tm.tm_isdst = -1;
        at = system_clock::from_time_t(std::mktime(&tm));
    }
    return at;
}

ScheduleTrigger::ScheduleTrigger(std::string trigger_id,
                                 std::filesystem::path repo_path,
                                 ScheduleSpec spec,
                                 CommitCallback callback)
: id_(std::move(trigger_id)),
  repo_path_(std::move(repo_path)),
  spec_(spec),
  callback_(std::move(callback))
{}

ScheduleTrigger::~ScheduleTrigger(){
    stop();
}

bool ScheduleTrigger::start(){
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (running_) return true;
    }
    if (!spec_.valid()) {
        spdlog::error("[{}] invalid schedule: {}", id_, spec_.describe());
        return false;
    }
    if (!callback_) {
        spdlog::error("[{}] no commit callback", id_);
        return false;
    }

    uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stopping_ = false;
        next_ = next_fire(spec_, std::chrono::system_clock::now());
        running_ = true;
        epoch = ++epoch_;
    }
    try {
        thread_ = std::thread([this, epoch]{ loop(epoch); });
    } catch (const std::system_error& e) {
        spdlog::error("[{}] can't spawn schedule thread: {}", id_, e.what());
        std::lock_guard<std::mutex> lk(mutex_);
        running_ = false;
        next_.reset();
        return false;
    }
    spdlog::info("[{}] scheduled {} for {}", id_, spec_.describe(), repo_path_.string());
    return true;
}

bool ScheduleTrigger::stop(){
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        was_running = running_;
        stopping_ = true;
        running_ = false;
        next_.reset();
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) thread_.detach();
        else thread_.join();
    }
    if (was_running) spdlog::info("[{}] schedule stopped", id_);
    return true;
}

bool ScheduleTrigger::running() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return running_;
}

std::optional<std::chrono::system_clock::time_point> ScheduleTrigger::next_run() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return next_;
}

// `epoch` tells a thread detached by a stop() from its own callback apart from
// the one a later start() spawned.
void ScheduleTrigger::loop(uint64_t epoch){
    std::unique_lock<std::mutex> lk(mutex_);
    auto done = [&]{ return stopping_ || epoch_ != epoch; };
    while (!done()) {
        if (!next_) break;
        auto at = *next_;
        if (cv_.wait_until(lk, at, done)) break;

        lk.unlock();
        fire();
        lk.lock();
        if (done()) break;
        next_ = next_fire(spec_, std::chrono::system_clock::now());
    }
}

void ScheduleTrigger::fire(){
    auto n = ++runs_;
    spdlog::info("[{}] schedule firing (run #{}) for {}", id_, n, repo_path_.string());
    try {
        callback_(repo_path_, ChangeSet{});
    } catch (const std::exception& e) {
        spdlog::error("[{}] commit callback failed on scheduled run: {}", id_, e.what());
    } catch (...) {
        spdlog::error("[{}] commit callback failed on scheduled run: unknown exception", id_);
    }
}

} // namespace commitwatch
