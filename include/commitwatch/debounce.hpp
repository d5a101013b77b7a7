#pragma once
#include <commitwatch/change.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace commitwatch {

// Collects changes into a pending set and hands the whole set to on_flush once
// `quiet` has elapsed without a new change. Each add() re-arms the timer and
// bumps a generation counter; a wakeup fires only if its generation is still
// current. on_flush runs on the buffer's own timer thread, one call at a time.
class DebounceBuffer {
public:
    using OnFlush = std::function<void(ChangeSet)>;
    using Clock = std::chrono::steady_clock;

    DebounceBuffer(std::chrono::milliseconds quiet, OnFlush on_flush);
    ~DebounceBuffer();

    DebounceBuffer(const DebounceBuffer&) = delete;
    DebounceBuffer& operator=(const DebounceBuffer&) = delete;

    // A buffer runs once: after stop() it can't be started again.
    bool start();
    // Disarms, drops pending changes and joins the timer thread. A flush that
    // is already running completes first, unless stop() is called from it.
    void stop();

    void add(const std::string& rel_path, ChangeKind kind);
    // Drops pending changes and disarms; returns how many were dropped.
    size_t clear();
    // Makes the timer fire now. False if nothing is pending.
    bool flush();

    size_t pending() const;
    bool armed() const;
    std::optional<Clock::time_point> armed_at() const;
    uint64_t generation() const;
    std::chrono::milliseconds quiet() const { return quiet_; }

private:
    struct State {
        std::mutex mu;
        std::condition_variable cv;
        std::map<std::string, ChangeKind> pending;
        std::optional<Clock::time_point> deadline;
        std::optional<Clock::time_point> armed_at;
        uint64_t generation{0};
        bool stopping{false};
        OnFlush on_flush;
    };

    // The timer thread holds its own reference, so a stop() issued from inside
    // on_flush can detach without leaving the thread on freed memory.
    std::shared_ptr<State> st_;
    std::chrono::milliseconds quiet_;
    std::thread timer_;

    static void run(std::shared_ptr<State> st);
    static ChangeKind merge(ChangeKind prev, ChangeKind next);
};

} // namespace commitwatch
