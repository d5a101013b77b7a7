#pragma once
#include <commitwatch/change.hpp>
#include <commitwatch/file_watcher.hpp>
#include <commitwatch/schedule.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace commitwatch {

enum class TriggerKind {
    FileChange,
    Schedule,
};

const char* to_string(TriggerKind k);

struct TriggerInfo {
    std::string id;
    TriggerKind kind{TriggerKind::FileChange};
    std::filesystem::path repo_path;
    std::chrono::system_clock::time_point created_at;

    // FileChange only
    std::optional<WatcherStatus> watcher;

    // Schedule only
    bool schedule_running{false};
    std::optional<std::chrono::system_clock::time_point> next_run;
    uint64_t run_count{0};
};

struct RegistryStatus {
    bool running{false};
    size_t total_triggers{0};
    size_t file_triggers{0};
    size_t schedule_triggers{0};
    size_t active_watchers{0};
};

// Owns every trigger of the process. One lock serializes all mutation and
// iteration, including teardown of the triggers themselves, so a commit
// callback must never call back into the registry that owns its trigger.
class TriggerRegistry {
public:
    TriggerRegistry() = default;
    ~TriggerRegistry();

    TriggerRegistry(const TriggerRegistry&) = delete;
    TriggerRegistry& operator=(const TriggerRegistry&) = delete;

    // Replaces an existing trigger with the same id. The record is kept only
    // if the watcher starts.
    bool add_file_trigger(const std::string& id,
                          const std::filesystem::path& repo_path,
                          CommitCallback callback,
                          std::vector<std::string> ignore_patterns = {},
                          double debounce_seconds = 5.0);

    bool add_schedule_trigger(const std::string& id,
                              const std::filesystem::path& repo_path,
                              const ScheduleSpec& spec,
                              CommitCallback callback);

    bool remove_trigger(const std::string& id);

    bool start();
    bool stop();

    bool pause_trigger(const std::string& id);
    bool resume_trigger(const std::string& id);
    // Dispatch a file trigger's pending changes now.
    bool flush_trigger(const std::string& id);

    bool contains(const std::string& id) const;
    std::vector<TriggerInfo> list_triggers() const;
    RegistryStatus status() const;

    void clear_all();

private:
    struct Record {
        std::string id;
        TriggerKind kind{TriggerKind::FileChange};
        std::filesystem::path repo_path;
        CommitCallback callback;
        std::unique_ptr<FileWatcher> watcher;
        std::unique_ptr<ScheduleTrigger> schedule;
        std::chrono::system_clock::time_point created_at;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Record> triggers_;
    bool running_{false};

    bool remove_locked(const std::string& id);
};

// Starts the registry for the lifetime of the guard and stops it on the way
// out, including unwinding.
class ScopedRegistry {
public:
    explicit ScopedRegistry(TriggerRegistry& r) : registry_(r) { registry_.start(); }
    ~ScopedRegistry() { registry_.stop(); }

    ScopedRegistry(const ScopedRegistry&) = delete;
    ScopedRegistry& operator=(const ScopedRegistry&) = delete;

    TriggerRegistry& operator*() const { return registry_; }
    TriggerRegistry* operator->() const { return &registry_; }

private:
    TriggerRegistry& registry_;
};

} // namespace commitwatch
