#pragma once
#include <commitwatch/change.hpp>
#include <commitwatch/debounce.hpp>
#include <commitwatch/dir_watcher.hpp>
#include <commitwatch/filter.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace commitwatch {

struct WatcherStatus {
    bool monitoring{false};
    bool paused{false};
    size_t pending_changes{0};
};

// Always ignored in addition to the caller's patterns (".git/").
extern const std::vector<std::string> kDefaultIgnorePatterns;

// One watched root: inotify subscription -> PathFilter -> DebounceBuffer ->
// CommitCallback. Every operation reports failure through its return value
// and the log; nothing is thrown to the caller.
class FileWatcher {
public:
    FileWatcher(std::string trigger_id,
                std::filesystem::path repo_path,
                std::vector<std::string> ignore_patterns,
                CommitCallback callback,
                std::chrono::milliseconds debounce = std::chrono::seconds(5));
    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    bool start();
    bool stop();
    bool pause();
    bool resume();
    // Dispatch whatever is pending without waiting for the quiet period.
    bool flush();

    WatcherStatus status() const;
    bool monitoring() const;

    // Entry point for the OS subscription; public so events can be injected.
    void on_raw_event(const FileEvent& ev);

    const std::string& id() const { return id_; }
    const std::filesystem::path& repo_path() const { return repo_path_; }
    std::chrono::milliseconds debounce() const { return debounce_; }

private:
    std::string id_;
    std::filesystem::path repo_path_;
    std::filesystem::path root_;   // canonical form of repo_path_ while monitoring
    std::vector<std::string> patterns_;
    CommitCallback callback_;
    std::chrono::milliseconds debounce_;

    std::mutex lifecycle_mutex_;   // serializes start/stop
    mutable std::mutex mutex_;     // flags and the parts below
    bool monitoring_{false};
    bool paused_{false};
    PathFilter filter_;
    std::unique_ptr<DirWatcher> dir_;
    std::unique_ptr<DebounceBuffer> buffer_;

    void dispatch(ChangeSet changes);
    std::optional<std::string> relative(const std::filesystem::path& p) const;
};

} // namespace commitwatch
