#pragma once
#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace commitwatch {

enum class EventKind {
    Create,
    Modify,
    Delete,
    MoveFrom,
    MoveTo,
};

struct FileEvent {
    EventKind kind;
    std::filesystem::path path;   // absolute
    bool is_dir{false};
};

const char* to_string(EventKind k);

// Recursive inotify subscription on one directory tree. Events are delivered
// on a reader thread owned by the watcher; .git subtrees are never watched.
class DirWatcher {
public:
    using OnEvent = std::function<void(const FileEvent&)>;

    explicit DirWatcher(std::filesystem::path dir);
    ~DirWatcher();

    DirWatcher(const DirWatcher&) = delete;
    DirWatcher& operator=(const DirWatcher&) = delete;

    // Opens the inotify descriptor, watches the tree and spawns the reader.
    bool start(OnEvent on_event);
    // Joins the reader; no event is delivered after this returns.
    void stop();

    bool running() const { return running_.load(); }
    size_t watch_count() const;
    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
    int inotify_fd_{-1};

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_flag_{false};
    std::thread reader_;
    OnEvent on_event_;

    mutable std::mutex watch_mutex_;
    std::unordered_map<int, std::filesystem::path> wd_to_path_;
    std::unordered_map<std::string, int> path_to_wd_;

    bool open_recursive();
    void close();
    void run_loop();

    bool add_watch(const std::filesystem::path& p);
    void remove_watch(const std::filesystem::path& p);
    void add_tree(const std::filesystem::path& root);
    void report_existing(const std::filesystem::path& root);
    std::filesystem::path base_for_wd(int wd) const;
};

} // namespace commitwatch
