#include <commitwatch/file_watcher.hpp>
#include <spdlog/spdlog.h>

#include <system_error>

namespace commitwatch {

const std::vector<std::string> kDefaultIgnorePatterns = {".git/"};

// Watcher whose callback is running on this thread, if any.
static thread_local const FileWatcher* t_dispatching = nullptr;

static ChangeKind change_kind(EventKind k){
    switch (k){
        case EventKind::Create:
        case EventKind::MoveTo:   return ChangeKind::Created;
        case EventKind::Modify:   return ChangeKind::Modified;
        case EventKind::Delete:
        case EventKind::MoveFrom: return ChangeKind::Deleted;
    }
    return ChangeKind::Modified;
}

FileWatcher::FileWatcher(std::string trigger_id,
                         std::filesystem::path repo_path,
                         std::vector<std::string> ignore_patterns,
                         CommitCallback callback,
                         std::chrono::milliseconds debounce)
: id_(std::move(trigger_id)),
  repo_path_(std::move(repo_path)),
  patterns_(std::move(ignore_patterns)),
  callback_(std::move(callback)),
  debounce_(debounce)
{}

FileWatcher::~FileWatcher(){
    stop();
}

bool FileWatcher::start(){
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (monitoring_) return true;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(repo_path_, ec)) {
        spdlog::error("[{}] can't watch {}: not a directory", id_, repo_path_.string());
        return false;
    }
    auto root = std::filesystem::canonical(repo_path_, ec);
    if (ec) {
        spdlog::error("[{}] can't resolve {}: {}", id_, repo_path_.string(), ec.message());
        return false;
    }
    if (debounce_.count() < 0) {
        spdlog::error("[{}] negative debounce interval {}ms", id_, debounce_.count());
        return false;
    }
    if (!callback_) {
        spdlog::error("[{}] no commit callback", id_);
        return false;
    }

    std::vector<std::string> patterns = kDefaultIgnorePatterns;
    patterns.insert(patterns.end(), patterns_.begin(), patterns_.end());
    auto filter = PathFilter::compile(patterns);
    if (!filter) {
        spdlog::error("[{}] bad ignore patterns, not starting", id_);
        return false;
    }

    auto buffer = std::make_unique<DebounceBuffer>(debounce_, [this](ChangeSet cs){ dispatch(std::move(cs)); });
    if (!buffer->start()) {
        spdlog::error("[{}] can't start debounce timer", id_);
        return false;
    }
    auto dir = std::make_unique<DirWatcher>(root);

    {
        std::lock_guard<std::mutex> lk(mutex_);
        root_ = root;
        filter_ = std::move(*filter);
        buffer_ = std::move(buffer);
        monitoring_ = true;
    }

    if (!dir->start([this](const FileEvent& ev){ on_raw_event(ev); })) {
        std::unique_ptr<DebounceBuffer> dead;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            monitoring_ = false;
            dead = std::move(buffer_);
        }
        dead->stop();
        spdlog::error("[{}] can't attach inotify to {}", id_, root.string());
        return false;
    }

    size_t watches = dir->watch_count();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        dir_ = std::move(dir);
    }
    spdlog::info("[{}] watching {} ({} dirs, debounce {}ms)", id_, root.string(), watches, debounce_.count());
    return true;
}

bool FileWatcher::stop(){
    // A stop() from inside the callback must not wait on lifecycle_mutex_: a
    // concurrent stop() holds it while joining this very thread.
    std::unique_lock<std::mutex> life(lifecycle_mutex_, std::defer_lock);
    if (t_dispatching != this) life.lock();

    std::unique_ptr<DirWatcher> dir;
    std::unique_ptr<DebounceBuffer> buffer;
    bool was_monitoring = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        was_monitoring = monitoring_;
        monitoring_ = false;
        dir = std::move(dir_);
        buffer = std::move(buffer_);
    }

    // detach the subscription first so nothing re-arms the timer behind us
    if (dir) dir->stop();
    size_t dropped = 0;
    if (buffer) {
        dropped = buffer->pending();
        buffer->stop();
    }

    if (was_monitoring) {
        spdlog::info("[{}] stopped watching {} ({} pending dropped)", id_, repo_path_.string(), dropped);
    }
    return true;
}

bool FileWatcher::pause(){
    std::lock_guard<std::mutex> lk(mutex_);
    if (paused_) return true;
    paused_ = true;
    size_t dropped = buffer_ ? buffer_->clear() : 0;
    spdlog::info("[{}] paused ({} pending dropped)", id_, dropped);
    return true;
}

bool FileWatcher::resume(){
    std::lock_guard<std::mutex> lk(mutex_);
    if (!paused_) return true;
    paused_ = false;
    spdlog::info("[{}] resumed", id_);
    return true;
}

bool FileWatcher::flush(){
    std::lock_guard<std::mutex> lk(mutex_);
    if (!monitoring_ || !buffer_) return false;
    return buffer_->flush();
}

WatcherStatus FileWatcher::status() const {
    std::lock_guard<std::mutex> lk(mutex_);
    WatcherStatus st;
    st.monitoring = monitoring_;
    st.paused = paused_;
    st.pending_changes = buffer_ ? buffer_->pending() : 0;
    return st;
}

bool FileWatcher::monitoring() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return monitoring_;
}

std::optional<std::string> FileWatcher::relative(const std::filesystem::path& p) const {
    for (const auto* base : {&root_, &repo_path_}) {
        if (base->empty()) continue;
        auto rel = p.lexically_normal().lexically_relative(base->lexically_normal());
        if (rel.empty() || rel == ".") continue;
        if (*rel.begin() == "..") continue;
        return rel.generic_string();
    }
    return std::nullopt;
}

void FileWatcher::on_raw_event(const FileEvent& ev){
    if (ev.is_dir) return;

    std::lock_guard<std::mutex> lk(mutex_);
    if (!monitoring_ || !buffer_) return;
    if (paused_) {
        spdlog::debug("[{}] paused, dropped: {}", id_, ev.path.string());
        return;
    }
    auto rel = relative(ev.path);
    if (!rel) {
        spdlog::debug("[{}] outside of {}: {}", id_, root_.string(), ev.path.string());
        return;
    }
    if (filter_.should_ignore(*rel)) {
        spdlog::debug("[{}] ignored: {}", id_, *rel);
        return;
    }
    spdlog::debug("[{}] {} {}", id_, to_string(ev.kind), *rel);
    buffer_->add(*rel, change_kind(ev.kind));
}

void FileWatcher::dispatch(ChangeSet changes){
    spdlog::info("[{}] flushing {} changes in {}", id_, changes.size(), repo_path_.string());
    struct Mark {
        const FileWatcher* prev;
        explicit Mark(const FileWatcher* w) : prev(t_dispatching) { t_dispatching = w; }
        ~Mark() { t_dispatching = prev; }
    } mark(this);
    try {
        callback_(repo_path_, changes);
    } catch (const std::exception& e) {
        spdlog::error("[{}] commit callback failed, {} paths discarded: {}", id_, changes.size(), e.what());
    } catch (...) {
        spdlog::error("[{}] commit callback failed, {} paths discarded: unknown exception", id_, changes.size());
    }
}

} // namespace commitwatch
