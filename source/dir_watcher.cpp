#include <commitwatch/dir_watcher.hpp>
#include <spdlog/spdlog.h>

#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace commitwatch {

const char* to_string(EventKind k){
    switch (k){
        case EventKind::Create:   return "create";
        case EventKind::Modify:   return "modify";
        case EventKind::Delete:   return "delete";
        case EventKind::MoveFrom: return "move_from";
        case EventKind::MoveTo:   return "move_to";
    }
    return "unknown";
}

static constexpr uint32_t kWatchMask =
    IN_CREATE | IN_MODIFY | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_CLOSE_WRITE | IN_ONLYDIR;

DirWatcher::DirWatcher(std::filesystem::path dir)
: dir_(std::move(dir))
{}

DirWatcher::~DirWatcher(){
    stop();
}

bool DirWatcher::add_watch(const std::filesystem::path& p){
    std::error_code ec;
    if (!std::filesystem::is_directory(p, ec)) return false;
    if (p.filename() == ".git") return false;
    auto can = std::filesystem::weakly_canonical(p, ec);
    std::string key = ec ? p.string() : can.string();

    std::lock_guard<std::mutex> lk(watch_mutex_);
    if (path_to_wd_.count(key)) return true;

    int wd = ::inotify_add_watch(inotify_fd_, key.c_str(), kWatchMask);
    if (wd < 0) {
        spdlog::warn("inotify_add_watch failed for {}: {}", key, std::strerror(errno));
        return false;
    }
    wd_to_path_[wd] = key;
    path_to_wd_[key] = wd;
    spdlog::debug("watch added: {} (wd={})", key, wd);
    return true;
}

void DirWatcher::remove_watch(const std::filesystem::path& p){
    std::error_code ec;
    auto can = std::filesystem::weakly_canonical(p, ec);
    std::string key = ec ? p.string() : can.string();

    std::lock_guard<std::mutex> lk(watch_mutex_);
    auto it = path_to_wd_.find(key);
    if (it == path_to_wd_.end()) return;
    int wd = it->second;
    // the kernel already dropped the watch for a deleted directory
    ::inotify_rm_watch(inotify_fd_, wd);
    wd_to_path_.erase(wd);
    path_to_wd_.erase(it);
    spdlog::debug("watch removed: {} (wd={})", key, wd);
}

void DirWatcher::add_tree(const std::filesystem::path& root){
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
    {
        if (it->path().filename() == ".git") {
            it.disable_recursion_pending();
            continue;
        }
        std::error_code dec;
        if (it->is_directory(dec)) add_watch(it->path());
    }
    if (ec) spdlog::warn("walking {} stopped early: {}", root.string(), ec.message());
}

// Empty for a watch that is already gone.
std::filesystem::path DirWatcher::base_for_wd(int wd) const{
    std::lock_guard<std::mutex> lk(watch_mutex_);
    auto it = wd_to_path_.find(wd);
    if (it == wd_to_path_.end()) return {};
    return it->second;
}

// Files created before the new directory's watch was in place (mkdir -p + write,
// cp -r, mv from outside the root) produce no inotify event of their own.
void DirWatcher::report_existing(const std::filesystem::path& root){
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
    {
        if (it->path().filename() == ".git") {
            it.disable_recursion_pending();
            continue;
        }
        std::error_code fec;
        if (it->is_regular_file(fec)) on_event_(FileEvent{EventKind::Create, it->path(), false});
    }
}

bool DirWatcher::open_recursive(){
    inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        spdlog::error("inotify_init1 failed: {}", std::strerror(errno));
        return false;
    }
    if (!add_watch(dir_)) {
        spdlog::error("can't watch {}", dir_.string());
        close();
        return false;
    }
    add_tree(dir_);
    return true;
}

void DirWatcher::close(){
    if (inotify_fd_ >= 0) {
        std::lock_guard<std::mutex> lk(watch_mutex_);
        for (auto& kv : wd_to_path_) {
            ::inotify_rm_watch(inotify_fd_, kv.first);
        }
        wd_to_path_.clear();
        path_to_wd_.clear();
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
}

size_t DirWatcher::watch_count() const {
    std::lock_guard<std::mutex> lk(watch_mutex_);
    return path_to_wd_.size();
}

bool DirWatcher::start(OnEvent on_event){
    if (running_.load()) return true;
    if (!open_recursive()) return false;

    on_event_ = std::move(on_event);
    stop_flag_.store(false);
    try {
        reader_ = std::thread([this]{ run_loop(); });
    } catch (const std::system_error& e) {
        spdlog::error("can't spawn inotify reader for {}: {}", dir_.string(), e.what());
        close();
        return false;
    }
    running_.store(true);
    spdlog::debug("watching (recursive) {}, {} dirs", dir_.string(), watch_count());
    return true;
}

void DirWatcher::stop(){
    stop_flag_.store(true);
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) reader_.detach();
        else reader_.join();
    }
    close();
    running_.store(false);
}

void DirWatcher::run_loop(){
    alignas(inotify_event) std::array<char, 32 * 1024> buf{};

    while (!stop_flag_.load()) {
        pollfd pfd{inotify_fd_, POLLIN, 0};
        int pr = ::poll(&pfd, 1, 100);
        if (pr < 0) {
            if (errno == EINTR) continue;
            spdlog::error("inotify poll error on {}: {}", dir_.string(), std::strerror(errno));
            break;
        }
        if (pr == 0) continue;

        ssize_t n = ::read(inotify_fd_, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            spdlog::error("inotify read error on {}: {}", dir_.string(), std::strerror(errno));
            break;
        }
        ssize_t off = 0;
        while (off < n && !stop_flag_.load()) {
            auto* ev = reinterpret_cast<inotify_event*>(buf.data() + off);
            off += sizeof(inotify_event) + ev->len;

            if (ev->mask & IN_Q_OVERFLOW) {
                spdlog::warn("inotify queue overflow on {}, events lost", dir_.string());
                continue;
            }
            if (ev->len == 0) continue;
            if (ev->name[0] == '\0') continue;

            std::filesystem::path base = base_for_wd(ev->wd);
            if (base.empty()) {
                spdlog::debug("event for removed watch wd={} dropped", ev->wd);
                continue;
            }
            std::filesystem::path p = base / ev->name;
            bool is_dir = ev->mask & IN_ISDIR;

            if (is_dir && (ev->mask & (IN_CREATE | IN_MOVED_TO))) {
                if (p.filename() != ".git" && add_watch(p)) {
                    add_tree(p);
                    report_existing(p);
                }
            }
            if (is_dir && (ev->mask & (IN_DELETE | IN_MOVED_FROM))) {
                remove_watch(p);
            }

            if (ev->mask & IN_CREATE)      on_event_(FileEvent{EventKind::Create,   p, is_dir});
            if (ev->mask & IN_CLOSE_WRITE) on_event_(FileEvent{EventKind::Modify,   p, is_dir});
            if (ev->mask & IN_MODIFY)      on_event_(FileEvent{EventKind::Modify,   p, is_dir});
            if (ev->mask & IN_DELETE)      on_event_(FileEvent{EventKind::Delete,   p, is_dir});
            if (ev->mask & IN_MOVED_FROM)  on_event_(FileEvent{EventKind::MoveFrom, p, is_dir});
            if (ev->mask & IN_MOVED_TO)    on_event_(FileEvent{EventKind::MoveTo,   p, is_dir});
        }
    }
}

} // namespace commitwatch
