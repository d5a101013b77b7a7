#include <commitwatch/registry.hpp>
#include <spdlog/spdlog.h>

#include <cmath>

namespace commitwatch {

// A year; keeps the millisecond conversion in range.
static constexpr double kMaxDebounceSeconds = 366.0 * 24 * 3600;

const char* to_string(TriggerKind k){
    switch (k){
        case TriggerKind::FileChange: return "file_change";
        case TriggerKind::Schedule:   return "schedule";
    }
    return "unknown";
}

TriggerRegistry::~TriggerRegistry(){
    clear_all();
}

bool TriggerRegistry::remove_locked(const std::string& id){
    auto it = triggers_.find(id);
    if (it == triggers_.end()) return false;
    auto& rec = it->second;
    if (rec.watcher) rec.watcher->stop();
    if (rec.schedule) rec.schedule->stop();
    triggers_.erase(it);
    return true;
}

bool TriggerRegistry::add_file_trigger(const std::string& id,
                                       const std::filesystem::path& repo_path,
                                       CommitCallback callback,
                                       std::vector<std::string> ignore_patterns,
                                       double debounce_seconds)
{
    if (id.empty()) {
        spdlog::error("add_file_trigger: empty trigger id");
        return false;
    }
    if (!callback) {
        spdlog::error("[{}] add_file_trigger: no callback", id);
        return false;
    }
    if (!std::isfinite(debounce_seconds) || debounce_seconds < 0 || debounce_seconds > kMaxDebounceSeconds) {
        spdlog::error("[{}] add_file_trigger: invalid debounce {}s", id, debounce_seconds);
        return false;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    if (triggers_.count(id)) {
        spdlog::warn("[{}] trigger already exists, replacing", id);
        remove_locked(id);
    }

    auto debounce = std::chrono::milliseconds(std::llround(debounce_seconds * 1000.0));
    auto watcher = std::make_unique<FileWatcher>(id, repo_path, std::move(ignore_patterns), callback, debounce);
    if (!watcher->start()) {
        spdlog::error("[{}] file trigger not added: watcher failed to start on {}", id, repo_path.string());
        return false;
    }

    Record rec;
    rec.id = id;
    rec.kind = TriggerKind::FileChange;
    rec.repo_path = repo_path;
    rec.callback = std::move(callback);
    rec.watcher = std::move(watcher);
    rec.created_at = std::chrono::system_clock::now();
    triggers_.emplace(id, std::move(rec));
    spdlog::info("[{}] file trigger added for {}", id, repo_path.string());
    return true;
}

bool TriggerRegistry::add_schedule_trigger(const std::string& id,
                                           const std::filesystem::path& repo_path,
                                           const ScheduleSpec& spec,
                                           CommitCallback callback)
{
    if (id.empty()) {
        spdlog::error("add_schedule_trigger: empty trigger id");
        return false;
    }
    if (!callback) {
        spdlog::error("[{}] add_schedule_trigger: no callback", id);
        return false;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    if (triggers_.count(id)) {
        spdlog::warn("[{}] trigger already exists, replacing", id);
        remove_locked(id);
    }

    auto sched = std::make_unique<ScheduleTrigger>(id, repo_path, spec, callback);
    if (!sched->start()) {
        spdlog::error("[{}] schedule trigger not added", id);
        return false;
    }

    Record rec;
    rec.id = id;
    rec.kind = TriggerKind::Schedule;
    rec.repo_path = repo_path;
    rec.callback = std::move(callback);
    rec.schedule = std::move(sched);
    rec.created_at = std::chrono::system_clock::now();
    triggers_.emplace(id, std::move(rec));
    spdlog::info("[{}] schedule trigger added for {} ({})", id, repo_path.string(), spec.describe());
    return true;
}

bool TriggerRegistry::remove_trigger(const std::string& id){
    std::lock_guard<std::mutex> lk(mutex_);
    if (!remove_locked(id)) {
        spdlog::warn("[{}] remove: no such trigger", id);
        return false;
    }
    spdlog::info("[{}] trigger removed", id);
    return true;
}

bool TriggerRegistry::start(){
    std::lock_guard<std::mutex> lk(mutex_);
    if (running_) return true;

    size_t failed = 0;
    for (auto& kv : triggers_) {
        auto& rec = kv.second;
        if (rec.watcher && !rec.watcher->monitoring()) {
            if (!rec.watcher->start()) ++failed;
        }
        if (rec.schedule && !rec.schedule->running()) {
            if (!rec.schedule->start()) ++failed;
        }
    }
    running_ = true;
    if (failed) spdlog::warn("trigger registry started, {} of {} triggers failed to start", failed, triggers_.size());
    else spdlog::info("trigger registry started ({} triggers)", triggers_.size());
    return true;
}

bool TriggerRegistry::stop(){
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& kv : triggers_) {
        auto& rec = kv.second;
        if (rec.watcher) rec.watcher->stop();
        if (rec.schedule) rec.schedule->stop();
    }
    if (running_) spdlog::info("trigger registry stopped");
    running_ = false;
    return true;
}

bool TriggerRegistry::pause_trigger(const std::string& id){
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = triggers_.find(id);
    if (it == triggers_.end() || !it->second.watcher) {
        spdlog::warn("[{}] pause: no such file trigger", id);
        return false;
    }
    it->second.watcher->pause();
    return true;
}

bool TriggerRegistry::resume_trigger(const std::string& id){
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = triggers_.find(id);
    if (it == triggers_.end() || !it->second.watcher) {
        spdlog::warn("[{}] resume: no such file trigger", id);
        return false;
    }
    it->second.watcher->resume();
    return true;
}

bool TriggerRegistry::flush_trigger(const std::string& id){
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = triggers_.find(id);
    if (it == triggers_.end() || !it->second.watcher) return false;
    return it->second.watcher->flush();
}

bool TriggerRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return triggers_.count(id) != 0;
}

std::vector<TriggerInfo> TriggerRegistry::list_triggers() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<TriggerInfo> out;
    out.reserve(triggers_.size());
    for (const auto& kv : triggers_) {
        const auto& rec = kv.second;
        TriggerInfo info;
        info.id = rec.id;
        info.kind = rec.kind;
        info.repo_path = rec.repo_path;
        info.created_at = rec.created_at;
        if (rec.watcher) info.watcher = rec.watcher->status();
        if (rec.schedule) {
            info.schedule_running = rec.schedule->running();
            info.next_run = rec.schedule->next_run();
            info.run_count = rec.schedule->run_count();
        }
        out.push_back(std::move(info));
    }
    return out;
}

RegistryStatus TriggerRegistry::status() const {
    std::lock_guard<std::mutex> lk(mutex_);
    RegistryStatus st;
    st.running = running_;
    st.total_triggers = triggers_.size();
    for (const auto& kv : triggers_) {
        const auto& rec = kv.second;
        if (rec.watcher) {
            ++st.file_triggers;
            if (rec.watcher->monitoring()) ++st.active_watchers;
        }
        if (rec.schedule) ++st.schedule_triggers;
    }
    return st;
}

void TriggerRegistry::clear_all(){
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& kv : triggers_) {
        auto& rec = kv.second;
        if (rec.watcher) rec.watcher->stop();
        if (rec.schedule) rec.schedule->stop();
    }
    size_t n = triggers_.size();
    triggers_.clear();
    if (n) spdlog::info("cleared {} triggers", n);
}

} // namespace commitwatch
