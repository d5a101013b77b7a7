#include <commitwatch/debounce.hpp>
#include <spdlog/spdlog.h>

#include <system_error>

namespace commitwatch {

const char* to_string(ChangeKind k){
    switch (k){
        case ChangeKind::Created:  return "created";
        case ChangeKind::Modified: return "modified";
        case ChangeKind::Deleted:  return "deleted";
    }
    return "unknown";
}

DebounceBuffer::DebounceBuffer(std::chrono::milliseconds quiet, OnFlush on_flush)
: st_(std::make_shared<State>()), quiet_(quiet)
{
    st_->on_flush = std::move(on_flush);
}

DebounceBuffer::~DebounceBuffer(){
    stop();
}

ChangeKind DebounceBuffer::merge(ChangeKind prev, ChangeKind next){
    if (prev == ChangeKind::Created && next == ChangeKind::Modified) return ChangeKind::Created;
    return next;
}

bool DebounceBuffer::start(){
    if (timer_.joinable()) return true;
    {
        std::lock_guard<std::mutex> lk(st_->mu);
        if (st_->stopping) return false;
    }
    try {
        timer_ = std::thread(&DebounceBuffer::run, st_);
    } catch (const std::system_error& e) {
        spdlog::error("can't spawn debounce timer: {}", e.what());
        return false;
    }
    return true;
}

void DebounceBuffer::stop(){
    {
        std::lock_guard<std::mutex> lk(st_->mu);
        st_->stopping = true;
        st_->pending.clear();
        st_->deadline.reset();
        st_->armed_at.reset();
        ++st_->generation;
    }
    st_->cv.notify_all();
    if (timer_.joinable()) {
        if (timer_.get_id() == std::this_thread::get_id()) timer_.detach();
        else timer_.join();
    }
}

void DebounceBuffer::add(const std::string& rel_path, ChangeKind kind){
    {
        std::lock_guard<std::mutex> lk(st_->mu);
        if (st_->stopping) return;
        auto it = st_->pending.find(rel_path);
        if (it == st_->pending.end()) st_->pending.emplace(rel_path, kind);
        else it->second = merge(it->second, kind);

        auto now = Clock::now();
        st_->deadline = now + quiet_;
        if (!st_->armed_at) st_->armed_at = now;
        ++st_->generation;
    }
    st_->cv.notify_all();
}

size_t DebounceBuffer::clear(){
    size_t n = 0;
    {
        std::lock_guard<std::mutex> lk(st_->mu);
        n = st_->pending.size();
        st_->pending.clear();
        st_->deadline.reset();
        st_->armed_at.reset();
        ++st_->generation;
    }
    st_->cv.notify_all();
    return n;
}

bool DebounceBuffer::flush(){
    {
        std::lock_guard<std::mutex> lk(st_->mu);
        if (st_->stopping || st_->pending.empty()) return false;
        st_->deadline = Clock::now();
        ++st_->generation;
    }
    st_->cv.notify_all();
    return true;
}

size_t DebounceBuffer::pending() const {
    std::lock_guard<std::mutex> lk(st_->mu);
    return st_->pending.size();
}

bool DebounceBuffer::armed() const {
    std::lock_guard<std::mutex> lk(st_->mu);
    return st_->deadline.has_value();
}

std::optional<DebounceBuffer::Clock::time_point> DebounceBuffer::armed_at() const {
    std::lock_guard<std::mutex> lk(st_->mu);
    return st_->armed_at;
}

uint64_t DebounceBuffer::generation() const {
    std::lock_guard<std::mutex> lk(st_->mu);
    return st_->generation;
}

void DebounceBuffer::run(std::shared_ptr<State> st){
    std::unique_lock<std::mutex> lk(st->mu);
    while (!st->stopping) {
        if (!st->deadline) {
            st->cv.wait(lk, [&]{ return st->stopping || st->deadline.has_value(); });
            continue;
        }
        const uint64_t gen = st->generation;
        const auto deadline = *st->deadline;
        if (st->cv.wait_until(lk, deadline, [&]{ return st->stopping || st->generation != gen; })) {
            continue;   // re-armed, cleared or stopping
        }

        ChangeSet batch;
        batch.reserve(st->pending.size());
        for (auto& kv : st->pending) batch.push_back(ChangeEntry{kv.first, kv.second});
        st->pending.clear();
        st->deadline.reset();
        st->armed_at.reset();
        if (batch.empty()) continue;

        lk.unlock();
        st->on_flush(std::move(batch));
        lk.lock();
    }
}

} // namespace commitwatch
