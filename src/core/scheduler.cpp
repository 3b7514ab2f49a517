// Brickfall Core
// scheduler.cpp - Deferred scheduler implementation

#include <algorithm>
#include <brickfall/core/scheduler.hpp>
#include <map>
#include <utility>

namespace brickfall::core {

struct DeferredScheduler::Impl {
    struct Entry {
        ScheduleHandle handle;
        ScheduledCallback callback;
    };

    // Keyed by (due time, handle) so equal due times keep schedule order
    using Key = std::pair<double, ScheduleHandle>;

    std::map<Key, Entry> queue;
    std::map<ScheduleHandle, Key> index;
    ScheduleHandle next_handle = 1;
    double now = 0.0;

    // Pop and run the earliest callback due at or before limit
    bool fire_next(double limit) {
        if (queue.empty()) {
            return false;
        }
        auto it = queue.begin();
        if (it->first.first > limit) {
            return false;
        }

        // Clock never runs backwards, even for callbacks scheduled in the past
        now = std::max(now, it->first.first);
        Entry entry = std::move(it->second);
        index.erase(entry.handle);
        queue.erase(it);

        if (entry.callback) {
            entry.callback();
        }
        return true;
    }
};

DeferredScheduler::DeferredScheduler() : impl_(std::make_unique<Impl>()) {}

DeferredScheduler::~DeferredScheduler() = default;

ScheduleHandle DeferredScheduler::schedule(ScheduledCallback callback, double delay_ms) {
    const ScheduleHandle handle = impl_->next_handle++;
    const Impl::Key key{impl_->now + std::max(delay_ms, 0.0), handle};
    impl_->queue.emplace(key, Impl::Entry{handle, std::move(callback)});
    impl_->index.emplace(handle, key);
    return handle;
}

bool DeferredScheduler::cancel(ScheduleHandle handle) {
    auto it = impl_->index.find(handle);
    if (it == impl_->index.end()) {
        return false;
    }
    impl_->queue.erase(it->second);
    impl_->index.erase(it);
    return true;
}

size_t DeferredScheduler::advance_to(double now_ms) {
    size_t fired = 0;
    while (impl_->fire_next(now_ms)) {
        ++fired;
    }
    impl_->now = std::max(impl_->now, now_ms);
    return fired;
}

size_t DeferredScheduler::advance_by(double delta_ms) {
    return advance_to(impl_->now + std::max(delta_ms, 0.0));
}

size_t DeferredScheduler::run_all() {
    size_t fired = 0;
    while (!impl_->queue.empty()) {
        if (impl_->fire_next(impl_->queue.begin()->first.first)) {
            ++fired;
        }
    }
    return fired;
}

double DeferredScheduler::now() const {
    return impl_->now;
}

size_t DeferredScheduler::pending_count() const {
    return impl_->queue.size();
}

bool DeferredScheduler::is_pending(ScheduleHandle handle) const {
    return impl_->index.count(handle) != 0;
}

double DeferredScheduler::next_due_time() const {
    if (impl_->queue.empty()) {
        return -1.0;
    }
    return impl_->queue.begin()->first.first;
}

void DeferredScheduler::cancel_all() {
    impl_->queue.clear();
    impl_->index.clear();
}

}  // namespace brickfall::core
