#include "fts/core/scheduler.hpp"

#include <algorithm>

namespace fts {

ManualScheduler::ManualScheduler(Timestamp start) : now_(start) {}

Timestamp ManualScheduler::now() const {
    std::lock_guard lock(mutex_);
    return now_;
}

void ManualScheduler::schedule_after(Duration delay, Task task) {
    std::lock_guard lock(mutex_);
    if (delay.count() < 0) {
        delay = Duration::zero();
    }
    entries_.push_back(Entry{now_ + delay, next_seq_++, std::move(task)});
}

bool ManualScheduler::pop_due(Timestamp limit, Entry& out) {
    std::lock_guard lock(mutex_);
    auto earliest = std::min_element(entries_.begin(), entries_.end(),
        [](const Entry& a, const Entry& b) {
            return a.due != b.due ? a.due < b.due : a.seq < b.seq;
        });
    if (earliest == entries_.end() || earliest->due > limit) {
        return false;
    }
    out = std::move(*earliest);
    entries_.erase(earliest);
    if (out.due > now_) {
        now_ = out.due;
    }
    return true;
}

std::size_t ManualScheduler::advance(Duration delta) {
    Timestamp target;
    {
        std::lock_guard lock(mutex_);
        target = now_ + delta;
    }

    std::size_t executed = 0;
    Entry entry;
    // Tasks run without the lock held so they can schedule follow-ups.
    while (pop_due(target, entry)) {
        entry.task();
        ++executed;
    }

    std::lock_guard lock(mutex_);
    if (now_ < target) {
        now_ = target;
    }
    return executed;
}

std::size_t ManualScheduler::run_due() {
    return advance(Duration::zero());
}

std::size_t ManualScheduler::pending_tasks() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool ManualScheduler::next_due_in(Duration& out) const {
    std::lock_guard lock(mutex_);
    if (entries_.empty()) {
        return false;
    }
    auto earliest = std::min_element(entries_.begin(), entries_.end(),
        [](const Entry& a, const Entry& b) { return a.due < b.due; });
    out = std::chrono::duration_cast<Duration>(earliest->due - now_);
    return true;
}

} // namespace fts
