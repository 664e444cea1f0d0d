#pragma once

#include "fts/core/time.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace fts {

/**
 * @brief Source of "now" for capture times and retention checks
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class WallClock final : public Clock {
public:
    Timestamp now() const override { return SystemClock::now(); }
};

/**
 * @brief Deferred task execution used for drains and retry backoff
 *
 * Implementations run tasks one at a time; two tasks never overlap.
 */
class Scheduler : public Clock {
public:
    using Task = std::function<void()>;
    using Duration = std::chrono::milliseconds;

    virtual void schedule_after(Duration delay, Task task) = 0;
};

/**
 * @brief Scheduler driven by explicit time advancement
 *
 * Nothing runs until advance() or run_due() is called. Tasks due at the same
 * instant run in the order they were scheduled. Lets tests assert a 2s/4s/8s
 * backoff without sleeping.
 */
class ManualScheduler final : public Scheduler {
public:
    explicit ManualScheduler(Timestamp start = from_unix_millis(1'700'000'000'000));

    Timestamp now() const override;
    void schedule_after(Duration delay, Task task) override;

    /**
     * @brief Move time forward, running every task that comes due on the way
     * @return number of tasks executed
     */
    std::size_t advance(Duration delta);

    /**
     * @brief Run tasks already due at the current instant
     */
    std::size_t run_due();

    std::size_t pending_tasks() const;

    /**
     * @brief Delay until the earliest queued task, if any
     */
    bool next_due_in(Duration& out) const;

private:
    struct Entry {
        Timestamp due;
        std::uint64_t seq;
        Task task;
    };

    bool pop_due(Timestamp limit, Entry& out);

    mutable std::mutex mutex_;
    Timestamp now_;
    std::uint64_t next_seq_ = 0;
    std::vector<Entry> entries_;
};

/**
 * @brief Production scheduler: boost::asio io_context on one worker thread
 *
 * A single thread means every drain and backoff callback is serialized.
 */
class AsioScheduler final : public Scheduler {
public:
    AsioScheduler();
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&) = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    void start();
    void stop();
    bool running() const noexcept;

    Timestamp now() const override { return SystemClock::now(); }
    void schedule_after(Duration delay, Task task) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fts
