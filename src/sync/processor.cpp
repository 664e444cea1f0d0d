#include "fts/sync/processor.hpp"

#include "fts/events/events.hpp"

#include <spdlog/spdlog.h>

namespace fts::sync {

SyncProcessor::SyncProcessor(queue::ActionQueue& queue,
                             RemoteEndpoint& remote,
                             ConnectivityGate& gate,
                             Scheduler& scheduler,
                             events::EventBus& bus,
                             bool drain_on_reconnect)
    : queue_(queue),
      remote_(remote),
      gate_(gate),
      scheduler_(scheduler),
      bus_(bus),
      drain_on_reconnect_(drain_on_reconnect),
      self_(new SyncProcessor*(this), [this](SyncProcessor** box) {
          delete box;
          std::lock_guard lock(release_mutex_);
          released_ = true;
          release_cv_.notify_all();
      }) {
    connectivity_subscription_ = bus_.subscribe<events::ConnectivityChangedEvent>(
        [this](const events::ConnectivityChangedEvent& e) {
            if (e.reachable && drain_on_reconnect_) {
                trigger(false);
            }
        });
}

SyncProcessor::~SyncProcessor() {
    bus_.unsubscribe<events::ConnectivityChangedEvent>(connectivity_subscription_);

    self_.reset();
    std::unique_lock lock(release_mutex_);
    release_cv_.wait(lock, [this] { return released_; });
}

void SyncProcessor::trigger(bool manual) {
    std::weak_ptr<SyncProcessor*> weak = self_;
    scheduler_.schedule_after(Scheduler::Duration{0}, [weak, manual] {
        if (auto self = weak.lock()) {
            (*self)->drain(manual);
        }
    });
}

bool SyncProcessor::backoff_pending() const {
    std::lock_guard lock(mutex_);
    return backoff_armed_;
}

DrainReport SyncProcessor::drain(bool manual) {
    {
        std::lock_guard lock(mutex_);
        if (backoff_armed_) {
            spdlog::debug("Drain skipped: waiting for backoff timer");
            DrainReport report;
            report.skipped = true;
            report.backoff_pending = true;
            return report;
        }
        if (draining_) {
            rerun_requested_ = true;
            rerun_manual_ = rerun_manual_ || manual;
            DrainReport report;
            report.skipped = true;
            return report;
        }
        draining_ = true;
    }

    DrainReport total;
    while (true) {
        DrainReport pass = run_pass(manual);
        total.submitted += pass.submitted;
        total.acknowledged += pass.acknowledged;
        total.failed += pass.failed;
        total.remaining = pass.remaining;
        total.backoff_pending = pass.backoff_pending;

        std::lock_guard lock(mutex_);
        if (!rerun_requested_ || backoff_armed_) {
            rerun_requested_ = false;
            rerun_manual_ = false;
            draining_ = false;
            break;
        }
        manual = rerun_manual_;
        rerun_requested_ = false;
        rerun_manual_ = false;
    }
    return total;
}

DrainReport SyncProcessor::run_pass(bool manual) {
    DrainReport report;
    const Timestamp started = scheduler_.now();

    while (true) {
        if (!manual && !gate_.is_reachable()) {
            spdlog::debug("Drain paused: remote unreachable");
            break;
        }

        auto next = queue_.next_eligible();
        if (next.is_error()) {
            spdlog::error("Drain stopped, cannot read queue: {}", next.error().message);
            break;
        }
        if (!next.value()) {
            break;
        }

        auto flight = queue_.mark_in_flight(next.value()->id);
        if (flight.is_error()) {
            spdlog::error("Drain stopped, cannot mark {} in flight: {}", next.value()->id, flight.error().message);
            break;
        }
        const model::QueueItem& item = flight.value();
        ++report.submitted;

        spdlog::debug("Submitting {} {} for session {} (attempt {})",
                      model::to_string(item.operation), item.id, item.payload.session_id, item.retry_count + 1);

        auto response = remote_.submit(item.operation, item.payload, item.id);

        Error failure;
        if (response.is_ok()) {
            auto acked = queue_.ack_success(item.id, response.value());
            if (acked.is_ok()) {
                ++report.acknowledged;
                continue;
            }
            if (acked.error().code != ErrorCode::PermanentSync) {
                spdlog::error("Could not record acknowledgement of {}: {}", item.id, acked.error().message);
                release_in_flight();
                break;
            }
            failure = acked.error();
        } else {
            failure = response.error();
            if (!failure.is_sync_error()) {
                // Anything the endpoint could not classify is a rejection.
                failure = Error::permanent(failure.message);
            }
        }

        auto outcome = queue_.mark_failed(item.id, failure);
        if (outcome.is_error()) {
            spdlog::error("Could not record failure of {}: {}", item.id, outcome.error().message);
            release_in_flight();
            break;
        }

        if (outcome.value().status == model::QueueStatus::Pending) {
            const auto delay = *outcome.value().retry_delay;
            bus_.emit(events::RetryScheduledEvent{item.id, outcome.value().retry_count, delay, failure.message});
            arm_backoff(delay, manual);
            report.backoff_pending = true;
            break;
        }

        ++report.failed;
    }

    auto remaining = queue_.pending_count();
    if (remaining.is_ok()) {
        report.remaining = remaining.value();
    } else {
        spdlog::warn("Could not read pending count: {}", remaining.error().message);
    }

    events::DrainCompletedEvent done;
    done.submitted = report.submitted;
    done.acknowledged = report.acknowledged;
    done.failed = report.failed;
    done.remaining = report.remaining;
    done.backoff_pending = report.backoff_pending;
    done.duration = std::chrono::duration_cast<std::chrono::milliseconds>(scheduler_.now() - started);
    bus_.emit(done);
    return report;
}

void SyncProcessor::arm_backoff(std::chrono::milliseconds delay, bool manual) {
    {
        std::lock_guard lock(mutex_);
        backoff_armed_ = true;
    }

    std::weak_ptr<SyncProcessor*> weak = self_;
    scheduler_.schedule_after(delay, [weak, manual] {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        SyncProcessor* processor = *self;
        {
            std::lock_guard lock(processor->mutex_);
            processor->backoff_armed_ = false;
        }
        processor->drain(manual);
    });
}

void SyncProcessor::release_in_flight() {
    auto released = queue_.recover();
    if (released.is_error()) {
        spdlog::error("Item left in flight until restart: {}", released.error().message);
    }
}

} // namespace fts::sync
