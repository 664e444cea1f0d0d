#include "fts/core/scheduler.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <exception>
#include <optional>
#include <thread>

namespace fts {

struct AsioScheduler::Impl {
    boost::asio::io_context io;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work;
    std::thread worker;
    std::atomic<bool> running{false};
};

AsioScheduler::AsioScheduler() : impl_(std::make_unique<Impl>()) {}

AsioScheduler::~AsioScheduler() {
    stop();
}

void AsioScheduler::start() {
    if (impl_->running.exchange(true)) {
        return;
    }
    if (impl_->io.stopped()) {
        impl_->io.restart();
    }
    impl_->work.emplace(boost::asio::make_work_guard(impl_->io));
    impl_->worker = std::thread([this]() {
        spdlog::debug("Scheduler worker started");
        impl_->io.run();
        spdlog::debug("Scheduler worker stopped");
    });
}

void AsioScheduler::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    impl_->work.reset();
    impl_->io.stop();
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

bool AsioScheduler::running() const noexcept {
    return impl_->running.load();
}

void AsioScheduler::schedule_after(Duration delay, Task task) {
    auto timer = std::make_shared<boost::asio::steady_timer>(impl_->io, delay);
    timer->async_wait([timer, task = std::move(task)](const boost::system::error_code& ec) {
        if (ec) {
            spdlog::debug("Scheduled task cancelled: {}", ec.message());
            return;
        }
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Scheduled task threw exception: {}", e.what());
        }
    });
}

} // namespace fts
