#include "seedkeeper/scheduler/periodic_task.hpp"
#include "seedkeeper/core/logger.hpp"
#include <algorithm>

namespace seedkeeper::scheduler {

PeriodicTask::PeriodicTask(boost::asio::io_context& io_context,
                           std::string name,
                           std::chrono::milliseconds interval,
                           Callback callback)
    : strand_(boost::asio::make_strand(io_context))
    , timer_(strand_)
    , name_(std::move(name))
    , interval_ms_(std::max<int64_t>(1, interval.count()))
    , callback_(std::move(callback)) {
}

void PeriodicTask::start() {
    if (running_.exchange(true)) {
        return;
    }
    
    boost::asio::post(strand_, [self = shared_from_this()] {
        self->next_deadline_ = Clock::now();
        self->schedule();
    });
    LOG_DEBUG("Task '{}' started, every {} ms", name_, interval_ms_.load());
}

void PeriodicTask::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    boost::asio::post(strand_, [self = shared_from_this()] {
        self->timer_.cancel();
    });
    LOG_DEBUG("Task '{}' stopped after {} runs ({} skipped)", name_, runs_.load(), skipped_.load());
}

bool PeriodicTask::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return !in_run_; });
}

void PeriodicTask::set_interval(std::chrono::milliseconds interval) {
    interval_ms_ = std::max<int64_t>(1, interval.count());
}

std::chrono::milliseconds PeriodicTask::interval() const {
    return std::chrono::milliseconds(interval_ms_.load());
}

void PeriodicTask::schedule() {
    if (!running_) {
        return;
    }
    
    timer_.expires_at(next_deadline_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        self->on_timer(ec);
    });
}

void PeriodicTask::on_timer(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || !running_) {
        return;
    }
    
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        in_run_ = true;
    }
    
    try {
        callback_();
    } catch (const std::exception& e) {
        LOG_ERROR("Task '{}' failed: {}", name_, e.what());
    }
    runs_++;
    
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        in_run_ = false;
    }
    idle_cv_.notify_all();
    
    auto interval = std::chrono::milliseconds(interval_ms_.load());
    auto now = Clock::now();
    next_deadline_ += interval;
    if (next_deadline_ <= now) {
        auto missed = (now - next_deadline_) / interval + 1;
        next_deadline_ += interval * missed;
        skipped_ += static_cast<uint64_t>(missed);
        LOG_DEBUG("Task '{}' overran, skipped {} run(s)", name_, missed);
    }
    schedule();
}

} // namespace seedkeeper::scheduler
