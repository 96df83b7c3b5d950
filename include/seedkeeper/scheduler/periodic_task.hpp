#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace seedkeeper::scheduler {

// Runs a callback on a fixed interval grid, serialized on its own strand.
// A run that overruns one or more deadlines skips them and the next run
// lands on the following grid point; missed runs never queue up.
class PeriodicTask : public std::enable_shared_from_this<PeriodicTask> {
public:
    using Callback = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    
    PeriodicTask(boost::asio::io_context& io_context,
                 std::string name,
                 std::chrono::milliseconds interval,
                 Callback callback);
    
    void start();
    // No new runs are scheduled; a run in progress completes.
    void stop();
    bool wait_idle(std::chrono::milliseconds timeout);
    
    void set_interval(std::chrono::milliseconds interval);
    std::chrono::milliseconds interval() const;
    
    const std::string& name() const { return name_; }
    bool running() const { return running_.load(); }
    uint64_t runs() const { return runs_.load(); }
    uint64_t skipped() const { return skipped_.load(); }

private:
    void schedule();
    void on_timer(const boost::system::error_code& ec);
    
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    std::string name_;
    std::atomic<int64_t> interval_ms_;
    Callback callback_;
    
    Clock::time_point next_deadline_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runs_{0};
    std::atomic<uint64_t> skipped_{0};
    
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    bool in_run_ = false;
};

} // namespace seedkeeper::scheduler
