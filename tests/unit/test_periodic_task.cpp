#include <gtest/gtest.h>
#include "seedkeeper/scheduler/periodic_task.hpp"
#include <atomic>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace seedkeeper::scheduler;
using namespace std::chrono_literals;

class PeriodicTaskTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_.emplace(boost::asio::make_work_guard(io_context_));
        for (int i = 0; i < 2; ++i) {
            threads_.emplace_back([this] { io_context_.run(); });
        }
    }
    
    void TearDown() override {
        for (auto& task : tasks_) {
            task->stop();
            task->wait_idle(2s);
        }
        work_.reset();
        io_context_.stop();
        for (auto& t : threads_) {
            t.join();
        }
    }
    
    std::shared_ptr<PeriodicTask> make_task(std::chrono::milliseconds interval, PeriodicTask::Callback callback) {
        auto task = std::make_shared<PeriodicTask>(io_context_, "test", interval, std::move(callback));
        tasks_.push_back(task);
        return task;
    }
    
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::vector<std::thread> threads_;
    std::vector<std::shared_ptr<PeriodicTask>> tasks_;
};

TEST_F(PeriodicTaskTest, RunsImmediatelyThenOnInterval) {
    std::atomic<int> calls{0};
    auto task = make_task(20ms, [&] { calls++; });
    
    task->start();
    std::this_thread::sleep_for(150ms);
    
    EXPECT_TRUE(task->running());
    EXPECT_GE(calls.load(), 3);
    EXPECT_EQ(task->runs(), static_cast<uint64_t>(calls.load()));
}

TEST_F(PeriodicTaskTest, StopHaltsFurtherRuns) {
    std::atomic<int> calls{0};
    auto task = make_task(10ms, [&] { calls++; });
    
    task->start();
    std::this_thread::sleep_for(50ms);
    task->stop();
    ASSERT_TRUE(task->wait_idle(1s));
    std::this_thread::sleep_for(20ms);
    
    int stopped_at = calls.load();
    std::this_thread::sleep_for(100ms);
    
    EXPECT_FALSE(task->running());
    EXPECT_EQ(calls.load(), stopped_at);
}

TEST_F(PeriodicTaskTest, OverrunSkipsMissedDeadlines) {
    std::atomic<int> calls{0};
    auto task = make_task(20ms, [&] {
        calls++;
        std::this_thread::sleep_for(50ms);
    });
    
    task->start();
    std::this_thread::sleep_for(320ms);
    task->stop();
    task->wait_idle(1s);
    
    // Runs never pile up: at most one per elapsed run duration.
    EXPECT_LE(calls.load(), 8);
    EXPECT_GE(calls.load(), 3);
    EXPECT_GT(task->skipped(), 0u);
}

TEST_F(PeriodicTaskTest, RunsNeverOverlap) {
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
    auto task = make_task(1ms, [&] {
        int now = ++active;
        int seen = max_active.load();
        while (now > seen && !max_active.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(3ms);
        --active;
    });
    
    task->start();
    std::this_thread::sleep_for(100ms);
    
    EXPECT_EQ(max_active.load(), 1);
}

TEST_F(PeriodicTaskTest, ExceptionDoesNotStopTask) {
    std::atomic<int> calls{0};
    auto task = make_task(10ms, [&] {
        calls++;
        throw std::runtime_error("tick failed");
    });
    
    task->start();
    std::this_thread::sleep_for(100ms);
    
    EXPECT_GE(calls.load(), 2);
    EXPECT_TRUE(task->running());
}

TEST_F(PeriodicTaskTest, IntervalCanChange) {
    auto task = make_task(1000ms, [] {});
    EXPECT_EQ(task->interval(), 1000ms);
    EXPECT_EQ(task->name(), "test");
    
    task->set_interval(250ms);
    EXPECT_EQ(task->interval(), 250ms);
    
    task->set_interval(0ms);
    EXPECT_EQ(task->interval(), 1ms);
}

TEST_F(PeriodicTaskTest, StartIsIdempotent) {
    std::atomic<int> calls{0};
    auto task = make_task(1000ms, [&] { calls++; });
    
    task->start();
    task->start();
    std::this_thread::sleep_for(100ms);
    
    EXPECT_EQ(calls.load(), 1);
}
