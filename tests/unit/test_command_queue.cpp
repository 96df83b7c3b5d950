#include <gtest/gtest.h>
#include "seedkeeper/scheduler/command_queue.hpp"
#include <future>

using namespace seedkeeper::scheduler;
using namespace std::chrono_literals;

TEST(CommandQueueTest, DeliversInOrder) {
    CommandQueue queue;
    
    auto first = queue.submit(Command::of(CommandType::STATUS));
    Command protect = Command::of(CommandType::PROTECT);
    protect.target = "abc";
    auto second = queue.submit(protect);
    EXPECT_EQ(queue.size(), 2u);
    
    CommandQueue::Entry entry;
    ASSERT_TRUE(queue.try_pop(entry));
    EXPECT_EQ(entry.command.type, CommandType::STATUS);
    CommandReply reply;
    reply.message = "done";
    entry.reply.set_value(reply);
    
    ASSERT_TRUE(queue.try_pop(entry));
    EXPECT_EQ(entry.command.type, CommandType::PROTECT);
    EXPECT_EQ(entry.command.target, "abc");
    entry.reply.set_value(CommandReply{});
    
    EXPECT_FALSE(queue.try_pop(entry));
    ASSERT_EQ(first.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(first.get().message, "done");
    EXPECT_TRUE(second.get().ok);
}

TEST(CommandQueueTest, FullQueueRejectsImmediately) {
    CommandQueue queue(2);
    queue.submit(Command::of(CommandType::STATUS));
    queue.submit(Command::of(CommandType::STATUS));
    
    auto rejected = queue.submit(Command::of(CommandType::LIST));
    
    ASSERT_EQ(rejected.wait_for(0ms), std::future_status::ready);
    auto reply = rejected.get();
    EXPECT_FALSE(reply.ok);
    EXPECT_EQ(reply.message, "command queue full");
    EXPECT_EQ(queue.size(), 2u);
}

TEST(CommandQueueTest, CloseRejectsPendingAndFutureCommands) {
    CommandQueue queue;
    auto pending = queue.submit(Command::of(CommandType::SPEED));
    
    queue.close("shutting down");
    
    auto reply = pending.get();
    EXPECT_FALSE(reply.ok);
    EXPECT_EQ(reply.message, "shutting down");
    EXPECT_EQ(queue.size(), 0u);
    
    auto late = queue.submit(Command::of(CommandType::STATUS)).get();
    EXPECT_FALSE(late.ok);
}

TEST(CommandQueueTest, CommandDefaults) {
    auto command = Command::of(CommandType::LOG);
    EXPECT_EQ(command.count, 20u);
    EXPECT_FALSE(command.delete_files.has_value());
    EXPECT_TRUE(command.target.empty());
}

TEST(CommandTypeTest, NamesRoundTrip) {
    for (auto type : {CommandType::STATUS, CommandType::SPEED, CommandType::LIST,
                      CommandType::START_CONTROLLER, CommandType::STOP_CONTROLLER,
                      CommandType::START_CLEANUP, CommandType::STOP_CLEANUP,
                      CommandType::RELOAD, CommandType::PROTECT, CommandType::UNPROTECT,
                      CommandType::DELETE, CommandType::LOG}) {
        EXPECT_EQ(parse_command_type(to_string(type)), type);
    }
    EXPECT_EQ(parse_command_type("STATUS"), CommandType::STATUS);
    EXPECT_FALSE(parse_command_type("reboot").has_value());
}
