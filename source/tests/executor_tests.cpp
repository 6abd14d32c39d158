#include <array>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

#include <taskq/descriptor/handle.hpp>
#include <taskq/executor.hpp>
#include <taskq/future.hpp>
#include <taskq/task.hpp>

namespace
{
    using namespace std::chrono_literals;

    taskq::task<int> answer()
    {
        co_return 42;
    }

    taskq::task<void> add_answer(int& out)
    {
        out += co_await answer();
    }

    taskq::task<void> answer_as_void()
    {
        co_await answer();
    }

    taskq::task<void> sleep_then_push(taskq::executor& exec, const taskq::milliseconds delay, std::vector<int>& out, int value)
    {
        co_await exec.sleep_for(delay);
        out.push_back(value);
    }

    taskq::task<void> yield_twice(taskq::executor& exec, std::vector<std::string>& out, std::string name)
    {
        out.push_back(name + "1");
        co_await exec.yield();
        out.push_back(name + "2");
        co_await exec.yield();
        out.push_back(name + "3");
    }

    taskq::task<void> fail_after_yield(taskq::executor& exec)
    {
        co_await exec.yield();
        throw std::runtime_error("late failure");
    }

    taskq::task<void> read_once(taskq::executor& exec, const taskq::descriptor::handle& source, std::string& out)
    {
        co_await exec.wait_io(source.get(), taskq::event_type::read);

        std::array<char, 32> buffer {};
        const auto result = source.read_some(buffer);
        if (!result)
            throw std::system_error(result.error(), "read failed");

        out.assign(buffer.data(), *result);
    }
}

TEST(Executor, DeferredCallbacksRunInOrder)
{
    taskq::executor exec;
    std::vector<int> order;

    exec.defer([&order]() { order.push_back(1); });
    exec.defer([&order, &exec]() {
        order.push_back(2);
        exec.defer([&order]() { order.push_back(4); });
    });
    exec.defer([&order]() { order.push_back(3); });

    EXPECT_TRUE(exec.has_work());
    exec.run();

    const std::vector<int> expected {1, 2, 3, 4};
    EXPECT_EQ(order, expected);
    EXPECT_FALSE(exec.has_work());
    EXPECT_EQ(exec.get_stats().total_callbacks, 4u);
}

TEST(Executor, TimersFireByDeadline)
{
    taskq::executor exec;
    std::vector<int> order;

    exec.add_timer(20ms, [&order]() { order.push_back(3); });
    exec.add_timer(5ms, [&order]() { order.push_back(1); });
    exec.add_timer(10ms, [&order]() { order.push_back(2); });
    EXPECT_EQ(exec.pending_timers(), 3u);

    const auto start = taskq::clock_type::now();
    exec.run();

    const std::vector<int> expected {1, 2, 3};
    EXPECT_EQ(order, expected);
    EXPECT_GE(taskq::clock_type::now() - start, 20ms);
    EXPECT_EQ(exec.get_stats().total_timers_fired, 3u);
}

TEST(Executor, TimersWithEqualDeadlinesKeepArmingOrder)
{
    taskq::executor exec;
    std::vector<int> order;

    for (int i = 0; i < 5; ++i)
        exec.add_timer(0ms, [&order, i]() { order.push_back(i); });

    exec.run();

    const std::vector<int> expected {0, 1, 2, 3, 4};
    EXPECT_EQ(order, expected);
}

TEST(Executor, CancelledTimerDoesNotFire)
{
    taskq::executor exec;
    bool fired = false;

    const auto id = exec.add_timer(5ms, [&fired]() { fired = true; });
    EXPECT_TRUE(exec.cancel_timer(id));
    EXPECT_FALSE(exec.cancel_timer(id));
    EXPECT_FALSE(exec.has_work());

    exec.run();
    EXPECT_FALSE(fired);
    EXPECT_EQ(exec.get_stats().total_timers_cancelled, 1u);
}

TEST(Executor, FiredTimerCannotBeCancelled)
{
    taskq::executor exec;
    const auto id = exec.add_timer(0ms, []() {});
    exec.run();

    EXPECT_FALSE(exec.cancel_timer(id));
}

TEST(Executor, SpawnRunsUntilFirstSuspension)
{
    taskq::executor exec;
    int value = 0;

    exec.spawn(add_answer(value));
    EXPECT_EQ(value, 42);
    EXPECT_EQ(exec.get_stats().total_tasks_completed, 1u);
}

TEST(Executor, SleepingTasksResumeInDeadlineOrder)
{
    taskq::executor exec;
    std::vector<int> order;

    exec.spawn(sleep_then_push(exec, 15ms, order, 2));
    exec.spawn(sleep_then_push(exec, 5ms, order, 1));
    EXPECT_TRUE(order.empty());

    exec.run();

    const std::vector<int> expected {1, 2};
    EXPECT_EQ(order, expected);
}

TEST(Executor, YieldInterleavesTasks)
{
    taskq::executor exec;
    std::vector<std::string> order;

    exec.spawn(yield_twice(exec, order, "a"));
    exec.spawn(yield_twice(exec, order, "b"));
    exec.run();

    const std::vector<std::string> expected {"a1", "b1", "a2", "b2", "a3", "b3"};
    EXPECT_EQ(order, expected);
}

TEST(Executor, CompletionHandlerReceivesOutcome)
{
    taskq::executor exec;
    std::exception_ptr failure;
    int calls = 0;

    exec.spawn(fail_after_yield(exec), [&failure, &calls](std::exception_ptr error) {
        failure = error;
        ++calls;
    });
    EXPECT_EQ(calls, 0);

    exec.run();
    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(failure);
    EXPECT_THROW(std::rethrow_exception(failure), std::runtime_error);
}

TEST(Executor, UnobservedTaskFailureIsContained)
{
    taskq::executor exec;
    exec.spawn(fail_after_yield(exec));
    EXPECT_NO_THROW(exec.run());
}

TEST(Executor, ThrowingCallbackDoesNotStopLoop)
{
    taskq::executor exec;
    bool reached = false;

    exec.defer([]() { throw std::runtime_error("callback failure"); });
    exec.defer([&reached]() { reached = true; });

    EXPECT_NO_THROW(exec.run());
    EXPECT_TRUE(reached);
    EXPECT_EQ(exec.get_stats().error_count, 1u);
}

TEST(Executor, NonStandardExceptionsAreContained)
{
    taskq::executor exec;
    bool reached = false;

    exec.defer([]() { throw 7; });
    exec.add_timer(0ms, []() { throw std::string("timer failure"); });
    exec.spawn(answer_as_void(), [](std::exception_ptr) { throw "handler failure"; });
    exec.defer([&reached]() { reached = true; });

    EXPECT_NO_THROW(exec.run());
    EXPECT_TRUE(reached);
    EXPECT_EQ(exec.get_stats().error_count, 3u);
}

TEST(Executor, WaitIoResumesOnReadiness)
{
    taskq::executor exec;

    auto pipe = taskq::descriptor::open_pipe();
    ASSERT_TRUE(pipe.has_value()) << pipe.error().message();
    ASSERT_TRUE(exec.register_fd(pipe->read_end.get()).has_value());

    std::string received;
    exec.spawn(read_once(exec, pipe->read_end, received));
    EXPECT_TRUE(exec.has_work());

    exec.add_timer(5ms, [&pipe]() {
        static constexpr std::string_view message = "ping";
        const auto written = pipe->write_end.write_some(message);
        if (!written)
            throw std::system_error(written.error(), "write failed");
    });

    exec.run();
    EXPECT_EQ(received, "ping");

    exec.unregister_fd(pipe->read_end.get());
    EXPECT_FALSE(exec.has_work());
}

TEST(Executor, RegisteringInvalidDescriptorFails)
{
    taskq::executor exec;
    const auto result = exec.register_fd(-1);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), std::errc::bad_file_descriptor);
    EXPECT_EQ(exec.get_stats().error_count, 1u);
}

TEST(Executor, RunUntilStopsWhenFutureSettles)
{
    taskq::executor exec;
    const taskq::promise p(exec);
    bool later = false;

    exec.add_timer(5ms, [p]() { p.set_value(); });
    exec.add_timer(200ms, [&later]() { later = true; });

    EXPECT_TRUE(exec.run_until(p.get_future()));
    EXPECT_FALSE(later);
    EXPECT_EQ(exec.pending_timers(), 1u);
}

TEST(Executor, RunUntilReturnsFalseWhenWorkRunsOut)
{
    taskq::executor exec;
    const taskq::promise p(exec);

    exec.defer([]() {});
    EXPECT_FALSE(exec.run_until(p.get_future()));
}

TEST(Executor, StopEndsRun)
{
    taskq::executor exec;
    int ticks = 0;

    exec.defer([&exec, &ticks]() {
        ++ticks;
        exec.stop();
    });
    exec.add_timer(50ms, [&ticks]() { ++ticks; });

    exec.run();
    EXPECT_EQ(ticks, 1);
    EXPECT_TRUE(exec.has_work());

    exec.run();
    EXPECT_EQ(ticks, 2);
}

TEST(Executor, StatisticsReset)
{
    taskq::executor exec;
    exec.defer([]() {});
    exec.add_timer(0ms, []() {});
    exec.run();

    EXPECT_GT(exec.get_stats().total_callbacks, 0u);
    exec.reset_stats();

    const auto& stats = exec.get_stats();
    EXPECT_EQ(stats.total_callbacks, 0u);
    EXPECT_EQ(stats.total_timers_armed, 0u);
    EXPECT_EQ(stats.total_timers_fired, 0u);
}
