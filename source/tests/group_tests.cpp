#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <taskq/errors.hpp>
#include <taskq/executor.hpp>
#include <taskq/future.hpp>
#include <taskq/queue.hpp>

#include "event_recorder.hpp"

namespace
{
    using namespace std::chrono_literals;
    using taskq::test::by_value;
    using taskq::test::event_recorder;

    taskq::task<void> sleep_task(taskq::executor& exec, const taskq::milliseconds delay)
    {
        co_await exec.sleep_for(delay);
    }

    taskq::task<void> fail_with(std::string message)
    {
        throw std::runtime_error(message);
        co_return;
    }

    // Items starting with "fail" throw, items starting with "slow" sleep past the timeout
    taskq::task<void> process(taskq::executor& exec, std::string item)
    {
        if (item.starts_with("fail"))
            return fail_with(item);

        if (item.starts_with("slow"))
            return sleep_task(exec, 50ms);

        return sleep_task(exec, 5ms);
    }

    using string_queue = taskq::item_queue<std::string>;

    string_queue make_queue(taskq::executor& exec, const taskq::queue_options& options = {})
    {
        return string_queue(exec, [&exec](const std::string& item) { return process(exec, item); }, options);
    }
}

TEST(Group, OnlyOwnTasksArePublished)
{
    taskq::executor exec;
    auto queue = make_queue(exec, {.auto_start = false, .max_concurrent_tasks = 2u});

    auto g1 = queue.create_group();
    auto g2 = queue.create_group();
    event_recorder r1(*g1, by_value);
    event_recorder r2(*g2, by_value);

    g1->push("a");
    g2->push("b");
    queue.push("c");
    g1->push("d");

    EXPECT_EQ(g1->length(), 2u);
    EXPECT_EQ(g2->length(), 1u);
    EXPECT_EQ(queue.length(), 4u);

    queue.start();
    queue.start();
    exec.run();

    const std::vector<std::string> expected1 {"task_started a", "task_completed a", "task_finished a",
                                              "task_started d", "task_completed d", "task_finished d", "finished"};
    const std::vector<std::string> expected2 {"task_started b", "task_completed b", "task_finished b", "finished"};

    EXPECT_EQ(r1.lines(), expected1);
    EXPECT_EQ(r2.lines(), expected2);
    EXPECT_EQ(g1->length(), 0u);
    EXPECT_EQ(g2->length(), 0u);
}

TEST(Group, EqualPayloadsAreTrackedSeparately)
{
    taskq::executor exec;
    auto queue = make_queue(exec, {.max_concurrent_tasks = 2u});

    auto group = queue.create_group();
    event_recorder recorder(*group, by_value);

    // Same payload in flight on the queue and in the group at the same time
    queue.push("same");
    group->push("same");

    exec.run();

    EXPECT_EQ(recorder.count("task_started same"), 1u);
    EXPECT_EQ(recorder.count("task_finished same"), 1u);
    EXPECT_EQ(recorder.count("finished"), 1u);
}

TEST(Group, EventsCarryQueueTokens)
{
    taskq::executor exec;
    auto queue = make_queue(exec, {.auto_start = false});
    auto group = queue.create_group();

    std::vector<taskq::task_id> started;
    group->task_started().subscribe([&started](const taskq::task_event<std::string>& e) { started.push_back(e.id); });

    queue.push("x");
    const auto first = group->push("y");
    const auto second = group->push("y");

    queue.start();
    exec.run();

    const std::vector<taskq::task_id> expected {first, second};
    EXPECT_EQ(started, expected);
    EXPECT_NE(first, second);
}

TEST(Group, CompletionFutureSettlesWhenOwnTasksFinish)
{
    taskq::executor exec;
    auto queue = make_queue(exec);
    auto group = queue.create_group();

    EXPECT_TRUE(group->completion_future().is_ready());

    group->push("a");
    queue.push("slow");
    group->push("b");

    const auto queue_done = queue.completion_future();
    const auto group_done = group->completion_future();
    EXPECT_FALSE(group_done.is_ready());

    // "b" is the last task of both, so the queue drains in the same iteration
    EXPECT_TRUE(exec.run_until(group_done));
    EXPECT_TRUE(queue_done.is_ready());
    EXPECT_EQ(queue.length(), 0u);
}

TEST(Group, GroupFinishesBeforeQueueWhenItsTasksAreDone)
{
    taskq::executor exec;
    auto queue = make_queue(exec, {.max_concurrent_tasks = 2u});
    auto group = queue.create_group();

    group->push("a");
    queue.push("slow");

    const auto group_done = group->completion_future();
    const auto queue_done = queue.completion_future();

    EXPECT_TRUE(exec.run_until(group_done));
    EXPECT_FALSE(queue_done.is_ready());
    EXPECT_EQ(queue.length(), 1u);

    exec.run();
    EXPECT_TRUE(queue_done.is_ready());
}

TEST(Group, FailuresAndTimeoutsAreRepublished)
{
    taskq::executor exec;
    auto queue = make_queue(exec, {.max_concurrent_tasks = 3u, .default_timeout = 20ms});
    auto group = queue.create_group();
    event_recorder recorder(*group, by_value);

    // "fail-1" fails while being dispatched, the others are still tracked then
    auto timed_out = group->push_async("slow-1");
    auto completed = group->push_async("ok-1");
    auto failed = group->push_async("fail-1");

    exec.run();

    EXPECT_EQ(recorder.count("task_failed fail-1"), 1u);
    EXPECT_EQ(recorder.count("task_timed_out slow-1"), 1u);
    EXPECT_EQ(recorder.count("task_completed ok-1"), 1u);
    EXPECT_EQ(recorder.count("finished"), 1u);

    EXPECT_THROW(failed.get(), std::runtime_error);
    EXPECT_THROW(timed_out.get(), taskq::timeout_error);
    EXPECT_NO_THROW(completed.get());
}

TEST(Group, DestroyStopsRepublishing)
{
    taskq::executor exec;
    auto queue = make_queue(exec, {.auto_start = false});
    auto group = queue.create_group();
    event_recorder recorder(*group, by_value);

    auto result = group->push_async("a");
    const auto group_done = group->completion_future();

    group->destroy();
    EXPECT_FALSE(group->active());
    group->destroy();

    queue.start();
    exec.run();

    // The task still ran on the queue and its own future settled
    EXPECT_TRUE(result.is_ready());
    EXPECT_FALSE(result.has_failed());
    EXPECT_EQ(queue.get_stats().completed, 1u);

    EXPECT_TRUE(recorder.lines().empty());
    EXPECT_FALSE(group_done.is_ready());
}

TEST(Group, PushAfterDestroyStillRunsOnQueue)
{
    taskq::executor exec;
    auto queue = make_queue(exec);
    auto group = queue.create_group();
    group->destroy();

    auto result = group->push_async("late");
    EXPECT_EQ(group->length(), 0u);

    exec.run();
    EXPECT_TRUE(result.is_ready());
    EXPECT_EQ(queue.get_stats().completed, 1u);
}

TEST(Group, DestroyedGroupReleasesSubscriptions)
{
    taskq::executor exec;
    auto queue = make_queue(exec);

    {
        auto group = queue.create_group();
        group->push("a");
    }

    // The queue keeps running without the group listening
    exec.run();
    EXPECT_EQ(queue.get_stats().completed, 1u);
}
