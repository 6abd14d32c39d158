#pragma once
#ifndef PCH
    #include <cstdint>
    #include <optional>

    #include <taskq/basic_types.hpp>
#endif

namespace taskq
{
    struct queue_options
    {
        /// Dispatch automatically when a task is pushed. Without it, start() has to be called
        /// after every push and every time the queue stops because it ran empty.
        bool auto_start = true;

        /// Number of tasks that may be in flight at once.
        std::uint32_t max_concurrent_tasks = 1u;

        /// Timeout applied to tasks without their own, 0 disables it.
        milliseconds default_timeout {0};

        /// Defer the next dispatch after a task finishes by one executor iteration,
        /// letting continuations of the settled futures run first.
        bool use_async_ticking = true;
    };

    struct task_options
    {
        /// Overrides queue_options::default_timeout when set, 0 disables the timeout.
        std::optional<milliseconds> timeout;

        /// Jump to the front of the queue and ignore max_concurrent_tasks when dispatched.
        bool run_immediately = false;
    };

} // namespace taskq
