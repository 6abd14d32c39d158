#pragma once
#ifndef PCH
    #include <exception>
    #include <memory>

    #include <taskq/basic_types.hpp>
#endif

namespace taskq
{
    /// @brief Published on the per-task channels of queues and groups.
    template <typename Payload>
    struct task_event
    {
        task_id id {};
        std::shared_ptr<const Payload> payload;

        /// Set on task_failed, and on task_finished unless the task completed.
        std::exception_ptr error;

        [[nodiscard]] const Payload& value() const noexcept { return *payload; }
    };

    /// @brief Published on the started, stopped and finished channels.
    struct lifecycle_event
    {
    };

} // namespace taskq
