#pragma once
#ifndef PCH
    #include <chrono>
    #include <cstdint>
#endif

namespace taskq
{
    using fd_t = int;

    /// @brief Token a queue assigns to every admitted task, unique per queue.
    using task_id = std::uint64_t;

    using clock_type = std::chrono::steady_clock;
    using milliseconds = std::chrono::milliseconds;

    /// @brief Readiness a coroutine can wait for with executor::wait_io().
    enum class event_type : std::uint8_t
    {
        read,
        write
    };
} // namespace taskq
