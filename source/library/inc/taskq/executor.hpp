#pragma once
#ifndef PCH
    #include <coroutine>
    #include <cstdint>
    #include <deque>
    #include <exception>
    #include <expected>
    #include <functional>
    #include <map>
    #include <unordered_map>

    #include <taskq/basic_types.hpp>
    #include <taskq/descriptor/poller.hpp>
    #include <taskq/task.hpp>
#endif

namespace taskq
{
    class future;

    struct executor_config
    {
        /// Most fd events handled per poll.
        std::uint32_t max_events = 64u;
    };

    /// @brief Counters describing the work done by an executor.
    struct executor_statistics
    {
        std::uint64_t total_callbacks {};
        std::uint64_t total_timers_armed {};
        std::uint64_t total_timers_fired {};
        std::uint64_t total_timers_cancelled {};
        std::uint64_t total_poll_waits {};
        std::uint64_t total_tasks_spawned {};
        std::uint64_t total_tasks_completed {};
        std::uint64_t error_count {};

        /// @brief Reset all statistics counters.
        void reset() noexcept;
    };

    /// @brief Single-threaded cooperative event loop.
    /// All callbacks, timers and coroutine resumptions run on the thread calling run().
    class executor
    {
    public:
        using callback = std::move_only_function<void()>;
        using completion_handler = std::move_only_function<void(std::exception_ptr)>;
        using timer_id = std::uint64_t;

        /// @brief Constructs the executor.
        /// @throws std::system_error If epoll creation fails.
        explicit executor(const executor_config& config = {}) noexcept(false);

        ~executor() noexcept;

        executor(const executor&) = delete;
        executor& operator=(const executor&) = delete;

        /// @brief Queues a callback for the next loop iteration.
        /// @throws std::bad_alloc if queue allocation fails.
        void defer(callback&& cb) noexcept(false);

        /// @brief Arms a one-shot timer.
        /// @throws std::bad_alloc if timer allocation fails.
        timer_id add_timer(const milliseconds delay, callback&& cb) noexcept(false);

        /// @brief Disarms a timer that has not fired yet.
        /// @return false if the timer already fired or is unknown.
        bool cancel_timer(const timer_id id) noexcept;

        /// @brief Starts a detached task right away; it runs until its first suspension.
        /// @throws std::bad_alloc if the wrapper frame cannot be allocated.
        void spawn(task<void>&& t) noexcept(false);

        /// @brief Starts a detached task and reports its outcome exactly once.
        void spawn(task<void>&& t, completion_handler&& on_done) noexcept(false);

        /// @brief Registers a file descriptor for edge-triggered events.
        [[nodiscard]] std::expected<void, std::error_code> register_fd(const fd_t fd) noexcept;

        /// @brief Unregisters a file descriptor and forgets its waiters.
        void unregister_fd(const fd_t fd) noexcept;

        /// @brief Awaits a specific event on a registered file descriptor.
        [[nodiscard]] auto wait_io(const fd_t fd, const event_type type) noexcept
        {
            struct io_awaiter
            {
                executor& exec;
                fd_t fd;
                event_type type;

                bool await_ready() const noexcept { return false; }

                void await_suspend(std::coroutine_handle<> h) noexcept(false) { exec.subscribe(fd, type, h); }

                void await_resume() const noexcept {}
            };

            return io_awaiter {*this, fd, type};
        }

        /// @brief Suspends the awaiting coroutine for the given delay.
        [[nodiscard]] auto sleep_for(const milliseconds delay) noexcept
        {
            struct sleep_awaiter
            {
                executor& exec;
                milliseconds delay;

                bool await_ready() const noexcept { return delay <= milliseconds::zero(); }

                void await_suspend(std::coroutine_handle<> h) noexcept(false)
                {
                    exec.add_timer(delay, [h]() { h.resume(); });
                }

                void await_resume() const noexcept {}
            };

            return sleep_awaiter {*this, delay};
        }

        /// @brief Resumes the awaiting coroutine on the next loop iteration.
        [[nodiscard]] auto yield() noexcept
        {
            struct yield_awaiter
            {
                executor& exec;

                bool await_ready() const noexcept { return false; }

                void await_suspend(std::coroutine_handle<> h) noexcept(false)
                {
                    exec.defer([h]() { h.resume(); });
                }

                void await_resume() const noexcept {}
            };

            return yield_awaiter {*this};
        }

        /// @brief Runs until no callbacks, timers or I/O waiters remain, or stop() is called.
        /// @throws std::system_error if polling fails.
        void run() noexcept(false);

        /// @brief Runs until the future settles, the loop runs out of work, or stop() is called.
        /// @return true if the future has settled.
        bool run_until(const future& f) noexcept(false);

        /// @brief Makes the current run() return after the running iteration.
        void stop() noexcept { stop_requested_ = true; }

        /// @brief True while callbacks, timers or I/O waiters are outstanding.
        [[nodiscard]] bool has_work() const noexcept;

        [[nodiscard]] std::size_t pending_timers() const noexcept { return timers_.size(); }

        [[nodiscard]] const executor_statistics& get_stats() const noexcept { return metrics_; }

        void reset_stats() noexcept { metrics_.reset(); }

    private:
        struct event_key
        {
            fd_t fd;
            event_type type;

            [[nodiscard]] bool operator==(const event_key&) const = default;
        };

        struct event_key_hash
        {
            [[nodiscard]] std::size_t operator()(const event_key& k) const noexcept
            {
                return std::hash<int> {}(k.fd) ^ (std::hash<int> {}(static_cast<int>(k.type)) << 1);
            }
        };

        struct timer_key
        {
            clock_type::time_point deadline;
            timer_id id;

            [[nodiscard]] auto operator<=>(const timer_key&) const = default;
        };

        // Helper owning a spawned task until it finishes
        struct detached_task_wrapper
        {
            struct promise_type
            {
                detached_task_wrapper get_return_object() noexcept
                {
                    return detached_task_wrapper {std::coroutine_handle<promise_type>::from_promise(*this)};
                }

                std::suspend_always initial_suspend() const noexcept { return {}; }

                struct final_awaiter
                {
                    bool await_ready() const noexcept { return false; }
                    void await_suspend(std::coroutine_handle<promise_type> h) const noexcept { h.destroy(); }
                    void await_resume() const noexcept {}
                };

                final_awaiter final_suspend() const noexcept { return {}; }
                void unhandled_exception() noexcept { std::terminate(); }
                void return_void() const noexcept {}
            };

            std::coroutine_handle<promise_type> handle;
        };

        detached_task_wrapper execute_task(task<void> t, completion_handler on_done) noexcept;

        // Internal use: register a coroutine to be resumed on an event
        void subscribe(const fd_t fd, const event_type type, std::coroutine_handle<> handle) noexcept(false);

        void resume_if_found(const fd_t fd, const event_type type);

        void run_once() noexcept(false);

        void run_ready_callbacks();

        void fire_due_timers();

        void poll_events(const int timeout_ms) noexcept(false);

        [[nodiscard]] int next_poll_timeout() const noexcept;

        void invoke_guarded(callback& cb) noexcept;

        descriptor::poller poller_;

        std::deque<callback> ready_;
        std::map<timer_key, callback> timers_;
        std::unordered_map<timer_id, clock_type::time_point> deadlines_;
        timer_id next_timer_id_ {1u};

        std::unordered_map<event_key, std::coroutine_handle<>, event_key_hash> subscribers_;

        bool stop_requested_ {};
        executor_statistics metrics_;
    };

} // namespace taskq
