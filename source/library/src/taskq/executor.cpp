#include "taskq/executor.hpp"

#include "taskq/future.hpp"
#include "taskq/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <limits>

namespace taskq
{
    void executor_statistics::reset() noexcept
    {
        total_callbacks = 0u;
        total_timers_armed = 0u;
        total_timers_fired = 0u;
        total_timers_cancelled = 0u;
        total_poll_waits = 0u;
        total_tasks_spawned = 0u;
        total_tasks_completed = 0u;
        error_count = 0u;
    }

    namespace
    {
        descriptor::poller open_poller(const std::uint32_t max_events) noexcept(false)
        {
            auto result = descriptor::poller::open(max_events);
            if (!result)
                throw std::system_error(result.error(), "epoll_create1 failed");

            return std::move(*result);
        }
    }

    executor::executor(const executor_config& config) noexcept(false): poller_(open_poller(config.max_events))
    {
    }

    executor::~executor() noexcept
    {
        if (!ready_.empty() || !timers_.empty())
            logger::log(logger::level::debug, std::source_location::current(),
                        "Executor destroyed with {} deferred callbacks and {} armed timers", ready_.size(), timers_.size());
    }

    void executor::defer(callback&& cb) noexcept(false)
    {
        ready_.push_back(std::move(cb));
    }

    executor::timer_id executor::add_timer(const milliseconds delay, callback&& cb) noexcept(false)
    {
        const auto id = next_timer_id_++;
        const auto deadline = clock_type::now() + std::max(delay, milliseconds::zero());

        timers_.emplace(timer_key {deadline, id}, std::move(cb));
        deadlines_.emplace(id, deadline);
        ++metrics_.total_timers_armed;
        return id;
    }

    bool executor::cancel_timer(const timer_id id) noexcept
    {
        const auto it = deadlines_.find(id);
        if (it == deadlines_.end())
            return false;

        timers_.erase(timer_key {it->second, id});
        deadlines_.erase(it);
        ++metrics_.total_timers_cancelled;
        return true;
    }

    void executor::spawn(task<void>&& t) noexcept(false)
    {
        spawn(std::move(t), [](std::exception_ptr error) {
            if (!error)
                return;

            try
            {
                std::rethrow_exception(error);
            }
            catch (const std::exception& e)
            {
                logger::log(logger::level::error, std::source_location::current(), "Exception propagated to detached task: {}", e.what());
            }
            catch (...)
            {
                logger::log(logger::level::error, std::source_location::current(), "Unknown exception propagated to detached task");
            }
        });
    }

    void executor::spawn(task<void>&& t, completion_handler&& on_done) noexcept(false)
    {
        ++metrics_.total_tasks_spawned;

        // Create and start the detached task; it destroys itself when done
        const auto dt = execute_task(std::move(t), std::move(on_done));
        dt.handle.resume();
    }

    executor::detached_task_wrapper executor::execute_task(task<void> tsk, completion_handler on_done) noexcept
    {
        std::exception_ptr error;
        try
        {
            co_await tsk;
        }
        catch (...)
        {
            error = std::current_exception();
        }

        ++metrics_.total_tasks_completed;

        try
        {
            on_done(error);
        }
        catch (const std::exception& e)
        {
            ++metrics_.error_count;
            logger::log(logger::level::error, std::source_location::current(), "Exception in task completion handler: {}", e.what());
        }
        catch (...)
        {
            ++metrics_.error_count;
            logger::log(logger::level::error, std::source_location::current(), "Unknown exception in task completion handler");
        }
    }

    std::expected<void, std::error_code> executor::register_fd(const fd_t fd) noexcept
    {
        const auto result = poller_.watch(fd);
        if (!result)
            ++metrics_.error_count;

        return result;
    }

    void executor::unregister_fd(const fd_t fd) noexcept
    {
        if (const auto result = poller_.forget(fd); !result)
        {
            ++metrics_.error_count;
            logger::log(logger::level::warn, std::source_location::current(), "epoll_ctl(DEL, {}) failed: {}", fd, result.error().message());
        }

        std::erase_if(subscribers_, [fd](const auto& item) noexcept { return item.first.fd == fd; });
    }

    void executor::subscribe(const fd_t fd, const event_type type, std::coroutine_handle<> handle) noexcept(false)
    {
        // operator[] might throw std::bad_alloc
        subscribers_[{fd, type}] = handle;
    }

    void executor::resume_if_found(const fd_t fd, const event_type type)
    {
        const auto it = subscribers_.find({fd, type});
        if (it == subscribers_.end())
            return;

        const auto handle = it->second;
        subscribers_.erase(it);
        defer([handle]() { handle.resume(); });
    }

    bool executor::has_work() const noexcept
    {
        return !ready_.empty() || !timers_.empty() || !subscribers_.empty();
    }

    void executor::run() noexcept(false)
    {
        stop_requested_ = false;
        while (!stop_requested_ && has_work())
            run_once();
    }

    bool executor::run_until(const future& f) noexcept(false)
    {
        stop_requested_ = false;
        while (!f.is_ready() && !stop_requested_ && has_work())
            run_once();

        return f.is_ready();
    }

    void executor::run_once() noexcept(false)
    {
        run_ready_callbacks();
        fire_due_timers();

        if (!ready_.empty())
        {
            // Collect readiness without blocking so fd waiters are not starved
            if (!subscribers_.empty())
                poll_events(0);
            return;
        }

        if (!timers_.empty() || !subscribers_.empty())
            poll_events(next_poll_timeout());
    }

    void executor::run_ready_callbacks()
    {
        // Callbacks deferred while draining run on the next iteration
        auto batch = std::exchange(ready_, {});
        for (auto& cb: batch)
        {
            ++metrics_.total_callbacks;
            invoke_guarded(cb);
        }
    }

    void executor::fire_due_timers()
    {
        const auto now = clock_type::now();
        while (!timers_.empty() && (timers_.begin()->first.deadline <= now))
        {
            auto node = timers_.extract(timers_.begin());
            deadlines_.erase(node.key().id);
            ++metrics_.total_timers_fired;
            invoke_guarded(node.mapped());
        }
    }

    int executor::next_poll_timeout() const noexcept
    {
        if (timers_.empty())
            return -1;

        const auto remaining = timers_.begin()->first.deadline - clock_type::now();
        if (remaining <= clock_type::duration::zero())
            return 0;

        // Round up so the timer is due once epoll returns
        const auto ms = std::chrono::ceil<milliseconds>(remaining).count();
        return static_cast<int>(std::min<std::int64_t>(ms, std::numeric_limits<int>::max()));
    }

    void executor::poll_events(const int timeout_ms) noexcept(false)
    {
        static constexpr std::uint32_t read_mask = EPOLLIN | EPOLLERR | EPOLLHUP;
        static constexpr std::uint32_t write_mask = EPOLLOUT | EPOLLERR | EPOLLHUP;

        ++metrics_.total_poll_waits;
        const auto ready = poller_.wait(timeout_ms);
        if (!ready)
        {
            if (ready.error().value() == EINTR)
                return;

            ++metrics_.error_count;
            logger::log(logger::level::error, std::source_location::current(), "epoll_wait error: {}", ready.error().message());
            throw std::system_error(ready.error(), "epoll_wait failed");
        }

        for (const auto& item: *ready)
        {
            const auto fd = item.data.fd;
            const auto new_events = item.events;

            if ((new_events & read_mask) != 0u)
                resume_if_found(fd, event_type::read);

            if ((new_events & write_mask) != 0u)
                resume_if_found(fd, event_type::write);
        }
    }

    void executor::invoke_guarded(callback& cb) noexcept
    {
        try
        {
            cb();
        }
        catch (const std::exception& e)
        {
            ++metrics_.error_count;
            logger::log(logger::level::error, std::source_location::current(), "Exception in deferred callback: {}", e.what());
        }
        catch (...)
        {
            ++metrics_.error_count;
            logger::log(logger::level::error, std::source_location::current(), "Unknown exception in deferred callback");
        }
    }

} // namespace taskq
