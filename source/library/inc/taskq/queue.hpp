#pragma once
#ifndef PCH
    #include <concepts>
    #include <cstdint>
    #include <deque>
    #include <exception>
    #include <functional>
    #include <memory>
    #include <optional>
    #include <type_traits>
    #include <unordered_map>
    #include <utility>

    #include <rxcpp/rx.hpp>

    #include <taskq/basic_types.hpp>
    #include <taskq/completion.hpp>
    #include <taskq/errors.hpp>
    #include <taskq/events.hpp>
    #include <taskq/executor.hpp>
    #include <taskq/future.hpp>
    #include <taskq/group.hpp>
    #include <taskq/logger.hpp>
    #include <taskq/options.hpp>
    #include <taskq/task.hpp>
#endif

namespace taskq
{
    /// @brief Counters describing the work done by a queue.
    struct queue_statistics
    {
        std::uint64_t admitted {};
        std::uint64_t dispatched {};
        std::uint64_t completed {};
        std::uint64_t failed {};
        std::uint64_t timed_out {};
        std::uint64_t priority_bypasses {};

        void reset() noexcept { *this = {}; }
    };

    /// @brief Routes every item to one shared processor.
    template <typename T>
    class item_invoker
    {
    public:
        using payload_type = T;
        using processor_type = std::function<task<void>(const T&)>;

        static constexpr bool announces_admission = true;

        template <typename F>
            requires std::is_invocable_r_v<task<void>, F&, const T&>
        item_invoker(F&& processor): processor_(std::forward<F>(processor))
        {
        }

        [[nodiscard]] task<void> operator()(const T& item) const { return processor_(item); }

    private:
        processor_type processor_;
    };

    using task_function = std::function<task<void>()>;

    /// @brief Runs each payload as its own task body.
    struct callable_invoker
    {
        using payload_type = task_function;

        static constexpr bool announces_admission = false;

        [[nodiscard]] task<void> operator()(const task_function& fn) const { return fn(); }
    };

    /// @brief Bounded-concurrency task queue running on one executor.
    ///
    /// At most options().max_concurrent_tasks tasks are in flight at once; a task pushed with
    /// run_immediately jumps the queue and may exceed that limit by one. A timed out task is
    /// only abandoned: its body keeps running unobserved and must tolerate that.
    ///
    /// Task failures never propagate out of the queue. They are published on task_failed /
    /// task_timed_out and task_finished, and fail the task's future if it has one.
    template <typename Payload, typename Invoker>
    class basic_queue
    {
    public:
        using payload_type = Payload;
        using invoker_type = Invoker;
        using event_type = task_event<Payload>;
        using group_type = basic_group<basic_queue>;

        explicit basic_queue(executor& exec, const queue_options& options = {}) noexcept(false)
            requires std::default_initializable<Invoker>
            : basic_queue(exec, Invoker {}, options)
        {
        }

        basic_queue(executor& exec, Invoker invoker, const queue_options& options = {}) noexcept(false):
            exec_(exec),
            invoker_(std::move(invoker)),
            options_(options),
            alive_(std::make_shared<bool>(true))
        {
        }

        ~basic_queue() noexcept
        {
            alive_.reset();
            for (const auto& [id, timer]: timers_)
                exec_.cancel_timer(timer);
        }

        basic_queue(const basic_queue&) = delete;
        basic_queue& operator=(const basic_queue&) = delete;

        /// @brief Adds a task to the queue.
        /// @return The token identifying the task in published events.
        task_id push(Payload payload, const task_options& options = {}) noexcept(false)
        {
            const auto id = allocate_id();
            enqueue(id, std::move(payload), options, std::nullopt);
            return id;
        }

        /// @brief Adds a task to the queue and returns a future settled with its outcome.
        /// A timed out task fails the future with timeout_error.
        [[nodiscard]] future push_async(Payload payload, const task_options& options = {}) noexcept(false)
        {
            const promise completion(exec_);
            enqueue(allocate_id(), std::move(payload), options, completion);
            return completion.get_future();
        }

        /// @brief Dispatches at most one pending task.
        void start() noexcept(false)
        {
            if (stopping_ || pending_.empty())
                return;

            // Only the front task may bypass a full queue
            if (running_ >= options_.max_concurrent_tasks)
            {
                if (!pending_.front()->options.run_immediately)
                    return;

                ++metrics_.priority_bypasses;
            }

            auto rec = std::move(pending_.front());
            pending_.pop_front();
            execute(std::move(rec));
        }

        /// @brief Starts the queue; the future settles the next time the queue stops.
        [[nodiscard]] future start_async() noexcept(false)
        {
            if (stop_promise_)
                return stop_promise_->get_future();

            stop_promise_.emplace(exec_);
            const auto result = stop_promise_->get_future();
            start();
            return result;
        }

        /// @brief Lets running tasks finish, then stops without dispatching pending ones.
        void stop() noexcept(false)
        {
            if (!active_)
                return;

            stopping_ = true;

            // Outcome publishing finalizes once the finishing task has settled
            if ((running_ == 0u) && (publishing_ == 0u))
                finish_stopping();
        }

        /// @brief Like stop(); the future settles once the queue has stopped.
        [[nodiscard]] future stop_async() noexcept(false)
        {
            if (!active_)
                return future::make_ready(exec_);

            if (!stop_promise_)
                stop_promise_.emplace(exec_);

            const auto result = stop_promise_->get_future();
            stop();
            return result;
        }

        /// @brief Settles once the queue has run out of tasks, immediately if it is empty.
        [[nodiscard]] future completion_future() noexcept(false)
        {
            return when_finished(exec_, length() == 0u, finished());
        }

        /// @brief Creates a group tracking its own subset of this queue's tasks.
        [[nodiscard]] std::shared_ptr<group_type> create_group() noexcept(false) { return std::make_shared<group_type>(*this); }

        /// @brief Pending plus running tasks.
        [[nodiscard]] std::size_t length() const noexcept { return pending_.size() + running_; }

        [[nodiscard]] bool active() const noexcept { return active_; }

        [[nodiscard]] bool stopping() const noexcept { return stopping_; }

        [[nodiscard]] std::uint32_t running_count() const noexcept { return running_; }

        [[nodiscard]] const queue_options& options() const noexcept { return options_; }

        [[nodiscard]] const queue_statistics& get_stats() const noexcept { return metrics_; }

        void reset_stats() noexcept { metrics_.reset(); }

        /// @brief Published on admission; only queues whose invoker announces admissions use it.
        [[nodiscard]] rxcpp::observable<event_type> task_added() const { return task_added_.get_observable(); }
        [[nodiscard]] rxcpp::observable<event_type> task_started() const { return task_started_.get_observable(); }
        [[nodiscard]] rxcpp::observable<event_type> task_completed() const { return task_completed_.get_observable(); }
        [[nodiscard]] rxcpp::observable<event_type> task_failed() const { return task_failed_.get_observable(); }
        [[nodiscard]] rxcpp::observable<event_type> task_timed_out() const { return task_timed_out_.get_observable(); }
        [[nodiscard]] rxcpp::observable<event_type> task_finished() const { return task_finished_.get_observable(); }
        [[nodiscard]] rxcpp::observable<lifecycle_event> started() const { return started_.get_observable(); }
        [[nodiscard]] rxcpp::observable<lifecycle_event> stopped() const { return stopped_.get_observable(); }
        [[nodiscard]] rxcpp::observable<lifecycle_event> finished() const { return finished_.get_observable(); }

    private:
        friend group_type;

        struct task_record
        {
            task_id id {};
            std::shared_ptr<const Payload> payload;
            task_options options;
            std::optional<promise> completion;
            bool finished {};
        };

        using record_ptr = std::shared_ptr<task_record>;

        enum class outcome : std::uint8_t
        {
            completed,
            failed,
            timed_out
        };

        template <typename T>
        static void emit(const rxcpp::subjects::subject<T>& channel, const T& value)
        {
            channel.get_subscriber().on_next(value);
        }

        [[nodiscard]] task_id allocate_id() noexcept { return next_id_++; }

        void enqueue(const task_id id, Payload&& payload, const task_options& options, std::optional<promise> completion) noexcept(false)
        {
            auto rec = std::make_shared<task_record>(
                task_record {id, std::make_shared<const Payload>(std::move(payload)), options, std::move(completion)});

            if (options.run_immediately)
                pending_.push_front(rec);
            else
                pending_.push_back(rec);

            ++metrics_.admitted;
            logger::log(logger::level::debug, std::source_location::current(), "Task #{} admitted ({} pending, {} running)", id,
                        pending_.size(), running_);

            if constexpr (Invoker::announces_admission)
                emit(task_added_, event_type {id, rec->payload, nullptr});

            if (options_.auto_start)
                start();
        }

        void execute(record_ptr rec) noexcept(false)
        {
            before_execute(*rec);

            const auto timeout = rec->options.timeout.value_or(options_.default_timeout);
            if (timeout > milliseconds::zero())
            {
                const auto timer = exec_.add_timer(timeout, [this, rec, timeout, alive = std::weak_ptr<bool>(alive_)]() {
                    if (!alive.expired())
                        finish(rec, outcome::timed_out, std::make_exception_ptr(timeout_error(timeout)));
                });
                timers_.emplace(rec->id, timer);
            }

            task<void> invocation;
            try
            {
                invocation = invoker_(*rec->payload);
            }
            catch (...)
            {
                finish(rec, outcome::failed, normalize_error(std::current_exception()));
                return;
            }

            // The handler keeps the record, and so the payload, alive until the body returns
            exec_.spawn(std::move(invocation), [this, rec, alive = std::weak_ptr<bool>(alive_)](std::exception_ptr error) {
                if (alive.expired())
                    return;

                if (error)
                    finish(rec, outcome::failed, normalize_error(std::move(error)));
                else
                    finish(rec, outcome::completed, nullptr);
            });
        }

        void before_execute(const task_record& rec) noexcept(false)
        {
            ++running_;
            ++metrics_.dispatched;

            if (!active_)
            {
                active_ = true;
                logger::log(logger::level::debug, std::source_location::current(), "Queue started");
                emit(started_, lifecycle_event {});
            }

            logger::log(logger::level::debug, std::source_location::current(), "Task #{} started ({} running)", rec.id, running_);
            emit(task_started_, event_type {rec.id, rec.payload, nullptr});
        }

        // First outcome wins; a late body result after a timeout lands here and is dropped
        void finish(const record_ptr& rec, const outcome result, std::exception_ptr error) noexcept(false)
        {
            if (rec->finished)
                return;

            rec->finished = true;
            after_execute(rec, result, std::move(error));
        }

        void after_execute(const record_ptr& rec, const outcome result, std::exception_ptr error) noexcept(false)
        {
            --running_;

            if (const auto it = timers_.find(rec->id); it != timers_.end())
            {
                exec_.cancel_timer(it->second);
                timers_.erase(it);
            }

            ++publishing_;

            event_type event {rec->id, rec->payload, nullptr};
            switch (result)
            {
                case outcome::timed_out:
                    ++metrics_.timed_out;
                    logger::log(logger::level::warn, std::source_location::current(), "Task #{} abandoned: {}", rec->id,
                                describe_error(error));
                    emit(task_timed_out_, event);
                    break;

                case outcome::failed:
                    ++metrics_.failed;
                    logger::log(logger::level::warn, std::source_location::current(), "Task #{} failed: {}", rec->id, describe_error(error));
                    event.error = error;
                    emit(task_failed_, event);
                    break;

                case outcome::completed:
                    ++metrics_.completed;
                    emit(task_completed_, event);
                    break;
            }

            event.error = error;
            emit(task_finished_, event);

            if (rec->completion)
            {
                if (error)
                    rec->completion->set_exception(error);
                else
                    rec->completion->set_value();
            }

            --publishing_;

            // A task dispatched and finished by a subscriber may already have stopped the queue
            if (!active_)
                return;

            if ((length() == 0u) || stopping_)
            {
                // Running tasks of a stopping queue, and an outer outcome still being published, finish first
                if ((running_ == 0u) && (publishing_ == 0u))
                    finish_stopping();
            }
            else
            {
                schedule_next();
            }
        }

        void schedule_next() noexcept(false)
        {
            if (!options_.use_async_ticking)
            {
                start();
                return;
            }

            // A queue stopped before the tick keeps its pending tasks
            exec_.defer([this, alive = std::weak_ptr<bool>(alive_), generation = generation_]() {
                if (!alive.expired() && (generation == generation_))
                    start();
            });
        }

        void finish_stopping() noexcept(false)
        {
            active_ = false;
            stopping_ = false;
            ++generation_;

            for (const auto& [id, timer]: timers_)
                exec_.cancel_timer(timer);
            timers_.clear();

            const auto resolver = std::exchange(stop_promise_, std::nullopt);

            logger::log(logger::level::debug, std::source_location::current(), "Queue stopped ({} pending)", pending_.size());

            if (length() == 0u)
                emit(finished_, lifecycle_event {});

            emit(stopped_, lifecycle_event {});

            if (resolver)
                resolver->set_value();
        }

        executor& exec_;
        Invoker invoker_;
        queue_options options_;

        std::deque<record_ptr> pending_;
        std::uint32_t running_ {};
        std::unordered_map<task_id, executor::timer_id> timers_;

        bool active_ {};
        bool stopping_ {};
        std::uint32_t publishing_ {};
        std::uint64_t generation_ {};
        std::optional<promise> stop_promise_;

        task_id next_id_ {1u};
        queue_statistics metrics_;

        // Expires with the queue so late timers and task results are ignored
        std::shared_ptr<bool> alive_;

        rxcpp::subjects::subject<event_type> task_added_;
        rxcpp::subjects::subject<event_type> task_started_;
        rxcpp::subjects::subject<event_type> task_completed_;
        rxcpp::subjects::subject<event_type> task_failed_;
        rxcpp::subjects::subject<event_type> task_timed_out_;
        rxcpp::subjects::subject<event_type> task_finished_;
        rxcpp::subjects::subject<lifecycle_event> started_;
        rxcpp::subjects::subject<lifecycle_event> stopped_;
        rxcpp::subjects::subject<lifecycle_event> finished_;
    };

    template <typename T>
    using item_queue = basic_queue<T, item_invoker<T>>;

    using function_queue = basic_queue<task_function, callable_invoker>;

} // namespace taskq
