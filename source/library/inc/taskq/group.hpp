#pragma once
#ifndef PCH
    #include <cstddef>
    #include <unordered_set>

    #include <rxcpp/rx.hpp>

    #include <taskq/basic_types.hpp>
    #include <taskq/completion.hpp>
    #include <taskq/events.hpp>
    #include <taskq/future.hpp>
    #include <taskq/logger.hpp>
    #include <taskq/options.hpp>
#endif

namespace taskq
{
    /// @brief A view over a subset of the tasks of one queue.
    ///
    /// Tasks pushed through a group are scheduled by the parent queue like any other task,
    /// but the group only re-publishes the events of its own tasks and tracks only their
    /// completion. Tasks are matched by the token the queue assigns on admission, so equal
    /// payloads in flight at the same time are never confused.
    ///
    /// A group must not outlive its queue. After destroy() tasks already pushed still run
    /// on the queue, but the group publishes nothing more and a pending completion_future()
    /// never settles.
    template <typename Queue>
    class basic_group
    {
    public:
        using payload_type = typename Queue::payload_type;
        using event_type = task_event<payload_type>;

        /// @throws std::bad_alloc if the subscriptions cannot be allocated.
        explicit basic_group(Queue& parent) noexcept(false): parent_(parent) { attach(); }

        ~basic_group() noexcept { destroy(); }

        basic_group(const basic_group&) = delete;
        basic_group& operator=(const basic_group&) = delete;

        /// @brief Pushes a payload to the parent queue and tracks it in this group.
        task_id push(payload_type payload, const task_options& options = {}) noexcept(false)
        {
            const auto id = parent_.allocate_id();
            track(id);
            parent_.enqueue(id, std::move(payload), options, std::nullopt);
            return id;
        }

        /// @brief Like push(), returning the future of the task.
        [[nodiscard]] future push_async(payload_type payload, const task_options& options = {}) noexcept(false)
        {
            const promise completion(parent_.exec_);
            const auto id = parent_.allocate_id();
            track(id);
            parent_.enqueue(id, std::move(payload), options, completion);
            return completion.get_future();
        }

        /// @brief Settles once every task of this group has finished.
        [[nodiscard]] future completion_future() noexcept(false)
        {
            return when_finished(parent_.exec_, length() == 0u, finished());
        }

        /// @brief Detaches from the parent queue.
        void destroy() noexcept
        {
            if (!active_)
                return;

            lifetime_.unsubscribe();
            active_ = false;
        }

        [[nodiscard]] bool active() const noexcept { return active_; }

        /// @brief Tasks of this group that have not finished yet.
        [[nodiscard]] std::size_t length() const noexcept { return pending_.size() + running_.size(); }

        [[nodiscard]] rxcpp::observable<event_type> task_started() const { return task_started_.get_observable(); }
        [[nodiscard]] rxcpp::observable<event_type> task_completed() const { return task_completed_.get_observable(); }
        [[nodiscard]] rxcpp::observable<event_type> task_failed() const { return task_failed_.get_observable(); }
        [[nodiscard]] rxcpp::observable<event_type> task_timed_out() const { return task_timed_out_.get_observable(); }
        [[nodiscard]] rxcpp::observable<event_type> task_finished() const { return task_finished_.get_observable(); }
        [[nodiscard]] rxcpp::observable<lifecycle_event> finished() const { return finished_.get_observable(); }

    private:
        template <typename T>
        static void emit(const rxcpp::subjects::subject<T>& channel, const T& value)
        {
            channel.get_subscriber().on_next(value);
        }

        void track(const task_id id) noexcept(false)
        {
            if (!active_)
            {
                logger::log(logger::level::warn, std::source_location::current(),
                            "Task #{} pushed through a destroyed group is not tracked", id);
                return;
            }

            pending_.insert(id);
        }

        void attach() noexcept(false)
        {
            parent_.task_started().subscribe(lifetime_, [this](const event_type& e) {
                if (pending_.erase(e.id) == 0u)
                    return;

                running_.insert(e.id);
                emit(task_started_, e);
            });

            parent_.task_completed().subscribe(lifetime_, [this](const event_type& e) {
                if (running_.contains(e.id))
                    emit(task_completed_, e);
            });

            parent_.task_failed().subscribe(lifetime_, [this](const event_type& e) {
                if (running_.contains(e.id))
                    emit(task_failed_, e);
            });

            parent_.task_timed_out().subscribe(lifetime_, [this](const event_type& e) {
                if (running_.contains(e.id))
                    emit(task_timed_out_, e);
            });

            parent_.task_finished().subscribe(lifetime_, [this](const event_type& e) {
                if (running_.erase(e.id) == 0u)
                    return;

                emit(task_finished_, e);
                if (length() == 0u)
                    emit(finished_, lifecycle_event {});
            });
        }

        Queue& parent_;
        bool active_ {true};

        std::unordered_set<task_id> pending_;
        std::unordered_set<task_id> running_;

        rxcpp::composite_subscription lifetime_;

        rxcpp::subjects::subject<event_type> task_started_;
        rxcpp::subjects::subject<event_type> task_completed_;
        rxcpp::subjects::subject<event_type> task_failed_;
        rxcpp::subjects::subject<event_type> task_timed_out_;
        rxcpp::subjects::subject<event_type> task_finished_;
        rxcpp::subjects::subject<lifecycle_event> finished_;
    };

} // namespace taskq
