#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <rxcpp/rx.hpp>

#include <taskq/errors.hpp>
#include <taskq/events.hpp>

namespace taskq::test
{
    /// @brief Subscribes to every channel a queue or group offers and records
    /// one line per event, e.g. "task_started A" or "finished".
    template <typename Source>
    class event_recorder
    {
    public:
        using event_type = typename Source::event_type;
        using labeler = std::function<std::string(const event_type&)>;

        explicit event_recorder(Source& source, labeler label): label_(std::move(label))
        {
            if constexpr (requires { source.task_added(); })
                on_task(source.task_added(), "task_added");

            on_task(source.task_started(), "task_started");
            on_task(source.task_completed(), "task_completed");
            on_task(source.task_failed(), "task_failed");
            on_task(source.task_timed_out(), "task_timed_out");
            on_task(source.task_finished(), "task_finished");

            if constexpr (requires { source.started(); })
                on_lifecycle(source.started(), "started");

            on_lifecycle(source.finished(), "finished");

            if constexpr (requires { source.stopped(); })
                on_lifecycle(source.stopped(), "stopped");
        }

        ~event_recorder() { lifetime_.unsubscribe(); }

        event_recorder(const event_recorder&) = delete;
        event_recorder& operator=(const event_recorder&) = delete;

        [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }

        [[nodiscard]] std::size_t count(const std::string& line) const
        {
            std::size_t n = 0u;
            for (const auto& l: lines_)
                n += (l == line) ? 1u : 0u;
            return n;
        }

        /// @brief Errors carried by task_finished events, in order.
        [[nodiscard]] const std::vector<std::exception_ptr>& finished_errors() const noexcept { return finished_errors_; }

    private:
        void on_task(const rxcpp::observable<event_type>& channel, std::string name)
        {
            channel.subscribe(lifetime_, [this, name](const event_type& e) {
                lines_.push_back(name + " " + label_(e));
                if (name == "task_finished")
                    finished_errors_.push_back(e.error);
            });
        }

        void on_lifecycle(const rxcpp::observable<lifecycle_event>& channel, std::string name)
        {
            channel.subscribe(lifetime_, [this, name](const lifecycle_event&) { lines_.push_back(name); });
        }

        labeler label_;
        rxcpp::composite_subscription lifetime_;
        std::vector<std::string> lines_;
        std::vector<std::exception_ptr> finished_errors_;
    };

    /// @brief Labels events by payload value for queues of strings.
    inline std::string by_value(const task_event<std::string>& e)
    {
        return e.value();
    }

} // namespace taskq::test
