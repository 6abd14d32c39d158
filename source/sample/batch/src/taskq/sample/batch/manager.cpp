#include "taskq/sample/batch/manager.hpp"

#include <taskq/errors.hpp>
#include <taskq/sample/common.hpp>

#include <format>
#include <stdexcept>

namespace taskq::sample::batch
{
    using namespace std::chrono_literals;

    bool manager::run() noexcept(false)
    {
        logger::log(logger::level::info, std::source_location::current(),
                    "═══════════════════════════════════════════════════════════════");
        logger::log(logger::level::info, std::source_location::current(), "Batch Starting");
        logger::log(logger::level::info, std::source_location::current(),
                    "═══════════════════════════════════════════════════════════════");

        executor_ = std::make_unique<executor>();

        logger::log(logger::level::debug, std::source_location::current(), "Batch: Registering signal handlers (SIGINT, SIGTERM)");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        const queue_options options {.max_concurrent_tasks = config_.max_concurrent_jobs, .default_timeout = config_.default_timeout};
        job_queue queue(*executor_, [this](const job& j) { return process(j); }, options);

        logger::log(logger::level::info, std::source_location::current(), "Batch: {} jobs, {} at a time, {} ms timeout",
                    config_.job_count + 1u, options.max_concurrent_tasks, options.default_timeout.count());

        auto ingest = queue.create_group();
        auto report = queue.create_group();
        subscribe_events(queue, *ingest, *report);

        // Settles the next time the queue stops, after draining or after a shutdown request
        const auto stopped = queue.start_async();
        watch_signals(queue, stopped);

        for (std::uint32_t n = 1u; n <= config_.job_count; ++n)
        {
            if ((n % 2u) != 0u)
                ingest->push(make_job(n, "ingest"));
            else
                report->push(make_job(n, "report"));
        }

        // The audit job overtakes everything still pending
        queue.push(make_job(0u, "audit"), {.run_immediately = true});

        logger::log(logger::level::info, std::source_location::current(), "Batch: Running event loop");

        executor_->run_until(stopped);

        if (watcher_)
        {
            executor_->cancel_timer(*watcher_);
            watcher_.reset();
        }

        const bool complete = queue.length() == 0u;
        if (!complete)
            logger::log(logger::level::warn, std::source_location::current(), "Batch: Interrupted with {} jobs left", queue.length());

        print_statistics(queue);

        // Bodies of abandoned jobs still run to their end
        logger::log(logger::level::debug, std::source_location::current(), "Batch: Waiting for abandoned jobs to wind down");
        executor_->run();

        subscriptions_.unsubscribe();

        logger::log(logger::level::info, std::source_location::current(),
                    "═══════════════════════════════════════════════════════════════");
        logger::log(logger::level::info, std::source_location::current(), "Batch: Shutdown complete");
        logger::log(logger::level::info, std::source_location::current(),
                    "═══════════════════════════════════════════════════════════════");

        return complete;
    }

    task<void> manager::process(const job& j) noexcept(false)
    {
        logger::log(logger::level::debug, std::source_location::current(), "Job #{} [{}]: Working for {} ms on {}", j.number, j.kind,
                    j.duration.count(), common::format_bytes(j.bytes));

        co_await executor_->sleep_for(j.duration);

        if (j.poisoned)
            throw std::runtime_error(std::format("job #{} hit a malformed record", j.number));
    }

    void manager::subscribe_events(job_queue& queue, job_queue::group_type& ingest, job_queue::group_type& report)
    {
        using event = job_queue::event_type;

        queue.started().subscribe(subscriptions_, [](const lifecycle_event&) {
            logger::log(logger::level::info, std::source_location::current(), "Batch: Queue started");
        });

        queue.task_added().subscribe(subscriptions_, [](const event& e) {
            logger::log(logger::level::debug, std::source_location::current(), "Job #{} [{}]: Queued as task {}", e.value().number,
                        e.value().kind, e.id);
        });

        queue.task_started().subscribe(subscriptions_, [](const event& e) {
            logger::log(logger::level::info, std::source_location::current(), "Job #{} [{}]: Started", e.value().number, e.value().kind);
        });

        queue.task_completed().subscribe(subscriptions_, [this](const event& e) {
            ++metrics_.completed;
            metrics_.bytes_processed += e.value().bytes;
            logger::log(logger::level::info, std::source_location::current(), "Job #{} [{}]: Completed", e.value().number, e.value().kind);
        });

        queue.task_failed().subscribe(subscriptions_, [this](const event& e) {
            ++metrics_.failed;
            logger::log(logger::level::warn, std::source_location::current(), "Job #{} [{}]: Failed: {}", e.value().number, e.value().kind,
                        describe_error(e.error));
        });

        queue.task_timed_out().subscribe(subscriptions_, [this](const event& e) {
            ++metrics_.timed_out;
            logger::log(logger::level::warn, std::source_location::current(), "Job #{} [{}]: Timed out after {} ms", e.value().number,
                        e.value().kind, config_.default_timeout.count());
        });

        queue.stopped().subscribe(subscriptions_, [](const lifecycle_event&) {
            logger::log(logger::level::info, std::source_location::current(), "Batch: Queue stopped");
        });

        ingest.finished().subscribe(subscriptions_, [](const lifecycle_event&) {
            logger::log(logger::level::info, std::source_location::current(), "Batch: All ingest jobs finished");
        });

        report.finished().subscribe(subscriptions_, [](const lifecycle_event&) {
            logger::log(logger::level::info, std::source_location::current(), "Batch: All report jobs finished");
        });
    }

    void manager::watch_signals(job_queue& queue, const future& stopped) noexcept(false)
    {
        watcher_ = executor_->add_timer(100ms, [this, &queue, stopped]() {
            watcher_.reset();
            if (stopped.is_ready())
                return;

            if (g_stop_requested.load(std::memory_order_acquire))
            {
                logger::log(logger::level::info, std::source_location::current(),
                            "Batch: Shutdown requested, letting {} running jobs finish", queue.running_count());
                queue.stop();
                return;
            }

            watch_signals(queue, stopped);
        });
    }

    job manager::make_job(const std::uint32_t number, std::string kind) const
    {
        return job {
            .number = number,
            .kind = std::move(kind),
            .bytes = common::random_between(4u * 1024u, 4u * 1024u * 1024u),
            .duration = common::random_delay(config_.min_job_duration, config_.max_job_duration),
            .poisoned = (number != 0u) && (config_.poison_interval != 0u) && ((number % config_.poison_interval) == 0u)};
    }

    void manager::print_statistics(const job_queue& queue) const
    {
        const auto& stats = queue.get_stats();
        const auto& exec_stats = executor_->get_stats();

        logger::log(logger::level::info, std::source_location::current(),
                    "═══════════════════════════════════════════════════════════════");
        logger::log(logger::level::info, std::source_location::current(), "Batch Statistics:");
        logger::log(logger::level::info, std::source_location::current(), "  Jobs admitted:     {}", stats.admitted);
        logger::log(logger::level::info, std::source_location::current(), "  Jobs dispatched:   {}", stats.dispatched);
        logger::log(logger::level::info, std::source_location::current(), "  Completed:         {}", metrics_.completed);
        logger::log(logger::level::info, std::source_location::current(), "  Failed:            {}", metrics_.failed);
        logger::log(logger::level::info, std::source_location::current(), "  Timed out:         {}", metrics_.timed_out);
        logger::log(logger::level::info, std::source_location::current(), "  Priority bypasses: {}", stats.priority_bypasses);
        logger::log(logger::level::info, std::source_location::current(), "  Data processed:    {}",
                    common::format_bytes(metrics_.bytes_processed));
        logger::log(logger::level::debug, std::source_location::current(), "  Loop callbacks:    {}", exec_stats.total_callbacks);
        logger::log(logger::level::debug, std::source_location::current(), "  Timers fired:      {}", exec_stats.total_timers_fired);
        logger::log(logger::level::debug, std::source_location::current(), "  Poll waits:        {}", exec_stats.total_poll_waits);
        logger::log(logger::level::info, std::source_location::current(),
                    "═══════════════════════════════════════════════════════════════");
    }

    void manager::signal_handler(int) noexcept
    {
        g_stop_requested.store(true, std::memory_order_release);
    }

} // namespace taskq::sample::batch
