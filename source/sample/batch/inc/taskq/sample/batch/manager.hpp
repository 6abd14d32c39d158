#pragma once
#include <taskq/executor.hpp>
#include <taskq/future.hpp>
#include <taskq/logger.hpp>
#include <taskq/queue.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace taskq::sample::batch
{
    // Batch configuration
    struct config
    {
        std::uint32_t job_count = 16u;
        std::uint32_t max_concurrent_jobs = 3u;
        std::chrono::milliseconds default_timeout {150};
        std::chrono::milliseconds min_job_duration {20};
        std::chrono::milliseconds max_job_duration {220};

        // Every n-th job throws instead of completing
        std::uint32_t poison_interval = 7u;
    };

    // One simulated unit of work
    struct job
    {
        std::uint32_t number {};
        std::string kind;
        std::uint64_t bytes {};
        std::chrono::milliseconds duration {};
        bool poisoned {};
    };

    // Batch statistics
    struct metric_data
    {
        std::uint64_t completed {};
        std::uint64_t failed {};
        std::uint64_t timed_out {};
        std::uint64_t bytes_processed {};
    };

    /// @brief Runs a batch of simulated jobs through a bounded queue split into two groups
    class manager
    {
    public:
        using job_queue = item_queue<job>;

        explicit manager(config config = {}): config_(std::move(config)) {}

        const metric_data& metrics() const noexcept { return metrics_; }

        /// @brief Run the batch
        /// @return false if the batch was interrupted before every job finished
        [[nodiscard]] bool run() noexcept(false);

    private:
        /// @brief Simulates the work of a single job
        [[nodiscard]] task<void> process(const job& j) noexcept(false);

        /// @brief Logs the event stream of the queue and of both groups
        void subscribe_events(job_queue& queue, job_queue::group_type& ingest, job_queue::group_type& report);

        /// @brief Stops the queue once a shutdown signal arrived
        void watch_signals(job_queue& queue, const future& stopped) noexcept(false);

        [[nodiscard]] job make_job(const std::uint32_t number, std::string kind) const;

        /// @brief Print batch statistics
        void print_statistics(const job_queue& queue) const;

        /// @brief Signal handler for graceful shutdown
        static void signal_handler(int signum) noexcept;

        config config_;
        std::unique_ptr<executor> executor_;
        std::optional<executor::timer_id> watcher_;
        rxcpp::composite_subscription subscriptions_;
        metric_data metrics_;

        static inline std::atomic_bool g_stop_requested {};
    };

} // namespace taskq::sample::batch
