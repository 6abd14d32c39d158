#pragma once
#ifndef PCH
    #include <cstdint>
    #include <span>
    #include <sys/epoll.h>
    #include <vector>

    #include <taskq/descriptor/handle.hpp>
#endif

namespace taskq::descriptor
{
    /// @brief The epoll instance an executor sleeps on between timers.
    /// Descriptors are watched edge-triggered for both directions at once.
    class poller
    {
    public:
        using result_t = std::expected<void, std::error_code>;

        static constexpr std::uint32_t interest = EPOLLIN | EPOLLOUT | EPOLLERR | EPOLLHUP | EPOLLET;

        /// @param capacity Most events returned by one wait().
        /// @throws std::bad_alloc if the event buffer cannot be allocated.
        [[nodiscard]] static std::expected<poller, std::error_code> open(const std::size_t capacity) noexcept(false);

        [[nodiscard]] result_t watch(const fd_t fd) noexcept;

        [[nodiscard]] result_t forget(const fd_t fd) noexcept;

        /// @brief Blocks for up to timeout_ms (-1 without limit) and returns the ready entries.
        /// The returned span is valid until the next call.
        [[nodiscard]] std::expected<std::span<const epoll_event>, std::error_code> wait(const int timeout_ms) noexcept;

    private:
        poller(handle fd, const std::size_t capacity): fd_(std::move(fd)), ready_(capacity) {}

        handle fd_;
        std::vector<epoll_event> ready_;
    };
} // namespace taskq::descriptor
