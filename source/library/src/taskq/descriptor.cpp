#include "taskq/descriptor/handle.hpp"
#include "taskq/descriptor/poller.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace taskq::descriptor
{
    void handle::reset(const fd_t fd) noexcept
    {
        if (fd_ >= 0)
            ::close(fd_);

        fd_ = fd;
    }

    io_result handle::read_some(const std::span<char> buffer) const noexcept
    {
        if (fd_ < 0)
            return std::unexpected(errno_code(EBADF));

        const ssize_t n = ::read(fd_, buffer.data(), buffer.size());
        if (n < 0)
            return std::unexpected(errno_code());

        return static_cast<std::size_t>(n);
    }

    io_result handle::write_some(const std::span<const char> data) const noexcept
    {
        if (fd_ < 0)
            return std::unexpected(errno_code(EBADF));

        const ssize_t n = ::write(fd_, data.data(), data.size());
        if (n < 0)
            return std::unexpected(errno_code());

        return static_cast<std::size_t>(n);
    }

    std::expected<pipe_ends, std::error_code> open_pipe() noexcept
    {
        int fds[2] {handle::none, handle::none};
        if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) < 0)
            return std::unexpected(errno_code());

        return pipe_ends {handle(fds[0]), handle(fds[1])};
    }

    std::expected<poller, std::error_code> poller::open(const std::size_t capacity) noexcept(false)
    {
        handle fd(::epoll_create1(EPOLL_CLOEXEC));
        if (!fd)
            return std::unexpected(errno_code());

        return poller(std::move(fd), (capacity == 0u) ? 1u : capacity);
    }

    poller::result_t poller::watch(const fd_t fd) noexcept
    {
        epoll_event ev {};
        ev.events = interest;
        ev.data.fd = fd;

        if (::epoll_ctl(fd_.get(), EPOLL_CTL_ADD, fd, &ev) < 0)
            return std::unexpected(errno_code());

        return {};
    }

    poller::result_t poller::forget(const fd_t fd) noexcept
    {
        if (::epoll_ctl(fd_.get(), EPOLL_CTL_DEL, fd, nullptr) < 0)
            return std::unexpected(errno_code());

        return {};
    }

    std::expected<std::span<const epoll_event>, std::error_code> poller::wait(const int timeout_ms) noexcept
    {
        const int ready = ::epoll_wait(fd_.get(), ready_.data(), static_cast<int>(ready_.size()), timeout_ms);
        if (ready < 0)
            return std::unexpected(errno_code());

        return std::span<const epoll_event>(ready_.data(), static_cast<std::size_t>(ready));
    }
} // namespace taskq::descriptor
