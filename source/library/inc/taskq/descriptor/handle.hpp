#pragma once
#ifndef PCH
    #include <cerrno>
    #include <cstddef>
    #include <expected>
    #include <span>
    #include <system_error>
    #include <utility>

    #include <taskq/basic_types.hpp>
#endif

namespace taskq::descriptor
{
    using io_result = std::expected<std::size_t, std::error_code>;

    [[nodiscard]] inline std::error_code errno_code(const int err = errno) noexcept
    {
        return std::error_code(err, std::generic_category());
    }

    /// @brief Owns one file descriptor and closes it on destruction.
    class handle
    {
    public:
        static constexpr fd_t none = -1;

        handle() noexcept = default;

        explicit handle(const fd_t fd) noexcept: fd_(fd) {}

        ~handle() noexcept { reset(); }

        handle(const handle&) = delete;
        handle& operator=(const handle&) = delete;

        handle(handle&& other) noexcept: fd_(std::exchange(other.fd_, none)) {}

        handle& operator=(handle&& other) noexcept
        {
            if (this != &other)
                reset(std::exchange(other.fd_, none));

            return *this;
        }

        [[nodiscard]] fd_t get() const noexcept { return fd_; }

        explicit operator bool() const noexcept { return fd_ >= 0; }

        /// @brief Closes the owned descriptor, if any, and takes ownership of fd.
        void reset(const fd_t fd = none) noexcept;

        /// @brief Single ::read into buffer; EAGAIN is returned as an error.
        [[nodiscard]] io_result read_some(std::span<char> buffer) const noexcept;

        /// @brief Single ::write of data; may write less than data.size().
        [[nodiscard]] io_result write_some(std::span<const char> data) const noexcept;

    private:
        fd_t fd_ {none};
    };

    struct pipe_ends
    {
        handle read_end;
        handle write_end;
    };

    /// @brief Opens a non-blocking, close-on-exec pipe.
    [[nodiscard]] std::expected<pipe_ends, std::error_code> open_pipe() noexcept;
} // namespace taskq::descriptor
