#pragma once
#ifndef PCH
    #include <exception>
    #include <stdexcept>
    #include <string>

    #include <taskq/basic_types.hpp>
#endif

namespace taskq
{
    /// @brief A task body failed with something that was not a std::exception.
    class task_error: public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief A task was abandoned because it did not finish within its timeout.
    /// The task body itself keeps running; only the queue stopped waiting for it.
    class timeout_error: public std::runtime_error
    {
    public:
        explicit timeout_error(const milliseconds elapsed);

        [[nodiscard]] milliseconds elapsed() const noexcept { return elapsed_; }

    private:
        milliseconds elapsed_;
    };

    /// @brief Keeps std::exception derived errors as they are and wraps anything else in task_error.
    /// A thrown string keeps its text as the message.
    [[nodiscard]] std::exception_ptr normalize_error(std::exception_ptr error) noexcept;

    /// @brief Returns what() of the stored exception, or a placeholder for foreign types.
    [[nodiscard]] std::string describe_error(const std::exception_ptr& error) noexcept(false);

} // namespace taskq
