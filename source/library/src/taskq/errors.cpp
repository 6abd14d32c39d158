#include "taskq/errors.hpp"

#include <format>

namespace taskq
{
    timeout_error::timeout_error(const milliseconds elapsed):
        std::runtime_error(std::format("Task timed out after {} milliseconds", elapsed.count())),
        elapsed_(elapsed)
    {
    }

    std::exception_ptr normalize_error(std::exception_ptr error) noexcept
    {
        if (!error)
            return error;

        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception&)
        {
            return error;
        }
        catch (const std::string& message)
        {
            return std::make_exception_ptr(task_error(message));
        }
        catch (const char* message)
        {
            return std::make_exception_ptr(task_error(message ? message : "task failed with a null message"));
        }
        catch (...)
        {
            return std::make_exception_ptr(task_error("task failed with a non-standard exception"));
        }
    }

    std::string describe_error(const std::exception_ptr& error) noexcept(false)
    {
        if (!error)
            return "none";

        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception& e)
        {
            return e.what();
        }
        catch (...)
        {
            return "unknown exception";
        }
    }

} // namespace taskq
