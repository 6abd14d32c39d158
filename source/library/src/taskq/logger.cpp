#include "taskq/logger.hpp"

#include <cstdlib>

namespace taskq::logger
{
    std::optional<level> parse_level(const std::string_view text) noexcept
    {
        if (text == "debug")
            return level::debug;

        if (text == "info")
            return level::info;

        if ((text == "warn") || (text == "warning"))
            return level::warn;

        if (text == "error")
            return level::error;

        return std::nullopt;
    }

    bool configure_from_environment() noexcept
    {
        const char* const value = std::getenv("TASKQ_LOG_LEVEL");
        if (value == nullptr)
            return false;

        const auto parsed = parse_level(value);
        if (!parsed)
        {
            log(level::warn, std::source_location::current(), "Ignoring unknown TASKQ_LOG_LEVEL '{}'", value);
            return false;
        }

        set_level(*parsed);
        return true;
    }
} // namespace taskq::logger
