#pragma once
#ifndef PCH
    #include <atomic>
    #include <cstdio>
    #include <exception>
    #include <format>
    #include <optional>
    #include <print>
    #include <source_location>
    #include <string_view>
    #include <utility>
#endif

namespace taskq::logger
{
    enum class level
    {
        debug,
        info,
        warn,
        error
    };

    namespace detail
    {
        [[nodiscard]] constexpr char level_to_char(const level l) noexcept
        {
            switch (l)
            {
                case level::debug:
                    return 'D';
                case level::info:
                    return 'I';
                case level::warn:
                    return 'W';
                case level::error:
                    return 'E';
            }

            return '?';
        }

        /// @brief Strips the directories from a source path.
        [[nodiscard]] constexpr std::string_view base_name(const std::string_view path) noexcept
        {
            const auto slash = path.find_last_of('/');
            return (slash == std::string_view::npos) ? path : path.substr(slash + 1u);
        }

        inline std::atomic<level>& threshold() noexcept
        {
            static std::atomic<level> value {level::info};
            return value;
        }
    }

    /// @brief Sets the lowest level that is still printed.
    inline void set_level(const level lvl) noexcept
    {
        detail::threshold().store(lvl, std::memory_order_relaxed);
    }

    [[nodiscard]] inline level get_level() noexcept
    {
        return detail::threshold().load(std::memory_order_relaxed);
    }

    [[nodiscard]] inline bool is_enabled(const level lvl) noexcept
    {
        return lvl >= get_level();
    }

    /// @brief Parses "debug", "info", "warn" or "error".
    [[nodiscard]] std::optional<level> parse_level(std::string_view text) noexcept;

    /// @brief Applies TASKQ_LOG_LEVEL when it is set to a valid level name.
    /// @return true if the environment changed the threshold.
    bool configure_from_environment() noexcept;

    /// @brief Logs a formatted message to stdout/stderr.
    /// @note Guaranteed not to throw; a formatting failure is reported on stderr instead.
    template <typename... Args>
    void log(const level lvl, const std::source_location& loc, std::format_string<Args...> fmt, Args&&... args) noexcept
    {
        if (!is_enabled(lvl))
            return;

        try
        {
            auto* const stream = (lvl == level::error) ? stderr : stdout;
            std::println(stream, "[{}] [{}:{}] {}", detail::level_to_char(lvl), detail::base_name(loc.file_name()), loc.line(),
                         std::format(fmt, std::forward<Args>(args)...));
            std::fflush(stream);
        }
        catch (const std::exception& e)
        {
            std::fputs("[E] [logger] failed to format log message: ", stderr);
            std::fputs(e.what(), stderr);
            std::fputc('\n', stderr);
        }
    }

} // namespace taskq::logger
