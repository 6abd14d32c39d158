#pragma once
#ifndef PCH
    #include <rxcpp/rx.hpp>

    #include <taskq/executor.hpp>
    #include <taskq/future.hpp>
#endif

namespace taskq
{
    /// @brief Returns a future settled by the next emission on finished,
    /// or an already settled one if there is nothing left to wait for.
    template <typename Event>
    [[nodiscard]] future when_finished(executor& exec, const bool already_finished, const rxcpp::observable<Event>& finished)
        noexcept(false)
    {
        if (already_finished)
            return future::make_ready(exec);

        const promise p(exec);
        finished.take(1).subscribe([p](const Event&) { p.set_value(); });
        return p.get_future();
    }

} // namespace taskq
