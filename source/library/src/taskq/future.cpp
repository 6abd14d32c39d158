#include "taskq/future.hpp"

#include "taskq/executor.hpp"
#include <stdexcept>

namespace taskq
{
    namespace detail
    {
        bool future_state::settle(std::exception_ptr error) noexcept(false)
        {
            if (settled_)
                return false;

            settled_ = true;
            error_ = std::move(error);

            for (auto& fn: std::exchange(continuations_, {}))
                owner_.defer([fn = std::move(fn), error = error_]() mutable { fn(error); });

            return true;
        }

        void future_state::add_continuation(continuation&& fn) noexcept(false)
        {
            if (settled_)
            {
                owner_.defer([fn = std::move(fn), error = error_]() mutable { fn(error); });
                return;
            }

            continuations_.push_back(std::move(fn));
        }
    } // namespace detail

    future future::make_ready(executor& owner) noexcept(false)
    {
        const promise p(owner);
        p.set_value();
        return p.get_future();
    }

    void future::get() const noexcept(false)
    {
        if (!state_)
            throw std::logic_error("future has no shared state");

        if (!state_->settled_)
            throw std::logic_error("future is not ready");

        if (state_->error_)
            std::rethrow_exception(state_->error_);
    }

    void future::then(continuation&& fn) noexcept(false)
    {
        if (!state_)
            throw std::logic_error("future has no shared state");

        state_->add_continuation(std::move(fn));
    }

    promise::promise(executor& owner) noexcept(false): state_(std::make_shared<detail::future_state>(owner))
    {
    }

    bool promise::set_value() const noexcept(false)
    {
        return state_->settle(nullptr);
    }

    bool promise::set_exception(std::exception_ptr error) const noexcept(false)
    {
        return state_->settle(std::move(error));
    }

} // namespace taskq
