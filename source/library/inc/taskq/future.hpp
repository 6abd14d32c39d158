#pragma once
#ifndef PCH
    #include <coroutine>
    #include <exception>
    #include <functional>
    #include <memory>
    #include <vector>
#endif

namespace taskq
{
    class executor;

    namespace detail
    {
        struct future_state
        {
            using continuation = std::move_only_function<void(std::exception_ptr)>;

            explicit future_state(executor& owner) noexcept: owner_(owner) {}

            bool settle(std::exception_ptr error) noexcept(false);

            void add_continuation(continuation&& fn) noexcept(false);

            executor& owner_;
            bool settled_ {};
            std::exception_ptr error_;
            std::vector<continuation> continuations_;
        };
    } // namespace detail

    /// @brief Read side of a completion signal without a value.
    /// Copies share the same state; continuations run on the owning executor, never inline.
    class future
    {
    public:
        using continuation = detail::future_state::continuation;

        future() noexcept = default;

        /// @brief Returns a future that has already completed successfully.
        [[nodiscard]] static future make_ready(executor& owner) noexcept(false);

        [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(state_); }

        [[nodiscard]] bool is_ready() const noexcept { return state_ && state_->settled_; }

        [[nodiscard]] bool has_failed() const noexcept { return is_ready() && static_cast<bool>(state_->error_); }

        /// @brief The failure, or nullptr while pending or on success.
        [[nodiscard]] std::exception_ptr error() const noexcept { return is_ready() ? state_->error_ : nullptr; }

        /// @brief Rethrows the failure of a settled future.
        /// @throws std::logic_error if the future is invalid or still pending.
        void get() const noexcept(false);

        /// @brief Calls fn with the outcome once settled, on a later executor iteration.
        /// @throws std::logic_error if the future is invalid.
        void then(continuation&& fn) noexcept(false);

        bool await_ready() const noexcept { return is_ready(); }

        void await_suspend(std::coroutine_handle<> h) noexcept(false)
        {
            then([h](std::exception_ptr) { h.resume(); });
        }

        void await_resume() const noexcept(false) { get(); }

        [[nodiscard]] friend bool operator==(const future&, const future&) noexcept = default;

    private:
        friend class promise;

        explicit future(std::shared_ptr<detail::future_state> state) noexcept: state_(std::move(state)) {}

        std::shared_ptr<detail::future_state> state_;
    };

    /// @brief Write side of a future. A promise is a handle: copies settle the same state.
    class promise
    {
    public:
        /// @throws std::bad_alloc if the shared state cannot be allocated.
        explicit promise(executor& owner) noexcept(false);

        [[nodiscard]] future get_future() const noexcept { return future(state_); }

        /// @return false if the state was already settled.
        bool set_value() const noexcept(false);

        /// @return false if the state was already settled.
        bool set_exception(std::exception_ptr error) const noexcept(false);

        [[nodiscard]] bool is_settled() const noexcept { return state_->settled_; }

    private:
        std::shared_ptr<detail::future_state> state_;
    };

} // namespace taskq
