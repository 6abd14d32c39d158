#pragma once
#ifndef PCH
    #include <concepts>
    #include <coroutine>
    #include <exception>
    #include <optional>
    #include <stdexcept>
    #include <type_traits>
    #include <utility>
#endif

namespace taskq
{
    template <typename T>
    class [[nodiscard]] task;

    namespace detail
    {
        /// @brief Coroutine and failure bookkeeping shared by all task promises.
        class promise_base
        {
        public:
            // Hands control back to the awaiting coroutine once the body is done
            struct final_awaiter
            {
                bool await_ready() const noexcept { return false; }

                template <typename Promise>
                std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> self) const noexcept
                {
                    const auto next = self.promise().awaiting_;
                    return next ? next : std::noop_coroutine();
                }

                void await_resume() const noexcept {}
            };

            std::suspend_always initial_suspend() const noexcept { return {}; }

            final_awaiter final_suspend() const noexcept { return {}; }

            void unhandled_exception() noexcept { failure_ = std::current_exception(); }

            void set_awaiting(const std::coroutine_handle<> h) noexcept { awaiting_ = h; }

        protected:
            void rethrow_failure() const noexcept(false)
            {
                if (failure_)
                    std::rethrow_exception(failure_);
            }

        private:
            std::coroutine_handle<> awaiting_;
            std::exception_ptr failure_;
        };

        template <typename T>
        class task_promise: public promise_base
        {
        public:
            [[nodiscard]] task<T> get_return_object() noexcept;

            template <typename U>
                requires std::convertible_to<U, T>
            void return_value(U&& value) noexcept(std::is_nothrow_constructible_v<T, U>)
            {
                value_.emplace(std::forward<U>(value));
            }

            /// @brief Moves the result out, or rethrows what the body threw.
            T take() noexcept(false)
            {
                rethrow_failure();
                return std::move(*value_);
            }

        private:
            std::optional<T> value_;
        };

        template <>
        class task_promise<void>: public promise_base
        {
        public:
            [[nodiscard]] task<void> get_return_object() noexcept;

            void return_void() const noexcept {}

            void take() const noexcept(false) { rethrow_failure(); }
        };
    } // namespace detail

    /// @brief A lazy coroutine task. Nothing runs until the task is awaited,
    /// and the awaiting coroutine resumes as soon as the body finishes.
    template <typename T = void>
    class [[nodiscard]] task
    {
    public:
        using promise_type = detail::task_promise<T>;
        using handle_type = std::coroutine_handle<promise_type>;

        task() noexcept = default;

        explicit task(const handle_type h) noexcept: handle_(h) {}

        ~task() noexcept { reset(); }

        task(const task&) = delete;
        task& operator=(const task&) = delete;

        task(task&& other) noexcept: handle_(std::exchange(other.handle_, {})) {}

        task& operator=(task&& other) noexcept
        {
            if (this != &other)
            {
                reset();
                handle_ = std::exchange(other.handle_, {});
            }

            return *this;
        }

        /// @brief True if the task owns a coroutine frame.
        [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(handle_); }

        [[nodiscard]] bool done() const noexcept { return !handle_ || handle_.done(); }

        /// @brief Awaiting an empty task of void completes at once; of any other type it throws.
        auto operator co_await() const noexcept
        {
            struct awaiter
            {
                handle_type body;

                bool await_ready() const noexcept { return !body || body.done(); }

                std::coroutine_handle<> await_suspend(const std::coroutine_handle<> caller) const noexcept
                {
                    body.promise().set_awaiting(caller);
                    return body;
                }

                T await_resume() const noexcept(false)
                {
                    if (body)
                        return body.promise().take();

                    if constexpr (!std::is_void_v<T>)
                        throw std::logic_error("awaited an empty task");
                }
            };

            return awaiter {handle_};
        }

    private:
        void reset() noexcept
        {
            if (handle_)
                std::exchange(handle_, {}).destroy();
        }

        handle_type handle_;
    };

    namespace detail
    {
        template <typename T>
        task<T> task_promise<T>::get_return_object() noexcept
        {
            return task<T>(std::coroutine_handle<task_promise<T>>::from_promise(*this));
        }

        inline task<void> task_promise<void>::get_return_object() noexcept
        {
            return task<void>(std::coroutine_handle<task_promise<void>>::from_promise(*this));
        }
    } // namespace detail

} // namespace taskq
