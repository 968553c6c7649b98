// bridge.hpp - run blocking-style code as a pollable task
//
// SPDX-License-Identifier: MIT OR Unlicense
//
// sync() wraps a closure into a task an executor can poll. The closure runs on
// a coroutine of its own and may call wait() on any pollable; wait() parks the
// coroutine until the pollable is ready, so the closure reads like ordinary
// blocking code while the executor thread never blocks.

#pragma once

#include "symco/config.hpp"
#include "symco/coroutine.hpp"
#include "symco/error.hpp"
#include "symco/log.hpp"
#include "symco/stack.hpp"

#include <concepts>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace symco
{
    // ============================================================================
    // Poll Protocol
    // ============================================================================

    // Tells the executor a pending task is worth polling again.
    class waker
    {
    public:
        waker() = default;
        explicit waker(std::function<void()> wake) : wake_{std::move(wake)} {}

        void wake() const
        {
            if (wake_)
                wake_();
        }

        [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(wake_); }

    private:
        std::function<void()> wake_;
    };

    class poll_context
    {
    public:
        explicit poll_context(waker w) : waker_{std::move(w)} {}

        [[nodiscard]] auto get_waker() const noexcept -> waker const & { return waker_; }

    private:
        waker waker_;
    };

    // poll() returns the output once ready; until then std::nullopt, after
    // arranging for the context's waker to be called.
    template <typename F>
    concept pollable = requires(F &future, poll_context &cx) {
        typename F::output_type;
        { future.poll(cx) } -> std::same_as<std::optional<typename F::output_type>>;
    };

    template <typename T>
    class ready_future
    {
    public:
        using output_type = T;

        explicit ready_future(T value) : value_{std::move(value)} {}

        auto poll(poll_context &) -> std::optional<T> { return std::exchange(value_, std::nullopt); }

    private:
        std::optional<T> value_;
    };

    template <typename T>
    [[nodiscard]] auto ready(T value) -> ready_future<T>
    {
        return ready_future<T>{std::move(value)};
    }

    namespace detail
    {
        // Built by wait() on the coroutine's stack and polled by the driver.
        struct wait_record
        {
            bool (*poll)(wait_record &record, poll_context &cx);
            void *future;
            void *output;
        };

        template <typename F>
        auto poll_erased(wait_record &record, poll_context &cx) -> bool
        {
            auto &future = *static_cast<F *>(record.future);
            auto &output = *static_cast<std::optional<typename F::output_type> *>(record.output);
            output = future.poll(cx);
            return output.has_value();
        }

        // control record of the bridged coroutine currently being driven
        [[nodiscard]] auto active_bridge() noexcept -> void *&;

        class bridge_scope
        {
        public:
            explicit bridge_scope(void *ctl) noexcept : saved_{std::exchange(active_bridge(), ctl)} {}
            ~bridge_scope() { active_bridge() = saved_; }

            bridge_scope(bridge_scope const &) = delete;
            auto operator=(bridge_scope const &) -> bridge_scope & = delete;

        private:
            void *saved_;
        };

        template <typename F>
        using closure_output_t = std::conditional_t<std::is_void_v<std::invoke_result_t<F &>>,
                                                    std::monostate,
                                                    std::invoke_result_t<F &>>;
    } // namespace detail

    // True when wait() may be called: the innermost coroutine on this thread is
    // the one a sync() task is driving.
    [[nodiscard]] inline auto in_sync_context() noexcept -> bool
    {
        void *const active = detail::active_bridge();
        return active != nullptr && active == running<default_resumer>().raw();
    }

    // Parks the calling closure until `future` is ready and returns its output.
    // Fatal outside a sync() closure.
    template <typename P>
        requires pollable<std::remove_cvref_t<P>>
    auto wait(P &&future) -> typename std::remove_cvref_t<P>::output_type
    {
        using F = std::remove_cvref_t<P>;

        if (!in_sync_context())
            detail::fatal("wait() called outside of a sync() closure");

        std::optional<typename F::output_type> output;
        detail::wait_record record{&detail::poll_erased<F>, std::addressof(future), &output};
        running<default_resumer>().suspend(&record);
        // the driver only resumes once the record reported ready
        return std::move(*output);
    }

    // ============================================================================
    // Sync Task
    // ============================================================================

    // Dropping a pending task force-unwinds the closure, so its destructors run
    // exactly once, before the stack goes away.
    template <typename F>
    class [[nodiscard]] sync_task
    {
    public:
        using output_type = detail::closure_output_t<F>;

        sync_task(F closure, stack_size size)
            : state_{std::make_unique<task_state>(std::move(closure), size)} {}

        sync_task(sync_task &&) noexcept = default;
        auto operator=(sync_task &&) noexcept -> sync_task & = default;
        sync_task(sync_task const &) = delete;
        auto operator=(sync_task const &) -> sync_task & = delete;
        ~sync_task() = default;

        // Exceptions escaping the closure are rethrown here. Polling a completed
        // task is fatal; polling a moved-from one throws coroutine_error.
        auto poll(poll_context &cx) -> std::optional<output_type>
        {
            if (state_ == nullptr)
                throw coroutine_error{error::invalid_coroutine};
            auto &st = *state_;
            if (st.completed)
                detail::fatal("sync_task polled after completion");
            if (!st.co)
                start(st);

            for (;;)
            {
                if (st.waiting != nullptr)
                {
                    if (!st.waiting->poll(*st.waiting, cx))
                        return std::nullopt;
                    st.waiting = nullptr;
                }

                std::expected<void *, error> yielded;
                try
                {
                    detail::bridge_scope scope{st.co->handle().raw()};
                    yielded = st.co->resume();
                }
                catch (...)
                {
                    st.completed = true;
                    st.co.reset();
                    throw;
                }
                if (!yielded)
                    throw coroutine_error{yielded.error()};

                if (st.co->done())
                {
                    st.completed = true;
                    st.co.reset();
                    return std::move(st.result);
                }
                st.waiting = static_cast<detail::wait_record *>(*yielded);
            }
        }

        [[nodiscard]] auto done() const noexcept -> bool { return state_ == nullptr || state_->completed; }
        [[nodiscard]] auto valid() const noexcept -> bool { return state_ != nullptr; }

    private:
        struct task_state
        {
            task_state(F f, stack_size s) : closure{std::move(f)}, size{s} {}

            F closure;
            stack_size size;
            std::optional<output_type> result;
            detail::wait_record *waiting = nullptr;
            bool completed = false;
            // last: unwound before the closure and the result it may touch go away
            std::optional<coroutine> co;
        };

        static void start(task_state &st)
        {
            auto stack = st.size.value == default_stack_size.value && !detail::stack_pool_retired()
                             ? stack_pool::local().acquire()
                             : allocate_stack(stack_size{detail::normalize_stack_size(st.size.value)});
            if (!stack)
                throw coroutine_error{stack.error()};

            auto body = [s = &st](coroutine::handle_type, void *) -> void *
            {
                if constexpr (std::is_void_v<std::invoke_result_t<F &>>)
                {
                    std::invoke(s->closure);
                    s->result.emplace();
                }
                else
                {
                    s->result.emplace(std::invoke(s->closure));
                }
                return nullptr;
            };

            auto created = coroutine::create(std::move(body), relay_hook(), std::move(*stack));
            if (!created)
                throw coroutine_error{created.error()};
            st.co.emplace(std::move(*created));
        }

        std::unique_ptr<task_state> state_;
    };

    // The closure may block on wait(); it starts running on the first poll.
    template <typename F>
    [[nodiscard]] auto sync(F &&closure, stack_size size = default_stack_size) -> sync_task<std::decay_t<F>>
    {
        return sync_task<std::decay_t<F>>{std::forward<F>(closure), size};
    }
} // namespace symco
