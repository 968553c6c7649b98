// coroutine.hpp - symmetric stackful coroutines and the panic relay
//
// SPDX-License-Identifier: MIT OR Unlicense

#pragma once

#include "symco/backend.hpp"
#include "symco/config.hpp"
#include "symco/error.hpp"
#include "symco/log.hpp"
#include "symco/stack.hpp"

#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <utility>

namespace symco
{
    template <resumer R>
    class basic_coroutine;

    template <resumer R>
    class coroutine_handle;

    // Injected into a suspended coroutine that is being destroyed. It unwinds the
    // coroutine's frames on the coroutine's own stack and is consumed by the
    // coroutine's entry. Deliberately not a std::exception.
    struct forced_unwind
    {
    };

    // ============================================================================
    // Panic Hooks
    // ============================================================================

    // Decides what happens after an exception escapes a coroutine body:
    //   a coroutine    rewind into it; it receives a std::exception_ptr* as data
    //   std::nullopt   relay; resume() rethrows on the resumer's stack
    // To abort, the hook simply never returns (see abort_hook).
    template <resumer R>
    using panic_hook = std::function<std::optional<basic_coroutine<R>>(std::exception_ptr)>;

    namespace detail
    {
        [[nodiscard]] auto describe(std::exception_ptr const &payload) -> std::string;

        [[noreturn]] void abort_on_panic(std::exception_ptr const &payload) noexcept;

        template <resumer R>
        struct coroutine_control
        {
            using context_type = typename R::context;

            state status = state::created;
            context_type self;     // held while created or suspended
            context_type resumer;  // held while running
            context_type handoff;  // what the exit switch hands to its target
            void *handoff_data = nullptr;
            stack_region stack;
            std::function<void *(coroutine_handle<R>, void *)> body;
            panic_hook<R> hook;
            void *in = nullptr;
            void *out = nullptr;
            std::exception_ptr payload;
            bool relay = false;
            bool unwinding = false;
            coroutine_control *previous = nullptr;
            std::unique_ptr<basic_coroutine<R>> successor;

            // innermost coroutine running on this thread
            static inline thread_local coroutine_control *current = nullptr;
        };
    } // namespace detail

    // Top-level default: there is no meaningful continuation, so give up.
    template <resumer R = default_resumer>
    [[nodiscard]] auto abort_hook() -> panic_hook<R>
    {
        return [](std::exception_ptr payload) -> std::optional<basic_coroutine<R>>
        {
            detail::abort_on_panic(payload);
        };
    }

    // For coroutines nested under a caller that knows how to handle exceptions.
    template <resumer R = default_resumer>
    [[nodiscard]] auto relay_hook() -> panic_hook<R>
    {
        return [](std::exception_ptr) -> std::optional<basic_coroutine<R>>
        {
            return std::nullopt;
        };
    }

    // ============================================================================
    // Coroutine Handle
    // ============================================================================

    // Non-owning view handed to the body; it is how the body suspends.
    template <resumer R>
    class coroutine_handle
    {
        using control = detail::coroutine_control<R>;

    public:
        constexpr coroutine_handle() noexcept = default;
        constexpr explicit coroutine_handle(control *ctl) noexcept : ctl_{ctl} {}

        // Switch back to whoever last resumed this coroutine, handing it `data`.
        // Returns the data of the next resume(). Fails with not_running unless
        // called by the coroutine itself.
        [[nodiscard]] auto try_suspend(void *data = nullptr) const -> std::expected<void *, error>
        {
            if (ctl_ == nullptr)
                return std::unexpected{error::invalid_coroutine};
            if (ctl_->status != state::running || control::current != ctl_)
                return std::unexpected{error::not_running};
            // someone swallowed the forced unwind; keep unwinding
            if (ctl_->unwinding)
                throw forced_unwind{};

            ctl_->out = data;
            ctl_->status = state::suspended;
            control::current = ctl_->previous;
            auto t = R::resume({std::move(ctl_->resumer), ctl_});
            ctl_->resumer = std::move(t.context);
            return ctl_->in;
        }

        auto suspend(void *data = nullptr) const -> void *
        {
            auto result = try_suspend(data);
            if (!result)
                detail::fatal("suspend() outside of its coroutine: {}", result.error());
            return *result;
        }

        [[nodiscard]] auto status() const noexcept -> state { return ctl_ != nullptr ? ctl_->status : state::finished; }
        [[nodiscard]] constexpr auto valid() const noexcept -> bool { return ctl_ != nullptr; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return valid(); }
        [[nodiscard]] constexpr auto raw() const noexcept -> control * { return ctl_; }

        [[nodiscard]] constexpr auto operator==(coroutine_handle const &) const noexcept -> bool = default;

    private:
        control *ctl_{nullptr};
    };

    template <resumer R = default_resumer>
    [[nodiscard]] auto running() noexcept -> coroutine_handle<R>
    {
        return coroutine_handle<R>{detail::coroutine_control<R>::current};
    }

    template <resumer R = default_resumer>
    auto suspend(void *data = nullptr) -> void *
    {
        return running<R>().suspend(data);
    }

    // ============================================================================
    // Coroutine
    // ============================================================================

    // States: created -> running <-> suspended -> {finished | panicked}.
    //
    // The body runs on its own stack. When it returns, throws, or finishes being
    // force-unwound, the entry switches back to the last resumer and the stack is
    // released by an on-top callback that runs on the far side of that switch,
    // i.e. never on the stack being released.
    template <resumer R = default_resumer>
    class [[nodiscard]] basic_coroutine
    {
        using control = detail::coroutine_control<R>;
        using transfer_type = typename R::transfer_type;

    public:
        using resumer_type = R;
        using handle_type = coroutine_handle<R>;
        using function_type = std::function<void *(handle_type, void *)>;
        using hook_type = panic_hook<R>;

        // An empty hook means abort_hook.
        [[nodiscard]] static auto create(function_type body, hook_type hook = {}, stack_size size = default_stack_size) noexcept -> std::expected<basic_coroutine, error>
        {
            if (!body)
                return std::unexpected{error::invalid_arguments};
            auto stack = allocate_stack(stack_size{detail::normalize_stack_size(size.value)});
            if (!stack)
                return std::unexpected{stack.error()};
            return create(std::move(body), std::move(hook), std::move(*stack));
        }

        // Runs on a caller-provided region, taking ownership of it.
        [[nodiscard]] static auto create(function_type body, hook_type hook, stack_region stack) noexcept -> std::expected<basic_coroutine, error>
        {
            if (!body || !stack)
                return std::unexpected{error::invalid_arguments};

            std::unique_ptr<control> ctl{new (std::nothrow) control{}};
            if (ctl == nullptr)
                return std::unexpected{error::out_of_memory};

            auto ctx = R::new_on(stack.bytes(), &basic_coroutine::entry);
            if (!ctx)
                return std::unexpected{ctx.error()};

            log_trace("coroutine {} created on {} byte stack", fmt::ptr(ctl.get()), stack.size());
            ctl->self = std::move(*ctx);
            ctl->stack = std::move(stack);
            ctl->body = std::move(body);
            ctl->hook = std::move(hook);
            return basic_coroutine{std::move(ctl)};
        }

        basic_coroutine(basic_coroutine const &) = delete;
        auto operator=(basic_coroutine const &) -> basic_coroutine & = delete;

        basic_coroutine(basic_coroutine &&other) noexcept = default;

        auto operator=(basic_coroutine &&other) noexcept -> basic_coroutine &
        {
            if (this != &other)
            {
                destroy();
                ctl_ = std::move(other.ctl_);
            }
            return *this;
        }

        ~basic_coroutine() { destroy(); }

        // Switch in, handing over `data`; returns what the coroutine passed back
        // when it suspended, or its final result when it terminated. A panic the
        // hook relays is rethrown here.
        [[nodiscard]] auto resume(void *data = nullptr) -> std::expected<void *, error>
        {
            if (ctl_ == nullptr)
                return std::unexpected{error::invalid_coroutine};
            if (is_terminal(ctl_->status))
                return std::unexpected{error::coroutine_terminated};
            if (ctl_->status == state::running)
                return std::unexpected{error::not_suspended};

            control *ctl = ctl_.get();
            ctl->in = data;
            ctl->status = state::running;
            ctl->previous = control::current;
            control::current = ctl;

            control *from = receive(R::resume({std::move(ctl->self), ctl}));
            if (from->relay)
            {
                from->relay = false;
                std::rethrow_exception(from->payload);
            }
            return from->out;
        }

        [[nodiscard]] auto status() const noexcept -> state { return ctl_ != nullptr ? ctl_->status : state::finished; }
        [[nodiscard]] auto done() const noexcept -> bool { return is_terminal(status()); }
        [[nodiscard]] auto suspended() const noexcept -> bool { return status() == state::suspended || status() == state::created; }
        [[nodiscard]] auto panicked() const noexcept -> bool { return status() == state::panicked; }
        [[nodiscard]] auto valid() const noexcept -> bool { return ctl_ != nullptr; }
        [[nodiscard]] explicit operator bool() const noexcept { return valid(); }
        [[nodiscard]] auto handle() const noexcept -> handle_type { return handle_type{ctl_.get()}; }

        // The exception that terminated this coroutine, if any.
        [[nodiscard]] auto payload() const noexcept -> std::exception_ptr { return ctl_ != nullptr ? ctl_->payload : nullptr; }

        // The coroutine a panic hook rewound into; ownership passes to the caller.
        [[nodiscard]] auto take_successor() noexcept -> std::optional<basic_coroutine>
        {
            if (ctl_ == nullptr || ctl_->successor == nullptr)
                return std::nullopt;
            std::optional<basic_coroutine> next{std::move(*ctl_->successor)};
            ctl_->successor.reset();
            return next;
        }

    private:
        explicit basic_coroutine(std::unique_ptr<control> ctl) noexcept : ctl_{std::move(ctl)} {}

        void destroy() noexcept
        {
            if (ctl_ == nullptr)
                return;

            control *ctl = ctl_.get();
            if (ctl->status == state::running)
                detail::fatal("coroutine {} destroyed while running", fmt::ptr(ctl));

            if (ctl->status == state::suspended)
            {
                log_trace("coroutine {} force-unwound", fmt::ptr(ctl));
                ctl->unwinding = true;
                ctl->status = state::running;
                ctl->previous = control::current;
                control::current = ctl;

                control *from = receive(R::resume_with({std::move(ctl->self), ctl}, &basic_coroutine::unwind));
                if (from->relay)
                {
                    from->relay = false;
                    log_error("coroutine {} raised while being unwound: {}", fmt::ptr(from), detail::describe(from->payload));
                }
            }
            // created: nothing ever ran on the stack; terminal: stack already gone
            ctl_.reset();
        }

        // Control just came back from a coroutine; its control record is the data.
        static auto receive(transfer_type t) noexcept -> control *
        {
            auto *from = static_cast<control *>(t.data);
            if (t.context)
                from->self = std::move(t.context);
            return from;
        }

        static void entry(transfer_type t) noexcept
        {
            auto *ctl = static_cast<control *>(t.data);
            ctl->resumer = std::move(t.context);

            void *result = nullptr;
            std::exception_ptr panic;
            try
            {
                result = ctl->body(handle_type{ctl}, ctl->in);
            }
            catch (forced_unwind const &)
            {
                result = nullptr;
            }
            catch (...)
            {
                panic = std::current_exception();
            }
            // captures die here, on the stack that created them
            ctl->body = nullptr;
            finish(ctl, result, std::move(panic));
        }

        // Nothing declared here outlives the final switch, so no destructor is skipped.
        [[noreturn]] static void finish(control *ctl, void *result, std::exception_ptr panic) noexcept
        {
            ctl->out = result;
            ctl->handoff_data = ctl;
            bool const destroying = std::exchange(ctl->unwinding, false);

            control *next = nullptr;
            if (panic == nullptr)
            {
                ctl->status = state::finished;
                log_trace("coroutine {} finished", fmt::ptr(ctl));
            }
            else
            {
                ctl->status = state::panicked;
                ctl->payload = std::move(panic);
                log_debug("coroutine {} panicked: {}", fmt::ptr(ctl), detail::describe(ctl->payload));
                // the destroyer gets it back; no hook may run inside a destructor
                if (!destroying)
                    next = run_hook(ctl);
            }

            if (next == nullptr)
            {
                if (ctl->status == state::panicked)
                    ctl->relay = true;
                control::current = ctl->previous;
                R::resume_with({std::move(ctl->resumer), ctl}, &basic_coroutine::release);
            }
            else
            {
                // the successor takes over this coroutine's resumer
                next->in = &ctl->payload;
                next->status = state::running;
                next->previous = ctl->previous;
                control::current = next;
                ctl->handoff = std::move(ctl->resumer);
                ctl->handoff_data = next;
                R::resume_with({std::move(next->self), ctl}, &basic_coroutine::release);
            }
            detail::fatal("terminated coroutine {} was resumed", fmt::ptr(ctl));
        }

        // Returns the successor's control record (now owned by `ctl`), or nullptr to relay.
        static auto run_hook(control *ctl) noexcept -> control *
        {
            if (!ctl->hook)
                detail::abort_on_panic(ctl->payload);
            try
            {
                std::optional<basic_coroutine> next = ctl->hook(ctl->payload);
                if (!next)
                    return nullptr;
                if (!next->valid() || !next->suspended())
                    detail::fatal("panic hook returned a coroutine that cannot be resumed ({})", next->status());
                ctl->successor = std::make_unique<basic_coroutine>(std::move(*next));
                return ctl->successor->ctl_.get();
            }
            catch (...)
            {
                detail::fatal("panic hook threw: {}", detail::describe(std::current_exception()));
            }
        }

        // On-top: runs on the target after the terminated coroutine left its stack.
        static auto release(transfer_type t) -> transfer_type
        {
            auto *ctl = static_cast<control *>(t.data);
            (void)t.context.release(); // dead, never resumed again
            ctl->stack.release();
            return {std::move(ctl->handoff), ctl->handoff_data};
        }

        // On-top: runs inside the suspended coroutine and starts unwinding it.
        [[noreturn]] static auto unwind(transfer_type t) -> transfer_type
        {
            auto *ctl = static_cast<control *>(t.data);
            ctl->resumer = std::move(t.context);
            throw forced_unwind{};
        }

        std::unique_ptr<control> ctl_;
    };

    using coroutine = basic_coroutine<default_resumer>;
} // namespace symco
