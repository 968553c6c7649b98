// ucontext.hpp - context-switch backend over POSIX getcontext/makecontext/swapcontext
//
// SPDX-License-Identifier: MIT OR Unlicense

#pragma once

#include "symco/context.hpp"

#include <cstddef>
#include <expected>
#include <span>
#include <utility>

#include <ucontext.h>

namespace symco
{
    class ucontext_resumer
    {
    public:
        // Single-owner handle to a saved ucontext_t. Switching consumes it.
        class context
        {
        public:
            constexpr context() noexcept = default;
            constexpr explicit context(ucontext_t *ucx) noexcept : ucx_{ucx} {}

            context(context const &) = delete;
            auto operator=(context const &) -> context & = delete;

            context(context &&other) noexcept : ucx_{std::exchange(other.ucx_, nullptr)} {}
            auto operator=(context &&other) noexcept -> context &
            {
                ucx_ = std::exchange(other.ucx_, nullptr);
                return *this;
            }

            ~context() = default;

            [[nodiscard]] constexpr auto valid() const noexcept -> bool { return ucx_ != nullptr; }
            [[nodiscard]] constexpr explicit operator bool() const noexcept { return valid(); }
            [[nodiscard]] constexpr auto raw() const noexcept -> ucontext_t * { return ucx_; }
            [[nodiscard]] auto release() noexcept -> ucontext_t * { return std::exchange(ucx_, nullptr); }

        private:
            ucontext_t *ucx_{nullptr};
        };

        using transfer_type = transfer<context>;
        using entry_type = void (*)(transfer_type);
        using map_type = transfer_type (*)(transfer_type);

        // The ucontext_t lives at the top of `stack`; the rest is the execution area.
        [[nodiscard]] static auto new_on(std::span<std::byte> stack, entry_type entry) noexcept -> std::expected<context, error>;

        static auto resume(transfer_type t) -> transfer_type { return switch_to(std::move(t), nullptr); }
        static auto resume_with(transfer_type t, map_type map) -> transfer_type { return switch_to(std::move(t), map); }

    private:
        static auto switch_to(transfer_type t, map_type on_top) -> transfer_type;
        static auto arrive() -> transfer_type;
        static void trampoline(unsigned int lo, unsigned int hi) noexcept;
    };

    namespace detail
    {
        // Per-thread state of the ucontext backend. swapcontext cannot carry an
        // argument, so the incoming transfer is parked here just before the switch
        // and taken out right after it. Access goes through current(), which
        // initializes the record (and the thread's root context) on first use.
        struct ucontext_thread_record
        {
            struct incoming_slot
            {
                ucontext_t *from = nullptr;
                ucontext_resumer::map_type on_top = nullptr;
                void *data = nullptr;
            };

            ucontext_t root{};
            ucontext_t *running = nullptr;
            incoming_slot incoming{};
            bool initialized = false;

            void initialize() noexcept;

            [[nodiscard]] static auto current() noexcept -> ucontext_thread_record &;
        };
    } // namespace detail
} // namespace symco
