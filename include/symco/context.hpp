// context.hpp - the context-switch contract every backend implements
//
// SPDX-License-Identifier: MIT OR Unlicense

#pragma once

#include "symco/config.hpp"
#include "symco/error.hpp"
#include "symco/log.hpp"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>

namespace symco
{
    // ============================================================================
    // Transfer
    // ============================================================================

    // The only channel across a switch. What `data` points to is agreed on by the
    // two sides of that particular switch.
    template <typename Context>
    struct transfer
    {
        Context context;
        void *data = nullptr;
    };

    // ============================================================================
    // Backend Contract
    // ============================================================================

    // A backend is a class of static functions so that selecting one is a type
    // decision made once per process, never a per-call dispatch.
    //
    //   new_on(stack, entry)     carve a fresh context inside `stack`; `entry`
    //                            runs on its first resumption and must not return
    //   resume(t)                switch into t.context, handing over t.data
    //   resume_with(t, map)      same, but `map` runs on the target before its
    //                            own continuation sees the arriving transfer
    template <typename R>
    concept resumer = requires(std::span<std::byte> stack,
                               typename R::entry_type entry,
                               typename R::map_type map,
                               typename R::transfer_type t) {
        typename R::context;
        requires std::movable<typename R::context>;
        requires !std::copyable<typename R::context>;
        { R::new_on(stack, entry) } -> std::same_as<std::expected<typename R::context, error>>;
        { R::resume(std::move(t)) } -> std::same_as<typename R::transfer_type>;
        { R::resume_with(std::move(t), map) } -> std::same_as<typename R::transfer_type>;
    };

    namespace detail
    {
        // ============================================================================
        // Stack Carving
        // ============================================================================

        // Address of a control block of `size` bytes placed at the aligned top of
        // `stack`, or nullptr when the block plus the minimum runway below it
        // does not fit. Never touches the memory.
        [[nodiscard]] inline auto carve_control_block(std::span<std::byte> stack, std::size_t size, std::size_t align) noexcept -> std::byte *
        {
            if (stack.data() == nullptr || stack.size() < size + min_runway)
                return nullptr;

            auto const base = reinterpret_cast<std::uintptr_t>(stack.data());
            auto const end = base + stack.size();
            auto const block = align_backward(end - size, std::max<std::size_t>(align, 16));
            if (block < base || block - base < min_runway)
                return nullptr;
            return reinterpret_cast<std::byte *>(block);
        }

        // ============================================================================
        // On-Top Bookkeeping
        // ============================================================================

        // On-top callbacks may not switch again: chaining is bounded at zero.
        [[nodiscard]] auto on_top_depth() noexcept -> int &;

        class on_top_scope
        {
        public:
            on_top_scope() noexcept { ++on_top_depth(); }
            ~on_top_scope() { --on_top_depth(); }

            on_top_scope(on_top_scope const &) = delete;
            auto operator=(on_top_scope const &) -> on_top_scope & = delete;
        };

        inline void check_switch_allowed() noexcept
        {
            if (on_top_depth() != 0)
                fatal("context switch requested from inside an on-top callback");
        }
    } // namespace detail
} // namespace symco
