// fcontext.hpp - context-switch backend over Boost.Context's assembly fcontext primitives
//
// SPDX-License-Identifier: MIT OR Unlicense

#pragma once

#include "symco/context.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>

#include <boost/context/detail/fcontext.hpp>

namespace symco
{
    class fcontext_resumer
    {
        using fcontext_t = boost::context::detail::fcontext_t;
        using raw_transfer = boost::context::detail::transfer_t;

    public:
        class context
        {
        public:
            constexpr context() noexcept = default;
            constexpr explicit context(fcontext_t fctx) noexcept : fctx_{fctx} {}

            context(context const &) = delete;
            auto operator=(context const &) -> context & = delete;

            context(context &&other) noexcept : fctx_{std::exchange(other.fctx_, nullptr)} {}
            auto operator=(context &&other) noexcept -> context &
            {
                fctx_ = std::exchange(other.fctx_, nullptr);
                return *this;
            }

            ~context() = default;

            [[nodiscard]] constexpr auto valid() const noexcept -> bool { return fctx_ != nullptr; }
            [[nodiscard]] constexpr explicit operator bool() const noexcept { return valid(); }
            [[nodiscard]] constexpr auto raw() const noexcept -> fcontext_t { return fctx_; }
            [[nodiscard]] auto release() noexcept -> fcontext_t { return std::exchange(fctx_, nullptr); }

        private:
            fcontext_t fctx_{nullptr};
        };

        using transfer_type = transfer<context>;
        using entry_type = void (*)(transfer_type);
        using map_type = transfer_type (*)(transfer_type);

        [[nodiscard]] static auto new_on(std::span<std::byte> stack, entry_type entry) noexcept -> std::expected<context, error>
        {
            // make_fcontext keeps its initial frame just below `top`
            auto *const top = detail::carve_control_block(stack, frame_reserve, 16);
            if (top == nullptr)
                return std::unexpected{error::stack_too_small};

            auto const size = static_cast<std::size_t>(top - stack.data());
            fcontext_t const fctx = boost::context::detail::make_fcontext(top, size, &fcontext_resumer::trampoline);
            if (fctx == nullptr)
                return std::unexpected{error::make_context_error};

            // hand the entry over; the fresh context parks itself right away
            raw_transfer const parked = boost::context::detail::jump_fcontext(fctx, reinterpret_cast<void *>(entry));
            return context{parked.fctx};
        }

        static auto resume(transfer_type t) -> transfer_type
        {
            detail::check_switch_allowed();
            fcontext_t const target = t.context.release();
            if (target == nullptr)
                detail::fatal("switch to an empty fcontext");
            raw_transfer const r = boost::context::detail::jump_fcontext(target, t.data);
            return {context{r.fctx}, r.data};
        }

        static auto resume_with(transfer_type t, map_type map) -> transfer_type
        {
            detail::check_switch_allowed();
            fcontext_t const target = t.context.release();
            if (target == nullptr)
                detail::fatal("switch to an empty fcontext");
            on_top_record record{map, t.data};
            raw_transfer const r = boost::context::detail::ontop_fcontext(target, &record, &fcontext_resumer::on_top);
            return {context{r.fctx}, r.data};
        }

    private:
        static constexpr std::size_t frame_reserve = 64;

        // lives on the switching side's stack, which may be released by the map
        struct on_top_record
        {
            map_type map;
            void *data;
        };

        static void trampoline(raw_transfer t) noexcept
        {
            auto const entry = reinterpret_cast<entry_type>(t.data);
            t = boost::context::detail::jump_fcontext(t.fctx, nullptr);
            entry(transfer_type{context{t.fctx}, t.data});
            detail::fatal("coroutine entry returned");
        }

        static auto on_top(raw_transfer t) -> raw_transfer
        {
            auto const record = *static_cast<on_top_record *>(t.data);
            detail::on_top_scope scope;
            transfer_type out = record.map(transfer_type{context{t.fctx}, record.data});
            return {out.context.release(), out.data};
        }
    };
} // namespace symco
