// error.hpp - error and state vocabulary shared by every symco layer
//
// SPDX-License-Identifier: MIT OR Unlicense

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace symco
{
    enum class [[nodiscard]] error : std::uint8_t
    {
        success = 0,
        invalid_coroutine,
        not_suspended,
        not_running,
        coroutine_terminated,
        make_context_error,
        switch_context_error,
        stack_too_small,
        out_of_memory,
        invalid_arguments,
        invalid_operation
    };

    [[nodiscard]] constexpr auto to_string(error e) noexcept -> std::string_view
    {
        switch (e)
        {
        case error::success:
            return "success";
        case error::invalid_coroutine:
            return "invalid coroutine";
        case error::not_suspended:
            return "coroutine not suspended";
        case error::not_running:
            return "coroutine not running";
        case error::coroutine_terminated:
            return "coroutine terminated";
        case error::make_context_error:
            return "make context error";
        case error::switch_context_error:
            return "switch context error";
        case error::stack_too_small:
            return "stack too small";
        case error::out_of_memory:
            return "out of memory";
        case error::invalid_arguments:
            return "invalid arguments";
        case error::invalid_operation:
            return "invalid operation";
        }
        return "unknown error";
    }

    enum class [[nodiscard]] state : std::uint8_t
    {
        created = 0,
        running,
        suspended,
        finished,
        panicked
    };

    [[nodiscard]] constexpr auto to_string(state s) noexcept -> std::string_view
    {
        switch (s)
        {
        case state::created:
            return "created";
        case state::running:
            return "running";
        case state::suspended:
            return "suspended";
        case state::finished:
            return "finished";
        case state::panicked:
            return "panicked";
        }
        return "unknown state";
    }

    [[nodiscard]] constexpr auto is_terminal(state s) noexcept -> bool
    {
        return s == state::finished || s == state::panicked;
    }

    // Thrown only where an interface has no error channel of its own (a poll()).
    class coroutine_error : public std::runtime_error
    {
    public:
        explicit coroutine_error(error code)
            : std::runtime_error{std::string{to_string(code)}}, code_{code} {}

        [[nodiscard]] auto code() const noexcept -> error { return code_; }

    private:
        error code_;
    };
} // namespace symco

// ============================================================================
// fmt Support
// ============================================================================

template <>
struct fmt::formatter<symco::error> : fmt::formatter<std::string_view>
{
    auto format(symco::error e, fmt::format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(symco::to_string(e), ctx);
    }
};

template <>
struct fmt::formatter<symco::state> : fmt::formatter<std::string_view>
{
    auto format(symco::state s, fmt::format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(symco::to_string(s), ctx);
    }
};
