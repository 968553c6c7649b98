// config.hpp - build-time knobs and strong types for symco
//
// SPDX-License-Identifier: MIT OR Unlicense

#pragma once

#include <cstddef>

// ============================================================================
// Configuration (Externalizable via Build Parameters)
// ============================================================================

#ifndef SYMCO_STACK_SIZE
#define SYMCO_STACK_SIZE (56 * 1024)
#endif

#ifndef SYMCO_MIN_STACK_SIZE
#define SYMCO_MIN_STACK_SIZE 32768
#endif

// bytes a backend insists on keeping free below its control block
#ifndef SYMCO_MIN_RUNWAY
#define SYMCO_MIN_RUNWAY 1024
#endif

#ifndef SYMCO_STACK_POOL_LIMIT
#define SYMCO_STACK_POOL_LIMIT 16
#endif

// 0 = trace ... 5 = critical
#ifndef SYMCO_LOG_LEVEL
#define SYMCO_LOG_LEVEL 2
#endif

namespace symco
{
    // ============================================================================
    // Constants & Strong Types
    // ============================================================================

    struct stack_size
    {
        std::size_t value;
        [[nodiscard]] constexpr explicit stack_size(std::size_t v) noexcept : value{v} {}
    };

    inline constexpr stack_size default_stack_size{SYMCO_STACK_SIZE};
    inline constexpr stack_size min_stack_size{SYMCO_MIN_STACK_SIZE};
    inline constexpr std::size_t min_runway{SYMCO_MIN_RUNWAY};
    inline constexpr std::size_t stack_pool_limit{SYMCO_STACK_POOL_LIMIT};

    namespace detail
    {
        [[nodiscard]] constexpr auto align_forward(std::size_t addr, std::size_t align) noexcept -> std::size_t
        {
            return (addr + (align - 1)) & ~(align - 1);
        }

        [[nodiscard]] constexpr auto align_backward(std::size_t addr, std::size_t align) noexcept -> std::size_t
        {
            return addr & ~(align - 1);
        }

        // coroutine stacks are clamped up to the minimum and rounded to 16 bytes
        [[nodiscard]] constexpr auto normalize_stack_size(std::size_t size) noexcept -> std::size_t
        {
            if (size == 0)
                size = default_stack_size.value;
            else if (size < min_stack_size.value)
                size = min_stack_size.value;
            return align_forward(size, 16);
        }
    } // namespace detail
} // namespace symco
