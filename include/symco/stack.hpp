// stack.hpp - ownership of the memory regions coroutines run on
//
// SPDX-License-Identifier: MIT OR Unlicense

#pragma once

#include "symco/config.hpp"
#include "symco/error.hpp"

#include <cstddef>
#include <cstdlib>
#include <expected>
#include <span>
#include <utility>
#include <vector>

#include <sys/mman.h>
#include <unistd.h>

namespace symco
{
    // ============================================================================
    // Allocator Contract
    // ============================================================================

    struct stack_allocator
    {
        void *(*alloc_cb)(std::size_t size, void *allocator_data) = nullptr;
        void (*dealloc_cb)(void *ptr, std::size_t size, void *allocator_data) = nullptr;
        void *allocator_data = nullptr;
    };

    namespace detail
    {
        inline void *heap_stack_alloc(std::size_t size, void *allocator_data)
        {
            (void)allocator_data;
            return std::calloc(1, size);
        }

        inline void heap_stack_dealloc(void *ptr, std::size_t size, void *allocator_data)
        {
            (void)size;
            (void)allocator_data;
            std::free(ptr);
        }

        [[nodiscard]] inline auto page_size() noexcept -> std::size_t
        {
            long const p = ::sysconf(_SC_PAGESIZE);
            return p > 0 ? static_cast<std::size_t>(p) : 4096U;
        }

        // one PROT_NONE guard page below the usable region (stacks grow down)
        inline void *mmap_stack_alloc(std::size_t size, void *allocator_data)
        {
            (void)allocator_data;
            std::size_t const ps = page_size();
            std::size_t const usable = align_forward(size == 0 ? ps : size, ps);
            void *mem = ::mmap(nullptr, usable + ps, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
            if (mem == MAP_FAILED)
                return nullptr;
            if (::mprotect(mem, ps, PROT_NONE) != 0)
            {
                ::munmap(mem, usable + ps);
                return nullptr;
            }
            return static_cast<std::byte *>(mem) + ps;
        }

        inline void mmap_stack_dealloc(void *ptr, std::size_t size, void *allocator_data)
        {
            (void)allocator_data;
            std::size_t const ps = page_size();
            std::size_t const usable = align_forward(size == 0 ? ps : size, ps);
            ::munmap(static_cast<std::byte *>(ptr) - ps, usable + ps);
        }
    } // namespace detail

    // calloc/free; the process default when nothing is registered
    [[nodiscard]] constexpr auto heap_stack_allocator() noexcept -> stack_allocator
    {
        return {&detail::heap_stack_alloc, &detail::heap_stack_dealloc, nullptr};
    }

    // page-granular mappings with a guard page, so overflow faults instead of corrupting
    [[nodiscard]] constexpr auto mmap_stack_allocator() noexcept -> stack_allocator
    {
        return {&detail::mmap_stack_alloc, &detail::mmap_stack_dealloc, nullptr};
    }

    // ============================================================================
    // Process-Wide Registration
    // ============================================================================

    // One registration per process, before the first stack is allocated. Later
    // attempts fail with error::invalid_operation.
    [[nodiscard]] auto register_stack_allocator(stack_allocator allocator) noexcept -> std::expected<void, error>;

    // Resolves the registration once; after this call registering is refused.
    [[nodiscard]] auto global_stack_allocator() noexcept -> stack_allocator const &;

    // ============================================================================
    // Stack Region
    // ============================================================================

    // Owning handle to one stack. The memory goes back to the allocator it came
    // from when the handle is released or destroyed, and never earlier.
    class [[nodiscard]] stack_region
    {
    public:
        constexpr stack_region() noexcept = default;

        stack_region(std::byte *base, std::size_t size, stack_allocator const &owner) noexcept
            : base_{base}, size_{size}, dealloc_cb_{owner.dealloc_cb}, allocator_data_{owner.allocator_data} {}

        stack_region(stack_region const &) = delete;
        auto operator=(stack_region const &) -> stack_region & = delete;

        stack_region(stack_region &&other) noexcept
            : base_{std::exchange(other.base_, nullptr)},
              size_{std::exchange(other.size_, 0)},
              dealloc_cb_{std::exchange(other.dealloc_cb_, nullptr)},
              allocator_data_{std::exchange(other.allocator_data_, nullptr)} {}

        auto operator=(stack_region &&other) noexcept -> stack_region &
        {
            if (this != &other)
            {
                release();
                base_ = std::exchange(other.base_, nullptr);
                size_ = std::exchange(other.size_, 0);
                dealloc_cb_ = std::exchange(other.dealloc_cb_, nullptr);
                allocator_data_ = std::exchange(other.allocator_data_, nullptr);
            }
            return *this;
        }

        ~stack_region() { release(); }

        void release() noexcept
        {
            if (base_ == nullptr)
                return;
            auto *const base = std::exchange(base_, nullptr);
            if (dealloc_cb_ != nullptr)
                dealloc_cb_(base, size_, allocator_data_);
            size_ = 0;
        }

        [[nodiscard]] auto bytes() const noexcept -> std::span<std::byte> { return {base_, size_}; }
        [[nodiscard]] constexpr auto data() const noexcept -> std::byte * { return base_; }
        [[nodiscard]] constexpr auto size() const noexcept -> std::size_t { return size_; }
        [[nodiscard]] constexpr auto valid() const noexcept -> bool { return base_ != nullptr; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return valid(); }

    private:
        std::byte *base_{nullptr};
        std::size_t size_{0};
        void (*dealloc_cb_)(void *ptr, std::size_t size, void *allocator_data){nullptr};
        void *allocator_data_{nullptr};
    };

    [[nodiscard]] inline auto allocate_stack(stack_size size, stack_allocator const &allocator) noexcept -> std::expected<stack_region, error>
    {
        if (allocator.alloc_cb == nullptr || allocator.dealloc_cb == nullptr || size.value == 0)
            return std::unexpected{error::invalid_arguments};
        auto *const base = static_cast<std::byte *>(allocator.alloc_cb(size.value, allocator.allocator_data));
        if (base == nullptr)
            return std::unexpected{error::out_of_memory};
        return stack_region{base, size.value, allocator};
    }

    [[nodiscard]] inline auto allocate_stack(stack_size size) noexcept -> std::expected<stack_region, error>
    {
        return allocate_stack(size, global_stack_allocator());
    }

    // ============================================================================
    // Per-Thread Stack Pool
    // ============================================================================

    namespace detail
    {
        // Set once this thread's pool is destroyed; later releases bypass it.
        [[nodiscard]] auto stack_pool_retired() noexcept -> bool &;
    } // namespace detail

    // Caches default-sized stacks for short-lived coroutines (the bridge creates
    // one per task). A region handed out here returns to the pool of whichever
    // thread releases it; beyond the limit, or once that thread's pool is gone,
    // it goes back to the global allocator.
    class stack_pool
    {
    public:
        stack_pool() = default;
        stack_pool(stack_pool const &) = delete;
        auto operator=(stack_pool const &) -> stack_pool & = delete;
        ~stack_pool()
        {
            clear();
            detail::stack_pool_retired() = true;
        }

        [[nodiscard]] static auto local() noexcept -> stack_pool &;

        [[nodiscard]] auto acquire() noexcept -> std::expected<stack_region, error>
        {
            std::size_t const size = detail::normalize_stack_size(default_stack_size.value);
            if (!free_.empty())
            {
                std::byte *base = free_.back();
                free_.pop_back();
                return stack_region{base, size, pooled()};
            }
            auto const &global = global_stack_allocator();
            auto *const base = static_cast<std::byte *>(global.alloc_cb(size, global.allocator_data));
            if (base == nullptr)
                return std::unexpected{error::out_of_memory};
            return stack_region{base, size, pooled()};
        }

        [[nodiscard]] auto cached() const noexcept -> std::size_t { return free_.size(); }

        void clear() noexcept
        {
            std::size_t const size = detail::normalize_stack_size(default_stack_size.value);
            auto const &global = global_stack_allocator();
            for (std::byte *base : free_)
                global.dealloc_cb(base, size, global.allocator_data);
            free_.clear();
        }

    private:
        static void recycle(void *ptr, std::size_t size, void *allocator_data);

        [[nodiscard]] static constexpr auto pooled() noexcept -> stack_allocator
        {
            return {nullptr, &stack_pool::recycle, nullptr};
        }

        std::vector<std::byte *> free_;
    };
} // namespace symco
