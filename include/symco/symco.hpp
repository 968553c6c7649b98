// symco.hpp - stackful symmetric coroutines for C++23
// Single-header entry point. Define SYMCO_IMPL in *one* source file.
//
// SPDX-License-Identifier: MIT OR Unlicense

#pragma once

#include "symco/backend.hpp"
#include "symco/bridge.hpp"
#include "symco/config.hpp"
#include "symco/context.hpp"
#include "symco/coroutine.hpp"
#include "symco/error.hpp"
#include "symco/log.hpp"
#include "symco/stack.hpp"

// ============================================================================
// Internal Implementation
// ============================================================================

#ifdef SYMCO_IMPL

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <new>
#include <string>
#include <system_error>

namespace symco
{
    // ============================================================================
    // Logging
    // ============================================================================

    namespace detail
    {
        struct log_config
        {
            std::atomic<log_sink> sink{nullptr};
            std::atomic<log_level> level{compiled_log_level};
        };

        static auto logging() noexcept -> log_config &
        {
            static log_config config;
            return config;
        }

        static void stderr_sink(log_level level, std::string_view message)
        {
            fmt::print(stderr, "[symco] [{}] {}\n", to_string(level), message);
        }

        void log_emit(log_level level, std::string_view message)
        {
            log_sink sink = logging().sink.load(std::memory_order_acquire);
            if (sink == nullptr)
                sink = &stderr_sink;
            sink(level, message);
        }

        void log_failure(char const *what) noexcept
        {
            std::fputs("[symco] logging failed: ", stderr);
            std::fputs(what, stderr);
            std::fputc('\n', stderr);
        }

        void log_os_failure(char const *call, int err) noexcept
        {
            std::string text;
            try
            {
                text = std::generic_category().message(err);
            }
            catch (std::bad_alloc const &)
            {
                text = {};
            }
            log_warn("{} failed: {} (errno {})", call, text, err);
        }
    } // namespace detail

    void set_log_sink(log_sink sink) noexcept
    {
        detail::logging().sink.store(sink, std::memory_order_release);
    }

    void set_log_level(log_level level) noexcept
    {
        detail::logging().level.store(level, std::memory_order_relaxed);
    }

    auto get_log_level() noexcept -> log_level
    {
        return detail::logging().level.load(std::memory_order_relaxed);
    }

    // ============================================================================
    // Per-Thread State
    // ============================================================================

    namespace detail
    {
        auto on_top_depth() noexcept -> int &
        {
            thread_local int depth = 0;
            return depth;
        }

        auto active_bridge() noexcept -> void *&
        {
            thread_local void *ctl = nullptr;
            return ctl;
        }
    } // namespace detail

    // ============================================================================
    // Panic Payloads
    // ============================================================================

    namespace detail
    {
        auto describe(std::exception_ptr const &payload) -> std::string
        {
            if (payload == nullptr)
                return "no exception";
            try
            {
                std::rethrow_exception(payload);
            }
            catch (std::exception const &e)
            {
                return e.what();
            }
            catch (forced_unwind const &)
            {
                return "forced unwind";
            }
            catch (...)
            {
                return "non-standard exception";
            }
        }

        void abort_on_panic(std::exception_ptr const &payload) noexcept
        {
            std::string what;
            try
            {
                what = describe(payload);
            }
            catch (std::bad_alloc const &)
            {
                what = {};
            }
            fatal("unhandled exception in coroutine: {}", what);
        }
    } // namespace detail

    // ============================================================================
    // ucontext Backend
    // ============================================================================

    namespace detail
    {
        void ucontext_thread_record::initialize() noexcept
        {
            // the thread's own stack; swapcontext saves into it on the first switch away
            running = &root;
            incoming = {};
            initialized = true;
        }

        auto ucontext_thread_record::current() noexcept -> ucontext_thread_record &
        {
            thread_local ucontext_thread_record record;
            if (!record.initialized)
                record.initialize();
            return record;
        }
    } // namespace detail

    auto ucontext_resumer::new_on(std::span<std::byte> stack, entry_type entry) noexcept -> std::expected<context, error>
    {
        if (entry == nullptr)
            return std::unexpected{error::invalid_arguments};

        auto *const block = detail::carve_control_block(stack, sizeof(ucontext_t), alignof(ucontext_t));
        if (block == nullptr)
            return std::unexpected{error::stack_too_small};

        auto *const ucx = ::new (block) ucontext_t{};
        if (::getcontext(ucx) != 0)
        {
            detail::log_os_failure("getcontext", errno);
            return std::unexpected{error::make_context_error};
        }

        ucx->uc_link = nullptr;
        ucx->uc_stack.ss_sp = stack.data();
        ucx->uc_stack.ss_size = static_cast<std::size_t>(block - stack.data());

        // makecontext only forwards int-sized arguments
        auto const addr = static_cast<std::uint64_t>(reinterpret_cast<std::uintptr_t>(entry));
        auto const lo = static_cast<unsigned int>(addr & 0xffffffffU);
        auto const hi = static_cast<unsigned int>(addr >> 32);
        ::makecontext(ucx, reinterpret_cast<void (*)()>(&ucontext_resumer::trampoline), 2, lo, hi);
        return context{ucx};
    }

    auto ucontext_resumer::switch_to(transfer_type t, map_type on_top) -> transfer_type
    {
        detail::check_switch_allowed();
        ucontext_t *const target = t.context.release();
        if (target == nullptr)
            detail::fatal("switch to an empty ucontext");

        auto &record = detail::ucontext_thread_record::current();
        ucontext_t *const self = record.running;
        record.incoming = {self, on_top, t.data};
        record.running = target;
        if (::swapcontext(self, target) != 0)
            detail::fatal("swapcontext failed: {}", error::switch_context_error);

        // possibly on another thread by now
        return arrive();
    }

    auto ucontext_resumer::arrive() -> transfer_type
    {
        auto &record = detail::ucontext_thread_record::current();
        auto const incoming = std::exchange(record.incoming, {});
        transfer_type t{context{incoming.from}, incoming.data};
        if (incoming.on_top == nullptr)
            return t;

        detail::on_top_scope scope;
        return incoming.on_top(std::move(t));
    }

    void ucontext_resumer::trampoline(unsigned int lo, unsigned int hi) noexcept
    {
        auto const addr = (static_cast<std::uint64_t>(hi) << 32) | lo;
        auto const entry = reinterpret_cast<entry_type>(static_cast<std::uintptr_t>(addr));
        entry(arrive());
        detail::fatal("coroutine entry returned");
    }

    // ============================================================================
    // Stack Allocator Registry
    // ============================================================================

    namespace detail
    {
        struct allocator_registry
        {
            std::mutex mutex;
            std::atomic<bool> frozen{false};
            stack_allocator allocator = heap_stack_allocator();
        };

        static auto registry() noexcept -> allocator_registry &
        {
            static allocator_registry r;
            return r;
        }
    } // namespace detail

    auto register_stack_allocator(stack_allocator allocator) noexcept -> std::expected<void, error>
    {
        if (allocator.alloc_cb == nullptr || allocator.dealloc_cb == nullptr)
            return std::unexpected{error::invalid_arguments};

        auto &r = detail::registry();
        std::lock_guard lock{r.mutex};
        if (r.frozen.load(std::memory_order_relaxed))
        {
            log_warn("stack allocator already fixed for this process");
            return std::unexpected{error::invalid_operation};
        }
        r.allocator = allocator;
        r.frozen.store(true, std::memory_order_release);
        log_debug("custom stack allocator registered");
        return {};
    }

    auto global_stack_allocator() noexcept -> stack_allocator const &
    {
        auto &r = detail::registry();
        if (r.frozen.load(std::memory_order_acquire))
            return r.allocator;

        std::lock_guard lock{r.mutex};
        r.frozen.store(true, std::memory_order_release);
        return r.allocator;
    }

    // ============================================================================
    // Stack Pool
    // ============================================================================

    namespace detail
    {
        auto stack_pool_retired() noexcept -> bool &
        {
            thread_local bool retired = false;
            return retired;
        }
    } // namespace detail

    auto stack_pool::local() noexcept -> stack_pool &
    {
        thread_local stack_pool pool;
        return pool;
    }

    void stack_pool::recycle(void *ptr, std::size_t size, void *allocator_data)
    {
        (void)allocator_data;
        auto const &global = global_stack_allocator();
        if (detail::stack_pool_retired())
        {
            global.dealloc_cb(ptr, size, global.allocator_data);
            return;
        }

        auto &pool = local();
        if (pool.free_.size() < stack_pool_limit)
        {
            try
            {
                pool.free_.push_back(static_cast<std::byte *>(ptr));
                return;
            }
            catch (std::bad_alloc const &)
            {
                log_debug("stack pool full, returning {} byte stack", size);
            }
        }
        global.dealloc_cb(ptr, size, global.allocator_data);
    }
} // namespace symco

#endif // SYMCO_IMPL
