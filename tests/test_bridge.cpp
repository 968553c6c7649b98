// test_bridge.cpp - sync()/wait(): blocking-style closures driven by an executor
//
// SPDX-License-Identifier: MIT OR Unlicense

#include <doctest/doctest.h>

#include "symco/symco.hpp"

#include "support/counting_allocator.hpp"
#include "support/fork.hpp"
#include "support/local_executor.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

using namespace std::chrono_literals;

namespace
{
    struct cleanup_guard
    {
        int *count;
        ~cleanup_guard() { ++*count; }
    };

    // pending until someone flips the flag, waking whoever polled last
    class gate
    {
    public:
        struct future
        {
            using output_type = int;
            gate *g;

            auto poll(symco::poll_context &cx) -> std::optional<int>
            {
                if (g->open_)
                    return g->value_;
                g->waker_ = cx.get_waker();
                return std::nullopt;
            }
        };

        auto wait_open() -> future { return future{this}; }

        void open(int value)
        {
            open_ = true;
            value_ = value;
            waker_.wake();
        }

    private:
        bool open_ = false;
        int value_ = 0;
        symco::waker waker_;
    };

    static_assert(symco::pollable<gate::future>);
} // namespace

// ============================================================================
// poll protocol
// ============================================================================

TEST_SUITE("poll protocol")
{
    TEST_CASE("ready future completes on first poll")
    {
        symco::poll_context cx{symco::waker{}};
        auto f = symco::ready(5);
        auto r = f.poll(cx);
        REQUIRE(r.has_value());
        CHECK(*r == 5);
    }

    TEST_CASE("waker calls through")
    {
        int woken = 0;
        symco::waker w{[&woken] { ++woken; }};
        auto copy = w;
        w.wake();
        copy.wake();
        CHECK(woken == 2);
        CHECK(static_cast<bool>(w));
        CHECK_FALSE(static_cast<bool>(symco::waker{}));
    }
}

// ============================================================================
// sync tasks
// ============================================================================

TEST_SUITE("sync")
{
    TEST_CASE("closure without waits completes on the first poll")
    {
        auto task = symco::sync([] { return 41 + 1; });
        symco::poll_context cx{symco::waker{}};
        auto r = task.poll(cx);
        REQUIRE(r.has_value());
        CHECK(*r == 42);
        CHECK(task.done());
    }

    TEST_CASE("void closure yields monostate")
    {
        bool ran = false;
        auto task = symco::sync([&ran] { ran = true; });
        static_assert(std::is_same_v<decltype(task)::output_type, std::monostate>);
        symco_test::local_executor ex;
        (void)ex.block_on(std::move(task));
        CHECK(ran);
    }

    TEST_CASE("wait on a ready future does not park the task")
    {
        symco_test::local_executor ex;
        auto value = ex.block_on(symco::sync([] { return symco::wait(symco::ready(std::string{"hi"})) + "!"; }));
        CHECK(value == "hi!");
        CHECK(ex.polls() == 1);
    }

    TEST_CASE("wait parks until the future is ready")
    {
        gate g;
        auto task = symco::sync([&g] { return symco::wait(g.wait_open()) * 2; });

        int wakes = 0;
        symco::poll_context cx{symco::waker{[&wakes] { ++wakes; }}};
        CHECK_FALSE(task.poll(cx).has_value());
        CHECK_FALSE(task.poll(cx).has_value());
        CHECK(wakes == 0);

        g.open(21);
        CHECK(wakes == 1);
        auto r = task.poll(cx);
        REQUIRE(r.has_value());
        CHECK(*r == 42);
    }

    TEST_CASE("several waits in sequence")
    {
        symco_test::local_executor ex;
        auto total = ex.block_on(symco::sync([&ex]
                                             {
            int sum = 0;
            for (int i = 1; i <= 5; ++i)
            {
                symco::wait(symco_test::yield_now());
                sum += symco::wait(symco::ready(i));
            }
            symco::wait(symco_test::sleep_for(ex, 1ms));
            return sum; }));
        CHECK(total == 15);
    }

    TEST_CASE("move-only captures are fine")
    {
        auto owned = std::make_unique<int>(9);
        symco_test::local_executor ex;
        auto r = ex.block_on(symco::sync([p = std::move(owned)] { return *p + symco::wait(symco::ready(1)); }));
        CHECK(r == 10);
    }

    TEST_CASE("in_sync_context is true only inside the bridged closure")
    {
        CHECK_FALSE(symco::in_sync_context());

        bool inside = false;
        bool nested_plain = true;
        symco_test::local_executor ex;
        ex.block_on(symco::sync([&]
                                {
            inside = symco::in_sync_context();
            auto plain = symco::coroutine::create([&](symco::coroutine::handle_type, void *) -> void *
                                                  {
                nested_plain = symco::in_sync_context();
                return nullptr; });
            if (plain)
                (void)plain->resume(); }));
        CHECK(inside);
        CHECK_FALSE(nested_plain);
        CHECK_FALSE(symco::in_sync_context());
    }

    TEST_CASE("a task polled from inside another task's closure")
    {
        symco_test::local_executor ex;
        auto r = ex.block_on(symco::sync([]
                                         {
            auto inner = symco::sync([] { return symco::wait(symco::ready(3)); });
            symco::poll_context cx{symco::waker{}};
            auto v = inner.poll(cx);
            // back in the outer closure, wait() must still be usable
            return v.value_or(0) + symco::wait(symco::ready(4)); }));
        CHECK(r == 7);
    }

    TEST_CASE("default-sized tasks recycle pooled stacks")
    {
        auto &pool = symco::stack_pool::local();
        pool.clear();
        symco_test::stack_census census;
        symco_test::local_executor ex;
        for (int i = 0; i < 10; ++i)
            CHECK(ex.block_on(symco::sync([i] { return symco::wait(symco::ready(i)); })) == i);
        CHECK(census.allocations() == 1);
        CHECK(pool.cached() == 1);
    }

    TEST_CASE("custom-sized tasks use the global allocator")
    {
        symco_test::stack_census census;
        symco_test::local_executor ex;
        CHECK(ex.block_on(symco::sync([] { return 1; }, symco::stack_size{256 * 1024})) == 1);
        CHECK(census.allocations() == 1);
        CHECK(census.releases() == 1);
    }
}

// ============================================================================
// concurrency - one thread, many closures, nobody blocks it
// ============================================================================

TEST_SUITE("bridge concurrency")
{
    TEST_CASE("a sleeping task does not hold up a busy one")
    {
        symco_test::local_executor ex;
        std::vector<std::string> finished;
        int busy_steps = 0;

        ex.spawn(symco::sync([&]
                             {
            symco::wait(symco_test::sleep_for(ex, 20ms));
            finished.push_back("sleeper"); }));
        ex.spawn(symco::sync([&]
                             {
            for (int i = 0; i < 100; ++i)
            {
                ++busy_steps;
                symco::wait(symco_test::yield_now());
            }
            finished.push_back("busy"); }));

        ex.run();
        CHECK(ex.pending() == 0);
        CHECK(busy_steps == 100);
        CHECK(finished == std::vector<std::string>{"busy", "sleeper"});
    }

    TEST_CASE("interleaving follows the executor's order")
    {
        symco_test::local_executor ex;
        std::vector<int> trace;
        for (int id = 0; id < 3; ++id)
        {
            ex.spawn(symco::sync([&trace, id]
                                 {
                for (int round = 0; round < 2; ++round)
                {
                    trace.push_back(id);
                    symco::wait(symco_test::yield_now());
                }
            }));
        }
        ex.run();
        CHECK(trace == std::vector{0, 1, 2, 0, 1, 2});
    }
}

// ============================================================================
// failures and cancellation
// ============================================================================

TEST_SUITE("bridge failures")
{
    TEST_CASE("exceptions surface from poll")
    {
        symco_test::local_executor ex;
        auto task = symco::sync([]() -> int
                                {
            symco::wait(symco_test::yield_now());
            throw std::runtime_error{"closure failed"}; });
        CHECK_THROWS_WITH_AS(ex.block_on(std::move(task)), "closure failed", std::runtime_error);
        CHECK(ex.pending() == 0);
    }

    TEST_CASE("a failed task keeps its stack accounting straight")
    {
        symco_test::stack_census census;
        symco_test::local_executor ex;
        auto task = symco::sync([]() -> int { throw std::logic_error{"nope"}; }, symco::stack_size{128 * 1024});
        CHECK_THROWS_AS(ex.block_on(std::move(task)), std::logic_error);
        CHECK(census.releases() == census.allocations());
    }

    TEST_CASE("wait outside a sync closure aborts")
    {
        CHECK(symco_test::aborts([]
                                 { (void)symco::wait(symco::ready(1)); }));
        CHECK(symco_test::aborts([]
                                 {
            auto co = symco::coroutine::create([](symco::coroutine::handle_type, void *) -> void *
                                               {
                (void)symco::wait(symco::ready(1));
                return nullptr; });
            if (co)
                (void)co->resume(); }));
    }

    TEST_CASE("polling a completed task aborts")
    {
        CHECK(symco_test::aborts([]
                                 {
            auto task = symco::sync([] { return 1; });
            symco::poll_context cx{symco::waker{}};
            (void)task.poll(cx);
            (void)task.poll(cx); }));
    }

    TEST_CASE("a moved-from task is done and refuses polls")
    {
        auto task = symco::sync([] { return 1; });
        auto moved = std::move(task);
        CHECK_FALSE(task.valid());
        CHECK(task.done());
        CHECK(moved.valid());
        CHECK_FALSE(moved.done());

        symco::poll_context cx{symco::waker{}};
        try
        {
            (void)task.poll(cx);
            FAIL("poll on a moved-from task returned");
        }
        catch (symco::coroutine_error const &e)
        {
            CHECK(e.code() == symco::error::invalid_coroutine);
        }
        CHECK(moved.poll(cx) == std::optional{1});
    }

    TEST_CASE("dropping a never-polled task runs nothing")
    {
        bool ran = false;
        symco_test::stack_census census;
        {
            auto task = symco::sync([&ran] { ran = true; });
        }
        CHECK_FALSE(ran);
        CHECK(census.allocations() == 0);
    }

    TEST_CASE("cancellation at random points cleans up exactly once")
    {
        std::mt19937 rng{20240611};
        for (int trial = 0; trial < 64; ++trial)
        {
            int const waits = 1 + static_cast<int>(rng() % 8);
            int const drop_after = 1 + static_cast<int>(rng() % static_cast<unsigned>(waits));

            symco_test::stack_census census;
            int cleanups = 0;
            int progress = 0;
            bool finished = false;
            {
                symco_test::local_executor ex;
                auto id = ex.spawn(symco::sync([&]
                                               {
                    cleanup_guard guard{&cleanups};
                    std::vector<int> heap_state(16, trial);
                    for (int i = 0; i < waits; ++i)
                    {
                        symco::wait(symco_test::yield_now());
                        ++progress;
                    }
                    finished = true; },
                                               symco::stack_size{96 * 1024}));

                for (int i = 0; i < drop_after; ++i)
                    REQUIRE(ex.step());
                CHECK(cleanups == 0);
                ex.cancel(id);
            }

            CHECK_FALSE(finished);
            CHECK(progress == drop_after - 1);
            CHECK(cleanups == 1);
            CHECK(census.allocations() == 1);
            CHECK(census.releases() == 1);
        }
    }
}
