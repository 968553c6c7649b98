// local_executor.hpp - single-threaded executor with timers, enough to drive sync() tasks
//
// SPDX-License-Identifier: MIT OR Unlicense

#pragma once

#include "symco/bridge.hpp"

#include <doctest/doctest.h>

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace symco_test
{
    class local_executor
    {
    public:
        using clock = std::chrono::steady_clock;
        using task_id = std::size_t;

        // Output is discarded; tests observe results through their captures.
        template <typename F>
        auto spawn(F future) -> task_id
        {
            auto shared = std::make_shared<F>(std::move(future));
            return add([shared](symco::poll_context &cx) { return shared->poll(cx).has_value(); });
        }

        // Runs everything until `future` completes and hands back its output.
        template <typename F>
        auto block_on(F future) -> typename F::output_type
        {
            auto shared = std::make_shared<F>(std::move(future));
            auto out = std::make_shared<std::optional<typename F::output_type>>();
            add([shared, out](symco::poll_context &cx)
                {
                    auto r = shared->poll(cx);
                    if (!r)
                        return false;
                    out->emplace(std::move(*r));
                    return true; });
            run();
            REQUIRE(out->has_value());
            return std::move(**out);
        }

        // Polls one ready task. False when nothing was ready.
        auto step() -> bool
        {
            while (!ready_.empty())
            {
                task_id const id = ready_.front();
                ready_.pop_front();
                auto it = tasks_.find(id);
                if (it == tasks_.end())
                    continue;

                it->second.queued = false;
                ++polls_;
                symco::poll_context cx{symco::waker{[this, id] { wake(id); }}};
                bool done = false;
                try
                {
                    done = it->second.poll(cx);
                }
                catch (...)
                {
                    tasks_.erase(id);
                    throw;
                }
                if (done)
                    tasks_.erase(id);
                return true;
            }
            return false;
        }

        // Until no task is left or every remaining task waits on nothing.
        void run()
        {
            while (!tasks_.empty())
            {
                if (step())
                    continue;
                if (!fire_timers())
                    return;
            }
        }

        // Dropping a task is how an executor cancels it.
        void cancel(task_id id) { tasks_.erase(id); }

        void wake(task_id id)
        {
            auto it = tasks_.find(id);
            if (it == tasks_.end() || it->second.queued)
                return;
            it->second.queued = true;
            ready_.push_back(id);
        }

        void add_timer(clock::time_point deadline, symco::waker w) { timers_.emplace(deadline, std::move(w)); }

        [[nodiscard]] auto pending() const noexcept -> std::size_t { return tasks_.size(); }
        [[nodiscard]] auto polls() const noexcept -> std::size_t { return polls_; }

    private:
        struct task
        {
            std::function<bool(symco::poll_context &)> poll;
            bool queued = true;
        };

        auto add(std::function<bool(symco::poll_context &)> poll) -> task_id
        {
            task_id const id = next_id_++;
            tasks_.emplace(id, task{std::move(poll)});
            ready_.push_back(id);
            return id;
        }

        // Sleeps until the earliest deadline and wakes everything due.
        auto fire_timers() -> bool
        {
            if (timers_.empty())
                return false;
            std::this_thread::sleep_until(timers_.begin()->first);
            auto const now = clock::now();
            while (!timers_.empty() && timers_.begin()->first <= now)
            {
                auto w = std::move(timers_.begin()->second);
                timers_.erase(timers_.begin());
                w.wake();
            }
            return true;
        }

        std::map<task_id, task> tasks_;
        std::deque<task_id> ready_;
        std::multimap<clock::time_point, symco::waker> timers_;
        task_id next_id_ = 0;
        std::size_t polls_ = 0;
    };

    // Ready once the deadline has passed.
    class timer_future
    {
    public:
        using output_type = std::monostate;

        timer_future(local_executor &ex, local_executor::clock::duration delay)
            : ex_{&ex}, deadline_{local_executor::clock::now() + delay} {}

        auto poll(symco::poll_context &cx) -> std::optional<std::monostate>
        {
            if (local_executor::clock::now() >= deadline_)
                return std::monostate{};
            ex_->add_timer(deadline_, cx.get_waker());
            return std::nullopt;
        }

    private:
        local_executor *ex_;
        local_executor::clock::time_point deadline_;
    };

    // Pending exactly once, then ready: gives every other task a turn.
    class yield_future
    {
    public:
        using output_type = std::monostate;

        auto poll(symco::poll_context &cx) -> std::optional<std::monostate>
        {
            if (std::exchange(yielded_, true))
                return std::monostate{};
            cx.get_waker().wake();
            return std::nullopt;
        }

    private:
        bool yielded_ = false;
    };

    inline auto sleep_for(local_executor &ex, local_executor::clock::duration delay) -> timer_future
    {
        return timer_future{ex, delay};
    }

    inline auto yield_now() -> yield_future
    {
        return yield_future{};
    }

    static_assert(symco::pollable<timer_future>);
    static_assert(symco::pollable<yield_future>);
} // namespace symco_test
