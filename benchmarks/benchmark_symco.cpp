// benchmark_symco.cpp - performance benchmarks for symco
// every number here is per switch where a switch is involved; that is the figure that matters

#define SYMCO_IMPL
#include "symco/symco.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

// --- Optional Backends ---

#ifdef SYMCO_HAVE_BOOST_CONTEXT
#include "symco/fcontext.hpp"
#endif

// ============================================================================
// timing utilities
// ============================================================================

// A single switch is a few dozen nanoseconds, below what one clock read can
// resolve, so work is timed in batches and reported per switch.
struct measurement
{
    std::string name;
    std::size_t ops = 0;             // operations per batch
    std::size_t switches_per_op = 0; // context switches one operation performs
    std::vector<double> batch_ns;    // sorted, one entry per batch

    [[nodiscard]] auto per_op(double batch) const -> double { return batch / static_cast<double>(ops); }

    [[nodiscard]] auto percentile(double p) const -> double
    {
        auto const idx = static_cast<std::size_t>(p * static_cast<double>(batch_ns.size() - 1));
        return per_op(batch_ns[idx]);
    }
};

template <typename F>
[[nodiscard]] auto measure(std::string name, std::size_t batches, std::size_t ops, std::size_t switches_per_op, F &&op) -> measurement
{
    using clock = std::chrono::steady_clock;

    for (std::size_t i = 0; i < ops; ++i)
        op();

    measurement m{std::move(name), ops, switches_per_op, {}};
    m.batch_ns.reserve(batches);
    for (std::size_t b = 0; b < batches; ++b)
    {
        auto const start = clock::now();
        for (std::size_t i = 0; i < ops; ++i)
            op();
        auto const elapsed = clock::now() - start;
        m.batch_ns.push_back(std::chrono::duration<double, std::nano>(elapsed).count());
    }
    std::ranges::sort(m.batch_ns);
    return m;
}

void report(measurement const &m)
{
    double const median = m.percentile(0.5);
    fmt::print("┌─────────────────────────────────────────────────────────────\n");
    fmt::print("│ {}\n", m.name);
    fmt::print("├─────────────────────────────────────────────────────────────\n");
    fmt::print("│ batches x ops:      {:>8} x {}\n", m.batch_ns.size(), m.ops);
    fmt::print("│ per op  best:       {:12.1f} ns\n", m.per_op(m.batch_ns.front()));
    fmt::print("│ per op  p50 / p99:  {:12.1f} / {:.1f} ns\n", median, m.percentile(0.99));
    if (m.switches_per_op > 0)
    {
        double const per_switch = median / static_cast<double>(m.switches_per_op);
        fmt::print("│ per switch (p50):   {:12.1f} ns  ({} switches/op)\n", per_switch, m.switches_per_op);
        fmt::print("│ switches/sec:       {:12.0f}\n", 1e9 / per_switch);
    }
    else
    {
        fmt::print("│ ops/sec:            {:12.0f}\n", 1e9 / median);
    }
    fmt::print("└─────────────────────────────────────────────────────────────\n\n");
}

// ============================================================================
// Raw Backend Entries
// ============================================================================

template <typename R>
void bounce_entry(typename R::transfer_type t) noexcept
{
    for (;;)
        t = R::resume({std::move(t.context), t.data});
}

// ============================================================================
// Benchmarks
// ============================================================================

template <typename R>
void bench_create_destroy(std::string_view backend)
{
    using coro = symco::basic_coroutine<R>;
    auto result = measure(fmt::format("coroutine create + destroy ({})", backend), 100, 1'000, 0, []()
                                 { auto co = coro::create([](typename coro::handle_type, void *) -> void * { return nullptr; }); });
    report(result);

    auto result_run = measure(fmt::format("coroutine create + run to completion ({})", backend), 100, 1'000, 2, []()
                                     {
        auto co = coro::create([](typename coro::handle_type, void *in) -> void * { return in; });
        if (co)
            (void)co->resume(); });
    report(result_run);
}

// ---------------------------------------------------------
// Context Switch Benchmarks
// ---------------------------------------------------------

template <typename R>
void bench_context_switch(std::string_view backend)
{
    // 1. raw backend, no bookkeeping at all
    {
        auto stack = symco::allocate_stack(symco::stack_size{64 * 1024});
        if (stack)
        {
            auto ctx = R::new_on(stack->bytes(), &bounce_entry<R>);
            if (ctx)
            {
                std::optional<typename R::context> parked{std::move(*ctx)};
                auto result = measure(fmt::format("raw switch round trip ({})", backend), 200, 10'000, 2, [&parked]()
                                             {
                    auto t = R::resume({std::move(*parked), nullptr});
                    *parked = std::move(t.context); });
                report(result);
            }
        }
    }

    // 2. symmetric coroutine resume + suspend
    {
        using coro = symco::basic_coroutine<R>;
        auto co = coro::create([](typename coro::handle_type h, void *) -> void *
                               {
            for (;;)
                h.suspend(); });
        if (co)
        {
            auto result = measure(fmt::format("coroutine resume + suspend ({})", backend), 200, 10'000, 2, [&co]()
                                         { [[maybe_unused]] auto _ = co->resume(); });
            report(result);
        }
    }
}

// ---------------------------------------------------------
// Bridge Benchmarks
// ---------------------------------------------------------

// Ready after `pending` polls, so every read costs that many round trips through the executor.
class slow_read
{
public:
    using output_type = std::size_t;

    slow_read(std::span<char> buf, int pending) : buf_{buf}, pending_{pending} {}

    auto poll(symco::poll_context &cx) -> std::optional<std::size_t>
    {
        if (pending_-- > 0)
        {
            cx.get_waker().wake();
            return std::nullopt;
        }
        std::ranges::fill(buf_, 'x');
        return buf_.size();
    }

private:
    std::span<char> buf_;
    int pending_;
};

template <typename F>
auto spin(F &future) -> typename F::output_type
{
    symco::poll_context cx{symco::waker{[] {}}};
    for (;;)
    {
        if (auto r = future.poll(cx))
            return std::move(*r);
    }
}

void bench_bridge()
{
    std::vector<char> buf(600);

    auto direct = measure("read polled directly", 100, 1'000, 0, [&buf]()
                                 {
        slow_read r{buf, 1};
        [[maybe_unused]] auto n = spin(r); });
    report(direct);

    auto bridged = measure("read through sync() + wait()", 100, 1'000, 4, [&buf]()
                                  {
        auto task = symco::sync([&buf] { return symco::wait(slow_read{buf, 1}); });
        [[maybe_unused]] auto n = spin(task); });
    report(bridged);

    auto nested = measure("16 waits inside one sync() task", 100, 100, 34, [&buf]()
                                 {
        auto task = symco::sync([&buf]
                                {
            std::size_t total = 0;
            for (int i = 0; i < 16; ++i)
                total += symco::wait(slow_read{buf, 1});
            return total; });
        [[maybe_unused]] auto n = spin(task); });
    report(nested);
}

void bench_memory_overhead()
{
    fmt::print("┌─────────────────────────────────────────────────────────────\n");
    fmt::print("│ memory overhead analysis\n");
    fmt::print("├─────────────────────────────────────────────────────────────\n");
    fmt::print("│ sizeof(coroutine control):  {:6} bytes\n", sizeof(symco::detail::coroutine_control<symco::default_resumer>));
    fmt::print("│ sizeof(symco::coroutine):   {:6} bytes\n", sizeof(symco::coroutine));
    fmt::print("│ sizeof(coroutine_handle):   {:6} bytes\n", sizeof(symco::coroutine_handle<symco::default_resumer>));
    fmt::print("│ sizeof(stack_region):       {:6} bytes\n", sizeof(symco::stack_region));
    fmt::print("│ sizeof(ucontext_t):         {:6} bytes\n", sizeof(ucontext_t));
    fmt::print("│ sizeof(symco::error):       {:6} bytes\n", sizeof(symco::error));
    fmt::print("│ sizeof(symco::state):       {:6} bytes\n", sizeof(symco::state));
    fmt::print("│ default stack size:         {:6} bytes\n", symco::default_stack_size.value);
    fmt::print("│ minimum stack size:         {:6} bytes\n", symco::min_stack_size.value);
    fmt::print("└─────────────────────────────────────────────────────────────\n\n");
}

void bench_allocation_pattern()
{
    fmt::print("┌─────────────────────────────────────────────────────────────\n");
    fmt::print("│ allocation pattern analysis\n");
    fmt::print("├─────────────────────────────────────────────────────────────\n");

    constexpr std::size_t count = 1000;
    std::vector<symco::coroutine> coroutines;
    coroutines.reserve(count);

    auto const start = std::chrono::steady_clock::now();

    for (std::size_t i = 0; i < count; ++i)
    {
        auto co = symco::coroutine::create([](symco::coroutine::handle_type h, void *) -> void *
                                           {
            h.suspend();
            return nullptr; });
        if (co)
        {
            (void)co->resume();
            coroutines.push_back(std::move(*co));
        }
    }

    auto const after_create = std::chrono::steady_clock::now();

    // every one of them is suspended, so this is a forced unwind each
    coroutines.clear();

    auto const after_destroy = std::chrono::steady_clock::now();

    auto const create_time = std::chrono::duration<double, std::milli>(after_create - start).count();
    auto const destroy_time = std::chrono::duration<double, std::milli>(after_destroy - after_create).count();

    fmt::print("│ created + started {} coroutines in {:.2f} ms ({:.1f} ns each)\n",
               count, create_time, create_time * 1e6 / static_cast<double>(count));
    fmt::print("│ unwound {} coroutines in {:.2f} ms ({:.1f} ns each)\n",
               count, destroy_time, destroy_time * 1e6 / static_cast<double>(count));
    fmt::print("└─────────────────────────────────────────────────────────────\n\n");
}

// ============================================================================
// main
// ============================================================================

int main()
{
    fmt::print("═══════════════════════════════════════════════════════════════\n");
    fmt::print("                     symco benchmarks                          \n");
    fmt::print("═══════════════════════════════════════════════════════════════\n\n");

    bench_memory_overhead();
    bench_allocation_pattern();

    bench_create_destroy<symco::ucontext_resumer>("ucontext");
    bench_context_switch<symco::ucontext_resumer>("ucontext");
#ifdef SYMCO_HAVE_BOOST_CONTEXT
    bench_create_destroy<symco::fcontext_resumer>("fcontext");
    bench_context_switch<symco::fcontext_resumer>("fcontext");
#else
    fmt::print("Skipping Boost.Context benchmarks (library not found)\n");
#endif

    bench_bridge();

    fmt::print("═══════════════════════════════════════════════════════════════\n");
    fmt::print("                     benchmarks complete                       \n");
    fmt::print("═══════════════════════════════════════════════════════════════\n");

    return 0;
}
