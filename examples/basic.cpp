// basic.cpp - basic coroutine usage example
// the "hello world" of coroutines, if hello world involved context switching

#define SYMCO_IMPL
#include "symco/symco.hpp"

#include <cstdio> // for stderr
#include <optional>
#include <stdexcept>

#include <fmt/core.h>

int main()
{
    fmt::print("=== basic coroutine example ===\n");

    // create a simple coroutine that suspends a few times
    auto coro_result = symco::coroutine::create([](symco::coroutine::handle_type h, void *) -> void *
                                                {
        fmt::print("coroutine: starting\n");

        fmt::print("coroutine: doing some work...\n");
        h.suspend();

        fmt::print("coroutine: resumed, doing more work...\n");
        h.suspend();

        fmt::print("coroutine: finishing up\n");
        return nullptr; });

    if (!coro_result)
    {
        fmt::print(stderr, "failed to create coroutine: {}\n", coro_result.error());
        return 1;
    }

    auto &coro = *coro_result;

    fmt::print("main: coroutine created, status = {}\n", coro.status());

    // resume until completion
    int step = 1;
    while (!coro.done())
    {
        fmt::print("\nmain: resuming coroutine (step {})\n", step++);

        auto resume_result = coro.resume();
        if (!resume_result)
        {
            fmt::print(stderr, "resume failed: {}\n", resume_result.error());
            return 1;
        }

        fmt::print("main: coroutine came back, status = {}\n", coro.status());
    }

    fmt::print("\nmain: coroutine completed\n");

    // data travels with every switch, no side channel needed
    fmt::print("\n=== data passing example ===\n");

    auto doubler = symco::coroutine::create([](symco::coroutine::handle_type h, void *in) -> void *
                                            {
        int result = 0;
        while (in != nullptr)
        {
            int const value = *static_cast<int *>(in);
            fmt::print("coroutine: received value = {}\n", value);
            result = value * 2;
            in = h.suspend(&result);
        }
        return nullptr; });

    if (doubler)
    {
        for (int value : {21, 50})
        {
            auto answer = doubler->resume(&value);
            if (answer && *answer != nullptr)
                fmt::print("main: received result = {}\n", *static_cast<int *>(*answer));
        }
        (void)doubler->resume(nullptr);
    }

    // a panic is handed back to whoever resumed the coroutine
    fmt::print("\n=== panic relay example ===\n");

    auto faulty = symco::coroutine::create([](symco::coroutine::handle_type, void *) -> void *
                                           { throw std::runtime_error{"sensor offline"}; },
                                           symco::relay_hook());
    if (faulty)
    {
        try
        {
            (void)faulty->resume();
        }
        catch (std::runtime_error const &e)
        {
            fmt::print("main: caught '{}', coroutine is {}\n", e.what(), faulty->status());
        }
    }

    return 0;
}
