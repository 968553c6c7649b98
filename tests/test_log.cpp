// test_log.cpp - levels, sinks, and a sink that misbehaves
//
// SPDX-License-Identifier: MIT OR Unlicense

#include <doctest/doctest.h>

#include "symco/symco.hpp"

#include "support/fork.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace
{
    std::vector<std::pair<symco::log_level, std::string>> captured;

    void capturing_sink(symco::log_level level, std::string_view message)
    {
        captured.emplace_back(level, std::string{message});
    }

    void throwing_sink(symco::log_level, std::string_view)
    {
        throw std::runtime_error{"sink broke"};
    }

    void throwing_int_sink(symco::log_level, std::string_view)
    {
        throw 17;
    }

    // puts the suite-wide sink and level back whatever a test did
    struct sink_scope
    {
        symco::log_level saved = symco::get_log_level();

        explicit sink_scope(symco::log_sink sink)
        {
            captured.clear();
            symco::set_log_sink(sink);
        }

        ~sink_scope()
        {
            symco::set_log_sink(nullptr);
            symco::set_log_level(saved);
        }
    };
} // namespace

TEST_SUITE("logging")
{
    TEST_CASE("level names")
    {
        CHECK(symco::to_string(symco::log_level::trace) == "trace");
        CHECK(symco::to_string(symco::log_level::warn) == "warn");
        CHECK(symco::to_string(symco::log_level::critical) == "critical");
    }

    TEST_CASE("messages below the runtime level are dropped")
    {
        sink_scope scope{&capturing_sink};
        symco::set_log_level(symco::log_level::warn);

        symco::log_info("quiet {}", 1);
        symco::log_warn("loud {}", 2);
        symco::log_error("louder {}", 3);

        REQUIRE(captured.size() == 2);
        CHECK(captured[0].first == symco::log_level::warn);
        CHECK(captured[0].second == "loud 2");
        CHECK(captured[1].second == "louder 3");
    }

    TEST_CASE("formatted arguments use the symco formatters")
    {
        sink_scope scope{&capturing_sink};
        symco::set_log_level(symco::log_level::warn);

        symco::log_warn("resume failed: {} while {}", symco::error::not_suspended, symco::state::running);
        REQUIRE(captured.size() == 1);
        CHECK(captured[0].second == "resume failed: coroutine not suspended while running");
    }

    TEST_CASE("OS failures carry their errno")
    {
        sink_scope scope{&capturing_sink};
        symco::set_log_level(symco::log_level::warn);

        symco::detail::log_os_failure("getcontext", EINVAL);
        REQUIRE(captured.size() == 1);
        CHECK(captured[0].first == symco::log_level::warn);
        CHECK(captured[0].second.starts_with("getcontext failed: "));
        CHECK(captured[0].second.ends_with(fmt::format("(errno {})", EINVAL)));
    }

    TEST_CASE("a throwing sink does not escape the logger")
    {
        {
            sink_scope scope{&throwing_sink};
            symco::set_log_level(symco::log_level::warn);
            symco::log_warn("into the void");
        }

        int const sig = symco_test::run_in_child([]
                                                 {
            symco::set_log_sink(&throwing_int_sink);
            symco::set_log_level(symco::log_level::warn);
            symco::log_error("still alive"); });
        CHECK(sig == 0);
    }
}
