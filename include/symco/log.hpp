// log.hpp - minimal leveled logging on top of {fmt}
//
// SPDX-License-Identifier: MIT OR Unlicense

#pragma once

#include "symco/config.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace symco
{
    enum class log_level : std::uint8_t
    {
        trace = 0,
        debug,
        info,
        warn,
        error,
        critical,
        off
    };

    [[nodiscard]] constexpr auto to_string(log_level l) noexcept -> std::string_view
    {
        switch (l)
        {
        case log_level::trace:
            return "trace";
        case log_level::debug:
            return "debug";
        case log_level::info:
            return "info";
        case log_level::warn:
            return "warn";
        case log_level::error:
            return "error";
        case log_level::critical:
            return "critical";
        case log_level::off:
            return "off";
        }
        return "unknown";
    }

    using log_sink = void (*)(log_level level, std::string_view message);

    // the sink receives already formatted messages; nullptr restores the stderr sink
    void set_log_sink(log_sink sink) noexcept;
    void set_log_level(log_level level) noexcept;
    [[nodiscard]] auto get_log_level() noexcept -> log_level;

    namespace detail
    {
        void log_emit(log_level level, std::string_view message);

        // last resort when formatting or the sink itself failed
        void log_failure(char const *what) noexcept;

        // an OS primitive failed; `err` is the errno it left behind
        void log_os_failure(char const *call, int err) noexcept;

        inline constexpr auto compiled_log_level = static_cast<log_level>(SYMCO_LOG_LEVEL);
    } // namespace detail

    template <typename... Args>
    void log(log_level level, fmt::format_string<Args...> format, Args &&...args) noexcept
    {
        if (level < detail::compiled_log_level || level < get_log_level())
            return;
        try
        {
            detail::log_emit(level, fmt::format(format, std::forward<Args>(args)...));
        }
        catch (std::exception const &e)
        {
            detail::log_failure(e.what());
        }
        catch (...)
        {
            detail::log_failure("non-standard exception");
        }
    }

    template <typename... Args>
    void log_trace(fmt::format_string<Args...> format, Args &&...args) noexcept
    {
        log(log_level::trace, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void log_debug(fmt::format_string<Args...> format, Args &&...args) noexcept
    {
        log(log_level::debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void log_info(fmt::format_string<Args...> format, Args &&...args) noexcept
    {
        log(log_level::info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void log_warn(fmt::format_string<Args...> format, Args &&...args) noexcept
    {
        log(log_level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void log_error(fmt::format_string<Args...> format, Args &&...args) noexcept
    {
        log(log_level::error, format, std::forward<Args>(args)...);
    }

    namespace detail
    {
        // register state can no longer be trusted, so there is nothing to unwind to
        template <typename... Args>
        [[noreturn]] void fatal(fmt::format_string<Args...> format, Args &&...args) noexcept
        {
            log(log_level::critical, format, std::forward<Args>(args)...);
            std::abort();
        }
    } // namespace detail
} // namespace symco
