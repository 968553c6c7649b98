// middleware.cpp - reuse a callback-driven synchronous library from async code
// the middleware only knows blocking callbacks; sync()/wait() lets it run on an executor unchanged

#define SYMCO_IMPL
#include "symco/symco.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace
{
    // Synchronous middleware: block-wise prefix xor, returns the xor of every block's tail.
    template <typename Input, typename Output>
    auto prefix_xor(Input &&input, Output &&output) -> std::expected<std::uint8_t, std::string_view>
    {
        constexpr std::size_t block_size = 1024;
        std::vector<std::uint8_t> buf(block_size);
        std::uint8_t result = 0;

        for (;;)
        {
            auto read = input(std::span{buf});
            if (!read)
                return std::unexpected{read.error()};
            if (*read == 0)
                return result;

            for (std::size_t i = 1; i < *read; ++i)
                buf[i] ^= buf[i - 1];
            result ^= buf[*read - 1];

            if (auto written = output(std::span{buf}.first(*read)); !written)
                return std::unexpected{written.error()};
        }
    }

    // Asynchronous source: each read is pending once before it completes, like a socket would be.
    class async_source
    {
    public:
        explicit async_source(std::span<std::uint8_t const> data) : data_{data} {}

        class read_future
        {
        public:
            using output_type = std::size_t;

            read_future(async_source &src, std::span<std::uint8_t> buf) : src_{&src}, buf_{buf} {}

            auto poll(symco::poll_context &cx) -> std::optional<std::size_t>
            {
                if (!polled_)
                {
                    polled_ = true;
                    cx.get_waker().wake();
                    return std::nullopt;
                }
                std::size_t const n = std::min(buf_.size(), src_->data_.size() - src_->offset_);
                std::copy_n(src_->data_.begin() + static_cast<std::ptrdiff_t>(src_->offset_), n, buf_.begin());
                src_->offset_ += n;
                return n;
            }

        private:
            async_source *src_;
            std::span<std::uint8_t> buf_;
            bool polled_ = false;
        };

        auto read(std::span<std::uint8_t> buf) -> read_future { return read_future{*this, buf}; }

    private:
        std::span<std::uint8_t const> data_;
        std::size_t offset_ = 0;
    };

    // Spins a single pollable to completion; a stand-in for a real executor.
    template <typename F>
    auto block_on(F future) -> typename F::output_type
    {
        bool woken = true;
        symco::poll_context cx{symco::waker{[&woken] { woken = true; }}};
        for (;;)
        {
            if (!std::exchange(woken, false))
                continue;
            if (auto r = future.poll(cx))
                return std::move(*r);
        }
    }
} // namespace

int main()
{
    std::vector<std::uint8_t> input(10 * 1024 + 123);
    for (std::size_t i = 0; i < input.size(); ++i)
        input[i] = static_cast<std::uint8_t>(i * 31 + 7);

    // 1. fully synchronous
    {
        std::size_t offset = 0;
        std::vector<std::uint8_t> sink;
        auto result = prefix_xor(
            [&](std::span<std::uint8_t> buf) -> std::expected<std::size_t, std::string_view>
            {
                std::size_t const n = std::min(buf.size(), input.size() - offset);
                std::copy_n(input.begin() + static_cast<std::ptrdiff_t>(offset), n, buf.begin());
                offset += n;
                return n;
            },
            [&](std::span<std::uint8_t const> block) -> std::expected<void, std::string_view>
            {
                sink.insert(sink.end(), block.begin(), block.end());
                return {};
            });
        fmt::print("sync result: {} ({} bytes out)\n", result.value_or(0), sink.size());
    }

    // 2. asynchronous source, same middleware, bridged
    {
        async_source source{input};
        std::vector<std::uint8_t> sink;
        auto result = block_on(symco::sync([&]
                                           { return prefix_xor(
                                                 [&](std::span<std::uint8_t> buf) -> std::expected<std::size_t, std::string_view>
                                                 { return symco::wait(source.read(buf)); },
                                                 [&](std::span<std::uint8_t const> block) -> std::expected<void, std::string_view>
                                                 {
                                                     sink.insert(sink.end(), block.begin(), block.end());
                                                     return {};
                                                 }); }));
        fmt::print("bridged result: {} ({} bytes out)\n", result.value_or(0), sink.size());
    }

    return 0;
}
