#pragma once

// Debug tracing, off unless the environment sets LAZYJSON_DEBUG=1.
// Messages go to stderr, one line each, prefixed with "lazyjson: ".

#include <cstdio>
#include <cstdlib>
#include <format>
#include <print>
#include <string_view>

namespace LazyJson::detail {

    inline bool debug_enabled() {
        static const bool enabled = []() {
            const char* env = std::getenv("LAZYJSON_DEBUG");
            return env && std::string_view{ env } == "1";
        }();
        return enabled;
    }

} // namespace LazyJson::detail

#define LAZYJSON_DEBUG_LOG(...) do { \
    if (::LazyJson::detail::debug_enabled()) { \
        std::println(stderr, "lazyjson: {}", std::format(__VA_ARGS__)); \
    } \
} while (0)
