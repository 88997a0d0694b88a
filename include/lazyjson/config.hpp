#pragma once
#ifndef LAZYJSON_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define LAZYJSON_PLATFORM_WINDOWS 1
#else
#define LAZYJSON_PLATFORM_WINDOWS 0
#endif
#if LAZYJSON_PLATFORM_WINDOWS
#if defined(LAZYJSON_BUILD_SHARED)
#define LAZYJSON_API __declspec(dllexport)
#elif defined(LAZYJSON_SHARED)
#define LAZYJSON_API __declspec(dllimport)
#else
#define LAZYJSON_API
#endif
#else
#if defined(LAZYJSON_BUILD_SHARED) || defined(LAZYJSON_SHARED)
#if __GNUC__ >= 4
#define LAZYJSON_API __attribute__((visibility("default")))
#else
#define LAZYJSON_API
#endif // __GNUC__
#else
#define LAZYJSON_API
#endif // LAZYJSON_BUILD_SHARED || LAZYJSON_SHARED
#endif // LAZYJSON_PLATFORM_WINDOWS
#endif // LAZYJSON_API

#include <cstddef>

namespace LazyJson {

    /// Absolute byte offset into a byte source.
    using position = std::size_t;

} // namespace LazyJson
