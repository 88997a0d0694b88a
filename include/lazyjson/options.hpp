#pragma once


/*
    ------------------------
    LazyJson reader options
    ------------------------
    This header defines the configuration structure that controls how the
    scanner accepts and materializes JSON read lazily from a byte source.

    ----------------------------------------
    Reader Options - LazyJson::ReaderOptions
    ----------------------------------------
    - `bool allow_comments`:
        * When true (default), `// ...` line comments are trivia wherever
          whitespace is allowed
        * When false, a `/` outside a string is a `malformed_json` error
    - `bool allow_trailing_commas`:
        * When true (default), a single comma right before `]` or `}` is
          accepted, e.g. `[1,2,]` or `{"a": 1,}`
        * When false, such a comma is a `malformed_json` error
    - `size_t max_depth`:
        * Optional limit on nesting depth of arrays/objects while skipping
          or materializing
        * If exceeded, the operation fails with `depth_limit_exceeded`
        * A value of 0 is treated as no explicit limit
    - `size_t buffer_size`:
        * Size in bytes of the read window each scanner keeps over its
          source. The window is refilled (after a seek) whenever a read
          falls outside it
    - `std::pmr::memory_resource* resource`:
        * Memory resource used for every materialized `LazyJson::value`

    -----
    Usage
    -----
        LazyJson::ReaderOptions opts;
        opts.allow_trailing_commas = false;
        auto cursor = LazyJson::Cursor::open(source, opts);

    Options are copied into every node and passed on to the nodes derived
    from it, so one configuration governs a whole walk.
*/


#include <cstddef>
#include <memory_resource>

/// @defgroup LazyJsonOptions Reader Options
/// @ingroup LazyJson
/// @brief Configuration objects controlling lazy reads

namespace LazyJson {

    /// @ingroup LazyJsonOptions
    /// @brief Configuration controlling lazy JSON reading
    ///
    /// @details
    /// The defaults accept the relaxed grammar: standard JSON plus `//`
    /// line comments and a single trailing comma per container.
    ///
    /// Example:
    /// @code
    /// ReaderOptions opts;
    /// opts.max_depth = 64;
    /// auto node = LazyJson::Node::open(source, 0, opts);
    /// @endcode
    struct ReaderOptions {
        bool allow_comments = true;        ///< Accept `//` line comments if true
        bool allow_trailing_commas = true; ///< Permit one trailing comma in arrays/objects if true
        std::size_t max_depth = 0;         ///< Maximum allowed nesting depth (0 = unlimited)
        std::size_t buffer_size = 4096;    ///< Bytes read from the source per refill
        std::pmr::memory_resource* resource = std::pmr::get_default_resource(); ///< Allocator for materialized values
    };

} // namespace LazyJson
