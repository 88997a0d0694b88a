#pragma once


/*
    ----------------------------------------------------
    LazyJson::ReadError - Structured read error reporting
    ----------------------------------------------------
    `LazyJson::ReadError` describes why a lazy read operation failed. Every
    fallible operation in LazyJson returns a `LazyJson::Result<T>`, which is
    an alias for `std::expected<T, ReadError>`.

    ------
    Fields
    ------
    - `code errc`:
        * Enumerated error code describing the failure category:
            - `malformed_json`
            - `type_mismatch`
            - `index_out_of_range`
            - `key_not_found`
            - `stream_exhausted`
            - `unexpected_end`
            - `invalid_argument`
            - `depth_limit_exceeded`
            - `io_error`
    - `position offset`:
        * Absolute byte offset in the byte source where the failure was
          detected. For errors that are not tied to the input (for example
          `invalid_argument`) this is the start of the value involved
    - `std::string msg`:
        * Human-readable description of the error
        * Intended for debugging and logging; not stable for programmatic use

    -------------------
    Severity of a code
    -------------------
    - `malformed_json`, `unexpected_end`, `depth_limit_exceeded` and
      `io_error` abort the operation in progress
    - `type_mismatch`, `index_out_of_range`, `key_not_found` and
      `invalid_argument` are local: the caller asked for something the value
      cannot give and may try something else
    - `stream_exhausted` is the expected end of a cursor walk, not a failure
      worth reporting
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "lazyjson/config.hpp"


/// @defgroup LazyJsonError Read Errors
/// @ingroup LazyJson
/// @brief Error codes and structures produced by lazy reads
namespace LazyJson {

    /// @ingroup LazyJsonError
    /// @brief Structured error information produced by scanner, node and cursor operations.
    ///
    /// @details
    /// Each error contains:
    ///
    /// - **errc**: classification of the error
    /// - **offset**: absolute byte position where the error was detected
    /// - **msg**: human-readable explanation of the error
    struct ReadError {
        /// @ingroup LazyJsonError
        /// @brief Closed set of failure reasons.
        ///
        /// @details
        /// Members:
        /// - `malformed_json`
        ///     The bytes at the expected position do not form a value, or a
        ///     container is missing a `,`, `:` or closing bracket.
        ///
        /// - `type_mismatch`
        ///     The operation is not defined for the node's kind, e.g. the
        ///     length of a string or a string key on an array.
        ///
        /// - `index_out_of_range`
        ///     The array has no element at the requested index.
        ///
        /// - `key_not_found`
        ///     The object has no member with the requested key.
        ///
        /// - `stream_exhausted`
        ///     A cursor was asked to advance past the last top-level value of
        ///     its last source.
        ///
        /// - `unexpected_end`
        ///     The source ended where more bytes were required.
        ///
        /// - `invalid_argument`
        ///     An argument violates the operation's precondition, e.g. a
        ///     negative `advance_by` count.
        ///
        /// - `depth_limit_exceeded`
        ///     Nesting exceeds `ReaderOptions::max_depth`. Off by default.
        ///
        /// - `io_error`
        ///     The byte source failed to read or seek.
        enum class code : uint8_t {
            malformed_json,       ///< Grammar violation.
            type_mismatch,        ///< Operation unsupported for the node's kind.
            index_out_of_range,   ///< Array index absent.
            key_not_found,        ///< Object key absent.
            stream_exhausted,     ///< No further top-level value.
            unexpected_end,       ///< Source ended prematurely.
            invalid_argument,     ///< Precondition violated by the caller.
            depth_limit_exceeded, ///< Maximum depth limit exceeded.
            io_error,             ///< Byte source read or seek failure.
        };

        code errc{};          ///< The classification of the failure.
        position offset{};    ///< Byte offset at which the failure was detected.
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup LazyJsonError
        /// @brief Constructs a fully-populated `ReadError` instance.
        ///
        /// @details
        /// Used internally to build errors with consistent formatting.
        ///
        /// Example internal use:
        /// @code
        /// return std::unexpected(ReadError::make(
        ///     code::key_not_found, m_Start, "Key not found in object"
        /// ));
        /// @endcode
        ///
        /// @param c    The error code describing the category of failure.
        /// @param o    Byte offset in the source.
        /// @param m    Human-readable error message.
        /// @return A fully constructed `ReadError`.
        LAZYJSON_API static ReadError make(code c, position o, std::string_view m);
    };

    /// @ingroup LazyJsonError
    /// @brief Stable lowercase name of an error code, e.g. `"key_not_found"`.
    LAZYJSON_API std::string_view to_string(ReadError::code c) noexcept;

    /// @ingroup LazyJsonError
    /// @brief Result type of every fallible LazyJson operation.
    template<typename T>
    using Result = std::expected<T, ReadError>;

} // namespace LazyJson
