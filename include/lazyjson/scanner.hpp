#pragma once


/*
    ---------------------------------------------------
    LazyJson::Scanner - Tokenizer over a byte source
    ---------------------------------------------------
    The scanner walks JSON text directly off a `ByteSource`. Each operation
    takes the absolute position to start from and returns the position where
    it stopped; the scanner keeps no parse state between calls.

    ---------------
    Skip vs. Parse
    ---------------
    - Skipping (`skip_value`) advances past a value without building it,
      so walking over a large subtree allocates nothing
    - Parsing (`parse_scalar`, `parse_string`, `parse_value`) builds the
      in-memory representation

    ---------
    Read window
    ---------
    The scanner reads the source through a window of
    `ReaderOptions::buffer_size` bytes. Whenever a position outside the window
    is requested it seeks the source there and refills, so a scanner is
    always correct even if something else moved the source in between.

    ---------
    Grammar
    ---------
    Standard JSON, plus (both on by default, see `ReaderOptions`):
        - `// ...` line comments wherever whitespace is allowed
        - one trailing comma right before `]` or `}`
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "lazyjson/config.hpp"
#include "lazyjson/error.hpp"
#include "lazyjson/options.hpp"
#include "lazyjson/source.hpp"
#include "lazyjson/value.hpp"

/// @defgroup LazyJsonScanner Scanner
/// @ingroup LazyJson
/// @brief Low-level tokenizer used by nodes and cursors

namespace LazyJson {

    /// @ingroup LazyJsonScanner
    /// @brief Kind of an unmaterialized JSON value, decided by its first bytes
    enum class node_kind : uint8_t {
        object,      ///< `{`
        array,       ///< `[`
        string,      ///< `"`
        number,      ///< `-` or a digit
        true_value,  ///< `true`
        false_value, ///< `false`
        null,        ///< `null`
    };

    /// @ingroup LazyJsonScanner
    /// @brief Stable lowercase name of a node kind, e.g. `"array"`
    LAZYJSON_API std::string_view to_string(node_kind k) noexcept;

    /// @ingroup LazyJsonScanner
    /// @brief Position-driven JSON tokenizer
    class LAZYJSON_API Scanner {
    public:
        /// @brief One step through a container
        ///
        /// @details
        /// When `done` is false, `pos` is the start of the next element (for
        /// objects, the opening quote of its key). When `done` is true, `pos`
        /// is the position right after the closing bracket.
        struct Step {
            bool done = false;
            position pos = 0;
        };

        Scanner(ByteSource& source, const ReaderOptions& opts);

        /// @brief Skips whitespace and line comments starting at @p pos
        ///
        /// @return Position of the next significant byte, or `unexpected_end`
        ///         if the source ends first
        Result<position> skip_trivia(position pos);

        /// @brief Determines the kind of the value starting exactly at @p pos
        ///
        /// @details
        /// Literals are matched in full, so `tru` or `nul` are `malformed_json`.
        Result<node_kind> classify(position pos);

        /// @brief Advances past the value starting at @p pos without building it
        /// @return Position right after the value
        Result<position> skip_value(position pos);

        /// @brief Builds the string, number or literal starting at @p pos
        ///
        /// @details
        /// Numbers without `.` or exponent become integers when they fit in
        /// `std::int64_t`, doubles otherwise. Containers are `type_mismatch`.
        Result<value> parse_scalar(position pos);

        /// @brief Builds the full value starting at @p pos, recursively
        ///
        /// @details
        /// Object members are inserted in file order, so a repeated key ends
        /// up holding its last value.
        Result<value> parse_value(position pos);

        /// @brief Builds the full value starting at @p pos into @p out
        /// @return Position right after the value
        Result<position> parse_value(position pos, value& out);

        /// @brief Unescapes the string token at @p pos into @p out
        /// @return Position right after the closing quote
        Result<position> parse_string(position pos, std::string& out);

        /// @brief Enters the array or object whose bracket is at @p pos
        Result<Step> open_container(position pos);

        /// @brief Moves from the end of an element to the next one
        ///
        /// @param pos   Position right after the previous element's value
        /// @param close `]` or `}`
        Result<Step> next_in_container(position pos, char close);

        /// @brief Moves from the end of an object key to the start of its value
        Result<position> skip_colon(position pos);

        [[nodiscard]] const ReaderOptions& options() const noexcept { return m_Opts; }

    private:
        static constexpr int end_of_input = -1;

        ByteSource& m_Source;
        ReaderOptions m_Opts;
        std::vector<char> m_Buf;
        position m_BufStart = 0;
        std::size_t m_BufLen = 0;

        Result<int> byte_at(position pos);

        Result<position> skip_value_impl(position pos, std::size_t depth);
        Result<position> skip_string(position pos);
        Result<position> skip_number(position pos);
        Result<position> skip_key(position pos);

        Result<position> parse_value_impl(position pos, std::size_t depth, value& out);
        Result<position> parse_scalar_impl(position pos, node_kind k, value& out);
        Result<position> parse_number(position pos, value& out);

        template<typename Out>
        Result<position> parse_string_into(position pos, Out& out);
    };

} // namespace LazyJson
