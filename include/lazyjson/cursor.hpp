#pragma once


/*
    ------------------------------------------------
    LazyJson::Cursor - Forward walk over a JSON stream
    ------------------------------------------------
    A JSON stream is one or more JSON values written back to back, possibly
    spread over several sources that are read as if concatenated. A `Cursor`
    stands on one top-level value at a time and only moves forward.

    ---------
    Behavior
    ---------
    - `open(...)` positions the cursor on the first value. Sources holding
      nothing but whitespace and comments are passed over
    - `current()` is the node the cursor stands on
    - `advance()` skips the current value, then moves to the next value in
      the same source or, once that source is used up, to the first value of
      the next one. Past the last value it fails with `stream_exhausted` and
      the cursor does not move
    - `advance_by(n)` advances `n` times and stops at the first failure,
      leaving the cursor wherever the last successful step put it
    - Node operations (`length`, `at`, `contains`, `materialize`, ...) are
      forwarded to `current()`

    -----
    Usage
    -----
        auto cursor = LazyJson::Cursor::open(LazyJson::make_source(R"(["x"] true {"y":1})"));
        while (cursor) {
            auto v = cursor->materialize();
            if (auto r = cursor->advance(); !r) break; // stream_exhausted at the end
        }
*/

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lazyjson/config.hpp"
#include "lazyjson/error.hpp"
#include "lazyjson/node.hpp"
#include "lazyjson/options.hpp"
#include "lazyjson/source.hpp"
#include "lazyjson/value.hpp"

/// @defgroup LazyJsonCursor Stream Cursor
/// @ingroup LazyJson
/// @brief Sequencing of top-level values across sources

namespace LazyJson {

    /// @ingroup LazyJsonCursor
    /// @brief Forward-only cursor over the top-level values of one or more sources
    class LAZYJSON_API Cursor {
    public:
        /// @brief Opens a cursor on the first value of @p source
        static Result<Cursor> open(std::shared_ptr<ByteSource> source, const ReaderOptions& opts = {});

        /// @brief Opens a cursor over @p sources, read in order as one stream
        ///
        /// @return The cursor, `invalid_argument` for an empty list or a null
        ///         source, or `stream_exhausted` if no source holds a value
        static Result<Cursor> open(std::vector<std::shared_ptr<ByteSource>> sources, const ReaderOptions& opts = {});

        [[nodiscard]] const Node& current() const noexcept { return m_Current; }

        /// @brief Moves to the next top-level value
        Result<void> advance();

        /// @brief Calls `advance()` @p n times
        Result<void> advance_by(std::int64_t n);

        /// @brief Number of successful advances since `open`
        [[nodiscard]] std::size_t ordinal() const noexcept { return m_Ordinal; }

        /// @brief Index of the source the current value belongs to
        [[nodiscard]] std::size_t source_index() const noexcept { return m_SourceIndex; }

        // ------------------------------------------------------------
        // Forwarded to current()
        // ------------------------------------------------------------

        [[nodiscard]] node_kind kind() const noexcept { return m_Current.kind(); }
        [[nodiscard]] bool is_object()  const noexcept { return m_Current.is_object();  }
        [[nodiscard]] bool is_array()   const noexcept { return m_Current.is_array();   }
        [[nodiscard]] bool is_string()  const noexcept { return m_Current.is_string();  }
        [[nodiscard]] bool is_number()  const noexcept { return m_Current.is_number();  }
        [[nodiscard]] bool is_true()    const noexcept { return m_Current.is_true();    }
        [[nodiscard]] bool is_false()   const noexcept { return m_Current.is_false();   }
        [[nodiscard]] bool is_boolean() const noexcept { return m_Current.is_boolean(); }
        [[nodiscard]] bool is_null()    const noexcept { return m_Current.is_null();    }

        Result<value> materialize() const { return m_Current.materialize(); }
        Result<std::size_t> length() const { return m_Current.length(); }
        Result<Node> at(std::int64_t index) const { return m_Current.at(index); }
        Result<Node> at(std::string_view key) const { return m_Current.at(key); }
        Result<bool> contains(const value& x) const { return m_Current.contains(x); }
        Result<bool> has_key(std::string_view key) const { return m_Current.has_key(key); }
        Result<std::vector<std::string>> keys() const { return m_Current.keys(); }
        Result<ElementIterator> elements() const { return m_Current.elements(); }
        Result<KeyIterator> member_keys() const { return m_Current.member_keys(); }
        Result<MemberIterator> items() const { return m_Current.items(); }

    private:
        struct Located {
            std::size_t source_index;
            Node node;
        };

        Cursor(std::vector<std::shared_ptr<ByteSource>> sources, Located first, const ReaderOptions& opts);

        /// First value at or after @p pos in source @p index, moving on to
        /// later sources when a source holds only trivia past that point.
        static Result<Located> locate(const std::vector<std::shared_ptr<ByteSource>>& sources, std::size_t index, position pos, const ReaderOptions& opts);

        std::vector<std::shared_ptr<ByteSource>> m_Sources;
        std::size_t m_SourceIndex = 0;
        Node m_Current;
        std::optional<position> m_End; ///< End of the current value once computed
        std::size_t m_Ordinal = 0;
        ReaderOptions m_Opts;
    };

} // namespace LazyJson
