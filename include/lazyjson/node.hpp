#pragma once


/*
    ------------------------------------------
    LazyJson::Node - Unmaterialized JSON value
    ------------------------------------------
    A `Node` is a handle to one JSON value inside a byte source: the source,
    the position of the value's first byte, and the value's kind. Nothing
    below that position is parsed until an operation asks for it, and nothing
    is kept afterwards: every child node is created fresh on each access.

    ----------
    Operations
    ----------
    - `kind()`, `is_*()`: O(1)
    - `materialize()`: parses the whole subtree into a `LazyJson::value`
    - `length()`: element or member count, by skipping
    - `at(index)`: array element; negative indices count from the end and
      cost a second scan
    - `at(key)`: first object member with that key, in file order
    - `contains(x)`: array element equal to `x`, or object key equal to `x`
    - `elements()`, `member_keys()`, `items()`: single-pass iterators

    ----------------
    Duplicate keys
    ----------------
    Lookup and iteration see every member in file order, so `at(key)` returns
    the first member with that key. `materialize()` builds an ordered map in
    which the last member wins. An object node can therefore report a larger
    `length()` than its materialized `size()`.

    -----------------
    Cost and sharing
    -----------------
    - Indexing and length are linear in the size of the containing value;
      no boundaries are cached between calls
    - Every operation seeks the source to the position it needs before
      reading. Nodes of the same source share its read position, so using
      them from several threads requires external synchronization

    -----
    Usage
    -----
        auto root = LazyJson::Node::open(LazyJson::make_source(R"({"a":[1,2,3]})"));
        if (!root) return;
        auto second = root->at("a").and_then([](const LazyJson::Node& a) { return a.at(1); });
        auto v = second->materialize(); // 2
*/

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lazyjson/config.hpp"
#include "lazyjson/error.hpp"
#include "lazyjson/options.hpp"
#include "lazyjson/scanner.hpp"
#include "lazyjson/source.hpp"
#include "lazyjson/value.hpp"

/// @defgroup LazyJsonNode Nodes
/// @ingroup LazyJson
/// @brief Lazy handles into a byte source

namespace LazyJson {

    class ElementIterator;
    class MemberIterator;
    class KeyIterator;

    /// @ingroup LazyJsonNode
    /// @brief Lazy handle to one JSON value
    class LAZYJSON_API Node {
    public:
        /// @brief Creates a node for the first value at or after @p pos
        ///
        /// @details
        /// Whitespace and comments before the value are skipped, so the
        /// node's `start()` is the value's first byte.
        ///
        /// @param source Byte source; must outlive every node derived from it
        /// @param pos    Position to start looking from
        /// @param opts   Options inherited by every derived node
        /// @return The node, `unexpected_end` if only trivia remains, or
        ///         `malformed_json` if no value starts there
        static Result<Node> open(std::shared_ptr<ByteSource> source, position pos = 0, const ReaderOptions& opts = {});

        [[nodiscard]] node_kind kind() const noexcept { return m_Kind; }

        /// @brief Position of the value's first byte
        [[nodiscard]] position start() const noexcept { return m_Start; }

        [[nodiscard]] const std::shared_ptr<ByteSource>& source() const noexcept { return m_Source; }

        [[nodiscard]] const ReaderOptions& options() const noexcept { return m_Opts; }

        [[nodiscard]] bool is_object()  const noexcept { return m_Kind == node_kind::object;      }
        [[nodiscard]] bool is_array()   const noexcept { return m_Kind == node_kind::array;       }
        [[nodiscard]] bool is_string()  const noexcept { return m_Kind == node_kind::string;      }
        [[nodiscard]] bool is_number()  const noexcept { return m_Kind == node_kind::number;      }
        [[nodiscard]] bool is_true()    const noexcept { return m_Kind == node_kind::true_value;  }
        [[nodiscard]] bool is_false()   const noexcept { return m_Kind == node_kind::false_value; }
        [[nodiscard]] bool is_boolean() const noexcept { return is_true() || is_false();          }
        [[nodiscard]] bool is_null()    const noexcept { return m_Kind == node_kind::null;        }

        /// @brief Parses the whole value, recursively
        ///
        /// @details
        /// Duplicate object keys collapse to their last occurrence.
        Result<value> materialize() const;

        /// @brief Position right after the value
        Result<position> end() const;

        /// @brief Number of array elements or object members
        ///
        /// @details
        /// Members are counted as written, duplicates included. Other kinds
        /// fail with `type_mismatch`.
        Result<std::size_t> length() const;

        /// @brief Array element at @p index
        ///
        /// @details
        /// A negative index counts from the end (`-1` is the last element);
        /// it costs a full counting scan before the element is located.
        ///
        /// @return The element, `index_out_of_range`, or `type_mismatch` if
        ///         this is not an array
        Result<Node> at(std::int64_t index) const;

        /// @brief Value of the first member named @p key
        ///
        /// @details
        /// Stops at the first match without scanning the remaining members.
        ///
        /// @return The member's value, `key_not_found`, or `type_mismatch` if
        ///         this is not an object
        Result<Node> at(std::string_view key) const;

        /// @brief Array: some element materializes equal to @p x.
        ///        Object: some key equals @p x.
        ///
        /// @details
        /// Stops at the first match. Object values are never compared, and a
        /// non-string @p x is never a key. Scalars fail with `type_mismatch`.
        Result<bool> contains(const value& x) const;

        /// @brief Whether an object has a member named @p key
        Result<bool> has_key(std::string_view key) const;

        /// @brief All member keys of an object, in file order, duplicates kept
        Result<std::vector<std::string>> keys() const;

        /// @brief Iterator over an array's elements
        Result<ElementIterator> elements() const;

        /// @brief Iterator over an object's keys
        Result<KeyIterator> member_keys() const;

        /// @brief Iterator over an object's `(key, value)` members
        Result<MemberIterator> items() const;

    private:
        friend class ElementIterator;
        friend class MemberIterator;

        Node(std::shared_ptr<ByteSource> source, position start, node_kind kind, const ReaderOptions& opts);

        /// Node for a value known to start exactly at @p pos
        static Result<Node> at_value(Scanner& s, const std::shared_ptr<ByteSource>& source, position pos, const ReaderOptions& opts);

        ReadError type_error(std::string_view op, std::string_view expected) const;

        std::shared_ptr<ByteSource> m_Source;
        position m_Start = 0;
        node_kind m_Kind = node_kind::null;
        ReaderOptions m_Opts;
    };

    /// @ingroup LazyJsonNode
    /// @brief One object member as produced by `MemberIterator`
    struct Member {
        std::string key; ///< Materialized key
        Node value;      ///< Lazy value
    };

    /// @ingroup LazyJsonNode
    /// @brief Shared state of the container iterators
    ///
    /// @details
    /// An iterator is bound to its container's start position and walks it
    /// once. Starting over means asking the node for a new iterator.
    class LAZYJSON_API ContainerIterator {
    public:
        /// @brief Whether the closing bracket has been reached
        [[nodiscard]] bool done() const noexcept { return m_Done; }

    protected:
        ContainerIterator(std::shared_ptr<ByteSource> source, position open, node_kind kind, const ReaderOptions& opts);

        /// Start of the next element (the key, for objects), or nothing at the end.
        /// Nothing moves until the caller records the element in `m_Last`, so
        /// a failed `next()` fails the same way when called again.
        Result<std::optional<position>> next_element();

        std::shared_ptr<ByteSource> m_Source;
        ReaderOptions m_Opts;
        Scanner m_Scanner;
        position m_Open = 0;
        char m_Close = ']';
        std::optional<position> m_Last; ///< Start of the last value handed out
        bool m_Done = false;
    };

    /// @ingroup LazyJsonNode
    /// @brief Single-pass iterator over array elements
    ///
    /// @code
    /// auto it = node.elements();
    /// while (true) {
    ///     auto elem = it->next();
    ///     if (!elem || !*elem) break;
    ///     use(**elem);
    /// }
    /// @endcode
    class LAZYJSON_API ElementIterator : public ContainerIterator {
    public:
        /// @brief Next element, or `std::nullopt` after the last one
        Result<std::optional<Node>> next();

    private:
        friend class Node;
        ElementIterator(std::shared_ptr<ByteSource> source, position open, node_kind kind, const ReaderOptions& opts)
            : ContainerIterator{ std::move(source), open, kind, opts } {}
    };

    /// @ingroup LazyJsonNode
    /// @brief Single-pass iterator over object members
    class LAZYJSON_API MemberIterator : public ContainerIterator {
    public:
        /// @brief Next member with its key materialized, or `std::nullopt` after the last one
        Result<std::optional<Member>> next();

    private:
        friend class Node;
        MemberIterator(std::shared_ptr<ByteSource> source, position open, node_kind kind, const ReaderOptions& opts)
            : ContainerIterator{ std::move(source), open, kind, opts } {}
    };

    /// @ingroup LazyJsonNode
    /// @brief Single-pass iterator over object keys
    class LAZYJSON_API KeyIterator : public ContainerIterator {
    public:
        Result<std::optional<std::string>> next();

    private:
        friend class Node;
        KeyIterator(std::shared_ptr<ByteSource> source, position open, node_kind kind, const ReaderOptions& opts)
            : ContainerIterator{ std::move(source), open, kind, opts } {}
    };

} // namespace LazyJson
