#pragma once


/*
    ----------------------------------------------------------------
    LazyJson - Lazy, streaming JSON reader
    ----------------------------------------------------------------

    This is the main public header for LazyJson

    It brings together:
        - Byte sources:                 `LazyJson::ByteSource`,
                                        `LazyJson::StringSource`,
                                        `LazyJson::StreamSource`,
                                        `LazyJson::open_file(...)`
        - The tokenizer:                `LazyJson::Scanner`
        - Lazy value handles:           `LazyJson::Node` and its iterators
        - Stream navigation:            `LazyJson::Cursor`
        - Materialized values:          `LazyJson::value`
        - Error reporting types:        `LazyJson::ReadError`,
                                        `LazyJson::Result<T>`
        - Configuration options:        `LazyJson::ReaderOptions`

    -------------------
    High-Level Overview
    -------------------
    - Nodes:
        * A `Node` records where a value starts and what kind it is. Indexing,
          length and iteration walk the source from that position, skipping
          whatever they do not need, so memory use stays flat no matter how
          large the document is
        * `materialize()` turns a node (usually a small one deep inside the
          document) into a `LazyJson::value`
    - Streams:
        * A `Cursor` walks top-level values written back to back, across one
          or several sources, forward only
    - Errors:
        * Every fallible call returns `std::expected<T, ReadError>`
    - Grammar:
        * JSON plus `//` line comments and one trailing comma per container,
          both configurable through `ReaderOptions`

    -----
    Usage
    -----
        #include <lazyjson/lazyjson.hpp>

        int main() {
            auto file = LazyJson::open_file("huge.json");
            if (!file) return 1;

            auto cursor = LazyJson::Cursor::open(*file);
            if (!cursor) {
                std::println("Read error: {}", cursor.error().msg);
                return 1;
            }

            auto name = cursor->at("users")
                .and_then([](const LazyJson::Node& users) { return users.at(-1); })
                .and_then([](const LazyJson::Node& user) { return user.at("name"); })
                .and_then([](const LazyJson::Node& n) { return n.materialize(); });
            if (name) std::println("{}", name->as_string());
        }

    Include this header for the full LazyJson API, or include individual
    headers such as `node.hpp`, `cursor.hpp` and `source.hpp` directly.
*/

#include "lazyjson/config.hpp"
#include "lazyjson/error.hpp"
#include "lazyjson/options.hpp"
#include "lazyjson/value.hpp"
#include "lazyjson/source.hpp"
#include "lazyjson/scanner.hpp"
#include "lazyjson/node.hpp"
#include "lazyjson/cursor.hpp"
