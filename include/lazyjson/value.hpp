#pragma once


/*
    ----------------------------------------------
    LazyJson::value - Materialized JSON value
    ----------------------------------------------
    The `LazyJson::value` type is what a lazy node turns into once it is
    materialized. It represents any JSON value:
        - null
        - boolean
        - integer (`std::int64_t`, numbers written without `.` or exponent)
        - floating (`double`, every other number)
        - string
        - array
        - object

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (strings, array, objects)
    - Each `value` instance stores a pointer to its `memory_resource`:
        * All nested containers and strings owned by that `value` are allocated
          from this resource
        * Materialization uses `ReaderOptions::resource`
    - Copy construction/assignment:
        * The destination `value` adopts the allocator of the source and performs
          a deep copy of the underlying JSON tree into that allocator
    - Move construction/assignment:
        * The destination `value` steals the allocator and storage of the source

    -----------------
    Kinds and Queries
    -----------------
    - `kind type() const` returns the current kind
    - Convenience predicates:
        * `is_null()`, `is_bool()`, `is_integer()`, `is_floating()`,
          `is_number()`, `is_string()`, `is_array()`, `is_object()`

    -----------------------------
    Accessors and Auto-Conversion
    -----------------------------
    - Scalar accessors:
        * `as_bool()`, `as_integer()`, `as_floating()`, `as_string()`
        * These assume the current type matches and throw
          `std::bad_variant_access` otherwise
        * `as_number()` returns either numeric alternative as a `double`
    - Container accessors:
        * Non-const `as_array()`/`as_object()` convert the value in-place to
          an empty container of that kind if necessary
        * Const versions assume the type is already correct

    -------------------
    Objects
    -------------------
    - `object` is an ordered map, so a key can only appear once. When an
      object node holding the same key twice is materialized, the last
      occurrence wins

    ---------------------
    Equality
    ---------------------
    - Two values compare equal if they hold equal contents; arrays and objects
      compare structurally
    - Integers and floating values compare by exact numeric value, so
      `1 == 1.0`, while an integer above 2^53 never equals the double it
      rounds to

    -------------
    Thread-Safety
    -------------
    - `value` is not inherently thread-safe
    - Concurrent access to the same `value` instance must be externally synchronized
*/

/// @defgroup LazyJson LazyJson Library
/// @brief Core types and functions for LazyJson

/// @defgroup LazyJsonValue Materialized Value
/// @ingroup LazyJson
/// @brief In-memory JSON value produced by materializing a node

#include <variant>
#include <string>
#include <vector>
#include <map>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <utility>
#include "lazyjson/config.hpp"

namespace LazyJson {
    /// @ingroup LazyJsonValue
    /// @brief Enumerates the possible kinds held by LazyJson::value
    enum class kind : uint8_t {
        null,     ///< JSON null value
        boolean,  ///< JSON boolean value (`true` or `false`)
        integer,  ///< JSON number without fraction or exponent
        floating, ///< JSON number with fraction or exponent
        string,   ///< JSON string value
        array,    ///< JSON array value
        object,   ///< JSON object value
    };

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    template<class Key, class T, class Compare = std::less<>>
    using pmr_map = std::pmr::map<Key, T, Compare>;

    /// @ingroup LazyJsonValue
    /// @brief String type used by LazyJson::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup LazyJsonValue
    /// @brief Array type used by LazyJson::value
    using array = pmr_vector<value>;

    /// @ingroup LazyJsonValue
    /// @brief Object type used by LazyJson::value
    using object = pmr_map<string, value>;

    /// @ingroup LazyJsonValue
    /// @brief Variant storage used internally by LazyJson::value
    using storage_t = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        string,
        array,
        object
    >;


    /// @ingroup LazyJsonValue
    /// @brief Dynamic in-memory JSON value.
    ///
    /// @details
    /// Produced by `Node::materialize()`. All nested allocations are performed
    /// with the `std::pmr::memory_resource` associated with the instance.
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @brief Constructs a null value using the given memory resource
        LAZYJSON_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a null value
        LAZYJSON_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        LAZYJSON_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        LAZYJSON_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs an integer value from any integral type but `bool`
        ///
        /// @tparam I Integral type (e.g. int, long, int64_t)
        /// @param i Integer value, stored as `std::int64_t`
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<std::int64_t>(i) } {}

        LAZYJSON_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        LAZYJSON_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        LAZYJSON_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        LAZYJSON_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        LAZYJSON_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        LAZYJSON_API value(const value& other);

        LAZYJSON_API value(value&& other) noexcept;

        LAZYJSON_API value& operator=(const value& other);

        LAZYJSON_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        [[nodiscard]] LAZYJSON_API kind type() const noexcept;

        [[nodiscard]] bool is_null()     const noexcept { return type() == kind::null;     }

        [[nodiscard]] bool is_bool()     const noexcept { return type() == kind::boolean;  }

        [[nodiscard]] bool is_integer()  const noexcept { return type() == kind::integer;  }

        [[nodiscard]] bool is_floating() const noexcept { return type() == kind::floating; }

        [[nodiscard]] bool is_number()   const noexcept { return is_integer() || is_floating(); }

        [[nodiscard]] bool is_string()   const noexcept { return type() == kind::string;   }

        [[nodiscard]] bool is_array()    const noexcept { return type() == kind::array;    }

        [[nodiscard]] bool is_object()   const noexcept { return type() == kind::object;   }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        [[nodiscard]] LAZYJSON_API bool as_bool() const;

        [[nodiscard]] LAZYJSON_API std::int64_t as_integer() const;

        [[nodiscard]] LAZYJSON_API double as_floating() const;

        /// @brief Either numeric alternative converted to `double`
        [[nodiscard]] LAZYJSON_API double as_number() const;

        [[nodiscard]] LAZYJSON_API const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        [[nodiscard]] LAZYJSON_API array&       as_array();

        [[nodiscard]] LAZYJSON_API const array& as_array() const;

        [[nodiscard]] LAZYJSON_API object&       as_object();

        [[nodiscard]] LAZYJSON_API const object& as_object() const;

        /// @brief Element or member count for containers, 0 otherwise
        [[nodiscard]] LAZYJSON_API size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @brief Array element access; converts to an array and grows with nulls
        LAZYJSON_API value& operator[](size_t idx);

        /// @brief Array element access; a shared null for missing elements
        LAZYJSON_API const value& operator[](size_t idx) const;

        /// @brief Object member access; converts to an object and inserts null
        LAZYJSON_API value& operator[](std::string_view key);

        /// @brief Object member lookup; throws `std::out_of_range` if absent
        LAZYJSON_API const value& at(std::string_view key) const;

        LAZYJSON_API friend bool operator==(const value& lhs, const value& rhs) noexcept;

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }


    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace LazyJson
