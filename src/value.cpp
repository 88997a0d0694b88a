#include "lazyjson/value.hpp"

#include <stdexcept>


namespace LazyJson {

    namespace {
        // True when `d` is integral and equal to `i` without rounding `i`
        bool same_number(std::int64_t i, double d) noexcept {
            constexpr double two_63 = 9223372036854775808.0;
            if (!(d >= -two_63 && d < two_63)) return false;
            auto t = static_cast<std::int64_t>(d);
            return static_cast<double>(t) == d && t == i;
        }
    } // namespace

    value::value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ b } {}

    value::value(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ d } {}

    value::value(const char* s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ s, res } } {}

    value::value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ sv.begin(), sv.end(), res } } {}

    value::value(string s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(s) } {}

    value::value(array a, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(a) } {}

    value::value(object o, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(o) } {}

    value::value(const value& other)
        : m_MemRes{ other.m_MemRes }, m_Storage{ clone_storage(other.m_Storage, other.m_MemRes) } {}

    value::value(value&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    value& value::operator=(const value& other) {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = clone_storage(other.m_Storage, other.m_MemRes);
        return *this;
    }

    value& value::operator=(value&& other) noexcept {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = std::move(other.m_Storage);
        return *this;
    }

    // `kind` lists the alternatives in `storage_t` order
    kind value::type() const noexcept {
        return static_cast<kind>(m_Storage.index());
    }

    bool value::as_bool() const { return std::get<bool>(m_Storage); }
    std::int64_t value::as_integer() const { return std::get<std::int64_t>(m_Storage); }
    double value::as_floating() const { return std::get<double>(m_Storage); }
    const string& value::as_string() const { return std::get<string>(m_Storage); }
    array& value::as_array() { if (!is_array()) m_Storage = array{ allocator_type(m_MemRes) }; return std::get<array>(m_Storage); }
    const array& value::as_array() const { return std::get<array>(m_Storage); }
    object& value::as_object() { if (!is_object()) m_Storage = object{ allocator_type(m_MemRes) }; return std::get<object>(m_Storage); }
    const object& value::as_object() const { return std::get<object>(m_Storage); }

    double value::as_number() const {
        if (is_integer()) return static_cast<double>(as_integer());
        return as_floating();
    }

    size_t value::size() const noexcept {
        if (is_array()) return as_array().size();
        if (is_object()) return as_object().size();
        return 0;
    }

    value& value::operator[](std::size_t idx) {
        auto& arr = as_array();
        if (idx >= arr.size()) {
            arr.resize(idx + 1, value{ m_MemRes });
        }
        return arr[idx];
    }

    const value& value::operator[](std::size_t idx) const {
        static const value null_sentinel{};
        if (!is_array()) return null_sentinel;
        const auto& arr = as_array();
        if (idx >= arr.size()) return null_sentinel;
        return arr[idx];
    }

    value& value::operator[](std::string_view key) {
        auto& obj = as_object();
        string k{ key.begin(), key.end(), m_MemRes };
        auto [it, inserted] = obj.emplace(std::move(k), value{ m_MemRes });
        return it->second;
    }

    const value& value::at(std::string_view key) const {
        if (is_object()) {
            const auto& obj = as_object();
            if (auto it = obj.find(key); it != obj.end()) return it->second;
        }
        throw std::out_of_range{ "LazyJson::value::at: key not found" };
    }

    bool operator==(const value& lhs, const value& rhs) noexcept {
        if (lhs.is_integer() && rhs.is_floating()) return same_number(lhs.as_integer(), rhs.as_floating());
        if (lhs.is_floating() && rhs.is_integer()) return same_number(rhs.as_integer(), lhs.as_floating());
        return lhs.m_Storage == rhs.m_Storage;
    }

    storage_t value::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        switch (s.index()) {
        case 0: return std::monostate{};
        case 1: return std::get<bool>(s);
        case 2: return std::get<std::int64_t>(s);
        case 3: return std::get<double>(s);
        case 4: {
            const auto& str = std::get<string>(s);
            return string{ str, res };
        }
        case 5: {
            const auto& arr = std::get<array>(s);
            array copy(allocator_type{ res });
            copy.reserve(arr.size());
            for (const auto& v : arr) copy.emplace_back(v);
            return copy;
        }
        case 6: {
            const auto& obj = std::get<object>(s);
            object copy{ std::less<>{}, res };
            for (const auto& [k, v] : obj) copy.emplace(string{ k, res }, value{ v });
            return copy;
        }
        }
        return std::monostate{};
    }

} // namespace LazyJson
