#include "lazyjson/node.hpp"

#include <format>
#include <utility>


namespace LazyJson {

    namespace {
        using code = ReadError::code;

        char closer_of(node_kind k) noexcept { return k == node_kind::array ? ']' : '}'; }

        bool is_container(node_kind k) noexcept { return k == node_kind::array || k == node_kind::object; }

        // Skips one element (array) or one "key": value pair (object) starting at
        // `pos` and returns the position right after it.
        Result<position> skip_entry(Scanner& s, node_kind container, position pos) {
            if (container == node_kind::object) {
                auto k = s.classify(pos);
                if (!k) return std::unexpected(k.error());
                if (*k != node_kind::string) return std::unexpected(ReadError::make(code::malformed_json, pos, "Expected '\"' to start object key"));
                auto key_end = s.skip_value(pos);
                if (!key_end) return std::unexpected(key_end.error());
                auto val = s.skip_colon(*key_end);
                if (!val) return std::unexpected(val.error());
                pos = *val;
            }
            return s.skip_value(pos);
        }

        // Reads the key at `pos` and returns the position of its value.
        Result<position> read_key(Scanner& s, position pos, std::string& key) {
            auto key_end = s.parse_string(pos, key);
            if (!key_end) return std::unexpected(key_end.error());
            return s.skip_colon(*key_end);
        }
    } // namespace

#pragma region Node

    Node::Node(std::shared_ptr<ByteSource> source, position start, node_kind kind, const ReaderOptions& opts)
        : m_Source{ std::move(source) }, m_Start{ start }, m_Kind{ kind }, m_Opts{ opts } {}

    Result<Node> Node::open(std::shared_ptr<ByteSource> source, position pos, const ReaderOptions& opts) {
        if (!source) return std::unexpected(ReadError::make(code::invalid_argument, pos, "Node requires a byte source"));
        Scanner s{ *source, opts };
        auto start = s.skip_trivia(pos);
        if (!start) return std::unexpected(start.error());
        return at_value(s, source, *start, opts);
    }

    Result<Node> Node::at_value(Scanner& s, const std::shared_ptr<ByteSource>& source, position pos, const ReaderOptions& opts) {
        auto k = s.classify(pos);
        if (!k) return std::unexpected(k.error());
        return Node{ source, pos, *k, opts };
    }

    ReadError Node::type_error(std::string_view op, std::string_view expected) const {
        return ReadError::make(code::type_mismatch, m_Start,
            std::format("{} requires {}, got {}", op, expected, to_string(m_Kind)));
    }

    Result<value> Node::materialize() const {
        Scanner s{ *m_Source, m_Opts };
        return s.parse_value(m_Start);
    }

    Result<position> Node::end() const {
        Scanner s{ *m_Source, m_Opts };
        return s.skip_value(m_Start);
    }

    Result<std::size_t> Node::length() const {
        if (!is_container(m_Kind)) return std::unexpected(type_error("length()", "an array or object"));

        Scanner s{ *m_Source, m_Opts };
        auto step = s.open_container(m_Start);
        if (!step) return std::unexpected(step.error());

        std::size_t count = 0;
        while (!step->done) {
            auto end = skip_entry(s, m_Kind, step->pos);
            if (!end) return std::unexpected(end.error());
            count++;
            step = s.next_in_container(*end, closer_of(m_Kind));
            if (!step) return std::unexpected(step.error());
        }
        return count;
    }

    Result<Node> Node::at(std::int64_t index) const {
        if (m_Kind != node_kind::array) return std::unexpected(type_error("Integer index", "an array"));

        if (index < 0) {
            auto n = length();
            if (!n) return std::unexpected(n.error());
            index += static_cast<std::int64_t>(*n);
            if (index < 0) return std::unexpected(ReadError::make(code::index_out_of_range, m_Start, "Array index out of range"));
        }

        Scanner s{ *m_Source, m_Opts };
        auto step = s.open_container(m_Start);
        if (!step) return std::unexpected(step.error());

        for (std::int64_t i = 0; i < index && !step->done; i++) {
            auto end = s.skip_value(step->pos);
            if (!end) return std::unexpected(end.error());
            step = s.next_in_container(*end, ']');
            if (!step) return std::unexpected(step.error());
        }
        if (step->done) return std::unexpected(ReadError::make(code::index_out_of_range, m_Start, "Array index out of range"));
        return at_value(s, m_Source, step->pos, m_Opts);
    }

    Result<Node> Node::at(std::string_view key) const {
        if (m_Kind != node_kind::object) return std::unexpected(type_error("String key", "an object"));

        Scanner s{ *m_Source, m_Opts };
        auto step = s.open_container(m_Start);
        if (!step) return std::unexpected(step.error());

        std::string current;
        while (!step->done) {
            current.clear();
            auto val = read_key(s, step->pos, current);
            if (!val) return std::unexpected(val.error());
            if (current == key) return at_value(s, m_Source, *val, m_Opts);

            auto end = s.skip_value(*val);
            if (!end) return std::unexpected(end.error());
            step = s.next_in_container(*end, '}');
            if (!step) return std::unexpected(step.error());
        }
        return std::unexpected(ReadError::make(code::key_not_found, m_Start, std::format("Key not found: \"{}\"", key)));
    }

    Result<bool> Node::contains(const value& x) const {
        if (m_Kind == node_kind::object) {
            if (!x.is_string()) return false;
            return has_key(x.as_string());
        }
        if (m_Kind != node_kind::array) return std::unexpected(type_error("contains()", "an array or object"));

        Scanner s{ *m_Source, m_Opts };
        auto step = s.open_container(m_Start);
        if (!step) return std::unexpected(step.error());

        while (!step->done) {
            value elem{ m_Opts.resource };
            auto end = s.parse_value(step->pos, elem);
            if (!end) return std::unexpected(end.error());
            if (elem == x) return true;
            step = s.next_in_container(*end, ']');
            if (!step) return std::unexpected(step.error());
        }
        return false;
    }

    Result<bool> Node::has_key(std::string_view key) const {
        auto it = member_keys();
        if (!it) return std::unexpected(it.error());
        while (true) {
            auto k = it->next();
            if (!k) return std::unexpected(k.error());
            if (!*k) return false;
            if (**k == key) return true;
        }
    }

    Result<std::vector<std::string>> Node::keys() const {
        auto it = member_keys();
        if (!it) return std::unexpected(it.error());

        std::vector<std::string> out;
        while (true) {
            auto k = it->next();
            if (!k) return std::unexpected(k.error());
            if (!*k) return out;
            out.push_back(std::move(**k));
        }
    }

    Result<ElementIterator> Node::elements() const {
        if (m_Kind != node_kind::array) return std::unexpected(type_error("elements()", "an array"));
        return ElementIterator{ m_Source, m_Start, m_Kind, m_Opts };
    }

    Result<KeyIterator> Node::member_keys() const {
        if (m_Kind != node_kind::object) return std::unexpected(type_error("member_keys()", "an object"));
        return KeyIterator{ m_Source, m_Start, m_Kind, m_Opts };
    }

    Result<MemberIterator> Node::items() const {
        if (m_Kind != node_kind::object) return std::unexpected(type_error("items()", "an object"));
        return MemberIterator{ m_Source, m_Start, m_Kind, m_Opts };
    }

#pragma endregion
#pragma region Iterators

    ContainerIterator::ContainerIterator(std::shared_ptr<ByteSource> source, position open, node_kind kind, const ReaderOptions& opts)
        : m_Source{ std::move(source) }, m_Opts{ opts }, m_Scanner{ *m_Source, m_Opts },
          m_Open{ open }, m_Close{ closer_of(kind) } {}

    Result<std::optional<position>> ContainerIterator::next_element() {
        if (m_Done) return std::nullopt;

        Result<Scanner::Step> step;
        if (!m_Last) {
            step = m_Scanner.open_container(m_Open);
        } else {
            auto end = m_Scanner.skip_value(*m_Last);
            if (!end) return std::unexpected(end.error());
            step = m_Scanner.next_in_container(*end, m_Close);
        }
        if (!step) return std::unexpected(step.error());

        if (step->done) {
            m_Done = true;
            return std::nullopt;
        }
        return step->pos;
    }

    Result<std::optional<Node>> ElementIterator::next() {
        auto pos = next_element();
        if (!pos) return std::unexpected(pos.error());
        if (!*pos) return std::nullopt;

        auto node = Node::at_value(m_Scanner, m_Source, **pos, m_Opts);
        if (!node) return std::unexpected(node.error());
        m_Last = **pos;
        return std::move(*node);
    }

    Result<std::optional<Member>> MemberIterator::next() {
        auto pos = next_element();
        if (!pos) return std::unexpected(pos.error());
        if (!*pos) return std::nullopt;

        std::string key;
        auto val = read_key(m_Scanner, **pos, key);
        if (!val) return std::unexpected(val.error());
        auto node = Node::at_value(m_Scanner, m_Source, *val, m_Opts);
        if (!node) return std::unexpected(node.error());
        m_Last = *val;
        return Member{ std::move(key), std::move(*node) };
    }

    Result<std::optional<std::string>> KeyIterator::next() {
        auto pos = next_element();
        if (!pos) return std::unexpected(pos.error());
        if (!*pos) return std::nullopt;

        std::string key;
        auto val = read_key(m_Scanner, **pos, key);
        if (!val) return std::unexpected(val.error());
        m_Last = *val;
        return key;
    }

#pragma endregion

} // namespace LazyJson
