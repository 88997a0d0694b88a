#include "lazyjson/scanner.hpp"

#include <algorithm>
#include <charconv>
#include <string_view>
#include <system_error>
#include <utility>


namespace LazyJson {

    namespace {
        using code = ReadError::code;

        constexpr std::string_view true_literal = "true";
        constexpr std::string_view false_literal = "false";
        constexpr std::string_view null_literal = "null";

        bool is_ws(int c) noexcept { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
        bool is_digit(int c) noexcept { return c >= '0' && c <= '9'; }

        std::unexpected<ReadError> fail(code c, position pos, std::string_view msg) {
            return std::unexpected(ReadError::make(c, pos, msg));
        }

        // Missing data and wrong data are reported differently.
        std::unexpected<ReadError> fail_at(int c, position pos, std::string_view msg) {
            if (c < 0) return fail(code::unexpected_end, pos, "Unexpected end of input");
            return fail(code::malformed_json, pos, msg);
        }

        template<typename Out>
        void append_utf8(uint32_t cp, Out& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        char closer_of(node_kind k) noexcept { return k == node_kind::array ? ']' : '}'; }
    } // namespace

    std::string_view to_string(node_kind k) noexcept {
        switch (k) {
        case node_kind::object:      return "object";
        case node_kind::array:       return "array";
        case node_kind::string:      return "string";
        case node_kind::number:      return "number";
        case node_kind::true_value:  return "true";
        case node_kind::false_value: return "false";
        case node_kind::null:        return "null";
        }
        return "unknown";
    }

    Scanner::Scanner(ByteSource& source, const ReaderOptions& opts)
        : m_Source{ source }, m_Opts{ opts }, m_Buf(std::max<std::size_t>(opts.buffer_size, 1)) {}

    Result<int> Scanner::byte_at(position pos) {
        if (pos >= m_BufStart && pos - m_BufStart < m_BufLen)
            return static_cast<unsigned char>(m_Buf[pos - m_BufStart]);

        if (auto s = m_Source.seek(pos); !s) return std::unexpected(s.error());
        auto n = m_Source.read(m_Buf.data(), m_Buf.size());
        if (!n) return std::unexpected(n.error());

        m_BufStart = pos;
        m_BufLen = *n;
        if (m_BufLen == 0) return end_of_input;
        return static_cast<unsigned char>(m_Buf[0]);
    }

#pragma region Trivia and classification

    Result<position> Scanner::skip_trivia(position pos) {
        while (true) {
            auto c = byte_at(pos);
            if (!c) return std::unexpected(c.error());
            if (*c == end_of_input) return fail(code::unexpected_end, pos, "Unexpected end of input, expected a value");

            if (is_ws(*c)) {
                pos++;
                continue;
            }

            if (*c == '/' && m_Opts.allow_comments) {
                auto next = byte_at(pos + 1);
                if (!next) return std::unexpected(next.error());
                if (*next == '/') {
                    // Line comment
                    pos += 2;
                    while (true) {
                        auto ch = byte_at(pos);
                        if (!ch) return std::unexpected(ch.error());
                        if (*ch == end_of_input) return fail(code::unexpected_end, pos, "Unexpected end of input in comment");
                        pos++;
                        if (*ch == '\n') break;
                    }
                    continue;
                }
            }
            return pos;
        }
    }

    Result<node_kind> Scanner::classify(position pos) {
        auto c = byte_at(pos);
        if (!c) return std::unexpected(c.error());

        auto match = [&](std::string_view literal, node_kind k) -> Result<node_kind> {
            for (std::size_t i = 1; i < literal.size(); i++) {
                auto ch = byte_at(pos + i);
                if (!ch) return std::unexpected(ch.error());
                if (*ch != literal[i]) return fail_at(*ch, pos, "Invalid literal");
            }
            return k;
        };

        switch (*c) {
        case '{': return node_kind::object;
        case '[': return node_kind::array;
        case '"': return node_kind::string;
        case 't': return match(true_literal, node_kind::true_value);
        case 'f': return match(false_literal, node_kind::false_value);
        case 'n': return match(null_literal, node_kind::null);
        default:
            if (*c == '-' || is_digit(*c)) return node_kind::number;
            return fail_at(*c, pos, "Unexpected character while looking for a value");
        }
    }

#pragma endregion
#pragma region Skipping

    Result<position> Scanner::skip_value(position pos) {
        return skip_value_impl(pos, 0);
    }

    Result<position> Scanner::skip_value_impl(position pos, std::size_t depth) {
        auto k = classify(pos);
        if (!k) return std::unexpected(k.error());

        switch (*k) {
        case node_kind::string: return skip_string(pos);
        case node_kind::number: return skip_number(pos);
        case node_kind::true_value: return pos + true_literal.size();
        case node_kind::false_value: return pos + false_literal.size();
        case node_kind::null: return pos + null_literal.size();
        case node_kind::array:
        case node_kind::object: break;
        }

        if (m_Opts.max_depth != 0 && depth + 1 > m_Opts.max_depth)
            return fail(code::depth_limit_exceeded, pos, "Maximum nesting depth exceeded");

        const char close = closer_of(*k);
        auto step = open_container(pos);
        if (!step) return std::unexpected(step.error());

        while (!step->done) {
            position elem = step->pos;
            if (*k == node_kind::object) {
                auto key_end = skip_key(elem);
                if (!key_end) return std::unexpected(key_end.error());
                auto val = skip_colon(*key_end);
                if (!val) return std::unexpected(val.error());
                elem = *val;
            }
            auto end = skip_value_impl(elem, depth + 1);
            if (!end) return std::unexpected(end.error());
            step = next_in_container(*end, close);
            if (!step) return std::unexpected(step.error());
        }
        return step->pos;
    }

    Result<position> Scanner::skip_string(position pos) {
        pos++; // Opening quote
        while (true) {
            auto c = byte_at(pos);
            if (!c) return std::unexpected(c.error());
            if (*c == end_of_input) return fail(code::unexpected_end, pos, "Nonterminated string");
            if (*c == '"') return pos + 1;
            if (*c == '\n') return fail(code::malformed_json, pos, "End of line while scanning string");
            if (*c == '\\') {
                auto esc = byte_at(pos + 1);
                if (!esc) return std::unexpected(esc.error());
                if (*esc == end_of_input) return fail(code::unexpected_end, pos + 1, "Unfinished escape sequence");
                pos += (*esc == 'u') ? 6 : 2;
                continue;
            }
            pos++;
        }
    }

    Result<position> Scanner::skip_number(position pos) {
        auto c = byte_at(pos);
        if (!c) return std::unexpected(c.error());

        if (*c == '-') {
            c = byte_at(++pos);
            if (!c) return std::unexpected(c.error());
        }
        if (!is_digit(*c)) return fail_at(*c, pos, "Expected digit");

        // A leading zero stands alone
        if (*c == '0') {
            c = byte_at(++pos);
            if (!c) return std::unexpected(c.error());
        } else {
            while (is_digit(*c)) {
                c = byte_at(++pos);
                if (!c) return std::unexpected(c.error());
            }
        }

        if (*c == '.') {
            c = byte_at(++pos);
            if (!c) return std::unexpected(c.error());
            if (!is_digit(*c)) return fail_at(*c, pos, "Expected digit after '.'");
            while (is_digit(*c)) {
                c = byte_at(++pos);
                if (!c) return std::unexpected(c.error());
            }
        }

        if (*c == 'e' || *c == 'E') {
            c = byte_at(++pos);
            if (!c) return std::unexpected(c.error());
            if (*c == '+' || *c == '-') {
                c = byte_at(++pos);
                if (!c) return std::unexpected(c.error());
            }
            if (!is_digit(*c)) return fail_at(*c, pos, "Expected digit in exponent");
            while (is_digit(*c)) {
                c = byte_at(++pos);
                if (!c) return std::unexpected(c.error());
            }
        }
        return pos;
    }

    Result<position> Scanner::skip_key(position pos) {
        auto c = byte_at(pos);
        if (!c) return std::unexpected(c.error());
        if (*c != '"') return fail_at(*c, pos, "Expected '\"' to start object key");
        return skip_string(pos);
    }

#pragma endregion
#pragma region Containers

    Result<Scanner::Step> Scanner::open_container(position pos) {
        auto c = byte_at(pos);
        if (!c) return std::unexpected(c.error());
        if (*c != '[' && *c != '{') return fail_at(*c, pos, "Expected '[' or '{'");
        const char close = (*c == '[') ? ']' : '}';

        auto first = skip_trivia(pos + 1);
        if (!first) return std::unexpected(first.error());
        auto n = byte_at(*first);
        if (!n) return std::unexpected(n.error());
        if (*n == close) return Step{ true, *first + 1 };
        return Step{ false, *first };
    }

    Result<Scanner::Step> Scanner::next_in_container(position pos, char close) {
        auto sep = skip_trivia(pos);
        if (!sep) return std::unexpected(sep.error());
        auto c = byte_at(*sep);
        if (!c) return std::unexpected(c.error());

        if (*c == close) return Step{ true, *sep + 1 };
        if (*c != ',') {
            return fail(code::malformed_json, *sep, close == ']' ? "Expected ',' or ']' in array" : "Expected ',' or '}' in object");
        }

        auto next = skip_trivia(*sep + 1);
        if (!next) return std::unexpected(next.error());
        c = byte_at(*next);
        if (!c) return std::unexpected(c.error());
        if (*c == close) {
            if (!m_Opts.allow_trailing_commas) return fail(code::malformed_json, *sep, "Trailing commas not allowed");
            return Step{ true, *next + 1 };
        }
        return Step{ false, *next };
    }

    Result<position> Scanner::skip_colon(position pos) {
        auto colon = skip_trivia(pos);
        if (!colon) return std::unexpected(colon.error());
        auto c = byte_at(*colon);
        if (!c) return std::unexpected(c.error());
        if (*c != ':') return fail(code::malformed_json, *colon, "Expected ':' after object key");
        return skip_trivia(*colon + 1);
    }

#pragma endregion
#pragma region Parsing

    Result<value> Scanner::parse_scalar(position pos) {
        auto k = classify(pos);
        if (!k) return std::unexpected(k.error());
        if (*k == node_kind::array || *k == node_kind::object)
            return fail(code::type_mismatch, pos, "Not a scalar value");

        value out{ m_Opts.resource };
        if (auto end = parse_scalar_impl(pos, *k, out); !end) return std::unexpected(end.error());
        return out;
    }

    Result<value> Scanner::parse_value(position pos) {
        value out{ m_Opts.resource };
        if (auto end = parse_value_impl(pos, 0, out); !end) return std::unexpected(end.error());
        return out;
    }

    Result<position> Scanner::parse_value(position pos, value& out) {
        return parse_value_impl(pos, 0, out);
    }

    Result<position> Scanner::parse_string(position pos, std::string& out) {
        auto c = byte_at(pos);
        if (!c) return std::unexpected(c.error());
        if (*c != '"') return fail_at(*c, pos, "Expected '\"' to start a string");
        return parse_string_into(pos, out);
    }

    Result<position> Scanner::parse_value_impl(position pos, std::size_t depth, value& out) {
        auto k = classify(pos);
        if (!k) return std::unexpected(k.error());
        if (*k != node_kind::array && *k != node_kind::object) return parse_scalar_impl(pos, *k, out);

        if (m_Opts.max_depth != 0 && depth + 1 > m_Opts.max_depth)
            return fail(code::depth_limit_exceeded, pos, "Maximum nesting depth exceeded");

        auto* res = m_Opts.resource;
        const char close = closer_of(*k);
        auto step = open_container(pos);
        if (!step) return std::unexpected(step.error());

        if (*k == node_kind::array) {
            array arr{ allocator_type(res) };
            while (!step->done) {
                value elem{ res };
                auto end = parse_value_impl(step->pos, depth + 1, elem);
                if (!end) return std::unexpected(end.error());
                arr.emplace_back(std::move(elem));
                step = next_in_container(*end, close);
                if (!step) return std::unexpected(step.error());
            }
            out = value{ std::move(arr), res };
            return step->pos;
        }

        object obj{ std::less<>{}, allocator_type(res) };
        while (!step->done) {
            auto c = byte_at(step->pos);
            if (!c) return std::unexpected(c.error());
            if (*c != '"') return fail_at(*c, step->pos, "Expected '\"' to start object key");

            string key{ res };
            auto key_end = parse_string_into(step->pos, key);
            if (!key_end) return std::unexpected(key_end.error());
            auto val_pos = skip_colon(*key_end);
            if (!val_pos) return std::unexpected(val_pos.error());

            value member{ res };
            auto end = parse_value_impl(*val_pos, depth + 1, member);
            if (!end) return std::unexpected(end.error());
            obj.insert_or_assign(std::move(key), std::move(member)); // Last occurrence wins

            step = next_in_container(*end, close);
            if (!step) return std::unexpected(step.error());
        }
        out = value{ std::move(obj), res };
        return step->pos;
    }

    Result<position> Scanner::parse_scalar_impl(position pos, node_kind k, value& out) {
        auto* res = m_Opts.resource;
        switch (k) {
        case node_kind::true_value:
            out = value{ true, res };
            return pos + true_literal.size();
        case node_kind::false_value:
            out = value{ false, res };
            return pos + false_literal.size();
        case node_kind::null:
            out = value{ nullptr, res };
            return pos + null_literal.size();
        case node_kind::number:
            return parse_number(pos, out);
        case node_kind::string: {
            string s{ res };
            auto end = parse_string_into(pos, s);
            if (!end) return std::unexpected(end.error());
            out = value{ std::move(s), res };
            return end;
        }
        case node_kind::array:
        case node_kind::object: break;
        }
        return fail(code::type_mismatch, pos, "Not a scalar value");
    }

    Result<position> Scanner::parse_number(position pos, value& out) {
        auto end = skip_number(pos);
        if (!end) return std::unexpected(end.error());

        std::string literal;
        literal.reserve(*end - pos);
        bool integral = true;
        for (position p = pos; p < *end; p++) {
            auto c = byte_at(p);
            if (!c) return std::unexpected(c.error());
            if (*c == '.' || *c == 'e' || *c == 'E') integral = false;
            literal.push_back(static_cast<char>(*c));
        }

        const char* first = literal.data();
        const char* last = literal.data() + literal.size();

        if (integral) {
            std::int64_t i = 0;
            auto [ptr, ec] = std::from_chars(first, last, i);
            if (ec == std::errc{} && ptr == last) {
                out = value{ i, m_Opts.resource };
                return end;
            }
            // Integers beyond int64 fall through to double
        }

        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || ptr != last) return fail(code::malformed_json, pos, "Number out of range");
        out = value{ d, m_Opts.resource };
        return end;
    }

    template<typename Out>
    Result<position> Scanner::parse_string_into(position pos, Out& out) {
        pos++; // Opening quote

        auto parse_hex4 = [&](uint16_t& out_code) -> Result<void> {
            uint16_t val = 0;
            for (int i = 0; i < 4; i++) {
                auto h = byte_at(pos);
                if (!h) return std::unexpected(h.error());
                unsigned digit = 0;
                if (*h >= '0' && *h <= '9') digit = *h - '0';
                else if (*h >= 'A' && *h <= 'F') digit = 10 + (*h - 'A');
                else if (*h >= 'a' && *h <= 'f') digit = 10 + (*h - 'a');
                else return fail_at(*h, pos, "Invalid hex digit in unicode escape");
                val = static_cast<uint16_t>((val << 4) | digit);
                pos++;
            }
            out_code = val;
            return {};
        };

        while (true) {
            auto c = byte_at(pos);
            if (!c) return std::unexpected(c.error());
            if (*c == end_of_input) return fail(code::unexpected_end, pos, "Nonterminated string");
            if (*c == '"') return pos + 1;
            if (*c == '\n') return fail(code::malformed_json, pos, "End of line while scanning string");

            if (*c != '\\') {
                out.push_back(static_cast<char>(*c));
                pos++;
                continue;
            }

            auto esc = byte_at(pos + 1);
            if (!esc) return std::unexpected(esc.error());
            switch (*esc) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                pos += 2;
                uint16_t first = 0;
                if (auto r = parse_hex4(first); !r) return std::unexpected(r.error());

                uint32_t codepoint = 0;
                if (first >= 0xD800 && first <= 0xDBFF) {
                    auto b = byte_at(pos);
                    if (!b) return std::unexpected(b.error());
                    auto u = byte_at(pos + 1);
                    if (!u) return std::unexpected(u.error());
                    if (*b != '\\' || *u != 'u') return fail_at(*b < 0 ? *b : *u, pos, "Expected low surrogate after high surrogate");
                    pos += 2;
                    uint16_t second = 0;
                    if (auto r = parse_hex4(second); !r) return std::unexpected(r.error());
                    if (!(second >= 0xDC00 && second <= 0xDFFF)) return fail(code::malformed_json, pos, "Invalid low surrogate");
                    codepoint = 0x10000u + ((static_cast<uint32_t>(first - 0xD800) << 10) | static_cast<uint32_t>(second - 0xDC00));
                } else if (first >= 0xDC00 && first <= 0xDFFF) {
                    return fail(code::malformed_json, pos, "Unpaired low surrogate");
                } else {
                    codepoint = first;
                }

                append_utf8(codepoint, out);
                continue;
            }
            default:
                return fail_at(*esc, pos, "Invalid escape sequence");
            }
            pos += 2;
        }
    }

#pragma endregion

} // namespace LazyJson
