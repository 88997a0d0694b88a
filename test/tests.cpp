#include <catch2/catch_all.hpp>

#include "lazyjson/lazyjson.hpp"

#include <charconv>
#include <limits>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace Catch;

namespace {

    using code = LazyJson::ReadError::code;

    struct rng {
        std::mt19937_64 eng;

        rng() : eng(std::random_device{}()) {}

        size_t uniform_size(size_t min, size_t max) {
            std::uniform_int_distribution<size_t> dist(min, max);
            return dist(eng);
        }

        bool coin(double p = 0.5) {
            std::bernoulli_distribution dist(p);
            return dist(eng);
        }

        double uniform_double() {
            std::uniform_real_distribution dist(-1e6, 1e6);
            return dist(eng);
        }

        std::int64_t uniform_integer() {
            std::uniform_int_distribution<std::int64_t> dist(-1'000'000'000'000, 1'000'000'000'000);
            return dist(eng);
        }

        char ascii_char() {
            std::uniform_int_distribution<int> dist(32, 126);
            return static_cast<char>(dist(eng));
        }

        std::string random_string(size_t max_len = 16) {
            size_t len = uniform_size(0, max_len);
            std::string s;
            s.reserve(len);
            for (size_t i = 0; i < len; i++)
                s.push_back(ascii_char());
            return s;
        }
    };

    LazyJson::value random_json_value(rng& r, int depth = 0, int max_depth = 4);

    LazyJson::value random_primitive(rng& r) {
        switch (r.uniform_size(0, 4)) {
            case 0: return LazyJson::value{ nullptr };
            case 1: return LazyJson::value{ r.coin() };
            case 2: return LazyJson::value{ r.uniform_double() };
            case 3: return LazyJson::value{ r.uniform_integer() };
            case 4: {
                auto s = r.random_string();
                return LazyJson::value{ std::string_view{ s } };
            }
        }
        return LazyJson::value{ nullptr };
    }

    LazyJson::value random_array(rng& r, int depth, int max_depth) {
        auto res = LazyJson::value{};
        auto& arr = res.as_array();
        size_t n = r.uniform_size(0, 8);
        for (size_t i = 0; i < n; i++)
            arr.emplace_back(random_json_value(r, depth + 1, max_depth));
        return res;
    }

    LazyJson::value random_object(rng& r, int depth, int max_depth) {
        auto res = LazyJson::value{};
        auto& obj = res.as_object();
        size_t n = r.uniform_size(0, 8);
        for (size_t i = 0; i < n; i++) {
            auto key = r.random_string();
            auto value = random_json_value(r, depth + 1, max_depth);
            obj.emplace(LazyJson::string{ key.c_str(), res.resource() }, std::move(value));
        }
        return res;
    }

    LazyJson::value random_json_value(rng& r, int depth, int max_depth) {
        if (depth >= max_depth) return random_primitive(r);
        switch (r.uniform_size(0, 2)) {
            case 0: return random_primitive(r);
            case 1: return random_array(r, depth, max_depth);
            case 2: return random_object(r, depth, max_depth);
        }
        return random_primitive(r);
    }

    // Minimal writer used to feed generated values back through the reader.
    // With `noisy` set it sprinkles comments and trailing commas in.
    void write_string(std::string_view s, std::string& out) {
        out.push_back('"');
        for (char c : s) {
            if (c == '"' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        out.push_back('"');
    }

    void write_json(const LazyJson::value& v, std::string& out, rng& r, bool noisy) {
        auto trivia = [&] {
            if (noisy && r.coin(0.2)) out += " // note\n";
            else out.push_back(' ');
        };

        if (v.is_null()) out += "null";
        else if (v.is_bool()) out += v.as_bool() ? "true" : "false";
        else if (v.is_integer()) out += std::to_string(v.as_integer());
        else if (v.is_floating()) {
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v.as_floating());
            REQUIRE(ec == std::errc{});
            out.append(buf, ptr);
        }
        else if (v.is_string()) write_string(v.as_string(), out);
        else if (v.is_array()) {
            out.push_back('[');
            trivia();
            bool first = true;
            for (const auto& e : v.as_array()) {
                if (!first) out.push_back(',');
                first = false;
                trivia();
                write_json(e, out, r, noisy);
            }
            if (noisy && !v.as_array().empty() && r.coin()) out.push_back(',');
            trivia();
            out.push_back(']');
        }
        else {
            out.push_back('{');
            trivia();
            bool first = true;
            for (const auto& [k, e] : v.as_object()) {
                if (!first) out.push_back(',');
                first = false;
                trivia();
                write_string(k, out);
                out += ": ";
                write_json(e, out, r, noisy);
            }
            if (noisy && !v.as_object().empty() && r.coin()) out.push_back(',');
            trivia();
            out.push_back('}');
        }
    }

    LazyJson::Node open_node(std::string_view text, const LazyJson::ReaderOptions& opts = {}) {
        auto n = LazyJson::Node::open(LazyJson::make_source(text), 0, opts);
        REQUIRE(n);
        return *std::move(n);
    }

    LazyJson::value materialize(const LazyJson::Node& n) {
        auto v = n.materialize();
        REQUIRE(v);
        return *std::move(v);
    }

    LazyJson::Node child(const LazyJson::Node& n, std::int64_t index) {
        auto c = n.at(index);
        REQUIRE(c);
        return *std::move(c);
    }

    LazyJson::Node child(const LazyJson::Node& n, std::string_view key) {
        auto c = n.at(key);
        REQUIRE(c);
        return *std::move(c);
    }

    template<typename T>
    void expect_error(const LazyJson::Result<T>& r, code c) {
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == c);
    }

    // Checks every lazy path below `node` against the materialized `expected`.
    void check_lazy_matches(const LazyJson::Node& node, const LazyJson::value& expected) {
        REQUIRE(materialize(node) == expected);

        if (expected.is_array()) {
            REQUIRE(node.is_array());
            auto n = node.length();
            REQUIRE(n);
            REQUIRE(*n == expected.size());
            for (size_t i = 0; i < expected.size(); i++)
                check_lazy_matches(child(node, static_cast<std::int64_t>(i)), expected[i]);
        }
        else if (expected.is_object()) {
            REQUIRE(node.is_object());
            auto n = node.length();
            REQUIRE(n);
            REQUIRE(*n == expected.size());
            for (const auto& [k, e] : expected.as_object())
                check_lazy_matches(child(node, std::string_view{ k }), e);
        }
    }

    const char* const stream_text = R"(
    {
        "a": ["this", "is", "a", "sequence"],
        "b": {"This": "is", "a": "map"},
        "c": [true, false, null],
        // This is a comment, and is allowed and ignored
        "d": [1, 2, 3],
        "e": "Trailing commas are allowed",
    }
    [
        "We can also have multiple objects per file",
    ]
    [{"a":{"b":[[], [{"c":null}]]}}]
)";

    struct CountingSource : LazyJson::ByteSource {
        LazyJson::StringSource inner;
        size_t reads = 0;
        size_t seeks = 0;
        size_t bytes = 0;

        explicit CountingSource(std::string data) : inner{ std::move(data) } {}

        LazyJson::Result<std::size_t> read(char* dst, std::size_t n) override {
            reads++;
            auto r = inner.read(dst, n);
            if (r) bytes += *r;
            return r;
        }

        LazyJson::Result<void> seek(LazyJson::position pos) override {
            seeks++;
            return inner.seek(pos);
        }

        LazyJson::Result<LazyJson::position> tell() override { return inner.tell(); }
    };

    struct CountingResource : std::pmr::memory_resource {
        size_t allocs = 0;
        size_t deallocs = 0;

        void* do_allocate(size_t bytes, size_t alignment) override {
            allocs++;
            return std::pmr::get_default_resource()->allocate(bytes, alignment);
        }

        void do_deallocate(void* p, size_t bytes, size_t alignment) override {
            deallocs++;
            return std::pmr::get_default_resource()->deallocate(p, bytes, alignment);
        }

        bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
            return this == &other;
        }
    };

}

#pragma region Scanner

TEST_CASE("Scanner Skips Whitespace and Comments") {
    auto src = LazyJson::make_source("  // hi\n  [1, 2]");
    LazyJson::Scanner s{ *src, LazyJson::ReaderOptions{} };

    auto start = s.skip_trivia(0);
    REQUIRE(start);
    REQUIRE(*start == 10);

    auto again = s.skip_trivia(*start);
    REQUIRE(again);
    REQUIRE(*again == 10);

    auto end = s.skip_value(*start);
    REQUIRE(end);
    REQUIRE(*end == 16);
}

TEST_CASE("Scanner Reports End of Input in Trivia") {
    auto src = LazyJson::make_source("   \n\t ");
    LazyJson::Scanner s{ *src, LazyJson::ReaderOptions{} };
    expect_error(s.skip_trivia(0), code::unexpected_end);
}

TEST_CASE("Scanner Classifies Each Kind") {
    auto kind_of = [](std::string_view text) {
        auto src = LazyJson::make_source(text);
        LazyJson::Scanner s{ *src, LazyJson::ReaderOptions{} };
        return s.classify(0);
    };

    REQUIRE(*kind_of("{}") == LazyJson::node_kind::object);
    REQUIRE(*kind_of("[]") == LazyJson::node_kind::array);
    REQUIRE(*kind_of("\"s\"") == LazyJson::node_kind::string);
    REQUIRE(*kind_of("-1") == LazyJson::node_kind::number);
    REQUIRE(*kind_of("7") == LazyJson::node_kind::number);
    REQUIRE(*kind_of("true") == LazyJson::node_kind::true_value);
    REQUIRE(*kind_of("false") == LazyJson::node_kind::false_value);
    REQUIRE(*kind_of("null") == LazyJson::node_kind::null);

    expect_error(kind_of("nulx"), code::malformed_json);
    expect_error(kind_of("tru"), code::unexpected_end);
    expect_error(kind_of("x"), code::malformed_json);
    expect_error(kind_of(""), code::unexpected_end);
}

TEST_CASE("Scanner Skips Values to Their End") {
    auto end_of = [](std::string_view text) {
        auto src = LazyJson::make_source(text);
        LazyJson::Scanner s{ *src, LazyJson::ReaderOptions{} };
        return s.skip_value(0);
    };

    REQUIRE(*end_of(R"("a\"b" ,)") == 6);
    REQUIRE(*end_of(R"("\u0022x")") == 9);
    REQUIRE(*end_of("-12.5e+3]") == 8);
    REQUIRE(*end_of("0123") == 1);
    REQUIRE(*end_of("true,") == 4);
    REQUIRE(*end_of("null") == 4);
    REQUIRE(*end_of(R"({"a": [1, {"b": "]"}], "c": {}} 5)") == 31);

    expect_error(end_of("1."), code::unexpected_end);
    expect_error(end_of("1.x"), code::malformed_json);
    expect_error(end_of("-"), code::unexpected_end);
    expect_error(end_of("-a"), code::malformed_json);
    expect_error(end_of("\"abc"), code::unexpected_end);
    expect_error(end_of("\"ab\ncd\""), code::malformed_json);
    expect_error(end_of("[1, 2"), code::unexpected_end);
    expect_error(end_of("[1 2]"), code::malformed_json);
    expect_error(end_of("[1,,2]"), code::malformed_json);
    expect_error(end_of("{1: 2}"), code::malformed_json);
    expect_error(end_of(R"({"a" 2})"), code::malformed_json);
}

TEST_CASE("Scanner Parses Scalars Only") {
    auto src = LazyJson::make_source(R"([1] "x")");
    LazyJson::Scanner s{ *src, LazyJson::ReaderOptions{} };

    expect_error(s.parse_scalar(0), code::type_mismatch);
    auto v = s.parse_scalar(4);
    REQUIRE(v);
    REQUIRE(v->as_string() == "x");
}

TEST_CASE("Small Buffers Read the Same Values") {
    LazyJson::ReaderOptions opts;
    opts.buffer_size = 1;
    auto root = open_node(stream_text, opts);
    REQUIRE(materialize(child(child(root, "b"), "a")) == LazyJson::value{ "map" });
    REQUIRE(*root.length() == 5);
}

#pragma endregion
#pragma region Values

TEST_CASE("Materialize Primitives") {
    REQUIRE(materialize(open_node("null")).is_null());
    REQUIRE(materialize(open_node("true")).as_bool() == true);
    REQUIRE(materialize(open_node("false")).as_bool() == false);

    auto i = materialize(open_node("123"));
    REQUIRE(i.is_integer());
    REQUIRE(i.as_integer() == 123);

    auto f = materialize(open_node("-0.5"));
    REQUIRE(f.is_floating());
    REQUIRE(f.as_floating() == Approx(-0.5));

    auto e = materialize(open_node("1e3"));
    REQUIRE(e.is_floating());
    REQUIRE(e.as_number() == Approx(1000.0));

    REQUIRE(materialize(open_node("\"str\"")).as_string() == "str");
}

TEST_CASE("Materialize String Escapes") {
    REQUIRE(materialize(open_node(R"("line\nbreak")")).as_string() == "line\nbreak");
    REQUIRE(materialize(open_node(R"("tab\tq\"s\\/\/")")).as_string() == "tab\tq\"s\\//");
    REQUIRE(materialize(open_node(R"("\u20AC")")).as_string() == "\xE2\x82\xAC");
    REQUIRE(materialize(open_node(R"("\uD83D\uDE00")")).as_string() == "\xF0\x9F\x98\x80");
}

TEST_CASE("Unpaired Surrogate Rejected") {
    expect_error(open_node(R"("\uD83D")").materialize(), code::malformed_json);
    expect_error(open_node(R"("\uDE00")").materialize(), code::malformed_json);
    expect_error(open_node(R"("\uD83DA")").materialize(), code::malformed_json);
}

TEST_CASE("Raw Control Bytes Other Than Newline Are Kept in Strings") {
    auto arr = open_node("[\"a\tb\", 1]");
    REQUIRE(*arr.length() == 2);

    auto v = materialize(arr);
    REQUIRE(v[0].as_string() == "a\tb");
    REQUIRE(*arr.contains(LazyJson::value{ 1 }));

    auto broken = open_node("[\"a\nb\", 1]");
    expect_error(broken.length(), code::malformed_json);
    expect_error(broken.materialize(), code::malformed_json);
}

TEST_CASE("Unknown Escape Rejected on Materialize") {
    expect_error(open_node(R"("\q")").materialize(), code::malformed_json);
}

TEST_CASE("Integers Beyond int64 Become Floating") {
    auto v = materialize(open_node("99999999999999999999"));
    REQUIRE(v.is_floating());
    REQUIRE(v.as_floating() == Approx(1e20));

    auto big = materialize(open_node("9223372036854775807"));
    REQUIRE(big.is_integer());
    REQUIRE(big.as_integer() == std::numeric_limits<std::int64_t>::max());
}

TEST_CASE("Out of Range Exponent Rejected") {
    expect_error(open_node("1e999").materialize(), code::malformed_json);
}

TEST_CASE("Leading Zero Stands Alone") {
    auto arr = open_node("[01]");
    expect_error(arr.length(), code::malformed_json);
    expect_error(arr.materialize(), code::malformed_json);
    REQUIRE(materialize(open_node("[0, -0, 0.5]")).size() == 3);
}

TEST_CASE("Numbers Compare Across Integer and Floating") {
    REQUIRE(LazyJson::value{ 2 } == LazyJson::value{ 2.0 });
    REQUIRE_FALSE(LazyJson::value{ 2 } == LazyJson::value{ 2.5 });
    REQUIRE_FALSE(LazyJson::value{ 1 } == LazyJson::value{ true });

    // 2^53 + 1 has no exact double; the nearest one is 2^53
    REQUIRE_FALSE(LazyJson::value{ std::int64_t{ 9007199254740993 } } == LazyJson::value{ 9007199254740992.0 });
    REQUIRE_FALSE(LazyJson::value{ 9007199254740992.0 } == LazyJson::value{ std::int64_t{ 9007199254740993 } });
    REQUIRE(LazyJson::value{ std::int64_t{ 9007199254740992 } } == LazyJson::value{ 9007199254740992.0 });
    REQUIRE_FALSE(LazyJson::value{ std::numeric_limits<std::int64_t>::max() } == LazyJson::value{ 9223372036854775808.0 });
    REQUIRE(LazyJson::value{ std::numeric_limits<std::int64_t>::min() } == LazyJson::value{ -9223372036854775808.0 });

    auto arr = open_node("[9007199254740993]");
    REQUIRE_FALSE(*arr.contains(LazyJson::value{ 9007199254740992.0 }));
    REQUIRE(*arr.contains(LazyJson::value{ std::int64_t{ 9007199254740993 } }));
}

TEST_CASE("Materialize Uses Provided memory_resource") {
    CountingResource res;
    LazyJson::ReaderOptions opts;
    opts.resource = &res;

    auto v = open_node(R"({"key": ["a fairly long string value", 1, 2]})", opts).materialize();
    REQUIRE(v);
    REQUIRE(v->resource() == &res);
    REQUIRE(res.allocs > 0);
}

#pragma endregion
#pragma region Node

TEST_CASE("DOM Round-Trip Through Lazy Reader") {
    rng r;
    for (int iter = 0; iter < 200; iter++) {
        auto v = random_json_value(r);
        std::string text;
        write_json(v, text, r, false);
        check_lazy_matches(open_node(text), v);
    }
}

TEST_CASE("DOM Round-Trip With Comments and Trailing Commas") {
    rng r;
    for (int iter = 0; iter < 200; iter++) {
        auto v = random_json_value(r);
        std::string text;
        write_json(v, text, r, true);
        REQUIRE(materialize(open_node(text)) == v);
    }
}

TEST_CASE("Node Reports Its Kind") {
    REQUIRE(open_node("{}").is_object());
    REQUIRE(open_node("[]").is_array());
    REQUIRE(open_node("\"\"").is_string());
    REQUIRE(open_node("3").is_number());
    REQUIRE(open_node("true").is_true());
    REQUIRE(open_node("true").is_boolean());
    REQUIRE(open_node("false").is_false());
    REQUIRE(open_node("false").is_boolean());
    REQUIRE(open_node("null").is_null());
    REQUIRE_FALSE(open_node("null").is_boolean());

    auto n = open_node("  // lead\n  [1]");
    REQUIRE(n.start() == 12);
    REQUIRE(LazyJson::to_string(n.kind()) == "array");
}

TEST_CASE("Node Open Fails on Bad Input") {
    expect_error(LazyJson::Node::open(LazyJson::make_source("   ")), code::unexpected_end);
    expect_error(LazyJson::Node::open(LazyJson::make_source("]")), code::malformed_json);
    expect_error(LazyJson::Node::open(nullptr), code::invalid_argument);
}

TEST_CASE("Trailing Commas and Comments Are Tolerated") {
    auto n = open_node("{ // c\n \"a\": [1,2,], }");
    LazyJson::value expected;
    expected["a"][0] = 1;
    expected["a"][1] = 2;
    REQUIRE(materialize(n) == expected);
    REQUIRE(*n.length() == 1);
    REQUIRE(*child(n, "a").length() == 2);
}

TEST_CASE("Trailing Commas Rejected When Not Allowed") {
    LazyJson::ReaderOptions opts;
    opts.allow_trailing_commas = false;

    expect_error(open_node("[1, 2,]", opts).length(), code::malformed_json);
    expect_error(open_node(R"({"a": 1,})", opts).materialize(), code::malformed_json);
    REQUIRE(*open_node("[1, 2]", opts).length() == 2);
}

TEST_CASE("Comments Rejected When Not Allowed") {
    LazyJson::ReaderOptions opts;
    opts.allow_comments = false;

    expect_error(LazyJson::Node::open(LazyJson::make_source("// c\n1"), 0, opts), code::malformed_json);
    expect_error(open_node("[1, // c\n 2]", opts).length(), code::malformed_json);
}

TEST_CASE("Length Matches Materialized Size") {
    REQUIRE(*open_node("[]").length() == 0);
    REQUIRE(*open_node("{}").length() == 0);
    REQUIRE(*open_node("[1, [2, 3], {\"a\": 4}]").length() == 3);
    REQUIRE(*open_node(R"({"a": 1, "b": [1, 2]})").length() == 2);
}

TEST_CASE("Duplicate Keys: First Match Lazily, Last Match Materialized") {
    auto n = open_node(R"({"k": 1, "k": 2})");
    REQUIRE(materialize(child(n, "k")) == LazyJson::value{ 1 });
    REQUIRE(*n.length() == 2);

    auto v = materialize(n);
    REQUIRE(v.size() == 1);
    REQUIRE(v.at("k") == LazyJson::value{ 2 });

    auto keys = n.keys();
    REQUIRE(keys);
    const std::vector<std::string> expected_keys{ "k", "k" };
    REQUIRE(*keys == expected_keys);
}

TEST_CASE("Negative Index Counts From the End") {
    auto n = open_node(R"([10, "x", [true], null])");
    for (std::int64_t i = 1; i <= 4; i++)
        REQUIRE(materialize(child(n, -i)) == materialize(child(n, 4 - i)));
}

TEST_CASE("Index Out of Range") {
    auto n = open_node("[1, 2, 3]");
    expect_error(n.at(100), code::index_out_of_range);
    expect_error(n.at(3), code::index_out_of_range);
    expect_error(n.at(-4), code::index_out_of_range);
    expect_error(open_node("[]").at(0), code::index_out_of_range);
}

TEST_CASE("Operations on the Wrong Kind Report type_mismatch") {
    auto str = open_node("\"abc\"");
    expect_error(str.length(), code::type_mismatch);
    expect_error(str.at(0), code::type_mismatch);
    expect_error(str.contains(LazyJson::value{ "a" }), code::type_mismatch);
    expect_error(str.elements(), code::type_mismatch);

    auto obj = open_node(R"({"a": 1})");
    expect_error(obj.at(0), code::type_mismatch);
    expect_error(obj.elements(), code::type_mismatch);

    auto arr = open_node("[1]");
    expect_error(arr.at("a"), code::type_mismatch);
    expect_error(arr.keys(), code::type_mismatch);
    expect_error(arr.has_key("a"), code::type_mismatch);
    expect_error(arr.items(), code::type_mismatch);
    expect_error(arr.member_keys(), code::type_mismatch);
}

TEST_CASE("Missing Key Reports key_not_found") {
    auto r = open_node(R"({"a": 1})").at("missing");
    expect_error(r, code::key_not_found);
    REQUIRE(r.error().msg.find("missing") != std::string::npos);
}

TEST_CASE("Contains Compares Elements and Keys") {
    auto arr = open_node(R"([1, "x", [2], {"a": null}])");
    REQUIRE(*arr.contains(LazyJson::value{ 1 }));
    REQUIRE(*arr.contains(LazyJson::value{ 1.0 }));
    REQUIRE(*arr.contains(LazyJson::value{ "x" }));
    REQUIRE_FALSE(*arr.contains(LazyJson::value{ 5 }));

    LazyJson::value nested;
    nested[0] = 2;
    REQUIRE(*arr.contains(nested));

    auto obj = open_node(R"({"a": 1, "b": 2})");
    REQUIRE(*obj.contains(LazyJson::value{ "a" }));
    REQUIRE_FALSE(*obj.contains(LazyJson::value{ "z" }));
    REQUIRE_FALSE(*obj.contains(LazyJson::value{ 1 }));
    REQUIRE(*obj.has_key("b"));
    REQUIRE_FALSE(*obj.has_key("c"));
}

TEST_CASE("Contains Stops at the First Match") {
    auto arr = open_node(R"([1, "\q"])");
    REQUIRE(*arr.contains(LazyJson::value{ 1 }));
    expect_error(arr.contains(LazyJson::value{ 5 }), code::malformed_json);
}

TEST_CASE("Unneeded Values Are Skipped, Not Parsed") {
    auto arr = open_node(R"(["\q", 7])");
    REQUIRE(materialize(child(arr, 1)) == LazyJson::value{ 7 });
    expect_error(child(arr, 0).materialize(), code::malformed_json);
}

TEST_CASE("Indexing Reads Only the Needed Prefix") {
    std::string text = "[";
    for (int i = 0; i < 1000; i++) text += std::to_string(i) + ", ";
    text += "0]";

    auto src = std::make_shared<CountingSource>(text);
    LazyJson::ReaderOptions opts;
    opts.buffer_size = 16;

    auto root = LazyJson::Node::open(src, 0, opts);
    REQUIRE(root);
    auto first = root->at(0);
    REQUIRE(first);
    REQUIRE(materialize(*first) == LazyJson::value{ 0 });
    REQUIRE(src->bytes < 64);

    auto n = root->length();
    REQUIRE(n);
    REQUIRE(*n == 1001);
    REQUIRE(src->bytes >= text.size());
}

TEST_CASE("Nodes Sharing a Source Do Not Interfere") {
    auto root = open_node(stream_text);
    auto a = child(root, "a");
    auto d = child(root, "d");

    REQUIRE(materialize(child(a, 3)) == LazyJson::value{ "sequence" });
    REQUIRE(materialize(child(d, 0)) == LazyJson::value{ 1 });
    REQUIRE(*a.length() == 4);
    REQUIRE(materialize(child(d, -1)) == LazyJson::value{ 3 });

    REQUIRE(a.source()->seek(0));
    REQUIRE(materialize(child(a, 0)) == LazyJson::value{ "this" });
}

TEST_CASE("Element Iterator Walks in Order") {
    auto arr = open_node(R"([1, [2, 3], "x",])");
    auto it = arr.elements();
    REQUIRE(it);

    std::vector<LazyJson::value> seen;
    while (true) {
        auto n = it->next();
        REQUIRE(n);
        if (!*n) break;
        seen.push_back(materialize(**n));
    }
    REQUIRE(seen.size() == 3);
    REQUIRE(seen[0] == LazyJson::value{ 1 });
    REQUIRE(seen[1].size() == 2);
    REQUIRE(seen[2] == LazyJson::value{ "x" });

    REQUIRE(it->done());
    auto after = it->next();
    REQUIRE(after);
    REQUIRE_FALSE(*after);

    // A fresh iterator starts over
    auto again = arr.elements();
    REQUIRE(again);
    auto first = again->next();
    REQUIRE(first);
    REQUIRE(*first);
    REQUIRE(materialize(**first) == LazyJson::value{ 1 });
}

TEST_CASE("Member Iterators Yield Keys and Lazy Values") {
    auto obj = open_node(R"({"a": [1, 2], "b\n": "\q", "a": null})");

    auto items = obj.items();
    REQUIRE(items);
    std::vector<std::string> keys;
    std::vector<LazyJson::node_kind> kinds;
    while (true) {
        auto m = items->next();
        REQUIRE(m);
        if (!*m) break;
        keys.push_back((*m)->key);
        kinds.push_back((*m)->value.kind());
    }
    const std::vector<std::string> expected_keys{ "a", "b\n", "a" };
    const std::vector<LazyJson::node_kind> expected_kinds{
        LazyJson::node_kind::array, LazyJson::node_kind::string, LazyJson::node_kind::null };
    REQUIRE(keys == expected_keys);
    REQUIRE(kinds == expected_kinds);

    auto names = obj.keys();
    REQUIRE(names);
    REQUIRE(*names == keys);

    auto key_it = obj.member_keys();
    REQUIRE(key_it);
    auto k = key_it->next();
    REQUIRE(k);
    REQUIRE(**k == "a");
}

TEST_CASE("Iterator Surfaces Malformed Input") {
    auto arr = open_node("[1 2]");
    auto it = arr.elements();
    REQUIRE(it);
    REQUIRE(*it->next());
    expect_error(it->next(), code::malformed_json);
}

TEST_CASE("Iterator Repeats a Failure Without Moving") {
    auto arr = open_node("[x, 1]");
    auto elems = arr.elements();
    REQUIRE(elems);
    expect_error(elems->next(), code::malformed_json);
    expect_error(elems->next(), code::malformed_json);
    REQUIRE_FALSE(elems->done());

    auto obj = open_node("{1: 2}");
    auto items = obj.items();
    REQUIRE(items);
    expect_error(items->next(), code::malformed_json);
    expect_error(items->next(), code::malformed_json);

    auto keys = obj.member_keys();
    REQUIRE(keys);
    expect_error(keys->next(), code::malformed_json);
    expect_error(keys->next(), code::malformed_json);

    auto later = open_node("[1, x]").elements();
    REQUIRE(later);
    REQUIRE(*later->next());
    auto first = later->next();
    expect_error(first, code::malformed_json);
    auto second = later->next();
    expect_error(second, code::malformed_json);
    REQUIRE(first.error().offset == second.error().offset);
}

TEST_CASE("Maximum Depth Is Enforced") {
    LazyJson::ReaderOptions opts;
    opts.max_depth = 2;

    REQUIRE(open_node("[[1]]", opts).materialize());
    auto deep = open_node("[[[1]]]", opts);
    expect_error(deep.materialize(), code::depth_limit_exceeded);
    expect_error(deep.end(), code::depth_limit_exceeded);
    REQUIRE(*deep.length() == 1);
}

TEST_CASE("Node End Is One Past the Value") {
    auto n = open_node(" [1, 2] 3");
    auto end = n.end();
    REQUIRE(end);
    REQUIRE(*end == 7);
}

#pragma endregion
#pragma region Cursor

TEST_CASE("Cursor Walks Top-Level Values") {
    auto cursor = LazyJson::Cursor::open(LazyJson::make_source(R"(["x"] true {"y":1})"));
    REQUIRE(cursor);

    REQUIRE(cursor->is_array());
    REQUIRE(materialize(*cursor->at(0)) == LazyJson::value{ "x" });
    REQUIRE(cursor->advance());
    REQUIRE(cursor->is_true());
    REQUIRE(cursor->advance());
    REQUIRE(cursor->is_object());
    REQUIRE(*cursor->has_key("y"));
    REQUIRE(cursor->ordinal() == 2);

    expect_error(cursor->advance(), code::stream_exhausted);
    REQUIRE(cursor->is_object());
    REQUIRE(cursor->ordinal() == 2);
}

TEST_CASE("Cursor Navigates a Commented Stream") {
    auto cursor = LazyJson::Cursor::open(LazyJson::make_source(stream_text));
    REQUIRE(cursor);

    REQUIRE(*cursor->length() == 5);
    REQUIRE(materialize(child(*cursor->at("a"), 0)) == LazyJson::value{ "this" });
    REQUIRE(materialize(child(*cursor->at("b"), "a")) == LazyJson::value{ "map" });
    REQUIRE(child(*cursor->at("c"), 2).is_null());
    REQUIRE(materialize(*cursor->at("e")) == LazyJson::value{ "Trailing commas are allowed" });
    const std::vector<std::string> expected_keys{ "a", "b", "c", "d", "e" };
    REQUIRE(*cursor->keys() == expected_keys);

    LazyJson::value d;
    d[0] = 1;
    d[1] = 2;
    d[2] = 3;
    REQUIRE(materialize(*cursor->at("d")) == d);

    REQUIRE(cursor->advance());
    REQUIRE(materialize(*cursor->at(0)) == LazyJson::value{ "We can also have multiple objects per file" });

    REQUIRE(cursor->advance());
    auto deep = child(child(child(child(child(cursor->current(), 0), "a"), "b"), 1), 0);
    REQUIRE(child(deep, "c").is_null());

    expect_error(cursor->advance(), code::stream_exhausted);
}

TEST_CASE("Cursor Spans Multiple Sources") {
    std::vector<std::shared_ptr<LazyJson::ByteSource>> sources{
        LazyJson::make_source("1 2"),
        LazyJson::make_source("  // only a comment\n"),
        LazyJson::make_source(""),
        LazyJson::make_source("[3] {\"four\": 4}"),
    };
    auto cursor = LazyJson::Cursor::open(std::move(sources));
    REQUIRE(cursor);

    REQUIRE(cursor->source_index() == 0);
    REQUIRE(cursor->advance());
    REQUIRE(materialize(cursor->current()) == LazyJson::value{ 2 });
    REQUIRE(cursor->advance());
    REQUIRE(cursor->source_index() == 3);
    REQUIRE(cursor->is_array());
    REQUIRE(cursor->advance());
    REQUIRE(*cursor->has_key("four"));
    expect_error(cursor->advance(), code::stream_exhausted);
}

TEST_CASE("Cursor Advance By") {
    std::vector<std::shared_ptr<LazyJson::ByteSource>> sources;
    for (int i = 0; i < 3; i++) sources.push_back(LazyJson::make_source(stream_text));
    auto cursor = LazyJson::Cursor::open(std::move(sources));
    REQUIRE(cursor);

    expect_error(cursor->advance_by(-1), code::invalid_argument);
    REQUIRE(cursor->ordinal() == 0);

    REQUIRE(cursor->advance_by(0));
    REQUIRE(cursor->ordinal() == 0);

    REQUIRE(cursor->advance_by(7));
    REQUIRE(cursor->ordinal() == 7);
    REQUIRE(cursor->source_index() == 2);
    REQUIRE(child(cursor->current(), 0).is_string());

    expect_error(cursor->advance_by(5), code::stream_exhausted);
    REQUIRE(cursor->ordinal() == 8);
    REQUIRE(cursor->source_index() == 2);
}

TEST_CASE("Cursor Open Edge Cases") {
    expect_error(LazyJson::Cursor::open(LazyJson::make_source("  \n ")), code::stream_exhausted);
    expect_error(LazyJson::Cursor::open(std::vector<std::shared_ptr<LazyJson::ByteSource>>{}), code::invalid_argument);
    expect_error(LazyJson::Cursor::open(std::shared_ptr<LazyJson::ByteSource>{}), code::invalid_argument);
}

TEST_CASE("Cursor Fails on Malformed Value") {
    auto cursor = LazyJson::Cursor::open(LazyJson::make_source("[1, 2 3"));
    REQUIRE(cursor);
    expect_error(cursor->advance(), code::malformed_json);
    REQUIRE(cursor->ordinal() == 0);
}

#pragma endregion
#pragma region Sources

TEST_CASE("Stream Source Reads From istream") {
    auto stream = std::make_unique<std::istringstream>(R"({"n": [1, 2, 3]} "tail")");
    auto src = std::make_shared<LazyJson::StreamSource>(std::move(stream));

    auto cursor = LazyJson::Cursor::open(src);
    REQUIRE(cursor);
    REQUIRE(materialize(child(*cursor->at("n"), -1)) == LazyJson::value{ 3 });
    REQUIRE(cursor->advance());
    REQUIRE(materialize(cursor->current()) == LazyJson::value{ "tail" });
    expect_error(cursor->advance(), code::stream_exhausted);
}

TEST_CASE("Open File") {
    auto file = LazyJson::open_file(LAZYJSON_TEST_DATA_DIR "/stream.json");
    REQUIRE(file);

    auto cursor = LazyJson::Cursor::open(*file);
    REQUIRE(cursor);
    REQUIRE(cursor->advance_by(2));
    REQUIRE(cursor->is_array());
    expect_error(cursor->advance(), code::stream_exhausted);

    expect_error(LazyJson::open_file(LAZYJSON_TEST_DATA_DIR "/does_not_exist.json"), code::io_error);
}

TEST_CASE("Error Codes Have Names") {
    REQUIRE(LazyJson::to_string(code::malformed_json) == "malformed_json");
    REQUIRE(LazyJson::to_string(code::stream_exhausted) == "stream_exhausted");
    REQUIRE(LazyJson::to_string(code::io_error) == "io_error");
}

#pragma endregion
