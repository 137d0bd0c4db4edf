#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <bjson/bjson.hpp>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using namespace bjson;

namespace {

    // Non-contiguous source: hands out one byte at a time and never exposes
    // its storage, so every lazy value has to go through fork()/advance().
    class ByteAtATimeSource {
    public:
        ByteAtATimeSource() = default;

        explicit ByteAtATimeSource(const std::string_view bytes) : bytes_(bytes), end_(bytes.size()) { }

        [[nodiscard]] std::optional<std::uint8_t> peek() const {
            if (pos_ < end_)
                return static_cast<std::uint8_t>(bytes_[pos_]);
            return std::nullopt;
        }

        std::optional<std::uint8_t> advance() {
            const auto c = peek();
            if (c)
                ++pos_;
            return c;
        }

        [[nodiscard]] ByteAtATimeSource fork(const std::size_t start, const std::size_t end) const {
            ByteAtATimeSource s;
            s.bytes_ = bytes_;
            s.pos_ = std::min(start, end_);
            s.end_ = std::clamp(end, s.pos_, end_);
            return s;
        }

        [[nodiscard]] std::size_t position() const {
            return pos_;
        }

    private:
        std::string_view bytes_ {};
        std::size_t pos_ {};
        std::size_t end_ {};
    };

    static_assert(ByteSource<ByteAtATimeSource>);
    static_assert(!ContiguousSource<ByteAtATimeSource>);

    using Stack8 = FixedStack<8>;
    using TestDeserializer = Deserializer<SpanSource, Stack8>;
    using TestValue = Value<SpanSource, Stack8>;

    ErrorCode first_error(const std::string_view json) {
        return validate(json).code;
    }

    std::vector<TokenKind> token_kinds(const std::string_view json) {
        SpanSource src {json};
        ParseError err;
        Token tok;
        std::vector<TokenKind> kinds;
        do {
            if (!next_token(src, tok, err))
                break;
            kinds.push_back(tok.kind);
        } while (tok.kind != TokenKind::End);
        return kinds;
    }

    std::string nested_arrays(const std::size_t depth) {
        return std::string(depth, '[') + std::string(depth, ']');
    }

    std::string describe(const TestDeserializer& d, const Event& ev) {
        switch (ev.kind) {
        case EventKind::Key:
            return "key:" + d.string_of(ev.token).str();
        case EventKind::End:
            return ev.token.kind == TokenKind::EndObject ? "}" : "]";
        case EventKind::Done:
            return "done";
        case EventKind::Value:
            break;
        }
        switch (ev.token.kind) {
        case TokenKind::BeginObject:
            return "{";
        case TokenKind::BeginArray:
            return "[";
        case TokenKind::String:
            return "str:" + d.string_of(ev.token).str();
        case TokenKind::Number:
            return "num:" + d.number_of(ev.token).str();
        case TokenKind::True:
            return "true";
        case TokenKind::False:
            return "false";
        default:
            return "null";
        }
    }

} // namespace

TEST_CASE("span source forks stay valid after the parent advances", "[bjson][source]") {
    SpanSource src {"hello world"};
    for (int i = 0; i < 6; ++i)
        src.advance();

    SpanSource f = src.fork(0, 5);
    CHECK(f.position() == 0);
    CHECK(f.remaining() == "hello");

    src.advance();
    CHECK(src.position() == 7);
    CHECK(src.peek() == 'o');

    CHECK(f.advance() == 'h');
    CHECK(f.remaining() == "ello");

    // forks never reach outside their parent view
    SpanSource g = f.fork(3, 100);
    CHECK(g.remaining() == "lo");

    SpanSource empty;
    CHECK_FALSE(empty.peek().has_value());
    CHECK_FALSE(empty.advance().has_value());
    CHECK(empty.remaining().empty());
}

TEST_CASE("fixed stack packs frames and refuses to grow", "[bjson][stack]") {
    FixedStack<3> s;
    CHECK(s.capacity() == 3);
    CHECK(s.empty());

    REQUIRE(s.push(Frame::make(Container::Object, Phase::AwaitingKey)) == ErrorCode::None);
    REQUIRE(s.push(Frame::make(Container::Array, Phase::AwaitingCommaOrEnd)) == ErrorCode::None);
    REQUIRE(s.push(Frame::make(Container::Object, Phase::AwaitingColon)) == ErrorCode::None);
    CHECK(s.push(Frame::make(Container::Array, Phase::AwaitingValue)) == ErrorCode::DepthExceeded);
    CHECK(s.size() == 3);

    s.peek_mut().phase(Phase::AwaitingValue);
    CHECK(s.peek() == Frame::make(Container::Object, Phase::AwaitingValue));

    CHECK(s.pop() == Frame::make(Container::Object, Phase::AwaitingValue));
    CHECK(s.pop() == Frame::make(Container::Array, Phase::AwaitingCommaOrEnd));
    CHECK(s.peek().container() == Container::Object);
    CHECK(s.peek().phase() == Phase::AwaitingKey);
    s.pop();
    CHECK(s.empty());

    // memory is fixed by the template argument
    static_assert(sizeof(FixedStack<64>) <= 32 + 2 * sizeof(std::size_t));
}

TEST_CASE("frame stores container and phase in one nibble", "[bjson][stack]") {
    for (const auto c : {Container::Object, Container::Array}) {
        for (const auto p : {Phase::AwaitingFirstEntry, Phase::AwaitingKey, Phase::AwaitingColon, Phase::AwaitingValue, Phase::AwaitingCommaOrEnd}) {
            const Frame f = Frame::make(c, p);
            CHECK(f.bits < 16);
            CHECK(f.container() == c);
            CHECK(f.phase() == p);
        }
    }
}

#if BJSON_GROWABLE_STACK
TEST_CASE("growable stack has no depth bound", "[bjson][stack]") {
    GrowableStack s;
    for (int i = 0; i < 10000; ++i)
        REQUIRE(s.push(Frame::make(i % 2 ? Container::Array : Container::Object, Phase::AwaitingFirstEntry)) == ErrorCode::None);
    CHECK(s.size() == 10000);
    CHECK(s.capacity() >= 10000);

    s.peek_mut().phase(Phase::AwaitingCommaOrEnd);
    CHECK(s.peek().phase() == Phase::AwaitingCommaOrEnd);

    GrowableStack moved = std::move(s);
    CHECK(moved.size() == 10000);
    CHECK(s.empty()); // NOLINT(bugprone-use-after-move)

    while (!moved.empty())
        moved.pop();
    CHECK(moved.size() == 0);
}
#endif

TEST_CASE("tokenizer classifies structural and scalar tokens", "[bjson][tokenizer]") {
    using enum TokenKind;
    const auto kinds = token_kinds(R"( { "a" : [ true , false , null , -1.5e3 ] } )");
    const std::vector<TokenKind> expected {BeginObject, String, Colon, BeginArray, True, Comma, False, Comma, Null, Comma, Number, EndArray, EndObject, End};
    CHECK(kinds == expected);
}

TEST_CASE("tokenizer keeps string and number spans raw", "[bjson][tokenizer]") {
    const std::string_view json = R"(["a\nb", 12.50])";
    SpanSource src {json};
    ParseError err;
    Token tok;

    REQUIRE(next_token(src, tok, err));
    REQUIRE(next_token(src, tok, err));
    REQUIRE(tok.kind == TokenKind::String);
    CHECK(tok.offset == 1);
    CHECK(tok.escaped);
    CHECK(json.substr(tok.begin, tok.end - tok.begin) == R"(a\nb)");

    REQUIRE(next_token(src, tok, err));
    REQUIRE(next_token(src, tok, err));
    REQUIRE(tok.kind == TokenKind::Number);
    CHECK(json.substr(tok.begin, tok.end - tok.begin) == "12.50");
    CHECK(err.ok());
}

TEST_CASE("literals match exactly", "[bjson][tokenizer]") {
    CHECK(first_error("true") == ErrorCode::None);
    CHECK(first_error("false") == ErrorCode::None);
    CHECK(first_error("null") == ErrorCode::None);

    CHECK(first_error("tru") == ErrorCode::UnexpectedEOF);
    CHECK(first_error("trux") == ErrorCode::InvalidLiteral);
    CHECK(first_error("truex") == ErrorCode::InvalidLiteral);
    CHECK(first_error("True") == ErrorCode::InvalidLiteral);
    CHECK(first_error("NULL") == ErrorCode::InvalidLiteral);
    CHECK(first_error("nul1") == ErrorCode::InvalidLiteral);
}

TEST_CASE("non-finite literals are syntax errors", "[bjson][tokenizer]") {
    CHECK(first_error(R"({"x": Infinity})") == ErrorCode::InvalidLiteral);
    CHECK(first_error("NaN") == ErrorCode::InvalidLiteral);
    CHECK(first_error("[-Infinity]") == ErrorCode::InvalidNumber);
    CHECK(error_category(first_error(R"({"x": Infinity})")) == ErrorCategory::Syntax);
}

TEST_CASE("number grammar", "[bjson][tokenizer]") {
    for (const char* ok : {"0", "-0", "1.5", "1e10", "1E-2", "-0.0e+0", "123456789012345678901234567890", "[1,-2,3.25]"}) {
        INFO(ok);
        CHECK(first_error(ok) == ErrorCode::None);
    }

    CHECK(first_error("+1") == ErrorCode::InvalidNumber);
    CHECK(first_error("01") == ErrorCode::InvalidNumber);
    CHECK(first_error("-01") == ErrorCode::InvalidNumber);
    CHECK(first_error("1.") == ErrorCode::InvalidNumber);
    CHECK(first_error("1.e5") == ErrorCode::InvalidNumber);
    CHECK(first_error("1e") == ErrorCode::InvalidNumber);
    CHECK(first_error("1e+") == ErrorCode::InvalidNumber);
    CHECK(first_error("1x") == ErrorCode::InvalidNumber);
    CHECK(first_error("0x10") == ErrorCode::InvalidNumber);
    CHECK(first_error("-") == ErrorCode::UnexpectedEOF);
    CHECK(first_error(".5") == ErrorCode::UnexpectedToken);
}

TEST_CASE("string escapes are validated", "[bjson][tokenizer]") {
    CHECK(first_error(R"("\"\\\/\b\f\n\r\t\u00e9")") == ErrorCode::None);

    CHECK(first_error(R"("\x")") == ErrorCode::InvalidEscape);
    CHECK(first_error(R"("\a")") == ErrorCode::InvalidEscape);
    CHECK(first_error(R"("\u12G4")") == ErrorCode::InvalidUnicode);
    CHECK(first_error(R"("\u12")") == ErrorCode::InvalidUnicode);
    CHECK(first_error("\"abc") == ErrorCode::UnexpectedEOF);
    CHECK(first_error("\"a\tb\"") == ErrorCode::InvalidString);
    CHECK(first_error("\"a\nb\"") == ErrorCode::InvalidString);
}

TEST_CASE("surrogate escapes must pair up", "[bjson][tokenizer]") {
    CHECK(first_error(R"("\uD83D\uDE00")") == ErrorCode::None);
    CHECK(first_error(R"("\uDC00")") == ErrorCode::InvalidUnicode);
    CHECK(first_error(R"("\uD800")") == ErrorCode::InvalidUnicode);
    CHECK(first_error(R"("\uD800x")") == ErrorCode::InvalidUnicode);
    CHECK(first_error(R"("\uD800\u0041")") == ErrorCode::InvalidUnicode);
    CHECK(first_error(R"("\uD800\n")") == ErrorCode::InvalidUnicode);
}

TEST_CASE("raw utf-8 inside strings must be well formed", "[bjson][tokenizer]") {
    CHECK(first_error("\"\xE2\x82\xAC\"") == ErrorCode::None);
    CHECK(first_error("\"\xF0\x9F\x98\x80\"") == ErrorCode::None);

    CHECK(first_error("\"\xC0\x80\"") == ErrorCode::InvalidUnicode);         // overlong NUL
    CHECK(first_error("\"\xE0\x80\xAF\"") == ErrorCode::InvalidUnicode);     // overlong '/'
    CHECK(first_error("\"\xED\xA0\x80\"") == ErrorCode::InvalidUnicode);     // encoded surrogate
    CHECK(first_error("\"\xF4\x90\x80\x80\"") == ErrorCode::InvalidUnicode); // past U+10FFFF
    CHECK(first_error("\"\xE2\x82\"") == ErrorCode::InvalidUnicode);         // truncated sequence
    CHECK(first_error("\"\x80\"") == ErrorCode::InvalidUnicode);             // stray continuation
    CHECK(first_error("\"\xFF\"") == ErrorCode::InvalidUnicode);
}

TEST_CASE("escaped string decodes lazily", "[bjson][string]") {
    TestDeserializer d {SpanSource {R"("\u0041BC")"}, Stack8 {}};
    TestValue v;
    REQUIRE(d.root(v));

    JsonString<SpanSource> s;
    REQUIRE(v.to_string(s));
    CHECK(s.has_escapes());
    CHECK(s.raw() == R"(\u0041BC)");
    CHECK(s.str() == "ABC");
    CHECK(s.equals("ABC"));
    CHECK_FALSE(s.equals("AB"));
    CHECK_FALSE(s.equals("ABCD"));

    char buf[2];
    CHECK(s.copy_to(buf, sizeof(buf)) == 3);
    CHECK(std::string_view(buf, 2) == "AB");

    REQUIRE(d.finish());
}

TEST_CASE("surrogate pairs combine into one code point", "[bjson][string]") {
    TestDeserializer d {SpanSource {R"("x\uD83D\uDE00y")"}, Stack8 {}};
    TestValue v;
    REQUIRE(d.root(v));

    JsonString<SpanSource> s;
    REQUIRE(v.to_string(s));

    std::vector<char32_t> cps;
    for (const char32_t cp : s)
        cps.push_back(cp);

    const std::vector<char32_t> expected {U'x', 0x1F600, U'y'};
    CHECK(cps == expected);
    CHECK(s.str() == "x\xF0\x9F\x98\x80y");
}

TEST_CASE("automaton emits events in document order", "[bjson][automaton]") {
    TestDeserializer d {SpanSource {R"({"a":[1,{"b":null}],"c":"x"})"}, Stack8 {}};

    std::vector<std::string> seen;
    Event ev;
    while (d.next_event(ev)) {
        seen.push_back(describe(d, ev));
        if (ev.kind == EventKind::Done)
            break;
    }

    const std::vector<std::string> expected {"{", "key:a", "[", "num:1", "{", "key:b", "null", "}", "]", "key:c", "str:x", "}", "done"};
    CHECK(seen == expected);
    CHECK(d.ok());
    CHECK(d.depth() == 0);
}

TEST_CASE("automaton tracks depth with pushes and pops", "[bjson][automaton]") {
    TestDeserializer d {SpanSource {"[[],[[]]]"}, Stack8 {}};
    std::vector<std::size_t> depths;
    Event ev;
    while (d.next_event(ev) && ev.kind != EventKind::Done)
        depths.push_back(d.depth());

    const std::vector<std::size_t> expected {1, 2, 1, 2, 3, 2, 1, 0};
    CHECK(depths == expected);
}

TEST_CASE("tokens illegal in the current phase", "[bjson][automaton]") {
    for (const char* bad : {"[,1]", "[1,]", "{,}", R"({"a" 1})", R"({"a":1,})", "{1:2}", "[1 2]", "[1}", R"({"a":1])", "]", ":", "[:]", R"({"a"::1})"}) {
        INFO(bad);
        CHECK(first_error(bad) == ErrorCode::UnexpectedToken);
    }
}

TEST_CASE("unexpected end of input", "[bjson][automaton]") {
    for (const char* bad : {"", "   ", "[1", "[1,", R"({"a":)", R"({"a")", "{", R"(["abc)"}) {
        INFO(bad);
        CHECK(first_error(bad) == ErrorCode::UnexpectedEOF);
    }
}

TEST_CASE("trailing data after the root value", "[bjson][automaton]") {
    CHECK(first_error("[1] 2") == ErrorCode::TrailingData);
    CHECK(first_error("1 2") == ErrorCode::TrailingData);
    CHECK(first_error("[1]]") == ErrorCode::TrailingData);
    CHECK(first_error("[] []") == ErrorCode::TrailingData);
    CHECK(first_error("{} \n\t ") == ErrorCode::None);
    CHECK(error_category(ErrorCode::TrailingData) == ErrorCategory::Structural);

    const auto err = validate("[1] 2");
    CHECK(err.offset == 4);
}

TEST_CASE("trailing bytes that are not tokens", "[bjson][automaton]") {
    for (const char* bad : {"{} x", "[] @", "1 x", "{} +", "[]\"open", "null nul", "true]", "\"s\" \x01", "0 -"}) {
        INFO(bad);
        CHECK(first_error(bad) == ErrorCode::TrailingData);
    }

    CHECK(validate("{} x").offset == 3);
    CHECK(validate("[]\n\t@").offset == 4);
    CHECK(validate("1 x").offset == 2);
}

TEST_CASE("fixed stack bounds nesting depth", "[bjson][depth]") {
    const auto deep33 = nested_arrays(33);
    const auto deep32 = nested_arrays(32);

    const auto err = validate(deep33, FixedStack<32> {});
    CHECK(err.code == ErrorCode::DepthExceeded);
    CHECK(err.offset == 32);
    CHECK(error_category(err.code) == ErrorCategory::Structural);

    CHECK(validate(deep32, FixedStack<32> {}).ok());
    CHECK(validate(nested_arrays(3), FixedStack<2> {}).code == ErrorCode::DepthExceeded);
    CHECK(validate(R"({"a":{"b":1}})", FixedStack<1> {}).code == ErrorCode::DepthExceeded);
    CHECK(validate(R"({"a":{"b":1}})", FixedStack<2> {}).ok());
}

#if BJSON_GROWABLE_STACK
TEST_CASE("growable stack accepts deep documents", "[bjson][depth]") {
    const auto deep = nested_arrays(5000);
    CHECK(validate(deep, GrowableStack {}).ok());
    CHECK(validate(deep).code == ErrorCode::DepthExceeded);
}
#endif

TEST_CASE("value handles are single use", "[bjson][cursor]") {
    SECTION("entering twice") {
        TestDeserializer d {SpanSource {"[1,2]"}, Stack8 {}};
        TestValue root;
        REQUIRE(d.root(root));

        ArrayCursor<SpanSource, Stack8> arr;
        REQUIRE(root.to_array(arr));

        ArrayCursor<SpanSource, Stack8> again;
        CHECK_FALSE(root.to_array(again));
        CHECK(d.error().code == ErrorCode::ReusedValue);
        CHECK(error_category(d.error().code) == ErrorCategory::Caller);
    }

    SECTION("root requested twice") {
        TestDeserializer d {SpanSource {"1"}, Stack8 {}};
        TestValue a;
        TestValue b;
        REQUIRE(d.root(a));
        CHECK_FALSE(d.root(b));
        CHECK(d.error().code == ErrorCode::ReusedValue);
    }

    SECTION("stale handle after the cursor moved on") {
        TestDeserializer d {SpanSource {"[1,2]"}, Stack8 {}};
        TestValue root;
        REQUIRE(d.root(root));
        ArrayCursor<SpanSource, Stack8> arr;
        REQUIRE(root.to_array(arr));

        TestValue first;
        TestValue second;
        REQUIRE(arr.next(first));
        REQUIRE(arr.next(second));

        JsonNumber<SpanSource> n;
        CHECK_FALSE(first.to_number(n));
        CHECK(d.error().code == ErrorCode::ReusedValue);
    }

    SECTION("object cursor abandoned for a sibling object") {
        using Object = ObjectCursor<SpanSource, Stack8>;
        TestDeserializer d {SpanSource {R"([{"a":1,"z":0},{"b":2}])"}, Stack8 {}};
        TestValue root;
        REQUIRE(d.root(root));
        ArrayCursor<SpanSource, Stack8> arr;
        REQUIRE(root.to_array(arr));

        TestValue first;
        REQUIRE(arr.next(first));
        Object abandoned;
        REQUIRE(first.to_object(abandoned));
        JsonString<SpanSource> key;
        TestValue value;
        REQUIRE(abandoned.next(key, value));
        CHECK(key.str() == "a");

        TestValue second;
        REQUIRE(arr.next(second));
        Object current;
        REQUIRE(second.to_object(current));

        CHECK_FALSE(abandoned.next(key, value));
        CHECK(d.error().code == ErrorCode::ReusedValue);
        CHECK_FALSE(current.next(key, value));
    }

    SECTION("array cursor abandoned for a sibling array") {
        using Array = ArrayCursor<SpanSource, Stack8>;
        TestDeserializer d {SpanSource {"[[1,2],[3,{}],4]"}, Stack8 {}};
        TestValue root;
        REQUIRE(d.root(root));
        Array outer;
        REQUIRE(root.to_array(outer));

        TestValue first;
        REQUIRE(outer.next(first));
        Array abandoned;
        REQUIRE(first.to_array(abandoned));

        TestValue second;
        REQUIRE(outer.next(second));
        Array current;
        REQUIRE(second.to_array(current));
        TestValue item;
        REQUIRE(current.next(item));
        REQUIRE(item.skip());
        REQUIRE(current.next(item));
        REQUIRE(item.skip());

        CHECK_FALSE(abandoned.next(item));
        CHECK(d.error().code == ErrorCode::ReusedValue);
    }

    SECTION("cursor used after its container was skipped past") {
        TestDeserializer d {SpanSource {"[[1,2],3]"}, Stack8 {}};
        TestValue root;
        REQUIRE(d.root(root));
        ArrayCursor<SpanSource, Stack8> outer;
        REQUIRE(root.to_array(outer));

        TestValue first;
        REQUIRE(outer.next(first));
        ArrayCursor<SpanSource, Stack8> inner;
        REQUIRE(first.to_array(inner));

        TestValue second;
        REQUIRE(outer.next(second));
        TestValue item;
        CHECK_FALSE(inner.next(item));
        CHECK(d.error().code == ErrorCode::ReusedValue);
    }

    SECTION("nested cursors keep working while children open and close") {
        TestDeserializer d {SpanSource {R"({"x":[[],{}],"y":[1],"z":2})"}, Stack8 {}};
        TestValue root;
        REQUIRE(d.root(root));
        ObjectCursor<SpanSource, Stack8> obj;
        REQUIRE(root.to_object(obj));

        JsonString<SpanSource> key;
        TestValue value;
        std::size_t entries = 0;
        while (obj.next(key, value)) {
            ++entries;
            if (value.is_array()) {
                ArrayCursor<SpanSource, Stack8> items;
                REQUIRE(value.to_array(items));
                TestValue item;
                while (items.next(item))
                    REQUIRE(item.skip());
                CHECK(items.ok());
            }
        }
        CHECK(obj.ok());
        CHECK(entries == 3);
        CHECK(d.finish());
    }

    SECTION("default constructed handle") {
        TestValue v;
        bool b = false;
        CHECK_FALSE(v.to_bool(b));
    }
}

TEST_CASE("reading the wrong kind is a type mismatch", "[bjson][cursor]") {
    TestDeserializer d {SpanSource {R"("text")"}, Stack8 {}};
    TestValue v;
    REQUIRE(d.root(v));
    CHECK(v.kind() == ValueKind::String);

    JsonNumber<SpanSource> n;
    CHECK_FALSE(v.to_number(n));
    CHECK(d.error().code == ErrorCode::TypeMismatch);
    CHECK(d.error().offset == 0);
}

TEST_CASE("object cursor skips values that were not consumed", "[bjson][cursor]") {
    TestDeserializer d {SpanSource {R"({"skip":{"deep":[1,[2,{"x":3}]]},"half":[1,2,3],"keep":7})"}, Stack8 {}};
    TestValue root;
    REQUIRE(d.root(root));

    ObjectCursor<SpanSource, Stack8> obj;
    REQUIRE(root.to_object(obj));

    JsonString<SpanSource> key;
    TestValue item;

    REQUIRE(obj.next(key, item));
    CHECK(key.equals("skip"));
    CHECK(item.is_object());

    // abandon the nested array after one element
    REQUIRE(obj.next(key, item));
    CHECK(key.equals("half"));
    ArrayCursor<SpanSource, Stack8> half;
    REQUIRE(item.to_array(half));
    TestValue elem;
    REQUIRE(half.next(elem));

    REQUIRE(obj.next(key, item));
    CHECK(key.equals("keep"));
    JsonNumber<SpanSource> n;
    REQUIRE(item.to_number(n));
    std::int64_t v = 0;
    REQUIRE(n.to_i64(v));
    CHECK(v == 7);

    CHECK_FALSE(obj.next(key, item));
    CHECK(obj.done());
    CHECK(obj.ok());

    // the abandoned cursor notices its container is gone
    CHECK_FALSE(half.next(elem));
    CHECK(d.ok());

    REQUIRE(d.finish());
}

TEST_CASE("skip walks containers to their closer", "[bjson][cursor]") {
    TestDeserializer d {SpanSource {R"([{"a":[1,2,{"b":[]}]},"after"])"}, Stack8 {}};
    TestValue root;
    REQUIRE(d.root(root));
    ArrayCursor<SpanSource, Stack8> arr;
    REQUIRE(root.to_array(arr));

    TestValue item;
    REQUIRE(arr.next(item));
    REQUIRE(item.skip());
    CHECK(d.depth() == 1);

    REQUIRE(arr.next(item));
    JsonString<SpanSource> s;
    REQUIRE(item.to_string(s));
    CHECK(s.equals("after"));
    CHECK_FALSE(arr.next(item));
    CHECK(arr.ok());
}

TEST_CASE("finish drains an untouched document", "[bjson][cursor]") {
    TestDeserializer d {SpanSource {R"({"a":[1,2,3],"b":{"c":null}} )"}, Stack8 {}};
    CHECK(d.finish());
    CHECK(d.depth() == 0);

    TestDeserializer bad {SpanSource {R"({"a":[1,2,3]} x)"}, Stack8 {}};
    CHECK_FALSE(bad.finish());
    CHECK(bad.error().code == ErrorCode::InvalidLiteral);
}

TEST_CASE("json number conversions", "[bjson][number]") {
    auto with_number = [](const std::string_view json, auto&& check) {
        TestDeserializer d {SpanSource {json}, Stack8 {}};
        TestValue v;
        REQUIRE(d.root(v));
        JsonNumber<SpanSource> n;
        REQUIRE(v.to_number(n));
        check(n);
    };

    with_number("9223372036854775807", [](const auto& n) {
        std::int64_t v = 0;
        REQUIRE(n.to_i64(v));
        CHECK(v == std::numeric_limits<std::int64_t>::max());
    });

    with_number("-9223372036854775808", [](const auto& n) {
        std::int64_t v = 0;
        REQUIRE(n.to_i64(v));
        CHECK(v == std::numeric_limits<std::int64_t>::min());
        std::uint64_t u = 0;
        CHECK_FALSE(n.to_u64(u));
    });

    with_number("9223372036854775808", [](const auto& n) {
        std::int64_t v = 0;
        CHECK_FALSE(n.to_i64(v));
        std::uint64_t u = 0;
        REQUIRE(n.to_u64(u));
        CHECK(u == 9223372036854775808ull);
    });

    with_number("18446744073709551616", [](const auto& n) {
        std::uint64_t u = 0;
        CHECK_FALSE(n.to_u64(u));
        double d = 0;
        REQUIRE(n.to_double(d));
        CHECK(d == Catch::Approx(18446744073709551616.0));
    });

    with_number("-12.5e-1", [](const auto& n) {
        CHECK_FALSE(n.is_integer());
        CHECK(n.raw() == "-12.5e-1");
        std::int64_t v = 0;
        CHECK_FALSE(n.to_i64(v));
        double d = 0;
        REQUIRE(n.to_double(d));
        CHECK(d == Catch::Approx(-1.25));
    });

    with_number("1e400", [](const auto& n) {
        double d = 0;
        CHECK_FALSE(n.to_double(d));
    });
}

TEST_CASE("non-contiguous sources go through fork and advance", "[bjson][source]") {
    std::vector<std::string> strings;
    REQUIRE(deserialize(ByteAtATimeSource {R"(["a\u00e9", "plain", "\uD83D\uDE00"])"}, strings).ok());
    const std::vector<std::string> expected {"a\xC3\xA9", "plain", "\xF0\x9F\x98\x80"};
    CHECK(strings == expected);

    std::vector<double> numbers;
    REQUIRE(deserialize(ByteAtATimeSource {"[1.25, -3, 4e2]"}, numbers).ok());
    REQUIRE(numbers.size() == 3);
    CHECK(numbers[0] == Catch::Approx(1.25));
    CHECK(numbers[1] == Catch::Approx(-3.0));
    CHECK(numbers[2] == Catch::Approx(400.0));

    std::vector<int> ints;
    const auto err = deserialize(ByteAtATimeSource {"[1, 2"}, ints);
    CHECK(err.code == ErrorCode::UnexpectedEOF);
    CHECK(err.offset == 5);
}

TEST_CASE("parse error keeps the first error", "[bjson][error]") {
    ParseError e;
    CHECK(e.ok());
    CHECK(static_cast<bool>(e));

    e.set(ErrorCode::InvalidNumber, 3);
    e.set(ErrorCode::TrailingData, 9);
    CHECK(e.code == ErrorCode::InvalidNumber);
    CHECK(e.offset == 3);
    CHECK_FALSE(e);
    CHECK(e.to_string() == "InvalidNumber");

    e.reset();
    CHECK(e.ok());
}

TEST_CASE("every error code has a name and a category", "[bjson][error]") {
    for (int i = 1; i <= static_cast<int>(ErrorCode::InternalError); ++i) {
        const auto code = static_cast<ErrorCode>(i);
        CHECK(std::string_view(error_code_name(code)) != "Unknown");
        CHECK(error_category(code) != ErrorCategory::None);
    }
    CHECK(error_category(ErrorCode::MissingField) == ErrorCategory::Semantic);
    CHECK(error_category(ErrorCode::SizeMismatch) == ErrorCategory::Semantic);
    CHECK(error_category(ErrorCode::OutOfMemory) == ErrorCategory::Resource);
    CHECK(error_category(ErrorCode::InvalidEscape) == ErrorCategory::Syntax);
}

TEST_CASE("error formatting points at the offending byte", "[bjson][error]") {
    const std::string json = "{\n  \"a\": tru\n}";
    const auto err = validate(json);
    REQUIRE(err.code == ErrorCode::InvalidLiteral);

    const auto loc = locate_error(json, err);
    CHECK(loc.offset == 9);
    CHECK(loc.line == 2);
    CHECK(loc.column == 8);

    const auto compact = err.format<ErrorFormat::Compact>();
    CHECK(compact == "bjson: InvalidLiteral at 2:8 (offset 9) unexpected 't'");

    const auto pretty = err.format<ErrorFormat::Pretty>();
    CHECK(pretty.rfind("bjson: InvalidLiteral\n", 0) == 0);
    CHECK(pretty.find(" --> 2:8 (offset 9)") != std::string::npos);
    CHECK(pretty.find("  \"a\": tru") != std::string::npos);
    CHECK(pretty.find('^') != std::string::npos);

    std::cout << pretty << "\n";
}

TEST_CASE("error formatting trims long lines", "[bjson][error]") {
    std::string json = "[";
    for (int i = 0; i < 200; ++i)
        json += "1,";
    json += "x]";

    const auto err = validate(json);
    REQUIRE(err.code == ErrorCode::InvalidLiteral);

    const auto pretty = format_error(json, err);
    CHECK(pretty.find("...") != std::string::npos);
    CHECK(format_error(json, ParseError {}).empty());
}
