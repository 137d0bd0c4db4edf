/*
 * bjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

// ReSharper disable CppClangTidyCppcoreguidelinesAvoidConstOrRefDataMembers

#ifndef BJSON_HPP
#define BJSON_HPP

#pragma once
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef _MSC_VER
    #define BJSON_FORCEINLINE __forceinline
#else
    #define BJSON_FORCEINLINE __attribute__((always_inline)) inline
#endif

// 1: GrowableStack is available (unbounded depth, heap backed).
#ifndef BJSON_GROWABLE_STACK
    #define BJSON_GROWABLE_STACK 1
#endif

// 1: floats are written in shortest round-trip form instead of the digits10 truncating form.
#ifndef BJSON_FAST_FLOAT_FORMAT
    #define BJSON_FAST_FLOAT_FORMAT 0
#endif

namespace bjson::detail {

    struct CharMask256 {
        std::uint64_t w[4] {};

        static consteval CharMask256 of(const std::string_view chars) {
            CharMask256 m {};
            for (const char c : chars)
                m.set(static_cast<unsigned char>(c));
            return m;
        }

        static consteval CharMask256 range(const unsigned lo, const unsigned hi) {
            CharMask256 m {};
            for (unsigned c = lo; c <= hi; ++c)
                m.set(c);
            return m;
        }

        constexpr void set(const unsigned c) noexcept {
            w[c >> 6] |= 1ull << (c & 63);
        }

        [[nodiscard]] constexpr CharMask256 operator|(const CharMask256& o) const noexcept {
            CharMask256 m {};
            for (int i = 0; i < 4; ++i)
                m.w[i] = w[i] | o.w[i];
            return m;
        }

        [[nodiscard]] constexpr bool test(const unsigned char c) const noexcept {
            return w[c >> 6] >> (c & 63) & 1ull;
        }
    };

    inline constexpr CharMask256 kWsMask = CharMask256::of(" \t\n\r");
    inline constexpr CharMask256 kDigitMask = CharMask256::range('0', '9');
    inline constexpr CharMask256 kAlphaMask = CharMask256::range('a', 'z') | CharMask256::range('A', 'Z');

    // bytes the writer must escape inside a string
    inline constexpr CharMask256 kEscapeMask = CharMask256::of("\"\\") | CharMask256::range(0x00, 0x1F);

    // bytes that may end a bare number or literal (EOF ends one as well)
    inline constexpr CharMask256 kDelimiterMask = CharMask256::of(" \t\n\r,]}");

    inline constexpr char kHexDigits[] = "0123456789ABCDEF";

    struct EscapePair {
        char letter;
        char byte;
    };

    // Shared by the tokenizer (letter -> byte) and the writer (byte -> letter).
    inline constexpr EscapePair kEscapeTable[] = {
        {'"', '"'},
        {'\\', '\\'},
        {'/', '/'},
        {'b', '\b'},
        {'f', '\f'},
        {'n', '\n'},
        {'r', '\r'},
        {'t', '\t'},
    };

    [[nodiscard]] constexpr std::optional<char> unescape_byte(const char letter) noexcept {
        for (const auto& e : kEscapeTable) {
            if (e.letter == letter)
                return e.byte;
        }
        return std::nullopt;
    }

    // '/' decodes but is never produced by the writer.
    [[nodiscard]] constexpr char escape_letter(const char byte) noexcept {
        for (const auto& e : kEscapeTable) {
            if (e.byte == byte && e.letter != '/')
                return e.letter;
        }
        return 0;
    }

    [[nodiscard]] BJSON_FORCEINLINE constexpr int hex_value(const std::uint8_t c) noexcept {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    [[nodiscard]] constexpr bool is_high_surrogate(const std::uint32_t u) noexcept {
        return u >= 0xD800 && u <= 0xDBFF;
    }

    [[nodiscard]] constexpr bool is_low_surrogate(const std::uint32_t u) noexcept {
        return u >= 0xDC00 && u <= 0xDFFF;
    }

    [[nodiscard]] constexpr std::size_t utf8_encode(const char32_t cp, char* out) noexcept {
        if (cp < 0x80) {
            out[0] = static_cast<char>(cp);
            return 1;
        }
        if (cp < 0x800) {
            out[0] = static_cast<char>(0xC0 | (cp >> 6));
            out[1] = static_cast<char>(0x80 | (cp & 0x3F));
            return 2;
        }
        if (cp < 0x10000) {
            out[0] = static_cast<char>(0xE0 | (cp >> 12));
            out[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out[2] = static_cast<char>(0x80 | (cp & 0x3F));
            return 3;
        }
        out[0] = static_cast<char>(0xF0 | (cp >> 18));
        out[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }

    // Number of continuation bytes announced by a lead byte, -1 for bytes that never lead.
    [[nodiscard]] constexpr int utf8_trailing(const std::uint8_t lead) noexcept {
        if (lead < 0x80)
            return 0;
        if (lead >= 0xC2 && lead <= 0xDF)
            return 1;
        if (lead >= 0xE0 && lead <= 0xEF)
            return 2;
        if (lead >= 0xF0 && lead <= 0xF4)
            return 3;
        return -1;
    }

    // Rejects overlong forms, encoded surrogates and anything past U+10FFFF.
    [[nodiscard]] constexpr bool utf8_valid_codepoint(const char32_t cp, const int trailing) noexcept {
        constexpr char32_t kMin[] = {0, 0x80, 0x800, 0x10000};
        if (trailing < 0 || trailing > 3 || cp < kMin[trailing])
            return false;
        if (is_high_surrogate(cp) || is_low_surrogate(cp))
            return false;
        return cp <= 0x10FFFF;
    }

} // namespace bjson::detail

namespace bjson {

    inline constexpr std::size_t kDefaultMaxDepth = 32;

    // longest number text that to_double converts from a non-contiguous source
    inline constexpr std::size_t kMaxNumberLength = 128;

    enum class ErrorCode : std::uint8_t {
        None,
        UnexpectedEOF,
        UnexpectedToken,
        InvalidLiteral,
        InvalidNumber,
        InvalidString,
        InvalidEscape,
        InvalidUnicode,
        DepthExceeded,
        TrailingData,
        OutOfMemory,
        TypeMismatch,
        MissingField,
        SizeMismatch,
        DuplicateKey,
        ReusedValue,
        NonFiniteNumber,
        SinkOverflow,
        Aborted,
        InternalError,
    };

    enum class ErrorCategory : std::uint8_t {
        None,
        Syntax,
        Structural,
        Semantic,
        Resource,
        Caller,
        Internal,
    };

    enum class ErrorFormat : std::uint8_t {
        Pretty,
        Compact
    };

    struct ParseError {
        ErrorCode code {ErrorCode::None};
        std::size_t offset {};
        std::string_view field {};
        std::string_view input {};

        // first error wins
        BJSON_FORCEINLINE void set(const ErrorCode c, const std::size_t at) noexcept {
            if (code == ErrorCode::None) {
                code = c;
                offset = at;
            }
        }

        BJSON_FORCEINLINE void reset() noexcept {
            code = ErrorCode::None;
            offset = 0;
            field = {};
            input = {};
        }

        template <ErrorFormat Fmt>
        [[nodiscard]] std::string format() const;

        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] BJSON_FORCEINLINE constexpr bool ok() const noexcept {
            return code == ErrorCode::None;
        }

        [[nodiscard]] BJSON_FORCEINLINE constexpr explicit operator bool() const noexcept {
            return ok();
        }
    };

    [[nodiscard]] constexpr const char* error_code_name(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::UnexpectedEOF:
            return "UnexpectedEOF";
        case ErrorCode::UnexpectedToken:
            return "UnexpectedToken";
        case ErrorCode::InvalidLiteral:
            return "InvalidLiteral";
        case ErrorCode::InvalidNumber:
            return "InvalidNumber";
        case ErrorCode::InvalidString:
            return "InvalidString";
        case ErrorCode::InvalidEscape:
            return "InvalidEscape";
        case ErrorCode::InvalidUnicode:
            return "InvalidUnicode";
        case ErrorCode::DepthExceeded:
            return "DepthExceeded";
        case ErrorCode::TrailingData:
            return "TrailingData";
        case ErrorCode::OutOfMemory:
            return "OutOfMemory";
        case ErrorCode::TypeMismatch:
            return "TypeMismatch";
        case ErrorCode::MissingField:
            return "MissingField";
        case ErrorCode::SizeMismatch:
            return "SizeMismatch";
        case ErrorCode::DuplicateKey:
            return "DuplicateKey";
        case ErrorCode::ReusedValue:
            return "ReusedValue";
        case ErrorCode::NonFiniteNumber:
            return "NonFiniteNumber";
        case ErrorCode::SinkOverflow:
            return "SinkOverflow";
        case ErrorCode::Aborted:
            return "Aborted";
        case ErrorCode::InternalError:
            return "InternalError";
        }
        return "Unknown";
    }

    [[nodiscard]] constexpr ErrorCategory error_category(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return ErrorCategory::None;
        case ErrorCode::UnexpectedEOF:
        case ErrorCode::InvalidLiteral:
        case ErrorCode::InvalidNumber:
        case ErrorCode::InvalidString:
        case ErrorCode::InvalidEscape:
        case ErrorCode::InvalidUnicode:
            return ErrorCategory::Syntax;
        case ErrorCode::UnexpectedToken:
        case ErrorCode::DepthExceeded:
        case ErrorCode::TrailingData:
            return ErrorCategory::Structural;
        case ErrorCode::TypeMismatch:
        case ErrorCode::MissingField:
        case ErrorCode::SizeMismatch:
        case ErrorCode::DuplicateKey:
        case ErrorCode::NonFiniteNumber:
            return ErrorCategory::Semantic;
        case ErrorCode::OutOfMemory:
        case ErrorCode::SinkOverflow:
            return ErrorCategory::Resource;
        case ErrorCode::ReusedValue:
        case ErrorCode::Aborted:
            return ErrorCategory::Caller;
        case ErrorCode::InternalError:
            return ErrorCategory::Internal;
        }
        return ErrorCategory::Internal;
    }

    struct ErrorLocation {
        std::size_t offset {};
        std::size_t line {1};
        std::size_t column {1};
    };

    [[nodiscard]] inline ErrorLocation locate_error(const std::string_view input, const ParseError& e) noexcept {
        ErrorLocation loc {};
        if (e.code == ErrorCode::None || input.data() == nullptr)
            return loc;

        loc.offset = std::min(e.offset, input.size());
        for (std::size_t i = 0; i < loc.offset; ++i) {
            if (input[i] == '\n') {
                ++loc.line;
                loc.column = 1;
            } else {
                ++loc.column;
            }
        }
        return loc;
    }

    namespace detail {
        inline void append_field_note(std::string& out, const ParseError& e) {
            if (e.field.empty())
                return;
            out.append(" field '");
            out.append(e.field);
            out.push_back('\'');
        }
    } // namespace detail

    [[nodiscard]] inline std::string format_error_compact(const std::string_view input, const ParseError& e) {
        if (e.code == ErrorCode::None)
            return {};

        const auto [offset, line, column] = locate_error(input, e);

        std::string out;
        out.reserve(96);

        out.append("bjson: ");
        out.append(error_code_name(e.code));
        out.append(" at ");
        out.append(std::to_string(line));
        out.push_back(':');
        out.append(std::to_string(column));
        out.append(" (offset ");
        out.append(std::to_string(offset));
        out.push_back(')');
        detail::append_field_note(out, e);

        if (offset < input.size()) {
            out.append(" unexpected '");
            out.push_back(input[offset]);
            out.push_back('\'');
        }

        return out;
    }

    [[nodiscard]] inline std::string format_error(const std::string_view input, const ParseError& e) {
        if (e.code == ErrorCode::None)
            return {};

        constexpr std::size_t kMaxWidth = 100;
        constexpr std::size_t kHalfWin = 40;

        const auto [offset, line, column] = locate_error(input, e);

        std::size_t start = offset;
        while (start > 0 && input[start - 1] != '\n')
            --start;

        std::size_t end = offset;
        while (end < input.size() && input[end] != '\n')
            ++end;

        std::string_view full = input.substr(start, end - start);

        std::size_t caret = column - 1;
        std::size_t trim_left = 0;

        if (full.size() > kMaxWidth) {
            std::size_t win = caret > kHalfWin ? caret - kHalfWin : 0;
            if (win + kMaxWidth > full.size())
                win = full.size() - kMaxWidth;

            trim_left = win;
            full = full.substr(win, kMaxWidth);
            caret -= trim_left;
        }

        std::string out;
        out.reserve(full.size() + 128);

        out.append("bjson: ");
        out.append(error_code_name(e.code));
        detail::append_field_note(out, e);
        out.push_back('\n');

        out.append(" --> ");
        out.append(std::to_string(line));
        out.push_back(':');
        out.append(std::to_string(column));
        out.append(" (offset ");
        out.append(std::to_string(offset));
        out.append(")\n\n");

        const std::string prefix = " " + std::to_string(line) + " | ";
        std::string rendered = prefix;
        if (trim_left)
            rendered += "...";
        rendered.append(full);
        if (trim_left + full.size() < end - start)
            rendered += "...";

        out.append(rendered);
        out.push_back('\n');

        std::string caret_line(rendered.size() + 1, ' ');
        const std::size_t caret_pos = prefix.size() + (trim_left ? 3 : 0) + caret;
        if (caret_pos < caret_line.size())
            caret_line[caret_pos] = '^';
        out.append(caret_line);

        if (offset < input.size()) {
            out.append(" unexpected '");
            out.push_back(input[offset]);
            out.push_back('\'');
        }

        out.push_back('\n');
        return out;
    }

    template <ErrorFormat Fmt>
    std::string ParseError::format() const {
        if (input.empty())
            return {};

        if constexpr (Fmt == ErrorFormat::Compact)
            return format_error_compact(input, *this);
        else
            return format_error(input, *this);
    }

    inline std::string ParseError::to_string() const {
        return error_code_name(code);
    }

    // ---------------------------------------------------------------------
    // byte sources
    // ---------------------------------------------------------------------

    // Forward reader over immutable bytes. Positions are absolute, so a fork
    // addressed by [start, end) stays meaningful after the parent advances.
    template <typename B>
    concept ByteSource = std::semiregular<B> && requires(B& b, const B& cb, const std::size_t n) {
        { b.peek() } -> std::same_as<std::optional<std::uint8_t>>;
        { b.advance() } -> std::same_as<std::optional<std::uint8_t>>;
        { cb.fork(n, n) } -> std::same_as<B>;
        { cb.position() } -> std::convertible_to<std::size_t>;
    };

    // sources that can hand out their bytes as one string_view
    template <typename B>
    concept ContiguousSource = ByteSource<B> && requires(const B& cb, const std::size_t n) {
        { cb.text(n, n) } -> std::convertible_to<std::string_view>;
    };

    class SpanSource {
    public:
        SpanSource() = default;

        explicit SpanSource(const std::string_view bytes) noexcept : data_(bytes.data()), end_(bytes.size()) { }

        [[nodiscard]] BJSON_FORCEINLINE std::optional<std::uint8_t> peek() const noexcept {
            if (pos_ < end_)
                return static_cast<std::uint8_t>(data_[pos_]);
            return std::nullopt;
        }

        BJSON_FORCEINLINE std::optional<std::uint8_t> advance() noexcept {
            if (pos_ < end_)
                return static_cast<std::uint8_t>(data_[pos_++]);
            return std::nullopt;
        }

        // zero-copy view of [start, end), clamped to this view's own range
        [[nodiscard]] SpanSource fork(std::size_t start, std::size_t end) const noexcept {
            start = std::clamp(start, begin_, end_);
            end = std::clamp(end, start, end_);

            SpanSource s;
            s.data_ = data_;
            s.begin_ = start;
            s.pos_ = start;
            s.end_ = end;
            return s;
        }

        [[nodiscard]] std::size_t position() const noexcept {
            return pos_;
        }

        [[nodiscard]] std::string_view text(std::size_t start, std::size_t end) const noexcept {
            start = std::clamp(start, begin_, end_);
            end = std::clamp(end, start, end_);
            if (data_ == nullptr)
                return {};
            return {data_ + start, end - start};
        }

        [[nodiscard]] std::string_view remaining() const noexcept {
            return text(pos_, end_);
        }

    private:
        const char* data_ {};
        std::size_t begin_ {};
        std::size_t pos_ {};
        std::size_t end_ {};
    };

    static_assert(ContiguousSource<SpanSource>);

    // ---------------------------------------------------------------------
    // depth stacks
    // ---------------------------------------------------------------------

    enum class Container : std::uint8_t {
        Object,
        Array
    };

    enum class Phase : std::uint8_t {
        AwaitingFirstEntry,
        AwaitingKey,
        AwaitingColon,
        AwaitingValue,
        AwaitingCommaOrEnd
    };

    // bit 0 = container, bits 1..3 = phase; fits a nibble
    struct Frame {
        std::uint8_t bits {};

        [[nodiscard]] static constexpr Frame make(const Container c, const Phase p) noexcept {
            return Frame {static_cast<std::uint8_t>(static_cast<unsigned>(c) | static_cast<unsigned>(p) << 1)};
        }

        [[nodiscard]] constexpr Container container() const noexcept {
            return static_cast<Container>(bits & 1u);
        }

        [[nodiscard]] constexpr Phase phase() const noexcept {
            return static_cast<Phase>(bits >> 1 & 7u);
        }

        constexpr void phase(const Phase p) noexcept {
            bits = static_cast<std::uint8_t>((bits & 1u) | static_cast<unsigned>(p) << 1);
        }

        friend constexpr bool operator==(const Frame&, const Frame&) noexcept = default;
    };

    static_assert(sizeof(Frame) == 1);

    template <typename S>
    concept DepthStack = std::movable<S> && requires(S& s, const S& cs, const Frame f) {
        { s.push(f) } -> std::same_as<ErrorCode>;
        { s.pop() } -> std::same_as<Frame>;
        s.peek_mut().phase(Phase::AwaitingKey);
        { s.peek_mut().container() } -> std::same_as<Container>;
        { cs.peek() } -> std::same_as<Frame>;
        { cs.size() } -> std::convertible_to<std::size_t>;
        { cs.empty() } -> std::convertible_to<bool>;
    };

    // Compile-time bounded stack, two frames per byte. Memory is
    // (MaxDepth + 1) / 2 bytes no matter what the input looks like.
    template <std::size_t MaxDepth>
    class FixedStack {
        static_assert(MaxDepth > 0, "FixedStack needs room for at least one frame");

    public:
        // proxy to a packed frame, so the automaton can edit the phase in place
        class FrameRef {
        public:
            [[nodiscard]] Container container() const noexcept {
                return load().container();
            }

            [[nodiscard]] Phase phase() const noexcept {
                return load().phase();
            }

            void phase(const Phase p) noexcept {
                Frame f = load();
                f.phase(p);
                store(f);
            }

        private:
            friend class FixedStack;

            FrameRef(std::uint8_t* byte, const unsigned shift) noexcept : byte_(byte), shift_(shift) { }

            [[nodiscard]] Frame load() const noexcept {
                return Frame {static_cast<std::uint8_t>(*byte_ >> shift_ & 0x0Fu)};
            }

            void store(const Frame f) noexcept {
                *byte_ = static_cast<std::uint8_t>((*byte_ & ~(0x0Fu << shift_)) | (f.bits & 0x0Fu) << shift_);
            }

            std::uint8_t* byte_;
            unsigned shift_;
        };

        [[nodiscard]] ErrorCode push(const Frame f) noexcept {
            if (size_ == MaxDepth)
                return ErrorCode::DepthExceeded;
            slot(size_++).store(f);
            return ErrorCode::None;
        }

        // caller checks empty() first
        Frame pop() noexcept {
            if (size_ == 0)
                return Frame {};
            return slot(--size_).load();
        }

        [[nodiscard]] Frame peek() const noexcept {
            if (size_ == 0)
                return Frame {};
            const std::size_t i = size_ - 1;
            return Frame {static_cast<std::uint8_t>(nibbles_[i / 2] >> (i % 2) * 4 & 0x0Fu)};
        }

        [[nodiscard]] FrameRef peek_mut() noexcept {
            if (size_ == 0)
                return FrameRef {&scratch_, 0};
            return slot(size_ - 1);
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return size_;
        }

        [[nodiscard]] bool empty() const noexcept {
            return size_ == 0;
        }

        [[nodiscard]] static constexpr std::size_t capacity() noexcept {
            return MaxDepth;
        }

    private:
        [[nodiscard]] FrameRef slot(const std::size_t i) noexcept {
            return FrameRef {&nibbles_[i / 2], static_cast<unsigned>(i % 2) * 4};
        }

        std::array<std::uint8_t, (MaxDepth + 1) / 2> nibbles_ {};
        std::size_t size_ {};
        std::uint8_t scratch_ {};
    };

#if BJSON_GROWABLE_STACK
    // Heap backed stack without a depth bound. Only allocation failure stops
    // it, so adversarial nesting costs memory in proportion to its depth.
    class GrowableStack {
    public:
        GrowableStack() = default;

        // a failed reservation leaves the stack empty, push() retries later
        explicit GrowableStack(const std::size_t reserve) {
            if (reserve > 0)
                static_cast<void>(reallocate(reserve));
        }

        GrowableStack(const GrowableStack&) = delete;
        GrowableStack& operator=(const GrowableStack&) = delete;

        GrowableStack(GrowableStack&& o) noexcept
            : frames_(std::move(o.frames_)), size_(std::exchange(o.size_, 0)), capacity_(std::exchange(o.capacity_, 0)) { }

        GrowableStack& operator=(GrowableStack&& o) noexcept {
            if (this != &o) {
                frames_ = std::move(o.frames_);
                size_ = std::exchange(o.size_, 0);
                capacity_ = std::exchange(o.capacity_, 0);
            }
            return *this;
        }

        ~GrowableStack() = default;

        [[nodiscard]] ErrorCode push(const Frame f) noexcept {
            if (size_ == capacity_) {
                if (capacity_ > std::numeric_limits<std::size_t>::max() / 2)
                    return ErrorCode::OutOfMemory;
                if (const auto code = reallocate(capacity_ ? capacity_ * 2 : 16); code != ErrorCode::None)
                    return code;
            }
            frames_[size_++] = f;
            return ErrorCode::None;
        }

        // caller checks empty() first
        Frame pop() noexcept {
            if (size_ == 0)
                return Frame {};
            return frames_[--size_];
        }

        [[nodiscard]] Frame peek() const noexcept {
            return size_ ? frames_[size_ - 1] : Frame {};
        }

        [[nodiscard]] Frame& peek_mut() noexcept {
            return size_ ? frames_[size_ - 1] : scratch_;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return size_;
        }

        [[nodiscard]] bool empty() const noexcept {
            return size_ == 0;
        }

        [[nodiscard]] std::size_t capacity() const noexcept {
            return capacity_;
        }

    private:
        [[nodiscard]] ErrorCode reallocate(const std::size_t n) noexcept {
            std::unique_ptr<Frame[]> next(new (std::nothrow) Frame[n]);
            if (!next)
                return ErrorCode::OutOfMemory;
            if (size_)
                std::memcpy(next.get(), frames_.get(), size_ * sizeof(Frame));
            frames_ = std::move(next);
            capacity_ = n;
            return ErrorCode::None;
        }

        std::unique_ptr<Frame[]> frames_ {};
        std::size_t size_ {};
        std::size_t capacity_ {};
        Frame scratch_ {};
    };

    static_assert(DepthStack<GrowableStack>);
#endif

    static_assert(DepthStack<FixedStack<kDefaultMaxDepth>>);

    namespace detail {

        // Serial of the container open at each depth (index depth - 1). A
        // cursor compares its own serial against it to notice that its
        // container closed and a sibling took the same depth. Grows with
        // the stack it shadows.
        template <typename S>
        class ContainerSerials {
        public:
            [[nodiscard]] ErrorCode record(const std::size_t depth, const std::uint64_t serial) noexcept {
                if (depth == 0)
                    return ErrorCode::InternalError;
                if (depth > capacity_) {
                    if (capacity_ > std::numeric_limits<std::size_t>::max() / 2 / sizeof(std::uint64_t))
                        return ErrorCode::OutOfMemory;
                    const std::size_t n = capacity_ ? capacity_ * 2 : 16;
                    std::unique_ptr<std::uint64_t[]> next(new (std::nothrow) std::uint64_t[n]);
                    if (!next)
                        return ErrorCode::OutOfMemory;
                    if (capacity_)
                        std::memcpy(next.get(), serials_.get(), capacity_ * sizeof(std::uint64_t));
                    serials_ = std::move(next);
                    capacity_ = n;
                }
                serials_[depth - 1] = serial;
                return ErrorCode::None;
            }

            [[nodiscard]] std::uint64_t at(const std::size_t depth) const noexcept {
                return depth && depth <= capacity_ ? serials_[depth - 1] : 0;
            }

        private:
            std::unique_ptr<std::uint64_t[]> serials_ {};
            std::size_t capacity_ {};
        };

        // bounded like the stack itself, no allocation
        template <std::size_t MaxDepth>
        class ContainerSerials<FixedStack<MaxDepth>> {
        public:
            [[nodiscard]] ErrorCode record(const std::size_t depth, const std::uint64_t serial) noexcept {
                if (depth == 0 || depth > MaxDepth)
                    return ErrorCode::InternalError;
                serials_[depth - 1] = serial;
                return ErrorCode::None;
            }

            [[nodiscard]] std::uint64_t at(const std::size_t depth) const noexcept {
                return depth && depth <= MaxDepth ? serials_[depth - 1] : 0;
            }

        private:
            std::array<std::uint64_t, MaxDepth> serials_ {};
        };

    } // namespace detail

    // ---------------------------------------------------------------------
    // tokenizer
    // ---------------------------------------------------------------------

    enum class TokenKind : std::uint8_t {
        BeginObject,
        EndObject,
        BeginArray,
        EndArray,
        Colon,
        Comma,
        String,
        Number,
        True,
        False,
        Null,
        End
    };

    // For strings [begin, end) is the raw content between the quotes; for
    // everything else it is the token text itself.
    struct Token {
        TokenKind kind {TokenKind::End};
        std::size_t offset {};
        std::size_t begin {};
        std::size_t end {};
        bool escaped {};
    };

    namespace detail {

        template <ByteSource B>
        BJSON_FORCEINLINE void skip_ws(B& src) noexcept {
            for (auto c = src.peek(); c && kWsMask.test(*c); c = src.peek())
                src.advance();
        }

        template <ByteSource B>
        [[nodiscard]] BJSON_FORCEINLINE bool at_delimiter(B& src) noexcept {
            const auto c = src.peek();
            return !c || kDelimiterMask.test(*c);
        }

        template <ByteSource B>
        std::size_t skip_digits(B& src) noexcept {
            std::size_t n = 0;
            for (auto c = src.peek(); c && kDigitMask.test(*c); c = src.peek()) {
                src.advance();
                ++n;
            }
            return n;
        }

        template <ByteSource B>
        [[nodiscard]] bool scan_literal(B& src, const std::string_view rest, const std::size_t start, ParseError& err) {
            for (const char expected : rest) {
                const std::size_t at = src.position();
                const auto c = src.advance();
                if (!c) {
                    err.set(ErrorCode::UnexpectedEOF, at);
                    return false;
                }
                if (*c != static_cast<std::uint8_t>(expected)) {
                    err.set(ErrorCode::InvalidLiteral, start);
                    return false;
                }
            }
            if (!at_delimiter(src)) {
                err.set(ErrorCode::InvalidLiteral, start);
                return false;
            }
            return true;
        }

        // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)? followed by a delimiter
        template <ByteSource B>
        [[nodiscard]] bool scan_number(B& src, Token& tok, ParseError& err) {
            const std::size_t start = src.position();
            if (src.peek() == '-')
                src.advance();

            const auto first = src.peek();
            if (!first) {
                err.set(ErrorCode::UnexpectedEOF, src.position());
                return false;
            }
            if (!kDigitMask.test(*first)) {
                err.set(ErrorCode::InvalidNumber, start);
                return false;
            }

            if (*first == '0') {
                src.advance();
                if (const auto c = src.peek(); c && kDigitMask.test(*c)) {
                    err.set(ErrorCode::InvalidNumber, start);
                    return false;
                }
            } else {
                skip_digits(src);
            }

            if (src.peek() == '.') {
                src.advance();
                if (skip_digits(src) == 0) {
                    err.set(ErrorCode::InvalidNumber, src.position());
                    return false;
                }
            }

            if (const auto c = src.peek(); c && (*c == 'e' || *c == 'E')) {
                src.advance();
                if (const auto s = src.peek(); s && (*s == '+' || *s == '-'))
                    src.advance();
                if (skip_digits(src) == 0) {
                    err.set(ErrorCode::InvalidNumber, src.position());
                    return false;
                }
            }

            if (!at_delimiter(src)) {
                err.set(ErrorCode::InvalidNumber, src.position());
                return false;
            }

            tok = Token {TokenKind::Number, start, start, src.position(), false};
            return true;
        }

        template <ByteSource B>
        [[nodiscard]] bool expect_byte(B& src, const std::uint8_t want, const std::size_t at, ParseError& err) {
            const std::size_t here = src.position();
            const auto c = src.advance();
            if (!c) {
                err.set(ErrorCode::UnexpectedEOF, here);
                return false;
            }
            if (*c != want) {
                err.set(ErrorCode::InvalidUnicode, at);
                return false;
            }
            return true;
        }

        template <ByteSource B>
        [[nodiscard]] bool scan_hex4(B& src, std::uint32_t& out, const std::size_t at, ParseError& err) {
            out = 0;
            for (int i = 0; i < 4; ++i) {
                const std::size_t here = src.position();
                const auto c = src.advance();
                if (!c) {
                    err.set(ErrorCode::UnexpectedEOF, here);
                    return false;
                }
                const int v = hex_value(*c);
                if (v < 0) {
                    err.set(ErrorCode::InvalidUnicode, at);
                    return false;
                }
                out = out << 4 | static_cast<std::uint32_t>(v);
            }
            return true;
        }

        // called after the backslash; `at` is the backslash position
        template <ByteSource B>
        [[nodiscard]] bool scan_escape(B& src, const std::size_t at, ParseError& err) {
            const std::size_t here = src.position();
            const auto e = src.advance();
            if (!e) {
                err.set(ErrorCode::UnexpectedEOF, here);
                return false;
            }

            if (*e != 'u') {
                if (!unescape_byte(static_cast<char>(*e))) {
                    err.set(ErrorCode::InvalidEscape, at);
                    return false;
                }
                return true;
            }

            std::uint32_t hi = 0;
            if (!scan_hex4(src, hi, at, err))
                return false;
            if (is_low_surrogate(hi)) {
                err.set(ErrorCode::InvalidUnicode, at);
                return false;
            }
            if (!is_high_surrogate(hi))
                return true;

            std::uint32_t lo = 0;
            if (!expect_byte(src, '\\', at, err) || !expect_byte(src, 'u', at, err) || !scan_hex4(src, lo, at, err))
                return false;
            if (!is_low_surrogate(lo)) {
                err.set(ErrorCode::InvalidUnicode, at);
                return false;
            }
            return true;
        }

        template <ByteSource B>
        [[nodiscard]] bool scan_utf8(B& src, const std::uint8_t lead, const std::size_t at, ParseError& err) {
            const int trailing = utf8_trailing(lead);
            if (trailing <= 0) {
                err.set(ErrorCode::InvalidUnicode, at);
                return false;
            }

            char32_t cp = lead & (0x7Fu >> (trailing + 1));
            for (int i = 0; i < trailing; ++i) {
                const auto c = src.peek();
                if (!c) {
                    err.set(ErrorCode::UnexpectedEOF, src.position());
                    return false;
                }
                if ((*c & 0xC0u) != 0x80u) {
                    err.set(ErrorCode::InvalidUnicode, at);
                    return false;
                }
                src.advance();
                cp = cp << 6 | (*c & 0x3Fu);
            }

            if (!utf8_valid_codepoint(cp, trailing)) {
                err.set(ErrorCode::InvalidUnicode, at);
                return false;
            }
            return true;
        }

        template <ByteSource B>
        [[nodiscard]] bool scan_string(B& src, Token& tok, ParseError& err) {
            const std::size_t open = src.position();
            src.advance();
            const std::size_t begin = src.position();
            bool escaped = false;

            for (;;) {
                const std::size_t at = src.position();
                const auto c = src.advance();
                if (!c) {
                    err.set(ErrorCode::UnexpectedEOF, at);
                    return false;
                }

                const std::uint8_t b = *c;
                if (b == '"') {
                    tok = Token {TokenKind::String, open, begin, at, escaped};
                    return true;
                }
                if (b < 0x20) {
                    err.set(ErrorCode::InvalidString, at);
                    return false;
                }
                if (b == '\\') {
                    escaped = true;
                    if (!scan_escape(src, at, err))
                        return false;
                } else if (b >= 0x80) {
                    if (!scan_utf8(src, b, at, err))
                        return false;
                }
            }
        }

    } // namespace detail

    // Reads the next token. End of input yields TokenKind::End, not an error;
    // whether that is acceptable is for the automaton to decide.
    template <ByteSource B>
    [[nodiscard]] bool next_token(B& src, Token& tok, ParseError& err) {
        detail::skip_ws(src);

        const std::size_t at = src.position();
        const auto c = src.peek();
        if (!c) {
            tok = Token {TokenKind::End, at, at, at, false};
            return true;
        }

        auto single = [&](const TokenKind k) {
            src.advance();
            tok = Token {k, at, at, at + 1, false};
            return true;
        };

        auto literal = [&](const TokenKind k, const std::string_view rest) {
            src.advance();
            if (!detail::scan_literal(src, rest, at, err))
                return false;
            tok = Token {k, at, at, src.position(), false};
            return true;
        };

        switch (*c) {
        case '{':
            return single(TokenKind::BeginObject);
        case '}':
            return single(TokenKind::EndObject);
        case '[':
            return single(TokenKind::BeginArray);
        case ']':
            return single(TokenKind::EndArray);
        case ':':
            return single(TokenKind::Colon);
        case ',':
            return single(TokenKind::Comma);
        case '"':
            return detail::scan_string(src, tok, err);
        case 't':
            return literal(TokenKind::True, "rue");
        case 'f':
            return literal(TokenKind::False, "alse");
        case 'n':
            return literal(TokenKind::Null, "ull");
        case '-':
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            return detail::scan_number(src, tok, err);
        case '+':
            err.set(ErrorCode::InvalidNumber, at);
            return false;
        default:
            break;
        }

        // Infinity, NaN, True and friends
        err.set(detail::kAlphaMask.test(*c) ? ErrorCode::InvalidLiteral : ErrorCode::UnexpectedToken, at);
        return false;
    }

    // ---------------------------------------------------------------------
    // lazy strings and numbers
    // ---------------------------------------------------------------------

    namespace detail {

        // The decoders below only ever see text the tokenizer accepted, so
        // they substitute instead of reporting on impossible input.

        template <ByteSource B>
        std::uint32_t read_hex4(B& src) noexcept {
            std::uint32_t v = 0;
            for (int i = 0; i < 4; ++i) {
                const int h = hex_value(src.advance().value_or(0));
                v = v << 4 | static_cast<std::uint32_t>(h < 0 ? 0 : h);
            }
            return v;
        }

        // backslash already consumed
        template <ByteSource B>
        char32_t decode_escape(B& src) noexcept {
            const auto e = static_cast<char>(src.advance().value_or(0));
            if (e != 'u')
                return static_cast<unsigned char>(unescape_byte(e).value_or(e));

            const std::uint32_t hi = read_hex4(src);
            if (!is_high_surrogate(hi))
                return hi;

            src.advance();
            src.advance();
            const std::uint32_t lo = read_hex4(src);
            return 0x10000 + ((hi - 0xD800) << 10) + (lo - 0xDC00);
        }

        template <ByteSource B>
        char32_t decode_utf8(B& src, const std::uint8_t lead) noexcept {
            const int trailing = utf8_trailing(lead);
            if (trailing <= 0)
                return 0xFFFD;

            char32_t cp = lead & (0x7Fu >> (trailing + 1));
            for (int i = 0; i < trailing; ++i)
                cp = cp << 6 | (src.advance().value_or(0x80) & 0x3Fu);
            return cp;
        }

        template <ByteSource B>
        [[nodiscard]] bool accumulate_digits(B& src, const std::uint64_t limit, std::uint64_t& val) noexcept {
            const std::uint64_t cutoff = limit / 10;
            const auto cutlim = static_cast<unsigned>(limit % 10);

            std::size_t n = 0;
            val = 0;
            while (const auto c = src.advance()) {
                const auto digit = static_cast<unsigned>(*c - '0');
                if (digit > 9)
                    return false;
                if (val > cutoff || (val == cutoff && digit > cutlim))
                    return false;
                val = val * 10 + digit;
                ++n;
            }
            return n > 0;
        }

    } // namespace detail

    // String token content, decoded on demand. Iterating yields code points
    // with escapes resolved and surrogate pairs combined.
    template <ByteSource B>
    class JsonString {
    public:
        class iterator {
        public:
            using iterator_concept = std::input_iterator_tag;
            using value_type = char32_t;
            using difference_type = std::ptrdiff_t;

            iterator() = default;

            explicit iterator(B src) : src_(std::move(src)) {
                ++*this;
            }

            [[nodiscard]] char32_t operator*() const noexcept {
                return current_;
            }

            iterator& operator++() {
                const auto c = src_.advance();
                if (!c) {
                    done_ = true;
                    return *this;
                }
                if (*c == '\\')
                    current_ = detail::decode_escape(src_);
                else if (*c < 0x80)
                    current_ = *c;
                else
                    current_ = detail::decode_utf8(src_, *c);
                return *this;
            }

            void operator++(int) {
                ++*this;
            }

            friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
                return it.done_;
            }

        private:
            B src_ {};
            char32_t current_ {};
            bool done_ {};
        };

        JsonString() = default;

        JsonString(B view, const std::size_t begin, const std::size_t end, const bool escaped)
            : view_(std::move(view)), begin_(begin), end_(end), escaped_(escaped) { }

        [[nodiscard]] iterator begin() const {
            return iterator {view_};
        }

        [[nodiscard]] std::default_sentinel_t end() const noexcept {
            return {};
        }

        [[nodiscard]] bool has_escapes() const noexcept {
            return escaped_;
        }

        // position of the opening quote
        [[nodiscard]] std::size_t offset() const noexcept {
            return begin_ ? begin_ - 1 : 0;
        }

        [[nodiscard]] std::size_t raw_size() const noexcept {
            return end_ - begin_;
        }

        [[nodiscard]] std::string_view raw() const
            requires ContiguousSource<B>
        {
            return view_.text(begin_, end_);
        }

        void append_utf8(std::string& out) const {
            if (!escaped_) {
                if constexpr (ContiguousSource<B>) {
                    out.append(raw());
                } else {
                    B s = view_;
                    while (const auto c = s.advance())
                        out.push_back(static_cast<char>(*c));
                }
                return;
            }

            char buf[4];
            for (const char32_t cp : *this)
                out.append(buf, detail::utf8_encode(cp, buf));
        }

        [[nodiscard]] std::string str() const {
            std::string out;
            out.reserve(raw_size());
            append_utf8(out);
            return out;
        }

        // compares the decoded text against UTF-8 without allocating
        [[nodiscard]] bool equals(const std::string_view utf8) const {
            if (!escaped_) {
                if (raw_size() != utf8.size())
                    return false;
                if constexpr (ContiguousSource<B>) {
                    return raw() == utf8;
                } else {
                    B s = view_;
                    for (const char c : utf8) {
                        if (s.advance() != static_cast<std::uint8_t>(c))
                            return false;
                    }
                    return true;
                }
            }

            std::size_t pos = 0;
            char buf[4];
            for (const char32_t cp : *this) {
                const std::size_t n = detail::utf8_encode(cp, buf);
                if (utf8.size() - pos < n || std::memcmp(buf, utf8.data() + pos, n) != 0)
                    return false;
                pos += n;
            }
            return pos == utf8.size();
        }

        // writes at most cap bytes and returns the full decoded length, like snprintf
        std::size_t copy_to(char* buf, const std::size_t cap) const {
            std::size_t n = 0;
            char tmp[4];
            for (const char32_t cp : *this) {
                const std::size_t len = detail::utf8_encode(cp, tmp);
                for (std::size_t i = 0; i < len; ++i, ++n) {
                    if (n < cap)
                        buf[n] = tmp[i];
                }
            }
            return n;
        }

    private:
        B view_ {};
        std::size_t begin_ {};
        std::size_t end_ {};
        bool escaped_ {};
    };

    // Validated number text, kept verbatim. Conversion and any precision loss
    // happen only when the caller asks for a value.
    template <ByteSource B>
    class JsonNumber {
    public:
        JsonNumber() = default;

        JsonNumber(B view, const std::size_t begin, const std::size_t end) : view_(std::move(view)), begin_(begin), end_(end) { }

        [[nodiscard]] std::string_view raw() const
            requires ContiguousSource<B>
        {
            return view_.text(begin_, end_);
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return end_ - begin_;
        }

        [[nodiscard]] std::string str() const {
            std::string out;
            out.reserve(size());
            B s = view_;
            while (const auto c = s.advance())
                out.push_back(static_cast<char>(*c));
            return out;
        }

        // no fraction and no exponent
        [[nodiscard]] bool is_integer() const {
            B s = view_;
            while (const auto c = s.advance()) {
                if (*c == '.' || *c == 'e' || *c == 'E')
                    return false;
            }
            return true;
        }

        [[nodiscard]] bool to_i64(std::int64_t& out) const {
            B s = view_;
            const bool neg = s.peek() == '-';
            if (neg)
                s.advance();

            constexpr auto max_pos = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            std::uint64_t val = 0;
            if (!detail::accumulate_digits(s, neg ? max_pos + 1 : max_pos, val))
                return false;

            out = neg ? static_cast<std::int64_t>(0 - val) : static_cast<std::int64_t>(val);
            return true;
        }

        [[nodiscard]] bool to_u64(std::uint64_t& out) const {
            B s = view_;
            if (s.peek() == '-')
                return false;

            std::uint64_t val = 0;
            if (!detail::accumulate_digits(s, std::numeric_limits<std::uint64_t>::max(), val))
                return false;
            out = val;
            return true;
        }

        // fails on text whose value is not a finite double
        [[nodiscard]] bool to_double(double& out) const {
            char buf[kMaxNumberLength];
            const char* first = buf;
            const char* last = buf;

            if constexpr (ContiguousSource<B>) {
                const std::string_view t = raw();
                first = t.data();
                last = t.data() + t.size();
            } else {
                std::size_t n = 0;
                B s = view_;
                while (const auto c = s.advance()) {
                    if (n == sizeof(buf))
                        return false;
                    buf[n++] = static_cast<char>(*c);
                }
                last = buf + n;
            }

            double v = 0;
            const auto [p, ec] = std::from_chars(first, last, v);
            if (ec != std::errc {} || p != last || !std::isfinite(v))
                return false;
            out = v;
            return true;
        }

    private:
        B view_ {};
        std::size_t begin_ {};
        std::size_t end_ {};
    };

    // ---------------------------------------------------------------------
    // automaton
    // ---------------------------------------------------------------------

    enum class ValueKind : std::uint8_t {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    enum class EventKind : std::uint8_t {
        Value, // scalar, or an opener whose frame is already pushed
        Key,
        End,   // container closed
        Done   // root closed and nothing but whitespace followed
    };

    enum class DuplicateKeys : std::uint8_t {
        LastWins,
        Reject
    };

    struct Event {
        EventKind kind {EventKind::Done};
        Token token {};
    };

    template <ByteSource B, DepthStack S>
    class Value;

    template <ByteSource B, DepthStack S>
    class ObjectCursor;

    template <ByteSource B, DepthStack S>
    class ArrayCursor;

    // Owns one source and one stack for exactly one top-level value. Nesting
    // is tracked by frames on the stack only, nothing here recurses.
    template <ByteSource B, DepthStack S>
    class Deserializer {
    public:
        Deserializer(B source, S stack) : src_(std::move(source)), stack_(std::move(stack)) { }

        Deserializer(const Deserializer&) = delete;
        Deserializer& operator=(const Deserializer&) = delete;

        // Pull one event. Returns false once an error is latched.
        [[nodiscard]] bool next_event(Event& ev) {
            if (state_ == State::Error)
                return false;

            // past the root only whitespace may follow, whatever the bytes look like
            if (stack_.empty() && state_ != State::Start) {
                detail::skip_ws(src_);
                if (src_.peek())
                    return fail(ErrorCode::TrailingData, src_.position());
            }

            Token tok {};
            for (;;) {
                if (!next_token(src_, tok, err_)) {
                    state_ = State::Error;
                    return false;
                }

                if (stack_.empty()) {
                    if (state_ == State::Start)
                        return open_value(tok, ev);
                    if (tok.kind != TokenKind::End)
                        return fail(ErrorCode::TrailingData, tok.offset);
                    ev = Event {EventKind::Done, tok};
                    return true;
                }

                if (tok.kind == TokenKind::End)
                    return fail(ErrorCode::UnexpectedEOF, tok.offset);

                // FrameRef or Frame&; not touched again once open_value may push
                auto&& frame = stack_.peek_mut();
                const Container container = frame.container();

                switch (frame.phase()) {
                case Phase::AwaitingFirstEntry:
                    if (container == Container::Object) {
                        if (tok.kind == TokenKind::EndObject)
                            return close(tok, ev);
                        if (tok.kind != TokenKind::String)
                            return fail(ErrorCode::UnexpectedToken, tok.offset);
                        frame.phase(Phase::AwaitingColon);
                        ev = Event {EventKind::Key, tok};
                        return true;
                    }
                    if (tok.kind == TokenKind::EndArray)
                        return close(tok, ev);
                    frame.phase(Phase::AwaitingCommaOrEnd);
                    return open_value(tok, ev);

                case Phase::AwaitingKey:
                    if (tok.kind != TokenKind::String)
                        return fail(ErrorCode::UnexpectedToken, tok.offset);
                    frame.phase(Phase::AwaitingColon);
                    ev = Event {EventKind::Key, tok};
                    return true;

                case Phase::AwaitingColon:
                    if (tok.kind != TokenKind::Colon)
                        return fail(ErrorCode::UnexpectedToken, tok.offset);
                    frame.phase(Phase::AwaitingValue);
                    continue;

                case Phase::AwaitingValue:
                    frame.phase(Phase::AwaitingCommaOrEnd);
                    return open_value(tok, ev);

                case Phase::AwaitingCommaOrEnd:
                    if (tok.kind == TokenKind::Comma) {
                        frame.phase(container == Container::Object ? Phase::AwaitingKey : Phase::AwaitingValue);
                        continue;
                    }
                    if (tok.kind == (container == Container::Object ? TokenKind::EndObject : TokenKind::EndArray))
                        return close(tok, ev);
                    return fail(ErrorCode::UnexpectedToken, tok.offset);
                }

                return fail(ErrorCode::InternalError, tok.offset);
            }
        }

        // Handle to the top-level value; available once.
        [[nodiscard]] bool root(Value<B, S>& out) {
            if (state_ == State::Error)
                return false;
            if (state_ != State::Start)
                return fail(ErrorCode::ReusedValue, src_.position());

            Event ev {};
            if (!next_event(ev))
                return false;
            issue(ev.token, out);
            return true;
        }

        // Consume whatever is left of the root and require end of input.
        [[nodiscard]] bool finish() {
            if (state_ == State::Error)
                return false;

            if (state_ == State::Start) {
                Value<B, S> v;
                if (!root(v) || !v.skip())
                    return false;
            }

            if (!drain_to(0))
                return false;

            Event ev {};
            if (!next_event(ev))
                return false;
            if (ev.kind != EventKind::Done)
                return fail(ErrorCode::InternalError, ev.token.offset);
            return true;
        }

        // Skip path: the same transitions as next_event with every event
        // dropped, until at most `depth` containers remain open. Any handle
        // still outstanding is invalidated.
        [[nodiscard]] bool drain_to(const std::size_t depth) {
            pending_ = 0;
            Event ev {};
            while (stack_.size() > depth) {
                if (!next_event(ev))
                    return false;
            }
            return ok();
        }

        [[nodiscard]] JsonString<B> string_of(const Token& t) const {
            return JsonString<B> {src_.fork(t.begin, t.end), t.begin, t.end, t.escaped};
        }

        [[nodiscard]] JsonNumber<B> number_of(const Token& t) const {
            return JsonNumber<B> {src_.fork(t.begin, t.end), t.begin, t.end};
        }

        [[nodiscard]] const ParseError& error() const noexcept {
            return err_;
        }

        [[nodiscard]] bool ok() const noexcept {
            return err_.ok();
        }

        [[nodiscard]] std::size_t depth() const noexcept {
            return stack_.size();
        }

        [[nodiscard]] std::size_t position() const noexcept {
            return src_.position();
        }

        [[nodiscard]] const S& stack() const noexcept {
            return stack_;
        }

        // identity of the container currently open at `depth`, 0 if none was
        [[nodiscard]] std::uint64_t container_serial(const std::size_t depth) const noexcept {
            return serials_.at(depth);
        }

        // text used by ParseError::format()
        void set_input(const std::string_view input) noexcept {
            err_.input = input;
        }

        void set_duplicate_keys(const DuplicateKeys policy) noexcept {
            duplicates_ = policy;
        }

        [[nodiscard]] DuplicateKeys duplicate_keys() const noexcept {
            return duplicates_;
        }

        // Latch an error; always returns false.
        bool fail(const ErrorCode code, const std::size_t offset) noexcept {
            err_.set(code, offset);
            state_ = State::Error;
            return false;
        }

        bool fail_field(const ErrorCode code, const std::size_t offset, const std::string_view field) noexcept {
            if (err_.ok())
                err_.field = field;
            return fail(code, offset);
        }

    private:
        friend class Value<B, S>;
        friend class ObjectCursor<B, S>;
        friend class ArrayCursor<B, S>;

        enum class State : std::uint8_t {
            Start,
            Running,
            Done,
            Error
        };

        [[nodiscard]] bool open_value(const Token& tok, Event& ev) {
            switch (tok.kind) {
            case TokenKind::BeginObject:
            case TokenKind::BeginArray: {
                const Container c = tok.kind == TokenKind::BeginObject ? Container::Object : Container::Array;
                if (const ErrorCode code = stack_.push(Frame::make(c, Phase::AwaitingFirstEntry)); code != ErrorCode::None)
                    return fail(code, tok.offset);
                if (const ErrorCode code = serials_.record(stack_.size(), ++opened_); code != ErrorCode::None)
                    return fail(code, tok.offset);
                if (state_ == State::Start)
                    state_ = State::Running;
                ev = Event {EventKind::Value, tok};
                return true;
            }
            case TokenKind::String:
            case TokenKind::Number:
            case TokenKind::True:
            case TokenKind::False:
            case TokenKind::Null:
                if (state_ == State::Start)
                    state_ = State::Done;
                ev = Event {EventKind::Value, tok};
                return true;
            case TokenKind::End:
                return fail(ErrorCode::UnexpectedEOF, tok.offset);
            default:
                return fail(ErrorCode::UnexpectedToken, tok.offset);
            }
        }

        [[nodiscard]] bool close(const Token& tok, Event& ev) {
            if (stack_.empty())
                return fail(ErrorCode::InternalError, tok.offset);

            static_cast<void>(stack_.pop());
            if (stack_.empty())
                state_ = State::Done;
            else
                stack_.peek_mut().phase(Phase::AwaitingCommaOrEnd);

            ev = Event {EventKind::End, tok};
            return true;
        }

        void issue(const Token& tok, Value<B, S>& out) {
            pending_ = ++ticket_;
            out = Value<B, S> {this, tok, pending_, stack_.size()};
        }

        [[nodiscard]] bool consume(const std::uint64_t ticket, const std::size_t offset) {
            if (state_ == State::Error)
                return false;
            if (ticket == 0 || ticket != pending_)
                return fail(ErrorCode::ReusedValue, offset);
            pending_ = 0;
            return true;
        }

        B src_;
        S stack_;
        detail::ContainerSerials<S> serials_ {};
        ParseError err_ {};
        State state_ {State::Start};
        DuplicateKeys duplicates_ {DuplicateKeys::LastWins};
        std::uint64_t ticket_ {};
        std::uint64_t pending_ {};
        std::uint64_t opened_ {};
    };

    // Single-use handle to the next value. Reading it, entering it or
    // skipping it consumes it; a second use reports ReusedValue.
    template <ByteSource B, DepthStack S>
    class Value {
    public:
        Value() = default;

        [[nodiscard]] ValueKind kind() const noexcept {
            switch (tok_.kind) {
            case TokenKind::True:
            case TokenKind::False:
                return ValueKind::Bool;
            case TokenKind::Number:
                return ValueKind::Number;
            case TokenKind::String:
                return ValueKind::String;
            case TokenKind::BeginArray:
                return ValueKind::Array;
            case TokenKind::BeginObject:
                return ValueKind::Object;
            default:
                return ValueKind::Null;
            }
        }

        [[nodiscard]] bool is_null() const noexcept {
            return kind() == ValueKind::Null;
        }

        [[nodiscard]] bool is_bool() const noexcept {
            return kind() == ValueKind::Bool;
        }

        [[nodiscard]] bool is_number() const noexcept {
            return kind() == ValueKind::Number;
        }

        [[nodiscard]] bool is_string() const noexcept {
            return kind() == ValueKind::String;
        }

        [[nodiscard]] bool is_array() const noexcept {
            return kind() == ValueKind::Array;
        }

        [[nodiscard]] bool is_object() const noexcept {
            return kind() == ValueKind::Object;
        }

        [[nodiscard]] std::size_t offset() const noexcept {
            return tok_.offset;
        }

        [[nodiscard]] bool to_null() {
            return expect(ValueKind::Null) && take();
        }

        [[nodiscard]] bool to_bool(bool& out) {
            if (!expect(ValueKind::Bool) || !take())
                return false;
            out = tok_.kind == TokenKind::True;
            return true;
        }

        [[nodiscard]] bool to_number(JsonNumber<B>& out) {
            if (!expect(ValueKind::Number) || !take())
                return false;
            out = d_->number_of(tok_);
            return true;
        }

        [[nodiscard]] bool to_string(JsonString<B>& out) {
            if (!expect(ValueKind::String) || !take())
                return false;
            out = d_->string_of(tok_);
            return true;
        }

        [[nodiscard]] bool to_object(ObjectCursor<B, S>& out) {
            if (!expect(ValueKind::Object) || !take())
                return false;
            out = ObjectCursor<B, S> {d_, depth_, d_->container_serial(depth_)};
            return true;
        }

        [[nodiscard]] bool to_array(ArrayCursor<B, S>& out) {
            if (!expect(ValueKind::Array) || !take())
                return false;
            out = ArrayCursor<B, S> {d_, depth_, d_->container_serial(depth_)};
            return true;
        }

        // Consume without materializing; containers are walked to their closer.
        [[nodiscard]] bool skip() {
            if (!take())
                return false;
            if (kind() == ValueKind::Array || kind() == ValueKind::Object)
                return d_->drain_to(depth_ - 1);
            return true;
        }

        // Latch an error at this value's position; always returns false.
        bool fail(const ErrorCode code) {
            return d_ ? d_->fail(code, tok_.offset) : false;
        }

        [[nodiscard]] Deserializer<B, S>* deserializer() const noexcept {
            return d_;
        }

    private:
        friend class Deserializer<B, S>;

        Value(Deserializer<B, S>* d, const Token& tok, const std::uint64_t ticket, const std::size_t depth)
            : d_(d), tok_(tok), ticket_(ticket), depth_(depth) { }

        [[nodiscard]] bool expect(const ValueKind k) {
            if (!d_)
                return false;
            if (kind() != k)
                return fail(ErrorCode::TypeMismatch);
            return true;
        }

        [[nodiscard]] bool take() {
            return d_ && d_->consume(ticket_, tok_.offset);
        }

        Deserializer<B, S>* d_ {};
        Token tok_ {};
        std::uint64_t ticket_ {};
        std::size_t depth_ {};
    };

    namespace detail {

        // Common part of the cursors: bring the automaton back to this
        // container's level (skipping whatever the previous entry left open)
        // and read one event there.
        template <ByteSource B, DepthStack S>
        [[nodiscard]] bool cursor_step(Deserializer<B, S>* d, const std::size_t depth, const std::uint64_t serial, bool& done, Event& ev) {
            if (done || !d || !d->ok())
                return false;
            // container closed behind the cursor's back, maybe replaced by a sibling
            if (d->depth() < depth || d->container_serial(depth) != serial) {
                done = true;
                return d->fail(ErrorCode::ReusedValue, d->position());
            }
            if (!d->drain_to(depth) || !d->next_event(ev))
                return false;
            if (ev.kind == EventKind::End) {
                done = true;
                return false;
            }
            return true;
        }

    } // namespace detail

    // Forward-only iteration over one object's entries in document order.
    template <ByteSource B, DepthStack S>
    class ObjectCursor {
    public:
        ObjectCursor() = default;

        // Next entry, or false when the object closed or an error is latched
        // (tell them apart with ok()). Unconsumed values are skipped.
        [[nodiscard]] bool next(JsonString<B>& key, Value<B, S>& value) {
            Event ev {};
            if (!detail::cursor_step(d_, depth_, serial_, done_, ev))
                return false;
            if (ev.kind != EventKind::Key)
                return d_->fail(ErrorCode::InternalError, ev.token.offset);
            key = d_->string_of(ev.token);

            if (!d_->next_event(ev))
                return false;
            if (ev.kind != EventKind::Value)
                return d_->fail(ErrorCode::InternalError, ev.token.offset);
            d_->issue(ev.token, value);
            return true;
        }

        [[nodiscard]] bool ok() const noexcept {
            return d_ && d_->ok();
        }

        [[nodiscard]] bool done() const noexcept {
            return done_;
        }

    private:
        friend class Value<B, S>;

        ObjectCursor(Deserializer<B, S>* d, const std::size_t depth, const std::uint64_t serial) : d_(d), depth_(depth), serial_(serial) { }

        Deserializer<B, S>* d_ {};
        std::size_t depth_ {};
        std::uint64_t serial_ {};
        bool done_ {};
    };

    template <ByteSource B, DepthStack S>
    class ArrayCursor {
    public:
        ArrayCursor() = default;

        [[nodiscard]] bool next(Value<B, S>& value) {
            Event ev {};
            if (!detail::cursor_step(d_, depth_, serial_, done_, ev))
                return false;
            if (ev.kind != EventKind::Value)
                return d_->fail(ErrorCode::InternalError, ev.token.offset);
            d_->issue(ev.token, value);
            return true;
        }

        [[nodiscard]] bool ok() const noexcept {
            return d_ && d_->ok();
        }

        [[nodiscard]] bool done() const noexcept {
            return done_;
        }

    private:
        friend class Value<B, S>;

        ArrayCursor(Deserializer<B, S>* d, const std::size_t depth, const std::uint64_t serial) : d_(d), depth_(depth), serial_(serial) { }

        Deserializer<B, S>* d_ {};
        std::size_t depth_ {};
        std::uint64_t serial_ {};
        bool done_ {};
    };

    // ---------------------------------------------------------------------
    // event walker / validation
    // ---------------------------------------------------------------------

    // Returning false from any callback stops the walk with ErrorCode::Aborted.
    template <typename H, typename B>
    concept ParserHandler = requires(H& h, const JsonString<B>& s, const JsonNumber<B>& n, const bool b) {
        { h.on_null() } -> std::convertible_to<bool>;
        { h.on_bool(b) } -> std::convertible_to<bool>;
        { h.on_number(n) } -> std::convertible_to<bool>;
        { h.on_string(s) } -> std::convertible_to<bool>;
        { h.on_key(s) } -> std::convertible_to<bool>;
        { h.on_array_begin() } -> std::convertible_to<bool>;
        { h.on_array_end() } -> std::convertible_to<bool>;
        { h.on_object_begin() } -> std::convertible_to<bool>;
        { h.on_object_end() } -> std::convertible_to<bool>;
    };

    namespace detail {

        template <ByteSource B, DepthStack S, typename H>
        [[nodiscard]] bool dispatch_event(const Deserializer<B, S>& d, const Event& ev, H& h) {
            if (ev.kind == EventKind::Key)
                return h.on_key(d.string_of(ev.token));
            if (ev.kind == EventKind::End)
                return ev.token.kind == TokenKind::EndObject ? h.on_object_end() : h.on_array_end();

            switch (ev.token.kind) {
            case TokenKind::BeginObject:
                return h.on_object_begin();
            case TokenKind::BeginArray:
                return h.on_array_begin();
            case TokenKind::String:
                return h.on_string(d.string_of(ev.token));
            case TokenKind::Number:
                return h.on_number(d.number_of(ev.token));
            case TokenKind::True:
                return h.on_bool(true);
            case TokenKind::False:
                return h.on_bool(false);
            default:
                return h.on_null();
            }
        }

        template <ByteSource B, DepthStack S, typename H>
        void run_walk(Deserializer<B, S>& d, H& handler) {
            Event ev {};
            while (d.next_event(ev)) {
                if (ev.kind == EventKind::Done)
                    return;
                if (!dispatch_event(d, ev, handler)) {
                    d.fail(ErrorCode::Aborted, ev.token.offset);
                    return;
                }
            }
        }

    } // namespace detail

    // SAX-style traversal with the same automaton, checking trailing data.
    template <ByteSource B, ParserHandler<B> H, DepthStack S = FixedStack<kDefaultMaxDepth>>
    [[nodiscard]] ParseError walk(B source, H& handler, S stack = S {}) {
        Deserializer<B, S> d(std::move(source), std::move(stack));
        detail::run_walk(d, handler);
        return d.error();
    }

    template <ParserHandler<SpanSource> H, DepthStack S = FixedStack<kDefaultMaxDepth>>
    [[nodiscard]] ParseError walk(const std::string_view json, H& handler, S stack = S {}) {
        Deserializer<SpanSource, S> d(SpanSource {json}, std::move(stack));
        d.set_input(json);
        detail::run_walk(d, handler);
        return d.error();
    }

    template <DepthStack S = FixedStack<kDefaultMaxDepth>>
    [[nodiscard]] ParseError validate(const std::string_view json, S stack = S {}) {
        Deserializer<SpanSource, S> d(SpanSource {json}, std::move(stack));
        d.set_input(json);
        static_cast<void>(d.finish());
        return d.error();
    }

    // ---------------------------------------------------------------------
    // sinks / writer
    // ---------------------------------------------------------------------

    template <typename S>
    concept SinkLike = requires(S& s, const char c, const std::string_view sv) {
        { s.put(c) } -> std::convertible_to<bool>;
        { s.puts(sv) } -> std::convertible_to<bool>;
    };

    struct FixedBufferSink {
        char* buf {};
        std::size_t cap {};
        std::size_t pos {};

        [[nodiscard]] BJSON_FORCEINLINE bool put(const char c) {
            if (pos >= cap)
                return false;
            buf[pos++] = c;
            return true;
        }

        [[nodiscard]] BJSON_FORCEINLINE bool puts(const std::string_view s) {
            if (s.size() > cap - pos)
                return false;
            if (!s.empty())
                std::memcpy(buf + pos, s.data(), s.size());
            pos += s.size();
            return true;
        }

        [[nodiscard]] BJSON_FORCEINLINE std::string_view finish() const {
            return {buf, pos};
        }
    };

    struct StringSink {
        std::string out;

        [[nodiscard]] BJSON_FORCEINLINE bool put(const char c) {
            out.push_back(c);
            return true;
        }

        [[nodiscard]] BJSON_FORCEINLINE bool puts(const std::string_view s) {
            out.append(s);
            return true;
        }

        [[nodiscard]] BJSON_FORCEINLINE std::string finish() {
            return std::move(out);
        }
    };

    // measures the output without storing it
    struct CountingSink {
        std::size_t count {};

        [[nodiscard]] BJSON_FORCEINLINE bool put(char) {
            ++count;
            return true;
        }

        [[nodiscard]] BJSON_FORCEINLINE bool puts(const std::string_view s) {
            count += s.size();
            return true;
        }

        [[nodiscard]] BJSON_FORCEINLINE std::size_t finish() const {
            return count;
        }
    };

    inline constexpr std::size_t kFloatBufferSize = 64;

    // Keeps only the digits10 most significant digits, truncating rather than
    // rounding, and picks whichever of plain, decimal-point or exponent form
    // needs no padding past that count. 0.1 -> "1e-1", 123.5 -> "123.5",
    // 1.7976931348623157e308 -> "179769313486231e294".
    struct TruncatingFloatFormat {
        template <std::floating_point T>
        [[nodiscard]] static std::size_t write(const T v, char* out) noexcept {
            if (v == 0) {
                if (!std::signbit(v)) {
                    out[0] = '0';
                    return 1;
                }
                out[0] = '-';
                out[1] = '0';
                return 2;
            }

            char sci[kFloatBufferSize];
            const auto [end, ec] = std::to_chars(sci, sci + sizeof(sci), v, std::chars_format::scientific);
            if (ec != std::errc {})
                return 0;

            std::size_t n = 0;
            const char* p = sci;
            if (*p == '-')
                out[n++] = *p++;

            constexpr int kDigits = std::numeric_limits<T>::digits10;
            char digits[kDigits];
            int count = 0;
            for (; p < end && *p != 'e'; ++p) {
                if (*p != '.' && count < kDigits)
                    digits[count++] = *p;
            }

            int exp10 = 0;
            if (p < end) {
                const char* e = p + 1;
                if (e < end && *e == '+')
                    ++e;
                if (std::from_chars(e, end, exp10).ec != std::errc {})
                    return 0;
            }

            while (count > 1 && digits[count - 1] == '0')
                --count;

            const int shift = exp10 - (count - 1);
            if (shift >= 0 && count + shift <= kDigits) {
                std::memcpy(out + n, digits, static_cast<std::size_t>(count));
                n += static_cast<std::size_t>(count);
                for (int i = 0; i < shift; ++i)
                    out[n++] = '0';
                return n;
            }

            if (shift < 0 && -shift < count) {
                const int whole = count + shift;
                std::memcpy(out + n, digits, static_cast<std::size_t>(whole));
                n += static_cast<std::size_t>(whole);
                out[n++] = '.';
                std::memcpy(out + n, digits + whole, static_cast<std::size_t>(-shift));
                n += static_cast<std::size_t>(-shift);
                return n;
            }

            std::memcpy(out + n, digits, static_cast<std::size_t>(count));
            n += static_cast<std::size_t>(count);
            out[n++] = 'e';
            const auto r = std::to_chars(out + n, out + kFloatBufferSize, shift);
            if (r.ec != std::errc {})
                return 0;
            return static_cast<std::size_t>(r.ptr - out);
        }
    };

    // shortest text that reads back to the same value
    struct ShortestFloatFormat {
        template <std::floating_point T>
        [[nodiscard]] static std::size_t write(const T v, char* out) noexcept {
            const auto [end, ec] = std::to_chars(out, out + kFloatBufferSize, v);
            if (ec != std::errc {})
                return 0;
            return static_cast<std::size_t>(end - out);
        }
    };

#if BJSON_FAST_FLOAT_FORMAT
    using DefaultFloatFormat = ShortestFloatFormat;
#else
    using DefaultFloatFormat = TruncatingFloatFormat;
#endif

    // Thin escaping layer over a caller-owned sink. Failures are latched in
    // the optional ParseError with the output offset reached so far.
    template <SinkLike Sink, typename FloatFormat = DefaultFloatFormat>
    class Writer {
    public:
        explicit Writer(Sink& sink, ParseError* err = nullptr) noexcept : sink_(sink), err_(err) { }

        [[nodiscard]] BJSON_FORCEINLINE bool put(const char c) {
            if (!sink_.put(c))
                return fail(ErrorCode::SinkOverflow);
            ++written_;
            return true;
        }

        [[nodiscard]] BJSON_FORCEINLINE bool puts(const std::string_view s) {
            if (!sink_.puts(s))
                return fail(ErrorCode::SinkOverflow);
            written_ += s.size();
            return true;
        }

        [[nodiscard]] bool write_null() {
            return puts("null");
        }

        [[nodiscard]] bool write_bool(const bool v) {
            return puts(v ? "true" : "false");
        }

        template <std::integral T>
        [[nodiscard]] bool write_integer(const T v) {
            char tmp[24];
            const auto [p, ec] = std::to_chars(tmp, tmp + sizeof(tmp), v);
            if (ec != std::errc {})
                return fail(ErrorCode::InternalError);
            return puts(std::string_view {tmp, static_cast<std::size_t>(p - tmp)});
        }

        template <std::floating_point T>
        [[nodiscard]] bool write_float(const T v) {
            if (!std::isfinite(v))
                return fail(ErrorCode::NonFiniteNumber);
            char tmp[kFloatBufferSize];
            const std::size_t n = FloatFormat::write(v, tmp);
            if (n == 0)
                return fail(ErrorCode::InternalError);
            return puts(std::string_view {tmp, n});
        }

        // quote, backslash and control bytes are escaped; other bytes pass through
        [[nodiscard]] bool write_string(const std::string_view s) {
            if (!put('"'))
                return false;

            std::size_t run = 0;
            for (std::size_t i = 0; i < s.size(); ++i) {
                const auto c = static_cast<unsigned char>(s[i]);
                if (!detail::kEscapeMask.test(c))
                    continue;

                if (i > run && !puts(s.substr(run, i - run)))
                    return false;
                run = i + 1;

                if (const char letter = detail::escape_letter(static_cast<char>(c))) {
                    const char tmp[2] = {'\\', letter};
                    if (!puts(std::string_view {tmp, 2}))
                        return false;
                    continue;
                }

                const char tmp[6] = {'\\', 'u', '0', '0', detail::kHexDigits[c >> 4 & 0xF], detail::kHexDigits[c & 0xF]};
                if (!puts(std::string_view {tmp, 6}))
                    return false;
            }

            if (run < s.size() && !puts(s.substr(run)))
                return false;
            return put('"');
        }

        [[nodiscard]] std::size_t written() const noexcept {
            return written_;
        }

    private:
        bool fail(const ErrorCode c) noexcept {
            if (err_)
                err_->set(c, written_);
            return false;
        }

        Sink& sink_;
        ParseError* err_ {};
        std::size_t written_ {};
    };

    // ---------------------------------------------------------------------
    // typed dispatch
    // ---------------------------------------------------------------------

    // A double that is never NaN or infinite.
    class JsonFinite {
    public:
        JsonFinite() = default;

        [[nodiscard]] static std::optional<JsonFinite> from(const double v) noexcept {
            if (!std::isfinite(v))
                return std::nullopt;
            JsonFinite f;
            f.value_ = v;
            return f;
        }

        [[nodiscard]] double get() const noexcept {
            return value_;
        }

        friend bool operator==(const JsonFinite&, const JsonFinite&) = default;

    private:
        double value_ {};
    };

    enum class Presence : std::uint8_t {
        Absent,
        Null,
        Present
    };

    // Field that tells "key missing" apart from "key: null".
    template <typename T>
    class Tri {
    public:
        Tri() = default;

        Tri(T v) : presence_(Presence::Present), value_(std::move(v)) { } // NOLINT(google-explicit-constructor)

        [[nodiscard]] static Tri null() {
            Tri t;
            t.presence_ = Presence::Null;
            return t;
        }

        [[nodiscard]] Presence presence() const noexcept {
            return presence_;
        }

        [[nodiscard]] bool is_absent() const noexcept {
            return presence_ == Presence::Absent;
        }

        [[nodiscard]] bool is_null() const noexcept {
            return presence_ == Presence::Null;
        }

        [[nodiscard]] bool is_present() const noexcept {
            return presence_ == Presence::Present;
        }

        // nullptr unless present
        [[nodiscard]] const T* get() const noexcept {
            return value_ ? &*value_ : nullptr;
        }

        [[nodiscard]] T* get() noexcept {
            return value_ ? &*value_ : nullptr;
        }

        friend bool operator==(const Tri&, const Tri&) = default;

    private:
        Presence presence_ {Presence::Absent};
        std::optional<T> value_ {};
    };

    // Decoding and encoding of one C++ type. Specialized below for the
    // supported standard types; user structures go through JsonObject<T>.
    template <typename T>
    struct Codec;

    // Specialize with `static constexpr auto fields = std::make_tuple(field("key", &T::member), ...);`
    template <typename T>
    struct JsonObject;

    template <typename T, typename M>
    struct Field {
        std::string_view key;
        M T::*member;
        bool required {true};

        // absent key keeps the member's default
        [[nodiscard]] constexpr Field optional() const noexcept {
            Field f = *this;
            f.required = false;
            return f;
        }
    };

    namespace detail {

        template <typename T>
        struct is_tri : std::false_type { };

        template <typename T>
        struct is_tri<Tri<T>> : std::true_type { };

        template <typename T>
        struct is_optional : std::false_type { };

        template <typename T>
        struct is_optional<std::optional<T>> : std::true_type { };

        template <typename T>
        inline constexpr bool may_be_absent_v = is_tri<T>::value || is_optional<T>::value;

    } // namespace detail

    template <typename T, typename M>
    [[nodiscard]] constexpr Field<T, M> field(const std::string_view key, M T::*member) noexcept {
        return Field<T, M> {key, member, !detail::may_be_absent_v<M>};
    }

    template <typename T>
    concept Described = requires { JsonObject<T>::fields; };

    template <>
    struct Codec<bool> {
        template <ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode(Value<B, S>& v, bool& out) {
            return v.to_bool(out);
        }

        template <typename W>
        [[nodiscard]] static bool encode(W& w, const bool v) {
            return w.write_bool(v);
        }
    };

    // Integer text converts directly; fraction or exponent text is accepted
    // only when it denotes an exact integer in range.
    template <typename T>
        requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
    struct Codec<T> {
        template <ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode(Value<B, S>& v, T& out) {
            JsonNumber<B> n;
            if (!v.to_number(n))
                return false;

            if (!n.is_integer())
                return decode_integral_double(v, n, out);

            if constexpr (std::is_signed_v<T>) {
                std::int64_t x = 0;
                if (!n.to_i64(x) || !std::in_range<T>(x))
                    return v.fail(ErrorCode::TypeMismatch);
                out = static_cast<T>(x);
            } else {
                std::uint64_t x = 0;
                if (!n.to_u64(x) || !std::in_range<T>(x))
                    return v.fail(ErrorCode::TypeMismatch);
                out = static_cast<T>(x);
            }
            return true;
        }

        template <typename W>
        [[nodiscard]] static bool encode(W& w, const T v) {
            return w.write_integer(v);
        }

    private:
        template <ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode_integral_double(Value<B, S>& v, const JsonNumber<B>& n, T& out) {
            // beyond 2^53 a double no longer pins down one integer
            constexpr double kExact = 9007199254740992.0;

            double d = 0;
            if (!n.to_double(d) || std::trunc(d) != d || std::fabs(d) > kExact)
                return v.fail(ErrorCode::TypeMismatch);

            const auto x = static_cast<std::int64_t>(d);
            if (!std::in_range<T>(x))
                return v.fail(ErrorCode::TypeMismatch);
            out = static_cast<T>(x);
            return true;
        }
    };

    template <typename T>
        requires(std::is_same_v<T, float> || std::is_same_v<T, double>)
    struct Codec<T> {
        template <ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode(Value<B, S>& v, T& out) {
            JsonNumber<B> n;
            if (!v.to_number(n))
                return false;

            double d = 0;
            if (!n.to_double(d))
                return v.fail(ErrorCode::TypeMismatch);
            if constexpr (std::is_same_v<T, float>) {
                if (std::fabs(d) > static_cast<double>(std::numeric_limits<float>::max()))
                    return v.fail(ErrorCode::TypeMismatch);
            }
            out = static_cast<T>(d);
            return true;
        }

        template <typename W>
        [[nodiscard]] static bool encode(W& w, const T v) {
            return w.write_float(v);
        }
    };

    template <>
    struct Codec<JsonFinite> {
        template <ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode(Value<B, S>& v, JsonFinite& out) {
            double d = 0;
            if (!Codec<double>::decode(v, d))
                return false;
            const auto f = JsonFinite::from(d);
            if (!f)
                return v.fail(ErrorCode::NonFiniteNumber);
            out = *f;
            return true;
        }

        template <typename W>
        [[nodiscard]] static bool encode(W& w, const JsonFinite v) {
            return w.write_float(v.get());
        }
    };

    template <>
    struct Codec<std::string> {
        template <ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode(Value<B, S>& v, std::string& out) {
            JsonString<B> s;
            if (!v.to_string(s))
                return false;
            out.clear();
            s.append_utf8(out);
            return true;
        }

        template <typename W>
        [[nodiscard]] static bool encode(W& w, const std::string& v) {
            return w.write_string(v);
        }
    };

    // null or a missing key -> empty
    template <typename T>
    struct Codec<std::optional<T>> {
        template <ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode(Value<B, S>& v, std::optional<T>& out) {
            if (v.is_null()) {
                if (!v.to_null())
                    return false;
                out.reset();
                return true;
            }

            T tmp {};
            if (!Codec<T>::decode(v, tmp))
                return false;
            out = std::move(tmp);
            return true;
        }

        template <typename W>
        [[nodiscard]] static bool encode(W& w, const std::optional<T>& v) {
            return v ? Codec<T>::encode(w, *v) : w.write_null();
        }
    };

    // Absent members are left out by the structure encoder; a bare absent
    // Tri writes null.
    template <typename T>
    struct Codec<Tri<T>> {
        template <ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode(Value<B, S>& v, Tri<T>& out) {
            if (v.is_null()) {
                if (!v.to_null())
                    return false;
                out = Tri<T>::null();
                return true;
            }

            T tmp {};
            if (!Codec<T>::decode(v, tmp))
                return false;
            out = Tri<T> {std::move(tmp)};
            return true;
        }

        template <typename W>
        [[nodiscard]] static bool encode(W& w, const Tri<T>& v) {
            const T* p = v.get();
            return p ? Codec<T>::encode(w, *p) : w.write_null();
        }
    };

    template <typename T, typename A>
    struct Codec<std::vector<T, A>> {
        template <ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode(Value<B, S>& v, std::vector<T, A>& out) {
            ArrayCursor<B, S> c;
            if (!v.to_array(c))
                return false;

            out.clear();
            Value<B, S> item;
            while (c.next(item)) {
                T tmp {};
                if (!Codec<T>::decode(item, tmp))
                    return false;
                out.push_back(std::move(tmp));
            }
            return c.ok();
        }

        template <typename W>
        [[nodiscard]] static bool encode(W& w, const std::vector<T, A>& v) {
            if (!w.put('['))
                return false;
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i && !w.put(','))
                    return false;
                if (!Codec<T>::encode(w, v[i]))
                    return false;
            }
            return w.put(']');
        }
    };

    // exact arity: fewer or more elements than N is SizeMismatch
    template <typename T, std::size_t N>
    struct Codec<std::array<T, N>> {
        template <ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode(Value<B, S>& v, std::array<T, N>& out) {
            ArrayCursor<B, S> c;
            if (!v.to_array(c))
                return false;

            std::size_t count = 0;
            Value<B, S> item;
            while (c.next(item)) {
                if (count == N)
                    return item.fail(ErrorCode::SizeMismatch);
                if (!Codec<T>::decode(item, out[count]))
                    return false;
                ++count;
            }
            if (!c.ok())
                return false;
            if (count != N)
                return v.fail(ErrorCode::SizeMismatch);
            return true;
        }

        template <typename W>
        [[nodiscard]] static bool encode(W& w, const std::array<T, N>& v) {
            if (!w.put('['))
                return false;
            for (std::size_t i = 0; i < N; ++i) {
                if (i && !w.put(','))
                    return false;
                if (!Codec<T>::encode(w, v[i]))
                    return false;
            }
            return w.put(']');
        }
    };

    namespace detail {

        template <typename Map>
        struct MapCodec {
            using Mapped = typename Map::mapped_type;

            template <ByteSource B, DepthStack S>
            [[nodiscard]] static bool decode(Value<B, S>& v, Map& out) {
                ObjectCursor<B, S> c;
                if (!v.to_object(c))
                    return false;

                Deserializer<B, S>& d = *v.deserializer();
                out.clear();

                JsonString<B> key;
                Value<B, S> item;
                while (c.next(key, item)) {
                    std::string k = key.str();
                    if (d.duplicate_keys() == DuplicateKeys::Reject && out.find(k) != out.end())
                        return d.fail(ErrorCode::DuplicateKey, key.offset());

                    Mapped tmp {};
                    if (!Codec<Mapped>::decode(item, tmp))
                        return false;
                    out.insert_or_assign(std::move(k), std::move(tmp));
                }
                return c.ok();
            }

            template <typename W>
            [[nodiscard]] static bool encode(W& w, const Map& m) {
                if (!w.put('{'))
                    return false;
                bool first = true;
                for (const auto& [k, val] : m) {
                    if (!first && !w.put(','))
                        return false;
                    first = false;
                    if (!w.write_string(k) || !w.put(':') || !Codec<Mapped>::encode(w, val))
                        return false;
                }
                return w.put('}');
            }
        };

    } // namespace detail

    template <typename T, typename C, typename A>
    struct Codec<std::map<std::string, T, C, A>> : detail::MapCodec<std::map<std::string, T, C, A>> { };

    template <typename T, typename H, typename E, typename A>
    struct Codec<std::unordered_map<std::string, T, H, E, A>> : detail::MapCodec<std::unordered_map<std::string, T, H, E, A>> { };

    // User structures. Keys are matched in one pass: known keys decode into
    // their member (a repeated key overwrites), unknown keys are skipped, and
    // required members that never appeared are reported once the object closes.
    template <Described T>
    struct Codec<T> {
        static constexpr std::size_t kCount = std::tuple_size_v<std::remove_cvref_t<decltype(JsonObject<T>::fields)>>;

        template <ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode(Value<B, S>& v, T& out) {
            ObjectCursor<B, S> c;
            if (!v.to_object(c))
                return false;

            Deserializer<B, S>& d = *v.deserializer();
            constexpr auto seq = std::make_index_sequence<kCount> {};
            std::array<bool, kCount> seen {};

            JsonString<B> key;
            Value<B, S> item;
            while (c.next(key, item)) {
                const std::size_t idx = find_field(key, seq);
                if (idx == kCount) {
                    if (!item.skip())
                        return false;
                    continue;
                }

                if (seen[idx] && d.duplicate_keys() == DuplicateKeys::Reject)
                    return d.fail(ErrorCode::DuplicateKey, key.offset());
                seen[idx] = true;

                if (!decode_field_at(idx, item, out, seq))
                    return false;
            }
            if (!c.ok())
                return false;

            constexpr auto required = required_flags(seq);
            constexpr auto keys = field_keys(seq);
            for (std::size_t i = 0; i < kCount; ++i) {
                if (required[i] && !seen[i])
                    return d.fail_field(ErrorCode::MissingField, v.offset(), keys[i]);
            }
            return true;
        }

        // declaration order; absent Tri members are omitted
        template <typename W>
        [[nodiscard]] static bool encode(W& w, const T& v) {
            if (!w.put('{'))
                return false;
            bool first = true;
            const bool ok = std::apply([&](const auto&... f) { return (encode_member(w, f, v, first) && ...); }, JsonObject<T>::fields);
            return ok && w.put('}');
        }

    private:
        template <ByteSource B, std::size_t... I>
        [[nodiscard]] static std::size_t find_field(const JsonString<B>& key, std::index_sequence<I...>) {
            std::size_t idx = kCount;
            static_cast<void>(((key.equals(std::get<I>(JsonObject<T>::fields).key) ? (idx = I, true) : false) || ...));
            return idx;
        }

        template <ByteSource B, DepthStack S, std::size_t... I>
        [[nodiscard]] static bool decode_field_at(const std::size_t idx, Value<B, S>& item, T& out, std::index_sequence<I...>) {
            bool ok = false;
            static_cast<void>(((idx == I ? (ok = decode_member(std::get<I>(JsonObject<T>::fields), item, out), true) : false) || ...));
            return ok;
        }

        template <typename M, ByteSource B, DepthStack S>
        [[nodiscard]] static bool decode_member(const Field<T, M>& f, Value<B, S>& item, T& out) {
            M tmp {};
            if (!Codec<M>::decode(item, tmp))
                return false;
            out.*f.member = std::move(tmp);
            return true;
        }

        template <typename W, typename M>
        [[nodiscard]] static bool encode_member(W& w, const Field<T, M>& f, const T& v, bool& first) {
            const M& m = v.*f.member;
            if constexpr (detail::is_tri<M>::value) {
                if (m.is_absent())
                    return true;
            }
            if (!first && !w.put(','))
                return false;
            first = false;
            return w.write_string(f.key) && w.put(':') && Codec<M>::encode(w, m);
        }

        template <std::size_t... I>
        static constexpr std::array<bool, kCount> required_flags(std::index_sequence<I...>) {
            return {std::get<I>(JsonObject<T>::fields).required...};
        }

        template <std::size_t... I>
        static constexpr std::array<std::string_view, kCount> field_keys(std::index_sequence<I...>) {
            return {std::get<I>(JsonObject<T>::fields).key...};
        }
    };

    // ---------------------------------------------------------------------
    // entry points
    // ---------------------------------------------------------------------

    // Decodes one document into `out`. `out` is only assigned when the whole
    // input was accepted, trailing whitespace included.
    template <typename T, ByteSource B, DepthStack S = FixedStack<kDefaultMaxDepth>>
    [[nodiscard]] ParseError deserialize(B source, T& out, S stack = S {}, const DuplicateKeys duplicates = DuplicateKeys::LastWins) {
        Deserializer<B, S> d(std::move(source), std::move(stack));
        d.set_duplicate_keys(duplicates);

        T value {};
        Value<B, S> root;
        if (d.root(root) && Codec<T>::decode(root, value) && d.finish())
            out = std::move(value);
        return d.error();
    }

    template <typename T, DepthStack S = FixedStack<kDefaultMaxDepth>>
    [[nodiscard]] ParseError deserialize(const std::string_view json, T& out, S stack = S {}, const DuplicateKeys duplicates = DuplicateKeys::LastWins) {
        ParseError err = deserialize(SpanSource {json}, out, std::move(stack), duplicates);
        err.input = json;
        return err;
    }

    // Lazy serialized form of a value; nothing is produced until one of the
    // members below runs. The value must outlive this object.
    template <typename T, typename FloatFormat = DefaultFloatFormat>
    class Serialization {
    public:
        explicit Serialization(const T& value) noexcept : value_(&value) { }

        template <SinkLike Sink>
        [[nodiscard]] bool write(Sink& sink, ParseError* err = nullptr) const {
            Writer<Sink, FloatFormat> w(sink, err);
            return Codec<T>::encode(w, *value_);
        }

        [[nodiscard]] std::optional<std::string> str(ParseError* err = nullptr) const {
            StringSink sink;
            if (!write(sink, err))
                return std::nullopt;
            return sink.finish();
        }

        [[nodiscard]] std::optional<std::size_t> size(ParseError* err = nullptr) const {
            CountingSink sink;
            if (!write(sink, err))
                return std::nullopt;
            return sink.finish();
        }

        // SinkOverflow when cap is too small
        [[nodiscard]] std::optional<std::size_t> copy_to(char* buf, const std::size_t cap, ParseError* err = nullptr) const {
            FixedBufferSink sink {buf, cap, 0};
            if (!write(sink, err))
                return std::nullopt;
            return sink.pos;
        }

    private:
        const T* value_;
    };

    template <typename FloatFormat = DefaultFloatFormat, typename T>
    [[nodiscard]] Serialization<T, FloatFormat> serialize(const T& value) noexcept {
        return Serialization<T, FloatFormat> {value};
    }

    template <typename FloatFormat = DefaultFloatFormat, typename T>
    void serialize(const T&& value) = delete;

} // namespace bjson

#endif // BJSON_HPP
