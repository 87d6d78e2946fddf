#include "codec/escape_codec.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>

namespace kvedit::codec {

namespace {

// Decode `text`, failing the test if it does not decode.
std::string decode_ok(const std::string& text) {
    auto result = decode(text);
    EXPECT_TRUE(std::holds_alternative<std::string>(result)) << "input: " << text;
    if (auto* s = std::get_if<std::string>(&result)) {
        return *s;
    }
    return {};
}

DecodeError decode_err(const std::string& text) {
    auto result = decode(text);
    EXPECT_TRUE(std::holds_alternative<DecodeError>(result)) << "input: " << text;
    if (auto* e = std::get_if<DecodeError>(&result)) {
        return *e;
    }
    return {};
}

} // anonymous namespace

// ── encode ────────────────────────────────────────────────────────────────────

TEST(EscapeCodecTest, PrintableAsciiIsVerbatim) {
    EXPECT_EQ(encode("hello world ~!"), "hello world ~!");
}

TEST(EscapeCodecTest, EmptyStringEncodesToEmpty) {
    EXPECT_EQ(encode(""), "");
}

TEST(EscapeCodecTest, BackslashIsDoubled) {
    EXPECT_EQ(encode("a\\b"), "a\\\\b");
}

TEST(EscapeCodecTest, StrictEscapesWhitespaceControls) {
    EXPECT_EQ(encode("a\tb\nc\rd"), "a\\tb\\nc\\rd");
}

TEST(EscapeCodecTest, PrettyLeavesWhitespaceControlsRaw) {
    EXPECT_EQ(encode("a\tb\nc\rd", EncodeStyle::Pretty), "a\tb\nc\rd");
}

TEST(EscapeCodecTest, OtherControlsUseUpperCaseHex) {
    EXPECT_EQ(encode(std::string("\x00\x1f\x7f", 3)), "\\x00\\x1F\\x7F");
    EXPECT_EQ(encode(std::string("\x00", 1), EncodeStyle::Pretty), "\\x00");
}

TEST(EscapeCodecTest, ValidUtf8IsVerbatim) {
    const std::string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
    EXPECT_EQ(encode(text), text);
}

TEST(EscapeCodecTest, InvalidUtf8BytesAreEscaped) {
    EXPECT_EQ(encode("\xFF"), "\\xFF");
    EXPECT_EQ(encode("\xC3"), "\\xC3");           // truncated sequence
    EXPECT_EQ(encode("\xC0\xAF"), "\\xC0\\xAF");   // overlong '/'
    EXPECT_EQ(encode("\xED\xA0\x80"), "\\xED\\xA0\\x80"); // surrogate
    EXPECT_EQ(encode("\xF4\x90\x80\x80"), "\\xF4\\x90\\x80\\x80"); // > U+10FFFF
}

TEST(EscapeCodecTest, MixedValidAndInvalidUtf8) {
    EXPECT_EQ(encode("\xC3\xA9\xFF" "a"), "\xC3\xA9\\xFF" "a");
}

// ── decode ────────────────────────────────────────────────────────────────────

TEST(EscapeCodecTest, DecodesAllEscapes) {
    EXPECT_EQ(decode_ok("\\\\\\t\\n\\r\\0"), std::string("\\\t\n\r\0", 5));
}

TEST(EscapeCodecTest, DecodesHexInEitherCase) {
    EXPECT_EQ(decode_ok("\\xff\\xFF\\x0a"), "\xFF\xFF\n");
}

TEST(EscapeCodecTest, DecodeAcceptsRawWhitespace) {
    EXPECT_EQ(decode_ok("a\tb\nc"), "a\tb\nc");
}

TEST(EscapeCodecTest, RejectsBadHexDigits) {
    auto err = decode_err("ab\\xZZ");
    EXPECT_EQ(err.position, 2u);
    EXPECT_FALSE(err.message.empty());
}

TEST(EscapeCodecTest, RejectsTruncatedHexEscape) {
    EXPECT_EQ(decode_err("\\x").position, 0u);
    EXPECT_EQ(decode_err("k\\xA").position, 1u);
}

TEST(EscapeCodecTest, RejectsTrailingBackslash) {
    auto err = decode_err("abc\\");
    EXPECT_EQ(err.position, 3u);
    EXPECT_EQ(err.message, "trailing backslash");
}

TEST(EscapeCodecTest, RejectsUnknownEscape) {
    EXPECT_EQ(decode_err("\\q").position, 0u);
}

// ── Round trip ────────────────────────────────────────────────────────────────

TEST(EscapeCodecTest, EveryByteRoundTripsInBothStyles) {
    std::string all;
    for (int b = 0; b < 256; ++b) {
        all += static_cast<char>(b);
    }
    EXPECT_EQ(decode_ok(encode(all, EncodeStyle::Strict)), all);
    EXPECT_EQ(decode_ok(encode(all, EncodeStyle::Pretty)), all);
}

TEST(EscapeCodecTest, StrictOutputIsSingleLine) {
    std::string all;
    for (int b = 0; b < 256; ++b) {
        all += static_cast<char>(b);
    }
    const auto text = encode(all);
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_EQ(text.find('\r'), std::string::npos);
    EXPECT_EQ(text.find('\t'), std::string::npos);
}

// ── utf8_sequence_length ──────────────────────────────────────────────────────

TEST(EscapeCodecTest, Utf8SequenceLength) {
    const unsigned char ascii[] = {'a'};
    const unsigned char two[]   = {0xC3, 0xA9};
    const unsigned char three[] = {0xE2, 0x82, 0xAC};
    const unsigned char four[]  = {0xF0, 0x9F, 0x98, 0x80};
    const unsigned char bad[]   = {0x80};

    EXPECT_EQ(utf8_sequence_length(ascii, 1), 1u);
    EXPECT_EQ(utf8_sequence_length(two, 2), 2u);
    EXPECT_EQ(utf8_sequence_length(three, 3), 3u);
    EXPECT_EQ(utf8_sequence_length(four, 4), 4u);
    EXPECT_EQ(utf8_sequence_length(four, 3), 0u);
    EXPECT_EQ(utf8_sequence_length(bad, 1), 0u);
    EXPECT_EQ(utf8_sequence_length(ascii, 0), 0u);
}

} // namespace kvedit::codec
