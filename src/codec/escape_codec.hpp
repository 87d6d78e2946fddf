#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace kvedit::codec {

// ── Escape codec ──────────────────────────────────────────────────────────────
//
// Lossless mapping between arbitrary byte strings and editable text.
//
// Encoded form:
//   - printable ASCII and well-formed UTF-8 sequences are copied verbatim
//   - '\' becomes "\\"
//   - TAB / LF / CR become "\t" / "\n" / "\r" (Strict) or stay raw (Pretty)
//   - every other byte becomes "\xHH" (two upper-case hex digits)
//
// Decoding accepts \\ \t \n \r \0 and \xHH (either case).  Anything else
// after a backslash is rejected.
//
// Thread-safe: pure functions, no shared state.

enum class EncodeStyle : uint8_t {
    Strict = 0, // single-line output, whitespace controls escaped
    Pretty = 1, // TAB / LF / CR left raw for multi-line display
};

struct DecodeError {
    std::size_t position; // byte offset of the offending backslash
    std::string message;
};

// Encode raw bytes as edit text.
[[nodiscard]] std::string encode(std::string_view bytes,
                                 EncodeStyle style = EncodeStyle::Strict);

// Decode edit text back to raw bytes, or report the first malformed escape.
[[nodiscard]] std::variant<std::string, DecodeError> decode(std::string_view text);

// Length of the well-formed UTF-8 sequence starting at `data[0]`, or 0 when
// the bytes there are not a complete, shortest-form, non-surrogate scalar.
[[nodiscard]] std::size_t utf8_sequence_length(const unsigned char* data,
                                               std::size_t available) noexcept;

} // namespace kvedit::codec
