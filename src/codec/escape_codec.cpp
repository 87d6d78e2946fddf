#include "codec/escape_codec.hpp"

#include <format>

namespace kvedit::codec {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

bool is_continuation(unsigned char b) noexcept {
    return (b & 0xC0) == 0x80;
}

// Returns the value of a hex digit, or -1.
int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_hex_escape(std::string& out, unsigned char b) {
    out += "\\x";
    out += kHexDigits[b >> 4];
    out += kHexDigits[b & 0x0F];
}

} // anonymous namespace

std::size_t utf8_sequence_length(const unsigned char* data,
                                 std::size_t available) noexcept {
    if (available == 0) {
        return 0;
    }

    const unsigned char lead = data[0];
    if (lead < 0x80) {
        return 1;
    }

    // Allowed range for the second byte; the rest are plain continuations.
    std::size_t length = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead == 0xE0) {
        length = 3;
        lo = 0xA0;              // reject overlong forms
    } else if (lead == 0xED) {
        length = 3;
        hi = 0x9F;              // reject UTF-16 surrogates
    } else if (lead >= 0xE1 && lead <= 0xEF) {
        length = 3;
    } else if (lead == 0xF0) {
        length = 4;
        lo = 0x90;              // reject overlong forms
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        length = 4;
    } else if (lead == 0xF4) {
        length = 4;
        hi = 0x8F;              // nothing above U+10FFFF
    } else {
        return 0;
    }

    if (available < length) {
        return 0;
    }
    if (data[1] < lo || data[1] > hi) {
        return 0;
    }
    for (std::size_t i = 2; i < length; ++i) {
        if (!is_continuation(data[i])) {
            return 0;
        }
    }
    return length;
}

// ── encode ────────────────────────────────────────────────────────────────────

std::string encode(std::string_view bytes, EncodeStyle style) {
    std::string out;
    out.reserve(bytes.size());

    const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());
    const std::size_t size = bytes.size();

    std::size_t i = 0;
    while (i < size) {
        const unsigned char b = data[i];

        if (b >= 0x80) {
            const std::size_t len = utf8_sequence_length(data + i, size - i);
            if (len == 0) {
                append_hex_escape(out, b);
                ++i;
            } else {
                out.append(bytes.data() + i, len);
                i += len;
            }
            continue;
        }

        switch (b) {
        case '\\':
            out += "\\\\";
            break;
        case '\t':
            out += (style == EncodeStyle::Pretty) ? "\t" : "\\t";
            break;
        case '\n':
            out += (style == EncodeStyle::Pretty) ? "\n" : "\\n";
            break;
        case '\r':
            out += (style == EncodeStyle::Pretty) ? "\r" : "\\r";
            break;
        default:
            if (b >= 0x20 && b < 0x7F) {
                out += static_cast<char>(b);
            } else {
                append_hex_escape(out, b);
            }
            break;
        }
        ++i;
    }

    return out;
}

// ── decode ────────────────────────────────────────────────────────────────────

std::variant<std::string, DecodeError> decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (c != '\\') {
            out += c;
            ++i;
            continue;
        }

        const std::size_t escape_pos = i;
        if (i + 1 >= text.size()) {
            return DecodeError{escape_pos, "trailing backslash"};
        }

        const char kind = text[i + 1];
        switch (kind) {
        case '\\': out += '\\'; i += 2; break;
        case 't':  out += '\t'; i += 2; break;
        case 'n':  out += '\n'; i += 2; break;
        case 'r':  out += '\r'; i += 2; break;
        case '0':  out += '\0'; i += 2; break;
        case 'x': {
            if (i + 4 > text.size()) {
                return DecodeError{escape_pos,
                    "truncated \\x escape (expected two hex digits)"};
            }
            const int hi = hex_value(text[i + 2]);
            const int lo = hex_value(text[i + 3]);
            if (hi < 0 || lo < 0) {
                return DecodeError{escape_pos,
                    std::format("invalid hex digits in escape '\\x{}{}'",
                                text[i + 2], text[i + 3])};
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 4;
            break;
        }
        default:
            return DecodeError{escape_pos,
                std::format("unknown escape '\\{}'", kind)};
        }
    }

    return out;
}

} // namespace kvedit::codec
