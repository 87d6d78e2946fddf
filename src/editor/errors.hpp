#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace kvedit {

// ── Error codes ───────────────────────────────────────────────────────────────
//
// Every editor operation reports failure as a std::error_code in the
// "kv_editor" category.  Success is the default-constructed (zero) code.
//
// Opening a missing collection and deleting a missing key are NOT errors.

enum class Errc : int {
    decode_failed        = 1, // malformed escape text in the edit buffer
    no_write_transaction = 2, // mutation / commit / abort while Reading
    writer_busy          = 3, // another write transaction is live
    store_io             = 4, // storage backend failure
    out_of_range         = 5, // no such pane or row
};

// Coarse classification reported to the presentation layer.
enum class ErrorKind : uint8_t {
    Decode       = 0,
    InvalidState = 1,
    StoreIO      = 2,
};

[[nodiscard]] const std::error_category& editor_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

// Maps an editor error code to its kind.  Codes from other categories are
// treated as StoreIO.
[[nodiscard]] ErrorKind error_kind(const std::error_code& ec) noexcept;

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

} // namespace kvedit

template <>
struct std::is_error_code_enum<kvedit::Errc> : std::true_type {};
