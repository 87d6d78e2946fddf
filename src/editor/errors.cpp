#include "editor/errors.hpp"

#include <string>

namespace kvedit {

namespace {

class EditorCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "kv_editor"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
        case Errc::decode_failed:        return "malformed escape sequence";
        case Errc::no_write_transaction: return "no write transaction is active";
        case Errc::writer_busy:          return "another write transaction is active";
        case Errc::store_io:             return "storage failure";
        case Errc::out_of_range:         return "no such pane or row";
        }
        return "unknown editor error";
    }
};

} // anonymous namespace

const std::error_category& editor_category() noexcept {
    static const EditorCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), editor_category()};
}

ErrorKind error_kind(const std::error_code& ec) noexcept {
    if (ec.category() != editor_category()) {
        return ErrorKind::StoreIO;
    }
    switch (static_cast<Errc>(ec.value())) {
    case Errc::decode_failed:        return ErrorKind::Decode;
    case Errc::no_write_transaction: return ErrorKind::InvalidState;
    case Errc::writer_busy:          return ErrorKind::InvalidState;
    case Errc::store_io:             return ErrorKind::StoreIO;
    case Errc::out_of_range:         return ErrorKind::InvalidState;
    }
    return ErrorKind::StoreIO;
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Decode:       return "DecodeError";
    case ErrorKind::InvalidState: return "InvalidStateError";
    case ErrorKind::StoreIO:      return "StoreIOError";
    }
    return "UnknownError";
}

} // namespace kvedit
