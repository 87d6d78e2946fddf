#pragma once

#include "codec/escape_codec.hpp"
#include "editor/transaction_session.hpp"
#include "storage/storage_engine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include <spdlog/spdlog.h>

namespace kvedit::editor {

// ── EntryEditBuffer ───────────────────────────────────────────────────────────
//
// One pending key/value pair in escaped text form, composed by the user and
// applied to a collection through the session's write transaction.
//
// commit_insert() / commit_delete():
//   1. decode the text (Errc::decode_failed, nothing touched)
//   2. require a write transaction (Errc::no_write_transaction)
//   3. put / delete in the collection (Errc::store_io on failure)
//   4. clear the buffer
// The buffer is left intact whenever a step fails so it can be corrected.

class EntryEditBuffer {
public:
    explicit EntryEditBuffer(std::shared_ptr<spdlog::logger> logger = {});

    // Overwrite both fields, e.g. with an existing row selected for editing.
    void stage_for_edit(std::string key_text, std::string value_text);

    void set_key_text(std::string key_text) { key_text_ = std::move(key_text); }
    void set_value_text(std::string value_text) { value_text_ = std::move(value_text); }

    [[nodiscard]] const std::string& key_text() const noexcept { return key_text_; }
    [[nodiscard]] const std::string& value_text() const noexcept { return value_text_; }

    [[nodiscard]] bool empty() const noexcept { return key_text_.empty() && value_text_.empty(); }

    void clear() noexcept;

    [[nodiscard]] std::variant<std::string, codec::DecodeError> decoded_key() const;
    [[nodiscard]] std::variant<std::string, codec::DecodeError> decoded_value() const;

    // Put the decoded key/value into `collection`.
    [[nodiscard]] std::error_code commit_insert(TransactionSession& session,
                                                const storage::Collection& collection);

    // Delete the decoded key from `collection`.  A missing key is not an error.
    [[nodiscard]] std::error_code commit_delete(TransactionSession& session,
                                                const storage::Collection& collection);

    // The decode error behind the most recent Errc::decode_failed, if any.
    [[nodiscard]] const std::optional<codec::DecodeError>& last_decode_error() const noexcept {
        return last_decode_error_;
    }

private:
    // Decode one field; on failure records the error and returns nullopt.
    [[nodiscard]] std::optional<std::string> decode_field(const std::string& text,
                                                          std::string_view field);

    std::string key_text_;
    std::string value_text_;
    std::optional<codec::DecodeError> last_decode_error_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace kvedit::editor
