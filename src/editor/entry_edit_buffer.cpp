#include "editor/entry_edit_buffer.hpp"

#include <utility>

namespace kvedit::editor {

EntryEditBuffer::EntryEditBuffer(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
{
}

void EntryEditBuffer::stage_for_edit(std::string key_text, std::string value_text) {
    key_text_ = std::move(key_text);
    value_text_ = std::move(value_text);
    last_decode_error_.reset();
}

void EntryEditBuffer::clear() noexcept {
    key_text_.clear();
    value_text_.clear();
    last_decode_error_.reset();
}

std::variant<std::string, codec::DecodeError> EntryEditBuffer::decoded_key() const {
    return codec::decode(key_text_);
}

std::variant<std::string, codec::DecodeError> EntryEditBuffer::decoded_value() const {
    return codec::decode(value_text_);
}

std::optional<std::string> EntryEditBuffer::decode_field(const std::string& text,
                                                         std::string_view field) {
    auto result = codec::decode(text);
    if (auto* err = std::get_if<codec::DecodeError>(&result)) {
        if (logger_) {
            logger_->info("[edit] Cannot decode {} at offset {}: {}",
                          field, err->position, err->message);
        }
        last_decode_error_ = std::move(*err);
        return std::nullopt;
    }
    return std::get<std::string>(std::move(result));
}

std::error_code EntryEditBuffer::commit_insert(TransactionSession& session,
                                               const storage::Collection& collection) {
    last_decode_error_.reset();

    auto key = decode_field(key_text_, "key");
    if (!key) {
        return Errc::decode_failed;
    }
    auto value = decode_field(value_text_, "value");
    if (!value) {
        return Errc::decode_failed;
    }

    if (auto ec = session.put(collection, *key, *value)) {
        return ec;
    }

    clear();
    return {};
}

std::error_code EntryEditBuffer::commit_delete(TransactionSession& session,
                                               const storage::Collection& collection) {
    last_decode_error_.reset();

    auto key = decode_field(key_text_, "key");
    if (!key) {
        return Errc::decode_failed;
    }

    if (auto ec = session.del(collection, *key)) {
        return ec;
    }

    clear();
    return {};
}

} // namespace kvedit::editor
