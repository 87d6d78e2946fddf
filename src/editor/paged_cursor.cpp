#include "editor/paged_cursor.hpp"

#include <algorithm>
#include <utility>

namespace kvedit::editor {

PagedCursor::PagedCursor(storage::Collection collection)
    : collection_(std::move(collection))
{
}

uint64_t PagedCursor::total_rows(const storage::ReadTransaction& txn) const {
    return txn.count(collection_);
}

std::vector<Row> PagedCursor::fetch(const storage::ReadTransaction& txn,
                                    uint64_t start_row, uint64_t row_count) {
    std::vector<Row> rows;
    if (row_count == 0) {
        return rows;
    }

    try {
        const uint64_t total = txn.count(collection_);
        if (start_row >= total) {
            return rows;
        }

        if (can_continue(txn, start_row, total)) {
            handle_->next();
        } else {
            seek(txn, start_row);
        }
        txn_serial_     = txn.serial();
        txn_generation_ = txn.generation();
        total_          = total;

        const uint64_t wanted = std::min(row_count, total - start_row);
        rows.reserve(static_cast<std::size_t>(wanted));

        for (uint64_t i = 0; i < wanted; ++i) {
            if (i > 0) {
                handle_->next();
            }
            if (!handle_->valid()) {
                // Fewer entries than the count promised; start over next time.
                reset();
                break;
            }
            rows.push_back(Row{std::string(handle_->key()), std::string(handle_->value())});
            last_row_ = start_row + i;
        }
    } catch (...) {
        reset();
        throw;
    }

    return rows;
}

void PagedCursor::reset() noexcept {
    handle_.reset();
    last_row_.reset();
    txn_serial_ = 0;
    txn_generation_ = 0;
    total_ = 0;
}

bool PagedCursor::can_continue(const storage::ReadTransaction& txn,
                               uint64_t start_row, uint64_t total) const noexcept {
    return handle_ != nullptr
        && last_row_.has_value()
        && txn.serial() == txn_serial_
        && txn.generation() == txn_generation_
        && total == total_
        && start_row == *last_row_ + 1;
}

void PagedCursor::seek(const storage::ReadTransaction& txn, uint64_t start_row) {
    reset();
    handle_ = txn.open_cursor(collection_);
    handle_->seek_to_first();
    for (uint64_t i = 0; i < start_row && handle_->valid(); ++i) {
        handle_->next();
    }
    ++seeks_;
    skipped_ += start_row;
}

} // namespace kvedit::editor
