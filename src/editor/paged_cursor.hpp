#pragma once

#include "storage/storage_engine.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kvedit::editor {

// One entry of a collection, raw bytes.
struct Row {
    std::string key;
    std::string value;

    friend bool operator==(const Row&, const Row&) = default;
};

// ── PagedCursor ───────────────────────────────────────────────────────────────
//
// Resumable, forward-only window over one collection.
//
// A scrolling table asks for rows in strictly increasing, contiguous order,
// often one row at a time.  The cursor keeps its store iterator between calls
// and, when a request starts exactly one past the last row it produced under
// the same transaction, simply advances it.  Any other request (a jump back or
// forward, a different transaction, a mutation through the transaction, or a
// changed row count) discards the iterator and re-seeks from the first entry,
// skipping `start_row` entries.
//
// The row count is re-read from the transaction on every call.
//
// NOT thread-safe.

class PagedCursor {
public:
    explicit PagedCursor(storage::Collection collection);

    // Up to `row_count` rows starting at zero-based `start_row`.
    // Empty (not an error) when start_row is past the end.
    [[nodiscard]] std::vector<Row> fetch(const storage::ReadTransaction& txn,
                                         uint64_t start_row, uint64_t row_count);

    // Number of rows visible in the collection under `txn`.
    [[nodiscard]] uint64_t total_rows(const storage::ReadTransaction& txn) const;

    // Forget the held iterator; the next fetch() re-seeks.
    void reset() noexcept;

    [[nodiscard]] const storage::Collection& collection() const noexcept { return collection_; }

    // Index of the last row produced by the held iterator, if any.
    [[nodiscard]] std::optional<uint64_t> last_row() const noexcept { return last_row_; }

    // How many times fetch() had to re-seek from the first entry.
    [[nodiscard]] uint64_t seek_count() const noexcept { return seeks_; }

    // Entries stepped over while re-seeking, summed over all calls.
    [[nodiscard]] uint64_t skipped_rows() const noexcept { return skipped_; }

private:
    [[nodiscard]] bool can_continue(const storage::ReadTransaction& txn,
                                    uint64_t start_row, uint64_t total) const noexcept;

    void seek(const storage::ReadTransaction& txn, uint64_t start_row);

    storage::Collection collection_;

    // Iterator state; meaningful only while handle_ is set.
    std::unique_ptr<storage::Cursor> handle_;
    uint64_t txn_serial_ = 0;
    uint64_t txn_generation_ = 0;
    uint64_t total_ = 0;
    std::optional<uint64_t> last_row_;

    uint64_t seeks_ = 0;
    uint64_t skipped_ = 0;
};

} // namespace kvedit::editor
