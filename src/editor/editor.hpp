#pragma once

#include "codec/escape_codec.hpp"
#include "editor/collection_registry.hpp"
#include "editor/entry_edit_buffer.hpp"
#include "editor/errors.hpp"
#include "editor/paged_cursor.hpp"
#include "editor/transaction_session.hpp"
#include "storage/storage_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace kvedit::editor {

struct EditorOptions {
    codec::EncodeStyle style = codec::EncodeStyle::Strict; // how rows are rendered
    uint64_t page_size = 30;                               // rows per next_page()
};

// One row as shown to the user: escaped key and value.
struct RenderedRow {
    uint64_t index = 0;
    std::string key;
    std::string value;
};

// Everything a front end needs to draw the focused collection.
struct View {
    std::string collection;
    uint64_t first_row = 0;
    std::vector<RenderedRow> rows;
    uint64_t total_row_count = 0;
    TxnMode mode = TxnMode::Reading;
    std::optional<ErrorKind> last_error;
};

// An open collection: its own cursor window and pending entry.
struct Pane {
    storage::Collection collection;
    PagedCursor cursor;
    EntryEditBuffer buffer;
    uint64_t next_row = 0; // first row after the last page shown

    [[nodiscard]] std::string title() const {
        return CollectionRegistry::display_name(collection);
    }
};

// ── Editor ────────────────────────────────────────────────────────────────────
//
// Core of the browser/editor: receives the presentation layer's intents and
// answers with rendering data.
//
// Owns one TransactionSession and an ordered list of panes, one per open
// collection.  Pane 0 is the main collection; it is opened at construction
// and cannot be closed.  Every intent records its outcome in last_error()
// (cleared on success).
//
// NOT thread-safe.

class Editor {
public:
    // Ensures the main collection exists.  Throws storage::StoreError if the
    // environment cannot be used.
    explicit Editor(storage::Environment& env,
                    EditorOptions options = {},
                    std::shared_ptr<spdlog::logger> logger = {});

    Editor(const Editor&)            = delete;
    Editor& operator=(const Editor&) = delete;

    // ── Collections / panes ──────────────────────────────────────────────────

    // Focus the pane showing `name` ("" = main), opening a pane for it if the
    // collection exists.  Returns the pane index, or std::nullopt when there
    // is no such collection.
    std::optional<std::size_t> select_collection(const std::string& name);

    // Create `name` inside the write transaction and focus a pane for it.
    std::error_code create_collection(const std::string& name);

    // Names of all named collections under the current transaction.
    [[nodiscard]] std::vector<std::string> collection_names();

    std::error_code focus(std::size_t index);
    std::error_code close_pane(std::size_t index);

    [[nodiscard]] std::size_t pane_count() const noexcept { return panes_.size(); }
    [[nodiscard]] std::size_t focused_index() const noexcept { return focused_; }
    [[nodiscard]] const Pane& focused_pane() const noexcept { return panes_[focused_]; }
    [[nodiscard]] std::vector<std::string> pane_titles() const;

    // ── Session ──────────────────────────────────────────────────────────────

    std::error_code begin_write();
    std::error_code commit();
    std::error_code abort();

    [[nodiscard]] TxnMode mode() const noexcept { return session_.mode(); }

    // ── Pending entry (focused pane) ─────────────────────────────────────────

    void stage_edit(std::string key_text, std::string value_text);
    void set_key_text(std::string key_text);
    void set_value_text(std::string value_text);

    // Copy row `row_index` of the focused collection into the buffer.
    std::error_code stage_row(uint64_t row_index);

    std::error_code insert();
    std::error_code remove();

    [[nodiscard]] const EntryEditBuffer& buffer() const noexcept { return focused_pane().buffer; }

    // ── Rows ─────────────────────────────────────────────────────────────────

    // Up to `count` rows of the focused collection starting at `start`.
    View request_rows(uint64_t start, uint64_t count);

    // The page following the last one requested.
    View next_page();

    // Status only, no rows.
    View status();

    [[nodiscard]] std::optional<ErrorKind> last_error() const noexcept { return last_error_; }
    [[nodiscard]] const std::error_code& last_error_code() const noexcept { return last_ec_; }

    [[nodiscard]] const TransactionSession& session() const noexcept { return session_; }
    [[nodiscard]] const EditorOptions& options() const noexcept { return options_; }

private:
    // Record the outcome of an intent and pass it through.
    std::error_code record(std::error_code ec);

    Pane& focused() noexcept { return panes_[focused_]; }

    std::size_t add_pane(const storage::Collection& collection);

    // Drop every pane's iterator; they belong to the transaction just replaced.
    void reset_cursors() noexcept;

    // After a commit/abort, close panes whose collection no longer exists.
    void prune_panes();

    View make_view(uint64_t first_row);

    storage::Environment& env_;
    EditorOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    CollectionRegistry registry_;
    storage::Collection main_;     // created before the session takes its first snapshot
    TransactionSession session_;
    std::vector<Pane> panes_;
    std::size_t focused_ = 0;

    std::optional<ErrorKind> last_error_;
    std::error_code last_ec_;
};

} // namespace kvedit::editor
