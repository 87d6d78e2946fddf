#include "editor/editor.hpp"

#include <algorithm>
#include <utility>

namespace kvedit::editor {

Editor::Editor(storage::Environment& env,
               EditorOptions options,
               std::shared_ptr<spdlog::logger> logger)
    : env_(env)
    , options_(options)
    , logger_(std::move(logger))
    , registry_(env, logger_)
    , main_(registry_.ensure_main())
    , session_(env, logger_)
{
    add_pane(main_);
}

// ── Collections / panes ───────────────────────────────────────────────────────

std::optional<std::size_t> Editor::select_collection(const std::string& name) {
    const auto wanted = CollectionRegistry::from_input(name);

    for (std::size_t i = 0; i < panes_.size(); ++i) {
        if (panes_[i].collection.name == wanted) {
            focused_ = i;
            record({});
            return i;
        }
    }

    std::optional<storage::Collection> collection;
    try {
        collection = registry_.open(session_.reader(), wanted);
    } catch (const storage::StoreError& e) {
        if (logger_) {
            logger_->error("[editor] Cannot open collection '{}': {}", name, e.what());
        }
        record(Errc::store_io);
        return std::nullopt;
    }

    // A missing collection is a normal outcome: nothing to show.
    record({});
    if (!collection) {
        return std::nullopt;
    }
    focused_ = add_pane(*collection);
    return focused_;
}

std::error_code Editor::create_collection(const std::string& name) {
    auto* writer = session_.writer();
    if (writer == nullptr) {
        return record(Errc::no_write_transaction);
    }

    storage::Collection collection;
    try {
        collection = registry_.open_or_create(*writer, CollectionRegistry::from_input(name));
    } catch (const storage::StoreError& e) {
        if (logger_) {
            logger_->error("[editor] Cannot create collection '{}': {}", name, e.what());
        }
        return record(Errc::store_io);
    }

    auto it = std::find_if(panes_.begin(), panes_.end(),
        [&](const Pane& p) { return p.collection == collection; });
    focused_ = (it != panes_.end())
        ? static_cast<std::size_t>(it - panes_.begin())
        : add_pane(collection);
    return record({});
}

std::vector<std::string> Editor::collection_names() {
    try {
        auto names = registry_.list(session_.reader());
        record({});
        return names;
    } catch (const storage::StoreError& e) {
        if (logger_) {
            logger_->error("[editor] Cannot list collections: {}", e.what());
        }
        record(Errc::store_io);
        return {};
    }
}

std::error_code Editor::focus(std::size_t index) {
    if (index >= panes_.size()) {
        return record(Errc::out_of_range);
    }
    focused_ = index;
    return record({});
}

std::error_code Editor::close_pane(std::size_t index) {
    if (index == 0 || index >= panes_.size()) {
        return record(Errc::out_of_range);
    }
    panes_.erase(panes_.begin() + static_cast<std::ptrdiff_t>(index));
    if (focused_ >= index && focused_ > 0) {
        --focused_;
    }
    return record({});
}

std::vector<std::string> Editor::pane_titles() const {
    std::vector<std::string> titles;
    titles.reserve(panes_.size());
    for (const auto& pane : panes_) {
        titles.push_back(pane.title());
    }
    return titles;
}

std::size_t Editor::add_pane(const storage::Collection& collection) {
    panes_.push_back(Pane{collection, PagedCursor{collection}, EntryEditBuffer{logger_}, 0});
    if (logger_) {
        logger_->debug("[editor] Opened pane {} for '{}'", panes_.size() - 1, panes_.back().title());
    }
    return panes_.size() - 1;
}

void Editor::prune_panes() {
    const auto& reader = session_.reader();
    for (std::size_t i = panes_.size(); i-- > 1;) {
        std::optional<storage::Collection> still_there;
        try {
            still_there = registry_.open(reader, panes_[i].collection.name);
        } catch (const storage::StoreError& e) {
            if (logger_) {
                logger_->warn("[editor] Cannot re-check collection '{}': {}",
                              panes_[i].title(), e.what());
            }
            continue;
        }
        if (!still_there || still_there->id != panes_[i].collection.id) {
            if (logger_) {
                logger_->info("[editor] Closing pane '{}': collection no longer exists",
                              panes_[i].title());
            }
            panes_.erase(panes_.begin() + static_cast<std::ptrdiff_t>(i));
            if (focused_ >= i && focused_ > 0) {
                --focused_;
            }
        }
    }
}

// ── Session ───────────────────────────────────────────────────────────────────

std::error_code Editor::begin_write() {
    auto ec = session_.begin_write();
    reset_cursors();
    return record(ec);
}

std::error_code Editor::commit() {
    auto ec = session_.commit();
    reset_cursors();
    prune_panes();
    return record(ec);
}

std::error_code Editor::abort() {
    auto ec = session_.abort();
    reset_cursors();
    prune_panes();
    return record(ec);
}

void Editor::reset_cursors() noexcept {
    for (auto& pane : panes_) {
        pane.cursor.reset();
    }
}

// ── Pending entry ─────────────────────────────────────────────────────────────

void Editor::stage_edit(std::string key_text, std::string value_text) {
    focused().buffer.stage_for_edit(std::move(key_text), std::move(value_text));
    record({});
}

void Editor::set_key_text(std::string key_text) {
    focused().buffer.set_key_text(std::move(key_text));
    record({});
}

void Editor::set_value_text(std::string value_text) {
    focused().buffer.set_value_text(std::move(value_text));
    record({});
}

std::error_code Editor::stage_row(uint64_t row_index) {
    auto& pane = focused();
    std::vector<Row> rows;
    try {
        // A separate window keeps the pane's scroll position.
        PagedCursor lookup{pane.collection};
        rows = lookup.fetch(session_.reader(), row_index, 1);
    } catch (const storage::StoreError& e) {
        if (logger_) {
            logger_->error("[editor] Cannot read row {}: {}", row_index, e.what());
        }
        return record(Errc::store_io);
    }
    if (rows.empty()) {
        return record(Errc::out_of_range);
    }
    pane.buffer.stage_for_edit(codec::encode(rows.front().key, options_.style),
                               codec::encode(rows.front().value, options_.style));
    return record({});
}

std::error_code Editor::insert() {
    auto& pane = focused();
    return record(pane.buffer.commit_insert(session_, pane.collection));
}

std::error_code Editor::remove() {
    auto& pane = focused();
    return record(pane.buffer.commit_delete(session_, pane.collection));
}

// ── Rows ──────────────────────────────────────────────────────────────────────

View Editor::request_rows(uint64_t start, uint64_t count) {
    auto& pane = focused();
    std::vector<Row> rows;
    try {
        rows = pane.cursor.fetch(session_.reader(), start, count);
        record({});
    } catch (const storage::StoreError& e) {
        if (logger_) {
            logger_->error("[editor] Cannot read rows {}..{}: {}", start, start + count, e.what());
        }
        record(Errc::store_io);
    }

    pane.next_row = start + rows.size();

    View view = make_view(start);
    view.rows.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        view.rows.push_back(RenderedRow{
            start + i,
            codec::encode(rows[i].key, options_.style),
            codec::encode(rows[i].value, options_.style)});
    }
    return view;
}

View Editor::next_page() {
    return request_rows(focused().next_row, options_.page_size);
}

View Editor::status() {
    return make_view(focused().next_row);
}

View Editor::make_view(uint64_t first_row) {
    const auto& pane = focused();
    View view;
    view.collection = pane.title();
    view.first_row = first_row;
    view.mode = session_.mode();
    try {
        view.total_row_count = pane.cursor.total_rows(session_.reader());
    } catch (const storage::StoreError& e) {
        if (logger_) {
            logger_->error("[editor] Cannot count rows of '{}': {}", pane.title(), e.what());
        }
        record(Errc::store_io);
    }
    view.last_error = last_error_;
    return view;
}

std::error_code Editor::record(std::error_code ec) {
    last_ec_ = ec;
    if (ec) {
        last_error_ = error_kind(ec);
    } else {
        last_error_.reset();
    }
    return ec;
}

} // namespace kvedit::editor
