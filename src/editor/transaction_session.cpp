#include "editor/transaction_session.hpp"

#include <utility>

namespace kvedit::editor {

std::string_view to_string(TxnMode mode) noexcept {
    return mode == TxnMode::Writing ? "writing" : "reading";
}

TransactionSession::TransactionSession(storage::Environment& env,
                                       std::shared_ptr<spdlog::logger> logger)
    : env_(env)
    , logger_(std::move(logger))
    , active_(env.begin_read())
{
}

TransactionSession::~TransactionSession() {
    if (auto* w = writer(); w != nullptr && !w->finished()) {
        if (logger_) {
            logger_->warn("[session] Discarding uncommitted write transaction {}", w->serial());
        }
        w->abort();
    }
}

// ── Transitions ───────────────────────────────────────────────────────────────

std::error_code TransactionSession::begin_write() {
    if (is_writing()) {
        if (logger_) {
            logger_->debug("[session] begin_write ignored: already writing");
        }
        return {};
    }

    std::unique_ptr<storage::WriteTransaction> wtxn;
    try {
        wtxn = env_.try_begin_write();
    } catch (const storage::StoreError& e) {
        if (logger_) {
            logger_->error("[session] Failed to begin write transaction: {}", e.what());
        }
        return Errc::store_io;
    }

    if (!wtxn) {
        if (logger_) {
            logger_->info("[session] begin_write refused: environment has a live writer");
        }
        return Errc::writer_busy;
    }

    // The read snapshot is simply released, never committed.
    active_ = std::move(wtxn);
    if (logger_) {
        logger_->debug("[session] Writing (txn {})", reader().serial());
    }
    return {};
}

std::error_code TransactionSession::commit() {
    auto* w = writer();
    if (w == nullptr) {
        if (logger_) {
            logger_->debug("[session] commit rejected: reading");
        }
        return Errc::no_write_transaction;
    }

    std::error_code ec;
    const uint64_t serial = w->serial();
    try {
        w->commit();
        if (logger_) {
            logger_->info("[session] Committed txn {} ({} writes)", serial, w->generation());
        }
    } catch (const storage::StoreError& e) {
        if (logger_) {
            logger_->error("[session] Commit of txn {} failed: {}", serial, e.what());
        }
        w->abort();
        ec = Errc::store_io;
    }

    return_to_reading();
    return ec;
}

std::error_code TransactionSession::abort() {
    auto* w = writer();
    if (w == nullptr) {
        if (logger_) {
            logger_->debug("[session] abort rejected: reading");
        }
        return Errc::no_write_transaction;
    }

    const uint64_t serial = w->serial();
    w->abort();
    if (logger_) {
        logger_->info("[session] Aborted txn {}", serial);
    }

    return_to_reading();
    return {};
}

void TransactionSession::return_to_reading() {
    active_ = env_.begin_read();
    if (logger_) {
        logger_->debug("[session] Reading (txn {})", reader().serial());
    }
}

// ── Mutations ─────────────────────────────────────────────────────────────────

std::error_code TransactionSession::put(const storage::Collection& collection,
                                        std::string_view key, std::string_view value) {
    auto* w = writer();
    if (w == nullptr) {
        if (logger_) {
            logger_->warn("[session] put rejected: no write transaction");
        }
        return Errc::no_write_transaction;
    }
    try {
        w->put(collection, key, value);
    } catch (const storage::StoreError& e) {
        if (logger_) {
            logger_->error("[session] put failed: {}", e.what());
        }
        return Errc::store_io;
    }
    return {};
}

std::error_code TransactionSession::del(const storage::Collection& collection,
                                        std::string_view key) {
    auto* w = writer();
    if (w == nullptr) {
        if (logger_) {
            logger_->warn("[session] delete rejected: no write transaction");
        }
        return Errc::no_write_transaction;
    }
    try {
        const bool existed = w->del(collection, key);
        if (!existed && logger_) {
            logger_->debug("[session] delete of missing key ignored");
        }
    } catch (const storage::StoreError& e) {
        if (logger_) {
            logger_->error("[session] delete failed: {}", e.what());
        }
        return Errc::store_io;
    }
    return {};
}

// ── Accessors ─────────────────────────────────────────────────────────────────

TxnMode TransactionSession::mode() const noexcept {
    return std::holds_alternative<Writing>(active_) ? TxnMode::Writing : TxnMode::Reading;
}

const storage::ReadTransaction& TransactionSession::reader() const noexcept {
    return std::visit(
        [](const auto& txn) -> const storage::ReadTransaction& { return *txn; },
        active_);
}

storage::WriteTransaction* TransactionSession::writer() noexcept {
    if (auto* w = std::get_if<Writing>(&active_)) {
        return w->get();
    }
    return nullptr;
}

} // namespace kvedit::editor
