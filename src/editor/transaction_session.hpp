#pragma once

#include "editor/errors.hpp"
#include "storage/storage_engine.hpp"

#include <cstdint>
#include <memory>
#include <string_view>
#include <system_error>
#include <variant>

#include <spdlog/spdlog.h>

namespace kvedit::editor {

enum class TxnMode : uint8_t {
    Reading = 0,
    Writing = 1,
};

[[nodiscard]] std::string_view to_string(TxnMode mode) noexcept;

// ── TransactionSession ────────────────────────────────────────────────────────
//
// Holds exactly one active transaction: a read snapshot (Reading, the resting
// state) or the environment's exclusive write transaction (Writing).  There is
// no "no transaction" state.
//
//   Reading --begin_write()--> Writing
//   Writing --commit()/abort()--> Reading (with a fresh snapshot)
//
// begin_write() while Writing is ignored.  commit()/abort() while Reading and
// every mutation while Reading return Errc::no_write_transaction without
// touching the store.
//
// NOT thread-safe: a session is confined to the thread that drives it.

class TransactionSession {
public:
    explicit TransactionSession(storage::Environment& env,
                                std::shared_ptr<spdlog::logger> logger = {});

    // Aborts a pending write transaction.
    ~TransactionSession();

    TransactionSession(const TransactionSession&)            = delete;
    TransactionSession& operator=(const TransactionSession&) = delete;

    // Replace the read snapshot with the environment's write transaction.
    // Returns Errc::writer_busy (and stays Reading) if another writer is live.
    [[nodiscard]] std::error_code begin_write();

    // Durably apply the session's writes and return to Reading.
    // On storage failure returns Errc::store_io; the session is Reading
    // afterwards either way.
    [[nodiscard]] std::error_code commit();

    // Discard the session's writes and return to Reading.
    [[nodiscard]] std::error_code abort();

    // Inserts or overwrites `key` in `collection`.  Writing only.
    [[nodiscard]] std::error_code put(const storage::Collection& collection,
                                      std::string_view key, std::string_view value);

    // Removes `key` from `collection`; a missing key is not an error.
    // Writing only.
    [[nodiscard]] std::error_code del(const storage::Collection& collection,
                                      std::string_view key);

    [[nodiscard]] TxnMode mode() const noexcept;

    [[nodiscard]] bool is_writing() const noexcept { return mode() == TxnMode::Writing; }

    // The active transaction, whichever kind, as a read view.
    [[nodiscard]] const storage::ReadTransaction& reader() const noexcept;

    // The active write transaction, or nullptr while Reading.
    [[nodiscard]] storage::WriteTransaction* writer() noexcept;

    [[nodiscard]] storage::Environment& environment() noexcept { return env_; }

private:
    using Reading = std::unique_ptr<storage::ReadTransaction>;
    using Writing = std::unique_ptr<storage::WriteTransaction>;

    // Drops the finished write transaction and takes a fresh snapshot.
    void return_to_reading();

    storage::Environment& env_;
    std::shared_ptr<spdlog::logger> logger_;
    std::variant<Reading, Writing> active_;
};

} // namespace kvedit::editor
