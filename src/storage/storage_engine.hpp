#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace kvedit::storage {

// ── StoreError ────────────────────────────────────────────────────────────────
//
// Thrown by storage backends when the underlying engine reports a failure
// (I/O error, corruption, collection limit reached, use of a finished
// transaction).  Missing keys and missing collections are not errors.

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── Collection ────────────────────────────────────────────────────────────────
//
// Cheap, copyable handle to one ordered byte-string -> byte-string mapping
// inside an Environment.  Valid for the Environment's lifetime and not tied
// to any single transaction.  `name == std::nullopt` is the main collection.

struct Collection {
    uint32_t id = 0;
    std::optional<std::string> name;

    [[nodiscard]] bool is_main() const noexcept { return !name.has_value(); }

    friend bool operator==(const Collection&, const Collection&) = default;
};

// ── Cursor ────────────────────────────────────────────────────────────────────
//
// Forward iterator over one collection, in bytewise key order, as seen by the
// transaction that opened it.  A cursor keeps the resources it iterates alive,
// so it may be destroyed after its transaction has ended, but it must not be
// advanced or read once that transaction has committed or aborted.

class Cursor {
public:
    virtual ~Cursor() = default;

    // Position on the first entry (or become invalid if the collection is empty).
    virtual void seek_to_first() = 0;

    // Advance one entry.  Precondition: valid().
    virtual void next() = 0;

    [[nodiscard]] virtual bool valid() const = 0;

    // Raw bytes of the current entry.  Precondition: valid().
    // The views stay valid until the next call to seek_to_first()/next().
    [[nodiscard]] virtual std::string_view key() const = 0;
    [[nodiscard]] virtual std::string_view value() const = 0;
};

// ── ReadTransaction ───────────────────────────────────────────────────────────
//
// A consistent snapshot of the Environment as of creation.  Any number of
// read transactions may coexist.  Read transactions are never committed; they
// are released by destroying them.

class ReadTransaction {
public:
    virtual ~ReadTransaction() = default;

    // Identity of this transaction object, unique within its Environment.
    [[nodiscard]] virtual uint64_t serial() const noexcept = 0;

    // Number of mutations performed through this transaction (always 0 for
    // a read-only snapshot).
    [[nodiscard]] virtual uint64_t generation() const noexcept = 0;

    [[nodiscard]] virtual bool writable() const noexcept = 0;

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] virtual std::optional<std::string>
    get(const Collection& collection, std::string_view key) const = 0;

    // Number of entries visible in `collection`.
    [[nodiscard]] virtual uint64_t count(const Collection& collection) const = 0;

    // Open a new, unpositioned cursor over `collection`.
    [[nodiscard]] virtual std::unique_ptr<Cursor>
    open_cursor(const Collection& collection) const = 0;
};

// ── WriteTransaction ──────────────────────────────────────────────────────────
//
// The single exclusive writer of an Environment.  Sees its own uncommitted
// writes.  Exactly one of commit() / abort() ends it; destroying an unfinished
// write transaction aborts it.

class WriteTransaction : public ReadTransaction {
public:
    // Inserts or overwrites `key` with `value`.
    virtual void put(const Collection& collection,
                     std::string_view key, std::string_view value) = 0;

    // Removes `key`.  Returns true if the key existed, false otherwise.
    virtual bool del(const Collection& collection, std::string_view key) = 0;

    // Durably apply all writes.  Throws StoreError on failure, in which case
    // the writes are discarded.  The transaction is finished either way.
    virtual void commit() = 0;

    // Discard all writes.
    virtual void abort() noexcept = 0;

    [[nodiscard]] virtual bool finished() const noexcept = 0;
};

// ── Environment ───────────────────────────────────────────────────────────────
//
// The store root owning every collection.  Enforces "many readers, at most
// one writer": try_begin_write() returns nullptr while another write
// transaction is live.
//
// The concrete backend (in-memory, RocksDB) is selected at startup and passed
// by reference to every component.

class Environment {
public:
    virtual ~Environment() = default;

    [[nodiscard]] virtual std::unique_ptr<ReadTransaction> begin_read() = 0;

    // Returns nullptr if a write transaction is already live.
    [[nodiscard]] virtual std::unique_ptr<WriteTransaction> try_begin_write() = 0;

    // Look up an existing collection.  std::nullopt if it does not exist.
    [[nodiscard]] virtual std::optional<Collection>
    open_collection(const ReadTransaction& txn,
                    const std::optional<std::string>& name) = 0;

    // Open `name`, creating it inside `txn` if absent.
    // Throws StoreError when the collection limit would be exceeded.
    [[nodiscard]] virtual Collection
    create_collection(WriteTransaction& txn,
                      const std::optional<std::string>& name) = 0;

    // Names of all named collections visible to `txn`, in bytewise order.
    [[nodiscard]] virtual std::vector<std::string>
    collection_names(const ReadTransaction& txn) const = 0;

    [[nodiscard]] virtual uint32_t max_collections() const noexcept = 0;
};

} // namespace kvedit::storage
