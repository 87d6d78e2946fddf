#pragma once

#include "storage/storage_engine.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace rocksdb {
class ColumnFamilyHandle;
class TransactionDB;
} // namespace rocksdb

namespace kvedit::storage {

// ── RocksDBEnvironment ────────────────────────────────────────────────────────
//
// Persistent Environment backed by a RocksDB TransactionDB.
//
//   - the main collection is the "default" column family; a named collection
//     `n` is the column family "c.<n>"
//   - a read transaction is a RocksDB snapshot
//   - the write transaction is a pessimistic rocksdb::Transaction with its own
//     snapshot, committed with sync=true
//   - the single-writer rule is enforced here with a writer slot, so a second
//     writer is refused immediately instead of blocking on RocksDB locks
//   - the "kvedit.meta" column family holds a registration key per named
//     collection and a row count per collection, both written through the
//     write transaction, so they follow its snapshot, commit and rollback
//
// A named collection exists for a transaction when its registration key is
// visible to it.  The column family itself is created eagerly; it is dropped
// again when the creating transaction aborts, and unregistered families left
// by an interrupted process are dropped on open.
//
// The environment must outlive every transaction it hands out.

class RocksDBEnvironment final : public Environment {
public:
    // Opens (or creates) a database at `db_path`, opening every existing
    // column family.  Throws StoreError if the database cannot be opened.
    explicit RocksDBEnvironment(const std::filesystem::path& db_path,
                                uint32_t max_collections = 1000);

    ~RocksDBEnvironment() override;

    // Not copyable or movable – RocksDB owns internal state.
    RocksDBEnvironment(const RocksDBEnvironment&)            = delete;
    RocksDBEnvironment& operator=(const RocksDBEnvironment&) = delete;
    RocksDBEnvironment(RocksDBEnvironment&&)                 = delete;
    RocksDBEnvironment& operator=(RocksDBEnvironment&&)      = delete;

    [[nodiscard]] std::unique_ptr<ReadTransaction> begin_read() override;
    [[nodiscard]] std::unique_ptr<WriteTransaction> try_begin_write() override;

    [[nodiscard]] std::optional<Collection>
    open_collection(const ReadTransaction& txn,
                    const std::optional<std::string>& name) override;

    [[nodiscard]] Collection
    create_collection(WriteTransaction& txn,
                      const std::optional<std::string>& name) override;

    [[nodiscard]] std::vector<std::string>
    collection_names(const ReadTransaction& txn) const override;

    [[nodiscard]] uint32_t max_collections() const noexcept override {
        return max_collections_;
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Column family backing `collection`.  Throws StoreError if unknown.
    [[nodiscard]] rocksdb::ColumnFamilyHandle* handle(const Collection& collection) const;

    // Column family holding collection registrations and row counts.
    [[nodiscard]] rocksdb::ColumnFamilyHandle* meta_handle() const noexcept { return meta_family_; }

    [[nodiscard]] rocksdb::TransactionDB& db() const noexcept { return *db_; }

    [[nodiscard]] uint64_t next_serial() noexcept { return ++serial_; }

    // Frees the writer slot taken by try_begin_write().
    void release_writer() noexcept;

    // Drops the column family of a collection whose creating transaction
    // did not commit.
    void discard_collection(const std::string& name) noexcept;

private:
    // Writes the row count of a column family that has none stored yet.
    void ensure_count(const std::string& family_name, rocksdb::ColumnFamilyHandle* handle);

    struct Family {
        uint32_t id;
        rocksdb::ColumnFamilyHandle* handle;
    };

    std::filesystem::path path_;
    const uint32_t max_collections_;

    std::unique_ptr<rocksdb::TransactionDB> db_;

    mutable std::mutex mutex_;
    rocksdb::ColumnFamilyHandle* default_family_ = nullptr;
    rocksdb::ColumnFamilyHandle* meta_family_ = nullptr;
    std::map<std::string, Family, std::less<>> families_;     // by collection name
    std::map<uint32_t, rocksdb::ColumnFamilyHandle*> by_id_;   // named collections only
    uint32_t next_collection_id_ = 1;
    bool writer_active_ = false;

    std::atomic<uint64_t> serial_{0};
};

} // namespace kvedit::storage
