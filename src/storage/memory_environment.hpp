#pragma once

#include "storage/storage_engine.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kvedit::storage {

// ── MemoryEnvironment ─────────────────────────────────────────────────────────
//
// In-memory Environment with the same transactional contract as the RocksDB
// backend.  Used by tests and by `--engine memory`.
//
// Multi-version, copy-on-write:
//   - the committed state is an immutable State published behind a mutex
//   - a read transaction pins the State that was current when it began
//   - the write transaction works on a private copy, copying a table only the
//     first time it mutates it, and publishes the copy on commit
//
// Collection creation is transactional: a collection created by an aborted
// write transaction does not exist afterwards.
//
// The environment must outlive every transaction it hands out.

class MemoryEnvironment final : public Environment {
public:
    using Table = std::map<std::string, std::string, std::less<>>;

    struct State {
        bool main_exists = false;
        std::map<std::string, uint32_t, std::less<>> names;
        std::unordered_map<uint32_t, std::shared_ptr<const Table>> tables;
    };

    explicit MemoryEnvironment(uint32_t max_collections = 1000);

    MemoryEnvironment(const MemoryEnvironment&)            = delete;
    MemoryEnvironment& operator=(const MemoryEnvironment&) = delete;

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

    // Make the next commit() fail with StoreError, as a disk-full or I/O
    // error would.  Lets callers exercise their failure paths.
    void fail_next_commit();

    // True while a write transaction is live.
    [[nodiscard]] bool writer_active() const;

private:
    friend class MemoryWriteTransaction;

    // Publish `state` as the committed state and free the writer slot.
    // Throws StoreError (and frees the slot) if a failure was injected.
    void publish(std::shared_ptr<const State> state);

    // Free the writer slot without publishing anything.
    void release_writer() noexcept;

    [[nodiscard]] uint32_t allocate_collection_id();

    [[nodiscard]] uint64_t next_serial() noexcept { return ++serial_; }

    mutable std::mutex mutex_;
    std::shared_ptr<const State> committed_;
    bool writer_active_ = false;
    bool fail_next_commit_ = false;
    uint32_t next_collection_id_ = 1;
    const uint32_t max_collections_;
    std::atomic<uint64_t> serial_{0};
};

} // namespace kvedit::storage
