#include "storage/rocksdb_environment.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <spdlog/spdlog.h>

#include <format>
#include <string_view>
#include <utility>
#include <vector>

namespace kvedit::storage {

namespace {

// Column-family name prefix for named collections; keeps user names clear of
// RocksDB's own "default".
constexpr std::string_view kFamilyPrefix = "c.";

constexpr std::string_view kMetaFamily = "kvedit.meta";

// Meta keys: "collection/<name>" -> "" and "count/<family name>" -> u64 LE.
constexpr std::string_view kCollectionKeyPrefix = "collection/";
constexpr std::string_view kCountKeyPrefix      = "count/";

[[noreturn]] void throw_status(std::string_view what, const rocksdb::Status& status) {
    throw StoreError(std::format("RocksDB {} failed: {}", what, status.ToString()));
}

rocksdb::Slice to_slice(std::string_view sv) {
    return rocksdb::Slice{sv.data(), sv.size()};
}

std::string family_name_of(const Collection& collection) {
    if (collection.is_main()) {
        return rocksdb::kDefaultColumnFamilyName;
    }
    return std::string(kFamilyPrefix) + *collection.name;
}

std::string collection_key(std::string_view name) {
    return std::string(kCollectionKeyPrefix) + std::string(name);
}

std::string count_key(std::string_view family_name) {
    return std::string(kCountKeyPrefix) + std::string(family_name);
}

std::string encode_count(uint64_t v) {
    std::string buf;
    buf.reserve(8);
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<char>((v >> (i * 8)) & 0xFF));
    }
    return buf;
}

uint64_t decode_count(std::string_view bytes) {
    if (bytes.size() != 8) {
        throw StoreError(std::format("corrupt row count ({} bytes)", bytes.size()));
    }
    uint64_t out = 0;
    for (int i = 0; i < 8; ++i) {
        out |= static_cast<uint64_t>(static_cast<uint8_t>(bytes[i])) << (i * 8);
    }
    return out;
}

uint64_t count_entries(rocksdb::Iterator& it) {
    uint64_t count = 0;
    for (it.SeekToFirst(); it.Valid(); it.Next()) {
        ++count;
    }
    if (!it.status().ok()) {
        throw_status("count", it.status());
    }
    return count;
}

// ── RocksDBCursor ─────────────────────────────────────────────────────────────
//
// `keepalive` pins the snapshot or transaction the iterator reads from; it is
// declared first so the iterator is destroyed before it.

class RocksDBCursor final : public Cursor {
public:
    RocksDBCursor(std::shared_ptr<const void> keepalive,
                  std::unique_ptr<rocksdb::Iterator> it)
        : keepalive_(std::move(keepalive)), it_(std::move(it)) {}

    void seek_to_first() override {
        it_->SeekToFirst();
        check();
    }

    void next() override {
        it_->Next();
        check();
    }

    [[nodiscard]] bool valid() const override { return it_->Valid(); }

    [[nodiscard]] std::string_view key() const override {
        const auto k = it_->key();
        return {k.data(), k.size()};
    }

    [[nodiscard]] std::string_view value() const override {
        const auto v = it_->value();
        return {v.data(), v.size()};
    }

private:
    // An iterator that stops early because of an error reports !Valid() with
    // a non-ok status; surface that instead of pretending the data ended.
    void check() const {
        if (!it_->Valid() && !it_->status().ok()) {
            throw_status("iteration", it_->status());
        }
    }

    std::shared_ptr<const void> keepalive_;
    std::unique_ptr<rocksdb::Iterator> it_;
};

// Gives the environment the meta column family as a transaction of either
// kind sees it.
class RocksDBMetaView {
public:
    virtual ~RocksDBMetaView() = default;
    [[nodiscard]] virtual std::optional<std::string> get_meta(std::string_view key) const = 0;
};

const RocksDBMetaView& meta_view_of(const ReadTransaction& txn) {
    const auto* view = dynamic_cast<const RocksDBMetaView*>(&txn);
    if (view == nullptr) {
        throw StoreError("transaction does not belong to a RocksDBEnvironment");
    }
    return *view;
}

uint64_t stored_count(const RocksDBMetaView& meta, const Collection& collection) {
    const auto family = family_name_of(collection);
    auto bytes = meta.get_meta(count_key(family));
    if (!bytes) {
        throw StoreError(std::format("no row count stored for column family '{}'", family));
    }
    return decode_count(*bytes);
}

// ── RocksDBReadTransaction ────────────────────────────────────────────────────

class RocksDBReadTransaction final : public ReadTransaction, public RocksDBMetaView {
public:
    RocksDBReadTransaction(RocksDBEnvironment& env, uint64_t serial)
        : env_(env), serial_(serial) {
        auto* db = &env.db();
        snapshot_ = std::shared_ptr<const rocksdb::Snapshot>(
            db->GetSnapshot(),
            [db](const rocksdb::Snapshot* s) { db->ReleaseSnapshot(s); });
    }

    [[nodiscard]] uint64_t serial() const noexcept override { return serial_; }
    [[nodiscard]] uint64_t generation() const noexcept override { return 0; }
    [[nodiscard]] bool writable() const noexcept override { return false; }

    [[nodiscard]] std::optional<std::string>
    get(const Collection& collection, std::string_view key) const override {
        return read(env_.handle(collection), key);
    }

    [[nodiscard]] uint64_t count(const Collection& collection) const override {
        return stored_count(*this, collection);
    }

    [[nodiscard]] std::unique_ptr<Cursor>
    open_cursor(const Collection& collection) const override {
        std::unique_ptr<rocksdb::Iterator> it(
            env_.db().NewIterator(read_options(), env_.handle(collection)));
        return std::make_unique<RocksDBCursor>(snapshot_, std::move(it));
    }

    [[nodiscard]] std::optional<std::string> get_meta(std::string_view key) const override {
        return read(env_.meta_handle(), key);
    }

private:
    [[nodiscard]] rocksdb::ReadOptions read_options() const {
        rocksdb::ReadOptions options;
        options.snapshot = snapshot_.get();
        return options;
    }

    [[nodiscard]] std::optional<std::string>
    read(rocksdb::ColumnFamilyHandle* family, std::string_view key) const {
        std::string value;
        auto status = env_.db().Get(read_options(), family, to_slice(key), &value);
        if (status.IsNotFound()) {
            return std::nullopt;
        }
        if (!status.ok()) {
            throw_status("Get", status);
        }
        return value;
    }

    RocksDBEnvironment& env_;
    std::shared_ptr<const rocksdb::Snapshot> snapshot_;
    uint64_t serial_;
};

// ── RocksDBWriteTransaction ───────────────────────────────────────────────────

class RocksDBWriteTransaction final : public WriteTransaction, public RocksDBMetaView {
public:
    RocksDBWriteTransaction(RocksDBEnvironment& env, uint64_t serial)
        : env_(env), serial_(serial) {
        rocksdb::WriteOptions write_options;
        write_options.sync = true;

        rocksdb::TransactionOptions txn_options;
        txn_options.set_snapshot = true;

        txn_.reset(env.db().BeginTransaction(write_options, txn_options));
        if (!txn_) {
            env.release_writer();
            throw StoreError("RocksDB BeginTransaction returned no transaction");
        }
    }

    ~RocksDBWriteTransaction() override {
        abort();
    }

    RocksDBWriteTransaction(const RocksDBWriteTransaction&)            = delete;
    RocksDBWriteTransaction& operator=(const RocksDBWriteTransaction&) = delete;

    [[nodiscard]] uint64_t serial() const noexcept override { return serial_; }
    [[nodiscard]] uint64_t generation() const noexcept override { return generation_; }
    [[nodiscard]] bool writable() const noexcept override { return true; }
    [[nodiscard]] bool finished() const noexcept override { return finished_; }

    [[nodiscard]] std::optional<std::string>
    get(const Collection& collection, std::string_view key) const override {
        ensure_open();
        return read(env_.handle(collection), key);
    }

    [[nodiscard]] uint64_t count(const Collection& collection) const override {
        ensure_open();
        return stored_count(*this, collection);
    }

    [[nodiscard]] std::unique_ptr<Cursor>
    open_cursor(const Collection& collection) const override {
        ensure_open();
        std::unique_ptr<rocksdb::Iterator> it(
            txn_->GetIterator(read_options(), env_.handle(collection)));
        return std::make_unique<RocksDBCursor>(txn_, std::move(it));
    }

    [[nodiscard]] std::optional<std::string> get_meta(std::string_view key) const override {
        ensure_open();
        return read(env_.meta_handle(), key);
    }

    void put(const Collection& collection,
             std::string_view key, std::string_view value) override {
        ensure_open();
        const bool existed = get(collection, key).has_value();
        auto status = txn_->Put(env_.handle(collection), to_slice(key), to_slice(value));
        if (!status.ok()) {
            throw_status("Put", status);
        }
        if (!existed) {
            adjust_count(collection, +1);
        }
        ++generation_;
    }

    bool del(const Collection& collection, std::string_view key) override {
        ensure_open();
        // RocksDB Delete succeeds even if the key is missing.
        if (!get(collection, key).has_value()) {
            return false;
        }
        auto status = txn_->Delete(env_.handle(collection), to_slice(key));
        if (!status.ok()) {
            throw_status("Delete", status);
        }
        adjust_count(collection, -1);
        ++generation_;
        return true;
    }

    void commit() override {
        ensure_open();
        finished_ = true;
        auto status = txn_->Commit();
        if (!status.ok()) {
            auto rollback = txn_->Rollback();
            if (!rollback.ok()) {
                spdlog::error("RocksDB Rollback after failed commit failed: {}",
                              rollback.ToString());
            }
            discard_created();
            env_.release_writer();
            throw_status("Commit", status);
        }
        created_.clear();
        env_.release_writer();
        spdlog::debug("RocksDB transaction {} committed ({} writes)", serial_, generation_);
    }

    void abort() noexcept override {
        if (finished_) {
            return;
        }
        finished_ = true;
        auto status = txn_->Rollback();
        if (!status.ok()) {
            spdlog::error("RocksDB Rollback failed: {}", status.ToString());
        }
        discard_created();
        env_.release_writer();
        spdlog::debug("RocksDB transaction {} aborted", serial_);
    }

    // Record `collection` as existing, with no rows, as of this transaction.
    void register_collection(const Collection& collection) {
        ensure_open();
        created_.push_back(*collection.name);
        write_meta(collection_key(*collection.name), "");
        write_meta(count_key(family_name_of(collection)), encode_count(0));
    }

private:
    void ensure_open() const {
        if (finished_) {
            throw StoreError("write transaction already committed or aborted");
        }
    }

    [[nodiscard]] rocksdb::ReadOptions read_options() const {
        rocksdb::ReadOptions options;
        options.snapshot = txn_->GetSnapshot();
        return options;
    }

    [[nodiscard]] std::optional<std::string>
    read(rocksdb::ColumnFamilyHandle* family, std::string_view key) const {
        std::string value;
        auto status = txn_->Get(read_options(), family, to_slice(key), &value);
        if (status.IsNotFound()) {
            return std::nullopt;
        }
        if (!status.ok()) {
            throw_status("Get", status);
        }
        return value;
    }

    void write_meta(std::string_view key, std::string_view value) {
        auto status = txn_->Put(env_.meta_handle(), to_slice(key), to_slice(value));
        if (!status.ok()) {
            throw_status("Put", status);
        }
    }

    void adjust_count(const Collection& collection, int delta) {
        const uint64_t current = stored_count(*this, collection);
        if (delta < 0 && current == 0) {
            throw StoreError(std::format("row count of '{}' would drop below zero",
                                         family_name_of(collection)));
        }
        write_meta(count_key(family_name_of(collection)),
                   encode_count(static_cast<uint64_t>(static_cast<int64_t>(current) + delta)));
    }

    void discard_created() noexcept {
        for (const auto& name : created_) {
            env_.discard_collection(name);
        }
        created_.clear();
    }

    RocksDBEnvironment& env_;
    std::shared_ptr<rocksdb::Transaction> txn_;
    uint64_t serial_;
    uint64_t generation_ = 0;
    bool finished_ = false;
    std::vector<std::string> created_;   // named collections created by this transaction
};

} // anonymous namespace

// ── RocksDBEnvironment ────────────────────────────────────────────────────────

RocksDBEnvironment::RocksDBEnvironment(const std::filesystem::path& db_path,
                                       uint32_t max_collections)
    : path_(db_path), max_collections_(max_collections) {
    rocksdb::Options options;
    options.create_if_missing = true;

    // Optimise for small-to-medium working sets typical of an edited store.
    options.IncreaseParallelism();
    options.OptimizeLevelStyleCompaction();

    // A fresh directory has no column-family list yet; open just "default".
    std::vector<std::string> family_names;
    auto list_status = rocksdb::DB::ListColumnFamilies(options, db_path.string(), &family_names);
    if (!list_status.ok() || family_names.empty()) {
        family_names = {rocksdb::kDefaultColumnFamilyName};
    }

    std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
    descriptors.reserve(family_names.size());
    for (const auto& name : family_names) {
        descriptors.emplace_back(name, rocksdb::ColumnFamilyOptions(options));
    }

    std::vector<rocksdb::ColumnFamilyHandle*> handles;
    rocksdb::TransactionDB* raw_db = nullptr;
    auto status = rocksdb::TransactionDB::Open(
        options, rocksdb::TransactionDBOptions{}, db_path.string(),
        descriptors, &handles, &raw_db);
    if (!status.ok()) {
        throw StoreError(
            "Failed to open RocksDB at " + db_path.string() + ": " +
            status.ToString());
    }
    db_.reset(raw_db);

    std::vector<rocksdb::ColumnFamilyHandle*> named;
    for (auto* handle : handles) {
        const std::string& name = handle->GetName();
        if (name == rocksdb::kDefaultColumnFamilyName) {
            default_family_ = handle;
        } else if (name == kMetaFamily) {
            meta_family_ = handle;
        } else if (name.starts_with(kFamilyPrefix)) {
            named.push_back(handle);
        } else {
            spdlog::warn("Ignoring foreign column family '{}' in {}", name, db_path.string());
            auto destroy = db_->DestroyColumnFamilyHandle(handle);
            if (!destroy.ok()) {
                spdlog::warn("DestroyColumnFamilyHandle failed: {}", destroy.ToString());
            }
        }
    }

    if (meta_family_ == nullptr) {
        auto create = db_->CreateColumnFamily(rocksdb::ColumnFamilyOptions(options),
                                              std::string(kMetaFamily), &meta_family_);
        if (!create.ok()) {
            throw_status("CreateColumnFamily", create);
        }
    }
    ensure_count(rocksdb::kDefaultColumnFamilyName, default_family_);

    for (auto* handle : named) {
        const std::string family = handle->GetName();
        const std::string collection = family.substr(kFamilyPrefix.size());

        std::string marker;
        auto found = db_->Get(rocksdb::ReadOptions{}, meta_family_,
                              collection_key(collection), &marker);
        if (found.IsNotFound()) {
            // Created by a transaction that never committed.
            spdlog::warn("Dropping unregistered collection '{}' in {}",
                         collection, db_path.string());
            auto drop = db_->DropColumnFamily(handle);
            if (!drop.ok()) {
                throw_status("DropColumnFamily", drop);
            }
            auto destroy = db_->DestroyColumnFamilyHandle(handle);
            if (!destroy.ok()) {
                spdlog::warn("DestroyColumnFamilyHandle failed: {}", destroy.ToString());
            }
            continue;
        }
        if (!found.ok()) {
            throw_status("Get", found);
        }

        ensure_count(family, handle);
        const uint32_t id = next_collection_id_++;
        families_.emplace(collection, Family{id, handle});
        by_id_.emplace(id, handle);
    }

    if (families_.size() > max_collections_) {
        spdlog::warn("{} holds {} collections, above the configured maximum of {}",
                     db_path.string(), families_.size(), max_collections_);
    }

    spdlog::info("RocksDB opened at {} ({} named collections)",
                 db_path.string(), families_.size());
}

RocksDBEnvironment::~RocksDBEnvironment() {
    if (!db_) {
        return;
    }
    spdlog::info("Closing RocksDB at {}", path_.string());
    for (auto& [_, family] : families_) {
        auto status = db_->DestroyColumnFamilyHandle(family.handle);
        if (!status.ok()) {
            spdlog::warn("DestroyColumnFamilyHandle failed: {}", status.ToString());
        }
    }
    for (auto* handle : {meta_family_, default_family_}) {
        if (handle == nullptr) {
            continue;
        }
        auto status = db_->DestroyColumnFamilyHandle(handle);
        if (!status.ok()) {
            spdlog::warn("DestroyColumnFamilyHandle failed: {}", status.ToString());
        }
    }
    auto status = db_->Close();
    if (!status.ok()) {
        spdlog::error("RocksDB Close failed: {}", status.ToString());
    }
}

// Databases written by other tools have no stored counts; count them once.
void RocksDBEnvironment::ensure_count(const std::string& family_name,
                                      rocksdb::ColumnFamilyHandle* handle) {
    std::string existing;
    const auto key = count_key(family_name);
    auto found = db_->Get(rocksdb::ReadOptions{}, meta_family_, key, &existing);
    if (found.ok()) {
        return;
    }
    if (!found.IsNotFound()) {
        throw_status("Get", found);
    }

    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions{}, handle));
    const uint64_t n = count_entries(*it);

    rocksdb::WriteOptions write_options;
    write_options.sync = true;
    auto put = db_->Put(write_options, meta_family_, key, encode_count(n));
    if (!put.ok()) {
        throw_status("Put", put);
    }
    spdlog::info("Counted {} rows in column family '{}'", n, family_name);
}

std::unique_ptr<ReadTransaction> RocksDBEnvironment::begin_read() {
    return std::make_unique<RocksDBReadTransaction>(*this, next_serial());
}

std::unique_ptr<WriteTransaction> RocksDBEnvironment::try_begin_write() {
    {
        std::lock_guard lock(mutex_);
        if (writer_active_) {
            return nullptr;
        }
        writer_active_ = true;
    }
    return std::make_unique<RocksDBWriteTransaction>(*this, next_serial());
}

std::optional<Collection>
RocksDBEnvironment::open_collection(const ReadTransaction& txn,
                                    const std::optional<std::string>& name) {
    if (!name) {
        return Collection{0, std::nullopt};
    }
    if (!meta_view_of(txn).get_meta(collection_key(*name))) {
        return std::nullopt;
    }
    std::lock_guard lock(mutex_);
    auto it = families_.find(*name);
    if (it == families_.end()) {
        throw StoreError(std::format("collection '{}' is registered but has no column family",
                                     *name));
    }
    return Collection{it->second.id, name};
}

Collection RocksDBEnvironment::create_collection(WriteTransaction& txn,
                                                 const std::optional<std::string>& name) {
    auto* writer = dynamic_cast<RocksDBWriteTransaction*>(&txn);
    if (writer == nullptr) {
        throw StoreError("transaction does not belong to a RocksDBEnvironment");
    }
    if (writer->finished()) {
        throw StoreError("write transaction already committed or aborted");
    }
    if (!name) {
        return Collection{0, std::nullopt};
    }
    if (auto existing = open_collection(txn, name)) {
        return *existing;
    }

    Collection collection;
    {
        std::lock_guard lock(mutex_);
        if (families_.contains(*name)) {
            throw StoreError(std::format(
                "collection '{}' exists but is not visible to this transaction", *name));
        }
        if (families_.size() >= max_collections_) {
            throw StoreError(std::format(
                "cannot create collection '{}': limit of {} collections reached",
                *name, max_collections_));
        }

        rocksdb::ColumnFamilyHandle* handle = nullptr;
        const std::string family_name = std::string(kFamilyPrefix) + *name;
        auto status = db_->CreateColumnFamily(rocksdb::ColumnFamilyOptions{}, family_name, &handle);
        if (!status.ok()) {
            throw_status("CreateColumnFamily", status);
        }

        const uint32_t id = next_collection_id_++;
        families_.emplace(*name, Family{id, handle});
        by_id_.emplace(id, handle);
        collection = Collection{id, name};
    }

    try {
        writer->register_collection(collection);
    } catch (const StoreError&) {
        discard_collection(*name);
        throw;
    }
    spdlog::info("Created collection '{}'", *name);
    return collection;
}

std::vector<std::string>
RocksDBEnvironment::collection_names(const ReadTransaction& txn) const {
    const auto& meta = meta_view_of(txn);

    std::vector<std::string> known;
    {
        std::lock_guard lock(mutex_);
        known.reserve(families_.size());
        for (const auto& [name, _] : families_) {
            known.push_back(name);
        }
    }

    std::vector<std::string> result;
    result.reserve(known.size());
    for (auto& name : known) {
        if (meta.get_meta(collection_key(name))) {
            result.push_back(std::move(name));
        }
    }
    return result;
}

rocksdb::ColumnFamilyHandle* RocksDBEnvironment::handle(const Collection& collection) const {
    if (collection.id == 0) {
        return default_family_;
    }
    std::lock_guard lock(mutex_);
    auto it = by_id_.find(collection.id);
    if (it == by_id_.end()) {
        throw StoreError(std::format("unknown collection id {}", collection.id));
    }
    return it->second;
}

void RocksDBEnvironment::release_writer() noexcept {
    std::lock_guard lock(mutex_);
    writer_active_ = false;
}

void RocksDBEnvironment::discard_collection(const std::string& name) noexcept {
    rocksdb::ColumnFamilyHandle* handle = nullptr;
    {
        std::lock_guard lock(mutex_);
        auto it = families_.find(name);
        if (it == families_.end()) {
            return;
        }
        handle = it->second.handle;
        by_id_.erase(it->second.id);
        families_.erase(it);
    }

    auto drop = db_->DropColumnFamily(handle);
    if (!drop.ok()) {
        spdlog::error("DropColumnFamily for '{}' failed: {}", name, drop.ToString());
    }
    auto destroy = db_->DestroyColumnFamilyHandle(handle);
    if (!destroy.ok()) {
        spdlog::warn("DestroyColumnFamilyHandle failed: {}", destroy.ToString());
    }
    spdlog::info("Dropped collection '{}' created by an uncommitted transaction", name);
}

} // namespace kvedit::storage
