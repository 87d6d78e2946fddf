#include "storage/memory_environment.hpp"

#include <format>
#include <mutex>
#include <utility>

namespace kvedit::storage {

using Table = MemoryEnvironment::Table;
using State = MemoryEnvironment::State;

// ── Shared plumbing ───────────────────────────────────────────────────────────

namespace {

// Gives the environment access to the State a transaction of either kind sees.
class MemoryStateView {
public:
    virtual ~MemoryStateView() = default;
    [[nodiscard]] virtual const State& view() const = 0;
};

const MemoryStateView& state_view_of(const ReadTransaction& txn) {
    const auto* view = dynamic_cast<const MemoryStateView*>(&txn);
    if (view == nullptr) {
        throw StoreError("transaction does not belong to a MemoryEnvironment");
    }
    return *view;
}

std::shared_ptr<const Table> table_of(const State& state, const Collection& collection) {
    auto it = state.tables.find(collection.id);
    if (it == state.tables.end()) {
        throw StoreError(std::format("unknown collection id {}", collection.id));
    }
    return it->second;
}

class MemoryCursor final : public Cursor {
public:
    explicit MemoryCursor(std::shared_ptr<const Table> table)
        : table_(std::move(table)) {}

    void seek_to_first() override {
        it_ = table_->begin();
        positioned_ = true;
    }

    void next() override { ++it_; }

    [[nodiscard]] bool valid() const override {
        return positioned_ && it_ != table_->end();
    }

    [[nodiscard]] std::string_view key() const override { return it_->first; }
    [[nodiscard]] std::string_view value() const override { return it_->second; }

private:
    std::shared_ptr<const Table> table_;
    Table::const_iterator it_;
    bool positioned_ = false;
};

// Read-side operations shared by both transaction kinds.
std::optional<std::string> get_from(const State& state, const Collection& collection,
                                    std::string_view key) {
    const auto table = table_of(state, collection);
    auto it = table->find(key);
    if (it == table->end()) {
        return std::nullopt;
    }
    return it->second;
}

// ── MemoryReadTransaction ─────────────────────────────────────────────────────

class MemoryReadTransaction final : public ReadTransaction, public MemoryStateView {
public:
    MemoryReadTransaction(std::shared_ptr<const State> state, uint64_t serial)
        : state_(std::move(state)), serial_(serial) {}

    [[nodiscard]] uint64_t serial() const noexcept override { return serial_; }
    [[nodiscard]] uint64_t generation() const noexcept override { return 0; }
    [[nodiscard]] bool writable() const noexcept override { return false; }

    [[nodiscard]] std::optional<std::string>
    get(const Collection& collection, std::string_view key) const override {
        return get_from(*state_, collection, key);
    }

    [[nodiscard]] uint64_t count(const Collection& collection) const override {
        return table_of(*state_, collection)->size();
    }

    [[nodiscard]] std::unique_ptr<Cursor>
    open_cursor(const Collection& collection) const override {
        return std::make_unique<MemoryCursor>(table_of(*state_, collection));
    }

    [[nodiscard]] const State& view() const override { return *state_; }

private:
    std::shared_ptr<const State> state_;
    uint64_t serial_;
};

} // anonymous namespace

// ── MemoryWriteTransaction ────────────────────────────────────────────────────

class MemoryWriteTransaction final : public WriteTransaction, public MemoryStateView {
public:
    MemoryWriteTransaction(MemoryEnvironment& env, const State& base, uint64_t serial)
        : env_(env), working_(std::make_shared<State>(base)), serial_(serial) {}

    ~MemoryWriteTransaction() override {
        abort();
    }

    MemoryWriteTransaction(const MemoryWriteTransaction&)            = delete;
    MemoryWriteTransaction& operator=(const MemoryWriteTransaction&) = delete;

    [[nodiscard]] uint64_t serial() const noexcept override { return serial_; }
    [[nodiscard]] uint64_t generation() const noexcept override { return generation_; }
    [[nodiscard]] bool writable() const noexcept override { return true; }
    [[nodiscard]] bool finished() const noexcept override { return finished_; }

    [[nodiscard]] std::optional<std::string>
    get(const Collection& collection, std::string_view key) const override {
        return get_from(view(), collection, key);
    }

    [[nodiscard]] uint64_t count(const Collection& collection) const override {
        return table_of(view(), collection)->size();
    }

    [[nodiscard]] std::unique_ptr<Cursor>
    open_cursor(const Collection& collection) const override {
        return std::make_unique<MemoryCursor>(table_of(view(), collection));
    }

    void put(const Collection& collection,
             std::string_view key, std::string_view value) override {
        auto& table = mutable_table(collection);
        table.insert_or_assign(std::string(key), std::string(value));
        ++generation_;
    }

    bool del(const Collection& collection, std::string_view key) override {
        // Look before copying: deleting a missing key must not dirty the table.
        if (!table_of(view(), collection)->contains(key)) {
            return false;
        }
        auto& table = mutable_table(collection);
        table.erase(table.find(key));
        ++generation_;
        return true;
    }

    void commit() override {
        ensure_open();
        finished_ = true;
        owned_.clear();
        env_.publish(std::move(working_));
    }

    void abort() noexcept override {
        if (finished_) {
            return;
        }
        finished_ = true;
        owned_.clear();
        working_.reset();
        env_.release_writer();
    }

    [[nodiscard]] const State& view() const override {
        ensure_open();
        return *working_;
    }

    // Create (or find) a collection inside this transaction.
    Collection create(const std::optional<std::string>& name) {
        ensure_open();

        if (!name) {
            if (!working_->main_exists) {
                working_->main_exists = true;
                auto table = std::make_shared<Table>();
                working_->tables[0] = table;
                owned_[0] = std::move(table);
                ++generation_;
            }
            return Collection{0, std::nullopt};
        }

        if (auto it = working_->names.find(*name); it != working_->names.end()) {
            return Collection{it->second, name};
        }

        if (working_->names.size() >= env_.max_collections()) {
            throw StoreError(std::format(
                "cannot create collection '{}': limit of {} collections reached",
                *name, env_.max_collections()));
        }

        const uint32_t id = env_.allocate_collection_id();
        working_->names.emplace(*name, id);
        auto table = std::make_shared<Table>();
        working_->tables[id] = table;
        owned_[id] = std::move(table);
        ++generation_;
        return Collection{id, name};
    }

private:
    void ensure_open() const {
        if (finished_) {
            throw StoreError("write transaction already committed or aborted");
        }
    }

    // Returns a table private to this transaction, copying the committed one
    // on first use.
    Table& mutable_table(const Collection& collection) {
        ensure_open();
        if (auto it = owned_.find(collection.id); it != owned_.end()) {
            return *it->second;
        }
        auto found = working_->tables.find(collection.id);
        if (found == working_->tables.end()) {
            throw StoreError(std::format("unknown collection id {}", collection.id));
        }
        auto copy = std::make_shared<Table>(*found->second);
        found->second = copy;
        owned_.emplace(collection.id, copy);
        return *copy;
    }

    MemoryEnvironment& env_;
    std::shared_ptr<State> working_;
    std::unordered_map<uint32_t, std::shared_ptr<Table>> owned_;
    uint64_t serial_;
    uint64_t generation_ = 0;
    bool finished_ = false;
};

// ── MemoryEnvironment ─────────────────────────────────────────────────────────

MemoryEnvironment::MemoryEnvironment(uint32_t max_collections)
    : committed_(std::make_shared<const State>())
    , max_collections_(max_collections) {}

std::unique_ptr<ReadTransaction> MemoryEnvironment::begin_read() {
    std::shared_ptr<const State> state;
    {
        std::lock_guard lock(mutex_);
        state = committed_;
    }
    return std::make_unique<MemoryReadTransaction>(std::move(state), next_serial());
}

std::unique_ptr<WriteTransaction> MemoryEnvironment::try_begin_write() {
    std::shared_ptr<const State> base;
    {
        std::lock_guard lock(mutex_);
        if (writer_active_) {
            return nullptr;
        }
        writer_active_ = true;
        base = committed_;
    }
    return std::make_unique<MemoryWriteTransaction>(*this, *base, next_serial());
}

std::optional<Collection>
MemoryEnvironment::open_collection(const ReadTransaction& txn,
                                   const std::optional<std::string>& name) {
    const State& state = state_view_of(txn).view();
    if (!name) {
        if (!state.main_exists) {
            return std::nullopt;
        }
        return Collection{0, std::nullopt};
    }
    auto it = state.names.find(*name);
    if (it == state.names.end()) {
        return std::nullopt;
    }
    return Collection{it->second, name};
}

Collection MemoryEnvironment::create_collection(WriteTransaction& txn,
                                                const std::optional<std::string>& name) {
    auto* writer = dynamic_cast<MemoryWriteTransaction*>(&txn);
    if (writer == nullptr) {
        throw StoreError("transaction does not belong to a MemoryEnvironment");
    }
    return writer->create(name);
}

std::vector<std::string>
MemoryEnvironment::collection_names(const ReadTransaction& txn) const {
    const State& state = state_view_of(txn).view();
    std::vector<std::string> result;
    result.reserve(state.names.size());
    for (const auto& [name, _] : state.names) {
        result.push_back(name);
    }
    return result;
}

void MemoryEnvironment::fail_next_commit() {
    std::lock_guard lock(mutex_);
    fail_next_commit_ = true;
}

bool MemoryEnvironment::writer_active() const {
    std::lock_guard lock(mutex_);
    return writer_active_;
}

void MemoryEnvironment::publish(std::shared_ptr<const State> state) {
    std::lock_guard lock(mutex_);
    writer_active_ = false;
    if (fail_next_commit_) {
        fail_next_commit_ = false;
        throw StoreError("commit failed: simulated I/O error");
    }
    committed_ = std::move(state);
}

void MemoryEnvironment::release_writer() noexcept {
    std::lock_guard lock(mutex_);
    writer_active_ = false;
}

uint32_t MemoryEnvironment::allocate_collection_id() {
    std::lock_guard lock(mutex_);
    return next_collection_id_++;
}

} // namespace kvedit::storage
