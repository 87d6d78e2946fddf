#pragma once

#include "storage/storage_engine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace kvedit::editor {

// Display label of the main (unnamed) collection.
inline constexpr const char* kMainCollectionLabel = "{main}";

// ── CollectionRegistry ────────────────────────────────────────────────────────
//
// Opens and creates collections of one Environment.  Handles it returns are
// plain values, valid for the Environment's lifetime and usable under any
// later transaction.
//
// A missing collection is reported as std::nullopt, never as an error.

class CollectionRegistry {
public:
    explicit CollectionRegistry(storage::Environment& env,
                                std::shared_ptr<spdlog::logger> logger = {});

    // Make sure the main collection exists, creating it in its own write
    // transaction if needed, and return it.  Called once at startup.
    // Throws storage::StoreError if the environment is unusable or another
    // writer is live.
    storage::Collection ensure_main();

    // Look up `name` (std::nullopt = main) under any transaction.
    [[nodiscard]] std::optional<storage::Collection>
    open(const storage::ReadTransaction& txn, const std::optional<std::string>& name) const;

    // Look up `name`, creating it inside `txn` if absent.
    // Throws storage::StoreError when the collection limit is reached.
    [[nodiscard]] storage::Collection
    open_or_create(storage::WriteTransaction& txn, const std::optional<std::string>& name);

    // Names of every named collection visible to `txn`, in bytewise order.
    [[nodiscard]] std::vector<std::string> list(const storage::ReadTransaction& txn) const;

    // Front-end names: the empty string means the main collection.
    [[nodiscard]] static std::optional<std::string> from_input(const std::string& text);

    [[nodiscard]] static std::string display_name(const storage::Collection& collection);

private:
    storage::Environment& env_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace kvedit::editor
