#include "editor/collection_registry.hpp"

#include <utility>

namespace kvedit::editor {

CollectionRegistry::CollectionRegistry(storage::Environment& env,
                                       std::shared_ptr<spdlog::logger> logger)
    : env_(env)
    , logger_(std::move(logger))
{
}

storage::Collection CollectionRegistry::ensure_main() {
    {
        auto rtxn = env_.begin_read();
        if (auto main = env_.open_collection(*rtxn, std::nullopt)) {
            return *main;
        }
    }

    auto wtxn = env_.try_begin_write();
    if (!wtxn) {
        throw storage::StoreError("cannot create the main collection: a write transaction is live");
    }
    auto main = env_.create_collection(*wtxn, std::nullopt);
    wtxn->commit();
    if (logger_) {
        logger_->info("[registry] Created main collection");
    }
    return main;
}

std::optional<storage::Collection>
CollectionRegistry::open(const storage::ReadTransaction& txn,
                         const std::optional<std::string>& name) const {
    auto collection = env_.open_collection(txn, name);
    if (!collection && logger_) {
        logger_->debug("[registry] Collection '{}' does not exist",
                       name.value_or(kMainCollectionLabel));
    }
    return collection;
}

storage::Collection
CollectionRegistry::open_or_create(storage::WriteTransaction& txn,
                                   const std::optional<std::string>& name) {
    if (auto existing = env_.open_collection(txn, name)) {
        return *existing;
    }
    auto collection = env_.create_collection(txn, name);
    if (logger_) {
        logger_->info("[registry] Created collection '{}'", display_name(collection));
    }
    return collection;
}

std::vector<std::string> CollectionRegistry::list(const storage::ReadTransaction& txn) const {
    return env_.collection_names(txn);
}

std::optional<std::string> CollectionRegistry::from_input(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::string CollectionRegistry::display_name(const storage::Collection& collection) {
    return collection.name.value_or(kMainCollectionLabel);
}

} // namespace kvedit::editor
