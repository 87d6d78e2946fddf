#include "cli/repl.hpp"
#include "common/editor_config.hpp"
#include "common/logger.hpp"
#include "editor/editor.hpp"
#include "storage/memory_environment.hpp"
#include "storage/rocksdb_environment.hpp"
#include "storage/storage_engine.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    kvedit::EditorConfig cfg;
    try {
        cfg = kvedit::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = kvedit::parse_log_level(cfg.log_level);
    kvedit::init_default_logger(level);
    auto logger = kvedit::make_logger("editor", level);

    logger->info("kv-editor starting – path={} engine={} max_collections={}",
                 cfg.path, cfg.engine, cfg.max_collections);

    // ── Storage ──────────────────────────────────────────────────────────────
    namespace fs = std::filesystem;
    std::unique_ptr<kvedit::storage::Environment> env;
    if (cfg.engine == "rocksdb") {
        const fs::path db_path{cfg.path};
        std::error_code fs_ec;
        fs::create_directories(db_path, fs_ec);
        if (fs_ec) {
            logger->error("Failed to create store directory {}: {}",
                          db_path.string(), fs_ec.message());
            return 1;
        }
        try {
            env = std::make_unique<kvedit::storage::RocksDBEnvironment>(
                db_path, cfg.max_collections);
        } catch (const kvedit::storage::StoreError& e) {
            logger->error("Failed to open RocksDB store: {}", e.what());
            return 1;
        }
        logger->info("Using RocksDB store at {}", db_path.string());
    } else {
        env = std::make_unique<kvedit::storage::MemoryEnvironment>(cfg.max_collections);
        logger->info("Using in-memory store");
    }

    // ── Editor ───────────────────────────────────────────────────────────────
    kvedit::editor::EditorOptions options;
    options.style = cfg.pretty ? kvedit::codec::EncodeStyle::Pretty
                               : kvedit::codec::EncodeStyle::Strict;
    options.page_size = cfg.page_size;

    try {
        kvedit::editor::Editor editor{*env, options, logger};
        kvedit::cli::Repl repl{editor, std::cout};
        repl.run(std::cin, "> ");
    } catch (const kvedit::storage::StoreError& e) {
        logger->error("Store failure: {}", e.what());
        return 1;
    }

    logger->info("kv-editor stopped");
    return 0;
}
