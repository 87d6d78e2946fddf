#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace kvedit {

// ── EditorConfig ──────────────────────────────────────────────────────────────
// Full configuration for one kv-editor run.
// Populated by parse_config() from CLI arguments.

struct EditorConfig {
    std::string path;             // Store directory (created if missing)
    std::string engine;           // Storage engine: "rocksdb" (default) or "memory"
    uint32_t    max_collections;  // Upper bound on named collections
    uint64_t    page_size;        // Rows per NEXT page
    std::string log_level;        // spdlog level string
    bool        pretty;           // Show TAB / LF / CR raw instead of escaped
};

// Bounds for --max-collections.
inline constexpr uint32_t kMaxCollectionsLimit = 100000;

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into an EditorConfig.
//
// On success: returns a fully validated EditorConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, carrying the help text.
//
// Validates:
//   - path is not empty
//   - engine is "rocksdb" or "memory"
//   - max_collections in [1, kMaxCollectionsLimit]
//   - page_size > 0

[[nodiscard]] EditorConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with kv-editor options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace kvedit
