#include "common/editor_config.hpp"

#include <format>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace kvedit {

namespace {

// Validate the fully populated EditorConfig.
void validate(const EditorConfig& cfg) {
    if (cfg.path.empty()) {
        throw std::runtime_error("--path must not be empty");
    }

    if (cfg.engine != "rocksdb" && cfg.engine != "memory") {
        throw std::runtime_error(
            std::format("--engine must be 'rocksdb' or 'memory', got '{}'", cfg.engine));
    }

    if (cfg.max_collections == 0 || cfg.max_collections > kMaxCollectionsLimit) {
        throw std::runtime_error(
            std::format("--max-collections must be in [1, {}], got {}",
                        kMaxCollectionsLimit, cfg.max_collections));
    }

    if (cfg.page_size == 0) {
        throw std::runtime_error("--page-size must be > 0");
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("path,p",
            po::value<std::string>()->required(),
            "Store directory to browse (created if missing)")
        ("engine",
            po::value<std::string>()->default_value("rocksdb"),
            "Storage engine: rocksdb (default) or memory")
        ("max-collections",
            po::value<uint32_t>()->default_value(1000),
            "Maximum number of named collections")
        ("page-size",
            po::value<uint64_t>()->default_value(30),
            "Rows shown per page")
        ("log-level",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("pretty",
            po::bool_switch()->default_value(false),
            "Show tabs and line breaks raw instead of escaped");
}

// ── parse_config ──────────────────────────────────────────────────────────────

EditorConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("kv-editor options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        // Handle --help before notify() so missing required options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::format("Argument error: {}", e.what()));
    }

    EditorConfig cfg;
    cfg.path            = vm["path"].as<std::string>();
    cfg.engine          = vm["engine"].as<std::string>();
    cfg.max_collections = vm["max-collections"].as<uint32_t>();
    cfg.page_size       = vm["page-size"].as<uint64_t>();
    cfg.log_level       = vm["log-level"].as<std::string>();
    cfg.pretty          = vm["pretty"].as<bool>();

    validate(cfg);
    return cfg;
}

} // namespace kvedit
