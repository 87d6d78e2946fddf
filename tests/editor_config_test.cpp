#include "common/editor_config.hpp"
#include "common/logger.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ── Helpers ───────────────────────────────────────────────────────────────────

// Build a fake argv array from a vector of strings.
// The returned pointers are valid as long as `args` is alive.
static std::vector<char*> make_argv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& s : args) {
        argv.push_back(s.data());
    }
    return argv;
}

// ── Fixture ───────────────────────────────────────────────────────────────────

class EditorConfigTest : public ::testing::Test {
protected:
    kvedit::EditorConfig parse() {
        auto argv = make_argv(args_);
        return kvedit::parse_config(static_cast<int>(argv.size()), argv.data());
    }

    void expect_rejected() {
        auto argv = make_argv(args_);
        EXPECT_THROW((void)kvedit::parse_config(static_cast<int>(argv.size()), argv.data()),
                     std::runtime_error);
    }

    std::vector<std::string> args_{
        "kv-editor",
        "--path", "./data/store",
    };
};

// ── Valid configuration ────────────────────────────────────────────────────────

TEST_F(EditorConfigTest, ParsesMinimalValidConfig) {
    auto cfg = parse();

    EXPECT_EQ(cfg.path,            "./data/store");
    EXPECT_EQ(cfg.engine,          "rocksdb");  // default
    EXPECT_EQ(cfg.max_collections, 1000u);      // default
    EXPECT_EQ(cfg.page_size,       30u);        // default
    EXPECT_EQ(cfg.log_level,       "warn");     // default
    EXPECT_FALSE(cfg.pretty);
}

TEST_F(EditorConfigTest, ParsesShortPathOption) {
    args_ = {"kv-editor", "-p", "/tmp/x"};
    EXPECT_EQ(parse().path, "/tmp/x");
}

TEST_F(EditorConfigTest, ParsesMemoryEngine) {
    args_.insert(args_.end(), {"--engine", "memory"});
    EXPECT_EQ(parse().engine, "memory");
}

TEST_F(EditorConfigTest, ParsesCustomLimits) {
    args_.insert(args_.end(), {"--max-collections", "5", "--page-size", "100"});
    auto cfg = parse();
    EXPECT_EQ(cfg.max_collections, 5u);
    EXPECT_EQ(cfg.page_size,       100u);
}

TEST_F(EditorConfigTest, AcceptsUpperCollectionLimit) {
    args_.insert(args_.end(), {"--max-collections", std::to_string(kvedit::kMaxCollectionsLimit)});
    EXPECT_EQ(parse().max_collections, kvedit::kMaxCollectionsLimit);
}

TEST_F(EditorConfigTest, ParsesPrettyAndLogLevel) {
    args_.insert(args_.end(), {"--pretty", "--log-level", "debug"});
    auto cfg = parse();
    EXPECT_TRUE(cfg.pretty);
    EXPECT_EQ(cfg.log_level, "debug");
}

// ── Validation errors ─────────────────────────────────────────────────────────

TEST_F(EditorConfigTest, RejectsMissingPath) {
    args_ = {"kv-editor"};
    expect_rejected();
}

TEST_F(EditorConfigTest, RejectsEmptyPath) {
    args_ = {"kv-editor", "--path", ""};
    expect_rejected();
}

TEST_F(EditorConfigTest, RejectsUnknownEngine) {
    args_.insert(args_.end(), {"--engine", "lmdb"});
    expect_rejected();
}

TEST_F(EditorConfigTest, RejectsZeroCollections) {
    args_.insert(args_.end(), {"--max-collections", "0"});
    expect_rejected();
}

TEST_F(EditorConfigTest, RejectsTooManyCollections) {
    args_.insert(args_.end(), {"--max-collections", std::to_string(kvedit::kMaxCollectionsLimit + 1)});
    expect_rejected();
}

TEST_F(EditorConfigTest, RejectsZeroPageSize) {
    args_.insert(args_.end(), {"--page-size", "0"});
    expect_rejected();
}

TEST_F(EditorConfigTest, RejectsNonNumericPageSize) {
    args_.insert(args_.end(), {"--page-size", "lots"});
    expect_rejected();
}

TEST_F(EditorConfigTest, RejectsUnknownOption) {
    args_.insert(args_.end(), {"--frobnicate"});
    expect_rejected();
}

TEST_F(EditorConfigTest, HelpThrowsWithUsageText) {
    args_ = {"kv-editor", "--help"};
    try {
        (void)parse();
        FAIL() << "--help should throw";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("--path"), std::string::npos);
    }
}

// ── Log levels ────────────────────────────────────────────────────────────────

TEST(LogLevelTest, ParsesKnownLevels) {
    EXPECT_EQ(kvedit::parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(kvedit::parse_log_level("warn"),  spdlog::level::warn);
    EXPECT_EQ(kvedit::parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(kvedit::parse_log_level("off"),   spdlog::level::off);
}

TEST(LogLevelTest, UnknownFallsBackToInfo) {
    EXPECT_EQ(kvedit::parse_log_level("chatty"), spdlog::level::info);
}

TEST(LogLevelTest, MakeLoggerIsIdempotent) {
    auto a = kvedit::make_logger("config-test", spdlog::level::debug);
    auto b = kvedit::make_logger("config-test");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->level(), spdlog::level::debug);
}
