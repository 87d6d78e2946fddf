#include "cli/repl.hpp"
#include "editor/editor.hpp"
#include "storage/memory_environment.hpp"

#include <sstream>
#include <string>

#include <gtest/gtest.h>

namespace kvedit::cli {

// ── Fixture ───────────────────────────────────────────────────────────────────
// Drives a Repl over an in-memory store and captures what it prints.

class ReplTest : public ::testing::Test {
protected:
    // Feed `script` (newline-separated commands) and return everything printed.
    std::string run(const std::string& script) {
        std::istringstream in(script);
        out_.str("");
        repl_.run(in);
        return out_.str();
    }

    std::string line(const std::string& text) {
        out_.str("");
        repl_.execute_line(text);
        return out_.str();
    }

    storage::MemoryEnvironment env_;
    editor::Editor editor_{env_};
    std::ostringstream out_;
    Repl repl_{editor_, out_};
};

// ── Editing session ───────────────────────────────────────────────────────────

TEST_F(ReplTest, InsertAndListRows) {
    const auto output = run(
        "WRITE\n"
        "KEY a\\tb\n"
        "VALUE 1\n"
        "INSERT\n"
        "ROWS 0 10\n");

    EXPECT_EQ(output,
        "OK\n"
        "OK\n"
        "OK\n"
        "OK\n"
        "0\ta\\tb\t1\n"
        "-- rows 0..0 of 1 in {main} (writing) --\n");
}

TEST_F(ReplTest, CommittedDataSurvivesIntoReading) {
    run("WRITE\nKEY k\nVALUE v\nINSERT\nCOMMIT\n");
    EXPECT_EQ(line("NEXT"),
        "0\tk\tv\n"
        "-- rows 0..0 of 1 in {main} (reading) --\n");
}

TEST_F(ReplTest, EmptyRangeFooter) {
    EXPECT_EQ(line("ROWS 5 10"), "-- no rows from 5 of 0 in {main} (reading) --\n");
}

TEST_F(ReplTest, EditCopiesRowIntoPendingEntry) {
    run("WRITE\nKEY k\nVALUE v\nINSERT\n");
    EXPECT_EQ(line("EDIT 0"), "KEY k\nVALUE v\n");
    EXPECT_EQ(line("EDIT 9"), "ERROR InvalidStateError: no such pane or row\n");
}

// ── Errors ────────────────────────────────────────────────────────────────────

TEST_F(ReplTest, CommitWhileReadingIsReported) {
    EXPECT_EQ(line("COMMIT"), "ERROR InvalidStateError: no write transaction is active\n");
}

TEST_F(ReplTest, DecodeErrorShowsOffset) {
    run("WRITE\nKEY ab\\xZZ\n");
    const auto output = line("INSERT");
    EXPECT_EQ(output.rfind("ERROR DecodeError: malformed escape sequence at offset 2", 0), 0u)
        << output;
}

TEST_F(ReplTest, ParseErrorsDoNotStopTheLoop) {
    const auto output = run("FROB\nSTATUS\n");
    EXPECT_EQ(output.rfind("ERROR unknown command: FROB\n", 0), 0u) << output;
    EXPECT_NE(output.find("mode: reading"), std::string::npos);
}

// ── Collections ───────────────────────────────────────────────────────────────

TEST_F(ReplTest, OpenMissingCollection) {
    EXPECT_EQ(line("OPEN nope"), "NOT_FOUND nope\n");
}

TEST_F(ReplTest, CreateListAndTabs) {
    EXPECT_EQ(run("WRITE\nCREATE users\n"), "OK\nOK [1] users\n");
    EXPECT_EQ(line("COLLECTIONS"), "{main}\nusers\n");
    EXPECT_EQ(line("TABS"), " [0] {main}\n*[1] users\n");
    EXPECT_EQ(line("TAB 0"), "OK\n");
    EXPECT_EQ(line("OPEN users"), "OK [1] users\n");
    EXPECT_EQ(line("CLOSE 0"), "ERROR InvalidStateError: no such pane or row\n");
}

TEST_F(ReplTest, StatusShowsPendingEntry) {
    run("KEY abc\nVALUE def\n");
    EXPECT_EQ(line("STATUS"),
        "mode: reading\n"
        "collection: {main} (pane 0 of 1)\n"
        "rows: 0\n"
        "key: abc\n"
        "value: def\n");
}

// ── Loop control ──────────────────────────────────────────────────────────────

TEST_F(ReplTest, QuitStopsReading) {
    run("QUIT\nWRITE\n");
    EXPECT_EQ(editor_.mode(), editor::TxnMode::Reading);
}

TEST_F(ReplTest, ExecuteLineReportsQuit) {
    EXPECT_FALSE(repl_.execute_line("QUIT"));
    EXPECT_TRUE(repl_.execute_line("STATUS"));
}

TEST_F(ReplTest, PromptIsPrinted) {
    std::istringstream in("STATUS\n");
    out_.str("");
    repl_.run(in, "> ");
    EXPECT_EQ(out_.str().rfind("> mode: reading", 0), 0u);
}

} // namespace kvedit::cli
