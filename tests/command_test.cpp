#include "cli/command.hpp"

#include <string>
#include <variant>

#include <gtest/gtest.h>

namespace kvedit::cli {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Unwrap a parse result that is expected to be a Command.
static Command expect_command(std::variant<Command, ParseError> result) {
    EXPECT_TRUE(std::holds_alternative<Command>(result))
        << "Expected Command but got ParseError: "
        << (std::holds_alternative<ParseError>(result)
                ? std::get<ParseError>(result).message
                : "");
    return std::get<Command>(result);
}

// Unwrap a parse result that is expected to be a ParseError.
static ParseError expect_error(std::variant<Command, ParseError> result) {
    EXPECT_TRUE(std::holds_alternative<ParseError>(result))
        << "Expected ParseError but got a Command";
    return std::get<ParseError>(result);
}

// ── No-argument commands ──────────────────────────────────────────────────────

TEST(ParseCommand, WriteCommitAbort) {
    EXPECT_TRUE(std::holds_alternative<WriteCmd>(expect_command(parse_command("WRITE"))));
    EXPECT_TRUE(std::holds_alternative<CommitCmd>(expect_command(parse_command("COMMIT"))));
    EXPECT_TRUE(std::holds_alternative<AbortCmd>(expect_command(parse_command("ABORT"))));
}

TEST(ParseCommand, VerbsAreCaseInsensitive) {
    EXPECT_TRUE(std::holds_alternative<WriteCmd>(expect_command(parse_command("write"))));
    EXPECT_TRUE(std::holds_alternative<TabsCmd>(expect_command(parse_command("Tabs"))));
}

TEST(ParseCommand, QuitAndExit) {
    EXPECT_TRUE(std::holds_alternative<QuitCmd>(expect_command(parse_command("QUIT"))));
    EXPECT_TRUE(std::holds_alternative<QuitCmd>(expect_command(parse_command("exit"))));
}

TEST(ParseCommand, NoArgCommandWithArgIsError) {
    auto err = expect_error(parse_command("COMMIT now"));
    EXPECT_NE(err.message.find("no arguments"), std::string::npos);
}

TEST(ParseCommand, StripsCarriageReturn) {
    auto cmd = expect_command(parse_command("STATUS\r"));
    EXPECT_TRUE(std::holds_alternative<StatusCmd>(cmd));
}

// ── OPEN / CREATE ─────────────────────────────────────────────────────────────

TEST(ParseCommand, OpenWithoutNameMeansMain) {
    auto cmd = expect_command(parse_command("OPEN"));
    ASSERT_TRUE(std::holds_alternative<OpenCmd>(cmd));
    EXPECT_EQ(std::get<OpenCmd>(cmd).name, "");
}

TEST(ParseCommand, OpenKeepsNameVerbatim) {
    auto cmd = expect_command(parse_command("open My Collection"));
    ASSERT_TRUE(std::holds_alternative<OpenCmd>(cmd));
    EXPECT_EQ(std::get<OpenCmd>(cmd).name, "My Collection");
}

TEST(ParseCommand, CreateRequiresName) {
    expect_error(parse_command("CREATE"));
    auto cmd = expect_command(parse_command("CREATE users"));
    ASSERT_TRUE(std::holds_alternative<CreateCmd>(cmd));
    EXPECT_EQ(std::get<CreateCmd>(cmd).name, "users");
}

// ── Indexed commands ──────────────────────────────────────────────────────────

TEST(ParseCommand, TabCloseEdit) {
    auto tab = expect_command(parse_command("TAB 2"));
    ASSERT_TRUE(std::holds_alternative<TabCmd>(tab));
    EXPECT_EQ(std::get<TabCmd>(tab).index, 2u);

    auto close = expect_command(parse_command("CLOSE 1"));
    ASSERT_TRUE(std::holds_alternative<CloseCmd>(close));
    EXPECT_EQ(std::get<CloseCmd>(close).index, 1u);

    auto edit = expect_command(parse_command("EDIT 123456789012"));
    ASSERT_TRUE(std::holds_alternative<EditCmd>(edit));
    EXPECT_EQ(std::get<EditCmd>(edit).row, 123456789012u);
}

TEST(ParseCommand, IndexIsRequiredAndNumeric) {
    expect_error(parse_command("TAB"));
    expect_error(parse_command("EDIT x"));
    expect_error(parse_command("CLOSE -1"));
    expect_error(parse_command("TAB 1 2"));
}

TEST(ParseCommand, RowsStartCount) {
    auto cmd = expect_command(parse_command("ROWS 10 25"));
    ASSERT_TRUE(std::holds_alternative<RowsCmd>(cmd));
    EXPECT_EQ(std::get<RowsCmd>(cmd).start, 10u);
    EXPECT_EQ(std::get<RowsCmd>(cmd).count, 25u);
}

TEST(ParseCommand, RowsNeedsBothNumbers) {
    expect_error(parse_command("ROWS"));
    expect_error(parse_command("ROWS 10"));
    expect_error(parse_command("ROWS a 10"));
    expect_error(parse_command("ROWS 10 b"));
}

// ── KEY / VALUE ───────────────────────────────────────────────────────────────

TEST(ParseCommand, KeyTakesRestOfLineVerbatim) {
    auto cmd = expect_command(parse_command("KEY  two  spaces\\t"));
    ASSERT_TRUE(std::holds_alternative<KeyCmd>(cmd));
    EXPECT_EQ(std::get<KeyCmd>(cmd).text, " two  spaces\\t");
}

TEST(ParseCommand, EmptyKeyIsAllowed) {
    auto bare = expect_command(parse_command("KEY"));
    ASSERT_TRUE(std::holds_alternative<KeyCmd>(bare));
    EXPECT_EQ(std::get<KeyCmd>(bare).text, "");

    auto spaced = expect_command(parse_command("KEY "));
    EXPECT_EQ(std::get<KeyCmd>(spaced).text, "");
}

TEST(ParseCommand, ValueText) {
    auto cmd = expect_command(parse_command("value \\x00abc"));
    ASSERT_TRUE(std::holds_alternative<ValueCmd>(cmd));
    EXPECT_EQ(std::get<ValueCmd>(cmd).text, "\\x00abc");
}

// ── Errors ────────────────────────────────────────────────────────────────────

TEST(ParseCommand, UnknownCommand) {
    auto err = expect_error(parse_command("FROB 1"));
    EXPECT_EQ(err.message, "unknown command: FROB");
}

TEST(ParseCommand, EmptyLineIsError) {
    expect_error(parse_command(""));
    expect_error(parse_command("\r"));
}

TEST(HelpText, MentionsEveryVerb) {
    const std::string help(help_text());
    for (const char* verb : {"OPEN", "CREATE", "TABS", "TAB", "CLOSE", "COLLECTIONS",
                             "WRITE", "COMMIT", "ABORT", "ROWS", "NEXT", "EDIT",
                             "KEY", "VALUE", "INSERT", "DELETE", "STATUS", "QUIT"}) {
        EXPECT_NE(help.find(verb), std::string::npos) << verb;
    }
}

} // namespace kvedit::cli
