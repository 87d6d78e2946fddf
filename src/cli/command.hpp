#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace kvedit::cli {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of one line typed at the kv-editor prompt.  Each
// command is a plain struct; the whole thing is wrapped in a std::variant so
// callers can std::visit over it without inheritance.

struct OpenCmd {
    std::string name; // empty = main collection
};

struct CreateCmd {
    std::string name;
};

struct CloseCmd {
    std::size_t index;
};

struct TabCmd {
    std::size_t index;
};

struct TabsCmd {};
struct CollectionsCmd {};

struct WriteCmd {};
struct CommitCmd {};
struct AbortCmd {};

struct RowsCmd {
    uint64_t start;
    uint64_t count;
};

struct NextCmd {};

struct EditCmd {
    uint64_t row;
};

struct KeyCmd {
    std::string text; // escaped text, verbatim rest of line
};

struct ValueCmd {
    std::string text;
};

struct InsertCmd {};
struct DeleteCmd {};
struct StatusCmd {};
struct HelpCmd {};
struct QuitCmd {};

using Command = std::variant<OpenCmd, CreateCmd, CloseCmd, TabCmd, TabsCmd, CollectionsCmd,
                             WriteCmd, CommitCmd, AbortCmd, RowsCmd, NextCmd, EditCmd,
                             KeyCmd, ValueCmd, InsertCmd, DeleteCmd, StatusCmd, HelpCmd,
                             QuitCmd>;

struct ParseError {
    std::string message;
};

// Parse one line (without the trailing '\n') into a Command.  Verbs are
// case-insensitive; KEY and VALUE take the rest of the line verbatim.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Command, ParseError> parse_command(std::string_view line);

// Text shown by HELP.
[[nodiscard]] std::string_view help_text() noexcept;

} // namespace kvedit::cli
