#pragma once

#include "cli/command.hpp"
#include "editor/editor.hpp"

#include <iosfwd>
#include <string>

namespace kvedit::cli {

// ── Repl ──────────────────────────────────────────────────────────────────────
//
// Line-oriented front end: feeds parsed commands into an Editor and prints
// what it answers.  Rows are printed as "<index>\t<key>\t<value>".  Failures
// are printed as "ERROR <kind>: <message>" and never end the loop.

class Repl {
public:
    Repl(editor::Editor& editor, std::ostream& out);

    // Read commands from `in` until QUIT or end of input.
    // `prompt` is printed before each line when non-empty.
    void run(std::istream& in, const std::string& prompt = {});

    // Execute one line.  Returns false when the line asked to quit.
    bool execute_line(std::string_view line);

    // Execute one parsed command.  Returns false for QUIT.
    bool execute(const Command& cmd);

private:
    void print_view(const editor::View& view);
    void print_result(const std::error_code& ec);
    void print_status();

    editor::Editor& editor_;
    std::ostream& out_;
};

} // namespace kvedit::cli
