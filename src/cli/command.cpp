#include "cli/command.hpp"

#include <cctype>
#include <charconv>
#include <string>
#include <utility>

namespace kvedit::cli {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

// Split `line` on the first space, returning {head, rest}.
// If there is no space, rest is empty.
std::pair<std::string_view, std::string_view> split_once(std::string_view line) {
    const auto pos = line.find(' ');
    if (pos == std::string_view::npos) {
        return {line, {}};
    }
    return {line.substr(0, pos), line.substr(pos + 1)};
}

std::string to_upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

// Parse a whole token as an unsigned integer.
template <typename T>
bool parse_uint(std::string_view token, T& out) {
    if (token.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
    return ec == std::errc{} && ptr == token.data() + token.size();
}

} // namespace

// ── parse_command ─────────────────────────────────────────────────────────────

std::variant<Command, ParseError> parse_command(std::string_view line) {
    // Strip trailing '\r' so the parser is CRLF-tolerant.
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    if (line.empty()) {
        return ParseError{"empty command"};
    }

    auto [verb_tok, rest] = split_once(line);
    const std::string verb = to_upper(verb_tok);

    // ── KEY text / VALUE text ─────────────────────────────────────────────────
    //
    // The text is everything after "KEY "; it may contain spaces and may be
    // empty (the empty key is a valid key).
    if (verb == "KEY") {
        return KeyCmd{std::string(rest)};
    }
    if (verb == "VALUE") {
        return ValueCmd{std::string(rest)};
    }

    // ── OPEN [name] / CREATE name ─────────────────────────────────────────────
    if (verb == "OPEN") {
        return OpenCmd{std::string(rest)};
    }
    if (verb == "CREATE") {
        if (rest.empty()) {
            return ParseError{"CREATE requires a collection name"};
        }
        return CreateCmd{std::string(rest)};
    }

    // ── Single-number commands ────────────────────────────────────────────────
    if (verb == "CLOSE" || verb == "TAB" || verb == "EDIT") {
        if (rest.empty()) {
            return ParseError{verb + " requires an index"};
        }
        uint64_t n = 0;
        if (!parse_uint(rest, n)) {
            return ParseError{verb + ": invalid index '" + std::string(rest) + "'"};
        }
        if (verb == "CLOSE") return CloseCmd{static_cast<std::size_t>(n)};
        if (verb == "TAB")   return TabCmd{static_cast<std::size_t>(n)};
        return EditCmd{n};
    }

    // ── ROWS start count ──────────────────────────────────────────────────────
    if (verb == "ROWS") {
        auto [start_tok, count_tok] = split_once(rest);
        if (start_tok.empty() || count_tok.empty()) {
            return ParseError{"ROWS requires: start count"};
        }
        RowsCmd cmd{};
        if (!parse_uint(start_tok, cmd.start)) {
            return ParseError{"ROWS: invalid start '" + std::string(start_tok) + "'"};
        }
        if (!parse_uint(count_tok, cmd.count)) {
            return ParseError{"ROWS: invalid count '" + std::string(count_tok) + "'"};
        }
        return cmd;
    }

    // ── Commands without arguments ────────────────────────────────────────────
    if (!rest.empty()) {
        static constexpr std::string_view kKnown[] = {
            "TABS", "COLLECTIONS", "WRITE", "COMMIT", "ABORT", "NEXT",
            "INSERT", "DELETE", "STATUS", "HELP", "QUIT", "EXIT"};
        for (auto known : kKnown) {
            if (verb == known) {
                return ParseError{verb + " takes no arguments"};
            }
        }
    } else {
        if (verb == "TABS")        return TabsCmd{};
        if (verb == "COLLECTIONS") return CollectionsCmd{};
        if (verb == "WRITE")       return WriteCmd{};
        if (verb == "COMMIT")      return CommitCmd{};
        if (verb == "ABORT")       return AbortCmd{};
        if (verb == "NEXT")        return NextCmd{};
        if (verb == "INSERT")      return InsertCmd{};
        if (verb == "DELETE")      return DeleteCmd{};
        if (verb == "STATUS")      return StatusCmd{};
        if (verb == "HELP")        return HelpCmd{};
        if (verb == "QUIT" || verb == "EXIT") return QuitCmd{};
    }

    return ParseError{"unknown command: " + std::string(verb_tok)};
}

std::string_view help_text() noexcept {
    return
        "OPEN [name]        show a collection (no name = {main})\n"
        "CREATE name        create a collection (needs WRITE)\n"
        "TABS               list open collections\n"
        "TAB i / CLOSE i    focus / close open collection i\n"
        "COLLECTIONS        list named collections in the store\n"
        "WRITE              start a write transaction\n"
        "COMMIT / ABORT     end the write transaction\n"
        "ROWS start count   show rows\n"
        "NEXT               show the next page\n"
        "EDIT row           copy a row into the pending entry\n"
        "KEY text           set the pending key (escaped text)\n"
        "VALUE text         set the pending value (escaped text)\n"
        "INSERT / DELETE    apply the pending entry\n"
        "STATUS             show mode, collection and pending entry\n"
        "QUIT               leave (uncommitted writes are discarded)\n"
        "Escapes: \\\\ \\t \\n \\r \\0 \\xHH\n";
}

} // namespace kvedit::cli
