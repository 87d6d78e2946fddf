#include "cli/repl.hpp"

#include <format>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>

namespace kvedit::cli {

Repl::Repl(editor::Editor& editor, std::ostream& out)
    : editor_(editor)
    , out_(out)
{
}

void Repl::run(std::istream& in, const std::string& prompt) {
    std::string line;
    while (true) {
        if (!prompt.empty()) {
            out_ << prompt << std::flush;
        }
        if (!std::getline(in, line)) {
            if (!prompt.empty()) {
                out_ << '\n';
            }
            break;
        }
        if (line.empty()) {
            continue;
        }
        if (!execute_line(line)) {
            break;
        }
    }
}

bool Repl::execute_line(std::string_view line) {
    auto parse_result = parse_command(line);
    if (auto* err = std::get_if<ParseError>(&parse_result)) {
        out_ << "ERROR " << err->message << '\n';
        return true;
    }
    return execute(std::get<Command>(parse_result));
}

bool Repl::execute(const Command& cmd) {
    return std::visit(
        [this](const auto& c) -> bool {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, OpenCmd>) {
                auto index = editor_.select_collection(c.name);
                if (index) {
                    out_ << std::format("OK [{}] {}\n", *index, editor_.focused_pane().title());
                } else if (editor_.last_error()) {
                    print_result(editor_.last_error_code());
                } else {
                    out_ << "NOT_FOUND " << c.name << '\n';
                }

            } else if constexpr (std::is_same_v<T, CreateCmd>) {
                if (auto ec = editor_.create_collection(c.name)) {
                    print_result(ec);
                } else {
                    out_ << std::format("OK [{}] {}\n", editor_.focused_index(),
                                        editor_.focused_pane().title());
                }

            } else if constexpr (std::is_same_v<T, CloseCmd>) {
                print_result(editor_.close_pane(c.index));

            } else if constexpr (std::is_same_v<T, TabCmd>) {
                print_result(editor_.focus(c.index));

            } else if constexpr (std::is_same_v<T, TabsCmd>) {
                const auto titles = editor_.pane_titles();
                for (std::size_t i = 0; i < titles.size(); ++i) {
                    out_ << std::format("{}[{}] {}\n",
                                        i == editor_.focused_index() ? '*' : ' ', i, titles[i]);
                }

            } else if constexpr (std::is_same_v<T, CollectionsCmd>) {
                const auto names = editor_.collection_names();
                if (editor_.last_error()) {
                    print_result(editor_.last_error_code());
                } else {
                    out_ << editor::kMainCollectionLabel << '\n';
                    for (const auto& name : names) {
                        out_ << name << '\n';
                    }
                }

            } else if constexpr (std::is_same_v<T, WriteCmd>) {
                print_result(editor_.begin_write());

            } else if constexpr (std::is_same_v<T, CommitCmd>) {
                print_result(editor_.commit());

            } else if constexpr (std::is_same_v<T, AbortCmd>) {
                print_result(editor_.abort());

            } else if constexpr (std::is_same_v<T, RowsCmd>) {
                print_view(editor_.request_rows(c.start, c.count));

            } else if constexpr (std::is_same_v<T, NextCmd>) {
                print_view(editor_.next_page());

            } else if constexpr (std::is_same_v<T, EditCmd>) {
                if (auto ec = editor_.stage_row(c.row)) {
                    print_result(ec);
                } else {
                    out_ << "KEY " << editor_.buffer().key_text() << '\n'
                         << "VALUE " << editor_.buffer().value_text() << '\n';
                }

            } else if constexpr (std::is_same_v<T, KeyCmd>) {
                editor_.set_key_text(c.text);
                out_ << "OK\n";

            } else if constexpr (std::is_same_v<T, ValueCmd>) {
                editor_.set_value_text(c.text);
                out_ << "OK\n";

            } else if constexpr (std::is_same_v<T, InsertCmd>) {
                print_result(editor_.insert());

            } else if constexpr (std::is_same_v<T, DeleteCmd>) {
                print_result(editor_.remove());

            } else if constexpr (std::is_same_v<T, StatusCmd>) {
                print_status();

            } else if constexpr (std::is_same_v<T, HelpCmd>) {
                out_ << help_text();

            } else if constexpr (std::is_same_v<T, QuitCmd>) {
                return false;
            }
            return true;
        },
        cmd);
}

void Repl::print_view(const editor::View& view) {
    if (view.last_error) {
        print_result(editor_.last_error_code());
    }
    for (const auto& row : view.rows) {
        out_ << row.index << '\t' << row.key << '\t' << row.value << '\n';
    }
    if (view.rows.empty()) {
        out_ << std::format("-- no rows from {} of {} in {} ({}) --\n",
                            view.first_row, view.total_row_count, view.collection,
                            editor::to_string(view.mode));
    } else {
        out_ << std::format("-- rows {}..{} of {} in {} ({}) --\n",
                            view.rows.front().index, view.rows.back().index,
                            view.total_row_count, view.collection,
                            editor::to_string(view.mode));
    }
}

void Repl::print_result(const std::error_code& ec) {
    if (!ec) {
        out_ << "OK\n";
        return;
    }

    out_ << "ERROR " << to_string(error_kind(ec)) << ": " << ec.message();
    if (ec == Errc::decode_failed) {
        if (const auto& detail = editor_.buffer().last_decode_error()) {
            out_ << std::format(" at offset {}: {}", detail->position, detail->message);
        }
    }
    out_ << '\n';
}

void Repl::print_status() {
    const auto view = editor_.status();
    out_ << "mode: " << editor::to_string(view.mode) << '\n'
         << std::format("collection: {} (pane {} of {})\n", view.collection,
                        editor_.focused_index(), editor_.pane_count())
         << "rows: " << view.total_row_count << '\n'
         << "key: " << editor_.buffer().key_text() << '\n'
         << "value: " << editor_.buffer().value_text() << '\n';
    if (view.last_error) {
        print_result(editor_.last_error_code());
    }
}

} // namespace kvedit::cli
