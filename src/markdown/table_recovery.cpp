#include "markdown/table_recovery.hpp"

#include "markdown/md_node.hpp"

#include <QLoggingCategory>

#include <exception>

Q_LOGGING_CATEGORY(blockmarkTableLog, "blockmark.table")

namespace blockmark::markdown {

namespace {

constexpr int kSeparatorLookahead = 10;

enum class ScanState {
    SeekingHeader,
    SeekingSeparator,
    CollectingRows,
    Done,
    Aborted
};

bool has_pipe(std::string_view line) {
    return line.find('|') != std::string_view::npos;
}

bool is_blank(std::string_view line) {
    return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (true) {
        const auto nl = text.find('\n', pos);
        auto line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    return lines;
}

size_t run_length(std::string_view s, size_t at, char ch) {
    size_t n = 0;
    while (at + n < s.size() && s[at + n] == ch) ++n;
    return n;
}

// True when a backtick run of exactly `len` starts somewhere after `from`.
bool has_closing_ticks(std::string_view s, size_t from, size_t len) {
    size_t i = from;
    while (i < s.size()) {
        if (s[i] == '`') {
            const auto n = run_length(s, i, '`');
            if (n == len) return true;
            i += n;
        } else {
            ++i;
        }
    }
    return false;
}

bool is_dash_group(std::string_view group) {
    const auto cell = trim_copy(group);
    std::string_view g(cell);
    if (!g.empty() && g.front() == ':') g.remove_prefix(1);
    if (!g.empty() && g.back() == ':') g.remove_suffix(1);
    return !g.empty() && g.find_first_not_of('-') == std::string_view::npos;
}

blocks::TableRow literal_row(const std::vector<std::string>& cells, int width) {
    blocks::TableRow row;
    row.cells.reserve(cells.size());
    for (const auto& cell : cells) {
        row.cells.push_back(RichTextList{plain_run(cell)});
    }
    return blocks::fit_row(std::move(row), width);
}

} // namespace

std::vector<std::string> split_table_row(std::string_view line) {
    std::vector<std::string> cells;
    std::string current;
    size_t code_ticks = 0;  // length of the open code span fence, 0 outside code
    int wiki_depth = 0;

    for (size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];

        // Outside code spans a backslash escapes the next pipe or backtick.
        if (code_ticks == 0 && ch == '\\' && i + 1 < line.size() &&
            (line[i + 1] == '|' || line[i + 1] == '`')) {
            if (line[i + 1] == '|') {
                current += '|';
            } else {
                current += "\\`";
            }
            ++i;
            continue;
        }

        if (ch == '`') {
            const auto n = run_length(line, i, '`');
            if (code_ticks == 0 && has_closing_ticks(line, i + n, n)) {
                code_ticks = n;
            } else if (code_ticks == n) {
                code_ticks = 0;
            }
            current.append(line.substr(i, n));
            i += n - 1;
            continue;
        }

        if (code_ticks > 0) {
            current += ch;
            continue;
        }

        if (ch == '[' && i + 1 < line.size() && line[i + 1] == '[' &&
            line.find("]]", i + 2) != std::string_view::npos) {
            ++wiki_depth;
            current += "[[";
            ++i;
            continue;
        }

        if (ch == ']' && wiki_depth > 0 && i + 1 < line.size() && line[i + 1] == ']') {
            --wiki_depth;
            current += "]]";
            ++i;
            continue;
        }

        if (ch == '|' && wiki_depth == 0) {
            cells.push_back(trim_copy(current));
            current.clear();
            continue;
        }

        current += ch;
    }
    cells.push_back(trim_copy(current));

    if (cells.size() > 1 && cells.front().empty()) {
        cells.erase(cells.begin());
    }
    if (cells.size() > 1 && cells.back().empty()) {
        cells.pop_back();
    }
    return cells;
}

bool is_strict_separator(std::string_view line) {
    if (!has_pipe(line)) return false;
    const auto trimmed = trim_copy(line);
    std::string_view body(trimmed);
    if (!body.empty() && body.front() == '|') body.remove_prefix(1);
    if (!body.empty() && body.back() == '|') body.remove_suffix(1);
    if (body.empty()) return false;

    size_t pos = 0;
    while (true) {
        const auto bar = body.find('|', pos);
        const auto group = body.substr(pos, bar == std::string_view::npos ? std::string_view::npos : bar - pos);
        if (!is_dash_group(group)) return false;
        if (bar == std::string_view::npos) return true;
        pos = bar + 1;
    }
}

bool is_loose_separator(std::string_view line) {
    return has_pipe(line) && line.find("---") != std::string_view::npos;
}

std::optional<std::vector<blocks::TableRow>> recover_table_rows(std::string_view source, int start_line, int width) {
    if (start_line < 1) return std::nullopt;

    const auto lines = split_lines(source);
    std::vector<std::vector<std::string>> raw_rows;

    auto state = ScanState::SeekingHeader;
    size_t header = 0;
    size_t i = static_cast<size_t>(start_line - 1);

    while (i < lines.size() && state != ScanState::Done && state != ScanState::Aborted) {
        const auto line = lines[i];
        switch (state) {
            case ScanState::SeekingHeader:
                if (has_pipe(line)) {
                    header = i;
                    raw_rows.push_back(split_table_row(line));
                    state = ScanState::SeekingSeparator;
                }
                ++i;
                break;
            case ScanState::SeekingSeparator:
                if (i > header + kSeparatorLookahead || !has_pipe(line)) {
                    state = ScanState::Aborted;
                    break;
                }
                if (is_strict_separator(line) || is_loose_separator(line)) {
                    state = ScanState::CollectingRows;
                }
                ++i;
                break;
            case ScanState::CollectingRows:
                if (is_blank(line) || !has_pipe(line)) {
                    state = ScanState::Done;
                    break;
                }
                raw_rows.push_back(split_table_row(line));
                ++i;
                break;
            case ScanState::Done:
            case ScanState::Aborted:
                break;
        }
    }

    if (state == ScanState::SeekingHeader || state == ScanState::SeekingSeparator ||
        state == ScanState::Aborted) {
        return std::nullopt;
    }

    std::vector<blocks::TableRow> rows;
    rows.reserve(raw_rows.size());
    for (const auto& cells : raw_rows) {
        rows.push_back(literal_row(cells, width));
    }
    return rows;
}

bool repair_table(blocks::Table& table, std::string_view source, int start_line) {
    if (table.rows.size() > 1 || start_line < 1) {
        return false;
    }

    try {
        auto recovered = recover_table_rows(source, start_line, table.width);
        if (!recovered || recovered->size() <= 1) {
            qCDebug(blockmarkTableLog) << "table at line" << start_line << "not recoverable; keeping parsed rows";
            return false;
        }
        qCDebug(blockmarkTableLog) << "recovered" << recovered->size() << "rows for table at line" << start_line
                                   << "(parser returned" << table.rows.size() << ")";
        table.rows = std::move(*recovered);
        // Recovery always starts from the header line.
        table.has_column_header = true;
        return true;
    } catch (const std::exception& e) {
        qCDebug(blockmarkTableLog) << "table recovery failed at line" << start_line << ":" << e.what();
        return false;
    }
}

} // namespace blockmark::markdown
