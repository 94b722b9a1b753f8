#pragma once

#include "core/block_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blockmark::markdown {

/**
 * Split one pipe-table line into trimmed cells. A pipe does not split when
 * it is escaped with a backslash, inside a backtick code span, or inside a
 * `[[...]]` wiki link. One empty leading and one empty trailing cell (the
 * outer pipes) are dropped. Escaped pipes come back unescaped; an escaped
 * backtick is kept as written and never opens a code span.
 */
[[nodiscard]] std::vector<std::string> split_table_row(std::string_view line);

/**
 * `| :--- | ---: |`: pipe-delimited groups of dashes with optional colons.
 */
[[nodiscard]] bool is_strict_separator(std::string_view line);

/**
 * Any line with a pipe and a run of at least three dashes.
 */
[[nodiscard]] bool is_loose_separator(std::string_view line);

/**
 * Re-derive table rows straight from the source text, starting at the
 * 1-based `start_line` of the table node. Returns the header row plus every
 * contiguous data row below the separator, each fitted to `width` literal
 * cells, or nullopt when no header/separator pair is found.
 */
[[nodiscard]] std::optional<std::vector<blocks::TableRow>> recover_table_rows(
    std::string_view source, int start_line, int width);

/**
 * Repair a table whose parse looks truncated (at most one row) by replacing
 * its rows with recovered ones, when recovery finds more than one row.
 * Tables parsed with two or more rows are left alone. Returns true when
 * the rows were replaced.
 */
bool repair_table(blocks::Table& table, std::string_view source, int start_line);

} // namespace blockmark::markdown
