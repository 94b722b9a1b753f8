#pragma once

#include "core/rich_text.hpp"
#include "markdown/md_node.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace blockmark::markdown {

struct InlineStyle {
    // Color forced onto `==highlighted==` spans.
    Color highlight_color = Color::YellowBackground;
};

/**
 * Convert inline nodes into styled runs, left to right.
 *
 * Emphasis, strong, strikethrough and inline code map onto annotations;
 * a link sets the href of everything beneath it. Text and inline HTML are
 * scanned for `==highlight==` delimiters (and `<mark>` tags, rewritten to
 * delimiters first); delimiters pair in document order across nodes, so a
 * highlight may enclose emphasis. Never returns an empty list.
 */
[[nodiscard]] RichTextList build_rich_text(const std::vector<Node>& inlines,
                                           const InlineStyle& style = {});

/**
 * Runs for a literal string, with highlight scanning but no markdown.
 */
[[nodiscard]] RichTextList build_rich_text(std::string_view text,
                                           const InlineStyle& style = {});

/**
 * Rewrite `<mark ...>` and `</mark>` tags to the `==` delimiter.
 */
[[nodiscard]] std::string rewrite_mark_tags(std::string_view html);

} // namespace blockmark::markdown
