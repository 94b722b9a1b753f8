#pragma once

#include "markdown/md_node.hpp"

#include <string_view>

namespace blockmark::markdown {

/**
 * Parse markdown with cmark-gfm (table, strikethrough and tasklist
 * extensions attached) and detach the result into a Node tree rooted at a
 * Document node. Never throws on malformed input. Nodes nested more than
 * 256 levels deep collapse into one Text node holding their literal text.
 */
[[nodiscard]] Node parse_document(std::string_view markdown);

} // namespace blockmark::markdown
