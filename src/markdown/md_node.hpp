#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blockmark::markdown {

/**
 * NodeKind - the closed set of markdown node kinds the converter knows.
 * Anything the parser yields outside this set arrives as Other.
 */
enum class NodeKind {
    // Block kinds
    Document,
    Paragraph,
    Heading,
    List,
    Item,
    BlockQuote,
    CodeBlock,
    HtmlBlock,
    ThematicBreak,
    Table,
    TableRow,
    TableCell,
    // Inline kinds
    Text,
    SoftBreak,
    LineBreak,
    Code,
    HtmlInline,
    Emph,
    Strong,
    Strikethrough,
    Link,
    Image,
    Other
};

[[nodiscard]] std::string_view kind_name(NodeKind kind);

/**
 * Node - a parsed markdown node, detached from the parser that produced it.
 * Only the fields meaningful for `kind` are set.
 */
struct Node {
    NodeKind kind = NodeKind::Other;
    std::string literal;             // Text, Code, HtmlInline, HtmlBlock, CodeBlock
    std::string url;                 // Link, Image
    std::string info;                // CodeBlock fence info string
    int heading_level = 0;           // Heading
    bool ordered = false;            // List
    std::optional<bool> checked;     // Item carrying a task marker
    bool header_row = false;         // TableRow
    int start_line = 0;              // 1-based source line, 0 when unknown
    std::vector<Node> children;

    [[nodiscard]] bool is_block() const;
};

/**
 * Flatten a subtree to plain text: literals of text, code and HTML nodes;
 * breaks become newlines; sibling blocks are joined with a newline.
 */
[[nodiscard]] std::string plain_text(const Node& node);
[[nodiscard]] std::string plain_text(const std::vector<Node>& nodes);

/**
 * Trim ASCII whitespace from both ends.
 */
[[nodiscard]] std::string trim_copy(std::string_view s);

} // namespace blockmark::markdown
