#include "markdown/md_node.hpp"

namespace blockmark::markdown {

std::string_view kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Document: return "document";
        case NodeKind::Paragraph: return "paragraph";
        case NodeKind::Heading: return "heading";
        case NodeKind::List: return "list";
        case NodeKind::Item: return "item";
        case NodeKind::BlockQuote: return "block_quote";
        case NodeKind::CodeBlock: return "code_block";
        case NodeKind::HtmlBlock: return "html_block";
        case NodeKind::ThematicBreak: return "thematic_break";
        case NodeKind::Table: return "table";
        case NodeKind::TableRow: return "table_row";
        case NodeKind::TableCell: return "table_cell";
        case NodeKind::Text: return "text";
        case NodeKind::SoftBreak: return "softbreak";
        case NodeKind::LineBreak: return "linebreak";
        case NodeKind::Code: return "code";
        case NodeKind::HtmlInline: return "html_inline";
        case NodeKind::Emph: return "emph";
        case NodeKind::Strong: return "strong";
        case NodeKind::Strikethrough: return "strikethrough";
        case NodeKind::Link: return "link";
        case NodeKind::Image: return "image";
        case NodeKind::Other: return "other";
    }
    return "other";
}

bool Node::is_block() const {
    switch (kind) {
        case NodeKind::Document:
        case NodeKind::Paragraph:
        case NodeKind::Heading:
        case NodeKind::List:
        case NodeKind::Item:
        case NodeKind::BlockQuote:
        case NodeKind::CodeBlock:
        case NodeKind::HtmlBlock:
        case NodeKind::ThematicBreak:
        case NodeKind::Table:
        case NodeKind::TableRow:
        case NodeKind::TableCell:
            return true;
        default:
            return false;
    }
}

std::string plain_text(const Node& node) {
    switch (node.kind) {
        case NodeKind::Text:
        case NodeKind::Code:
        case NodeKind::HtmlInline:
        case NodeKind::HtmlBlock:
        case NodeKind::CodeBlock:
            return node.literal;
        case NodeKind::SoftBreak:
        case NodeKind::LineBreak:
            return "\n";
        default:
            return plain_text(node.children);
    }
}

std::string plain_text(const std::vector<Node>& nodes) {
    std::string out;
    const Node* previous = nullptr;
    for (const auto& child : nodes) {
        if (previous && previous->is_block() && child.is_block()) {
            out += '\n';
        }
        out += plain_text(child);
        previous = &child;
    }
    return out;
}

std::string trim_copy(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

} // namespace blockmark::markdown
