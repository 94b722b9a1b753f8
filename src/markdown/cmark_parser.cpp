#include "markdown/cmark_parser.hpp"

#include <cmark-gfm.h>
#include <cmark-gfm-core-extensions.h>

#include <QLoggingCategory>

#include <cstring>
#include <memory>

Q_LOGGING_CATEGORY(blockmarkParseLog, "blockmark.parse")

namespace blockmark::markdown {

namespace {

struct ParserDeleter {
    void operator()(cmark_parser* p) const { cmark_parser_free(p); }
};

struct NodeDeleter {
    void operator()(cmark_node* n) const { cmark_node_free(n); }
};

using ParserPtr = std::unique_ptr<cmark_parser, ParserDeleter>;
using DocumentPtr = std::unique_ptr<cmark_node, NodeDeleter>;

constexpr const char* kExtensions[] = {"table", "strikethrough", "tasklist"};

// Deeper subtrees collapse into one text node; the tree walks downstream
// recurse once per level.
constexpr int kMaxNestingDepth = 256;

std::string str_or_empty(const char* s) {
    return s ? std::string(s) : std::string();
}

bool type_string_is(cmark_node* node, const char* expected) {
    const char* s = cmark_node_get_type_string(node);
    return s && std::strcmp(s, expected) == 0;
}

// Extension node types are assigned at registration time, so they are
// matched by their type string rather than by enum value.
NodeKind extension_kind(cmark_node* node) {
    if (type_string_is(node, "table")) return NodeKind::Table;
    if (type_string_is(node, "table_row") || type_string_is(node, "table_header")) return NodeKind::TableRow;
    if (type_string_is(node, "table_cell")) return NodeKind::TableCell;
    if (type_string_is(node, "strikethrough")) return NodeKind::Strikethrough;
    return NodeKind::Other;
}

NodeKind kind_of(cmark_node* node) {
    switch (cmark_node_get_type(node)) {
        case CMARK_NODE_DOCUMENT: return NodeKind::Document;
        case CMARK_NODE_PARAGRAPH: return NodeKind::Paragraph;
        case CMARK_NODE_HEADING: return NodeKind::Heading;
        case CMARK_NODE_LIST: return NodeKind::List;
        case CMARK_NODE_ITEM: return NodeKind::Item;
        case CMARK_NODE_BLOCK_QUOTE: return NodeKind::BlockQuote;
        case CMARK_NODE_CODE_BLOCK: return NodeKind::CodeBlock;
        case CMARK_NODE_HTML_BLOCK: return NodeKind::HtmlBlock;
        case CMARK_NODE_THEMATIC_BREAK: return NodeKind::ThematicBreak;
        case CMARK_NODE_TEXT: return NodeKind::Text;
        case CMARK_NODE_SOFTBREAK: return NodeKind::SoftBreak;
        case CMARK_NODE_LINEBREAK: return NodeKind::LineBreak;
        case CMARK_NODE_CODE: return NodeKind::Code;
        case CMARK_NODE_HTML_INLINE: return NodeKind::HtmlInline;
        case CMARK_NODE_EMPH: return NodeKind::Emph;
        case CMARK_NODE_STRONG: return NodeKind::Strong;
        case CMARK_NODE_LINK: return NodeKind::Link;
        case CMARK_NODE_IMAGE: return NodeKind::Image;
        default: return extension_kind(node);
    }
}

// Literal text of a subtree, collected with cmark's iterator so arbitrarily
// deep input never recurses.
std::string flatten_literals(cmark_node* root) {
    std::string out;
    cmark_iter* iter = cmark_iter_new(root);
    cmark_event_type event;
    while ((event = cmark_iter_next(iter)) != CMARK_EVENT_DONE) {
        if (event != CMARK_EVENT_ENTER) continue;
        cmark_node* current = cmark_iter_get_node(iter);
        switch (cmark_node_get_type(current)) {
            case CMARK_NODE_SOFTBREAK:
            case CMARK_NODE_LINEBREAK:
                out += '\n';
                break;
            default:
                if (const char* literal = cmark_node_get_literal(current)) out += literal;
                break;
        }
    }
    cmark_iter_free(iter);
    return out;
}

Node detach(cmark_node* source, int depth) {
    if (depth > kMaxNestingDepth) {
        qCDebug(blockmarkParseLog) << "nesting deeper than" << kMaxNestingDepth << "at line"
                                   << cmark_node_get_start_line(source) << "kept as text";
        return Node{
            .kind = NodeKind::Text,
            .literal = flatten_literals(source),
            .start_line = cmark_node_get_start_line(source),
        };
    }

    Node node;
    node.kind = kind_of(source);
    node.start_line = cmark_node_get_start_line(source);

    switch (node.kind) {
        case NodeKind::Text:
        case NodeKind::Code:
        case NodeKind::HtmlInline:
        case NodeKind::HtmlBlock:
            node.literal = str_or_empty(cmark_node_get_literal(source));
            break;
        case NodeKind::CodeBlock:
            node.literal = str_or_empty(cmark_node_get_literal(source));
            node.info = str_or_empty(cmark_node_get_fence_info(source));
            break;
        case NodeKind::Heading:
            node.heading_level = cmark_node_get_heading_level(source);
            break;
        case NodeKind::List:
            node.ordered = cmark_node_get_list_type(source) == CMARK_ORDERED_LIST;
            break;
        case NodeKind::Item:
            if (type_string_is(source, "tasklist")) {
                node.checked = cmark_gfm_extensions_get_tasklist_item_checked(source);
            }
            break;
        case NodeKind::TableRow:
            node.header_row = cmark_gfm_extensions_get_table_row_is_header(source) != 0;
            break;
        case NodeKind::Link:
        case NodeKind::Image:
            node.url = str_or_empty(cmark_node_get_url(source));
            break;
        default:
            break;
    }

    for (cmark_node* child = cmark_node_first_child(source); child; child = cmark_node_next(child)) {
        node.children.push_back(detach(child, depth + 1));
    }
    return node;
}

} // namespace

Node parse_document(std::string_view markdown) {
    cmark_gfm_core_extensions_ensure_registered();

    ParserPtr parser(cmark_parser_new(CMARK_OPT_DEFAULT));
    if (!parser) {
        qCWarning(blockmarkParseLog) << "cmark_parser_new failed; returning empty document";
        return Node{.kind = NodeKind::Document};
    }

    for (const char* name : kExtensions) {
        if (auto* ext = cmark_find_syntax_extension(name)) {
            cmark_parser_attach_syntax_extension(parser.get(), ext);
        } else {
            qCWarning(blockmarkParseLog) << "cmark-gfm extension not available:" << name;
        }
    }

    cmark_parser_feed(parser.get(), markdown.data(), markdown.size());
    DocumentPtr doc(cmark_parser_finish(parser.get()));
    if (!doc) {
        return Node{.kind = NodeKind::Document};
    }
    // cmark splits text at every would-be delimiter; merge the fragments.
    cmark_consolidate_text_nodes(doc.get());

    auto root = detach(doc.get(), 0);
    qCDebug(blockmarkParseLog) << "parsed document with" << root.children.size() << "top-level nodes";
    return root;
}

} // namespace blockmark::markdown
