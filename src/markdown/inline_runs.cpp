#include "markdown/inline_runs.hpp"

#include <QRegularExpression>
#include <QString>

#include <optional>

namespace blockmark::markdown {

namespace {

constexpr std::string_view kHighlightDelimiter = "==";

enum class Marker {
    None,
    UnderlineOpen,
    UnderlineClose
};

// One leaf of the flattened inline tree. `scan` marks text that may carry
// highlight delimiters (code spans do not).
struct Piece {
    std::string text;
    Annotations annotations;
    std::optional<std::string> href;
    bool scan = false;
    Marker marker = Marker::None;
};

struct Delimiter {
    size_t piece = 0;
    size_t offset = 0;    // within the piece
    size_t position = 0;  // within the flattened text
    bool active = false;
};

QString lower_tag(std::string_view html) {
    return QString::fromUtf8(html.data(), static_cast<qsizetype>(html.size())).trimmed().toLower();
}

bool is_line_break_tag(const QString& tag) {
    static const QRegularExpression re(QStringLiteral(R"(^<br\s*/?>$)"));
    return re.match(tag).hasMatch();
}

class Flattener {
public:
    std::vector<Piece> pieces;

    void walk(const std::vector<Node>& nodes, const Annotations& ann, const std::optional<std::string>& href) {
        const Node* previous = nullptr;
        for (const auto& node : nodes) {
            // Sibling blocks (paragraphs of one quote or list item) are
            // separated by a newline, matching plain_text().
            if (previous && previous->is_block() && node.is_block()) {
                add("\n", ann, href, false);
            }
            walk(node, ann, href);
            previous = &node;
        }
    }

    void walk(const Node& node, const Annotations& ann, const std::optional<std::string>& href) {
        switch (node.kind) {
            case NodeKind::Text:
                add(node.literal, ann, href, true);
                break;
            case NodeKind::HtmlInline:
            case NodeKind::HtmlBlock:
                add_html(node.literal, ann, href);
                break;
            case NodeKind::Code:
                add(node.literal, ann.with_code(), href, false);
                break;
            case NodeKind::CodeBlock:
                add(node.literal, ann, href, false);
                break;
            case NodeKind::SoftBreak:
            case NodeKind::LineBreak:
                add("\n", ann, href, false);
                break;
            case NodeKind::Emph:
                walk(node.children, ann.with_italic(), href);
                break;
            case NodeKind::Strong:
                walk(node.children, ann.with_bold(), href);
                break;
            case NodeKind::Strikethrough:
                walk(node.children, ann.with_strikethrough(), href);
                break;
            case NodeKind::Link:
                walk(node.children, ann, std::optional<std::string>(node.url));
                break;
            case NodeKind::Document:
            case NodeKind::Paragraph:
            case NodeKind::Heading:
            case NodeKind::List:
            case NodeKind::Item:
            case NodeKind::BlockQuote:
            case NodeKind::ThematicBreak:
            case NodeKind::Table:
            case NodeKind::TableRow:
            case NodeKind::TableCell:
            case NodeKind::Image:
            case NodeKind::Other:
                walk(node.children, ann, href);
                break;
        }
    }

    void add(std::string text, const Annotations& ann, const std::optional<std::string>& href, bool scan) {
        pieces.push_back(Piece{std::move(text), ann, href, scan, Marker::None});
    }

private:
    void add_html(const std::string& literal, const Annotations& ann, const std::optional<std::string>& href) {
        const auto tag = lower_tag(literal);
        if (tag == QStringLiteral("<u>")) {
            pieces.push_back(Piece{{}, ann, href, false, Marker::UnderlineOpen});
            return;
        }
        if (tag == QStringLiteral("</u>")) {
            pieces.push_back(Piece{{}, ann, href, false, Marker::UnderlineClose});
            return;
        }
        if (is_line_break_tag(tag)) {
            add("\n", ann, href, false);
            return;
        }
        add(rewrite_mark_tags(literal), ann, href, true);
    }
};

// Pair delimiters left to right: each delimiter opens a span closed by the
// next one, provided at least one character lies between them. A delimiter
// that cannot pair stays literal text.
std::vector<Delimiter> find_delimiters(const std::vector<Piece>& pieces) {
    std::vector<Delimiter> found;
    size_t base = 0;
    for (size_t i = 0; i < pieces.size(); ++i) {
        const auto& piece = pieces[i];
        if (piece.scan) {
            size_t pos = piece.text.find(kHighlightDelimiter);
            while (pos != std::string::npos) {
                found.push_back(Delimiter{i, pos, base + pos, false});
                pos = piece.text.find(kHighlightDelimiter, pos + kHighlightDelimiter.size());
            }
        }
        base += piece.text.size();
    }

    size_t k = 0;
    while (k + 1 < found.size()) {
        const auto open_end = found[k].position + kHighlightDelimiter.size();
        if (found[k + 1].position > open_end) {
            found[k].active = true;
            found[k + 1].active = true;
            k += 2;
        } else {
            ++k;
        }
    }
    return found;
}

class Emitter {
public:
    explicit Emitter(const InlineStyle& style) : style_(style) {}

    RichTextList build(const std::vector<Piece>& pieces) {
        const auto delimiters = find_delimiters(pieces);
        size_t next = 0;

        for (size_t i = 0; i < pieces.size(); ++i) {
            const auto& piece = pieces[i];
            if (piece.marker == Marker::UnderlineOpen) {
                ++underline_depth_;
                continue;
            }
            if (piece.marker == Marker::UnderlineClose) {
                if (underline_depth_ > 0) --underline_depth_;
                continue;
            }

            size_t cursor = 0;
            while (next < delimiters.size() && delimiters[next].piece == i) {
                const auto& d = delimiters[next++];
                if (!d.active) continue;
                push(piece, piece.text.substr(cursor, d.offset - cursor));
                highlighted_ = !highlighted_;
                cursor = d.offset + kHighlightDelimiter.size();
            }
            push(piece, piece.text.substr(cursor));
        }

        if (runs_.empty()) {
            runs_.push_back(plain_run(""));
        }
        return std::move(runs_);
    }

private:
    void push(const Piece& piece, std::string content) {
        if (content.empty()) return;
        auto ann = piece.annotations;
        if (underline_depth_ > 0) ann = ann.with_underline();
        if (highlighted_) ann = ann.with_color(style_.highlight_color);
        runs_.push_back(RichText{std::move(content), ann, piece.href});
    }

    const InlineStyle& style_;
    RichTextList runs_;
    bool highlighted_ = false;
    int underline_depth_ = 0;
};

} // namespace

RichTextList build_rich_text(const std::vector<Node>& inlines, const InlineStyle& style) {
    Flattener flattener;
    flattener.walk(inlines, Annotations{}, std::nullopt);
    return Emitter(style).build(flattener.pieces);
}

RichTextList build_rich_text(std::string_view text, const InlineStyle& style) {
    Flattener flattener;
    flattener.add(std::string(text), Annotations{}, std::nullopt, true);
    return Emitter(style).build(flattener.pieces);
}

std::string rewrite_mark_tags(std::string_view html) {
    static const QRegularExpression open(QStringLiteral(R"(<mark\b[^>]*>)"),
                                         QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression close(QStringLiteral(R"(</mark\s*>)"),
                                          QRegularExpression::CaseInsensitiveOption);

    auto text = QString::fromUtf8(html.data(), static_cast<qsizetype>(html.size()));
    if (!text.contains(QStringLiteral("mark"), Qt::CaseInsensitive)) {
        return std::string(html);
    }
    text.replace(open, QStringLiteral("=="));
    text.replace(close, QStringLiteral("=="));
    return text.toStdString();
}

} // namespace blockmark::markdown
