#include "markdown/block_converter.hpp"

#include "markdown/callout.hpp"
#include "markdown/cmark_parser.hpp"
#include "markdown/table_recovery.hpp"

#include <QEventLoop>
#include <QFutureWatcher>
#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cctype>

Q_LOGGING_CATEGORY(blockmarkConvertLog, "blockmark.convert")

namespace blockmark::markdown {

namespace {

constexpr std::string_view kPlainTextLanguage = "plain text";

struct ListFrame {
    bool ordered = false;
    std::vector<blocks::Block> items;
};

bool is_blank_inline(const Node& node) {
    switch (node.kind) {
        case NodeKind::SoftBreak:
        case NodeKind::LineBreak:
            return true;
        case NodeKind::Text:
            return trim_copy(node.literal).empty();
        default:
            return false;
    }
}

// A paragraph holding nothing but images (cmark never puts an image at
// block level) converts to one image block per image.
bool is_image_paragraph(const Node& paragraph) {
    bool any_image = false;
    for (const auto& child : paragraph.children) {
        if (child.kind == NodeKind::Image) {
            any_image = true;
        } else if (!is_blank_inline(child)) {
            return false;
        }
    }
    return any_image;
}

std::string code_language(const std::string& info) {
    const auto trimmed = trim_copy(info);
    const auto end = trimmed.find_first_of(" \t");
    auto language = trimmed.substr(0, end);
    if (language.empty()) {
        return std::string(kPlainTextLanguage);
    }
    for (auto& ch : language) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return language;
}

std::string code_content(std::string literal) {
    if (!literal.empty() && literal.back() == '\n') {
        literal.pop_back();
    }
    return literal;
}

// Resolvers may finish their promise from a slot on this thread, so the
// wait spins a local event loop instead of blocking. Exceptions stored in
// the future propagate from result().
std::optional<AssetResolution> await_resolution(QFuture<std::optional<AssetResolution>> future) {
    if (!future.isFinished()) {
        QEventLoop loop;
        QFutureWatcher<std::optional<AssetResolution>> watcher;
        QObject::connect(&watcher, &QFutureWatcherBase::finished, &loop, &QEventLoop::quit);
        watcher.setFuture(future);
        if (!future.isFinished()) {
            loop.exec();
        }
    }
    future.waitForFinished();
    return future.resultCount() > 0 ? future.result() : std::optional<AssetResolution>{};
}

// One conversion: the list-frame stack and the output it feeds.
class Dispatcher {
public:
    Dispatcher(const ConverterOptions& options, std::string_view source)
        : options_(options), source_(source) {}

    std::vector<blocks::Block> run(const Node& document) {
        for (const auto& node : document.children) {
            dispatch(node);
        }
        flush_lists();
        return std::move(out_);
    }

private:
    void dispatch(const Node& node) {
        switch (node.kind) {
            case NodeKind::Heading:
                on_heading(node);
                break;
            case NodeKind::Paragraph:
                on_paragraph(node);
                break;
            case NodeKind::List:
                on_list(node);
                break;
            case NodeKind::Item:
                on_item(node);
                break;
            case NodeKind::BlockQuote:
                on_blockquote(node);
                break;
            case NodeKind::CodeBlock:
                on_code(node);
                break;
            case NodeKind::ThematicBreak:
                flush_lists();
                append(blocks::make(blocks::Divider{}));
                break;
            case NodeKind::Table:
                on_table(node);
                break;
            case NodeKind::Image:
                flush_lists();
                on_image(node);
                break;
            case NodeKind::Link:
                // Links only mean something inside inline content.
                break;
            case NodeKind::Document:
            case NodeKind::HtmlBlock:
            case NodeKind::TableRow:
            case NodeKind::TableCell:
            case NodeKind::Text:
            case NodeKind::SoftBreak:
            case NodeKind::LineBreak:
            case NodeKind::Code:
            case NodeKind::HtmlInline:
            case NodeKind::Emph:
            case NodeKind::Strong:
            case NodeKind::Strikethrough:
            case NodeKind::Other:
                on_other(node);
                break;
        }
    }

    void on_heading(const Node& node) {
        flush_lists();
        append(blocks::make(blocks::Heading{
            .level = blocks::clamp_heading_level(node.heading_level),
            .rich_text = rich_text(node.children),
        }));
    }

    void on_paragraph(const Node& node) {
        flush_lists();
        if (is_image_paragraph(node)) {
            for (const auto& child : node.children) {
                if (child.kind == NodeKind::Image) on_image(child);
            }
            return;
        }
        if (trim_copy(plain_text(node)).empty()) {
            qCDebug(blockmarkConvertLog) << "dropping empty paragraph at line" << node.start_line;
            return;
        }
        append(blocks::make(blocks::Paragraph{.rich_text = rich_text(node.children)}));
    }

    void on_list(const Node& node) {
        frames_.push_back(ListFrame{node.ordered, {}});
        for (const auto& child : node.children) {
            dispatch(child);
        }
        // A nested list folds into its parent frame right away, so its
        // items sit directly under the parent item. Top-level frames stay
        // open until a non-list sibling flushes them.
        if (frames_.size() > 1) {
            auto finished = std::move(frames_.back());
            frames_.pop_back();
            auto& parent = frames_.back().items;
            for (auto& item : finished.items) {
                parent.push_back(std::move(item));
            }
        }
    }

    void on_item(const Node& node) {
        if (frames_.empty()) {
            // An item outside any list; give it an unordered frame.
            frames_.push_back(ListFrame{false, {}});
        }

        std::vector<Node> content;
        std::vector<const Node*> nested;
        for (const auto& child : node.children) {
            if (child.kind == NodeKind::List) {
                nested.push_back(&child);
            } else {
                content.push_back(child);
            }
        }

        auto text = rich_text(content);
        blocks::Block item;
        if (node.checked.has_value()) {
            item = blocks::make(blocks::Todo{.rich_text = std::move(text), .checked = *node.checked});
        } else if (frames_.back().ordered) {
            item = blocks::make(blocks::NumberedListItem{.rich_text = std::move(text)});
        } else {
            item = blocks::make(blocks::BulletedListItem{.rich_text = std::move(text)});
        }
        frames_.back().items.push_back(std::move(item));

        for (const auto* list : nested) {
            on_list(*list);
        }
    }

    void on_blockquote(const Node& node) {
        flush_lists();
        if (auto callout = classify_callout(plain_text(node))) {
            qCDebug(blockmarkConvertLog) << "callout" << QString::fromStdString(callout->type)
                                         << "at line" << node.start_line;
            append(blocks::make(blocks::Callout{
                .rich_text = build_rich_text(callout->text(), options_.inline_style),
                .icon = std::string(callout->style.icon),
                .color = callout->style.color,
            }));
            return;
        }
        append(blocks::make(blocks::Quote{.rich_text = rich_text(node.children)}));
    }

    void on_code(const Node& node) {
        flush_lists();
        append(blocks::make(blocks::Code{
            .rich_text = RichTextList{plain_run(code_content(node.literal))},
            .language = code_language(node.info),
        }));
    }

    void on_table(const Node& node) {
        flush_lists();

        blocks::Table table;
        if (!node.children.empty()) {
            const auto& header = node.children.front();
            table.width = std::max(1, static_cast<int>(header.children.size()));
            table.has_column_header = header.header_row;
        }
        for (const auto& row_node : node.children) {
            blocks::TableRow row;
            for (const auto& cell : row_node.children) {
                row.cells.push_back(rich_text(cell.children));
            }
            table.rows.push_back(blocks::fit_row(std::move(row), table.width));
        }

        repair_table(table, source_, node.start_line);
        append(blocks::make(std::move(table)));
    }

    void on_image(const Node& node) {
        const auto alt = trim_copy(plain_text(node.children));
        blocks::Image image{blocks::MediaSource::external(node.url), {}};
        if (!alt.empty()) {
            image.caption.push_back(plain_run(alt));
        }

        if (!is_remote_url(node.url) && options_.resolver) {
            qCDebug(blockmarkConvertLog) << "resolving local asset" << QString::fromStdString(node.url);
            const auto resolution = await_resolution(options_.resolver->resolve(node.url));
            if (resolution && resolution->kind == AssetResolution::Kind::Image) {
                image.source = blocks::MediaSource::upload(resolution->upload_id);
                if (image.caption.empty() && resolution->caption && !resolution->caption->empty()) {
                    image.caption.push_back(plain_run(*resolution->caption));
                }
            }
        }
        append(blocks::make(std::move(image)));
    }

    void on_other(const Node& node) {
        flush_lists();
        if (trim_copy(plain_text(node)).empty()) {
            return;
        }
        qCDebug(blockmarkConvertLog) << "converting" << kind_name(node.kind).data() << "at line"
                                     << node.start_line << "as paragraph";
        append(blocks::make(blocks::Paragraph{.rich_text = rich_text(std::vector<Node>{node})}));
    }

    RichTextList rich_text(const std::vector<Node>& nodes) const {
        return build_rich_text(nodes, options_.inline_style);
    }

    void append(blocks::Block block) {
        out_.push_back(std::move(block));
    }

    // Drain every open frame, oldest first.
    void flush_lists() {
        for (auto& frame : frames_) {
            for (auto& item : frame.items) {
                out_.push_back(std::move(item));
            }
        }
        frames_.clear();
    }

    const ConverterOptions& options_;
    std::string_view source_;
    std::vector<ListFrame> frames_;
    std::vector<blocks::Block> out_;
};

} // namespace

bool is_remote_url(std::string_view url) {
    const auto starts_with = [url](std::string_view prefix) {
        if (url.size() < prefix.size()) return false;
        for (size_t i = 0; i < prefix.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(url[i])) != prefix[i]) return false;
        }
        return true;
    };
    return starts_with("http://") || starts_with("https://");
}

BlockConverter::BlockConverter(ConverterOptions options)
    : options_(options) {
}

std::vector<blocks::Block> BlockConverter::convert(std::string_view markdown) const {
    return convert(parse_document(markdown), markdown);
}

std::vector<blocks::Block> BlockConverter::convert(const Node& document, std::string_view source) const {
    auto blocks = Dispatcher(options_, source).run(document);
    qCDebug(blockmarkConvertLog) << "converted document into" << blocks.size() << "blocks";
    return blocks;
}

} // namespace blockmark::markdown
