#include "payload/block_json.hpp"

#include <QString>

#include <type_traits>
#include <variant>

namespace blockmark::payload {

namespace {

QString qstr(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

QJsonObject annotations_to_json(const Annotations& a) {
    return QJsonObject{
        {QStringLiteral("bold"), a.bold},
        {QStringLiteral("italic"), a.italic},
        {QStringLiteral("strikethrough"), a.strikethrough},
        {QStringLiteral("underline"), a.underline},
        {QStringLiteral("code"), a.code},
        {QStringLiteral("color"), qstr(color_name(a.color))},
    };
}

QJsonObject text_payload(const RichTextList& runs, Color color) {
    return QJsonObject{
        {QStringLiteral("rich_text"), rich_text_to_json(runs)},
        {QStringLiteral("color"), qstr(color_name(color))},
    };
}

QJsonObject media_payload(const blocks::MediaSource& source, const RichTextList& caption) {
    QJsonObject payload;
    if (source.kind == blocks::MediaSource::Kind::FileUpload) {
        payload[QStringLiteral("type")] = QStringLiteral("file_upload");
        payload[QStringLiteral("file_upload")] = QJsonObject{{QStringLiteral("id"), qstr(source.value)}};
    } else {
        payload[QStringLiteral("type")] = QStringLiteral("external");
        payload[QStringLiteral("external")] = QJsonObject{{QStringLiteral("url"), qstr(source.value)}};
    }
    payload[QStringLiteral("caption")] = rich_text_to_json(caption);
    return payload;
}

QJsonObject row_payload(const blocks::TableRow& row) {
    QJsonArray cells;
    for (const auto& cell : row.cells) {
        cells.append(rich_text_to_json(cell));
    }
    return QJsonObject{{QStringLiteral("cells"), cells}};
}

QJsonObject payload_of(const blocks::BlockContent& content) {
    return std::visit([](const auto& c) -> QJsonObject {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, blocks::Heading>) {
            auto payload = text_payload(c.rich_text, c.color);
            payload[QStringLiteral("is_toggleable")] = c.is_toggleable;
            return payload;
        } else if constexpr (std::is_same_v<T, blocks::Todo>) {
            auto payload = text_payload(c.rich_text, c.color);
            payload[QStringLiteral("checked")] = c.checked;
            return payload;
        } else if constexpr (std::is_same_v<T, blocks::Callout>) {
            auto payload = text_payload(c.rich_text, c.color);
            payload[QStringLiteral("icon")] = QJsonObject{
                {QStringLiteral("type"), QStringLiteral("emoji")},
                {QStringLiteral("emoji"), qstr(c.icon)},
            };
            return payload;
        } else if constexpr (std::is_same_v<T, blocks::Code>) {
            return QJsonObject{
                {QStringLiteral("rich_text"), rich_text_to_json(c.rich_text)},
                {QStringLiteral("language"), qstr(c.language)},
                {QStringLiteral("caption"), rich_text_to_json(c.caption)},
            };
        } else if constexpr (std::is_same_v<T, blocks::Divider>) {
            return QJsonObject{};
        } else if constexpr (std::is_same_v<T, blocks::Table>) {
            QJsonArray children;
            for (const auto& row : c.rows) {
                children.append(block_to_json(blocks::make(row)));
            }
            return QJsonObject{
                {QStringLiteral("table_width"), c.width},
                {QStringLiteral("has_column_header"), c.has_column_header},
                {QStringLiteral("has_row_header"), c.has_row_header},
                {QStringLiteral("children"), children},
            };
        } else if constexpr (std::is_same_v<T, blocks::TableRow>) {
            return row_payload(c);
        } else if constexpr (std::is_same_v<T, blocks::Image> || std::is_same_v<T, blocks::File>) {
            return media_payload(c.source, c.caption);
        } else {
            // Paragraph, list items, quote
            return text_payload(c.rich_text, c.color);
        }
    }, content);
}

} // namespace

QJsonObject rich_text_to_json(const RichText& run) {
    const auto content = qstr(run.content);
    QJsonObject text{{QStringLiteral("content"), content}};
    if (run.href) {
        text[QStringLiteral("link")] = QJsonObject{{QStringLiteral("url"), qstr(*run.href)}};
    }

    QJsonObject out{
        {QStringLiteral("type"), QStringLiteral("text")},
        {QStringLiteral("text"), text},
        {QStringLiteral("annotations"), annotations_to_json(run.annotations)},
        {QStringLiteral("plain_text"), content},
    };
    if (run.href) {
        out[QStringLiteral("href")] = qstr(*run.href);
    }
    return out;
}

QJsonArray rich_text_to_json(const RichTextList& runs) {
    QJsonArray out;
    for (const auto& run : runs) {
        out.append(rich_text_to_json(run));
    }
    return out;
}

QJsonObject block_to_json(const blocks::Block& block) {
    const auto tag = qstr(blocks::type_name(block.type()));
    return QJsonObject{
        {QStringLiteral("object"), QStringLiteral("block")},
        {QStringLiteral("type"), tag},
        {tag, payload_of(block.content)},
    };
}

QJsonArray blocks_to_json(const std::vector<blocks::Block>& blocks) {
    QJsonArray out;
    for (const auto& block : blocks) {
        out.append(block_to_json(block));
    }
    return out;
}

} // namespace blockmark::payload
