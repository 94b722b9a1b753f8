#include "payload/schema_normalizer.hpp"

#include <QString>

namespace blockmark::payload {

namespace {

const QString kDefaultColor = QStringLiteral("default");
const QString kPlainText = QStringLiteral("plain text");

void ensure_array(QJsonObject& obj, const QString& key) {
    if (!obj.value(key).isArray()) obj[key] = QJsonArray{};
}

void ensure_bool(QJsonObject& obj, const QString& key, bool fallback) {
    if (!obj.value(key).isBool()) obj[key] = fallback;
}

void ensure_string(QJsonObject& obj, const QString& key, const QString& fallback) {
    const auto value = obj.value(key);
    if (!value.isString() || value.toString().isEmpty()) obj[key] = fallback;
}

QJsonObject payload(const QJsonObject& block, const QString& key) {
    return block.value(key).toObject();
}

void normalize_text(QJsonObject& block, const QString& key) {
    auto p = payload(block, key);
    ensure_array(p, QStringLiteral("rich_text"));
    ensure_string(p, QStringLiteral("color"), kDefaultColor);
    block[key] = p;
}

void normalize_media(QJsonObject& block, const QString& key) {
    auto p = payload(block, key);
    const auto type = p.value(QStringLiteral("type")).toString();
    if (type == QStringLiteral("file_upload") && p.value(QStringLiteral("file_upload")).isObject()) {
        // already a valid upload reference
    } else if (type == QStringLiteral("external") && p.value(QStringLiteral("external")).isObject()) {
        auto external = p.value(QStringLiteral("external")).toObject();
        if (!external.value(QStringLiteral("url")).isString()) external[QStringLiteral("url")] = QString();
        p[QStringLiteral("external")] = external;
    } else {
        p.remove(QStringLiteral("file_upload"));
        p[QStringLiteral("type")] = QStringLiteral("external");
        p[QStringLiteral("external")] = QJsonObject{{QStringLiteral("url"), QString()}};
    }
    ensure_array(p, QStringLiteral("caption"));
    block[key] = p;
}

void normalize_table(QJsonObject& block) {
    const auto key = QStringLiteral("table");
    auto p = payload(block, key);
    if (!p.value(QStringLiteral("table_width")).isDouble() || p.value(QStringLiteral("table_width")).toInt() < 1) {
        p[QStringLiteral("table_width")] = 1;
    }
    ensure_bool(p, QStringLiteral("has_column_header"), true);
    ensure_bool(p, QStringLiteral("has_row_header"), false);
    ensure_array(p, QStringLiteral("children"));
    p[QStringLiteral("children")] = normalize_blocks(p.value(QStringLiteral("children")).toArray());
    block[key] = p;
    block.remove(QStringLiteral("children"));
}

} // namespace

QJsonObject normalize_block(QJsonObject block) {
    block[QStringLiteral("object")] = QStringLiteral("block");
    const auto type = block.value(QStringLiteral("type")).toString();

    if (type == QStringLiteral("paragraph") || type == QStringLiteral("quote") ||
        type == QStringLiteral("bulleted_list_item") || type == QStringLiteral("numbered_list_item") ||
        type == QStringLiteral("callout")) {
        normalize_text(block, type);
    } else if (type.startsWith(QStringLiteral("heading_"))) {
        normalize_text(block, type);
        auto p = payload(block, type);
        ensure_bool(p, QStringLiteral("is_toggleable"), false);
        block[type] = p;
    } else if (type == QStringLiteral("to_do")) {
        normalize_text(block, type);
        auto p = payload(block, type);
        ensure_bool(p, QStringLiteral("checked"), false);
        block[type] = p;
    } else if (type == QStringLiteral("code")) {
        auto p = payload(block, type);
        ensure_array(p, QStringLiteral("rich_text"));
        ensure_string(p, QStringLiteral("language"), kPlainText);
        ensure_array(p, QStringLiteral("caption"));
        block[type] = p;
    } else if (type == QStringLiteral("image") || type == QStringLiteral("file")) {
        normalize_media(block, type);
    } else if (type == QStringLiteral("divider")) {
        block[type] = QJsonObject{};
    } else if (type == QStringLiteral("table")) {
        normalize_table(block);
    } else if (type == QStringLiteral("table_row")) {
        auto p = payload(block, type);
        ensure_array(p, QStringLiteral("cells"));
        block[type] = p;
    }
    return block;
}

QJsonArray normalize_blocks(const QJsonArray& blocks) {
    QJsonArray out;
    for (const auto& value : blocks) {
        out.append(value.isObject() ? QJsonValue(normalize_block(value.toObject())) : value);
    }
    return out;
}

} // namespace blockmark::payload
