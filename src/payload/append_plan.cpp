#include "payload/append_plan.hpp"

#include "payload/block_json.hpp"
#include "payload/schema_normalizer.hpp"

#include <QJsonArray>
#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(blockmarkPlanLog, "blockmark.plan")

namespace blockmark::payload {

namespace {

template <typename T>
std::vector<std::vector<T>> chunk(const std::vector<T>& items, std::size_t size) {
    std::vector<std::vector<T>> out;
    for (std::size_t offset = 0; offset < items.size(); offset += size) {
        const auto end = std::min(items.size(), offset + size);
        out.emplace_back(items.begin() + static_cast<std::ptrdiff_t>(offset),
                         items.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return out;
}

blocks::TableRow placeholder_row(int width) {
    blocks::TableRow row;
    row.cells.assign(static_cast<std::size_t>(std::max(1, width)), RichTextList{});
    return row;
}

} // namespace

std::size_t AppendPlan::block_count() const {
    std::size_t n = 0;
    for (const auto& batch : batches) n += batch.size();
    return n;
}

std::vector<std::vector<blocks::TableRow>> AppendPlan::row_batches(std::size_t index) const {
    const auto it = table_rows.find(index);
    if (it == table_rows.end()) return {};
    return chunk(it->second, batch_size);
}

AppendPlan plan_append(const std::vector<blocks::Block>& blocks, std::size_t batch_size) {
    AppendPlan plan;
    plan.batch_size = std::max<std::size_t>(1, batch_size);

    std::vector<blocks::Block> prepared;
    prepared.reserve(blocks.size());
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        const auto* table = std::get_if<blocks::Table>(&blocks[i].content);
        if (!table) {
            prepared.push_back(blocks[i]);
            continue;
        }
        qCDebug(blockmarkPlanLog) << "table at index" << i << "with" << table->rows.size() << "rows";
        plan.table_rows.emplace(i, table->rows);

        auto clone = *table;
        clone.rows = {placeholder_row(table->width)};
        prepared.push_back(blocks::make(std::move(clone)));
    }

    plan.batches = chunk(prepared, plan.batch_size);
    qCDebug(blockmarkPlanLog) << "planned" << prepared.size() << "blocks in" << plan.batches.size()
                              << "batches," << plan.table_rows.size() << "tables";
    return plan;
}

QJsonObject plan_to_json(const AppendPlan& plan) {
    QJsonArray batches;
    for (const auto& batch : plan.batches) {
        batches.append(normalize_blocks(blocks_to_json(batch)));
    }

    QJsonArray tables;
    for (const auto& [index, rows] : plan.table_rows) {
        QJsonArray row_batches;
        for (const auto& rows_batch : plan.row_batches(index)) {
            QJsonArray json_rows;
            for (const auto& row : rows_batch) {
                json_rows.append(normalize_block(block_to_json(blocks::make(row))));
            }
            row_batches.append(json_rows);
        }
        tables.append(QJsonObject{
            {QStringLiteral("index"), static_cast<qint64>(index)},
            {QStringLiteral("row_batches"), row_batches},
        });
    }

    return QJsonObject{
        {QStringLiteral("batches"), batches},
        {QStringLiteral("tables"), tables},
    };
}

} // namespace blockmark::payload
