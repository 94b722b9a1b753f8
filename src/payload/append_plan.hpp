#pragma once

#include "core/block_types.hpp"

#include <QJsonObject>

#include <cstddef>
#include <map>
#include <vector>

namespace blockmark::payload {

// Most children the block API accepts in one append request.
inline constexpr std::size_t kMaxAppendBatch = 100;

/**
 * AppendPlan - how a converted document is sent to the block API.
 *
 * Tables must be created with at least one row and a request carries at
 * most kMaxAppendBatch children, so each table goes out with a single
 * placeholder row; its real rows are appended to the created table
 * afterwards, in batches of the same size.
 */
struct AppendPlan {
    std::vector<std::vector<blocks::Block>> batches;
    // Index into the original block list -> that table's real rows.
    std::map<std::size_t, std::vector<blocks::TableRow>> table_rows;
    std::size_t batch_size = kMaxAppendBatch;

    [[nodiscard]] std::size_t block_count() const;

    /**
     * The real rows of table `index` split into append batches.
     */
    [[nodiscard]] std::vector<std::vector<blocks::TableRow>> row_batches(std::size_t index) const;
};

/**
 * Plan the append of `blocks`. A zero batch size is treated as 1.
 */
[[nodiscard]] AppendPlan plan_append(const std::vector<blocks::Block>& blocks,
                                     std::size_t batch_size = kMaxAppendBatch);

/**
 * { "batches": [[block...]...], "tables": [{ "index", "row_batches": [[row...]...] }] }
 */
[[nodiscard]] QJsonObject plan_to_json(const AppendPlan& plan);

} // namespace blockmark::payload
