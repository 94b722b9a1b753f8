#pragma once

#include <QJsonArray>
#include <QJsonObject>

namespace blockmark::payload {

/**
 * Guarantee the structural minimum the block API expects: `object: "block"`,
 * a payload object for the block's type, arrays where arrays are required
 * and valid scalar defaults. Table rows are normalized recursively and a
 * top-level `children` key on a table is dropped (rows live in
 * `table.children`). Blocks of unknown type only get `object` set.
 *
 * normalize_block(normalize_block(b)) == normalize_block(b).
 */
[[nodiscard]] QJsonObject normalize_block(QJsonObject block);
[[nodiscard]] QJsonArray normalize_blocks(const QJsonArray& blocks);

} // namespace blockmark::payload
