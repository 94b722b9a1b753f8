#pragma once

#include "core/block_types.hpp"

#include <QJsonArray>
#include <QJsonObject>

#include <vector>

namespace blockmark::payload {

/**
 * Serialize typed blocks into the request shape of the block API:
 *
 *   { "object": "block", "type": "<tag>", "<tag>": { ...payload } }
 *
 * Rich text runs become
 *
 *   { "type": "text", "text": { "content", "link"? }, "annotations",
 *     "plain_text", "href"? }
 */
[[nodiscard]] QJsonObject rich_text_to_json(const RichText& run);
[[nodiscard]] QJsonArray rich_text_to_json(const RichTextList& runs);
[[nodiscard]] QJsonObject block_to_json(const blocks::Block& block);
[[nodiscard]] QJsonArray blocks_to_json(const std::vector<blocks::Block>& blocks);

} // namespace blockmark::payload
