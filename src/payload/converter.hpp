#pragma once

#include "core/block_types.hpp"
#include "core/front_matter.hpp"
#include "core/rich_text.hpp"
#include "markdown/asset_resolver.hpp"

#include <QJsonArray>

#include <string_view>
#include <vector>

namespace blockmark::payload {

struct ConvertOptions {
    // Optional; local images stay external links without one.
    markdown::AssetResolver* resolver = nullptr;
    FrontMatterHandling front_matter = FrontMatterHandling::Remove;
    Color highlight_color = Color::YellowBackground;
};

/**
 * Convert a markdown document into normalized block API payloads.
 *
 * Never throws for malformed markdown. Exceptions raised by the resolver
 * propagate unchanged.
 */
[[nodiscard]] QJsonArray convert(std::string_view markdown, const ConvertOptions& options = {});

/**
 * The typed blocks convert() serializes.
 */
[[nodiscard]] std::vector<blocks::Block> convert_blocks(std::string_view markdown,
                                                        const ConvertOptions& options = {});

} // namespace blockmark::payload
