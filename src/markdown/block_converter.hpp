#pragma once

#include "core/block_types.hpp"
#include "markdown/asset_resolver.hpp"
#include "markdown/inline_runs.hpp"
#include "markdown/md_node.hpp"

#include <string_view>
#include <vector>

namespace blockmark::markdown {

struct ConverterOptions {
    InlineStyle inline_style;
    // Optional; without it local image paths stay external links.
    AssetResolver* resolver = nullptr;
};

/**
 * BlockConverter - walks a parsed markdown document in order and emits
 * typed blocks. Lists are flattened depth-first: a nested list's items
 * follow their parent item directly.
 *
 * The converter keeps no state between calls; each convert() works on its
 * own list-frame stack and output.
 */
class BlockConverter {
public:
    explicit BlockConverter(ConverterOptions options = {});

    /**
     * Parse `markdown` with cmark-gfm and convert it.
     */
    [[nodiscard]] std::vector<blocks::Block> convert(std::string_view markdown) const;

    /**
     * Convert an already parsed document. `source` is the text `document`
     * was parsed from; table recovery reads it by line number.
     */
    [[nodiscard]] std::vector<blocks::Block> convert(const Node& document, std::string_view source) const;

private:
    ConverterOptions options_;
};

/**
 * True for absolute http:// and https:// URLs (case-insensitive scheme).
 */
[[nodiscard]] bool is_remote_url(std::string_view url);

} // namespace blockmark::markdown
