#include "payload/converter.hpp"

#include "markdown/block_converter.hpp"
#include "payload/block_json.hpp"
#include "payload/schema_normalizer.hpp"

namespace blockmark::payload {

std::vector<blocks::Block> convert_blocks(std::string_view markdown, const ConvertOptions& options) {
    const auto document = apply_front_matter_handling(markdown, options.front_matter);

    const markdown::BlockConverter converter(markdown::ConverterOptions{
        .inline_style = markdown::InlineStyle{.highlight_color = options.highlight_color},
        .resolver = options.resolver,
    });
    return converter.convert(document);
}

QJsonArray convert(std::string_view markdown, const ConvertOptions& options) {
    return normalize_blocks(blocks_to_json(convert_blocks(markdown, options)));
}

} // namespace blockmark::payload
