#pragma once

#include "core/rich_text.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace blockmark::markdown {

struct CalloutStyle {
    std::string_view keyword;  // canonical keyword, e.g. "warning"
    std::string_view icon;     // emoji glyph
    Color color;
};

/**
 * Look up a callout keyword (case-insensitive). Unknown keywords resolve
 * to the note style.
 */
[[nodiscard]] CalloutStyle callout_style(std::string_view type);

/**
 * A blockquote recognised as `[!TYPE]<modifier> title` followed by body
 * lines.
 */
struct CalloutMatch {
    std::string type;   // lower-cased TYPE as written
    std::string title;  // rest of the first line, trimmed; may be empty
    std::string body;   // remaining lines, trimmed; may be empty
    CalloutStyle style;

    /**
     * Text of the callout: title (the type keyword when no title was
     * written), then a space and the body when there is one.
     */
    [[nodiscard]] std::string text() const;
};

/**
 * Classify a blockquote by its flattened plain text. Returns nullopt when
 * the first line does not open with `[!TYPE]`.
 */
[[nodiscard]] std::optional<CalloutMatch> classify_callout(std::string_view plain);

} // namespace blockmark::markdown
