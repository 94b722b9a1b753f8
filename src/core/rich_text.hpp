#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blockmark {

/**
 * Color - the API's closed color palette. Foreground colors tint text;
 * the *Background family highlights a span or tints a callout.
 */
enum class Color {
    Default,
    Gray,
    Brown,
    Orange,
    Yellow,
    Green,
    Blue,
    Purple,
    Pink,
    Red,
    GrayBackground,
    BrownBackground,
    OrangeBackground,
    YellowBackground,
    GreenBackground,
    BlueBackground,
    PurpleBackground,
    PinkBackground,
    RedBackground
};

/**
 * Wire name of a color, e.g. "yellow_background".
 */
[[nodiscard]] std::string_view color_name(Color color);

/**
 * Parse a wire color name. Returns nullopt for names outside the palette.
 */
[[nodiscard]] std::optional<Color> parse_color(std::string_view name);

/**
 * Annotations - the full formatting state of one run. Always fully
 * populated; the with_* helpers return an extended copy so a recursion
 * never mutates what its caller holds.
 */
struct Annotations {
    bool bold = false;
    bool italic = false;
    bool strikethrough = false;
    bool underline = false;
    bool code = false;
    Color color = Color::Default;

    [[nodiscard]] Annotations with_bold() const { auto a = *this; a.bold = true; return a; }
    [[nodiscard]] Annotations with_italic() const { auto a = *this; a.italic = true; return a; }
    [[nodiscard]] Annotations with_strikethrough() const { auto a = *this; a.strikethrough = true; return a; }
    [[nodiscard]] Annotations with_underline() const { auto a = *this; a.underline = true; return a; }
    [[nodiscard]] Annotations with_code() const { auto a = *this; a.code = true; return a; }
    [[nodiscard]] Annotations with_color(Color c) const { auto a = *this; a.color = c; return a; }

    bool operator==(const Annotations&) const = default;
};

/**
 * RichText - a contiguous span of text sharing one annotation set.
 */
struct RichText {
    std::string content;
    Annotations annotations;
    std::optional<std::string> href;

    bool operator==(const RichText&) const = default;
};

using RichTextList = std::vector<RichText>;

/**
 * A single run of literal text with default annotations.
 */
[[nodiscard]] inline RichText plain_run(std::string content) {
    return RichText{std::move(content), Annotations{}, std::nullopt};
}

/**
 * Concatenated content of all runs.
 */
[[nodiscard]] inline std::string to_plain_text(const RichTextList& runs) {
    std::string out;
    for (const auto& run : runs) {
        out += run.content;
    }
    return out;
}

} // namespace blockmark
