#include "core/rich_text.hpp"

#include <array>
#include <utility>

namespace blockmark {

namespace {

constexpr std::array<std::pair<Color, std::string_view>, 19> kColorNames{{
    {Color::Default, "default"},
    {Color::Gray, "gray"},
    {Color::Brown, "brown"},
    {Color::Orange, "orange"},
    {Color::Yellow, "yellow"},
    {Color::Green, "green"},
    {Color::Blue, "blue"},
    {Color::Purple, "purple"},
    {Color::Pink, "pink"},
    {Color::Red, "red"},
    {Color::GrayBackground, "gray_background"},
    {Color::BrownBackground, "brown_background"},
    {Color::OrangeBackground, "orange_background"},
    {Color::YellowBackground, "yellow_background"},
    {Color::GreenBackground, "green_background"},
    {Color::BlueBackground, "blue_background"},
    {Color::PurpleBackground, "purple_background"},
    {Color::PinkBackground, "pink_background"},
    {Color::RedBackground, "red_background"},
}};

} // namespace

std::string_view color_name(Color color) {
    for (const auto& [c, name] : kColorNames) {
        if (c == color) return name;
    }
    return "default";
}

std::optional<Color> parse_color(std::string_view name) {
    for (const auto& [c, n] : kColorNames) {
        if (n == name) return c;
    }
    return std::nullopt;
}

} // namespace blockmark
