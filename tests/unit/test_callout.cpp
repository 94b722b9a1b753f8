#include <catch2/catch_test_macros.hpp>

#include "markdown/callout.hpp"

using namespace blockmark;
using namespace blockmark::markdown;

TEST_CASE("Callout: classify", "[callout]") {
    SECTION("type and title") {
        const auto match = classify_callout("[!WARNING] Careful");
        REQUIRE(match.has_value());
        REQUIRE(match->type == "warning");
        REQUIRE(match->title == "Careful");
        REQUIRE(match->body.empty());
        REQUIRE(match->style.icon == "⚠️");
        REQUIRE(match->style.color == Color::YellowBackground);
        REQUIRE(match->text() == "Careful");
    }

    SECTION("body lines follow the title") {
        const auto match = classify_callout("[!tip] Shortcut\nPress ctrl+k\nto search");
        REQUIRE(match.has_value());
        REQUIRE(match->type == "tip");
        REQUIRE(match->title == "Shortcut");
        REQUIRE(match->body == "Press ctrl+k\nto search");
        REQUIRE(match->text() == "Shortcut Press ctrl+k\nto search");
    }

    SECTION("missing title falls back to the type keyword") {
        const auto match = classify_callout("[!NOTE]\nRemember this");
        REQUIRE(match.has_value());
        REQUIRE(match->title.empty());
        REQUIRE(match->text() == "note Remember this");
    }

    SECTION("fold modifier is consumed") {
        const auto match = classify_callout("[!faq]- Collapsed");
        REQUIRE(match.has_value());
        REQUIRE(match->type == "faq");
        REQUIRE(match->title == "Collapsed");
    }

    SECTION("unknown types use the note style") {
        const auto match = classify_callout("[!custom] Hi");
        REQUIRE(match.has_value());
        REQUIRE(match->style.keyword == "note");
        REQUIRE(match->style.icon == "📝");
        REQUIRE(match->style.color == Color::GrayBackground);
    }

    SECTION("leading whitespace is ignored") {
        REQUIRE(classify_callout("  [!info] x").has_value());
    }
}

TEST_CASE("Callout: non-matches", "[callout]") {
    REQUIRE_FALSE(classify_callout("Just a quote").has_value());
    REQUIRE_FALSE(classify_callout("[NOTE] no bang").has_value());
    REQUIRE_FALSE(classify_callout("[!] empty type").has_value());
    REQUIRE_FALSE(classify_callout("[!not valid] spaces").has_value());
    REQUIRE_FALSE(classify_callout("[!note").has_value());
    REQUIRE_FALSE(classify_callout("text\n[!NOTE] later line").has_value());
    REQUIRE_FALSE(classify_callout("").has_value());
}

TEST_CASE("Callout: style table", "[callout]") {
    REQUIRE(callout_style("INFO").color == Color::BlueBackground);
    REQUIRE(callout_style("danger").icon == "⛔");
    REQUIRE(callout_style("danger").color == Color::RedBackground);
    REQUIRE(callout_style("done").icon == "✅");
    REQUIRE(callout_style("question").color == Color::PurpleBackground);
    REQUIRE(callout_style("help").icon == "🆘");
    REQUIRE(callout_style("quote").icon == "💬");
    REQUIRE(callout_style("caution").icon == "⚠️");
}
