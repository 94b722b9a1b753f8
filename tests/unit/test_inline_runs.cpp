#include <catch2/catch_test_macros.hpp>

#include "markdown/cmark_parser.hpp"
#include "markdown/inline_runs.hpp"

using namespace blockmark;
using namespace blockmark::markdown;

namespace {

// Runs of the first paragraph of `markdown`.
RichTextList runs_of(const std::string& markdown, const InlineStyle& style = {}) {
    const auto doc = parse_document(markdown);
    REQUIRE_FALSE(doc.children.empty());
    REQUIRE(doc.children.front().kind == NodeKind::Paragraph);
    return build_rich_text(doc.children.front().children, style);
}

} // namespace

TEST_CASE("Inline runs: emphasis sets annotations", "[inline]") {
    const auto runs = runs_of("plain **bold** *it* ~~gone~~ `code`");

    REQUIRE(runs.size() == 8);
    REQUIRE(runs[0].content == "plain ");
    REQUIRE(runs[0].annotations == Annotations{});
    REQUIRE(runs[1].content == "bold");
    REQUIRE(runs[1].annotations.bold);
    REQUIRE(runs[3].content == "it");
    REQUIRE(runs[3].annotations.italic);
    REQUIRE(runs[5].content == "gone");
    REQUIRE(runs[5].annotations.strikethrough);
    REQUIRE(runs[7].content == "code");
    REQUIRE(runs[7].annotations.code);
}

TEST_CASE("Inline runs: nested emphasis accumulates", "[inline]") {
    const auto runs = runs_of("***both***");

    REQUIRE(runs.size() == 1);
    REQUIRE(runs[0].annotations.bold);
    REQUIRE(runs[0].annotations.italic);
}

TEST_CASE("Inline runs: annotations do not leak between siblings", "[inline]") {
    const auto runs = runs_of("**a** b");

    REQUIRE(runs.size() == 2);
    REQUIRE(runs[0].annotations.bold);
    REQUIRE_FALSE(runs[1].annotations.bold);
}

TEST_CASE("Inline runs: links carry href", "[inline]") {
    const auto runs = runs_of("see [the **site**](https://example.com) now");

    REQUIRE(runs.size() == 4);
    REQUIRE_FALSE(runs[0].href.has_value());
    REQUIRE(runs[1].content == "the ");
    REQUIRE(runs[1].href == std::optional<std::string>("https://example.com"));
    REQUIRE(runs[2].content == "site");
    REQUIRE(runs[2].annotations.bold);
    REQUIRE(runs[2].href == std::optional<std::string>("https://example.com"));
    REQUIRE_FALSE(runs[3].href.has_value());
}

TEST_CASE("Inline runs: highlight delimiters", "[inline][highlight]") {
    SECTION("==text== becomes a highlighted run with delimiters stripped") {
        const auto runs = runs_of("a ==marked== b");

        REQUIRE(runs.size() == 3);
        REQUIRE(runs[0].content == "a ");
        REQUIRE(runs[1].content == "marked");
        REQUIRE(runs[1].annotations.color == Color::YellowBackground);
        REQUIRE(runs[2].content == " b");
        REQUIRE(runs[2].annotations.color == Color::Default);
    }

    SECTION("emphasis inside a highlight keeps both") {
        const auto runs = runs_of("==**bold** and *it*==");

        REQUIRE(runs.size() == 3);
        REQUIRE(runs[0].content == "bold");
        REQUIRE(runs[0].annotations.bold);
        REQUIRE(runs[0].annotations.color == Color::YellowBackground);
        REQUIRE(runs[1].content == " and ");
        REQUIRE(runs[1].annotations.color == Color::YellowBackground);
        REQUIRE(runs[2].content == "it");
        REQUIRE(runs[2].annotations.italic);
        REQUIRE(runs[2].annotations.color == Color::YellowBackground);
    }

    SECTION("highlight color is configurable") {
        const auto runs = runs_of("==x==", InlineStyle{.highlight_color = Color::PinkBackground});
        REQUIRE(runs.size() == 1);
        REQUIRE(runs[0].annotations.color == Color::PinkBackground);
    }

    SECTION("an unpaired delimiter stays literal") {
        const auto runs = runs_of("a == b");
        REQUIRE(runs.size() == 1);
        REQUIRE(runs[0].content == "a == b");
        REQUIRE(runs[0].annotations.color == Color::Default);
    }

    SECTION("an empty pair stays literal") {
        const auto runs = runs_of("x ==== y");
        REQUIRE(to_plain_text(runs) == "x ==== y");
        for (const auto& run : runs) {
            REQUIRE(run.annotations.color == Color::Default);
        }
    }

    SECTION("code spans are not scanned") {
        const auto runs = runs_of("`a ==b== c`");
        REQUIRE(runs.size() == 1);
        REQUIRE(runs[0].content == "a ==b== c");
        REQUIRE(runs[0].annotations.code);
        REQUIRE(runs[0].annotations.color == Color::Default);
    }
}

TEST_CASE("Inline runs: html tags", "[inline][html]") {
    SECTION("<mark> highlights") {
        const auto runs = runs_of("a <mark>hot</mark> b");
        REQUIRE(to_plain_text(runs) == "a hot b");
        REQUIRE(runs[1].content == "hot");
        REQUIRE(runs[1].annotations.color == Color::YellowBackground);
    }

    SECTION("<u> underlines") {
        const auto runs = runs_of("a <u>under</u> b");
        REQUIRE(runs.size() == 3);
        REQUIRE(runs[1].content == "under");
        REQUIRE(runs[1].annotations.underline);
        REQUIRE_FALSE(runs[2].annotations.underline);
    }

    SECTION("<br> breaks the line") {
        const auto runs = runs_of("one<br>two");
        REQUIRE(to_plain_text(runs) == "one\ntwo");
    }

    SECTION("other tags stay literal") {
        const auto runs = runs_of("a <span>b</span>");
        REQUIRE(to_plain_text(runs) == "a <span>b</span>");
    }
}

TEST_CASE("Inline runs: breaks become newlines", "[inline]") {
    REQUIRE(to_plain_text(runs_of("one\ntwo")) == "one\ntwo");
    REQUIRE(to_plain_text(runs_of("one  \ntwo")) == "one\ntwo");
}

TEST_CASE("Inline runs: never empty", "[inline]") {
    const auto runs = build_rich_text(std::vector<Node>{}, InlineStyle{});
    REQUIRE(runs.size() == 1);
    REQUIRE(runs[0].content.empty());
}

TEST_CASE("Inline runs: literal text scans highlights only", "[inline]") {
    const auto runs = build_rich_text(std::string_view("**not bold** ==yes=="), InlineStyle{});
    REQUIRE(runs.size() == 2);
    REQUIRE(runs[0].content == "**not bold** ");
    REQUIRE_FALSE(runs[0].annotations.bold);
    REQUIRE(runs[1].content == "yes");
    REQUIRE(runs[1].annotations.color == Color::YellowBackground);
}

TEST_CASE("rewrite_mark_tags", "[inline][html]") {
    REQUIRE(rewrite_mark_tags("<mark>") == "==");
    REQUIRE(rewrite_mark_tags("<MARK class=\"x\">") == "==");
    REQUIRE(rewrite_mark_tags("</mark >") == "==");
    REQUIRE(rewrite_mark_tags("<marker>") == "<marker>");
    REQUIRE(rewrite_mark_tags("<b>") == "<b>");
}
