#include <catch2/catch_test_macros.hpp>
#include "core/block_types.hpp"

using namespace blockmark;
using namespace blockmark::blocks;

TEST_CASE("BlockContent variants", "[blocks]") {
    SECTION("Paragraph") {
        BlockContent content = Paragraph{{plain_run("Some text")}};
        REQUIRE(get_type(content) == BlockType::Paragraph);
        REQUIRE(get_text(content) == "Some text");
    }

    SECTION("Heading") {
        BlockContent content = Heading{.level = 2, .rich_text = {plain_run("Title")}};
        REQUIRE(get_type(content) == BlockType::Heading2);
        REQUIRE(get_text(content) == "Title");
    }

    SECTION("Todo") {
        BlockContent content = Todo{.rich_text = {plain_run("Task")}, .checked = true};
        REQUIRE(get_type(content) == BlockType::ToDo);
        REQUIRE(get_text(content) == "Task");
        REQUIRE(std::get<Todo>(content).checked);
    }

    SECTION("Code") {
        BlockContent content = Code{.rich_text = {plain_run("int main() {}")}, .language = "cpp"};
        REQUIRE(get_type(content) == BlockType::Code);
        REQUIRE(get_text(content) == "int main() {}");
    }

    SECTION("Code defaults to plain text") {
        REQUIRE(Code{}.language == "plain text");
    }

    SECTION("Divider, table and media carry no rich text") {
        REQUIRE(get_text(Divider{}) == "");
        REQUIRE(get_rich_text(Table{}).empty());
        REQUIRE(get_rich_text(Image{MediaSource::external("https://x.io/a.png"), {plain_run("cap")}}).empty());
    }
}

TEST_CASE("Heading levels clamp into 1..3", "[blocks]") {
    REQUIRE(clamp_heading_level(-2) == 1);
    REQUIRE(clamp_heading_level(0) == 1);
    REQUIRE(clamp_heading_level(1) == 1);
    REQUIRE(clamp_heading_level(3) == 3);
    REQUIRE(clamp_heading_level(6) == 3);

    REQUIRE(get_type(Heading{.level = 5}) == BlockType::Heading3);
    REQUIRE(get_type(Heading{.level = 0}) == BlockType::Heading1);
}

TEST_CASE("BlockType wire names", "[blocks]") {
    SECTION("type_name") {
        REQUIRE(type_name(BlockType::Heading1) == "heading_1");
        REQUIRE(type_name(BlockType::ToDo) == "to_do");
        REQUIRE(type_name(BlockType::BulletedListItem) == "bulleted_list_item");
        REQUIRE(type_name(BlockType::TableRow) == "table_row");
    }

    SECTION("parse_type round-trips every tag") {
        for (auto type : {BlockType::Paragraph, BlockType::Heading1, BlockType::Heading2, BlockType::Heading3,
                          BlockType::BulletedListItem, BlockType::NumberedListItem, BlockType::ToDo,
                          BlockType::Quote, BlockType::Callout, BlockType::Code, BlockType::Divider,
                          BlockType::Table, BlockType::TableRow, BlockType::Image, BlockType::File}) {
            REQUIRE(parse_type(type_name(type)) == type);
        }
    }

    SECTION("parse_type rejects unknown names") {
        REQUIRE_FALSE(parse_type("toggle").has_value());
        REQUIRE_FALSE(parse_type("").has_value());
    }
}

TEST_CASE("fit_row reconciles cell count to the table width", "[blocks]") {
    TableRow row{{{plain_run("a")}, {plain_run("b")}, {plain_run("c")}}};

    SECTION("truncates extra cells") {
        const auto fitted = fit_row(row, 2);
        REQUIRE(fitted.cells.size() == 2);
        REQUIRE(to_plain_text(fitted.cells[1]) == "b");
    }

    SECTION("pads missing cells with one empty run") {
        const auto fitted = fit_row(row, 5);
        REQUIRE(fitted.cells.size() == 5);
        REQUIRE(fitted.cells[4].size() == 1);
        REQUIRE(fitted.cells[4][0].content.empty());
    }

    SECTION("width below one still yields one cell") {
        REQUIRE(fit_row(TableRow{}, 0).cells.size() == 1);
    }
}

TEST_CASE("Block equality", "[blocks]") {
    const auto a = make(Paragraph{{plain_run("x")}});
    const auto b = make(Paragraph{{plain_run("x")}});
    const auto c = make(Quote{{plain_run("x")}});

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
    REQUIRE(c.type() == BlockType::Quote);
}
