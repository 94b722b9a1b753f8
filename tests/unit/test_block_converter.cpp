#include <catch2/catch_test_macros.hpp>

#include "markdown/block_converter.hpp"

using namespace blockmark;
using namespace blockmark::blocks;
using namespace blockmark::markdown;

namespace {

std::vector<Block> convert(const std::string& markdown) {
    return BlockConverter().convert(markdown);
}

std::vector<BlockType> types_of(const std::vector<Block>& blocks) {
    std::vector<BlockType> out;
    for (const auto& block : blocks) out.push_back(block.type());
    return out;
}

std::vector<std::string> texts_of(const std::vector<Block>& blocks) {
    std::vector<std::string> out;
    for (const auto& block : blocks) out.push_back(get_text(block.content));
    return out;
}

} // namespace

TEST_CASE("BlockConverter: headings", "[converter]") {
    const auto blocks = convert("# One\n## Two\n### Three\n#### Four\n###### Six\n");

    REQUIRE(types_of(blocks) == std::vector<BlockType>{
        BlockType::Heading1, BlockType::Heading2, BlockType::Heading3, BlockType::Heading3, BlockType::Heading3});
    REQUIRE(texts_of(blocks) == std::vector<std::string>{"One", "Two", "Three", "Four", "Six"});
}

TEST_CASE("BlockConverter: paragraphs and dividers", "[converter]") {
    const auto blocks = convert("first\nline\n\n---\n\nsecond\n");

    REQUIRE(types_of(blocks) == std::vector<BlockType>{BlockType::Paragraph, BlockType::Divider, BlockType::Paragraph});
    REQUIRE(get_text(blocks[0].content) == "first\nline");
}

TEST_CASE("BlockConverter: whitespace-only nodes are dropped", "[converter]") {
    Node document{.kind = NodeKind::Document};
    Node blank{.kind = NodeKind::Paragraph};
    blank.children.push_back(Node{.kind = NodeKind::Text, .literal = "   "});
    blank.children.push_back(Node{.kind = NodeKind::SoftBreak});
    document.children.push_back(blank);
    Node other{.kind = NodeKind::Other};
    other.children.push_back(Node{.kind = NodeKind::Text, .literal = "\t"});
    document.children.push_back(other);

    REQUIRE(BlockConverter().convert(document, "").empty());
}

TEST_CASE("BlockConverter: column header follows the first row", "[converter][table]") {
    const auto table_of = [](bool header_row) {
        Node row{.kind = NodeKind::TableRow, .header_row = header_row};
        for (const char* text : {"a", "b"}) {
            Node cell{.kind = NodeKind::TableCell};
            cell.children.push_back(Node{.kind = NodeKind::Text, .literal = text});
            row.children.push_back(cell);
        }
        Node table{.kind = NodeKind::Table};
        table.children.push_back(row);
        table.children.push_back(row);
        Node document{.kind = NodeKind::Document};
        document.children.push_back(table);
        const auto blocks = BlockConverter().convert(document, "");
        REQUIRE(blocks.size() == 1);
        return std::get<Table>(blocks[0].content);
    };

    REQUIRE(table_of(true).has_column_header);
    REQUIRE_FALSE(table_of(false).has_column_header);
    REQUIRE(table_of(false).width == 2);
}

TEST_CASE("BlockConverter: deeply nested input", "[converter]") {
    SECTION("quotes nested far beyond the depth limit") {
        const auto blocks = convert(std::string(100000, '>') + " deep\n");
        REQUIRE(types_of(blocks) == std::vector<BlockType>{BlockType::Quote});
        REQUIRE(get_text(blocks[0].content) == "deep");
    }

    SECTION("nested lists keep their text") {
        std::string markdown;
        for (int level = 0; level < 400; ++level) {
            markdown += std::string(static_cast<size_t>(level) * 2, ' ') + "- item\n";
        }
        const auto blocks = convert(markdown);
        REQUIRE_FALSE(blocks.empty());
        REQUIRE(get_text(blocks.front().content) == "item");
    }
}

TEST_CASE("BlockConverter: lists", "[converter][lists]") {
    SECTION("nested items flatten depth-first") {
        const auto blocks = convert("- item1\n  - sub1\n  - sub2\n- item2\n");
        REQUIRE(texts_of(blocks) == std::vector<std::string>{"item1", "sub1", "sub2", "item2"});
        REQUIRE(types_of(blocks) == std::vector<BlockType>(4, BlockType::BulletedListItem));
    }

    SECTION("ordered lists become numbered items") {
        const auto blocks = convert("1. one\n2. two\n   - inner\n");
        REQUIRE(types_of(blocks) == std::vector<BlockType>{
            BlockType::NumberedListItem, BlockType::NumberedListItem, BlockType::BulletedListItem});
    }

    SECTION("task items become to-dos") {
        const auto blocks = convert("- [ ] open\n- [x] closed\n- plain\n");
        REQUIRE(types_of(blocks) == std::vector<BlockType>{BlockType::ToDo, BlockType::ToDo, BlockType::BulletedListItem});
        REQUIRE_FALSE(std::get<Todo>(blocks[0].content).checked);
        REQUIRE(std::get<Todo>(blocks[1].content).checked);
        REQUIRE(get_text(blocks[1].content) == "closed");
    }

    SECTION("a following block flushes the list first") {
        const auto blocks = convert("- a\n- b\n\n# After\n");
        REQUIRE(texts_of(blocks) == std::vector<std::string>{"a", "b", "After"});
    }

    SECTION("loose items keep their paragraphs on separate lines") {
        const auto blocks = convert("- first\n\n  second\n");
        REQUIRE(blocks.size() == 1);
        REQUIRE(get_text(blocks[0].content) == "first\nsecond");
    }
}

TEST_CASE("BlockConverter: quotes and callouts", "[converter][callout]") {
    SECTION("plain blockquote") {
        const auto blocks = convert("> quoted *text*\n");
        REQUIRE(types_of(blocks) == std::vector<BlockType>{BlockType::Quote});
        const auto runs = std::get<Quote>(blocks[0].content).rich_text;
        REQUIRE(to_plain_text(runs) == "quoted text");
        REQUIRE(runs.back().annotations.italic);
    }

    SECTION("callout blockquote") {
        const auto blocks = convert("> [!WARNING] Careful\n> Hot ==surface==\n");
        REQUIRE(types_of(blocks) == std::vector<BlockType>{BlockType::Callout});
        const auto& callout = std::get<Callout>(blocks[0].content);
        REQUIRE(callout.icon == "⚠️");
        REQUIRE(callout.color == Color::YellowBackground);
        REQUIRE(to_plain_text(callout.rich_text) == "Careful Hot surface");
        REQUIRE(callout.rich_text.back().annotations.color == Color::YellowBackground);
    }
}

TEST_CASE("BlockConverter: code blocks", "[converter]") {
    SECTION("language from the fence, lower-cased") {
        const auto blocks = convert("```Python extra\nprint(1)\n```\n");
        const auto& code = std::get<Code>(blocks.at(0).content);
        REQUIRE(code.language == "python");
        REQUIRE(get_text(blocks[0].content) == "print(1)");
        REQUIRE(code.rich_text.size() == 1);
        REQUIRE(code.rich_text[0].annotations == Annotations{});
    }

    SECTION("no fence info means plain text") {
        const auto blocks = convert("```\n==not highlighted==\n```\n");
        const auto& code = std::get<Code>(blocks.at(0).content);
        REQUIRE(code.language == "plain text");
        REQUIRE(get_text(blocks[0].content) == "==not highlighted==");
    }
}

TEST_CASE("BlockConverter: tables", "[converter][table]") {
    const auto blocks = convert("| a | **b** |\n|---|---|\n| 1 | 2 |\n| 3 |\n");

    REQUIRE(types_of(blocks) == std::vector<BlockType>{BlockType::Table});
    const auto& table = std::get<Table>(blocks[0].content);
    REQUIRE(table.width == 2);
    REQUIRE(table.has_column_header);
    REQUIRE_FALSE(table.has_row_header);
    REQUIRE(table.rows.size() == 3);
    REQUIRE(table.rows[0].cells[1].front().annotations.bold);
    REQUIRE(table.rows[2].cells.size() == 2);
    REQUIRE(to_plain_text(table.rows[2].cells[1]).empty());
}

TEST_CASE("BlockConverter: images", "[converter][image]") {
    SECTION("remote image") {
        const auto blocks = convert("![A cat](https://example.com/cat.png)\n");
        REQUIRE(types_of(blocks) == std::vector<BlockType>{BlockType::Image});
        const auto& image = std::get<Image>(blocks[0].content);
        REQUIRE(image.source == MediaSource::external("https://example.com/cat.png"));
        REQUIRE(to_plain_text(image.caption) == "A cat");
    }

    SECTION("several images in one paragraph") {
        const auto blocks = convert("![](a.png)\n![b](b.png)\n");
        REQUIRE(types_of(blocks) == std::vector<BlockType>{BlockType::Image, BlockType::Image});
        REQUIRE(std::get<Image>(blocks[0].content).caption.empty());
    }

    SECTION("an image inside text stays inline") {
        const auto blocks = convert("look ![x](x.png) here\n");
        REQUIRE(types_of(blocks) == std::vector<BlockType>{BlockType::Paragraph});
    }

    SECTION("local image without a resolver stays external") {
        const auto blocks = convert("![](img/local.png)\n");
        REQUIRE(std::get<Image>(blocks.at(0).content).source == MediaSource::external("img/local.png"));
    }
}

TEST_CASE("BlockConverter: html blocks become paragraphs", "[converter]") {
    const auto blocks = convert("<div>\nhello\n</div>\n");
    REQUIRE(types_of(blocks) == std::vector<BlockType>{BlockType::Paragraph});
}

TEST_CASE("is_remote_url", "[converter]") {
    REQUIRE(is_remote_url("http://a"));
    REQUIRE(is_remote_url("HTTPS://a"));
    REQUIRE_FALSE(is_remote_url("ftp://a"));
    REQUIRE_FALSE(is_remote_url("./http://a"));
    REQUIRE_FALSE(is_remote_url("img.png"));
}
