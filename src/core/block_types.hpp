#pragma once

#include "core/rich_text.hpp"

#include <algorithm>
#include <variant>
#include <string>
#include <string_view>
#include <optional>
#include <vector>

namespace blockmark::blocks {

/**
 * Block content types - one struct per payload shape of the target
 * block API. These are plain value types.
 */

struct Paragraph {
    RichTextList rich_text;
    Color color = Color::Default;

    bool operator==(const Paragraph&) const = default;
};

struct Heading {
    int level = 1;  // 1, 2, or 3
    RichTextList rich_text;
    Color color = Color::Default;
    bool is_toggleable = false;

    bool operator==(const Heading&) const = default;
};

struct BulletedListItem {
    RichTextList rich_text;
    Color color = Color::Default;

    bool operator==(const BulletedListItem&) const = default;
};

struct NumberedListItem {
    RichTextList rich_text;
    Color color = Color::Default;

    bool operator==(const NumberedListItem&) const = default;
};

struct Todo {
    RichTextList rich_text;
    bool checked = false;
    Color color = Color::Default;

    bool operator==(const Todo&) const = default;
};

struct Quote {
    RichTextList rich_text;
    Color color = Color::Default;

    bool operator==(const Quote&) const = default;
};

struct Callout {
    RichTextList rich_text;
    std::string icon;  // emoji glyph
    Color color = Color::Default;

    bool operator==(const Callout&) const = default;
};

struct Code {
    RichTextList rich_text;
    std::string language = "plain text";
    RichTextList caption;

    bool operator==(const Code&) const = default;
};

struct Divider {
    bool operator==(const Divider&) const = default;
};

struct TableRow {
    std::vector<RichTextList> cells;

    bool operator==(const TableRow&) const = default;
};

struct Table {
    int width = 1;
    bool has_column_header = true;
    bool has_row_header = false;
    std::vector<TableRow> rows;

    bool operator==(const Table&) const = default;
};

/**
 * Where an image or file lives: an external URL, or a handle returned by
 * the API's file upload endpoint.
 */
struct MediaSource {
    enum class Kind { External, FileUpload };

    Kind kind = Kind::External;
    std::string value;  // URL or upload id

    [[nodiscard]] static MediaSource external(std::string url) {
        return MediaSource{Kind::External, std::move(url)};
    }
    [[nodiscard]] static MediaSource upload(std::string id) {
        return MediaSource{Kind::FileUpload, std::move(id)};
    }

    bool operator==(const MediaSource&) const = default;
};

struct Image {
    MediaSource source;
    RichTextList caption;

    bool operator==(const Image&) const = default;
};

struct File {
    MediaSource source;
    RichTextList caption;

    bool operator==(const File&) const = default;
};

/**
 * BlockContent - Sum type representing all possible block payloads.
 */
using BlockContent = std::variant<
    Paragraph,
    Heading,
    BulletedListItem,
    NumberedListItem,
    Todo,
    Quote,
    Callout,
    Code,
    Divider,
    Table,
    TableRow,
    Image,
    File
>;

/**
 * BlockType - the wire discriminant. Headings split by level.
 */
enum class BlockType {
    Paragraph,
    Heading1,
    Heading2,
    Heading3,
    BulletedListItem,
    NumberedListItem,
    ToDo,
    Quote,
    Callout,
    Code,
    Divider,
    Table,
    TableRow,
    Image,
    File
};

[[nodiscard]] constexpr int clamp_heading_level(int level) {
    return std::clamp(level, 1, 3);
}

/**
 * Get the BlockType for a BlockContent variant.
 */
[[nodiscard]] constexpr BlockType get_type(const BlockContent& content) {
    return std::visit([](const auto& c) -> BlockType {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Paragraph>) return BlockType::Paragraph;
        else if constexpr (std::is_same_v<T, Heading>) {
            switch (clamp_heading_level(c.level)) {
                case 1: return BlockType::Heading1;
                case 2: return BlockType::Heading2;
                default: return BlockType::Heading3;
            }
        }
        else if constexpr (std::is_same_v<T, BulletedListItem>) return BlockType::BulletedListItem;
        else if constexpr (std::is_same_v<T, NumberedListItem>) return BlockType::NumberedListItem;
        else if constexpr (std::is_same_v<T, Todo>) return BlockType::ToDo;
        else if constexpr (std::is_same_v<T, Quote>) return BlockType::Quote;
        else if constexpr (std::is_same_v<T, Callout>) return BlockType::Callout;
        else if constexpr (std::is_same_v<T, Code>) return BlockType::Code;
        else if constexpr (std::is_same_v<T, Divider>) return BlockType::Divider;
        else if constexpr (std::is_same_v<T, Table>) return BlockType::Table;
        else if constexpr (std::is_same_v<T, TableRow>) return BlockType::TableRow;
        else if constexpr (std::is_same_v<T, Image>) return BlockType::Image;
        else if constexpr (std::is_same_v<T, File>) return BlockType::File;
    }, content);
}

/**
 * Get the type name as it appears on the wire.
 */
[[nodiscard]] constexpr std::string_view type_name(BlockType type) {
    switch (type) {
        case BlockType::Paragraph: return "paragraph";
        case BlockType::Heading1: return "heading_1";
        case BlockType::Heading2: return "heading_2";
        case BlockType::Heading3: return "heading_3";
        case BlockType::BulletedListItem: return "bulleted_list_item";
        case BlockType::NumberedListItem: return "numbered_list_item";
        case BlockType::ToDo: return "to_do";
        case BlockType::Quote: return "quote";
        case BlockType::Callout: return "callout";
        case BlockType::Code: return "code";
        case BlockType::Divider: return "divider";
        case BlockType::Table: return "table";
        case BlockType::TableRow: return "table_row";
        case BlockType::Image: return "image";
        case BlockType::File: return "file";
    }
    return "unknown";
}

/**
 * Parse a wire type name.
 */
[[nodiscard]] inline std::optional<BlockType> parse_type(std::string_view name) {
    if (name == "paragraph") return BlockType::Paragraph;
    if (name == "heading_1") return BlockType::Heading1;
    if (name == "heading_2") return BlockType::Heading2;
    if (name == "heading_3") return BlockType::Heading3;
    if (name == "bulleted_list_item") return BlockType::BulletedListItem;
    if (name == "numbered_list_item") return BlockType::NumberedListItem;
    if (name == "to_do") return BlockType::ToDo;
    if (name == "quote") return BlockType::Quote;
    if (name == "callout") return BlockType::Callout;
    if (name == "code") return BlockType::Code;
    if (name == "divider") return BlockType::Divider;
    if (name == "table") return BlockType::Table;
    if (name == "table_row") return BlockType::TableRow;
    if (name == "image") return BlockType::Image;
    if (name == "file") return BlockType::File;
    return std::nullopt;
}

/**
 * Get the rich text of text-bearing blocks. Divider, table, row and media
 * blocks have none and yield an empty list.
 */
[[nodiscard]] inline RichTextList get_rich_text(const BlockContent& content) {
    return std::visit([](const auto& c) -> RichTextList {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Divider> || std::is_same_v<T, Table> ||
                      std::is_same_v<T, TableRow> || std::is_same_v<T, Image> ||
                      std::is_same_v<T, File>) {
            return {};
        } else {
            return c.rich_text;
        }
    }, content);
}

/**
 * Get the plain text of a block.
 */
[[nodiscard]] inline std::string get_text(const BlockContent& content) {
    return to_plain_text(get_rich_text(content));
}

/**
 * Block - one unit of the converted document.
 */
struct Block {
    BlockContent content;

    [[nodiscard]] BlockType type() const { return get_type(content); }

    bool operator==(const Block&) const = default;
};

/**
 * Wrap a payload in a Block.
 */
template<typename T>
[[nodiscard]] Block make(T content) {
    return Block{BlockContent{std::move(content)}};
}

/**
 * Reconcile a row to exactly `width` cells: excess cells are dropped and
 * missing cells are filled with one empty run each.
 */
[[nodiscard]] inline TableRow fit_row(TableRow row, int width) {
    const auto target = static_cast<size_t>(std::max(width, 1));
    if (row.cells.size() > target) {
        row.cells.resize(target);
    }
    while (row.cells.size() < target) {
        row.cells.push_back(RichTextList{plain_run("")});
    }
    return row;
}

} // namespace blockmark::blocks
