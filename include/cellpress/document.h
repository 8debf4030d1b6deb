#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cellpress {

/// Block-level element types
enum class BlockType {
    Paragraph,
    Heading,
    List,
    Quote,
    Code,
    Table,
    Image,
};

/// A single cell in a table. Text may carry inline markup.
struct TableCell {
    std::string text;
    bool isHeader = false;

    static TableCell data(const std::string& t) { return {t, false}; }
    static TableCell header(const std::string& t) { return {t, true}; }
};

/// A table: ordered rows of ordered cells. Rows may be ragged.
struct TableBlock {
    std::vector<std::vector<TableCell>> rows;
};

/// An image reference resolved upstream.
/// `data` holds the decoded bytes; only its presence matters to layout.
struct ImageBlock {
    std::string id;
    std::optional<std::vector<uint8_t>> data;
    std::optional<std::string> alt;
    std::optional<std::string> caption;
    std::optional<uint32_t> width;    // Pixel width, when known
    std::optional<uint32_t> height;   // Pixel height, when known
};

/// One semantic unit of document content.
/// Text fields may embed inline markup (see markup.h).
struct Block {
    BlockType type = BlockType::Paragraph;
    std::string text;                    // Paragraph, Heading, Quote, Code
    int level = 1;                       // Heading: 1..6
    std::vector<std::string> items;      // List
    std::optional<std::string> lang;     // Code: language token
    TableBlock table;                    // Table
    ImageBlock image;                    // Image

    static Block paragraph(const std::string& t) {
        Block b;
        b.type = BlockType::Paragraph;
        b.text = t;
        return b;
    }
    static Block heading(const std::string& t, int level) {
        Block b;
        b.type = BlockType::Heading;
        b.text = t;
        b.level = level;
        return b;
    }
    static Block list(const std::vector<std::string>& items) {
        Block b;
        b.type = BlockType::List;
        b.items = items;
        return b;
    }
    static Block quote(const std::string& t) {
        Block b;
        b.type = BlockType::Quote;
        b.text = t;
        return b;
    }
    static Block code(const std::optional<std::string>& lang, const std::string& t) {
        Block b;
        b.type = BlockType::Code;
        b.lang = lang;
        b.text = t;
        return b;
    }
    static Block tableOf(const std::vector<std::vector<TableCell>>& rows) {
        Block b;
        b.type = BlockType::Table;
        b.table.rows = rows;
        return b;
    }
    static Block imageOf(const ImageBlock& img) {
        Block b;
        b.type = BlockType::Image;
        b.image = img;
        return b;
    }
};

} // namespace cellpress
