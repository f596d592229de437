#pragma once

/**
 * Word-processing document object model produced by the conversion core.
 *
 * Mirrors the paragraph / run / table hierarchy of WordprocessingML:
 * a Document holds numbering definitions and an ordered sequence of
 * blocks, each block being a Paragraph or a Table. Every element is owned
 * by exactly one parent; there are no back-references.
 */

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mdocx {

// ========== Runs ==========

/**
 * A span of literal text with one resolved set of formatting flags.
 *
 * Empty string attributes mean "inherit the document default".
 */
struct TextRun {
    std::string text;
    bool bold = false;
    bool italic = false;
    bool strike = false;
    bool superscript = false;
    bool subscript = false;
    bool line_break = false;     // Renders as a line break, text is empty.
    bool underline = false;      // Single underline.
    std::string font;            // Font family, e.g. Consolas for code.
    int size = 0;                // Half-points, 0 = default.
    std::string color;           // RRGGBB hex.
    std::string style;           // Character style name, e.g. "Hyperlink".
};

// A group of runs wrapped in an external hyperlink.
struct Hyperlink {
    std::string url;
    std::vector<TextRun> runs;
};

using InlineItem = std::variant<TextRun, Hyperlink>;

// ========== Paragraph Properties ==========

enum class BorderStyle { Single };

struct Border {
    BorderStyle style = BorderStyle::Single;
    int size = 0;            // Eighths of a point.
    std::string color;       // RRGGBB hex.
    int space = 0;           // Points between border and text.
};

enum class TabStopType { Left, Right };

struct TabStop {
    TabStopType type = TabStopType::Left;
    int position = 0;        // Twips.
};

// Reference from a paragraph to a numbering scheme level.
struct NumberingRef {
    std::string reference;   // Scheme name, see numbering.hpp.
    int level = 0;           // 0-8.
};

struct Paragraph {
    std::vector<InlineItem> children;
    int heading_level = 0;                 // 0 = body text, 1-6 = heading.
    std::optional<NumberingRef> numbering;
    std::optional<int> spacing_before;     // Twips.
    std::optional<int> spacing_after;      // Twips.
    std::optional<int> indent_left;        // Twips.
    std::optional<Border> border_left;
    std::optional<Border> border_bottom;
    std::string shading;                   // Fill color, empty = none.
    std::vector<TabStop> tab_stops;
};

// ========== Tables ==========

struct TableCell {
    std::vector<Paragraph> paragraphs;
    std::string shading;                   // Fill color, empty = none.
};

struct TableRow {
    std::vector<TableCell> cells;
    bool header = false;
};

struct Table {
    std::vector<TableRow> rows;
    int width_percent = 100;
};

using Block = std::variant<Paragraph, Table>;

// ========== Numbering ==========

enum class LevelFormat { Bullet, Decimal, LowerLetter, LowerRoman };

enum class LevelAlignment { Left };

struct NumberingLevel {
    int level = 0;
    LevelFormat format = LevelFormat::Bullet;
    std::string text;        // Glyph or pattern such as "%1."
    LevelAlignment alignment = LevelAlignment::Left;
    int indent_left = 0;     // Twips.
    int indent_hanging = 0;  // Twips.

    bool operator==(const NumberingLevel& other) const {
        return level == other.level && format == other.format && text == other.text &&
               alignment == other.alignment && indent_left == other.indent_left &&
               indent_hanging == other.indent_hanging;
    }
};

struct NumberingScheme {
    std::string reference;
    std::vector<NumberingLevel> levels;

    bool operator==(const NumberingScheme& other) const {
        return reference == other.reference && levels == other.levels;
    }
};

// ========== Document Root ==========

struct Document {
    std::vector<NumberingScheme> numbering;
    std::vector<Block> blocks;
};

// Returns the concatenated text of all runs in a paragraph, hyperlinks included.
std::string paragraph_text(const Paragraph& paragraph);

// Returns all runs of a paragraph in order, flattening hyperlink groups.
std::vector<TextRun> paragraph_runs(const Paragraph& paragraph);

const char* level_format_name(LevelFormat format);

} // namespace mdocx
