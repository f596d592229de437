#pragma once

/**
 * Application configuration constants.
 *
 * Defines the settings file name, default parser extensions and the fixed
 * layout values (fonts, colors, spacing, indents) used when composing the
 * document model. Lengths are in twips (1/20 pt) unless noted otherwise.
 */

#include <string>
#include <vector>

namespace mdocx {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".mdocx.json";  // Local settings file.

// ========== Parser Defaults ==========

// cmark-gfm syntax extensions attached to the parser unless overridden.
inline const std::vector<std::string> DEFAULT_EXTENSIONS = {
    "table", "strikethrough", "tasklist", "autolink"
};

// Deepest node nesting accepted from the parser. Deeper input is rejected.
constexpr int MAX_NESTING_DEPTH = 256;

// ========== Units ==========

constexpr int TWIPS_PER_INCH = 1440;

// ========== Fonts and Colors ==========

constexpr const char* CODE_FONT = "Consolas";        // Inline code and code blocks.
constexpr int CODE_BLOCK_FONT_SIZE = 20;             // Half-points (10 pt).
constexpr const char* CODE_SHADING = "F4F4F4";       // Code block line fill.
constexpr const char* TABLE_HEADER_SHADING = "F4F4F4"; // First table row fill.
constexpr const char* HYPERLINK_COLOR = "0563C1";
constexpr const char* HYPERLINK_STYLE = "Hyperlink"; // Character style name.
constexpr const char* IMAGE_COLOR = "888888";        // Muted image placeholder.
constexpr const char* QUOTE_BORDER_COLOR = "BBBBBB";
constexpr const char* RULE_BORDER_COLOR = "CCCCCC";

// ========== Spacing ==========

constexpr int HEADING_SPACING_BEFORE = 240;
constexpr int HEADING_SPACING_AFTER = 120;
constexpr int PARAGRAPH_SPACING_AFTER = 160;
constexpr int LIST_ITEM_SPACING_AFTER = 80;
constexpr int CODE_LINE_SPACING_AFTER = 0;
constexpr int SPACER_SPACING_AFTER = 160;   // Blank paragraph after code blocks and tables.
constexpr int RULE_SPACING = 240;           // Before and after a thematic break.

// ========== Indents and Borders ==========

constexpr int QUOTE_INDENT = TWIPS_PER_INCH / 2;
constexpr int QUOTE_BORDER_SIZE = 6;        // Eighths of a point.
constexpr int QUOTE_BORDER_SPACE = 10;      // Points.
constexpr int RULE_BORDER_SIZE = 6;
constexpr int RULE_BORDER_SPACE = 1;
constexpr int RULE_TAB_POSITION = 9026;     // Right edge of an A4 text column.

constexpr int LIST_INDENT_STEP = TWIPS_PER_INCH / 2;   // Per nesting level.
constexpr int LIST_HANGING_INDENT = TWIPS_PER_INCH / 4;
constexpr int NUMBERING_LEVELS = 9;

// ========== Task Lists ==========

constexpr const char* CHECKED_PREFIX = "☑ ";
constexpr const char* UNCHECKED_PREFIX = "☐ ";

// ========== Conversion Messages ==========

constexpr const char* MSG_INPUT_REQUIRED = "Markdown content is required";
constexpr const char* MSG_CONVERSION_FAILED = "Failed to convert markdown to docx";

} // namespace mdocx
