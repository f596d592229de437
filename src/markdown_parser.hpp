#pragma once

/**
 * Markdown parsing front end.
 *
 * Runs cmark-gfm over the input text and converts its node tree into the
 * syntax tree consumed by the conversion core. GitHub extensions (tables,
 * strikethrough, task lists, autolinks) are enabled through
 * ParserOptions::extensions.
 */

#include "ast.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace mdocx {

// Raised when cmark-gfm cannot be set up or fails to produce a document.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message) : std::runtime_error(message) {}
};

struct ParserOptions {
    bool smart = false;                  // Smart quotes and dashes.
    bool hard_breaks = false;            // Treat soft line breaks as hard breaks.
    std::vector<std::string> extensions; // cmark-gfm syntax extension names.

    // Options with the default extension set from config.hpp.
    static ParserOptions defaults();
};

// Parses markdown into a Root node whose children are the top-level blocks.
Node parse_markdown(const std::string& markdown, const ParserOptions& options = ParserOptions::defaults());

} // namespace mdocx
