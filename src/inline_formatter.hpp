#pragma once

/**
 * Inline formatter: flattens inline syntax nodes into styled text runs.
 *
 * Formatting is inherited through an explicit FormattingContext value.
 * Each emphasis-like node switches on one flag for its subtree; flags set
 * by an ancestor are never cleared, so `**a *b* c**` yields the runs
 * "a " (bold), "b" (bold, italic) and " c" (bold).
 *
 * The formatter is total: unrecognized containers are flattened with the
 * context unchanged and unrecognized leaves become plain runs.
 */

#include "ast.hpp"
#include "document_model.hpp"

#include <vector>

namespace mdocx {

struct FormattingContext {
    bool bold = false;
    bool italic = false;
    bool strike = false;
    bool superscript = false;
    bool subscript = false;

    FormattingContext with_bold() const { auto c = *this; c.bold = true; return c; }
    FormattingContext with_italic() const { auto c = *this; c.italic = true; return c; }
    FormattingContext with_strike() const { auto c = *this; c.strike = true; return c; }
    FormattingContext with_superscript() const { auto c = *this; c.superscript = true; return c; }
    FormattingContext with_subscript() const { auto c = *this; c.subscript = true; return c; }
};

// Returns the runs rendering one inline node under the given context.
std::vector<TextRun> format_inline(const Node& node, FormattingContext context = {});

// Formats each node in order and concatenates the runs.
std::vector<TextRun> format_inlines(const std::vector<Node>& nodes, FormattingContext context = {});

// Applies hyperlink decoration (link color, single underline, Hyperlink style).
TextRun restyle_as_hyperlink(TextRun run);

} // namespace mdocx
