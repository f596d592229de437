#pragma once

/**
 * Block composer: maps block-level syntax nodes onto document blocks.
 *
 * Walks a node sequence in order and emits paragraphs and tables,
 * recursing into block quotes, lists and generic parents. Inline content
 * is delegated to the inline formatter, except links, which are wrapped
 * into Hyperlink groups here because the document model represents a
 * hyperlink as a wrapper around runs rather than as a run attribute.
 *
 * Usage:
 *   Node root = parse_markdown("# Title\n\nSome **bold** text.");
 *   Document doc = build_document(compose_blocks(root.children));
 */

#include "ast.hpp"
#include "document_model.hpp"
#include "inline_formatter.hpp"

#include <vector>

namespace mdocx {

/**
 * Composes a sequence of block nodes.
 * @param nodes Block nodes in reading order
 * @param list_level Nesting level of the enclosing list, 0 outside lists
 */
std::vector<Block> compose_blocks(const std::vector<Node>& nodes, int list_level = 0);

// Builds the inline content of a paragraph or table cell, wrapping links.
std::vector<InlineItem> compose_inline_content(const std::vector<Node>& nodes,
                                               FormattingContext context = {});

// Formats a link's children as hyperlink-styled runs wrapped with its URL.
Hyperlink build_hyperlink(const Node& link, FormattingContext context = {});

// Attaches the numbering schemes to a block sequence.
Document build_document(std::vector<Block> blocks);

} // namespace mdocx
