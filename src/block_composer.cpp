#include "block_composer.hpp"
#include "config.hpp"
#include "numbering.hpp"
#include "verbose.hpp"

#include <algorithm>
#include <utility>

namespace mdocx {

namespace {
    void compose_block(const Node& node, int list_level, std::vector<Block>& out);

    Paragraph spacer_paragraph() {
        Paragraph spacer;
        spacer.spacing_after = SPACER_SPACING_AFTER;
        return spacer;
    }

    // Splits on '\n', keeping empty lines. A trailing '\r' is dropped from each line.
    std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        size_t start = 0;
        while (true) {
            size_t end = text.find('\n', start);
            std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(std::move(line));
            if (end == std::string::npos) {
                break;
            }
            start = end + 1;
        }
        return lines;
    }

    void compose_heading(const Node& node, std::vector<Block>& out) {
        Paragraph para;
        para.heading_level = std::clamp(node.depth, 1, 6);
        para.children = compose_inline_content(node.children);
        para.spacing_before = HEADING_SPACING_BEFORE;
        para.spacing_after = HEADING_SPACING_AFTER;
        out.emplace_back(std::move(para));
    }

    void compose_paragraph(const Node& node, std::vector<Block>& out) {
        Paragraph para;
        para.children = compose_inline_content(node.children);
        para.spacing_after = PARAGRAPH_SPACING_AFTER;
        out.emplace_back(std::move(para));
    }

    void compose_blockquote(const Node& node, std::vector<Block>& out) {
        // Quoted content starts a fresh block sequence outside any list.
        std::vector<Block> inner = compose_blocks(node.children);
        for (auto& block : inner) {
            if (auto* para = std::get_if<Paragraph>(&block)) {
                para->indent_left = QUOTE_INDENT;
                para->border_left = Border{BorderStyle::Single, QUOTE_BORDER_SIZE,
                                           QUOTE_BORDER_COLOR, QUOTE_BORDER_SPACE};
            }
            out.push_back(std::move(block));
        }
    }

    void compose_list(const Node& node, int list_level, std::vector<Block>& out) {
        const char* reference = node.ordered ? ORDERED_REFERENCE : BULLET_REFERENCE;

        for (const auto& item : node.children) {
            std::string check_prefix;
            if (item.checked.has_value()) {
                check_prefix = *item.checked ? CHECKED_PREFIX : UNCHECKED_PREFIX;
            }

            for (size_t i = 0; i < item.children.size(); ++i) {
                const Node& child = item.children[i];

                if (child.type == NodeType::Paragraph) {
                    Paragraph para;
                    para.children = compose_inline_content(child.children);
                    if (i == 0 && !check_prefix.empty()) {
                        TextRun prefix;
                        prefix.text = check_prefix;
                        para.children.insert(para.children.begin(), InlineItem(std::move(prefix)));
                    }
                    para.numbering = NumberingRef{reference, clamp_list_level(list_level)};
                    para.spacing_after = LIST_ITEM_SPACING_AFTER;
                    out.emplace_back(std::move(para));
                } else if (child.type == NodeType::List) {
                    compose_block(child, list_level + 1, out);
                } else {
                    compose_block(child, list_level, out);
                }
            }
        }
    }

    void compose_code(const Node& node, std::vector<Block>& out) {
        for (const auto& line : split_lines(node.value.value_or(""))) {
            TextRun run;
            run.text = line.empty() ? " " : line;
            run.font = CODE_FONT;
            run.size = CODE_BLOCK_FONT_SIZE;

            Paragraph para;
            para.children.emplace_back(std::move(run));
            para.shading = CODE_SHADING;
            para.spacing_after = CODE_LINE_SPACING_AFTER;
            out.emplace_back(std::move(para));
        }
        out.emplace_back(spacer_paragraph());
    }

    void compose_table(const Node& node, std::vector<Block>& out) {
        Table table;
        for (size_t r = 0; r < node.children.size(); ++r) {
            const Node& row_node = node.children[r];
            bool header = (r == 0);

            TableRow row;
            row.header = header;
            for (const auto& cell_node : row_node.children) {
                FormattingContext context;
                TableCell cell;
                if (header) {
                    context.bold = true;
                    cell.shading = TABLE_HEADER_SHADING;
                }
                Paragraph para;
                para.children = compose_inline_content(cell_node.children, context);
                cell.paragraphs.push_back(std::move(para));
                row.cells.push_back(std::move(cell));
            }
            table.rows.push_back(std::move(row));
        }
        out.emplace_back(std::move(table));
        out.emplace_back(spacer_paragraph());
    }

    void compose_thematic_break(std::vector<Block>& out) {
        TextRun tab;
        tab.text = "\t";

        Paragraph para;
        para.children.emplace_back(std::move(tab));
        para.border_bottom = Border{BorderStyle::Single, RULE_BORDER_SIZE,
                                    RULE_BORDER_COLOR, RULE_BORDER_SPACE};
        para.tab_stops.push_back(TabStop{TabStopType::Right, RULE_TAB_POSITION});
        para.spacing_before = RULE_SPACING;
        para.spacing_after = RULE_SPACING;
        out.emplace_back(std::move(para));
    }

    void compose_block(const Node& node, int list_level, std::vector<Block>& out) {
        switch (node.type) {
            case NodeType::Heading:
                compose_heading(node, out);
                return;
            case NodeType::Paragraph:
                compose_paragraph(node, out);
                return;
            case NodeType::Blockquote:
                compose_blockquote(node, out);
                return;
            case NodeType::List:
                compose_list(node, list_level, out);
                return;
            case NodeType::Code:
                compose_code(node, out);
                return;
            case NodeType::Table:
                compose_table(node, out);
                return;
            case NodeType::ThematicBreak:
                compose_thematic_break(out);
                return;
            default:
                break;
        }

        if (node.has_children()) {
            for (const auto& child : node.children) {
                compose_block(child, list_level, out);
            }
        } else if (is_verbose()) {
            std::string name = node.type == NodeType::Other ? node.type_name : node_type_name(node.type);
            verbose_log("COMPOSE", "Skipping block-level leaf: " + name);
        }
    }
}

std::vector<Block> compose_blocks(const std::vector<Node>& nodes, int list_level) {
    std::vector<Block> blocks;
    for (const auto& node : nodes) {
        compose_block(node, list_level, blocks);
    }
    return blocks;
}

std::vector<InlineItem> compose_inline_content(const std::vector<Node>& nodes,
                                               FormattingContext context) {
    std::vector<InlineItem> items;
    for (const auto& child : nodes) {
        if (child.type == NodeType::Link) {
            items.emplace_back(build_hyperlink(child, context));
            continue;
        }
        for (auto& run : format_inline(child, context)) {
            items.emplace_back(std::move(run));
        }
    }
    return items;
}

Hyperlink build_hyperlink(const Node& link, FormattingContext context) {
    Hyperlink hyperlink;
    hyperlink.url = link.url;
    for (auto& run : format_inlines(link.children, context)) {
        hyperlink.runs.push_back(restyle_as_hyperlink(std::move(run)));
    }
    return hyperlink;
}

Document build_document(std::vector<Block> blocks) {
    Document doc;
    doc.numbering = numbering_schemes();
    doc.blocks = std::move(blocks);
    return doc;
}

} // namespace mdocx
