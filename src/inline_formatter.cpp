#include "inline_formatter.hpp"
#include "config.hpp"

#include <iterator>

namespace mdocx {

namespace {
    TextRun styled_run(const std::string& text, const FormattingContext& context) {
        TextRun run;
        run.text = text;
        run.bold = context.bold;
        run.italic = context.italic;
        run.strike = context.strike;
        run.superscript = context.superscript;
        run.subscript = context.subscript;
        return run;
    }

    void append(std::vector<TextRun>& out, std::vector<TextRun> runs) {
        out.insert(out.end(), std::make_move_iterator(runs.begin()),
                   std::make_move_iterator(runs.end()));
    }
}

std::vector<TextRun> format_inlines(const std::vector<Node>& nodes, FormattingContext context) {
    std::vector<TextRun> runs;
    for (const auto& child : nodes) {
        append(runs, format_inline(child, context));
    }
    return runs;
}

std::vector<TextRun> format_inline(const Node& node, FormattingContext context) {
    switch (node.type) {
        case NodeType::Text:
            return {styled_run(node.value.value_or(""), context)};

        case NodeType::Strong:
            return format_inlines(node.children, context.with_bold());

        case NodeType::Emphasis:
            return format_inlines(node.children, context.with_italic());

        case NodeType::Delete:
            return format_inlines(node.children, context.with_strike());

        case NodeType::Superscript:
            return format_inlines(node.children, context.with_superscript());

        case NodeType::Subscript:
            return format_inlines(node.children, context.with_subscript());

        case NodeType::InlineCode: {
            // Code text is never struck through or scripted.
            TextRun run;
            run.text = node.value.value_or("");
            run.font = CODE_FONT;
            run.bold = context.bold;
            run.italic = context.italic;
            return {run};
        }

        case NodeType::Break: {
            TextRun run;
            run.line_break = true;
            return {run};
        }

        case NodeType::Image: {
            TextRun run;
            run.text = "[Image: " + (node.alt.empty() ? node.url : node.alt) + "]";
            run.italic = true;
            run.color = IMAGE_COLOR;
            return {run};
        }

        default:
            break;
    }

    // Links reached here are nested inside other inline nodes and are
    // flattened like any other container.
    if (node.has_children()) {
        return format_inlines(node.children, context);
    }
    if (node.value) {
        TextRun run;
        run.text = *node.value;
        return {run};
    }
    return {};
}

TextRun restyle_as_hyperlink(TextRun run) {
    run.style = HYPERLINK_STYLE;
    run.color = HYPERLINK_COLOR;
    run.underline = true;
    return run;
}

} // namespace mdocx
