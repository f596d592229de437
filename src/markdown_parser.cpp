#include "markdown_parser.hpp"
#include "config.hpp"
#include "verbose.hpp"

#include <cmark-gfm.h>
#include <cmark-gfm-core-extensions.h>

#include <cstdint>
#include <memory>
#include <utility>

namespace mdocx {

namespace {
    struct ParserDeleter {
        void operator()(cmark_parser* parser) const { cmark_parser_free(parser); }
    };

    struct NodeDeleter {
        void operator()(cmark_node* node) const { cmark_node_free(node); }
    };

    using ParserPtr = std::unique_ptr<cmark_parser, ParserDeleter>;
    using NodePtr = std::unique_ptr<cmark_node, NodeDeleter>;

    std::string literal_of(cmark_node* node) {
        const char* literal = cmark_node_get_literal(node);
        return literal ? literal : "";
    }

    void check_depth(int depth) {
        if (depth > MAX_NESTING_DEPTH) {
            throw ParseError("Markdown nesting exceeds " + std::to_string(MAX_NESTING_DEPTH) + " levels");
        }
    }

    // Concatenates the text of all descendants (used for image alt text).
    std::string collect_text(cmark_node* node, int depth) {
        check_depth(depth);
        std::string text;
        for (cmark_node* child = cmark_node_first_child(node); child; child = cmark_node_next(child)) {
            switch (cmark_node_get_type(child)) {
                case CMARK_NODE_TEXT:
                case CMARK_NODE_CODE:
                    text += literal_of(child);
                    break;
                case CMARK_NODE_SOFTBREAK:
                case CMARK_NODE_LINEBREAK:
                    text += " ";
                    break;
                default:
                    text += collect_text(child, depth + 1);
                    break;
            }
        }
        return text;
    }

    Alignment alignment_of(uint8_t code) {
        switch (code) {
            case 'l': return Alignment::Left;
            case 'c': return Alignment::Center;
            case 'r': return Alignment::Right;
            default: return Alignment::None;
        }
    }

    class TreeConverter {
    public:
        explicit TreeConverter(const ParserOptions& options) : options_(options) {}

        Node convert(cmark_node* node, int depth = 0) const {
            check_depth(depth);
            Node out;
            std::string type_string = cmark_node_get_type_string(node);

            if (type_string == "table") {
                out.type = NodeType::Table;
                uint16_t columns = cmark_gfm_extensions_get_table_columns(node);
                uint8_t* aligns = cmark_gfm_extensions_get_table_alignments(node);
                for (uint16_t i = 0; i < columns; ++i) {
                    out.align.push_back(aligns ? alignment_of(aligns[i]) : Alignment::None);
                }
            } else if (type_string == "table_header" || type_string == "table_row") {
                out.type = NodeType::TableRow;
            } else if (type_string == "table_cell") {
                out.type = NodeType::TableCell;
            } else if (type_string == "strikethrough") {
                out.type = NodeType::Delete;
            } else {
                convert_core(node, type_string, depth, out);
                if (out.type == NodeType::Image) {
                    // Image children hold the alt text only.
                    return out;
                }
            }

            convert_children(node, depth, out);
            return out;
        }

    private:
        const ParserOptions& options_;

        void convert_core(cmark_node* node, const std::string& type_string, int depth, Node& out) const {
            switch (cmark_node_get_type(node)) {
                case CMARK_NODE_DOCUMENT:
                    out.type = NodeType::Root;
                    break;
                case CMARK_NODE_BLOCK_QUOTE:
                    out.type = NodeType::Blockquote;
                    break;
                case CMARK_NODE_LIST:
                    out.type = NodeType::List;
                    out.ordered = cmark_node_get_list_type(node) == CMARK_ORDERED_LIST;
                    if (out.ordered) {
                        out.start = cmark_node_get_list_start(node);
                    }
                    break;
                case CMARK_NODE_ITEM:
                    out.type = NodeType::ListItem;
                    if (type_string == "tasklist") {
                        out.checked = cmark_gfm_extensions_get_tasklist_item_checked(node);
                    }
                    break;
                case CMARK_NODE_CODE_BLOCK: {
                    out.type = NodeType::Code;
                    std::string literal = literal_of(node);
                    if (!literal.empty() && literal.back() == '\n') {
                        literal.pop_back();
                    }
                    out.value = literal;
                    const char* info = cmark_node_get_fence_info(node);
                    std::string lang = info ? info : "";
                    out.lang = lang.substr(0, lang.find_first_of(" \t"));
                    break;
                }
                case CMARK_NODE_PARAGRAPH:
                    out.type = NodeType::Paragraph;
                    break;
                case CMARK_NODE_HEADING:
                    out.type = NodeType::Heading;
                    out.depth = cmark_node_get_heading_level(node);
                    break;
                case CMARK_NODE_THEMATIC_BREAK:
                    out.type = NodeType::ThematicBreak;
                    break;
                case CMARK_NODE_TEXT:
                    out.type = NodeType::Text;
                    out.value = literal_of(node);
                    break;
                case CMARK_NODE_SOFTBREAK:
                    if (options_.hard_breaks) {
                        out.type = NodeType::Break;
                    } else {
                        out.type = NodeType::Text;
                        out.value = " ";
                    }
                    break;
                case CMARK_NODE_LINEBREAK:
                    out.type = NodeType::Break;
                    break;
                case CMARK_NODE_CODE:
                    out.type = NodeType::InlineCode;
                    out.value = literal_of(node);
                    break;
                case CMARK_NODE_EMPH:
                    out.type = NodeType::Emphasis;
                    break;
                case CMARK_NODE_STRONG:
                    out.type = NodeType::Strong;
                    break;
                case CMARK_NODE_LINK: {
                    out.type = NodeType::Link;
                    const char* url = cmark_node_get_url(node);
                    out.url = url ? url : "";
                    break;
                }
                case CMARK_NODE_IMAGE: {
                    out.type = NodeType::Image;
                    const char* url = cmark_node_get_url(node);
                    out.url = url ? url : "";
                    out.alt = collect_text(node, depth + 1);
                    break;
                }
                case CMARK_NODE_HTML_BLOCK:
                case CMARK_NODE_HTML_INLINE:
                    out.type = NodeType::Other;
                    out.type_name = "html";
                    out.value = literal_of(node);
                    break;
                default: {
                    out.type = NodeType::Other;
                    out.type_name = type_string;
                    const char* literal = cmark_node_get_literal(node);
                    if (literal) {
                        out.value = std::string(literal);
                    }
                    break;
                }
            }
        }

        // Converts the children of node into out, merging adjacent text nodes.
        void convert_children(cmark_node* node, int depth, Node& out) const {
            for (cmark_node* child = cmark_node_first_child(node); child; child = cmark_node_next(child)) {
                Node converted = convert(child, depth + 1);
                if (converted.type == NodeType::Text && !out.children.empty() &&
                    out.children.back().type == NodeType::Text) {
                    *out.children.back().value += converted.value.value_or("");
                    continue;
                }
                out.children.push_back(std::move(converted));
            }
        }
    };
}

ParserOptions ParserOptions::defaults() {
    ParserOptions options;
    options.extensions = DEFAULT_EXTENSIONS;
    return options;
}

Node parse_markdown(const std::string& markdown, const ParserOptions& options) {
    cmark_gfm_core_extensions_ensure_registered();

    // Invalid UTF-8 is replaced with U+FFFD so every literal is valid text.
    int cmark_options = CMARK_OPT_DEFAULT | CMARK_OPT_VALIDATE_UTF8;
    if (options.smart) {
        cmark_options |= CMARK_OPT_SMART;
    }

    ParserPtr parser(cmark_parser_new(cmark_options));
    if (!parser) {
        throw ParseError("Failed to create markdown parser");
    }

    for (const auto& name : options.extensions) {
        cmark_syntax_extension* extension = cmark_find_syntax_extension(name.c_str());
        if (!extension) {
            throw ParseError("Unknown markdown extension: " + name);
        }
        if (!cmark_parser_attach_syntax_extension(parser.get(), extension)) {
            throw ParseError("Failed to attach markdown extension: " + name);
        }
        verbose_log("PARSE", "Enabled extension: " + name);
    }

    verbose_in("PARSE", truncate(markdown));

    cmark_parser_feed(parser.get(), markdown.c_str(), markdown.length());
    NodePtr doc(cmark_parser_finish(parser.get()));
    if (!doc) {
        throw ParseError("Markdown parser produced no document");
    }

    Node root = TreeConverter(options).convert(doc.get());
    verbose_log("PARSE", "Parsed " + std::to_string(root.children.size()) + " top-level blocks");
    return root;
}

} // namespace mdocx
