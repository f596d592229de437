#include "ast.hpp"

#include <utility>

namespace mdocx {

const char* node_type_name(NodeType type) {
    switch (type) {
        case NodeType::Root: return "root";
        case NodeType::Text: return "text";
        case NodeType::InlineCode: return "inlineCode";
        case NodeType::Heading: return "heading";
        case NodeType::Paragraph: return "paragraph";
        case NodeType::Blockquote: return "blockquote";
        case NodeType::List: return "list";
        case NodeType::ListItem: return "listItem";
        case NodeType::Code: return "code";
        case NodeType::Emphasis: return "emphasis";
        case NodeType::Strong: return "strong";
        case NodeType::Delete: return "delete";
        case NodeType::Link: return "link";
        case NodeType::Image: return "image";
        case NodeType::ThematicBreak: return "thematicBreak";
        case NodeType::Table: return "table";
        case NodeType::TableRow: return "tableRow";
        case NodeType::TableCell: return "tableCell";
        case NodeType::Break: return "break";
        case NodeType::Superscript: return "superscript";
        case NodeType::Subscript: return "subscript";
        case NodeType::Other: return "other";
    }
    return "other";
}

Node make_text(const std::string& value) {
    Node node;
    node.type = NodeType::Text;
    node.value = value;
    return node;
}

Node make_inline_code(const std::string& value) {
    Node node;
    node.type = NodeType::InlineCode;
    node.value = value;
    return node;
}

Node make_break() {
    Node node;
    node.type = NodeType::Break;
    return node;
}

Node make_image(const std::string& url, const std::string& alt) {
    Node node;
    node.type = NodeType::Image;
    node.url = url;
    node.alt = alt;
    return node;
}

Node make_link(const std::string& url, std::vector<Node> children) {
    Node node = make_container(NodeType::Link, std::move(children));
    node.url = url;
    return node;
}

Node make_container(NodeType type, std::vector<Node> children) {
    Node node;
    node.type = type;
    node.children = std::move(children);
    return node;
}

Node make_heading(int depth, std::vector<Node> children) {
    Node node = make_container(NodeType::Heading, std::move(children));
    node.depth = depth;
    return node;
}

Node make_paragraph(std::vector<Node> children) {
    return make_container(NodeType::Paragraph, std::move(children));
}

Node make_list(bool ordered, std::vector<Node> items, std::optional<int> start) {
    Node node = make_container(NodeType::List, std::move(items));
    node.ordered = ordered;
    node.start = start;
    return node;
}

Node make_list_item(std::vector<Node> children, std::optional<bool> checked) {
    Node node = make_container(NodeType::ListItem, std::move(children));
    node.checked = checked;
    return node;
}

Node make_code(const std::string& value, const std::string& lang) {
    Node node;
    node.type = NodeType::Code;
    node.value = value;
    node.lang = lang;
    return node;
}

Node make_thematic_break() {
    Node node;
    node.type = NodeType::ThematicBreak;
    return node;
}

Node make_table(std::vector<Node> rows, std::vector<Alignment> align) {
    Node node = make_container(NodeType::Table, std::move(rows));
    node.align = std::move(align);
    return node;
}

Node make_other(const std::string& type_name, std::optional<std::string> value,
                std::vector<Node> children) {
    Node node = make_container(NodeType::Other, std::move(children));
    node.type_name = type_name;
    node.value = std::move(value);
    return node;
}

} // namespace mdocx
