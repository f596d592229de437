#pragma once

/**
 * Markdown syntax tree consumed by the conversion core.
 *
 * A node is tagged by a closed NodeType. Container nodes own their
 * children in reading order; leaf nodes carry a literal value. Shapes the
 * producer does not map onto a known type are kept as NodeType::Other with
 * the producer's type name, so the core can fall back on their children
 * or literal value instead of failing.
 */

#include <optional>
#include <string>
#include <vector>

namespace mdocx {

enum class NodeType {
    Root,           // Document or any generic parent.
    Text,
    InlineCode,
    Heading,
    Paragraph,
    Blockquote,
    List,
    ListItem,
    Code,
    Emphasis,
    Strong,
    Delete,
    Link,
    Image,
    ThematicBreak,
    Table,
    TableRow,
    TableCell,
    Break,
    Superscript,
    Subscript,
    Other           // Unrecognized shape, see Node::type_name.
};

// Column alignment hint of a table.
enum class Alignment { None, Left, Center, Right };

struct Node {
    NodeType type = NodeType::Other;
    std::string type_name;               // Producer's name for Other nodes.
    std::optional<std::string> value;    // Literal payload of leaf nodes.
    std::vector<Node> children;

    int depth = 0;                       // Heading: 1-6.
    bool ordered = false;                // List.
    std::optional<int> start;            // List: first number of an ordered list.
    std::optional<bool> checked;         // ListItem: task-list state, unset if not a task.
    std::string url;                     // Link, Image.
    std::string alt;                     // Image.
    std::string lang;                    // Code.
    std::vector<Alignment> align;        // Table: one entry per column.

    bool has_children() const { return !children.empty(); }
};

// Returns the canonical lowercase name of a node type ("heading", "tableCell", ...).
const char* node_type_name(NodeType type);

// ========== Construction Helpers ==========

Node make_text(const std::string& value);
Node make_inline_code(const std::string& value);
Node make_break();
Node make_image(const std::string& url, const std::string& alt = "");
Node make_link(const std::string& url, std::vector<Node> children);
Node make_container(NodeType type, std::vector<Node> children);
Node make_heading(int depth, std::vector<Node> children);
Node make_paragraph(std::vector<Node> children);
Node make_list(bool ordered, std::vector<Node> items, std::optional<int> start = std::nullopt);
Node make_list_item(std::vector<Node> children, std::optional<bool> checked = std::nullopt);
Node make_code(const std::string& value, const std::string& lang = "");
Node make_thematic_break();
Node make_table(std::vector<Node> rows, std::vector<Alignment> align = {});

// Creates an unrecognized node. With a value and no children it is treated as a leaf.
Node make_other(const std::string& type_name, std::optional<std::string> value = std::nullopt,
                std::vector<Node> children = {});

} // namespace mdocx
