#include <catch2/catch.hpp>
#include "packer.hpp"
#include "block_composer.hpp"
#include "config.hpp"
#include "numbering.hpp"

using namespace mdocx;
using json = nlohmann::json;

static Document sample_document() {
    return build_document(compose_blocks({
        make_heading(1, {make_text("Title")}),
        make_paragraph({
            make_container(NodeType::Strong, {make_text("bold")}),
            make_break(),
            make_link("https://example.com", {make_text("site")})
        }),
        make_list(true, {make_list_item({make_paragraph({make_text("one")})})}),
        make_container(NodeType::Blockquote, {make_paragraph({make_text("q")})}),
        make_table({make_container(NodeType::TableRow, {
            make_container(NodeType::TableCell, {make_text("h")})
        })}),
        make_thematic_break()
    }));
}

TEST_CASE("JSON packer reports its media type", "[packer]") {
    JsonPacker packer;

    REQUIRE(packer.media_type() == "application/json");
    REQUIRE(packer.file_extension() == ".json");
}

TEST_CASE("Output file name uses the input stem and packer extension", "[packer]") {
    JsonPacker packer;

    REQUIRE(packer.output_file_name("notes/README.md") == "README.json");
    REQUIRE(packer.output_file_name("plain") == "plain.json");
    REQUIRE(packer.output_file_name("") == "document.json");
    REQUIRE(packer.output_file_name("-") == "document.json");
}

TEST_CASE("Paragraph properties are written with document keys", "[packer]") {
    json j = JsonPacker::to_json(sample_document());

    REQUIRE(j["numbering"].size() == 2);
    REQUIRE(j["numbering"][0]["reference"] == BULLET_REFERENCE);
    REQUIRE(j["numbering"][0]["levels"].size() == 9);
    REQUIRE(j["numbering"][1]["levels"][1]["format"] == "lowerLetter");
    REQUIRE(j["numbering"][1]["levels"][1]["indent"]["left"] == 1440);

    const json& blocks = j["blocks"];

    const json& heading = blocks[0];
    REQUIRE(heading["type"] == "paragraph");
    REQUIRE(heading["heading"] == "Heading1");
    REQUIRE(heading["spacing"]["before"] == HEADING_SPACING_BEFORE);
    REQUIRE(heading["spacing"]["after"] == HEADING_SPACING_AFTER);

    const json& runs = blocks[1]["children"];
    REQUIRE(runs.size() == 3);
    REQUIRE(runs[0]["text"] == "bold");
    REQUIRE(runs[0]["bold"] == true);
    REQUIRE_FALSE(runs[0].contains("italics"));
    REQUIRE(runs[1]["break"] == 1);
    REQUIRE_FALSE(runs[1].contains("text"));
    REQUIRE(runs[2]["type"] == "hyperlink");
    REQUIRE(runs[2]["link"] == "https://example.com");
    REQUIRE(runs[2]["children"][0]["underline"] == "single");
    REQUIRE(runs[2]["children"][0]["style"] == HYPERLINK_STYLE);

    const json& item = blocks[2];
    REQUIRE(item["numbering"]["reference"] == ORDERED_REFERENCE);
    REQUIRE(item["numbering"]["level"] == 0);

    const json& quote = blocks[3];
    REQUIRE(quote["indent"]["left"] == QUOTE_INDENT);
    REQUIRE(quote["border"]["left"]["color"] == QUOTE_BORDER_COLOR);
    REQUIRE(quote["border"]["left"]["style"] == "single");
}

TEST_CASE("Tables and rules are written with their layout", "[packer]") {
    json j = JsonPacker::to_json(sample_document());
    const json& blocks = j["blocks"];

    const json& table = blocks[4];
    REQUIRE(table["type"] == "table");
    REQUIRE(table["width"]["size"] == 100);
    REQUIRE(table["width"]["type"] == "pct");
    REQUIRE(table["rows"][0]["header"] == true);
    REQUIRE(table["rows"][0]["cells"][0]["shading"]["fill"] == TABLE_HEADER_SHADING);
    REQUIRE(table["rows"][0]["cells"][0]["children"][0]["children"][0]["bold"] == true);

    REQUIRE(blocks[5]["spacing"]["after"] == SPACER_SPACING_AFTER);

    const json& rule = blocks[6];
    REQUIRE(rule["border"]["bottom"]["color"] == RULE_BORDER_COLOR);
    REQUIRE(rule["tabStops"][0]["type"] == "right");
    REQUIRE(rule["tabStops"][0]["position"] == RULE_TAB_POSITION);
}

TEST_CASE("Pack serializes with the configured indent", "[packer]") {
    Document doc = build_document(compose_blocks({make_paragraph({make_text("x")})}));

    std::string compact = JsonPacker(-1).pack(doc);
    std::string pretty = JsonPacker(2).pack(doc);

    REQUIRE(compact.find('\n') == std::string::npos);
    REQUIRE(pretty.find('\n') != std::string::npos);
    REQUIRE(json::parse(compact) == json::parse(pretty));
}

TEST_CASE("Invalid UTF-8 text raises a pack error", "[packer][errors]") {
    Document doc = build_document(compose_blocks({make_paragraph({make_text("bad \xff byte")})}));

    REQUIRE_THROWS_AS(JsonPacker().pack(doc), PackError);
}
