#include <catch2/catch.hpp>
#include "converter.hpp"
#include "config.hpp"
#include "test_helpers.hpp"

#include <thread>
#include <vector>

using namespace mdocx;
using json = nlohmann::json;

namespace {
    // Packer that always fails, for exercising the failure boundary.
    class FailingPacker : public DocumentPacker {
    public:
        std::string pack(const Document&) const override {
            throw PackError("disk full");
        }
        std::string media_type() const override { return "application/octet-stream"; }
        std::string file_extension() const override { return ".bin"; }
    };
}

// ============================================================================
// Input validation
// ============================================================================

TEST_CASE("Missing or empty markdown is rejected", "[converter][validation]") {
    JsonPacker packer;
    Converter converter(ParserOptions::defaults(), packer);

    auto missing = converter.convert(std::nullopt);
    auto empty = converter.convert(std::string());

    REQUIRE(missing.status == ConversionStatus::InvalidInput);
    REQUIRE(missing.error == MSG_INPUT_REQUIRED);
    REQUIRE(missing.artifact.empty());
    REQUIRE(empty.status == ConversionStatus::InvalidInput);
    REQUIRE(empty.error == MSG_INPUT_REQUIRED);
}

TEST_CASE("Requests without a string markdown field are rejected", "[converter][validation]") {
    JsonPacker packer;
    Converter converter(ParserOptions::defaults(), packer);

    REQUIRE(converter.convert_request(json::object()).status == ConversionStatus::InvalidInput);
    REQUIRE(converter.convert_request(json{{"markdown", 42}}).status == ConversionStatus::InvalidInput);
    REQUIRE(converter.convert_request(json{{"markdown", nullptr}}).status == ConversionStatus::InvalidInput);
    REQUIRE(converter.convert_request(json{{"markdown", ""}}).status == ConversionStatus::InvalidInput);
    REQUIRE(converter.convert_request(json::array()).status == ConversionStatus::InvalidInput);
}

TEST_CASE("Malformed request bodies fail with the generic error", "[converter][errors]") {
    JsonPacker packer;
    Converter converter(ParserOptions::defaults(), packer);

    auto result = converter.convert_request_body("{not json");

    REQUIRE(result.status == ConversionStatus::Failed);
    REQUIRE(result.error == MSG_CONVERSION_FAILED);
    REQUIRE(result.artifact.empty());
}

// ============================================================================
// Conversion
// ============================================================================

TEST_CASE("Markdown converts to a packed document", "[converter]") {
    JsonPacker packer(-1);
    Converter converter(ParserOptions::defaults(), packer);

    auto result = converter.convert_request_body(R"({"markdown": "# Title\n\nSome **bold** text."})");

    REQUIRE(result.ok());
    REQUIRE(result.error.empty());
    REQUIRE(result.media_type == "application/json");

    json doc = json::parse(result.artifact);
    REQUIRE(doc["blocks"].size() == 2);
    REQUIRE(doc["blocks"][0]["heading"] == "Heading1");
    REQUIRE(doc["blocks"][1]["children"][1]["bold"] == true);
    REQUIRE(doc["numbering"].size() == 2);
}

TEST_CASE("Built document follows list nesting from markdown", "[converter][lists]") {
    JsonPacker packer;
    Converter converter(ParserOptions::defaults(), packer);

    Document doc = converter.build_document("- A\n  - B\n    - C\n");

    REQUIRE(doc.blocks.size() == 3);
    REQUIRE(as_paragraph(doc.blocks[0]).numbering->level == 0);
    REQUIRE(as_paragraph(doc.blocks[1]).numbering->level == 1);
    REQUIRE(as_paragraph(doc.blocks[2]).numbering->level == 2);
    REQUIRE(paragraph_text(as_paragraph(doc.blocks[2])) == "C");
}

TEST_CASE("Task list from markdown gets checkbox prefixes", "[converter][tasks]") {
    JsonPacker packer;
    Converter converter(ParserOptions::defaults(), packer);

    Document doc = converter.build_document("- [x] done\n- [ ] todo\n");

    REQUIRE(doc.blocks.size() == 2);
    REQUIRE(paragraph_text(as_paragraph(doc.blocks[0])) == std::string(CHECKED_PREFIX) + "done");
    REQUIRE(paragraph_text(as_paragraph(doc.blocks[1])) == std::string(UNCHECKED_PREFIX) + "todo");
}

TEST_CASE("Downstream failures become a generic error", "[converter][errors]") {
    FailingPacker packer;
    Converter converter(ParserOptions::defaults(), packer);

    auto result = converter.convert(std::string("text"));

    REQUIRE(result.status == ConversionStatus::Failed);
    REQUIRE(result.error == MSG_CONVERSION_FAILED);
    REQUIRE(result.artifact.empty());
}

TEST_CASE("Parser setup failures become a generic error", "[converter][errors]") {
    ParserOptions options;
    options.extensions = {"no-such-extension"};
    JsonPacker packer;
    Converter converter(options, packer);

    auto result = converter.convert(std::string("text"));

    REQUIRE(result.status == ConversionStatus::Failed);
    REQUIRE(result.error == MSG_CONVERSION_FAILED);
}

TEST_CASE("Excessively nested input fails instead of crashing", "[converter][errors]") {
    JsonPacker packer;
    Converter converter(ParserOptions::defaults(), packer);

    auto result = converter.convert(std::string(100000, '>') + "x");

    REQUIRE(result.status == ConversionStatus::Failed);
    REQUIRE(result.error == MSG_CONVERSION_FAILED);
}

TEST_CASE("Nesting within the limit still converts", "[converter]") {
    JsonPacker packer;
    Converter converter(ParserOptions::defaults(), packer);

    auto result = converter.convert(std::string(50, '>') + "x");

    REQUIRE(result.ok());
}

TEST_CASE("Invalid UTF-8 in markdown is replaced, not fatal", "[converter]") {
    JsonPacker packer(-1);
    Converter converter(ParserOptions::defaults(), packer);

    auto result = converter.convert(std::string("caf\xe9 and a stray \xff byte"));

    REQUIRE(result.ok());
    json doc = json::parse(result.artifact);
    std::string text = doc["blocks"][0]["children"][0]["text"];
    REQUIRE(text.find("\xEF\xBF\xBD") != std::string::npos);
}

TEST_CASE("Concurrent conversions are independent", "[converter][threads]") {
    JsonPacker packer(-1);
    Converter converter(ParserOptions::defaults(), packer);

    const std::vector<std::string> inputs = {
        "# One\n\n- a\n  - b\n",
        "| x | y |\n|---|---|\n| 1 | 2 |\n",
        "```\ncode\n```\n",
        "> quoted *text*\n"
    };
    std::vector<std::string> expected;
    for (const auto& input : inputs) {
        expected.push_back(converter.convert(input).artifact);
    }

    const int rounds = 8;
    std::vector<std::string> outputs(inputs.size() * rounds);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < outputs.size(); ++t) {
        threads.emplace_back([&, t]() {
            outputs[t] = converter.convert(inputs[t % inputs.size()]).artifact;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (size_t t = 0; t < outputs.size(); ++t) {
        REQUIRE(outputs[t] == expected[t % inputs.size()]);
    }
}
