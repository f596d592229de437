#pragma once

/**
 * Conversion entry point: markdown text in, packed document out.
 *
 * The Converter is the failure boundary of the pipeline. It rejects
 * missing or non-string input before any work starts, runs
 * parse -> compose -> pack, and turns every downstream exception into a
 * generic failure result. Failure details are logged, never returned.
 *
 * Usage:
 *   JsonPacker packer;
 *   Converter converter(ParserOptions::defaults(), packer);
 *   ConversionResult result = converter.convert(markdown);
 *   if (result.ok()) write(result.artifact);
 *
 * A Converter holds no per-call state and may be shared by threads.
 */

#include "document_model.hpp"
#include "markdown_parser.hpp"
#include "packer.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace mdocx {

enum class ConversionStatus {
    Ok,
    InvalidInput,   // Missing, empty or non-string markdown.
    Failed          // Malformed request body, parser or packer failure.
};

struct ConversionResult {
    ConversionStatus status = ConversionStatus::Failed;
    std::string artifact;     // Packed document, empty unless ok().
    std::string media_type;   // MIME type of the artifact.
    std::string error;        // Caller-facing message, empty if ok().

    bool ok() const { return status == ConversionStatus::Ok; }
};

class Converter {
public:
    // The packer must outlive the converter.
    Converter(ParserOptions options, const DocumentPacker& packer);

    // Parses and composes markdown into a document. Throws ParseError.
    Document build_document(const std::string& markdown) const;

    // Converts markdown; std::nullopt or an empty string is invalid input.
    ConversionResult convert(const std::optional<std::string>& markdown) const;

    // Converts a request body of the form {"markdown": "..."}.
    ConversionResult convert_request(const nlohmann::json& request) const;

    // Parses the body as JSON first; malformed JSON is a failure, not invalid input.
    ConversionResult convert_request_body(const std::string& body) const;

    const ParserOptions& options() const { return options_; }

private:
    ParserOptions options_;
    const DocumentPacker& packer_;
};

} // namespace mdocx
