#pragma once

/**
 * Document packers.
 *
 * A packer serializes a composed Document into an output artifact. The
 * container writer for the word-processing format plugs in behind
 * DocumentPacker; JsonPacker writes the full document model as JSON so
 * it can be inspected or handed to an external container writer.
 */

#include "document_model.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace mdocx {

// Raised when a packer cannot serialize a document.
class PackError : public std::runtime_error {
public:
    explicit PackError(const std::string& message) : std::runtime_error(message) {}
};

class DocumentPacker {
public:
    virtual ~DocumentPacker() = default;

    // Serializes the document. Throws PackError on failure.
    virtual std::string pack(const Document& doc) const = 0;

    // MIME type of the produced artifact.
    virtual std::string media_type() const = 0;

    // File extension of the produced artifact, including the dot.
    virtual std::string file_extension() const = 0;

    // Output file name for an input path: its stem plus file_extension().
    // Standard input ("" or "-") is named "document".
    std::string output_file_name(const std::string& input_path) const;
};

/**
 * Writes the document model as JSON.
 *
 * Layout:
 *   {
 *     "numbering": [ { "reference": "bullet-list", "levels": [ ... ] }, ... ],
 *     "blocks": [ { "type": "paragraph", "children": [ ... ], ... },
 *                 { "type": "table", "rows": [ ... ] } ]
 *   }
 * Optional paragraph and run attributes are omitted when unset.
 */
class JsonPacker : public DocumentPacker {
public:
    // indent < 0 writes compact single-line JSON.
    explicit JsonPacker(int indent = 2) : indent_(indent) {}

    std::string pack(const Document& doc) const override;
    std::string media_type() const override { return "application/json"; }
    std::string file_extension() const override { return ".json"; }

    // Builds the JSON value for a document without serializing it.
    static nlohmann::json to_json(const Document& doc);

private:
    int indent_;
};

} // namespace mdocx
