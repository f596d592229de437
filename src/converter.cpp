#include "converter.hpp"
#include "block_composer.hpp"
#include "config.hpp"
#include "verbose.hpp"

#include <utility>

namespace mdocx {

using json = nlohmann::json;

namespace {
    ConversionResult invalid_input() {
        ConversionResult result;
        result.status = ConversionStatus::InvalidInput;
        result.error = MSG_INPUT_REQUIRED;
        return result;
    }

    ConversionResult conversion_failed() {
        ConversionResult result;
        result.status = ConversionStatus::Failed;
        result.error = MSG_CONVERSION_FAILED;
        return result;
    }
}

Converter::Converter(ParserOptions options, const DocumentPacker& packer)
    : options_(std::move(options)), packer_(packer) {}

Document Converter::build_document(const std::string& markdown) const {
    Node root = parse_markdown(markdown, options_);
    std::vector<Block> blocks = compose_blocks(root.children);
    verbose_log("COMPOSE", "Composed " + std::to_string(blocks.size()) + " blocks");
    return mdocx::build_document(std::move(blocks));
}

ConversionResult Converter::convert(const std::optional<std::string>& markdown) const {
    if (!markdown || markdown->empty()) {
        verbose_err("CONVERT", "Rejected request without markdown content");
        return invalid_input();
    }

    try {
        Document doc = build_document(*markdown);

        ConversionResult result;
        result.artifact = packer_.pack(doc);
        result.media_type = packer_.media_type();
        result.status = ConversionStatus::Ok;
        return result;
    } catch (const std::exception& e) {
        log_error("CONVERT", std::string("Conversion error: ") + e.what());
        return conversion_failed();
    }
}

ConversionResult Converter::convert_request(const json& request) const {
    if (!request.is_object() || !request.contains("markdown") || !request["markdown"].is_string()) {
        if (is_verbose()) {
            std::string dumped = request.dump(-1, ' ', false, json::error_handler_t::replace);
            verbose_err("CONVERT", "Request has no string 'markdown' field: " + truncate(dumped));
        }
        return invalid_input();
    }
    return convert(request.at("markdown").get<std::string>());
}

ConversionResult Converter::convert_request_body(const std::string& body) const {
    json request;
    try {
        request = json::parse(body);
    } catch (const json::exception& e) {
        log_error("CONVERT", "Request body is not valid JSON: " + std::string(e.what()));
        return conversion_failed();
    }
    return convert_request(request);
}

} // namespace mdocx
