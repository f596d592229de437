#include "packer.hpp"
#include "verbose.hpp"

#include <filesystem>

namespace mdocx {

using json = nlohmann::json;

namespace {
    json run_json(const TextRun& run) {
        json j = {{"type", "run"}};
        if (run.line_break) {
            j["break"] = 1;
        } else {
            j["text"] = run.text;
        }
        if (run.bold) j["bold"] = true;
        if (run.italic) j["italics"] = true;
        if (run.strike) j["strike"] = true;
        if (run.superscript) j["superScript"] = true;
        if (run.subscript) j["subScript"] = true;
        if (run.underline) j["underline"] = "single";
        if (!run.font.empty()) j["font"] = run.font;
        if (run.size > 0) j["size"] = run.size;
        if (!run.color.empty()) j["color"] = run.color;
        if (!run.style.empty()) j["style"] = run.style;
        return j;
    }

    json border_json(const Border& border) {
        return {
            {"style", "single"},
            {"size", border.size},
            {"color", border.color},
            {"space", border.space}
        };
    }

    json paragraph_json(const Paragraph& para) {
        json children = json::array();
        for (const auto& item : para.children) {
            if (const auto* run = std::get_if<TextRun>(&item)) {
                children.push_back(run_json(*run));
            } else if (const auto* link = std::get_if<Hyperlink>(&item)) {
                json runs = json::array();
                for (const auto& r : link->runs) {
                    runs.push_back(run_json(r));
                }
                children.push_back({{"type", "hyperlink"}, {"link", link->url}, {"children", runs}});
            }
        }

        json j = {{"type", "paragraph"}, {"children", children}};
        if (para.heading_level > 0) {
            j["heading"] = "Heading" + std::to_string(para.heading_level);
        }
        if (para.numbering) {
            j["numbering"] = {{"reference", para.numbering->reference}, {"level", para.numbering->level}};
        }
        if (para.spacing_before || para.spacing_after) {
            json spacing = json::object();
            if (para.spacing_before) spacing["before"] = *para.spacing_before;
            if (para.spacing_after) spacing["after"] = *para.spacing_after;
            j["spacing"] = spacing;
        }
        if (para.indent_left) {
            j["indent"] = {{"left", *para.indent_left}};
        }
        if (para.border_left || para.border_bottom) {
            json border = json::object();
            if (para.border_left) border["left"] = border_json(*para.border_left);
            if (para.border_bottom) border["bottom"] = border_json(*para.border_bottom);
            j["border"] = border;
        }
        if (!para.shading.empty()) {
            j["shading"] = {{"fill", para.shading}};
        }
        if (!para.tab_stops.empty()) {
            json stops = json::array();
            for (const auto& stop : para.tab_stops) {
                stops.push_back({
                    {"type", stop.type == TabStopType::Right ? "right" : "left"},
                    {"position", stop.position}
                });
            }
            j["tabStops"] = stops;
        }
        return j;
    }

    json table_json(const Table& table) {
        json rows = json::array();
        for (const auto& row : table.rows) {
            json cells = json::array();
            for (const auto& cell : row.cells) {
                json paragraphs = json::array();
                for (const auto& para : cell.paragraphs) {
                    paragraphs.push_back(paragraph_json(para));
                }
                json cell_json = {{"children", paragraphs}};
                if (!cell.shading.empty()) {
                    cell_json["shading"] = {{"fill", cell.shading}};
                }
                cells.push_back(cell_json);
            }
            json row_json = {{"cells", cells}};
            if (row.header) {
                row_json["header"] = true;
            }
            rows.push_back(row_json);
        }
        return {
            {"type", "table"},
            {"width", {{"size", table.width_percent}, {"type", "pct"}}},
            {"rows", rows}
        };
    }

    json numbering_json(const NumberingScheme& scheme) {
        json levels = json::array();
        for (const auto& level : scheme.levels) {
            levels.push_back({
                {"level", level.level},
                {"format", level_format_name(level.format)},
                {"text", level.text},
                {"alignment", "left"},
                {"indent", {{"left", level.indent_left}, {"hanging", level.indent_hanging}}}
            });
        }
        return {{"reference", scheme.reference}, {"levels", levels}};
    }
}

json JsonPacker::to_json(const Document& doc) {
    json numbering = json::array();
    for (const auto& scheme : doc.numbering) {
        numbering.push_back(numbering_json(scheme));
    }

    json blocks = json::array();
    for (const auto& block : doc.blocks) {
        if (const auto* para = std::get_if<Paragraph>(&block)) {
            blocks.push_back(paragraph_json(*para));
        } else if (const auto* table = std::get_if<Table>(&block)) {
            blocks.push_back(table_json(*table));
        }
    }

    return {{"numbering", numbering}, {"blocks", blocks}};
}

std::string DocumentPacker::output_file_name(const std::string& input_path) const {
    std::string stem = "document";
    if (!input_path.empty() && input_path != "-") {
        std::string name = std::filesystem::path(input_path).stem().string();
        if (!name.empty()) {
            stem = name;
        }
    }
    return stem + file_extension();
}

std::string JsonPacker::pack(const Document& doc) const {
    try {
        std::string out = to_json(doc).dump(indent_);
        verbose_out("PACK", std::to_string(doc.blocks.size()) + " blocks, " +
                            std::to_string(out.size()) + " bytes");
        return out;
    } catch (const json::exception& e) {
        // dump() throws on text that is not valid UTF-8.
        throw PackError(std::string("Failed to serialize document: ") + e.what());
    }
}

} // namespace mdocx
