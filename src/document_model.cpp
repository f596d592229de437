#include "document_model.hpp"

namespace mdocx {

std::vector<TextRun> paragraph_runs(const Paragraph& paragraph) {
    std::vector<TextRun> runs;
    for (const auto& item : paragraph.children) {
        if (const auto* run = std::get_if<TextRun>(&item)) {
            runs.push_back(*run);
        } else if (const auto* link = std::get_if<Hyperlink>(&item)) {
            runs.insert(runs.end(), link->runs.begin(), link->runs.end());
        }
    }
    return runs;
}

std::string paragraph_text(const Paragraph& paragraph) {
    std::string text;
    for (const auto& run : paragraph_runs(paragraph)) {
        text += run.text;
    }
    return text;
}

const char* level_format_name(LevelFormat format) {
    switch (format) {
        case LevelFormat::Bullet: return "bullet";
        case LevelFormat::Decimal: return "decimal";
        case LevelFormat::LowerLetter: return "lowerLetter";
        case LevelFormat::LowerRoman: return "lowerRoman";
    }
    return "bullet";
}

} // namespace mdocx
