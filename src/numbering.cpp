#include "numbering.hpp"
#include "config.hpp"

#include <algorithm>
#include <string>

namespace mdocx {

namespace {
    const char* const BULLET_GLYPHS[] = {"•", "◦", "–"};

    NumberingLevel base_level(int level) {
        NumberingLevel def;
        def.level = level;
        def.alignment = LevelAlignment::Left;
        def.indent_left = LIST_INDENT_STEP * (level + 1);
        def.indent_hanging = LIST_HANGING_INDENT;
        return def;
    }

    NumberingScheme build_bullet_scheme() {
        NumberingScheme scheme;
        scheme.reference = BULLET_REFERENCE;
        for (int i = 0; i < NUMBERING_LEVELS; ++i) {
            NumberingLevel def = base_level(i);
            def.format = LevelFormat::Bullet;
            def.text = BULLET_GLYPHS[i % 3];
            scheme.levels.push_back(def);
        }
        return scheme;
    }

    NumberingScheme build_ordered_scheme() {
        NumberingScheme scheme;
        scheme.reference = ORDERED_REFERENCE;
        for (int i = 0; i < NUMBERING_LEVELS; ++i) {
            NumberingLevel def = base_level(i);
            std::string placeholder = "%" + std::to_string(i + 1);
            switch (i % 3) {
                case 0:
                    def.format = LevelFormat::Decimal;
                    def.text = placeholder + ".";
                    break;
                case 1:
                    def.format = LevelFormat::LowerLetter;
                    def.text = placeholder + ")";
                    break;
                default:
                    def.format = LevelFormat::LowerRoman;
                    def.text = placeholder + ".";
                    break;
            }
            scheme.levels.push_back(def);
        }
        return scheme;
    }
}

const NumberingScheme& bullet_scheme() {
    static const NumberingScheme scheme = build_bullet_scheme();
    return scheme;
}

const NumberingScheme& ordered_scheme() {
    static const NumberingScheme scheme = build_ordered_scheme();
    return scheme;
}

const std::vector<NumberingScheme>& numbering_schemes() {
    static const std::vector<NumberingScheme> schemes = {bullet_scheme(), ordered_scheme()};
    return schemes;
}

int clamp_list_level(int level) {
    return std::clamp(level, 0, NUMBERING_LEVELS - 1);
}

} // namespace mdocx
