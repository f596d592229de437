#include <catch2/catch.hpp>
#include "numbering.hpp"
#include "config.hpp"

using namespace mdocx;

TEST_CASE("Bullet scheme defines nine cycling glyph levels", "[numbering]") {
    const auto& scheme = bullet_scheme();

    REQUIRE(scheme.reference == BULLET_REFERENCE);
    REQUIRE(scheme.levels.size() == 9);

    const char* glyphs[] = {"•", "◦", "–"};
    for (int i = 0; i < 9; ++i) {
        const auto& level = scheme.levels[i];
        REQUIRE(level.level == i);
        REQUIRE(level.format == LevelFormat::Bullet);
        REQUIRE(level.text == glyphs[i % 3]);
        REQUIRE(level.alignment == LevelAlignment::Left);
    }
}

TEST_CASE("Ordered scheme cycles decimal, letter and roman", "[numbering]") {
    const auto& scheme = ordered_scheme();

    REQUIRE(scheme.reference == ORDERED_REFERENCE);
    REQUIRE(scheme.levels.size() == 9);

    REQUIRE(scheme.levels[0].format == LevelFormat::Decimal);
    REQUIRE(scheme.levels[0].text == "%1.");
    REQUIRE(scheme.levels[1].format == LevelFormat::LowerLetter);
    REQUIRE(scheme.levels[1].text == "%2)");
    REQUIRE(scheme.levels[2].format == LevelFormat::LowerRoman);
    REQUIRE(scheme.levels[2].text == "%3.");
    REQUIRE(scheme.levels[3].format == LevelFormat::Decimal);
    REQUIRE(scheme.levels[3].text == "%4.");
    REQUIRE(scheme.levels[8].format == LevelFormat::LowerRoman);
    REQUIRE(scheme.levels[8].text == "%9.");
}

TEST_CASE("Level indents grow by half an inch per level", "[numbering]") {
    for (const auto* scheme : {&bullet_scheme(), &ordered_scheme()}) {
        for (int i = 0; i < 9; ++i) {
            REQUIRE(scheme->levels[i].indent_left == 720 * (i + 1));
            REQUIRE(scheme->levels[i].indent_hanging == 360);
        }
    }
}

TEST_CASE("Numbering schemes are built once and compare equal", "[numbering]") {
    REQUIRE(&bullet_scheme() == &bullet_scheme());
    REQUIRE(bullet_scheme() == bullet_scheme());
    REQUIRE_FALSE(bullet_scheme() == ordered_scheme());

    const auto& all = numbering_schemes();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0] == bullet_scheme());
    REQUIRE(all[1] == ordered_scheme());
}

TEST_CASE("List levels are clamped to the defined range", "[numbering]") {
    REQUIRE(clamp_list_level(-1) == 0);
    REQUIRE(clamp_list_level(0) == 0);
    REQUIRE(clamp_list_level(5) == 5);
    REQUIRE(clamp_list_level(8) == 8);
    REQUIRE(clamp_list_level(9) == 8);
    REQUIRE(clamp_list_level(42) == 8);
}

TEST_CASE("Level format names match the document format", "[numbering]") {
    REQUIRE(std::string(level_format_name(LevelFormat::Bullet)) == "bullet");
    REQUIRE(std::string(level_format_name(LevelFormat::Decimal)) == "decimal");
    REQUIRE(std::string(level_format_name(LevelFormat::LowerLetter)) == "lowerLetter");
    REQUIRE(std::string(level_format_name(LevelFormat::LowerRoman)) == "lowerRoman");
}
