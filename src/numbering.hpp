#pragma once

/**
 * List numbering definitions.
 *
 * Two schemes are defined for the whole process, one for bullet lists and
 * one for ordered lists, each with nine nesting levels. They are built on
 * first use and never modified, so concurrent conversions can share them.
 */

#include "document_model.hpp"

#include <vector>

namespace mdocx {

constexpr const char* BULLET_REFERENCE = "bullet-list";
constexpr const char* ORDERED_REFERENCE = "ordered-list";

// Bullet scheme: glyphs cycle through U+2022, U+25E6, U+2013 every three levels.
const NumberingScheme& bullet_scheme();

// Ordered scheme: decimal, lower-letter, lower-roman, cycling every three levels.
const NumberingScheme& ordered_scheme();

// Both schemes, in the order they are attached to a document.
const std::vector<NumberingScheme>& numbering_schemes();

// Clamps a list nesting level to the defined levels (0-8).
int clamp_list_level(int level);

} // namespace mdocx
