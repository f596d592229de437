#pragma once

/**
 * Settings persistence for the mdocx CLI.
 *
 * Handles loading and saving of converter settings to a local JSON file:
 * markdown parser options and the output indentation of the JSON packer.
 */

#include "config.hpp"
#include "markdown_parser.hpp"

#include <optional>
#include <string>

namespace mdocx {

/**
 * Converter settings stored in .mdocx.json.
 *
 * Keys that are absent from the file keep their defaults.
 */
struct Settings {
    ParserOptions parser = ParserOptions::defaults();   // Markdown parser options.
    int output_indent = 2;                              // JSON packer indent, -1 = compact.
};

// Loads settings from the given file. Returns empty optional if the file
// doesn't exist or is not valid JSON.
std::optional<Settings> load_settings(const std::string& path = SETTINGS_FILE);

// Saves settings to the given file. Returns false if the file cannot be written.
bool save_settings(const Settings& settings, const std::string& path = SETTINGS_FILE);

} // namespace mdocx
