#pragma once

#include <string>
#include <iostream>

namespace mdocx {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

/**
 * Status output helper for the CLI with color support.
 *
 * Messages go to stderr so that a document written to stdout stays clean.
 * Falls back to plain text when colors are not supported (TERM unset or
 * dumb, or stderr is not a TTY).
 */
class Console {
public:
    // Creates a Console instance and detects color support.
    Console();

    // ========== Colored Output ==========

    // Prints error message in red.
    void print_error(const std::string& text) const;

    // Prints warning message in yellow.
    void print_warning(const std::string& text) const;

    // Prints success message in green with a checkmark prefix.
    void print_success(const std::string& text) const;

    // Prints informational message in cyan.
    void print_info(const std::string& text) const;

private:
    bool colors_enabled_;  // True if terminal supports ANSI colors.

    // Detects and enables color support based on terminal capabilities.
    void enable_colors();

    void print_line(const std::string& text, const char* color) const;
};

} // namespace mdocx
