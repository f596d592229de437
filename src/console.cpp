#include "console.hpp"
#include <cstdlib>
#include <unistd.h>

namespace mdocx {

Console::Console() : colors_enabled_(true) {
    enable_colors();
}

void Console::enable_colors() {
    // Check if output is a terminal
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb" || !isatty(STDERR_FILENO)) {
        colors_enabled_ = false;
    }
}

void Console::print_line(const std::string& text, const char* color) const {
    if (colors_enabled_) {
        std::cerr << color << text << ansi::RESET << std::endl;
    } else {
        std::cerr << text << std::endl;
    }
}

void Console::print_error(const std::string& text) const {
    print_line(text, ansi::RED);
}

void Console::print_warning(const std::string& text) const {
    print_line(text, ansi::YELLOW);
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        std::cerr << "* " << text << std::endl;
    }
}

void Console::print_info(const std::string& text) const {
    print_line(text, ansi::CYAN);
}

} // namespace mdocx
