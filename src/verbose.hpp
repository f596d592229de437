#pragma once

/**
 * Verbose logging utility for the mdocx converter.
 *
 * Writes timestamped, categorized diagnostics to stderr when the
 * -v/--verbose flag is enabled: parser setup, skipped nodes, conversion
 * failures and packer output sizes. The flag is set once at startup,
 * before any conversion runs.
 */

#include <string>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <ctime>

namespace mdocx {

/**
 * Global verbose mode flag.
 */
inline bool g_verbose = false;

/**
 * Set verbose mode.
 */
inline void set_verbose(bool enabled) {
    g_verbose = enabled;
}

/**
 * Check if verbose mode is enabled.
 */
inline bool is_verbose() {
    return g_verbose;
}

/**
 * Get current timestamp as string.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

/**
 * Log a verbose message with timestamp and category.
 */
inline void verbose_log(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    std::cerr << "\033[90m[" << timestamp() << "] \033[36m[" << category << "]\033[0m " << message << std::endl;
}

/**
 * Logs data entering a stage (markdown input, requests).
 */
inline void verbose_in(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    std::cerr << "\033[90m[" << timestamp() << "] \033[32m[" << category << " <<<]\033[0m " << message << std::endl;
}

/**
 * Logs data leaving a stage (packed artifacts).
 */
inline void verbose_out(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    std::cerr << "\033[90m[" << timestamp() << "] \033[33m[" << category << " >>>]\033[0m " << message << std::endl;
}

/**
 * Log error details that are not reported to the caller.
 */
inline void verbose_err(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    std::cerr << "\033[90m[" << timestamp() << "] \033[31m[" << category << " ERR]\033[0m " << message << std::endl;
}

/**
 * Logs a failure regardless of verbose mode.
 */
inline void log_error(const std::string& category, const std::string& message) {
    std::cerr << "[" << timestamp() << "] [" << category << " ERR] " << message << std::endl;
}

/**
 * Truncate long content for display.
 */
inline std::string truncate(const std::string& s, size_t max_len = 200) {
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len) + "... (" + std::to_string(s.length()) + " bytes total)";
}

} // namespace mdocx
