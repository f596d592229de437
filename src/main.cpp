#include "config.hpp"
#include "console.hpp"
#include "converter.hpp"
#include "packer.hpp"
#include "settings.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>

using namespace mdocx;

// ========== Exit Codes ==========

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_CODE = 1;   // Conversion or I/O failure.
constexpr int EXIT_INVALID_INPUT = 2;

// ========== Input / Output ==========

// Reads the whole input file, or stdin when path is empty or "-".
std::optional<std::string> read_input(const std::string& path) {
    if (path.empty() || path == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Writes the artifact to the output file, or stdout when path is empty or "-".
bool write_output(const std::string& path, const std::string& artifact) {
    if (path.empty() || path == "-") {
        std::cout << artifact << std::endl;
        return static_cast<bool>(std::cout);
    }

    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    file << artifact;
    return file.good();
}

// Resolves -o: a directory gets the packer's output file name inside it.
std::string resolve_output_path(const std::string& output_path, const std::string& input_path,
                                const DocumentPacker& packer) {
    if (output_path.empty() || output_path == "-" || !std::filesystem::is_directory(output_path)) {
        return output_path;
    }
    return (std::filesystem::path(output_path) / packer.output_file_name(input_path)).string();
}

// ========== Settings ==========

// Loads settings from the config path, falling back to defaults with a warning.
Settings resolve_settings(const std::string& config_path, bool explicit_path, Console& console) {
    bool exists = std::filesystem::exists(config_path);
    if (!exists) {
        if (explicit_path) {
            console.print_warning("Config file not found: " + config_path + " (using defaults)");
        }
        return Settings{};
    }

    auto loaded = load_settings(config_path);
    if (!loaded.has_value()) {
        console.print_warning("Ignoring invalid config file: " + config_path);
        return Settings{};
    }
    return *loaded;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Convert Markdown into a word-processing document model"};
    app.footer("\nExamples:\n"
               "  mdocx README.md -o readme.json     Convert a file\n"
               "  mdocx README.md -o out/            Write out/README.json\n"
               "  mdocx --smart --save-config        Store options in .mdocx.json\n"
               "  cat notes.md | mdocx               Convert stdin to stdout\n"
               "  mdocx --request body.json          Convert a {\"markdown\": ...} request body\n");

    std::string input_path;
    app.add_option("input", input_path, "Markdown file to convert (default: stdin)");

    std::string output_path;
    app.add_option("-o,--output", output_path,
                   "Output file or directory (default: stdout)");

    bool request_mode = false;
    app.add_flag("--request", request_mode,
                 "Treat input as a JSON request body of the form {\"markdown\": \"...\"}");

    std::string config_path = SETTINGS_FILE;
    auto* config_option = app.add_option("-c,--config", config_path,
                                         "Settings file (default: .mdocx.json)");

    int indent = 0;
    auto* indent_option = app.add_option("--indent", indent,
                                         "JSON indent, -1 for compact output")
        ->check(CLI::Range(-1, 8));

    bool smart = false;
    app.add_flag("--smart", smart, "Enable smart punctuation");

    bool hard_breaks = false;
    app.add_flag("--hard-breaks", hard_breaks, "Render soft line breaks as line breaks");

    bool save_config = false;
    app.add_flag("--save-config", save_config,
                 "Write the effective settings to the settings file and exit");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log parser and packer diagnostics to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);

    Console console;

    Settings settings = resolve_settings(config_path, config_option->count() > 0, console);
    if (smart) {
        settings.parser.smart = true;
    }
    if (hard_breaks) {
        settings.parser.hard_breaks = true;
    }
    if (indent_option->count() > 0) {
        settings.output_indent = indent;
    }

    if (save_config) {
        if (!save_settings(settings, config_path)) {
            console.print_error("Error: cannot write config file " + config_path);
            return EXIT_FAILURE_CODE;
        }
        console.print_success("Saved settings to " + config_path);
        return EXIT_OK;
    }

    if (verbose) {
        std::string extensions;
        for (const auto& name : settings.parser.extensions) {
            if (!extensions.empty()) extensions += ", ";
            extensions += name;
        }
        console.print_info("Parser extensions: " + (extensions.empty() ? std::string("none") : extensions));
    }

    auto input = read_input(input_path);
    if (!input.has_value()) {
        console.print_error("Error: cannot read input file " + input_path);
        return EXIT_FAILURE_CODE;
    }

    JsonPacker packer(settings.output_indent);
    Converter converter(settings.parser, packer);

    ConversionResult result = request_mode
        ? converter.convert_request_body(*input)
        : converter.convert(*input);

    switch (result.status) {
        case ConversionStatus::InvalidInput:
            console.print_error("Error: " + result.error);
            return EXIT_INVALID_INPUT;
        case ConversionStatus::Failed:
            console.print_error("Error: " + result.error);
            return EXIT_FAILURE_CODE;
        case ConversionStatus::Ok:
            break;
    }

    output_path = resolve_output_path(output_path, input_path, packer);
    if (!write_output(output_path, result.artifact)) {
        console.print_error("Error: cannot write output file " + output_path);
        return EXIT_FAILURE_CODE;
    }

    if (!output_path.empty() && output_path != "-") {
        console.print_success("Wrote " + output_path + " (" + result.media_type + ")");
    }
    return EXIT_OK;
}
