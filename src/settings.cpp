#include "settings.hpp"
#include "verbose.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>

namespace mdocx {

using json = nlohmann::json;

std::optional<Settings> load_settings(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json j;
        file >> j;

        Settings settings;

        if (j.contains("parser") && j["parser"].is_object()) {
            const json& parser = j["parser"];
            settings.parser.smart = parser.value("smart", false);
            settings.parser.hard_breaks = parser.value("hard_breaks", false);

            if (parser.contains("extensions") && parser["extensions"].is_array()) {
                settings.parser.extensions.clear();
                for (const auto& name : parser["extensions"]) {
                    if (name.is_string()) {
                        settings.parser.extensions.push_back(name.get<std::string>());
                    }
                }
            }
        }

        if (j.contains("output") && j["output"].is_object()) {
            settings.output_indent = j["output"].value("indent", 2);
        }

        verbose_log("CONFIG", "Loaded settings from " + path);
        return settings;
    } catch (const json::exception& e) {
        verbose_err("CONFIG", "Invalid settings file " + path + ": " + e.what());
        return std::nullopt;
    }
}

bool save_settings(const Settings& settings, const std::string& path) {
    json j;
    j["parser"] = {
        {"smart", settings.parser.smart},
        {"hard_breaks", settings.parser.hard_breaks},
        {"extensions", settings.parser.extensions}
    };
    j["output"] = {{"indent", settings.output_indent}};

    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << j.dump(2) << std::endl;
    return file.good();
}

} // namespace mdocx
