#include "scholar_parser/config_loader.h"
#include "scholar_parser/errors.h"
#include <filesystem>
#include <fstream>

namespace scholar_parser {

namespace {

void read_count(const nlohmann::json& config, const char* key, size_t& target) {
    if (!config.contains(key)) {
        return;
    }
    const auto& value = config.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw ConfigError(std::string("Config key '") + key + "' must be a non-negative integer");
    }
    target = value.get<size_t>();
}

} // namespace

ParseOptions ConfigLoader::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("Config file not found: " + path);
    }

    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json config;
    try {
        file >> config;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path + ": " + e.what());
    }

    return from_json(config);
}

ParseOptions ConfigLoader::from_json(const nlohmann::json& config, const ParseOptions& base) {
    if (!config.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    ParseOptions options = base;
    read_count(config, "max_reference_lines", options.max_reference_lines);
    read_count(config, "reference_tail_window", options.reference_tail_window);
    read_count(config, "min_reference_length", options.min_reference_length);
    read_count(config, "abstract_window_lines", options.abstract_window_lines);
    read_count(config, "section_id_prefix_length", options.section_id_prefix_length);

    if (config.contains("default_heading")) {
        const auto& heading = config.at("default_heading");
        if (!heading.is_string()) {
            throw ConfigError("Config key 'default_heading' must be a string");
        }
        options.default_heading = heading.get<std::string>();
    }

    return options;
}

nlohmann::json ConfigLoader::to_json(const ParseOptions& options) {
    return {
        {"max_reference_lines", options.max_reference_lines},
        {"reference_tail_window", options.reference_tail_window},
        {"min_reference_length", options.min_reference_length},
        {"abstract_window_lines", options.abstract_window_lines},
        {"section_id_prefix_length", options.section_id_prefix_length},
        {"default_heading", options.default_heading}
    };
}

} // namespace scholar_parser
