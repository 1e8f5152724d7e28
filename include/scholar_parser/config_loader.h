#pragma once

#include <scholar_parser/parse_options.h>
#include <nlohmann/json.hpp>
#include <string>

namespace scholar_parser {

// Reads ParseOptions from a JSON file whose keys are the field names.
// Missing keys keep their defaults, unknown keys are ignored.
class ConfigLoader {
public:
    // Throws ConfigError if the file cannot be read or parsed
    static ParseOptions load(const std::string& path);

    static ParseOptions from_json(const nlohmann::json& config,
                                  const ParseOptions& base = ParseOptions{});

    static nlohmann::json to_json(const ParseOptions& options);
};

} // namespace scholar_parser
