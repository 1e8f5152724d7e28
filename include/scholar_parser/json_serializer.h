#pragma once

#include <scholar_parser/detail_extractor.h>
#include <scholar_parser/scholar_parser.h>
#include <nlohmann/json.hpp>
#include <string>

namespace scholar_parser {

// Renders results with camelCase field names; absent values become null
class JsonSerializer {
public:
    static nlohmann::json to_json(const ParseResult& result);
    static nlohmann::json to_json(const SectionChunk& section);
    static nlohmann::json to_json(const ParsedReference& reference);
    static nlohmann::json to_json(const PaperDetails& details);

    static std::string serialize(const ParseResult& result, bool pretty = true);

    // Never throws on malformed UTF-8; bad sequences become U+FFFD
    static std::string dump(const nlohmann::json& value, bool pretty = true);

    // Single line, for JSON Lines output
    static std::string serialize_compact(const ParseResult& result);
};

} // namespace scholar_parser
