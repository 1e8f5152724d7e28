#include "scholar_parser/json_serializer.h"
#include "scholar_parser/text_normalizer.h"
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace scholar_parser {

namespace {

// Text files are read as raw bytes; strings are made valid UTF-8 before
// they reach either writer
nlohmann::json text_to_json(const std::string& value) {
    return to_valid_utf8(value);
}

nlohmann::json optional_to_json(const std::optional<std::string>& value) {
    if (value) {
        return text_to_json(*value);
    }
    return nullptr;
}

nlohmann::json optional_to_json(const std::optional<int>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

nlohmann::json texts_to_json(const std::vector<std::string>& values) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& value : values) {
        output.push_back(text_to_json(value));
    }
    return output;
}

nlohmann::json statements_to_json(const std::vector<ExtractedStatement>& statements) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& statement : statements) {
        output.push_back({
            {"text", text_to_json(statement.text)},
            {"confidence", statement.confidence},
            {"sectionId", statement.section_id}
        });
    }
    return output;
}

using CompactWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(CompactWriter& writer, const std::string& value) {
    std::string valid = to_valid_utf8(value);
    writer.String(valid.c_str(), static_cast<rapidjson::SizeType>(valid.size()));
}

void write_optional(CompactWriter& writer, const std::optional<std::string>& value) {
    if (value) {
        write_string(writer, *value);
    } else {
        writer.Null();
    }
}

void write_optional(CompactWriter& writer, const std::optional<int>& value) {
    if (value) {
        writer.Int(*value);
    } else {
        writer.Null();
    }
}

} // namespace

nlohmann::json JsonSerializer::to_json(const SectionChunk& section) {
    return {
        {"id", section.id},
        {"heading", text_to_json(section.heading)},
        {"text", text_to_json(section.text)},
        {"pageStart", optional_to_json(section.page_start)},
        {"pageEnd", optional_to_json(section.page_end)}
    };
}

nlohmann::json JsonSerializer::to_json(const ParsedReference& reference) {
    return {
        {"rawText", text_to_json(reference.raw_text)},
        {"doi", optional_to_json(reference.doi)},
        {"title", optional_to_json(reference.title)},
        {"year", optional_to_json(reference.year)},
        {"authors", texts_to_json(reference.authors)}
    };
}

nlohmann::json JsonSerializer::to_json(const ParseResult& result) {
    nlohmann::json output;
    output["parserName"] = result.parser_name;
    output["parserVersion"] = result.parser_version;
    output["confidence"] = result.confidence;
    output["title"] = optional_to_json(result.title);
    output["abstract"] = optional_to_json(result.abstract);
    output["fullText"] = text_to_json(result.full_text);

    output["sections"] = nlohmann::json::array();
    for (const auto& section : result.sections) {
        output["sections"].push_back(to_json(section));
    }

    output["references"] = nlohmann::json::array();
    for (const auto& reference : result.references) {
        output["references"].push_back(to_json(reference));
    }

    return output;
}

nlohmann::json JsonSerializer::to_json(const PaperDetails& details) {
    nlohmann::json output;
    output["title"] = optional_to_json(details.title);
    output["abstract"] = optional_to_json(details.abstract);

    output["requestedSections"] = nlohmann::json::array();
    for (const auto& section : details.requested_sections) {
        output["requestedSections"].push_back(to_json(section));
    }

    output["claims"] = statements_to_json(details.claims);
    output["methods"] = statements_to_json(details.methods);
    output["limitations"] = statements_to_json(details.limitations);
    output["datasets"] = texts_to_json(details.datasets);
    output["metrics"] = texts_to_json(details.metrics);

    output["references"] = nlohmann::json::array();
    for (const auto& reference : details.references) {
        output["references"].push_back(to_json(reference));
    }

    output["parserConfidence"] = details.parser_confidence;
    return output;
}

std::string JsonSerializer::serialize(const ParseResult& result, bool pretty) {
    return dump(to_json(result), pretty);
}

std::string JsonSerializer::dump(const nlohmann::json& value, bool pretty) {
    return value.dump(pretty ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string JsonSerializer::serialize_compact(const ParseResult& result) {
    // Streamed straight into the buffer with RapidJSON; no intermediate DOM
    rapidjson::StringBuffer buffer;
    CompactWriter writer(buffer);

    writer.StartObject();
    writer.Key("parserName");
    write_string(writer, result.parser_name);
    writer.Key("parserVersion");
    write_string(writer, result.parser_version);
    writer.Key("confidence");
    writer.Double(result.confidence);
    writer.Key("title");
    write_optional(writer, result.title);
    writer.Key("abstract");
    write_optional(writer, result.abstract);
    writer.Key("fullText");
    write_string(writer, result.full_text);

    writer.Key("sections");
    writer.StartArray();
    for (const auto& section : result.sections) {
        writer.StartObject();
        writer.Key("id");
        write_string(writer, section.id);
        writer.Key("heading");
        write_string(writer, section.heading);
        writer.Key("text");
        write_string(writer, section.text);
        writer.Key("pageStart");
        write_optional(writer, section.page_start);
        writer.Key("pageEnd");
        write_optional(writer, section.page_end);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("references");
    writer.StartArray();
    for (const auto& reference : result.references) {
        writer.StartObject();
        writer.Key("rawText");
        write_string(writer, reference.raw_text);
        writer.Key("doi");
        write_optional(writer, reference.doi);
        writer.Key("title");
        write_optional(writer, reference.title);
        writer.Key("year");
        write_optional(writer, reference.year);
        writer.Key("authors");
        writer.StartArray();
        for (const auto& author : reference.authors) {
            write_string(writer, author);
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace scholar_parser
