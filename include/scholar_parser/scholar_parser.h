#pragma once

#include <scholar_parser/document.h>
#include <scholar_parser/errors.h>
#include <scholar_parser/parse_options.h>
#include <scholar_parser/reference_extractor.h>
#include <scholar_parser/section_segmenter.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scholar_parser {

constexpr const char* kParserName = "scholar-parser";
constexpr const char* kParserVersion = "1.0.0";

// Static reliability ceiling of the line heuristics, not measured per input
constexpr double kHeuristicConfidence = 0.74;

struct ParseResult {
    std::string parser_name;
    std::string parser_version;
    double confidence = 0.0;
    std::optional<std::string> title;
    std::optional<std::string> abstract;
    std::string full_text;
    std::vector<SectionChunk> sections;
    std::vector<ParsedReference> references;
};

// Runs front matter extraction, section segmentation and reference parsing
// over one document. Stateless after construction; parse() may be called
// from several threads at once.
class ScholarParser {
public:
    explicit ScholarParser(const ParseOptions& options = ParseOptions{});
    ~ScholarParser();

    ScholarParser(ScholarParser&&) noexcept;
    ScholarParser& operator=(ScholarParser&&) noexcept;

    // Throws EmptyDocumentError when the pages hold no text
    ParseResult parse(const std::vector<std::string>& pages) const;
    ParseResult parse_text(const std::string& text) const;
    ParseResult parse(const Document& document) const;

    const ParseOptions& options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace scholar_parser
