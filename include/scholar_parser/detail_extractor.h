#pragma once

#include <scholar_parser/scholar_parser.h>
#include <optional>
#include <string>
#include <vector>

namespace scholar_parser {

struct DetailRequest {
    // Heading fragments to restrict extraction to; empty means all sections
    std::vector<std::string> sections;
    bool include_references = true;
};

struct ExtractedStatement {
    std::string text;
    double confidence;
    std::string section_id;
};

struct PaperDetails {
    std::optional<std::string> title;
    std::optional<std::string> abstract;
    std::vector<SectionChunk> requested_sections;
    std::vector<ExtractedStatement> claims;
    std::vector<ExtractedStatement> methods;
    std::vector<ExtractedStatement> limitations;
    std::vector<std::string> datasets;
    std::vector<std::string> metrics;
    std::vector<ParsedReference> references;
    double parser_confidence = 0.0;
};

// Pattern-based pass over already segmented sections: sentences that read
// like claims, method descriptions or limitations, plus dataset and metric
// names. Surface matching only.
class DetailExtractor {
public:
    static constexpr size_t kMaxStatements = 25;
    static constexpr size_t kMaxDatasets = 30;
    static constexpr size_t kMinSentenceLength = 20;

    PaperDetails extract(const ParseResult& result, const DetailRequest& request = DetailRequest{}) const;

    std::vector<SectionChunk> select_sections(const std::vector<SectionChunk>& sections,
                                              const std::vector<std::string>& requested) const;

    static std::vector<std::string> split_sentences(const std::string& text);
};

} // namespace scholar_parser
