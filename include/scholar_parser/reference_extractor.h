#pragma once

#include <scholar_parser/document.h>
#include <scholar_parser/parse_options.h>
#include <optional>
#include <string>
#include <vector>

namespace scholar_parser {

struct ParsedReference {
    std::string raw_text;
    std::optional<std::string> doi;     // lower-case, "10.NNNN/suffix"
    std::optional<std::string> title;   // not populated by the line heuristic
    std::optional<int> year;            // 1900..2099
    std::vector<std::string> authors;   // not populated by the line heuristic
};

// First DOI-looking substring, lower-cased
std::optional<std::string> extract_doi(const std::string& text);

// First 19xx or 20xx digit run
std::optional<int> extract_year(const std::string& text);

class ReferenceExtractor {
public:
    explicit ReferenceExtractor(const ParseOptions& options = ParseOptions{});

    std::vector<ParsedReference> extract(const Document& document) const;
    std::vector<ParsedReference> extract(const std::string& raw_text) const;

    // Lines after a line reading exactly "references" (any case), or the
    // tail window when there is no such line
    std::vector<std::string> locate_bibliography(const std::vector<std::string>& lines) const;

    // Returns nothing for lines below the noise threshold
    std::optional<ParsedReference> parse_line(const std::string& line) const;

private:
    ParseOptions options_;
};

} // namespace scholar_parser
