#include "scholar_parser/reference_extractor.h"
#include "scholar_parser/text_normalizer.h"
#include <algorithm>
#include <cstddef>
#include <regex>

namespace scholar_parser {

namespace {

// Only the bounded "10.NNNN/" prefix goes through the regex; the suffix is
// scanned by hand because std::regex recurses once per repeated character.
const std::regex& doi_prefix_regex() {
    static const std::regex pattern(R"(10\.\d{4,9}/(?=[-._;()/:A-Za-z0-9]))");
    return pattern;
}

bool is_doi_suffix_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == ';' || c == '(' || c == ')' ||
           c == '/' || c == ':';
}

const std::regex& year_regex() {
    static const std::regex pattern(R"((?:19|20)\d{2})");
    return pattern;
}

} // namespace

std::optional<std::string> extract_doi(const std::string& text) {
    std::smatch match;
    if (!std::regex_search(text, match, doi_prefix_regex())) {
        return std::nullopt;
    }

    auto suffix_begin = match[0].second;
    auto suffix_end = std::find_if_not(suffix_begin, text.end(), is_doi_suffix_char);
    return to_lower_ascii(std::string(match[0].first, suffix_end));
}

std::optional<int> extract_year(const std::string& text) {
    std::smatch match;
    if (std::regex_search(text, match, year_regex())) {
        return std::stoi(match.str(0));
    }
    return std::nullopt;
}

ReferenceExtractor::ReferenceExtractor(const ParseOptions& options) : options_(options) {}

std::vector<ParsedReference> ReferenceExtractor::extract(const Document& document) const {
    auto region = locate_bibliography(document.line_texts());

    std::vector<ParsedReference> references;
    size_t limit = std::min(region.size(), options_.max_reference_lines);
    for (size_t i = 0; i < limit; ++i) {
        if (auto reference = parse_line(region[i])) {
            references.push_back(std::move(*reference));
        }
    }

    return references;
}

std::vector<ParsedReference> ReferenceExtractor::extract(const std::string& raw_text) const {
    return extract(Document::from_text(raw_text));
}

std::vector<std::string> ReferenceExtractor::locate_bibliography(const std::vector<std::string>& lines) const {
    auto heading = std::find_if(lines.begin(), lines.end(), [](const std::string& line) {
        return to_lower_ascii(line) == "references";
    });
    if (heading != lines.end()) {
        return std::vector<std::string>(heading + 1, lines.end());
    }

    size_t window = std::min(lines.size(), options_.reference_tail_window);
    return std::vector<std::string>(lines.end() - static_cast<std::ptrdiff_t>(window), lines.end());
}

std::optional<ParsedReference> ReferenceExtractor::parse_line(const std::string& line) const {
    if (utf8_length(line) < options_.min_reference_length) {
        return std::nullopt;
    }

    ParsedReference reference;
    reference.raw_text = line;
    reference.doi = extract_doi(line);
    reference.year = extract_year(line);
    return reference;
}

} // namespace scholar_parser
