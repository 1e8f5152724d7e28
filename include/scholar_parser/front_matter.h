#pragma once

#include <scholar_parser/document.h>
#include <scholar_parser/parse_options.h>
#include <optional>
#include <string>

namespace scholar_parser {

struct FrontMatter {
    std::optional<std::string> title;
    std::optional<std::string> abstract;
};

// Title is the first non-empty line. The abstract is the first line starting
// with "abstract" (any case) plus the lines after it, up to
// abstract_window_lines in total.
class FrontMatterExtractor {
public:
    explicit FrontMatterExtractor(const ParseOptions& options = ParseOptions{});

    FrontMatter extract(const Document& document) const;

private:
    ParseOptions options_;
};

} // namespace scholar_parser
