#include "scholar_parser/front_matter.h"
#include "scholar_parser/text_normalizer.h"
#include <algorithm>

namespace scholar_parser {

FrontMatterExtractor::FrontMatterExtractor(const ParseOptions& options) : options_(options) {}

FrontMatter FrontMatterExtractor::extract(const Document& document) const {
    FrontMatter front;
    const auto& lines = document.lines();
    if (lines.empty()) {
        return front;
    }

    front.title = lines.front().text;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (!starts_with_ignore_case(lines[i].text, "abstract")) {
            continue;
        }

        size_t end = std::min(lines.size(), i + options_.abstract_window_lines);
        std::string joined;
        for (size_t j = i; j < end; ++j) {
            if (!joined.empty()) {
                joined += ' ';
            }
            joined += lines[j].text;
        }
        front.abstract = normalize_whitespace(joined);
        break;
    }

    return front;
}

} // namespace scholar_parser
