#pragma once

#include <scholar_parser/document.h>
#include <scholar_parser/heading_classifier.h>
#include <scholar_parser/parse_options.h>
#include <optional>
#include <string>
#include <vector>

namespace scholar_parser {

struct SectionChunk {
    // Hash of heading and a text prefix. Stable within one run; collisions
    // are possible, so it is not a content fingerprint.
    std::string id;
    std::string heading;    // literal heading line, case preserved
    std::string text;       // normalized, never empty
    std::optional<int> page_start;
    std::optional<int> page_end;
};

class SectionSegmenter {
public:
    explicit SectionSegmenter(const ParseOptions& options = ParseOptions{},
                              HeadingClassifier classifier = HeadingClassifier{});

    std::vector<SectionChunk> segment(const Document& document) const;
    std::vector<SectionChunk> segment(const std::string& raw_text) const;

    std::string make_section_id(const std::string& heading, const std::string& text) const;

private:
    ParseOptions options_;
    HeadingClassifier classifier_;
};

} // namespace scholar_parser
