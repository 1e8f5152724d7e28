#include "scholar_parser/section_segmenter.h"
#include "scholar_parser/text_normalizer.h"
#include <functional>
#include <sstream>

namespace scholar_parser {

namespace {

// Body lines collected under the current heading
struct PendingSection {
    std::string heading;
    std::string body;
    std::optional<int> first_page;
    std::optional<int> last_page;

    void add_line(const Line& line) {
        if (!body.empty()) {
            body += ' ';
        }
        body += line.text;
        if (line.page) {
            if (!first_page) {
                first_page = line.page;
            }
            last_page = line.page;
        }
    }

    void reset(const std::string& new_heading) {
        heading = new_heading;
        body.clear();
        first_page.reset();
        last_page.reset();
    }
};

} // namespace

SectionSegmenter::SectionSegmenter(const ParseOptions& options, HeadingClassifier classifier)
    : options_(options), classifier_(std::move(classifier)) {}

std::vector<SectionChunk> SectionSegmenter::segment(const Document& document) const {
    std::vector<SectionChunk> sections;
    PendingSection current;
    current.reset(options_.default_heading);

    auto flush = [&]() {
        std::string text = normalize_whitespace(current.body);
        if (text.empty()) {
            return;
        }
        SectionChunk chunk;
        chunk.id = make_section_id(current.heading, text);
        chunk.heading = current.heading;
        chunk.text = std::move(text);
        chunk.page_start = current.first_page;
        chunk.page_end = current.last_page;
        sections.push_back(std::move(chunk));
    };

    for (const auto& line : document.lines()) {
        if (classifier_.is_heading(line.text)) {
            flush();
            current.reset(line.text);
            continue;
        }
        current.add_line(line);
    }
    flush();

    return sections;
}

std::vector<SectionChunk> SectionSegmenter::segment(const std::string& raw_text) const {
    return segment(Document::from_text(raw_text));
}

std::string SectionSegmenter::make_section_id(const std::string& heading, const std::string& text) const {
    std::string key = heading;
    key += '\x1f';
    key += text.substr(0, options_.section_id_prefix_length);

    std::ostringstream id;
    id << "section_" << std::hex << std::hash<std::string>{}(key);
    return id.str();
}

} // namespace scholar_parser
