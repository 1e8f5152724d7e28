#include "scholar_parser/document.h"
#include "scholar_parser/text_normalizer.h"

namespace scholar_parser {

Document Document::from_pages(std::vector<std::string> pages) {
    Document document;
    document.page_count_ = pages.size();
    document.has_page_numbers_ = true;

    // Splitting each page separately yields the same lines as splitting the
    // "\n"-joined text, since the separator is itself a line break.
    for (size_t i = 0; i < pages.size(); ++i) {
        if (i > 0) {
            document.raw_text_ += "\n";
        }
        document.raw_text_ += pages[i];

        int page_number = static_cast<int>(i) + 1;
        for (auto& line : split_lines(pages[i])) {
            document.lines_.push_back({std::move(line), page_number});
        }
    }

    document.full_text_ = normalize_whitespace(document.raw_text_);
    return document;
}

Document Document::from_text(std::string text) {
    Document document;
    document.raw_text_ = std::move(text);
    document.page_count_ = document.raw_text_.empty() ? 0 : 1;

    for (auto& line : split_lines(document.raw_text_)) {
        document.lines_.push_back({std::move(line), std::nullopt});
    }

    document.full_text_ = normalize_whitespace(document.raw_text_);
    return document;
}

std::vector<std::string> Document::line_texts() const {
    std::vector<std::string> texts;
    texts.reserve(lines_.size());
    for (const auto& line : lines_) {
        texts.push_back(line.text);
    }
    return texts;
}

} // namespace scholar_parser
