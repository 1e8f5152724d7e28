#pragma once

#include <optional>
#include <string>
#include <vector>

namespace scholar_parser {

struct Line {
    std::string text;           // trimmed, never empty
    std::optional<int> page;    // 1-based, absent for pre-joined input
};

// Immutable view of one document's extracted text. Built either from
// per-page strings or from a single pre-joined string.
class Document {
public:
    static Document from_pages(std::vector<std::string> pages);
    static Document from_text(std::string text);

    // Pages joined with "\n"
    const std::string& raw_text() const { return raw_text_; }

    // raw_text() with whitespace collapsed
    const std::string& full_text() const { return full_text_; }

    const std::vector<Line>& lines() const { return lines_; }

    // Line texts only, in document order
    std::vector<std::string> line_texts() const;

    size_t page_count() const { return page_count_; }
    bool has_page_numbers() const { return has_page_numbers_; }
    bool empty() const { return full_text_.empty(); }

private:
    Document() = default;

    std::string raw_text_;
    std::string full_text_;
    std::vector<Line> lines_;
    size_t page_count_ = 0;
    bool has_page_numbers_ = false;
};

} // namespace scholar_parser
