#pragma once

#include <memory>
#include <string>
#include <vector>

namespace scholar_parser {

struct ExtractOptions {
    bool verbose = false;
    int page_limit = -1;    // -1 = all pages
};

// Plain text of each PDF page, in page order, through MuPDF. Lines of a
// page are separated by "\n", text blocks by an empty line.
class TextExtractor {
public:
    TextExtractor();
    ~TextExtractor();

    std::string extract_page(const std::string& pdf_path, int page_number);

    // Throws ExtractionError when the document cannot be opened
    std::vector<std::string> extract_all_pages(const std::string& pdf_path,
                                               const ExtractOptions& options = ExtractOptions{});

    int get_page_count(const std::string& pdf_path);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace scholar_parser
