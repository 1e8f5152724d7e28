#pragma once

#include <scholar_parser/document.h>
#include <scholar_parser/text_extractor.h>
#include <string>
#include <vector>

namespace scholar_parser {

// Turns a path into page texts: PDFs go through TextExtractor, any other
// file is read as text and split into pages at form feeds.
class DocumentLoader {
public:
    explicit DocumentLoader(const ExtractOptions& options = ExtractOptions{});

    // Throws ExtractionError for missing or unreadable files
    Document load(const std::string& path) const;

    static bool is_pdf(const std::string& path);
    static std::vector<std::string> split_pages(const std::string& text);
    static std::vector<std::string> collect_inputs(const std::string& directory);

    // "<output_dir>/<input relative to input_root><extension>", e.g.
    // papers/a/x.pdf -> out/a/x.pdf.json
    static std::string output_path_for(const std::string& input_root,
                                       const std::string& input,
                                       const std::string& output_dir,
                                       const std::string& extension = ".json");

private:
    ExtractOptions options_;
};

} // namespace scholar_parser
