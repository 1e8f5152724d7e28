#include "scholar_parser/document_loader.h"
#include "scholar_parser/errors.h"
#include "scholar_parser/text_normalizer.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace scholar_parser {

namespace {

std::string lower_extension(const fs::path& path) {
    return to_lower_ascii(path.extension().string());
}

} // namespace

DocumentLoader::DocumentLoader(const ExtractOptions& options) : options_(options) {}

Document DocumentLoader::load(const std::string& path) const {
    if (!fs::exists(path)) {
        throw ExtractionError("File does not exist: " + path);
    }
    if (!fs::is_regular_file(path)) {
        throw ExtractionError("Not a regular file: " + path);
    }

    if (is_pdf(path)) {
        TextExtractor extractor;
        return Document::from_pages(extractor.extract_all_pages(path, options_));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ExtractionError("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    return Document::from_pages(split_pages(buffer.str()));
}

bool DocumentLoader::is_pdf(const std::string& path) {
    return lower_extension(path) == ".pdf";
}

std::vector<std::string> DocumentLoader::split_pages(const std::string& text) {
    // pdftotext separates pages with a form feed and ends the last one with it
    std::vector<std::string> pages;
    size_t start = 0;
    size_t pos;
    while ((pos = text.find('\f', start)) != std::string::npos) {
        pages.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    if (start < text.size() || pages.empty()) {
        pages.push_back(text.substr(start));
    }
    return pages;
}

std::vector<std::string> DocumentLoader::collect_inputs(const std::string& directory) {
    std::vector<std::string> inputs;
    for (const auto& entry : fs::recursive_directory_iterator(directory)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto ext = lower_extension(entry.path());
        if (ext == ".pdf" || ext == ".txt") {
            inputs.push_back(entry.path().string());
        }
    }
    std::sort(inputs.begin(), inputs.end());
    return inputs;
}

std::string DocumentLoader::output_path_for(const std::string& input_root,
                                            const std::string& input,
                                            const std::string& output_dir,
                                            const std::string& extension) {
    // Keep the full relative path and the input extension so that a/x.pdf,
    // b/x.pdf and a/x.txt never map to the same output file
    fs::path root(input_root);
    if (!root.has_filename() && root.has_parent_path()) {
        root = root.parent_path();
    }
    fs::path relative = fs::path(input).lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        relative = fs::path(input).filename();
    }
    return (fs::path(output_dir) / relative).string() + extension;
}

} // namespace scholar_parser
