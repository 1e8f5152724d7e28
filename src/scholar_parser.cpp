#include "scholar_parser/scholar_parser.h"
#include "scholar_parser/front_matter.h"

namespace scholar_parser {

class ScholarParser::Impl {
public:
    explicit Impl(const ParseOptions& options)
        : options_(options),
          segmenter_(options),
          references_(options),
          front_matter_(options) {
        validate_options(options_);
    }

    ParseResult parse(const Document& document) const {
        if (document.empty()) {
            throw EmptyDocumentError();
        }

        auto front = front_matter_.extract(document);

        ParseResult result;
        result.parser_name = kParserName;
        result.parser_version = kParserVersion;
        result.confidence = kHeuristicConfidence;
        result.title = std::move(front.title);
        result.abstract = std::move(front.abstract);
        result.full_text = document.full_text();
        result.sections = segmenter_.segment(document);
        result.references = references_.extract(document);
        return result;
    }

    const ParseOptions& options() const { return options_; }

private:
    ParseOptions options_;
    SectionSegmenter segmenter_;
    ReferenceExtractor references_;
    FrontMatterExtractor front_matter_;
};

ScholarParser::ScholarParser(const ParseOptions& options)
    : pImpl(std::make_unique<Impl>(options)) {}

ScholarParser::~ScholarParser() = default;

ScholarParser::ScholarParser(ScholarParser&&) noexcept = default;
ScholarParser& ScholarParser::operator=(ScholarParser&&) noexcept = default;

ParseResult ScholarParser::parse(const std::vector<std::string>& pages) const {
    return pImpl->parse(Document::from_pages(pages));
}

ParseResult ScholarParser::parse_text(const std::string& text) const {
    return pImpl->parse(Document::from_text(text));
}

ParseResult ScholarParser::parse(const Document& document) const {
    return pImpl->parse(document);
}

const ParseOptions& ScholarParser::options() const {
    return pImpl->options();
}

} // namespace scholar_parser
