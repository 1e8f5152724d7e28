#include "scholar_parser/heading_classifier.h"
#include "scholar_parser/text_normalizer.h"

namespace scholar_parser {

namespace {

// Bytes >= 0x80 belong to multi-byte UTF-8 letters and count as word
// characters, so "Resultsé" is not a heading. Unicode spaces are checked
// before this.
bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return (u >= '0' && u <= '9') || (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') ||
           u == '_' || u >= 0x80;
}

} // namespace

const std::vector<HeadingTerm>& default_heading_terms() {
    static const std::vector<HeadingTerm> terms = {
        {"abstract", BoundaryRule::WORD_BOUNDARY},
        {"introduction", BoundaryRule::WORD_BOUNDARY},
        {"background", BoundaryRule::WORD_BOUNDARY},
        {"related work", BoundaryRule::WORD_BOUNDARY},
        {"method", BoundaryRule::WORD_BOUNDARY},
        {"methods", BoundaryRule::WORD_BOUNDARY},
        {"materials", BoundaryRule::WORD_BOUNDARY},
        {"results", BoundaryRule::WORD_BOUNDARY},
        {"discussion", BoundaryRule::WORD_BOUNDARY},
        {"conclusion", BoundaryRule::WORD_BOUNDARY},
        {"limitations", BoundaryRule::WORD_BOUNDARY},
        {"references", BoundaryRule::WORD_BOUNDARY},
    };
    return terms;
}

HeadingClassifier::HeadingClassifier(std::vector<HeadingTerm> terms)
    : terms_(std::move(terms)) {}

bool HeadingClassifier::is_heading(const std::string& line) const {
    return matched_term(line).has_value();
}

std::optional<std::string> HeadingClassifier::matched_term(const std::string& line) const {
    for (const auto& term : terms_) {
        if (matches(line, term)) {
            return term.term;
        }
    }
    return std::nullopt;
}

bool HeadingClassifier::matches(const std::string& line, const HeadingTerm& term) {
    if (term.term.empty() || !starts_with_ignore_case(line, term.term)) {
        return false;
    }
    if (term.rule == BoundaryRule::PREFIX || line.size() == term.term.size()) {
        return true;
    }
    size_t end = term.term.size();
    return whitespace_length(line, end) > 0 || !is_word_char(line[end]);
}

} // namespace scholar_parser
