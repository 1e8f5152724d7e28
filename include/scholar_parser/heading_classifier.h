#pragma once

#include <optional>
#include <string>
#include <vector>

namespace scholar_parser {

enum class BoundaryRule {
    WORD_BOUNDARY,  // term must be followed by a non-word character or end of line
    PREFIX          // any continuation is accepted
};

struct HeadingTerm {
    std::string term;   // lower-case
    BoundaryRule rule;
};

// abstract, introduction, background, related work, method, methods,
// materials, results, discussion, conclusion, limitations, references
const std::vector<HeadingTerm>& default_heading_terms();

// Decides whether a trimmed line is a section heading by matching the start
// of the line against a fixed vocabulary, ignoring case. Unknown headings
// ("Experimental Setup") are missed and body lines that begin with a
// vocabulary word ("Results show that...") are taken as headings; both are
// accepted.
class HeadingClassifier {
public:
    explicit HeadingClassifier(std::vector<HeadingTerm> terms = default_heading_terms());

    bool is_heading(const std::string& line) const;

    // First vocabulary term that matches the line, if any
    std::optional<std::string> matched_term(const std::string& line) const;

    const std::vector<HeadingTerm>& terms() const { return terms_; }

private:
    static bool matches(const std::string& line, const HeadingTerm& term);

    std::vector<HeadingTerm> terms_;
};

} // namespace scholar_parser
