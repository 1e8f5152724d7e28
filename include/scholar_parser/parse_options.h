#pragma once

#include <cstddef>
#include <string>

namespace scholar_parser {

namespace defaults {

// Reference parsing looks at no more than this many candidate lines, which
// caps the reference list on malformed input.
constexpr size_t kMaxReferenceLines = 60;

// Lines taken from the end of the document when no "References" heading is
// found. Tunable guess: long enough for a typical bibliography, short enough
// to keep most body text out.
constexpr size_t kReferenceTailWindow = 120;

// Candidate reference lines shorter than this (in code points) are running
// headers, page numbers or stray punctuation.
constexpr size_t kMinReferenceLength = 30;

// The abstract is the "Abstract..." line plus the lines that follow it,
// this many in total.
constexpr size_t kAbstractWindowLines = 5;

// Bytes of section text mixed into the section id hash.
constexpr size_t kSectionIdPrefixLength = 200;

// Heading of the text that precedes the first recognized heading.
constexpr const char* kDefaultHeading = "Body";

} // namespace defaults

struct ParseOptions {
    size_t max_reference_lines = defaults::kMaxReferenceLines;
    size_t reference_tail_window = defaults::kReferenceTailWindow;
    size_t min_reference_length = defaults::kMinReferenceLength;
    size_t abstract_window_lines = defaults::kAbstractWindowLines;
    size_t section_id_prefix_length = defaults::kSectionIdPrefixLength;
    std::string default_heading = defaults::kDefaultHeading;
};

// Throws std::invalid_argument for values no parser can work with
void validate_options(const ParseOptions& options);

} // namespace scholar_parser
