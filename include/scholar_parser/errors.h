#pragma once

#include <stdexcept>
#include <string>

namespace scholar_parser {

// Base class for the library's runtime failures. Invalid option values are
// reported separately with std::invalid_argument (validate_options).
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message) : std::runtime_error(message) {}
};

// The normalized document text is empty; no partial result exists
class EmptyDocumentError : public ParseError {
public:
    EmptyDocumentError() : ParseError("Parser produced empty text") {}
};

// Unreadable or malformed configuration file
class ConfigError : public ParseError {
public:
    explicit ConfigError(const std::string& message) : ParseError(message) {}
};

// Failure turning a file into page texts (missing file, MuPDF error)
class ExtractionError : public ParseError {
public:
    explicit ExtractionError(const std::string& message) : ParseError(message) {}
};

} // namespace scholar_parser
