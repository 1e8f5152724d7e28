#include "scholar_parser/parse_options.h"
#include <stdexcept>

namespace scholar_parser {

void validate_options(const ParseOptions& options) {
    if (options.abstract_window_lines == 0) {
        throw std::invalid_argument("abstract_window_lines must be at least 1");
    }
    if (options.default_heading.empty()) {
        throw std::invalid_argument("default_heading cannot be empty");
    }
}

} // namespace scholar_parser
