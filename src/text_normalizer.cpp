#include "scholar_parser/text_normalizer.h"
#include <algorithm>

namespace scholar_parser {

namespace {

const char kReplacementCharacter[] = "\xEF\xBF\xBD";

unsigned char byte_at(const std::string& text, size_t pos) {
    return static_cast<unsigned char>(text[pos]);
}

// Whitespace length of the code point that ends right before `end`
size_t trailing_whitespace_length(const std::string& text, size_t end) {
    for (size_t length = 1; length <= 3 && length <= end; ++length) {
        if (whitespace_length(text, end - length) == length) {
            return length;
        }
    }
    return 0;
}

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed UTF-8 sequence at `pos`, or 0
size_t valid_sequence_length(const std::string& text, size_t pos) {
    unsigned char lead = byte_at(text, pos);
    if (lead < 0x80) {
        return 1;
    }

    size_t length;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) min_second = 0xA0;      // overlong
        if (lead == 0xED) max_second = 0x9F;      // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) min_second = 0x90;      // overlong
        if (lead == 0xF4) max_second = 0x8F;      // above U+10FFFF
    } else {
        return 0;
    }

    if (pos + length > text.size()) {
        return 0;
    }
    unsigned char second = byte_at(text, pos + 1);
    if (second < min_second || second > max_second) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        if (!is_continuation(byte_at(text, pos + i))) {
            return 0;
        }
    }
    return length;
}

} // namespace

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r' ||
           (c >= '\x1c' && c <= '\x1f');
}

size_t whitespace_length(const std::string& text, size_t pos) {
    if (pos >= text.size()) {
        return 0;
    }
    unsigned char lead = byte_at(text, pos);
    if (lead < 0x80) {
        return is_space(static_cast<char>(lead)) ? 1 : 0;
    }

    size_t remaining = text.size() - pos;
    if (lead == 0xC2 && remaining >= 2) {
        unsigned char next = byte_at(text, pos + 1);
        return (next == 0x85 || next == 0xA0) ? 2 : 0;
    }
    if (remaining < 3) {
        return 0;
    }

    unsigned char second = byte_at(text, pos + 1);
    unsigned char third = byte_at(text, pos + 2);
    switch (lead) {
        case 0xE1:
            return (second == 0x9A && third == 0x80) ? 3 : 0;
        case 0xE2:
            if (second == 0x80 && ((third >= 0x80 && third <= 0x8A) ||
                                   third == 0xA8 || third == 0xA9 || third == 0xAF)) {
                return 3;
            }
            return (second == 0x81 && third == 0x9F) ? 3 : 0;
        case 0xE3:
            return (second == 0x80 && third == 0x80) ? 3 : 0;
        default:
            return 0;
    }
}

size_t line_break_length(const std::string& text, size_t pos) {
    if (pos >= text.size()) {
        return 0;
    }
    char c = text[pos];
    if (c == '\n' || c == '\r' || c == '\v' || c == '\f' || (c >= '\x1c' && c <= '\x1e')) {
        return 1;
    }

    size_t length = whitespace_length(text, pos);
    if (length == 2 && byte_at(text, pos + 1) == 0x85) {
        return 2;
    }
    if (length == 3 && byte_at(text, pos) == 0xE2 && byte_at(text, pos + 1) == 0x80 &&
        (byte_at(text, pos + 2) == 0xA8 || byte_at(text, pos + 2) == 0xA9)) {
        return 3;
    }
    return 0;
}

std::string normalize_whitespace(const std::string& value) {
    std::string result;
    result.reserve(value.size());

    bool pending_space = false;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t space = whitespace_length(value, pos);
        if (space > 0) {
            pending_space = !result.empty();
            pos += space;
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(value[pos]);
        ++pos;
    }

    return result;
}

std::string trim(const std::string& value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end) {
        size_t space = whitespace_length(value, start);
        if (space == 0) {
            break;
        }
        start += space;
    }
    while (end > start) {
        size_t space = trailing_whitespace_length(value, end);
        if (space == 0 || end - space < start) {
            break;
        }
        end -= space;
    }
    return value.substr(start, end - start);
}

std::string to_lower_ascii(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return lowered;
}

bool starts_with_ignore_case(const std::string& value, const std::string& prefix) {
    if (value.size() < prefix.size()) {
        return false;
    }
    return to_lower_ascii(value.substr(0, prefix.size())) == to_lower_ascii(prefix);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;

    auto emit = [&](size_t end) {
        std::string line = trim(text.substr(start, end - start));
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
    };

    size_t pos = 0;
    while (pos < text.size()) {
        size_t line_break = line_break_length(text, pos);
        if (line_break == 0) {
            ++pos;
            continue;
        }
        emit(pos);
        pos += line_break;
        start = pos;
    }
    emit(text.size());

    return lines;
}

size_t utf8_length(const std::string& value) {
    return static_cast<size_t>(std::count_if(value.begin(), value.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string to_valid_utf8(const std::string& value) {
    std::string result;
    result.reserve(value.size());

    size_t pos = 0;
    while (pos < value.size()) {
        size_t length = valid_sequence_length(value, pos);
        if (length == 0) {
            result += kReplacementCharacter;
            ++pos;
            // The rest of a broken sequence becomes part of the same replacement
            while (pos < value.size() && is_continuation(byte_at(value, pos))) {
                ++pos;
            }
            continue;
        }
        result.append(value, pos, length);
        pos += length;
    }

    return result;
}

} // namespace scholar_parser
