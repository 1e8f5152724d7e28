#include "scholar_parser/detail_extractor.h"
#include "scholar_parser/text_normalizer.h"
#include <algorithm>
#include <regex>
#include <set>

namespace scholar_parser {

namespace {

using PatternList = std::vector<std::regex>;

const PatternList& claim_patterns() {
    static const PatternList patterns = {
        std::regex(R"(\bwe (?:propose|present|show|demonstrate)\b)", std::regex::icase),
        std::regex(R"(\bthis paper\b)", std::regex::icase),
        std::regex(R"(\bour (?:results|findings)\b)", std::regex::icase),
        std::regex(R"(\bwe find that\b)", std::regex::icase),
    };
    return patterns;
}

const PatternList& method_patterns() {
    static const PatternList patterns = {
        std::regex(R"(\bmethod(?:ology)?\b)", std::regex::icase),
        std::regex(R"(\bapproach\b)", std::regex::icase),
        std::regex(R"(\bmodel\b)", std::regex::icase),
        std::regex(R"(\balgorithm\b)", std::regex::icase),
        std::regex(R"(\bexperimental setup\b)", std::regex::icase),
    };
    return patterns;
}

const PatternList& limitation_patterns() {
    static const PatternList patterns = {
        std::regex(R"(\blimitation\b)", std::regex::icase),
        std::regex(R"(\bhowever\b)", std::regex::icase),
        std::regex(R"(\bfuture work\b)", std::regex::icase),
        std::regex(R"(\bchallenge\b)", std::regex::icase),
        std::regex(R"(\bconstraint\b)", std::regex::icase),
    };
    return patterns;
}

const PatternList& metric_patterns() {
    static const PatternList patterns = {
        std::regex(R"(\bF1(?:-score)?\b)", std::regex::icase),
        std::regex(R"(\baccuracy\b)", std::regex::icase),
        std::regex(R"(\bprecision\b)", std::regex::icase),
        std::regex(R"(\brecall\b)", std::regex::icase),
        std::regex(R"(\bAUC\b)", std::regex::icase),
        std::regex(R"(\bRMSE\b)", std::regex::icase),
        std::regex(R"(\bMAE\b)", std::regex::icase),
        std::regex(R"(\bBLEU\b)", std::regex::icase),
        std::regex(R"(\bROUGE\b)", std::regex::icase),
        std::regex(R"(\bmAP\b)", std::regex::icase),
    };
    return patterns;
}

bool is_name_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

// Finds "<Capitalized-name> <dataset|corpus|benchmark>" without std::regex,
// whose recursion depth grows with the length of a name run.
std::vector<std::string> find_dataset_mentions(const std::string& text) {
    static const char* const kKinds[] = {"dataset", "corpus", "benchmark"};

    std::vector<std::string> mentions;
    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] < 'A' || text[pos] > 'Z') {
            ++pos;
            continue;
        }

        size_t name_end = pos + 1;
        while (name_end < text.size() && is_name_char(text[name_end])) {
            ++name_end;
        }

        size_t kind_start = name_end;
        while (size_t space = whitespace_length(text, kind_start)) {
            kind_start += space;
        }

        size_t match_end = 0;
        if (name_end > pos + 1 && kind_start > name_end) {
            for (const char* kind : kKinds) {
                if (text.compare(kind_start, std::char_traits<char>::length(kind), kind) == 0) {
                    match_end = kind_start + std::char_traits<char>::length(kind);
                    break;
                }
            }
        }

        if (match_end > 0) {
            mentions.push_back(text.substr(pos, match_end - pos));
            pos = match_end;
        } else {
            // Later starts inside the same name run end at the same place
            pos = name_end;
        }
    }
    return mentions;
}

std::string to_upper_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](char c) {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    });
    return value;
}

// Normalized, non-empty, first occurrence wins
std::vector<std::string> unique_list(const std::vector<std::string>& items) {
    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto& item : items) {
        std::string normalized = normalize_whitespace(item);
        if (!normalized.empty() && seen.insert(normalized).second) {
            unique.push_back(std::move(normalized));
        }
    }
    return unique;
}

std::vector<ExtractedStatement> collect_statements(const std::vector<SectionChunk>& sections,
                                                   const PatternList& patterns,
                                                   double confidence) {
    std::vector<ExtractedStatement> statements;
    for (const auto& section : sections) {
        for (auto& sentence : DetailExtractor::split_sentences(section.text)) {
            bool hit = std::any_of(patterns.begin(), patterns.end(), [&](const std::regex& pattern) {
                return std::regex_search(sentence, pattern);
            });
            if (!hit) {
                continue;
            }
            statements.push_back({std::move(sentence), confidence, section.id});
            if (statements.size() == DetailExtractor::kMaxStatements) {
                return statements;
            }
        }
    }
    return statements;
}

std::vector<std::string> extract_datasets(const std::vector<SectionChunk>& sections) {
    std::vector<std::string> matches;
    for (const auto& section : sections) {
        auto mentions = find_dataset_mentions(section.text);
        matches.insert(matches.end(), mentions.begin(), mentions.end());
    }

    auto datasets = unique_list(matches);
    if (datasets.size() > DetailExtractor::kMaxDatasets) {
        datasets.resize(DetailExtractor::kMaxDatasets);
    }
    return datasets;
}

std::vector<std::string> extract_metrics(const std::vector<SectionChunk>& sections) {
    std::vector<std::string> found;
    for (const auto& section : sections) {
        for (const auto& pattern : metric_patterns()) {
            auto begin = std::sregex_iterator(section.text.begin(), section.text.end(), pattern);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                found.push_back(to_upper_ascii(it->str(0)));
            }
        }
    }
    return unique_list(found);
}

} // namespace

PaperDetails DetailExtractor::extract(const ParseResult& result, const DetailRequest& request) const {
    PaperDetails details;
    details.title = result.title;
    details.abstract = result.abstract;
    details.parser_confidence = result.confidence;
    details.requested_sections = select_sections(result.sections, request.sections);

    const auto& selected = details.requested_sections;
    double confidence = result.confidence;
    details.claims = collect_statements(selected, claim_patterns(), std::max(0.45, confidence - 0.2));
    details.methods = collect_statements(selected, method_patterns(), std::max(0.5, confidence - 0.15));
    details.limitations = collect_statements(selected, limitation_patterns(), std::max(0.4, confidence - 0.25));
    details.datasets = extract_datasets(selected);
    details.metrics = extract_metrics(selected);

    if (request.include_references) {
        details.references = result.references;
    }

    return details;
}

std::vector<SectionChunk> DetailExtractor::select_sections(const std::vector<SectionChunk>& sections,
                                                           const std::vector<std::string>& requested) const {
    std::vector<std::string> targets;
    for (const auto& name : requested) {
        std::string target = to_lower_ascii(trim(name));
        if (!target.empty()) {
            targets.push_back(std::move(target));
        }
    }
    if (targets.empty()) {
        return sections;
    }

    std::vector<SectionChunk> selected;
    for (const auto& section : sections) {
        std::string heading = to_lower_ascii(section.heading);
        bool wanted = std::any_of(targets.begin(), targets.end(), [&](const std::string& target) {
            return heading.find(target) != std::string::npos;
        });
        if (wanted) {
            selected.push_back(section);
        }
    }

    return selected.empty() ? sections : selected;
}

std::vector<std::string> DetailExtractor::split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    size_t start = 0;

    auto emit = [&](size_t end) {
        std::string sentence = normalize_whitespace(text.substr(start, end - start));
        if (sentence.size() > kMinSentenceLength) {
            sentences.push_back(std::move(sentence));
        }
    };

    for (size_t i = 0; i + 1 < text.size(); ++i) {
        char c = text[i];
        if ((c == '.' || c == '!' || c == '?') && is_space(text[i + 1])) {
            emit(i + 1);
            start = i + 1;
        }
    }
    emit(text.size());

    return sentences;
}

} // namespace scholar_parser
