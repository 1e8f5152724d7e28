#pragma once

#include <scholar_parser/document_loader.h>
#include <scholar_parser/scholar_parser.h>
#include <scholar_parser/thread_pool.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scholar_parser {

struct BatchOptions {
    size_t thread_count = 0;    // 0 = hardware concurrency
    bool verbose = false;
};

struct BatchItem {
    std::string path;
    std::optional<ParseResult> result;
    std::string error;          // empty on success
    size_t page_count = 0;      // pages loaded, also set when parsing failed
    bool success() const { return result.has_value(); }
};

using ProgressCallback = std::function<void(size_t current, size_t total)>;

// Loads and parses many files on a thread pool. One failing file does not
// stop the batch; its error is recorded on its BatchItem.
class BatchParser {
public:
    BatchParser(const ParseOptions& parse_options = ParseOptions{},
                const BatchOptions& batch_options = BatchOptions{});

    // Single file; throws ExtractionError or EmptyDocumentError
    ParseResult parse_file(const std::string& path);

    // Results come back in the order of `paths`. `progress` runs on pool
    // threads but never concurrently with itself.
    std::vector<BatchItem> parse_files(const std::vector<std::string>& paths,
                                       ProgressCallback progress = nullptr);

    // documents_processed, documents_failed, pages_processed,
    // total_processing_time_ms, average_processing_time_ms
    nlohmann::json get_stats() const;

private:
    ParseResult parse_file(const std::string& path, size_t& pages);
    BatchItem run_one(const std::string& path);
    void record(bool success, size_t pages, long long elapsed_ms);

    BatchOptions batch_options_;
    ScholarParser parser_;
    DocumentLoader loader_;

    mutable std::mutex stats_mutex_;
    size_t documents_processed_ = 0;
    size_t documents_failed_ = 0;
    size_t pages_processed_ = 0;
    long long total_processing_time_ms_ = 0;

    // Last member: workers are joined before anything they use is destroyed
    ThreadPool pool_;
};

} // namespace scholar_parser
