#include "scholar_parser/batch_parser.h"
#include <chrono>
#include <exception>
#include <future>
#include <iostream>

namespace scholar_parser {

BatchParser::BatchParser(const ParseOptions& parse_options, const BatchOptions& batch_options)
    : batch_options_(batch_options),
      parser_(parse_options),
      loader_(ExtractOptions{batch_options.verbose, -1}),
      pool_(batch_options.thread_count) {}

ParseResult BatchParser::parse_file(const std::string& path) {
    size_t pages = 0;
    return parse_file(path, pages);
}

ParseResult BatchParser::parse_file(const std::string& path, size_t& pages) {
    auto start_time = std::chrono::steady_clock::now();
    pages = 0;

    try {
        auto document = loader_.load(path);
        pages = document.page_count();
        auto result = parser_.parse(document);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        record(true, pages, elapsed.count());
        return result;
    } catch (const std::exception&) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        record(false, pages, elapsed.count());
        throw;
    }
}

BatchItem BatchParser::run_one(const std::string& path) {
    BatchItem item;
    item.path = path;

    try {
        item.result = parse_file(path, item.page_count);
        if (batch_options_.verbose) {
            std::cerr << "[BatchParser::run_one] Parsed " << path << ": "
                      << item.result->sections.size() << " sections, "
                      << item.result->references.size() << " references" << std::endl;
        }
    } catch (const std::exception& e) {
        item.error = e.what();
        if (batch_options_.verbose) {
            std::cerr << "[BatchParser::run_one] Failed " << path << ": " << item.error << std::endl;
        }
    }

    return item;
}

std::vector<BatchItem> BatchParser::parse_files(const std::vector<std::string>& paths,
                                                ProgressCallback progress) {
    size_t completed = 0;
    std::mutex progress_mutex;
    std::vector<std::future<BatchItem>> futures;
    futures.reserve(paths.size());

    for (const auto& path : paths) {
        futures.push_back(pool_.submit([this, path, &completed, &progress_mutex, &paths, &progress]() {
            BatchItem item = run_one(path);
            // One callback at a time, with counts in increasing order
            std::lock_guard<std::mutex> lock(progress_mutex);
            ++completed;
            if (progress) {
                progress(completed, paths.size());
            }
            return item;
        }));
    }

    // Every job is waited for before a callback exception leaves this frame
    std::vector<BatchItem> items;
    items.reserve(paths.size());
    std::exception_ptr failure;
    for (auto& future : futures) {
        try {
            items.push_back(future.get());
        } catch (...) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    return items;
}

nlohmann::json BatchParser::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);

    nlohmann::json stats;
    stats["documents_processed"] = documents_processed_;
    stats["documents_failed"] = documents_failed_;
    stats["pages_processed"] = pages_processed_;
    stats["total_processing_time_ms"] = total_processing_time_ms_;

    size_t attempted = documents_processed_ + documents_failed_;
    if (attempted > 0) {
        stats["average_processing_time_ms"] =
            static_cast<double>(total_processing_time_ms_) / static_cast<double>(attempted);
    }

    return stats;
}

void BatchParser::record(bool success, size_t pages, long long elapsed_ms) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (success) {
        ++documents_processed_;
        pages_processed_ += pages;
    } else {
        ++documents_failed_;
    }
    total_processing_time_ms_ += elapsed_ms;
}

} // namespace scholar_parser
