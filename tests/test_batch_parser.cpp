#include <gtest/gtest.h>
#include <scholar_parser/batch_parser.h>
#include <scholar_parser/errors.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

namespace fs = std::filesystem;
using namespace scholar_parser;

class BatchParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("scholar_parser_batch_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);

        paper_ = write_file("a_paper.txt",
            "A Paper\nAbstract\nShort abstract.\nReferences\n"
            "Roe R. (2015). Another paper entirely. doi:10.2222/q.1\n");
        empty_ = write_file("b_empty.txt", "  \n\n");
        paged_ = write_file("c_paged.txt", "First Page Title\fIntroduction\nSecond page body\f");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    fs::path dir_;
    std::string paper_;
    std::string empty_;
    std::string paged_;
};

TEST_F(BatchParserTest, SplitsPagesAtFormFeeds) {
    EXPECT_EQ(DocumentLoader::split_pages("a\fb\f"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(DocumentLoader::split_pages("a\f\fb"), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(DocumentLoader::split_pages("no breaks"), (std::vector<std::string>{"no breaks"}));
    EXPECT_EQ(DocumentLoader::split_pages(""), (std::vector<std::string>{""}));
}

TEST_F(BatchParserTest, DetectsPdfByExtension) {
    EXPECT_TRUE(DocumentLoader::is_pdf("paper.pdf"));
    EXPECT_TRUE(DocumentLoader::is_pdf("/tmp/PAPER.PDF"));
    EXPECT_FALSE(DocumentLoader::is_pdf("paper.txt"));
    EXPECT_FALSE(DocumentLoader::is_pdf("pdf"));
}

TEST_F(BatchParserTest, NonAsciiExtensionIsNotPdf) {
    EXPECT_TRUE(DocumentLoader::is_pdf("X.PdF"));
    EXPECT_FALSE(DocumentLoader::is_pdf("x.\xC3\x89pdf"));
    EXPECT_FALSE(DocumentLoader::is_pdf("x.pdf\xC3\xA9"));
}

TEST_F(BatchParserTest, LoadsTextFilesWithPages) {
    DocumentLoader loader;
    auto document = loader.load(paged_);

    EXPECT_EQ(document.page_count(), 2u);
    ASSERT_EQ(document.lines().size(), 3u);
    EXPECT_EQ(document.lines()[2].page, 2);
}

TEST_F(BatchParserTest, LoaderRejectsMissingAndDirectories) {
    DocumentLoader loader;
    EXPECT_THROW(loader.load((dir_ / "missing.txt").string()), ExtractionError);
    EXPECT_THROW(loader.load(dir_.string()), ExtractionError);
}

TEST_F(BatchParserTest, CollectsInputsSorted) {
    write_file("notes.md", "ignored");
    fs::create_directories(dir_ / "nested");
    write_file("nested/d.TXT", "nested file");

    auto inputs = DocumentLoader::collect_inputs(dir_.string());
    ASSERT_EQ(inputs.size(), 4u);
    EXPECT_EQ(inputs[0], paper_);
    EXPECT_EQ(inputs[1], empty_);
    EXPECT_EQ(inputs[2], paged_);
    EXPECT_EQ(fs::path(inputs[3]).filename().string(), "d.TXT");
}

TEST_F(BatchParserTest, ParseSingleFile) {
    BatchParser parser;
    auto result = parser.parse_file(paper_);

    EXPECT_EQ(result.title, "A Paper");
    ASSERT_EQ(result.references.size(), 1u);
    EXPECT_EQ(result.references[0].doi, "10.2222/q.1");

    EXPECT_THROW(parser.parse_file(empty_), EmptyDocumentError);
    EXPECT_THROW(parser.parse_file((dir_ / "missing.txt").string()), ExtractionError);
}

TEST_F(BatchParserTest, BatchKeepsOrderAndRecordsFailures) {
    BatchOptions options;
    options.thread_count = 2;
    BatchParser parser(ParseOptions{}, options);

    std::atomic<size_t> progress_calls{0};
    std::vector<std::string> paths = {paged_, empty_, paper_, (dir_ / "missing.txt").string()};
    auto items = parser.parse_files(paths, [&progress_calls](size_t current, size_t total) {
        progress_calls++;
        EXPECT_LE(current, total);
    });

    ASSERT_EQ(items.size(), paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        EXPECT_EQ(items[i].path, paths[i]);
    }
    EXPECT_TRUE(items[0].success());
    EXPECT_FALSE(items[1].success());
    EXPECT_EQ(items[1].error, "Parser produced empty text");
    EXPECT_TRUE(items[2].success());
    EXPECT_FALSE(items[3].success());
    EXPECT_FALSE(items[3].error.empty());
    EXPECT_EQ(progress_calls, paths.size());

    EXPECT_EQ(items[0].page_count, 2u);
    EXPECT_EQ(items[1].page_count, 1u);
    EXPECT_EQ(items[2].page_count, 1u);
    EXPECT_EQ(items[3].page_count, 0u);

    auto stats = parser.get_stats();
    EXPECT_EQ(stats["documents_processed"].get<size_t>(), 2u);
    EXPECT_EQ(stats["documents_failed"].get<size_t>(), 2u);
    EXPECT_EQ(stats["pages_processed"].get<size_t>(), 3u);
    EXPECT_TRUE(stats.contains("average_processing_time_ms"));
}

TEST_F(BatchParserTest, FreshParserHasEmptyStats) {
    BatchParser parser;
    auto stats = parser.get_stats();

    EXPECT_EQ(stats["documents_processed"].get<size_t>(), 0u);
    EXPECT_FALSE(stats.contains("average_processing_time_ms"));
}

TEST_F(BatchParserTest, ParsesPdf) {
    const std::string test_pdf = "test_data/test.pdf";
    if (!fs::exists(test_pdf)) {
        GTEST_SKIP() << "Test PDF not found";
    }

    BatchParser parser;
    ParseResult result;
    ASSERT_NO_THROW(result = parser.parse_file(test_pdf));
    EXPECT_FALSE(result.full_text.empty());
    EXPECT_GT(parser.get_stats()["pages_processed"].get<size_t>(), 0u);
}

TEST_F(BatchParserTest, ProgressCallbackIsSerialized) {
    BatchOptions options;
    options.thread_count = 4;
    BatchParser parser(ParseOptions{}, options);

    std::vector<std::string> paths;
    for (int i = 0; i < 12; ++i) {
        paths.push_back(i % 2 == 0 ? paper_ : paged_);
    }

    std::atomic<int> active{0};
    int max_active = 0;
    size_t last = 0;
    bool increasing = true;
    parser.parse_files(paths, [&](size_t current, size_t) {
        int now = ++active;
        max_active = std::max(max_active, now);
        increasing = increasing && current == last + 1;
        last = current;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --active;
    });

    EXPECT_EQ(max_active, 1);
    EXPECT_TRUE(increasing);
    EXPECT_EQ(last, paths.size());
}

TEST_F(BatchParserTest, OutputPathsKeepInputLayout) {
    EXPECT_EQ(DocumentLoader::output_path_for("papers", "papers/a/x.pdf", "out"), "out/a/x.pdf.json");
    EXPECT_EQ(DocumentLoader::output_path_for("papers/", "papers/x.txt", "out"), "out/x.txt.json");
    EXPECT_EQ(DocumentLoader::output_path_for("papers", "elsewhere/y.pdf", "out", ".jsonl"), "out/y.pdf.jsonl");

    std::set<std::string> outputs;
    for (const auto& input : {"papers/x.pdf", "papers/x.txt", "papers/a/x.pdf", "papers/b/x.pdf"}) {
        outputs.insert(DocumentLoader::output_path_for("papers", input, "out"));
    }
    EXPECT_EQ(outputs.size(), 4u);
}

TEST_F(BatchParserTest, CorruptPdfIsReportedNotFatal) {
    auto path = write_file("corrupt.pdf", "%PDF-1.7\nthis is not a valid document\n%%EOF");

    // MuPDF either rejects the file or repairs it into an empty document
    BatchParser parser;
    EXPECT_THROW(parser.parse_file(path), ParseError);

    auto items = parser.parse_files({path});
    ASSERT_EQ(items.size(), 1u);
    EXPECT_FALSE(items[0].success());
    EXPECT_FALSE(items[0].error.empty());
}
