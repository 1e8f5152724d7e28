#include <gtest/gtest.h>
#include <scholar_parser/detail_extractor.h>
#include <string>
#include <vector>

using namespace scholar_parser;

class DetailExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        result_ = parser_.parse_text(
            "Title\n"
            "Abstract\n"
            "In this paper we propose a new approach to parsing.\n"
            "Methods\n"
            "We train a model on the ImageNet dataset and the Penn Treebank corpus. The algorithm runs fast.\n"
            "Results\n"
            "Our results show an F1-score of 0.9 and accuracy of 95 percent. However, recall drops on long documents.\n"
            "Limitations\n"
            "Future work will address the memory constraint on very large inputs.\n"
            "References\n"
            "Doe J. (2019). Parsing all the things. Journal of Parsing.");
    }

    ScholarParser parser_;
    DetailExtractor extractor_;
    ParseResult result_;
};

TEST_F(DetailExtractorTest, SplitsSentences) {
    auto sentences = DetailExtractor::split_sentences(
        "Short one. This sentence is long enough to keep! Is this also long enough to keep? x");

    ASSERT_EQ(sentences.size(), 2u);
    EXPECT_EQ(sentences[0], "This sentence is long enough to keep!");
    EXPECT_EQ(sentences[1], "Is this also long enough to keep?");
}

TEST_F(DetailExtractorTest, DecimalPointsDoNotSplit) {
    auto sentences = DetailExtractor::split_sentences("The score reached 0.95 on the test set.");

    ASSERT_EQ(sentences.size(), 1u);
    EXPECT_EQ(sentences[0], "The score reached 0.95 on the test set.");
}

TEST_F(DetailExtractorTest, ExtractsStatementsWithConfidence) {
    auto details = extractor_.extract(result_);

    ASSERT_EQ(details.claims.size(), 2u);
    EXPECT_EQ(details.claims[0].text, "In this paper we propose a new approach to parsing.");
    EXPECT_NEAR(details.claims[0].confidence, 0.54, 1e-9);
    EXPECT_EQ(details.claims[0].section_id, result_.sections[1].id);

    ASSERT_EQ(details.methods.size(), 3u);
    EXPECT_EQ(details.methods[2].text, "The algorithm runs fast.");
    EXPECT_NEAR(details.methods[0].confidence, 0.59, 1e-9);

    ASSERT_EQ(details.limitations.size(), 2u);
    EXPECT_EQ(details.limitations[0].text, "However, recall drops on long documents.");
    EXPECT_NEAR(details.limitations[0].confidence, 0.49, 1e-9);
}

TEST_F(DetailExtractorTest, ConfidenceFloorsApply) {
    result_.confidence = 0.3;
    auto details = extractor_.extract(result_);

    ASSERT_FALSE(details.claims.empty());
    EXPECT_DOUBLE_EQ(details.claims[0].confidence, 0.45);
    EXPECT_DOUBLE_EQ(details.methods[0].confidence, 0.5);
    EXPECT_DOUBLE_EQ(details.limitations[0].confidence, 0.4);
    EXPECT_DOUBLE_EQ(details.parser_confidence, 0.3);
}

TEST_F(DetailExtractorTest, ExtractsDatasetsAndMetrics) {
    auto details = extractor_.extract(result_);

    EXPECT_EQ(details.datasets, (std::vector<std::string>{"ImageNet dataset", "Treebank corpus"}));
    EXPECT_EQ(details.metrics, (std::vector<std::string>{"F1-SCORE", "ACCURACY", "RECALL"}));
}

TEST_F(DetailExtractorTest, CopiesFrontMatterAndReferences) {
    auto details = extractor_.extract(result_);

    EXPECT_EQ(details.title, result_.title);
    EXPECT_EQ(details.abstract, result_.abstract);
    ASSERT_EQ(details.references.size(), 1u);
    EXPECT_EQ(details.references[0].year, 2019);

    DetailRequest request;
    request.include_references = false;
    EXPECT_TRUE(extractor_.extract(result_, request).references.empty());
}

TEST_F(DetailExtractorTest, RestrictsToRequestedSections) {
    DetailRequest request;
    request.sections = {"  METHOD "};
    auto details = extractor_.extract(result_, request);

    ASSERT_EQ(details.requested_sections.size(), 1u);
    EXPECT_EQ(details.requested_sections[0].heading, "Methods");
    EXPECT_TRUE(details.claims.empty());
    EXPECT_TRUE(details.limitations.empty());
    EXPECT_EQ(details.methods.size(), 2u);
    EXPECT_TRUE(details.metrics.empty());
}

TEST_F(DetailExtractorTest, UnmatchedRequestFallsBackToAllSections) {
    auto all = extractor_.select_sections(result_.sections, {});
    auto unmatched = extractor_.select_sections(result_.sections, {"appendix"});
    auto blank = extractor_.select_sections(result_.sections, {"", "  "});

    EXPECT_EQ(all.size(), result_.sections.size());
    EXPECT_EQ(unmatched.size(), result_.sections.size());
    EXPECT_EQ(blank.size(), result_.sections.size());
}

TEST_F(DetailExtractorTest, StatementsAreCapped) {
    std::string body;
    for (int i = 0; i < 40; ++i) {
        body += "We propose variant number " + std::to_string(i) + " of the method. ";
    }
    auto result = parser_.parse_text("Introduction\n" + body);
    auto details = extractor_.extract(result);

    EXPECT_EQ(details.claims.size(), DetailExtractor::kMaxStatements);
    EXPECT_EQ(details.methods.size(), DetailExtractor::kMaxStatements);
    EXPECT_EQ(details.claims.back().text, "We propose variant number 24 of the method.");
}

TEST_F(DetailExtractorTest, DatasetsAreUniqueAndCapped) {
    std::string body = "We use Alpha dataset and Alpha dataset again. ";
    for (int i = 0; i < 40; ++i) {
        body += "Set" + std::to_string(i) + " benchmark. ";
    }
    auto result = parser_.parse_text("Results\n" + body);
    auto details = extractor_.extract(result);

    ASSERT_EQ(details.datasets.size(), DetailExtractor::kMaxDatasets);
    EXPECT_EQ(details.datasets[0], "Alpha dataset");
    EXPECT_EQ(details.datasets[1], "Set0 benchmark");
}

TEST_F(DetailExtractorTest, DatasetNamesFollowCapitalLetter) {
    auto result = parser_.parse_text(
        "Results\nWe use theImageNet dataset, a dataset, X corpus and Multi-Domain  benchmark suites.");
    auto details = extractor_.extract(result);

    EXPECT_EQ(details.datasets, (std::vector<std::string>{"ImageNet dataset", "Multi-Domain benchmark"}));
}

TEST_F(DetailExtractorTest, VeryLongTokensDoNotOverflow) {
    std::string name = "A" + std::string(300000, 'b');
    auto result = parser_.parse_text("Methods\nWe evaluate on the " + name + " dataset with our model.");
    auto details = extractor_.extract(result);

    ASSERT_EQ(details.datasets.size(), 1u);
    EXPECT_EQ(details.datasets[0], name + " dataset");
    EXPECT_EQ(details.methods.size(), 1u);
}
