#include <gtest/gtest.h>
#include <scholar_parser/config_loader.h>
#include <scholar_parser/errors.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace scholar_parser;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("scholar_parser_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write_config(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    fs::path dir_;
};

TEST_F(ConfigLoaderTest, LoadsAllKeys) {
    auto path = write_config("full.json", R"({
        "max_reference_lines": 10,
        "reference_tail_window": 40,
        "min_reference_length": 12,
        "abstract_window_lines": 3,
        "section_id_prefix_length": 64,
        "default_heading": "Preamble"
    })");

    auto options = ConfigLoader::load(path);
    EXPECT_EQ(options.max_reference_lines, 10u);
    EXPECT_EQ(options.reference_tail_window, 40u);
    EXPECT_EQ(options.min_reference_length, 12u);
    EXPECT_EQ(options.abstract_window_lines, 3u);
    EXPECT_EQ(options.section_id_prefix_length, 64u);
    EXPECT_EQ(options.default_heading, "Preamble");
}

TEST_F(ConfigLoaderTest, MissingKeysKeepDefaults) {
    auto path = write_config("partial.json", R"({"max_reference_lines": 5, "unknown_key": true})");

    auto options = ConfigLoader::load(path);
    EXPECT_EQ(options.max_reference_lines, 5u);
    EXPECT_EQ(options.reference_tail_window, defaults::kReferenceTailWindow);
    EXPECT_EQ(options.min_reference_length, defaults::kMinReferenceLength);
    EXPECT_EQ(options.abstract_window_lines, defaults::kAbstractWindowLines);
    EXPECT_EQ(options.default_heading, defaults::kDefaultHeading);
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW(ConfigLoader::load((dir_ / "absent.json").string()), ConfigError);
}

TEST_F(ConfigLoaderTest, InvalidJsonThrows) {
    auto path = write_config("broken.json", "{ \"max_reference_lines\": ");
    EXPECT_THROW(ConfigLoader::load(path), ConfigError);
}

TEST_F(ConfigLoaderTest, WrongTypesThrow) {
    EXPECT_THROW(ConfigLoader::from_json(nlohmann::json::array()), ConfigError);
    EXPECT_THROW(ConfigLoader::from_json({{"max_reference_lines", "sixty"}}), ConfigError);
    EXPECT_THROW(ConfigLoader::from_json({{"min_reference_length", -1}}), ConfigError);
    EXPECT_THROW(ConfigLoader::from_json({{"default_heading", 7}}), ConfigError);
}

TEST_F(ConfigLoaderTest, FromJsonStartsFromBase) {
    ParseOptions base;
    base.abstract_window_lines = 9;

    auto options = ConfigLoader::from_json({{"max_reference_lines", 1}}, base);
    EXPECT_EQ(options.max_reference_lines, 1u);
    EXPECT_EQ(options.abstract_window_lines, 9u);
}

TEST_F(ConfigLoaderTest, ToJsonRoundTrips) {
    ParseOptions options;
    options.reference_tail_window = 77;
    options.default_heading = "Front";

    auto json = ConfigLoader::to_json(options);
    EXPECT_EQ(json["reference_tail_window"], 77);
    EXPECT_EQ(json["default_heading"], "Front");

    auto restored = ConfigLoader::from_json(json);
    EXPECT_EQ(restored.reference_tail_window, 77u);
    EXPECT_EQ(restored.default_heading, "Front");
}
