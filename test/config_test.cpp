#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/property_tree/json_parser.hpp>

#include "common/config.hpp"
#include "support/temp_dir.hpp"

namespace Medcap {
namespace {

Common::SaveLoad::PropertyTree parse_json(const std::string& text)
{
    std::istringstream stream(text);
    Common::SaveLoad::PropertyTree tree;
    boost::property_tree::read_json(stream, tree);
    return tree;
}

TEST(Config, EmptyDocumentKeepsDefaults)
{
    const auto config = parse_config(parse_json("{}"), "test");

    EXPECT_EQ(config.dataset.text.max_word_count, 97u);
    EXPECT_EQ(config.dataset.text.max_length, 97);
    EXPECT_EQ(config.dataset.text.mode, CaptionMode::FullReport);
    EXPECT_EQ(config.dataset.image.size, 256);
    EXPECT_TRUE(config.dataset.image.normalize);
    EXPECT_FALSE(config.dataset.image.channels_first);
    EXPECT_FALSE(config.dataset.seed.has_value());
    EXPECT_TRUE(config.dataset.cache.empty());
    EXPECT_EQ(config.catalog_options.allowed_views, (std::vector<std::string>{"AP", "PA"}));
    EXPECT_EQ(config.catalog_options.columns.report, "impression");
}

TEST(Config, ReadsEverySection)
{
    const auto config = parse_config(parse_json(R"({
        "catalog": {
            "split_csv": "/data/split.csv",
            "metadata_csv": "/data/metadata.csv",
            "sections_csv": "/data/sections.csv",
            "image_root": "/data/files",
            "allowed_views": ["PA"],
            "report_column": "findings",
            "image_extension": ".png"
        },
        "text": { "max_word_count": 40, "max_length": 64, "full_report": false },
        "image": { "size": 224, "normalize": false, "channels_first": true },
        "cache": "/tmp/captions.json",
        "seed": 1234,
        "show_progress": true
    })"), "test");

    EXPECT_EQ(config.catalog.split_csv.string(), "/data/split.csv");
    EXPECT_EQ(config.catalog.metadata_csv.string(), "/data/metadata.csv");
    EXPECT_EQ(config.catalog.sections_csv.string(), "/data/sections.csv");
    EXPECT_EQ(config.catalog.image_root.string(), "/data/files");
    EXPECT_EQ(config.catalog_options.allowed_views, (std::vector<std::string>{"PA"}));
    EXPECT_EQ(config.catalog_options.columns.report, "findings");
    EXPECT_EQ(config.catalog_options.image_extension, ".png");

    EXPECT_EQ(config.dataset.text.max_word_count, 40u);
    EXPECT_EQ(config.dataset.text.max_length, 64);
    EXPECT_EQ(config.dataset.text.mode, CaptionMode::RandomSentence);
    EXPECT_EQ(config.dataset.image.size, 224);
    EXPECT_FALSE(config.dataset.image.normalize);
    EXPECT_TRUE(config.dataset.image.channels_first);
    EXPECT_EQ(config.dataset.cache.string(), "/tmp/captions.json");
    ASSERT_TRUE(config.dataset.seed.has_value());
    EXPECT_EQ(*config.dataset.seed, 1234u);
    EXPECT_TRUE(config.dataset.log.show_progress);
}

TEST(Config, MistypedValueIsAnError)
{
    EXPECT_THROW((void)parse_config(parse_json(R"({"image": {"size": "large"}})"), "test"), std::runtime_error);
    EXPECT_THROW((void)parse_config(parse_json(R"({"text": {"full_report": "sometimes"}})"), "test"), std::runtime_error);
}

TEST(Config, NegativeCountsAreRejected)
{
    EXPECT_THROW((void)parse_config(parse_json(R"({"text": {"max_word_count": -1}})"), "test"), std::runtime_error);
    EXPECT_THROW((void)parse_config(parse_json(R"({"text": {"max_word_count": " -5"}})"), "test"), std::runtime_error);
    EXPECT_THROW((void)parse_config(parse_json(R"({"seed": -7})"), "test"), std::runtime_error);

    const auto config = parse_config(parse_json(R"({"text": {"max_word_count": 0}, "seed": 7})"), "test");
    EXPECT_EQ(config.dataset.text.max_word_count, 0u);
    EXPECT_EQ(config.dataset.seed, std::optional<std::uint64_t>{7});
}

TEST(Config, NonPositiveSizesAreRejected)
{
    EXPECT_THROW((void)parse_config(parse_json(R"({"image": {"size": 0}})"), "test"), std::runtime_error);
    EXPECT_THROW((void)parse_config(parse_json(R"({"text": {"max_length": -3}})"), "test"), std::runtime_error);
}

TEST(Config, LoadsFromFile)
{
    Support::TempDir dir;
    const auto file = dir.write("medcap.json", R"({"text": {"max_word_count": 0}, "seed": 9})");

    const auto config = load_config(file);
    EXPECT_EQ(config.dataset.text.max_word_count, 0u);
    EXPECT_EQ(config.dataset.seed, std::optional<std::uint64_t>{9});
}

TEST(Config, MissingFileIsReported)
{
    EXPECT_THROW((void)load_config("/nonexistent/medcap.json"), std::runtime_error);
}

} // namespace
} // namespace Medcap
