#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <torch/torch.h>

#include "core.hpp"
#include "support/temp_dir.hpp"
#include "support/whitespace_tokenizer.hpp"

namespace Medcap {
namespace {

class PretrainingDatasetTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        // 20x40 white frames: squaring to 32 leaves 8 zero rows above and below.
        records_ = {
            make_record("a", "train", std::string{"Heart size is normal. Lungs are clear. No acute process."}),
            make_record("b", "train", std::nullopt),
            make_record("c", "validate", std::string{"1. No pneumothorax. 2. Clear lung fields and no effusion."}),
            make_record("d", "train", std::string{"Mild cardiomegaly. Small left effusion."}),
        };

        options_.cache = dir_.path() / "cache" / "captions.json";
        options_.image.size = 32;
        options_.text.max_length = 12;
        options_.seed = 17;
        options_.log.stream = nullptr;
    }

    Data::StudyRecord make_record(const std::string& name, const std::string& split, std::optional<std::string> report)
    {
        const auto path = dir_.path() / (name + ".png");
        const cv::Mat image(20, 40, CV_8UC1, cv::Scalar(255));
        if (!cv::imwrite(path.string(), image)) {
            throw std::runtime_error("Unable to write " + path.string());
        }

        Data::StudyRecord record;
        record.dicom_id = name;
        record.study_id = "s" + name;
        record.subject_id = "10000032";
        record.split = split;
        record.view_position = "PA";
        record.image_path = path.string();
        record.report = std::move(report);
        return record;
    }

    [[nodiscard]] PretrainingDataset open(const std::string& split) const
    {
        return PretrainingDataset(records_, split, tokenizer_, options_);
    }

    Support::TempDir dir_;
    std::vector<Data::StudyRecord> records_;
    DatasetOptions options_;
    std::shared_ptr<const Text::Tokenizer> tokenizer_ = std::make_shared<Support::WhitespaceTokenizer>();
};

TEST_F(PretrainingDatasetTest, IndexesOnlyCaptionedImagesOfTheSplit)
{
    auto train = open("train");
    ASSERT_EQ(train.size(), torch::optional<std::size_t>{2});
    EXPECT_EQ(train.paths(), (std::vector<std::string>{records_[0].image_path, records_[3].image_path}));

    auto validate = open("valid");
    EXPECT_EQ(validate.split(), "validate");
    EXPECT_EQ(validate.paths(), (std::vector<std::string>{records_[2].image_path}));
    EXPECT_TRUE(open("test").paths().empty());
}

TEST_F(PretrainingDatasetTest, WritesTheCaptionCacheOnFirstUse)
{
    EXPECT_FALSE(std::filesystem::exists(options_.cache));
    auto train = open("train");
    EXPECT_TRUE(std::filesystem::exists(options_.cache));
    EXPECT_EQ(Caption::load(options_.cache).index, *train.caption_index());
}

TEST_F(PretrainingDatasetTest, SampleHasSquaredNormalizedImage)
{
    auto train = open("train");
    const auto sample = train.get(0);

    ASSERT_EQ(sample.image.sizes(), (std::vector<int64_t>{32, 32, 3}));
    EXPECT_EQ(sample.image.scalar_type(), torch::kFloat32);
    EXPECT_FLOAT_EQ(sample.image.slice(0, 0, 8).abs().sum().item<float>(), 0.0f);
    EXPECT_FLOAT_EQ(sample.image.slice(0, 24, 32).abs().sum().item<float>(), 0.0f);
    EXPECT_NEAR(sample.image.slice(0, 8, 24).min().item<float>(), 1.0f, 1e-5);
    EXPECT_LE(sample.image.max().item<float>(), 1.0f + 1e-5f);
    EXPECT_EQ(sample.path, records_[0].image_path);
}

TEST_F(PretrainingDatasetTest, ChannelsFirstAndRawIntensitiesAreOptional)
{
    options_.image.channels_first = true;
    options_.image.normalize = false;
    auto train = open("train");
    const auto sample = train.get(0);

    ASSERT_EQ(sample.image.sizes(), (std::vector<int64_t>{3, 32, 32}));
    EXPECT_NEAR(sample.image.max().item<float>(), 255.0f, 1e-3);
    EXPECT_TRUE(torch::equal(sample.image[0], sample.image[2]));
}

TEST_F(PretrainingDatasetTest, FullReportCaptionIsEncoded)
{
    auto train = open("train");
    const auto sample = train.get(0);
    const auto expected = Support::WhitespaceTokenizer{}.encode("heart size is normal lungs are clear no acute process", 12);

    EXPECT_TRUE(torch::equal(sample.input_ids, expected.input_ids));
    EXPECT_TRUE(torch::equal(sample.attention_mask, expected.attention_mask));
    EXPECT_EQ(sample.caption_length, 12);
    EXPECT_EQ(sample.input_ids.size(0), 12);
}

TEST_F(PretrainingDatasetTest, SeededRandomSentenceIsReproducible)
{
    options_.text.mode = CaptionMode::RandomSentence;
    auto first = open("train");
    auto second = open("train");

    for (std::uint64_t epoch = 0; epoch < 4; ++epoch) {
        first.set_epoch(epoch);
        second.set_epoch(epoch);
        for (std::size_t i = 0; i < 2; ++i) {
            EXPECT_TRUE(torch::equal(first.get(i).input_ids, second.get(i).input_ids));
        }
    }

    first.set_epoch(2);
    const auto repeat = first.get(0).input_ids;
    EXPECT_TRUE(torch::equal(first.get(0).input_ids, repeat));
}

TEST_F(PretrainingDatasetTest, RandomSentenceDrawsFromTheReport)
{
    options_.text.mode = CaptionMode::RandomSentence;
    auto train = open("train");
    const auto& sentences = train.caption_index()->sentences(train.paths()[0]);

    for (std::uint64_t epoch = 0; epoch < 8; ++epoch) {
        train.set_epoch(epoch);
        const auto ids = train.get(0).input_ids;
        bool matched = false;
        for (const auto& sentence : sentences) {
            matched = matched || torch::equal(ids, Support::WhitespaceTokenizer{}.encode(sentence, 12).input_ids);
        }
        EXPECT_TRUE(matched) << "epoch " << epoch;
    }
}

TEST_F(PretrainingDatasetTest, SplitsCanShareOneCaptionIndex)
{
    auto train = open("train");
    PretrainingDataset validate(records_, "validate", tokenizer_, train.caption_index(), options_);

    EXPECT_EQ(validate.caption_index().get(), train.caption_index().get());
    EXPECT_EQ(validate.size(), torch::optional<std::size_t>{1});
}

TEST_F(PretrainingDatasetTest, TransformRunsOnChannelsFirstImage)
{
    auto train = open("train");
    std::vector<int64_t> seen;
    train.set_transform([&seen](const torch::Tensor& image) {
        seen = image.sizes().vec();
        return image.mul(0.5);
    });

    const auto sample = train.get(0);
    EXPECT_EQ(seen, (std::vector<int64_t>{3, 32, 32}));
    EXPECT_NEAR(sample.image.max().item<float>(), 0.5f, 1e-5);
}

TEST_F(PretrainingDatasetTest, DataLoaderYieldsLengthSortedBatches)
{
    auto loader = torch::data::make_data_loader<torch::data::samplers::SequentialSampler>(
        open("train").map(Data::BatchCollator{}),
        torch::data::DataLoaderOptions().batch_size(2));

    std::size_t batches = 0;
    for (auto& batch : *loader) {
        ++batches;
        ASSERT_EQ(batch.size(), 2u);
        EXPECT_EQ(batch.images.sizes(), (std::vector<int64_t>{2, 32, 32, 3}));
        EXPECT_GE(batch.caption_lengths[0].item<int64_t>(), batch.caption_lengths[1].item<int64_t>());
    }
    EXPECT_EQ(batches, 1u);
}

TEST_F(PretrainingDatasetTest, InvalidAccessAndArgumentsThrow)
{
    auto train = open("train");
    EXPECT_THROW((void)train.get(2), std::out_of_range);

    EXPECT_THROW(PretrainingDataset(records_, "train", nullptr, options_), std::invalid_argument);

    auto bad = options_;
    bad.image.size = 0;
    EXPECT_THROW(PretrainingDataset(records_, "train", tokenizer_, bad), std::invalid_argument);
}

TEST_F(PretrainingDatasetTest, UnreadableImageIsReported)
{
    auto train = open("train");
    std::filesystem::remove(records_[0].image_path);
    EXPECT_THROW((void)train.get(0), std::runtime_error);
}

TEST_F(PretrainingDatasetTest, MakeDatasetReadsTheCatalog)
{
    Config config;
    config.catalog.split_csv = dir_.write("split.csv", "dicom_id,study_id,subject_id,split\nd1,50414267,10000032,train\n");
    config.catalog.metadata_csv = dir_.write("metadata.csv", "dicom_id,study_id,subject_id,ViewPosition\nd1,50414267,10000032,PA\n");
    config.catalog.sections_csv = dir_.write("sections.csv", "study_id,impression\n50414267,Lungs are clear.\n");
    config.catalog.image_root = dir_.path() / "files";
    config.catalog_options.image_extension = ".png";
    config.dataset = options_;

    const auto image_dir = config.catalog.image_root / "p10" / "p10000032" / "s50414267";
    std::filesystem::create_directories(image_dir);
    ASSERT_TRUE(cv::imwrite((image_dir / "d1.png").string(), cv::Mat(10, 10, CV_8UC1, cv::Scalar(128))));

    auto dataset = make_dataset(config, "train", tokenizer_);
    ASSERT_EQ(dataset.size(), torch::optional<std::size_t>{1});
    const auto sample = dataset.get(0);
    EXPECT_EQ(sample.caption_length, 5);
    EXPECT_NEAR(sample.image.max().item<float>(), 128.0f / 255.0f, 1e-5);
}

} // namespace
} // namespace Medcap
