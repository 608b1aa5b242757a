#ifndef MEDCAP_CORE_HPP
#define MEDCAP_CORE_HPP
/*
 * Paired image/report dataset.
 * ---------------------------------------------------------------------------
 *  - Construction resolves the corpus-wide caption index once (cache or
 *    build) and the ordered image list of one split. Both are read-only
 *    afterwards and may be shared by several split views and readers.
 *  - get(i) decodes and squares the i-th image, picks its caption and
 *    tokenizes it. It touches no shared mutable state, so torch::data
 *    workers can call it concurrently.
 *  - Batches come from Data::BatchCollator, e.g.
 *      auto loader = torch::data::make_data_loader(
 *          std::move(dataset).map(Medcap::Data::BatchCollator{}), batch_size);
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "caption/cache.hpp"
#include "caption/sampler.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "data/collate.hpp"
#include "data/index.hpp"
#include "data/load/load.hpp"
#include "data/transform/format/format.hpp"
#include "text/tokenizer.hpp"
#include "utils/log.hpp"

namespace Medcap {
    class PretrainingDataset : public torch::data::datasets::Dataset<PretrainingDataset, Data::Sample> {
    public:
        // Receives and returns a (3,H,W) float tensor; runs after squaring and intensity scaling.
        using ImageTransform = std::function<torch::Tensor(const torch::Tensor&)>;

        PretrainingDataset(const std::vector<Data::StudyRecord>& records,
                           const std::string& split,
                           std::shared_ptr<const Text::Tokenizer> tokenizer,
                           DatasetOptions options = {})
            : PretrainingDataset(records,
                                 split,
                                 std::move(tokenizer),
                                 std::make_shared<const Caption::CaptionIndex>(
                                     Caption::load_or_build(records, options.text.max_word_count, options.cache, options.log)),
                                 options)
        {}

        PretrainingDataset(const std::vector<Data::StudyRecord>& records,
                           const std::string& split,
                           std::shared_ptr<const Text::Tokenizer> tokenizer,
                           std::shared_ptr<const Caption::CaptionIndex> captions,
                           DatasetOptions options)
            : tokenizer_(std::move(tokenizer)),
              captions_(std::move(captions)),
              options_(std::move(options)),
              split_(Data::canonical_split(split))
        {
            if (!tokenizer_) {
                throw std::invalid_argument("PretrainingDataset requires a tokenizer.");
            }
            if (!captions_) {
                throw std::invalid_argument("PretrainingDataset requires a caption index.");
            }
            if (options_.image.size <= 0) {
                throw std::invalid_argument("Image size must be positive.");
            }
            if (options_.text.max_length <= 0) {
                throw std::invalid_argument("Caption max_length must be positive.");
            }

            paths_ = Data::build_split_index(records, split_, *captions_);

            std::ostringstream message;
            message << "Split '" << split_ << "': " << paths_.size() << " images with captions";
            Log::info(options_.log, message.str());
        }

        Data::Sample get(std::size_t index) override
        {
            if (index >= paths_.size()) {
                throw std::out_of_range("PretrainingDataset index " + std::to_string(index) + " out of range ("
                                        + std::to_string(paths_.size()) + " images).");
            }
            const auto& path = paths_[index];

            Data::Sample sample;
            sample.image = load_image(path);
            auto caption = load_caption(path, index);
            sample.input_ids = std::move(caption.encoding.input_ids);
            sample.token_type_ids = std::move(caption.encoding.token_type_ids);
            sample.attention_mask = std::move(caption.encoding.attention_mask);
            sample.caption_length = caption.length;
            sample.path = path;
            return sample;
        }

        [[nodiscard]] torch::optional<std::size_t> size() const override
        {
            return paths_.size();
        }

        // Seeded sentence draws depend on (seed, epoch, index); call between epochs, not during one.
        void set_epoch(std::uint64_t epoch) noexcept { epoch_ = epoch; }

        void set_transform(ImageTransform transform) { transform_ = std::move(transform); }

        [[nodiscard]] const std::vector<std::string>& paths() const noexcept { return paths_; }
        [[nodiscard]] const std::string& split() const noexcept { return split_; }
        [[nodiscard]] const std::shared_ptr<const Caption::CaptionIndex>& caption_index() const noexcept { return captions_; }
        [[nodiscard]] const DatasetOptions& options() const noexcept { return options_; }

        [[nodiscard]] torch::Tensor load_image(const std::string& path) const
        {
            auto intensities = Data::Load::to_tensor(Data::Load::decode_grayscale(path));
            auto square = Data::Transform::Format::Square(intensities, options_.image.size);
            if (options_.image.normalize) {
                square = square.div(255.0);
            }

            auto image = square.unsqueeze(0).repeat({3, 1, 1});
            if (transform_) {
                image = transform_(image);
            }
            if (!options_.image.channels_first) {
                image = image.permute({1, 2, 0}).contiguous();
            }
            return image;
        }

        [[nodiscard]] Caption::Caption load_caption(const std::string& path, std::size_t index) const
        {
            const auto& sentences = captions_->sentences(path);
            std::string text;
            if (options_.seed.has_value()) {
                auto engine = seeded_engine(index);
                text = Caption::select(sentences, options_.text.mode, engine, path);
            } else {
                static thread_local std::mt19937_64 engine{std::random_device{}()};
                text = Caption::select(sentences, options_.text.mode, engine, path);
            }
            return Caption::encode(text, *tokenizer_, options_.text.max_length);
        }

    private:
        [[nodiscard]] std::mt19937_64 seeded_engine(std::size_t index) const
        {
            const auto seed = *options_.seed;
            const auto item = static_cast<std::uint64_t>(index);
            std::seed_seq sequence{
                static_cast<std::uint32_t>(seed), static_cast<std::uint32_t>(seed >> 32),
                static_cast<std::uint32_t>(epoch_), static_cast<std::uint32_t>(epoch_ >> 32),
                static_cast<std::uint32_t>(item), static_cast<std::uint32_t>(item >> 32)
            };
            return std::mt19937_64(sequence);
        }

        std::shared_ptr<const Text::Tokenizer> tokenizer_{};
        std::shared_ptr<const Caption::CaptionIndex> captions_{};
        DatasetOptions options_{};
        std::string split_{};
        std::vector<std::string> paths_{};
        std::uint64_t epoch_{0};
        ImageTransform transform_{};
    };

    // Loads the catalog named by the configuration and opens one split of it.
    [[nodiscard]] inline PretrainingDataset make_dataset(const Config& config,
                                                         const std::string& split,
                                                         std::shared_ptr<const Text::Tokenizer> tokenizer)
    {
        const auto records = Data::Load::load_studies(config.catalog, config.catalog_options, config.dataset.log);
        return PretrainingDataset(records, split, std::move(tokenizer), config.dataset);
    }
}

#endif // MEDCAP_CORE_HPP
