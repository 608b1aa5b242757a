#ifndef MEDCAP_DATA_COLLATE_HPP
#define MEDCAP_DATA_COLLATE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Medcap::Data {
    struct Sample {
        torch::Tensor image{};
        torch::Tensor input_ids{};
        torch::Tensor token_type_ids{};
        torch::Tensor attention_mask{};
        std::int64_t caption_length{0};
        std::string path{};
    };

    // Every field shares one order: caption_lengths non-increasing, ties kept in arrival order.
    struct Batch {
        torch::Tensor images{};
        torch::Tensor input_ids{};
        torch::Tensor token_type_ids{};
        torch::Tensor attention_mask{};
        torch::Tensor caption_lengths{};
        std::vector<std::string> paths{};

        [[nodiscard]] std::size_t size() const noexcept { return paths.size(); }
    };

    namespace Details {
        inline std::vector<int64_t> descending_order(const std::vector<int64_t>& lengths)
        {
            std::vector<int64_t> order(lengths.size());
            std::iota(order.begin(), order.end(), int64_t{0});
            std::stable_sort(order.begin(), order.end(), [&](int64_t lhs, int64_t rhs) {
                return lengths[static_cast<std::size_t>(lhs)] > lengths[static_cast<std::size_t>(rhs)];
            });
            return order;
        }
    }

    [[nodiscard]] inline Batch collate(const std::vector<Sample>& samples)
    {
        if (samples.empty()) {
            throw std::invalid_argument("collate expects at least one sample.");
        }

        std::vector<torch::Tensor> images, ids, types, masks;
        std::vector<int64_t> lengths;
        images.reserve(samples.size());
        ids.reserve(samples.size());
        types.reserve(samples.size());
        masks.reserve(samples.size());
        lengths.reserve(samples.size());
        for (const auto& sample : samples) {
            images.push_back(sample.image);
            ids.push_back(sample.input_ids);
            types.push_back(sample.token_type_ids);
            masks.push_back(sample.attention_mask);
            lengths.push_back(sample.caption_length);
        }

        const auto order = Details::descending_order(lengths);
        const auto permutation = torch::tensor(order, torch::TensorOptions().dtype(torch::kLong));

        Batch batch;
        batch.images = torch::stack(images).index_select(0, permutation);
        batch.input_ids = torch::stack(ids).index_select(0, permutation);
        batch.token_type_ids = torch::stack(types).index_select(0, permutation);
        batch.attention_mask = torch::stack(masks).index_select(0, permutation);
        batch.caption_lengths = torch::tensor(lengths, torch::TensorOptions().dtype(torch::kLong)).index_select(0, permutation);
        batch.paths.reserve(samples.size());
        for (const auto index : order) {
            batch.paths.push_back(samples[static_cast<std::size_t>(index)].path);
        }
        return batch;
    }

    // Collation step for torch::data pipelines: dataset.map(BatchCollator{}).
    class BatchCollator : public torch::data::transforms::Collation<Batch, std::vector<Sample>> {
    public:
        Batch apply_batch(std::vector<Sample> samples) override
        {
            return collate(samples);
        }
    };
}

#endif // MEDCAP_DATA_COLLATE_HPP
