#ifndef MEDCAP_CAPTION_SAMPLER_HPP
#define MEDCAP_CAPTION_SAMPLER_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../common/config.hpp"
#include "../common/errors.hpp"
#include "../text/details/tokenize.hpp"
#include "../text/report.hpp"
#include "../text/tokenizer.hpp"

namespace Medcap::Caption {
    struct Caption {
        Text::Encoding encoding{};
        std::int64_t length{0}; // non-padding token count after truncation
    };

    /**
     * Chooses the caption text of one sample. FullReport joins every sentence in order;
     * RandomSentence draws one sentence uniformly with the caller's engine, so each reader
     * must own its engine. `path` only labels the error raised for an empty collection.
     */
    [[nodiscard]] inline std::string select(const Text::SentenceCollection& sentences,
                                            CaptionMode mode,
                                            std::mt19937_64& rng,
                                            const std::string& path = {})
    {
        if (sentences.empty()) {
            throw EmptyCaptionError(path);
        }
        switch (mode) {
            case CaptionMode::FullReport:
                return Text::Details::join(sentences);
            case CaptionMode::RandomSentence: {
                std::uniform_int_distribution<std::size_t> pick(0, sentences.size() - 1);
                return sentences[pick(rng)];
            }
        }
        throw std::invalid_argument("Unsupported caption mode.");
    }

    [[nodiscard]] inline Caption encode(const std::string& text, const Text::Tokenizer& tokenizer, std::int64_t max_length)
    {
        if (max_length <= 0) {
            throw std::invalid_argument("Caption max_length must be positive.");
        }

        Caption caption;
        caption.encoding = tokenizer.encode(text, max_length);
        const auto& ids = caption.encoding.input_ids;
        if (!ids.defined() || ids.dim() != 1 || ids.size(0) != max_length) {
            throw std::runtime_error("Tokenizer must return 1-D input_ids of length " + std::to_string(max_length) + '.');
        }
        caption.length = ids.ne(tokenizer.pad_token_id()).sum().item<std::int64_t>();
        return caption;
    }
}

#endif // MEDCAP_CAPTION_SAMPLER_HPP
