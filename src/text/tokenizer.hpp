#ifndef MEDCAP_TEXT_TOKENIZER_HPP
#define MEDCAP_TEXT_TOKENIZER_HPP

#include <cstdint>
#include <string>

#include <torch/torch.h>

namespace Medcap::Text {
    // Fixed-length encoding of one caption; every tensor is 1-D kLong of length max_length.
    struct Encoding {
        torch::Tensor input_ids{};
        torch::Tensor token_type_ids{};
        torch::Tensor attention_mask{}; // 0 at padding positions
    };

    // Boundary to a pretrained subword tokenizer. Implementations truncate to max_length and pad
    // up to it with pad_token_id(); encode must be safe to call from concurrent readers.
    class Tokenizer {
    public:
        virtual ~Tokenizer() = default;

        [[nodiscard]] virtual Encoding encode(const std::string& text, std::int64_t max_length) const = 0;

        [[nodiscard]] virtual std::int64_t pad_token_id() const { return 0; }
    };
}

#endif // MEDCAP_TEXT_TOKENIZER_HPP
