#ifndef MEDCAP_DATA_INDEX_HPP
#define MEDCAP_DATA_INDEX_HPP

#include <string>
#include <vector>

#include "../caption/cache.hpp"
#include "load/types.hpp"

namespace Medcap::Data {
    // "valid" is accepted as a shorthand for the "validate" split of the source tables.
    [[nodiscard]] inline std::string canonical_split(const std::string& split)
    {
        return split == "valid" ? std::string{"validate"} : split;
    }

    // Image paths of one split that own at least one sentence, in record order.
    [[nodiscard]] inline std::vector<std::string> build_split_index(const std::vector<StudyRecord>& records,
                                                                    const std::string& split,
                                                                    const Caption::CaptionIndex& captions)
    {
        const auto wanted = canonical_split(split);
        std::vector<std::string> paths;
        for (const auto& record : records) {
            if (record.split == wanted && captions.usable(record.image_path)) {
                paths.push_back(record.image_path);
            }
        }
        return paths;
    }
}

#endif // MEDCAP_DATA_INDEX_HPP
