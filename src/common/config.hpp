#ifndef MEDCAP_COMMON_CONFIG_HPP
#define MEDCAP_COMMON_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../data/load/types.hpp"
#include "../utils/log.hpp"
#include "save_load.hpp"

namespace Medcap {
    enum class CaptionMode {
        FullReport,
        RandomSentence
    };

    struct TextOptions {
        std::size_t max_word_count{97}; // 0 = uncapped
        std::int64_t max_length{97};
        CaptionMode mode{CaptionMode::FullReport};
    };

    struct ImageOptions {
        std::int64_t size{256};
        bool normalize{true};       // scale intensities to [0, 1]
        bool channels_first{false}; // [C, H, W] instead of [H, W, C]
    };

    struct DatasetOptions {
        TextOptions text{};
        ImageOptions image{};
        std::filesystem::path cache{};
        std::optional<std::uint64_t> seed{};
        Log::Options log{};
    };

    struct Config {
        Data::Type::CatalogPaths catalog{};
        Data::Type::CatalogOptions catalog_options{};
        DatasetOptions dataset{};
    };

    namespace Details {
        inline void apply_catalog(const Common::SaveLoad::PropertyTree& tree, Config& config, const std::string& context)
        {
            namespace Detail = Common::SaveLoad::Detail;
            auto& paths = config.catalog;
            auto& options = config.catalog_options;

            if (auto value = Detail::read_optional<std::string>(tree, "split_csv", context)) paths.split_csv = *value;
            if (auto value = Detail::read_optional<std::string>(tree, "metadata_csv", context)) paths.metadata_csv = *value;
            if (auto value = Detail::read_optional<std::string>(tree, "sections_csv", context)) paths.sections_csv = *value;
            if (auto value = Detail::read_optional<std::string>(tree, "image_root", context)) paths.image_root = *value;
            if (auto value = Detail::read_optional<std::string>(tree, "report_column", context)) options.columns.report = *value;
            if (auto value = Detail::read_optional<std::string>(tree, "image_extension", context)) options.image_extension = *value;

            if (const auto views = tree.get_child_optional("allowed_views")) {
                options.allowed_views = Detail::read_array<std::string>(*views, context + " allowed_views");
            }
        }

        inline void apply_text(const Common::SaveLoad::PropertyTree& tree, TextOptions& text, const std::string& context)
        {
            namespace Detail = Common::SaveLoad::Detail;
            if (auto value = Detail::read_optional<std::size_t>(tree, "max_word_count", context)) text.max_word_count = *value;
            if (auto value = Detail::read_optional<std::int64_t>(tree, "max_length", context)) text.max_length = *value;
            if (auto value = Detail::read_optional<bool>(tree, "full_report", context)) {
                text.mode = *value ? CaptionMode::FullReport : CaptionMode::RandomSentence;
            }
            if (text.max_length <= 0) {
                throw std::runtime_error("text.max_length must be positive in " + context);
            }
        }

        inline void apply_image(const Common::SaveLoad::PropertyTree& tree, ImageOptions& image, const std::string& context)
        {
            namespace Detail = Common::SaveLoad::Detail;
            if (auto value = Detail::read_optional<std::int64_t>(tree, "size", context)) image.size = *value;
            if (auto value = Detail::read_optional<bool>(tree, "normalize", context)) image.normalize = *value;
            if (auto value = Detail::read_optional<bool>(tree, "channels_first", context)) image.channels_first = *value;
            if (image.size <= 0) {
                throw std::runtime_error("image.size must be positive in " + context);
            }
        }
    }

    // Every key is optional; absent keys keep the defaults above.
    [[nodiscard]] inline Config parse_config(const Common::SaveLoad::PropertyTree& tree, const std::string& context)
    {
        namespace Detail = Common::SaveLoad::Detail;

        Config config;
        if (const auto catalog = tree.get_child_optional("catalog")) {
            Details::apply_catalog(*catalog, config, context + " [catalog]");
        }
        if (const auto text = tree.get_child_optional("text")) {
            Details::apply_text(*text, config.dataset.text, context + " [text]");
        }
        if (const auto image = tree.get_child_optional("image")) {
            Details::apply_image(*image, config.dataset.image, context + " [image]");
        }
        if (auto cache = Detail::read_optional<std::string>(tree, "cache", context)) {
            config.dataset.cache = *cache;
        }
        config.dataset.seed = Detail::read_optional<std::uint64_t>(tree, "seed", context);
        if (auto progress = Detail::read_optional<bool>(tree, "show_progress", context)) {
            config.dataset.log.show_progress = *progress;
        }
        return config;
    }

    [[nodiscard]] inline Config load_config(const std::filesystem::path& path)
    {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Configuration file not found: " + path.string());
        }
        return parse_config(Common::SaveLoad::read_json_file(path), "configuration '" + path.string() + "'");
    }
}

#endif // MEDCAP_COMMON_CONFIG_HPP
