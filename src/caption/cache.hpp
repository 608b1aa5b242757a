#ifndef MEDCAP_CAPTION_CACHE_HPP
#define MEDCAP_CAPTION_CACHE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../common/errors.hpp"
#include "../common/save_load.hpp"
#include "../data/load/types.hpp"
#include "../text/report.hpp"
#include "../utils/log.hpp"
#include "../utils/progressbar.hpp"

namespace Medcap::Caption {
    // Bump whenever process_report changes what it emits for the same input.
    inline constexpr std::int64_t kCacheFormatVersion = 1;

    struct CaptionIndex {
        std::map<std::string, Text::SentenceCollection> mapping{};
        std::set<std::string> excluded{};

        [[nodiscard]] bool usable(const std::string& path) const { return mapping.find(path) != mapping.end(); }

        [[nodiscard]] const Text::SentenceCollection& sentences(const std::string& path) const
        {
            const auto it = mapping.find(path);
            if (it == mapping.end()) {
                throw EmptyCaptionError(path);
            }
            return it->second;
        }

        bool operator==(const CaptionIndex&) const = default;
    };

    struct CacheArtifact {
        std::int64_t format_version{kCacheFormatVersion};
        std::size_t max_word_count{0};
        CaptionIndex index{};
    };

    [[nodiscard]] inline CaptionIndex build_index(const std::vector<Data::StudyRecord>& records,
                                                  std::size_t max_word_count,
                                                  const Log::Options& log = {})
    {
        std::unordered_set<std::string> seen;
        seen.reserve(records.size());
        for (const auto& record : records) {
            if (!seen.insert(record.image_path).second) {
                throw DuplicateKeyError("study records", "image path", record.image_path);
            }
        }

        CaptionIndex index;
        Text::ReportStatistics statistics;
        std::optional<Utils::ProgressBar> progress;
        if (log.show_progress && log.stream != nullptr) {
            progress.emplace(static_cast<std::int64_t>(records.size()), "Captions", *log.stream);
        }

        std::int64_t done = 0;
        for (const auto& record : records) {
            auto processed = Text::process_report(record.report, max_word_count);
            statistics.accumulate(processed);
            if (processed.empty()) {
                index.excluded.insert(record.image_path);
                std::ostringstream message;
                message << "Study " << record.study_id << " has no usable sentence"
                        << (record.report.has_value() ? "" : " (missing report)")
                        << "; excluding '" << record.image_path << "'.";
                Log::warn(log, message.str());
            } else {
                index.mapping.emplace(record.image_path, std::move(processed.sentences));
            }
            if (progress) {
                progress->update(++done);
            }
        }

        Log::info(log, statistics.summary());
        return index;
    }

    [[nodiscard]] inline Common::SaveLoad::PropertyTree serialize(const CaptionIndex& index, std::size_t max_word_count)
    {
        using Common::SaveLoad::PropertyTree;
        using Common::SaveLoad::Detail::write_array;

        PropertyTree tree;
        tree.put("format_version", kCacheFormatVersion);
        tree.put("max_word_count", max_word_count);

        PropertyTree mapping;
        for (const auto& [path, sentences] : index.mapping) {
            PropertyTree entry;
            entry.put("path", path);
            entry.add_child("sentences", write_array(sentences));
            mapping.push_back({"", entry});
        }
        tree.add_child("mapping", mapping);

        const std::vector<std::string> excluded(index.excluded.begin(), index.excluded.end());
        tree.add_child("excluded", write_array(excluded));
        return tree;
    }

    [[nodiscard]] inline CacheArtifact deserialize(const Common::SaveLoad::PropertyTree& tree, const std::string& context)
    {
        namespace Detail = Common::SaveLoad::Detail;

        CacheArtifact artifact;
        try {
            artifact.format_version = Detail::get_numeric<std::int64_t>(tree, "format_version", context);
            artifact.max_word_count = Detail::get_numeric<std::size_t>(tree, "max_word_count", context);

            for (const auto& node : Detail::get_child(tree, "mapping", context)) {
                auto path = Detail::get_string(node.second, "path", context);
                auto sentences = Detail::read_array<std::string>(Detail::get_child(node.second, "sentences", context), context);
                if (sentences.empty()) {
                    throw CacheFormatError("Empty sentence collection for '" + path + "' in " + context);
                }
                if (!artifact.index.mapping.emplace(path, std::move(sentences)).second) {
                    throw CacheFormatError("Path '" + path + "' listed twice in " + context);
                }
            }

            for (auto& path : Detail::read_array<std::string>(Detail::get_child(tree, "excluded", context), context)) {
                if (artifact.index.usable(path)) {
                    throw CacheFormatError("Path '" + path + "' is both captioned and excluded in " + context);
                }
                artifact.index.excluded.insert(std::move(path));
            }
        } catch (const CacheFormatError&) {
            throw;
        } catch (const std::runtime_error& error) {
            throw CacheFormatError(error.what());
        }
        return artifact;
    }

    inline void save(const std::filesystem::path& location, const CaptionIndex& index, std::size_t max_word_count)
    {
        namespace fs = std::filesystem;
        if (location.has_parent_path()) {
            fs::create_directories(location.parent_path());
        }
        auto staging = location;
        staging += ".partial";
        Common::SaveLoad::write_json_file(staging, serialize(index, max_word_count));
        fs::rename(staging, location);
    }

    [[nodiscard]] inline CacheArtifact load(const std::filesystem::path& location)
    {
        Common::SaveLoad::PropertyTree tree;
        try {
            tree = Common::SaveLoad::read_json_file(location);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw CacheFormatError("Unreadable caption cache '" + location.string() + "': " + error.what());
        }
        return deserialize(tree, "caption cache '" + location.string() + "'");
    }

    // A present artifact is returned as stored, without comparing it to the records; only an artifact
    // written by a different processing version or word cap is rebuilt.
    [[nodiscard]] inline CaptionIndex load_or_build(const std::vector<Data::StudyRecord>& records,
                                                    std::size_t max_word_count,
                                                    const std::filesystem::path& location,
                                                    const Log::Options& log = {})
    {
        if (location.empty()) {
            throw std::invalid_argument("Caption cache location must not be empty.");
        }

        if (std::filesystem::exists(location)) {
            auto artifact = load(location);
            if (artifact.format_version == kCacheFormatVersion && artifact.max_word_count == max_word_count) {
                Log::info(log, "Loading captions from " + location.string());
                return std::move(artifact.index);
            }
            std::ostringstream message;
            message << "Caption cache " << location.string() << " was built with format " << artifact.format_version
                    << " and word cap " << artifact.max_word_count << " (expected " << kCacheFormatVersion
                    << " and " << max_word_count << "); rebuilding.";
            Log::warn(log, message.str());
        } else {
            Log::info(log, "Caption cache " + location.string() + " does not exist. Creating captions...");
        }

        auto index = build_index(records, max_word_count, log);
        save(location, index, max_word_count);
        Log::info(log, "Saved captions to " + location.string());
        return index;
    }
}

#endif // MEDCAP_CAPTION_CACHE_HPP
