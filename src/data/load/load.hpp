#ifndef MEDCAP_LOAD_HPP
#define MEDCAP_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "../../common/errors.hpp"
#include "../../utils/log.hpp"
#include "../../utils/progressbar.hpp"
#include "types.hpp"

namespace Medcap::Data::Load {
    namespace Details {
        inline std::string trim_copy(const std::string& value)
        {
            const auto not_space = [](unsigned char character) { return !std::isspace(character); };
            auto first = std::find_if(value.begin(), value.end(), not_space);
            auto last = std::find_if(value.rbegin(), value.rend(), not_space).base();
            if (first >= last) {
                return {};
            }
            return std::string(first, last);
        }

        inline std::string strip_utf8_bom(std::string value)
        {
            constexpr unsigned char bom[] = {0xEF, 0xBB, 0xBF};
            if (value.size() >= 3 &&
                static_cast<unsigned char>(value[0]) == bom[0] &&
                static_cast<unsigned char>(value[1]) == bom[1] &&
                static_cast<unsigned char>(value[2]) == bom[2]) {
                value.erase(0, 3);
            }
            return value;
        }

        /**
         * Reads one logical CSV record. Quoted fields may hold delimiters, doubled quotes and line
         * breaks, so a record can span several physical lines. Returns false once the stream is
         * exhausted; throws if the stream ends inside a quoted field. Fields are trimmed unless trim is false.
         */
        inline bool read_csv_record(std::istream& stream,
                                    std::vector<std::string>& fields,
                                    char delimiter = ',',
                                    bool trim = true)
        {
            fields.clear();
            std::string line;
            if (!std::getline(stream, line)) {
                return false;
            }

            std::string cur;
            cur.reserve(128);
            bool in_quote = false;

            while (true) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                for (std::size_t i = 0; i < line.size(); ++i) {
                    const char c = line[i];

                    if (c == '"') {
                        // handle escaped double quotes ("")
                        if (in_quote && i + 1 < line.size() && line[i + 1] == '"') {
                            cur.push_back('"');
                            ++i;
                        } else {
                            in_quote = !in_quote;
                        }
                        continue;
                    }

                    if (!in_quote && c == delimiter) {
                        fields.emplace_back(trim ? trim_copy(cur) : cur);
                        cur.clear();
                        continue;
                    }

                    cur.push_back(c);
                }

                if (!in_quote) {
                    break;
                }
                if (!std::getline(stream, line)) {
                    throw std::runtime_error("Unterminated quoted CSV field");
                }
                cur.push_back('\n');
            }

            fields.emplace_back(trim ? trim_copy(cur) : cur);
            return true;
        }

        // A repeated header name resolves to its first column.
        inline std::unordered_map<std::string, std::size_t> header_index_map(const std::vector<std::string>& header)
        {
            std::unordered_map<std::string, std::size_t> mapping;
            for (std::size_t index = 0; index < header.size(); ++index) {
                mapping.emplace(strip_utf8_bom(trim_copy(header[index])), index);
            }
            return mapping;
        }

        struct CsvTable {
            std::filesystem::path file{};
            std::unordered_map<std::string, std::size_t> columns{};
            std::vector<std::vector<std::string>> rows{};

            [[nodiscard]] std::size_t column(const std::string& name) const
            {
                const auto it = columns.find(name);
                if (it == columns.end()) {
                    throw std::runtime_error("CSV column not found: " + name + " in " + file.string());
                }
                return it->second;
            }
        };

        // Columns named in untrimmed_columns keep their surrounding whitespace; every other field is trimmed.
        inline CsvTable read_csv_table(const std::filesystem::path& file_path,
                                       char delimiter,
                                       const std::vector<std::string>& required_columns,
                                       const std::vector<std::string>& untrimmed_columns = {})
        {
            std::ifstream file(file_path);
            if (!file) {
                throw std::runtime_error("Failed to open CSV file: " + file_path.string());
            }

            CsvTable table;
            table.file = file_path;

            std::vector<std::string> fields;
            try {
                if (!read_csv_record(file, fields, delimiter)) {
                    throw std::runtime_error("CSV file is empty");
                }
                table.columns = header_index_map(fields);
                for (const auto& column : required_columns) {
                    (void)table.column(column);
                }

                const auto width = fields.size();
                std::vector<bool> keep_raw(width, false);
                for (const auto& column : untrimmed_columns) {
                    keep_raw[table.column(column)] = true;
                }

                while (read_csv_record(file, fields, delimiter, false)) {
                    if (fields.size() == 1 && trim_copy(fields.front()).empty()) {
                        continue;
                    }
                    if (fields.size() < width) {
                        fields.resize(width);
                    }
                    for (std::size_t index = 0; index < fields.size(); ++index) {
                        if (index >= width || !keep_raw[index]) {
                            fields[index] = trim_copy(fields[index]);
                        }
                    }
                    table.rows.push_back(fields);
                }
            } catch (const std::runtime_error& error) {
                throw std::runtime_error(std::string(error.what()) + " (" + file_path.string() + ", record "
                                         + std::to_string(table.rows.size() + 1) + ")");
            }
            return table;
        }

        inline void ensure_unique(const CsvTable& table, const std::string& column)
        {
            const auto index = table.column(column);
            std::unordered_set<std::string> seen;
            seen.reserve(table.rows.size());
            for (const auto& row : table.rows) {
                if (!seen.insert(row[index]).second) {
                    throw DuplicateKeyError(table.file.string(), column, row[index]);
                }
            }
        }

        // <root>/p<first two digits of subject>/p<subject>/s<study>/<dicom><extension>
        inline std::filesystem::path image_path(const std::filesystem::path& root,
                                                const std::string& subject_id,
                                                const std::string& study_id,
                                                const std::string& dicom_id,
                                                const std::string& extension)
        {
            return root / ("p" + subject_id.substr(0, 2)) / ("p" + subject_id) / ("s" + study_id) / (dicom_id + extension);
        }

        inline std::string join_key(const std::string& dicom_id, const std::string& study_id, const std::string& subject_id)
        {
            std::string key;
            key.reserve(dicom_id.size() + study_id.size() + subject_id.size() + 2);
            key.append(dicom_id).push_back('\x1f');
            key.append(study_id).push_back('\x1f');
            key.append(subject_id);
            return key;
        }
    }

    /**
     * Joins the split, image metadata and sectioned report tables into one record per image.
     * Rows follow the order of the split table. Images whose view is not allowed, or whose study
     * has no report text, are left out. Duplicate identifiers abort before any join happens.
     */
    [[nodiscard]] inline std::vector<StudyRecord> load_studies(const Type::CatalogPaths& paths,
                                                               const Type::CatalogOptions& options = {},
                                                               const Log::Options& log = {})
    {
        const auto& cols = options.columns;
        const auto split = Details::read_csv_table(paths.split_csv, options.delimiter,
                                                   {cols.dicom_id, cols.study_id, cols.subject_id, cols.split});
        const auto metadata = Details::read_csv_table(paths.metadata_csv, options.delimiter,
                                                      {cols.dicom_id, cols.study_id, cols.subject_id, cols.view_position});
        const auto sections = Details::read_csv_table(paths.sections_csv, options.delimiter,
                                                      {cols.study_id, cols.report}, {cols.report});

        Details::ensure_unique(split, cols.dicom_id);
        Details::ensure_unique(metadata, cols.dicom_id);
        Details::ensure_unique(sections, cols.study_id);

        std::unordered_map<std::string, std::size_t> metadata_rows;
        metadata_rows.reserve(metadata.rows.size());
        {
            const auto dicom = metadata.column(cols.dicom_id);
            const auto study = metadata.column(cols.study_id);
            const auto subject = metadata.column(cols.subject_id);
            for (std::size_t i = 0; i < metadata.rows.size(); ++i) {
                const auto& row = metadata.rows[i];
                metadata_rows.emplace(Details::join_key(row[dicom], row[study], row[subject]), i);
            }
        }

        std::unordered_map<std::string, std::size_t> section_rows;
        section_rows.reserve(sections.rows.size());
        {
            const auto study = sections.column(cols.study_id);
            for (std::size_t i = 0; i < sections.rows.size(); ++i) {
                section_rows.emplace(sections.rows[i][study], i);
            }
        }

        const std::unordered_set<std::string> allowed(options.allowed_views.begin(), options.allowed_views.end());
        const auto split_dicom = split.column(cols.dicom_id);
        const auto split_study = split.column(cols.study_id);
        const auto split_subject = split.column(cols.subject_id);
        const auto split_name = split.column(cols.split);
        const auto view_column = metadata.column(cols.view_position);
        const auto report_column = sections.column(cols.report);

        std::vector<StudyRecord> records;
        records.reserve(split.rows.size());
        std::size_t unmatched = 0;
        std::size_t filtered = 0;
        std::optional<Utils::ProgressBar> progress;
        if (log.show_progress && log.stream != nullptr) {
            progress.emplace(static_cast<std::int64_t>(split.rows.size()), "Catalog", *log.stream);
        }
        std::int64_t done = 0;
        for (const auto& row : split.rows) {
            if (progress) {
                progress->update(++done);
            }
            const auto meta = metadata_rows.find(Details::join_key(row[split_dicom], row[split_study], row[split_subject]));
            const auto section = section_rows.find(row[split_study]);
            if (meta == metadata_rows.end() || section == section_rows.end()) {
                ++unmatched;
                continue;
            }

            const auto& view = metadata.rows[meta->second][view_column];
            const auto& report = sections.rows[section->second][report_column];
            if ((!allowed.empty() && allowed.find(view) == allowed.end()) || report.empty()) {
                ++filtered;
                continue;
            }

            StudyRecord record;
            record.subject_id = row[split_subject];
            record.study_id = row[split_study];
            record.dicom_id = row[split_dicom];
            record.view_position = view;
            record.split = row[split_name];
            record.image_path = Details::image_path(paths.image_root, record.subject_id, record.study_id,
                                                    record.dicom_id, options.image_extension).string();
            record.report = report;
            records.push_back(std::move(record));
        }

        std::ostringstream message;
        message << "Loaded " << records.size() << " images (" << unmatched << " without metadata or report section, "
                << filtered << " filtered by view or empty report)";
        Log::info(log, message.str());
        return records;
    }

    [[nodiscard]] inline cv::Mat decode_grayscale(const std::string& path)
    {
        cv::Mat image = cv::imread(path, cv::IMREAD_GRAYSCALE);
        if (image.empty()) {
            throw std::runtime_error("Failed to decode image: " + path);
        }
        return image;
    }

    // Single-channel image -> (H,W) float32 tensor holding the raw intensities.
    [[nodiscard]] inline torch::Tensor to_tensor(const cv::Mat& image)
    {
        if (image.empty() || image.channels() != 1) {
            throw std::invalid_argument("to_tensor expects a non-empty single-channel image.");
        }
        cv::Mat image_float;
        image.convertTo(image_float, CV_32F);
        auto options = torch::TensorOptions().dtype(torch::kFloat32);
        return torch::from_blob(image_float.data, {image_float.rows, image_float.cols}, options).clone();
    }
}
#endif //MEDCAP_LOAD_HPP
