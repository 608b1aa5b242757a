#ifndef MEDCAP_TEXT_REPORT_HPP
#define MEDCAP_TEXT_REPORT_HPP
/*
 * Report text -> sentence collection.
 * ---------------------------------------------------------------------------
 *  - Numbered items ("1.", "2.") and periods delimit sentence candidates.
 *  - Each candidate is lower-cased and reduced to its ASCII word tokens;
 *    candidates with fewer than two tokens carry no signal and are dropped.
 *  - A report stops contributing once its kept tokens reach the word cap.
 *  - Corpus statistics are a separate fold over ProcessedReport values.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <numeric>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "details/tokenize.hpp"

namespace Medcap::Text {
    using SentenceCollection = std::vector<std::string>;

    struct ProcessedReport {
        SentenceCollection sentences{};
        std::size_t word_count{0};
        std::vector<std::size_t> sentence_lengths{};

        [[nodiscard]] bool empty() const noexcept { return sentences.empty(); }
    };

    // max_word_count == 0 disables the cap.
    [[nodiscard]] inline ProcessedReport process_report(const std::optional<std::string>& report, std::size_t max_word_count)
    {
        ProcessedReport result;
        if (!report.has_value()) {
            return result;
        }

        std::string text = Details::replace_all(*report, "\r\n", " ");
        std::replace(text.begin(), text.end(), '\n', ' ');
        std::replace(text.begin(), text.end(), '\r', ' ');

        for (const auto& block : Details::split_bullets(text)) {
            for (const auto& candidate : Details::split_periods(block)) {
                if (Details::is_blank(candidate)) {
                    continue;
                }

                const auto cleaned = Details::replace_all(candidate, Details::kDoubleReplacementCharacter, " ");
                std::vector<std::string> kept;
                for (const auto& token : Details::word_tokens(cleaned)) {
                    auto ascii = Details::ascii_only(token);
                    if (!ascii.empty()) {
                        kept.push_back(std::move(ascii));
                    }
                }
                if (kept.size() <= 1) {
                    continue;
                }

                result.sentence_lengths.push_back(kept.size());
                result.word_count += kept.size();
                result.sentences.push_back(Details::join(kept));

                if (max_word_count > 0 && result.word_count >= max_word_count) {
                    return result;
                }
            }
        }
        return result;
    }

    struct Distribution {
        std::size_t count{0};
        double min{0.0};
        double mean{0.0};
        double max{0.0};
        double p5{0.0};
        double p95{0.0};

        [[nodiscard]] std::string to_string() const
        {
            std::ostringstream stream;
            stream << std::fixed << std::setprecision(2)
                   << min << ", " << mean << ", " << max << " [" << p5 << ", " << p95 << "]";
            return stream.str();
        }
    };

    namespace Details {
        // Linear interpolation between closest ranks on sorted values.
        inline double percentile(const std::vector<double>& sorted, double q)
        {
            if (sorted.empty()) {
                return 0.0;
            }
            const double position = (q / 100.0) * static_cast<double>(sorted.size() - 1);
            const auto lower = static_cast<std::size_t>(std::floor(position));
            const auto upper = static_cast<std::size_t>(std::ceil(position));
            const double fraction = position - static_cast<double>(lower);
            return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
        }

        inline Distribution describe(const std::vector<std::size_t>& values)
        {
            Distribution distribution;
            if (values.empty()) {
                return distribution;
            }
            std::vector<double> sorted(values.begin(), values.end());
            std::sort(sorted.begin(), sorted.end());
            distribution.count = sorted.size();
            distribution.min = sorted.front();
            distribution.max = sorted.back();
            distribution.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(sorted.size());
            distribution.p5 = percentile(sorted, 5.0);
            distribution.p95 = percentile(sorted, 95.0);
            return distribution;
        }
    }

    class ReportStatistics {
    public:
        void accumulate(const ProcessedReport& report)
        {
            sentence_lengths_.insert(sentence_lengths_.end(), report.sentence_lengths.begin(), report.sentence_lengths.end());
            sentences_per_report_.push_back(report.sentences.size());
            if (report.empty()) {
                ++empty_reports_;
            }
        }

        [[nodiscard]] std::size_t reports() const noexcept { return sentences_per_report_.size(); }
        [[nodiscard]] std::size_t empty_reports() const noexcept { return empty_reports_; }

        [[nodiscard]] Distribution sentence_lengths() const { return Details::describe(sentence_lengths_); }
        [[nodiscard]] Distribution sentences_per_report() const { return Details::describe(sentences_per_report_); }

        [[nodiscard]] std::string summary() const
        {
            std::ostringstream stream;
            stream << "sentence lengths: " << sentence_lengths().to_string()
                   << " | sentences per report: " << sentences_per_report().to_string()
                   << " | excluded: " << empty_reports_ << '/' << reports();
            return stream.str();
        }

    private:
        std::vector<std::size_t> sentence_lengths_{};
        std::vector<std::size_t> sentences_per_report_{};
        std::size_t empty_reports_{0};
    };
}

#endif // MEDCAP_TEXT_REPORT_HPP
