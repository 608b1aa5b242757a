#ifndef MEDCAP_TEXT_TOKENIZE_HPP
#define MEDCAP_TEXT_TOKENIZE_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace Medcap::Text::Details {
    inline constexpr std::string_view kDoubleReplacementCharacter = "\xEF\xBF\xBD\xEF\xBF\xBD";
    inline constexpr UChar32 kReplacementCodepoint = 0xFFFD;

    inline std::string replace_all(std::string value, std::string_view from, std::string_view to)
    {
        if (from.empty()) {
            return value;
        }
        std::size_t position = 0;
        while ((position = value.find(from, position)) != std::string::npos) {
            value.replace(position, from.size(), to);
            position += to.size();
        }
        return value;
    }

    inline bool is_blank(std::string_view value)
    {
        return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    }

    // Numbered items ("1.", "12.") separate blocks; the numbers themselves are dropped.
    inline std::vector<std::string> split_bullets(const std::string& text)
    {
        static const std::regex bullet{"[0-9]+\\."};
        std::vector<std::string> blocks;
        std::sregex_token_iterator first(text.begin(), text.end(), bullet, -1);
        for (std::sregex_token_iterator last; first != last; ++first) {
            blocks.push_back(first->str());
        }
        if (blocks.empty()) {
            blocks.push_back(text);
        }
        return blocks;
    }

    inline std::vector<std::string> split_periods(const std::string& block)
    {
        std::vector<std::string> pieces;
        std::size_t begin = 0;
        while (true) {
            const auto end = block.find('.', begin);
            if (end == std::string::npos) {
                pieces.push_back(block.substr(begin));
                break;
            }
            pieces.push_back(block.substr(begin, end - begin));
            begin = end + 1;
        }
        return pieces;
    }

    // Lenient UTF-8 decoding: an ill-formed sequence is consumed and yields U+FFFD.
    inline UChar32 next_codepoint(std::string_view text, std::size_t& offset)
    {
        const auto* bytes = reinterpret_cast<const std::uint8_t*>(text.data());
        const auto length = static_cast<std::int32_t>(text.size());
        auto index = static_cast<std::int32_t>(offset);
        UChar32 codepoint = 0;
        U8_NEXT(bytes, index, length, codepoint);
        offset = static_cast<std::size_t>(index);
        return codepoint < 0 ? kReplacementCodepoint : codepoint;
    }

    // Unicode word character: '_' or any letter (L*) or number (Nd, Nl, No).
    inline bool is_word_codepoint(UChar32 codepoint)
    {
        if (codepoint == U'_') {
            return true;
        }
        return (U_GET_GC_MASK(codepoint) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
    }

    // Lower-cases ASCII letters and returns the maximal runs of word characters, in order.
    inline std::vector<std::string> word_tokens(std::string_view sentence)
    {
        std::vector<std::string> tokens;
        std::string current;
        std::size_t offset = 0;
        while (offset < sentence.size()) {
            const auto begin = offset;
            const auto codepoint = next_codepoint(sentence, offset);
            if (!is_word_codepoint(codepoint)) {
                if (!current.empty()) {
                    tokens.push_back(std::move(current));
                    current.clear();
                }
                continue;
            }
            if (codepoint < 0x80) {
                current.push_back(static_cast<char>(std::tolower(static_cast<int>(codepoint))));
            } else {
                current.append(sentence.substr(begin, offset - begin));
            }
        }
        if (!current.empty()) {
            tokens.push_back(std::move(current));
        }
        return tokens;
    }

    inline std::string ascii_only(std::string_view token)
    {
        std::string result;
        result.reserve(token.size());
        for (const char c : token) {
            if (static_cast<unsigned char>(c) < 0x80) {
                result.push_back(c);
            }
        }
        return result;
    }

    inline std::string join(const std::vector<std::string>& values, std::string_view separator = " ")
    {
        std::string joined;
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                joined.append(separator);
            }
            joined.append(values[i]);
        }
        return joined;
    }
}

#endif // MEDCAP_TEXT_TOKENIZE_HPP
