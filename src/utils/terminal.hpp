#ifndef MEDCAP_TERMINAL_HPP
#define MEDCAP_TERMINAL_HPP

#include <string>
#include <string_view>

namespace Medcap::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset  = "\033[0m";
        inline constexpr std::string_view kOrange = "\033[38;5;208m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kWarn = "⚠";
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }
}

#endif // MEDCAP_TERMINAL_HPP
