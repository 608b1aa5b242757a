#ifndef MEDCAP_LOG_HPP
#define MEDCAP_LOG_HPP

#include <iostream>
#include <ostream>
#include <string_view>

#include "terminal.hpp"

// Every log line is routed through a caller-owned stream; a null stream silences the library.
namespace Medcap::Log {
    struct Options {
        std::ostream* stream{&std::cout};
        bool show_progress{false};
    };

    inline void info(const Options& options, std::string_view message)
    {
        if (options.stream == nullptr) {
            return;
        }
        *options.stream << "[Medcap] " << message << std::endl;
    }

    inline void warn(const Options& options, std::string_view message)
    {
        using Utils::Terminal::ApplyColor;
        using Utils::Terminal::Colors::kOrange;
        using Utils::Terminal::Symbols::kWarn;

        if (options.stream == nullptr) {
            return;
        }
        *options.stream << "[Medcap] " << ApplyColor(kWarn, kOrange) << ' ' << message << std::endl;
    }
}

#endif // MEDCAP_LOG_HPP
