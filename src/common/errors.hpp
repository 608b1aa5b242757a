#ifndef MEDCAP_COMMON_ERRORS_HPP
#define MEDCAP_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Medcap {
    // A path reached caption sampling without any sentence: the caption index is inconsistent.
    class EmptyCaptionError : public std::logic_error {
    public:
        explicit EmptyCaptionError(const std::string& path)
            : std::logic_error("No sentence available for image '" + path + "'."), path_(path)
        {}

        [[nodiscard]] const std::string& path() const noexcept { return path_; }

    private:
        std::string path_;
    };

    // Duplicate identifiers in a source table or duplicate image paths in a record list.
    class DuplicateKeyError : public std::runtime_error {
    public:
        DuplicateKeyError(const std::string& source, const std::string& key, const std::string& value)
            : std::runtime_error("Duplicate " + key + " '" + value + "' in " + source + "."),
              key_(key),
              value_(value)
        {}

        [[nodiscard]] const std::string& key() const noexcept { return key_; }
        [[nodiscard]] const std::string& value() const noexcept { return value_; }

    private:
        std::string key_;
        std::string value_;
    };

    class CacheFormatError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}

#endif // MEDCAP_COMMON_ERRORS_HPP
