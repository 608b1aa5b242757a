#ifndef MEDCAP_COMMON_SAVE_LOAD_HPP
#define MEDCAP_COMMON_SAVE_LOAD_HPP
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace Medcap::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        // Stream extraction wraps "-1" into an unsigned type instead of failing.
        template <class T>
        bool is_negative_for_unsigned(const std::string& text)
        {
            if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
                const auto first = text.find_first_not_of(" \t\r\n");
                return first != std::string::npos && text[first] == '-';
            } else {
                return false;
            }
        }

        template <class T>
        std::optional<T> parse_value(const PropertyTree& node)
        {
            if (is_negative_for_unsigned<T>(node.data())) {
                return std::nullopt;
            }
            const auto value = node.get_value_optional<T>();
            if (!value) {
                return std::nullopt;
            }
            return *value;
        }

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto child = tree.get_child_optional(key);
            if (!child) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            const auto value = parse_value<Numeric>(*child);
            if (!value) {
                std::ostringstream message;
                message << "Invalid numeric field '" << key << "' ('" << child->data() << "') in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline const PropertyTree& get_child(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                std::ostringstream message;
                message << "Missing section '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *child;
        }

        // Absent keys yield nullopt; present keys with the wrong type are an error.
        template <class T>
        std::optional<T> read_optional(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                return std::nullopt;
            }
            const auto value = parse_value<T>(*child);
            if (!value) {
                std::ostringstream message;
                message << "Invalid value '" << child->data() << "' for field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                auto value = parse_value<T>(child.second);
                if (!value) {
                    std::ostringstream message;
                    message << "Invalid array element '" << child.second.data() << "' in " << context;
                    throw std::runtime_error(message.str());
                }
                values.push_back(std::move(*value));
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put_value(value);
                array.push_back({"", element});
            }
            return array;
        }
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, false);
        stream.flush();
        if (!stream) {
            std::ostringstream message;
            message << "Failed to write '" << path.string() << "'.";
            throw std::runtime_error(message.str());
        }
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        boost::property_tree::read_json(path.string(), tree);
        return tree;
    }
}
#endif // MEDCAP_COMMON_SAVE_LOAD_HPP
