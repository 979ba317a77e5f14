#ifndef METALOADER_UTILS_HPP
#define METALOADER_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <metaloader/export.hpp>

namespace metaloader
{
    namespace fs = std::filesystem;

    METALOADER_API bool starts_with(const std::string_view& str, const std::string_view& prefix);
    METALOADER_API bool ends_with(const std::string_view& str, const std::string_view& suffix);

    template <class B>
    inline std::string hex_string(const B& buffer, std::size_t size)
    {
        std::ostringstream oss;
        oss << std::hex;
        for (std::size_t i = 0; i < size; ++i)
        {
            oss << std::setw(2) << std::setfill('0')
                << static_cast<int>(static_cast<unsigned char>(buffer[i]));
        }
        return oss.str();
    }

    template <class B>
    inline std::string hex_string(const B& buffer)
    {
        return hex_string(buffer, buffer.size());
    }

    METALOADER_API bool is_hex(const std::string_view& input);

    METALOADER_API std::string string_transform(const std::string_view& input,
                                                int (*functor)(int));
    METALOADER_API std::string to_lower(const std::string_view& input);
    METALOADER_API bool contains(const std::string_view& str, const std::string_view& sub_str);

    // Removes leading and trailing whitespace.
    METALOADER_API std::string strip(const std::string_view& input);

    // Parses a base 10 unsigned integer, rejecting signs, blanks and overflow.
    METALOADER_API std::optional<std::uint64_t> parse_uint(const std::string_view& input);

    METALOADER_API std::pair<std::string, std::string> parse_header(
        const std::string_view& header);

    METALOADER_API
    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split = SIZE_MAX);

    METALOADER_API
    std::vector<std::string> rsplit(const std::string_view& input,
                                    const std::string_view& sep,
                                    std::size_t max_split);

    // Human readable byte count, e.g. "1.5 MiB".
    METALOADER_API std::string format_bytes(std::uint64_t bytes);
}

#endif
