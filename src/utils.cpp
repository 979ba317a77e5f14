#include <cstdlib>
#include <stdexcept>

#include <fmt/format.h>

#include <metaloader/utils.hpp>

namespace metaloader
{
    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    bool ends_with(const std::string_view& str, const std::string_view& suffix)
    {
        return str.size() >= suffix.size()
               && 0 == str.compare(str.size() - suffix.size(), suffix.size(), suffix);
    }

    bool is_hex(const std::string_view& input)
    {
        return !input.empty()
               && std::all_of(input.begin(),
                              input.end(),
                              [](unsigned char c) { return std::isxdigit(c) != 0; });
    }

    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    bool contains(const std::string_view& str, const std::string_view& sub_str)
    {
        return str.find(sub_str) != std::string::npos;
    }

    std::string strip(const std::string_view& input)
    {
        std::size_t start = 0, end = input.size();
        while (start < end && std::isspace(static_cast<unsigned char>(input[start])))
            ++start;
        while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])))
            --end;
        return std::string(input.substr(start, end - start));
    }

    std::optional<std::uint64_t> parse_uint(const std::string_view& input)
    {
        if (input.empty())
            return std::nullopt;

        std::uint64_t value = 0;
        for (unsigned char c : input)
        {
            if (!std::isdigit(c))
                return std::nullopt;
            const std::uint64_t digit = c - '0';
            if (value > (UINT64_MAX - digit) / 10)
                return std::nullopt;
            value = value * 10 + digit;
        }
        return value;
    }

    std::pair<std::string, std::string> parse_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx != std::string_view::npos)
        {
            std::string_view key, value;
            key = header.substr(0, colon_idx);
            colon_idx++;
            // remove spaces
            while (colon_idx < header.size() && std::isspace(header[colon_idx]))
            {
                ++colon_idx;
            }

            value = header.substr(colon_idx);
            // http headers are case insensitive!
            return std::make_pair(to_lower(key), strip(value));
        }
        return std::make_pair(std::string(), std::string(header));
    }

    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split)
    {
        std::vector<std::string> result;
        std::size_t i = 0, j = 0, len = input.size(), n = sep.size();

        while (i + n <= len)
        {
            if (input[i] == sep[0] && input.substr(i, n) == sep)
            {
                if (max_split-- <= 0)
                    break;
                result.emplace_back(input.substr(j, i - j));
                i = j = i + n;
            }
            else
            {
                i++;
            }
        }
        result.emplace_back(input.substr(j, len - j));
        return result;
    }

    std::vector<std::string> rsplit(const std::string_view& input,
                                    const std::string_view& sep,
                                    std::size_t max_split)
    {
        if (max_split == SIZE_MAX)
            return split(input, sep, max_split);

        std::vector<std::string> result;

        std::ptrdiff_t i, j, len = static_cast<std::ptrdiff_t>(input.size()),
                             n = static_cast<std::ptrdiff_t>(sep.size());
        i = j = len;

        while (i >= n)
        {
            if (input[i - 1] == sep[n - 1] && input.substr(i - n, n) == sep)
            {
                if (max_split-- <= 0)
                {
                    break;
                }
                result.emplace_back(input.substr(i, j - i));
                i = j = i - n;
            }
            else
            {
                i--;
            }
        }
        result.emplace_back(input.substr(0, j));
        std::reverse(result.begin(), result.end());

        return result;
    }

    std::string format_bytes(std::uint64_t bytes)
    {
        static constexpr const char* units[] = { "B", "KiB", "MiB", "GiB", "TiB" };
        double value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < std::size(units))
        {
            value /= 1024.0;
            ++unit;
        }
        if (unit == 0)
            return fmt::format("{} B", bytes);
        return fmt::format("{:.1f} {}", value, units[unit]);
    }
}
