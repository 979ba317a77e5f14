#ifndef METALOADER_MIRRORID_HPP
#define METALOADER_MIRRORID_HPP

#include <string>
#include <fmt/format.h>

namespace metaloader
{

    // Identifies a Mirror (one url of a file) and is used to compare Mirrors.
    class MirrorID
    {
        std::string value;

    public:
        MirrorID() = default;

        explicit MirrorID(const std::string& v)
            : value(v)
        {
        }

        std::string to_string() const
        {
            return fmt::format("MirrorID <{}>", value);
        }

        [[nodiscard]] friend bool operator<(const MirrorID& left, const MirrorID& right)
        {
            return left.value < right.value;
        }
        [[nodiscard]] friend bool operator==(const MirrorID& left, const MirrorID& right)
        {
            return left.value == right.value;
        }
        [[nodiscard]] friend bool operator!=(const MirrorID& left, const MirrorID& right)
        {
            return !(left == right);
        }
    };
}


#endif
