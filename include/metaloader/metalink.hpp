#ifndef METALOADER_METALINK_HPP
#define METALOADER_METALINK_HPP

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <metaloader/export.hpp>
#include <metaloader/enums.hpp>
#include <metaloader/checksum.hpp>

namespace metaloader
{
    // Priority bounds of RFC 5854, 1 is the most preferred.
    constexpr std::uint32_t MIN_PRIORITY = 1;
    constexpr std::uint32_t MAX_PRIORITY = 999999;

    struct Publisher
    {
        std::string name;
        std::optional<std::string> url;
    };

    struct Signature
    {
        std::string mediatype;
        std::string value;
    };

    struct Origin
    {
        std::string url;
        // The descriptor should be refreshed from `url` (not acted upon here).
        bool dynamic = false;
    };

    // Reference to another descriptor or peer-to-peer swarm, kept for reporting only.
    struct MetaUrl
    {
        std::string url;
        std::string mediatype;
        std::optional<std::uint32_t> priority;
        std::optional<std::string> name;
    };

    // One `url` element: a mirror of the file.
    struct Resource
    {
        std::string url;
        Protocol protocol = Protocol::kOTHER;
        std::optional<std::uint32_t> priority;
        // ISO 3166-1 alpha-2 country code.
        std::optional<std::string> location;
        std::optional<std::uint32_t> max_connections;
        // Position of the url element among its siblings.
        std::size_t declared_order = 0;

        // Resources without priority come after every prioritized one.
        std::uint64_t effective_priority() const noexcept
        {
            return priority ? *priority : static_cast<std::uint64_t>(MAX_PRIORITY) + 1;
        }
    };

    // Ordering key (priority ascending, declared order).
    inline bool resource_precedes(const Resource& lhs, const Resource& rhs)
    {
        return std::make_pair(lhs.effective_priority(), lhs.declared_order)
               < std::make_pair(rhs.effective_priority(), rhs.declared_order);
    }

    struct PieceHashes
    {
        ChecksumType type = ChecksumType::kUNSUPPORTED;
        std::string tag;
        std::uint64_t length = 0;
        // Lowercase hex digests, one per piece in file order.
        std::vector<std::string> hashes;

        // Number of pieces needed to cover `size` bytes.
        std::uint64_t expected_count(std::uint64_t size) const noexcept
        {
            return length == 0 ? 0 : (size + length - 1) / length;
        }

        // Byte range [first, second) of piece `index` in a file of `size` bytes.
        std::pair<std::uint64_t, std::uint64_t> range(std::size_t index,
                                                      std::uint64_t size) const noexcept
        {
            const std::uint64_t start = static_cast<std::uint64_t>(index) * length;
            return { start, std::min(start + length, size) };
        }
    };

    struct FileEntry
    {
        std::string name;
        std::optional<std::uint64_t> size;

        std::vector<Checksum> checksums;
        std::optional<PieceHashes> pieces;
        std::vector<Resource> resources;
        std::vector<MetaUrl> metaurls;

        std::optional<std::string> identity;
        std::optional<std::string> version;
        std::optional<std::string> description;
        std::optional<std::string> copyright;
        std::optional<std::string> logo;
        std::optional<Publisher> publisher;
        std::optional<Signature> signature;
        std::vector<std::string> languages;
        std::vector<std::string> os;

        // Resources sorted by (priority, declared order).
        METALOADER_API std::vector<Resource> ranked_resources() const;

        // True when some checksum (whole file or pieces) can be verified by this build.
        METALOADER_API bool has_verifiable_checksum() const;
    };

    struct Metalink
    {
        std::optional<std::string> generator;
        std::optional<Origin> origin;
        // RFC 3339 date-times, kept verbatim.
        std::optional<std::string> published;
        std::optional<std::string> updated;

        std::vector<FileEntry> files;
    };
}

#endif
