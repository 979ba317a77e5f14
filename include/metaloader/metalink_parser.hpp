#ifndef METALOADER_METALINK_PARSER_HPP
#define METALOADER_METALINK_PARSER_HPP

#include <filesystem>
#include <string_view>

#include <tl/expected.hpp>

#include <metaloader/export.hpp>
#include <metaloader/errors.hpp>
#include <metaloader/metalink.hpp>

namespace metaloader
{
    namespace fs = std::filesystem;

    /** Parses and validates a Metalink 4 document (RFC 5854).
     *
     * Only elements of the metalink namespace are interpreted, others are skipped.
     * Optional elements that are absent stay empty. Checksums with an unknown algorithm are
     * kept as kUNSUPPORTED, `url` elements that are not absolute URLs with a supported
     * scheme are dropped with a warning. External entities and network access are refused.
     */
    METALOADER_API tl::expected<Metalink, ParseError> parse_metalink(std::string_view xml);

    METALOADER_API tl::expected<Metalink, ParseError> parse_metalink_file(const fs::path& path);

    // Accepts relative paths made of plain segments only.
    METALOADER_API bool is_safe_file_name(std::string_view name);

    // Loose RFC 3339 date-time check (YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)).
    METALOADER_API bool is_rfc3339_datetime(std::string_view value);
}

#endif
