#ifndef METALOADER_TRANSPORT_HPP
#define METALOADER_TRANSPORT_HPP

#include <cstdint>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <tl/expected.hpp>

#include <metaloader/export.hpp>
#include <metaloader/errors.hpp>
#include <metaloader/run_context.hpp>

namespace metaloader
{
    // Inclusive byte range, as in the `Range: bytes=first-last` header.
    struct ByteRange
    {
        std::uint64_t first = 0;
        std::uint64_t last = 0;

        std::uint64_t size() const noexcept
        {
            return last - first + 1;
        }

        std::string to_string() const
        {
            return fmt::format("{}-{}", first, last);
        }
    };

    struct FetchRequest
    {
        std::string url;
        // Whole resource when empty.
        std::optional<ByteRange> range;
    };

    struct FetchResponse
    {
        long http_status = 0;
        // The body starts at `range.first` (HTTP 206, or a protocol with native offsets).
        bool range_honored = false;
        std::optional<std::uint64_t> content_length;
        std::string effective_url;
    };

    // Receives the body of a fetch in order. Returning false from a callback stops the
    // transfer, which then ends with ML_INTERRUPTED.
    class FetchSink
    {
    public:
        virtual ~FetchSink() = default;

        // Called once, before the first byte of a successful response.
        virtual bool on_response(const FetchResponse& response) = 0;
        virtual bool on_data(const char* buffer, std::size_t size) = 0;
    };

    struct ProbeResult
    {
        std::optional<std::uint64_t> size;
        bool ranges_supported = false;
    };

    // Moves bytes from a url. Implementations are called concurrently by several workers.
    class METALOADER_API Transport
    {
    public:
        virtual ~Transport() = default;

        virtual tl::expected<FetchResponse, DownloaderError> fetch(const FetchRequest& request,
                                                                   FetchSink& sink,
                                                                   const CancellationToken& token)
            = 0;

        // Size and range capability of `url`, without its body.
        virtual tl::expected<ProbeResult, DownloaderError> probe(const std::string& url,
                                                                 const CancellationToken& token)
            = 0;
    };
}

#endif
