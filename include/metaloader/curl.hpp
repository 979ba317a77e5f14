#ifndef METALOADER_CURL_HPP
#define METALOADER_CURL_HPP

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <metaloader/export.hpp>
#include <metaloader/context.hpp>
#include <metaloader/enums.hpp>
#include <metaloader/transport.hpp>

namespace metaloader
{
    class CURLHandle;

    namespace details
    {
        class CURLSetup;
    }

    // Status and headers of a finished transfer.
    struct METALOADER_API Response
    {
        std::map<std::string, std::string> headers;

        long http_status = 0;
        std::string effective_url;
        Protocol protocol = Protocol::kOTHER;

        // A 2xx status for HTTP, any completed transfer for the other protocols.
        bool ok() const;

        tl::expected<std::string, std::out_of_range> get_header(const std::string& header) const;

        void fill_values(CURLHandle& handle);

        // -1 when the server did not tell.
        curl_off_t content_length = -1;
    };

    // Transport over libcurl easy handles, one handle per call.
    class METALOADER_API CurlTransport : public Transport
    {
    public:
        explicit CurlTransport(const Context& ctx);
        ~CurlTransport() override;

        CurlTransport(const CurlTransport&) = delete;
        CurlTransport& operator=(const CurlTransport&) = delete;

        tl::expected<FetchResponse, DownloaderError> fetch(const FetchRequest& request,
                                                           FetchSink& sink,
                                                           const CancellationToken& token) override;

        tl::expected<ProbeResult, DownloaderError> probe(const std::string& url,
                                                         const CancellationToken& token) override;

    private:
        tl::expected<FetchResponse, DownloaderError> fetch_impl(const FetchRequest& request,
                                                                FetchSink& sink,
                                                                const CancellationToken& token);
        tl::expected<ProbeResult, DownloaderError> probe_impl(const std::string& url,
                                                              const CancellationToken& token);

        const Context& m_ctx;
        std::unique_ptr<details::CURLSetup> m_setup;
    };
}

#endif
