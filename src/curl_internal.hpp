#ifndef METALOADER_SRC_CURL_INTERNAL_HPP
#define METALOADER_SRC_CURL_INTERNAL_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <tl/expected.hpp>

#include <metaloader/export.hpp>
#include <metaloader/utils.hpp>
#include <metaloader/enums.hpp>
#include <metaloader/errors.hpp>
#include <metaloader/curl.hpp>

namespace metaloader
{
    class Context;

    class METALOADER_API curl_error : public std::runtime_error
    {
    public:
        explicit curl_error(const std::string& what = "download error");
    };

    class METALOADER_API CURLHandle
    {
    public:
        explicit CURLHandle(const Context& ctx);
        CURLHandle(const Context& ctx, const std::string& url);
        ~CURLHandle();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

        CURLHandle& url(const std::string& url, const proxy_map_type& proxies);
        CURLHandle& user_agent(const std::string& user_agent);

        // Runs the transfer, returns the curl code and fills `error_message` on failure.
        CURLcode perform(std::string& error_message);

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        CURL* handle();

        CURLHandle& add_header(const std::string& header);
        CURLHandle& add_headers(const std::vector<std::string>& headers);

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

    private:
        void init_handle(const Context& ctx);

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        char errorbuffer[CURL_ERROR_SIZE];
    };

    template <class T>
    CURLHandle& CURLHandle::setopt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)));
        }
        return *this;
    }

    std::optional<std::string> proxy_match(const proxy_map_type& ctx, const std::string& url);

    // Maps a failed transfer on the error taxonomy of the downloader.
    METALOADER_API DownloaderError curl_transfer_error(CURLcode code, const std::string& message);
    METALOADER_API DownloaderError http_status_error(long http_status, const std::string& url);
}

namespace metaloader::details
{
    // Scoped initialization and termination of CURL. Instances are reference counted,
    // the global state lives as long as one of them.
    class CURLSetup final
    {
    public:
        CURLSetup();
        ~CURLSetup();

        CURLSetup(CURLSetup&&) = delete;
        CURLSetup& operator=(CURLSetup&&) = delete;

        CURLSetup(const CURLSetup&) = delete;
        CURLSetup& operator=(const CURLSetup&) = delete;
    };
}
#endif
