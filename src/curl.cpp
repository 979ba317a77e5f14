#include <atomic>
#include <cassert>
#include <mutex>

#include <spdlog/spdlog.h>

#include <metaloader/curl.hpp>
#include <metaloader/utils.hpp>
#include <metaloader/context.hpp>
#include <metaloader/url.hpp>

#include "curl_internal.hpp"

namespace metaloader
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what)
        : std::runtime_error(what)
    {
    }

    /**************
     * CURLHandle*
     **************/

    CURLHandle::CURLHandle(const Context& ctx)
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        init_handle(ctx);
        // Set error buffer
        errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, errorbuffer);
    }

    void CURLHandle::init_handle(const Context& ctx)
    {
        setopt(CURLOPT_FOLLOWLOCATION, 1L);
        setopt(CURLOPT_NETRC, CURL_NETRC_OPTIONAL);
        setopt(CURLOPT_MAXREDIRS, 6L);
        setopt(CURLOPT_CONNECTTIMEOUT, ctx.connect_timeout);
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        setopt(CURLOPT_BUFFERSIZE, ctx.transfer_buffersize);
        // worker threads must not get SIGPIPE/SIGALRM
        setopt(CURLOPT_NOSIGNAL, 1L);

        if (ctx.disable_ssl)
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);

            // also disable proxy SSL verification
            setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);

            // Windows SSL backend doesn't support this
            CURLcode verifystatus = curl_easy_setopt(m_handle, CURLOPT_SSL_VERIFYSTATUS, 0L);
            if (verifystatus != CURLE_OK && verifystatus != CURLE_NOT_BUILT_IN)
                throw curl_error("Could not initialize CURL handle");

            if (!ctx.ssl_ca_info.empty())
            {
                setopt(CURLOPT_CAINFO, ctx.ssl_ca_info.string());
            }

            if (ctx.ssl_no_revoke)
            {
                setopt(CURLOPT_SSL_OPTIONS, static_cast<long>(CURLSSLOPT_NO_REVOKE));
            }
        }

        if (ctx.verbosity > 2)
            setopt(CURLOPT_VERBOSE, 1L);
    }

    CURLHandle::CURLHandle(const Context& ctx, const std::string& url)
        : CURLHandle(ctx)
    {
        this->url(url, ctx.proxy_map);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
        if (p_headers)
        {
            curl_slist_free_all(p_headers);
        }
    }

    CURLHandle& CURLHandle::url(const std::string& url, const proxy_map_type& proxies)
    {
        setopt(CURLOPT_URL, url.c_str());
        const auto match = proxy_match(proxies, url);
        if (match)
        {
            setopt(CURLOPT_PROXY, match.value().c_str());
        }
        else
        {
            setopt(CURLOPT_PROXY, nullptr);
        }
        return *this;
    }

    CURLHandle& CURLHandle::user_agent(const std::string& user_agent)
    {
        add_header(fmt::format("User-Agent: {} {}", user_agent, curl_version()));
        return *this;
    }

    CURLcode CURLHandle::perform(std::string& error_message)
    {
        CURLcode curl_result = curl_easy_perform(handle());
        if (curl_result != CURLE_OK)
        {
            error_message = fmt::format("{} [{}]", curl_easy_strerror(curl_result), errorbuffer);
        }
        return curl_result;
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
            return tl::unexpected(result);
        return val;
    }

    template tl::expected<long, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<char*, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<double, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<long long, CURLcode> CURLHandle::getinfo(CURLINFO option);

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        auto res = getinfo<char*>(option);
        if (res && res.value() != nullptr)
            return std::string(res.value());
        else if (res)
            return std::string();
        else
            return tl::unexpected(res.error());
    }

    CURL* CURLHandle::handle()
    {
        if (p_headers)
            setopt(CURLOPT_HTTPHEADER, p_headers);
        return m_handle;
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        p_headers = curl_slist_append(p_headers, header.c_str());
        if (!p_headers)
        {
            throw std::bad_alloc();
        }
        return *this;
    }

    CURLHandle& CURLHandle::add_headers(const std::vector<std::string>& headers)
    {
        for (auto& h : headers)
        {
            add_header(h);
        }
        return *this;
    }

    /************
     * Response *
     ************/

    bool Response::ok() const
    {
        if (protocol == Protocol::kHTTP)
            return http_status / 100 == 2;
        return true;
    }

    tl::expected<std::string, std::out_of_range> Response::get_header(
        const std::string& header) const
    {
        if (headers.find(header) != headers.end())
            return headers.at(header);
        else
            return tl::unexpected(
                std::out_of_range(std::string("Could not find header ") + header));
    }

    void Response::fill_values(CURLHandle& handle)
    {
        http_status = handle.getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        effective_url = handle.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
        content_length = handle.getinfo<curl_off_t>(CURLINFO_CONTENT_LENGTH_DOWNLOAD_T)
                             .value_or(-1);
    }

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url)
    {
        // Same lookup order as requests.utils.select_proxy()
        if (proxies.empty())
        {
            return std::nullopt;
        }

        auto handler = URLHandler(url);
        auto scheme = handler.scheme();
        auto host = handler.host();
        std::vector<std::string> options;

        if (host.empty())
        {
            options = {
                scheme,
                "all",
            };
        }
        else
        {
            options = { scheme + "://" + host, scheme, "all://" + host, "all" };
        }

        for (auto& option : options)
        {
            auto proxy = proxies.find(option);
            if (proxy != proxies.end())
            {
                return proxy->second;
            }
        }

        return std::nullopt;
    }

    DownloaderError curl_transfer_error(CURLcode code, const std::string& message)
    {
        switch (code)
        {
            case CURLE_OPERATION_TIMEDOUT:
                return DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::ML_TIMEOUT, message };

            case CURLE_RECV_ERROR:
            case CURLE_SEND_ERROR:
            case CURLE_PARTIAL_FILE:
            case CURLE_GOT_NOTHING:
                return DownloaderError{ ErrorLevel::SERIOUS,
                                        ErrorCode::ML_CONNECTION_RESET,
                                        message };

            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_PEER_FAILED_VERIFICATION:
            case CURLE_SSL_CERTPROBLEM:
            case CURLE_SSL_CIPHER:
            case CURLE_SSL_ISSUER_ERROR:
            case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
            case CURLE_SSL_INVALIDCERTSTATUS:
                return DownloaderError{ ErrorLevel::INFO, ErrorCode::ML_TLS, message };

            case CURLE_FILE_COULDNT_READ_FILE:
            case CURLE_REMOTE_FILE_NOT_FOUND:
            case CURLE_REMOTE_ACCESS_DENIED:
            case CURLE_LOGIN_DENIED:
                return DownloaderError{ ErrorLevel::INFO, ErrorCode::ML_BADSTATUS, message };

            case CURLE_RANGE_ERROR:
            case CURLE_BAD_CONTENT_ENCODING:
            case CURLE_WEIRD_SERVER_REPLY:
                return DownloaderError{ ErrorLevel::INFO,
                                        ErrorCode::ML_MALFORMED_RESPONSE,
                                        message };

            case CURLE_OUT_OF_MEMORY:
                return DownloaderError{ ErrorLevel::FATAL, ErrorCode::ML_CURL, message };

            // These errors will not go away by retrying the same url
            case CURLE_BAD_FUNCTION_ARGUMENT:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_FILESIZE_EXCEEDED:
            case CURLE_INTERFACE_FAILED:
            case CURLE_NOT_BUILT_IN:
            case CURLE_UNSUPPORTED_PROTOCOL:
            case CURLE_URL_MALFORMAT:
            case CURLE_SSL_CACERT_BADFILE:
            case CURLE_SSL_CRL_BADFILE:
                return DownloaderError{ ErrorLevel::INFO, ErrorCode::ML_BADFUNCARG, message };

            default:
                return DownloaderError{ ErrorLevel::INFO, ErrorCode::ML_CURL, message };
        }
    }

    DownloaderError http_status_error(long http_status, const std::string& url)
    {
        if (http_status == 408 || http_status == 429 || http_status / 100 == 5)
        {
            return DownloaderError{ ErrorLevel::SERIOUS,
                                    ErrorCode::ML_TEMPORARYERR,
                                    fmt::format("Server returned {} for {}", http_status, url),
                                    http_status };
        }
        return DownloaderError{ ErrorLevel::INFO,
                                ErrorCode::ML_BADSTATUS,
                                fmt::format("Server returned {} for {}", http_status, url),
                                http_status };
    }

    namespace
    {
        // State of one fetch, shared with the curl callbacks.
        struct Transfer
        {
            CURLHandle* handle;
            const FetchRequest* request;
            FetchSink* sink;
            const CancellationToken* token;
            Protocol protocol;

            Response response;
            HeaderCbState headercb_state = HeaderCbState::kDEFAULT;
            std::string headercb_interrupt_reason;

            bool response_delivered = false;
            bool discard_body = false;
            bool sink_aborted = false;
        };

        // Hands status and headers to the sink, once, before the first byte of the body.
        void deliver_response(Transfer& t)
        {
            t.response_delivered = true;
            t.response.fill_values(*t.handle);

            if (!t.response.ok())
            {
                // error pages are not part of the file
                t.discard_body = true;
                return;
            }

            FetchResponse fetch_response;
            fetch_response.http_status = t.response.http_status;
            fetch_response.effective_url = t.response.effective_url;
            if (t.response.content_length >= 0)
                fetch_response.content_length
                    = static_cast<std::uint64_t>(t.response.content_length);

            if (t.request->range)
            {
                // curl applies the range itself for the other protocols
                fetch_response.range_honored
                    = t.protocol != Protocol::kHTTP || t.response.http_status == 206;
            }

            if (!t.sink->on_response(fetch_response))
                t.sink_aborted = true;
        }

        std::size_t header_callback(char* buffer,
                                    std::size_t size,
                                    std::size_t nitems,
                                    Transfer* self)
        {
            assert(self);

            const std::size_t ret = size * nitems;
            std::string_view header(buffer, ret);

            if (starts_with(header, "HTTP/"))
            {
                // every redirect (or 100 Continue) starts a new header block
                self->response.headers.clear();
                self->headercb_state
                    = (contains(header, " 200") || contains(header, " 206"))
                          ? HeaderCbState::kHTTP_STATE_OK
                          : HeaderCbState::kDEFAULT;
                return ret;
            }

            if (self->headercb_state == HeaderCbState::kINTERRUPTED)
                return ret;

            auto [key, value] = parse_header(header);
            if (key.empty())
                return ret;
            self->response.headers[key] = value;

            if (self->headercb_state == HeaderCbState::kHTTP_STATE_OK && key == "content-range"
                && self->request->range)
            {
                // bytes <first>-<last>/<total>
                const auto unit_end = value.find(' ');
                const auto dash = value.find('-');
                std::optional<std::uint64_t> first;
                if (unit_end != std::string::npos && dash != std::string::npos && dash > unit_end)
                    first = parse_uint(value.substr(unit_end + 1, dash - unit_end - 1));

                if (!first || *first != self->request->range->first)
                {
                    self->headercb_state = HeaderCbState::kINTERRUPTED;
                    self->headercb_interrupt_reason
                        = fmt::format("Server returned Content-Range '{}' but {} was requested",
                                      value,
                                      self->request->range->to_string());
                    // Return error value
                    return ret + 1;
                }
                self->headercb_state = HeaderCbState::kDONE;
            }

            return ret;
        }

        std::size_t write_callback(char* buffer,
                                   std::size_t size,
                                   std::size_t nitems,
                                   Transfer* self)
        {
            assert(self);
            const std::size_t all = size * nitems;

            if (self->token->is_cancelled())
                return 0;

            if (!self->response_delivered)
                deliver_response(*self);

            if (self->discard_body)
                return all;

            if (self->sink_aborted || !self->sink->on_data(buffer, all))
            {
                self->sink_aborted = true;
                // Return zero that will lead to transfer abortion
                return 0;
            }
            return all;
        }

        int progress_callback(const CancellationToken* token,
                              curl_off_t /*total_to_download*/,
                              curl_off_t /*now_downloaded*/,
                              curl_off_t /*total_to_upload*/,
                              curl_off_t /*now_uploaded*/)
        {
            return token->is_cancelled() ? 1 : 0;
        }

        std::size_t discard_callback(char* /*buffer*/,
                                     std::size_t size,
                                     std::size_t nitems,
                                     void* /*userdata*/)
        {
            return size * nitems;
        }

        std::size_t header_map_callback(char* buffer,
                                        std::size_t size,
                                        std::size_t nitems,
                                        Response* response)
        {
            std::string_view header(buffer, size * nitems);
            if (starts_with(header, "HTTP/"))
            {
                response->headers.clear();
                return size * nitems;
            }
            auto kv = parse_header(header);
            if (!kv.first.empty())
            {
                response->headers[kv.first] = kv.second;
            }
            return size * nitems;
        }

        DownloaderError interrupted_error(const std::string& url)
        {
            return DownloaderError{ ErrorLevel::INFO,
                                    ErrorCode::ML_INTERRUPTED,
                                    fmt::format("Transfer of {} was interrupted", url) };
        }
    }

    /*****************
     * CurlTransport *
     *****************/

    CurlTransport::CurlTransport(const Context& ctx)
        : m_ctx(ctx)
        , m_setup(std::make_unique<details::CURLSetup>())
    {
    }

    CurlTransport::~CurlTransport() = default;

    tl::expected<FetchResponse, DownloaderError> CurlTransport::fetch(
        const FetchRequest& request, FetchSink& sink, const CancellationToken& token)
    {
        try
        {
            return fetch_impl(request, sink, token);
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(DownloaderError{ ErrorLevel::FATAL, ErrorCode::ML_CURL, e.what() });
        }
    }

    tl::expected<ProbeResult, DownloaderError> CurlTransport::probe(const std::string& url,
                                                                    const CancellationToken& token)
    {
        try
        {
            return probe_impl(url, token);
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(DownloaderError{ ErrorLevel::FATAL, ErrorCode::ML_CURL, e.what() });
        }
    }

    tl::expected<FetchResponse, DownloaderError> CurlTransport::fetch_impl(
        const FetchRequest& request, FetchSink& sink, const CancellationToken& token)
    {
        if (token.is_cancelled())
            return tl::unexpected(interrupted_error(request.url));

        CURLHandle h(m_ctx, request.url);
        Transfer transfer{ &h, &request, &sink, &token, detect_protocol(request.url) };
        transfer.response.protocol = transfer.protocol;

        h.user_agent(m_ctx.user_agent);
        h.add_headers(m_ctx.additional_httpheaders);

        if (request.range)
        {
            h.setopt(CURLOPT_RANGE, request.range->to_string());
        }

        h.setopt(CURLOPT_HEADERFUNCTION, &header_callback);
        h.setopt(CURLOPT_HEADERDATA, &transfer);
        h.setopt(CURLOPT_WRITEFUNCTION, &write_callback);
        h.setopt(CURLOPT_WRITEDATA, &transfer);
        h.setopt(CURLOPT_XFERINFOFUNCTION, &progress_callback);
        h.setopt(CURLOPT_XFERINFODATA, &token);
        h.setopt(CURLOPT_NOPROGRESS, 0L);

        spdlog::debug("Fetching {}{}",
                      request.url,
                      request.range ? fmt::format(" [{}]", request.range->to_string()) : "");

        std::string error_message;
        const CURLcode result = h.perform(error_message);

        if (token.is_cancelled())
            return tl::unexpected(interrupted_error(request.url));

        if (transfer.sink_aborted)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::INFO,
                ErrorCode::ML_INTERRUPTED,
                fmt::format("Transfer of {} stopped by the receiver", request.url) });
        }

        if (transfer.headercb_state == HeaderCbState::kINTERRUPTED)
        {
            return tl::unexpected(DownloaderError{ ErrorLevel::INFO,
                                                   ErrorCode::ML_MALFORMED_RESPONSE,
                                                   transfer.headercb_interrupt_reason });
        }

        if (result != CURLE_OK)
        {
            auto error = curl_transfer_error(
                result, fmt::format("Fetching {} failed: {}", request.url, error_message));
            if (transfer.response_delivered && !transfer.response.ok())
            {
                // the status tells more than the aborted transfer
                return tl::unexpected(
                    http_status_error(transfer.response.http_status, request.url));
            }
            return tl::unexpected(error);
        }

        if (!transfer.response_delivered)
        {
            // empty body
            deliver_response(transfer);
            if (transfer.sink_aborted)
                return tl::unexpected(interrupted_error(request.url));
        }

        if (!transfer.response.ok())
        {
            return tl::unexpected(http_status_error(transfer.response.http_status, request.url));
        }

        FetchResponse response;
        response.http_status = transfer.response.http_status;
        response.effective_url = transfer.response.effective_url;
        if (transfer.response.content_length >= 0)
            response.content_length = static_cast<std::uint64_t>(transfer.response.content_length);
        if (request.range)
            response.range_honored = transfer.protocol != Protocol::kHTTP
                                     || transfer.response.http_status == 206;
        return response;
    }

    tl::expected<ProbeResult, DownloaderError> CurlTransport::probe_impl(
        const std::string& url, const CancellationToken& token)
    {
        if (token.is_cancelled())
            return tl::unexpected(interrupted_error(url));

        CURLHandle h(m_ctx, url);
        Response response;
        response.protocol = detect_protocol(url);

        h.user_agent(m_ctx.user_agent);
        h.add_headers(m_ctx.additional_httpheaders);
        h.setopt(CURLOPT_NOBODY, 1L);
        h.setopt(CURLOPT_HEADERFUNCTION, &header_map_callback);
        h.setopt(CURLOPT_HEADERDATA, &response);
        h.setopt(CURLOPT_WRITEFUNCTION, &discard_callback);
        h.setopt(CURLOPT_XFERINFOFUNCTION, &progress_callback);
        h.setopt(CURLOPT_XFERINFODATA, &token);
        h.setopt(CURLOPT_NOPROGRESS, 0L);

        std::string error_message;
        const CURLcode result = h.perform(error_message);
        if (token.is_cancelled())
            return tl::unexpected(interrupted_error(url));
        if (result != CURLE_OK)
        {
            return tl::unexpected(
                curl_transfer_error(result, fmt::format("Probing {} failed: {}", url, error_message)));
        }

        response.fill_values(h);
        if (!response.ok())
        {
            return tl::unexpected(http_status_error(response.http_status, url));
        }

        ProbeResult probe;
        if (response.content_length >= 0)
            probe.size = static_cast<std::uint64_t>(response.content_length);

        if (response.protocol == Protocol::kHTTP)
        {
            auto accept_ranges = response.get_header("accept-ranges");
            probe.ranges_supported = accept_ranges && contains(to_lower(*accept_ranges), "bytes");
        }
        else
        {
            probe.ranges_supported = true;
        }

        spdlog::debug("Probed {}: size {}, ranges {}",
                      url,
                      probe.size ? std::to_string(*probe.size) : "unknown",
                      probe.ranges_supported ? "supported" : "unsupported");
        return probe;
    }

    namespace details
    {
        static std::mutex curl_setup_mutex;
        static std::size_t curl_setup_count = 0;

        CURLSetup::CURLSetup()
        {
            std::lock_guard<std::mutex> lock(curl_setup_mutex);
            if (curl_setup_count == 0 && curl_global_init(CURL_GLOBAL_ALL) != 0)
                throw curl_error("failed to initialize curl");
            ++curl_setup_count;
        }

        CURLSetup::~CURLSetup()
        {
            std::lock_guard<std::mutex> lock(curl_setup_mutex);
            if (--curl_setup_count == 0)
                curl_global_cleanup();
        }
    }
}
