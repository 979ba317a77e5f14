#include <stdexcept>
#include <utility>

#include <metaloader/url.hpp>
#include <metaloader/utils.hpp>

namespace metaloader
{
    URLHandler::URLHandler(const std::string& url)
        : m_handle(curl_url())
    {
        if (m_handle == nullptr)
        {
            throw std::runtime_error("Could not create CURLU handle");
        }

        if (!url.empty())
        {
            m_valid = curl_url_set(m_handle, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK;
        }
    }

    URLHandler::~URLHandler()
    {
        if (m_handle)
        {
            curl_url_cleanup(m_handle);
        }
    }

    URLHandler::URLHandler(const URLHandler& rhs)
        : m_handle(curl_url_dup(rhs.m_handle))
        , m_valid(rhs.m_valid)
    {
        if (m_handle == nullptr)
        {
            throw std::runtime_error("Could not duplicate CURLU handle");
        }
    }

    URLHandler& URLHandler::operator=(const URLHandler& rhs)
    {
        URLHandler tmp(rhs);
        std::swap(tmp.m_handle, m_handle);
        std::swap(tmp.m_valid, m_valid);
        return *this;
    }

    URLHandler::URLHandler(URLHandler&& rhs)
        : m_handle(std::exchange(rhs.m_handle, nullptr))
        , m_valid(std::exchange(rhs.m_valid, false))
    {
    }

    URLHandler& URLHandler::operator=(URLHandler&& rhs)
    {
        std::swap(m_handle, rhs.m_handle);
        std::swap(m_valid, rhs.m_valid);
        return *this;
    }

    std::string URLHandler::get_part(CURLUPart part) const
    {
        if (!m_valid)
            return {};

        char* scratch = nullptr;
        if (curl_url_get(m_handle, part, &scratch, 0) != CURLUE_OK || scratch == nullptr)
            return {};

        std::string res(scratch);
        curl_free(scratch);
        return res;
    }

    std::string URLHandler::url() const
    {
        return get_part(CURLUPART_URL);
    }

    std::string URLHandler::scheme() const
    {
        return get_part(CURLUPART_SCHEME);
    }

    std::string URLHandler::host() const
    {
        return get_part(CURLUPART_HOST);
    }

    std::string URLHandler::path() const
    {
        return get_part(CURLUPART_PATH);
    }

    Protocol detect_protocol(const std::string& url)
    {
        const std::string lurl = to_lower(url);
        if (starts_with(lurl, "http://") || starts_with(lurl, "https://"))
            return Protocol::kHTTP;
        if (starts_with(lurl, "ftp://") || starts_with(lurl, "ftps://"))
            return Protocol::kFTP;
        if (starts_with(lurl, "file://"))
            return Protocol::kFILE;
        return Protocol::kOTHER;
    }

    bool is_supported_url(const std::string& url)
    {
        if (detect_protocol(url) == Protocol::kOTHER)
            return false;

        URLHandler handler(url);
        if (!handler.valid())
            return false;

        // file:// URLs have no host, every other scheme needs one
        return detect_protocol(url) == Protocol::kFILE || !handler.host().empty();
    }

    std::string url_filename(const std::string& url)
    {
        URLHandler handler(url);
        std::string path = handler.valid() ? handler.path() : url;

        auto cut = path.find_first_of("?#");
        if (cut != std::string::npos)
            path.resize(cut);

        auto parts = rsplit(path, "/", 1);
        return parts.back();
    }
}
