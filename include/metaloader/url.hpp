#ifndef METALOADER_URL_HPP
#define METALOADER_URL_HPP

#include <string>

extern "C"
{
#include <curl/curl.h>
}

#include <metaloader/export.hpp>
#include <metaloader/enums.hpp>

namespace metaloader
{
    // Thin owner of a CURLU handle, used to validate and take apart resource URLs.
    class METALOADER_API URLHandler
    {
    public:
        explicit URLHandler(const std::string& url = "");
        ~URLHandler();

        URLHandler(const URLHandler&);
        URLHandler& operator=(const URLHandler&);
        URLHandler(URLHandler&&);
        URLHandler& operator=(URLHandler&&);

        // False when curl refused to parse the URL given to the constructor.
        bool valid() const noexcept
        {
            return m_valid;
        }

        std::string url() const;
        std::string scheme() const;
        std::string host() const;
        std::string path() const;

    private:
        std::string get_part(CURLUPart part) const;

        CURLU* m_handle;
        bool m_valid = false;
    };

    // Scheme of `url` mapped on the protocols we know how to fetch.
    METALOADER_API Protocol detect_protocol(const std::string& url);

    // True for an absolute URL with a scheme we can fetch.
    METALOADER_API bool is_supported_url(const std::string& url);

    // Last path segment of `url`, without query or fragment. Empty if there is none.
    METALOADER_API std::string url_filename(const std::string& url);
}

#endif
