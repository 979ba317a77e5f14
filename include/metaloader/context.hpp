#ifndef METALOADER_CONTEXT_HPP
#define METALOADER_CONTEXT_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <metaloader/export.hpp>

namespace metaloader
{
    namespace fs = std::filesystem;

    using proxy_map_type = std::map<std::string, std::string>;

    // Tunables of a download run. Plain values, owned by the caller and shared read-only.
    class METALOADER_API Context
    {
    public:
        int verbosity = 0;

        // ssl options
        bool disable_ssl = false;
        bool ssl_no_revoke = false;
        fs::path ssl_ca_info;

        long connect_timeout = 30L;
        long low_speed_time = 30L;
        long low_speed_limit = 1000L;

        // Number of worker threads, shared by every file of the run.
        long max_parallel_downloads = 5L;
        // -1 means no limit, a `maxconnections` hint of a url lowers it further.
        long max_downloads_per_mirror = -1L;

        // This can improve throughput significantly
        // see https://github.com/curl/curl/issues/9601
        long transfer_buffersize = 100 * 1024;

        // A mirror with this many failures and no success is not used anymore.
        int allowed_mirror_failures = 3;
        // Bound on the attempts of one segment, whatever mirror served them.
        std::size_t max_attempts_per_segment = 5;
        std::size_t retry_backoff_factor = 2;
        std::chrono::steady_clock::duration retry_default_timeout = std::chrono::seconds(2);

        // Files smaller than this are fetched in one segment.
        std::uint64_t min_segment_size = 1024 * 1024;

        bool validate_checksum = true;
        bool verify_pieces = true;
        // CompletedUnverified files count as success.
        bool accept_unverified = false;
        // The first failed file cancels the whole run.
        bool failfast = false;
        // Reuse what is already on disk.
        bool resume = true;

        std::string user_agent;
        std::vector<std::string> additional_httpheaders;
        proxy_map_type proxy_map;

        void set_verbosity(int v);
        void set_log_level(spdlog::level::level_enum);

        Context();
    };

    METALOADER_API std::string default_user_agent();
}

#endif
