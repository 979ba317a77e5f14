#include <algorithm>

#include <spdlog/fmt/fmt.h>

#include <metaloader/mirror.hpp>

namespace metaloader
{
    Mirror::Mirror(const Context& ctx, const Resource& resource)
        : m_resource(resource)
        , m_id(Mirror::id(resource.url))
        , m_retry_backoff_factor(ctx.retry_backoff_factor)
    {
        long allowed = ctx.max_downloads_per_mirror > 0 ? ctx.max_downloads_per_mirror : -1;
        if (resource.max_connections)
        {
            const long hint = static_cast<long>(*resource.max_connections);
            allowed = allowed > 0 ? std::min(allowed, hint) : hint;
        }
        m_stats.allowed_parallel_connections = allowed;

        // curl honors byte ranges itself for local files and FTP
        if (resource.protocol == Protocol::kFILE || resource.protocol == Protocol::kFTP)
        {
            m_range_support = RangeSupport::kSUPPORTED;
        }
    }

    Mirror::~Mirror() = default;

    MirrorStats Mirror::stats() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stats;
    }

    bool Mirror::need_wait_for_retry() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_retry_counter != 0 && m_next_retry > std::chrono::steady_clock::now();
    }

    bool Mirror::try_acquire_connection()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stats.allowed_parallel_connections != -1
            && m_stats.running_transfers >= m_stats.allowed_parallel_connections)
        {
            return false;
        }

        m_stats.running_transfers++;
        if (m_stats.max_tried_parallel_connections < m_stats.running_transfers)
        {
            m_stats.max_tried_parallel_connections = m_stats.running_transfers;
        }
        return true;
    }

    void Mirror::release_connection()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stats.running_transfers > 0)
            m_stats.running_transfers--;
    }

    void Mirror::update_statistics(bool transfer_success)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stats.running_transfers > 0)
            m_stats.running_transfers--;

        if (transfer_success)
        {
            m_stats.successful_transfers++;
        }
        else
        {
            m_stats.failed_transfers++;
            const auto now = std::chrono::steady_clock::now();
            if (m_stats.failed_transfers == 1 || m_next_retry < now)
            {
                m_retry_counter++;
                m_retry_wait_seconds = m_retry_wait_seconds * m_retry_backoff_factor;
                m_next_retry = now + m_retry_wait_seconds;
            }
        }
    }

    bool Mirror::is_failure_budget_exhausted(int allowed_failures) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return allowed_failures > 0 && m_stats.successful_transfers == 0
               && m_stats.failed_transfers >= allowed_failures;
    }

    RangeSupport Mirror::range_support() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_range_support;
    }

    void Mirror::set_range_support(RangeSupport value)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_range_support != value)
        {
            spdlog::info("Mirror {} {} byte ranges",
                         m_resource.url,
                         value == RangeSupport::kUNSUPPORTED ? "does not support" : "supports");
        }
        m_range_support = value;
    }

    mirror_set make_mirrors(const Context& ctx, const std::vector<Resource>& ranked_resources)
    {
        mirror_set mirrors;
        for (const auto& resource : ranked_resources)
        {
            const auto new_id = Mirror::id(resource.url);
            bool duplicate = false;
            for (const auto& mirror : mirrors)
                duplicate = duplicate || mirror->id() == new_id;
            if (duplicate)
            {
                spdlog::debug("Ignoring duplicate url {}", resource.url);
                continue;
            }
            mirrors.push_back(std::make_shared<Mirror>(ctx, resource));
        }
        return mirrors;
    }
}
