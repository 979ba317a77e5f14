#ifndef METALOADER_MIRROR_HPP
#define METALOADER_MIRROR_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <metaloader/export.hpp>
#include <metaloader/context.hpp>
#include <metaloader/enums.hpp>
#include <metaloader/metalink.hpp>
#include <metaloader/mirrorid.hpp>

namespace metaloader
{
    struct MirrorStats
    {
        // Maximum number of allowed parallel connections to this mirror. -1 means no
        // limit.
        long allowed_parallel_connections = -1;

        // The maximum number of tried parallel connections to this mirror
        // (including unsuccessful).
        int max_tried_parallel_connections = 0;

        // How many transfers from this mirror are currently in progress.
        int running_transfers = 0;

        // How many transfers was finished successfully from the mirror.
        int successful_transfers = 0;

        // How many transfers failed with a transient error.
        int failed_transfers = 0;

    };

    // A resource of one file, with the statistics collected while fetching from it.
    // Statistics are updated by several workers and guarded by the mirror's own mutex.
    class METALOADER_API Mirror
    {
    public:
        Mirror(const Context& ctx, const Resource& resource);
        ~Mirror();

        Mirror(const Mirror&) = delete;
        Mirror& operator=(const Mirror&) = delete;
        Mirror(Mirror&&) = delete;
        Mirror& operator=(Mirror&&) = delete;

        // Identifier used to compare mirror instances.
        const MirrorID& id() const
        {
            return m_id;
        }

        const std::string& url() const
        {
            return m_resource.url;
        }

        Protocol protocol() const
        {
            return m_resource.protocol;
        }

        const Resource& resource() const
        {
            return m_resource;
        }

        // Snapshot of the statistics at the time of the call.
        MirrorStats stats() const;

        bool need_wait_for_retry() const;

        // Reserves a connection slot, false if the mirror is at its connection limit.
        bool try_acquire_connection();
        // Gives a slot back without judging the mirror (cancelled or refused transfer).
        void release_connection();

        // Gives a slot back and records the outcome of the transfer.
        void update_statistics(bool transfer_success);

        // True once the mirror failed `allowed_failures` times without a single success.
        bool is_failure_budget_exhausted(int allowed_failures) const;

        RangeSupport range_support() const;
        void set_range_support(RangeSupport value);

        static MirrorID id(const std::string& url)
        {
            return MirrorID(fmt::format("Mirror[{}]", url));
        }

    private:
        const Resource m_resource;
        const MirrorID m_id;

        mutable std::mutex m_mutex;
        MirrorStats m_stats;
        RangeSupport m_range_support = RangeSupport::kUNKNOWN;

        // retry & backoff values
        std::chrono::steady_clock::time_point m_next_retry;

        // first retry should wait for how long?
        std::chrono::steady_clock::duration m_retry_wait_seconds = std::chrono::milliseconds(200);

        // backoff factor for retry
        std::size_t m_retry_backoff_factor = 2;

        // count number of retries (this is not the same as failed transfers, as mutiple
        // transfers can be started at the same time, but should all be retried only once)
        std::size_t m_retry_counter = 0;
    };

    using mirror_set = std::vector<std::shared_ptr<Mirror>>;

    // One Mirror per resource, in (priority, declared order).
    METALOADER_API mirror_set make_mirrors(const Context& ctx,
                                           const std::vector<Resource>& ranked_resources);
}

#endif
