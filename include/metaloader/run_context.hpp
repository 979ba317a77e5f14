#ifndef METALOADER_RUN_CONTEXT_HPP
#define METALOADER_RUN_CONTEXT_HPP

#include <atomic>

#include <metaloader/result.hpp>

namespace metaloader
{
    // Cooperative cancellation flag, polled by transfers and workers.
    class CancellationToken
    {
    public:
        void cancel() noexcept
        {
            m_cancelled.store(true);
        }

        bool is_cancelled() const noexcept
        {
            return m_cancelled.load();
        }

    private:
        std::atomic<bool> m_cancelled{ false };
    };

    // State shared by every worker of one run, owned by the caller of the run.
    struct RunContext
    {
        CancellationToken token;
        // Optional, not owned.
        ProgressObserver* observer = nullptr;
    };
}

#endif
