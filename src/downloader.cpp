#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

#include <metaloader/curl.hpp>
#include <metaloader/downloader.hpp>

namespace metaloader
{
    namespace
    {
        // Upper bound of an idle wait, so that a cancellation is noticed without a signal.
        constexpr auto idle_poll_interval = std::chrono::milliseconds(100);
    }

    Downloader::Downloader(const Context& ctx)
        : m_ctx(ctx)
        , m_owned_transport(std::make_unique<CurlTransport>(ctx))
        , m_owned_storage(std::make_unique<FileStorage>())
        , m_transport(*m_owned_transport)
        , m_storage(*m_owned_storage)
    {
    }

    Downloader::Downloader(const Context& ctx, Transport& transport, Storage& storage)
        : m_ctx(ctx)
        , m_transport(transport)
        , m_storage(storage)
    {
    }

    Downloader::~Downloader() = default;

    void Downloader::signal()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_generation;
        }
        m_cv.notify_all();
    }

    void Downloader::worker(std::vector<std::unique_ptr<FileTarget>>& targets)
    {
        const std::size_t count = targets.size();
        while (true)
        {
            std::size_t generation;
            std::size_t start;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                generation = m_generation;
                start = m_next_target;
                m_next_target = (m_next_target + 1) % std::max<std::size_t>(count, 1);
            }

            std::optional<std::chrono::steady_clock::time_point> wake_at;
            std::size_t done = 0;
            bool worked = false;

            for (std::size_t i = 0; i < count && !worked; ++i)
            {
                FileTarget& target = *targets[(start + i) % count];
                Assignment assignment;

                switch (target.next(assignment, wake_at))
                {
                    case PollResult::kDONE:
                        ++done;
                        break;
                    case PollResult::kWAIT:
                        break;
                    case PollResult::kPREPARE:
                        target.prepare();
                        worked = true;
                        break;
                    case PollResult::kFETCH:
                        target.fetch(assignment);
                        worked = true;
                        break;
                    case PollResult::kVERIFY:
                        target.verify();
                        worked = true;
                        break;
                }
            }

            if (worked)
            {
                signal();
                continue;
            }

            if (done == count)
            {
                signal();
                return;
            }

            auto deadline = std::chrono::steady_clock::now() + idle_poll_interval;
            if (wake_at && *wake_at < deadline)
                deadline = *wake_at;

            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_until(lock, deadline, [&] { return m_generation != generation; });
        }
    }

    RunReport Downloader::download(const DownloadPlan& plan, RunContext& run)
    {
        std::vector<std::unique_ptr<FileTarget>> targets;
        for (const auto& file : plan.files)
        {
            targets.push_back(
                std::make_unique<FileTarget>(m_ctx, run, m_transport, m_storage, file));
        }

        if (!targets.empty())
        {
            const std::size_t n_workers
                = static_cast<std::size_t>(std::max(m_ctx.max_parallel_downloads, 1L));
            spdlog::info("Downloading {} file(s) with {} worker(s)", targets.size(), n_workers);

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_next_target = 0;
            }

            std::vector<std::thread> workers;
            workers.reserve(n_workers);
            for (std::size_t i = 0; i < n_workers; ++i)
                workers.emplace_back([this, &targets] { worker(targets); });
            for (auto& t : workers)
                t.join();
        }

        RunReport report;
        for (const auto& target : targets)
            report.results.push_back(target->result());

        spdlog::info("Transferred {} in total", format_bytes(report.bytes_transferred()));
        return report;
    }

    RunReport Downloader::download(const Metalink& metalink,
                                   const fs::path& destination_dir,
                                   RunContext& run)
    {
        auto plan = DownloadPlan::from_metalink(metalink, destination_dir);
        plan.minimize(m_ctx);
        return download(plan, run);
    }
}
