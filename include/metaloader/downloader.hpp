#ifndef METALOADER_DOWNLOADER_HPP
#define METALOADER_DOWNLOADER_HPP

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <metaloader/export.hpp>
#include <metaloader/context.hpp>
#include <metaloader/download_plan.hpp>
#include <metaloader/metalink.hpp>
#include <metaloader/result.hpp>
#include <metaloader/run_context.hpp>
#include <metaloader/storage.hpp>
#include <metaloader/target.hpp>
#include <metaloader/transport.hpp>

namespace metaloader
{
    namespace fs = std::filesystem;

    /** Runs a download plan on a fixed pool of `max_parallel_downloads` worker threads.
     *
     * Workers visit the files round-robin and take whatever work a file offers: its
     * preparation, the fetch of a ready segment, or its final verification. A worker with
     * nothing to do sleeps until another worker finished something or the earliest retry
     * deadline passed.
     */
    class METALOADER_API Downloader
    {
    public:
        // Uses curl and the local file system.
        explicit Downloader(const Context& ctx);
        Downloader(const Context& ctx, Transport& transport, Storage& storage);
        ~Downloader();

        Downloader(const Downloader&) = delete;
        Downloader& operator=(const Downloader&) = delete;

        // Blocks until every file of `plan` has its terminal result.
        RunReport download(const DownloadPlan& plan, RunContext& run);

        // Plans `metalink` under `destination_dir` (reusing what is on disk) and runs it.
        RunReport download(const Metalink& metalink,
                           const fs::path& destination_dir,
                           RunContext& run);

    private:
        void worker(std::vector<std::unique_ptr<FileTarget>>& targets);
        void signal();

        const Context& m_ctx;
        std::unique_ptr<Transport> m_owned_transport;
        std::unique_ptr<Storage> m_owned_storage;
        Transport& m_transport;
        Storage& m_storage;

        std::mutex m_mutex;
        std::condition_variable m_cv;
        std::size_t m_generation = 0;
        std::size_t m_next_target = 0;
    };
}

#endif
