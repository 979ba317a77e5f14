#ifndef METALOADER_RETRY_HPP
#define METALOADER_RETRY_HPP

#include <chrono>
#include <memory>

#include <metaloader/export.hpp>
#include <metaloader/context.hpp>
#include <metaloader/errors.hpp>
#include <metaloader/mirror.hpp>
#include <metaloader/segment.hpp>

namespace metaloader
{
    enum class RetryAction
    {
        // Segment is Pending again, possibly after a backoff delay.
        kREQUEUE,
        // Segment is Pending again, the mirror must not be used for this file anymore.
        kEXCLUDE_MIRROR_AND_REQUEUE,
        // Segment is Failed.
        kFAIL,
    };

    // State transitions of a segment and the statistics of the mirrors serving it.
    // Callers hold the lock of the file owning the segment.
    class METALOADER_API RetryController
    {
    public:
        explicit RetryController(const Context& ctx);

        // Pending -> InFlight. The connection of `mirror` is already reserved, by this
        // segment when `holds_connection` is set.
        void on_start(Segment& segment,
                      std::shared_ptr<Mirror> mirror,
                      bool holds_connection = true) const;

        // True when the segment may not be started again.
        bool attempts_exhausted(const Segment& segment) const;

        // InFlight -> Completed. Returns false (and changes nothing) when the segment was
        // already Completed.
        bool on_success(Segment& segment) const;

        // InFlight -> Pending or Failed.
        RetryAction on_failure(Segment& segment, const DownloaderError& error) const;

        // Delay before the attempt following attempt number `attempts`.
        std::chrono::steady_clock::duration backoff(std::size_t attempts) const;

        // Terminal status of a file whose segment failed with `error`.
        static FileStatus failure_status(const DownloaderError& error);

    private:
        void release(Segment& segment, bool judge, bool success) const;

        const Context& m_ctx;
    };
}

#endif
