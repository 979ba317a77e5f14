#include <spdlog/spdlog.h>

#include <metaloader/retry.hpp>

namespace metaloader
{
    RetryController::RetryController(const Context& ctx)
        : m_ctx(ctx)
    {
    }

    void RetryController::on_start(Segment& segment,
                                   std::shared_ptr<Mirror> mirror,
                                   bool holds_connection) const
    {
        segment.state = SegmentState::kINFLIGHT;
        segment.attempts++;
        segment.bytes_written = 0;
        segment.tried_mirrors.insert(mirror->id());
        segment.mirror = std::move(mirror);
        segment.holds_connection = holds_connection;
    }

    bool RetryController::attempts_exhausted(const Segment& segment) const
    {
        return segment.attempts >= m_ctx.max_attempts_per_segment;
    }

    void RetryController::release(Segment& segment, bool judge, bool success) const
    {
        if (!segment.mirror || !segment.holds_connection)
            return;
        segment.holds_connection = false;
        if (judge)
            segment.mirror->update_statistics(success);
        else
            segment.mirror->release_connection();
    }

    bool RetryController::on_success(Segment& segment) const
    {
        if (segment.state == SegmentState::kCOMPLETED)
            return false;

        release(segment, true, true);
        segment.state = SegmentState::kCOMPLETED;
        segment.last_error.reset();
        return true;
    }

    std::chrono::steady_clock::duration RetryController::backoff(std::size_t attempts) const
    {
        auto delay = m_ctx.retry_default_timeout;
        for (std::size_t i = 1; i < attempts; ++i)
            delay *= m_ctx.retry_backoff_factor;
        return delay;
    }

    RetryAction RetryController::on_failure(Segment& segment, const DownloaderError& error) const
    {
        segment.last_error = error;

        if (error.code == ErrorCode::ML_INTERRUPTED)
        {
            // cancelled attempts do not count
            release(segment, false, false);
            if (segment.attempts > 0)
                segment.attempts--;
            segment.state = SegmentState::kPENDING;
            return RetryAction::kREQUEUE;
        }

        if (error.code == ErrorCode::ML_IO || error.is_fatal())
        {
            release(segment, false, false);
            segment.state = SegmentState::kFAILED;
            return RetryAction::kFAIL;
        }

        const bool transient = error.is_transient();
        release(segment, transient, false);

        if (attempts_exhausted(segment))
        {
            spdlog::error("Segment {} failed after {} attempts: {}",
                          segment.index,
                          segment.attempts,
                          error.reason);
            segment.state = SegmentState::kFAILED;
            return RetryAction::kFAIL;
        }

        segment.state = SegmentState::kPENDING;
        if (transient)
        {
            segment.not_before = std::chrono::steady_clock::now() + backoff(segment.attempts);
            spdlog::info("Retrying segment {} (attempt {} failed: {})",
                         segment.index,
                         segment.attempts,
                         error.reason);
            return RetryAction::kREQUEUE;
        }

        segment.not_before = std::chrono::steady_clock::now();
        spdlog::info("Not using {} anymore: {}",
                     segment.mirror ? segment.mirror->url() : std::string("mirror"),
                     error.reason);
        return RetryAction::kEXCLUDE_MIRROR_AND_REQUEUE;
    }

    FileStatus RetryController::failure_status(const DownloaderError& error)
    {
        if (error.code == ErrorCode::ML_IO)
            return FileStatus::kIO_ERROR;
        if (error.code == ErrorCode::ML_INTERRUPTED)
            return FileStatus::kCANCELLED;
        if (error.is_integrity_error())
            return FileStatus::kCHECKSUM_MISMATCH;
        return FileStatus::kINCOMPLETE_NO_MIRRORS;
    }
}
