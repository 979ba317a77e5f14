#ifndef METALOADER_RESULT_HPP
#define METALOADER_RESULT_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <metaloader/export.hpp>
#include <metaloader/enums.hpp>
#include <metaloader/errors.hpp>

namespace metaloader
{
    namespace fs = std::filesystem;

    METALOADER_API std::string_view to_string(FileStatus status);
    METALOADER_API std::string_view to_string(SegmentState state);

    // Terminal outcome of one file of the run.
    struct METALOADER_API DownloadResult
    {
        std::string name;
        fs::path destination;
        FileStatus status = FileStatus::kRUNNING;

        // Url of the last mirror that served (or failed to serve) a segment.
        std::optional<std::string> last_mirror;
        // Bytes of the file committed to storage when the result was produced.
        std::uint64_t bytes_written = 0;
        std::optional<std::uint64_t> total_bytes;
        // Bytes received from the network for this file, retries included.
        std::uint64_t bytes_transferred = 0;

        std::optional<DownloaderError> error;

        bool is_success(bool accept_unverified) const noexcept
        {
            return status == FileStatus::kVERIFIED
                   || (accept_unverified && status == FileStatus::kCOMPLETED_UNVERIFIED);
        }
    };

    struct SegmentEvent
    {
        std::string file;
        std::size_t segment = 0;
        SegmentState state = SegmentState::kPENDING;
        std::optional<std::string> mirror;
        std::size_t attempt = 0;
    };

    // Receives progress of a run. Called from worker threads, outside the file lock; the
    // events of one file arrive in order and `on_file_finished` comes last. Implementations
    // synchronize themselves and do not call back into the downloader.
    class METALOADER_API ProgressObserver
    {
    public:
        virtual ~ProgressObserver() = default;

        virtual void on_segment_state(const SegmentEvent& /*event*/)
        {
        }

        // `bytes` were received for `file` since the previous call.
        virtual void on_bytes(const std::string& /*file*/, std::uint64_t /*bytes*/)
        {
        }

        virtual void on_file_finished(const DownloadResult& /*result*/)
        {
        }
    };

    struct METALOADER_API RunReport
    {
        // One result per file, in descriptor order.
        std::vector<DownloadResult> results;

        bool success(bool accept_unverified = false) const;
        std::uint64_t bytes_transferred() const;
        const DownloadResult* find(std::string_view name) const;
    };
}

#endif
