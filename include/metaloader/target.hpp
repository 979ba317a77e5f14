#ifndef METALOADER_TARGET_HPP
#define METALOADER_TARGET_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <metaloader/export.hpp>
#include <metaloader/context.hpp>
#include <metaloader/download_plan.hpp>
#include <metaloader/mirror.hpp>
#include <metaloader/mirror_selector.hpp>
#include <metaloader/result.hpp>
#include <metaloader/retry.hpp>
#include <metaloader/run_context.hpp>
#include <metaloader/segment.hpp>
#include <metaloader/segment_planner.hpp>
#include <metaloader/storage.hpp>
#include <metaloader/transport.hpp>
#include <metaloader/utils.hpp>
#include <metaloader/verifier.hpp>

namespace metaloader
{
    enum class TargetState
    {
        // Nothing done yet, the first worker prepares the file.
        kNEW,
        // Storage is opened, the size probed and the segments planned.
        kPREPARING,
        // Segments are being fetched.
        kRUNNING,
        // Every segment is completed, the whole file is being checked.
        kVERIFYING,
        // The result is final.
        kDONE,
    };

    enum class PollResult
    {
        kFETCH,
        kPREPARE,
        kVERIFY,
        // Nothing to do right now.
        kWAIT,
        kDONE,
    };

    // A segment written by a transfer, with the bytes it received so far.
    struct SegmentSlot
    {
        std::size_t segment = 0;
        std::uint64_t offset = 0;
        std::optional<std::uint64_t> length;
        std::uint64_t written = 0;

        bool is_complete() const noexcept
        {
            return length && written >= *length;
        }
    };

    // One attempt of one segment, handed to a worker.
    struct Assignment
    {
        std::size_t segment = 0;
        // Segments written by the transfer, `segment` first. A whole stream from a mirror
        // without byte ranges also carries every other segment that was Pending.
        std::vector<SegmentSlot> slots;
        std::shared_ptr<Mirror> mirror;
        FetchRequest request;
        std::uint64_t offset = 0;
        std::optional<std::uint64_t> length;
        std::optional<std::uint64_t> file_size;
    };

    /** One file of a run: its mirrors, its segment queue and its storage.
     *
     * Workers call `next` to get work, then run it with `prepare`, `fetch` or `verify`
     * without holding the file lock. The segment queue, the exclusions and the result are
     * guarded by the file mutex; mirror statistics by the mirrors themselves.
     */
    class METALOADER_API FileTarget
    {
    public:
        FileTarget(const Context& ctx,
                   RunContext& run,
                   Transport& transport,
                   Storage& storage,
                   FilePlan plan);
        ~FileTarget();

        FileTarget(const FileTarget&) = delete;
        FileTarget& operator=(const FileTarget&) = delete;

        // Decides what the calling worker should do with this file. `wake_at` is lowered
        // to the earliest retry deadline when the answer is kWAIT.
        PollResult next(Assignment& assignment,
                        std::optional<std::chrono::steady_clock::time_point>& wake_at);

        void prepare();
        void fetch(const Assignment& assignment);
        void verify();

        bool is_done() const;
        TargetState state() const;
        const std::string& name() const;

        DownloadResult result() const;
        std::vector<Segment> segments() const;
        const mirror_set& mirrors() const
        {
            return m_mirrors;
        }

    private:
        struct FetchOutcome
        {
            std::vector<SegmentSlot> slots;
            std::optional<DownloaderError> error;
        };

        void open_and_plan();
        void verify_file();
        PollResult next_locked(Assignment& assignment,
                               std::optional<std::chrono::steady_clock::time_point>& wake_at);
        FetchOutcome transfer(const Assignment& assignment);
        // Called with m_mutex held, once per segment written by a finished transfer.
        void apply_outcome(const SegmentSlot& slot,
                           const std::optional<DownloaderError>& error,
                           const std::vector<std::size_t>& verified_pieces,
                           const Assignment& assignment);
        // Called with m_mutex held. Starts every other Pending segment on `mirror`, carried
        // by a stream from the beginning of the file.
        std::vector<SegmentSlot> claim_pending_segments(const std::shared_ptr<Mirror>& mirror,
                                                        std::size_t except);
        // Checks the pieces lying entirely in [offset, offset + length), returns the
        // indices of the verified ones.
        tl::expected<std::vector<std::size_t>, DownloaderError> verify_segment_pieces(
            std::uint64_t offset, std::uint64_t length, std::uint64_t file_size);

        // Hands the queued events to the observer, without holding m_mutex. Events reach the
        // observer in the order they were queued, one worker delivers at a time.
        void deliver_events();

        // Called with m_mutex held.
        void finish(FileStatus status, std::optional<DownloaderError> error);
        void fail_segment(Segment& segment, const DownloaderError& error);
        void notify_segment(const Segment& segment);
        std::uint64_t bytes_written_locked() const;
        bool all_pieces_verified_locked() const;

        const Context& m_ctx;
        RunContext& m_run;
        Transport& m_transport;
        Storage& m_storage;
        const FilePlan m_plan;

        MirrorSelector m_selector;
        RetryController m_retry;
        IntegrityVerifier m_verifier;
        SegmentPlanner m_planner;
        mirror_set m_mirrors;

        mutable std::mutex m_mutex;
        TargetState m_state = TargetState::kNEW;
        std::unique_ptr<StorageHandle> m_handle;
        std::optional<std::uint64_t> m_size;
        std::vector<Segment> m_segments;
        std::vector<bool> m_verified_pieces;
        std::set<MirrorID> m_excluded;
        // Mirrors that delivered at least one completed segment.
        std::set<MirrorID> m_served_by;
        std::size_t m_inflight = 0;
        std::optional<DownloaderError> m_failure;
        std::optional<std::string> m_last_mirror;
        DownloadResult m_result;

        std::vector<SegmentEvent> m_events;
        std::optional<DownloadResult> m_finished_event;
        bool m_delivering = false;

        std::atomic<std::uint64_t> m_bytes_transferred{ 0 };
    };
}

#endif
