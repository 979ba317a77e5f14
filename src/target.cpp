#include <algorithm>
#include <functional>

#include <spdlog/spdlog.h>

#include <metaloader/target.hpp>

namespace metaloader
{
    namespace
    {
        // Writes the parts of a response body that fall in the segments of an assignment.
        // The body either starts at the segment offset (range honored) or at the beginning
        // of the file. A whole stream answering a ranged request also takes over the other
        // Pending segments of the file, so the mirror serves the file in one transfer.
        class SegmentSink : public FetchSink
        {
        public:
            using claim_callback = std::function<std::vector<SegmentSlot>()>;

            SegmentSink(StorageHandle& storage,
                        const Assignment& assignment,
                        claim_callback claim,
                        ProgressObserver* observer,
                        const std::string& file,
                        std::atomic<std::uint64_t>& transferred)
                : m_storage(storage)
                , m_assignment(assignment)
                , m_claim(std::move(claim))
                , m_observer(observer)
                , m_file(file)
                , m_transferred(transferred)
                , m_slots(assignment.slots)
            {
            }

            bool on_response(const FetchResponse& response) override
            {
                const auto& mirror = m_assignment.mirror;
                if (m_assignment.request.range && response.range_honored)
                {
                    m_body_start = m_assignment.offset;
                    mirror->set_range_support(RangeSupport::kSUPPORTED);
                }
                else
                {
                    m_body_start = 0;
                    m_whole_stream = true;
                    if (m_assignment.request.range)
                    {
                        mirror->set_range_support(RangeSupport::kUNSUPPORTED);
                        auto claimed = m_claim();
                        m_slots.insert(m_slots.end(), claimed.begin(), claimed.end());
                    }
                }

                const bool http = response.http_status == 200 || response.http_status == 206;
                if (http && response.content_length)
                {
                    std::optional<std::uint64_t> expected
                        = m_whole_stream ? m_assignment.file_size : m_assignment.length;
                    if (expected && *response.content_length != *expected)
                    {
                        m_error = DownloaderError{
                            ErrorLevel::INFO,
                            ErrorCode::ML_MALFORMED_RESPONSE,
                            fmt::format("Server reports Content-Length: {} but expected size is: {}",
                                        *response.content_length,
                                        *expected)
                        };
                        return false;
                    }
                }
                return true;
            }

            bool on_data(const char* buffer, std::size_t size) override
            {
                m_transferred += size;
                if (m_observer)
                    m_observer->on_bytes(m_file, size);

                const std::uint64_t chunk_start = m_body_start + m_received;
                const std::uint64_t chunk_end = chunk_start + size;
                m_received += size;

                bool all_written = true;
                std::uint64_t last_end = 0;
                for (auto& slot : m_slots)
                {
                    const auto slot_end = slot.length ? std::optional<std::uint64_t>(
                                              slot.offset + *slot.length)
                                                      : std::nullopt;
                    const std::uint64_t start = std::max(chunk_start, slot.offset);
                    const std::uint64_t stop = slot_end ? std::min(chunk_end, *slot_end) : chunk_end;
                    if (start < stop)
                    {
                        auto res = m_storage.write_at(start,
                                                      buffer + (start - chunk_start),
                                                      static_cast<std::size_t>(stop - start));
                        if (!res)
                        {
                            m_error = res.error();
                            return false;
                        }
                        slot.written += stop - start;
                    }

                    if (!slot.is_complete())
                        all_written = false;
                    else
                        last_end = std::max(last_end, *slot_end);
                }

                if (all_written)
                {
                    m_all_written = true;
                    // The wanted byte ranges are over
                    if (m_whole_stream || chunk_end > last_end)
                        return false;
                }
                return true;
            }

            const std::vector<SegmentSlot>& slots() const
            {
                return m_slots;
            }

            bool all_written() const
            {
                return m_all_written;
            }

            const std::optional<DownloaderError>& error() const
            {
                return m_error;
            }

        private:
            StorageHandle& m_storage;
            const Assignment& m_assignment;
            claim_callback m_claim;
            ProgressObserver* m_observer;
            const std::string& m_file;
            std::atomic<std::uint64_t>& m_transferred;

            std::vector<SegmentSlot> m_slots;
            // File offset of the first byte of the body.
            std::uint64_t m_body_start = 0;
            std::uint64_t m_received = 0;
            bool m_whole_stream = false;
            bool m_all_written = false;
            std::optional<DownloaderError> m_error;
        };

        DownloaderError cancelled_error(const std::string& name)
        {
            return DownloaderError{ ErrorLevel::INFO,
                                    ErrorCode::ML_INTERRUPTED,
                                    fmt::format("Download of {} was cancelled", name) };
        }
    }

    FileTarget::FileTarget(const Context& ctx,
                           RunContext& run,
                           Transport& transport,
                           Storage& storage,
                           FilePlan plan)
        : m_ctx(ctx)
        , m_run(run)
        , m_transport(transport)
        , m_storage(storage)
        , m_plan(std::move(plan))
        , m_selector(ctx)
        , m_retry(ctx)
        , m_verifier(ctx)
        , m_planner(ctx)
        , m_mirrors(make_mirrors(ctx, m_plan.resources))
    {
        m_result.name = m_plan.entry.name;
        m_result.destination = m_plan.destination;
        m_result.total_bytes = m_plan.entry.size;
    }

    FileTarget::~FileTarget() = default;

    const std::string& FileTarget::name() const
    {
        return m_plan.entry.name;
    }

    bool FileTarget::is_done() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state == TargetState::kDONE;
    }

    TargetState FileTarget::state() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }

    DownloadResult FileTarget::result() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_result;
    }

    std::vector<Segment> FileTarget::segments() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_segments;
    }

    PollResult FileTarget::next(Assignment& assignment,
                                std::optional<std::chrono::steady_clock::time_point>& wake_at)
    {
        PollResult result;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            result = next_locked(assignment, wake_at);
        }
        deliver_events();
        return result;
    }

    PollResult FileTarget::next_locked(Assignment& assignment,
                                       std::optional<std::chrono::steady_clock::time_point>& wake_at)
    {
        switch (m_state)
        {
            case TargetState::kDONE:
                return PollResult::kDONE;
            case TargetState::kNEW:
                if (m_plan.error)
                {
                    finish(FileStatus::kPLAN_ERROR, m_plan.error->to_downloader_error());
                    return PollResult::kDONE;
                }
                if (m_run.token.is_cancelled())
                {
                    finish(FileStatus::kCANCELLED, cancelled_error(name()));
                    return PollResult::kDONE;
                }
                if (m_plan.already_verified)
                {
                    std::error_code ec;
                    const auto on_disk = fs::file_size(m_plan.destination, ec);
                    m_size = ec ? m_plan.entry.size : std::optional<std::uint64_t>(on_disk);
                    finish(FileStatus::kVERIFIED, std::nullopt);
                    return PollResult::kDONE;
                }
                m_state = TargetState::kPREPARING;
                return PollResult::kPREPARE;
            case TargetState::kPREPARING:
            case TargetState::kVERIFYING:
                return PollResult::kWAIT;
            case TargetState::kRUNNING:
                break;
        }

        if (m_inflight == 0)
        {
            if (m_run.token.is_cancelled())
            {
                finish(FileStatus::kCANCELLED, cancelled_error(name()));
                return PollResult::kDONE;
            }
            if (m_failure)
            {
                finish(RetryController::failure_status(*m_failure), m_failure);
                return PollResult::kDONE;
            }
            if (std::all_of(m_segments.begin(),
                            m_segments.end(),
                            [](const Segment& s) { return s.state == SegmentState::kCOMPLETED; }))
            {
                m_state = TargetState::kVERIFYING;
                return PollResult::kVERIFY;
            }
        }

        // no new transfer once the file is doomed
        if (m_failure || m_run.token.is_cancelled())
            return PollResult::kWAIT;

        const auto now = std::chrono::steady_clock::now();
        for (auto& segment : m_segments)
        {
            if (segment.state != SegmentState::kPENDING)
                continue;

            if (!segment.is_ready(now))
            {
                if (!wake_at || segment.not_before < *wake_at)
                    wake_at = segment.not_before;
                continue;
            }

            const bool partial = segment.is_partial(m_size);
            tl::expected<std::shared_ptr<Mirror>, DownloaderError> selected;
            if (m_retry.attempts_exhausted(segment))
            {
                selected = tl::unexpected(
                    DownloaderError{ ErrorLevel::SERIOUS,
                                     ErrorCode::ML_NOURL,
                                     fmt::format("No attempt left for segment {}", segment.index) });
            }
            else
            {
                selected = m_selector.select(m_mirrors, m_excluded, segment, partial);
            }
            if (!selected)
            {
                fail_segment(segment,
                             segment.last_error ? *segment.last_error : selected.error());
                notify_segment(segment);
                if (m_inflight == 0)
                {
                    finish(RetryController::failure_status(*m_failure), m_failure);
                    return PollResult::kDONE;
                }
                return PollResult::kWAIT;
            }

            if (!selected.value())
            {
                // every candidate is busy
                continue;
            }

            auto mirror = std::move(selected.value());
            m_retry.on_start(segment, mirror);
            ++m_inflight;
            m_last_mirror = mirror->url();

            assignment = Assignment{};
            assignment.segment = segment.index;
            assignment.mirror = mirror;
            assignment.offset = segment.offset;
            assignment.length = segment.length;
            assignment.file_size = m_size;
            assignment.request.url = mirror->url();
            assignment.slots.push_back(SegmentSlot{ segment.index, segment.offset, segment.length });
            notify_segment(segment);
            if (partial)
            {
                if (mirror->range_support() != RangeSupport::kUNSUPPORTED)
                {
                    assignment.request.range
                        = ByteRange{ segment.offset, segment.offset + *segment.length - 1 };
                }
                else
                {
                    // the stream starts at the beginning of the file
                    auto claimed = claim_pending_segments(mirror, segment.index);
                    assignment.slots.insert(assignment.slots.end(), claimed.begin(), claimed.end());
                }
            }
            return PollResult::kFETCH;
        }

        return PollResult::kWAIT;
    }

    void FileTarget::prepare()
    {
        open_and_plan();
        deliver_events();
    }

    void FileTarget::verify()
    {
        verify_file();
        deliver_events();
    }

    void FileTarget::open_and_plan()
    {
        auto handle = m_storage.open(m_plan.destination);
        if (!handle)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            finish(FileStatus::kIO_ERROR, handle.error());
            return;
        }

        std::optional<std::uint64_t> size = m_plan.entry.size;
        bool ranges_supported = true;
        if (!size && !m_mirrors.empty())
        {
            // only the best mirror is asked, any other will be asked for the body anyway
            const auto& best = m_mirrors.front();
            auto probe = m_transport.probe(best->url(), m_run.token);
            if (probe)
            {
                size = probe->size;
                ranges_supported = probe->ranges_supported;
                best->set_range_support(ranges_supported ? RangeSupport::kSUPPORTED
                                                         : RangeSupport::kUNSUPPORTED);
            }
            else
            {
                spdlog::warn("Could not probe {}: {}", best->url(), probe.error().reason);
            }
        }

        auto planned = m_planner.plan(size, m_plan.entry.pieces, ranges_supported);

        std::lock_guard<std::mutex> lock(m_mutex);
        m_handle = std::move(handle.value());
        if (!planned)
        {
            finish(FileStatus::kPLAN_ERROR, planned.error().to_downloader_error());
            return;
        }

        m_size = size;
        m_result.total_bytes = size;
        m_segments = std::move(planned.value());
        if (m_plan.entry.pieces)
            m_verified_pieces.assign(m_plan.entry.pieces->hashes.size(), false);

        for (const auto piece : m_plan.completed_pieces)
        {
            for (auto& segment : m_segments)
            {
                if (segment.piece && *segment.piece == piece)
                {
                    segment.state = SegmentState::kCOMPLETED;
                    segment.bytes_written = segment.length.value_or(0);
                    m_verified_pieces[piece] = true;
                }
            }
        }

        spdlog::info("{}: {} segment(s) of {}",
                     name(),
                     m_segments.size(),
                     size ? format_bytes(*size) : std::string("unknown size"));
        m_state = TargetState::kRUNNING;
    }

    FileTarget::FetchOutcome FileTarget::transfer(const Assignment& assignment)
    {
        SegmentSink sink(
            *m_handle,
            assignment,
            [this, &assignment]()
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                return claim_pending_segments(assignment.mirror, assignment.segment);
            },
            m_run.observer,
            m_plan.entry.name,
            m_bytes_transferred);

        auto response = m_transport.fetch(assignment.request, sink, m_run.token);

        FetchOutcome outcome;
        outcome.slots = sink.slots();
        if (sink.error())
            outcome.error = sink.error();
        else if (!response && !sink.all_written())
            outcome.error = response.error();
        return outcome;
    }

    std::vector<SegmentSlot> FileTarget::claim_pending_segments(const std::shared_ptr<Mirror>& mirror,
                                                                std::size_t except)
    {
        std::vector<SegmentSlot> claimed;
        if (m_state != TargetState::kRUNNING || m_failure || m_run.token.is_cancelled())
            return claimed;

        if (m_excluded.count(mirror->id()))
            return claimed;

        for (auto& segment : m_segments)
        {
            if (segment.index == except || segment.state != SegmentState::kPENDING
                || m_retry.attempts_exhausted(segment))
            {
                continue;
            }
            m_retry.on_start(segment, mirror, false);
            claimed.push_back(SegmentSlot{ segment.index, segment.offset, segment.length });
            notify_segment(segment);
        }

        if (!claimed.empty())
        {
            spdlog::info("{}: {} serves {} more segment(s) in the same stream",
                         name(),
                         mirror->url(),
                         claimed.size());
        }
        return claimed;
    }

    tl::expected<std::vector<std::size_t>, DownloaderError> FileTarget::verify_segment_pieces(
        std::uint64_t offset, std::uint64_t length, std::uint64_t file_size)
    {
        std::vector<std::size_t> verified;
        const auto& pieces = m_plan.entry.pieces;
        if (!pieces || !m_verifier.can_verify_pieces(*pieces))
            return verified;

        if (pieces->hashes.size() != pieces->expected_count(file_size))
        {
            spdlog::warn("Piece hashes of {} do not cover its {} bytes, pieces are not verified",
                         name(),
                         file_size);
            return verified;
        }

        const std::uint64_t end = offset + length;
        for (std::size_t i = static_cast<std::size_t>(offset / pieces->length);
             i < pieces->hashes.size();
             ++i)
        {
            auto [piece_start, piece_end] = pieces->range(i, file_size);
            if (piece_start >= end)
                break;
            if (piece_start < offset || piece_end > end)
                continue;

            auto res = m_verifier.verify_piece(*m_handle, *pieces, i, file_size);
            if (!res)
                return tl::unexpected(res.error());
            if (res.value())
                verified.push_back(i);
        }
        return verified;
    }

    void FileTarget::fetch(const Assignment& assignment)
    {
        auto outcome = transfer(assignment);
        if (outcome.error && outcome.error->code != ErrorCode::ML_INTERRUPTED)
            spdlog::warn("{}", outcome.error->reason);

        // per segment: the error, or the pieces verified
        std::vector<std::optional<DownloaderError>> errors(outcome.slots.size());
        std::vector<std::vector<std::size_t>> verified_pieces(outcome.slots.size());
        for (std::size_t i = 0; i < outcome.slots.size(); ++i)
        {
            const auto& slot = outcome.slots[i];
            if (slot.length ? !slot.is_complete() : outcome.error.has_value())
            {
                if (outcome.error)
                {
                    errors[i] = outcome.error;
                    continue;
                }
                errors[i] = DownloaderError{ ErrorLevel::SERIOUS,
                                             ErrorCode::ML_CONNECTION_RESET,
                                             fmt::format("Received {} of {} bytes of segment {} from {}",
                                                         slot.written,
                                                         *slot.length,
                                                         slot.segment,
                                                         assignment.mirror->url()) };
                spdlog::warn("{}", errors[i]->reason);
                continue;
            }

            const std::uint64_t length = slot.length.value_or(slot.written);
            const std::uint64_t file_size = assignment.file_size.value_or(slot.written);
            auto verified = verify_segment_pieces(slot.offset, length, file_size);
            if (verified)
            {
                verified_pieces[i] = std::move(verified.value());
            }
            else
            {
                errors[i] = verified.error();
                spdlog::warn("{}", verified.error().reason);
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_inflight;
            for (std::size_t i = 0; i < outcome.slots.size(); ++i)
                apply_outcome(outcome.slots[i], errors[i], verified_pieces[i], assignment);
        }
        deliver_events();
    }

    void FileTarget::apply_outcome(const SegmentSlot& slot,
                                   const std::optional<DownloaderError>& error,
                                   const std::vector<std::size_t>& verified_pieces,
                                   const Assignment& assignment)
    {
        Segment& segment = m_segments[slot.segment];
        segment.bytes_written = slot.written;

        if (!error)
        {
            if (!segment.length)
            {
                // the stream ended: now the size is known
                segment.length = slot.written;
                m_size = slot.written;
                m_result.total_bytes = m_size;
            }
            if (m_retry.on_success(segment))
            {
                m_served_by.insert(assignment.mirror->id());
                for (const auto i : verified_pieces)
                    m_verified_pieces[i] = true;
            }
            notify_segment(segment);
            return;
        }

        switch (m_retry.on_failure(segment, *error))
        {
            case RetryAction::kREQUEUE:
                break;
            case RetryAction::kEXCLUDE_MIRROR_AND_REQUEUE:
                m_excluded.insert(assignment.mirror->id());
                if (!m_selector.has_candidate(m_mirrors, m_excluded))
                    fail_segment(segment, *error);
                break;
            case RetryAction::kFAIL:
                fail_segment(segment, *error);
                break;
        }
        notify_segment(segment);
    }

    void FileTarget::verify_file()
    {
        std::optional<std::uint64_t> size;
        bool all_pieces_verified = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            size = m_size;
            all_pieces_verified = all_pieces_verified_locked();
        }

        const std::uint64_t file_size = size.value_or(0);

        // drop whatever an older, longer file left behind
        auto truncated = m_handle->truncate(file_size);
        if (!truncated)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            finish(FileStatus::kIO_ERROR, truncated.error());
            return;
        }

        auto status = m_verifier.verify_file(*m_handle, m_plan.entry, file_size, all_pieces_verified);

        std::lock_guard<std::mutex> lock(m_mutex);
        if (!status)
        {
            finish(FileStatus::kIO_ERROR, status.error());
            return;
        }

        if (status.value() != FileStatus::kCHECKSUM_MISMATCH)
        {
            finish(status.value(), std::nullopt);
            return;
        }

        DownloaderError error{ ErrorLevel::SERIOUS,
                               ErrorCode::ML_CHECKSUM_MISMATCH,
                               fmt::format("Checksum of {} does not match", name()) };

        // no mirror that served this content is trusted for this file anymore
        for (const auto& id : m_served_by)
            m_excluded.insert(id);
        m_served_by.clear();

        const bool attempts_left = std::none_of(m_segments.begin(),
                                                m_segments.end(),
                                                [this](const Segment& s)
                                                { return m_retry.attempts_exhausted(s); });
        if (!attempts_left || !m_selector.has_candidate(m_mirrors, m_excluded))
        {
            finish(FileStatus::kCHECKSUM_MISMATCH, error);
            return;
        }

        spdlog::warn("{}, fetching it again from other mirrors", error.reason);
        const auto now = std::chrono::steady_clock::now();
        for (auto& segment : m_segments)
        {
            segment.state = SegmentState::kPENDING;
            segment.last_error = error;
            segment.bytes_written = 0;
            segment.not_before = now;
        }
        std::fill(m_verified_pieces.begin(), m_verified_pieces.end(), false);
        m_state = TargetState::kRUNNING;
    }

    void FileTarget::fail_segment(Segment& segment, const DownloaderError& error)
    {
        segment.state = SegmentState::kFAILED;
        segment.last_error = error;
        if (!m_failure)
            m_failure = error;
    }

    void FileTarget::notify_segment(const Segment& segment)
    {
        if (!m_run.observer)
            return;

        SegmentEvent event;
        event.file = name();
        event.segment = segment.index;
        event.state = segment.state;
        if (segment.mirror)
            event.mirror = segment.mirror->url();
        event.attempt = segment.attempts;
        m_events.push_back(std::move(event));
    }

    void FileTarget::deliver_events()
    {
        if (!m_run.observer)
            return;

        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_delivering)
        {
            // the worker delivering now picks these up
            return;
        }
        m_delivering = true;
        while (!m_events.empty() || m_finished_event)
        {
            std::vector<SegmentEvent> events;
            events.swap(m_events);
            std::optional<DownloadResult> finished;
            finished.swap(m_finished_event);

            lock.unlock();
            for (const auto& event : events)
                m_run.observer->on_segment_state(event);
            if (finished)
                m_run.observer->on_file_finished(*finished);
            lock.lock();
        }
        m_delivering = false;
    }

    std::uint64_t FileTarget::bytes_written_locked() const
    {
        if (m_plan.already_verified)
            return m_size.value_or(0);

        std::uint64_t total = 0;
        for (const auto& segment : m_segments)
            total += segment.bytes_written;
        return total;
    }

    bool FileTarget::all_pieces_verified_locked() const
    {
        return !m_verified_pieces.empty()
               && std::all_of(m_verified_pieces.begin(),
                              m_verified_pieces.end(),
                              [](bool v) { return v; });
    }

    void FileTarget::finish(FileStatus status, std::optional<DownloaderError> error)
    {
        m_state = TargetState::kDONE;

        if (m_handle)
        {
            auto finalized = m_handle->finalize();
            if (!finalized)
            {
                if (status == FileStatus::kVERIFIED || status == FileStatus::kCOMPLETED_UNVERIFIED)
                {
                    status = FileStatus::kIO_ERROR;
                    error = finalized.error();
                }
                else
                {
                    finalized.error().log();
                }
            }
            m_handle.reset();
        }

        m_result.status = status;
        m_result.last_mirror = m_last_mirror;
        m_result.bytes_written = bytes_written_locked();
        if (m_size)
            m_result.total_bytes = m_size;
        m_result.bytes_transferred = m_bytes_transferred.load();
        m_result.error = std::move(error);

        if (m_result.is_success(true))
        {
            spdlog::info("{}: {}", name(), to_string(status));
        }
        else
        {
            spdlog::error("{}: {}{}",
                          name(),
                          to_string(status),
                          m_result.error ? fmt::format(" ({})", m_result.error->reason) : "");
        }

        if (m_run.observer)
            m_finished_event = m_result;

        if (m_ctx.failfast && status != FileStatus::kCANCELLED
            && !m_result.is_success(m_ctx.accept_unverified))
        {
            spdlog::error("Cancelling the remaining downloads");
            m_run.token.cancel();
        }
    }
}
