#ifndef METALOADER_SEGMENT_HPP
#define METALOADER_SEGMENT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>

#include <metaloader/enums.hpp>
#include <metaloader/errors.hpp>
#include <metaloader/mirror.hpp>
#include <metaloader/mirrorid.hpp>

namespace metaloader
{
    // A contiguous byte range of a file, fetched and verified as one unit.
    struct Segment
    {
        std::size_t index = 0;
        std::uint64_t offset = 0;
        // Unknown when the file size is unknown: the segment ends with the stream.
        std::optional<std::uint64_t> length;
        // Piece covered by this segment when the file has piece hashes.
        std::optional<std::size_t> piece;

        SegmentState state = SegmentState::kPENDING;
        std::size_t attempts = 0;
        std::optional<DownloaderError> last_error;

        // Mirror of the current (or last) attempt.
        std::shared_ptr<Mirror> mirror;
        // The attempt reserved the connection slot of `mirror`. Segments carried along by a
        // whole stream share the slot of the segment that started it.
        bool holds_connection = false;
        std::set<MirrorID> tried_mirrors;
        // Pending segments are not handed out before this point (retry backoff).
        std::chrono::steady_clock::time_point not_before;

        std::uint64_t bytes_written = 0;

        bool is_ready(std::chrono::steady_clock::time_point now) const noexcept
        {
            return state == SegmentState::kPENDING && not_before <= now;
        }

        // A segment not covering a whole file of size `file_size` needs a ranged request.
        bool is_partial(std::optional<std::uint64_t> file_size) const noexcept
        {
            if (!length || !file_size)
                return false;
            return offset != 0 || *length != *file_size;
        }

        // One past the last byte, if known.
        std::optional<std::uint64_t> end() const noexcept
        {
            if (!length)
                return std::nullopt;
            return offset + *length;
        }
    };
}

#endif
