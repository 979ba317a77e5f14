#include <algorithm>

#include <spdlog/spdlog.h>

#include <metaloader/segment_planner.hpp>

namespace metaloader
{
    SegmentPlanner::SegmentPlanner(std::size_t max_segments, std::uint64_t min_segment_size)
        : m_max_segments(std::max<std::size_t>(max_segments, 1))
        , m_min_segment_size(std::max<std::uint64_t>(min_segment_size, 1))
    {
    }

    SegmentPlanner::SegmentPlanner(const Context& ctx)
        : SegmentPlanner(static_cast<std::size_t>(std::max(ctx.max_parallel_downloads, 1L)),
                         ctx.min_segment_size)
    {
    }

    tl::expected<void, PlanError> SegmentPlanner::check_piece_layout(
        const PieceHashes& pieces, std::optional<std::uint64_t> size)
    {
        if (pieces.length == 0)
        {
            return tl::unexpected(
                PlanError{ PlanErrorKind::kINVALID_PIECE_LAYOUT, "piece length must be > 0" });
        }
        if (size && pieces.hashes.size() != pieces.expected_count(*size))
        {
            return tl::unexpected(PlanError{
                PlanErrorKind::kINVALID_PIECE_LAYOUT,
                fmt::format("{} piece hashes of {} bytes cannot cover {} bytes (expected {})",
                            pieces.hashes.size(),
                            pieces.length,
                            *size,
                            pieces.expected_count(*size)) });
        }
        return {};
    }

    tl::expected<std::vector<Segment>, PlanError> SegmentPlanner::plan(
        std::optional<std::uint64_t> size,
        const std::optional<PieceHashes>& pieces,
        bool ranges_supported) const
    {
        std::vector<Segment> segments;

        if (!size)
        {
            // read until the end of the stream
            segments.emplace_back();
            return segments;
        }

        if (pieces)
        {
            auto layout = check_piece_layout(*pieces, size);
            if (!layout)
                return tl::unexpected(layout.error());

            if (ranges_supported)
            {
                for (std::size_t i = 0; i < pieces->hashes.size(); ++i)
                {
                    auto [start, end] = pieces->range(i, *size);
                    Segment segment;
                    segment.index = i;
                    segment.offset = start;
                    segment.length = end - start;
                    segment.piece = i;
                    segments.push_back(std::move(segment));
                }
                if (segments.empty())
                {
                    // empty file
                    segments.emplace_back();
                    segments.back().length = 0;
                }
                return segments;
            }
        }

        std::uint64_t count = ranges_supported ? *size / m_min_segment_size : 1;
        count = std::clamp<std::uint64_t>(count, 1, m_max_segments);

        const std::uint64_t base = *size / count;
        const std::uint64_t remainder = *size % count;
        std::uint64_t offset = 0;
        for (std::uint64_t i = 0; i < count; ++i)
        {
            Segment segment;
            segment.index = static_cast<std::size_t>(i);
            segment.offset = offset;
            segment.length = base + (i < remainder ? 1 : 0);
            offset += *segment.length;
            segments.push_back(std::move(segment));
        }

        spdlog::debug("Planned {} segment(s) for {} bytes", segments.size(), *size);
        return segments;
    }
}
