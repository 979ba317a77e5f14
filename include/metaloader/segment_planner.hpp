#ifndef METALOADER_SEGMENT_PLANNER_HPP
#define METALOADER_SEGMENT_PLANNER_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include <tl/expected.hpp>

#include <metaloader/export.hpp>
#include <metaloader/context.hpp>
#include <metaloader/errors.hpp>
#include <metaloader/metalink.hpp>
#include <metaloader/segment.hpp>

namespace metaloader
{
    /** Splits a file into segments.
     *
     * With piece hashes every piece becomes one segment, so that each segment can be
     * verified on its own. Otherwise the file is cut in at most `max_segments` equal parts
     * no smaller than `min_segment_size`. A file of unknown size, a small file, or a file
     * whose mirror does not serve byte ranges is fetched as a single segment.
     */
    class METALOADER_API SegmentPlanner
    {
    public:
        SegmentPlanner(std::size_t max_segments, std::uint64_t min_segment_size);
        explicit SegmentPlanner(const Context& ctx);

        tl::expected<std::vector<Segment>, PlanError> plan(
            std::optional<std::uint64_t> size,
            const std::optional<PieceHashes>& pieces,
            bool ranges_supported = true) const;

        // Checks that `pieces` exactly covers a file of `size` bytes.
        static tl::expected<void, PlanError> check_piece_layout(const PieceHashes& pieces,
                                                                std::optional<std::uint64_t> size);

    private:
        std::size_t m_max_segments;
        std::uint64_t m_min_segment_size;
    };
}

#endif
