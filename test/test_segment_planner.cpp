#include <doctest/doctest.h>

#include <numeric>
#include <random>

#include <metaloader/segment_planner.hpp>

using namespace metaloader;

namespace
{
    std::uint64_t covered(const std::vector<Segment>& segments)
    {
        std::uint64_t expected_offset = 0;
        for (const auto& s : segments)
        {
            CHECK_EQ(s.offset, expected_offset);
            REQUIRE(s.length.has_value());
            expected_offset += *s.length;
        }
        return expected_offset;
    }

    PieceHashes pieces_of(std::uint64_t length, std::size_t count)
    {
        PieceHashes pieces;
        pieces.type = ChecksumType::kSHA256;
        pieces.tag = "sha-256";
        pieces.length = length;
        pieces.hashes.assign(count, std::string(64, '0'));
        return pieces;
    }
}

TEST_SUITE("segment_planner")
{
    TEST_CASE("unknown_size")
    {
        SegmentPlanner planner(4, 1000);
        auto segments = planner.plan(std::nullopt, std::nullopt);
        REQUIRE(segments.has_value());
        REQUIRE_EQ(segments->size(), 1);
        CHECK_EQ(segments->front().offset, 0);
        CHECK_FALSE(segments->front().length.has_value());
        CHECK_FALSE(segments->front().is_partial(std::nullopt));
    }

    TEST_CASE("small_file_is_one_segment")
    {
        SegmentPlanner planner(4, 1000);
        auto segments = planner.plan(999, std::nullopt);
        REQUIRE(segments.has_value());
        REQUIRE_EQ(segments->size(), 1);
        CHECK_EQ(covered(*segments), 999);
        CHECK_FALSE(segments->front().is_partial(999));
    }

    TEST_CASE("empty_file")
    {
        SegmentPlanner planner(4, 1000);
        auto segments = planner.plan(0, std::nullopt);
        REQUIRE(segments.has_value());
        REQUIRE_EQ(segments->size(), 1);
        CHECK_EQ(segments->front().length, std::optional<std::uint64_t>(0));
    }

    TEST_CASE("split_is_bounded_and_contiguous")
    {
        SegmentPlanner planner(4, 1000);

        auto three = planner.plan(3500, std::nullopt);
        REQUIRE(three.has_value());
        CHECK_EQ(three->size(), 3);
        CHECK_EQ(covered(*three), 3500);
        // the remainder goes to the first segments
        CHECK_EQ(*three->at(0).length, 1167);
        CHECK_EQ(*three->at(2).length, 1166);
        CHECK(three->at(1).is_partial(3500));

        auto capped = planner.plan(1000000, std::nullopt);
        REQUIRE(capped.has_value());
        CHECK_EQ(capped->size(), 4);
        CHECK_EQ(covered(*capped), 1000000);
        for (std::size_t i = 0; i < capped->size(); ++i)
            CHECK_EQ(capped->at(i).index, i);
    }

    TEST_CASE("no_ranges")
    {
        SegmentPlanner planner(4, 1000);
        auto segments = planner.plan(100000, std::nullopt, false);
        REQUIRE(segments.has_value());
        CHECK_EQ(segments->size(), 1);
        CHECK_EQ(covered(*segments), 100000);
    }

    TEST_CASE("one_segment_per_piece")
    {
        SegmentPlanner planner(2, 1000000);
        auto segments = planner.plan(2500, pieces_of(1000, 3));
        REQUIRE(segments.has_value());
        REQUIRE_EQ(segments->size(), 3);
        CHECK_EQ(covered(*segments), 2500);
        CHECK_EQ(*segments->at(2).length, 500);
        for (std::size_t i = 0; i < segments->size(); ++i)
            CHECK_EQ(segments->at(i).piece, std::optional<std::size_t>(i));
    }

    TEST_CASE("piece_segments_partition_the_file")
    {
        std::mt19937 rng(20240611);
        std::uniform_int_distribution<std::uint64_t> piece_lengths(1, 4096);
        std::uniform_int_distribution<std::uint64_t> piece_counts(0, 50);

        std::vector<std::pair<std::uint64_t, std::uint64_t>> cases = {
            { 0, 1000 }, { 1, 1000 }, { 999, 1000 }, { 1000, 1000 }, { 5000, 1000 }, { 5001, 1000 }
        };
        for (int i = 0; i < 200; ++i)
        {
            const std::uint64_t length = piece_lengths(rng);
            const std::uint64_t full = piece_counts(rng) * length;
            // exact multiples, and sizes with a shorter last piece
            const std::uint64_t size = (i % 3 == 0) ? full : full + rng() % length;
            cases.emplace_back(size, length);
        }

        for (const auto& c : cases)
        {
            const std::uint64_t size = c.first;
            const std::uint64_t length = c.second;
            CAPTURE(size);
            CAPTURE(length);
            PieceHashes pieces = pieces_of(length, 0);
            pieces.hashes.assign(pieces.expected_count(size), std::string(64, '0'));

            SegmentPlanner planner(4, 1000);
            auto segments = planner.plan(size, pieces);
            REQUIRE(segments.has_value());
            REQUIRE_FALSE(segments->empty());

            std::uint64_t end = 0;
            for (std::size_t i = 0; i < segments->size(); ++i)
            {
                const auto& segment = segments->at(i);
                REQUIRE(segment.length.has_value());
                // contiguous, no overlap
                CHECK_EQ(segment.offset, end);
                CHECK_EQ(segment.index, i);
                if (size > 0)
                {
                    CHECK_GT(*segment.length, 0);
                    CHECK_LE(*segment.length, length);
                    CHECK_EQ(segment.piece, std::optional<std::size_t>(i));
                    CHECK_EQ(segment.offset, i * length);
                }
                end += *segment.length;
            }
            CHECK_EQ(end, size);
            if (size > 0)
                CHECK_EQ(segments->size(), pieces.hashes.size());
        }
    }

    TEST_CASE("pieces_without_ranges")
    {
        SegmentPlanner planner(2, 1000);
        auto segments = planner.plan(2500, pieces_of(1000, 3), false);
        REQUIRE(segments.has_value());
        REQUIRE_EQ(segments->size(), 1);
        CHECK_FALSE(segments->front().piece.has_value());
    }

    TEST_CASE("invalid_piece_layout")
    {
        SegmentPlanner planner(4, 1000);

        auto too_few = planner.plan(2500, pieces_of(1000, 2));
        REQUIRE_FALSE(too_few.has_value());
        CHECK_EQ(too_few.error().kind, PlanErrorKind::kINVALID_PIECE_LAYOUT);

        auto too_many = planner.plan(2000, pieces_of(1000, 3));
        REQUIRE_FALSE(too_many.has_value());

        auto zero_length = SegmentPlanner::check_piece_layout(pieces_of(0, 1), 10);
        REQUIRE_FALSE(zero_length.has_value());
        CHECK_EQ(zero_length.error().to_downloader_error().code,
                 ErrorCode::ML_INVALID_PIECE_LAYOUT);

        CHECK(SegmentPlanner::check_piece_layout(pieces_of(1000, 3), std::nullopt).has_value());
    }
}
