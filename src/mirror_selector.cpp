#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

#include <metaloader/mirror_selector.hpp>

namespace metaloader
{
    MirrorSelector::MirrorSelector(const Context& ctx)
        : m_ctx(ctx)
    {
    }

    bool MirrorSelector::is_usable(const Mirror& mirror, const std::set<MirrorID>& excluded) const
    {
        if (excluded.count(mirror.id()))
            return false;
        return !mirror.is_failure_budget_exhausted(m_ctx.allowed_mirror_failures);
    }

    bool MirrorSelector::has_candidate(const mirror_set& ranked_mirrors,
                                       const std::set<MirrorID>& excluded) const
    {
        return std::any_of(ranked_mirrors.begin(),
                           ranked_mirrors.end(),
                           [&](const std::shared_ptr<Mirror>& m) { return is_usable(*m, excluded); });
    }

    tl::expected<std::shared_ptr<Mirror>, DownloaderError> MirrorSelector::select(
        const mirror_set& ranked_mirrors,
        const std::set<MirrorID>& excluded,
        const Segment& segment,
        bool partial) const
    {
        mirror_set candidates;
        for (const auto& mirror : ranked_mirrors)
        {
            if (is_usable(*mirror, excluded))
                candidates.push_back(mirror);
        }

        if (candidates.empty())
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::ML_NOURL,
                fmt::format("No mirror left for segment {}", segment.index) });
        }

        if (partial)
        {
            mirror_set range_capable;
            std::copy_if(candidates.begin(),
                         candidates.end(),
                         std::back_inserter(range_capable),
                         [](const std::shared_ptr<Mirror>& m)
                         { return m->range_support() != RangeSupport::kUNSUPPORTED; });
            if (!range_capable.empty())
                candidates = std::move(range_capable);
        }

        mirror_set order;
        std::copy_if(candidates.begin(),
                     candidates.end(),
                     std::back_inserter(order),
                     [&segment](const std::shared_ptr<Mirror>& m)
                     { return segment.tried_mirrors.count(m->id()) == 0; });

        if (order.empty())
        {
            // Every candidate was tried: reuse the least failed one, in ranking order
            order = candidates;
            std::stable_sort(order.begin(),
                             order.end(),
                             [](const std::shared_ptr<Mirror>& lhs,
                                const std::shared_ptr<Mirror>& rhs)
                             { return lhs->stats().failed_transfers < rhs->stats().failed_transfers; });
        }

        // mirrors waiting for a retry come last
        std::stable_partition(order.begin(),
                              order.end(),
                              [](const std::shared_ptr<Mirror>& m)
                              { return !m->need_wait_for_retry(); });

        for (const auto& mirror : order)
        {
            if (partial && mirror->range_support() == RangeSupport::kUNKNOWN
                && mirror->stats().running_transfers > 0)
            {
                // the answer to its first ranged request is still awaited
                spdlog::debug("Waiting for the range support of {}", mirror->url());
                return std::shared_ptr<Mirror>();
            }
            if (mirror->try_acquire_connection())
            {
                spdlog::debug("Selected {} for segment {}", mirror->url(), segment.index);
                return mirror;
            }
        }

        // all busy
        return std::shared_ptr<Mirror>();
    }
}
