#ifndef METALOADER_MIRROR_SELECTOR_HPP
#define METALOADER_MIRROR_SELECTOR_HPP

#include <memory>
#include <set>

#include <tl/expected.hpp>

#include <metaloader/export.hpp>
#include <metaloader/context.hpp>
#include <metaloader/errors.hpp>
#include <metaloader/mirror.hpp>
#include <metaloader/mirrorid.hpp>
#include <metaloader/segment.hpp>

namespace metaloader
{
    /** Picks the mirror of the next attempt of a segment.
     *
     * Candidates are the ranked mirrors of the file, minus the ones excluded for that file
     * and the ones that exhausted their failure budget. Among them, range capable mirrors
     * are preferred for partial segments, mirrors not yet tried by the segment are preferred
     * over tried ones, and mirrors outside their retry delay over the others.
     *
     * A partial segment waits for a preferred mirror whose byte range support is not known
     * yet while a transfer to it runs: that transfer tells whether the mirror honors ranges.
     *
     * On success a connection slot of the returned mirror is reserved. A null mirror means
     * every candidate is busy and the segment has to wait. An ML_NOURL error means there is
     * no candidate left.
     */
    class METALOADER_API MirrorSelector
    {
    public:
        explicit MirrorSelector(const Context& ctx);

        tl::expected<std::shared_ptr<Mirror>, DownloaderError> select(
            const mirror_set& ranked_mirrors,
            const std::set<MirrorID>& excluded,
            const Segment& segment,
            bool partial) const;

        // True when `select` could still return a mirror for this file, ignoring
        // the tries of segments and busy mirrors.
        bool has_candidate(const mirror_set& ranked_mirrors,
                           const std::set<MirrorID>& excluded) const;

    private:
        bool is_usable(const Mirror& mirror, const std::set<MirrorID>& excluded) const;

        const Context& m_ctx;
    };
}

#endif
