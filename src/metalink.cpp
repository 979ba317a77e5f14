#include <algorithm>

#include <metaloader/metalink.hpp>

namespace metaloader
{
    std::vector<Resource> FileEntry::ranked_resources() const
    {
        std::vector<Resource> res = resources;
        std::stable_sort(res.begin(), res.end(), resource_precedes);
        return res;
    }

    bool FileEntry::has_verifiable_checksum() const
    {
        if (std::any_of(checksums.begin(),
                        checksums.end(),
                        [](const Checksum& cs) { return is_supported(cs.type); }))
        {
            return true;
        }
        return pieces && is_supported(pieces->type);
    }
}
