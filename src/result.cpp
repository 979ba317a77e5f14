#include <algorithm>

#include <metaloader/result.hpp>

namespace metaloader
{
    std::string_view to_string(FileStatus status)
    {
        switch (status)
        {
            case FileStatus::kRUNNING:
                return "Running";
            case FileStatus::kVERIFIED:
                return "Verified";
            case FileStatus::kCOMPLETED_UNVERIFIED:
                return "CompletedUnverified";
            case FileStatus::kCHECKSUM_MISMATCH:
                return "ChecksumMismatch";
            case FileStatus::kINCOMPLETE_NO_MIRRORS:
                return "IncompleteNoMirrors";
            case FileStatus::kIO_ERROR:
                return "IOError";
            case FileStatus::kPLAN_ERROR:
                return "PlanError";
            case FileStatus::kCANCELLED:
                return "Cancelled";
        }
        return "Unknown";
    }

    std::string_view to_string(SegmentState state)
    {
        switch (state)
        {
            case SegmentState::kPENDING:
                return "pending";
            case SegmentState::kINFLIGHT:
                return "in flight";
            case SegmentState::kCOMPLETED:
                return "completed";
            case SegmentState::kFAILED:
                return "failed";
        }
        return "unknown";
    }

    bool RunReport::success(bool accept_unverified) const
    {
        return std::all_of(results.begin(),
                           results.end(),
                           [accept_unverified](const DownloadResult& r)
                           { return r.is_success(accept_unverified); });
    }

    std::uint64_t RunReport::bytes_transferred() const
    {
        std::uint64_t total = 0;
        for (const auto& r : results)
            total += r.bytes_transferred;
        return total;
    }

    const DownloadResult* RunReport::find(std::string_view name) const
    {
        for (const auto& r : results)
        {
            if (r.name == name)
                return &r;
        }
        return nullptr;
    }
}
