#ifndef METALOADER_DOWNLOAD_PLAN_HPP
#define METALOADER_DOWNLOAD_PLAN_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include <metaloader/export.hpp>
#include <metaloader/context.hpp>
#include <metaloader/errors.hpp>
#include <metaloader/metalink.hpp>

namespace metaloader
{
    namespace fs = std::filesystem;

    // What will be done for one file of the descriptor.
    struct METALOADER_API FilePlan
    {
        FileEntry entry;
        fs::path destination;
        // Resources in (priority, declared order).
        std::vector<Resource> resources;
        // The file is rejected, sibling files proceed.
        std::optional<PlanError> error;

        // Set by DownloadPlan::minimize().
        std::vector<std::size_t> completed_pieces;
        bool already_verified = false;
        // Bytes left to fetch, unknown when the size is.
        std::optional<std::uint64_t> remaining_size;

        bool ok() const noexcept
        {
            return !error.has_value();
        }

        nlohmann::json to_json() const;
    };

    class METALOADER_API DownloadPlan
    {
    public:
        // One FilePlan per file entry, all of them placed under `destination_dir`.
        static DownloadPlan from_metalink(const Metalink& metalink,
                                          const fs::path& destination_dir);

        // Looks at what is already on disk: valid pieces need no fetch, and a file whose
        // whole-file checksum already matches needs no network access at all.
        void minimize(const Context& ctx);

        // Sum of the known remaining sizes of the accepted files.
        std::uint64_t remaining_bytes() const;

        nlohmann::json to_json() const;

        std::vector<FilePlan> files;
        std::optional<std::string> generator;
        std::optional<std::string> published;
        std::optional<std::string> updated;
    };
}

#endif
