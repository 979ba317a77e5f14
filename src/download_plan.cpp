#include <set>

#include <spdlog/spdlog.h>

#include <metaloader/download_plan.hpp>
#include <metaloader/segment_planner.hpp>
#include <metaloader/storage.hpp>
#include <metaloader/verifier.hpp>

namespace metaloader
{
    namespace
    {
        void minimize_file(const Context& ctx, FilePlan& plan)
        {
            std::error_code ec;
            if (!fs::exists(plan.destination, ec))
                return;

            const auto& entry = plan.entry;
            const auto on_disk = fs::file_size(plan.destination, ec);
            if (ec)
                return;

            IntegrityVerifier verifier(ctx);
            FileStorage storage;
            auto handle = storage.open(plan.destination);
            if (!handle)
            {
                spdlog::warn("Cannot reuse {}: {}", plan.destination.string(), handle.error().reason);
                return;
            }

            if (entry.pieces && entry.size && verifier.can_verify_pieces(*entry.pieces))
            {
                auto valid = verifier.valid_pieces(**handle, *entry.pieces, *entry.size);
                if (!valid)
                {
                    spdlog::warn("Cannot reuse {}: {}", plan.destination.string(), valid.error().reason);
                    return;
                }

                std::uint64_t remaining = *entry.size;
                for (std::size_t i = 0; i < valid->size(); ++i)
                {
                    if (!(*valid)[i])
                        continue;
                    auto [start, end] = entry.pieces->range(i, *entry.size);
                    plan.completed_pieces.push_back(i);
                    remaining -= end - start;
                }
                plan.remaining_size = remaining;
                spdlog::info("{}: {} of {} pieces already valid",
                             entry.name,
                             plan.completed_pieces.size(),
                             entry.pieces->hashes.size());
            }
            else if (!entry.pieces && ctx.validate_checksum
                     && strongest_checksum(entry.checksums) != nullptr
                     && (!entry.size || *entry.size == on_disk))
            {
                auto status = verifier.verify_file(**handle, entry, on_disk, false);
                if (status && status.value() == FileStatus::kVERIFIED)
                {
                    spdlog::info("{} already downloaded", entry.name);
                    plan.already_verified = true;
                    plan.remaining_size = 0;
                }
            }

            auto finalized = (*handle)->finalize();
            if (!finalized)
                finalized.error().log();
        }

        nlohmann::json resource_to_json(const Resource& resource)
        {
            nlohmann::json j;
            j["url"] = resource.url;
            if (resource.priority)
                j["priority"] = *resource.priority;
            if (resource.location)
                j["location"] = *resource.location;
            if (resource.max_connections)
                j["maxconnections"] = *resource.max_connections;
            return j;
        }
    }

    DownloadPlan DownloadPlan::from_metalink(const Metalink& metalink,
                                             const fs::path& destination_dir)
    {
        DownloadPlan plan;
        plan.generator = metalink.generator;
        plan.published = metalink.published;
        plan.updated = metalink.updated;

        std::set<std::string> names;
        for (const auto& entry : metalink.files)
        {
            FilePlan file;
            file.entry = entry;
            file.destination = destination_dir / fs::path(entry.name);
            file.resources = entry.ranked_resources();
            file.remaining_size = entry.size;

            if (!names.insert(entry.name).second)
            {
                file.error = PlanError{ PlanErrorKind::kUNRESOLVABLE_FILE,
                                        fmt::format("Duplicate file name {}", entry.name) };
            }
            else if (file.resources.empty())
            {
                file.error = PlanError{ PlanErrorKind::kUNRESOLVABLE_FILE,
                                        fmt::format("No usable url for {}", entry.name) };
            }
            else if (entry.pieces)
            {
                auto layout = SegmentPlanner::check_piece_layout(*entry.pieces, entry.size);
                if (!layout)
                    file.error = layout.error();
            }

            if (file.error)
                spdlog::error("Skipping {}: {}", entry.name, file.error->reason);

            plan.files.push_back(std::move(file));
        }
        return plan;
    }

    void DownloadPlan::minimize(const Context& ctx)
    {
        if (!ctx.resume)
            return;

        for (auto& file : files)
        {
            if (file.ok())
                minimize_file(ctx, file);
        }
    }

    std::uint64_t DownloadPlan::remaining_bytes() const
    {
        std::uint64_t total = 0;
        for (const auto& file : files)
        {
            if (file.ok() && file.remaining_size)
                total += *file.remaining_size;
        }
        return total;
    }

    nlohmann::json FilePlan::to_json() const
    {
        nlohmann::json j;
        j["name"] = entry.name;
        j["destination"] = destination.string();
        if (entry.size)
            j["size"] = *entry.size;
        else
            j["size"] = nullptr;

        if (error)
        {
            j["status"] = "rejected";
            j["error"] = error->reason;
        }
        else if (already_verified)
        {
            j["status"] = "complete";
        }
        else
        {
            j["status"] = "pending";
        }

        j["resources"] = nlohmann::json::array();
        for (const auto& resource : resources)
            j["resources"].push_back(resource_to_json(resource));

        j["checksums"] = nlohmann::json::array();
        for (const auto& cs : entry.checksums)
        {
            j["checksums"].push_back({ { "type", cs.tag },
                                       { "hash", cs.checksum },
                                       { "supported", is_supported(cs.type) } });
        }

        if (entry.pieces)
        {
            j["pieces"] = { { "type", entry.pieces->tag },
                            { "length", entry.pieces->length },
                            { "count", entry.pieces->hashes.size() } };
            j["completed_pieces"] = completed_pieces;
        }

        if (remaining_size)
            j["remaining_size"] = *remaining_size;
        else
            j["remaining_size"] = nullptr;
        return j;
    }

    nlohmann::json DownloadPlan::to_json() const
    {
        nlohmann::json j;
        if (generator)
            j["generator"] = *generator;
        if (published)
            j["published"] = *published;
        if (updated)
            j["updated"] = *updated;

        j["files"] = nlohmann::json::array();
        for (const auto& file : files)
            j["files"].push_back(file.to_json());
        j["remaining_bytes"] = remaining_bytes();
        return j;
    }
}
