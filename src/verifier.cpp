#include <algorithm>

#include <spdlog/spdlog.h>

#include <metaloader/verifier.hpp>

namespace metaloader
{
    namespace
    {
        constexpr std::size_t read_chunk_size = 64 * 1024;
    }

    IntegrityVerifier::IntegrityVerifier(const Context& ctx)
        : m_ctx(ctx)
    {
    }

    bool IntegrityVerifier::can_verify_pieces(const PieceHashes& pieces) const
    {
        return m_ctx.verify_pieces && is_supported(pieces.type);
    }

    tl::expected<void, DownloaderError> IntegrityVerifier::digest_range(
        StorageHandle& storage, std::uint64_t offset, std::uint64_t length, MultiHasher& hasher) const
    {
        std::vector<char> buffer(read_chunk_size);
        std::uint64_t done = 0;
        while (done < length)
        {
            const std::size_t wanted
                = static_cast<std::size_t>(std::min<std::uint64_t>(read_chunk_size, length - done));
            auto got = storage.read_at(offset + done, buffer.data(), wanted);
            if (!got)
                return tl::unexpected(got.error());
            if (got.value() == 0)
            {
                return tl::unexpected(DownloaderError{
                    ErrorLevel::FATAL,
                    ErrorCode::ML_IO,
                    fmt::format("{} ends at {} bytes, {} expected",
                                storage.path().string(),
                                offset + done,
                                offset + length) });
            }
            hasher.update(buffer.data(), got.value());
            done += got.value();
        }
        return {};
    }

    tl::expected<bool, DownloaderError> IntegrityVerifier::verify_piece(
        StorageHandle& storage,
        const PieceHashes& pieces,
        std::size_t index,
        std::uint64_t file_size) const
    {
        if (!can_verify_pieces(pieces) || index >= pieces.hashes.size())
            return false;

        auto [start, end] = pieces.range(index, file_size);
        MultiHasher hasher({ pieces.type });
        auto read = digest_range(storage, start, end - start, hasher);
        if (!read)
            return tl::unexpected(read.error());

        const auto computed = hasher.final_hex()[pieces.type];
        if (computed != pieces.hashes[index])
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::SERIOUS,
                ErrorCode::ML_PIECE_MISMATCH,
                fmt::format("Piece {} of {} does not match its {} digest (expected {}, got {})",
                            index,
                            storage.path().filename().string(),
                            pieces.tag,
                            pieces.hashes[index],
                            computed) });
        }

        spdlog::debug("Piece {} of {} verified", index, storage.path().filename().string());
        return true;
    }

    tl::expected<std::vector<bool>, DownloaderError> IntegrityVerifier::valid_pieces(
        StorageHandle& storage, const PieceHashes& pieces, std::uint64_t file_size) const
    {
        std::vector<bool> valid(pieces.hashes.size(), false);
        if (!can_verify_pieces(pieces))
            return valid;

        auto on_disk = storage.size();
        if (!on_disk)
            return tl::unexpected(on_disk.error());

        for (std::size_t i = 0; i < pieces.hashes.size(); ++i)
        {
            auto [start, end] = pieces.range(i, file_size);
            if (end > on_disk.value())
                break;

            auto res = verify_piece(storage, pieces, i, file_size);
            if (res)
            {
                valid[i] = res.value();
            }
            else if (res.error().code != ErrorCode::ML_PIECE_MISMATCH)
            {
                return tl::unexpected(res.error());
            }
        }
        return valid;
    }

    FileStatus IntegrityVerifier::decide(const std::vector<Checksum>& declared,
                                         const std::map<ChecksumType, std::string>& computed,
                                         bool all_pieces_verified)
    {
        bool matched = false;
        for (const auto& cs : declared)
        {
            auto it = computed.find(cs.type);
            if (it == computed.end())
                continue;
            if (it->second != cs.checksum)
                return FileStatus::kCHECKSUM_MISMATCH;
            matched = true;
        }

        if (matched || all_pieces_verified)
            return FileStatus::kVERIFIED;
        return FileStatus::kCOMPLETED_UNVERIFIED;
    }

    tl::expected<FileStatus, DownloaderError> IntegrityVerifier::verify_file(
        StorageHandle& storage,
        const FileEntry& entry,
        std::uint64_t file_size,
        bool all_pieces_verified) const
    {
        std::map<ChecksumType, std::string> computed;

        if (m_ctx.validate_checksum)
        {
            std::vector<ChecksumType> types;
            for (const auto& cs : entry.checksums)
            {
                if (is_supported(cs.type))
                    types.push_back(cs.type);
                else
                    spdlog::warn("Cannot verify {} checksum of {}", cs.tag, entry.name);
            }

            if (!types.empty())
            {
                MultiHasher hasher(types);
                auto read = digest_range(storage, 0, file_size, hasher);
                if (!read)
                    return tl::unexpected(read.error());
                computed = hasher.final_hex();
            }
        }

        const FileStatus status = decide(m_ctx.validate_checksum ? entry.checksums
                                                                 : std::vector<Checksum>{},
                                         computed,
                                         all_pieces_verified);

        if (status == FileStatus::kCHECKSUM_MISMATCH)
        {
            for (const auto& cs : entry.checksums)
            {
                auto it = computed.find(cs.type);
                if (it != computed.end() && it->second != cs.checksum)
                {
                    spdlog::error("{} checksum of {} does not match (expected {}, got {})",
                                  cs.tag,
                                  entry.name,
                                  cs.checksum,
                                  it->second);
                }
            }
        }
        else if (status == FileStatus::kCOMPLETED_UNVERIFIED)
        {
            spdlog::warn("{} was downloaded but could not be verified", entry.name);
        }
        return status;
    }
}
