#ifndef METALOADER_VERIFIER_HPP
#define METALOADER_VERIFIER_HPP

#include <cstdint>
#include <map>
#include <vector>

#include <tl/expected.hpp>

#include <metaloader/export.hpp>
#include <metaloader/checksum.hpp>
#include <metaloader/context.hpp>
#include <metaloader/errors.hpp>
#include <metaloader/metalink.hpp>
#include <metaloader/storage.hpp>

namespace metaloader
{
    // Checks the bytes committed to storage against the digests of the descriptor.
    class METALOADER_API IntegrityVerifier
    {
    public:
        explicit IntegrityVerifier(const Context& ctx);

        // True when the piece matched, false when it cannot be verified (unsupported
        // algorithm, piece verification disabled). A mismatch is a ML_PIECE_MISMATCH error.
        tl::expected<bool, DownloaderError> verify_piece(StorageHandle& storage,
                                                         const PieceHashes& pieces,
                                                         std::size_t index,
                                                         std::uint64_t file_size) const;

        // Which pieces of a `file_size` bytes file already match their digest.
        tl::expected<std::vector<bool>, DownloaderError> valid_pieces(
            StorageHandle& storage, const PieceHashes& pieces, std::uint64_t file_size) const;

        // Digests every supported whole-file checksum in one pass and decides the status:
        // kVERIFIED, kCOMPLETED_UNVERIFIED or kCHECKSUM_MISMATCH.
        tl::expected<FileStatus, DownloaderError> verify_file(StorageHandle& storage,
                                                              const FileEntry& entry,
                                                              std::uint64_t file_size,
                                                              bool all_pieces_verified) const;

        // Any mismatch of a supported algorithm wins. Otherwise one match (or every piece
        // verified) is enough to be kVERIFIED.
        static FileStatus decide(const std::vector<Checksum>& declared,
                                 const std::map<ChecksumType, std::string>& computed,
                                 bool all_pieces_verified);

        bool can_verify_pieces(const PieceHashes& pieces) const;

    private:
        tl::expected<void, DownloaderError> digest_range(StorageHandle& storage,
                                                         std::uint64_t offset,
                                                         std::uint64_t length,
                                                         MultiHasher& hasher) const;

        const Context& m_ctx;
    };
}

#endif
