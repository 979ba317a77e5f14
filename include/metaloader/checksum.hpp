#ifndef METALOADER_CHECKSUM_HPP
#define METALOADER_CHECKSUM_HPP

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include <metaloader/export.hpp>
#include <metaloader/enums.hpp>
#include <metaloader/errors.hpp>

typedef struct evp_md_ctx_st EVP_MD_CTX;
typedef struct evp_md_st EVP_MD;

namespace metaloader
{
    namespace fs = std::filesystem;

    struct Checksum
    {
        ChecksumType type;
        // Algorithm name as written in the document (e.g. "sha-256").
        std::string tag;
        // Lowercase hex digest.
        std::string checksum;
    };

    // Maps an IANA hash name (RFC 5854 §4.2.4) to a ChecksumType. Unknown names yield kUNSUPPORTED.
    METALOADER_API ChecksumType checksum_type_from_name(std::string_view name);
    METALOADER_API std::string_view checksum_type_name(ChecksumType type);

    // Higher is stronger, kUNSUPPORTED is 0.
    METALOADER_API int checksum_strength(ChecksumType type);

    // The OpenSSL digest implementing `type`, or nullptr if this build cannot compute it
    // (kUNSUPPORTED, or MD2 on a libcrypto without it).
    METALOADER_API const EVP_MD* evp_digest(ChecksumType type);

    inline bool is_supported(ChecksumType type)
    {
        return evp_digest(type) != nullptr;
    }

    // Number of hex characters of a `type` digest, 0 when unknown.
    METALOADER_API std::size_t checksum_hex_length(ChecksumType type);

    // Strongest checksum of `checksums` that can be verified, or nullptr.
    METALOADER_API const Checksum* strongest_checksum(const std::vector<Checksum>& checksums);

    // Incremental digest computation.
    class METALOADER_API Hasher
    {
    public:
        // Throws std::invalid_argument if `type` is not supported.
        explicit Hasher(ChecksumType type);
        ~Hasher();

        Hasher(const Hasher&) = delete;
        Hasher& operator=(const Hasher&) = delete;
        Hasher(Hasher&&) noexcept;
        Hasher& operator=(Hasher&&) noexcept;

        ChecksumType type() const noexcept
        {
            return m_type;
        }

        void update(const char* data, std::size_t size);
        void update(std::string_view data)
        {
            update(data.data(), data.size());
        }

        // Finishes the computation and returns the lowercase hex digest.
        std::string final_hex();

    private:
        ChecksumType m_type;
        EVP_MD_CTX* m_ctx = nullptr;
    };

    // Feeds one stream of bytes to several digests at once.
    class METALOADER_API MultiHasher
    {
    public:
        explicit MultiHasher(const std::vector<ChecksumType>& types);

        void update(const char* data, std::size_t size);
        std::map<ChecksumType, std::string> final_hex();

    private:
        std::vector<Hasher> m_hashers;
    };

    METALOADER_API std::string digest(ChecksumType type, std::string_view data);

    inline std::string sha256(std::string_view data)
    {
        return digest(ChecksumType::kSHA256, data);
    }

    // Digests of the whole file at `path` for every supported type in `types`.
    METALOADER_API tl::expected<std::map<ChecksumType, std::string>, DownloaderError> file_digests(
        const fs::path& path, const std::vector<ChecksumType>& types);
}

#endif
