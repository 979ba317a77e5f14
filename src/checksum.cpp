#include <stdexcept>
#include <utility>

#include <openssl/evp.h>

#include <metaloader/checksum.hpp>
#include <metaloader/fileio.hpp>
#include <metaloader/utils.hpp>

namespace metaloader
{
    ChecksumType checksum_type_from_name(std::string_view name)
    {
        const std::string lname = to_lower(strip(name));
        if (lname == "md2")
            return ChecksumType::kMD2;
        if (lname == "md5")
            return ChecksumType::kMD5;
        if (lname == "sha-1" || lname == "sha1")
            return ChecksumType::kSHA1;
        if (lname == "sha-224" || lname == "sha224")
            return ChecksumType::kSHA224;
        if (lname == "sha-256" || lname == "sha256")
            return ChecksumType::kSHA256;
        if (lname == "sha-384" || lname == "sha384")
            return ChecksumType::kSHA384;
        if (lname == "sha-512" || lname == "sha512")
            return ChecksumType::kSHA512;
        return ChecksumType::kUNSUPPORTED;
    }

    std::string_view checksum_type_name(ChecksumType type)
    {
        switch (type)
        {
            case ChecksumType::kMD2:
                return "md2";
            case ChecksumType::kMD5:
                return "md5";
            case ChecksumType::kSHA1:
                return "sha-1";
            case ChecksumType::kSHA224:
                return "sha-224";
            case ChecksumType::kSHA256:
                return "sha-256";
            case ChecksumType::kSHA384:
                return "sha-384";
            case ChecksumType::kSHA512:
                return "sha-512";
            default:
                return "unsupported";
        }
    }

    int checksum_strength(ChecksumType type)
    {
        switch (type)
        {
            case ChecksumType::kMD2:
                return 1;
            case ChecksumType::kMD5:
                return 2;
            case ChecksumType::kSHA1:
                return 3;
            case ChecksumType::kSHA224:
                return 4;
            case ChecksumType::kSHA256:
                return 5;
            case ChecksumType::kSHA384:
                return 6;
            case ChecksumType::kSHA512:
                return 7;
            default:
                return 0;
        }
    }

    const EVP_MD* evp_digest(ChecksumType type)
    {
        switch (type)
        {
            case ChecksumType::kMD2:
                // not built into most libcrypto configurations
                return EVP_get_digestbyname("md2");
            case ChecksumType::kMD5:
                return EVP_md5();
            case ChecksumType::kSHA1:
                return EVP_sha1();
            case ChecksumType::kSHA224:
                return EVP_sha224();
            case ChecksumType::kSHA256:
                return EVP_sha256();
            case ChecksumType::kSHA384:
                return EVP_sha384();
            case ChecksumType::kSHA512:
                return EVP_sha512();
            default:
                return nullptr;
        }
    }

    std::size_t checksum_hex_length(ChecksumType type)
    {
        switch (type)
        {
            case ChecksumType::kMD2:
            case ChecksumType::kMD5:
                return 32;
            case ChecksumType::kSHA1:
                return 40;
            case ChecksumType::kSHA224:
                return 56;
            case ChecksumType::kSHA256:
                return 64;
            case ChecksumType::kSHA384:
                return 96;
            case ChecksumType::kSHA512:
                return 128;
            default:
                return 0;
        }
    }

    const Checksum* strongest_checksum(const std::vector<Checksum>& checksums)
    {
        const Checksum* best = nullptr;
        for (const auto& cs : checksums)
        {
            if (!is_supported(cs.type))
                continue;
            if (!best || checksum_strength(cs.type) > checksum_strength(best->type))
                best = &cs;
        }
        return best;
    }

    /**********
     * Hasher *
     **********/

    Hasher::Hasher(ChecksumType type)
        : m_type(type)
    {
        const EVP_MD* md = evp_digest(type);
        if (md == nullptr)
        {
            throw std::invalid_argument(
                fmt::format("Unsupported checksum algorithm '{}'", checksum_type_name(type)));
        }

        m_ctx = EVP_MD_CTX_create();
        if (m_ctx == nullptr || EVP_DigestInit_ex(m_ctx, md, nullptr) != 1)
        {
            EVP_MD_CTX_destroy(m_ctx);
            throw std::runtime_error("Could not initialize digest context");
        }
    }

    Hasher::~Hasher()
    {
        if (m_ctx)
        {
            EVP_MD_CTX_destroy(m_ctx);
        }
    }

    Hasher::Hasher(Hasher&& rhs) noexcept
        : m_type(rhs.m_type)
        , m_ctx(std::exchange(rhs.m_ctx, nullptr))
    {
    }

    Hasher& Hasher::operator=(Hasher&& rhs) noexcept
    {
        std::swap(m_type, rhs.m_type);
        std::swap(m_ctx, rhs.m_ctx);
        return *this;
    }

    void Hasher::update(const char* data, std::size_t size)
    {
        if (EVP_DigestUpdate(m_ctx, data, size) != 1)
        {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    std::string Hasher::final_hex()
    {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(m_ctx, hash, &len) != 1)
        {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return hex_string(hash, len);
    }

    /***************
     * MultiHasher *
     ***************/

    MultiHasher::MultiHasher(const std::vector<ChecksumType>& types)
    {
        for (auto type : types)
        {
            if (!is_supported(type))
                continue;
            bool seen = false;
            for (const auto& h : m_hashers)
                seen = seen || h.type() == type;
            if (!seen)
                m_hashers.emplace_back(type);
        }
    }

    void MultiHasher::update(const char* data, std::size_t size)
    {
        for (auto& h : m_hashers)
            h.update(data, size);
    }

    std::map<ChecksumType, std::string> MultiHasher::final_hex()
    {
        std::map<ChecksumType, std::string> res;
        for (auto& h : m_hashers)
            res[h.type()] = h.final_hex();
        return res;
    }

    std::string digest(ChecksumType type, std::string_view data)
    {
        Hasher hasher(type);
        hasher.update(data);
        return hasher.final_hex();
    }

    tl::expected<std::map<ChecksumType, std::string>, DownloaderError> file_digests(
        const fs::path& path, const std::vector<ChecksumType>& types)
    {
        std::error_code ec;
        FileIO infile(path, FileIO::read_binary, ec);
        if (ec)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::ML_IO,
                fmt::format("Could not open {}: {}", path.string(), ec.message()) });
        }

        MultiHasher hasher(types);
        constexpr std::size_t BUFSIZE = 32768;
        std::vector<char> buffer(BUFSIZE);
        std::size_t count;
        while ((count = infile.read(buffer.data(), 1, BUFSIZE)) > 0)
        {
            hasher.update(buffer.data(), count);
        }
        if (infile.error())
        {
            return tl::unexpected(DownloaderError{ ErrorLevel::FATAL,
                                                   ErrorCode::ML_IO,
                                                   fmt::format("Could not read {}", path.string()) });
        }
        return hasher.final_hex();
    }
}
