#ifndef METALOADER_STORAGE_HPP
#define METALOADER_STORAGE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include <tl/expected.hpp>

#include <metaloader/export.hpp>
#include <metaloader/errors.hpp>
#include <metaloader/fileio.hpp>

namespace metaloader
{
    namespace fs = std::filesystem;

    // An open destination file. Writes at distinct offsets may run concurrently.
    class METALOADER_API StorageHandle
    {
    public:
        virtual ~StorageHandle() = default;

        virtual tl::expected<void, DownloaderError> write_at(std::uint64_t offset,
                                                             const char* buffer,
                                                             std::size_t size)
            = 0;

        // Reads up to `size` bytes, fewer only at the end of the file.
        virtual tl::expected<std::size_t, DownloaderError> read_at(std::uint64_t offset,
                                                                   char* buffer,
                                                                   std::size_t size)
            = 0;

        virtual tl::expected<void, DownloaderError> truncate(std::uint64_t size) = 0;
        virtual tl::expected<std::uint64_t, DownloaderError> size() = 0;

        // Flushes to disk and closes. Later calls fail.
        virtual tl::expected<void, DownloaderError> finalize() = 0;

        virtual const fs::path& path() const = 0;
    };

    class METALOADER_API Storage
    {
    public:
        virtual ~Storage() = default;

        // Opens `path` for reading and writing, creating it (and its parents) if needed.
        // Existing content is kept.
        virtual tl::expected<std::unique_ptr<StorageHandle>, DownloaderError> open(
            const fs::path& path)
            = 0;
    };

    class METALOADER_API FileStorageHandle : public StorageHandle
    {
    public:
        explicit FileStorageHandle(std::unique_ptr<FileIO> file);
        ~FileStorageHandle() override;

        tl::expected<void, DownloaderError> write_at(std::uint64_t offset,
                                                     const char* buffer,
                                                     std::size_t size) override;
        tl::expected<std::size_t, DownloaderError> read_at(std::uint64_t offset,
                                                           char* buffer,
                                                           std::size_t size) override;
        tl::expected<void, DownloaderError> truncate(std::uint64_t size) override;
        tl::expected<std::uint64_t, DownloaderError> size() override;
        tl::expected<void, DownloaderError> finalize() override;

        const fs::path& path() const override
        {
            return m_path;
        }

    private:
        tl::expected<void, DownloaderError> check_open() const;

        fs::path m_path;
        // guards m_file itself, positional I/O on it needs no lock
        mutable std::mutex m_mutex;
        std::unique_ptr<FileIO> m_file;
    };

    // Storage on the local file system, through FileIO.
    class METALOADER_API FileStorage : public Storage
    {
    public:
        tl::expected<std::unique_ptr<StorageHandle>, DownloaderError> open(
            const fs::path& path) override;
    };

    METALOADER_API DownloaderError io_error(const fs::path& path,
                                            const std::string& operation,
                                            const std::error_code& ec);
}

#endif
