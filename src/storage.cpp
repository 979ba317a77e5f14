#include <spdlog/spdlog.h>

#include <metaloader/storage.hpp>

namespace metaloader
{
    DownloaderError io_error(const fs::path& path,
                             const std::string& operation,
                             const std::error_code& ec)
    {
        return DownloaderError{
            ErrorLevel::FATAL,
            ErrorCode::ML_IO,
            fmt::format("Could not {} {}: {}", operation, path.string(), ec.message())
        };
    }

    FileStorageHandle::FileStorageHandle(std::unique_ptr<FileIO> file)
        : m_path(file->path())
        , m_file(std::move(file))
    {
    }

    FileStorageHandle::~FileStorageHandle()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file && m_file->open())
        {
            std::error_code ec;
            m_file->close(ec);
            if (ec)
            {
                spdlog::error("Could not close file: {}", m_path.string());
            }
        }
    }

    tl::expected<void, DownloaderError> FileStorageHandle::check_open() const
    {
        if (!m_file || !m_file->open())
        {
            return tl::unexpected(
                io_error(m_path, "access", std::make_error_code(std::errc::bad_file_descriptor)));
        }
        return {};
    }

    tl::expected<void, DownloaderError> FileStorageHandle::write_at(std::uint64_t offset,
                                                                    const char* buffer,
                                                                    std::size_t size)
    {
        auto open = check_open();
        if (!open)
            return open;

        std::error_code ec;
        m_file->write_at(buffer, size, offset, ec);
        if (ec)
            return tl::unexpected(io_error(m_path, "write", ec));
        return {};
    }

    tl::expected<std::size_t, DownloaderError> FileStorageHandle::read_at(std::uint64_t offset,
                                                                          char* buffer,
                                                                          std::size_t size)
    {
        auto open = check_open();
        if (!open)
            return tl::unexpected(open.error());

        std::error_code ec;
        const std::size_t got = m_file->read_at(buffer, size, offset, ec);
        if (ec)
            return tl::unexpected(io_error(m_path, "read", ec));
        return got;
    }

    tl::expected<void, DownloaderError> FileStorageHandle::truncate(std::uint64_t size)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto open = check_open();
        if (!open)
            return open;

        std::error_code ec;
        m_file->truncate(static_cast<std::streamoff>(size), ec);
        if (ec)
            return tl::unexpected(io_error(m_path, "truncate", ec));
        return {};
    }

    tl::expected<std::uint64_t, DownloaderError> FileStorageHandle::size()
    {
        std::error_code ec;
        const auto file_size = fs::file_size(m_path, ec);
        if (ec)
            return tl::unexpected(io_error(m_path, "stat", ec));
        return static_cast<std::uint64_t>(file_size);
    }

    tl::expected<void, DownloaderError> FileStorageHandle::finalize()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto open = check_open();
        if (!open)
            return open;

        std::error_code ec;
        m_file->sync(ec);
        if (ec)
            return tl::unexpected(io_error(m_path, "flush", ec));

        m_file->close(ec);
        if (ec)
            return tl::unexpected(io_error(m_path, "close", ec));
        return {};
    }

    tl::expected<std::unique_ptr<StorageHandle>, DownloaderError> FileStorage::open(
        const fs::path& path)
    {
        std::error_code ec;
        if (path.has_parent_path())
        {
            fs::create_directories(path.parent_path(), ec);
            if (ec)
                return tl::unexpected(io_error(path.parent_path(), "create directory", ec));
        }

        const auto open_mode
            = fs::exists(path) ? FileIO::read_update_binary : FileIO::write_update_binary;
        spdlog::info("Opening file {}", path.string());

        auto file = std::make_unique<FileIO>(path, open_mode, ec);
        if (ec)
            return tl::unexpected(io_error(path, "open", ec));

        return std::unique_ptr<StorageHandle>(std::make_unique<FileStorageHandle>(std::move(file)));
    }
}
