#ifndef METALOADER_FILEIO_HPP
#define METALOADER_FILEIO_HPP

#include <cassert>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#include <limits.h>

#ifndef _WIN32
#include <unistd.h>
#include <sys/types.h>
#else
#include <io.h>
#include <windows.h>
#endif


namespace metaloader
{
    namespace fs = std::filesystem;

    class FileIO
    {
    private:
        FILE* m_fs = nullptr;
        fs::path m_path;

    public:
#ifdef _WIN32
        constexpr static wchar_t read_update_binary[] = L"rb+";
        constexpr static wchar_t write_update_binary[] = L"wb+";
        constexpr static wchar_t read_binary[] = L"rb";
#else
        constexpr static char read_update_binary[] = "rb+";
        constexpr static char write_update_binary[] = "wb+";
        constexpr static char read_binary[] = "rb";
#endif

        FileIO() = default;

#ifdef _WIN32
        inline explicit FileIO(const fs::path& file_path,
                               const wchar_t* mode,
                               std::error_code& ec) noexcept
            : m_path(file_path)
        {
            m_fs = ::_wfsopen(file_path.wstring().c_str(), mode, _SH_DENYNO);
            if (!m_fs)
            {
                ec.assign(GetLastError(), std::generic_category());
                spdlog::error("Could not open file: {}", ec.message());
            }
        }
#else
        inline explicit FileIO(const fs::path& file_path,
                               const char* mode,
                               std::error_code& ec) noexcept
            : m_path(file_path)
        {
            m_fs = ::fopen(file_path.c_str(), mode);
            if (m_fs)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
                spdlog::error("Could not open file {}: {}", file_path.string(), ec.message());
            }
        }
#endif

        FileIO(const FileIO&) = delete;
        FileIO& operator=(const FileIO&) = delete;

        inline ~FileIO()
        {
            if (m_fs)
            {
                std::error_code ec;
                close(ec);
                if (ec)
                {
                    spdlog::error("Error: {}", ec.message());
                }
            }
        }

        inline int fd() const noexcept
        {
#ifndef _WIN32
            return ::fileno(m_fs);
#else
            return ::_fileno(m_fs);
#endif
        }

        inline bool open() const noexcept
        {
            return m_fs != nullptr;
        }

        inline std::size_t read(void* buffer,
                                std::size_t element_size,
                                std::size_t element_count) const noexcept
        {
            assert(m_fs);
            return ::fread(buffer, element_size, element_count, m_fs);
        }

        inline std::size_t write(const void* buffer,
                                 std::size_t element_size,
                                 std::size_t element_count) const noexcept
        {
            return ::fwrite(buffer, element_size, element_count, m_fs);
        }

        // Writes `size` bytes at `offset` without moving the stream position.
        // Several threads may write disjoint ranges of the same file concurrently.
        void write_at(const char* buffer,
                      std::size_t size,
                      std::uint64_t offset,
                      std::error_code& ec) const noexcept
        {
            ec.clear();
#ifndef _WIN32
            while (size > 0)
            {
                ssize_t written = ::pwrite(fd(), buffer, size, static_cast<off_t>(offset));
                if (written < 0)
                {
                    if (errno == EINTR)
                        continue;
                    ec.assign(errno, std::generic_category());
                    return;
                }
                buffer += written;
                size -= static_cast<std::size_t>(written);
                offset += static_cast<std::uint64_t>(written);
            }
#else
            HANDLE h = reinterpret_cast<HANDLE>(::_get_osfhandle(fd()));
            OVERLAPPED ov = {};
            ov.Offset = static_cast<DWORD>(offset & 0xFFFFFFFF);
            ov.OffsetHigh = static_cast<DWORD>(offset >> 32);
            DWORD written = 0;
            if (!::WriteFile(h, buffer, static_cast<DWORD>(size), &written, &ov)
                || written != size)
            {
                ec.assign(GetLastError(), std::generic_category());
            }
#endif
        }

        // Reads up to `size` bytes at `offset`, returns the number of bytes read
        // (short only at the end of the file).
        std::size_t read_at(char* buffer,
                            std::size_t size,
                            std::uint64_t offset,
                            std::error_code& ec) const noexcept
        {
            ec.clear();
            std::size_t total = 0;
#ifndef _WIN32
            while (total < size)
            {
                ssize_t got = ::pread(
                    fd(), buffer + total, size - total, static_cast<off_t>(offset + total));
                if (got < 0)
                {
                    if (errno == EINTR)
                        continue;
                    ec.assign(errno, std::generic_category());
                    break;
                }
                if (got == 0)
                    break;
                total += static_cast<std::size_t>(got);
            }
#else
            HANDLE h = reinterpret_cast<HANDLE>(::_get_osfhandle(fd()));
            OVERLAPPED ov = {};
            ov.Offset = static_cast<DWORD>(offset & 0xFFFFFFFF);
            ov.OffsetHigh = static_cast<DWORD>(offset >> 32);
            DWORD got = 0;
            if (!::ReadFile(h, buffer, static_cast<DWORD>(size), &got, &ov)
                && GetLastError() != ERROR_HANDLE_EOF)
            {
                ec.assign(GetLastError(), std::generic_category());
            }
            total = got;
#endif
            return total;
        }

        void truncate(std::streamoff length, std::error_code& ec) const noexcept
        {
#ifdef _WIN32
            return fs::resize_file(m_path, length, ec);
#else
            ec.clear();
            if (::ftruncate(fd(), length) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
#endif
        }

        void sync(std::error_code& ec) const noexcept
        {
            ec.clear();
            if (::fflush(m_fs) != 0)
            {
                ec.assign(errno, std::generic_category());
                return;
            }
#ifndef _WIN32
            if (::fsync(fd()) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
#endif
        }

        inline int error()
        {
            return ::ferror(m_fs);
        }

        inline const fs::path& path() const
        {
            return m_path;
        }

        void close(std::error_code& ec) noexcept
        {
            if (!m_fs)
            {
                ec.clear();
                return;
            }
            if (::fclose(m_fs) == 0)
            {
                ec.clear();
                m_fs = nullptr;
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }
        }
    };
}

#endif
