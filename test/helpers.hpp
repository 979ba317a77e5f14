#ifndef METALOADER_TEST_HELPERS_HPP
#define METALOADER_TEST_HELPERS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <fmt/format.h>

namespace metaloader::testing
{
    namespace fs = std::filesystem;

    // Fresh directory under the system temporary directory, removed on destruction.
    class TemporaryDirectory
    {
    public:
        TemporaryDirectory()
        {
            static std::atomic<int> counter{ 0 };
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            m_path = fs::temp_directory_path()
                     / fmt::format("metaloader-test-{}-{}", stamp, counter++);
            fs::create_directories(m_path);
        }

        ~TemporaryDirectory()
        {
            std::error_code ec;
            fs::remove_all(m_path, ec);
        }

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        const fs::path& path() const
        {
            return m_path;
        }

    private:
        fs::path m_path;
    };

    inline void write_file(const fs::path& path, const std::string& content)
    {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    inline std::string read_file(const fs::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    // Deterministic, non repeating content of `size` bytes.
    inline std::string make_content(std::size_t size, unsigned seed = 1)
    {
        std::string content(size, '\0');
        unsigned state = seed;
        for (auto& c : content)
        {
            state = state * 1103515245u + 12345u;
            c = static_cast<char>((state >> 16) & 0xFF);
        }
        return content;
    }

    inline fs::path test_data(const std::string& name)
    {
        return fs::path(METALOADER_TEST_DATA_DIR) / name;
    }
}

#endif
