#include <doctest/doctest.h>

#include <metaloader/fileio.hpp>
#include <metaloader/storage.hpp>

#include "helpers.hpp"

using namespace metaloader;
using metaloader::testing::read_file;
using metaloader::testing::TemporaryDirectory;
using metaloader::testing::write_file;

TEST_SUITE("fileio")
{
    TEST_CASE("open")
    {
        TemporaryDirectory tmp;
        std::error_code ec;
        FileIO f(tmp.path() / "test.txt", FileIO::write_update_binary, ec);

        CHECK_FALSE(ec);
        CHECK(f.open());
        f.write("test", 1, 4);
        f.close(ec);
        CHECK_FALSE(ec);
        CHECK_EQ(read_file(tmp.path() / "test.txt"), "test");
    }

    TEST_CASE("open_missing")
    {
        TemporaryDirectory tmp;
        std::error_code ec;
        FileIO f(tmp.path() / "missing" / "test.txt", FileIO::read_update_binary, ec);
        CHECK(ec);
        CHECK_FALSE(f.open());
    }

    TEST_CASE("positional_io")
    {
        TemporaryDirectory tmp;
        std::error_code ec;
        FileIO f(tmp.path() / "pos.bin", FileIO::write_update_binary, ec);
        REQUIRE_FALSE(ec);

        f.write_at("world", 5, 6, ec);
        CHECK_FALSE(ec);
        f.write_at("hello ", 6, 0, ec);
        CHECK_FALSE(ec);

        char buffer[16] = {};
        CHECK_EQ(f.read_at(buffer, 5, 6, ec), 5);
        CHECK_EQ(std::string(buffer, 5), "world");
        // short read at the end
        CHECK_EQ(f.read_at(buffer, 16, 8, ec), 3);
        CHECK_FALSE(ec);
    }

    TEST_CASE("truncate")
    {
        TemporaryDirectory tmp;
        write_file(tmp.path() / "trunc.txt", "Hello world this is file number 1");

        std::error_code ec;
        {
            FileIO f(tmp.path() / "trunc.txt", FileIO::read_update_binary, ec);
            REQUIRE_FALSE(ec);
            f.truncate(5, ec);
            CHECK_FALSE(ec);
        }
        CHECK_EQ(read_file(tmp.path() / "trunc.txt"), "Hello");
    }
}

TEST_SUITE("storage")
{
    TEST_CASE("open_creates_parents")
    {
        TemporaryDirectory tmp;
        FileStorage storage;
        auto handle = storage.open(tmp.path() / "a" / "b" / "file.bin");
        REQUIRE(handle.has_value());
        CHECK(fs::exists(tmp.path() / "a" / "b" / "file.bin"));
        CHECK((*handle)->finalize().has_value());
    }

    TEST_CASE("keeps_existing_content")
    {
        TemporaryDirectory tmp;
        write_file(tmp.path() / "file.bin", "0123456789");

        FileStorage storage;
        auto handle = storage.open(tmp.path() / "file.bin");
        REQUIRE(handle.has_value());
        auto& h = **handle;

        auto size = h.size();
        REQUIRE(size.has_value());
        CHECK_EQ(size.value(), 10);

        CHECK(h.write_at(2, "ab", 2).has_value());
        CHECK(h.truncate(6).has_value());
        CHECK(h.finalize().has_value());
        CHECK_EQ(read_file(tmp.path() / "file.bin"), "01ab45");
    }

    TEST_CASE("finalized_handle_refuses_io")
    {
        TemporaryDirectory tmp;
        FileStorage storage;
        auto handle = storage.open(tmp.path() / "file.bin");
        REQUIRE(handle.has_value());
        auto& h = **handle;
        REQUIRE(h.finalize().has_value());

        auto res = h.write_at(0, "x", 1);
        REQUIRE_FALSE(res.has_value());
        CHECK_EQ(res.error().code, ErrorCode::ML_IO);
        CHECK(res.error().is_fatal());
    }

    TEST_CASE("unwritable_destination")
    {
        TemporaryDirectory tmp;
        write_file(tmp.path() / "plain", "a file, not a directory");

        FileStorage storage;
        auto handle = storage.open(tmp.path() / "plain" / "file.bin");
        REQUIRE_FALSE(handle.has_value());
        CHECK_EQ(handle.error().code, ErrorCode::ML_IO);
    }
}
