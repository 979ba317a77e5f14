#include <doctest/doctest.h>

#include <map>
#include <mutex>
#include <system_error>
#include <thread>

#include <metaloader/downloader.hpp>
#include <metaloader/target.hpp>

#include "helpers.hpp"

using namespace metaloader;
using metaloader::testing::make_content;
using metaloader::testing::read_file;
using metaloader::testing::TemporaryDirectory;
using metaloader::testing::write_file;

namespace
{
    // Behavior of one url of the in-memory transport.
    struct Source
    {
        std::string content;
        bool ranges = true;
        // Every fetch answers with this status when not 2xx.
        long status = 200;
        // The first fetches answer 503.
        int transient_failures = 0;
        // A byte at this file offset is flipped in every body.
        std::optional<std::uint64_t> corrupt_at;
        bool probe_fails = false;
        std::chrono::milliseconds chunk_delay{ 0 };
    };

    class MemoryTransport : public Transport
    {
    public:
        void add(const std::string& url, Source source)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sources[url] = std::move(source);
        }

        int fetches(const std::string& url) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_requests.find(url);
            return it == m_requests.end() ? 0 : static_cast<int>(it->second.size());
        }

        int total_fetches() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            int total = 0;
            for (const auto& [url, requests] : m_requests)
                total += static_cast<int>(requests.size());
            return total;
        }

        std::vector<std::optional<ByteRange>> requests(const std::string& url) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_requests.find(url);
            return it == m_requests.end() ? std::vector<std::optional<ByteRange>>() : it->second;
        }

        int probes(const std::string& url) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_probes.find(url);
            return it == m_probes.end() ? 0 : it->second;
        }

        int max_concurrent(const std::string& url) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_max_running.find(url);
            return it == m_max_running.end() ? 0 : it->second;
        }

        tl::expected<FetchResponse, DownloaderError> fetch(const FetchRequest& request,
                                                           FetchSink& sink,
                                                           const CancellationToken& token) override
        {
            Source source;
            bool transient_failure = false;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_requests[request.url].push_back(request.range);
                auto it = m_sources.find(request.url);
                if (it == m_sources.end())
                    return tl::unexpected(status_error(404, request.url));
                source = it->second;
                if (it->second.transient_failures > 0)
                {
                    it->second.transient_failures--;
                    transient_failure = true;
                }
                int& running = m_running[request.url];
                ++running;
                m_max_running[request.url] = std::max(m_max_running[request.url], running);
            }
            RunningGuard guard{ this, request.url };

            if (transient_failure)
                return tl::unexpected(status_error(503, request.url));
            if (source.status < 200 || source.status >= 300)
                return tl::unexpected(status_error(source.status, request.url));

            std::string body = source.content;
            if (source.corrupt_at && *source.corrupt_at < body.size())
                body[*source.corrupt_at] = static_cast<char>(body[*source.corrupt_at] ^ 0xFF);

            FetchResponse response;
            response.effective_url = request.url;
            if (request.range && source.ranges)
            {
                body = body.substr(request.range->first, request.range->size());
                response.http_status = 206;
                response.range_honored = true;
            }
            else
            {
                response.http_status = 200;
            }
            response.content_length = body.size();

            if (!sink.on_response(response))
                return tl::unexpected(interrupted(request.url));

            constexpr std::size_t chunk_size = 512;
            for (std::size_t pos = 0; pos < body.size(); pos += chunk_size)
            {
                if (source.chunk_delay.count() > 0)
                    std::this_thread::sleep_for(source.chunk_delay);
                if (token.is_cancelled())
                    return tl::unexpected(interrupted(request.url));
                const std::size_t n = std::min(chunk_size, body.size() - pos);
                if (!sink.on_data(body.data() + pos, n))
                    return tl::unexpected(interrupted(request.url));
            }
            return response;
        }

        tl::expected<ProbeResult, DownloaderError> probe(const std::string& url,
                                                         const CancellationToken&) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_probes[url]++;
            auto it = m_sources.find(url);
            if (it == m_sources.end())
                return tl::unexpected(status_error(404, url));
            if (it->second.probe_fails)
                return tl::unexpected(status_error(503, url));

            ProbeResult result;
            result.size = it->second.content.size();
            result.ranges_supported = it->second.ranges;
            return result;
        }

    private:
        struct RunningGuard
        {
            MemoryTransport* self;
            std::string url;

            ~RunningGuard()
            {
                std::lock_guard<std::mutex> lock(self->m_mutex);
                self->m_running[url]--;
            }
        };

        static DownloaderError status_error(long status, const std::string& url)
        {
            const bool transient = status >= 500;
            return DownloaderError{ transient ? ErrorLevel::SERIOUS : ErrorLevel::INFO,
                                    transient ? ErrorCode::ML_TEMPORARYERR
                                              : ErrorCode::ML_BADSTATUS,
                                    fmt::format("Server returned {} for {}", status, url),
                                    status };
        }

        static DownloaderError interrupted(const std::string& url)
        {
            return DownloaderError{ ErrorLevel::INFO,
                                    ErrorCode::ML_INTERRUPTED,
                                    fmt::format("Transfer of {} interrupted", url) };
        }

        mutable std::mutex m_mutex;
        std::map<std::string, Source> m_sources;
        std::map<std::string, std::vector<std::optional<ByteRange>>> m_requests;
        std::map<std::string, int> m_probes;
        std::map<std::string, int> m_running;
        std::map<std::string, int> m_max_running;
    };

    class FailingStorage : public Storage
    {
    public:
        tl::expected<std::unique_ptr<StorageHandle>, DownloaderError> open(
            const fs::path& path) override
        {
            return tl::unexpected(
                io_error(path, "open", std::make_error_code(std::errc::permission_denied)));
        }
    };

    class RecordingObserver : public ProgressObserver
    {
    public:
        void on_segment_state(const SegmentEvent& event) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (event.state == SegmentState::kCOMPLETED)
                completed_segments++;
        }

        void on_bytes(const std::string&, std::uint64_t bytes) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            received += bytes;
            if (cancel_on_bytes)
                cancel_on_bytes->cancel();
        }

        void on_file_finished(const DownloadResult&) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            finished_files++;
        }

        std::mutex m_mutex;
        int completed_segments = 0;
        int finished_files = 0;
        std::uint64_t received = 0;
        CancellationToken* cancel_on_bytes = nullptr;
    };

    const std::string mirror1 = "https://mirror1.example/pub/file.bin";
    const std::string mirror2 = "https://mirror2.example/pub/file.bin";

    Context test_context()
    {
        Context ctx;
        ctx.max_parallel_downloads = 3;
        ctx.min_segment_size = 1000;
        ctx.retry_default_timeout = std::chrono::milliseconds(1);
        return ctx;
    }

    Resource resource(const std::string& url, std::optional<std::uint32_t> priority, std::size_t order)
    {
        Resource r;
        r.url = url;
        r.protocol = Protocol::kHTTP;
        r.priority = priority;
        r.declared_order = order;
        return r;
    }

    FileEntry file_entry(const std::string& name,
                         const std::string& content,
                         const std::vector<std::string>& urls)
    {
        FileEntry entry;
        entry.name = name;
        entry.size = content.size();
        entry.checksums.push_back({ ChecksumType::kSHA256, "sha-256", sha256(content) });
        for (std::size_t i = 0; i < urls.size(); ++i)
            entry.resources.push_back(resource(urls[i], static_cast<std::uint32_t>(i + 1), i));
        return entry;
    }

    PieceHashes pieces_of(const std::string& content, std::uint64_t length)
    {
        PieceHashes pieces;
        pieces.type = ChecksumType::kSHA256;
        pieces.tag = "sha-256";
        pieces.length = length;
        for (std::uint64_t start = 0; start < content.size(); start += length)
            pieces.hashes.push_back(sha256(content.substr(start, length)));
        return pieces;
    }

    Metalink metalink_of(std::vector<FileEntry> entries)
    {
        Metalink ml;
        ml.files = std::move(entries);
        return ml;
    }

    RunReport run(const Context& ctx,
                  Transport& transport,
                  const Metalink& ml,
                  const fs::path& dir,
                  RunContext& run_ctx)
    {
        FileStorage storage;
        Downloader dl(ctx, transport, storage);
        return dl.download(ml, dir, run_ctx);
    }

    RunReport run(const Context& ctx, Transport& transport, const Metalink& ml, const fs::path& dir)
    {
        RunContext run_ctx;
        return run(ctx, transport, ml, dir, run_ctx);
    }
}

TEST_SUITE("downloader")
{
    TEST_CASE("segmented_download_from_the_best_mirror")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(3000);

        MemoryTransport transport;
        transport.add(mirror1, Source{ content });
        transport.add(mirror2, Source{ content });

        RunContext run_ctx;
        RecordingObserver observer;
        run_ctx.observer = &observer;
        auto report = run(ctx,
                          transport,
                          metalink_of({ file_entry("file.bin", content, { mirror1, mirror2 }) }),
                          tmp.path(),
                          run_ctx);

        REQUIRE_EQ(report.results.size(), 1);
        const auto& result = report.results[0];
        CHECK_EQ(result.status, FileStatus::kVERIFIED);
        CHECK(report.success());
        CHECK_EQ(result.destination, tmp.path() / "file.bin");
        CHECK_EQ(result.last_mirror, std::optional<std::string>(mirror1));
        CHECK_EQ(result.bytes_written, 3000);
        CHECK_EQ(result.bytes_transferred, 3000);
        CHECK_EQ(read_file(tmp.path() / "file.bin"), content);

        // the size is declared: no probe, three ranged requests to the preferred mirror
        CHECK_EQ(transport.probes(mirror1), 0);
        CHECK_EQ(transport.fetches(mirror1), 3);
        CHECK_EQ(transport.fetches(mirror2), 0);
        for (const auto& range : transport.requests(mirror1))
            CHECK(range.has_value());

        CHECK_EQ(observer.completed_segments, 3);
        CHECK_EQ(observer.finished_files, 1);
        CHECK_EQ(observer.received, 3000);
    }

    TEST_CASE("transient_errors_move_to_the_next_mirror")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(3000);

        MemoryTransport transport;
        transport.add(mirror1, Source{ content, true, 500 });
        transport.add(mirror2, Source{ content });

        auto report = run(ctx,
                          transport,
                          metalink_of({ file_entry("file.bin", content, { mirror1, mirror2 }) }),
                          tmp.path());

        CHECK_EQ(report.results[0].status, FileStatus::kVERIFIED);
        CHECK_EQ(read_file(tmp.path() / "file.bin"), content);
        CHECK_GE(transport.fetches(mirror1), 1);
        CHECK_LE(transport.fetches(mirror1), ctx.allowed_mirror_failures);
        CHECK_GE(transport.fetches(mirror2), 1);
    }

    TEST_CASE("transient_errors_are_retried")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(500);

        Source flaky{ content };
        flaky.transient_failures = 2;
        MemoryTransport transport;
        transport.add(mirror1, flaky);

        auto report = run(
            ctx, transport, metalink_of({ file_entry("file.bin", content, { mirror1 }) }), tmp.path());

        CHECK_EQ(report.results[0].status, FileStatus::kVERIFIED);
        CHECK_EQ(transport.fetches(mirror1), 3);
    }

    TEST_CASE("attempts_per_segment_are_bounded")
    {
        TemporaryDirectory tmp;
        Context ctx = test_context();
        ctx.allowed_mirror_failures = 0;
        ctx.max_attempts_per_segment = 3;
        const std::string content = make_content(500);

        MemoryTransport transport;
        transport.add(mirror1, Source{ content, true, 503 });

        auto report = run(
            ctx, transport, metalink_of({ file_entry("file.bin", content, { mirror1 }) }), tmp.path());

        const auto& result = report.results[0];
        CHECK_EQ(result.status, FileStatus::kINCOMPLETE_NO_MIRRORS);
        REQUIRE(result.error.has_value());
        CHECK_EQ(result.error->code, ErrorCode::ML_TEMPORARYERR);
        CHECK_EQ(transport.fetches(mirror1), 3);
    }

    TEST_CASE("failure_budget_of_a_mirror")
    {
        TemporaryDirectory tmp;
        Context ctx = test_context();
        ctx.allowed_mirror_failures = 2;
        ctx.max_attempts_per_segment = 10;
        const std::string content = make_content(500);

        MemoryTransport transport;
        transport.add(mirror1, Source{ content, true, 500 });

        auto report = run(
            ctx, transport, metalink_of({ file_entry("file.bin", content, { mirror1 }) }), tmp.path());

        CHECK_EQ(report.results[0].status, FileStatus::kINCOMPLETE_NO_MIRRORS);
        CHECK_EQ(transport.fetches(mirror1), 2);
    }

    TEST_CASE("not_found")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(500);

        SUBCASE("single mirror")
        {
            MemoryTransport transport;
            transport.add(mirror1, Source{ content, true, 404 });

            auto report = run(ctx,
                              transport,
                              metalink_of({ file_entry("file.bin", content, { mirror1 }) }),
                              tmp.path());

            const auto& result = report.results[0];
            CHECK_EQ(result.status, FileStatus::kINCOMPLETE_NO_MIRRORS);
            REQUIRE(result.error.has_value());
            CHECK_EQ(result.error->http_status, 404);
            // a permanent error is not retried on the same mirror
            CHECK_EQ(transport.fetches(mirror1), 1);
            CHECK_FALSE(report.success());
        }

        SUBCASE("fallback")
        {
            MemoryTransport transport;
            transport.add(mirror1, Source{ content, true, 404 });
            transport.add(mirror2, Source{ content });

            auto report = run(ctx,
                              transport,
                              metalink_of({ file_entry("file.bin", content, { mirror1, mirror2 }) }),
                              tmp.path());

            CHECK_EQ(report.results[0].status, FileStatus::kVERIFIED);
            CHECK_EQ(report.results[0].last_mirror, std::optional<std::string>(mirror2));
            CHECK_EQ(transport.fetches(mirror1), 1);
        }
    }

    TEST_CASE("corrupt_piece_is_fetched_again_from_another_mirror")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(4000);

        // the third piece is damaged on the preferred mirror
        Source corrupt{ content };
        corrupt.corrupt_at = 2500;
        MemoryTransport transport;
        transport.add(mirror1, corrupt);
        transport.add(mirror2, Source{ content });

        FileEntry entry = file_entry("file.bin", content, { mirror1, mirror2 });
        entry.pieces = pieces_of(content, 1000);

        auto report = run(ctx, transport, metalink_of({ entry }), tmp.path());

        const auto& result = report.results[0];
        CHECK_EQ(result.status, FileStatus::kVERIFIED);
        CHECK_EQ(read_file(tmp.path() / "file.bin"), content);
        CHECK_GE(transport.fetches(mirror2), 1);
        // only the damaged piece was fetched twice
        CHECK_EQ(result.bytes_transferred, 5000);
        CHECK_EQ(transport.total_fetches(), 5);
    }

    TEST_CASE("corrupt_piece_without_alternative")
    {
        TemporaryDirectory tmp;
        Context ctx = test_context();
        ctx.max_attempts_per_segment = 2;
        const std::string content = make_content(3000);

        Source corrupt{ content };
        corrupt.corrupt_at = 1500;
        MemoryTransport transport;
        transport.add(mirror1, corrupt);

        FileEntry entry = file_entry("file.bin", content, { mirror1 });
        entry.pieces = pieces_of(content, 1000);

        auto report = run(ctx, transport, metalink_of({ entry }), tmp.path());

        const auto& result = report.results[0];
        CHECK_EQ(result.status, FileStatus::kCHECKSUM_MISMATCH);
        REQUIRE(result.error.has_value());
        CHECK_EQ(result.error->code, ErrorCode::ML_PIECE_MISMATCH);
    }

    TEST_CASE("whole_file_checksum_mismatch")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(3000);

        Source corrupt{ content };
        corrupt.corrupt_at = 10;

        SUBCASE("other mirror is good")
        {
            MemoryTransport transport;
            transport.add(mirror1, corrupt);
            transport.add(mirror2, Source{ content });

            auto report = run(ctx,
                              transport,
                              metalink_of({ file_entry("file.bin", content, { mirror1, mirror2 }) }),
                              tmp.path());

            CHECK_EQ(report.results[0].status, FileStatus::kVERIFIED);
            CHECK_EQ(read_file(tmp.path() / "file.bin"), content);
            CHECK_GE(transport.fetches(mirror2), 3);
        }

        SUBCASE("no attempt left")
        {
            Context one_attempt = ctx;
            one_attempt.max_attempts_per_segment = 1;

            MemoryTransport transport;
            transport.add(mirror1, corrupt);
            transport.add(mirror2, Source{ content });

            auto report = run(one_attempt,
                              transport,
                              metalink_of({ file_entry("file.bin", content, { mirror1, mirror2 }) }),
                              tmp.path());

            const auto& result = report.results[0];
            CHECK_EQ(result.status, FileStatus::kCHECKSUM_MISMATCH);
            REQUIRE(result.error.has_value());
            CHECK_EQ(result.error->code, ErrorCode::ML_CHECKSUM_MISMATCH);
            CHECK_EQ(transport.fetches(mirror1), 3);
            CHECK_EQ(transport.fetches(mirror2), 0);
        }

        SUBCASE("every mirror is bad")
        {
            MemoryTransport transport;
            transport.add(mirror1, corrupt);
            transport.add(mirror2, corrupt);

            auto report = run(ctx,
                              transport,
                              metalink_of({ file_entry("file.bin", content, { mirror1, mirror2 }) }),
                              tmp.path());

            const auto& result = report.results[0];
            CHECK_EQ(result.status, FileStatus::kCHECKSUM_MISMATCH);
            REQUIRE(result.error.has_value());
            CHECK_EQ(result.error->code, ErrorCode::ML_CHECKSUM_MISMATCH);
        }
    }

    TEST_CASE("mirror_without_byte_ranges")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(3000);

        Source whole{ content };
        whole.ranges = false;

        SUBCASE("single mirror")
        {
            MemoryTransport transport;
            transport.add(mirror1, whole);

            auto report = run(ctx,
                              transport,
                              metalink_of({ file_entry("file.bin", content, { mirror1 }) }),
                              tmp.path());

            const auto& result = report.results[0];
            CHECK_EQ(result.status, FileStatus::kVERIFIED);
            CHECK_EQ(read_file(tmp.path() / "file.bin"), content);
            // one stream writes every segment
            CHECK_EQ(result.bytes_transferred, 3000);
            CHECK_EQ(transport.fetches(mirror1), 1);
        }

        SUBCASE("with pieces")
        {
            MemoryTransport transport;
            transport.add(mirror1, whole);

            FileEntry entry = file_entry("file.bin", content, { mirror1 });
            entry.pieces = pieces_of(content, 1000);

            auto report = run(ctx, transport, metalink_of({ entry }), tmp.path());

            const auto& result = report.results[0];
            CHECK_EQ(result.status, FileStatus::kVERIFIED);
            CHECK_EQ(result.bytes_transferred, 3000);
            CHECK_EQ(transport.fetches(mirror1), 1);
        }

        SUBCASE("preferred mirror")
        {
            MemoryTransport transport;
            transport.add(mirror1, whole);
            transport.add(mirror2, Source{ content });

            auto report = run(ctx,
                              transport,
                              metalink_of({ file_entry("file.bin", content, { mirror1, mirror2 }) }),
                              tmp.path());

            const auto& result = report.results[0];
            CHECK_EQ(result.status, FileStatus::kVERIFIED);
            CHECK_EQ(result.bytes_transferred, 3000);
            CHECK_EQ(transport.fetches(mirror1), 1);
            CHECK_EQ(transport.fetches(mirror2), 0);
        }
    }

    TEST_CASE("unknown_size_is_probed")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(3000);

        FileEntry entry = file_entry("file.bin", content, { mirror1, mirror2 });
        entry.size.reset();

        SUBCASE("probe answers")
        {
            MemoryTransport transport;
            transport.add(mirror1, Source{ content });
            transport.add(mirror2, Source{ content });

            auto report = run(ctx, transport, metalink_of({ entry }), tmp.path());

            const auto& result = report.results[0];
            CHECK_EQ(result.status, FileStatus::kVERIFIED);
            CHECK_EQ(result.total_bytes, std::optional<std::uint64_t>(3000));
            CHECK_EQ(transport.probes(mirror1), 1);
            CHECK_EQ(transport.probes(mirror2), 0);
            CHECK_EQ(transport.fetches(mirror1), 3);
        }

        SUBCASE("probe fails")
        {
            Source no_probe{ content };
            no_probe.probe_fails = true;
            MemoryTransport transport;
            transport.add(mirror1, no_probe);

            auto report = run(ctx, transport, metalink_of({ entry }), tmp.path());

            const auto& result = report.results[0];
            CHECK_EQ(result.status, FileStatus::kVERIFIED);
            CHECK_EQ(result.total_bytes, std::optional<std::uint64_t>(3000));
            // streamed in one request
            REQUIRE_EQ(transport.fetches(mirror1), 1);
            CHECK_FALSE(transport.requests(mirror1)[0].has_value());
            CHECK_EQ(read_file(tmp.path() / "file.bin"), content);
        }
    }

    TEST_CASE("empty_file")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();

        MemoryTransport transport;
        transport.add(mirror1, Source{ "" });

        auto report = run(
            ctx, transport, metalink_of({ file_entry("empty.bin", "", { mirror1 }) }), tmp.path());

        CHECK_EQ(report.results[0].status, FileStatus::kVERIFIED);
        CHECK(fs::exists(tmp.path() / "empty.bin"));
        CHECK_EQ(fs::file_size(tmp.path() / "empty.bin"), 0);
    }

    TEST_CASE("unverifiable_file")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(1500);

        FileEntry entry = file_entry("file.bin", content, { mirror1 });
        entry.checksums = { { ChecksumType::kUNSUPPORTED, "tiger", "0123" } };

        MemoryTransport transport;
        transport.add(mirror1, Source{ content });

        auto report = run(ctx, transport, metalink_of({ entry }), tmp.path());

        CHECK_EQ(report.results[0].status, FileStatus::kCOMPLETED_UNVERIFIED);
        CHECK_FALSE(report.success());
        CHECK(report.success(true));
        CHECK_EQ(read_file(tmp.path() / "file.bin"), content);
    }

    TEST_CASE("io_error")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(500);

        MemoryTransport transport;
        transport.add(mirror1, Source{ content });
        FailingStorage storage;
        Downloader dl(ctx, transport, storage);
        RunContext run_ctx;

        auto report = dl.download(
            metalink_of({ file_entry("file.bin", content, { mirror1 }) }), tmp.path(), run_ctx);

        const auto& result = report.results[0];
        CHECK_EQ(result.status, FileStatus::kIO_ERROR);
        REQUIRE(result.error.has_value());
        CHECK_EQ(result.error->code, ErrorCode::ML_IO);
        CHECK_EQ(transport.total_fetches(), 0);
    }

    TEST_CASE("rejected_files_do_not_stop_the_others")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(500);

        MemoryTransport transport;
        transport.add(mirror1, Source{ content });

        FileEntry no_url = file_entry("no-url.bin", content, {});
        FileEntry bad_pieces = file_entry("bad-pieces.bin", content, { mirror1 });
        bad_pieces.pieces = pieces_of(content, 100);
        bad_pieces.pieces->hashes.pop_back();

        auto report = run(ctx,
                          transport,
                          metalink_of({ file_entry("file.bin", content, { mirror1 }),
                                        file_entry("file.bin", content, { mirror1 }),
                                        no_url,
                                        bad_pieces }),
                          tmp.path());

        REQUIRE_EQ(report.results.size(), 4);
        CHECK_EQ(report.results[0].status, FileStatus::kVERIFIED);
        CHECK_EQ(report.results[1].status, FileStatus::kPLAN_ERROR);
        CHECK_EQ(report.results[2].status, FileStatus::kPLAN_ERROR);
        REQUIRE(report.results[2].error.has_value());
        CHECK_EQ(report.results[2].error->code, ErrorCode::ML_UNRESOLVABLE_FILE);
        CHECK_EQ(report.results[3].status, FileStatus::kPLAN_ERROR);
        REQUIRE(report.results[3].error.has_value());
        CHECK_EQ(report.results[3].error->code, ErrorCode::ML_INVALID_PIECE_LAYOUT);
        CHECK_FALSE(report.success());
        CHECK_EQ(transport.fetches(mirror1), 1);
    }

    TEST_CASE("connections_per_mirror")
    {
        TemporaryDirectory tmp;
        Context ctx = test_context();
        ctx.max_parallel_downloads = 4;
        const std::string content = make_content(4000);

        Source slow{ content };
        slow.chunk_delay = std::chrono::milliseconds(2);
        MemoryTransport transport;
        transport.add(mirror1, slow);

        FileEntry entry = file_entry("file.bin", content, { mirror1 });
        entry.resources[0].max_connections = 1;

        auto report = run(ctx, transport, metalink_of({ entry }), tmp.path());

        CHECK_EQ(report.results[0].status, FileStatus::kVERIFIED);
        CHECK_EQ(transport.fetches(mirror1), 4);
        CHECK_EQ(transport.max_concurrent(mirror1), 1);
    }

    TEST_CASE("several_files")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string first = make_content(2500, 1);
        const std::string second = make_content(700, 2);
        const std::string url_first = "https://mirror1.example/a.bin";
        const std::string url_second = "https://mirror1.example/sub/b.bin";

        MemoryTransport transport;
        transport.add(url_first, Source{ first });
        transport.add(url_second, Source{ second });

        auto report = run(ctx,
                          transport,
                          metalink_of({ file_entry("a.bin", first, { url_first }),
                                        file_entry("sub/b.bin", second, { url_second }) }),
                          tmp.path());

        CHECK(report.success());
        CHECK_EQ(report.bytes_transferred(), 3200);
        REQUIRE(report.find("sub/b.bin") != nullptr);
        CHECK_EQ(report.find("sub/b.bin")->status, FileStatus::kVERIFIED);
        CHECK(report.find("c.bin") == nullptr);
        CHECK_EQ(read_file(tmp.path() / "a.bin"), first);
        CHECK_EQ(read_file(tmp.path() / "sub" / "b.bin"), second);
    }

    TEST_CASE("cancellation")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(3000);

        SUBCASE("before the run")
        {
            MemoryTransport transport;
            transport.add(mirror1, Source{ content });

            RunContext run_ctx;
            run_ctx.token.cancel();
            auto report = run(ctx,
                              transport,
                              metalink_of({ file_entry("file.bin", content, { mirror1 }) }),
                              tmp.path(),
                              run_ctx);

            CHECK_EQ(report.results[0].status, FileStatus::kCANCELLED);
            CHECK_EQ(transport.total_fetches(), 0);
        }

        SUBCASE("during the run")
        {
            Source slow{ content };
            slow.chunk_delay = std::chrono::milliseconds(5);
            MemoryTransport transport;
            transport.add(mirror1, slow);

            RunContext run_ctx;
            RecordingObserver observer;
            observer.cancel_on_bytes = &run_ctx.token;
            run_ctx.observer = &observer;

            auto report = run(ctx,
                              transport,
                              metalink_of({ file_entry("file.bin", content, { mirror1 }) }),
                              tmp.path(),
                              run_ctx);

            CHECK_EQ(report.results[0].status, FileStatus::kCANCELLED);
            CHECK_FALSE(report.success(true));
        }
    }

    TEST_CASE("failfast")
    {
        TemporaryDirectory tmp;
        Context ctx = test_context();
        ctx.failfast = true;
        const std::string content = make_content(3000);
        const std::string missing = "https://mirror1.example/missing.bin";

        Source slow{ content };
        slow.chunk_delay = std::chrono::milliseconds(5);
        MemoryTransport transport;
        transport.add(mirror2, slow);
        transport.add(missing, Source{ content, true, 404 });

        RunContext run_ctx;
        auto report = run(ctx,
                          transport,
                          metalink_of({ file_entry("missing.bin", content, { missing }),
                                        file_entry("file.bin", content, { mirror2 }) }),
                          tmp.path(),
                          run_ctx);

        CHECK(run_ctx.token.is_cancelled());
        CHECK_EQ(report.results[0].status, FileStatus::kINCOMPLETE_NO_MIRRORS);
        const auto other = report.results[1].status;
        CHECK((other == FileStatus::kCANCELLED || other == FileStatus::kVERIFIED));
        CHECK_FALSE(report.success());
    }
}

TEST_SUITE("resume")
{
    TEST_CASE("valid_pieces_are_not_fetched_again")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(3000);

        // two good pieces and a damaged tail
        std::string on_disk = content;
        on_disk[2500] = static_cast<char>(on_disk[2500] ^ 0xFF);
        write_file(tmp.path() / "file.bin", on_disk);

        MemoryTransport transport;
        transport.add(mirror1, Source{ content });

        FileEntry entry = file_entry("file.bin", content, { mirror1 });
        entry.pieces = pieces_of(content, 1000);

        auto plan = DownloadPlan::from_metalink(metalink_of({ entry }), tmp.path());
        plan.minimize(ctx);
        REQUIRE_EQ(plan.files.size(), 1);
        const std::vector<std::size_t> valid{ 0, 1 };
        CHECK_EQ(plan.files[0].completed_pieces, valid);
        CHECK_EQ(plan.files[0].remaining_size, std::optional<std::uint64_t>(1000));
        CHECK_EQ(plan.remaining_bytes(), 1000);

        FileStorage storage;
        Downloader dl(ctx, transport, storage);
        RunContext run_ctx;
        auto report = dl.download(plan, run_ctx);

        CHECK_EQ(report.results[0].status, FileStatus::kVERIFIED);
        CHECK_EQ(read_file(tmp.path() / "file.bin"), content);
        auto requests = transport.requests(mirror1);
        REQUIRE_EQ(requests.size(), 1);
        REQUIRE(requests[0].has_value());
        CHECK_EQ(requests[0]->first, 2000);
        CHECK_EQ(requests[0]->last, 2999);
    }

    TEST_CASE("complete_file_is_not_downloaded")
    {
        TemporaryDirectory tmp;
        Context ctx = test_context();
        const std::string content = make_content(3000);
        write_file(tmp.path() / "file.bin", content);

        MemoryTransport transport;
        transport.add(mirror1, Source{ content });
        const Metalink ml = metalink_of({ file_entry("file.bin", content, { mirror1 }) });

        SUBCASE("resume")
        {
            auto report = run(ctx, transport, ml, tmp.path());
            CHECK_EQ(report.results[0].status, FileStatus::kVERIFIED);
            CHECK_EQ(report.results[0].bytes_transferred, 0);
            CHECK_EQ(transport.total_fetches(), 0);
        }

        SUBCASE("no resume")
        {
            ctx.resume = false;
            auto report = run(ctx, transport, ml, tmp.path());
            CHECK_EQ(report.results[0].status, FileStatus::kVERIFIED);
            CHECK_EQ(transport.fetches(mirror1), 3);
        }
    }

    TEST_CASE("longer_stale_file_is_replaced")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(3000);
        write_file(tmp.path() / "file.bin", make_content(5000, 7));

        MemoryTransport transport;
        transport.add(mirror1, Source{ content });

        auto report = run(
            ctx, transport, metalink_of({ file_entry("file.bin", content, { mirror1 }) }), tmp.path());

        CHECK_EQ(report.results[0].status, FileStatus::kVERIFIED);
        CHECK_EQ(read_file(tmp.path() / "file.bin"), content);
    }
}

namespace
{
    // Reads the target back from its callbacks, which needs the file lock to be free.
    class InspectingObserver : public ProgressObserver
    {
    public:
        void on_segment_state(const SegmentEvent& event) override
        {
            segment_events++;
            if (finished)
                events_after_finish++;
            if (event.state == SegmentState::kCOMPLETED)
            {
                completed++;
                CHECK_EQ(target->segments().at(event.segment).state, SegmentState::kCOMPLETED);
            }
        }

        void on_file_finished(const DownloadResult& result) override
        {
            finished = true;
            status = result.status;
            state_when_finished = target->state();
        }

        FileTarget* target = nullptr;
        int segment_events = 0;
        int events_after_finish = 0;
        int completed = 0;
        bool finished = false;
        FileStatus status = FileStatus::kRUNNING;
        TargetState state_when_finished = TargetState::kNEW;
    };
}

TEST_SUITE("file_target")
{
    TEST_CASE("observer_runs_outside_the_file_lock")
    {
        TemporaryDirectory tmp;
        const Context ctx = test_context();
        const std::string content = make_content(3000);

        MemoryTransport transport;
        transport.add(mirror1, Source{ content });
        FileStorage storage;

        auto plan = DownloadPlan::from_metalink(
            metalink_of({ file_entry("file.bin", content, { mirror1 }) }), tmp.path());
        REQUIRE_EQ(plan.files.size(), 1);

        InspectingObserver observer;
        RunContext run_ctx;
        run_ctx.observer = &observer;
        FileTarget target(ctx, run_ctx, transport, storage, plan.files[0]);
        observer.target = &target;

        for (int i = 0; i < 1000 && !target.is_done(); ++i)
        {
            Assignment assignment;
            std::optional<std::chrono::steady_clock::time_point> wake_at;
            switch (target.next(assignment, wake_at))
            {
                case PollResult::kPREPARE:
                    target.prepare();
                    break;
                case PollResult::kFETCH:
                    target.fetch(assignment);
                    break;
                case PollResult::kVERIFY:
                    target.verify();
                    break;
                case PollResult::kWAIT:
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    break;
                case PollResult::kDONE:
                    break;
            }
        }

        REQUIRE(target.is_done());
        CHECK(observer.finished);
        CHECK_EQ(observer.status, FileStatus::kVERIFIED);
        CHECK_EQ(observer.state_when_finished, TargetState::kDONE);
        CHECK_EQ(observer.completed, 3);
        // started and completed, for each of the three segments
        CHECK_EQ(observer.segment_events, 6);
        CHECK_EQ(observer.events_after_finish, 0);
    }
}
