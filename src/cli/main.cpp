#include <algorithm>
#include <csignal>
#include <iostream>
#include <mutex>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <metaloader/metaloader.hpp>
#include <metaloader/url.hpp>
#include <metaloader/utils.hpp>

using namespace metaloader;

namespace
{
    constexpr int exit_success = 0;
    constexpr int exit_failure = 1;
    constexpr int exit_parse_error = 2;

    bool show_progress_bars = true;
    RunContext* active_run = nullptr;

    void handle_sigint(int)
    {
        if (active_run)
            active_run->token.cancel();
    }

    class ProgressPrinter : public ProgressObserver
    {
    public:
        explicit ProgressPrinter(std::uint64_t total)
            : m_total(total)
        {
        }

        void on_bytes(const std::string&, std::uint64_t bytes) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_done += bytes;
            if (!show_progress_bars)
                return;

            if (m_total == 0)
            {
                std::cout << "\r" << format_bytes(m_done) << std::flush;
                return;
            }

            const std::uint64_t done = std::min(m_done, m_total);
            const std::size_t bar_width = 50;
            const std::size_t pos = static_cast<std::size_t>(bar_width * done / m_total);
            std::string bar(bar_width, ' ');
            for (std::size_t i = 0; i < bar_width; ++i)
            {
                if (i < pos)
                    bar[i] = '=';
                else if (i == pos)
                    bar[i] = '>';
            }
            std::cout << "\r[" << bar << "] " << (done * 100 / m_total) << " % ("
                      << format_bytes(done) << ")" << std::flush;
        }

        void on_file_finished(const DownloadResult& result) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            spdlog::info("{} finished: {}", result.name, to_string(result.status));
        }

    private:
        std::mutex m_mutex;
        std::uint64_t m_total;
        std::uint64_t m_done = 0;
    };

    void load_config(Context& ctx, const std::string& file)
    {
        spdlog::info("Loading configuration {}", file);
        YAML::Node config = YAML::LoadFile(file);

        if (config["max-parallel-downloads"])
            ctx.max_parallel_downloads = config["max-parallel-downloads"].as<long>();
        if (config["max-downloads-per-mirror"])
            ctx.max_downloads_per_mirror = config["max-downloads-per-mirror"].as<long>();
        if (config["allowed-mirror-failures"])
            ctx.allowed_mirror_failures = config["allowed-mirror-failures"].as<int>();
        if (config["max-attempts"])
            ctx.max_attempts_per_segment = config["max-attempts"].as<std::size_t>();
        if (config["retry-timeout-ms"])
            ctx.retry_default_timeout
                = std::chrono::milliseconds(config["retry-timeout-ms"].as<long>());
        if (config["retry-backoff-factor"])
            ctx.retry_backoff_factor = config["retry-backoff-factor"].as<std::size_t>();
        if (config["min-segment-size"])
            ctx.min_segment_size = config["min-segment-size"].as<std::uint64_t>();
        if (config["connect-timeout"])
            ctx.connect_timeout = config["connect-timeout"].as<long>();
        if (config["low-speed-time"])
            ctx.low_speed_time = config["low-speed-time"].as<long>();
        if (config["low-speed-limit"])
            ctx.low_speed_limit = config["low-speed-limit"].as<long>();
        if (config["user-agent"])
            ctx.user_agent = config["user-agent"].as<std::string>();
        if (config["disable-ssl"])
            ctx.disable_ssl = config["disable-ssl"].as<bool>();
        if (config["ca-info"])
            ctx.ssl_ca_info = config["ca-info"].as<std::string>();
        if (config["headers"])
            ctx.additional_httpheaders = config["headers"].as<std::vector<std::string>>();
        if (config["proxies"])
            ctx.proxy_map = config["proxies"].as<std::map<std::string, std::string>>();
        if (config["verify-pieces"])
            ctx.verify_pieces = config["verify-pieces"].as<bool>();
        if (config["accept-unverified"])
            ctx.accept_unverified = config["accept-unverified"].as<bool>();
        if (config["failfast"])
            ctx.failfast = config["failfast"].as<bool>();
    }

    void print_report(const Context& ctx, const RunReport& report)
    {
        if (show_progress_bars)
            std::cout << "\n";

        for (const auto& result : report.results)
        {
            std::string line = fmt::format("{:<20} {}", to_string(result.status), result.name);
            if (result.total_bytes)
                line += fmt::format(" ({})", format_bytes(*result.total_bytes));
            if (result.last_mirror)
                line += fmt::format(" from {}", *result.last_mirror);
            if (result.error && !result.is_success(ctx.accept_unverified))
                line += fmt::format(": {}", result.error->reason);
            std::cout << line << "\n";
        }
        std::cout << fmt::format("Transferred {}", format_bytes(report.bytes_transferred()))
                  << std::endl;
    }

    int run_plan(const Context& ctx, DownloadPlan plan)
    {
        plan.minimize(ctx);

        RunContext run;
        ProgressPrinter printer(plan.remaining_bytes());
        run.observer = &printer;

        active_run = &run;
        std::signal(SIGINT, handle_sigint);

        Downloader dl{ ctx };
        RunReport report = dl.download(plan, run);

        std::signal(SIGINT, SIG_DFL);
        active_run = nullptr;

        print_report(ctx, report);
        if (!report.success(ctx.accept_unverified))
        {
            spdlog::error("Download was not successful");
            return exit_failure;
        }
        return exit_success;
    }

    tl::expected<DownloadPlan, int> load_plan(const std::string& metalink_file,
                                              const std::string& dest_folder)
    {
        auto metalink = parse_metalink_file(metalink_file);
        if (!metalink)
        {
            spdlog::critical("Could not parse {}: {}", metalink_file, metalink.error().message());
            return tl::make_unexpected(exit_parse_error);
        }
        return DownloadPlan::from_metalink(metalink.value(), dest_folder);
    }

    int handle_download(const Context& ctx,
                        const std::string& metalink_file,
                        const std::string& dest_folder)
    {
        auto plan = load_plan(metalink_file, dest_folder);
        if (!plan)
            return plan.error();
        return run_plan(ctx, std::move(plan.value()));
    }

    int handle_plan(const Context& ctx,
                    const std::string& metalink_file,
                    const std::string& dest_folder)
    {
        auto plan = load_plan(metalink_file, dest_folder);
        if (!plan)
            return plan.error();
        plan->minimize(ctx);
        std::cout << plan->to_json().dump(4) << std::endl;
        return exit_success;
    }

    int handle_download_file(const Context& ctx,
                             const std::string& url,
                             const std::string& dest_folder)
    {
        if (!is_supported_url(url))
        {
            spdlog::critical("Unsupported URL: {}", url);
            return exit_parse_error;
        }

        FileEntry entry;
        entry.name = url_filename(url);
        if (!is_safe_file_name(entry.name))
        {
            spdlog::critical("Cannot derive a file name from {}", url);
            return exit_parse_error;
        }

        Resource resource;
        resource.url = url;
        resource.protocol = detect_protocol(url);
        entry.resources.push_back(resource);

        Metalink metalink;
        metalink.files.push_back(std::move(entry));

        spdlog::info("Downloading {} to {}", url, dest_folder);
        return run_plan(ctx, DownloadPlan::from_metalink(metalink, dest_folder));
    }
}

int
main(int argc, char** argv)
{
    CLI::App app{ "Metalink downloader" };
    app.require_subcommand(1);

    std::string metalink_file, url, outdir = ".", config_file;
    int verbosity = 0;
    bool disable_ssl = false;
    bool no_verify_pieces = false;
    bool accept_unverified = false;
    bool failfast = false;
    bool no_resume = false;
    long max_parallel = -1;
    long max_attempts = -1;
    std::string user_agent;

    CLI::App* s_dl = app.add_subcommand("download", "Download the files of a metalink");
    s_dl->add_option("-m,--metalink", metalink_file, "Metalink file")->required();

    CLI::App* s_plan
        = app.add_subcommand("plan", "Print what a download would do, without downloading");
    s_plan->add_option("-m,--metalink", metalink_file, "Metalink file")->required();

    CLI::App* s_file = app.add_subcommand("download-file", "Download a single URL");
    s_file->add_option("-u,--url", url, "URL to download")->required();

    for (CLI::App* sub : { s_dl, s_plan, s_file })
    {
        sub->add_option("-d,--dest", outdir, "Output directory");
        sub->add_option("-c,--config", config_file, "YAML file with download settings");
        sub->add_flag("-v", verbosity, "Increase verbosity (repeatable)");
        sub->add_flag("-k", disable_ssl, "Disable SSL verification");
        sub->add_flag("--no-resume", no_resume, "Ignore what is already on disk");
    }
    for (CLI::App* sub : { s_dl, s_file })
    {
        sub->add_option("--max-parallel", max_parallel, "Number of parallel transfers");
        sub->add_option("--max-attempts", max_attempts, "Attempts per segment");
        sub->add_option("--user-agent", user_agent, "User agent sent with every request");
        sub->add_flag("--accept-unverified",
                      accept_unverified,
                      "Count files without a usable checksum as success");
        sub->add_flag("--failfast", failfast, "Stop the run at the first failed file");
    }
    s_dl->add_flag("--no-verify-pieces", no_verify_pieces, "Do not check piece hashes");

    CLI11_PARSE(app, argc, argv);

    Context ctx;
    ctx.set_verbosity(verbosity);
    if (verbosity > 0)
        show_progress_bars = false;

    try
    {
        if (!config_file.empty())
            load_config(ctx, config_file);
    }
    catch (const YAML::Exception& e)
    {
        spdlog::critical("Could not load {}: {}", config_file, e.what());
        return exit_parse_error;
    }

    if (disable_ssl)
        ctx.disable_ssl = true;
    if (no_verify_pieces)
        ctx.verify_pieces = false;
    if (accept_unverified)
        ctx.accept_unverified = true;
    if (failfast)
        ctx.failfast = true;
    if (no_resume)
        ctx.resume = false;
    if (max_parallel > 0)
        ctx.max_parallel_downloads = max_parallel;
    if (max_attempts > 0)
        ctx.max_attempts_per_segment = static_cast<std::size_t>(max_attempts);
    if (!user_agent.empty())
        ctx.user_agent = user_agent;

    if (app.got_subcommand(s_plan))
        return handle_plan(ctx, metalink_file, outdir);
    if (app.got_subcommand(s_file))
        return handle_download_file(ctx, url, outdir);
    return handle_download(ctx, metalink_file, outdir);
}
