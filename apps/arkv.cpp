// arkv.cpp - archive a file or folder to every registered destination
// one thread and one SSH session per destination

#include "arkv/config.hpp"
#include "arkv/libssh_transport.hpp"
#include "arkv/log.hpp"
#include "arkv/path_planner.hpp"
#include "arkv/progress.hpp"
#include "arkv/uploader.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fmt/color.h>
#include <fmt/format.h>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace
{

    arkv::cancel_token g_cancel;

    auto signal_handler(int /*signal*/) -> void
    {
        g_cancel.request();
    }

    // =============================================================================
    // configuration
    // =============================================================================

    struct cli_config
    {
        std::filesystem::path local_path;
        std::optional<std::filesystem::path> config_path;
        std::vector<std::string> destinations; // empty = all
        arkv::session_options session{};
        arkv::planner_options planner{};
        arkv::engine_options engine{};
        bool verbose{false};
        bool dry_run{false};
    };

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(stderr, R"(
arkv - archive files to remote servers over SFTP

Usage: {} <file-or-folder> [options]

Options:
  --config <file>          Destination registry (default: ~/.config/arkv/config.json)
  -d, --destination <name> Upload to this destination only (repeatable; default: all)
  --chunk-size <bytes>     Transfer chunk size (default: 262144)
  --read-ahead             Read the next chunk while the current one is on the wire
  --follow-symlinks        Follow links that stay inside the uploaded folder
  --connect-timeout <s>    TCP + SSH handshake timeout (default: 30)
  --io-timeout <s>         Per-chunk timeout (default: 60)
  --strict-host-key        Require the host key to be in known_hosts
  --dry-run                Print the upload plan and exit
  -v, --verbose            Log diagnostics to stderr
  -h, --help               Show this help

Examples:
  {} cool-picture.png
  {} my_files/tuesday/ -d nas
  {} build/ -d nas -d offsite --read-ahead

)",
                   program_name, program_name, program_name, program_name);
    }

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> std::optional<cli_config>
    {
        cli_config config;

        for (int i = 1; i < argc; ++i)
        {
            std::string_view const arg{argv[i]};

            if (arg == "--config" && i + 1 < argc)
            {
                config.config_path = argv[++i];
            }
            else if ((arg == "--destination" || arg == "-d") && i + 1 < argc)
            {
                config.destinations.emplace_back(argv[++i]);
            }
            else if (arg == "--chunk-size" && i + 1 < argc)
            {
                config.engine.chunk_size = static_cast<std::size_t>(std::stoull(argv[++i]));
            }
            else if (arg == "--read-ahead")
            {
                config.engine.read_ahead = true;
            }
            else if (arg == "--follow-symlinks")
            {
                config.planner.follow_symlinks = true;
            }
            else if (arg == "--connect-timeout" && i + 1 < argc)
            {
                config.session.connect_timeout = std::chrono::seconds{std::stoul(argv[++i])};
            }
            else if (arg == "--io-timeout" && i + 1 < argc)
            {
                config.session.io_timeout = std::chrono::seconds{std::stoul(argv[++i])};
            }
            else if (arg == "--strict-host-key")
            {
                config.session.strict_host_key_checking = true;
            }
            else if (arg == "--dry-run")
            {
                config.dry_run = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                return std::nullopt;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                fmt::print(stderr, "Unknown argument: {}\n", arg);
                return std::nullopt;
            }
            else if (config.local_path.empty())
            {
                config.local_path = arg;
            }
            else
            {
                fmt::print(stderr, "Only one file or folder can be archived per run\n");
                return std::nullopt;
            }
        }

        if (config.local_path.empty())
        {
            fmt::print(stderr, "Error: nothing to archive\n");
            return std::nullopt;
        }

        return config;
    }

    // =============================================================================
    // console progress
    // =============================================================================

    [[nodiscard]] auto human_bytes(std::uint64_t const bytes) -> std::string
    {
        if (bytes < 1024)
        {
            return fmt::format("{} B", bytes);
        }
        if (bytes < 1024 * 1024)
        {
            return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / 1024.0);
        }
        return fmt::format("{:.2f} MiB", static_cast<double>(bytes) / 1048576.0);
    }

    // one per destination; lines from concurrent uploads are serialized through a shared mutex
    class console_sink final : public arkv::progress_sink
    {
    public:
        console_sink(std::string label, std::uint64_t total_bytes, std::mutex &out, bool verbose)
            : label_{std::move(label)}, total_bytes_{total_bytes}, out_{out}, verbose_{verbose}
        {
        }

        void on_event(arkv::transfer_event const &event) override
        {
            if (auto const *bytes = std::get_if<arkv::events::bytes_written>(&event))
            {
                sent_ += bytes->delta;
                return;
            }

            if (auto const *dir = std::get_if<arkv::events::directory_ensured>(&event))
            {
                if (verbose_)
                {
                    std::lock_guard const lock{out_};
                    fmt::print("[{}] dir  {}\n", label_, dir->remote_path);
                }
                return;
            }

            if (auto const *done = std::get_if<arkv::events::entry_completed>(&event))
            {
                print_completed(*done);
            }
        }

    private:
        void print_completed(arkv::events::entry_completed const &done)
        {
            auto const &entry = *done.entry;
            std::lock_guard const lock{out_};

            if (done.outcome.is_failure())
            {
                fmt::print(stderr, fmt::fg(fmt::color::red), "[{}] FAIL {} ({})\n", label_, entry.remote_path,
                           arkv::error_code_formatter::describe(done.outcome.error));
                return;
            }

            if (done.outcome.is_skipped())
            {
                if (verbose_ || done.outcome.skipped_because == arkv::skip_reason::symlink_not_followed)
                {
                    fmt::print(fmt::fg(fmt::color::yellow), "[{}] skip {} ({})\n", label_, entry.remote_path,
                               arkv::to_string(done.outcome.skipped_because));
                }
                return;
            }

            if (entry.is_file())
            {
                auto const percent = total_bytes_ == 0
                                         ? 100.0
                                         : 100.0 * static_cast<double>(sent_) / static_cast<double>(total_bytes_);
                fmt::print("[{}] {:5.1f}% {} ({})\n", label_, std::min(percent, 100.0), entry.remote_path,
                           human_bytes(entry.size_bytes));
            }
        }

        std::string label_;
        std::uint64_t total_bytes_{0};
        std::uint64_t sent_{0};
        std::mutex &out_;
        bool verbose_{false};
    };

    // =============================================================================
    // per-destination run
    // =============================================================================

    struct destination_result
    {
        arkv::destination_context destination;
        std::optional<arkv::error_code> error; // pre-flight or planning failure
        arkv::upload_summary summary{};
    };

    auto print_plan(arkv::upload_plan const &plan, arkv::destination_context const &destination) -> void
    {
        fmt::print(fmt::fg(fmt::color::cyan), "\n=== Plan for {} ===\n", destination);
        for (auto const &entry : plan.entries)
        {
            fmt::print("  {:9} {} -> {}{}\n", arkv::to_string(entry.kind), entry.local_path.string(),
                       plan.absolute_remote_path(entry),
                       entry.is_file() ? fmt::format(" ({})", human_bytes(entry.size_bytes)) : std::string{});
        }
        for (auto const &warning : plan.warnings)
        {
            fmt::print(fmt::fg(fmt::color::yellow), "  warning: {}: {}\n", warning.local_path.string(),
                       arkv::to_string(warning.kind));
        }
        fmt::print("  {} directories, {} files, {}\n", plan.total_directories, plan.total_files,
                   human_bytes(plan.total_bytes));
    }

    auto run_destination(cli_config const &config, destination_result &out, std::mutex &console) -> void
    {
        auto plan = arkv::plan_upload(config.local_path, out.destination.remote_base, config.planner);
        if (!plan.has_value())
        {
            out.error = plan.error();
            return;
        }

        for (auto const &warning : plan->warnings)
        {
            arkv::log::get()->warn("skipping {}: {}", warning.local_path.string(), arkv::to_string(warning.kind));
        }

        auto const label = out.destination.name.empty() ? out.destination.host : out.destination.name;
        console_sink sink{label, plan->total_bytes, console, config.verbose};

        auto summary = arkv::execute_upload(*plan, out.destination, config.session, config.engine,
                                            arkv::make_libssh_transport_factory(), sink, &g_cancel);
        if (!summary.has_value())
        {
            out.error = summary.error();
            return;
        }
        out.summary = std::move(*summary);
    }

    [[nodiscard]] auto load_destinations(cli_config const &config) -> std::optional<std::vector<arkv::destination_context>>
    {
        std::filesystem::path path;
        if (config.config_path.has_value())
        {
            path = *config.config_path;
        }
        else
        {
            auto default_path = arkv::default_config_path();
            if (!default_path.has_value())
            {
                fmt::print(stderr, "Error: cannot locate the config file ($HOME is not set)\n");
                return std::nullopt;
            }
            path = std::move(*default_path);
        }

        auto loaded = arkv::load_config(path);
        if (!loaded.has_value())
        {
            fmt::print(stderr, "Error: {}: {}\n", path.string(), arkv::error_code_formatter::describe(loaded.error()));
            return std::nullopt;
        }
        if (!loaded->has_value() || (*loaded)->destinations.empty())
        {
            fmt::print(stderr, "Error: no destinations configured in {}\n", path.string());
            return std::nullopt;
        }

        auto selected = arkv::select_destinations(**loaded, config.destinations);
        if (!selected.has_value())
        {
            fmt::print(stderr, "Error: {}\n", arkv::error_code_formatter::describe(selected.error()));
            return std::nullopt;
        }
        return std::move(*selected);
    }

} // anonymous namespace

auto main(int argc, char const *argv[]) -> int
{
    std::optional<cli_config> config_opt;
    try
    {
        config_opt = parse_args(argc, argv);
    }
    catch (std::exception const &e)
    {
        fmt::print(stderr, "Error: invalid numeric argument ({})\n", e.what());
    }

    if (!config_opt.has_value())
    {
        print_usage(argv[0]);
        return 1;
    }
    auto const &config = *config_opt;

    if (config.verbose)
    {
        arkv::log::enable_console(spdlog::level::debug);
    }

    auto destinations = load_destinations(config);
    if (!destinations.has_value())
    {
        return 1;
    }

    if (config.dry_run)
    {
        for (auto const &destination : *destinations)
        {
            auto plan = arkv::plan_upload(config.local_path, destination.remote_base, config.planner);
            if (!plan.has_value())
            {
                fmt::print(stderr, "Error: {}: {}\n", config.local_path.string(),
                           arkv::error_code_formatter::describe(plan.error()));
                return 1;
            }
            print_plan(*plan, destination);
        }
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (destinations->size() > 1)
    {
        fmt::print("\nArchiving to {} destinations\n\n", destinations->size());
    }
    else
    {
        fmt::print("\nArchiving to {}\n\n", destinations->front());
    }

    std::vector<destination_result> results;
    results.reserve(destinations->size());
    for (auto &destination : *destinations)
    {
        results.push_back(destination_result{std::move(destination), std::nullopt, {}});
    }

    std::mutex console;
    {
        std::vector<std::jthread> workers;
        workers.reserve(results.size());
        for (auto &result : results)
        {
            workers.emplace_back([&config, &result, &console] { run_destination(config, result, console); });
        }
    }

    bool any_failed = false;
    fmt::print("\n");
    for (auto const &result : results)
    {
        if (result.error.has_value())
        {
            any_failed = true;
            fmt::print(stderr, fmt::fg(fmt::color::red), "{}: {}\n", result.destination,
                       arkv::error_code_formatter::describe(*result.error));
            continue;
        }

        auto const &summary = result.summary;
        auto const mb = static_cast<double>(summary.bytes_transferred) / 1048576.0;
        auto const secs = summary.seconds();
        auto const speed = secs > 0.0 ? mb / secs : 0.0;

        auto const colour = summary.ok() ? fmt::color::green : fmt::color::red;
        fmt::print(fmt::fg(colour), "{}: {} files, {} directories, {:.2f} MB in {:.1f}s ({:.2f} MB/s)", result.destination,
                   summary.files_transferred, summary.directories_ensured, mb, secs, speed);
        if (summary.failed > 0 || summary.skipped > 0)
        {
            fmt::print(fmt::fg(colour), " - {} failed, {} skipped", summary.failed, summary.skipped);
        }
        if (summary.aborted_by.has_value())
        {
            fmt::print(fmt::fg(colour), " - stopped early: {}",
                       arkv::error_code_formatter::describe(*summary.aborted_by));
        }
        fmt::print("\n");

        any_failed = any_failed || !summary.ok();
    }

    if (g_cancel.requested())
    {
        fmt::print(stderr, "\nInterrupted.\n");
        return 130;
    }

    return any_failed ? 1 : 0;
}
