// fastssh_cli.cpp - run a command, stream it, or move a file over one SSH session
// thin shell around the library, mostly useful for poking at a real host

#include "fastssh/connection_validator.hpp"
#include "fastssh/log.hpp"
#include "fastssh/session.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <fmt/color.h>
#include <fmt/format.h>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wtautological-compare"
#include <fmt/ranges.h>
#pragma GCC diagnostic pop
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace
{

    std::atomic<bool> g_running{true};

    auto signal_handler(int /*signal*/) -> void
    {
        g_running.store(false);
    }

    // =============================================================================
    // configuration
    // =============================================================================

    struct transfer_request
    {
        std::string from;
        std::string to;
    };

    struct cli_config
    {
        // ssh settings
        std::string host;
        int port{22};
        std::string username;
        std::string password;
        std::string key_path;

        // what to do
        bool check_only{false};
        bool stream{false};
        bool verbose{false};
        std::optional<transfer_request> put;
        std::optional<transfer_request> get;
        std::vector<std::string> command;
    };

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(stderr, R"(
Usage: {} [options] [-- command...]

Required:
  --host <host>             Remote host name or address
  --user <user>             SSH username

Authentication (one required):
  --password <pass>         SSH password (also unlocks an encrypted key)
  --key <path>              Path to SSH private key

Optional:
  --port <port>             SSH port (default: 22)
  --check                   Only check that the credentials are accepted
  --stream                  Print output as it arrives instead of after exit
  --put <local> <remote>    Upload a local file before running the command
  --get <remote> <local>    Download a remote file after running the command
  --verbose                 Library diagnostics on stderr

Example:
  {} --host 192.168.1.100 --user admin --password secret123 -- uname -a

)",
                   program_name, program_name);
    }

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> std::optional<cli_config>
    {
        cli_config config;

        for (int i = 1; i < argc; ++i)
        {
            std::string_view const arg{argv[i]};

            if (arg == "--host" && i + 1 < argc)
            {
                config.host = argv[++i];
            }
            else if (arg == "--port" && i + 1 < argc)
            {
                config.port = std::stoi(argv[++i]);
            }
            else if (arg == "--user" && i + 1 < argc)
            {
                config.username = argv[++i];
            }
            else if (arg == "--password" && i + 1 < argc)
            {
                config.password = argv[++i];
            }
            else if (arg == "--key" && i + 1 < argc)
            {
                config.key_path = argv[++i];
            }
            else if (arg == "--put" && i + 2 < argc)
            {
                config.put = transfer_request{.from = argv[i + 1], .to = argv[i + 2]};
                i += 2;
            }
            else if (arg == "--get" && i + 2 < argc)
            {
                config.get = transfer_request{.from = argv[i + 1], .to = argv[i + 2]};
                i += 2;
            }
            else if (arg == "--check")
            {
                config.check_only = true;
            }
            else if (arg == "--stream")
            {
                config.stream = true;
            }
            else if (arg == "--verbose")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                return std::nullopt;
            }
            else if (arg == "--")
            {
                config.command.assign(argv + i + 1, argv + argc);
                break;
            }
            else
            {
                fmt::print(stderr, "Unknown argument: {}\n", arg);
                return std::nullopt;
            }
        }

        // validate required fields
        if (config.host.empty())
        {
            fmt::print(stderr, "Error: --host is required\n");
            return std::nullopt;
        }
        if (config.username.empty())
        {
            fmt::print(stderr, "Error: --user is required\n");
            return std::nullopt;
        }
        if (config.password.empty() && config.key_path.empty())
        {
            fmt::print(stderr, "Error: --password or --key is required\n");
            return std::nullopt;
        }
        if (!config.check_only && config.command.empty() && !config.put && !config.get)
        {
            fmt::print(stderr, "Error: nothing to do, give a command, --put, --get or --check\n");
            return std::nullopt;
        }

        return config;
    }

    [[nodiscard]] auto make_credentials(cli_config const &config) -> fastssh::credentials
    {
        fastssh::credentials creds{
            .host = config.host, .port = config.port, .username = config.username, .password = config.password};
        if (!config.key_path.empty())
        {
            creds.key = fastssh::private_key{.source = fastssh::key_file{config.key_path}, .passphrase = std::nullopt};
        }
        return creds;
    }

    auto report(std::string_view const what, fastssh::error const e) -> void
    {
        fmt::print(stderr, fg(fmt::color::red), "{} failed: {} ({})\n", what, e, fastssh::kind_of(e));
    }

    auto write_chunk(std::FILE *stream, std::span<std::uint8_t const> const chunk) -> void
    {
        fmt::print(stream, "{}", fastssh::as_string_view(chunk));
        std::fflush(stream);
    }

    // =============================================================================
    // actions
    // =============================================================================

    [[nodiscard]] auto run_blocking(fastssh::session &ssh, std::string const &command) -> int
    {
        auto result = ssh.exec(command);
        if (!result.has_value())
        {
            report("exec", result.error());
            return 255;
        }

        fmt::print("{}", result->get_stdout());
        fmt::print(stderr, "{}", result->get_stderr());
        return result->get_exit_code();
    }

    [[nodiscard]] auto run_streaming(fastssh::session &ssh, std::string const &command) -> int
    {
        auto handle = ssh.async_exec(
            command, [](std::span<std::uint8_t const> const chunk) { write_chunk(stdout, chunk); },
            [](std::span<std::uint8_t const> const chunk) { write_chunk(stderr, chunk); });
        if (!handle.has_value())
        {
            report("exec", handle.error());
            return 255;
        }

        while (!handle->wait_for(std::chrono::milliseconds{100}))
        {
            if (!g_running.load())
            {
                handle->cancel();
            }
        }

        auto const status = handle->wait();
        if (!status.has_value())
        {
            if (!g_running.load())
            {
                fmt::print(stderr, "\ninterrupted\n");
                return 130;
            }
            report("stream", status.error());
            return 255;
        }
        return *status;
    }

    [[nodiscard]] auto download(fastssh::session &ssh, transfer_request const &request) -> bool
    {
        auto data = ssh.download_file(request.from);
        if (!data.has_value())
        {
            report("download", data.error());
            return false;
        }

        std::ofstream out(request.to, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<char const *>(data->data()), static_cast<std::streamsize>(data->size()));
        if (!out)
        {
            fmt::print(stderr, fg(fmt::color::red), "cannot write {}\n", request.to);
            return false;
        }

        fmt::print(stderr, "{} -> {} ({} bytes)\n", request.from, request.to, data->size());
        return true;
    }

} // anonymous namespace

auto main(int argc, char const *argv[]) -> int
{
    auto config_opt = parse_args(argc, argv);
    if (!config_opt.has_value())
    {
        print_usage(argv[0]);
        return 1;
    }
    auto const &config = *config_opt;

    if (config.verbose)
    {
        fastssh::log::set_level(fastssh::log::level::debug);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto const creds = make_credentials(config);

    if (config.check_only)
    {
        auto const valid = fastssh::is_valid_connection(creds);
        if (!valid.has_value())
        {
            report("check", valid.error());
            return 255;
        }
        fmt::print("{}@{}: {}\n", config.username, config.host, *valid ? "accepted" : "rejected");
        return *valid ? 0 : 1;
    }

    auto connected = fastssh::session::connect(creds);
    if (!connected.has_value())
    {
        report("connect", connected.error());
        return 255;
    }
    auto &ssh = *connected;

    if (config.put.has_value())
    {
        auto const &request = *config.put;
        if (auto sent = ssh.send_file(request.to, fastssh::local_path{request.from}); !sent.has_value())
        {
            report("upload", sent.error());
            return 255;
        }
        fmt::print(stderr, "{} -> {}\n", request.from, request.to);
    }

    int status = 0;
    if (!config.command.empty())
    {
        auto const command = fmt::format("{}", fmt::join(config.command, " "));
        status = config.stream ? run_streaming(ssh, command) : run_blocking(ssh, command);
    }

    if (config.get.has_value() && !download(ssh, *config.get))
    {
        return 255;
    }

    return status;
}
