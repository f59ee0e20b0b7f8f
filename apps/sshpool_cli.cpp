// sshpool_cli.cpp - run commands on a device through the session manager
// exec waits for output, spawn streams it and forwards Ctrl-C, devmode prints the token

#include "sshpool/devmode.hpp"
#include "sshpool/libssh_transport.hpp"
#include "sshpool/log.hpp"
#include "sshpool/session_manager.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <fmt/color.h>
#include <fmt/format.h>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace
{

    std::atomic<bool> g_interrupted{false};

    auto signal_handler(int /*signal*/) -> void
    {
        g_interrupted.store(true);
    }

    // =============================================================================
    // configuration
    // =============================================================================

    enum class cli_mode
    {
        exec,
        spawn,
        devmode,
    };

    struct cli_config
    {
        cli_mode mode{cli_mode::exec};
        std::string command;

        sshpool::device target;
        sshpool::session_manager_config manager;

        bool read_stdin{false};
        bool verbose{false};
    };

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(R"(
Usage: {} <exec|spawn|devmode> [options] [--] [command...]

Target:
  --host <host>             Device address
  --user <user>             SSH username

Authentication (key > password > none):
  --key <path>              Private key file
  --passphrase <pass>       Private key passphrase
  --password <pass>         SSH password

Optional:
  --port <port>             SSH port (default: 22)
  --name <name>             Device name used as pool key (default: host)
  --new                     Use a dedicated connection
  --timeout <seconds>       Connect timeout (default: 3)
  --stdin                   exec: send standard input to the command
  --verbose                 Debug logging

Example:
  {} exec --host 192.168.1.20 --port 9922 --user prisoner --key ~/.ssh/tv_webos -- uname -a

)",
                   program_name, program_name);
    }

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> std::optional<cli_config>
    {
        if (argc < 2)
        {
            return std::nullopt;
        }

        cli_config config;
        std::string_view const mode{argv[1]};
        if (mode == "exec")
        {
            config.mode = cli_mode::exec;
        }
        else if (mode == "spawn")
        {
            config.mode = cli_mode::spawn;
        }
        else if (mode == "devmode")
        {
            config.mode = cli_mode::devmode;
        }
        else
        {
            fmt::print(stderr, "Unknown mode: {}\n", mode);
            return std::nullopt;
        }

        std::vector<std::string> words;
        for (int i = 2; i < argc; ++i)
        {
            std::string_view const arg{argv[i]};

            if (arg == "--host" && i + 1 < argc)
            {
                config.target.host = argv[++i];
            }
            else if (arg == "--port" && i + 1 < argc)
            {
                config.target.port = static_cast<std::uint16_t>(std::stoul(argv[++i]));
            }
            else if (arg == "--user" && i + 1 < argc)
            {
                config.target.username = argv[++i];
            }
            else if (arg == "--password" && i + 1 < argc)
            {
                config.target.password = argv[++i];
            }
            else if (arg == "--key" && i + 1 < argc)
            {
                config.target.private_key = sshpool::key_file{.path = argv[++i]};
            }
            else if (arg == "--passphrase" && i + 1 < argc)
            {
                config.target.passphrase = argv[++i];
            }
            else if (arg == "--name" && i + 1 < argc)
            {
                config.target.name = argv[++i];
            }
            else if (arg == "--timeout" && i + 1 < argc)
            {
                config.manager.connect_timeout = std::chrono::seconds{std::stoul(argv[++i])};
            }
            else if (arg == "--new")
            {
                config.target.is_new = true;
            }
            else if (arg == "--stdin")
            {
                config.read_stdin = true;
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
                words.insert(words.end(), argv + i + 1, argv + argc);
                break;
            }
            else if (arg.starts_with("--"))
            {
                fmt::print(stderr, "Unknown argument: {}\n", arg);
                return std::nullopt;
            }
            else
            {
                words.emplace_back(arg);
            }
        }

        for (auto const &word : words)
        {
            if (!config.command.empty())
            {
                config.command += ' ';
            }
            config.command += word;
        }

        if (config.target.host.empty())
        {
            fmt::print(stderr, "Error: --host is required\n");
            return std::nullopt;
        }
        if (config.target.username.empty())
        {
            fmt::print(stderr, "Error: --user is required\n");
            return std::nullopt;
        }
        if (config.mode != cli_mode::devmode && config.command.empty())
        {
            fmt::print(stderr, "Error: no command given\n");
            return std::nullopt;
        }
        if (config.target.name.empty())
        {
            config.target.name = config.target.host;
        }

        return config;
    }

    // =============================================================================
    // modes
    // =============================================================================

    auto write_out(std::FILE *stream, std::span<std::uint8_t const> bytes) -> void
    {
        std::fwrite(bytes.data(), 1, bytes.size(), stream);
        std::fflush(stream);
    }

    [[nodiscard]] auto run_exec(sshpool::session_manager &manager, cli_config const &config) -> int
    {
        std::optional<std::vector<std::uint8_t>> input;
        if (config.read_stdin)
        {
            input.emplace(std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{});
        }

        auto const output = manager.exec(config.target, config.command, input);
        if (!output)
        {
            fmt::print(stderr, fmt::fg(fmt::color::red), "exec failed: {}\n", output.error());
            return 1;
        }
        write_out(stdout, *output);
        return 0;
    }

    [[nodiscard]] auto run_spawn(sshpool::session_manager &manager, cli_config const &config) -> int
    {
        auto spawned = manager.spawn(config.target, config.command);
        if (!spawned)
        {
            fmt::print(stderr, fmt::fg(fmt::color::red), "spawn failed: {}\n", spawned.error());
            return 1;
        }

        auto &proc = **spawned;
        proc.set_callback([](std::uint32_t ext, std::span<std::uint8_t const> bytes)
                          { write_out(ext == 0 ? stdout : stderr, bytes); });

        if (auto started = proc.start(); !started)
        {
            fmt::print(stderr, fmt::fg(fmt::color::red), "start failed: {}\n", started.error());
            return 1;
        }

        bool interrupt_sent = false;
        while (!proc.wait_closed(std::chrono::milliseconds{100}))
        {
            if (g_interrupted.load() && !interrupt_sent)
            {
                interrupt_sent = true;
                if (auto sent = proc.signal(sshpool::transport::signal::interrupt); !sent)
                {
                    fmt::print(stderr, "interrupt not delivered: {}\n", sent.error());
                    return 130;
                }
            }
        }
        return interrupt_sent ? 130 : 0;
    }

    [[nodiscard]] auto run_devmode(sshpool::session_manager &manager, cli_config const &config) -> int
    {
        auto const token = sshpool::devmode::token(manager, config.target);
        if (!token)
        {
            fmt::print(stderr, fmt::fg(fmt::color::yellow), "no devmode token: {}\n", token.error());
            return 1;
        }
        fmt::print("{}\n", *token);
        return 0;
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

    sshpool::logger().set_level(config.verbose ? spdlog::level::debug : spdlog::level::warn);

    std::signal(SIGINT, signal_handler);

    sshpool::session_manager manager{std::make_shared<sshpool::transport::libssh_connector>(), config.manager};

    switch (config.mode)
    {
    case cli_mode::exec:
        return run_exec(manager, config);
    case cli_mode::spawn:
        return run_spawn(manager, config);
    case cli_mode::devmode:
        return run_devmode(manager, config);
    }
    return 1;
}
