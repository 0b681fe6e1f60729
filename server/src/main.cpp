#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "filegate/server/config.hpp"
#include "filegate/server/logging.hpp"
#include "filegate/server/server.hpp"
#include "filegate/version.hpp"

#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "FileGate server " << filegate::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--config <FILE>] [--address <ADDRESS>] [--threads <N>]\n"
                     "       [--state-dir <DIR>] [--landing-page <FILE>] [--session-ttl <minutes>] [--log <FILE>]\n"
                     "       [--debug] [--add-user <NAME>:<PASSWORD>]... [--remove-user <NAME>]...\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            std::cerr << "Missing value for " << argv[index] << std::endl;
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    struct AccountCommands
    {
        std::vector<std::pair<std::string, std::string>> additions;
        std::vector<std::string> removals;
    };

    // Returns false on a usage error; `done` is set when the program should exit successfully.
    bool parse_arguments(int argc, char *argv[], filegate::server::ServerConfig &config, AccountCommands &accounts,
                         bool &done)
    {
        for (int i = 1; i < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    return false;
                }
                filegate::server::load_config_file(*value, config);
            }
        }

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--config")
            {
                ++i;
            }
            else if (arg == "--port")
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    return false;
                }
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    return false;
                }
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    return false;
                }
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    return false;
                }
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--state-dir")
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    return false;
                }
                config.state_dir = std::filesystem::path(*value);
            }
            else if (arg == "--landing-page")
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    return false;
                }
                config.landing_page = std::filesystem::path(*value);
            }
            else if (arg == "--session-ttl")
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    return false;
                }
                config.session_ttl = std::chrono::minutes(std::stoll(*value));
            }
            else if (arg == "--log")
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    return false;
                }
                config.log_file = std::filesystem::path(*value);
            }
            else if (arg == "--debug")
            {
                config.debug = true;
            }
            else if (arg == "--add-user")
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    return false;
                }
                const auto colon = value->find(':');
                if (colon == std::string::npos)
                {
                    std::cerr << "--add-user expects <name>:<password>" << std::endl;
                    return false;
                }
                accounts.additions.emplace_back(value->substr(0, colon), value->substr(colon + 1));
            }
            else if (arg == "--remove-user")
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    return false;
                }
                accounts.removals.push_back(*value);
            }
            else if (arg == "--help" || arg == "-h")
            {
                done = true;
                return true;
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                return false;
            }
        }
        return true;
    }

} // namespace

int main(int argc, char *argv[])
{
    using filegate::server::Server;
    using filegate::server::ServerConfig;

    ServerConfig config;
    AccountCommands accounts;
    bool done = false;

    try
    {
        if (!parse_arguments(argc, argv, config, accounts, done))
        {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    if (done)
    {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        filegate::server::configure_logging(config.log_file, config.debug);
        spdlog::info("Starting FileGate server {} on {}:{}", filegate::version(), config.address, config.port);

        Server server(std::move(config));
        for (const auto &[username, password] : accounts.additions)
        {
            std::string message;
            if (!server.create_account(username, password, message))
            {
                spdlog::error("Cannot create account {}: {}", username, message);
                return EXIT_FAILURE;
            }
        }
        for (const auto &username : accounts.removals)
        {
            if (!server.delete_account(username))
            {
                spdlog::warn("No account named {}", username);
            }
        }

        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
