#include "fetchvault/cli/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace fetchvault::cli
{

    CliConfig parse_arguments(int argc, char *argv[])
    {
        CliConfig config;
        config.store_root = default_store_root();

        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index];
            if (arg.rfind("--", 0) != 0 && arg != "-h")
            {
                break;
            }
            ++index;
            if (arg == "--store")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--store requires a directory");
                }
                config.store_root = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--verbose")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (index < argc)
        {
            config.command = argv[index++];
        }
        while (index < argc)
        {
            config.args.emplace_back(argv[index++]);
        }
        return config;
    }

    std::filesystem::path default_store_root()
    {
        if (const char *home = std::getenv("FETCHVAULT_HOME"))
        {
            return std::filesystem::path(home);
        }
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "FetchVault";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".fetchvault";
        }
        return std::filesystem::path(".fetchvault");
    }

    std::string usage(const char *program_name)
    {
        return std::string("Usage: ") + program_name +
               " [--store <DIR>] [--log <FILE>] [--verbose] [<command> [args...]]\n"
               "Without a command an interactive shell is started. Type HELP for the command list.\n";
    }

} // namespace fetchvault::cli
