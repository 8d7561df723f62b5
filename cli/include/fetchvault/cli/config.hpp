#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fetchvault::cli
{

    struct CliConfig
    {
        std::filesystem::path store_root;
        std::optional<std::filesystem::path> log_path;
        bool verbose{};
        bool show_help{};
        // Empty command starts the interactive shell.
        std::string command;
        std::vector<std::string> args;
    };

    CliConfig parse_arguments(int argc, char *argv[]);

    std::filesystem::path default_store_root();

    std::string usage(const char *program_name);

} // namespace fetchvault::cli
