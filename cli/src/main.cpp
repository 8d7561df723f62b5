#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "fetchvault/cli/config.hpp"
#include "fetchvault/cli/console.hpp"
#include "fetchvault/version.hpp"

int main(int argc, char *argv[])
{
    using fetchvault::cli::CliConfig;
    using fetchvault::cli::Console;

    CliConfig config;
    try
    {
        config = fetchvault::cli::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << fetchvault::cli::usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.show_help)
    {
        std::cout << "fetchvault " << fetchvault::version() << "\n"
                  << fetchvault::cli::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(config.verbose ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console_sink);
        if (config.log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_path->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("fetchvault", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }
    catch (const spdlog::spdlog_ex &ex)
    {
        std::cerr << "Cannot open log: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    Console console(config, std::cout);
    if (config.command.empty())
    {
        console.interactive_shell(std::cin);
        return EXIT_SUCCESS;
    }
    return console.execute(config.command, config.args) ? EXIT_SUCCESS : EXIT_FAILURE;
}
