#include <cassert>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fetchvault/cli/config.hpp"
#include "fetchvault/cli/console.hpp"

using namespace fetchvault;

namespace
{

    cli::CliConfig config_for(const std::string &name)
    {
        cli::CliConfig config{};
        config.store_root = std::filesystem::temp_directory_path() / ("fetchvault_console_" + name);
        std::error_code ec;
        std::filesystem::remove_all(config.store_root, ec);
        return config;
    }

    bool starts_with(const std::string &text, const std::string &prefix)
    {
        return text.rfind(prefix, 0) == 0;
    }

    void test_export_to_stdout_answers_ok()
    {
        const auto config = config_for("export");
        std::ostringstream out;
        cli::Console console(config, out);

        assert(console.execute("export", {}));
        const auto text = out.str();
        assert(starts_with(text, "OK\n"));
        const auto document = nlohmann::json::parse(text.substr(3));
        assert(document.contains("exportedAt"));
        assert(document["data"]["templates"].size() == 3);

        std::filesystem::remove_all(config.store_root);
    }

    void test_failures_report_error_label()
    {
        const auto config = config_for("errors");
        std::ostringstream out;
        cli::Console console(config, out);

        assert(!console.execute("START", {"queue-missing"}));
        assert(starts_with(out.str(), "ERROR: not_found\n"));

        out.str("");
        assert(!console.execute("START", {}));
        assert(starts_with(out.str(), "ERROR: invalid_usage\n"));

        out.str("");
        assert(!console.execute("FROBNICATE", {}));
        assert(out.str() == "ERROR: unsupported_command\n");

        out.str("");
        assert(console.execute("ENQUEUE", {"abc", "https://media.example/abc", "--quality", "720p"}));
        assert(starts_with(out.str(), "OK\nqueue-"));

        std::filesystem::remove_all(config.store_root);
    }

} // namespace

void run_console_tests()
{
    test_export_to_stdout_answers_ok();
    test_failures_report_error_label();
}
