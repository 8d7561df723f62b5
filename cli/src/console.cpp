#include "fetchvault/cli/console.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "fetchvault/filename.hpp"
#include "fetchvault/snapshot.hpp"

namespace fetchvault::cli
{

    namespace
    {

        class UsageError : public std::runtime_error
        {
        public:
            using std::runtime_error::runtime_error;
        };

        const std::set<std::string> kFlagOptions{"--force", "--default"};

        std::string to_upper(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            return value;
        }

        std::string trim(const std::string &value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }

        std::vector<std::string> split_tokens(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::string current;
            bool quoted = false;
            for (const char c : line)
            {
                if (c == '"')
                {
                    quoted = !quoted;
                    continue;
                }
                if (!quoted && std::isspace(static_cast<unsigned char>(c)) != 0)
                {
                    if (!current.empty())
                    {
                        tokens.push_back(std::move(current));
                        current.clear();
                    }
                    continue;
                }
                current.push_back(c);
            }
            if (!current.empty())
            {
                tokens.push_back(std::move(current));
            }
            return tokens;
        }

        void require_positional(const std::vector<std::string> &positional, std::size_t count, const char *usage)
        {
            if (positional.size() < count)
            {
                throw UsageError(std::string("Usage: ") + usage);
            }
        }

        std::uint64_t parse_u64(const std::string &value, const char *what)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size())
                {
                    throw UsageError(std::string("invalid ") + what + ": " + value);
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw UsageError(std::string("invalid ") + what + ": " + value);
            }
        }

        std::optional<std::string> option(const std::map<std::string, std::string> &options, const std::string &key)
        {
            const auto it = options.find(key);
            if (it == options.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::vector<std::byte> read_file_bytes(const std::filesystem::path &path)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                throw UsageError("cannot read " + path.string());
            }
            std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            std::vector<std::byte> bytes(raw.size());
            std::transform(raw.begin(), raw.end(), bytes.begin(), [](char c)
                           { return static_cast<std::byte>(c); });
            return bytes;
        }

    } // namespace

    Console::Console(const CliConfig &config, std::ostream &out)
        : store_(config.store_root),
          tracker_(store_),
          queue_(store_, tracker_),
          history_(store_),
          templates_(store_),
          library_(store_),
          out_(out)
    {
    }

    bool Console::execute(const std::string &command, const std::vector<std::string> &args)
    {
        try
        {
            if (!dispatch(to_upper(command), parse_args(args)))
            {
                out_ << "ERROR: unsupported_command" << std::endl;
                return false;
            }
            return true;
        }
        catch (const StoreError &ex)
        {
            print_error(ex);
            spdlog::error("{} failed: {}", command, ex.what());
        }
        catch (const UsageError &ex)
        {
            out_ << "ERROR: invalid_usage" << std::endl;
            out_ << ex.what() << std::endl;
        }
        catch (const std::exception &ex)
        {
            out_ << "ERROR: " << to_string(ErrorCode::InternalError) << std::endl;
            out_ << ex.what() << std::endl;
            spdlog::error("{} failed: {}", command, ex.what());
        }
        return false;
    }

    void Console::interactive_shell(std::istream &in)
    {
        while (true)
        {
            out_ << "fetchvault> " << std::flush;
            std::string line;
            if (!std::getline(in, line))
            {
                out_ << std::endl;
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            const auto tokens = split_tokens(line);
            if (tokens.empty())
            {
                continue;
            }
            const auto command = to_upper(tokens[0]);
            if (command == "EXIT" || command == "QUIT")
            {
                out_ << "OK" << std::endl;
                break;
            }
            execute(command, std::vector<std::string>(tokens.begin() + 1, tokens.end()));
        }
    }

    bool Console::dispatch(const std::string &command, const ParsedArgs &args)
    {
        if (command == "HELP")
        {
            print_help();
        }
        else if (command == "ENQUEUE")
        {
            handle_enqueue(args);
        }
        else if (command == "START")
        {
            handle_start(args);
        }
        else if (command == "RESUME")
        {
            handle_resume(args);
        }
        else if (command == "PROGRESS")
        {
            handle_progress(args);
        }
        else if (command == "CHUNK")
        {
            handle_chunk(args);
        }
        else if (command == "INTERRUPT")
        {
            handle_interrupt(args);
        }
        else if (command == "COMPLETE")
        {
            handle_complete(args);
        }
        else if (command == "FAIL")
        {
            handle_fail(args);
        }
        else if (command == "RETRY")
        {
            handle_retry(args);
        }
        else if (command == "CANCEL")
        {
            handle_cancel(args);
        }
        else if (command == "SHOW")
        {
            handle_show(args);
        }
        else if (command == "LIST")
        {
            handle_list(args);
        }
        else if (command == "HISTORY")
        {
            handle_history(args);
        }
        else if (command == "OFFSET")
        {
            handle_offset(args);
        }
        else if (command == "ASSEMBLE")
        {
            handle_assemble(args);
        }
        else if (command == "INVALIDATE")
        {
            handle_invalidate(args);
        }
        else if (command == "TEMPLATES")
        {
            handle_templates(args);
        }
        else if (command == "TEMPLATE-ADD")
        {
            handle_template_add(args);
        }
        else if (command == "TEMPLATE-DEFAULT")
        {
            handle_template_default(args);
        }
        else if (command == "TEMPLATE-REMOVE")
        {
            handle_template_remove(args);
        }
        else if (command == "FILENAME")
        {
            handle_filename(args);
        }
        else if (command == "COLLECTIONS")
        {
            handle_collections(args);
        }
        else if (command == "COLLECTION-ADD")
        {
            handle_collection_add(args);
        }
        else if (command == "TAGS")
        {
            handle_tags(args);
        }
        else if (command == "TAG")
        {
            handle_tag(args);
        }
        else if (command == "EXPORT")
        {
            handle_export(args);
        }
        else if (command == "IMPORT")
        {
            handle_import(args);
        }
        else
        {
            return false;
        }
        return true;
    }

    void Console::handle_enqueue(const ParsedArgs &args)
    {
        require_positional(args.positional, 2,
                           "ENQUEUE <source-id> <source-ref> [--title T] [--quality Q] [--format F] [--kind K] "
                           "[--format-id X] [--channel C] [--duration D] [--thumbnail U] [--force]");
        JobRequest job{};
        job.source_id = args.positional[0];
        job.source_ref = args.positional[1];
        job.title = option(args.options, "--title").value_or(job.source_id);
        job.quality = option(args.options, "--quality").value_or("best");
        job.format = option(args.options, "--format").value_or("mp4");
        job.transfer_format_id = option(args.options, "--format-id").value_or("");
        job.thumbnail_ref = option(args.options, "--thumbnail").value_or("");
        job.channel = option(args.options, "--channel");
        job.duration = option(args.options, "--duration");
        if (const auto kind = option(args.options, "--kind"))
        {
            const auto parsed = media_kind_from_string(*kind);
            if (!parsed)
            {
                throw UsageError("unknown kind: " + *kind + " (video, audio, caption, thumbnail)");
            }
            job.kind = *parsed;
        }
        const auto id = queue_.enqueue(job, args.flags.contains("--force"));
        out_ << "OK" << std::endl;
        out_ << id << std::endl;
    }

    void Console::handle_start(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "START <job-id>");
        const auto offset = queue_.start(args.positional[0]);
        out_ << "OK" << std::endl;
        out_ << "Offset: " << offset << std::endl;
    }

    void Console::handle_resume(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "RESUME <job-id>");
        const auto offset = queue_.resume(args.positional[0]);
        out_ << "OK" << std::endl;
        out_ << "Offset: " << offset << std::endl;
    }

    void Console::handle_progress(const ParsedArgs &args)
    {
        require_positional(args.positional, 2, "PROGRESS <job-id> <downloaded-bytes> [--total N]");
        std::optional<std::uint64_t> total;
        if (const auto value = option(args.options, "--total"))
        {
            total = parse_u64(*value, "total");
        }
        const bool applied = queue_.update_progress(args.positional[0], parse_u64(args.positional[1], "byte count"), total);
        out_ << (applied ? "OK" : "OK (ignored: job is not active)") << std::endl;
    }

    void Console::handle_chunk(const ParsedArgs &args)
    {
        require_positional(args.positional, 3, "CHUNK <job-id> <offset> <file> [--total N]");
        std::optional<std::uint64_t> total;
        if (const auto value = option(args.options, "--total"))
        {
            total = parse_u64(*value, "total");
        }
        const auto bytes = read_file_bytes(args.positional[2]);
        queue_.report_chunk(args.positional[0], parse_u64(args.positional[1], "offset"), bytes, total);
        const auto item = queue_.get(args.positional[0]);
        out_ << "OK" << std::endl;
        print_item(item);
    }

    void Console::handle_interrupt(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "INTERRUPT <job-id>");
        queue_.mark_interrupted(args.positional[0]);
        out_ << "OK" << std::endl;
    }

    void Console::handle_complete(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "COMPLETE <job-id>");
        queue_.mark_completed(args.positional[0]);
        out_ << "OK" << std::endl;
    }

    void Console::handle_fail(const ParsedArgs &args)
    {
        require_positional(args.positional, 2, "FAIL <job-id> <message...>");
        std::ostringstream message;
        for (std::size_t i = 1; i < args.positional.size(); ++i)
        {
            message << (i > 1 ? " " : "") << args.positional[i];
        }
        queue_.mark_failed(args.positional[0], message.str());
        out_ << "OK" << std::endl;
    }

    void Console::handle_retry(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "RETRY <job-id>");
        queue_.retry(args.positional[0]);
        out_ << "OK" << std::endl;
    }

    void Console::handle_cancel(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "CANCEL <job-id>");
        queue_.cancel(args.positional[0]);
        out_ << "OK" << std::endl;
    }

    void Console::handle_show(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "SHOW <job-id>");
        const auto item = queue_.get(args.positional[0]);
        out_ << "OK" << std::endl;
        print_item(item);
        if (item.error)
        {
            out_ << "  Error: " << *item.error << std::endl;
        }
    }

    void Console::handle_list(const ParsedArgs &args)
    {
        std::vector<QueueItem> items;
        if (args.positional.empty())
        {
            items = queue_.items();
        }
        else
        {
            const auto status = job_status_from_string(args.positional[0]);
            if (!status)
            {
                throw UsageError("unknown status: " + args.positional[0] +
                                 " (pending, active, paused, completed, failed)");
            }
            items = queue_.list_by_status(*status);
        }
        out_ << "OK" << std::endl;
        for (const auto &item : items)
        {
            print_item(item);
        }
    }

    void Console::handle_history(const ParsedArgs &args)
    {
        const std::size_t limit = args.positional.empty() ? 50 : static_cast<std::size_t>(parse_u64(args.positional[0], "limit"));
        out_ << "OK" << std::endl;
        for (const auto &record : history_.recent(limit))
        {
            out_ << record.id << "  " << record.source_id << "  " << record.quality << " " << record.format << "  "
                 << iso_datetime(record.completed_at) << "  " << record.title;
            if (record.size_bytes)
            {
                out_ << "  (" << *record.size_bytes << " bytes)";
            }
            out_ << std::endl;
        }
    }

    void Console::handle_offset(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "OFFSET <job-id>");
        const auto offset = tracker_.resume_offset(args.positional[0]);
        out_ << "OK" << std::endl;
        out_ << "Offset: " << offset << std::endl;
    }

    void Console::handle_assemble(const ParsedArgs &args)
    {
        require_positional(args.positional, 2, "ASSEMBLE <job-id> <output-file>");
        const auto state = tracker_.load(args.positional[0]);
        if (!state)
        {
            throw StoreError(ErrorCode::NotFound, "no usable checkpoint for " + args.positional[0]);
        }
        std::ofstream out(args.positional[1], std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char *>(state->bytes.data()), static_cast<std::streamsize>(state->bytes.size()));
        if (!out)
        {
            throw StoreError(ErrorCode::IoError, "cannot write " + args.positional[1]);
        }
        out_ << "OK" << std::endl;
        out_ << "Wrote " << state->bytes.size() << " bytes in " << state->checkpoint.chunks.size() << " chunks"
             << std::endl;
    }

    void Console::handle_invalidate(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "INVALIDATE <job-id>");
        tracker_.invalidate(args.positional[0]);
        out_ << "OK" << std::endl;
    }

    void Console::handle_templates(const ParsedArgs &)
    {
        out_ << "OK" << std::endl;
        for (const auto &naming : templates_.list())
        {
            out_ << (naming.is_default ? "* " : "  ") << naming.id << "  " << naming.name << "  " << naming.pattern
                 << std::endl;
        }
    }

    void Console::handle_template_add(const ParsedArgs &args)
    {
        require_positional(args.positional, 2, "TEMPLATE-ADD <name> <pattern> [--default]");
        const auto id = templates_.add(args.positional[0], args.positional[1], args.flags.contains("--default"));
        out_ << "OK" << std::endl;
        out_ << id << std::endl;
    }

    void Console::handle_template_default(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "TEMPLATE-DEFAULT <template-id>");
        templates_.set_default(args.positional[0]);
        out_ << "OK" << std::endl;
    }

    void Console::handle_template_remove(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "TEMPLATE-REMOVE <template-id>");
        templates_.remove(args.positional[0]);
        out_ << "OK" << std::endl;
    }

    void Console::handle_filename(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "FILENAME <job-id> [--template <template-id>] [--date YYYY-MM-DD]");
        const auto item = queue_.get(args.positional[0]);
        std::string pattern = "{title}";
        if (const auto template_id = option(args.options, "--template"))
        {
            pattern = templates_.get(*template_id).pattern;
        }
        else if (const auto naming = templates_.default_template())
        {
            pattern = naming->pattern;
        }
        auto fields = fields_from(item);
        fields.date = option(args.options, "--date");
        out_ << "OK" << std::endl;
        out_ << render(pattern, fields) << std::endl;
    }

    void Console::handle_collections(const ParsedArgs &)
    {
        out_ << "OK" << std::endl;
        for (const auto &collection : library_.collections())
        {
            out_ << collection.id << "  " << collection.name << "  (" << collection.item_count << " items)" << std::endl;
        }
    }

    void Console::handle_collection_add(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "COLLECTION-ADD <name> [--description D] [--color C]");
        const auto collection = library_.create_collection(args.positional[0], option(args.options, "--description"),
                                                           option(args.options, "--color"));
        out_ << "OK" << std::endl;
        out_ << collection.id << std::endl;
    }

    void Console::handle_tags(const ParsedArgs &)
    {
        out_ << "OK" << std::endl;
        for (const auto &tag : library_.tags())
        {
            out_ << tag.id << "  " << tag.name << "  (" << tag.item_count << " items)" << std::endl;
        }
    }

    void Console::handle_tag(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "TAG <name>");
        const auto tag = library_.get_or_create_tag(args.positional[0]);
        out_ << "OK" << std::endl;
        out_ << tag.id << std::endl;
    }

    void Console::handle_export(const ParsedArgs &args)
    {
        const auto document = export_snapshot(store_);
        if (args.positional.empty())
        {
            out_ << "OK" << std::endl;
            out_ << document << std::endl;
            return;
        }
        std::ofstream out(args.positional[0], std::ios::trunc);
        out << document;
        if (!out)
        {
            throw StoreError(ErrorCode::IoError, "cannot write " + args.positional[0]);
        }
        out_ << "OK" << std::endl;
    }

    void Console::handle_import(const ParsedArgs &args)
    {
        require_positional(args.positional, 1, "IMPORT <file>");
        std::ifstream in(args.positional[0]);
        if (!in.is_open())
        {
            throw UsageError("cannot read " + args.positional[0]);
        }
        const std::string document((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        const auto counts = import_snapshot(store_, document);
        out_ << "OK" << std::endl;
        out_ << "History: " << counts.history << std::endl;
        out_ << "Collections: " << counts.collections << std::endl;
        out_ << "Tags: " << counts.tags << std::endl;
        out_ << "Templates: " << counts.templates << std::endl;
        out_ << "Skipped: " << counts.skipped << std::endl;
    }

    void Console::print_help() const
    {
        out_ << "Commands:\n"
             << "  ENQUEUE <source-id> <source-ref> [--title T] [--quality Q] [--format F] [--kind K]\n"
             << "          [--format-id X] [--channel C] [--duration D] [--thumbnail U] [--force]\n"
             << "  START <job>            RESUME <job>           PROGRESS <job> <bytes> [--total N]\n"
             << "  CHUNK <job> <offset> <file> [--total N]\n"
             << "  INTERRUPT <job>        COMPLETE <job>         FAIL <job> <message>\n"
             << "  RETRY <job>            CANCEL <job>           SHOW <job>\n"
             << "  LIST [status]          HISTORY [limit]\n"
             << "  OFFSET <job>           ASSEMBLE <job> <file>  INVALIDATE <job>\n"
             << "  TEMPLATES              TEMPLATE-ADD <name> <pattern> [--default]\n"
             << "  TEMPLATE-DEFAULT <id>  TEMPLATE-REMOVE <id>\n"
             << "  FILENAME <job> [--template <id>] [--date YYYY-MM-DD]\n"
             << "  COLLECTIONS            COLLECTION-ADD <name> [--description D] [--color C]\n"
             << "  TAGS                   TAG <name>\n"
             << "  EXPORT [file]          IMPORT <file>\n"
             << "  EXIT" << std::endl;
    }

    void Console::print_item(const QueueItem &item) const
    {
        out_ << item.id << "  [" << to_string(item.status) << "]  " << item.source_id << "  " << item.quality << " "
             << item.format << " " << to_string(item.kind) << "  " << std::fixed << std::setprecision(1)
             << item.progress_pct << "%  " << item.downloaded_bytes;
        if (item.total_bytes)
        {
            out_ << "/" << *item.total_bytes;
        }
        out_ << " bytes  " << item.title << std::endl;
    }

    void Console::print_error(const StoreError &error) const
    {
        out_ << "ERROR: " << to_string(error.code()) << std::endl;
        out_ << error.what() << std::endl;
    }

    Console::ParsedArgs Console::parse_args(const std::vector<std::string> &args)
    {
        ParsedArgs parsed;
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const auto &arg = args[i];
            if (arg.rfind("--", 0) != 0)
            {
                parsed.positional.push_back(arg);
                continue;
            }
            if (kFlagOptions.contains(arg))
            {
                parsed.flags.insert(arg);
                continue;
            }
            if (i + 1 >= args.size())
            {
                throw UsageError(arg + " requires a value");
            }
            parsed.options[arg] = args[++i];
        }
        return parsed;
    }

} // namespace fetchvault::cli
