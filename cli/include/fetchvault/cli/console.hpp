#pragma once

#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "fetchvault/cli/config.hpp"
#include "fetchvault/errors.hpp"
#include "fetchvault/history.hpp"
#include "fetchvault/library.hpp"
#include "fetchvault/queue_manager.hpp"
#include "fetchvault/resume_tracker.hpp"
#include "fetchvault/store.hpp"
#include "fetchvault/templates.hpp"

namespace fetchvault::cli
{

    // Operator and transfer-driver surface over one store.
    class Console
    {
    public:
        Console(const CliConfig &config, std::ostream &out);

        // Runs a single command; returns false when it failed.
        bool execute(const std::string &command, const std::vector<std::string> &args);

        void interactive_shell(std::istream &in);

    private:
        struct ParsedArgs
        {
            std::vector<std::string> positional;
            std::map<std::string, std::string> options;
            std::set<std::string> flags;
        };

        bool dispatch(const std::string &command, const ParsedArgs &args);

        void handle_enqueue(const ParsedArgs &args);
        void handle_start(const ParsedArgs &args);
        void handle_resume(const ParsedArgs &args);
        void handle_progress(const ParsedArgs &args);
        void handle_chunk(const ParsedArgs &args);
        void handle_interrupt(const ParsedArgs &args);
        void handle_complete(const ParsedArgs &args);
        void handle_fail(const ParsedArgs &args);
        void handle_retry(const ParsedArgs &args);
        void handle_cancel(const ParsedArgs &args);
        void handle_show(const ParsedArgs &args);
        void handle_list(const ParsedArgs &args);
        void handle_history(const ParsedArgs &args);
        void handle_offset(const ParsedArgs &args);
        void handle_assemble(const ParsedArgs &args);
        void handle_invalidate(const ParsedArgs &args);
        void handle_templates(const ParsedArgs &args);
        void handle_template_add(const ParsedArgs &args);
        void handle_template_default(const ParsedArgs &args);
        void handle_template_remove(const ParsedArgs &args);
        void handle_filename(const ParsedArgs &args);
        void handle_collections(const ParsedArgs &args);
        void handle_collection_add(const ParsedArgs &args);
        void handle_tags(const ParsedArgs &args);
        void handle_tag(const ParsedArgs &args);
        void handle_export(const ParsedArgs &args);
        void handle_import(const ParsedArgs &args);

        void print_help() const;
        void print_item(const QueueItem &item) const;
        void print_error(const StoreError &error) const;

        static ParsedArgs parse_args(const std::vector<std::string> &args);

        Store store_;
        ResumeTracker tracker_;
        QueueManager queue_;
        History history_;
        TemplateStore templates_;
        Library library_;
        std::ostream &out_;
    };

} // namespace fetchvault::cli
