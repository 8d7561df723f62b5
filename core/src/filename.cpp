#include "fetchvault/filename.hpp"

#include <array>
#include <cctype>

#include "fetchvault/time_utils.hpp"

namespace fetchvault
{

    namespace
    {

        struct PlaceholderMapping
        {
            Placeholder placeholder;
            std::string_view token;
        };

        constexpr std::array<PlaceholderMapping, 7> kPlaceholderMappings{{
            {Placeholder::Title, "title"},
            {Placeholder::Channel, "channel"},
            {Placeholder::Quality, "quality"},
            {Placeholder::Format, "format"},
            {Placeholder::Date, "date"},
            {Placeholder::Duration, "duration"},
            {Placeholder::SourceId, "id"},
        }};

        bool is_token_char(char c) noexcept
        {
            return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
        }

        std::string value_for(Placeholder placeholder, const FilenameFields &fields)
        {
            switch (placeholder)
            {
            case Placeholder::Title:
                return fields.title;
            case Placeholder::Channel:
                return fields.channel.value_or("Unknown");
            case Placeholder::Quality:
                return fields.quality.value_or("best");
            case Placeholder::Format:
                return fields.format.value_or("mp4");
            case Placeholder::Date:
                return fields.date ? *fields.date : iso_date(now());
            case Placeholder::Duration:
                return fields.duration.value_or("");
            case Placeholder::SourceId:
                return fields.source_id.value_or("");
            }
            return {};
        }

        // Substituted values never carry braces, so they cannot form new tokens.
        void append_value(std::string &out, std::string_view value)
        {
            for (const char c : value)
            {
                if (c != '{' && c != '}')
                {
                    out.push_back(c);
                }
            }
        }

    } // namespace

    std::string_view to_string(Placeholder placeholder) noexcept
    {
        for (const auto &mapping : kPlaceholderMappings)
        {
            if (mapping.placeholder == placeholder)
            {
                return mapping.token;
            }
        }
        return "unknown";
    }

    std::optional<Placeholder> placeholder_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kPlaceholderMappings)
        {
            if (mapping.token == value)
            {
                return mapping.placeholder;
            }
        }
        return std::nullopt;
    }

    FilenameFields fields_from(const QueueItem &item)
    {
        FilenameFields fields{};
        fields.title = item.title;
        fields.channel = item.channel;
        fields.quality = item.quality.empty() ? std::nullopt : std::optional<std::string>(item.quality);
        fields.format = item.format.empty() ? std::nullopt : std::optional<std::string>(item.format);
        fields.duration = item.duration;
        fields.source_id = item.source_id;
        return fields;
    }

    std::string render(std::string_view pattern, const FilenameFields &fields)
    {
        std::string out;
        out.reserve(pattern.size() + fields.title.size());
        std::size_t pos = 0;
        while (pos < pattern.size())
        {
            const char c = pattern[pos];
            if (c == '}')
            {
                ++pos;
                continue;
            }
            if (c != '{')
            {
                out.push_back(c);
                ++pos;
                continue;
            }
            auto end = pos + 1;
            while (end < pattern.size() && is_token_char(pattern[end]))
            {
                ++end;
            }
            if (end == pos + 1 || end >= pattern.size() || pattern[end] != '}')
            {
                // Stray opening brace.
                ++pos;
                continue;
            }
            const auto name = pattern.substr(pos + 1, end - pos - 1);
            if (const auto placeholder = placeholder_from_string(name))
            {
                append_value(out, value_for(*placeholder, fields));
            }
            else
            {
                out.append(pattern.substr(pos, end - pos + 1));
            }
            pos = end + 1;
        }
        return sanitize_filename(out);
    }

    bool is_forbidden_filename_char(char c) noexcept
    {
        switch (c)
        {
        case '<':
        case '>':
        case ':':
        case '"':
        case '/':
        case '\\':
        case '|':
        case '?':
        case '*':
            return true;
        default:
            return static_cast<unsigned char>(c) < 0x20 || c == 0x7F;
        }
    }

    std::string sanitize_filename(std::string_view name)
    {
        std::string out;
        out.reserve(name.size());
        bool pending_space = false;
        for (const char c : name)
        {
            if (is_forbidden_filename_char(c) && c != '\t' && c != '\n' && c != '\r')
            {
                continue;
            }
            if (std::isspace(static_cast<unsigned char>(c)) != 0)
            {
                pending_space = !out.empty();
                continue;
            }
            if (pending_space)
            {
                out.push_back(' ');
                pending_space = false;
            }
            out.push_back(c);
        }
        return out;
    }

} // namespace fetchvault
