/**
 * fetchvault - Filename rendering from naming templates.
 *
 * A template is plain text with {name} tokens. Known tokens are replaced by
 * job fields, unknown tokens stay as literal text, and braces that do not
 * form a token are dropped. The result is stripped of characters that are
 * illegal in common filesystems, whitespace runs are collapsed and the ends
 * trimmed, so rendering an already rendered name with the same fields
 * returns it unchanged.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "fetchvault/records.hpp"

namespace fetchvault
{

    enum class Placeholder : std::uint8_t
    {
        Title,
        Channel,
        Quality,
        Format,
        Date,
        Duration,
        SourceId
    };

    std::string_view to_string(Placeholder placeholder) noexcept;
    std::optional<Placeholder> placeholder_from_string(std::string_view value) noexcept;

    struct FilenameFields
    {
        std::string title;
        std::optional<std::string> channel{};
        std::optional<std::string> quality{};
        std::optional<std::string> format{};
        std::optional<std::string> date{};
        std::optional<std::string> duration{};
        std::optional<std::string> source_id{};
    };

    FilenameFields fields_from(const QueueItem &item);

    std::string render(std::string_view pattern, const FilenameFields &fields);

    std::string sanitize_filename(std::string_view name);

    bool is_forbidden_filename_char(char c) noexcept;

} // namespace fetchvault
