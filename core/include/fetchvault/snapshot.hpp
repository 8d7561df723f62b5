#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "fetchvault/store.hpp"

namespace fetchvault
{

    struct ImportCounts
    {
        std::size_t history{};
        std::size_t collections{};
        std::size_t tags{};
        std::size_t templates{};
        std::size_t skipped{};
    };

    // Serializes history, library collections, tags and naming templates.
    std::string export_snapshot(Store &store);

    // Upserts every well-formed record by id. Malformed records are counted in
    // `skipped`; only a document that is not a snapshot at all throws (InvalidPayload).
    ImportCounts import_snapshot(Store &store, std::string_view document);

} // namespace fetchvault
