#pragma once

#include <optional>
#include <string>
#include <vector>

#include "fetchvault/records.hpp"
#include "fetchvault/store.hpp"

namespace fetchvault
{

    // User-defined collections and tags that travel with snapshot export/import.
    class Library
    {
    public:
        explicit Library(Store &store);

        LibraryCollection create_collection(const std::string &name, std::optional<std::string> description = std::nullopt,
                                            std::optional<std::string> color = std::nullopt);
        std::optional<LibraryCollection> find_collection(const std::string &id) const;
        std::vector<LibraryCollection> collections() const;
        void update_collection(LibraryCollection collection);
        bool remove_collection(const std::string &id);

        // Case-insensitive lookup by name; creates the tag when absent.
        Tag get_or_create_tag(const std::string &name);
        std::vector<Tag> tags() const;
        bool remove_tag(const std::string &id);

    private:
        Store &store_;
    };

} // namespace fetchvault
