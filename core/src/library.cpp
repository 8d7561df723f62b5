#include "fetchvault/library.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "fetchvault/crypto.hpp"

namespace fetchvault
{

    namespace
    {
        bool iequals(const std::string &lhs, const std::string &rhs)
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b)
                              { return std::tolower(a) == std::tolower(b); });
        }
    } // namespace

    Library::Library(Store &store)
        : store_(store)
    {
    }

    LibraryCollection Library::create_collection(const std::string &name, std::optional<std::string> description,
                                                 std::optional<std::string> color)
    {
        if (name.empty())
        {
            throw StoreError(ErrorCode::InvalidArgument, "collection name must not be empty");
        }
        if (!store_.collections().get_all_by_index(index::kByName, name).empty())
        {
            throw StoreError(ErrorCode::AlreadyExists, "collection '" + name + "' already exists");
        }
        LibraryCollection collection{};
        collection.id = crypto::random_id("collection");
        collection.name = name;
        collection.description = std::move(description);
        collection.color = std::move(color);
        collection.created_at = now();
        collection.updated_at = collection.created_at;
        store_.collections().put(collection);
        spdlog::info("Created collection '{}' ({})", name, collection.id);
        return collection;
    }

    std::optional<LibraryCollection> Library::find_collection(const std::string &id) const
    {
        return store_.collections().find(id);
    }

    std::vector<LibraryCollection> Library::collections() const
    {
        return store_.collections().get_all();
    }

    void Library::update_collection(LibraryCollection collection)
    {
        // Existence check surfaces NotFound before the write.
        (void)store_.collections().get(collection.id);
        collection.updated_at = now();
        store_.collections().put(collection);
    }

    bool Library::remove_collection(const std::string &id)
    {
        return store_.collections().remove(id);
    }

    Tag Library::get_or_create_tag(const std::string &name)
    {
        if (name.empty())
        {
            throw StoreError(ErrorCode::InvalidArgument, "tag name must not be empty");
        }
        for (auto &tag : store_.tags().get_all())
        {
            if (iequals(tag.name, name))
            {
                return tag;
            }
        }
        Tag tag{};
        tag.id = crypto::random_id("tag");
        tag.name = name;
        store_.tags().put(tag);
        return tag;
    }

    std::vector<Tag> Library::tags() const
    {
        return store_.tags().get_all();
    }

    bool Library::remove_tag(const std::string &id)
    {
        return store_.tags().remove(id);
    }

} // namespace fetchvault
