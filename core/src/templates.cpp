#include "fetchvault/templates.hpp"

#include <spdlog/spdlog.h>

#include "fetchvault/crypto.hpp"

namespace fetchvault
{

    TemplateStore::TemplateStore(Store &store)
        : store_(store)
    {
    }

    std::vector<NamingTemplate> TemplateStore::list() const
    {
        return store_.templates().get_all();
    }

    NamingTemplate TemplateStore::get(const std::string &id) const
    {
        return store_.templates().get(id);
    }

    std::optional<NamingTemplate> TemplateStore::default_template() const
    {
        auto defaults = store_.templates().get_all_by_index(index::kByDefault, "true");
        if (defaults.empty())
        {
            return std::nullopt;
        }
        return std::move(defaults.front());
    }

    std::string TemplateStore::add(const std::string &name, const std::string &pattern, bool make_default)
    {
        if (pattern.empty())
        {
            throw StoreError(ErrorCode::InvalidArgument, "template pattern must not be empty");
        }
        NamingTemplate naming{crypto::random_id("template"), name, pattern, make_default};
        if (make_default)
        {
            write_with_default(naming);
        }
        else
        {
            store_.templates().put(naming);
        }
        spdlog::info("Added naming template '{}' ({})", name, naming.id);
        return naming.id;
    }

    void TemplateStore::update(const NamingTemplate &naming)
    {
        if (naming.pattern.empty())
        {
            throw StoreError(ErrorCode::InvalidArgument, "template pattern must not be empty");
        }
        const auto existing = store_.templates().get(naming.id);
        if (naming.is_default)
        {
            write_with_default(naming);
        }
        else
        {
            store_.templates().put(naming);
        }
        if (existing.is_default && !naming.is_default)
        {
            spdlog::info("Template {} is no longer the default", naming.id);
        }
    }

    bool TemplateStore::remove(const std::string &id)
    {
        return store_.templates().remove(id);
    }

    void TemplateStore::set_default(const std::string &id)
    {
        auto target = store_.templates().get(id);
        target.is_default = true;
        write_with_default(std::move(target));
        spdlog::info("Default naming template is now {}", id);
    }

    void TemplateStore::write_with_default(NamingTemplate naming)
    {
        std::vector<NamingTemplate> batch;
        for (auto &other : store_.templates().get_all())
        {
            if (other.id != naming.id && other.is_default)
            {
                other.is_default = false;
                batch.push_back(std::move(other));
            }
        }
        naming.is_default = true;
        batch.push_back(std::move(naming));
        store_.templates().put_many(batch);
    }

} // namespace fetchvault
