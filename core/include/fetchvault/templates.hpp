#pragma once

#include <optional>
#include <string>
#include <vector>

#include "fetchvault/records.hpp"
#include "fetchvault/store.hpp"

namespace fetchvault
{

    // Filename pattern presets. At most one template is the default at any time.
    class TemplateStore
    {
    public:
        explicit TemplateStore(Store &store);

        std::vector<NamingTemplate> list() const;
        NamingTemplate get(const std::string &id) const;
        std::optional<NamingTemplate> default_template() const;

        std::string add(const std::string &name, const std::string &pattern, bool make_default = false);
        void update(const NamingTemplate &naming);
        bool remove(const std::string &id);

        // Clears every other default and marks id in a single write.
        void set_default(const std::string &id);

    private:
        void write_with_default(NamingTemplate naming);

        Store &store_;
    };

} // namespace fetchvault
