#ifndef POST_MAKER_ALIAS_STORE_HPP
#define POST_MAKER_ALIAS_STORE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../pipeline/model/model.hpp"

namespace stores {
    using NamedDescriptor = std::pair<std::string, pipeline::model::RequestDescriptor>;

    struct Collection {
        std::string name_;
        std::vector<NamedDescriptor> aliases_;
    };

    /**
     * Saved requests. Collections live in {collection: {alias: descriptor}}, global aliases in
     * {alias: descriptor}, each in its own JSON file. A missing file reads as empty.
     */
    class AliasStore {
       public:
        AliasStore(std::filesystem::path collections_path, std::filesystem::path global_aliases_path);

        // Without a collection the alias is saved globally.
        void save(const std::optional<std::string>& collection, const std::string& alias, const pipeline::model::RequestDescriptor& descriptor);

        [[nodiscard]] std::optional<pipeline::model::RequestDescriptor> find(const std::optional<std::string>& collection, const std::string& alias) const;

        [[nodiscard]] std::vector<Collection> collections() const;
        [[nodiscard]] std::vector<NamedDescriptor> global_aliases() const;

        bool remove_global(const std::string& alias);
        bool delete_collection(const std::string& name);
        bool delete_collection_item(const std::string& name, const std::string& alias);

       private:
        [[nodiscard]] static json::Value load_object(const std::filesystem::path& path);

        std::filesystem::path collections_path_;
        std::filesystem::path global_aliases_path_;
    };
}  // namespace stores

#endif
