#include "alias_store.hpp"

#include <stdexcept>
#include <utility>

#include "json_file.hpp"

namespace stores {
    namespace {
        std::vector<NamedDescriptor> descriptors_of(const json::Value& group) {
            std::vector<NamedDescriptor> out;
            if (!group.is_object()) {
                return out;
            }
            for (const auto& [alias, entry] : group.as_object()) {
                out.emplace_back(alias, pipeline::model::descriptor_from_json(entry));
            }
            return out;
        }
    }  // namespace

    AliasStore::AliasStore(std::filesystem::path collections_path, std::filesystem::path global_aliases_path)
        : collections_path_(std::move(collections_path)), global_aliases_path_(std::move(global_aliases_path)) {}

    json::Value AliasStore::load_object(const std::filesystem::path& path) {
        auto doc = read_json_file(path);
        if (!doc) {
            return json::Value{json::Object{}};
        }
        if (!doc->is_object()) {
            throw std::runtime_error("Expected a JSON object in " + path.string());
        }
        return std::move(*doc);
    }

    void AliasStore::save(const std::optional<std::string>& collection, const std::string& alias, const pipeline::model::RequestDescriptor& descriptor) {
        if (!collection) {
            json::Value aliases = load_object(global_aliases_path_);
            aliases.set(alias, pipeline::model::to_json(descriptor));
            write_json_file(global_aliases_path_, aliases);
            return;
        }

        json::Value collections = load_object(collections_path_);
        json::Value* group = collections.find(*collection);
        if (group == nullptr || !group->is_object()) {
            collections.set(*collection, json::Object{});
            group = collections.find(*collection);
        }
        group->set(alias, pipeline::model::to_json(descriptor));
        write_json_file(collections_path_, collections);
    }

    std::optional<pipeline::model::RequestDescriptor> AliasStore::find(const std::optional<std::string>& collection, const std::string& alias) const {
        const json::Value doc = collection ? load_object(collections_path_) : load_object(global_aliases_path_);

        const json::Value* group = collection ? doc.find(*collection) : &doc;
        if (group == nullptr) {
            return std::nullopt;
        }

        const json::Value* entry = group->find(alias);
        if (entry == nullptr) {
            return std::nullopt;
        }
        return pipeline::model::descriptor_from_json(*entry);
    }

    std::vector<Collection> AliasStore::collections() const {
        const json::Value doc = load_object(collections_path_);

        std::vector<Collection> out;
        for (const auto& [name, group] : doc.as_object()) {
            out.push_back(Collection{.name_ = name, .aliases_ = descriptors_of(group)});
        }
        return out;
    }

    std::vector<NamedDescriptor> AliasStore::global_aliases() const { return descriptors_of(load_object(global_aliases_path_)); }

    bool AliasStore::remove_global(const std::string& alias) {
        json::Value aliases = load_object(global_aliases_path_);
        if (!aliases.erase(alias)) {
            return false;
        }
        write_json_file(global_aliases_path_, aliases);
        return true;
    }

    bool AliasStore::delete_collection(const std::string& name) {
        json::Value collections = load_object(collections_path_);
        if (!collections.erase(name)) {
            return false;
        }
        write_json_file(collections_path_, collections);
        return true;
    }

    bool AliasStore::delete_collection_item(const std::string& name, const std::string& alias) {
        json::Value collections = load_object(collections_path_);
        json::Value* group = collections.find(name);
        if (group == nullptr || !group->erase(alias)) {
            return false;
        }
        write_json_file(collections_path_, collections);
        return true;
    }
}  // namespace stores
