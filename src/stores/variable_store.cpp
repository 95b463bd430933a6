#include "variable_store.hpp"

#include <utility>

#include "json_file.hpp"

namespace stores {
    FileVariableStore::FileVariableStore(std::filesystem::path path) : path_(std::move(path)) {}

    pipeline::resolver::VariableMap FileVariableStore::load() const {
        pipeline::resolver::VariableMap out;

        std::optional<json::Value> doc;
        try {
            doc = read_json_file(path_);
        } catch (const std::runtime_error&) {
            return out;
        }

        if (!doc || !doc->is_object()) {
            return out;
        }

        for (const auto& [name, value] : doc->as_object()) {
            out[name] = value.is_string() ? value.as_string() : value.dump();
        }
        return out;
    }

    void FileVariableStore::save(const pipeline::resolver::VariableMap& variables) {
        json::Value doc{json::Object{}};
        for (const auto& [name, value] : variables) {
            doc.set(name, value);
        }
        write_json_file(path_, doc);
    }

    void FileVariableStore::set(const std::string& name, const std::string& value) {
        auto variables = load();
        variables[name] = value;
        save(variables);
    }

    bool FileVariableStore::remove(const std::string& name) {
        auto variables = load();
        if (variables.erase(name) == 0) {
            return false;
        }
        save(variables);
        return true;
    }

    void FileVariableStore::clear() { save({}); }
}  // namespace stores
