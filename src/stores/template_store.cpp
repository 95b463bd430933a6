#include "template_store.hpp"

#include <stdexcept>
#include <utility>

#include "json_file.hpp"

namespace stores {
    namespace {
        RequestTemplate template_from_json(const std::string& name, const json::Value& entry) {
            RequestTemplate out{.name_ = name, .descriptor_ = pipeline::model::descriptor_from_json(entry), .flags_ = {}};
            if (const json::Value* flags = entry.find("flags")) {
                out.flags_ = pipeline::model::options_from_json(*flags);
            }
            return out;
        }
    }  // namespace

    TemplateStore::TemplateStore(std::filesystem::path path) : path_(std::move(path)) {}

    json::Value TemplateStore::load_object() const {
        auto doc = read_json_file(path_);
        if (!doc) {
            return json::Value{json::Object{}};
        }
        if (!doc->is_object()) {
            throw std::runtime_error("Expected a JSON object in " + path_.string());
        }
        return std::move(*doc);
    }

    void TemplateStore::save(const RequestTemplate& request_template) {
        json::Value entry = pipeline::model::to_json(request_template.descriptor_);
        entry.set("flags", pipeline::model::to_json(request_template.flags_));

        json::Value templates = load_object();
        templates.set(request_template.name_, std::move(entry));
        write_json_file(path_, templates);
    }

    std::optional<RequestTemplate> TemplateStore::find(const std::string& name) const {
        const json::Value templates = load_object();
        const json::Value* entry = templates.find(name);
        if (entry == nullptr) {
            return std::nullopt;
        }
        return template_from_json(name, *entry);
    }

    std::vector<RequestTemplate> TemplateStore::list() const {
        const json::Value templates = load_object();

        std::vector<RequestTemplate> out;
        for (const auto& [name, entry] : templates.as_object()) {
            out.push_back(template_from_json(name, entry));
        }
        return out;
    }

    bool TemplateStore::remove(const std::string& name) {
        json::Value templates = load_object();
        if (!templates.erase(name)) {
            return false;
        }
        write_json_file(path_, templates);
        return true;
    }
}  // namespace stores
