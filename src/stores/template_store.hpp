#ifndef POST_MAKER_TEMPLATE_STORE_HPP
#define POST_MAKER_TEMPLATE_STORE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../pipeline/model/model.hpp"

namespace stores {
    struct RequestTemplate {
        std::string name_;
        pipeline::model::RequestDescriptor descriptor_;
        pipeline::model::ExecuteOptions flags_;
    };

    // {name: {method, url, headers, data, flags: {...}}} in one JSON file.
    class TemplateStore {
       public:
        explicit TemplateStore(std::filesystem::path path);

        void save(const RequestTemplate& request_template);
        [[nodiscard]] std::optional<RequestTemplate> find(const std::string& name) const;
        [[nodiscard]] std::vector<RequestTemplate> list() const;
        bool remove(const std::string& name);

       private:
        [[nodiscard]] json::Value load_object() const;

        std::filesystem::path path_;
    };
}  // namespace stores

#endif
