#ifndef POST_MAKER_RENDERERS_INTERFACE_HPP
#define POST_MAKER_RENDERERS_INTERFACE_HPP

#include <optional>
#include <string>
#include <vector>

#include "../http/model/model.hpp"
#include "../pipeline/model/model.hpp"

namespace renderers {
    struct RequestPreview {
        std::string method_;
        std::string url_;
        http::model::Headers headers_;
        std::optional<json::Value> body_;
    };

    class IRenderer {
       public:
        IRenderer() = default;
        virtual ~IRenderer() = default;
        IRenderer(const IRenderer&) = delete;
        IRenderer& operator=(const IRenderer&) = delete;
        IRenderer(IRenderer&&) = delete;
        IRenderer& operator=(IRenderer&&) = delete;

        virtual void render_preview(const RequestPreview& preview) = 0;
        virtual void render_response(const pipeline::model::ResponseRecord& record, const http::model::Headers& response_headers) = 0;
        virtual void render_exchange(const RequestPreview& request, const http::model::Response& response, const std::string& body, bool mocked) = 0;
        virtual void render_history(const std::vector<pipeline::model::ResponseRecord>& records) = 0;
        virtual void info(const std::string& message) = 0;
        virtual void success(const std::string& message) = 0;
        virtual void warning(const std::string& message) = 0;
        virtual void error(const std::string& message) = 0;
    };
}  // namespace renderers

#endif
