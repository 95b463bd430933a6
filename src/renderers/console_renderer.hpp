#ifndef POST_MAKER_CONSOLE_RENDERER_HPP
#define POST_MAKER_CONSOLE_RENDERER_HPP

#include <ostream>

#include "interface.hpp"

namespace renderers {
    struct AnsiColors {
        static constexpr const char* RESET = "\033[0m";
        static constexpr const char* BOLD = "\033[1m";
        static constexpr const char* RED = "\033[31m";
        static constexpr const char* GREEN = "\033[32m";
        static constexpr const char* YELLOW = "\033[33m";
        static constexpr const char* BLUE = "\033[34m";
        static constexpr const char* MAGENTA = "\033[35m";
        static constexpr const char* CYAN = "\033[36m";
    };

    // Writes to std::cout/std::cerr unless other streams are given. Colors can be turned off for
    // non-terminal output.
    class ConsoleRenderer : public IRenderer {
       public:
        ConsoleRenderer();
        ConsoleRenderer(std::ostream& out, std::ostream& err, bool use_color);

        void render_preview(const RequestPreview& preview) override;
        void render_response(const pipeline::model::ResponseRecord& record, const http::model::Headers& response_headers) override;
        void render_exchange(const RequestPreview& request, const http::model::Response& response, const std::string& body, bool mocked) override;
        void render_history(const std::vector<pipeline::model::ResponseRecord>& records) override;
        void info(const std::string& message) override;
        void success(const std::string& message) override;
        void warning(const std::string& message) override;
        void error(const std::string& message) override;

       private:
        void line(std::ostream& os, const char* color, const std::string& text, bool bold = false) const;
        void render_request_lines(const RequestPreview& request);

        [[nodiscard]] static const char* status_color(long status);

        std::ostream& out_;
        std::ostream& err_;
        bool use_color_;
    };
}  // namespace renderers

#endif
