#ifndef POST_MAKER_PIPELINE_MODEL_HPP
#define POST_MAKER_PIPELINE_MODEL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../../http/model/model.hpp"
#include "../../json/value.hpp"

namespace pipeline::model {
    enum class DebugMode { OFF, ON };

    enum class DisplayFilter { BODY, HEADERS, STATUS };

    struct RequestDescriptor {
        std::string method_ = "GET";
        std::string url_;
        http::model::Headers headers_;
        std::optional<json::Value> body_;
        std::optional<std::string> auth_;
    };

    struct ExecuteOptions {
        std::optional<std::string> output_file_;
        std::optional<DisplayFilter> display_filter_;
        std::optional<std::string> auth_override_;
        std::optional<std::string> assertion_;
        bool preview_ = false;
        bool fill_variables_ = false;
        bool skip_history_ = false;
        bool dry_run_ = false;
        bool mock_ = false;
        int repeat_ = 1;
        long interval_ms_ = 0;
        bool verbose_ = false;
    };

    // One completed exchange. Never modified after creation.
    struct ResponseRecord {
        std::string method_;
        std::string url_;
        http::model::Headers headers_;
        std::optional<json::Value> body_;
        std::optional<std::string> output_file_;
        std::optional<DisplayFilter> display_filter_;
        long status_ = 0;
        std::string reason_;
        double elapsed_ms_ = 0.0;
        std::size_t size_bytes_ = 0;
        std::string timestamp_;
        std::string response_body_;
    };

    struct ExecutionSummary {
        std::size_t dispatched_ = 0;
        std::size_t failed_ = 0;
        std::size_t skipped_ = 0;
        std::vector<ResponseRecord> records_;
        // Values typed in at variable prompts, in prompt order.
        std::vector<std::pair<std::string, std::string>> prompted_variables_;
    };

    // Absent, JSON null and {} all mean "no body". Everything else, [] and "" included, is kept.
    [[nodiscard]] std::optional<json::Value> normalize_body(std::optional<json::Value> body);

    [[nodiscard]] std::optional<DisplayFilter> parse_display_filter(std::string_view text);
    [[nodiscard]] std::string to_string(DisplayFilter filter);

    [[nodiscard]] json::Value headers_to_json(const http::model::Headers& headers);
    [[nodiscard]] http::model::Headers headers_from_json(const json::Value& value);

    [[nodiscard]] json::Value to_json(const RequestDescriptor& descriptor);
    [[nodiscard]] RequestDescriptor descriptor_from_json(const json::Value& value);

    [[nodiscard]] json::Value to_json(const ResponseRecord& record);
    [[nodiscard]] ResponseRecord record_from_json(const json::Value& value);

    [[nodiscard]] json::Value to_json(const ExecuteOptions& options);
    [[nodiscard]] ExecuteOptions options_from_json(const json::Value& value);
}  // namespace pipeline::model

#endif
