#include "model.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "../../utils/string_utils.hpp"

namespace pipeline::model {
    namespace fields {
        static std::optional<std::string> optional_string(const json::Value& value, std::string_view key) {
            const json::Value* v = value.find(key);
            if (v == nullptr || v->is_null()) {
                return std::nullopt;
            }
            if (!v->is_string()) {
                throw std::runtime_error("Field '" + std::string(key) + "' must be a string");
            }
            return v->as_string();
        }

        static bool bool_or(const json::Value& value, std::string_view key, bool fallback) {
            const json::Value* v = value.find(key);
            if (v == nullptr || v->is_null()) {
                return fallback;
            }
            if (!v->is_bool()) {
                throw std::runtime_error("Field '" + std::string(key) + "' must be a boolean");
            }
            return v->as_bool();
        }

        static int64_t int_or(const json::Value& value, std::string_view key, int64_t fallback) {
            const json::Value* v = value.find(key);
            if (v == nullptr || v->is_null()) {
                return fallback;
            }
            if (!v->is_number()) {
                throw std::runtime_error("Field '" + std::string(key) + "' must be a number");
            }
            return v->is_int() ? v->as_int() : static_cast<int64_t>(v->as_double());
        }

        static json::Value optional_to_json(const std::optional<std::string>& value) { return value ? json::Value(*value) : json::Value(nullptr); }
    }  // namespace fields

    std::optional<json::Value> normalize_body(std::optional<json::Value> body) {
        if (!body || body->is_null()) {
            return std::nullopt;
        }
        if (body->is_object() && body->as_object().empty()) {
            return std::nullopt;
        }
        return body;
    }

    std::optional<DisplayFilter> parse_display_filter(std::string_view text) {
        const std::string filter = string_utils::to_lower(string_utils::trim(std::string(text)));
        if (filter.empty()) {
            return std::nullopt;
        }
        if (filter == "body") {
            return DisplayFilter::BODY;
        }
        if (filter == "headers") {
            return DisplayFilter::HEADERS;
        }
        if (filter == "status") {
            return DisplayFilter::STATUS;
        }
        throw std::runtime_error("Invalid display filter '" + std::string(text) + "', expected body, headers or status");
    }

    std::string to_string(DisplayFilter filter) {
        switch (filter) {
            case DisplayFilter::BODY:
                return "body";
            case DisplayFilter::HEADERS:
                return "headers";
            case DisplayFilter::STATUS:
                return "status";
        }
        return "";
    }

    json::Value headers_to_json(const http::model::Headers& headers) {
        json::Object out;
        for (const auto& [name, value] : headers) {
            // Repeated headers (Set-Cookie) fold into one comma separated entry under the first spelling.
            auto it = std::find_if(out.begin(), out.end(), [&name](const auto& member) { return string_utils::iequals(member.first, name); });
            if (it == out.end()) {
                out.emplace_back(name, value);
            } else {
                it->second = json::Value(it->second.as_string() + ", " + value);
            }
        }
        return json::Value(std::move(out));
    }

    http::model::Headers headers_from_json(const json::Value& value) {
        http::model::Headers out;
        if (!value.is_object()) {
            return out;
        }
        for (const auto& [name, v] : value.as_object()) {
            out.emplace_back(name, v.is_string() ? v.as_string() : v.dump());
        }
        return out;
    }

    json::Value to_json(const RequestDescriptor& descriptor) {
        json::Value out{json::Object{}};
        out.set("method", descriptor.method_);
        out.set("url", descriptor.url_);
        out.set("headers", headers_to_json(descriptor.headers_));
        out.set("data", descriptor.body_ ? *descriptor.body_ : json::Value(nullptr));
        if (descriptor.auth_) {
            out.set("auth", *descriptor.auth_);
        }
        return out;
    }

    RequestDescriptor descriptor_from_json(const json::Value& value) {
        if (!value.is_object()) {
            throw std::runtime_error("Request must be a JSON object");
        }

        RequestDescriptor out;
        out.url_ = fields::optional_string(value, "url").value_or("");
        if (out.url_.empty()) {
            throw std::runtime_error("Request is missing 'url'");
        }
        out.method_ = fields::optional_string(value, "method").value_or("GET");
        if (const json::Value* headers = value.find("headers")) {
            out.headers_ = headers_from_json(*headers);
        }
        if (const json::Value* data = value.find("data")) {
            out.body_ = *data;
        }
        out.auth_ = fields::optional_string(value, "auth");
        return out;
    }

    json::Value to_json(const ResponseRecord& record) {
        json::Value out{json::Object{}};
        out.set("method", record.method_);
        out.set("url", record.url_);
        out.set("headers", headers_to_json(record.headers_));
        out.set("data", record.body_ ? *record.body_ : json::Value(nullptr));
        out.set("output_file", fields::optional_to_json(record.output_file_));
        out.set("only", record.display_filter_ ? json::Value(to_string(*record.display_filter_)) : json::Value(nullptr));
        out.set("status", record.status_);
        out.set("reason", record.reason_);
        out.set("elapsed", record.elapsed_ms_);
        out.set("size", static_cast<int64_t>(record.size_bytes_));
        out.set("date", record.timestamp_);
        out.set("body", record.response_body_);
        return out;
    }

    ResponseRecord record_from_json(const json::Value& value) {
        if (!value.is_object()) {
            throw std::runtime_error("History entry must be a JSON object");
        }

        ResponseRecord out;
        out.method_ = value.string_or("method", "GET");
        out.url_ = value.string_or("url", "");
        if (const json::Value* headers = value.find("headers")) {
            out.headers_ = headers_from_json(*headers);
        }
        if (const json::Value* data = value.find("data")) {
            out.body_ = normalize_body(*data);
        }
        out.output_file_ = fields::optional_string(value, "output_file");
        if (auto only = fields::optional_string(value, "only")) {
            out.display_filter_ = parse_display_filter(*only);
        }
        out.status_ = static_cast<long>(fields::int_or(value, "status", 0));
        out.reason_ = value.string_or("reason", "");
        if (const json::Value* elapsed = value.find("elapsed"); elapsed != nullptr && elapsed->is_number()) {
            out.elapsed_ms_ = elapsed->as_double();
        }
        out.size_bytes_ = static_cast<std::size_t>(fields::int_or(value, "size", 0));
        out.timestamp_ = value.string_or("date", "");
        out.response_body_ = value.string_or("body", "");
        return out;
    }

    json::Value to_json(const ExecuteOptions& options) {
        json::Value out{json::Object{}};
        out.set("output_file", fields::optional_to_json(options.output_file_));
        out.set("only", options.display_filter_ ? json::Value(to_string(*options.display_filter_)) : json::Value(nullptr));
        out.set("auth", fields::optional_to_json(options.auth_override_));
        out.set("assertion", fields::optional_to_json(options.assertion_));
        out.set("preview", options.preview_);
        out.set("fill_vars", options.fill_variables_);
        out.set("no_history", options.skip_history_);
        out.set("dry_run", options.dry_run_);
        out.set("mock", options.mock_);
        out.set("repeat", options.repeat_);
        out.set("interval", options.interval_ms_);
        out.set("verbose", options.verbose_);
        return out;
    }

    ExecuteOptions options_from_json(const json::Value& value) {
        ExecuteOptions out;
        if (!value.is_object()) {
            return out;
        }
        out.output_file_ = fields::optional_string(value, "output_file");
        if (auto only = fields::optional_string(value, "only")) {
            out.display_filter_ = parse_display_filter(*only);
        }
        out.auth_override_ = fields::optional_string(value, "auth");
        out.assertion_ = fields::optional_string(value, "assertion");
        out.preview_ = fields::bool_or(value, "preview", false);
        out.fill_variables_ = fields::bool_or(value, "fill_vars", false);
        out.skip_history_ = fields::bool_or(value, "no_history", false);
        out.dry_run_ = fields::bool_or(value, "dry_run", false);
        out.mock_ = fields::bool_or(value, "mock", false);
        out.repeat_ = static_cast<int>(fields::int_or(value, "repeat", 1));
        out.interval_ms_ = static_cast<long>(fields::int_or(value, "interval", 0));
        out.verbose_ = fields::bool_or(value, "verbose", false);
        return out;
    }
}  // namespace pipeline::model
