#include "curl_command.hpp"

#include <stdexcept>
#include <vector>

#include "../utils/string_utils.hpp"

namespace cli {
    namespace {
        bool is_one_of(const std::string& token, const char* a, const char* b) { return token == a || token == b; }

        bool is_data_flag(const std::string& token) {
            return token == CurlFlags::DATA_SHORT || token == CurlFlags::DATA_LONG || token == CurlFlags::DATA_RAW || token == CurlFlags::DATA_BINARY;
        }
    }  // namespace

    pipeline::model::RequestDescriptor parse_curl_command(std::string_view text) {
        const std::vector<std::string> tokens = string_utils::shell_split(text);
        if (tokens.empty() || tokens.front() != "curl") {
            throw std::runtime_error("Not a valid cURL command.");
        }

        pipeline::model::RequestDescriptor out;

        for (size_t i = 1; i < tokens.size(); ++i) {
            const std::string& token = tokens[i];
            const bool has_value = i + 1 < tokens.size();

            if (is_one_of(token, CurlFlags::REQUEST_SHORT, CurlFlags::REQUEST_LONG) && has_value) {
                out.method_ = string_utils::to_upper(tokens[++i]);
            } else if (is_one_of(token, CurlFlags::HEADER_SHORT, CurlFlags::HEADER_LONG) && has_value) {
                const std::string& header = tokens[++i];
                const auto colon = header.find(':');
                if (colon != std::string::npos) {
                    http::model::set_header(out.headers_, string_utils::trim(header.substr(0, colon)), string_utils::trim(header.substr(colon + 1)));
                }
            } else if (is_data_flag(token) && has_value) {
                const std::string& data = tokens[++i];
                try {
                    out.body_ = json::Value::parse(data);
                } catch (const json::ParseError&) {
                    out.body_ = json::Value(data);
                }
            } else if (!token.starts_with("-")) {
                out.url_ = token;
            }
        }

        if (out.url_.empty()) {
            throw std::runtime_error("Could not parse URL from cURL command.");
        }
        return out;
    }

    std::string to_curl_command(const pipeline::model::RequestDescriptor& descriptor) {
        std::vector<std::string> tokens = {"curl"};

        const std::string method = string_utils::to_upper(descriptor.method_);
        if (method != "GET") {
            tokens.emplace_back(CurlFlags::REQUEST_SHORT);
            tokens.push_back(method);
        }

        for (const auto& [name, value] : descriptor.headers_) {
            tokens.emplace_back(CurlFlags::HEADER_SHORT);
            tokens.push_back(name + ": " + value);
        }

        if (const auto body = pipeline::model::normalize_body(descriptor.body_)) {
            tokens.emplace_back(CurlFlags::DATA_SHORT);
            tokens.push_back(body->is_string() ? body->as_string() : body->dump());
        }

        tokens.push_back(descriptor.url_);

        std::string out;
        for (const auto& token : tokens) {
            if (!out.empty()) {
                out += ' ';
            }
            out += string_utils::shell_quote(token);
        }
        return out;
    }
}  // namespace cli
