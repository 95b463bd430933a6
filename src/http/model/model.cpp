#include "model.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

#include "../../utils/string_utils.hpp"

namespace http::model {
    const std::string* find_header(const Headers& headers, std::string_view name) {
        auto it = std::find_if(headers.begin(), headers.end(), [name](const auto& header) { return string_utils::iequals(header.first, name); });
        return it == headers.end() ? nullptr : &it->second;
    }

    void set_header(Headers& headers, std::string name, std::string value) {
        auto it = std::find_if(headers.begin(), headers.end(), [&name](const auto& header) { return string_utils::iequals(header.first, name); });
        if (it != headers.end()) {
            it->first = std::move(name);
            it->second = std::move(value);
            return;
        }
        headers.emplace_back(std::move(name), std::move(value));
    }

    void merge_headers(Headers& into, const Headers& overrides) {
        for (const auto& [name, value] : overrides) {
            set_header(into, name, value);
        }
    }

    std::string reason_phrase(long status) {
        static const std::unordered_map<long, const char*> REASONS = {
            {100, "Continue"},          {101, "Switching Protocols"},   {200, "OK"},
            {201, "Created"},           {202, "Accepted"},              {204, "No Content"},
            {206, "Partial Content"},   {301, "Moved Permanently"},     {302, "Found"},
            {303, "See Other"},         {304, "Not Modified"},          {307, "Temporary Redirect"},
            {308, "Permanent Redirect"}, {400, "Bad Request"},          {401, "Unauthorized"},
            {403, "Forbidden"},         {404, "Not Found"},             {405, "Method Not Allowed"},
            {406, "Not Acceptable"},    {408, "Request Timeout"},       {409, "Conflict"},
            {410, "Gone"},              {413, "Payload Too Large"},     {415, "Unsupported Media Type"},
            {422, "Unprocessable Entity"}, {429, "Too Many Requests"},  {500, "Internal Server Error"},
            {501, "Not Implemented"},   {502, "Bad Gateway"},           {503, "Service Unavailable"},
            {504, "Gateway Timeout"},
        };

        auto it = REASONS.find(status);
        return it == REASONS.end() ? std::string{} : std::string(it->second);
    }
}  // namespace http::model
