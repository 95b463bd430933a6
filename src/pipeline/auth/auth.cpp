#include "auth.hpp"

#include <string>

#include "../../utils/string_utils.hpp"
#include "../error/pipeline_error.hpp"

namespace pipeline::auth {
    http::model::Headers synthesize_auth(std::string_view type, std::string_view value) {
        if (type.empty() || value.empty()) {
            return {};
        }

        const std::string normalized_type = string_utils::to_lower(std::string(type));

        if (normalized_type == AuthTypes::BEARER) {
            return {{AUTHORIZATION_HEADER, "Bearer " + std::string(value)}};
        }

        if (normalized_type == AuthTypes::BASIC) {
            if (value.find(':') == std::string_view::npos) {
                throw error::MalformedAuth("Basic auth value must be in the form username:password");
            }
            return {{AUTHORIZATION_HEADER, "Basic " + string_utils::base64_encode(value)}};
        }

        throw error::UnsupportedAuthType(std::string(type));
    }

    http::model::Headers synthesize_auth(std::string_view descriptor) {
        // Only leading blanks go before the split, so "bearer " keeps its separator.
        const auto start = descriptor.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) {
            return {};
        }
        const std::string_view text = descriptor.substr(start);

        const auto space = text.find(' ');
        if (space == std::string_view::npos) {
            throw error::MalformedAuth("Auth must be in the form '<type> <value>', e.g. 'bearer TOKEN' or 'basic USER:PASS'");
        }

        return synthesize_auth(text.substr(0, space), string_utils::trim(std::string(text.substr(space + 1))));
    }
}  // namespace pipeline::auth
