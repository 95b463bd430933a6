#ifndef POST_MAKER_AUTH_HPP
#define POST_MAKER_AUTH_HPP

#include <string_view>

#include "../../http/model/model.hpp"

namespace pipeline::auth {
    struct AuthTypes {
        static constexpr const char* BEARER = "bearer";
        static constexpr const char* BASIC = "basic";
    };

    inline constexpr const char* AUTHORIZATION_HEADER = "Authorization";

    // Returns {"Authorization": ...} for bearer/basic, or no headers when type or value is empty.
    // Throws error::MalformedAuth for a basic value without ':' and error::UnsupportedAuthType otherwise.
    [[nodiscard]] http::model::Headers synthesize_auth(std::string_view type, std::string_view value);

    // Accepts the compact "<type> <value>" form, e.g. "bearer abc123".
    [[nodiscard]] http::model::Headers synthesize_auth(std::string_view descriptor);
}  // namespace pipeline::auth

#endif
