#ifndef POST_MAKER_PLACEHOLDER_RESOLVER_HPP
#define POST_MAKER_PLACEHOLDER_RESOLVER_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "../../http/model/model.hpp"
#include "../../json/value.hpp"

namespace pipeline::resolver {
    using VariableMap = std::map<std::string, std::string>;

    // Supplies a value for a variable that is not in the map (interactive mode).
    using UnknownVariableHandler = std::function<std::string(const std::string& name)>;

    /**
     * Expands {{name}} tokens (name = one or more [A-Za-z0-9_]) against a variable map.
     *
     * Without a handler the resolver is strict: an unknown name throws error::MissingVariable.
     * With a handler, the returned value is substituted and stored in the map, so later
     * occurrences of the same name reuse it.
     */
    class PlaceholderResolver {
       public:
        explicit PlaceholderResolver(VariableMap& variables, UnknownVariableHandler on_unknown = nullptr);

        [[nodiscard]] std::string resolve(std::string_view text);
        [[nodiscard]] std::string resolve(const std::string& text) { return resolve(std::string_view(text)); }
        [[nodiscard]] std::string resolve(const char* text) { return resolve(std::string_view(text)); }
        [[nodiscard]] json::Value resolve(const json::Value& value);
        [[nodiscard]] http::model::Headers resolve(const http::model::Headers& headers);

        [[nodiscard]] const std::vector<std::string>& captured() const { return captured_; }

       private:
        const std::string& lookup(const std::string& name);

        VariableMap& variables_;
        UnknownVariableHandler on_unknown_;
        std::vector<std::string> captured_;
    };
}  // namespace pipeline::resolver

#endif
