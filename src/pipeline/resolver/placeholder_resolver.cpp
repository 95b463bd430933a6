#include "placeholder_resolver.hpp"

#include <cctype>
#include <string>
#include <type_traits>
#include <variant>

#include "../error/pipeline_error.hpp"

namespace pipeline::resolver {
    namespace {
        bool is_word_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

        // Length of the "{{name}}" token starting at pos, or 0 when there is none.
        size_t token_length(std::string_view text, size_t pos) {
            if (text.compare(pos, 2, "{{") != 0) {
                return 0;
            }
            size_t end = pos + 2;
            while (end < text.size() && is_word_char(text[end])) {
                ++end;
            }
            if (end == pos + 2 || text.compare(end, 2, "}}") != 0) {
                return 0;
            }
            return end + 2 - pos;
        }
    }  // namespace

    PlaceholderResolver::PlaceholderResolver(VariableMap& variables, UnknownVariableHandler on_unknown)
        : variables_(variables), on_unknown_(std::move(on_unknown)) {}

    const std::string& PlaceholderResolver::lookup(const std::string& name) {
        auto it = variables_.find(name);
        if (it != variables_.end()) {
            return it->second;
        }

        if (!on_unknown_) {
            throw error::MissingVariable(name);
        }

        captured_.push_back(name);
        return variables_.emplace(name, on_unknown_(name)).first->second;
    }

    std::string PlaceholderResolver::resolve(std::string_view text) {
        std::string out;
        out.reserve(text.size());

        size_t pos = 0;
        while (pos < text.size()) {
            const size_t length = token_length(text, pos);
            if (length == 0) {
                out.push_back(text[pos]);
                ++pos;
                continue;
            }
            out += lookup(std::string(text.substr(pos + 2, length - 4)));
            pos += length;
        }

        return out;
    }

    json::Value PlaceholderResolver::resolve(const json::Value& value) {
        return std::visit(
            [this](const auto& v) -> json::Value {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    return json::Value(resolve(std::string_view(v)));
                } else if constexpr (std::is_same_v<T, json::Array>) {
                    json::Array out;
                    out.reserve(v.size());
                    for (const auto& element : v) {
                        out.push_back(resolve(element));
                    }
                    return json::Value(std::move(out));
                } else if constexpr (std::is_same_v<T, json::Object>) {
                    json::Object out;
                    out.reserve(v.size());
                    for (const auto& [key, member] : v) {
                        out.emplace_back(key, resolve(member));
                    }
                    return json::Value(std::move(out));
                } else {
                    return json::Value(v);
                }
            },
            value.storage());
    }

    http::model::Headers PlaceholderResolver::resolve(const http::model::Headers& headers) {
        http::model::Headers out;
        out.reserve(headers.size());
        for (const auto& [name, value] : headers) {
            out.emplace_back(name, resolve(std::string_view(value)));
        }
        return out;
    }
}  // namespace pipeline::resolver
