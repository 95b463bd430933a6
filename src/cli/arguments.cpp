#include "arguments.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

#include "../utils/constants.hpp"

namespace cli {
    namespace {
        const FlagSpec* find_spec(const std::vector<FlagSpec>& specs, std::string_view token) {
            auto it = std::ranges::find_if(specs, [token](const FlagSpec& spec) { return token == spec.long_ || (!spec.short_.empty() && token == spec.short_); });
            return it == specs.end() ? nullptr : &*it;
        }

        bool looks_like_flag(std::string_view token) { return token.size() > 1 && token.front() == '-' && std::isdigit(static_cast<unsigned char>(token[1])) == 0; }

        void store_value(ParsedArgs& parsed, const FlagSpec& spec, std::string value) {
            if (!spec.allowed_values_.empty() && std::ranges::find(spec.allowed_values_, value) == spec.allowed_values_.end()) {
                std::string allowed;
                for (const auto& v : spec.allowed_values_) {
                    allowed += allowed.empty() ? v : ", " + v;
                }
                throw UsageError(spec.error_message_ + " (choose from " + allowed + ")");
            }
            parsed.set_value(spec.long_, std::move(value));
        }
    }  // namespace

    bool ParsedArgs::has(std::string_view flag) const { return switches_.contains(flag) || values_.contains(flag); }

    std::optional<std::string> ParsedArgs::get(std::string_view flag) const {
        auto it = values_.find(flag);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::string ParsedArgs::get_or(std::string_view flag, std::string fallback) const { return get(flag).value_or(std::move(fallback)); }

    long ParsedArgs::get_long(std::string_view flag, long fallback) const {
        const auto value = get(flag);
        if (!value) {
            return fallback;
        }

        long out = 0;
        auto [end, ec] = std::from_chars(value->data(), value->data() + value->size(), out, constants::BASE_10);
        if (value->empty() || ec != std::errc{} || end != value->data() + value->size()) {
            throw UsageError("Flag " + std::string(flag) + " expects an integer, got '" + *value + "'");
        }
        return out;
    }

    void ParsedArgs::set_value(const std::string& flag, std::string value) { values_[flag] = std::move(value); }

    void ParsedArgs::set_switch(const std::string& flag) { switches_.insert(flag); }

    void ParsedArgs::add_positional(std::string value) { positional_.push_back(std::move(value)); }

    ParsedArgs parse_arguments(const std::vector<std::string>& args, const std::vector<FlagSpec>& specs) {
        ParsedArgs parsed;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& token = args[i];

            if (!looks_like_flag(token)) {
                parsed.add_positional(token);
                continue;
            }

            std::string_view name = token;
            std::optional<std::string> inline_value;
            if (const auto eq = token.find('='); token.starts_with("--") && eq != std::string::npos) {
                name = std::string_view(token).substr(0, eq);
                inline_value = token.substr(eq + 1);
            }

            const FlagSpec* spec = find_spec(specs, name);
            if (spec == nullptr) {
                throw UsageError("Unknown flag '" + std::string(name) + "'");
            }

            if (!spec->takes_value_) {
                if (inline_value) {
                    throw UsageError("Flag " + spec->long_ + " does not take a value");
                }
                parsed.set_switch(spec->long_);
                continue;
            }

            if (inline_value) {
                store_value(parsed, *spec, std::move(*inline_value));
            } else if (i + 1 < args.size()) {
                store_value(parsed, *spec, args[++i]);
            } else {
                throw UsageError("Flag " + spec->long_ + " expects a value");
            }
        }

        for (const auto& spec : specs) {
            if (spec.is_required_ && !parsed.has(spec.long_)) {
                throw UsageError(spec.error_message_);
            }
        }

        return parsed;
    }
}  // namespace cli
