#ifndef POST_MAKER_ARGUMENTS_HPP
#define POST_MAKER_ARGUMENTS_HPP

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cli {
    struct UsageError : public std::runtime_error {
        explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
    };

    struct FlagSpec {
        std::string short_;
        // Also the key the parsed value is stored under.
        std::string long_;
        bool takes_value_ = true;
        bool is_required_ = false;
        std::vector<std::string> allowed_values_;
        std::string error_message_;
    };

    class ParsedArgs {
       public:
        [[nodiscard]] bool has(std::string_view flag) const;
        [[nodiscard]] std::optional<std::string> get(std::string_view flag) const;
        [[nodiscard]] std::string get_or(std::string_view flag, std::string fallback) const;
        // Throws UsageError when the value is not an integer.
        [[nodiscard]] long get_long(std::string_view flag, long fallback) const;

        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

        void set_value(const std::string& flag, std::string value);
        void set_switch(const std::string& flag);
        void add_positional(std::string value);

       private:
        std::map<std::string, std::string, std::less<>> values_;
        std::set<std::string, std::less<>> switches_;
        std::vector<std::string> positional_;
    };

    // Accepts "-x value", "--flag value" and "--flag=value". Throws UsageError for unknown flags,
    // missing values, values outside allowed_values_ and missing required flags.
    [[nodiscard]] ParsedArgs parse_arguments(const std::vector<std::string>& args, const std::vector<FlagSpec>& specs);
}  // namespace cli

#endif
