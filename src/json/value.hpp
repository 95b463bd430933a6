#ifndef POST_MAKER_JSON_VALUE_HPP
#define POST_MAKER_JSON_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace json {
    class Value;

    using Array = std::vector<Value>;
    // Insertion-ordered; keys are unique.
    using Object = std::vector<std::pair<std::string, Value>>;

    struct ParseError : public std::runtime_error {
        explicit ParseError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // An integer literal too wide for 64 bits, kept as its source text.
    struct BigInteger {
        std::string digits_;

        bool operator==(const BigInteger& other) const = default;
    };

    class Value {
       public:
        using Storage = std::variant<std::nullptr_t, bool, int64_t, uint64_t, BigInteger, double, std::string, Array, Object>;

        Value() = default;
        Value(std::nullptr_t) {}                                      // NOLINT(google-explicit-constructor)
        Value(bool b) : storage_(b) {}                                // NOLINT(google-explicit-constructor)
        Value(int i) : storage_(static_cast<int64_t>(i)) {}           // NOLINT(google-explicit-constructor)
        Value(long i) : storage_(static_cast<int64_t>(i)) {}          // NOLINT(google-explicit-constructor)
        Value(long long i) : storage_(static_cast<int64_t>(i)) {}     // NOLINT(google-explicit-constructor)
        Value(uint64_t u) : storage_(u) {}                            // NOLINT(google-explicit-constructor)
        Value(BigInteger n) : storage_(std::move(n)) {}               // NOLINT(google-explicit-constructor)
        Value(double d) : storage_(d) {}                              // NOLINT(google-explicit-constructor)
        Value(std::string s) : storage_(std::move(s)) {}              // NOLINT(google-explicit-constructor)
        Value(std::string_view s) : storage_(std::string(s)) {}       // NOLINT(google-explicit-constructor)
        Value(const char* s) : storage_(std::string(s)) {}            // NOLINT(google-explicit-constructor)
        Value(Array a) : storage_(std::move(a)) {}                    // NOLINT(google-explicit-constructor)
        Value(Object o) : storage_(std::move(o)) {}                   // NOLINT(google-explicit-constructor)

        [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(storage_); }
        [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(storage_); }
        [[nodiscard]] bool is_int() const { return std::holds_alternative<int64_t>(storage_); }
        [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(storage_); }
        [[nodiscard]] bool is_number() const {
            return is_int() || is_double() || std::holds_alternative<uint64_t>(storage_) || std::holds_alternative<BigInteger>(storage_);
        }
        [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(storage_); }
        [[nodiscard]] bool is_array() const { return std::holds_alternative<Array>(storage_); }
        [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(storage_); }

        [[nodiscard]] bool as_bool() const { return std::get<bool>(storage_); }
        [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(storage_); }
        [[nodiscard]] double as_double() const;
        [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(storage_); }
        [[nodiscard]] const Array& as_array() const { return std::get<Array>(storage_); }
        [[nodiscard]] const Object& as_object() const { return std::get<Object>(storage_); }
        [[nodiscard]] Array& as_array() { return std::get<Array>(storage_); }
        [[nodiscard]] Object& as_object() { return std::get<Object>(storage_); }

        [[nodiscard]] const Storage& storage() const { return storage_; }

        // Object helpers. find() returns nullptr when this is not an object or the key is absent.
        [[nodiscard]] const Value* find(std::string_view key) const;
        [[nodiscard]] Value* find(std::string_view key);
        void set(std::string key, Value value);
        bool erase(std::string_view key);

        [[nodiscard]] std::string string_or(std::string_view key, std::string fallback) const;

        // indent < 0 renders a single line ({"a": 1, "b": 2}), otherwise one member per line.
        [[nodiscard]] std::string dump(int indent = -1) const;

        static Value parse(std::string_view text);

        bool operator==(const Value& other) const;
        bool operator!=(const Value& other) const { return !(*this == other); }

       private:
        Storage storage_;
    };

}  // namespace json

#endif
