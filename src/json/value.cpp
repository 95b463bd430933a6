#include "value.hpp"

#include <simdjson.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

using namespace simdjson;

namespace json {
    namespace parser {
        static Value from_value(ondemand::value value);

        // raw is the literal as it appears in the input, possibly followed by whitespace.
        static Value from_number(simdjson_result<ondemand::number> result, std::string_view raw) {
            if (result.error() == BIGINT_ERROR) {
                const auto end = raw.find_last_not_of(" \t\r\n");
                return Value(BigInteger{std::string(raw.substr(0, end == std::string_view::npos ? 0 : end + 1))});
            }
            ondemand::number number = result.value();
            switch (number.get_number_type()) {
                case ondemand::number_type::signed_integer:
                    return Value(number.get_int64());
                case ondemand::number_type::unsigned_integer:
                    return Value(number.get_uint64());
                default:
                    return Value(number.get_double());
            }
        }

        static Value from_array(ondemand::array array) {
            Array out;
            for (auto element : array) {
                out.push_back(from_value(element.value()));
            }
            return Value(std::move(out));
        }

        static Value from_object(ondemand::object object) {
            Value out{Object{}};
            for (auto field_result : object) {
                ondemand::field field = std::move(field_result).take_value();
                std::string key(field.unescaped_key().value());
                out.set(std::move(key), from_value(field.value()));
            }
            return out;
        }

        static Value from_value(ondemand::value value) {
            switch (value.type().value()) {
                case ondemand::json_type::object:
                    return from_object(value.get_object().value());
                case ondemand::json_type::array:
                    return from_array(value.get_array().value());
                case ondemand::json_type::string:
                    return Value(std::string_view(value.get_string().value()));
                case ondemand::json_type::number: {
                    const std::string_view raw = value.raw_json_token();
                    return from_number(value.get_number(), raw);
                }
                case ondemand::json_type::boolean:
                    return Value(bool(value.get_bool().value()));
                default:
                    return Value(nullptr);
            }
        }

        static Value from_document(ondemand::document& doc) {
            switch (doc.type().value()) {
                case ondemand::json_type::object:
                    return from_object(doc.get_object().value());
                case ondemand::json_type::array:
                    return from_array(doc.get_array().value());
                case ondemand::json_type::string:
                    return Value(std::string_view(doc.get_string().value()));
                case ondemand::json_type::number: {
                    const std::string_view raw = doc.raw_json_token().value();
                    return from_number(doc.get_number(), raw);
                }
                case ondemand::json_type::boolean:
                    return Value(bool(doc.get_bool().value()));
                default:
                    if (!doc.is_null().value()) {
                        throw ParseError("Invalid JSON literal");
                    }
                    return Value(nullptr);
            }
        }
    }  // namespace parser

    namespace writer {
        static void write_string(std::string& out, std::string_view s) {
            out.push_back('"');
            for (const char c : s) {
                switch (c) {
                    case '"':
                        out += "\\\"";
                        break;
                    case '\\':
                        out += "\\\\";
                        break;
                    case '\n':
                        out += "\\n";
                        break;
                    case '\r':
                        out += "\\r";
                        break;
                    case '\t':
                        out += "\\t";
                        break;
                    case '\b':
                        out += "\\b";
                        break;
                    case '\f':
                        out += "\\f";
                        break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20) {
                            char buf[8];
                            std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                            out += buf;
                        } else {
                            out.push_back(c);
                        }
                }
            }
            out.push_back('"');
        }

        static void write_double(std::string& out, double d) {
            if (std::isnan(d)) {
                out += "NaN";
                return;
            }
            if (std::isinf(d)) {
                out += d > 0 ? "Infinity" : "-Infinity";
                return;
            }
            char buf[64];
            auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) {
                throw std::runtime_error("Failed to format number");
            }
            std::string_view text(buf, static_cast<size_t>(end - buf));
            out += text;
            if (text.find_first_of(".eE") == std::string_view::npos) {
                out += ".0";
            }
        }

        static void newline(std::string& out, int indent, int depth) {
            if (indent < 0) {
                return;
            }
            out.push_back('\n');
            out.append(static_cast<size_t>(indent * depth), ' ');
        }

        static void write_value(std::string& out, const Value& value, int indent, int depth) {
            std::visit(
                [&](const auto& v) {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, std::nullptr_t>) {
                        out += "null";
                    } else if constexpr (std::is_same_v<T, bool>) {
                        out += v ? "true" : "false";
                    } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
                        out += std::to_string(v);
                    } else if constexpr (std::is_same_v<T, BigInteger>) {
                        out += v.digits_;
                    } else if constexpr (std::is_same_v<T, double>) {
                        write_double(out, v);
                    } else if constexpr (std::is_same_v<T, std::string>) {
                        write_string(out, v);
                    } else if constexpr (std::is_same_v<T, Array>) {
                        if (v.empty()) {
                            out += "[]";
                            return;
                        }
                        out.push_back('[');
                        for (size_t i = 0; i < v.size(); ++i) {
                            if (i > 0) {
                                out += indent < 0 ? ", " : ",";
                            }
                            newline(out, indent, depth + 1);
                            write_value(out, v[i], indent, depth + 1);
                        }
                        newline(out, indent, depth);
                        out.push_back(']');
                    } else {
                        if (v.empty()) {
                            out += "{}";
                            return;
                        }
                        out.push_back('{');
                        for (size_t i = 0; i < v.size(); ++i) {
                            if (i > 0) {
                                out += indent < 0 ? ", " : ",";
                            }
                            newline(out, indent, depth + 1);
                            write_string(out, v[i].first);
                            out += ": ";
                            write_value(out, v[i].second, indent, depth + 1);
                        }
                        newline(out, indent, depth);
                        out.push_back('}');
                    }
                },
                value.storage());
        }
    }  // namespace writer

    double Value::as_double() const {
        if (is_int()) {
            return static_cast<double>(as_int());
        }
        if (const auto* u = std::get_if<uint64_t>(&storage_)) {
            return static_cast<double>(*u);
        }
        if (const auto* big = std::get_if<BigInteger>(&storage_)) {
            return std::strtod(big->digits_.c_str(), nullptr);
        }
        return std::get<double>(storage_);
    }

    const Value* Value::find(std::string_view key) const {
        if (!is_object()) {
            return nullptr;
        }
        const auto& members = as_object();
        auto it = std::find_if(members.begin(), members.end(), [key](const auto& member) { return member.first == key; });
        return it == members.end() ? nullptr : &it->second;
    }

    Value* Value::find(std::string_view key) { return const_cast<Value*>(std::as_const(*this).find(key)); }

    void Value::set(std::string key, Value value) {
        if (!is_object()) {
            storage_ = Object{};
        }
        if (Value* existing = find(key)) {
            *existing = std::move(value);
            return;
        }
        as_object().emplace_back(std::move(key), std::move(value));
    }

    bool Value::erase(std::string_view key) {
        if (!is_object()) {
            return false;
        }
        auto& members = as_object();
        auto it = std::find_if(members.begin(), members.end(), [key](const auto& member) { return member.first == key; });
        if (it == members.end()) {
            return false;
        }
        members.erase(it);
        return true;
    }

    std::string Value::string_or(std::string_view key, std::string fallback) const {
        const Value* v = find(key);
        if (v == nullptr || !v->is_string()) {
            return fallback;
        }
        return v->as_string();
    }

    std::string Value::dump(int indent) const {
        std::string out;
        writer::write_value(out, *this, indent, 0);
        return out;
    }

    Value Value::parse(std::string_view text) {
        try {
            ondemand::parser doc_parser;
            padded_string padded(text);
            ondemand::document doc = doc_parser.iterate(padded);
            Value out = parser::from_document(doc);
            // A wide integer at the root is left unconsumed, so it has to be the whole input.
            if (const auto* big = std::get_if<BigInteger>(&out.storage())) {
                const auto first = text.find_first_not_of(" \t\r\n");
                const auto last = text.find_last_not_of(" \t\r\n");
                if (text.substr(first, last - first + 1) != big->digits_) {
                    throw ParseError("Trailing content after JSON value");
                }
                return out;
            }
            if (!doc.at_end()) {
                throw ParseError("Trailing content after JSON value");
            }
            return out;
        } catch (const simdjson::simdjson_error& e) {
            throw ParseError(std::string("Invalid JSON: ") + e.what());
        }
    }

    bool Value::operator==(const Value& other) const {
        // Integers and doubles holding the same number compare equal, like the stored files expect.
        if (is_number() && other.is_number() && storage_.index() != other.storage_.index()) {
            return as_double() == other.as_double();
        }
        return storage_ == other.storage_;
    }
}  // namespace json
