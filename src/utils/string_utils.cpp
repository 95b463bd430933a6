#include "string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(buf[i]) != std::tolower(key[i])) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool iequals(std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
    }

    bool icontains(std::string_view haystack, std::string_view needle) {
        if (needle.empty()) {
            return true;
        }
        auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                              [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
        return it != haystack.end();
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool is_all_digits(std::string_view sv) {
        return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    std::string base64_encode(std::string_view input) {
        static constexpr std::array<char, 64> ALPHABET = {'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M', 'N', 'O', 'P',
                                                          'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z', 'a', 'b', 'c', 'd', 'e', 'f',
                                                          'g', 'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v',
                                                          'w', 'x', 'y', 'z', '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/'};

        std::string out;
        out.reserve(((input.size() + 2) / 3) * 4);

        size_t i = 0;
        for (; i + 2 < input.size(); i += 3) {
            const auto n = (static_cast<unsigned char>(input[i]) << 16U) | (static_cast<unsigned char>(input[i + 1]) << 8U) |
                           static_cast<unsigned char>(input[i + 2]);
            out.push_back(ALPHABET[(n >> 18U) & 0x3FU]);
            out.push_back(ALPHABET[(n >> 12U) & 0x3FU]);
            out.push_back(ALPHABET[(n >> 6U) & 0x3FU]);
            out.push_back(ALPHABET[n & 0x3FU]);
        }

        const size_t rest = input.size() - i;
        if (rest == 1) {
            const auto n = static_cast<unsigned char>(input[i]) << 16U;
            out.push_back(ALPHABET[(n >> 18U) & 0x3FU]);
            out.push_back(ALPHABET[(n >> 12U) & 0x3FU]);
            out += "==";
        } else if (rest == 2) {
            const auto n = (static_cast<unsigned char>(input[i]) << 16U) | (static_cast<unsigned char>(input[i + 1]) << 8U);
            out.push_back(ALPHABET[(n >> 18U) & 0x3FU]);
            out.push_back(ALPHABET[(n >> 12U) & 0x3FU]);
            out.push_back(ALPHABET[(n >> 6U) & 0x3FU]);
            out.push_back('=');
        }

        return out;
    }

    std::vector<std::string> split_lines(std::string_view sv) {
        std::vector<std::string> out;
        size_t start = 0;
        while (start <= sv.size()) {
            size_t pos = sv.find('\n', start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;
            std::string_view line = sv.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            if (pos == std::string_view::npos) {
                if (!line.empty()) {
                    out.emplace_back(line);
                }
                break;
            }
            out.emplace_back(line);
            start = pos + 1;
        }
        return out;
    }

    std::vector<std::string> shell_split(std::string_view sv) {
        std::vector<std::string> out;
        std::string current;
        bool in_token = false;

        for (size_t i = 0; i < sv.size(); ++i) {
            const char c = sv[i];

            if (std::isspace(static_cast<unsigned char>(c)) != 0) {
                if (in_token) {
                    out.push_back(std::move(current));
                    current.clear();
                    in_token = false;
                }
                continue;
            }

            in_token = true;

            if (c == '\'') {
                const size_t close = sv.find('\'', i + 1);
                if (close == std::string_view::npos) {
                    throw std::runtime_error("No closing quotation");
                }
                current.append(sv.substr(i + 1, close - i - 1));
                i = close;
            } else if (c == '"') {
                ++i;
                for (; i < sv.size() && sv[i] != '"'; ++i) {
                    if (sv[i] == '\\' && i + 1 < sv.size() && (sv[i + 1] == '"' || sv[i + 1] == '\\' || sv[i + 1] == '$' || sv[i + 1] == '`')) {
                        ++i;
                    }
                    current.push_back(sv[i]);
                }
                if (i >= sv.size()) {
                    throw std::runtime_error("No closing quotation");
                }
            } else if (c == '\\' && i + 1 < sv.size()) {
                current.push_back(sv[++i]);
            } else {
                current.push_back(c);
            }
        }

        if (in_token) {
            out.push_back(std::move(current));
        }

        return out;
    }

    std::string shell_quote(std::string_view sv) {
        if (sv.empty()) {
            return "''";
        }

        const bool safe = std::all_of(sv.begin(), sv.end(), [](unsigned char c) {
            return std::isalnum(c) != 0 || c == '@' || c == '%' || c == '+' || c == '=' || c == ':' || c == ',' || c == '.' || c == '/' ||
                   c == '-' || c == '_';
        });
        if (safe) {
            return std::string(sv);
        }

        std::string out = "'";
        for (const char c : sv) {
            if (c == '\'') {
                out += "'\"'\"'";
            } else {
                out.push_back(c);
            }
        }
        out += "'";
        return out;
    }

    std::string format_size(double bytes) {
        static constexpr std::array<const char *, 4> UNITS = {"B", "KB", "MB", "GB"};
        static constexpr double STEP = 1024.0;

        const char *unit = "TB";
        for (const char *candidate : UNITS) {
            if (bytes < STEP) {
                unit = candidate;
                break;
            }
            bytes /= STEP;
        }

        std::array<char, 64> buf{};
        std::snprintf(buf.data(), buf.size(), "%.2f %s", bytes, unit);
        return {buf.data()};
    }

    std::filesystem::path append_to_path(const std::filesystem::path &path, const std::string &str) { return {path.string() + str}; }
}  // namespace string_utils
