#ifndef POST_MAKER_UTILS_HPP
#define POST_MAKER_UTILS_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool iequals(std::string_view a, std::string_view b);

    bool icontains(std::string_view haystack, std::string_view needle);

    std::string trim(std::string s);

    std::string to_upper(std::string s);

    std::string to_lower(std::string s);

    bool is_all_digits(std::string_view sv);

    std::string base64_encode(std::string_view input);

    std::vector<std::string> split_lines(std::string_view sv);

    // Splits a command line the way a POSIX shell would: whitespace separates tokens, single quotes
    // are literal, double quotes allow backslash escapes. Throws on an unterminated quote.
    std::vector<std::string> shell_split(std::string_view sv);

    std::string shell_quote(std::string_view sv);

    // Human readable byte count with two decimals: 512.00 B, 1.50 KB.
    std::string format_size(double bytes);

    std::filesystem::path append_to_path(const std::filesystem::path& path, const std::string& str);
}  // namespace string_utils

#endif
