#ifndef POST_MAKER_JSON_FILE_HPP
#define POST_MAKER_JSON_FILE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "../json/value.hpp"

namespace stores {
    // nullopt when the file is missing. Throws std::runtime_error when it cannot be opened.
    [[nodiscard]] std::optional<std::string> read_text_file(const std::filesystem::path& path);

    // nullopt when the file is missing or holds only whitespace. Throws std::runtime_error when the
    // file cannot be read and json::ParseError when it is not valid JSON.
    [[nodiscard]] std::optional<json::Value> read_json_file(const std::filesystem::path& path);

    // Writes <path>.tmp then renames it over path. Parent directories are created as needed.
    void write_atomic(const std::filesystem::path& path, std::string_view bytes);

    void write_json_file(const std::filesystem::path& path, const json::Value& value);
}  // namespace stores

#endif
