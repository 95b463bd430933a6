#include "json_file.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace stores {
    std::optional<std::string> read_text_file(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::nullopt;
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("open failed: " + path.string());
        }

        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    std::optional<json::Value> read_json_file(const std::filesystem::path& path) {
        const auto content = read_text_file(path);
        if (!content || string_utils::trim(*content).empty()) {
            return std::nullopt;
        }

        return json::Value::parse(*content);
    }

    void write_atomic(const std::filesystem::path& path, std::string_view bytes) {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        const auto tmp = string_utils::append_to_path(path, ".tmp");
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("open failed: " + tmp.string());
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                throw std::runtime_error("write failed: " + tmp.string());
            }
        }
        std::filesystem::rename(tmp, path);  // atomic on same filesystem
    }

    void write_json_file(const std::filesystem::path& path, const json::Value& value) { write_atomic(path, value.dump(constants::JSON_INDENT)); }
}  // namespace stores
