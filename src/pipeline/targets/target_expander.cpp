#include "target_expander.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "../../utils/string_utils.hpp"

namespace pipeline::targets {
    std::vector<std::string> expand_targets(std::string_view url) {
        const std::string trimmed = string_utils::trim(std::string(url));

        std::error_code ec;
        if (trimmed.empty() || !std::filesystem::is_regular_file(trimmed, ec)) {
            return {trimmed};
        }

        std::ifstream in(trimmed, std::ios::binary);
        if (!in) {
            return {trimmed};
        }

        std::ostringstream content;
        content << in.rdbuf();

        std::vector<std::string> out;
        for (auto& line : string_utils::split_lines(content.str())) {
            std::string target = string_utils::trim(std::move(line));
            if (!target.empty()) {
                out.push_back(std::move(target));
            }
        }
        return out;
    }
}  // namespace pipeline::targets
