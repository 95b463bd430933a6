#ifndef POST_MAKER_TARGET_EXPANDER_HPP
#define POST_MAKER_TARGET_EXPANDER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace pipeline::targets {
    // A url naming a readable file expands to its trimmed, non-blank lines in file order;
    // anything else is a single target (the trimmed url).
    [[nodiscard]] std::vector<std::string> expand_targets(std::string_view url);
}  // namespace pipeline::targets

#endif
