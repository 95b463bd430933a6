#ifndef POST_MAKER_DIFF_UTILS_HPP
#define POST_MAKER_DIFF_UTILS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace diff_utils {
    inline constexpr std::size_t DEFAULT_CONTEXT = 3;

    /**
     * Line based diff in unified format: "--- from", "+++ to", then one "@@ -a,n +b,m @@" header per
     * hunk followed by ' ', '-' and '+' prefixed lines. Changes closer than 2 * context lines share a
     * hunk. Identical inputs produce no lines at all.
     */
    [[nodiscard]] std::vector<std::string> unified_diff(const std::vector<std::string>& before,
                                                        const std::vector<std::string>& after,
                                                        const std::string& from,
                                                        const std::string& to,
                                                        std::size_t context = DEFAULT_CONTEXT);
}  // namespace diff_utils

#endif
