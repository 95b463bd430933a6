#include "diff_utils.hpp"

#include <algorithm>

namespace diff_utils {
    namespace {
        struct Edit {
            char tag_;
            std::size_t before_pos_;
            std::size_t after_pos_;
            const std::string* line_;
        };

        // Longest common subsequence walk; removals come before additions at each change.
        std::vector<Edit> edit_script(const std::vector<std::string>& before, const std::vector<std::string>& after) {
            const std::size_t n = before.size();
            const std::size_t m = after.size();

            // lcs[i][j] is the LCS length of before[i..] and after[j..].
            std::vector<std::vector<std::size_t>> lcs(n + 1, std::vector<std::size_t>(m + 1, 0));
            for (std::size_t i = n; i-- > 0;) {
                for (std::size_t j = m; j-- > 0;) {
                    lcs[i][j] = before[i] == after[j] ? lcs[i + 1][j + 1] + 1 : std::max(lcs[i + 1][j], lcs[i][j + 1]);
                }
            }

            std::vector<Edit> out;
            std::size_t i = 0;
            std::size_t j = 0;
            while (i < n || j < m) {
                if (i < n && j < m && before[i] == after[j]) {
                    out.push_back({' ', i, j, &before[i]});
                    ++i;
                    ++j;
                } else if (j < m && (i == n || lcs[i][j + 1] > lcs[i + 1][j])) {
                    out.push_back({'+', i, j, &after[j]});
                    ++j;
                } else {
                    out.push_back({'-', i, j, &before[i]});
                    ++i;
                }
            }
            return out;
        }

        std::string format_range(std::size_t start, std::size_t length) {
            if (length == 1) {
                return std::to_string(start + 1);
            }
            if (length == 0) {
                return std::to_string(start) + ",0";
            }
            return std::to_string(start + 1) + "," + std::to_string(length);
        }
    }  // namespace

    std::vector<std::string> unified_diff(const std::vector<std::string>& before,
                                          const std::vector<std::string>& after,
                                          const std::string& from,
                                          const std::string& to,
                                          std::size_t context) {
        const std::vector<Edit> edits = edit_script(before, after);

        std::vector<std::size_t> changes;
        for (std::size_t k = 0; k < edits.size(); ++k) {
            if (edits[k].tag_ != ' ') {
                changes.push_back(k);
            }
        }
        if (changes.empty()) {
            return {};
        }

        std::vector<std::string> out = {"--- " + from, "+++ " + to};

        std::size_t first = 0;
        while (first < changes.size()) {
            std::size_t last = first;
            while (last + 1 < changes.size() && changes[last + 1] - changes[last] <= 2 * context + 1) {
                ++last;
            }

            const std::size_t begin = changes[first] > context ? changes[first] - context : 0;
            const std::size_t end = std::min(edits.size(), changes[last] + context + 1);

            std::size_t before_len = 0;
            std::size_t after_len = 0;
            for (std::size_t k = begin; k < end; ++k) {
                before_len += edits[k].tag_ != '+' ? 1 : 0;
                after_len += edits[k].tag_ != '-' ? 1 : 0;
            }

            out.push_back("@@ -" + format_range(edits[begin].before_pos_, before_len) + " +" + format_range(edits[begin].after_pos_, after_len) + " @@");
            for (std::size_t k = begin; k < end; ++k) {
                out.push_back(edits[k].tag_ + *edits[k].line_);
            }

            first = last + 1;
        }

        return out;
    }
}  // namespace diff_utils
