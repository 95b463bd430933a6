#ifndef POST_MAKER_OUTPUT_REPORT_HPP
#define POST_MAKER_OUTPUT_REPORT_HPP

#include <string>

#include "../../http/model/model.hpp"

namespace pipeline::output {
    /**
     * Fixed plain-text report of one exchange:
     *
     *   Request Method: <METHOD>
     *   Status: <code> <reason>
     *   ============================
     *   Headers:
     *   <response headers, 2-space JSON>
     *   ============================
     *   Body:
     *   <body>
     */
    [[nodiscard]] std::string format_report(const std::string& method, long status, const std::string& reason, const http::model::Headers& response_headers,
                                            const std::string& body);

    // Overwrites path. Throws error::OutputWriteError.
    void write_report(const std::string& path, const std::string& report);
}  // namespace pipeline::output

#endif
