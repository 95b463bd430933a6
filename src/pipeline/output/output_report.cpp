#include "output_report.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include "../../utils/constants.hpp"
#include "../error/pipeline_error.hpp"
#include "../model/model.hpp"

namespace pipeline::output {
    std::string format_report(const std::string& method, long status, const std::string& reason, const http::model::Headers& response_headers,
                              const std::string& body) {
        std::ostringstream oss;
        oss << "Request Method: " << method << "\n"
            << "Status: " << status << " " << reason << "\n"
            << constants::REPORT_SEPARATOR << "\n"
            << "Headers:\n"
            << pipeline::model::headers_to_json(response_headers).dump(constants::JSON_INDENT) << "\n"
            << constants::REPORT_SEPARATOR << "\n"
            << "Body:\n"
            << body;
        return oss.str();
    }

    void write_report(const std::string& path, const std::string& report) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw error::OutputWriteError(path, std::strerror(errno));
        }
        out.write(report.data(), static_cast<std::streamsize>(report.size()));
        out.flush();
        if (!out) {
            throw error::OutputWriteError(path, "write failed");
        }
    }
}  // namespace pipeline::output
