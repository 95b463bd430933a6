#include "console_renderer.hpp"

#include <unistd.h>

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace renderers {
    namespace {
        std::string body_text(const std::optional<json::Value>& body) { return body ? body->dump(constants::JSON_INDENT) : "None"; }

        std::string headers_text(const http::model::Headers& headers) { return pipeline::model::headers_to_json(headers).dump(constants::JSON_INDENT); }

        std::string fixed(double value, int precision) {
            std::ostringstream os;
            os << std::fixed << std::setprecision(precision) << value;
            return os.str();
        }
    }  // namespace

    ConsoleRenderer::ConsoleRenderer() : ConsoleRenderer(std::cout, std::cerr, isatty(fileno(stdout)) != 0) {}

    ConsoleRenderer::ConsoleRenderer(std::ostream& out, std::ostream& err, bool use_color) : out_(out), err_(err), use_color_(use_color) {}

    void ConsoleRenderer::line(std::ostream& os, const char* color, const std::string& text, bool bold) const {
        if (use_color_) {
            os << (bold ? AnsiColors::BOLD : "") << color << text << AnsiColors::RESET << '\n';
        } else {
            os << text << '\n';
        }
    }

    const char* ConsoleRenderer::status_color(long status) {
        if (status >= 200 && status < 300) {
            return AnsiColors::GREEN;
        }
        if (status >= 300 && status < 400) {
            return AnsiColors::CYAN;
        }
        if (status >= 400 && status < 500) {
            return AnsiColors::YELLOW;
        }
        return AnsiColors::RED;
    }

    void ConsoleRenderer::render_request_lines(const RequestPreview& request) {
        line(out_, AnsiColors::GREEN, "Method: " + request.method_);
        line(out_, AnsiColors::YELLOW, "URL: " + request.url_);
        line(out_, AnsiColors::RESET, "Headers: " + headers_text(request.headers_));
        line(out_, AnsiColors::RESET, "Data: " + body_text(request.body_));
    }

    void ConsoleRenderer::render_preview(const RequestPreview& preview) {
        line(out_, AnsiColors::MAGENTA, "REQUEST PREVIEW", true);
        render_request_lines(preview);
    }

    void ConsoleRenderer::render_response(const pipeline::model::ResponseRecord& record, const http::model::Headers& response_headers) {
        using pipeline::model::DisplayFilter;

        const std::string status_line = "Time: " + fixed(record.elapsed_ms_, 2) + " ms  Size: " +
                                        string_utils::format_size(static_cast<double>(record.size_bytes_)) + "  Status code: " +
                                        std::to_string(record.status_) + " " + record.reason_;

        const bool show_all = !record.display_filter_.has_value();

        if (show_all || record.display_filter_ == DisplayFilter::STATUS) {
            line(out_, status_color(record.status_), status_line, true);
        }
        if (show_all || record.display_filter_ == DisplayFilter::HEADERS) {
            line(out_, AnsiColors::MAGENTA, "Headers:", true);
            for (const auto& [name, value] : response_headers) {
                line(out_, AnsiColors::CYAN, "  " + name + ": " + value);
            }
        }
        if (show_all || record.display_filter_ == DisplayFilter::BODY) {
            line(out_, AnsiColors::YELLOW, "Body:", true);
            out_ << record.response_body_ << '\n';
        }
        out_.flush();
    }

    void ConsoleRenderer::render_exchange(const RequestPreview& request, const http::model::Response& response, const std::string& body, bool mocked) {
        line(out_, AnsiColors::CYAN, mocked ? "[VERBOSE] MOCK REQUEST" : "[VERBOSE] REQUEST SENT");
        render_request_lines(request);
        line(out_, AnsiColors::CYAN, mocked ? "[VERBOSE] MOCK RESPONSE" : "[VERBOSE] RESPONSE RECEIVED");
        line(out_, AnsiColors::GREEN, "Status: " + std::to_string(response.status_) + " " + response.reason_);
        line(out_, AnsiColors::RESET, "Headers: " + headers_text(response.headers_));
        line(out_, AnsiColors::RESET, "Body: " + body);
    }

    void ConsoleRenderer::render_history(const std::vector<pipeline::model::ResponseRecord>& records) {
        if (records.empty()) {
            line(out_, AnsiColors::YELLOW, "No history found.");
            return;
        }

        for (size_t i = 0; i < records.size(); ++i) {
            const auto& r = records[i];
            line(out_, AnsiColors::CYAN,
                 "[" + std::to_string(i) + "] " + r.method_ + " " + r.url_ + "  status=" + std::to_string(r.status_) + "  time=" + fixed(r.elapsed_ms_, 1) +
                     "ms  size=" + string_utils::format_size(static_cast<double>(r.size_bytes_)) + "  date=" + r.timestamp_);
        }
    }

    void ConsoleRenderer::info(const std::string& message) { line(out_, AnsiColors::CYAN, message); }

    void ConsoleRenderer::success(const std::string& message) { line(out_, AnsiColors::GREEN, message); }

    void ConsoleRenderer::warning(const std::string& message) { line(out_, AnsiColors::YELLOW, message); }

    void ConsoleRenderer::error(const std::string& message) { line(err_, AnsiColors::RED, message, true); }
}  // namespace renderers
