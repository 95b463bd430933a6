#ifndef POST_MAKER_MODEL_HPP
#define POST_MAKER_MODEL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace http::model {
    // Ordered name/value pairs; names compare case-insensitively.
    using Headers = std::vector<std::pair<std::string, std::string>>;

    struct Request {
        std::string url_;
        std::string method_ = "GET";
        std::optional<std::string> body_;

        Headers headers_;
    };

    struct Response {
        long status_ = 0;
        std::size_t byte_length_ = 0;

        std::string reason_;
        std::string body_;

        Headers headers_;

        // Set by transports that do not touch the network; the executor reports it instead of the measured time.
        std::optional<double> simulated_elapsed_ms_;
    };

    [[nodiscard]] const std::string* find_header(const Headers& headers, std::string_view name);

    void set_header(Headers& headers, std::string name, std::string value);

    // Every entry of overrides replaces a same-named entry of into, or is appended.
    void merge_headers(Headers& into, const Headers& overrides);

    [[nodiscard]] std::string reason_phrase(long status);
}  // namespace http::model

#endif
