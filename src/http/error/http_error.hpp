#ifndef POST_MAKER_HTTP_ERROR_HPP
#define POST_MAKER_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::http_error {
    // Connection, timeout or protocol failure reported by the transport. Never retried.
    struct TransportError : public std::runtime_error {
        std::string url_;
        explicit TransportError(std::string u, const std::string &msg);
    };
}  // namespace http::http_error

#endif
