#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace http::http_error {
    TransportError::TransportError(std::string u, const std::string &msg) : std::runtime_error(msg), url_(std::move(u)) {}
}  // namespace http::http_error
