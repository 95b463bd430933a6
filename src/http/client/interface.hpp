#ifndef POST_MAKER_CLIENT_INTERFACE_HPP
#define POST_MAKER_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"

namespace http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        // Blocks until the exchange completes. Throws http::http_error::TransportError on failure.
        virtual http::model::Response send(const http::model::Request& req) = 0;
    };
}  // namespace http::client

#endif
