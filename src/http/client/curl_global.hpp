#ifndef POST_MAKER_CURL_GLOBAL_HPP
#define POST_MAKER_CURL_GLOBAL_HPP

namespace http::client {

    // Owns libcurl's process-wide state; create exactly one before the first CurlEasy.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace http::client

#endif
