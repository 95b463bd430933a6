#ifndef POST_MAKER_CURL_EASY_HPP
#define POST_MAKER_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <optional>
#include <string>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    struct CurlOptions {
        long connect_timeout_ms_ = 10'000L;
        long timeout_ms_ = 30'000L;
        std::string user_agent_ = "post-maker/1.0.2";
    };

    class CurlEasy : public IHttpClient {
       public:
        explicit CurlEasy(CurlOptions options = {});

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response send(const http::model::Request& req) override;
        void set_url(const std::string& u);
        void set_headers(const http::model::Headers& hs, bool has_body);
        void set_method(const std::string& method, const std::optional<std::string>& body);
        void enable_compression();

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void perform_throw(const std::string& url);
        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void prepare_for_new_request(std::string& body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        std::string last_reason_;
        std::string request_body_;

        http::model::Headers last_response_headers_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
        CurlOptions options_;
    };
}  // namespace http::client

#endif
