#include "curl_easy.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long FORBID_REUSE = 1L;
        static constexpr long FRESH_CONNECT = 1L;
        static constexpr long POST = 0L;
        static constexpr long NO_BODY = 0L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
        static constexpr long HTTP_GET = 1L;
    };

    struct HeaderKeys {
        static constexpr const char* STATUS_LINE = "HTTP/";
        static constexpr const char* CONTENT_TYPE = "Content-Type";
        static constexpr const char* JSON_CONTENT_TYPE = "application/json";
    };

    CurlEasy::CurlEasy(CurlOptions options) : handle_(curl_easy_init()), options_(std::move(options)) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
        enable_compression();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const http::model::Headers& hs, bool has_body) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& [name, value] : hs) {
            // "Name;" is curl's spelling for a header sent with an empty value.
            const std::string line = value.empty() ? name + ";" : name + ": " + value;
            headers_ = curl_slist_append(headers_, line.c_str());
        }
        if (has_body && http::model::find_header(hs, HeaderKeys::CONTENT_TYPE) == nullptr) {
            headers_ = curl_slist_append(headers_, (std::string(HeaderKeys::CONTENT_TYPE) + ": " + HeaderKeys::JSON_CONTENT_TYPE).c_str());
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_method(const std::string& method, const std::optional<std::string>& body) {
        if (body) {
            request_body_ = *body;
            setopt(CURLOPT_POSTFIELDS, request_body_.c_str());
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request_body_.size()));
            if (method != "POST") {
                setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
            }
            return;
        }

        if (method == "GET") {
            return;
        }

        if (method == "HEAD") {
            setopt(CURLOPT_NOBODY, 1L);
            return;
        }

        if (method == "POST") {
            request_body_.clear();
            setopt(CURLOPT_POSTFIELDS, request_body_.c_str());
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
            return;
        }

        setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms_);
        setopt(CURLOPT_TIMEOUT_MS, options_.timeout_ms_);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, options_.user_agent_.c_str());
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);
        // One connection per exchange, nothing is pooled between sends.
        setopt(CURLOPT_FORBID_REUSE, CurlDefaults::FORBID_REUSE);
        setopt(CURLOPT_FRESH_CONNECT, CurlDefaults::FRESH_CONNECT);
    }

    void CurlEasy::enable_compression() {
        // Empty string => accept all supported encodings (gzip/deflate/br)
        setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
    }

    void CurlEasy::prepare_for_new_request(std::string& body) {
        last_response_headers_.clear();
        last_reason_.clear();
        error_buf_[0] = '\0';
        body.clear();

        // Always set these per request (don't rely on old values)
        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_NOBODY, CurlDefaults::NO_BODY);
        setopt(CURLOPT_POST, CurlDefaults::POST);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;
        std::string line = string_utils::trim(std::string(buffer, bytes));

        if (line.empty()) {
            return bytes;
        }

        // A new status line starts a new response (redirects, 100-continue); only the last one counts.
        if (string_utils::ieq_prefix(line.c_str(), line.size(), HeaderKeys::STATUS_LINE)) {
            self->last_response_headers_.clear();
            const auto first_space = line.find(' ');
            const auto second_space = first_space == std::string::npos ? std::string::npos : line.find(' ', first_space + 1);
            self->last_reason_ = second_space == std::string::npos ? std::string{} : string_utils::trim(line.substr(second_space + 1));
            return bytes;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return bytes;
        }

        std::string name = string_utils::trim(line.substr(0, colon));
        std::string value = string_utils::trim(line.substr(colon + 1));
        self->last_response_headers_.emplace_back(std::move(name), std::move(value));

        return bytes;
    }

    http::model::Response CurlEasy::send(const http::model::Request& req) {
        std::string body;
        prepare_for_new_request(body);

        set_url(req.url_);
        set_headers(req.headers_, req.body_.has_value());
        set_method(req.method_, req.body_);

        perform_throw(req.url_);
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::perform_throw(const std::string& url) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw http::http_error::TransportError(url, err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);

        http::model::Response r;
        r.status_ = code;
        r.reason_ = last_reason_.empty() ? http::model::reason_phrase(code) : std::move(last_reason_);
        r.byte_length_ = incoming_body.size();
        r.body_ = std::move(incoming_body);
        r.headers_ = std::move(last_response_headers_);
        return r;
    }

}  // namespace http::client
