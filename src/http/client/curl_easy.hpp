#ifndef MANDRILL_CPP_CURL_EASY_HPP
#define MANDRILL_CPP_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <string>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = 256;

    struct TransportOptions {
        long connect_timeout_ms_ = 10'000L;
        long timeout_ms_ = 30'000L;
        std::string user_agent_ = "mandrill-cpp/1.0";
    };

    class CurlEasy : public IHttpClient {
       public:
        explicit CurlEasy(TransportOptions options = {});

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response post(const http::model::Request& req) override;
        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);
        void enable_compression();

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void perform_throw(const std::string& url);
        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void prepare_for_new_request(std::string& body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        std::string last_content_type_;

        TransportOptions options_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif
