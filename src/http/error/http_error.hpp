#ifndef MANDRILL_CPP_HTTP_ERROR_HPP
#define MANDRILL_CPP_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

#include "../model/model.hpp"

namespace http::http_error {
    const long ERROR_MESSAGE_LENGTH = 512;

    enum class HttpStatusClass : long {
        SUCCESS = 200,
        REDIRECTION = 300,
        CLIENT_ERROR = 400,
        SERVER_ERROR = 500,
        UPPER_BOUNDARY = 600,
    };

    // A response was received but its status (or body) was not acceptable.
    struct HttpError : public std::runtime_error {
        long status_;
        std::string url_;
        std::string body_;
        std::string body_preview_;
        explicit HttpError(long s, std::string u, std::string body, const std::string &msg);
    };

    // 4xx
    struct ClientError : public HttpError {
        using HttpError::HttpError;
    };

    // 5xx
    struct ServerError : public HttpError {
        using HttpError::HttpError;
    };

    // No HTTP response at all: connection refused, DNS failure, timeout, TLS failure.
    struct TransportError : public std::runtime_error {
        int curl_code_;
        std::string url_;
        explicit TransportError(int code, std::string u, const std::string &msg);
    };

    void throw_for_status(const http::model::Response &resp);
}  // namespace http::http_error

#endif
