#ifndef MANDRILL_CPP_API_ERROR_HPP
#define MANDRILL_CPP_API_ERROR_HPP

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../../http/error/http_error.hpp"

namespace mandrill::api {
    struct ErrorStatus {
        static constexpr const char* SERVER_ERROR = "ServerError";
        static constexpr const char* SERVER_EXCEPTION = "ServerException";
    };

    enum class ErrorKind {
        STRUCTURED_API,       // server error status with a {message, code, status, name} body
        UNSTRUCTURED_SERVER,  // server error status, body missing fields or not JSON
    };

    // The JSON error document the API sends with a failing status.
    struct ErrorBody {
        std::string message_;
        int64_t code_ = 0;
        std::string status_;
        std::string name_;
    };

    // Returns the four error fields only when the body is a JSON object carrying all of them
    // with the expected types.
    [[nodiscard]] std::optional<ErrorBody> parse_error_body(std::string_view body);

    class ApiError : public std::runtime_error {
       public:
        ApiError(ErrorKind kind, const std::string& message, int64_t code, std::string status, std::string name, std::exception_ptr cause);

        // cause must hold `error` (pass std::current_exception() from the catch block).
        [[nodiscard]] static ApiError from_server_error(const http::http_error::ServerError& error, std::exception_ptr cause);

        [[nodiscard]] ErrorKind kind() const { return kind_; }
        [[nodiscard]] std::string message() const { return what(); }
        [[nodiscard]] int64_t code() const { return code_; }
        [[nodiscard]] const std::string& status() const { return status_; }
        [[nodiscard]] const std::string& name() const { return name_; }
        [[nodiscard]] std::exception_ptr cause() const { return cause_; }
        [[noreturn]] void rethrow_cause() const;

       private:
        ErrorKind kind_;
        int64_t code_;
        std::string status_;
        std::string name_;
        std::exception_ptr cause_;
    };

    // Any failure that is not normalized, kept as the exception that was thrown.
    struct RawTransportError {
        std::string message_;
        long http_status_ = 0;  // 0 when no response was received
        std::exception_ptr error_;

        [[noreturn]] void rethrow() const { std::rethrow_exception(error_); }
    };
}  // namespace mandrill::api

#endif
