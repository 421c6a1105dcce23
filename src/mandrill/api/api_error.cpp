#include "api_error.hpp"

#include <simdjson.h>

#include <optional>
#include <string>
#include <string_view>

#include "../../http/error/http_error.hpp"

namespace mandrill::api {
    struct ErrorBodyKeys {
        static constexpr const char* MESSAGE = "message";
        static constexpr const char* CODE = "code";
        static constexpr const char* STATUS = "status";
        static constexpr const char* NAME = "name";
    };

    std::optional<ErrorBody> parse_error_body(std::string_view body) {
        simdjson::ondemand::parser parser;
        simdjson::padded_string json(body);

        simdjson::ondemand::document doc;
        if (parser.iterate(json).get(doc) != simdjson::SUCCESS) {
            return std::nullopt;
        }

        simdjson::ondemand::object obj;
        if (doc.get_object().get(obj) != simdjson::SUCCESS) {
            return std::nullopt;
        }

        ErrorBody out;
        std::string_view sv;

        if (obj[ErrorBodyKeys::MESSAGE].get_string().get(sv) != simdjson::SUCCESS) {
            return std::nullopt;
        }
        out.message_ = std::string(sv);

        if (obj[ErrorBodyKeys::CODE].get_int64().get(out.code_) != simdjson::SUCCESS) {
            return std::nullopt;
        }

        if (obj[ErrorBodyKeys::STATUS].get_string().get(sv) != simdjson::SUCCESS) {
            return std::nullopt;
        }
        out.status_ = std::string(sv);

        if (obj[ErrorBodyKeys::NAME].get_string().get(sv) != simdjson::SUCCESS) {
            return std::nullopt;
        }
        out.name_ = std::string(sv);

        return out;
    }

    ApiError::ApiError(ErrorKind kind, const std::string& message, int64_t code, std::string status, std::string name, std::exception_ptr cause)
        : std::runtime_error(message), kind_(kind), code_(code), status_(std::move(status)), name_(std::move(name)), cause_(std::move(cause)) {}

    ApiError ApiError::from_server_error(const http::http_error::ServerError& error, std::exception_ptr cause) {
        if (std::optional<ErrorBody> body = parse_error_body(error.body_)) {
            return {ErrorKind::STRUCTURED_API, body->message_, body->code_, std::move(body->status_), std::move(body->name_), std::move(cause)};
        }

        return {ErrorKind::UNSTRUCTURED_SERVER, error.what(), error.status_, ErrorStatus::SERVER_ERROR, ErrorStatus::SERVER_EXCEPTION, std::move(cause)};
    }

    void ApiError::rethrow_cause() const {
        if (cause_ == nullptr) {
            throw std::logic_error("ApiError has no cause");
        }
        std::rethrow_exception(cause_);
    }
}  // namespace mandrill::api
