#ifndef MANDRILL_CPP_REQUEST_EXECUTOR_HPP
#define MANDRILL_CPP_REQUEST_EXECUTOR_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "../../http/client/interface.hpp"
#include "../../http/model/model.hpp"
#include "api_error.hpp"

namespace mandrill::api {
    using ExecuteResult = std::variant<nlohmann::json, ApiError, RawTransportError>;

    /**
     * Sends one API action as `POST {base_url}/{section}/{sub_action}.json` with the API key
     * injected into the JSON body. The section is lower-cased in the path.
     *
     * Server error statuses (5xx) are normalized into ApiError. Every other failure
     * (TransportError, ClientError, HttpError) reaches the caller unmodified.
     *
     * configure() and set_base_url() are not synchronized; call them before sharing the
     * executor between threads. execute() itself only reads configuration and creates a
     * fresh transport per call.
     */
    class RequestExecutor {
       public:
        explicit RequestExecutor(http::client::HttpClientFactory http_client_factory);
        RequestExecutor(http::client::HttpClientFactory http_client_factory, std::string api_key);

        ~RequestExecutor() = default;
        RequestExecutor(const RequestExecutor&) = delete;
        RequestExecutor& operator=(const RequestExecutor&) = delete;
        RequestExecutor(RequestExecutor&&) = delete;
        RequestExecutor& operator=(RequestExecutor&&) = delete;

        void configure(std::string api_key);
        void set_base_url(std::string url);

        [[nodiscard]] bool is_configured() const { return api_key_.has_value(); }
        [[nodiscard]] std::string base_url() const;

        [[nodiscard]] http::model::Request build_request(std::string_view section, std::string_view sub_action, const nlohmann::json& payload) const;

        nlohmann::json execute(std::string_view section, std::string_view sub_action, const nlohmann::json& payload = nlohmann::json::object()) const;

        // Same as execute(), with the three outcomes returned instead of thrown. A transport that
        // cannot be created is reported as a RawTransportError with status 0. Precondition
        // violations (std::invalid_argument, std::logic_error) are still thrown.
        ExecuteResult try_execute(std::string_view section, std::string_view sub_action,
                                  const nlohmann::json& payload = nlohmann::json::object()) const;

       private:
        http::client::HttpClientFactory http_client_factory_;
        std::optional<std::string> api_key_;
        std::optional<std::string> base_url_;

        [[nodiscard]] static nlohmann::json parse_success(const http::model::Response& resp);
    };
}  // namespace mandrill::api

#endif
