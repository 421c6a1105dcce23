#include "request_executor.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "../../http/error/http_error.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace mandrill::api {
    RequestExecutor::RequestExecutor(http::client::HttpClientFactory http_client_factory) : http_client_factory_(std::move(http_client_factory)) {
        if (http_client_factory_ == nullptr) {
            throw std::invalid_argument("HTTP client factory is required");
        }
    }

    RequestExecutor::RequestExecutor(http::client::HttpClientFactory http_client_factory, std::string api_key)
        : RequestExecutor(std::move(http_client_factory)) {
        configure(std::move(api_key));
    }

    void RequestExecutor::configure(std::string api_key) { api_key_ = std::move(api_key); }

    void RequestExecutor::set_base_url(std::string url) { base_url_ = std::move(url); }

    std::string RequestExecutor::base_url() const { return base_url_.value_or(constants::DEFAULT_BASE_URL); }

    http::model::Request RequestExecutor::build_request(std::string_view section, std::string_view sub_action, const nlohmann::json& payload) const {
        if (!api_key_) {
            throw std::logic_error("API key is not configured");
        }
        const std::string section_name = string_utils::to_lower(section);
        if (!string_utils::is_path_segment_safe(section_name)) {
            throw std::invalid_argument("Invalid section: '" + std::string(section) + "'");
        }
        if (!string_utils::is_path_segment_safe(sub_action)) {
            throw std::invalid_argument("Invalid sub-action: '" + std::string(sub_action) + "'");
        }

        // Work on a copy; the caller may reuse its payload.
        nlohmann::json body = payload.is_null() ? nlohmann::json::object() : payload;
        if (!body.is_object()) {
            throw std::invalid_argument("Payload must be a JSON object");
        }
        body[constants::API_KEY_FIELD] = *api_key_;

        http::model::Request r;
        r.url_ = string_utils::trim_right_slash(base_url()) + "/" + section_name + "/" + std::string(sub_action) + constants::ENDPOINT_SUFFIX;
        r.method_ = "POST";
        r.body_ = body.dump();
        r.headers_ = {"Content-Type: application/json", "Accept: application/json"};
        return r;
    }

    nlohmann::json RequestExecutor::execute(std::string_view section, std::string_view sub_action, const nlohmann::json& payload) const {
        const http::model::Request req = build_request(section, sub_action, payload);

        std::unique_ptr<http::client::IHttpClient> http = http_client_factory_();
        if (http == nullptr) {
            throw std::runtime_error("HTTP client factory returned no client");
        }

        const http::model::Response resp = http->post(req);

        try {
            http::http_error::throw_for_status(resp);
        } catch (const http::http_error::ServerError& e) {
            throw ApiError::from_server_error(e, std::current_exception());
        }

        return parse_success(resp);
    }

    ExecuteResult RequestExecutor::try_execute(std::string_view section, std::string_view sub_action, const nlohmann::json& payload) const {
        try {
            return ExecuteResult{std::in_place_type<nlohmann::json>, execute(section, sub_action, payload)};
        } catch (const ApiError& e) {
            return ExecuteResult{std::in_place_type<ApiError>, e};
        } catch (const http::http_error::HttpError& e) {
            return ExecuteResult{std::in_place_type<RawTransportError>, RawTransportError{e.what(), e.status_, std::current_exception()}};
        } catch (const http::http_error::TransportError& e) {
            return ExecuteResult{std::in_place_type<RawTransportError>, RawTransportError{e.what(), 0, std::current_exception()}};
        } catch (const std::runtime_error& e) {
            // Transport construction failed before anything was sent.
            return ExecuteResult{std::in_place_type<RawTransportError>, RawTransportError{e.what(), 0, std::current_exception()}};
        }
    }

    nlohmann::json RequestExecutor::parse_success(const http::model::Response& resp) {
        nlohmann::json parsed = nlohmann::json::parse(resp.body_, nullptr, false);

        if (parsed.is_discarded()) {
            std::string msg = "Failed to parse JSON response";
            if (!resp.content_type_.empty()) {
                msg += " (Content-Type: " + resp.content_type_ + ")";
            }
            throw http::http_error::HttpError(resp.status_, resp.effective_url_, resp.body_, msg);
        }

        return parsed;
    }
}  // namespace mandrill::api
