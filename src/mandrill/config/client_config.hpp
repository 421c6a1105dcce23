#ifndef MANDRILL_CPP_CONFIG_CLIENT_CONFIG_HPP
#define MANDRILL_CPP_CONFIG_CLIENT_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../../http/client/curl_easy.hpp"

namespace mandrill::config {

    template <typename T>
    struct ParserOptions {
        bool is_required_ = true;
        std::vector<T> allowed_values_;
        T fallback_value_;
        std::string error_message_;
    };

    const ParserOptions<std::string_view> API_KEY_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid api_key"};
    const ParserOptions<std::string_view> BASE_URL_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid base_url"};
    const ParserOptions<int64_t> CONNECT_TIMEOUT_MS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 10'000, .error_message_ = "Invalid connect_timeout_ms"};
    const ParserOptions<int64_t> TIMEOUT_MS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 30'000, .error_message_ = "Invalid timeout_ms"};
    const ParserOptions<std::string_view> USER_AGENT_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "mandrill-cpp/1.0", .error_message_ = "Invalid user_agent"};

    // See: config/mandrill.example.json for the file layout.
    struct ClientConfig {
        std::string api_key_;
        std::optional<std::string> base_url_;
        http::client::TransportOptions transport_;

        [[nodiscard]] static ClientConfig load_from_file(const std::filesystem::path& path);
        [[nodiscard]] static ClientConfig parse_json(std::string_view json);

        // MANDRILL_API_KEY and MANDRILL_BASE_URL win over file values when set and non-empty.
        void apply_env_overrides();
    };

}  // namespace mandrill::config

#endif
