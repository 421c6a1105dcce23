#include "client_config.hpp"

#include <simdjson.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"

namespace mandrill::config {
    namespace parser {
        template <typename T>
        static T parse_value(simdjson::simdjson_result<T> result, const ParserOptions<T>& options) {
            if (result.error() == simdjson::error_code::NO_SUCH_FIELD && !options.is_required_) {
                return options.fallback_value_;
            }

            if (result.error() != simdjson::error_code::SUCCESS) {
                throw std::runtime_error(options.error_message_);
            }

            T value = result.value_unsafe();

            if (options.allowed_values_.empty()) {
                return value;
            }

            if (!std::ranges::any_of(options.allowed_values_, [&value](const T& allowed_value) { return allowed_value == value; })) {
                throw std::runtime_error(options.error_message_);
            }

            return value;
        }

        static long parse_timeout(simdjson::simdjson_result<int64_t> result, const ParserOptions<int64_t>& options) {
            const int64_t value = parse_value(std::move(result), options);
            if (value < 0) {
                throw std::runtime_error(options.error_message_);
            }
            return static_cast<long>(value);
        }

        static ClientConfig parse_document(simdjson::padded_string& json) {
            simdjson::ondemand::parser json_parser;
            simdjson::ondemand::document doc;
            if (json_parser.iterate(json).get(doc) != simdjson::error_code::SUCCESS) {
                throw std::runtime_error("Config is not valid JSON");
            }

            ClientConfig config;
            config.api_key_ = std::string(parse_value(doc["api_key"].get_string(), API_KEY_PARSER_OPTIONS));

            std::string base_url = std::string(parse_value(doc["base_url"].get_string(), BASE_URL_PARSER_OPTIONS));
            if (!base_url.empty()) {
                config.base_url_ = std::move(base_url);
            }

            config.transport_ = http::client::TransportOptions{
                .connect_timeout_ms_ = parse_timeout(doc["connect_timeout_ms"].get_int64(), CONNECT_TIMEOUT_MS_PARSER_OPTIONS),
                .timeout_ms_ = parse_timeout(doc["timeout_ms"].get_int64(), TIMEOUT_MS_PARSER_OPTIONS),
                .user_agent_ = std::string(parse_value(doc["user_agent"].get_string(), USER_AGENT_PARSER_OPTIONS)),
            };

            return config;
        }
    }  // namespace parser

    ClientConfig ClientConfig::load_from_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw std::runtime_error("Config file not found: " + path.string());
        }

        simdjson::padded_string json;
        if (simdjson::padded_string::load(path.string()).get(json) != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Failed to read config file: " + path.string());
        }

        return parser::parse_document(json);
    }

    ClientConfig ClientConfig::parse_json(std::string_view json) {
        simdjson::padded_string padded(json);
        return parser::parse_document(padded);
    }

    void ClientConfig::apply_env_overrides() {
        if (const char* key = std::getenv(constants::API_KEY_ENV); key != nullptr && *key != '\0') {
            api_key_ = key;
        }

        if (const char* url = std::getenv(constants::BASE_URL_ENV); url != nullptr && *url != '\0') {
            base_url_ = url;
        }
    }
}  // namespace mandrill::config
