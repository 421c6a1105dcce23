#include <nlohmann/json.hpp>

#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/mandrill/api/api_error.hpp"
#include "src/mandrill/api/request_executor.hpp"
#include "src/mandrill/api/section_executor.hpp"
#include "src/mandrill/config/client_config.hpp"
#include "src/utils/constants.hpp"

namespace {
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FATAL = 1;
    constexpr int EXIT_API_ERROR = 2;
    constexpr int EXIT_TRANSPORT_ERROR = 3;

    void print_usage(const char* argv0) {
        std::cerr << "usage: " << argv0 << " [--config <file.json>] <section> <action> [json-payload]\n"
                  << "  e.g. " << argv0 << " users ping2\n"
                  << "       " << argv0 << " messages search '{\"query\":\"email:gmail.com\"}'\n"
                  << "API key and base url may also come from " << constants::API_KEY_ENV << " and " << constants::BASE_URL_ENV << ".\n";
    }
}  // namespace

int main(int argc, char** argv) {
    try {
        //
        // Collect
        //

        std::optional<std::string> config_path;
        int arg = 1;
        if (arg + 1 < argc && std::strcmp(argv[arg], "--config") == 0) {
            config_path = argv[arg + 1];
            arg += 2;
        }

        if (argc - arg < 2 || argc - arg > 3) {
            print_usage(argv[0]);
            return EXIT_FATAL;
        }

        const std::string section = argv[arg];
        const std::string action = argv[arg + 1];

        nlohmann::json payload = nlohmann::json::object();
        if (argc - arg == 3) {
            payload = nlohmann::json::parse(argv[arg + 2], nullptr, false);
            if (payload.is_discarded() || !payload.is_object()) {
                std::cerr << "Payload must be a JSON object" << std::endl;
                return EXIT_FATAL;
            }
        }

        mandrill::config::ClientConfig config;
        if (config_path) {
            config = mandrill::config::ClientConfig::load_from_file(*config_path);
        }
        config.apply_env_overrides();

        if (config.api_key_.empty()) {
            std::cout << constants::API_KEY_ENV << " not set" << std::endl;
            return EXIT_FATAL;
        }

        //
        // Execute
        //

        http::client::CurlGlobal curl_global;

        mandrill::api::RequestExecutor executor(
            [transport = config.transport_]() {
                auto client = std::make_unique<http::client::CurlEasy>(transport);
                client->enable_compression();
                return std::unique_ptr<http::client::IHttpClient>(std::move(client));
            },
            config.api_key_);

        if (config.base_url_) {
            executor.set_base_url(*config.base_url_);
        }

        const mandrill::api::SectionExecutor client(executor, section);
        mandrill::api::ExecuteResult result = client.try_execute(action, payload);

        //
        // Report
        //

        if (const auto* body = std::get_if<nlohmann::json>(&result)) {
            std::cout << body->dump(2) << std::endl;
            return EXIT_OK;
        }

        if (const auto* api_error = std::get_if<mandrill::api::ApiError>(&result)) {
            std::cerr << "API Error: " << api_error->message() << " (status: " << api_error->status() << ", name: " << api_error->name()
                      << ", code: " << api_error->code() << ")\n";
            return EXIT_API_ERROR;
        }

        const auto& raw = std::get<mandrill::api::RawTransportError>(result);
        std::cerr << "Transport Error: " << raw.message_;
        if (raw.http_status_ != 0) {
            std::cerr << " (HTTP " << raw.http_status_ << ")";
        }
        std::cerr << "\n";
        return EXIT_TRANSPORT_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return EXIT_FATAL;
    }
};
