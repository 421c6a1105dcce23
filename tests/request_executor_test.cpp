#include "../src/mandrill/api/request_executor.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "../src/http/error/http_error.hpp"
#include "../src/mandrill/api/api_error.hpp"
#include "../src/mandrill/api/section_executor.hpp"
#include "support/fake_http_client.hpp"

using mandrill::api::ApiError;
using mandrill::api::ErrorKind;
using mandrill::api::RequestExecutor;
using mandrill::api::SectionExecutor;
using test_support::make_factory;
using test_support::respond_with;

namespace {
    const char* const API_KEY = "test-api-key";

    std::optional<ApiError> capture_api_error(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const ApiError& e) {
            return e;
        }
        return std::nullopt;
    }

    nlohmann::json sent_body(const test_support::Exchange& exchange) { return nlohmann::json::parse(exchange.requests_.back().body_); }
}  // namespace

TEST(RequestExecutorTest, InjectsApiKeyIntoPayload) {
    auto exchange = respond_with(200, R"({"foo":"bar"})");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    (void)executor.execute("messages", "send", {{"message", {{"subject", "hi"}}}, {"async", true}});

    ASSERT_EQ(exchange->requests_.size(), 1U);
    const nlohmann::json expected = {{"message", {{"subject", "hi"}}}, {"async", true}, {"key", API_KEY}};
    EXPECT_EQ(sent_body(*exchange), expected);
}

TEST(RequestExecutorTest, ConfiguredKeyOverridesCallerSuppliedKey) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    (void)executor.execute("users", "info", {{"key", "caller-key"}, {"id", 7}});

    EXPECT_EQ(sent_body(*exchange)["key"], API_KEY);
    EXPECT_EQ(sent_body(*exchange)["id"], 7);
}

TEST(RequestExecutorTest, DoesNotMutateCallerPayload) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    const nlohmann::json payload = {{"key", "caller-key"}, {"query", "tag:welcome"}};
    const nlohmann::json before = payload;
    (void)executor.execute("messages", "search", payload);

    EXPECT_EQ(payload, before);
}

TEST(RequestExecutorTest, EmptyAndNullPayloadSendOnlyTheKey) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    (void)executor.execute("users", "ping2");
    EXPECT_EQ(sent_body(*exchange), nlohmann::json({{"key", API_KEY}}));

    (void)executor.execute("users", "ping2", nullptr);
    EXPECT_EQ(sent_body(*exchange), nlohmann::json({{"key", API_KEY}}));
}

TEST(RequestExecutorTest, RejectsNonObjectPayload) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    EXPECT_THROW((void)executor.execute("users", "info", nlohmann::json::array({1, 2})), std::invalid_argument);
    EXPECT_THROW((void)executor.execute("users", "info", "text"), std::invalid_argument);
    EXPECT_TRUE(exchange->requests_.empty());
}

TEST(RequestExecutorTest, UsesDefaultBaseUrlAndSectionPath) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    (void)executor.execute("messages", "send");

    EXPECT_EQ(executor.base_url(), "https://mandrillapp.com/api/1.0/");
    EXPECT_EQ(exchange->requests_.back().url_, "https://mandrillapp.com/api/1.0/messages/send.json");
}

TEST(RequestExecutorTest, LowerCasesSectionInPath) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    (void)executor.execute("Messages", "send");
    (void)executor.try_execute("USERS", "ping2");

    EXPECT_EQ(exchange->requests_[0].url_, "https://mandrillapp.com/api/1.0/messages/send.json");
    EXPECT_EQ(exchange->requests_[1].url_, "https://mandrillapp.com/api/1.0/users/ping2.json");
    EXPECT_EQ(executor.build_request("Templates", "list", {}).url_, "https://mandrillapp.com/api/1.0/templates/list.json");
}

TEST(RequestExecutorTest, BaseUrlOverrideRedirectsRequests) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    executor.set_base_url("http://127.0.0.1:8080/mock");
    (void)executor.execute("users", "ping2");
    EXPECT_EQ(exchange->requests_.back().url_, "http://127.0.0.1:8080/mock/users/ping2.json");

    executor.set_base_url("http://127.0.0.1:8080/mock/");
    (void)executor.execute("users", "ping2");
    EXPECT_EQ(exchange->requests_.back().url_, "http://127.0.0.1:8080/mock/users/ping2.json");
}

TEST(RequestExecutorTest, PostsJsonBody) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    (void)executor.execute("users", "info");

    const http::model::Request& req = exchange->requests_.back();
    EXPECT_EQ(req.method_, "POST");
    EXPECT_NE(std::find(req.headers_.begin(), req.headers_.end(), "Content-Type: application/json"), req.headers_.end());
}

TEST(RequestExecutorTest, ReturnsDecodedObjectAsIs) {
    auto exchange = respond_with(200, R"({"foo":"bar"})");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    EXPECT_EQ(executor.execute("users", "info"), nlohmann::json({{"foo", "bar"}}));
}

TEST(RequestExecutorTest, ReturnsNonObjectResponsesAsIs) {
    auto scalar = respond_with(200, R"("PONG!")");
    RequestExecutor scalar_executor(make_factory(scalar), API_KEY);
    EXPECT_EQ(scalar_executor.execute("users", "ping"), nlohmann::json("PONG!"));

    auto array = respond_with(200, R"([{"email":"a@example.com"}])");
    RequestExecutor array_executor(make_factory(array), API_KEY);
    const nlohmann::json result = array_executor.execute("messages", "send");
    ASSERT_TRUE(result.is_array());
    EXPECT_EQ(result[0]["email"], "a@example.com");
}

TEST(RequestExecutorTest, UndecodableSuccessBodyIsHttpError) {
    auto exchange = respond_with(200, "not json");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    EXPECT_THROW((void)executor.execute("users", "info"), http::http_error::HttpError);
}

TEST(RequestExecutorTest, UndecodableSuccessBodyReportsContentType) {
    auto exchange = std::make_shared<test_support::Exchange>();
    exchange->responder_ = [](const http::model::Request& req) {
        http::model::Response r = test_support::make_response(200, "<html>maintenance</html>", req.url_);
        r.content_type_ = "text/html; charset=utf-8";
        return r;
    };
    RequestExecutor executor(make_factory(exchange), API_KEY);

    try {
        (void)executor.execute("users", "info");
        FAIL() << "expected HttpError";
    } catch (const http::http_error::HttpError& e) {
        EXPECT_EQ(std::string(e.what()), "Failed to parse JSON response (Content-Type: text/html; charset=utf-8)");
        EXPECT_EQ(e.status_, 200);
        EXPECT_EQ(e.body_, "<html>maintenance</html>");
    }
}

TEST(RequestExecutorTest, StructuredServerErrorKeepsApiFields) {
    auto exchange = respond_with(500, R"({"message":"Invalid API key","code":-1,"status":"error","name":"Invalid_Key"})");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    std::optional<ApiError> error = capture_api_error([&executor]() { (void)executor.execute("users", "info"); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::STRUCTURED_API);
    EXPECT_EQ(error->message(), "Invalid API key");
    EXPECT_EQ(error->code(), -1);
    EXPECT_EQ(error->status(), "error");
    EXPECT_EQ(error->name(), "Invalid_Key");
    EXPECT_STREQ(error->what(), "Invalid API key");

    try {
        error->rethrow_cause();
        FAIL() << "cause was not rethrown";
    } catch (const http::http_error::ServerError& cause) {
        EXPECT_EQ(cause.status_, 500);
        EXPECT_EQ(cause.url_, "https://mandrillapp.com/api/1.0/users/info.json");
    }
}

TEST(RequestExecutorTest, EmptyServerErrorBodyIsSynthesized) {
    auto exchange = respond_with(500, "");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    std::optional<ApiError> error = capture_api_error([&executor]() { (void)executor.execute("users", "info"); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::UNSTRUCTURED_SERVER);
    EXPECT_EQ(error->status(), "ServerError");
    EXPECT_EQ(error->name(), "ServerException");
    EXPECT_EQ(error->code(), 500);

    try {
        error->rethrow_cause();
        FAIL() << "cause was not rethrown";
    } catch (const http::http_error::ServerError& cause) {
        EXPECT_EQ(error->message(), cause.what());
    }
}

TEST(RequestExecutorTest, ServerErrorBodyMissingAFieldIsSynthesized) {
    auto exchange = respond_with(500, R"({"message":"Invalid API key","code":-1,"status":"error"})");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    std::optional<ApiError> error = capture_api_error([&executor]() { (void)executor.execute("users", "info"); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::UNSTRUCTURED_SERVER);
    EXPECT_EQ(error->status(), "ServerError");
    EXPECT_EQ(error->name(), "ServerException");
}

TEST(RequestExecutorTest, HtmlGatewayErrorIsSynthesized) {
    auto exchange = respond_with(502, "<html><body>Bad Gateway</body></html>");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    std::optional<ApiError> error = capture_api_error([&executor]() { (void)executor.execute("messages", "send"); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::UNSTRUCTURED_SERVER);
    EXPECT_EQ(error->code(), 502);
    EXPECT_NE(error->message().find("502"), std::string::npos);
}

TEST(RequestExecutorTest, ClientErrorStatusIsNotNormalized) {
    auto exchange = respond_with(404, R"({"message":"nope","code":5,"status":"error","name":"Unknown_Message"})");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    EXPECT_THROW((void)executor.execute("messages", "info"), http::http_error::ClientError);
}

TEST(RequestExecutorTest, ConnectivityFailurePropagatesUnwrapped) {
    auto exchange = std::make_shared<test_support::Exchange>();
    exchange->responder_ = [](const http::model::Request& req) -> http::model::Response {
        throw http::http_error::TransportError(7, req.url_, "curl_easy_perform failed: Couldn't connect to server");
    };
    RequestExecutor executor(make_factory(exchange), API_KEY);

    try {
        (void)executor.execute("users", "ping");
        FAIL() << "expected TransportError";
    } catch (const ApiError&) {
        FAIL() << "transport failure must not be normalized";
    } catch (const http::http_error::TransportError& e) {
        EXPECT_EQ(e.curl_code_, 7);
        EXPECT_EQ(e.url_, "https://mandrillapp.com/api/1.0/users/ping.json");
    }
}

TEST(RequestExecutorTest, RequiresConfiguredKey) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange));

    EXPECT_FALSE(executor.is_configured());
    EXPECT_THROW((void)executor.execute("users", "info"), std::logic_error);

    executor.configure("");
    EXPECT_TRUE(executor.is_configured());
    (void)executor.execute("users", "info");
    EXPECT_EQ(sent_body(*exchange)["key"], "");
}

TEST(RequestExecutorTest, RejectsUnsafeSubActions) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    EXPECT_THROW((void)executor.execute("users", ""), std::invalid_argument);
    EXPECT_THROW((void)executor.execute("users", "info/../x"), std::invalid_argument);
    EXPECT_THROW((void)executor.execute("users", "in fo"), std::invalid_argument);
    EXPECT_THROW((void)executor.execute("users", "info?x=1"), std::invalid_argument);
    EXPECT_THROW((void)executor.execute("", "info"), std::invalid_argument);
    EXPECT_TRUE(exchange->requests_.empty());
}

TEST(RequestExecutorTest, RequiresHttpClientFactory) { EXPECT_THROW(RequestExecutor executor(nullptr), std::invalid_argument); }

TEST(RequestExecutorTest, CreatesTransportPerCall) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    (void)executor.execute("users", "info");
    (void)executor.execute("users", "info");

    EXPECT_EQ(exchange->clients_created_, 2);
}

TEST(RequestExecutorTest, TryExecuteReturnsDecodedBody) {
    auto exchange = respond_with(200, R"({"PING":"PONG!"})");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    mandrill::api::ExecuteResult result = executor.try_execute("users", "ping2");

    ASSERT_TRUE(std::holds_alternative<nlohmann::json>(result));
    EXPECT_EQ(std::get<nlohmann::json>(result)["PING"], "PONG!");
}

TEST(RequestExecutorTest, TryExecuteReturnsNormalizedError) {
    auto exchange = respond_with(500, R"({"message":"Invalid API key","code":-1,"status":"error","name":"Invalid_Key"})");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    mandrill::api::ExecuteResult result = executor.try_execute("users", "ping2");

    ASSERT_TRUE(std::holds_alternative<ApiError>(result));
    EXPECT_EQ(std::get<ApiError>(result).name(), "Invalid_Key");
}

TEST(RequestExecutorTest, TryExecuteReturnsRawTransportErrors) {
    auto refused = std::make_shared<test_support::Exchange>();
    refused->responder_ = [](const http::model::Request& req) -> http::model::Response {
        throw http::http_error::TransportError(7, req.url_, "connection refused");
    };
    RequestExecutor refused_executor(make_factory(refused), API_KEY);

    mandrill::api::ExecuteResult refused_result = refused_executor.try_execute("users", "ping2");
    ASSERT_TRUE(std::holds_alternative<mandrill::api::RawTransportError>(refused_result));
    const auto& raw = std::get<mandrill::api::RawTransportError>(refused_result);
    EXPECT_EQ(raw.message_, "connection refused");
    EXPECT_EQ(raw.http_status_, 0);
    EXPECT_THROW(raw.rethrow(), http::http_error::TransportError);

    auto forbidden = respond_with(403, "forbidden");
    RequestExecutor forbidden_executor(make_factory(forbidden), API_KEY);

    mandrill::api::ExecuteResult forbidden_result = forbidden_executor.try_execute("users", "ping2");
    ASSERT_TRUE(std::holds_alternative<mandrill::api::RawTransportError>(forbidden_result));
    EXPECT_EQ(std::get<mandrill::api::RawTransportError>(forbidden_result).http_status_, 403);
    EXPECT_THROW(std::get<mandrill::api::RawTransportError>(forbidden_result).rethrow(), http::http_error::ClientError);
}

TEST(RequestExecutorTest, TryExecuteReportsTransportSetupFailure) {
    int attempts = 0;
    RequestExecutor failing(
        [&attempts]() -> std::unique_ptr<http::client::IHttpClient> {
            ++attempts;
            throw std::runtime_error("Failed to create CURL easy handle");
        },
        API_KEY);

    mandrill::api::ExecuteResult failed = failing.try_execute("users", "ping");
    ASSERT_TRUE(std::holds_alternative<mandrill::api::RawTransportError>(failed));
    EXPECT_EQ(std::get<mandrill::api::RawTransportError>(failed).message_, "Failed to create CURL easy handle");
    EXPECT_EQ(std::get<mandrill::api::RawTransportError>(failed).http_status_, 0);
    EXPECT_THROW(std::get<mandrill::api::RawTransportError>(failed).rethrow(), std::runtime_error);
    EXPECT_EQ(attempts, 1);

    RequestExecutor empty([]() -> std::unique_ptr<http::client::IHttpClient> { return nullptr; }, API_KEY);

    mandrill::api::ExecuteResult none = empty.try_execute("users", "ping");
    ASSERT_TRUE(std::holds_alternative<mandrill::api::RawTransportError>(none));
    EXPECT_EQ(std::get<mandrill::api::RawTransportError>(none).message_, "HTTP client factory returned no client");
}

TEST(RequestExecutorTest, TryExecuteStillThrowsOnPreconditions) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange));

    EXPECT_THROW((void)executor.try_execute("users", "ping2"), std::logic_error);
}

static_assert(std::is_constructible_v<SectionExecutor, const RequestExecutor&, std::string_view>);
static_assert(std::is_constructible_v<SectionExecutor, RequestExecutor&, std::string_view>);
static_assert(!std::is_constructible_v<SectionExecutor, RequestExecutor&&, std::string_view>);

TEST(SectionExecutorTest, LowerCasesDeclaredSectionName) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    const SectionExecutor messages(executor, "Messages");
    (void)messages.execute("send", {{"async", false}});

    EXPECT_EQ(messages.section(), "messages");
    EXPECT_EQ(exchange->requests_.back().url_, "https://mandrillapp.com/api/1.0/messages/send.json");
}

TEST(SectionExecutorTest, SectionDoesNotDependOnPayload) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);
    const SectionExecutor templates(executor, "Templates");

    (void)templates.execute("list", {{"section", "users"}});
    (void)templates.execute("list", {{"label", "Messages"}});

    EXPECT_EQ(exchange->requests_[0].url_, "https://mandrillapp.com/api/1.0/templates/list.json");
    EXPECT_EQ(exchange->requests_[1].url_, "https://mandrillapp.com/api/1.0/templates/list.json");
}

TEST(SectionExecutorTest, SeesBaseUrlChangesOnSharedExecutor) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);
    const SectionExecutor users(executor, "Users");

    executor.set_base_url("http://localhost:9999/api/");
    (void)users.execute("info");

    EXPECT_EQ(exchange->requests_.back().url_, "http://localhost:9999/api/users/info.json");
}

TEST(SectionExecutorTest, RejectsUnsafeSectionName) {
    auto exchange = respond_with(200, "{}");
    RequestExecutor executor(make_factory(exchange), API_KEY);

    EXPECT_THROW((void)SectionExecutor(executor, "Sub/Accounts"), std::invalid_argument);
    EXPECT_THROW((void)SectionExecutor(executor, ""), std::invalid_argument);
}
