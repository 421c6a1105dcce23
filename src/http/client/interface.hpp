#ifndef MANDRILL_CPP_CLIENT_INTERFACE_HPP
#define MANDRILL_CPP_CLIENT_INTERFACE_HPP

#include <functional>
#include <memory>

#include "../model/model.hpp"

namespace http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        // Returns the response for every HTTP status. Throws http_error::TransportError
        // when no response was received at all.
        virtual http::model::Response post(const http::model::Request& req) = 0;
    };

    using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;
}  // namespace http::client

#endif
