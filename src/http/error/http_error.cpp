#include "http_error.hpp"

#include <stdexcept>
#include <string>

#include "../model/model.hpp"

namespace http::http_error {
    HttpError::HttpError(long s, std::string u,
                         std::string body,        // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg),
          status_(s),
          url_(std::move(u)),
          body_(std::move(body)),
          body_preview_(body_.substr(0, static_cast<size_t>(ERROR_MESSAGE_LENGTH))) {}

    TransportError::TransportError(int code, std::string u, const std::string &msg) : std::runtime_error(msg), curl_code_(code), url_(std::move(u)) {}

    void throw_for_status(const http::model::Response &resp) {
        const long status = resp.status_;

        if (status >= static_cast<long>(HttpStatusClass::SUCCESS) && status < static_cast<long>(HttpStatusClass::REDIRECTION)) {
            return;
        }

        const std::string where = "`POST " + resp.effective_url_ + "` resulted in status " + std::to_string(status);

        if (status >= static_cast<long>(HttpStatusClass::SERVER_ERROR) && status < static_cast<long>(HttpStatusClass::UPPER_BOUNDARY)) {
            throw ServerError(status, resp.effective_url_, resp.body_, "Server error: " + where);
        }

        if (status >= static_cast<long>(HttpStatusClass::CLIENT_ERROR) && status < static_cast<long>(HttpStatusClass::SERVER_ERROR)) {
            throw ClientError(status, resp.effective_url_, resp.body_, "Client error: " + where);
        }

        throw HttpError(status, resp.effective_url_, resp.body_, "HTTP request failed with status " + std::to_string(status));
    }
}  // namespace http::http_error
