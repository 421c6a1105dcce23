#include "messages.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace mandrill::sections {
    nlohmann::json message_to_json(const Message& message) {
        nlohmann::json j = nlohmann::json::object();

        auto put_if_set = [&j](const char* key, const std::string& value) {
            if (!value.empty()) {
                j[key] = value;
            }
        };

        put_if_set("html", message.html_);
        put_if_set("text", message.text_);
        put_if_set("subject", message.subject_);
        put_if_set("from_email", message.from_email_);
        put_if_set("from_name", message.from_name_);

        nlohmann::json to = nlohmann::json::array();
        for (const auto& r : message.to_) {
            nlohmann::json recipient = {{"email", r.email_}, {"type", r.type_}};
            if (!r.name_.empty()) {
                recipient["name"] = r.name_;
            }
            to.push_back(std::move(recipient));
        }
        j["to"] = std::move(to);

        if (!message.headers_.empty()) {
            j["headers"] = message.headers_;
        }
        if (!message.tags_.empty()) {
            j["tags"] = message.tags_;
        }
        if (message.important_) {
            j["important"] = *message.important_;
        }
        if (message.track_opens_) {
            j["track_opens"] = *message.track_opens_;
        }
        if (message.track_clicks_) {
            j["track_clicks"] = *message.track_clicks_;
        }

        return j;
    }

    MessagesApi::MessagesApi(const mandrill::api::RequestExecutor& executor) : section_(executor, SECTION) {}

    std::vector<SendResult> MessagesApi::send(const Message& message, const SendOptions& options) const {
        if (message.to_.empty()) {
            throw std::invalid_argument("Message needs at least one recipient");
        }

        nlohmann::json payload = {{"message", message_to_json(message)}, {"async", options.async_}};
        if (options.ip_pool_) {
            payload["ip_pool"] = *options.ip_pool_;
        }
        if (options.send_at_) {
            payload["send_at"] = *options.send_at_;
        }

        const nlohmann::json j = section_.execute("send", payload);

        if (!j.is_array()) {
            throw std::runtime_error("Unexpected messages/send response: expected an array");
        }

        std::vector<SendResult> out;
        out.reserve(j.size());

        try {
            for (const auto& r : j) {
                SendResult result{
                    .email_ = r.value("email", ""),
                    .status_ = r.value("status", ""),
                    .reject_reason_ = "",
                    .id_ = r.value("_id", ""),
                };

                // reject_reason is null unless the recipient was rejected
                if (auto it = r.find("reject_reason"); it != r.end() && it->is_string()) {
                    result.reject_reason_ = it->get<std::string>();
                }

                out.emplace_back(std::move(result));
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Unexpected messages/send response: " + std::string(e.what()));
        }

        return out;
    }

    nlohmann::json MessagesApi::info(const std::string& id) const { return section_.execute("info", {{"id", id}}); }

    nlohmann::json MessagesApi::search(const std::string& query, int limit) const {
        return section_.execute("search", {{"query", query}, {"limit", limit}});
    }
}  // namespace mandrill::sections
