#ifndef MANDRILL_CPP_MESSAGES_HPP
#define MANDRILL_CPP_MESSAGES_HPP

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../api/request_executor.hpp"
#include "../api/section_executor.hpp"

namespace mandrill::sections {

    struct Recipient {
        std::string email_;
        std::string name_;
        std::string type_ = "to";  // to, cc or bcc
    };

    struct Message {
        std::string html_;
        std::string text_;
        std::string subject_;
        std::string from_email_;
        std::string from_name_;
        std::vector<Recipient> to_;
        std::map<std::string, std::string> headers_;
        std::vector<std::string> tags_;
        std::optional<bool> important_;
        std::optional<bool> track_opens_;
        std::optional<bool> track_clicks_;
    };

    struct SendOptions {
        bool async_ = false;
        std::optional<std::string> ip_pool_;
        std::optional<std::string> send_at_;  // UTC, "YYYY-MM-DD HH:MM:SS"
    };

    struct SendResult {
        std::string email_;
        std::string status_;  // sent, queued, scheduled, rejected, invalid
        std::string reject_reason_;
        std::string id_;
    };

    [[nodiscard]] nlohmann::json message_to_json(const Message& message);

    class MessagesApi {
       public:
        static constexpr const char* SECTION = "Messages";
        static constexpr int DEFAULT_SEARCH_LIMIT = 100;

        explicit MessagesApi(const mandrill::api::RequestExecutor& executor);
        explicit MessagesApi(mandrill::api::RequestExecutor&&) = delete;

        [[nodiscard]] std::vector<SendResult> send(const Message& message, const SendOptions& options = {}) const;
        [[nodiscard]] nlohmann::json info(const std::string& id) const;
        [[nodiscard]] nlohmann::json search(const std::string& query, int limit = DEFAULT_SEARCH_LIMIT) const;

       private:
        mandrill::api::SectionExecutor section_;
    };

}  // namespace mandrill::sections

#endif
