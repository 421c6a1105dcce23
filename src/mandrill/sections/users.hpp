#ifndef MANDRILL_CPP_USERS_HPP
#define MANDRILL_CPP_USERS_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "../api/request_executor.hpp"
#include "../api/section_executor.hpp"

namespace mandrill::sections {

    struct UserInfo {
        std::string username_;
        std::string created_at_;
        std::string public_id_;
        int reputation_{};
        int hourly_quota_{};
        int backlog_{};
    };

    struct Sender {
        std::string address_;
        std::string created_at_;
        int sent_{};
        int hard_bounces_{};
        int soft_bounces_{};
        int rejects_{};
        int complaints_{};
        int unsubs_{};
        int opens_{};
        int clicks_{};
    };

    class UsersApi {
       public:
        static constexpr const char* SECTION = "Users";

        explicit UsersApi(const mandrill::api::RequestExecutor& executor);
        explicit UsersApi(mandrill::api::RequestExecutor&&) = delete;

        [[nodiscard]] UserInfo info() const;
        [[nodiscard]] std::string ping() const;
        [[nodiscard]] nlohmann::json ping2() const;
        [[nodiscard]] std::vector<Sender> senders() const;

       private:
        mandrill::api::SectionExecutor section_;
    };

}  // namespace mandrill::sections

#endif
