#include "users.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace mandrill::sections {
    UsersApi::UsersApi(const mandrill::api::RequestExecutor& executor) : section_(executor, SECTION) {}

    UserInfo UsersApi::info() const {
        const nlohmann::json j = section_.execute("info");

        if (!j.is_object()) {
            throw std::runtime_error("Unexpected users/info response: expected an object");
        }

        try {
            return UserInfo{
                .username_ = j.value("username", ""),
                .created_at_ = j.value("created_at", ""),
                .public_id_ = j.value("public_id", ""),
                .reputation_ = j.value("reputation", 0),
                .hourly_quota_ = j.value("hourly_quota", 0),
                .backlog_ = j.value("backlog", 0),
            };
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Unexpected users/info response: " + std::string(e.what()));
        }
    }

    std::string UsersApi::ping() const {
        const nlohmann::json j = section_.execute("ping");

        // users/ping answers with a bare JSON string
        if (!j.is_string()) {
            throw std::runtime_error("Unexpected users/ping response: expected a string");
        }

        return j.get<std::string>();
    }

    nlohmann::json UsersApi::ping2() const { return section_.execute("ping2"); }

    std::vector<Sender> UsersApi::senders() const {
        const nlohmann::json j = section_.execute("senders");

        if (!j.is_array()) {
            throw std::runtime_error("Unexpected users/senders response: expected an array");
        }

        std::vector<Sender> out;
        out.reserve(j.size());

        try {
            for (const auto& s : j) {
                out.push_back(Sender{
                    .address_ = s.value("address", ""),
                    .created_at_ = s.value("created_at", ""),
                    .sent_ = s.value("sent", 0),
                    .hard_bounces_ = s.value("hard_bounces", 0),
                    .soft_bounces_ = s.value("soft_bounces", 0),
                    .rejects_ = s.value("rejects", 0),
                    .complaints_ = s.value("complaints", 0),
                    .unsubs_ = s.value("unsubs", 0),
                    .opens_ = s.value("opens", 0),
                    .clicks_ = s.value("clicks", 0),
                });
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Unexpected users/senders response: " + std::string(e.what()));
        }

        return out;
    }
}  // namespace mandrill::sections
