#ifndef MANDRILL_CPP_SECTION_EXECUTOR_HPP
#define MANDRILL_CPP_SECTION_EXECUTOR_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

#include "request_executor.hpp"

namespace mandrill::api {
    // A RequestExecutor bound to one API section. Section clients embed one of these and
    // declare their section name once; it is lower-cased here and never recomputed. The
    // executor is held by reference and must outlive this object.
    class SectionExecutor {
       public:
        SectionExecutor(const RequestExecutor& executor, std::string_view section_name);
        SectionExecutor(RequestExecutor&&, std::string_view) = delete;

        [[nodiscard]] const std::string& section() const { return section_; }

        nlohmann::json execute(std::string_view sub_action, const nlohmann::json& payload = nlohmann::json::object()) const;
        ExecuteResult try_execute(std::string_view sub_action, const nlohmann::json& payload = nlohmann::json::object()) const;

       private:
        const RequestExecutor& executor_;
        std::string section_;
    };
}  // namespace mandrill::api

#endif
