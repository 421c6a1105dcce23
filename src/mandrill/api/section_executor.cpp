#include "section_executor.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/string_utils.hpp"

namespace mandrill::api {
    SectionExecutor::SectionExecutor(const RequestExecutor& executor, std::string_view section_name)
        : executor_(executor), section_(string_utils::to_lower(section_name)) {
        if (!string_utils::is_path_segment_safe(section_)) {
            throw std::invalid_argument("Invalid section name: '" + std::string(section_name) + "'");
        }
    }

    nlohmann::json SectionExecutor::execute(std::string_view sub_action, const nlohmann::json& payload) const {
        return executor_.execute(section_, sub_action, payload);
    }

    ExecuteResult SectionExecutor::try_execute(std::string_view sub_action, const nlohmann::json& payload) const {
        return executor_.try_execute(section_, sub_action, payload);
    }
}  // namespace mandrill::api
