/**
 * @file task_types.cpp
 * @brief Agent type conversions
 *
 * @date 2025
 */

#include "sandpool/core/task_types.hpp"

#include "sandpool/utils/string_utils.hpp"

namespace sandpool {
namespace core {

AgentType ParseAgentType(const std::string& type) {
    std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(type));
    if (lower == "coder") return AgentType::Coder;
    if (lower == "tester") return AgentType::Tester;
    if (lower == "reviewer") return AgentType::Reviewer;
    if (lower == "researcher") return AgentType::Researcher;
    if (lower == "planner") return AgentType::Planner;
    return AgentType::Unknown;
}

std::string NormalizeAgentType(const std::string& type) {
    std::string key = utils::StringUtils::ToLower(utils::StringUtils::Trim(type));
    return key.empty() ? "unknown" : key;
}

std::string AgentTypeToString(AgentType type) {
    switch (type) {
        case AgentType::Coder: return "coder";
        case AgentType::Tester: return "tester";
        case AgentType::Reviewer: return "reviewer";
        case AgentType::Researcher: return "researcher";
        case AgentType::Planner: return "planner";
        default: return "unknown";
    }
}

} // namespace core
} // namespace sandpool
