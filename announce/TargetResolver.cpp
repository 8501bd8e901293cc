/**
 * @file TargetResolver.cpp
 * @brief Expand a target id into the ordered set of physical device ids
 */

#include "TargetResolver.h"
#include "LogLevel.h"

#include <algorithm>

std::vector<std::string> TargetResolver::splitMembers(const std::string& value) {
    std::vector<std::string> members;
    size_t start = 0;

    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();

        std::string item = value.substr(start, comma - start);
        size_t b = item.find_first_not_of(" \t[]'\"");
        size_t e = item.find_last_not_of(" \t[]'\"");
        if (b != std::string::npos) {
            item = item.substr(b, e - b + 1);
            if (std::find(members.begin(), members.end(), item) == members.end()) {
                members.push_back(item);
            }
        }
        start = comma + 1;
    }

    return members;
}

std::vector<std::string> TargetResolver::expand(const std::string& targetId) {
    std::vector<std::string> devices;

    if (targetId.empty()) {
        return devices;
    }

    DeviceState state;
    if (!m_bus.getState(targetId, state)) {
        LOG_ERROR("[Orchestrator] Target " << targetId << " cannot be resolved");
        return devices;
    }

    if (state.hasAttribute(BusAction::ENTITY_ID)) {
        devices = splitMembers(state.attribute(BusAction::ENTITY_ID));
        if (devices.empty()) {
            LOG_WARN("[Orchestrator] Group " << targetId << " has no members");
        } else {
            LOG_DEBUG("[Orchestrator] Group " << targetId << " -> " << devices.size() << " device(s)");
        }
        return devices;
    }

    devices.push_back(targetId);
    return devices;
}
