/**
 * @file ProcessCommandBus.cpp
 * @brief CommandBus backed by an external helper program
 */

#include "ProcessCommandBus.h"
#include "ProcessRunner.h"
#include "LogLevel.h"

#include <cstdlib>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return std::string();
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

ProcessCommandBus::ProcessCommandBus(const std::string& helperPath, unsigned int timeoutMs)
    : m_helperPath(helperPath), m_timeoutMs(timeoutMs) {}

std::vector<std::string> ProcessCommandBus::buildCallArgs(const std::string& domain,
                                                          const std::string& action,
                                                          const CommandParams& params) const {
    std::vector<std::string> args;
    args.push_back(m_helperPath);
    args.push_back("call");
    args.push_back(domain);
    args.push_back(action);
    for (const auto& param : params) {
        args.push_back(param.first + "=" + param.second);
    }
    return args;
}

CommandResult ProcessCommandBus::call(const std::string& domain,
                                      const std::string& action,
                                      const CommandParams& params) {
    ProcessResult result = ProcessRunner::run(buildCallArgs(domain, action, params), m_timeoutMs);

    if (!result.started) {
        return CommandResult::failure("command bus helper not executable: " + m_helperPath);
    }
    if (result.timedOut) {
        return CommandResult::failure(domain + "." + action + " timed out");
    }
    if (result.exitCode != 0) {
        std::string message = trim(result.output);
        if (message.empty()) {
            message = domain + "." + action + " failed with status " + std::to_string(result.exitCode);
        }
        LOG_DEBUG("[Bus] " << domain << "." << action << " -> " << message);
        return CommandResult::failure(message);
    }

    LOG_DEBUG("[Bus] " << domain << "." << action << " -> ok");
    return CommandResult::success();
}

bool ProcessCommandBus::getState(const std::string& deviceId, DeviceState& state) {
    ProcessResult result = ProcessRunner::run({m_helperPath, "state", deviceId}, m_timeoutMs);

    if (!result.succeeded()) {
        LOG_DEBUG("[Bus] state " << deviceId << " unavailable (exit " << result.exitCode
                  << (result.timedOut ? ", timeout" : "") << ")");
        return false;
    }

    return parseState(result.output, state);
}

bool ProcessCommandBus::parseState(const std::string& output, DeviceState& state) {
    state = DeviceState();

    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        state.attributes[key] = value;

        if (key == "state") {
            state.state = value;
        } else if (key == BusAction::VOLUME_LEVEL) {
            char* end = nullptr;
            float volume = std::strtof(value.c_str(), &end);
            if (end != value.c_str() && *end == '\0') {
                state.hasVolume = true;
                state.volume = volume;
            }
        } else if (key == BusAction::CONTENT_ID) {
            state.playingRef = value;
        }
    }

    // A resolvable device reports at least its state
    return !state.state.empty();
}
