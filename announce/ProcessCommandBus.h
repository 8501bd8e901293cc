/**
 * @file ProcessCommandBus.h
 * @brief CommandBus backed by an external helper program
 *
 * Each bus operation runs the helper once:
 *   <helper> call <domain> <action> key=value ...   exit 0 = ok
 *   <helper> state <deviceId>                       exit 0, key=value lines
 *
 * In state output, "state", "volume_level" and "media_content_id" fill the
 * typed DeviceState fields; every line is also kept as an attribute.
 */

#ifndef REPLAY2PLAYER_PROCESS_COMMAND_BUS_H
#define REPLAY2PLAYER_PROCESS_COMMAND_BUS_H

#include "CommandBus.h"
#include "AnnounceTypes.h"

#include <string>
#include <vector>

class ProcessCommandBus : public CommandBus {
public:
    explicit ProcessCommandBus(const std::string& helperPath,
                               unsigned int timeoutMs = AnnounceTiming::BUS_CALL_TIMEOUT_MS);

    CommandResult call(const std::string& domain,
                       const std::string& action,
                       const CommandParams& params) override;

    bool getState(const std::string& deviceId, DeviceState& state) override;

    // Exposed for tests
    std::vector<std::string> buildCallArgs(const std::string& domain,
                                           const std::string& action,
                                           const CommandParams& params) const;
    static bool parseState(const std::string& output, DeviceState& state);

private:
    std::string m_helperPath;
    unsigned int m_timeoutMs;
};

#endif // REPLAY2PLAYER_PROCESS_COMMAND_BUS_H
