/**
 * @file CommandBus.h
 * @brief Host platform command bus and state query interface
 *
 * The bus may accept a command and then silently ignore it; callers that
 * need certainty poll getState() afterwards.
 */

#ifndef REPLAY2PLAYER_COMMAND_BUS_H
#define REPLAY2PLAYER_COMMAND_BUS_H

#include "AnnounceTypes.h"

#include <map>
#include <string>

using CommandParams = std::map<std::string, std::string>;

struct CommandResult {
    bool ok = false;
    std::string error;

    static CommandResult success() { return CommandResult{true, std::string()}; }
    static CommandResult failure(const std::string& message) { return CommandResult{false, message}; }
};

//=============================================================================
// Host actions used by the orchestrator
//=============================================================================

namespace BusAction {
    constexpr const char* MEDIA_PLAYER = "media_player";
    constexpr const char* VOLUME_SET = "volume_set";
    constexpr const char* PLAY_MEDIA = "play_media";
    constexpr const char* MEDIA_STOP = "media_stop";

    constexpr const char* SONOS = "sonos";
    constexpr const char* SNAPSHOT = "snapshot";
    constexpr const char* RESTORE = "restore";

    constexpr const char* ENTITY_ID = "entity_id";
    constexpr const char* VOLUME_LEVEL = "volume_level";
    constexpr const char* CONTENT_ID = "media_content_id";
    constexpr const char* CONTENT_TYPE = "media_content_type";
    constexpr const char* WITH_GROUP = "with_group";
}

class CommandBus {
public:
    virtual ~CommandBus() = default;

    /**
     * @brief Issue an action on the host platform
     * @return ok, or the error reported by the platform
     */
    virtual CommandResult call(const std::string& domain,
                               const std::string& action,
                               const CommandParams& params) = 0;

    /**
     * @brief Poll the current state of a device or group
     * @return false if the id cannot be resolved
     */
    virtual bool getState(const std::string& deviceId, DeviceState& state) = 0;
};

#endif // REPLAY2PLAYER_COMMAND_BUS_H
