/**
 * @file VolumeController.cpp
 * @brief Temporary volume boost with deferred restore
 */

#include "VolumeController.h"
#include "LogLevel.h"

#include <algorithm>
#include <sstream>

float VolumeController::boostedVolume(float current, float amount) {
    return std::min(current + amount, AnnounceDefaults::VOLUME_MAX);
}

std::string VolumeController::formatVolume(float volume) {
    std::ostringstream oss;
    oss << volume;
    return oss.str();
}

bool VolumeController::boost(const std::string& deviceId, float amount, float& originalVolume) {
    DeviceState state;
    if (!m_bus.getState(deviceId, state)) {
        LOG_WARN("[Volume] " << deviceId << ": state unavailable, not boosting");
        return false;
    }
    if (!state.hasVolume) {
        LOG_DEBUG("[Volume] " << deviceId << ": no volume control");
        return false;
    }

    float target = boostedVolume(state.volume, amount);

    CommandResult result = m_bus.call(BusAction::MEDIA_PLAYER, BusAction::VOLUME_SET, {
        {BusAction::ENTITY_ID, deviceId},
        {BusAction::VOLUME_LEVEL, formatVolume(target)}
    });
    if (!result.ok) {
        LOG_WARN("[Volume] " << deviceId << ": boost failed: " << result.error);
        return false;
    }

    LOG_INFO("[Volume] " << deviceId << ": " << state.volume << " -> " << target);
    originalVolume = state.volume;
    return true;
}

void VolumeController::restore(const std::string& deviceId, float volume) {
    CommandResult result = m_bus.call(BusAction::MEDIA_PLAYER, BusAction::VOLUME_SET, {
        {BusAction::ENTITY_ID, deviceId},
        {BusAction::VOLUME_LEVEL, formatVolume(volume)}
    });

    if (result.ok) {
        LOG_INFO("[Volume] " << deviceId << ": restored to " << volume);
    } else {
        LOG_WARN("[Volume] " << deviceId << ": restore failed: " << result.error);
    }
}

bool VolumeController::scheduleRestore(const std::string& deviceId, float originalVolume,
                                       unsigned int delayMs, RestorationTask& task) {
    task.deviceId = deviceId;
    task.kind = RestorationKind::VOLUME_RESTORE;
    task.volume = originalVolume;
    task.fireAt = std::chrono::steady_clock::now() + std::chrono::milliseconds(delayMs);

    bool scheduled = m_scheduler.schedule(
        std::string(restorationName(task.kind)) + " " + deviceId, delayMs,
        [this, deviceId, originalVolume]() { restore(deviceId, originalVolume); });

    if (!scheduled) {
        LOG_WARN("[Volume] " << deviceId << ": restore to " << originalVolume << " not scheduled");
    }
    return scheduled;
}
