/**
 * @file StateSnapshotManager.cpp
 * @brief Vendor snapshot/restore of a player around an announcement
 */

#include "StateSnapshotManager.h"
#include "LogLevel.h"

#include <exception>

SnapshotResult StateSnapshotManager::snapshotDetailed(const std::string& deviceId) {
    try {
        CommandResult result = m_bus.call(BusAction::SONOS, BusAction::SNAPSHOT, {
            {BusAction::ENTITY_ID, deviceId},
            {BusAction::WITH_GROUP, "true"}
        });
        if (result.ok) {
            LOG_DEBUG("[Snapshot] " << deviceId << ": snapshot taken");
            return SnapshotResult::SNAPSHOT;
        }
        LOG_WARN("[Snapshot] " << deviceId << ": snapshot failed (" << result.error
                 << "), stopping instead");

        result = m_bus.call(BusAction::MEDIA_PLAYER, BusAction::MEDIA_STOP, {
            {BusAction::ENTITY_ID, deviceId}
        });
        if (result.ok) {
            return SnapshotResult::STOPPED;
        }
        LOG_WARN("[Snapshot] " << deviceId << ": fallback stop failed: " << result.error);
    } catch (const std::exception& e) {
        LOG_WARN("[Snapshot] " << deviceId << ": " << e.what());
    }
    return SnapshotResult::FAILED;
}

bool StateSnapshotManager::snapshot(const std::string& deviceId) {
    return snapshotDetailed(deviceId) != SnapshotResult::FAILED;
}

void StateSnapshotManager::restore(const std::string& deviceId) {
    try {
        CommandResult result = m_bus.call(BusAction::SONOS, BusAction::RESTORE, {
            {BusAction::ENTITY_ID, deviceId},
            {BusAction::WITH_GROUP, "true"}
        });
        if (result.ok) {
            LOG_INFO("[Snapshot] " << deviceId << ": state restored");
        } else {
            LOG_WARN("[Snapshot] " << deviceId << ": restore failed: " << result.error);
        }
    } catch (const std::exception& e) {
        LOG_WARN("[Snapshot] " << deviceId << ": restore threw: " << e.what());
    }
}

bool StateSnapshotManager::scheduleRestore(const std::string& deviceId, unsigned int delayMs,
                                           RestorationTask& task) {
    task.deviceId = deviceId;
    task.kind = RestorationKind::STATE_RESTORE;
    task.volume = 0.0f;
    task.fireAt = std::chrono::steady_clock::now() + std::chrono::milliseconds(delayMs);

    bool scheduled = m_scheduler.schedule(
        std::string(restorationName(task.kind)) + " " + deviceId, delayMs,
        [this, deviceId]() { restore(deviceId); });

    if (!scheduled) {
        LOG_WARN("[Snapshot] " << deviceId << ": restore not scheduled");
    }
    return scheduled;
}
