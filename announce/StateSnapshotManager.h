/**
 * @file StateSnapshotManager.h
 * @brief Vendor snapshot/restore of a player around an announcement
 *
 * Best-effort: nothing here throws or blocks delivery. When the snapshot
 * service is refused, a plain stop is issued instead so the announcement
 * does not fight with whatever was playing.
 */

#ifndef REPLAY2PLAYER_STATE_SNAPSHOT_MANAGER_H
#define REPLAY2PLAYER_STATE_SNAPSHOT_MANAGER_H

#include "AnnounceTypes.h"
#include "CommandBus.h"
#include "TaskScheduler.h"

#include <string>

enum class SnapshotResult {
    FAILED,         // neither snapshot nor fallback stop succeeded
    SNAPSHOT,       // vendor snapshot taken
    STOPPED         // snapshot refused, fallback stop succeeded
};

class StateSnapshotManager {
public:
    StateSnapshotManager(CommandBus& bus, TaskScheduler& scheduler)
        : m_bus(bus), m_scheduler(scheduler) {}

    /**
     * @return true if the snapshot or the fallback stop succeeded
     */
    bool snapshot(const std::string& deviceId);
    SnapshotResult snapshotDetailed(const std::string& deviceId);

    /**
     * @brief Issue the vendor restore now; failures are logged only
     */
    void restore(const std::string& deviceId);

    bool scheduleRestore(const std::string& deviceId, unsigned int delayMs, RestorationTask& task);

private:
    CommandBus& m_bus;
    TaskScheduler& m_scheduler;
};

#endif // REPLAY2PLAYER_STATE_SNAPSHOT_MANAGER_H
