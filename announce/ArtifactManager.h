/**
 * @file ArtifactManager.h
 * @brief Retention and deletion of generated audio artifacts
 *
 * Deletion is unconditional once the retention window ends, whether or not
 * a device is still playing the file. Deleting twice is harmless.
 */

#ifndef REPLAY2PLAYER_ARTIFACT_MANAGER_H
#define REPLAY2PLAYER_ARTIFACT_MANAGER_H

#include "AnnounceTypes.h"
#include "TaskScheduler.h"

#include <mutex>
#include <set>
#include <string>

class ArtifactLifecycleManager {
public:
    explicit ArtifactLifecycleManager(TaskScheduler& scheduler) : m_scheduler(scheduler) {}

    /**
     * @brief Stamp the retention deadline and schedule deletion
     * @return false if the deletion could not be scheduled
     */
    bool track(AudioArtifact& artifact, unsigned int retentionSeconds);

    /**
     * @brief Delete the file now
     * @return true if the file is gone (deleted now or already missing)
     */
    bool remove(const std::string& path);

    bool isTracked(const std::string& path) const;
    size_t trackedCount() const;

private:
    TaskScheduler& m_scheduler;
    mutable std::mutex m_mutex;
    std::set<std::string> m_tracked;
};

#endif // REPLAY2PLAYER_ARTIFACT_MANAGER_H
