/**
 * @file ArtifactManager.cpp
 * @brief Retention and deletion of generated audio artifacts
 */

#include "ArtifactManager.h"
#include "LogLevel.h"

#include <cerrno>
#include <cstring>
#include <limits>
#include <unistd.h>

bool ArtifactLifecycleManager::track(AudioArtifact& artifact, unsigned int retentionSeconds) {
    if (artifact.path.empty()) {
        LOG_WARN("[Artifact] Nothing to track");
        return false;
    }

    if (artifact.createdAt.time_since_epoch().count() == 0) {
        artifact.createdAt = std::chrono::system_clock::now();
    }
    artifact.retentionDeadline = artifact.createdAt + std::chrono::seconds(retentionSeconds);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tracked.insert(artifact.path);
    }

    const unsigned int maxSeconds = std::numeric_limits<unsigned int>::max() / 1000u;
    const unsigned int delayMs = retentionSeconds > maxSeconds ? std::numeric_limits<unsigned int>::max()
                                                                : retentionSeconds * 1000u;

    const std::string path = artifact.path;
    bool scheduled = m_scheduler.schedule("delete " + path, delayMs,
                                          [this, path]() { remove(path); });
    if (!scheduled) {
        LOG_WARN("[Artifact] Deletion of " << path << " not scheduled");
        return false;
    }

    LOG_DEBUG("[Artifact] Tracking " << path << " for " << retentionSeconds << "s");
    return true;
}

bool ArtifactLifecycleManager::remove(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tracked.erase(path);
    }

    if (::unlink(path.c_str()) == 0) {
        LOG_INFO("[Artifact] Deleted " << path);
        return true;
    }

    int err = errno;
    if (err == ENOENT) {
        LOG_DEBUG("[Artifact] " << path << " already gone");
        return true;
    }

    LOG_WARN("[Artifact] Failed to delete " << path << ": " << strerror(err));
    return false;
}

bool ArtifactLifecycleManager::isTracked(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tracked.count(path) > 0;
}

size_t ArtifactLifecycleManager::trackedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tracked.size();
}
