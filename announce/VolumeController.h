/**
 * @file VolumeController.h
 * @brief Temporary volume boost with deferred restore
 *
 * A restore is only ever scheduled with a volume that was read from the
 * device before boosting. A device without a readable volume is left alone.
 */

#ifndef REPLAY2PLAYER_VOLUME_CONTROLLER_H
#define REPLAY2PLAYER_VOLUME_CONTROLLER_H

#include "AnnounceTypes.h"
#include "CommandBus.h"
#include "TaskScheduler.h"

#include <string>

class VolumeController {
public:
    VolumeController(CommandBus& bus, TaskScheduler& scheduler)
        : m_bus(bus), m_scheduler(scheduler) {}

    /**
     * @brief Raise the volume by amount, capped at VOLUME_MAX
     * @param originalVolume Receives the pre-boost volume on success
     * @return false if the volume is unreadable or the set command failed;
     *         nothing was changed in that case
     */
    bool boost(const std::string& deviceId, float amount, float& originalVolume);

    /**
     * @brief Set the volume back to originalVolume after delayMs
     * @param task Receives the registered restoration
     * @return false if the scheduler refused the task
     */
    bool scheduleRestore(const std::string& deviceId, float originalVolume,
                         unsigned int delayMs, RestorationTask& task);

    /**
     * @brief Issue the restore now; failures are logged only
     */
    void restore(const std::string& deviceId, float volume);

    static float boostedVolume(float current, float amount);
    static std::string formatVolume(float volume);

private:
    CommandBus& m_bus;
    TaskScheduler& m_scheduler;
};

#endif // REPLAY2PLAYER_VOLUME_CONTROLLER_H
