/**
 * @file DeliveryOrchestrator.h
 * @brief Per-device announcement delivery and deferred restoration
 *
 * Per device, strictly in this order:
 *   classify -> boost volume -> snapshot (quirky) -> play/negotiate
 *   -> schedule volume restore -> schedule state restore (quirky)
 *
 * Devices run concurrently, one thread each; nothing is shared between
 * them. The request succeeds if at least one device played the audio.
 */

#ifndef REPLAY2PLAYER_DELIVERY_ORCHESTRATOR_H
#define REPLAY2PLAYER_DELIVERY_ORCHESTRATOR_H

#include "AnnounceTypes.h"
#include "CommandBus.h"
#include "ContentNegotiator.h"
#include "DeviceClassifier.h"
#include "DurationProbe.h"
#include "StateSnapshotManager.h"
#include "TargetResolver.h"
#include "TaskScheduler.h"
#include "VolumeController.h"

#include <future>
#include <string>

class DeliveryOrchestrator {
public:
    DeliveryOrchestrator(CommandBus& bus, TaskScheduler& scheduler, DurationProbe& probe,
                         const AnnounceConfig& config = AnnounceConfig());

    DeliveryReport deliver(const AnnouncementRequest& request);

    /**
     * @brief Volume restore delay in ms
     *
     * max(duration + margin, floor) when the duration is known,
     * max(fallback, floor) otherwise.
     */
    static unsigned int restoreDelayMs(bool haveDuration, double durationSeconds,
                                       const AnnounceConfig& config);

    /**
     * @brief State restore delay: the volume restore delay plus the extra
     */
    static unsigned int stateRestoreDelayMs(unsigned int volumeDelayMs, const AnnounceConfig& config);

private:
    struct Duration {
        bool known = false;
        double seconds = 0.0;
    };

    void deliverToDevice(const AnnouncementRequest& request, std::shared_future<Duration> duration,
                         DeviceDeliveryState& device);
    void scheduleRestorations(const std::string& deviceId, std::shared_future<Duration>& duration,
                              DeviceDeliveryState& device);
    static DeliveryReport fail(FailureKind kind, const std::string& error);

    CommandBus& m_bus;
    DurationProbe& m_probe;
    AnnounceConfig m_config;

    TargetResolver m_resolver;
    VolumeController m_volume;
    StateSnapshotManager m_snapshots;
    ContentNegotiator m_negotiator;
};

#endif // REPLAY2PLAYER_DELIVERY_ORCHESTRATOR_H
