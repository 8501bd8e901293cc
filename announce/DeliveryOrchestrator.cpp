/**
 * @file DeliveryOrchestrator.cpp
 * @brief Per-device announcement delivery and deferred restoration
 */

#include "DeliveryOrchestrator.h"
#include "LogLevel.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <thread>
#include <vector>

DeliveryOrchestrator::DeliveryOrchestrator(CommandBus& bus, TaskScheduler& scheduler,
                                           DurationProbe& probe, const AnnounceConfig& config)
    : m_bus(bus)
    , m_probe(probe)
    , m_config(config)
    , m_resolver(bus)
    , m_volume(bus, scheduler)
    , m_snapshots(bus, scheduler)
    , m_negotiator(bus, config) {}

namespace {

// Saturates at the unsigned int range
unsigned int secondsToMs(double seconds) {
    const double maxSeconds = std::numeric_limits<unsigned int>::max() / 1000.0;
    if (!(seconds > 0.0)) return 0;
    if (seconds >= maxSeconds) return std::numeric_limits<unsigned int>::max();
    return static_cast<unsigned int>(std::llround(seconds * 1000.0));
}

// First failing device in target order
FailureKind firstFailure(const DeliveryReport& report) {
    for (const auto& device : report.devices) {
        if (device.failure != FailureKind::NONE) return device.failure;
    }
    return FailureKind::INTERNAL_ERROR;
}

} // namespace

unsigned int DeliveryOrchestrator::restoreDelayMs(bool haveDuration, double durationSeconds,
                                                  const AnnounceConfig& config) {
    double seconds = haveDuration ? durationSeconds + config.restoreMarginSeconds
                                  : config.restoreFallbackSeconds;
    seconds = std::max(seconds, config.restoreFloorSeconds);
    return secondsToMs(seconds);
}

unsigned int DeliveryOrchestrator::stateRestoreDelayMs(unsigned int volumeDelayMs,
                                                       const AnnounceConfig& config) {
    unsigned int extraMs = secondsToMs(config.stateRestoreExtraSeconds);
    if (extraMs > std::numeric_limits<unsigned int>::max() - volumeDelayMs) {
        return std::numeric_limits<unsigned int>::max();
    }
    return volumeDelayMs + extraMs;
}

DeliveryReport DeliveryOrchestrator::fail(FailureKind kind, const std::string& error) {
    DeliveryReport report;
    report.success = false;
    report.failure = kind;
    report.error = error;
    LOG_ERROR("[Orchestrator] " << error);
    return report;
}

//=============================================================================
// Request
//=============================================================================

DeliveryReport DeliveryOrchestrator::deliver(const AnnouncementRequest& request) {
    if (!request.artifact.valid()) {
        return fail(FailureKind::NO_ARTIFACT, "no audio artifact to deliver");
    }

    std::vector<std::string> devices = m_resolver.expand(request.targetId);
    if (devices.empty()) {
        return fail(FailureKind::NO_TARGETS, "target " + request.targetId + " has no devices");
    }

    LOG_INFO("[Orchestrator] Delivering " << request.artifact.url << " to "
             << devices.size() << " device(s)");

    // Probed once per request, only waited on when a restore is scheduled
    AudioArtifact artifact = request.artifact;
    DurationProbe& probe = m_probe;
    std::shared_future<Duration> duration = std::async(std::launch::async, [&probe, artifact]() {
        Duration d;
        d.known = probe.tryProbe(artifact, d.seconds);
        return d;
    }).share();

    DeliveryReport report;
    report.devices.resize(devices.size());

    std::vector<std::thread> workers;
    workers.reserve(devices.size());
    for (size_t i = 0; i < devices.size(); i++) {
        report.devices[i].deviceId = devices[i];
        DeviceDeliveryState* device = &report.devices[i];
        workers.emplace_back([this, &request, duration, device]() {
            deliverToDevice(request, duration, *device);
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    duration.wait();

    size_t delivered = report.deliveredCount();
    report.success = delivered > 0;
    if (report.success) {
        LOG_INFO("[Orchestrator] Delivered to " << delivered << "/" << devices.size() << " device(s)");
    } else {
        report.failure = firstFailure(report);
        report.error = "delivery failed on all " + std::to_string(devices.size()) + " device(s)";
        LOG_ERROR("[Orchestrator] " << report.error);
    }
    return report;
}

//=============================================================================
// Device
//=============================================================================

void DeliveryOrchestrator::deliverToDevice(const AnnouncementRequest& request,
                                           std::shared_future<Duration> duration,
                                           DeviceDeliveryState& device) {
    const std::string deviceId = device.deviceId;

    try {
        DeviceState state;
        if (!m_bus.getState(deviceId, state)) {
            device.outcome = DeliveryOutcome::FAILED;
            device.failure = FailureKind::DEVICE_UNREACHABLE;
            device.error = "device cannot be resolved";
            LOG_ERROR("[Orchestrator] " << deviceId << ": " << device.error);
            return;
        }

        // 1. Classify
        DeviceClass cls = DeviceClassifier::classify(deviceId, state.attributes);
        device.isQuirky = cls.isQuirky;
        LOG_DEBUG("[Orchestrator] " << deviceId << ": "
                  << (cls.isQuirky ? "quirky (" + cls.reason + ")" : std::string("standard")));

        // 2. Boost
        if (request.options.volumeBoostEnabled) {
            float original = 0.0f;
            device.volumeBoosted = m_volume.boost(deviceId, request.options.volumeBoostAmount, original);
            if (device.volumeBoosted) {
                device.originalVolume = original;
            }
        }

        // 3. Snapshot
        if (device.isQuirky) {
            device.snapshotTaken = m_snapshots.snapshot(deviceId);
        }

        // 4. Play
        NegotiationResult played;
        device.contentTypeCandidates = ContentNegotiator::buildCandidates(
            request.artifact.contentType, m_config.alternateContentTypes);
        if (device.isQuirky) {
            played = m_negotiator.negotiate(deviceId, request.artifact.url, device.contentTypeCandidates);
        } else {
            if (device.contentTypeCandidates.empty()) {
                throw std::invalid_argument("no content type to play");
            }
            device.contentTypeCandidates.resize(1);
            played = m_negotiator.playSingleShot(deviceId, request.artifact.url,
                                                 device.contentTypeCandidates.front());
        }

        device.attemptIndex = played.attemptIndex;
        device.playAttempts = played.playAttempts;
        if (played.delivered) {
            device.outcome = DeliveryOutcome::DELIVERED;
            device.winningContentType = played.winningContentType;
        } else {
            device.outcome = DeliveryOutcome::FAILED;
            device.failure = played.failure;
            device.error = played.error;
        }
    } catch (const std::exception& e) {
        device.outcome = DeliveryOutcome::FAILED;
        device.failure = FailureKind::INTERNAL_ERROR;
        device.error = e.what();
        LOG_ERROR("[Orchestrator] " << deviceId << ": " << e.what());
    }

    // 5./6. Restorations run whatever the playback outcome
    scheduleRestorations(deviceId, duration, device);
}

void DeliveryOrchestrator::scheduleRestorations(const std::string& deviceId,
                                                std::shared_future<Duration>& duration,
                                                DeviceDeliveryState& device) {
    bool stateRestore = device.isQuirky && device.snapshotTaken;
    if (!device.volumeBoosted && !stateRestore) {
        return;
    }

    const Duration& d = duration.get();
    unsigned int delayMs = restoreDelayMs(d.known, d.seconds, m_config);

    if (device.volumeBoosted) {
        RestorationTask task;
        if (m_volume.scheduleRestore(deviceId, device.originalVolume, delayMs, task)) {
            device.restorations.push_back(task);
        }
    }

    if (stateRestore) {
        RestorationTask task;
        if (m_snapshots.scheduleRestore(deviceId, stateRestoreDelayMs(delayMs, m_config), task)) {
            device.restorations.push_back(task);
        }
    }

    LOG_DEBUG("[Orchestrator] " << deviceId << ": " << device.restorations.size()
              << " restoration(s) in " << delayMs << "ms"
              << (d.known ? "" : " (duration unknown)"));
}
