/**
 * @file AnnounceTypes.h
 * @brief Data model shared by the announcement delivery components
 *
 * Requests, per-device delivery state, reported device state, restoration
 * tasks and audio artifacts. Tunables live in AnnounceConfig, with their
 * defaults in the AnnounceTiming / AnnounceDefaults namespaces.
 */

#ifndef REPLAY2PLAYER_ANNOUNCE_TYPES_H
#define REPLAY2PLAYER_ANNOUNCE_TYPES_H

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

//=============================================================================
// Timing Configuration
//=============================================================================

namespace AnnounceTiming {
    // Content negotiation waits
    constexpr unsigned int VERIFY_GRACE_MS = 2000;       // play -> state check
    constexpr unsigned int CORRECTIVE_GRACE_MS = 3000;   // stop -> retry

    // Deferred restoration
    constexpr double RESTORE_MARGIN_SECONDS = 2.0;
    constexpr double RESTORE_FLOOR_SECONDS = 5.0;
    constexpr double RESTORE_FALLBACK_SECONDS = 15.0;
    constexpr double STATE_RESTORE_EXTRA_SECONDS = 1.0;

    // Duration probe
    constexpr double DEFAULT_DURATION_SECONDS = 10.0;
    constexpr unsigned int PROBE_TIMEOUT_MS = 5000;

    // External tools
    constexpr unsigned int BUS_CALL_TIMEOUT_MS = 10000;
    constexpr unsigned int TRANSCODE_TIMEOUT_MS = 60000;

    // Artifact store
    constexpr unsigned int ARTIFACT_RETENTION_SECONDS = 300;
}

namespace AnnounceDefaults {
    constexpr bool VOLUME_BOOST_ENABLED = true;
    constexpr float VOLUME_BOOST_AMOUNT = 0.1f;   // 10% volume increase
    constexpr float VOLUME_MAX = 1.0f;

    constexpr int PREPEND_SILENCE_SECONDS = 3;
    constexpr int PREPEND_SILENCE_MAX_SECONDS = 10;

    inline std::vector<std::string> alternateContentTypes() {
        return {"audio/mpeg", "audio/mp3", "music", "application/octet-stream"};
    }

    // Substrings (lower case) of a play error that mean "device busy /
    // in a conflicting transport state"
    inline std::vector<std::string> busySignatures() {
        return {"busy", "transition", "conflict", "701"};
    }
}

//=============================================================================
// Orchestration Configuration
//=============================================================================

struct AnnounceConfig {
    unsigned int verifyGraceMs = AnnounceTiming::VERIFY_GRACE_MS;
    unsigned int correctiveGraceMs = AnnounceTiming::CORRECTIVE_GRACE_MS;

    double restoreMarginSeconds = AnnounceTiming::RESTORE_MARGIN_SECONDS;
    double restoreFloorSeconds = AnnounceTiming::RESTORE_FLOOR_SECONDS;
    double restoreFallbackSeconds = AnnounceTiming::RESTORE_FALLBACK_SECONDS;
    double stateRestoreExtraSeconds = AnnounceTiming::STATE_RESTORE_EXTRA_SECONDS;

    unsigned int retentionSeconds = AnnounceTiming::ARTIFACT_RETENTION_SECONDS;

    std::vector<std::string> alternateContentTypes = AnnounceDefaults::alternateContentTypes();
    std::vector<std::string> busySignatures = AnnounceDefaults::busySignatures();
};

//=============================================================================
// Device State (as reported by the host platform)
//=============================================================================

struct DeviceState {
    std::string state;                // "playing", "idle", ...
    bool hasVolume = false;
    float volume = 0.0f;              // volume_level 0..1, valid if hasVolume
    std::string playingRef;           // media_content_id
    std::map<std::string, std::string> attributes;

    bool hasAttribute(const std::string& key) const {
        return attributes.find(key) != attributes.end();
    }

    std::string attribute(const std::string& key) const {
        auto it = attributes.find(key);
        return it != attributes.end() ? it->second : std::string();
    }
};

//=============================================================================
// Request
//=============================================================================

enum class SourceKind { RECORDING, SYNTHESIZED_SPEECH };

struct DeliveryOptions {
    bool volumeBoostEnabled = AnnounceDefaults::VOLUME_BOOST_ENABLED;
    float volumeBoostAmount = AnnounceDefaults::VOLUME_BOOST_AMOUNT;
};

struct AudioArtifact {
    std::string path;                 // file in the artifact store
    std::string url;                  // URL the command bus fetches from
    std::string contentType;          // declared type, best guess from encoding
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point retentionDeadline;

    bool valid() const { return !path.empty() && !url.empty(); }
};

struct AnnouncementRequest {
    SourceKind sourceKind = SourceKind::RECORDING;
    AudioArtifact artifact;
    std::string targetId;
    DeliveryOptions options;
};

//=============================================================================
// Restoration
//=============================================================================

enum class RestorationKind { VOLUME_RESTORE, STATE_RESTORE };

struct RestorationTask {
    std::string deviceId;
    RestorationKind kind = RestorationKind::VOLUME_RESTORE;
    float volume = 0.0f;              // payload for VOLUME_RESTORE
    std::chrono::steady_clock::time_point fireAt;
};

//=============================================================================
// Per-device delivery
//=============================================================================

enum class DeliveryOutcome { PENDING, DELIVERED, FAILED };

enum class FailureKind {
    NONE,
    DEVICE_BUSY,            // transient, retried once after a corrective stop
    UNSUPPORTED_CONTENT,    // explicit play error, next candidate
    NOT_CONFIRMED,          // accepted but reported state never changed
    DEVICE_UNREACHABLE,     // state query failed, no retries
    NO_TARGETS,
    NO_ARTIFACT,
    INTERNAL_ERROR          // unexpected exception while handling the device
};

struct DeviceDeliveryState {
    std::string deviceId;
    bool isQuirky = false;
    bool volumeBoosted = false;
    float originalVolume = 0.0f;      // valid only if volumeBoosted
    bool snapshotTaken = false;
    std::vector<std::string> contentTypeCandidates;
    size_t attemptIndex = 0;
    int playAttempts = 0;
    std::string winningContentType;
    std::vector<RestorationTask> restorations;
    DeliveryOutcome outcome = DeliveryOutcome::PENDING;
    FailureKind failure = FailureKind::NONE;
    std::string error;
};

struct DeliveryReport {
    bool success = false;
    FailureKind failure = FailureKind::NONE;
    std::string error;
    std::vector<DeviceDeliveryState> devices;

    size_t deliveredCount() const {
        size_t n = 0;
        for (const auto& d : devices) {
            if (d.outcome == DeliveryOutcome::DELIVERED) n++;
        }
        return n;
    }
};

const char* outcomeName(DeliveryOutcome outcome);
const char* failureName(FailureKind kind);
const char* restorationName(RestorationKind kind);

#endif // REPLAY2PLAYER_ANNOUNCE_TYPES_H
