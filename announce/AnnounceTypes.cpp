/**
 * @file AnnounceTypes.cpp
 * @brief Display names for delivery enums
 */

#include "AnnounceTypes.h"

const char* outcomeName(DeliveryOutcome outcome) {
    switch (outcome) {
        case DeliveryOutcome::PENDING:   return "pending";
        case DeliveryOutcome::DELIVERED: return "delivered";
        case DeliveryOutcome::FAILED:    return "failed";
    }
    return "unknown";
}

const char* failureName(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE:                return "none";
        case FailureKind::DEVICE_BUSY:         return "device busy";
        case FailureKind::UNSUPPORTED_CONTENT: return "unsupported content type";
        case FailureKind::NOT_CONFIRMED:       return "playback not confirmed";
        case FailureKind::DEVICE_UNREACHABLE:  return "device unreachable";
        case FailureKind::NO_TARGETS:          return "no target devices";
        case FailureKind::NO_ARTIFACT:         return "no audio artifact";
        case FailureKind::INTERNAL_ERROR:      return "internal error";
    }
    return "unknown";
}

const char* restorationName(RestorationKind kind) {
    return kind == RestorationKind::VOLUME_RESTORE ? "volume-restore" : "state-restore";
}
