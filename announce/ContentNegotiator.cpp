/**
 * @file ContentNegotiator.cpp
 * @brief Ordered content-type negotiation with playback verification
 */

#include "ContentNegotiator.h"
#include "LogLevel.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

ContentNegotiator::ContentNegotiator(CommandBus& bus, const AnnounceConfig& config)
    : m_bus(bus), m_config(config) {}

std::vector<std::string> ContentNegotiator::buildCandidates(const std::string& declaredType,
                                                            const std::vector<std::string>& alternates) {
    std::vector<std::string> candidates;
    if (!declaredType.empty()) {
        candidates.push_back(declaredType);
    }
    for (const auto& type : alternates) {
        if (type.empty()) continue;
        if (std::find(candidates.begin(), candidates.end(), type) == candidates.end()) {
            candidates.push_back(type);
        }
    }
    return candidates;
}

bool ContentNegotiator::isBusyError(const std::string& error) const {
    std::string lower = toLower(error);
    for (const auto& signature : m_config.busySignatures) {
        if (!signature.empty() && lower.find(toLower(signature)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void ContentNegotiator::waitFor(unsigned int ms) {
    if (ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
}

// Players may rewrite the scheme (x-rincon-mp3radio://host/path)
bool ContentNegotiator::isPlaying(const DeviceState& state, const std::string& url) {
    if (state.playingRef.empty() || url.empty()) return false;
    if (state.playingRef == url) return true;

    size_t scheme = url.find("://");
    std::string location = scheme == std::string::npos ? url : url.substr(scheme + 3);
    return !location.empty() && state.playingRef.find(location) != std::string::npos;
}

// A rejected play on a device the host no longer knows is not a content error
bool ContentNegotiator::stillResolvable(const std::string& deviceId) {
    DeviceState state;
    return m_bus.getState(deviceId, state);
}

FailureKind ContentNegotiator::attempt(const std::string& deviceId, const std::string& url,
                                       const std::string& contentType, NegotiationResult& result) {
    result.playAttempts++;
    LOG_DEBUG("[Negotiator] " << deviceId << ": play as " << contentType
              << " (attempt " << result.playAttempts << ")");

    CommandResult play = m_bus.call(BusAction::MEDIA_PLAYER, BusAction::PLAY_MEDIA, {
        {BusAction::ENTITY_ID, deviceId},
        {BusAction::CONTENT_ID, url},
        {BusAction::CONTENT_TYPE, contentType}
    });

    if (!play.ok) {
        result.error = play.error;
        if (isBusyError(play.error)) {
            LOG_DEBUG("[Negotiator] " << deviceId << ": busy: " << play.error);
            return FailureKind::DEVICE_BUSY;
        }
        if (!stillResolvable(deviceId)) {
            LOG_DEBUG("[Negotiator] " << deviceId << ": gone: " << play.error);
            return FailureKind::DEVICE_UNREACHABLE;
        }
        LOG_DEBUG("[Negotiator] " << deviceId << ": " << contentType << " rejected: " << play.error);
        return FailureKind::UNSUPPORTED_CONTENT;
    }

    // Accepted; the bus may still have ignored it
    waitFor(m_config.verifyGraceMs);

    DeviceState state;
    if (!m_bus.getState(deviceId, state)) {
        result.error = "device no longer resolvable";
        return FailureKind::DEVICE_UNREACHABLE;
    }

    if (!isPlaying(state, url)) {
        result.error = "playback not confirmed (state=" + state.state
                     + ", playing=" + (state.playingRef.empty() ? "-" : state.playingRef) + ")";
        LOG_DEBUG("[Negotiator] " << deviceId << ": " << result.error);
        return FailureKind::NOT_CONFIRMED;
    }

    return FailureKind::NONE;
}

bool ContentNegotiator::correctiveStop(const std::string& deviceId, NegotiationResult& result) {
    result.correctiveStops++;
    CommandResult stop = m_bus.call(BusAction::MEDIA_PLAYER, BusAction::MEDIA_STOP, {
        {BusAction::ENTITY_ID, deviceId}
    });
    if (!stop.ok) {
        LOG_WARN("[Negotiator] " << deviceId << ": corrective stop failed: " << stop.error);
    }
    waitFor(m_config.correctiveGraceMs);
    return stop.ok;
}

NegotiationResult ContentNegotiator::playSingleShot(const std::string& deviceId,
                                                   const std::string& url,
                                                   const std::string& contentType) {
    NegotiationResult result;
    result.playAttempts = 1;

    CommandResult play = m_bus.call(BusAction::MEDIA_PLAYER, BusAction::PLAY_MEDIA, {
        {BusAction::ENTITY_ID, deviceId},
        {BusAction::CONTENT_ID, url},
        {BusAction::CONTENT_TYPE, contentType}
    });

    if (!play.ok) {
        if (isBusyError(play.error)) {
            result.failure = FailureKind::DEVICE_BUSY;
        } else if (!stillResolvable(deviceId)) {
            result.failure = FailureKind::DEVICE_UNREACHABLE;
        } else {
            result.failure = FailureKind::UNSUPPORTED_CONTENT;
        }
        result.error = play.error;
        LOG_ERROR("[Negotiator] " << deviceId << ": play failed: " << play.error);
        return result;
    }

    result.delivered = true;
    result.winningContentType = contentType;
    LOG_INFO("[Negotiator] " << deviceId << ": playing as " << contentType);
    return result;
}

NegotiationResult ContentNegotiator::negotiate(const std::string& deviceId, const std::string& url,
                                               const std::vector<std::string>& candidates) {
    if (candidates.empty()) {
        throw std::invalid_argument("content negotiation needs at least one candidate");
    }

    NegotiationResult result;

    for (size_t i = 0; i < candidates.size(); i++) {
        result.attemptIndex = i;
        bool retried = false;

        while (true) {
            FailureKind failure = attempt(deviceId, url, candidates[i], result);

            if (failure == FailureKind::NONE) {
                result.delivered = true;
                result.winningContentType = candidates[i];
                result.failure = FailureKind::NONE;
                result.error.clear();
                LOG_INFO("[Negotiator] " << deviceId << ": playing as " << candidates[i]
                         << " after " << result.playAttempts << " attempt(s)");
                return result;
            }

            result.failure = failure;

            if (failure == FailureKind::DEVICE_UNREACHABLE) {
                LOG_ERROR("[Negotiator] " << deviceId << ": unreachable, giving up");
                return result;
            }

            if (failure == FailureKind::DEVICE_BUSY && !retried) {
                retried = true;
                correctiveStop(deviceId, result);
                continue;
            }
            break;
        }
    }

    LOG_ERROR("[Negotiator] " << deviceId << ": all " << candidates.size()
              << " content type(s) failed, last error: " << result.error);
    return result;
}
