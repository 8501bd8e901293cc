/**
 * @file ContentNegotiator.h
 * @brief Ordered content-type negotiation with playback verification
 *
 * For each candidate content type, in order:
 *   play -> wait verify grace -> read state -> playing ref == url ?
 *
 * An explicit play error moves to the next candidate, except when the error
 * looks like a busy/transitioning transport: then the device is stopped,
 * given the corrective grace, and the same candidate is retried once.
 * A play that is accepted but never shows up in the reported state counts
 * as a failed candidate. A device that stops resolving ends negotiation.
 */

#ifndef REPLAY2PLAYER_CONTENT_NEGOTIATOR_H
#define REPLAY2PLAYER_CONTENT_NEGOTIATOR_H

#include "AnnounceTypes.h"
#include "CommandBus.h"

#include <string>
#include <vector>

struct NegotiationResult {
    bool delivered = false;
    std::string winningContentType;     // diagnostics only, never cached
    size_t attemptIndex = 0;            // index of the last candidate tried
    int playAttempts = 0;
    int correctiveStops = 0;
    FailureKind failure = FailureKind::NONE;   // last failure seen
    std::string error;
};

class ContentNegotiator {
public:
    ContentNegotiator(CommandBus& bus, const AnnounceConfig& config);
    virtual ~ContentNegotiator() = default;

    /**
     * @brief Declared type first, then the alternates, without duplicates
     */
    static std::vector<std::string> buildCandidates(const std::string& declaredType,
                                                    const std::vector<std::string>& alternates);

    /**
     * @brief Play url on deviceId, trying candidates in order
     * @throws std::invalid_argument if candidates is empty
     */
    NegotiationResult negotiate(const std::string& deviceId, const std::string& url,
                                const std::vector<std::string>& candidates);

    /**
     * @brief Standard devices: one play command, accepted means delivered
     */
    NegotiationResult playSingleShot(const std::string& deviceId, const std::string& url,
                                     const std::string& contentType);

    bool isBusyError(const std::string& error) const;

protected:
    // Timed suspension between play and verification / stop and retry
    virtual void waitFor(unsigned int ms);

private:
    FailureKind attempt(const std::string& deviceId, const std::string& url,
                        const std::string& contentType, NegotiationResult& result);
    bool correctiveStop(const std::string& deviceId, NegotiationResult& result);
    bool stillResolvable(const std::string& deviceId);
    static bool isPlaying(const DeviceState& state, const std::string& url);

    CommandBus& m_bus;
    AnnounceConfig m_config;
};

#endif // REPLAY2PLAYER_CONTENT_NEGOTIATOR_H
