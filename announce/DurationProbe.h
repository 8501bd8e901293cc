/**
 * @file DurationProbe.h
 * @brief Playback duration of an audio artifact via ffprobe
 */

#ifndef REPLAY2PLAYER_DURATION_PROBE_H
#define REPLAY2PLAYER_DURATION_PROBE_H

#include "AnnounceTypes.h"

#include <string>
#include <vector>

class DurationProbe {
public:
    explicit DurationProbe(const std::string& ffprobePath = "ffprobe",
                           double defaultSeconds = AnnounceTiming::DEFAULT_DURATION_SECONDS,
                           unsigned int timeoutMs = AnnounceTiming::PROBE_TIMEOUT_MS);
    virtual ~DurationProbe() = default;

    /**
     * @brief Duration in seconds; false if the tool is missing, times out,
     *        or reports nothing usable
     */
    virtual bool tryProbe(const AudioArtifact& artifact, double& seconds);

    /**
     * @brief Duration in seconds, or the configured default
     */
    double probe(const AudioArtifact& artifact);

    double defaultSeconds() const { return m_defaultSeconds; }

    std::vector<std::string> buildArgs(const std::string& path) const;
    static bool parseDuration(const std::string& output, double& seconds);

private:
    std::string m_ffprobePath;
    double m_defaultSeconds;
    unsigned int m_timeoutMs;
};

#endif // REPLAY2PLAYER_DURATION_PROBE_H
