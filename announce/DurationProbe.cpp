/**
 * @file DurationProbe.cpp
 * @brief Playback duration of an audio artifact via ffprobe
 */

#include "DurationProbe.h"
#include "ProcessRunner.h"
#include "LogLevel.h"

#include <cmath>
#include <cstdlib>
#include <sstream>

DurationProbe::DurationProbe(const std::string& ffprobePath, double defaultSeconds,
                             unsigned int timeoutMs)
    : m_ffprobePath(ffprobePath), m_defaultSeconds(defaultSeconds), m_timeoutMs(timeoutMs) {}

std::vector<std::string> DurationProbe::buildArgs(const std::string& path) const {
    return {
        m_ffprobePath,
        "-v", "error",
        "-show_entries", "format=duration",
        "-of", "default=noprint_wrappers=1:nokey=1",
        path
    };
}

bool DurationProbe::parseDuration(const std::string& output, double& seconds) {
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        const char* begin = line.c_str();
        char* end = nullptr;
        double value = std::strtod(begin, &end);
        if (end == begin) continue;  // "N/A" or a diagnostic line
        if (!std::isfinite(value) || value <= 0.0) return false;
        seconds = value;
        return true;
    }
    return false;
}

bool DurationProbe::tryProbe(const AudioArtifact& artifact, double& seconds) {
    if (artifact.path.empty()) {
        return false;
    }

    ProcessResult result = ProcessRunner::run(buildArgs(artifact.path), m_timeoutMs);
    if (!result.succeeded()) {
        LOG_WARN("[Probe] ffprobe failed for " << artifact.path
                 << (result.timedOut ? " (timeout)" : "")
                 << (result.started ? "" : " (not executable)"));
        return false;
    }

    if (!parseDuration(result.output, seconds)) {
        LOG_WARN("[Probe] No usable duration for " << artifact.path);
        return false;
    }

    LOG_DEBUG("[Probe] " << artifact.path << " = " << seconds << "s");
    return true;
}

double DurationProbe::probe(const AudioArtifact& artifact) {
    double seconds = 0.0;
    if (tryProbe(artifact, seconds)) {
        return seconds;
    }
    return m_defaultSeconds;
}
