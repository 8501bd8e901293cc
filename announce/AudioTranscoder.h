/**
 * @file AudioTranscoder.h
 * @brief ffmpeg transcoding to MP3 with leading silence, artifact store
 *
 * Some players clip the first seconds of a freshly started stream, so
 * recordings are re-encoded with a configurable amount of silence in front.
 */

#ifndef REPLAY2PLAYER_AUDIO_TRANSCODER_H
#define REPLAY2PLAYER_AUDIO_TRANSCODER_H

#include "AnnounceTypes.h"

#include <atomic>
#include <string>
#include <vector>

class AudioTranscoder {
public:
    static constexpr const char* OUTPUT_CONTENT_TYPE = "audio/mpeg";
    static constexpr const char* OUTPUT_EXTENSION = ".mp3";

    explicit AudioTranscoder(const std::string& ffmpegPath = "ffmpeg",
                             unsigned int timeoutMs = AnnounceTiming::TRANSCODE_TIMEOUT_MS);

    std::vector<std::string> buildArgs(const std::string& inputPath,
                                       const std::string& outputPath,
                                       int silenceSeconds) const;

    bool transcode(const std::string& inputPath, const std::string& outputPath,
                   int silenceSeconds);

    /**
     * @brief Content type from the file extension; audio/mpeg if unknown
     */
    static std::string contentTypeForPath(const std::string& path);

private:
    std::string m_ffmpegPath;
    unsigned int m_timeoutMs;
};

//=============================================================================
// ArtifactStore - directory served to the players under a base URL
//=============================================================================

class ArtifactStore {
public:
    ArtifactStore(const std::string& directory, const std::string& baseUrl);

    /**
     * @brief Create the store directory if needed
     */
    bool prepare();

    /**
     * @brief Copy inputPath into the store, type inferred from its extension
     */
    bool importFile(const std::string& inputPath, AudioArtifact& artifact);

    /**
     * @brief Transcode inputPath into the store as MP3
     */
    bool importTranscoded(const std::string& inputPath, AudioTranscoder& transcoder,
                          int silenceSeconds, AudioArtifact& artifact);

    std::string makeFileName(const std::string& extension);
    std::string pathFor(const std::string& fileName) const;
    std::string urlFor(const std::string& fileName) const;

    static std::string extensionOf(const std::string& path);

private:
    void stamp(const std::string& fileName, const std::string& contentType,
               AudioArtifact& artifact) const;

    std::string m_directory;
    std::string m_baseUrl;
    std::atomic<unsigned int> m_counter{0};
};

#endif // REPLAY2PLAYER_AUDIO_TRANSCODER_H
