/**
 * @file AudioTranscoder.cpp
 * @brief ffmpeg transcoding to MP3 with leading silence, artifact store
 */

#include "AudioTranscoder.h"
#include "ProcessRunner.h"
#include "LogLevel.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

AudioTranscoder::AudioTranscoder(const std::string& ffmpegPath, unsigned int timeoutMs)
    : m_ffmpegPath(ffmpegPath), m_timeoutMs(timeoutMs) {}

std::vector<std::string> AudioTranscoder::buildArgs(const std::string& inputPath,
                                                    const std::string& outputPath,
                                                    int silenceSeconds) const {
    int silenceMs = std::max(0, silenceSeconds) * 1000;

    return {
        m_ffmpegPath,
        "-hide_banner",
        "-loglevel", "error",
        "-i", inputPath,
        "-af", "adelay=" + std::to_string(silenceMs) + ":all=1,aresample=44100",
        "-ar", "44100",
        "-ac", "2",
        "-b:a", "128k",
        "-f", "mp3",
        "-y", outputPath
    };
}

bool AudioTranscoder::transcode(const std::string& inputPath, const std::string& outputPath,
                                int silenceSeconds) {
    std::vector<std::string> args = buildArgs(inputPath, outputPath, silenceSeconds);
    LOG_DEBUG("[Artifact] " << ProcessRunner::formatCommand(args));

    ProcessResult result = ProcessRunner::run(args, m_timeoutMs);
    if (!result.succeeded()) {
        if (!result.started) {
            LOG_ERROR("[Artifact] Cannot run " << m_ffmpegPath);
        } else if (result.timedOut) {
            LOG_ERROR("[Artifact] ffmpeg timed out after " << m_timeoutMs << "ms");
        } else {
            LOG_ERROR("[Artifact] ffmpeg failed (exit " << result.exitCode << "): " << result.output);
        }
        ::unlink(outputPath.c_str());
        return false;
    }

    struct stat st;
    if (::stat(outputPath.c_str(), &st) != 0 || st.st_size == 0) {
        LOG_ERROR("[Artifact] ffmpeg produced no output for " << inputPath);
        return false;
    }

    LOG_INFO("[Artifact] Transcoded " << inputPath << " (" << st.st_size << " bytes, "
             << silenceSeconds << "s silence)");
    return true;
}

std::string AudioTranscoder::contentTypeForPath(const std::string& path) {
    std::string ext = ArtifactStore::extensionOf(path);

    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".wav") return "audio/wav";
    if (ext == ".ogg") return "audio/ogg";
    if (ext == ".webm") return "audio/webm";
    if (ext == ".flac") return "audio/flac";
    if (ext == ".m4a" || ext == ".aac") return "audio/aac";
    return "audio/mpeg";
}

//=============================================================================
// ArtifactStore
//=============================================================================

ArtifactStore::ArtifactStore(const std::string& directory, const std::string& baseUrl)
    : m_directory(directory), m_baseUrl(baseUrl) {
    while (m_directory.size() > 1 && m_directory.back() == '/') m_directory.pop_back();
    while (!m_baseUrl.empty() && m_baseUrl.back() == '/') m_baseUrl.pop_back();
}

bool ArtifactStore::prepare() {
    if (::mkdir(m_directory.c_str(), 0755) == 0 || errno == EEXIST) {
        return true;
    }
    LOG_ERROR("[Artifact] Cannot create " << m_directory << ": " << strerror(errno));
    return false;
}

std::string ArtifactStore::extensionOf(const std::string& path) {
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return std::string();
    }
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string ArtifactStore::makeFileName(const std::string& extension) {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream oss;
    oss << "replay_" << now << "_" << ::getpid() << "_" << m_counter.fetch_add(1)
        << (extension.empty() ? AudioTranscoder::OUTPUT_EXTENSION : extension);
    return oss.str();
}

std::string ArtifactStore::pathFor(const std::string& fileName) const {
    return m_directory + "/" + fileName;
}

std::string ArtifactStore::urlFor(const std::string& fileName) const {
    return m_baseUrl + "/" + fileName;
}

void ArtifactStore::stamp(const std::string& fileName, const std::string& contentType,
                          AudioArtifact& artifact) const {
    artifact.path = pathFor(fileName);
    artifact.url = urlFor(fileName);
    artifact.contentType = contentType;
    artifact.createdAt = std::chrono::system_clock::now();
    artifact.retentionDeadline = artifact.createdAt;
}

bool ArtifactStore::importFile(const std::string& inputPath, AudioArtifact& artifact) {
    std::ifstream in(inputPath, std::ios::binary);
    if (!in) {
        LOG_ERROR("[Artifact] Cannot open " << inputPath);
        return false;
    }
    if (in.peek() == std::ifstream::traits_type::eof()) {
        LOG_ERROR("[Artifact] " << inputPath << " is empty");
        return false;
    }

    std::string fileName = makeFileName(extensionOf(inputPath));
    std::string outputPath = pathFor(fileName);

    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        LOG_ERROR("[Artifact] Cannot write " << outputPath);
        return false;
    }
    out << in.rdbuf();
    out.close();
    if (!out) {
        LOG_ERROR("[Artifact] Copy to " << outputPath << " failed");
        ::unlink(outputPath.c_str());
        return false;
    }

    stamp(fileName, AudioTranscoder::contentTypeForPath(inputPath), artifact);
    LOG_DEBUG("[Artifact] Stored " << inputPath << " as " << artifact.path
              << " (" << artifact.contentType << ")");
    return true;
}

bool ArtifactStore::importTranscoded(const std::string& inputPath, AudioTranscoder& transcoder,
                                     int silenceSeconds, AudioArtifact& artifact) {
    std::string fileName = makeFileName(AudioTranscoder::OUTPUT_EXTENSION);
    if (!transcoder.transcode(inputPath, pathFor(fileName), silenceSeconds)) {
        return false;
    }
    stamp(fileName, AudioTranscoder::OUTPUT_CONTENT_TYPE, artifact);
    return true;
}
