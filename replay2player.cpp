/**
 * @file replay2player.cpp
 * @brief Announce a recorded or synthesized audio file on playback devices
 *
 * Flow:
 *   input file -> (ffmpeg, prepended silence) -> artifact store
 *     -> DeliveryOrchestrator -> command bus helper -> players
 *
 * Volume and player state are restored by deferred tasks once the
 * announcement is expected to have finished; the artifact is deleted after
 * the retention window. The process stays up until those tasks have run.
 */

#include "AnnounceTypes.h"
#include "ArtifactManager.h"
#include "AudioTranscoder.h"
#include "DeliveryOrchestrator.h"
#include "DurationProbe.h"
#include "ProcessCommandBus.h"
#include "TaskScheduler.h"
#include "globals.h"

#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <signal.h>
#include <string>

// Version
#define REPLAY2PLAYER_VERSION "1.0.0"

// ================================================================
// Global state
// ================================================================
static std::atomic<bool> running{true};

// Signal handler: abandon pending restorations and deletions
void signal_handler(int /*sig*/) {
    running = false;
}

// ================================================================
// Configuration
// ================================================================
struct Config {
    // Request
    std::string input_path = "";
    std::string target = "";
    bool tts = false;
    std::string content_type = "";           // override, else inferred
    bool boost = AnnounceDefaults::VOLUME_BOOST_ENABLED;
    float boost_amount = AnnounceDefaults::VOLUME_BOOST_AMOUNT;

    // Artifact store
    std::string media_dir = "/tmp/replay2player";
    std::string media_url = "";
    unsigned int retention = AnnounceTiming::ARTIFACT_RETENTION_SECONDS;

    // Tools
    std::string bus_path = "replay2player-bus";
    std::string ffprobe_path = "ffprobe";
    std::string ffmpeg_path = "ffmpeg";
    int transcode = -1;                      // -1 = by source kind
    int prepend_silence = AnnounceDefaults::PREPEND_SILENCE_SECONDS;

    // Other
    bool verbose = false;
    bool quiet = false;
};

void print_usage(const char* prog) {
    std::cout << "replay2player v" << REPLAY2PLAYER_VERSION << std::endl;
    std::cout << "Voice announcements on media players" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << prog << " [options] -t <target> <audio file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Request Options:" << std::endl;
    std::cout << "  -t, --target <id>       Device or group id" << std::endl;
    std::cout << "  --tts                   Input is synthesized speech (default: recording)" << std::endl;
    std::cout << "  --content-type <type>   Declared content type (default: from file)" << std::endl;
    std::cout << "  --boost <0..1>          Volume boost amount (default: 0.1)" << std::endl;
    std::cout << "  --no-boost              Leave the volume alone" << std::endl;
    std::cout << std::endl;
    std::cout << "Artifact Options:" << std::endl;
    std::cout << "  --media-dir <dir>       Artifact store directory (default: /tmp/replay2player)" << std::endl;
    std::cout << "  --media-url <url>       Base URL of the artifact store (required)" << std::endl;
    std::cout << "  --retention <seconds>   Delete artifacts after (default: 300)" << std::endl;
    std::cout << "  --no-transcode          Copy the input as is" << std::endl;
    std::cout << "  --transcode             Transcode even synthesized speech" << std::endl;
    std::cout << "  --prepend-silence <s>   Leading silence, 0..10 seconds (default: 3)" << std::endl;
    std::cout << std::endl;
    std::cout << "Tools:" << std::endl;
    std::cout << "  --bus <path>            Command bus helper (default: replay2player-bus)" << std::endl;
    std::cout << "  --ffprobe <path>        ffprobe binary (default: ffprobe)" << std::endl;
    std::cout << "  --ffmpeg <path>         ffmpeg binary (default: ffmpeg)" << std::endl;
    std::cout << std::endl;
    std::cout << "Other:" << std::endl;
    std::cout << "  -v                      Verbose output (debug level)" << std::endl;
    std::cout << "  -q, --quiet             Quiet mode (warnings and errors only)" << std::endl;
    std::cout << "  -h, --help              Show this help" << std::endl;
    std::cout << std::endl;
    std::cout << "Exit status: 0 delivered, 2 delivery failed, 1 usage error" << std::endl;
    std::cout << std::endl;
}

static void usage_error(const std::string& message) {
    LOG_ERROR(message);
    LOG_ERROR("Use -h for help.");
    exit(1);
}

static double parse_number(const std::string& option, const std::string& value,
                           double min, double max) {
    char* end = nullptr;
    double number = std::strtod(value.c_str(), &end);
    if (value.empty() || *end != '\0' || number < min || number > max) {
        usage_error("Invalid value for " + option + ": " + value);
    }
    return number;
}

Config parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            exit(0);
        }
        else if (arg == "-v") {
            config.verbose = true;
        }
        else if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        }
        else if (arg == "--tts") {
            config.tts = true;
        }
        else if (arg == "--no-boost") {
            config.boost = false;
        }
        else if (arg == "--no-transcode") {
            config.transcode = 0;
        }
        else if (arg == "--transcode") {
            config.transcode = 1;
        }
        else if ((arg == "-t" || arg == "--target" || arg == "--content-type" ||
                  arg == "--bus" || arg == "--media-dir" || arg == "--media-url" ||
                  arg == "--ffprobe" || arg == "--ffmpeg") && i + 1 < argc) {
            std::string value = argv[++i];

            if (arg == "-t" || arg == "--target") config.target = value;
            else if (arg == "--content-type") config.content_type = value;
            else if (arg == "--bus") config.bus_path = value;
            else if (arg == "--media-dir") config.media_dir = value;
            else if (arg == "--media-url") config.media_url = value;
            else if (arg == "--ffprobe") config.ffprobe_path = value;
            else if (arg == "--ffmpeg") config.ffmpeg_path = value;
        }
        else if (arg == "--boost" && i + 1 < argc) {
            config.boost_amount = static_cast<float>(parse_number(arg, argv[++i], 0.0, 1.0));
            config.boost = true;
        }
        else if (arg == "--retention" && i + 1 < argc) {
            config.retention = static_cast<unsigned int>(parse_number(arg, argv[++i], 1.0, 86400.0));
        }
        else if (arg == "--prepend-silence" && i + 1 < argc) {
            config.prepend_silence = static_cast<int>(parse_number(
                arg, argv[++i], 0.0, AnnounceDefaults::PREPEND_SILENCE_MAX_SECONDS));
        }
        else if (!arg.empty() && arg[0] == '-') {
            usage_error("Unknown or incomplete option: " + arg);
        }
        else if (config.input_path.empty()) {
            config.input_path = arg;
        }
        else {
            usage_error("Unexpected argument: " + arg);
        }
    }

    return config;
}

static void print_report(const DeliveryReport& report) {
    std::cout << std::endl;
    for (const auto& device : report.devices) {
        std::cout << "  " << std::left << std::setw(32) << device.deviceId
                  << std::setw(10) << outcomeName(device.outcome);
        if (device.outcome == DeliveryOutcome::DELIVERED) {
            std::cout << " as " << device.winningContentType
                      << " (" << device.playAttempts << " attempt(s))";
        } else {
            std::cout << " " << failureName(device.failure);
            if (!device.error.empty()) std::cout << ": " << device.error;
        }
        for (const auto& task : device.restorations) {
            std::cout << " [" << restorationName(task.kind) << "]";
        }
        std::cout << std::endl;
    }
    std::cout << std::endl;
}

// ================================================================
// Main
// ================================================================
int main(int argc, char* argv[]) {

    Config config = parse_args(argc, argv);

    if (config.verbose) {
        g_logLevel = LogLevel::DEBUG;
    } else if (config.quiet) {
        g_logLevel = LogLevel::WARN;
    }

    if (config.input_path.empty()) usage_error("No audio file given");
    if (config.target.empty()) usage_error("No target given (-t)");
    if (config.media_url.empty()) usage_error("No artifact store URL given (--media-url)");

    LOG_INFO("replay2player v" << REPLAY2PLAYER_VERSION);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    DeferredTaskScheduler scheduler;
    ArtifactLifecycleManager artifacts(scheduler);

    // Resolve the artifact
    ArtifactStore store(config.media_dir, config.media_url);
    bool transcode = config.transcode < 0 ? !config.tts : config.transcode == 1;

    AnnouncementRequest request;
    request.sourceKind = config.tts ? SourceKind::SYNTHESIZED_SPEECH : SourceKind::RECORDING;
    request.targetId = config.target;
    request.options.volumeBoostEnabled = config.boost;
    request.options.volumeBoostAmount = config.boost_amount;

    bool stored = store.prepare();
    if (stored && transcode) {
        AudioTranscoder transcoder(config.ffmpeg_path);
        stored = store.importTranscoded(config.input_path, transcoder, config.prepend_silence,
                                        request.artifact);
    } else if (stored) {
        stored = store.importFile(config.input_path, request.artifact);
    }

    if (stored) {
        if (!config.content_type.empty()) {
            request.artifact.contentType = config.content_type;
        }
        artifacts.track(request.artifact, config.retention);
    } else {
        LOG_ERROR("No audio artifact for " << config.input_path);
        request.artifact = AudioArtifact();
    }

    // Deliver
    AnnounceConfig announceConfig;
    announceConfig.retentionSeconds = config.retention;

    ProcessCommandBus bus(config.bus_path);
    DurationProbe probe(config.ffprobe_path);
    DeliveryOrchestrator orchestrator(bus, scheduler, probe, announceConfig);

    DeliveryReport report = orchestrator.deliver(request);
    print_report(report);

    if (report.success) {
        LOG_INFO("Delivered to " << report.deliveredCount() << "/" << report.devices.size()
                 << " device(s)");
    } else {
        LOG_ERROR("Announcement failed: " << failureName(report.failure)
                  << (report.error.empty() ? "" : " (" + report.error + ")"));
    }

    // Deferred restorations and artifact deletion
    if (scheduler.pendingCount() > 0) {
        LOG_INFO("Waiting for " << scheduler.pendingCount() << " deferred task(s)...");
    }
    while (running && !scheduler.waitUntilIdle(200)) {
    }
    if (!running) {
        LOG_WARN("Interrupted, abandoning " << scheduler.pendingCount() << " deferred task(s)");
    }
    scheduler.stop();

    LOG_INFO("Stopped");
    return report.success ? 0 : 2;
}
