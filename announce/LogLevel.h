/**
 * @file LogLevel.h
 * @brief Log levels and logging macros for replay2player
 *
 * ERROR, WARN, INFO, DEBUG filtered at runtime through g_logLevel, removed
 * entirely in NOLOG builds. Each message is formatted first and written as
 * one line, so output from concurrent device threads does not interleave.
 *
 * Usage:
 *   LOG_ERROR("[Orchestrator] " << deviceId << ": " << error);
 *   LOG_WARN("[Volume] restore failed for " << deviceId);
 *   LOG_INFO("Delivered to " << n << " device(s)");
 *   LOG_DEBUG("[Negotiator] play as " << contentType);
 */

#ifndef REPLAY2PLAYER_LOGLEVEL_H
#define REPLAY2PLAYER_LOGLEVEL_H

#include <sstream>
#include <string>

enum class LogLevel { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3 };

extern LogLevel g_logLevel;

// ERROR goes to stderr, everything else to stdout; WARN lines are tagged
void logWrite(LogLevel level, const std::string& message);

#ifdef NOLOG
#define LOG_ERROR(x) do {} while(0)
#define LOG_WARN(x)  do {} while(0)
#define LOG_INFO(x)  do {} while(0)
#define LOG_DEBUG(x) do {} while(0)
#else
#define REPLAY2PLAYER_LOG(level, x) do { \
    if (g_logLevel >= (level)) { \
        std::ostringstream log_line_; \
        log_line_ << x; \
        logWrite((level), log_line_.str()); \
    } \
} while(0)
#define LOG_ERROR(x) REPLAY2PLAYER_LOG(LogLevel::ERROR, x)
#define LOG_WARN(x)  REPLAY2PLAYER_LOG(LogLevel::WARN, x)
#define LOG_INFO(x)  REPLAY2PLAYER_LOG(LogLevel::INFO, x)
#define LOG_DEBUG(x) REPLAY2PLAYER_LOG(LogLevel::DEBUG, x)
#endif

#endif // REPLAY2PLAYER_LOGLEVEL_H
