/**
 * @file globals.cpp
 * @brief Global variable definitions for replay2player
 */

#include "globals.h"

#include <iostream>
#include <mutex>

// Global log level - default INFO
LogLevel g_logLevel = LogLevel::INFO;

namespace {
std::mutex g_logMutex;
}

void logWrite(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level == LogLevel::ERROR) {
        std::cerr << message << std::endl;
    } else if (level == LogLevel::WARN) {
        std::cout << "[WARN] " << message << std::endl;
    } else {
        std::cout << message << std::endl;
    }
}
