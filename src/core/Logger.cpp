/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <format>
#include <fstream>

namespace Smallville {
namespace {

namespace fs = std::filesystem;

constexpr const char* LOG_FILE_NAME = "smallville.log";
constexpr const char* ROTATED_LOG_FILE_NAME = "smallville.previous.log";
constexpr std::uintmax_t MAX_LOG_BYTES = 1024 * 1024;

// Opened on the first release-mode message; guarded by the logger mutex
struct ReleaseLogSink {
    std::ofstream stream;
    bool opened = false;
};

ReleaseLogSink& sink() {
    static ReleaseLogSink instance;
    return instance;
}

// One previous log is kept; an oversized log moves aside at startup
void rotateIfOversized(const fs::path& logFile) {
    std::error_code ec;
    const auto size = fs::file_size(logFile, ec);
    if (ec || size < MAX_LOG_BYTES) {
        return;
    }
    fs::rename(logFile, logFile.parent_path() / ROTATED_LOG_FILE_NAME, ec);
}

void openSink(ReleaseLogSink& target) {
    target.opened = true;

    // SMALLVILLE_APP_NAME comes from ${PROJECT_NAME}
    char* prefPath = SDL_GetPrefPath("Smallville", SMALLVILLE_APP_NAME);
    if (prefPath == nullptr) {
        return;
    }
    const fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
        return;
    }

    const fs::path logFile = logDir / LOG_FILE_NAME;
    rotateIfOversized(logFile);
    target.stream.open(logFile, std::ios::out | std::ios::app);
}

[[maybe_unused]] void writeToFile(LogLevel level, const char* system, const char* message) {
    ReleaseLogSink& target = sink();
    if (!target.opened) {
        openSink(target);
    }

    if (!target.stream.is_open()) {
        std::fprintf(stderr, "Smallville - [%s] %s: %s\n", system, getLevelString(level),
                     message);
        return;
    }

    // Only CRITICAL and ERROR reach the file, so every line is flushed
    const auto now =
        std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    target.stream << std::format("{:%F %T} [{}] [{}] {}\n", now, getLevelString(level), system,
                                 message)
                  << std::flush;
}

} // anonymous namespace

const char* getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::CRITICAL: return "CRITICAL";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG_LEVEL: return "DEBUG";
    }
    return "UNKNOWN";
}

void Logger::Log(LogLevel level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
#ifdef DEBUG
    std::printf("Smallville - [%s] %s: %s\n", system, getLevelString(level), message);
    std::fflush(stdout);
#else
    writeToFile(level, system, message);
#endif
}

} // namespace Smallville
