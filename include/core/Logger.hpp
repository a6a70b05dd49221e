/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace Smallville {

// ERROR_LEVEL/DEBUG_LEVEL avoid clashing with platform ERROR/DEBUG macros
enum class LogLevel : uint8_t { CRITICAL, ERROR_LEVEL, WARNING, INFO, DEBUG_LEVEL };

const char* getLevelString(LogLevel level);

/**
 * Process-wide log sink.
 *
 * Debug builds (DEBUG defined) print every level to stdout. Release builds
 * only ever see CRITICAL and ERROR, which go to smallville.log in the SDL
 * preference directory, or to stderr when that cannot be opened. Benchmark
 * mode drops everything.
 */
class Logger {
public:
    static void Log(LogLevel level, const char* system, const char* message);
    static void Log(LogLevel level, const char* system, const std::string& message) {
        Log(level, system, message.c_str());
    }

    static void SetBenchmarkMode(bool enabled) {
        s_benchmarkMode.store(enabled, std::memory_order_relaxed);
    }
    static bool IsBenchmarkMode() { return s_benchmarkMode.load(std::memory_order_relaxed); }

private:
    static inline std::atomic<bool> s_benchmarkMode{false};
    static inline std::mutex s_logMutex;
};

} // namespace Smallville

#define SMALLVILLE_LOG_AT(level, system, msg)                                  \
    Smallville::Logger::Log(Smallville::LogLevel::level, system, msg)

#define SMALLVILLE_CRITICAL(system, msg) SMALLVILLE_LOG_AT(CRITICAL, system, msg)
#define SMALLVILLE_ERROR(system, msg) SMALLVILLE_LOG_AT(ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define SMALLVILLE_WARN(system, msg) SMALLVILLE_LOG_AT(WARNING, system, msg)
#define SMALLVILLE_INFO(system, msg) SMALLVILLE_LOG_AT(INFO, system, msg)
#define SMALLVILLE_DEBUG(system, msg) SMALLVILLE_LOG_AT(DEBUG_LEVEL, system, msg)
#else
#define SMALLVILLE_WARN(system, msg) ((void)0)
#define SMALLVILLE_INFO(system, msg) ((void)0)
#define SMALLVILLE_DEBUG(system, msg) ((void)0)
#endif

#define WORLD_GRID_CRITICAL(msg) SMALLVILLE_CRITICAL("WorldGrid", msg)
#define WORLD_GRID_ERROR(msg) SMALLVILLE_ERROR("WorldGrid", msg)
#define WORLD_GRID_WARN(msg) SMALLVILLE_WARN("WorldGrid", msg)
#define WORLD_GRID_INFO(msg) SMALLVILLE_INFO("WorldGrid", msg)
#define WORLD_GRID_DEBUG(msg) SMALLVILLE_DEBUG("WorldGrid", msg)

#define WORLD_CONFIG_CRITICAL(msg) SMALLVILLE_CRITICAL("WorldConfigLoader", msg)
#define WORLD_CONFIG_ERROR(msg) SMALLVILLE_ERROR("WorldConfigLoader", msg)
#define WORLD_CONFIG_WARN(msg) SMALLVILLE_WARN("WorldConfigLoader", msg)
#define WORLD_CONFIG_INFO(msg) SMALLVILLE_INFO("WorldConfigLoader", msg)
#define WORLD_CONFIG_DEBUG(msg) SMALLVILLE_DEBUG("WorldConfigLoader", msg)

#define ORCHESTRATOR_CRITICAL(msg) SMALLVILLE_CRITICAL("AgentOrchestrator", msg)
#define ORCHESTRATOR_ERROR(msg) SMALLVILLE_ERROR("AgentOrchestrator", msg)
#define ORCHESTRATOR_WARN(msg) SMALLVILLE_WARN("AgentOrchestrator", msg)
#define ORCHESTRATOR_INFO(msg) SMALLVILLE_INFO("AgentOrchestrator", msg)
#define ORCHESTRATOR_DEBUG(msg) SMALLVILLE_DEBUG("AgentOrchestrator", msg)

#define MEMORY_CRITICAL(msg) SMALLVILLE_CRITICAL("MemoryStore", msg)
#define MEMORY_ERROR(msg) SMALLVILLE_ERROR("MemoryStore", msg)
#define MEMORY_WARN(msg) SMALLVILLE_WARN("MemoryStore", msg)
#define MEMORY_INFO(msg) SMALLVILLE_INFO("MemoryStore", msg)
#define MEMORY_DEBUG(msg) SMALLVILLE_DEBUG("MemoryStore", msg)

#define SERIAL_CRITICAL(msg) SMALLVILLE_CRITICAL("BinarySerializer", msg)
#define SERIAL_ERROR(msg) SMALLVILLE_ERROR("BinarySerializer", msg)
#define SERIAL_WARN(msg) SMALLVILLE_WARN("BinarySerializer", msg)
#define SERIAL_INFO(msg) SMALLVILLE_INFO("BinarySerializer", msg)
#define SERIAL_DEBUG(msg) SMALLVILLE_DEBUG("BinarySerializer", msg)

#define SMALLVILLE_ENABLE_BENCHMARK_MODE() Smallville::Logger::SetBenchmarkMode(true)
#define SMALLVILLE_DISABLE_BENCHMARK_MODE() Smallville::Logger::SetBenchmarkMode(false)

#endif // LOGGER_HPP
