/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Smallville {

/**
 * @brief Malformed or inconsistent world configuration. Fatal at startup.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Tile access outside the grid extents.
 *
 * Programmer error: coordinates are never clamped or wrapped.
 */
class OutOfBounds : public std::out_of_range {
public:
    OutOfBounds(int x, int y, int width, int height);

    int x() const { return m_x; }
    int y() const { return m_y; }

private:
    int m_x;
    int m_y;
};

/**
 * @brief A memory store could not be loaded from its snapshot resource.
 */
class CorruptSnapshot : public std::runtime_error {
public:
    CorruptSnapshot(const std::string& path, const std::string& reason);

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

// Defined in agent/AgentTypes.hpp
enum class TickPhase : uint8_t;

/**
 * @brief A cognitive-module call failed during a tick or a conversation.
 */
class CollaboratorFailure : public std::runtime_error {
public:
    CollaboratorFailure(TickPhase phase, const std::string& message);

    TickPhase phase() const { return m_phase; }

private:
    TickPhase m_phase;
};

} // namespace Smallville

#endif // ERRORS_HPP
