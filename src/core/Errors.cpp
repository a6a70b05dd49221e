/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Errors.hpp"
#include "agent/AgentTypes.hpp"
#include <format>

namespace Smallville {

OutOfBounds::OutOfBounds(int x, int y, int width, int height)
    : std::out_of_range(std::format("Tile ({}, {}) is outside the {}x{} grid",
                                    x, y, width, height)),
      m_x(x), m_y(y) {}

CorruptSnapshot::CorruptSnapshot(const std::string& path,
                                 const std::string& reason)
    : std::runtime_error(std::format("Corrupt snapshot '{}': {}", path, reason)),
      m_path(path) {}

CollaboratorFailure::CollaboratorFailure(TickPhase phase,
                                         const std::string& message)
    : std::runtime_error(std::format("{} failed: {}", toString(phase), message)),
      m_phase(phase) {}

} // namespace Smallville
