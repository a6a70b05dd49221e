/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCRATCH_MEMORY_HPP
#define SCRATCH_MEMORY_HPP

#include "core/SimTime.hpp"
#include "utils/JsonReader.hpp"
#include "world/WorldData.hpp"
#include <optional>
#include <string>

namespace Smallville {

/**
 * @brief Tick-scoped agent state
 *
 * currentTile and currentTime are owned by the orchestrator. plannerState
 * belongs to the planner/executor and is carried through save/load untouched.
 */
struct AgentWorkingState {
    std::optional<TileCoord> currentTile;
    std::optional<SimTime> currentTime;
    JsonObject plannerState;
};

/**
 * @brief Short-term ("scratch") memory store, persisted as scratch.json
 *
 * The file is a flat JSON object. Keys this class understands are listed
 * below; every other key belongs to the planner/executor and round-trips
 * through AgentWorkingState::plannerState.
 *
 *   "name"          agent name
 *   "vision_r"      perception radius in tiles
 *   "att_bandwidth" how many perceived events the agent attends to per tick
 *   "retention"     how many recent events are considered already known
 *   "curr_tile"     [x, y] or null
 *   "curr_time"     "February 13, 2023, 14:05:00" or null
 */
class ScratchMemory {
public:
    static constexpr int DEFAULT_VISION_RADIUS = 4;
    static constexpr int DEFAULT_ATTENTION_BANDWIDTH = 3;
    static constexpr int DEFAULT_RETENTION = 5;

    explicit ScratchMemory(std::string name = {}) : m_name(std::move(name)) {}

    /**
     * @throws CorruptSnapshot if the file is missing or malformed
     */
    static ScratchMemory load(const std::string& path);

    bool save(const std::string& path) const;

    const std::string& name() const { return m_name; }

    int visionRadius() const { return m_visionRadius; }
    void setVisionRadius(int radius) { m_visionRadius = radius; }
    int attentionBandwidth() const { return m_attentionBandwidth; }
    void setAttentionBandwidth(int bandwidth) { m_attentionBandwidth = bandwidth; }
    int retention() const { return m_retention; }
    void setRetention(int retention) { m_retention = retention; }

    AgentWorkingState& workingState() { return m_state; }
    const AgentWorkingState& workingState() const { return m_state; }

private:
    std::string m_name;
    int m_visionRadius{DEFAULT_VISION_RADIUS};
    int m_attentionBandwidth{DEFAULT_ATTENTION_BANDWIDTH};
    int m_retention{DEFAULT_RETENTION};
    AgentWorkingState m_state;
};

} // namespace Smallville

#endif // SCRATCH_MEMORY_HPP
