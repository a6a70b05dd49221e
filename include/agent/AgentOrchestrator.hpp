/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_ORCHESTRATOR_HPP
#define AGENT_ORCHESTRATOR_HPP

#include "agent/AgentTypes.hpp"
#include "agent/CognitiveModules.hpp"
#include "core/SimTime.hpp"
#include "memory/AssociativeMemory.hpp"
#include "memory/ScratchMemory.hpp"
#include "memory/SpatialMemory.hpp"
#include <optional>
#include <string>

namespace Smallville {

class WorldGrid;

/**
 * @brief One simulated agent: its memories plus the per-tick cognition pipeline
 *
 * Each tick runs perceive -> retrieve -> plan -> reflect -> execute on the
 * injected cognitive modules and returns the resulting action. The pipeline
 * never branches; a failing module aborts the rest of the tick.
 *
 * Snapshot folder layout:
 *   <folder>/spatial_memory.json
 *   <folder>/associative_memory/nodes.bin
 *   <folder>/scratch.json
 *
 * Not thread-safe. Different agents may tick on different threads.
 */
class AgentOrchestrator {
public:
    static constexpr const char* SPATIAL_MEMORY_FILE = "spatial_memory.json";
    static constexpr const char* ASSOCIATIVE_MEMORY_DIR = "associative_memory";
    static constexpr const char* SCRATCH_FILE = "scratch.json";
    static constexpr const char* BOOTSTRAP_MEMORY_DIR = "bootstrap_memory";

    /**
     * @brief Load an agent from a snapshot folder
     * @throws CorruptSnapshot if any of the three stores cannot be loaded
     * @throws std::invalid_argument if a cognitive module is missing
     */
    AgentOrchestrator(std::string name, const std::string& memoryFolder,
                      CognitiveModules modules);

    /**
     * @brief Build an agent around memory stores that already exist in memory
     * @throws std::invalid_argument if a cognitive module is missing
     */
    AgentOrchestrator(std::string name, SpatialMemory spatial, AssociativeMemory associative,
                      ScratchMemory scratch, CognitiveModules modules);

    AgentOrchestrator(const AgentOrchestrator&) = delete;
    AgentOrchestrator& operator=(const AgentOrchestrator&) = delete;

    /**
     * @brief Advance the agent by one simulation step
     *
     * Position and time are recorded before any module runs and are kept
     * even when the tick fails.
     *
     * @param world Shared world grid, read by the modules
     * @param peers Other agents, for planning and execution
     * @param position Tile the agent stands on
     * @param time Current simulation time
     * @return The executor's action
     * @throws CollaboratorFailure naming the phase that failed
     * @throws std::logic_error if a tick is already running on this agent
     */
    AgentAction tick(const WorldGrid& world, const AgentRoster& peers, TileCoord position,
                     SimTime time);

    /**
     * @brief Write the three stores into a snapshot folder
     *
     * Stores are written independently: a failed store is logged and the
     * remaining ones are still attempted.
     * @return true only if all three were written
     */
    bool save(const std::string& folder) const;

    /**
     * @brief Hand the agent to the conversation engine
     * @throws CollaboratorFailure (phase Conversing) if the engine fails
     * @throws std::logic_error if a tick is running on this agent
     */
    void openConversation(ConversationMode mode);

    /**
     * @brief Day flag for a tick at now, given the time of the previous tick
     */
    static DayFlag dayFlagFor(std::optional<SimTime> previous, SimTime now);

    /**
     * @brief Default snapshot folder of an agent inside a simulation folder:
     *        <simFolder>/personas/<name>/bootstrap_memory
     */
    static std::string memoryFolderFor(const std::string& simFolder, const std::string& name);

    const std::string& name() const { return m_name; }

    AgentWorkingState& workingState() { return m_scratch.workingState(); }
    const AgentWorkingState& workingState() const { return m_scratch.workingState(); }

    SpatialMemory& spatialMemory() { return m_spatial; }
    const SpatialMemory& spatialMemory() const { return m_spatial; }
    AssociativeMemory& associativeMemory() { return m_associative; }
    const AssociativeMemory& associativeMemory() const { return m_associative; }
    ScratchMemory& scratch() { return m_scratch; }
    const ScratchMemory& scratch() const { return m_scratch; }

    TickPhase phase() const { return m_phase; }
    DayFlag lastDayFlag() const { return m_lastDayFlag; }

private:
    template <typename Fn>
    auto runPhase(TickPhase phase, Fn&& fn) -> decltype(fn());

    AgentContext makeContext();

    std::string m_name;
    SpatialMemory m_spatial;
    AssociativeMemory m_associative;
    ScratchMemory m_scratch;
    CognitiveModules m_modules;

    TickPhase m_phase{TickPhase::Idle};
    DayFlag m_lastDayFlag{DayFlag::NoSignal};
};

} // namespace Smallville

#endif // AGENT_ORCHESTRATOR_HPP
