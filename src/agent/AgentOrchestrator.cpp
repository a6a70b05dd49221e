/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "agent/AgentOrchestrator.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "world/WorldGrid.hpp"
#include <filesystem>
#include <format>
#include <stdexcept>

namespace Smallville {

namespace {

// Puts the orchestrator back to Idle however the pipeline is left
class PhaseGuard {
public:
    explicit PhaseGuard(TickPhase& phase) : m_phase(phase) {}
    ~PhaseGuard() { m_phase = TickPhase::Idle; }

    PhaseGuard(const PhaseGuard&) = delete;
    PhaseGuard& operator=(const PhaseGuard&) = delete;

private:
    TickPhase& m_phase;
};

std::string joinPath(const std::string& folder, const char* entry) {
    return (std::filesystem::path(folder) / entry).string();
}

CognitiveModules requireComplete(CognitiveModules modules, const std::string& name) {
    if (!modules.isComplete()) {
        ORCHESTRATOR_ERROR("Agent '" + name + "' is missing a cognitive module");
        throw std::invalid_argument("Agent '" + name + "' requires all six cognitive modules");
    }
    return modules;
}

} // anonymous namespace

AgentOrchestrator::AgentOrchestrator(std::string name, const std::string& memoryFolder,
                                     CognitiveModules modules)
    : m_name(std::move(name)),
      m_spatial(SpatialMemory::load(joinPath(memoryFolder, SPATIAL_MEMORY_FILE))),
      m_associative(AssociativeMemory::load(joinPath(memoryFolder, ASSOCIATIVE_MEMORY_DIR))),
      m_scratch(ScratchMemory::load(joinPath(memoryFolder, SCRATCH_FILE))),
      m_modules(requireComplete(std::move(modules), m_name)) {
    if (m_scratch.name() != m_name) {
        ORCHESTRATOR_WARN(std::format("Scratch memory in {} belongs to '{}', loading it for '{}'",
                                      memoryFolder, m_scratch.name(), m_name));
    }
    ORCHESTRATOR_INFO(std::format("Loaded agent '{}' from {} ({} memory nodes)", m_name,
                                  memoryFolder, m_associative.size()));
}

AgentOrchestrator::AgentOrchestrator(std::string name, SpatialMemory spatial,
                                     AssociativeMemory associative, ScratchMemory scratch,
                                     CognitiveModules modules)
    : m_name(std::move(name)),
      m_spatial(std::move(spatial)),
      m_associative(std::move(associative)),
      m_scratch(std::move(scratch)),
      m_modules(requireComplete(std::move(modules), m_name)) {
    ORCHESTRATOR_DEBUG("Created agent '" + m_name + "'");
}

template <typename Fn>
auto AgentOrchestrator::runPhase(TickPhase phase, Fn&& fn) -> decltype(fn()) {
    m_phase = phase;
    ORCHESTRATOR_DEBUG(std::format("'{}' {}", m_name, toString(phase)));
    try {
        return fn();
    } catch (const CollaboratorFailure& e) {
        ORCHESTRATOR_ERROR(std::format("'{}' {}: {}", m_name, toString(phase), e.what()));
        throw;
    } catch (const std::exception& e) {
        ORCHESTRATOR_ERROR(std::format("'{}' {}: {}", m_name, toString(phase), e.what()));
        throw CollaboratorFailure(phase, e.what());
    }
}

AgentContext AgentOrchestrator::makeContext() {
    return AgentContext(m_name, m_scratch, m_spatial, m_associative);
}

AgentAction AgentOrchestrator::tick(const WorldGrid& world, const AgentRoster& peers,
                                    TileCoord position, SimTime time) {
    if (m_phase != TickPhase::Idle) {
        throw std::logic_error(std::format("Agent '{}' is already in phase {}", m_name,
                                           toString(m_phase)));
    }

    // Recorded up front and never rolled back
    AgentWorkingState& state = m_scratch.workingState();
    state.currentTile = position;
    const DayFlag dayFlag = dayFlagFor(state.currentTime, time);
    state.currentTime = time;
    m_lastDayFlag = dayFlag;

    if (dayFlag != DayFlag::NoSignal) {
        ORCHESTRATOR_INFO(std::format("'{}' {} at {}", m_name, toString(dayFlag),
                                      formatSimTime(time)));
    }

    PhaseGuard guard(m_phase);
    AgentContext agent = makeContext();

    const PerceivedEvents perceived = runPhase(TickPhase::Perceiving, [&] {
        return m_modules.perceiver->perceive(agent, world);
    });

    const RetrievedMemories retrieved = runPhase(TickPhase::Retrieving, [&] {
        return m_modules.retriever->retrieve(agent, perceived);
    });

    const Plan plan = runPhase(TickPhase::Planning, [&] {
        return m_modules.planner->plan(agent, world, peers, dayFlag, retrieved);
    });

    runPhase(TickPhase::Reflecting, [&] { m_modules.reflector->reflect(agent); });

    return runPhase(TickPhase::Executing, [&] {
        return m_modules.executor->execute(agent, world, peers, plan);
    });
}

bool AgentOrchestrator::save(const std::string& folder) const {
    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec) {
        ORCHESTRATOR_ERROR("Failed to create snapshot folder " + folder + ": " + ec.message());
        return false;
    }

    bool success = true;
    if (!m_spatial.save(joinPath(folder, SPATIAL_MEMORY_FILE))) {
        ORCHESTRATOR_ERROR("'" + m_name + "' spatial memory was not saved");
        success = false;
    }
    if (!m_associative.save(joinPath(folder, ASSOCIATIVE_MEMORY_DIR))) {
        ORCHESTRATOR_ERROR("'" + m_name + "' associative memory was not saved");
        success = false;
    }
    if (!m_scratch.save(joinPath(folder, SCRATCH_FILE))) {
        ORCHESTRATOR_ERROR("'" + m_name + "' scratch memory was not saved");
        success = false;
    }

    if (success) {
        ORCHESTRATOR_INFO("Saved agent '" + m_name + "' to " + folder);
    }
    return success;
}

void AgentOrchestrator::openConversation(ConversationMode mode) {
    if (m_phase != TickPhase::Idle) {
        throw std::logic_error(std::format("Agent '{}' is busy in phase {}", m_name,
                                           toString(m_phase)));
    }

    PhaseGuard guard(m_phase);
    AgentContext agent = makeContext();
    runPhase(TickPhase::Conversing, [&] { m_modules.conversation->converse(agent, mode); });
}

DayFlag AgentOrchestrator::dayFlagFor(std::optional<SimTime> previous, SimTime now) {
    if (!previous) {
        return DayFlag::FirstDay;
    }
    return isSameCalendarDay(*previous, now) ? DayFlag::NoSignal : DayFlag::NewDay;
}

std::string AgentOrchestrator::memoryFolderFor(const std::string& simFolder,
                                               const std::string& name) {
    return (std::filesystem::path(simFolder) / "personas" / name / BOOTSTRAP_MEMORY_DIR)
        .string();
}

} // namespace Smallville
