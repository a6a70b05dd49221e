/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COGNITIVE_MODULES_HPP
#define COGNITIVE_MODULES_HPP

#include "agent/AgentTypes.hpp"
#include "memory/AssociativeMemory.hpp"
#include "memory/ScratchMemory.hpp"
#include "memory/SpatialMemory.hpp"
#include <memory>
#include <string>
#include <unordered_map>

namespace Smallville {

class AgentOrchestrator;
class WorldGrid;

/**
 * @brief What a cognitive module gets to see of the agent it works for
 *
 * Built by the orchestrator for each call and only valid for its duration.
 * Modules read and write the memory stores directly.
 */
struct AgentContext {
    const std::string& name;
    ScratchMemory& scratch;
    SpatialMemory& spatial;
    AssociativeMemory& associative;

    AgentContext(const std::string& n, ScratchMemory& s, SpatialMemory& sp,
                 AssociativeMemory& a)
        : name(n), scratch(s), spatial(sp), associative(a) {}

    AgentWorkingState& workingState() { return scratch.workingState(); }
};

/**
 * @brief Every other agent in the simulation, keyed by name
 *
 * Non-owning. The driver keeps the agents alive for the whole tick.
 */
using AgentRoster = std::unordered_map<std::string, AgentOrchestrator*>;

// ============================================================================
// Cognitive module interfaces
//
// Implementations may throw. CollaboratorFailure passes through as is; any
// other std::exception is reported to the tick caller as a CollaboratorFailure
// for the phase that was running.
// ============================================================================

class IPerceiver {
public:
    virtual ~IPerceiver() = default;

    /**
     * @brief Scan the agent's surroundings and store what is new
     *
     * Expected to update spatial memory and add event nodes to associative
     * memory for the events it keeps.
     */
    virtual PerceivedEvents perceive(AgentContext& agent, const WorldGrid& world) = 0;
};

class IRetriever {
public:
    virtual ~IRetriever() = default;

    virtual RetrievedMemories retrieve(AgentContext& agent,
                                       const PerceivedEvents& perceived) = 0;
};

class IPlanner {
public:
    virtual ~IPlanner() = default;

    /**
     * @brief Decide what the agent does next
     *
     * A single call per tick, even if the planner perceives or retrieves
     * again internally. dayFlag tells it whether daily plans need rebuilding.
     */
    virtual Plan plan(AgentContext& agent, const WorldGrid& world, const AgentRoster& peers,
                      DayFlag dayFlag, const RetrievedMemories& retrieved) = 0;
};

class IReflector {
public:
    virtual ~IReflector() = default;

    // Called after every successful plan. Decides on its own whether to reflect.
    virtual void reflect(AgentContext& agent) = 0;
};

class IExecutor {
public:
    virtual ~IExecutor() = default;

    virtual AgentAction execute(AgentContext& agent, const WorldGrid& world,
                                const AgentRoster& peers, const Plan& plan) = 0;
};

class IConversationEngine {
public:
    virtual ~IConversationEngine() = default;

    virtual void converse(AgentContext& agent, ConversationMode mode) = 0;
};

/**
 * @brief The capability set injected into an orchestrator
 *
 * Shared ownership so one stateless implementation can serve many agents.
 */
struct CognitiveModules {
    std::shared_ptr<IPerceiver> perceiver;
    std::shared_ptr<IRetriever> retriever;
    std::shared_ptr<IPlanner> planner;
    std::shared_ptr<IReflector> reflector;
    std::shared_ptr<IExecutor> executor;
    std::shared_ptr<IConversationEngine> conversation;

    bool isComplete() const {
        return perceiver && retriever && planner && reflector && executor && conversation;
    }
};

} // namespace Smallville

#endif // COGNITIVE_MODULES_HPP
