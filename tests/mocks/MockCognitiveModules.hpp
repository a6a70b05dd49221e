/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_COGNITIVE_MODULES_HPP
#define MOCK_COGNITIVE_MODULES_HPP

#include "agent/CognitiveModules.hpp"
#include "core/Errors.hpp"
#include "world/WorldGrid.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Smallville::Testing {

// Shared by all mocks of one agent so tests can assert call order
struct CallLog {
    std::vector<std::string> calls;
};

enum class MockFailure {
    None,
    Collaborator,   // Throws CollaboratorFailure for its own phase
    Runtime         // Throws a plain std::runtime_error
};

// Common mock control
class MockModuleBase {
public:
    MockModuleBase(std::shared_ptr<CallLog> log, std::string callName, TickPhase phase)
        : m_log(std::move(log)), m_callName(std::move(callName)), m_phase(phase) {}

    int callCount = 0;
    MockFailure failure = MockFailure::None;
    // Runs inside the call, before any failure is raised
    std::function<void(AgentContext&)> onCall;

protected:
    void enter(AgentContext& agent) {
        ++callCount;
        m_log->calls.push_back(m_callName);
        if (onCall) {
            onCall(agent);
        }
        if (failure == MockFailure::Collaborator) {
            throw CollaboratorFailure(m_phase, m_callName + " unavailable");
        }
        if (failure == MockFailure::Runtime) {
            throw std::runtime_error(m_callName + " timed out");
        }
    }

private:
    std::shared_ptr<CallLog> m_log;
    std::string m_callName;
    TickPhase m_phase;
};

// Stores every event within vision of the agent's tile, like a real perceiver
class MockPerceiver : public IPerceiver, public MockModuleBase {
public:
    explicit MockPerceiver(std::shared_ptr<CallLog> log)
        : MockModuleBase(std::move(log), "perceive", TickPhase::Perceiving) {}

    PerceivedEvents perceive(AgentContext& agent, const WorldGrid& world) override {
        enter(agent);

        PerceivedEvents perceived;
        const auto& state = agent.workingState();
        if (!state.currentTile || !world.isValidPosition(*state.currentTile)) {
            return perceived;
        }

        for (const TileCoord& coord :
             world.tilesNear(*state.currentTile, agent.scratch.visionRadius())) {
            const Tile& tile = world.accessTile(coord);
            agent.spatial.recordTile(tile);
            for (const TileEvent& event : tile.events) {
                const uint32_t id = agent.associative.addEvent(
                    state.currentTime.value_or(SimTime{}), event.subject,
                    event.predicate.value_or("is"), event.object.value_or("idle"),
                    event.description.value_or("idle"), 1, {tile.gameObject});
                perceived.push_back(PerceivedEvent{event, coord, id});
            }
        }
        return perceived;
    }
};

class MockRetriever : public IRetriever, public MockModuleBase {
public:
    explicit MockRetriever(std::shared_ptr<CallLog> log)
        : MockModuleBase(std::move(log), "retrieve", TickPhase::Retrieving) {}

    RetrievedMemories retrieve(AgentContext& agent, const PerceivedEvents& perceived) override {
        enter(agent);
        lastPerceivedCount = perceived.size();

        RetrievedMemories retrieved;
        for (const PerceivedEvent& event : perceived) {
            retrieved.push_back(RetrievedContext{event, {event.memoryNodeId}, {}});
        }
        return retrieved;
    }

    size_t lastPerceivedCount = 0;
};

class MockPlanner : public IPlanner, public MockModuleBase {
public:
    explicit MockPlanner(std::shared_ptr<CallLog> log)
        : MockModuleBase(std::move(log), "plan", TickPhase::Planning) {}

    Plan plan(AgentContext& agent, const WorldGrid& world, const AgentRoster& peers,
              DayFlag dayFlag, const RetrievedMemories& retrieved) override {
        enter(agent);
        dayFlags.push_back(dayFlag);
        lastPeerCount = peers.size();
        lastRetrievedCount = retrieved.size();

        const TileCoord here = agent.workingState().currentTile.value_or(TileCoord{});
        return Plan{world.addressOf(here, AddressLevel::Arena), "sleeping", 60};
    }

    std::vector<DayFlag> dayFlags;
    size_t lastPeerCount = 0;
    size_t lastRetrievedCount = 0;
};

class MockReflector : public IReflector, public MockModuleBase {
public:
    explicit MockReflector(std::shared_ptr<CallLog> log)
        : MockModuleBase(std::move(log), "reflect", TickPhase::Reflecting) {}

    void reflect(AgentContext& agent) override {
        enter(agent);
        agent.associative.resetImportance();
    }
};

class MockExecutor : public IExecutor, public MockModuleBase {
public:
    explicit MockExecutor(std::shared_ptr<CallLog> log)
        : MockModuleBase(std::move(log), "execute", TickPhase::Executing) {}

    AgentAction execute(AgentContext& agent, const WorldGrid& world, const AgentRoster& peers,
                        const Plan& plan) override {
        enter(agent);
        lastPlan = plan;
        (void)world;
        (void)peers;
        return MoveAction{target};
    }

    TileCoord target{2, 2};
    Plan lastPlan;
};

class MockConversationEngine : public IConversationEngine, public MockModuleBase {
public:
    explicit MockConversationEngine(std::shared_ptr<CallLog> log)
        : MockModuleBase(std::move(log), "converse", TickPhase::Conversing) {}

    void converse(AgentContext& agent, ConversationMode mode) override {
        enter(agent);
        modes.push_back(mode);
        if (mode == ConversationMode::Whisper) {
            agent.associative.addThought(agent.workingState().currentTime.value_or(SimTime{}),
                                         agent.name, "was told", "a secret",
                                         "was told a secret", 5, {"secret"});
        }
    }

    std::vector<ConversationMode> modes;
};

/**
 * @brief One full set of mocks sharing a call log
 */
struct MockModuleSet {
    std::shared_ptr<CallLog> log = std::make_shared<CallLog>();
    std::shared_ptr<MockPerceiver> perceiver = std::make_shared<MockPerceiver>(log);
    std::shared_ptr<MockRetriever> retriever = std::make_shared<MockRetriever>(log);
    std::shared_ptr<MockPlanner> planner = std::make_shared<MockPlanner>(log);
    std::shared_ptr<MockReflector> reflector = std::make_shared<MockReflector>(log);
    std::shared_ptr<MockExecutor> executor = std::make_shared<MockExecutor>(log);
    std::shared_ptr<MockConversationEngine> conversation =
        std::make_shared<MockConversationEngine>(log);

    CognitiveModules modules() const {
        return CognitiveModules{perceiver, retriever, planner, reflector, executor, conversation};
    }
};

} // namespace Smallville::Testing

#endif // MOCK_COGNITIVE_MODULES_HPP
